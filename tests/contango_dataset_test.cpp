// contango_dataset_test.cpp — dataset line format, existing-data loading, merge
//
// Tests contango_io formatting/parsing and DatasetMerger: skip vs. overwrite,
// deployment-date restriction, legacy/corrected file names, idempotent reruns.

#include <gtest/gtest.h>

#include "contango/contango_calculator.hpp"
#include "contango/contango_dataset.hpp"
#include "contango/contango_record.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const std::string HEADER =
    "Date,First Month,F1,F2,F3,F4,F5,F6,F7,F8,F9,F10,F11,F12,"
    "Contango 2/1,Contango 7/4,Con 7/4 div 3";

using test_helpers::price;

// Settlements base, base+1, ... for `n` contracts.
ContangoRecord make_record(int date, const std::string& base = "10", int n = 9) {
    ContangoRecord r;
    r.date = date;
    r.front_month = 1;
    for (int i = 0; i < n; ++i) r.prices[i] = price(base) + i * fixed_point::PRICE_SCALE;
    r.contango_f2_minus_f1 = relative_spread(*r.f(2), *r.f(1));
    r.contango_f7_minus_f4 = relative_spread(*r.f(7), *r.f(4));
    r.contango_f7_minus_f4_div_3 = relative_spread(*r.f(7), *r.f(4), 3);
    return r;
}

}  // namespace

// ===========================================================================
// Formatting
// ===========================================================================

TEST(ContangoFormatTest, FormatsRecordLine) {
    EXPECT_EQ(contango_io::format_line(make_record(20210426)),
              "2021-04-26,1,10,11,12,13,14,15,16,17,18,,,,0.1,0.2308,0.0769");
}

TEST(ContangoFormatTest, FractionalPricesKeepTheirDigits) {
    auto r = make_record(20210427, "24.675", 12);
    std::string line = contango_io::format_line(r);
    EXPECT_EQ(line.rfind("2021-04-27,1,24.675,25.675,", 0), 0u);
    EXPECT_EQ(line.find(",,"), std::string::npos);
}

TEST(ContangoFormatTest, PricesPrintAtNaturalScale) {
    EXPECT_EQ(contango_io::format_price(price("24.675")), "24.675");
    EXPECT_EQ(contango_io::format_price(price("18.0000")), "18");
    EXPECT_EQ(contango_io::format_price(price("0.05")), "0.05");
    EXPECT_EQ(contango_io::format_price(price("-0.5")), "-0.5");
}

TEST(ContangoFormatTest, RatiosPrintAtMostFourDecimals) {
    EXPECT_EQ(contango_io::format_ratio(13), "0.0013");
    EXPECT_EQ(contango_io::format_ratio(-13), "-0.0013");
    EXPECT_EQ(contango_io::format_ratio(2308), "0.2308");
    EXPECT_EQ(contango_io::format_ratio(1000), "0.1");
    EXPECT_EQ(contango_io::format_ratio(12500), "1.25");
    EXPECT_EQ(contango_io::format_ratio(0), "0");
}

TEST(ContangoFormatTest, ExactHalfFromPricesRoundsUp) {
    auto r = make_record(20210426, "10.4");
    r.prices[1] = price("10.413");
    r.contango_f2_minus_f1 = relative_spread(*r.f(2), *r.f(1));
    std::string line = contango_io::format_line(r);
    EXPECT_EQ(line.rfind("2021-04-26,1,10.4,10.413,", 0), 0u);
    EXPECT_NE(line.find(",,,,0.0013,"), std::string::npos);
}

TEST(ContangoFormatTest, UndefinedRatioRendersEmpty) {
    auto r = make_record(20210426);
    r.contango_f2_minus_f1.reset();
    std::string line = contango_io::format_line(r);
    EXPECT_EQ(line, "2021-04-26,1,10,11,12,13,14,15,16,17,18,,,,,0.2308,0.0769");
}

// ===========================================================================
// Existing data
// ===========================================================================

TEST(ContangoParseTest, SkipsHeaderAndBlankLines) {
    std::string text = HEADER + "\r\n\r\n2021-04-27,x\r\n   \n2021-04-26,y";
    auto dataset = contango_io::parse_existing(text);
    ASSERT_EQ(dataset.size(), 2u);
    EXPECT_EQ(dataset.at(20210426), "2021-04-26,y");
    EXPECT_EQ(dataset.at(20210427), "2021-04-27,x");
}

TEST(ContangoParseTest, PreservesLinesVerbatim) {
    std::string line = "2010-01-04,1,20.05,21.1,,,,,,,,,,,5.24%,-,oddly formatted";
    auto dataset = contango_io::parse_existing(HEADER + "\n" + line);
    EXPECT_EQ(dataset.at(20100104), line);
}

TEST(ContangoParseTest, BadDateThrows) {
    EXPECT_THROW(contango_io::parse_existing("2021-13-01,1"), DatasetFormatError);
}

TEST(ContangoParseTest, DuplicateDateThrows) {
    EXPECT_THROW(contango_io::parse_existing("2021-04-26,a\n2021-04-26,b"), DatasetFormatError);
}

TEST(ContangoParseTest, SerializeSortsAndHasNoTrailingNewline) {
    std::map<int, std::string> dataset{{20210427, "2021-04-27,b"}, {20210426, "2021-04-26,a"}};
    EXPECT_EQ(contango_io::serialize(dataset), HEADER + "\n2021-04-26,a\n2021-04-27,b");
}

TEST(ContangoParseTest, WriteThenReadRoundTrips) {
    auto dir = test_helpers::make_temp_dir();
    std::map<int, std::string> dataset;
    dataset[20210426] = contango_io::format_line(make_record(20210426));
    dataset[20210427] = contango_io::format_line(make_record(20210427, "24.675", 12));

    auto path = dir / "roundtrip.csv";
    contango_io::write_file(path, contango_io::serialize(dataset));
    EXPECT_EQ(contango_io::read_existing(path), dataset);
}

TEST(ContangoParseTest, MissingFileThrows) {
    auto dir = test_helpers::make_temp_dir();
    EXPECT_THROW(contango_io::read_existing(dir / "missing.csv"), std::runtime_error);
}

// ===========================================================================
// DatasetMerger
// ===========================================================================

class DatasetMergerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = test_helpers::make_temp_dir();
        config_.output_root = root_ / "out";
        config_.existing_root = root_ / "existing";
        config_.vendor = "vixcentral";
        config_.deployment_date = 20210427;
    }

    void TearDown() override { fs::remove_all(root_); }

    fs::path existing_dir() const { return config_.existing_root / "alternative" / "vixcentral"; }
    fs::path output_dir() const { return config_.output_root / "alternative" / "vixcentral"; }

    std::string output() const {
        return test_helpers::read_file(output_dir() / "vix_contango.csv");
    }

    test_helpers::ScopedLogCapture log_;
    fs::path root_;
    MergeConfig config_;
};

TEST_F(DatasetMergerTest, WritesBothFileNamesIdentically) {
    DatasetMerger merger(config_);
    merger.merge({make_record(20210426)});

    auto legacy = test_helpers::read_file(output_dir() / "vix_contago.csv");
    auto corrected = test_helpers::read_file(output_dir() / "vix_contango.csv");
    EXPECT_EQ(legacy, corrected);
    EXPECT_EQ(corrected, HEADER + "\n" + contango_io::format_line(make_record(20210426)));
}

TEST_F(DatasetMergerTest, NoExistingDataStartsEmpty) {
    DatasetMerger merger(config_);
    EXPECT_FALSE(merger.existing_path().has_value());
    EXPECT_TRUE(merger.load_existing().empty());
}

TEST_F(DatasetMergerTest, PrefersCorrectedExistingFile) {
    test_helpers::write_file(existing_dir() / "vix_contango.csv", HEADER + "\n2021-01-04,corrected");
    test_helpers::write_file(existing_dir() / "vix_contago.csv", HEADER + "\n2021-01-04,legacy");

    DatasetMerger merger(config_);
    ASSERT_TRUE(merger.existing_path().has_value());
    EXPECT_EQ(merger.existing_path()->filename().string(), "vix_contango.csv");
    EXPECT_EQ(merger.load_existing().at(20210104), "2021-01-04,corrected");
}

TEST_F(DatasetMergerTest, FallsBackToLegacyExistingFile) {
    test_helpers::write_file(existing_dir() / "vix_contago.csv", HEADER + "\n2021-01-04,legacy");

    DatasetMerger merger(config_);
    merger.merge({});
    EXPECT_EQ(output(), HEADER + "\n2021-01-04,legacy");
}

TEST_F(DatasetMergerTest, ExistingRowsKeptWithoutOverwrite) {
    test_helpers::write_file(existing_dir() / "vix_contango.csv",
                             HEADER + "\n2021-04-26,old\n2021-04-28,old");

    DatasetMerger merger(config_);
    merger.merge({make_record(20210426), make_record(20210427)});

    EXPECT_EQ(output(), HEADER + "\n2021-04-26,old\n" +
                            contango_io::format_line(make_record(20210427)) +
                            "\n2021-04-28,old");
}

TEST_F(DatasetMergerTest, OverwriteReplacesExistingRows) {
    test_helpers::write_file(existing_dir() / "vix_contango.csv", HEADER + "\n2021-04-26,old");
    config_.overwrite_existing = true;

    DatasetMerger merger(config_);
    merger.merge({make_record(20210426)});

    EXPECT_EQ(output(), HEADER + "\n" + contango_io::format_line(make_record(20210426)));
}

TEST_F(DatasetMergerTest, OnlyDeploymentDateRestrictsWrites) {
    test_helpers::write_file(existing_dir() / "vix_contango.csv", HEADER + "\n2021-04-26,old");
    config_.only_deployment_date = true;
    config_.overwrite_existing = true;

    DatasetMerger merger(config_);
    merger.merge({make_record(20210426, "30"), make_record(20210427), make_record(20210428)});

    EXPECT_EQ(output(), HEADER + "\n2021-04-26,old\n" +
                            contango_io::format_line(make_record(20210427)));
}

TEST_F(DatasetMergerTest, OnlyDeploymentDateWithoutExistingData) {
    config_.only_deployment_date = true;

    DatasetMerger merger(config_);
    merger.merge({make_record(20210426), make_record(20210427)});

    EXPECT_EQ(output(), HEADER + "\n" + contango_io::format_line(make_record(20210427)));
}

TEST_F(DatasetMergerTest, RerunIsIdempotent) {
    std::vector<ContangoRecord> records{make_record(20210427), make_record(20210426)};

    DatasetMerger(config_).merge(records);
    std::string first = output();

    // Second run reads the first run's output as existing data.
    config_.existing_root = config_.output_root;
    DatasetMerger(config_).merge(records);

    EXPECT_EQ(output(), first);
}

TEST_F(DatasetMergerTest, ApplyCountsWrittenRows) {
    DatasetMerger merger(config_);
    std::map<int, std::string> dataset{{20210426, "2021-04-26,old"}};
    int written = merger.apply(dataset, {make_record(20210426), make_record(20210427)});
    EXPECT_EQ(written, 1);
    EXPECT_EQ(dataset.size(), 2u);
}
