#pragma once

#include "contango/contango_record.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include "log.hpp"
#include "settlement/settlement_parser.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Contango dataset file format
// ---------------------------------------------------------------------------
namespace contango_io {

constexpr const char* HEADER =
    "Date,First Month,F1,F2,F3,F4,F5,F6,F7,F8,F9,F10,F11,F12,"
    "Contango 2/1,Contango 7/4,Con 7/4 div 3";

// Both names are written with identical content; the misspelled one predates
// the corrected name and is still read downstream.
constexpr const char* LEGACY_FILE_NAME = "vix_contago.csv";
constexpr const char* FILE_NAME = "vix_contango.csv";

// Natural decimal scale: 24.675, 18
inline std::string format_price(int64_t value) {
    return fixed_point::format(value, fixed_point::PRICE_DECIMALS);
}

// At most RATIO_DECIMALS places, trailing zeros dropped: 0.1, 0.2308
inline std::string format_ratio(int64_t value) {
    return fixed_point::format(value, ContangoRecord::RATIO_DECIMALS);
}

inline std::string format_line(const ContangoRecord& record) {
    std::ostringstream ss;
    ss << time_utils::format_date(record.date);
    ss << "," << record.front_month;
    for (const auto& price : record.prices) {
        ss << ",";
        if (price) ss << format_price(*price);
    }
    for (const auto* ratio : {&record.contango_f2_minus_f1,
                              &record.contango_f7_minus_f4,
                              &record.contango_f7_minus_f4_div_3}) {
        ss << ",";
        if (*ratio) ss << format_ratio(**ratio);
    }
    return ss.str();
}

// Date -> raw line. Header and blank lines are skipped; lines are kept
// byte-for-byte so previously published rows never change.
inline std::map<int, std::string> parse_existing(const std::string& text) {
    std::map<int, std::string> dataset;
    for (const auto& line : settlement_csv::split_lines(text)) {
        if (!settlement_csv::is_data_line(line)) continue;

        std::string field = line.substr(0, line.find(','));
        int date = 0;
        try {
            date = time_utils::parse_date(field);
        } catch (const std::invalid_argument& e) {
            throw DatasetFormatError(std::string("Existing contango row: ") + e.what());
        }
        if (!dataset.emplace(date, line).second) {
            throw DatasetFormatError("Duplicate date in existing contango data: " + field);
        }
    }
    return dataset;
}

inline std::map<int, std::string> read_existing(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open existing data file: " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Failed reading existing data file: " + path.string());
    }
    return parse_existing(ss.str());
}

// Header followed by rows in date order, '\n'-joined, no trailing newline.
inline std::string serialize(const std::map<int, std::string>& dataset) {
    std::string out = HEADER;
    for (const auto& [date, line] : dataset) {
        out += "\n";
        out += line;
    }
    return out;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path.string());
    }
    out << content;
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Failed writing output file: " + path.string());
    }
}

}  // namespace contango_io

// ---------------------------------------------------------------------------
// MergeConfig
// ---------------------------------------------------------------------------
struct MergeConfig {
    std::filesystem::path output_root;
    std::filesystem::path existing_root;
    std::string vendor = "vixcentral";
    bool overwrite_existing = false;
    bool only_deployment_date = false;
    int deployment_date = 0;
};

// ---------------------------------------------------------------------------
// DatasetMerger — folds new contango rows into the historical dataset
// ---------------------------------------------------------------------------
class DatasetMerger {
public:
    explicit DatasetMerger(MergeConfig config) : config_(std::move(config)) {}

    std::filesystem::path output_directory() const {
        return config_.output_root / "alternative" / config_.vendor;
    }

    std::vector<std::filesystem::path> output_paths() const {
        auto dir = output_directory();
        return {dir / contango_io::LEGACY_FILE_NAME, dir / contango_io::FILE_NAME};
    }

    // Corrected name first, then the legacy one.
    std::optional<std::filesystem::path> existing_path() const {
        auto dir = config_.existing_root / "alternative" / config_.vendor;
        for (const char* name : {contango_io::FILE_NAME, contango_io::LEGACY_FILE_NAME}) {
            auto path = dir / name;
            if (std::filesystem::exists(path)) return path;
        }
        return std::nullopt;
    }

    std::map<int, std::string> load_existing() const {
        auto path = existing_path();
        if (!path) {
            Log::info("DatasetMerger: no existing data under " +
                      (config_.existing_root / "alternative" / config_.vendor).string() +
                      "; creating data for the first time");
            return {};
        }
        Log::info("DatasetMerger: reading existing data from " + path->string());
        return contango_io::read_existing(*path);
    }

    // Returns the number of rows written into the dataset.
    int apply(std::map<int, std::string>& dataset,
              const std::vector<ContangoRecord>& records) const {
        int written = 0;
        for (const auto& record : records) {
            if (!config_.overwrite_existing && dataset.count(record.date)) continue;
            if (config_.only_deployment_date && record.date != config_.deployment_date) continue;

            dataset[record.date] = contango_io::format_line(record);
            ++written;
        }
        return written;
    }

    void merge(const std::vector<ContangoRecord>& records) const {
        auto dataset = load_existing();
        int written = apply(dataset, records);

        std::filesystem::create_directories(output_directory());
        std::string content = contango_io::serialize(dataset);
        auto paths = output_paths();
        for (const auto& path : paths) {
            contango_io::write_file(path, content);
        }

        Log::info("DatasetMerger: wrote " + std::to_string(written) + " new rows (" +
                  std::to_string(dataset.size()) + " total) to " + paths[0].string() +
                  " and " + paths[1].string());
    }

private:
    MergeConfig config_;
};
