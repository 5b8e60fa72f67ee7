#pragma once

#include <functional>
#include <iostream>
#include <string>

// ---------------------------------------------------------------------------
// Log — progress to stdout, errors to stderr. A callback replaces both sinks
// (tests use it to capture or silence output).
// ---------------------------------------------------------------------------
class Log {
public:
    enum class Level { INFO, ERROR };
    using Callback = std::function<void(Level, const std::string&)>;

    static void info(const std::string& message) {
        if (callback_) {
            callback_(Level::INFO, message);
        } else {
            std::cout << message << std::endl;
        }
    }

    static void error(const std::string& message) {
        if (callback_) {
            callback_(Level::ERROR, message);
        } else {
            std::cerr << "ERROR: " << message << std::endl;
        }
    }

    static void set_callback(Callback cb) { callback_ = std::move(cb); }
    static void clear_callback() { callback_ = nullptr; }

private:
    static inline Callback callback_ = nullptr;
};
