#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

Logger& Logger::instance() {
    static Logger instance_;
    return instance_;
}

void Logger::write(LogLevel p_level, const std::string& p_message) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
              << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
              << " [" << level_name(p_level) << "]"
              << " [" << std::this_thread::get_id() << "] "
              << p_message << '\n';
}

LogLevel Logger::parse_level(std::string_view p_text) {
    std::string text(p_text);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    throw std::invalid_argument("Unknown log level: " + std::string(p_text));
}

std::string printable(std::string_view p_text) {
    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.reserve(p_text.size());
    for (unsigned char c : p_text) {
        if (c < 0x20 || c == 0x7f || c == '\\') {
            out += "\\x";
            out += HEX[c >> 4];
            out += HEX[c & 0xF];
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

const char* Logger::level_name(LogLevel p_level) {
    switch (p_level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}
