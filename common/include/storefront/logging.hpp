#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace storefront {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    return ss.str();
}

// Records go to std::clog so they stay out of the interactive menu output.
inline void log_record(const std::string& level, const std::string& domain,
                       const std::string& message, const nlohmann::json& fields) {
    nlohmann::json log_entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }
    std::clog << log_entry.dump() << std::endl;
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_record("info", domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_record("warn", domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_record("error", domain, message, fields);
}

}  // namespace storefront
