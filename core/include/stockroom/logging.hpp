#pragma once

#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include "helpers.hpp"

namespace stockroom {

inline std::string now_iso8601() {
    return helpers::to_iso8601(helpers::now());
}

/**
 * Write one structured JSON log line to stdout.
 */
inline void log(const std::string& level, const std::string& domain, const std::string& message,
                const nlohmann::json& fields = {}) {
    nlohmann::json log_entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << log_entry.dump() << std::endl;
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log("info", domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log("warn", domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log("error", domain, message, fields);
}

} // namespace stockroom
