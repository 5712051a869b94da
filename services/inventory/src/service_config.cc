#include "service_config.hpp"
#include "stockroom/errors.hpp"
#include <cstdlib>
#include <stdexcept>

namespace inventory {

namespace {

long parse_long(const char* name, const std::string& raw, long min, long max) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(raw, &consumed);
    } catch (const std::logic_error&) {
        throw stockroom::ValidationError(std::string(name) + " is not a number: " + raw);
    }
    if (consumed != raw.size()) {
        throw stockroom::ValidationError(std::string(name) + " is not a number: " + raw);
    }
    if (value < min || value > max) {
        throw stockroom::ValidationError(std::string(name) + " must be between " +
                                         std::to_string(min) + " and " + std::to_string(max));
    }
    return value;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return value && *value ? value : nullptr;
}

} // anonymous namespace

int parse_port(const std::string& raw) {
    return static_cast<int>(parse_long("port", raw, 1, 65535));
}

ServiceConfig ServiceConfig::from_env() {
    ServiceConfig config;
    if (auto raw = env("STOCKROOM_PORT")) {
        config.port = static_cast<int>(parse_long("STOCKROOM_PORT", raw, 1, 65535));
    }
    if (auto raw = env("STOCKROOM_DEFAULT_WAREHOUSE")) {
        config.default_warehouse = raw;
    }
    if (auto raw = env("STOCKROOM_MAX_ATTEMPTS")) {
        config.engine.max_attempts =
            static_cast<int>(parse_long("STOCKROOM_MAX_ATTEMPTS", raw, 1, 100));
    }
    if (auto raw = env("STOCKROOM_SNAPSHOT_INTERVAL")) {
        config.engine.snapshot_interval =
            static_cast<uint32_t>(parse_long("STOCKROOM_SNAPSHOT_INTERVAL", raw, 0, 1000000));
    }
    return config;
}

} // namespace inventory
