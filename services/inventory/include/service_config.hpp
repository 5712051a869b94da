#pragma once

#include <string>
#include "inventory_engine.hpp"

namespace inventory {

constexpr int DEFAULT_PORT = 50061;
constexpr const char* DEFAULT_WAREHOUSE = "WH-01";

/// Runtime settings for the inventory server.
struct ServiceConfig {
    int port = DEFAULT_PORT;
    std::string default_warehouse = DEFAULT_WAREHOUSE;
    EngineConfig engine;

    /**
     * Read settings from the environment, falling back to defaults:
     *   STOCKROOM_PORT, STOCKROOM_DEFAULT_WAREHOUSE,
     *   STOCKROOM_MAX_ATTEMPTS, STOCKROOM_SNAPSHOT_INTERVAL
     *
     * @throws stockroom::ValidationError for malformed or out-of-range values
     */
    static ServiceConfig from_env();
};

/// Parse a listening port given on the command line.
/// @throws stockroom::ValidationError unless raw is an integer in 1..65535
int parse_port(const std::string& raw);

} // namespace inventory
