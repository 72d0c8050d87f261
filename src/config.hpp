#pragma once

#include "logger.hpp"
#include "metricsengine.hpp"

#include <functional>
#include <string>

namespace execmetrics {

struct AppConfig {
    std::string executionsPath = "data/executions.csv";
    std::string refdataPath = "data/refdata.csv";
    std::string marketdataPath = "data/marketdata.csv";
    std::string outputPath = "output/trading_metrics.csv";
    LogLevel logLevel = LogLevel::Info;
    EngineConfig engine;
};

// Returns the value of a variable, or nullptr when unset
using EnvironmentLookup = std::function<const char*(const char*)>;

// Resolve configuration from environment variables (unset or empty -> default).
// Throws std::invalid_argument for unparseable values.
[[nodiscard]] AppConfig loadConfig(const EnvironmentLookup& lookup);

// Process environment
[[nodiscard]] AppConfig loadConfigFromEnvironment();

// Positional overrides: [executions [refdata [marketdata [output]]]]
void applyArguments(AppConfig& config, int argc, const char* const argv[]);

} // namespace execmetrics
