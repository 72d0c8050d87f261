#include "config.hpp"
#include "csvutils.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace execmetrics {

namespace {

std::string lookupOr(const EnvironmentLookup& lookup, const char* name, const std::string& fallback)
{
    const char* value = lookup(name);
    if (value == nullptr || csv::trim(value).empty()) {
        return fallback;
    }
    return csv::trim(value);
}

int64_t parseNonNegative(const std::string& text, const char* name)
{
    size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got '" + text + "'");
    }
    if (consumed != text.size() || value < 0) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got '" + text + "'");
    }
    return value;
}

} // namespace

AppConfig loadConfig(const EnvironmentLookup& lookup)
{
    AppConfig config;
    config.executionsPath = lookupOr(lookup, "EXECUTIONS_FILE_PATH", config.executionsPath);
    config.refdataPath = lookupOr(lookup, "REFDATA_FILE_PATH", config.refdataPath);
    config.marketdataPath = lookupOr(lookup, "MARKETDATA_FILE_PATH", config.marketdataPath);
    config.outputPath = lookupOr(lookup, "OUTPUT_FILE_PATH", config.outputPath);

    std::string toleranceMs = lookupOr(lookup, "BENCHMARK_TOLERANCE_MS", "");
    if (!toleranceMs.empty()) {
        int64_t millis = parseNonNegative(toleranceMs, "BENCHMARK_TOLERANCE_MS");
        if (millis > std::numeric_limits<Duration>::max() / kNanosPerMilli) {
            throw std::invalid_argument("BENCHMARK_TOLERANCE_MS is too large");
        }
        config.engine.tolerance = millis * kNanosPerMilli;
    }

    std::string convention = csv::toLower(lookupOr(lookup, "SLIPPAGE_CONVENTION", "favorable"));
    if (convention == "favorable") {
        config.engine.convention = SlippageConvention::PositiveIsFavorable;
    } else if (convention == "adverse") {
        config.engine.convention = SlippageConvention::PositiveIsAdverse;
    } else {
        throw std::invalid_argument("SLIPPAGE_CONVENTION must be 'favorable' or 'adverse', got '" + convention + "'");
    }

    config.engine.tradingPhase = lookupOr(lookup, "TRADING_PHASE", "");

    std::string threads = lookupOr(lookup, "WORKER_THREADS", "");
    if (!threads.empty()) {
        int64_t count = parseNonNegative(threads, "WORKER_THREADS");
        if (count == 0) {
            throw std::invalid_argument("WORKER_THREADS must be positive");
        }
        config.engine.workerThreads = static_cast<size_t>(count);
    }

    std::string level = lookupOr(lookup, "LOG_LEVEL", "INFO");
    auto parsedLevel = parseLogLevel(level);
    if (!parsedLevel) {
        throw std::invalid_argument("LOG_LEVEL must be DEBUG, INFO, WARNING or ERROR, got '" + level + "'");
    }
    config.logLevel = *parsedLevel;

    return config;
}

AppConfig loadConfigFromEnvironment()
{
    return loadConfig([](const char* name) -> const char* { return std::getenv(name); });
}

void applyArguments(AppConfig& config, int argc, const char* const argv[])
{
    if (argc > 1)
        config.executionsPath = argv[1];
    if (argc > 2)
        config.refdataPath = argv[2];
    if (argc > 3)
        config.marketdataPath = argv[3];
    if (argc > 4)
        config.outputPath = argv[4];
}

} // namespace execmetrics
