#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "pipeline.hpp"

#include <chrono>
#include <exception>

using namespace execmetrics;

int main(int argc, char* argv[])
{
    auto& logger = Logger::instance();
    auto start = std::chrono::steady_clock::now();

    try {
        // Configuration: environment first, positional arguments override paths
        AppConfig config = loadConfigFromEnvironment();
        applyArguments(config, argc, argv);
        logger.setLevel(config.logLevel);

        Report report = runPipeline(config);

        const AggregateRow& overall = report.overall();
        logger.info("Overall: ", overall.executionCount, " executions, notional ", overall.totalNotional,
                    ", weighted slippage ", overall.weightedSlippage, " (", overall.weightedSlippageBps, " bps)");

        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        logger.info("Total execution time: ", elapsed.count(), " seconds.");
        return 0;

    } catch (const DataIntegrityError& e) {
        logger.error("Data integrity error, no report written: ", e.what());
        return 2;
    } catch (const std::exception& e) {
        logger.error("Fatal error: ", e.what());
        return 1;
    }
}
