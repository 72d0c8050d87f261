#include "pipeline.hpp"
#include "dataloader.hpp"
#include "datasetprofile.hpp"
#include "logger.hpp"
#include "reportwriter.hpp"

namespace execmetrics {

Report runPipeline(const AppConfig& config)
{
    auto& logger = Logger::instance();

    logger.info("Loading data...");
    LoadedExecutions executions = loadExecutions(config.executionsPath);
    std::vector<Instrument> instruments = loadInstruments(config.refdataPath);
    std::vector<MarketObservation> observations = loadMarketData(config.marketdataPath);
    logger.info("Executions data count: ", executions.executions.size() + executions.rejected.size());
    logger.info("Refdata count: ", instruments.size());
    logger.info("Marketdata count: ", observations.size());
    if (!executions.rejected.empty()) {
        logger.warning("Rejected ", executions.rejected.size(), " unparseable execution rows");
    }

    logger.info("Building instrument catalog and market series index...");
    InstrumentCatalog catalog = InstrumentCatalog::fromInstruments(std::move(instruments));
    SeriesIndexOptions indexOptions;
    indexOptions.marketState = config.engine.tradingPhase;
    MarketSeriesIndex index(std::move(observations), indexOptions);
    logger.info("Indexed ", index.observationCount(), " observations across ", index.instrumentCount(),
                " instruments");
    if (index.filteredCount() > 0) {
        logger.info("Dropped ", index.filteredCount(), " observations outside market state ",
                    config.engine.tradingPhase);
    }
    if (index.duplicateCount() > 0) {
        logger.debug("Collapsed ", index.duplicateCount(), " duplicate observations");
    }

    logger.info("Starting analysis of executions data...");
    logProfile(profileDatasets(executions.executions, index));

    logger.info("Starting calculation of metrics (tolerance ", config.engine.tolerance / kNanosPerMilli,
                " ms, convention ", toString(config.engine.convention), ", threads ", config.engine.workerThreads,
                ")...");
    MetricsEngine engine(catalog, index, config.engine);
    Report report = engine.run(executions.executions);
    report.addSkipped(executions.rejected);

    logger.info("Saving report to '", config.outputPath, "'...");
    ReportPaths paths = writeReport(report, config.outputPath);
    logger.info("Output saved to '", paths.summary, "', '", paths.details, "' and '", paths.skipped, "'.");

    return report;
}

} // namespace execmetrics
