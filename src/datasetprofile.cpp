#include "datasetprofile.hpp"
#include "csvutils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace execmetrics {

DatasetProfile profileDatasets(const std::vector<Execution>& executions, const MarketSeriesIndex& index)
{
    DatasetProfile profile;
    profile.executionCount = executions.size();

    std::set<std::string> venues;
    std::set<int64_t> dates;
    for (const auto& execution : executions) {
        if (!execution.venue.empty()) {
            venues.insert(execution.venue);
        }
        dates.insert(csv::dayOf(execution.timestamp));

        if (!profile.executionTimeRange) {
            profile.executionTimeRange = std::make_pair(execution.timestamp, execution.timestamp);
        } else {
            profile.executionTimeRange->first = std::min(profile.executionTimeRange->first, execution.timestamp);
            profile.executionTimeRange->second = std::max(profile.executionTimeRange->second, execution.timestamp);
        }
    }
    profile.uniqueVenues = venues.size();
    profile.uniqueDates = dates.size();
    profile.marketTimeRange = index.timeRange();
    return profile;
}

void logProfile(const DatasetProfile& profile)
{
    auto& logger = Logger::instance();
    logger.info("Total number of executions: ", profile.executionCount);
    logger.info("Unique number of venues: ", profile.uniqueVenues);
    logger.info("Unique dates of executions: ", profile.uniqueDates);
    if (profile.executionTimeRange) {
        logger.info("Executions timestamp ranges from ", csv::formatTimestamp(profile.executionTimeRange->first),
                    " to ", csv::formatTimestamp(profile.executionTimeRange->second));
    }
    if (profile.marketTimeRange) {
        logger.info("Market data timestamp ranges from ", csv::formatTimestamp(profile.marketTimeRange->first),
                    " to ", csv::formatTimestamp(profile.marketTimeRange->second));
    }
}

} // namespace execmetrics
