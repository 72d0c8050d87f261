#include "../src/aggregator.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>

using namespace execmetrics;

namespace {

MetricRecord makeRecord(const std::string& id, const std::string& instrument, Side side, Qty quantity,
                        double slippage, double slippageBps, const std::string& venue = "")
{
    MetricRecord record{};
    record.executionId = id;
    record.instrumentId = instrument;
    record.venue = venue;
    record.side = side;
    record.quantity = quantity;
    record.price = 100.0;
    record.benchmarkPrice = 100.0;
    record.slippage = slippage;
    record.slippageBps = slippageBps;
    record.notional = quantity * 100.0;
    return record;
}

const AggregateRow* findRow(const std::vector<AggregateRow>& rows, GroupDimension dimension, const std::string& key)
{
    auto iterator = std::find_if(rows.begin(), rows.end(), [&](const AggregateRow& row) {
        return row.dimension == dimension && row.key == key;
    });
    return iterator == rows.end() ? nullptr : &*iterator;
}

} // namespace

class AggregatorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        records = {makeRecord("E1", "AAA", Side::Buy, 100, 0.02, 2.0, "XNYS"),
                   makeRecord("E2", "AAA", Side::Sell, 300, -0.01, -1.0, "XNYS"),
                   makeRecord("E3", "BBB", Side::Buy, 50, 0.10, 10.0, "XLON"),
                   makeRecord("E4", "BBB", Side::Buy, 150, 0.30, 30.0),
                   makeRecord("E5", "CCC", Side::Sell, 1, 5.0, 500.0, "XLON")};
    }

    std::vector<MetricRecord> records;
};

TEST_F(AggregatorTest, EmptyAggregatorYieldsZeroOverall)
{
    Aggregator aggregator;
    auto rows = aggregator.rows();

    ASSERT_EQ(1, rows.size());
    EXPECT_EQ(GroupDimension::Overall, rows[0].dimension);
    EXPECT_EQ(kOverallKey, rows[0].key);
    EXPECT_EQ(0, rows[0].executionCount);
    EXPECT_EQ(0.0, rows[0].totalQuantity);
    EXPECT_EQ(0.0, rows[0].totalNotional);
    EXPECT_EQ(0.0, rows[0].weightedSlippage);
    EXPECT_EQ(0.0, rows[0].weightedSlippageBps);
    EXPECT_FALSE(std::isnan(rows[0].weightedSlippage));
}

TEST_F(AggregatorTest, GroupsAndWeightedAverages)
{
    Aggregator aggregator;
    for (const auto& record : records) {
        aggregator.add(record);
    }
    auto rows = aggregator.rows();
    EXPECT_EQ(5, aggregator.count());

    // overall + 3 instruments + 2 sides + 2 venues
    ASSERT_EQ(8, rows.size());
    EXPECT_EQ(GroupDimension::Overall, rows[0].dimension);

    auto aaa = findRow(rows, GroupDimension::Instrument, "AAA");
    ASSERT_NE(nullptr, aaa);
    EXPECT_EQ(2, aaa->executionCount);
    EXPECT_DOUBLE_EQ(400.0, aaa->totalQuantity);
    EXPECT_DOUBLE_EQ(40000.0, aaa->totalNotional);
    EXPECT_NEAR((100 * 0.02 + 300 * -0.01) / 400.0, aaa->weightedSlippage, 1e-12);
    EXPECT_NEAR((100 * 2.0 + 300 * -1.0) / 400.0, aaa->weightedSlippageBps, 1e-12);

    auto buy = findRow(rows, GroupDimension::Side, "BUY");
    ASSERT_NE(nullptr, buy);
    EXPECT_EQ(3, buy->executionCount);
    EXPECT_NEAR((100 * 0.02 + 50 * 0.10 + 150 * 0.30) / 300.0, buy->weightedSlippage, 1e-12);

    // Records without a venue are not grouped by venue
    auto xlon = findRow(rows, GroupDimension::Venue, "XLON");
    ASSERT_NE(nullptr, xlon);
    EXPECT_EQ(2, xlon->executionCount);
    EXPECT_EQ(nullptr, findRow(rows, GroupDimension::Venue, ""));
}

TEST_F(AggregatorTest, OverallCountMatchesInstrumentGroups)
{
    Aggregator aggregator;
    for (const auto& record : records) {
        aggregator.add(record);
    }
    auto rows = aggregator.rows();

    size_t instrumentCount = 0;
    double instrumentWeighted = 0.0;
    double instrumentQuantity = 0.0;
    for (const auto& row : rows) {
        if (row.dimension == GroupDimension::Instrument) {
            instrumentCount += row.executionCount;
            instrumentWeighted += row.weightedSlippage * row.totalQuantity;
            instrumentQuantity += row.totalQuantity;
        }
    }

    EXPECT_EQ(records.size(), rows[0].executionCount);
    EXPECT_EQ(instrumentCount, rows[0].executionCount);
    EXPECT_NEAR(instrumentWeighted / instrumentQuantity, rows[0].weightedSlippage, 1e-12);
}

TEST_F(AggregatorTest, OrderInvariant)
{
    Aggregator reference;
    for (const auto& record : records) {
        reference.add(record);
    }
    auto expected = reference.rows();

    std::mt19937 generator(42);
    for (int round = 0; round < 20; ++round) {
        std::shuffle(records.begin(), records.end(), generator);

        Aggregator shuffled;
        for (const auto& record : records) {
            shuffled.add(record);
        }
        auto actual = shuffled.rows();

        ASSERT_EQ(expected.size(), actual.size());
        for (size_t i = 0; i < expected.size(); ++i) {
            EXPECT_EQ(expected[i].dimension, actual[i].dimension);
            EXPECT_EQ(expected[i].key, actual[i].key);
            EXPECT_EQ(expected[i].executionCount, actual[i].executionCount);
            EXPECT_NEAR(expected[i].totalQuantity, actual[i].totalQuantity, 1e-9);
            EXPECT_NEAR(expected[i].totalNotional, actual[i].totalNotional, 1e-9);
            EXPECT_NEAR(expected[i].weightedSlippage, actual[i].weightedSlippage, 1e-12);
            EXPECT_NEAR(expected[i].weightedSlippageBps, actual[i].weightedSlippageBps, 1e-9);
        }
    }
}

TEST_F(AggregatorTest, MergeEqualsSingleFold)
{
    Aggregator whole;
    Aggregator left;
    Aggregator right;
    for (size_t i = 0; i < records.size(); ++i) {
        whole.add(records[i]);
        (i % 2 == 0 ? left : right).add(records[i]);
    }
    left.merge(right);

    auto expected = whole.rows();
    auto actual = left.rows();
    ASSERT_EQ(expected.size(), actual.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(expected[i].key, actual[i].key);
        EXPECT_EQ(expected[i].executionCount, actual[i].executionCount);
        EXPECT_NEAR(expected[i].weightedSlippage, actual[i].weightedSlippage, 1e-12);
    }
}

TEST(AggregatorStability, LargeAndSmallMagnitudes)
{
    // A naive running sum loses the small contributions entirely
    Aggregator aggregator;
    aggregator.add(makeRecord("BIG", "A", Side::Buy, 1e16, 0.0, 0.0));
    for (int i = 0; i < 1000; ++i) {
        aggregator.add(makeRecord("S" + std::to_string(i), "A", Side::Buy, 1.0, 0.0, 0.0));
    }
    aggregator.add(makeRecord("NEG", "A", Side::Buy, -1e16, 0.0, 0.0));

    EXPECT_DOUBLE_EQ(1000.0, aggregator.rows()[0].totalQuantity);
}
