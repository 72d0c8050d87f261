#include "../src/csvutils.hpp"
#include "../src/dataloader.hpp"
#include "../src/errors.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace execmetrics;

class DataLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        std::ofstream out("test_refdata.csv");
        out << "instrument_id,currency,multiplier,tick_size\n"
               "XYZ,USD,1,0.01\n"
               "FUT, EUR ,50,0.25\n";
        out.close();
    }

    void TearDown() override { std::remove("test_refdata.csv"); }
};

TEST_F(DataLoaderTest, LoadInstrumentsFromFile)
{
    auto instruments = loadInstruments("test_refdata.csv");
    ASSERT_EQ(2, instruments.size());
    EXPECT_EQ("XYZ", instruments[0].id);
    EXPECT_EQ("EUR", instruments[1].currency);
    EXPECT_DOUBLE_EQ(50.0, instruments[1].multiplier);
    EXPECT_DOUBLE_EQ(0.25, instruments[1].tickSize);
}

TEST_F(DataLoaderTest, LoadInvalidFile)
{
    EXPECT_THROW(loadInstruments("non_existent.csv"), std::runtime_error);
    EXPECT_THROW(loadExecutions("non_existent.csv"), std::runtime_error);
    EXPECT_THROW(loadMarketData("non_existent.csv"), std::runtime_error);
}

TEST(DataLoaderExecutions, ParsesRowsAndColumnsByName)
{
    std::istringstream input("Timestamp,Execution_ID,Instrument_ID,Side,Quantity,Price,Venue,Phase\n"
                             "2023-01-01 12:00:00.5,E1,XYZ,BUY,100,10.5,XNYS,CONTINUOUS_TRADING\n"
                             "\n"
                             "15,E2,XYZ,s,50,10.7,,\n");
    auto loaded = loadExecutions(input, "executions");

    EXPECT_TRUE(loaded.rejected.empty());
    ASSERT_EQ(2, loaded.executions.size());

    const auto& first = loaded.executions[0];
    EXPECT_EQ("E1", first.id);
    EXPECT_EQ("XYZ", first.instrumentId);
    EXPECT_EQ(Side::Buy, first.side);
    EXPECT_DOUBLE_EQ(100.0, first.quantity);
    EXPECT_DOUBLE_EQ(10.5, first.price);
    EXPECT_EQ(csv::parseTimestamp("2023-01-01T12:00:00.500"), first.timestamp);
    EXPECT_EQ("XNYS", first.venue);
    EXPECT_EQ("CONTINUOUS_TRADING", first.phase);

    const auto& second = loaded.executions[1];
    EXPECT_EQ(Side::Sell, second.side);
    EXPECT_EQ(15 * kNanosPerSecond, second.timestamp);
    EXPECT_TRUE(second.venue.empty());
}

TEST(DataLoaderExecutions, SignedQuantityWithoutSide)
{
    std::istringstream input("execution_id,instrument_id,side,quantity,price,timestamp\n"
                             "E1,XYZ,,100,10.5,1\n"
                             "E2,XYZ,,-50,10.7,2\n");
    auto loaded = loadExecutions(input, "executions");

    ASSERT_EQ(2, loaded.executions.size());
    EXPECT_EQ(Side::Buy, loaded.executions[0].side);
    EXPECT_EQ(Side::Sell, loaded.executions[1].side);
    EXPECT_DOUBLE_EQ(50.0, loaded.executions[1].quantity);
}

TEST(DataLoaderExecutions, BadRowsAreRejectedNotFatal)
{
    std::istringstream input("execution_id,instrument_id,side,quantity,price,timestamp\n"
                             "E1,XYZ,BUY,abc,10.5,1\n"
                             "E2,XYZ,HOLD,10,10.5,1\n"
                             "E3,XYZ,BUY,10,,1\n"
                             "E4,XYZ,BUY,10,10.5,yesterday\n"
                             ",XYZ,BUY,10,10.5,1\n"
                             "E5,XYZ,SELL,-10,10.5,1\n");
    auto loaded = loadExecutions(input, "executions");

    // Negative quantity with an explicit side is left for the calculator to reject
    ASSERT_EQ(1, loaded.executions.size());
    EXPECT_EQ("E5", loaded.executions[0].id);
    EXPECT_DOUBLE_EQ(-10.0, loaded.executions[0].quantity);

    ASSERT_EQ(5, loaded.rejected.size());
    EXPECT_EQ("E1", loaded.rejected[0].executionId);
    EXPECT_EQ(0u, loaded.rejected[0].reason.find("invalid row:"));
    EXPECT_NE(std::string::npos, loaded.rejected[1].reason.find("side"));
    EXPECT_NE(std::string::npos, loaded.rejected[2].reason.find("price"));
    EXPECT_EQ("<executions:6>", loaded.rejected[4].executionId);
}

TEST(DataLoaderExecutions, MissingColumnIsFatal)
{
    std::istringstream input("execution_id,instrument_id,quantity,price,timestamp\n");
    EXPECT_THROW(loadExecutions(input, "executions"), std::runtime_error);

    std::istringstream empty("");
    EXPECT_THROW(loadExecutions(empty, "executions"), std::runtime_error);
}

TEST(DataLoaderReference, MalformedRowIsIntegrityError)
{
    std::istringstream input("instrument_id,currency,multiplier,tick_size\n"
                             "XYZ,USD,one,0.01\n");
    EXPECT_THROW(loadInstruments(input, "refdata"), DataIntegrityError);
}

TEST(DataLoaderMarket, NullableFields)
{
    std::istringstream input("instrument_id,timestamp,bid,ask,last,volume,market_state\n"
                             "XYZ,10,99.5,100.5,,1000,CONTINUOUS_TRADING\n"
                             "XYZ,20,,,110,,\n");
    auto observations = loadMarketData(input, "marketdata");

    ASSERT_EQ(2, observations.size());
    EXPECT_DOUBLE_EQ(99.5, observations[0].bid.value());
    EXPECT_DOUBLE_EQ(100.5, observations[0].ask.value());
    EXPECT_FALSE(observations[0].last.has_value());
    EXPECT_DOUBLE_EQ(1000.0, observations[0].volume);
    EXPECT_EQ("CONTINUOUS_TRADING", observations[0].marketState);

    EXPECT_FALSE(observations[1].bid.has_value());
    EXPECT_DOUBLE_EQ(110.0, observations[1].last.value());
    EXPECT_DOUBLE_EQ(0.0, observations[1].volume);
    EXPECT_TRUE(observations[1].marketState.empty());
}

TEST(DataLoaderMarket, MalformedRowIsIntegrityError)
{
    std::istringstream input("instrument_id,timestamp,bid,ask,last,volume\n"
                             "XYZ,10,99.5x,100.5,,1000\n");
    EXPECT_THROW(loadMarketData(input, "marketdata"), DataIntegrityError);
}

TEST(CsvUtils, SplitAndTrim)
{
    auto fields = csv::splitLine(" a , b,,c\r");
    ASSERT_EQ(4, fields.size());
    EXPECT_EQ("a", fields[0]);
    EXPECT_EQ("b", fields[1]);
    EXPECT_EQ("", fields[2]);
    EXPECT_EQ("c", fields[3]);
}

TEST(CsvUtils, ParseTimestamp)
{
    EXPECT_EQ(0, csv::parseTimestamp("1970-01-01 00:00:00"));
    EXPECT_EQ(1672574400LL * kNanosPerSecond, csv::parseTimestamp("2023-01-01T12:00:00Z"));
    EXPECT_EQ(1672574400LL * kNanosPerSecond + 123456000, csv::parseTimestamp("2023-01-01 12:00:00.123456"));
    EXPECT_EQ(1672531200LL * kNanosPerSecond, csv::parseTimestamp("2023-01-01"));
    EXPECT_EQ(1500000000, csv::parseTimestamp("1.5"));

    EXPECT_THROW(csv::parseTimestamp("2023-13-01"), std::invalid_argument);
    EXPECT_THROW(csv::parseTimestamp("2023-01-01 12:00"), std::invalid_argument);
    EXPECT_THROW(csv::parseTimestamp("soon"), std::invalid_argument);
    EXPECT_THROW(csv::parseTimestamp(""), std::invalid_argument);
}

TEST(CsvUtils, ParseTimestampRejectsImpossibleDates)
{
    EXPECT_THROW(csv::parseTimestamp("2023-02-31"), std::invalid_argument);
    EXPECT_THROW(csv::parseTimestamp("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(csv::parseTimestamp("2023-04-31 10:00:00"), std::invalid_argument);
    EXPECT_EQ(csv::parseTimestamp("2024-03-01") - 86400 * kNanosPerSecond, csv::parseTimestamp("2024-02-29"));
}

TEST(CsvUtils, ParseTimestampRejectsOutOfRange)
{
    // int64 nanoseconds cover 1677-09-21 to 2262-04-11
    EXPECT_THROW(csv::parseTimestamp("2300-01-01"), std::invalid_argument);
    EXPECT_THROW(csv::parseTimestamp("1600-01-01 00:00:00"), std::invalid_argument);
    EXPECT_THROW(csv::parseTimestamp("99999999999"), std::invalid_argument);
    EXPECT_THROW(csv::parseTimestamp("123456789012345678901234"), std::invalid_argument);

    EXPECT_EQ(9223372035LL * kNanosPerSecond, csv::parseTimestamp("9223372035"));
    EXPECT_EQ(csv::parseTimestamp("2262-04-11"), csv::parseTimestamp("2262-04-11 00:00:00"));
}

TEST(DataLoaderExecutions, OutOfRangeTimestampIsRejectedRow)
{
    std::istringstream input("execution_id,instrument_id,side,quantity,price,timestamp\n"
                             "E1,XYZ,BUY,10,10.5,2300-01-01\n"
                             "E2,XYZ,BUY,10,10.5,2023-02-31\n"
                             "E3,XYZ,BUY,10,10.5,1\n");
    auto loaded = loadExecutions(input, "executions");

    ASSERT_EQ(1, loaded.executions.size());
    EXPECT_EQ("E3", loaded.executions[0].id);
    ASSERT_EQ(2, loaded.rejected.size());
    EXPECT_EQ(0u, loaded.rejected[0].reason.find("invalid row:"));
}

TEST(DataLoaderMarket, OutOfRangeTimestampIsIntegrityError)
{
    std::istringstream input("instrument_id,timestamp,bid,ask,last,volume\n"
                             "XYZ,99999999999,,,100,1\n");
    EXPECT_THROW(loadMarketData(input, "marketdata"), DataIntegrityError);
}

TEST(CsvUtils, FormatTimestamp)
{
    Timestamp timestamp = csv::parseTimestamp("2023-01-01 12:00:00.123456");
    EXPECT_EQ("2023-01-01 12:00:00.123456000", csv::formatTimestamp(timestamp));
    EXPECT_EQ("1970-01-01 00:00:00.000000000", csv::formatTimestamp(0));
    EXPECT_EQ(csv::dayOf(csv::parseTimestamp("2023-01-01 23:59:59")), csv::dayOf(csv::parseTimestamp("2023-01-01")));
}
