// bar_series_validator_test.cpp - integrity checks ahead of the pipeline

#include <gtest/gtest.h>

#include "scanner/market_data/bar_series_validator.hpp"
#include "scanner/data_structures/scanner_errors.hpp"
#include "test_bar_builders.hpp"

#include <limits>

using namespace FvgScanner::Core;
using namespace FvgScanner::Testing;

TEST(BarSeriesValidatorTest, AcceptsScenarioSeries) {
    EXPECT_NO_THROW(BarSeriesValidator("SPY").validate_series(make_untouched_gap_scenario()));
    EXPECT_NO_THROW(BarSeriesValidator("SPY").validate_series({}));
}

TEST(BarSeriesValidatorTest, DuplicateTimestampIsIntegrityError) {
    std::vector<Bar> bars = make_flat_bars(5);
    bars[3].timestamp_ms = bars[2].timestamp_ms;
    try {
        BarSeriesValidator("QQQ").validate_series(bars);
        FAIL() << "duplicate timestamp accepted";
    } catch (const DataIntegrityError& integrity_error) {
        std::string message = integrity_error.what();
        EXPECT_NE(message.find("QQQ"), std::string::npos);
        EXPECT_NE(message.find("duplicate"), std::string::npos);
        EXPECT_NE(message.find("bar 3"), std::string::npos);
    }
}

TEST(BarSeriesValidatorTest, OutOfOrderTimestampIsIntegrityError) {
    std::vector<Bar> bars = make_flat_bars(5);
    std::swap(bars[1].timestamp_ms, bars[2].timestamp_ms);
    EXPECT_THROW(BarSeriesValidator("QQQ").validate_series(bars), DataIntegrityError);
}

TEST(BarSeriesValidatorTest, RejectsInconsistentPrices) {
    BarSeriesValidator validator("IWM");
    EXPECT_THROW(validator.validate_price_data(Bar(0, 10.0, 9.0, 11.0, 10.0, 1.0), 0), DataIntegrityError);
    EXPECT_THROW(validator.validate_price_data(Bar(0, 12.0, 11.0, 9.0, 10.0, 1.0), 0), DataIntegrityError);
    EXPECT_THROW(validator.validate_price_data(Bar(0, 10.0, 11.0, 9.0, 10.0, -1.0), 0), DataIntegrityError);
    EXPECT_THROW(validator.validate_price_data(Bar(0, std::numeric_limits<double>::quiet_NaN(), 11.0, 9.0, 10.0, 1.0), 0),
                 DataIntegrityError);
    EXPECT_NO_THROW(validator.validate_price_data(Bar(0, 10.0, 11.0, 9.0, 10.0, 0.0), 0));
}
