/**
 * @file CommissionCalculatorTest.cpp
 * @brief Unit tests for commission split and order numbering
 */

#include <gtest/gtest.h>
#include "domain/CommissionCalculator.hpp"
#include "domain/OrderNumber.hpp"

using namespace marketplace::domain;

// ============================================================================
// COMMISSION SPLIT
// ============================================================================

TEST(CommissionCalculatorTest, VendorRate_SplitsSubtotal) {
    auto split = CommissionCalculator::computeSplit(Decimal(3000), Decimal(5));

    EXPECT_EQ(split.rateFixed(), "5.00");
    EXPECT_EQ(split.commissionAmountFixed(), "150.00");
    EXPECT_EQ(split.vendorEarningsFixed(), "2850.00");
    EXPECT_EQ(split.platformRevenueFixed(), "150.00");
}

TEST(CommissionCalculatorTest, FractionalRate_RoundsCommissionAndKeepsSum) {
    auto split = CommissionCalculator::computeSplit(Decimal("99.99"), Decimal("7.5"));

    EXPECT_EQ(split.commissionAmountFixed(), "7.50");
    EXPECT_EQ(split.vendorEarningsFixed(), "92.49");
    EXPECT_EQ(split.commissionAmount + split.vendorEarnings, Decimal("99.99"));
}

TEST(CommissionCalculatorTest, NoVendorRate_UsesDefault) {
    auto split = CommissionCalculator::computeSplit(Decimal(1000), std::nullopt);

    EXPECT_EQ(split.rateFixed(), "5.00");
    EXPECT_EQ(split.commissionAmountFixed(), "50.00");
    EXPECT_EQ(split.vendorEarningsFixed(), "950.00");
}

TEST(CommissionCalculatorTest, NoVendorRate_UsesConfiguredDefault) {
    auto split = CommissionCalculator::computeSplit(Decimal(1000), std::nullopt, Decimal(10));

    EXPECT_EQ(split.commissionAmountFixed(), "100.00");
}

TEST(CommissionCalculatorTest, ZeroAndFullRate) {
    auto zero = CommissionCalculator::computeSplit(Decimal("250.50"), Decimal(0));
    EXPECT_EQ(zero.commissionAmountFixed(), "0.00");
    EXPECT_EQ(zero.vendorEarningsFixed(), "250.50");

    auto full = CommissionCalculator::computeSplit(Decimal("250.50"), Decimal(100));
    EXPECT_EQ(full.commissionAmountFixed(), "250.50");
    EXPECT_EQ(full.vendorEarningsFixed(), "0.00");
}

TEST(CommissionCalculatorTest, RateOutOfRange_Throws) {
    EXPECT_THROW(CommissionCalculator::computeSplit(Decimal(100), Decimal("-0.01")),
                 InvalidCommissionRateException);
    EXPECT_THROW(CommissionCalculator::computeSplit(Decimal(100), Decimal("100.01")),
                 InvalidCommissionRateException);
}

TEST(CommissionCalculatorTest, ParseRate) {
    EXPECT_FALSE(CommissionCalculator::parseRate(std::nullopt).has_value());
    EXPECT_FALSE(CommissionCalculator::parseRate(std::string("")).has_value());
    EXPECT_FALSE(CommissionCalculator::parseRate(std::string("abc")).has_value());

    auto rate = CommissionCalculator::parseRate(std::string("7.50"));
    ASSERT_TRUE(rate.has_value());
    EXPECT_EQ(*rate, Decimal("7.5"));
}

// ============================================================================
// ORDER NUMBER
// ============================================================================

TEST(OrderNumberTest, PadsSequenceToSixDigits) {
    EXPECT_EQ(OrderNumber::format("ZK", 2024, 1), "ZK-2024-000001");
    EXPECT_EQ(OrderNumber::format("ZK", 2025, 123456), "ZK-2025-123456");
}

TEST(OrderNumberTest, LongSequenceNotTruncated) {
    EXPECT_EQ(OrderNumber::format("ZK", 2025, 1234567), "ZK-2025-1234567");
}
