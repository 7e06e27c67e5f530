#include "helpers/HelperLibrary.h"
#include <gtest/gtest.h>

namespace SBX {

class NumberHelpersTest : public ::testing::Test {
protected:
    HostValue number(const std::string &name, const HelperArgs &args) {
        return library_->call(HelperNamespace::Number, name, args);
    }

    HostValue math(const std::string &name, const HelperArgs &args) {
        return library_->call(HelperNamespace::Math, name, args);
    }

    std::shared_ptr<const HelperLibrary> library_ = HelperLibrary::createDefault();
};

TEST_F(NumberHelpersTest, Round_ToDecimals) {
    EXPECT_DOUBLE_EQ(number("round", {3.14159, 2}).get<double>(), 3.14);
    EXPECT_EQ(number("round", {2.5}), 3);
    EXPECT_EQ(number("round", {-2.5}), -3);
    EXPECT_TRUE(number("round", {7.4}).is_number_integer());
}

TEST_F(NumberHelpersTest, Round_HugeValueIsUnchanged) {
    EXPECT_DOUBLE_EQ(number("round", {1e300, 20}).get<double>(), 1e300);
    EXPECT_DOUBLE_EQ(number("round", {-1e300, 5}).get<double>(), -1e300);
}

TEST_F(NumberHelpersTest, Round_RejectsBadDecimals) {
    EXPECT_THROW(number("round", {1.5, 25}), HelperError);
    EXPECT_THROW(number("round", {"1.5"}), HelperError);
}

TEST_F(NumberHelpersTest, CeilFloorAbsClamp) {
    EXPECT_EQ(number("ceil", {1.2}), 2);
    EXPECT_EQ(number("floor", {-1.2}), -2);
    EXPECT_EQ(number("abs", {-7}), 7);
    EXPECT_EQ(number("clamp", {15, 0, 10}), 10);
    EXPECT_EQ(number("clamp", {-3, 0, 10}), 0);
}

TEST_F(NumberHelpersTest, Currency_UsesSymbolAndGrouping) {
    EXPECT_EQ(number("currency", {1234.5}), "$1,234.50");
    EXPECT_EQ(number("currency", {-5, "EUR"}), "-€5.00");
    EXPECT_EQ(number("currency", {1234567, "JPY"}), "¥1,234,567");
    EXPECT_EQ(number("currency", {10, "xyz"}), "XYZ 10.00");
    EXPECT_THROW(number("currency", {10, "DOLLARS"}), HelperError);
}

TEST_F(NumberHelpersTest, Percent_ScalesAndFormats) {
    EXPECT_EQ(number("percent", {0.1234}), "12.34%");
    EXPECT_EQ(number("percent", {0.5, 0}), "50%");
}

TEST_F(NumberHelpersTest, Math_Aggregates) {
    EXPECT_EQ(math("sum", {json::array({1, 2, 3})}), 6);
    EXPECT_EQ(math("sum", {json::array()}), 0);
    EXPECT_DOUBLE_EQ(math("avg", {json::array({1, 2})}).get<double>(), 1.5);
    EXPECT_EQ(math("avg", {json::array()}), 0);
    EXPECT_EQ(math("min", {json::array({4, -1, 9})}), -1);
    EXPECT_EQ(math("max", {json::array({4, -1, 9})}), 9);
    EXPECT_TRUE(math("min", {json::array()}).is_null());
    EXPECT_TRUE(math("max", {json::array()}).is_null());
}

TEST_F(NumberHelpersTest, Math_RejectsNonNumericElements) {
    EXPECT_THROW(math("sum", {json::array({1, "2"})}), HelperError);
    EXPECT_THROW(math("avg", {"1,2"}), HelperError);
}

TEST_F(NumberHelpersTest, Random_StaysInRange) {
    for (int i = 0; i < 100; ++i) {
        double value = math("random", {5, 10}).get<double>();
        EXPECT_GE(value, 5.0);
        EXPECT_LT(value, 10.0);

        int64_t dice = math("randomInt", {1, 6}).get<int64_t>();
        EXPECT_GE(dice, 1);
        EXPECT_LE(dice, 6);
    }
}

}  // namespace SBX
