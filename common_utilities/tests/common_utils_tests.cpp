/**
 * @file common_utils_tests.cpp
 * @brief 异常体系、溢出检查运算与日志管理的基础单元测试
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "isocal/common_utils/utilities/exceptions.h"
#include "isocal/common_utils/utilities/logging_utils.h"
#include "isocal/common_utils/utilities/math_utils.h"

using namespace isocal::common_utils;

namespace isocal::common_utils::tests {

// =============================================================================
// 异常体系
// =============================================================================

class ExceptionsTest : public ::testing::Test {};

TEST_F(ExceptionsTest, rangeException_Constructed_CarriesPayloadAndMessage) {
    RangeException e(DateField::MONTH_OF_YEAR, 13, 1, 12);
    EXPECT_EQ(e.getCode(), ErrorCode::RANGE);
    EXPECT_EQ(e.getField(), DateField::MONTH_OF_YEAR);
    EXPECT_EQ(e.getValue(), 13);
    EXPECT_EQ(e.getMinimum(), 1);
    EXPECT_EQ(e.getMaximum(), 12);
    EXPECT_EQ(std::string(e.what()), "Illegal value for MonthOfYear field, value 13 is not in the range 1 to 12");
}

TEST_F(ExceptionsTest, hierarchy_AllKinds_CatchableAsBase) {
    auto codeOf = [](auto&& thrower) {
        try {
            thrower();
        } catch (const IsocalBaseException& e) {
            return e.getCode();
        }
        return ErrorCode::NONE;
    };
    EXPECT_EQ(codeOf([] { throw InvalidFieldException(DateField::DAY_OF_MONTH, "x"); }), ErrorCode::INVALID_FIELD);
    EXPECT_EQ(codeOf([] { throw ArithmeticOverflowException("x"); }), ErrorCode::ARITHMETIC_OVERFLOW);
    EXPECT_EQ(codeOf([] { throw NullInputException("x"); }), ErrorCode::NULL_INPUT);
    EXPECT_EQ(codeOf([] { throw ConfigurationException("x"); }), ErrorCode::CONFIGURATION);
}

TEST_F(ExceptionsTest, throwMacro_Message_AppendsSourceLocation) {
    try {
        ISOCAL_THROW(ConfigurationException, "bad key " << 42);
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        std::string message = e.what();
        EXPECT_EQ(message.rfind("bad key 42 (at ", 0), 0u) << message;
        EXPECT_NE(message.find("common_utils_tests.cpp"), std::string::npos) << message;
    }
}

TEST_F(ExceptionsTest, makeErrorMsg_MixedOperands_BuildsStdString) {
    int64_t epochDay = INT64_C(-784353015102);
    std::string field = "Year";
    std::string message = ISOCAL_MAKE_ERROR_MSG("Epoch day " << epochDay << ' ' << field << " out of range");

    EXPECT_EQ(message.rfind("Epoch day -784353015102 Year out of range (at ", 0), 0u) << message;
    EXPECT_NE(message.find(", in "), std::string::npos) << message;
    EXPECT_EQ(message.back(), ')');
}

TEST_F(ExceptionsTest, dateFieldName_AllFields_DisplayNames) {
    EXPECT_STREQ(dateFieldName(DateField::YEAR), "Year");
    EXPECT_STREQ(dateFieldName(DateField::DAY_OF_MONTH), "DayOfMonth");
    EXPECT_STREQ(dateFieldName(DateField::DAY_OF_WEEK), "DayOfWeek");
    EXPECT_STREQ(dateFieldName(DateField::DAY_OF_YEAR), "DayOfYear");
    EXPECT_STREQ(dateFieldName(DateField::YEAR_OF_ERA), "YearOfEra");
}

// =============================================================================
// MathUtils
// =============================================================================

class MathUtilsTest : public ::testing::Test {};

TEST_F(MathUtilsTest, safeAdd_Overflow_Throws) {
    EXPECT_EQ(MathUtils::safeAdd(INT64_MAX - 1, 1), INT64_MAX);
    EXPECT_THROW(MathUtils::safeAdd(INT64_MAX, 1), ArithmeticOverflowException);
    EXPECT_THROW(MathUtils::safeAdd(INT64_MIN, -1), ArithmeticOverflowException);
}

TEST_F(MathUtilsTest, safeSubtractMultiply_Overflow_Throws) {
    EXPECT_EQ(MathUtils::safeSubtract(0, INT64_MAX), -INT64_MAX);
    EXPECT_THROW(MathUtils::safeSubtract(INT64_MIN, 1), ArithmeticOverflowException);
    EXPECT_EQ(MathUtils::safeMultiply(146097, 400), 58438800);
    EXPECT_THROW(MathUtils::safeMultiply(INT64_MAX / 2 + 1, 2), ArithmeticOverflowException);
}

TEST_F(MathUtilsTest, safeNegate_MinValue_Throws) {
    EXPECT_EQ(MathUtils::safeNegate(INT64_MAX), -INT64_MAX);
    EXPECT_THROW(MathUtils::safeNegate(INT64_MIN), ArithmeticOverflowException);
}

TEST_F(MathUtilsTest, floorDivMod_NegativeDividend_RoundsTowardNegativeInfinity) {
    EXPECT_EQ(MathUtils::floorDiv(7, 12), 0);
    EXPECT_EQ(MathUtils::floorDiv(-1, 12), -1);
    EXPECT_EQ(MathUtils::floorDiv(-12, 12), -1);
    EXPECT_EQ(MathUtils::floorDiv(-13, 12), -2);
    EXPECT_EQ(MathUtils::floorMod(-1, 12), 11);
    EXPECT_EQ(MathUtils::floorMod(-12, 12), 0);
    EXPECT_EQ(MathUtils::floorMod(25, 12), 1);
    for (int64_t n = -50; n <= 50; ++n) {
        EXPECT_EQ(MathUtils::floorDiv(n, 7) * 7 + MathUtils::floorMod(n, 7), n);
    }
}

// =============================================================================
// LoggingManager
// =============================================================================

class LoggingManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        LoggingManager::setGlobalInstance(nullptr);
    }
};

TEST_F(LoggingManagerTest, getModuleLogger_SameName_ReturnsCachedLogger) {
    LoggingConfig config;
    config.console_level = "warn";
    auto manager = std::make_shared<LoggingManager>(config);
    manager->initialize(config);

    auto first = manager->getModuleLogger("calendar_test");
    auto second = manager->getModuleLogger("calendar_test");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "calendar_test");
}

TEST_F(LoggingManagerTest, stringToLevel_KnownAndUnknown_MapsOrDefaultsToInfo) {
    EXPECT_EQ(LoggingManager::stringToLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(LoggingManager::stringToLevel("WARN"), spdlog::level::warn);
    EXPECT_EQ(LoggingManager::stringToLevel("off"), spdlog::level::off);
    EXPECT_EQ(LoggingManager::stringToLevel("nonsense"), spdlog::level::info);
}

TEST_F(LoggingManagerTest, globalInstance_Injected_UsedByMacros) {
    LoggingConfig config;
    config.enable_console = false;
    auto injected = std::make_shared<LoggingManager>(config);
    LoggingManager::setGlobalInstance(injected);

    EXPECT_EQ(&LoggingManager::getGlobalInstance(), injected.get());
    EXPECT_NO_THROW(ISOCAL_LOG_WARN("test_module", "module logger {}", 2));
    EXPECT_EQ(injected->getModuleLogger("test_module"), getModuleLogger("test_module"));
}

} // namespace isocal::common_utils::tests

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "🎯 开始执行 common_utils 单元测试..." << std::endl;
    std::cout << "📊 测试覆盖范围：异常体系|溢出检查运算|日志管理" << std::endl;

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "\n✅ 所有单元测试通过" << std::endl;
    } else {
        std::cout << "\n❌ 部分单元测试失败，需要进一步检查" << std::endl;
    }

    return result;
}
