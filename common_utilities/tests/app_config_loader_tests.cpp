/**
 * @file app_config_loader_tests.cpp
 * @brief 配置加载器测试：YAML / 环境变量 / 命令行 的优先级合并
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "isocal/common_utils/utilities/app_config_loader.h"
#include "isocal/common_utils/utilities/exceptions.h"

using namespace isocal::common_utils;

namespace isocal::common_utils::tests {

class AppConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "isocal_config_loader_test";
        std::filesystem::create_directories(tempDir_);
        clearEnvironment();
    }

    void TearDown() override {
        clearEnvironment();
        std::error_code ec;
        std::filesystem::remove_all(tempDir_, ec);
    }

    static void clearEnvironment() {
        for (const char* name : {"ISOCAL_LOG_LEVEL", "ISOCAL_RESOLVER", "ISOCAL_YEAR", "ISOCAL_MONTH"}) {
            unsetenv(name);
        }
    }

    std::filesystem::path writeYaml(const std::string& name, const std::string& content) {
        std::filesystem::path path = tempDir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path tempDir_;
};

TEST_F(AppConfigLoaderTest, constructor_Defaults_LogLevelAndFile) {
    AppConfigLoader loader;
    EXPECT_EQ(loader.getAppName(), "isocal");
    EXPECT_EQ(loader.getString("log_level"), "info");
    EXPECT_TRUE(loader.has("log_file"));
    EXPECT_EQ(loader.getString("log_file", "unused"), "");
    EXPECT_FALSE(loader.has("year"));
    EXPECT_EQ(loader.getString("year", "fallback"), "fallback");
}

TEST_F(AppConfigLoaderTest, loadFromFile_NestedYaml_FlattensWithDots) {
    auto path = writeYaml("nested.yaml",
        "log_level: debug\n"
        "date:\n"
        "  year: 2008\n"
        "  month: 2\n"
        "resolvers:\n"
        "  - strict\n"
        "  - previous_valid\n");

    AppConfigLoader loader;
    ASSERT_TRUE(loader.loadFromFile(path));
    EXPECT_EQ(loader.getString("log_level"), "debug");
    EXPECT_EQ(loader.getInt("date.year"), 2008);
    EXPECT_EQ(loader.getInt("date.month"), 2);
    EXPECT_EQ(loader.getString("resolvers"), "strict,previous_valid");
    EXPECT_EQ(loader.get("date.year")->source, ConfigSource::FILE_YAML);
}

TEST_F(AppConfigLoaderTest, loadFromFile_MissingOrMalformed_ReturnsFalse) {
    AppConfigLoader loader;
    EXPECT_FALSE(loader.loadFromFile(tempDir_ / "does_not_exist.yaml"));

    auto path = writeYaml("broken.yaml", "log_level: [unclosed\n");
    EXPECT_FALSE(loader.loadFromFile(path));
    EXPECT_EQ(loader.getString("log_level"), "info");
}

TEST_F(AppConfigLoaderTest, loadFromEnvironment_PrefixedVariable_OverridesYaml) {
    auto path = writeYaml("env.yaml", "log_level: debug\nresolver: strict\n");
    setenv("ISOCAL_LOG_LEVEL", "error", 1);

    AppConfigLoader loader;
    loader.setDefault("resolver", "previous_valid");
    ASSERT_TRUE(loader.loadFromFile(path));
    EXPECT_EQ(loader.loadFromEnvironment(), 1);
    EXPECT_EQ(loader.getString("log_level"), "error");
    EXPECT_EQ(loader.get("log_level")->source, ConfigSource::ENVIRONMENT);
    EXPECT_EQ(loader.getString("resolver"), "strict");
}

TEST_F(AppConfigLoaderTest, loadFromCommandLine_Forms_ParsesKeyValuesAndFlags) {
    const char* argv[] = {"isocal_date_calc", "positional", "--year=2008", "--month", "2",
                          "--Log-Level=warn", "--amount=-5", "--verbose"};
    AppConfigLoader loader;
    EXPECT_EQ(loader.loadFromCommandLine(8, argv), 5);
    EXPECT_EQ(loader.getInt64("year"), 2008);
    EXPECT_EQ(loader.getInt("month"), 2);
    EXPECT_EQ(loader.getString("log_level"), "warn");
    EXPECT_EQ(loader.getInt("amount"), -5);
    EXPECT_TRUE(loader.getBool("verbose"));
    EXPECT_FALSE(loader.has("positional"));
}

TEST_F(AppConfigLoaderTest, precedence_AllSources_CommandLineWinsRegardlessOfOrder) {
    auto path = writeYaml("precedence.yaml", "log_level: debug\n");
    setenv("ISOCAL_LOG_LEVEL", "error", 1);
    const char* argv[] = {"isocal_date_calc", "--log_level=trace"};

    AppConfigLoader loader;
    // 命令行先加载，随后加载的低优先级来源不得覆盖
    loader.loadFromCommandLine(2, argv);
    ASSERT_TRUE(loader.loadFromFile(path));
    loader.loadFromEnvironment();

    EXPECT_EQ(loader.getString("log_level"), "trace");
    EXPECT_EQ(loader.get("log_level")->source, ConfigSource::COMMAND_LINE);
}

TEST_F(AppConfigLoaderTest, getInt_NonNumericOrOversized_ThrowsConfigurationException) {
    const char* argv[] = {"isocal_date_calc", "--year=twenty", "--amount=99999999999", "--day= 7 "};
    AppConfigLoader loader;
    loader.loadFromCommandLine(4, argv);
    EXPECT_THROW(loader.getInt("year"), ConfigurationException);
    EXPECT_THROW(loader.getInt("amount"), ConfigurationException);
    EXPECT_EQ(loader.getInt64("amount"), INT64_C(99999999999));
    EXPECT_EQ(loader.getInt("day"), 7);
}

TEST_F(AppConfigLoaderTest, validateRequired_MissingKeys_Reported) {
    const char* argv[] = {"isocal_date_calc", "--year=2008"};
    AppConfigLoader loader;
    loader.loadFromCommandLine(2, argv);
    auto missing = loader.validateRequired({"year", "month", "day"});
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0], "month");
    EXPECT_EQ(missing[1], "day");
}

TEST_F(AppConfigLoaderTest, loadFromEnvironment_DeclaredKeyWithoutDefault_Read) {
    setenv("ISOCAL_YEAR", "2008", 1);
    setenv("ISOCAL_MONTH", "2", 1);

    AppConfigLoader loader;
    EXPECT_EQ(loader.loadFromEnvironment(), 0);
    EXPECT_FALSE(loader.has("year"));

    loader.declareKey("year");
    loader.declareKey("Month");
    EXPECT_EQ(loader.loadFromEnvironment(), 2);
    EXPECT_EQ(loader.getInt64("year"), 2008);
    EXPECT_EQ(loader.getInt("month"), 2);
    EXPECT_EQ(loader.get("year")->source, ConfigSource::ENVIRONMENT);
    EXPECT_TRUE(loader.validateRequired({"year", "month"}).empty());
}

} // namespace isocal::common_utils::tests

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "🎯 开始执行配置加载器单元测试..." << std::endl;

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "\n✅ 配置加载器测试全部通过" << std::endl;
    } else {
        std::cout << "\n❌ 配置加载器测试存在失败" << std::endl;
    }

    return result;
}
