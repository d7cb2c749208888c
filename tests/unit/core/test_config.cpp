#include <gtest/gtest.h>
#include "csa/core/config.hpp"

#include <filesystem>
#include <fstream>

using namespace csa;
using namespace csa::core;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "csa_config_test";
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path write(const std::string& name, const std::string& content) const {
        const fs::path path = temp_dir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    fs::path temp_dir_;
};

TEST_F(ConfigTest, EmptyContentKeepsDefaults) {
    auto result = Config::load_from_string("");
    ASSERT_TRUE(result.is_ok());

    const Config& config = result.value();
    EXPECT_EQ(config.analysis.long_function_threshold, 50u);
    EXPECT_EQ(config.output.indent, 2);
    EXPECT_FALSE(config.output.include_ast);
    EXPECT_TRUE(config.output.pretty_print);
    EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigTest, ReadsAllSections) {
    auto result = Config::load_from_string(R"(
[analysis]
long_function_threshold = 20

[output]
indent = 4
include_ast = true
pretty_print = false
include_locations = false

[logging]
level = "debug"
)");
    ASSERT_TRUE(result.is_ok()) << result.error();

    const Config& config = result.value();
    EXPECT_EQ(config.analysis.long_function_threshold, 20u);
    EXPECT_EQ(config.output.indent, 4);
    EXPECT_TRUE(config.output.include_ast);
    EXPECT_FALSE(config.output.pretty_print);
    EXPECT_FALSE(config.output.include_locations);
    EXPECT_EQ(config.logging.level, "debug");

    const auto options = config.export_options();
    EXPECT_EQ(options.indent, 4);
    EXPECT_TRUE(options.include_ast);
    EXPECT_FALSE(options.pretty_print);
    EXPECT_FALSE(options.include_locations);
}

TEST_F(ConfigTest, InvalidTomlIsConfigError) {
    auto result = Config::load_from_string("[analysis\nlong_function_threshold = ");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_TRUE(result.error().has_context());
}

TEST_F(ConfigTest, WrongTypeIsConfigError) {
    auto result = Config::load_from_string("[output]\ninclude_ast = \"yes\"\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_NE(result.error().context()->find("output.include_ast"), std::string::npos);
}

TEST_F(ConfigTest, SectionMustBeTable) {
    auto result = Config::load_from_string("analysis = 3\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().context()->find("analysis must be a table"), std::string::npos);
}

TEST_F(ConfigTest, OutOfRangeValues) {
    auto negative = Config::load_from_string("[analysis]\nlong_function_threshold = -1\n");
    ASSERT_TRUE(negative.is_err());
    EXPECT_EQ(negative.error().code(), ErrorCode::ConfigError);

    auto indent = Config::load_from_string("[output]\nindent = 100\n");
    ASSERT_TRUE(indent.is_err());

    auto level = Config::load_from_string("[logging]\nlevel = \"loud\"\n");
    ASSERT_TRUE(level.is_err());
    EXPECT_NE(level.error().context()->find("logging.level"), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFile) {
    const fs::path path = write("csa.toml", "[analysis]\nlong_function_threshold = 10\n");

    auto result = Config::load_from_file(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().analysis.long_function_threshold, 10u);
}

TEST_F(ConfigTest, MissingFileKeepsReadError) {
    auto result = Config::load_from_file(temp_dir_ / "missing.toml");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(ConfigTest, InvalidFileNamesPath) {
    const fs::path path = write("bad.toml", "[output]\nindent = \"wide\"\n");

    auto result = Config::load_from_file(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_NE(result.error().context()->find(path.string()), std::string::npos);
}

TEST_F(ConfigTest, ToStringReloads) {
    Config config;
    config.analysis.long_function_threshold = 75;
    config.output.include_ast = true;
    config.logging.level = "info";

    auto reloaded = Config::load_from_string(config.to_string());
    ASSERT_TRUE(reloaded.is_ok()) << reloaded.error();
    EXPECT_EQ(reloaded.value().analysis.long_function_threshold, 75u);
    EXPECT_TRUE(reloaded.value().output.include_ast);
    EXPECT_EQ(reloaded.value().logging.level, "info");
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("WARN"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}
