#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "sccplib/utils/config_loader.hpp"

using namespace sccplib::utils;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "sccplib_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        unsetenv("SCCPLIB_LOG_LEVEL");
        unsetenv("SCCPLIB_CODEC_STRICT_POINTERS");
        unsetenv("SCCPLIB_UNKNOWN_KEY");
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::filesystem::path createTestConfigFile(const std::string& filename, const std::string& content) {
        std::filesystem::path filepath = test_dir / filename;
        std::ofstream file(filepath);
        file << content;
        return filepath;
    }

    std::filesystem::path test_dir;
};

// Nested objects become dotted keys
TEST_F(ConfigLoaderTest, LoadFromFile) {
    auto path = createTestConfigFile("basic.json", R"({
        "codec": { "strict_pointers": true },
        "log": { "level": "debug", "file": "/tmp/sccp.log", "max_files": 3, "ratio": 0.5 },
        "tags": ["a", "b"]
    })");

    ConfigLoader loader;
    ASSERT_TRUE(loader.load_from_file(path));
    EXPECT_TRUE(loader.get_bool("codec.strict_pointers"));
    EXPECT_EQ(loader.get_string("log.level"), "debug");
    EXPECT_EQ(loader.get_string("log.file"), "/tmp/sccp.log");
    EXPECT_EQ(loader.get_int("log.max_files"), 3);
    EXPECT_DOUBLE_EQ(loader.get_double("log.ratio"), 0.5);
    EXPECT_EQ(loader.get_string_array("tags"), (std::vector<std::string>{"a", "b"}));
}

TEST_F(ConfigLoaderTest, NonExistentFile) {
    ConfigLoader loader;
    EXPECT_FALSE(loader.load_from_file(test_dir / "missing.json"));
    EXPECT_TRUE(loader.get_all_keys().empty());
}

TEST_F(ConfigLoaderTest, InvalidJson) {
    ConfigLoader loader;
    EXPECT_FALSE(loader.load_from_json_string(R"({"log": {"level": "debug",}})"));
    EXPECT_FALSE(loader.load_from_json_string("[1, 2, 3]"));
    EXPECT_FALSE(loader.has("log.level"));
}

// Getters fall back to the default on missing or mistyped values
TEST_F(ConfigLoaderTest, DefaultValues) {
    ConfigLoader loader;
    loader.set("name", std::string("sccp"));
    EXPECT_EQ(loader.get_string("missing", "fallback"), "fallback");
    EXPECT_EQ(loader.get_int("missing", 7), 7);
    EXPECT_EQ(loader.get_int("name", 9), 9);
    EXPECT_TRUE(loader.get_bool("name", true));
    EXPECT_DOUBLE_EQ(loader.get_double("missing", 1.5), 1.5);
}

// Defaults never replace values already present
TEST_F(ConfigLoaderTest, LoadDefaults) {
    ConfigLoader loader;
    loader.set("log.level", std::string("error"));
    loader.load_defaults({
        {"log.level", std::string("info")},
        {"log.colors", true},
    });
    EXPECT_EQ(loader.get_string("log.level"), "error");
    EXPECT_TRUE(loader.get_bool("log.colors"));
}

// Only keys that already exist are read from the environment
TEST_F(ConfigLoaderTest, EnvironmentOverrides) {
    ConfigLoader loader;
    loader.load_defaults({
        {"log.level", std::string("info")},
        {"codec.strict_pointers", false},
    });
    setenv("SCCPLIB_LOG_LEVEL", "trace", 1);
    setenv("SCCPLIB_CODEC_STRICT_POINTERS", "yes", 1);
    setenv("SCCPLIB_UNKNOWN_KEY", "1", 1);

    EXPECT_EQ(loader.load_from_environment(), 2u);
    EXPECT_EQ(loader.get_string("log.level"), "trace");
    EXPECT_TRUE(loader.get_bool("codec.strict_pointers"));
    EXPECT_FALSE(loader.has("unknown.key"));
}

TEST_F(ConfigLoaderTest, CommandLine) {
    ConfigLoader loader;
    const char* argv[] = {"tool", "--log.level=warning", "input.bin", "--codec.strict_pointers=true", "--", "-v"};
    auto rest = loader.load_from_command_line(6, argv);

    EXPECT_EQ(loader.get_string("log.level"), "warning");
    EXPECT_TRUE(loader.get_bool("codec.strict_pointers"));
    EXPECT_EQ(rest, (std::vector<std::string>{"input.bin", "--", "-v"}));
}

// File, then environment, then command line
TEST_F(ConfigLoaderTest, SourcePrecedence) {
    ConfigLoader loader;
    loader.load_defaults({{"log.level", std::string("info")}});
    ASSERT_TRUE(loader.load_from_json_string(R"({"log": {"level": "debug"}})"));
    EXPECT_EQ(loader.get_string("log.level"), "debug");

    setenv("SCCPLIB_LOG_LEVEL", "error", 1);
    loader.load_from_environment();
    EXPECT_EQ(loader.get_string("log.level"), "error");

    const char* argv[] = {"tool", "--log.level=critical"};
    loader.load_from_command_line(2, argv);
    EXPECT_EQ(loader.get_string("log.level"), "critical");
}

TEST_F(ConfigLoaderTest, KeysAndRemoval) {
    ConfigLoader loader;
    loader.set("log.level", std::string("info"));
    loader.set("log.colors", true);
    loader.set("codec.strict_pointers", false);

    EXPECT_EQ(loader.get_all_keys(), (std::vector<std::string>{"codec.strict_pointers", "log.colors", "log.level"}));
    EXPECT_EQ(loader.get_keys_with_prefix("log."), (std::vector<std::string>{"log.colors", "log.level"}));

    EXPECT_TRUE(loader.remove("log.colors"));
    EXPECT_FALSE(loader.remove("log.colors"));
    EXPECT_FALSE(loader.has("log.colors"));

    loader.clear();
    EXPECT_TRUE(loader.get_all_keys().empty());
}

// Dotted keys are nested again on output
TEST_F(ConfigLoaderTest, ToJsonString) {
    ConfigLoader loader;
    loader.set("log.level", std::string("info"));
    loader.set("codec.strict_pointers", true);

    auto j = nlohmann::json::parse(loader.to_json_string());
    EXPECT_EQ(j["log"]["level"], "info");
    EXPECT_EQ(j["codec"]["strict_pointers"], true);
}

// A key nested under another key's value is kept under its dotted name
TEST_F(ConfigLoaderTest, ToJsonStringOverlappingKeys) {
    for (bool short_first : {true, false}) {
        ConfigLoader loader;
        if (short_first) {
            loader.set("log", int64_t{1});
            loader.set("log.level", std::string("debug"));
        } else {
            loader.set("log.level", std::string("debug"));
            loader.set("log", int64_t{1});
        }
        loader.set("codec.strict_pointers", true);

        std::string text;
        ASSERT_NO_THROW(text = loader.to_json_string());
        auto j = nlohmann::json::parse(text);
        EXPECT_EQ(j["log"], 1);
        EXPECT_EQ(j["log.level"], "debug");
        EXPECT_EQ(j["codec"]["strict_pointers"], true);
    }

    const char* argv[] = {"tool", "--log=1", "--log.level=debug"};
    ConfigLoader cli;
    cli.load_from_command_line(3, argv);
    std::string text;
    ASSERT_NO_THROW(text = cli.to_json_string());
    auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j["log"], 1);
    EXPECT_EQ(j["log.level"], "debug");
}

// Key characters with meaning in JSON pointers are plain text here
TEST_F(ConfigLoaderTest, ToJsonStringSpecialCharacters) {
    ConfigLoader loader;
    loader.set("a~b", true);
    loader.set("path/with/slash", std::string("x"));

    std::string text;
    ASSERT_NO_THROW(text = loader.to_json_string());
    auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j["a~b"], true);
    EXPECT_EQ(j["path/with/slash"], "x");
}

TEST_F(ConfigLoaderTest, Utilities) {
    EXPECT_EQ(config_utils::normalize_env_var_name("log.level", "SCCPLIB_"), "SCCPLIB_LOG_LEVEL");

    EXPECT_EQ(config_utils::parse_bool("ON"), true);
    EXPECT_EQ(config_utils::parse_bool("0"), false);
    EXPECT_FALSE(config_utils::parse_bool("maybe").has_value());

    EXPECT_TRUE(std::holds_alternative<bool>(config_utils::parse_value("true")));
    EXPECT_TRUE(std::holds_alternative<int64_t>(config_utils::parse_value("42")));
    EXPECT_TRUE(std::holds_alternative<double>(config_utils::parse_value("4.5")));
    EXPECT_TRUE(std::holds_alternative<std::string>(config_utils::parse_value("debug")));
}
