#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "AppConfig.hpp"
#include "errors.hpp"

using namespace code_query;
using json = nlohmann::json;
namespace fs = std::filesystem;

TEST(AppConfigTest, DefaultsAreConsistent) {
    AppConfig cfg;

    EXPECT_NO_THROW(cfg.validate());
    EXPECT_EQ(cfg.max_iterations, 3);
    EXPECT_EQ(cfg.history_length, 4u);
    EXPECT_EQ(cfg.history_char_cap, 500u);
    EXPECT_EQ(cfg.cache_ceiling_chars, 8000u);
    EXPECT_EQ(cfg.cache_head_chars + cfg.cache_tail_chars, 8000u);
    EXPECT_EQ(cfg.preview_chars, 500u);
}

TEST(AppConfigTest, JsonOverridesOnlyWhatItNames) {
    AppConfig cfg = AppConfig::from_json({
        {"chat_model", "qwen2.5-coder"},
        {"max_iterations", 5},
        {"ignored_paths", {"vendor/", "./third_party"}},
    });

    EXPECT_EQ(cfg.chat_model, "qwen2.5-coder");
    EXPECT_EQ(cfg.max_iterations, 5);
    EXPECT_EQ(cfg.helper_model, AppConfig{}.helper_model);
    EXPECT_EQ(cfg.filter.ignored_paths, (std::vector<std::string>{"vendor", "third_party"}));
}

TEST(AppConfigTest, ExtensionsAreNormalized) {
    AppConfig cfg = AppConfig::from_json({{"allowed_extensions", {".PY", "cpp", ""}}});

    EXPECT_EQ(cfg.filter.allowed_extensions, (std::vector<std::string>{"py", "cpp"}));
}

TEST(AppConfigTest, InconsistentTruncationIsRejected) {
    EXPECT_THROW(AppConfig::from_json({{"cache_ceiling_chars", 1000}}), ConfigError);
}

TEST(AppConfigTest, ZeroIterationsIsRejected) {
    EXPECT_THROW(AppConfig::from_json({{"max_iterations", 0}}), ConfigError);
}

TEST(AppConfigTest, WrongTypeIsAConfigError) {
    EXPECT_THROW(AppConfig::from_json({{"max_iterations", "three"}}), ConfigError);
}

TEST(AppConfigTest, RootMustBeAnObject) {
    EXPECT_THROW(AppConfig::from_json(json::array({1, 2})), ConfigError);
}

TEST(AppConfigTest, MissingExplicitFileIsAnError) {
    EXPECT_THROW(AppConfig::load("/definitely/not/here/config.json"), ConfigError);
}

TEST(AppConfigTest, LoadsExplicitFile) {
    fs::path path = fs::temp_directory_path() / "code_query_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"bot_name": "Helper", "history_length": 2})";
    }

    AppConfig cfg = AppConfig::load(path.string());
    fs::remove(path);

    EXPECT_EQ(cfg.bot_name, "Helper");
    EXPECT_EQ(cfg.history_length, 2u);
}

TEST(AppConfigTest, MalformedFileIsAConfigError) {
    fs::path path = fs::temp_directory_path() / "code_query_config_bad.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }

    EXPECT_THROW(AppConfig::load(path.string()), ConfigError);
    fs::remove(path);
}
