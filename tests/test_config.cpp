#include <gtest/gtest.h>

#include "jswitch/config.hpp"
#include "testing.hpp"

namespace {

using jswitch::Config;
using jswitch::ErrorKind;

TEST(ConfigTest, LoadsAllFields) {
    testutil::TemporaryDirectory tmp;
    auto path = tmp.WriteFile("config.json", R"({
        "JavaBase": "C:\\Java",
        "LogPath": "C:\\Logs",
        "DefaultVersion": "21"
    })");

    Config cfg;
    auto r = jswitch::LoadConfig(path, cfg);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.base_directory, "C:\\Java");
    ASSERT_TRUE(cfg.log_directory.has_value());
    EXPECT_EQ(*cfg.log_directory, "C:\\Logs");
    ASSERT_TRUE(cfg.default_version.has_value());
    EXPECT_EQ(*cfg.default_version, "21");
}

TEST(ConfigTest, OptionalFieldsDefaultToAbsent) {
    Config cfg;
    auto r = jswitch::ParseConfig(R"({"JavaBase": "/opt/java", "LogPath": null, "DefaultVersion": ""})", cfg);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.base_directory, "/opt/java");
    EXPECT_FALSE(cfg.log_directory.has_value());
    EXPECT_FALSE(cfg.default_version.has_value());
}

TEST(ConfigTest, MissingFileIsConfigNotFound) {
    testutil::TemporaryDirectory tmp;
    Config cfg;
    auto r = jswitch::LoadConfig(tmp.Path() + "/nope.json", cfg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ConfigNotFound);
}

TEST(ConfigTest, InvalidJsonIsParseError) {
    testutil::TemporaryDirectory tmp;
    auto path = tmp.WriteFile("config.json", "{ \"JavaBase\": ");
    Config cfg;
    auto r = jswitch::LoadConfig(path, cfg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ConfigParseError);
}

TEST(ConfigTest, NonObjectIsParseError) {
    Config cfg;
    auto r = jswitch::ParseConfig(R"(["JavaBase"])", cfg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ConfigParseError);
}

TEST(ConfigTest, WrongFieldTypeIsParseError) {
    Config cfg;
    auto r = jswitch::ParseConfig(R"({"JavaBase": "/opt/java", "DefaultVersion": 21})", cfg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::ConfigParseError);
}

TEST(ConfigTest, MissingBaseIsMissingRequiredField) {
    Config cfg;
    auto r = jswitch::ParseConfig(R"({"LogPath": "/var/log/jswitch"})", cfg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::MissingRequiredField);

    r = jswitch::ParseConfig(R"({"JavaBase": ""})", cfg);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::MissingRequiredField);
}

TEST(ConfigTest, DefaultPathIsBesideExecutableDirectory) {
    const std::string path = jswitch::DefaultConfigPath(nullptr);
    EXPECT_NE(path.find("config"), std::string::npos);
    EXPECT_EQ(std::filesystem::path(path).filename(), "config.json");
}

} // namespace
