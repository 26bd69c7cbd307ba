#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "pathgate/core/config.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "pathgate_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteConfig(const std::filesystem::path& path, const std::string& sandbox_json,
                 bool tls_enabled = false) {
    std::ofstream out(path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": 9090,\n"
        << "    \"threads\": 2,\n"
        << "    \"tls\": {\"enabled\": " << (tls_enabled ? "true" : "false")
        << ", \"certificate\": \"\", \"private_key\": \"\"},\n"
        << "    \"limits\": {\"max_body_bytes\": 1048576}\n"
        << "  },\n"
        << "  \"sandbox\": " << sandbox_json << ",\n"
        << "  \"tools\": {\"read_default_limit\": 100, \"max_line_length\": 80},\n"
        << "  \"observability\": {\"log_level\": \"warning\"}\n"
        << "}\n";
}

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override { std::filesystem::remove(path_); }

    std::filesystem::path path_ = MakeTempConfigPath();
};

}  // namespace

TEST_F(ConfigTest, LoadsSandboxSettings) {
    WriteConfig(path_, R"({"root_path": "/srv/sandbox", "platform": "windows",
                          "allowed_prefixes": ["C:/work/", "/shared/"]})");

    auto config = pathgate::core::LoadConfig(path_.string());
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.threads, 2);
    EXPECT_EQ(config.server.limits.max_body_bytes, 1048576u);
    EXPECT_EQ(config.sandbox.root_path, "/srv/sandbox");
    EXPECT_EQ(config.sandbox.platform, "windows");
    ASSERT_EQ(config.sandbox.allowed_prefixes.size(), 2u);
    EXPECT_EQ(config.sandbox.allowed_prefixes[0], "C:/work/");
    EXPECT_EQ(config.sandbox.allowed_prefixes[1], "/shared/");
    EXPECT_EQ(config.tools.read_default_limit, 100);
    EXPECT_EQ(config.tools.max_line_length, 80);
    EXPECT_EQ(config.observability.log_level, "warning");
}

TEST_F(ConfigTest, MissingSandboxKeysUseDefaults) {
    WriteConfig(path_, "{}");

    auto config = pathgate::core::LoadConfig(path_.string());
    EXPECT_EQ(config.sandbox.root_path, "data/sandbox");
    EXPECT_EQ(config.sandbox.platform, "host");
    EXPECT_TRUE(config.sandbox.allowed_prefixes.empty());
}

TEST_F(ConfigTest, RejectsUnknownPlatform) {
    WriteConfig(path_, R"({"root_path": "data", "platform": "plan9"})");

    EXPECT_THROW({ (void)pathgate::core::LoadConfig(path_.string()); }, std::invalid_argument);
}

TEST_F(ConfigTest, RejectsBlankAllowedPrefix) {
    WriteConfig(path_, R"({"root_path": "data", "allowed_prefixes": ["/data/", " "]})");

    EXPECT_THROW({ (void)pathgate::core::LoadConfig(path_.string()); }, std::invalid_argument);
}

TEST_F(ConfigTest, TlsEnabledRequiresCertificateAndKey) {
    WriteConfig(path_, "{}", true);

    EXPECT_THROW({ (void)pathgate::core::LoadConfig(path_.string()); }, std::invalid_argument);
}
