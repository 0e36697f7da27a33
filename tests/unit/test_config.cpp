#include <gtest/gtest.h>

#include "Config.h"
#include "TestHelpers.h"
#include "TransferSettings.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>

using namespace HuffStream;
using HuffStream::test::TempDir;

namespace {

    void writeText(const std::string& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

} // namespace

TEST(ConfigTest, LoadsKeyValueFile) {
    TempDir dir;
    writeText(dir.file("server.conf"),
              "# comment\n"
              "\n"
              "control_port = 9101\n"
              "data_port=9100\n"
              "save_directory =  /srv/received  \n"
              "not a setting\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(dir.file("server.conf")));

    EXPECT_EQ(config.getInt("control_port"), 9101);
    EXPECT_EQ(config.getInt("data_port"), 9100);
    EXPECT_EQ(config.get("save_directory"), "/srv/received");
    EXPECT_FALSE(config.hasKey("not a setting"));
    EXPECT_EQ(config.keys().size(), 3u);
}

TEST(ConfigTest, MissingFileIsReported) {
    Config config;
    EXPECT_FALSE(config.loadFromFile("/nonexistent/huffstream.conf"));
}

TEST(ConfigTest, TypedGettersFallBackOnBadValues) {
    Config config;
    config.set("port", "12ab");
    config.set("size", "-4");
    config.set("flag", "maybe");
    config.setBool("on", true);

    EXPECT_EQ(config.getInt("port", 7), 7);
    EXPECT_EQ(config.getSize("size", 9), 9u);
    EXPECT_TRUE(config.getBool("flag", true));
    EXPECT_TRUE(config.getBool("on"));
    EXPECT_EQ(config.getInt("missing", 3), 3);
}

TEST(ConfigTest, LaterLayersOverrideEarlierOnes) {
    TempDir dir;
    writeText(dir.file("a.conf"), "host=10.0.0.1\nbuffer_size=1024\n");
    writeText(dir.file("b.conf"), "host=10.0.0.2\n");

    Config config;
    EXPECT_TRUE(config.loadLayered({dir.file("a.conf"), dir.file("missing.conf"), dir.file("b.conf")}));
    EXPECT_EQ(config.get("host"), "10.0.0.2");
    EXPECT_EQ(config.getInt("buffer_size"), 1024);

    EXPECT_TRUE(config.loadFromFile(dir.file("a.conf"), false));
    EXPECT_EQ(config.get("host"), "10.0.0.2");
}

TEST(ConfigTest, EnvironmentOverridesKnownKeys) {
    ::setenv("HUFFSTREAM_TEST_DATA_PORT", "9555", 1);

    Config config;
    config.set("data_port", "9000");
    EXPECT_EQ(config.applyEnvironment("HUFFSTREAM_TEST_", {"data_port", "control_port"}), 1u);
    EXPECT_EQ(config.getInt("data_port"), 9555);
    EXPECT_FALSE(config.hasKey("control_port"));

    ::unsetenv("HUFFSTREAM_TEST_DATA_PORT");
}

TEST(ConfigTest, SaveWritesSortedKeys) {
    TempDir dir;
    Config config;
    config.set("b", "2");
    config.set("a", "1");
    ASSERT_TRUE(config.saveToFile(dir.file("out.conf")));

    std::ifstream in(dir.file("out.conf"));
    std::string first, second;
    std::getline(in, first);
    std::getline(in, second);
    EXPECT_EQ(first, "a=1");
    EXPECT_EQ(second, "b=2");
}

TEST(ServerSettingsTest, DefaultsAreValid) {
    Config config;
    auto settings = ServerSettings::fromConfig(config);
    ASSERT_TRUE(settings) << settings.error().message;

    EXPECT_EQ(settings->host, "0.0.0.0");
    EXPECT_EQ(settings->controlPort, hfs::config::DEFAULT_CONTROL_PORT);
    EXPECT_EQ(settings->dataPort, hfs::config::DEFAULT_DATA_PORT);
    EXPECT_EQ(settings->legacyPort, 0);
    EXPECT_EQ(settings->bufferSize, hfs::config::DEFAULT_BUFFER_SIZE);
    EXPECT_EQ(settings->saveDirectory, hfs::config::DEFAULT_SAVE_DIRECTORY);
    EXPECT_FALSE(settings->tls.enabled);
}

TEST(ServerSettingsTest, ReadsEveryKey) {
    Config config;
    config.set("host", "127.0.0.1");
    config.set("control_port", "7001");
    config.set("data_port", "7000");
    config.set("legacy_port", "7002");
    config.set("buffer_size", "65536");
    config.set("max_connections", "32");
    config.set("save_directory", "inbox");

    auto settings = ServerSettings::fromConfig(config);
    ASSERT_TRUE(settings) << settings.error().message;
    EXPECT_EQ(settings->host, "127.0.0.1");
    EXPECT_EQ(settings->controlPort, 7001);
    EXPECT_EQ(settings->dataPort, 7000);
    EXPECT_EQ(settings->legacyPort, 7002);
    EXPECT_EQ(settings->bufferSize, 65536u);
    EXPECT_EQ(settings->maxConnections, 32u);
    EXPECT_EQ(settings->saveDirectory, "inbox");
}

TEST(ServerSettingsTest, InvalidValueNamesTheKey) {
    Config config;
    config.set("data_port", "seventy");

    auto settings = ServerSettings::fromConfig(config);
    ASSERT_FALSE(settings);
    EXPECT_EQ(settings.error().code, hfs::ErrorCode::InvalidConfig);
    EXPECT_NE(settings.error().message.find("data_port"), std::string::npos);
}

TEST(ServerSettingsTest, RejectsInconsistentPorts) {
    ServerSettings settings;
    settings.controlPort = 9000;
    settings.dataPort = 9000;
    EXPECT_EQ(settings.validate().error().code, hfs::ErrorCode::InvalidConfig);

    settings.dataPort = 9001;
    settings.controlPort = 9002;
    settings.legacyPort = 9001;
    EXPECT_FALSE(settings.validate());

    settings.legacyPort = 70000;
    EXPECT_FALSE(settings.validate());

    // Ephemeral ports never collide
    settings.controlPort = 0;
    settings.dataPort = 0;
    settings.legacyPort = 0;
    EXPECT_TRUE(settings.validate());
}

TEST(ServerSettingsTest, RejectsTinyConnectionLimit) {
    ServerSettings settings;
    settings.maxConnections = 1;
    EXPECT_FALSE(settings.validate());

    Config config;
    config.set("max_connections", "1");
    EXPECT_FALSE(ServerSettings::fromConfig(config));
}

TEST(ServerSettingsTest, TlsNeedsCertificateAndKey) {
    ServerSettings settings;
    settings.tls.enabled = true;

    auto missing = settings.validate();
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, hfs::ErrorCode::MissingTLSMaterial);

    settings.tls.certFile = "/nonexistent/cert.pem";
    settings.tls.keyFile = "/nonexistent/key.pem";
    EXPECT_EQ(settings.validate().error().code, hfs::ErrorCode::MissingTLSMaterial);

    TempDir dir;
    writeText(dir.file("cert.pem"), "x");
    writeText(dir.file("key.pem"), "x");
    settings.tls.certFile = dir.file("cert.pem");
    settings.tls.keyFile = dir.file("key.pem");
    EXPECT_TRUE(settings.validate());
}

TEST(ClientSettingsTest, ReadsRetryPolicy) {
    Config config;
    config.set("retry_attempts", "5");
    config.set("retry_delay_ms", "250");
    config.set("tls_enabled", "yes");
    config.set("tls_verify", "false");

    auto settings = ClientSettings::fromConfig(config);
    ASSERT_TRUE(settings) << settings.error().message;
    EXPECT_EQ(settings->host, "127.0.0.1");
    EXPECT_EQ(settings->retryAttempts, 5);
    EXPECT_EQ(settings->retryDelayMs, 250);
    EXPECT_TRUE(settings->tls.enabled);
    EXPECT_FALSE(settings->tls.verify);
}

TEST(ClientSettingsTest, RejectsBadValues) {
    Config config;
    config.set("retry_attempts", "0");
    EXPECT_FALSE(ClientSettings::fromConfig(config));

    Config flags;
    flags.set("tls_verify", "sometimes");
    auto bad = ClientSettings::fromConfig(flags);
    ASSERT_FALSE(bad);
    EXPECT_NE(bad.error().message.find("tls_verify"), std::string::npos);

    ClientSettings settings;
    settings.tls.enabled = true;
    settings.tls.caFile = "/nonexistent/ca.pem";
    EXPECT_EQ(settings.validate().error().code, hfs::ErrorCode::MissingTLSMaterial);
}

TEST(LoggingConfigTest, RejectsUnknownLevel) {
    Config config;
    config.set("log_level", "chatty");
    auto applied = applyLoggingConfig(config);
    ASSERT_FALSE(applied);
    EXPECT_EQ(applied.error().code, hfs::ErrorCode::InvalidConfig);
}

TEST(LoggingConfigTest, KnownKeysCoverSettings) {
    const auto& keys = knownConfigKeys();
    for (const char* key : {"control_port", "data_port", "legacy_port", "tls_enabled", "buffer_size",
                            "retry_attempts", "save_directory", "log_level"}) {
        EXPECT_NE(std::find(keys.begin(), keys.end(), key), keys.end()) << key;
    }
}
