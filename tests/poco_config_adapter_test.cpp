#include <gtest/gtest.h>
#include "core/config_observer.hpp"
#include "core/conversion_handler.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace
{
    class RecordingObserver : public ConfigObserver
    {
    public:
        void onConfigUpdate(const ConfigUpdateEvent &event) override
        {
            events.push_back(event);
        }

        std::vector<ConfigUpdateEvent> events;
    };
}

class PocoConfigAdapterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        ::unsetenv("PORT");
        PocoConfigAdapter::getInstance().resetToDefaults();
        temp_ = std::make_unique<test_support::TempDir>("config");
    }

    void TearDown() override
    {
        ::unsetenv("PORT");
        PocoConfigAdapter::getInstance().resetToDefaults();
    }

    std::string writeConfig(const std::string &content)
    {
        auto path = temp_->path() / "config.json";
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::unique_ptr<test_support::TempDir> temp_;
};

TEST_F(PocoConfigAdapterTest, DefaultsMatchDocumentedValues)
{
    auto &config = PocoConfigAdapter::getInstance();

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getServerHost(), "0.0.0.0");
    EXPECT_EQ(config.getServerPort(), 8080);
    EXPECT_EQ(config.getHttpServerThreads(), 8);
    EXPECT_EQ(config.getEncoderBinary(), "ffmpeg");
    EXPECT_EQ(config.getMp3Bitrate(), "128k");
    EXPECT_EQ(config.getMaxPayloadBytes(), 20u * 1024 * 1024);
    EXPECT_EQ(config.getConversionTimeoutSeconds(), 60);
    EXPECT_EQ(config.getMaxConcurrentConversions(), 4);
    EXPECT_EQ(config.getStderrCapBytes(), 65536u);
    EXPECT_FALSE(config.getTempRoot().empty());
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigAdapterTest, PortEnvironmentOverridesConfiguredPort)
{
    auto &config = PocoConfigAdapter::getInstance();

    ::setenv("PORT", "9191", 1);
    EXPECT_EQ(config.getServerPort(), 9191);

    ::setenv("PORT", "not-a-port", 1);
    EXPECT_EQ(config.getServerPort(), 8080);

    ::setenv("PORT", "70000", 1);
    EXPECT_EQ(config.getServerPort(), 8080);
}

TEST_F(PocoConfigAdapterTest, LoadOverlaysFileOnDefaults)
{
    auto &config = PocoConfigAdapter::getInstance();
    auto path = writeConfig(R"({
        "server_port": 9090,
        "limits": { "max_payload_bytes": 1048576 }
    })");

    ASSERT_TRUE(config.loadConfig(path));
    EXPECT_EQ(config.getServerPort(), 9090);
    EXPECT_EQ(config.getMaxPayloadBytes(), 1048576u);
    EXPECT_EQ(config.getConversionTimeoutSeconds(), 60);
    EXPECT_EQ(config.getEncoderBinary(), "ffmpeg");
}

TEST_F(PocoConfigAdapterTest, LoadRejectsMissingOrMalformedFiles)
{
    auto &config = PocoConfigAdapter::getInstance();

    EXPECT_FALSE(config.loadConfig((temp_->path() / "absent.json").string()));
    EXPECT_FALSE(config.loadConfig(writeConfig("{ not json")));
    EXPECT_FALSE(config.loadConfig(writeConfig("[1, 2, 3]")));
    EXPECT_EQ(config.getServerPort(), 8080);
}

TEST_F(PocoConfigAdapterTest, UpdateReportsOnlyChangedKeys)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    auto changed = config.updateConfig({{"limits", {{"conversion_timeout_seconds", 5}, {"max_concurrent_conversions", 4}}}});

    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0], "limits.conversion_timeout_seconds");
    ASSERT_EQ(observer.events.size(), 1u);
    EXPECT_TRUE(observer.events[0].hasKey("limits.conversion_timeout_seconds"));
    EXPECT_EQ(observer.events[0].source, "api");
    EXPECT_FALSE(observer.events[0].update_id.empty());

    auto unchanged = config.updateConfig({{"limits", {{"conversion_timeout_seconds", 5}}}});
    EXPECT_TRUE(unchanged.empty());
    EXPECT_EQ(observer.events.size(), 1u);

    config.unsubscribe(&observer);
}

TEST_F(PocoConfigAdapterTest, UpdateRejectsNonObjectPatch)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_THROW(config.updateConfig(nlohmann::json::array({1, 2})), std::invalid_argument);
}

TEST_F(PocoConfigAdapterTest, UnsubscribedObserverIsNotNotified)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);
    config.subscribe(&observer);
    config.updateConfig({{"mp3_bitrate", "192k"}});
    EXPECT_EQ(observer.events.size(), 1u);

    config.unsubscribe(&observer);
    config.updateConfig({{"mp3_bitrate", "96k"}});
    EXPECT_EQ(observer.events.size(), 1u);
}

TEST_F(PocoConfigAdapterTest, InvalidUpdatesAreRejectedAndNothingChanges)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    EXPECT_THROW(config.updateConfig({{"limits", {{"conversion_timeout_seconds", 0}}}}), std::invalid_argument);
    EXPECT_THROW(config.updateConfig({{"encoder_binary", ""}}), std::invalid_argument);
    EXPECT_THROW(config.updateConfig({{"log_level", "LOUD"}}), std::invalid_argument);
    EXPECT_THROW(config.updateConfig({{"server_port", 0}}), std::invalid_argument);
    EXPECT_THROW(config.updateConfig({{"server_port", "9090"}}), std::invalid_argument);
    EXPECT_THROW(config.updateConfig({{"limits", 5}}), std::invalid_argument);

    EXPECT_TRUE(observer.events.empty());
    EXPECT_EQ(config.getConversionTimeoutSeconds(), 60);
    EXPECT_EQ(config.getEncoderBinary(), "ffmpeg");
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getServerPort(), 8080);
    EXPECT_TRUE(config.validateConfig());

    config.unsubscribe(&observer);
}

TEST_F(PocoConfigAdapterTest, IntegersBeyondIntRangeAreRejected)
{
    auto &config = PocoConfigAdapter::getInstance();

    EXPECT_THROW(config.updateConfig({{"limits", {{"max_payload_bytes", 3000000000u}}}}), std::invalid_argument);
    EXPECT_THROW(config.updateConfig({{"limits", {{"stderr_cap_bytes", -1}}}}), std::invalid_argument);
    EXPECT_EQ(config.getMaxPayloadBytes(), 20u * 1024 * 1024);
    EXPECT_EQ(config.getStderrCapBytes(), 65536u);

    EXPECT_FALSE(config.loadConfig(writeConfig(R"({ "limits": { "max_payload_bytes": 4294967297 } })")));
    EXPECT_EQ(config.getMaxPayloadBytes(), 20u * 1024 * 1024);
}

TEST_F(PocoConfigAdapterTest, InvalidFileKeepsPreviousValues)
{
    auto &config = PocoConfigAdapter::getInstance();
    ASSERT_TRUE(config.loadConfig(writeConfig(R"({ "server_port": 9090, "mp3_bitrate": "192k" })")));

    RecordingObserver observer;
    config.subscribe(&observer);
    EXPECT_FALSE(config.loadConfig(writeConfig(R"({ "server_port": 0, "mp3_bitrate": "64k" })")));
    config.unsubscribe(&observer);

    EXPECT_TRUE(observer.events.empty());
    EXPECT_EQ(config.getServerPort(), 9090);
    EXPECT_EQ(config.getMp3Bitrate(), "192k");
}

TEST_F(PocoConfigAdapterTest, WatcherAppliesValidEditsAndIgnoresInvalidOnes)
{
    auto &config = PocoConfigAdapter::getInstance();
    const auto path = writeConfig(R"({ "limits": { "conversion_timeout_seconds": 30 } })");
    ASSERT_TRUE(config.loadConfig(path));

    auto waitFor = [&](int expected)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (config.getConversionTimeoutSeconds() != expected && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return config.getConversionTimeoutSeconds();
    };
    // mtime granularity can hide two writes within the same tick
    auto rewrite = [&](const std::string &content, int age_seconds)
    {
        writeConfig(content);
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() -
                                                   std::chrono::seconds(age_seconds));
    };

    config.startWatching(path, 1);

    rewrite(R"({ "limits": { "conversion_timeout_seconds": 45 } })", 20);
    EXPECT_EQ(waitFor(45), 45);

    rewrite(R"({ "limits": { "conversion_timeout_seconds": -5 } })", 10);
    std::this_thread::sleep_for(std::chrono::milliseconds(2500));
    EXPECT_EQ(config.getConversionTimeoutSeconds(), 45);
    EXPECT_TRUE(config.validateConfig());

    config.stopWatching();
}

TEST_F(PocoConfigAdapterTest, CommandLinePortSurvivesFileReload)
{
    auto &config = PocoConfigAdapter::getInstance();
    config.applyCommandLineOverrides({{"server_port", 9400}});
    EXPECT_EQ(config.getServerPort(), 9400);

    RecordingObserver observer;
    config.subscribe(&observer);
    ASSERT_TRUE(config.loadConfig(writeConfig(R"({ "server_port": 9090, "mp3_bitrate": "96k" })")));
    config.unsubscribe(&observer);

    EXPECT_EQ(config.getServerPort(), 9400);
    EXPECT_EQ(config.getMp3Bitrate(), "96k");
    ASSERT_EQ(observer.events.size(), 1u);
    EXPECT_FALSE(observer.events[0].hasKey("server_port"));

    config.resetToDefaults();
    EXPECT_EQ(config.getServerPort(), 8080);
    EXPECT_TRUE(config.getCommandLineOverrides().empty());
}

TEST_F(PocoConfigAdapterTest, InvalidCommandLineOverrideIsRejected)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_THROW(config.applyCommandLineOverrides({{"server_port", 70000}}), std::invalid_argument);
    EXPECT_EQ(config.getServerPort(), 8080);
    EXPECT_TRUE(config.getCommandLineOverrides().empty());
}

TEST_F(PocoConfigAdapterTest, HandlerFollowsLimitUpdates)
{
    auto &config = PocoConfigAdapter::getInstance();
    WorkspaceManager workspaces((temp_->path() / "workspaces").string());
    ConversionHandler handler(workspaces, ConversionHandler::Settings::fromConfig(config));
    config.subscribe(&handler);

    config.updateConfig({{"limits", {{"max_concurrent_conversions", 2}, {"max_payload_bytes", 512}}}, {"mp3_bitrate", "64k"}});

    EXPECT_EQ(handler.limiter().maxInFlight(), 2u);
    EXPECT_EQ(handler.settings().max_payload_bytes, 512u);
    EXPECT_EQ(handler.settings().invoker.bitrate, "64k");

    config.unsubscribe(&handler);
}

TEST_F(PocoConfigAdapterTest, FlattenProducesDottedKeys)
{
    auto flat = PocoConfigAdapter::flatten({{"a", 1}, {"b", {{"c", "x"}, {"d", {{"e", true}}}}}});

    ASSERT_EQ(flat.size(), 3u);
    EXPECT_EQ(flat.at("a").get<int>(), 1);
    EXPECT_EQ(flat.at("b.c").get<std::string>(), "x");
    EXPECT_TRUE(flat.at("b.d.e").get<bool>());
}

TEST_F(PocoConfigAdapterTest, SaveWritesLoadableFile)
{
    auto &config = PocoConfigAdapter::getInstance();
    config.updateConfig({{"server_port", 9300}});
    const auto path = (temp_->path() / "saved.json").string();

    ASSERT_TRUE(config.saveConfig(path));
    config.resetToDefaults();
    ASSERT_TRUE(config.loadConfig(path));
    EXPECT_EQ(config.getServerPort(), 9300);
}
