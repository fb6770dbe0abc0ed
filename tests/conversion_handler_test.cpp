#include <gtest/gtest.h>
#include "core/conversion_handler.hpp"
#include "logging/logger.hpp"
#include "test_support.hpp"
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

class ConversionHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
        temp_ = std::make_unique<test_support::TempDir>("handler");
        workspaces_ = std::make_unique<WorkspaceManager>((temp_->path() / "workspaces").string());
    }

    ConversionHandler::Settings settingsFor(const std::string &encoder)
    {
        ConversionHandler::Settings settings;
        settings.max_payload_bytes = 1024;
        settings.max_concurrent_conversions = 4;
        settings.invoker.encoder_binary = encoder;
        settings.invoker.timeout = std::chrono::milliseconds(10000);
        return settings;
    }

    ConversionRequest requestWith(ConversionHandler &handler, const std::string &payload)
    {
        return ConversionRequest(handler.nextRequestId(), payload, AudioFormat::Ogg, "voice");
    }

    bool workspaceRootEmpty() const
    {
        const auto root = temp_->path() / "workspaces";
        return !std::filesystem::exists(root) || std::filesystem::is_empty(root);
    }

    std::unique_ptr<test_support::TempDir> temp_;
    std::unique_ptr<WorkspaceManager> workspaces_;
};

TEST_F(ConversionHandlerTest, SuccessfulConversionReturnsArtifactAndCleansUp)
{
    ConversionHandler handler(*workspaces_, settingsFor(test_support::fixedOutputEncoder(temp_->path(), "ID3-mp3-bytes")));

    auto result = handler.handle(requestWith(handler, test_support::oggPayload("ok")));

    ASSERT_TRUE(result.success) << result.diagnostic;
    EXPECT_EQ(result.error_kind, ConversionErrorKind::None);
    EXPECT_EQ(std::string(result.artifact.begin(), result.artifact.end()), "ID3-mp3-bytes");
    EXPECT_EQ(handler.encoderInvocations(), 1u);
    EXPECT_EQ(workspaces_->liveCount(), 0u);
    EXPECT_TRUE(workspaceRootEmpty());
}

TEST_F(ConversionHandlerTest, EmptyPayloadIsRejectedBeforeAnyWork)
{
    ConversionHandler handler(*workspaces_, settingsFor(test_support::copyEncoder(temp_->path())));

    auto result = handler.handle(requestWith(handler, ""));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ConversionErrorKind::InvalidInput);
    EXPECT_EQ(handler.encoderInvocations(), 0u);
    EXPECT_EQ(workspaces_->acquiredCount(), 0u);
}

TEST_F(ConversionHandlerTest, PayloadAtLimitIsAcceptedAndOneOverIsRejected)
{
    ConversionHandler handler(*workspaces_, settingsFor(test_support::copyEncoder(temp_->path())));

    auto at_limit = handler.handle(requestWith(handler, std::string(1024, 'a')));
    EXPECT_TRUE(at_limit.success) << at_limit.diagnostic;
    EXPECT_EQ(handler.encoderInvocations(), 1u);

    auto over_limit = handler.handle(requestWith(handler, std::string(1025, 'a')));
    EXPECT_FALSE(over_limit.success);
    EXPECT_EQ(over_limit.error_kind, ConversionErrorKind::PayloadTooLarge);
    EXPECT_EQ(handler.encoderInvocations(), 1u);
    EXPECT_EQ(workspaces_->acquiredCount(), 1u);
}

TEST_F(ConversionHandlerTest, EncoderFailureKeepsDiagnosticOutOfPublicMessage)
{
    ConversionHandler handler(*workspaces_, settingsFor(test_support::failingEncoder(temp_->path())));

    auto result = handler.handle(requestWith(handler, test_support::oggPayload("bad")));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ConversionErrorKind::ConversionFailed);
    EXPECT_NE(result.diagnostic.find("unsupported format"), std::string::npos);
    EXPECT_EQ(result.error_message.find("unsupported format"), std::string::npos);
    EXPECT_TRUE(workspaceRootEmpty());
}

TEST_F(ConversionHandlerTest, EncoderStderrIsWrittenToServerLog)
{
    ConversionHandler handler(*workspaces_, settingsFor(test_support::failingEncoder(temp_->path())));
    test_support::LogCapture capture;
    ASSERT_TRUE(capture.attached());

    auto result = handler.handle(requestWith(handler, test_support::oggPayload("logged")));

    ASSERT_EQ(result.error_kind, ConversionErrorKind::ConversionFailed);
    const std::string logged = capture.text();
    EXPECT_NE(logged.find("unsupported format"), std::string::npos) << logged;
    EXPECT_NE(logged.find(result.request_id), std::string::npos) << logged;
    EXPECT_NE(logged.find("ConversionFailed"), std::string::npos) << logged;
}

TEST_F(ConversionHandlerTest, TimeoutIsReportedAndWorkspaceReleased)
{
    auto settings = settingsFor(test_support::hangingEncoder(temp_->path()));
    settings.invoker.timeout = std::chrono::milliseconds(300);
    ConversionHandler handler(*workspaces_, settings);

    auto result = handler.handle(requestWith(handler, test_support::oggPayload("slow")));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ConversionErrorKind::ConversionTimeout);
    EXPECT_TRUE(workspaceRootEmpty());
}

TEST_F(ConversionHandlerTest, ZeroExitWithoutOutputIsNotFound)
{
    ConversionHandler handler(*workspaces_, settingsFor(test_support::silentEncoder(temp_->path())));

    auto result = handler.handle(requestWith(handler, test_support::oggPayload("silent")));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ConversionErrorKind::NotFound);
    EXPECT_TRUE(workspaceRootEmpty());
}

TEST_F(ConversionHandlerTest, ZeroExitWithEmptyOutputIsConversionFailure)
{
    ConversionHandler handler(*workspaces_, settingsFor(test_support::emptyOutputEncoder(temp_->path())));

    auto result = handler.handle(requestWith(handler, test_support::oggPayload("empty")));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ConversionErrorKind::ConversionFailed);
    EXPECT_TRUE(workspaceRootEmpty());
}

TEST_F(ConversionHandlerTest, ConcurrentRequestsGetTheirOwnArtifacts)
{
    auto settings = settingsFor(test_support::copyEncoder(temp_->path()));
    settings.max_concurrent_conversions = 8;
    ConversionHandler handler(*workspaces_, settings);

    const int count = 8;
    std::vector<ConversionResult> results(count);
    std::vector<std::thread> threads;
    for (int i = 0; i < count; ++i)
    {
        threads.emplace_back([&, i]()
                             { results[i] = handler.handle(requestWith(handler, test_support::oggPayload("req" + std::to_string(i)))); });
    }
    for (auto &t : threads)
    {
        t.join();
    }

    std::set<std::string> request_ids;
    for (int i = 0; i < count; ++i)
    {
        ASSERT_TRUE(results[i].success) << results[i].diagnostic;
        EXPECT_EQ(std::string(results[i].artifact.begin(), results[i].artifact.end()),
                  test_support::oggPayload("req" + std::to_string(i)));
        request_ids.insert(results[i].request_id);
    }
    EXPECT_EQ(request_ids.size(), static_cast<size_t>(count));
    EXPECT_EQ(workspaces_->liveCount(), 0u);
    EXPECT_TRUE(workspaceRootEmpty());
}

TEST_F(ConversionHandlerTest, RequestsBeyondConcurrencyCapAreBusy)
{
    auto settings = settingsFor(test_support::slowCopyEncoder(temp_->path(), "1"));
    settings.max_concurrent_conversions = 1;
    ConversionHandler handler(*workspaces_, settings);

    ConversionResult first;
    std::thread runner([&]()
                       { first = handler.handle(requestWith(handler, test_support::oggPayload("first"))); });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (handler.limiter().inFlight() == 0 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(handler.limiter().inFlight(), 1u);

    auto second = handler.handle(requestWith(handler, test_support::oggPayload("second")));
    runner.join();

    EXPECT_EQ(second.error_kind, ConversionErrorKind::Busy);
    EXPECT_TRUE(first.success) << first.diagnostic;
    EXPECT_EQ(handler.encoderInvocations(), 1u);
    EXPECT_EQ(handler.limiter().inFlight(), 0u);
}

TEST_F(ConversionHandlerTest, SniffsOggAndOpusSignatures)
{
    EXPECT_EQ(sniffAudioFormat(test_support::oggPayload("x")), AudioFormat::Opus);
    EXPECT_EQ(sniffAudioFormat(std::string("OggS") + std::string(40, '\0') + "\x01vorbis"), AudioFormat::Ogg);
    EXPECT_EQ(sniffAudioFormat("RIFF....WAVE"), AudioFormat::Unknown);
    EXPECT_EQ(sniffAudioFormat("Ogg"), AudioFormat::Unknown);
    EXPECT_EQ(sniffAudioFormat(""), AudioFormat::Unknown);
}

TEST_F(ConversionHandlerTest, RequestCarriesDeclaredAndSniffedFormats)
{
    ConversionRequest opus_as_ogg("req-1", test_support::oggPayload("x"), AudioFormat::Ogg, "voice");
    EXPECT_EQ(opus_as_ogg.declared_format, AudioFormat::Ogg);
    EXPECT_EQ(opus_as_ogg.sniffed_format, AudioFormat::Opus);

    ConversionRequest undeclared("req-2", "RIFF....WAVE");
    EXPECT_EQ(undeclared.declared_format, AudioFormat::Unknown);
    EXPECT_EQ(undeclared.sniffed_format, AudioFormat::Unknown);

    ConversionRequest empty;
    EXPECT_EQ(empty.sniffed_format, AudioFormat::Unknown);
}

TEST_F(ConversionHandlerTest, RequestIdsAreUnique)
{
    ConversionHandler handler(*workspaces_, settingsFor("ffmpeg"));
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i)
    {
        ids.insert(handler.nextRequestId());
    }
    EXPECT_EQ(ids.size(), 100u);
    EXPECT_EQ(ids.begin()->rfind("req-", 0), 0u);
}

TEST_F(ConversionHandlerTest, UpdatedSettingsApplyToNextRequest)
{
    ConversionHandler handler(*workspaces_, settingsFor(test_support::copyEncoder(temp_->path())));

    auto settings = handler.settings();
    settings.max_payload_bytes = 8;
    settings.max_concurrent_conversions = 2;
    handler.updateSettings(settings);

    EXPECT_EQ(handler.limiter().maxInFlight(), 2u);
    auto result = handler.handle(requestWith(handler, std::string(9, 'a')));
    EXPECT_EQ(result.error_kind, ConversionErrorKind::PayloadTooLarge);
}
