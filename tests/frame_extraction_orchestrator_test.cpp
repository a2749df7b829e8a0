#include "test_base.hpp"
#include "stubs/processing_stubs.hpp"
#include "core/errors.hpp"
#include "core/frame_extraction_orchestrator.hpp"
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

class FrameExtractionOrchestratorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        scratch_root_ = testDir() / "scratch";
        fs::create_directories(scratch_root_);

        request_.request_id = "req";
        request_.source_bucket = "in";
        request_.source_key = "videos/sample.mp4";
        request_.notification_target = "http://queue.local/notify";

        limits_.max_frames = 10;
        limits_.timeout = std::chrono::seconds(30);
    }

    FrameExtractionOrchestrator makeOrchestrator()
    {
        OrchestratorSettings settings;
        settings.output_bucket = "out";
        settings.scratch_root = scratch_root_.string();
        return FrameExtractionOrchestrator(storage_, extractor_, archiver_, notifier_, settings);
    }

    bool scratchRootIsEmpty() const
    {
        return fs::is_empty(scratch_root_);
    }

    CallJournal journal_;
    RecordingStorageGateway storage_{journal_};
    ScriptedFrameExtractor extractor_{journal_};
    RecordingArchiveBuilder archiver_{journal_};
    RecordingNotifier notifier_{journal_};
    fs::path scratch_root_;
    ProcessingRequest request_;
    ExtractionLimits limits_;
};

TEST_F(FrameExtractionOrchestratorTest, SuccessfulRunUploadsArchiveAndNotifiesSuccess)
{
    auto orchestrator = makeOrchestrator();

    orchestrator.process(request_, limits_);

    EXPECT_EQ(journal_, (CallJournal{"download", "extract", "archive", "upload", "notify:SUCCESS"}));

    ASSERT_EQ(storage_.downloads.size(), 1u);
    EXPECT_EQ(storage_.downloads[0].bucket, "in");
    EXPECT_EQ(storage_.downloads[0].key, "videos/sample.mp4");
    EXPECT_EQ(fs::path(storage_.downloads[0].local_path).filename(), "sample.mp4");

    ASSERT_EQ(archiver_.stems.size(), 1u);
    EXPECT_EQ(archiver_.stems[0], "sample_frames");
    EXPECT_EQ(fs::path(archiver_.source_dirs[0]).filename(), "frames");

    ASSERT_EQ(storage_.uploads.size(), 1u);
    EXPECT_EQ(storage_.uploads[0].bucket, "out");
    EXPECT_TRUE(storage_.uploads[0].local_file_existed);
    EXPECT_TRUE(std::regex_match(storage_.uploads[0].key,
                                 std::regex(R"(processed/\d{4}-\d{2}-\d{2}/req/sample_frames\.zip)")));

    ASSERT_EQ(notifier_.notifications.size(), 1u);
    const auto &sent = notifier_.notifications[0];
    EXPECT_EQ(sent.status, OutcomeStatus::SUCCESS);
    EXPECT_EQ(sent.request_id, "req");
    EXPECT_EQ(sent.target, "http://queue.local/notify");
    EXPECT_EQ(sent.result_location, "s3://out/" + storage_.uploads[0].key);
    EXPECT_TRUE(std::regex_match(sent.result_location,
                                 std::regex(R"(s3://out/processed/\d{4}-\d{2}-\d{2}/req/sample_frames\.zip)")));
}

TEST_F(FrameExtractionOrchestratorTest, ExtractorReceivesDownloadedFileAndLimits)
{
    auto orchestrator = makeOrchestrator();

    orchestrator.process(request_, limits_);

    ASSERT_EQ(extractor_.source_paths.size(), 1u);
    EXPECT_EQ(extractor_.source_paths[0], storage_.downloads[0].local_path);
    EXPECT_TRUE(extractor_.source_existed);
    EXPECT_EQ(extractor_.output_dirs[0], archiver_.source_dirs[0]);
    ASSERT_EQ(extractor_.seen_limits.size(), 1u);
    EXPECT_EQ(extractor_.seen_limits[0].max_frames, std::optional<int>(10));
    EXPECT_EQ(extractor_.seen_limits[0].timeout, std::chrono::milliseconds(30000));
}

TEST_F(FrameExtractionOrchestratorTest, ScratchDirectoryIsRemovedAfterSuccess)
{
    auto orchestrator = makeOrchestrator();

    orchestrator.process(request_, limits_);

    EXPECT_TRUE(scratchRootIsEmpty());
    EXPECT_FALSE(fs::exists(storage_.uploads[0].local_path));
}

TEST_F(FrameExtractionOrchestratorTest, ScratchDirectoryOutlivesNotification)
{
    auto orchestrator = makeOrchestrator();
    bool archive_present_during_notify = false;
    notifier_.on_notify = [&]()
    {
        archive_present_during_notify = fs::exists(storage_.uploads.at(0).local_path);
    };

    orchestrator.process(request_, limits_);

    EXPECT_TRUE(archive_present_during_notify);
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, ZeroFramesSkipsPackagingAndUpload)
{
    extractor_.frame_count = 0;
    auto orchestrator = makeOrchestrator();

    orchestrator.process(request_, limits_);

    EXPECT_EQ(journal_, (CallJournal{"download", "extract", "notify:NO_FRAMES_EXTRACTED"}));
    ASSERT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_EQ(notifier_.notifications[0].result_location, "");
    EXPECT_TRUE(storage_.uploads.empty());
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, MissingSourceObjectNotifiesFailureAndRethrows)
{
    storage_.download_error = "NoSuchKey";
    auto orchestrator = makeOrchestrator();

    try
    {
        orchestrator.process(request_, limits_);
        FAIL() << "Expected TransferError";
    }
    catch (const TransferError &e)
    {
        EXPECT_EQ(e.code(), "NoSuchKey");
    }

    EXPECT_EQ(journal_, (CallJournal{"download", "notify:FAILURE"}));
    ASSERT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_EQ(notifier_.notifications[0].result_location, "");
    EXPECT_EQ(notifier_.notifications[0].request_id, "req");
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, AccessDeniedDownloadSkipsArchiveAndUpload)
{
    storage_.download_error = "AccessDenied";
    auto orchestrator = makeOrchestrator();

    EXPECT_THROW(orchestrator.process(request_, limits_), TransferError);

    EXPECT_TRUE(extractor_.source_paths.empty());
    EXPECT_TRUE(archiver_.stems.empty());
    EXPECT_TRUE(storage_.uploads.empty());
    ASSERT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_EQ(notifier_.notifications[0].status, OutcomeStatus::FAILURE);
    EXPECT_EQ(notifier_.notifications[0].result_location, "");
}

TEST_F(FrameExtractionOrchestratorTest, ExtractionErrorNotifiesFailureOnce)
{
    extractor_.error = std::make_exception_ptr(ExtractionError("Could not open video file"));
    auto orchestrator = makeOrchestrator();

    EXPECT_THROW(orchestrator.process(request_, limits_), ExtractionError);

    EXPECT_EQ(journal_, (CallJournal{"download", "extract", "notify:FAILURE"}));
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, PackagingErrorNotifiesFailureOnce)
{
    archiver_.error = true;
    auto orchestrator = makeOrchestrator();

    EXPECT_THROW(orchestrator.process(request_, limits_), PackagingError);

    EXPECT_EQ(journal_, (CallJournal{"download", "extract", "archive", "notify:FAILURE"}));
    EXPECT_TRUE(storage_.uploads.empty());
}

TEST_F(FrameExtractionOrchestratorTest, UploadErrorNotifiesFailureOnce)
{
    storage_.upload_error = "AccessDenied";
    auto orchestrator = makeOrchestrator();

    EXPECT_THROW(orchestrator.process(request_, limits_), TransferError);

    EXPECT_EQ(journal_, (CallJournal{"download", "extract", "archive", "upload", "notify:FAILURE"}));
    ASSERT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_EQ(notifier_.notifications[0].status, OutcomeStatus::FAILURE);
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, UndeliverableFailureNotificationKeepsOriginalError)
{
    storage_.download_error = "NoSuchBucket";
    notifier_.fail = true;
    auto orchestrator = makeOrchestrator();

    EXPECT_THROW(orchestrator.process(request_, limits_), TransferError);

    EXPECT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, UndeliverableSuccessNotificationPropagatesWithoutRetry)
{
    notifier_.fail = true;
    auto orchestrator = makeOrchestrator();

    EXPECT_THROW(orchestrator.process(request_, limits_), NotificationError);

    EXPECT_EQ(journal_, (CallJournal{"download", "extract", "archive", "upload", "notify:SUCCESS"}));
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, NonStandardStageErrorNotifiesFailureAndRethrows)
{
    extractor_.error = std::make_exception_ptr(42);
    auto orchestrator = makeOrchestrator();

    EXPECT_THROW(orchestrator.process(request_, limits_), int);

    EXPECT_EQ(journal_, (CallJournal{"download", "extract", "notify:FAILURE"}));
    ASSERT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_EQ(notifier_.notifications[0].status, OutcomeStatus::FAILURE);
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, NonStandardNotifierErrorKeepsOriginalError)
{
    storage_.download_error = "NoSuchKey";
    notifier_.on_notify = []()
    {
        throw 7;
    };
    auto orchestrator = makeOrchestrator();

    EXPECT_THROW(orchestrator.process(request_, limits_), TransferError);

    EXPECT_EQ(notifier_.notifications.size(), 1u);
    EXPECT_TRUE(scratchRootIsEmpty());
}

TEST_F(FrameExtractionOrchestratorTest, EachRequestUsesItsOwnScratchDirectory)
{
    auto orchestrator = makeOrchestrator();

    orchestrator.process(request_, limits_);
    request_.request_id = "req-2";
    orchestrator.process(request_, limits_);

    ASSERT_EQ(storage_.downloads.size(), 2u);
    EXPECT_NE(fs::path(storage_.downloads[0].local_path).parent_path(),
              fs::path(storage_.downloads[1].local_path).parent_path());
}

TEST(ProcessingStageTest, NamesEveryStage)
{
    EXPECT_EQ(processingStageName(ProcessingStage::INIT), "INIT");
    EXPECT_EQ(processingStageName(ProcessingStage::UPLOADING), "UPLOADING");
    EXPECT_EQ(processingStageName(ProcessingStage::DONE), "DONE");
}
