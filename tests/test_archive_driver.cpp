#include <gtest/gtest.h>
#include "chanarc/archive_driver.h"
#include "chanarc/archive_reader.h"
#include "chanarc/checkpoint_store.h"
#include "fake_channel.h"
#include "test_utils.h"
#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

using namespace chanarc;
using std::chrono::milliseconds;

class ArchiveDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = make_test_dir("archive_driver");
        config_ = configFor(test_dir_, 10);
    }

    void TearDown() override {
        remove_directory(test_dir_);
    }

    static ArchiverConfig configFor(const std::string& dir, uint32_t batch_size) {
        ArchiverConfig config;
        config.token = "test-token";
        config.channel_id = "42";
        config.archive_path = join_path(dir, "chan.zst");
        config.batch_size = batch_size;
        config.compression_level = 3;
        return config;
    }

    DriverResult runDriver(FakeChannel& channel, const std::atomic<bool>* stop = nullptr) {
        ArchiveDriver driver(config_, &channel, &sleeper_);
        if (stop != nullptr) {
            driver.setStopFlag(stop);
        }
        DriverResult result = driver.run();
        state_ = driver.getState();
        checkpoint_ = driver.getCheckpoint();
        stats_ = driver.getStats();
        return result;
    }

    Checkpoint loadCheckpoint() {
        CheckpointStore store(config_.checkpointPath(), config_.lockPath());
        Checkpoint checkpoint;
        EXPECT_EQ(CheckpointResult::SUCCESS, store.load(checkpoint));
        return checkpoint;
    }

    std::vector<Record> readArchive() {
        ArchiveReader reader;
        std::vector<Record> records;
        ReaderStats stats;
        EXPECT_EQ(ReadResult::SUCCESS, reader.readAll(config_.archive_path, records, stats));
        EXPECT_EQ(0u, stats.corrupt_regions);
        return records;
    }

    static std::vector<std::string> contentsFor(MessageId first, MessageId last) {
        std::vector<std::string> contents;
        for (MessageId id = first; id <= last; id++) {
            contents.push_back("message " + std::to_string(id));
        }
        return contents;
    }

    std::vector<std::string> archivedContents() {
        std::vector<std::string> contents;
        for (const Record& record : readArchive()) {
            contents.push_back(record.content);
        }
        return contents;
    }

    std::string test_dir_;
    ArchiverConfig config_;
    RecordingSleeper sleeper_;

    DriverState state_ = DriverState::INIT;
    Checkpoint checkpoint_;
    DriverStats stats_;
};

// ============================================================================
// Basic backfill / catch-up
// ============================================================================

TEST_F(ArchiveDriverTest, SmallChannelSingleBatch) {
    FakeChannel channel;
    channel.postRange(1, 5);

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
    EXPECT_EQ(DriverState::IDLE, state_);

    // One page with everything, one empty page, then an empty catch-up
    EXPECT_EQ(2u, channel.countCalls(Direction::BEFORE));
    EXPECT_FALSE(channel.calls()[0].cursor.has_value());
    EXPECT_EQ(MessageId(1), channel.calls()[1].cursor);
    EXPECT_EQ(1u, channel.countCalls(Direction::AFTER));
    EXPECT_EQ(MessageId(5), channel.calls()[2].cursor);

    std::vector<Record> records = readArchive();
    ASSERT_EQ(5u, records.size());
    EXPECT_EQ("user1", records[0].username);
    EXPECT_EQ("message 1", records[0].content);
    EXPECT_EQ("message 5", records[4].content);

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_EQ(MessageId(1), checkpoint.oldest_archived_id);
    EXPECT_EQ(MessageId(5), checkpoint.newest_archived_id);
    EXPECT_TRUE(checkpoint.backfill_complete);
    EXPECT_EQ(5u, checkpoint.total_messages);
    EXPECT_EQ(0u, checkpoint.spool_bytes);
    EXPECT_EQ(file_size_of(config_.archive_path),
              static_cast<int64_t>(checkpoint.archive_bytes));
    EXPECT_EQ(checkpoint, checkpoint_);

    EXPECT_FALSE(path_exists(config_.spoolPath()));
}

TEST_F(ArchiveDriverTest, MultiPageBackfill) {
    config_ = configFor(test_dir_, 100);
    FakeChannel channel;
    channel.postRange(1, 250);

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    ASSERT_EQ(4u, channel.countCalls(Direction::BEFORE));
    EXPECT_FALSE(channel.calls()[0].cursor.has_value());
    EXPECT_EQ(MessageId(151), channel.calls()[1].cursor);
    EXPECT_EQ(MessageId(51), channel.calls()[2].cursor);
    EXPECT_EQ(MessageId(1), channel.calls()[3].cursor);
    for (const FakeChannel::Call& call : channel.calls()) {
        EXPECT_EQ(100u, call.limit);
    }

    EXPECT_EQ(contentsFor(1, 250), archivedContents());
    EXPECT_EQ(3u, stats_.batches_written);
    EXPECT_EQ(250u, stats_.messages_written);

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_EQ(250u, checkpoint.total_messages);
    EXPECT_EQ(MessageId(1), checkpoint.oldest_archived_id);
    EXPECT_EQ(MessageId(250), checkpoint.newest_archived_id);
}

TEST_F(ArchiveDriverTest, CatchUpAppendsNewMessages) {
    FakeChannel channel;
    channel.postRange(1, 5);
    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
    std::vector<uint8_t> before = read_file_bytes(config_.archive_path);

    channel.postRange(6, 8);
    channel.clearCalls();
    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    EXPECT_EQ(0u, channel.countCalls(Direction::BEFORE));
    ASSERT_GE(channel.calls().size(), 1u);
    EXPECT_EQ(Direction::AFTER, channel.calls()[0].direction);
    EXPECT_EQ(MessageId(5), channel.calls()[0].cursor);

    EXPECT_EQ(contentsFor(1, 8), archivedContents());

    // Earlier bytes untouched
    std::vector<uint8_t> after = read_file_bytes(config_.archive_path);
    ASSERT_GT(after.size(), before.size());
    EXPECT_TRUE(std::equal(before.begin(), before.end(), after.begin()));

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_EQ(MessageId(1), checkpoint.oldest_archived_id);
    EXPECT_EQ(MessageId(8), checkpoint.newest_archived_id);
    EXPECT_TRUE(checkpoint.backfill_complete);
    EXPECT_EQ(8u, checkpoint.total_messages);
}

TEST_F(ArchiveDriverTest, CatchUpPagesForward) {
    FakeChannel channel;
    channel.postRange(1, 5);
    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    channel.postRange(6, 30);
    channel.clearCalls();
    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    // 25 new messages at 10 per page: 3 pages and an empty one
    ASSERT_EQ(4u, channel.countCalls(Direction::AFTER));
    EXPECT_EQ(MessageId(5), channel.calls()[0].cursor);
    EXPECT_EQ(MessageId(15), channel.calls()[1].cursor);
    EXPECT_EQ(MessageId(25), channel.calls()[2].cursor);
    EXPECT_EQ(MessageId(30), channel.calls()[3].cursor);

    EXPECT_EQ(contentsFor(1, 30), archivedContents());
}

TEST_F(ArchiveDriverTest, RerunWithoutNewMessagesIsNoOp) {
    FakeChannel channel;
    channel.postRange(1, 37);
    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    std::vector<uint8_t> archive = read_file_bytes(config_.archive_path);
    std::vector<uint8_t> checkpoint_bytes = read_file_bytes(config_.checkpointPath());

    for (int run = 0; run < 3; run++) {
        ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
        EXPECT_EQ(0u, stats_.messages_written);
    }

    EXPECT_EQ(archive, read_file_bytes(config_.archive_path));
    EXPECT_EQ(checkpoint_bytes, read_file_bytes(config_.checkpointPath()));
}

TEST_F(ArchiveDriverTest, EmptyChannel) {
    FakeChannel channel;

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
    EXPECT_TRUE(path_exists(config_.archive_path));
    EXPECT_EQ(0, file_size_of(config_.archive_path));

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_TRUE(checkpoint.backfill_complete);
    EXPECT_FALSE(checkpoint.oldest_archived_id.has_value());
    EXPECT_EQ(0u, checkpoint.total_messages);

    // First messages ever arrive later
    channel.postRange(100, 103);
    channel.clearCalls();
    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
    EXPECT_EQ(MessageId(0), channel.calls()[0].cursor);

    EXPECT_EQ(contentsFor(100, 103), archivedContents());
    checkpoint = loadCheckpoint();
    EXPECT_EQ(MessageId(100), checkpoint.oldest_archived_id);
    EXPECT_EQ(MessageId(103), checkpoint.newest_archived_id);
}

TEST_F(ArchiveDriverTest, MessagesPostedDuringBackfillAreCaughtUp) {
    FakeChannel channel;
    channel.postRange(1, 45);
    channel.setHook([&channel](size_t call) {
        if (call == 2) {
            channel.postRange(46, 48);
        }
    });

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
    EXPECT_EQ(contentsFor(1, 48), archivedContents());
    EXPECT_EQ(MessageId(48), loadCheckpoint().newest_archived_id);
}

TEST_F(ArchiveDriverTest, StatisticsTotals) {
    FakeChannel channel;
    channel.postRange(1, 12);

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    uint64_t expected_bytes = 0;
    for (MessageId id = 1; id <= 12; id++) {
        // NUL user NUL content NEWLINE
        expected_bytes += 3 + std::string("user" + std::to_string(id % 3)).size() +
                          std::string("message " + std::to_string(id)).size();
    }

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_EQ(12u, checkpoint.total_messages);
    EXPECT_EQ(expected_bytes, checkpoint.uncompressed_bytes);
}

// ============================================================================
// Payload handling
// ============================================================================

TEST_F(ArchiveDriverTest, MalformedMessagesSkippedAndCursorAdvances) {
    FakeChannel channel;
    channel.postRange(1, 25);
    channel.markMalformed(3);
    channel.markMalformed(20);

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    std::vector<std::string> expected;
    for (MessageId id = 1; id <= 25; id++) {
        if (id != 3 && id != 20) {
            expected.push_back("message " + std::to_string(id));
        }
    }
    EXPECT_EQ(expected, archivedContents());
    EXPECT_EQ(2u, stats_.malformed_skipped);
    EXPECT_EQ(23u, loadCheckpoint().total_messages);
}

TEST_F(ArchiveDriverTest, PageOfOnlyMalformedStillAdvances) {
    FakeChannel channel;
    channel.postRange(1, 30);
    for (MessageId id = 11; id <= 20; id++) {
        channel.markMalformed(id);
    }

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    std::vector<std::string> expected = contentsFor(1, 10);
    std::vector<std::string> tail = contentsFor(21, 30);
    expected.insert(expected.end(), tail.begin(), tail.end());
    EXPECT_EQ(expected, archivedContents());
    EXPECT_EQ(MessageId(1), loadCheckpoint().oldest_archived_id);
}

TEST_F(ArchiveDriverTest, UnframableUsernameSkipped) {
    FakeChannel channel;
    channel.post(1, "alice", "hello");
    channel.post(2, "bad\nname", "dropped");
    channel.post(3, "bob", "multi\nline");

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    std::vector<Record> records = readArchive();
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ("alice", records[0].username);
    EXPECT_EQ("bob", records[1].username);
    EXPECT_EQ("multi line", records[1].content);
    EXPECT_EQ(1u, stats_.malformed_skipped);
    // The skipped id is still covered by the cursor
    EXPECT_EQ(MessageId(3), loadCheckpoint().newest_archived_id);
}

TEST_F(ArchiveDriverTest, EmptyContentKeptByDefault) {
    FakeChannel channel;
    channel.post(1, "alice", "");
    channel.post(2, "bob", "text");

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    std::vector<Record> records = readArchive();
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ("", records[0].content);
}

TEST_F(ArchiveDriverTest, SkipEmptyContentOption) {
    config_.skip_empty_content = true;
    FakeChannel channel;
    channel.post(1, "alice", "");
    channel.post(2, "bob", "text");
    channel.post(3, "carol", "");

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    std::vector<Record> records = readArchive();
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("bob", records[0].username);
    EXPECT_EQ(2u, stats_.empty_skipped);

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_EQ(1u, checkpoint.total_messages);
    EXPECT_EQ(MessageId(1), checkpoint.oldest_archived_id);
    EXPECT_EQ(MessageId(3), checkpoint.newest_archived_id);
}

TEST_F(ArchiveDriverTest, CursorMessageRepeatedByPlatformIsDropped) {
    FakeChannel channel;
    channel.postRange(1, 25);
    channel.setLeakyCursor(true);

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
    EXPECT_EQ(contentsFor(1, 25), archivedContents());
    EXPECT_EQ(2u, stats_.out_of_range_dropped);
}

// ============================================================================
// Retry, rate limits, failures
// ============================================================================

TEST_F(ArchiveDriverTest, RateLimitWaitsRetryAfter) {
    FakeChannel channel;
    channel.postRange(1, 5);
    channel.injectFault(FetchStatus::RATE_LIMITED, milliseconds(2000));

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    ASSERT_EQ(1u, sleeper_.sleeps().size());
    EXPECT_GE(sleeper_.sleeps()[0], milliseconds(2000));
    EXPECT_EQ(1u, stats_.rate_limit_waits);

    // Same request repeated after the wait
    EXPECT_FALSE(channel.calls()[0].cursor.has_value());
    EXPECT_FALSE(channel.calls()[1].cursor.has_value());
    EXPECT_EQ(contentsFor(1, 5), archivedContents());
}

TEST_F(ArchiveDriverTest, RateLimitWithoutHintUsesBackoff) {
    FakeChannel channel;
    channel.postRange(1, 5);
    channel.injectFault(FetchStatus::RATE_LIMITED);
    channel.injectFault(FetchStatus::RATE_LIMITED);

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
    ASSERT_EQ(2u, sleeper_.sleeps().size());
    EXPECT_EQ(milliseconds(500), sleeper_.sleeps()[0]);
    EXPECT_EQ(milliseconds(1000), sleeper_.sleeps()[1]);
}

TEST_F(ArchiveDriverTest, TransientErrorsBackOffExponentially) {
    FakeChannel channel;
    channel.postRange(1, 5);
    channel.injectFault(FetchStatus::TRANSIENT);
    channel.injectFault(FetchStatus::TRANSIENT);
    channel.injectFault(FetchStatus::TRANSIENT);

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));

    std::vector<milliseconds> expected = {milliseconds(500), milliseconds(1000),
                                          milliseconds(2000)};
    EXPECT_EQ(expected, sleeper_.sleeps());
    EXPECT_EQ(3u, stats_.retries);
    EXPECT_EQ(0u, stats_.rate_limit_waits);
    EXPECT_EQ(contentsFor(1, 5), archivedContents());
}

TEST_F(ArchiveDriverTest, RetryBudgetResetsPerBatch) {
    config_.retry.max_attempts = 2;
    FakeChannel channel;
    channel.postRange(1, 25);
    channel.setHook([&channel](size_t call) {
        // Two failures in front of the second and third pages
        if (call == 2 || call == 5) {
            channel.injectFault(FetchStatus::TRANSIENT);
            channel.injectFault(FetchStatus::TRANSIENT);
        }
    });

    ASSERT_EQ(DriverResult::SUCCESS, runDriver(channel));
    EXPECT_EQ(4u, stats_.retries);
    EXPECT_EQ(contentsFor(1, 25), archivedContents());
}

TEST_F(ArchiveDriverTest, RetriesExhaustedAborts) {
    config_.retry.max_attempts = 3;
    FakeChannel channel;
    channel.postRange(1, 25);
    channel.setHook([&channel](size_t call) {
        if (call == 2) {
            for (int i = 0; i < 10; i++) {
                channel.injectFault(FetchStatus::TRANSIENT);
            }
        }
    });

    EXPECT_EQ(DriverResult::ERR_RETRIES_EXHAUSTED, runDriver(channel));
    EXPECT_EQ(DriverState::ABORTED, state_);
    // One good page, then the initial attempt plus three retries
    EXPECT_EQ(5u, channel.calls().size());
    EXPECT_EQ(3u, sleeper_.sleeps().size());

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_EQ(checkpoint_, checkpoint);
    EXPECT_EQ(10u, checkpoint.total_messages);
    EXPECT_EQ(MessageId(16), checkpoint.oldest_archived_id);
    EXPECT_FALSE(checkpoint.backfill_complete);
}

TEST_F(ArchiveDriverTest, FatalErrorAbortsWithoutRetry) {
    FakeChannel channel;
    channel.postRange(1, 25);
    channel.failFromCall(2);

    EXPECT_EQ(DriverResult::ERR_FETCH_FATAL, runDriver(channel));
    EXPECT_EQ(DriverState::ABORTED, state_);
    EXPECT_EQ(3u, channel.calls().size());
    EXPECT_TRUE(sleeper_.sleeps().empty());

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_EQ(20u, checkpoint.total_messages);
    EXPECT_EQ(MessageId(6), checkpoint.oldest_archived_id);
    EXPECT_EQ(MessageId(25), checkpoint.newest_archived_id);
    EXPECT_EQ(file_size_of(config_.spoolPath()), static_cast<int64_t>(checkpoint.spool_bytes));
}

// ============================================================================
// Cancellation and locking
// ============================================================================

TEST_F(ArchiveDriverTest, StopFlagHonouredAtBatchBoundary) {
    FakeChannel channel;
    channel.postRange(1, 50);
    std::atomic<bool> stop(false);
    channel.setHook([&stop](size_t call) {
        if (call == 2) {
            stop.store(true);
        }
    });

    ASSERT_EQ(DriverResult::SUCCESS_INTERRUPTED, runDriver(channel, &stop));
    EXPECT_EQ(DriverState::IDLE, state_);
    // The batch in flight when the flag was raised is finished and saved
    EXPECT_EQ(2u, channel.calls().size());

    Checkpoint checkpoint = loadCheckpoint();
    EXPECT_EQ(20u, checkpoint.total_messages);
    EXPECT_EQ(MessageId(31), checkpoint.oldest_archived_id);
    EXPECT_FALSE(checkpoint.backfill_complete);
    EXPECT_FALSE(path_exists(config_.archive_path));
}

TEST_F(ArchiveDriverTest, StopBeforeFirstFetch) {
    FakeChannel channel;
    channel.postRange(1, 5);
    std::atomic<bool> stop(true);

    ASSERT_EQ(DriverResult::SUCCESS_INTERRUPTED, runDriver(channel, &stop));
    EXPECT_TRUE(channel.calls().empty());
    EXPECT_FALSE(path_exists(config_.checkpointPath()));
}

TEST_F(ArchiveDriverTest, SecondInstanceIsLockedOut) {
    CheckpointStore holder(config_.checkpointPath(), config_.lockPath());
    ASSERT_EQ(CheckpointResult::SUCCESS, holder.acquireLock());

    FakeChannel channel;
    channel.postRange(1, 5);
    EXPECT_EQ(DriverResult::ERR_LOCKED, runDriver(channel));
    EXPECT_EQ(DriverState::ABORTED, state_);
    EXPECT_TRUE(channel.calls().empty());

    holder.releaseLock();
    EXPECT_EQ(DriverResult::SUCCESS, runDriver(channel));
}

TEST_F(ArchiveDriverTest, RunTwiceOnSameDriverRefused) {
    FakeChannel channel;
    channel.postRange(1, 5);

    ArchiveDriver driver(config_, &channel, &sleeper_);
    ASSERT_EQ(DriverResult::SUCCESS, driver.run());
    EXPECT_NE(DriverResult::SUCCESS, driver.run());
}

TEST(DriverNamesTest, StateAndResultNames) {
    EXPECT_STREQ("BACKFILLING", driverStateName(DriverState::BACKFILLING));
    EXPECT_STREQ("CATCHING_UP", driverStateName(DriverState::CATCHING_UP));
    EXPECT_STREQ("ERR_LOCKED", driverResultName(DriverResult::ERR_LOCKED));
    EXPECT_STREQ("SUCCESS_INTERRUPTED", driverResultName(DriverResult::SUCCESS_INTERRUPTED));
}
