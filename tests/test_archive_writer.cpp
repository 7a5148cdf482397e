#include <gtest/gtest.h>
#include "chanarc/archive_writer.h"
#include "chanarc/archive_reader.h"
#include "chanarc/record_codec.h"
#include "test_utils.h"
#include <algorithm>
#include <string>
#include <vector>

using namespace chanarc;

class ArchiveWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = make_test_dir("archive_writer");
        path_ = join_path(test_dir_, "chan.zst");
    }

    void TearDown() override {
        remove_directory(test_dir_);
    }

    static std::vector<std::string> batch(const std::string& user, int first, int count) {
        std::vector<std::string> records;
        for (int i = first; i < first + count; i++) {
            std::string record;
            RecordCodec::encode(user, "message " + std::to_string(i), record);
            records.push_back(record);
        }
        return records;
    }

    std::vector<Record> readBack() {
        ArchiveReader reader;
        std::vector<Record> records;
        ReaderStats stats;
        EXPECT_EQ(ReadResult::SUCCESS, reader.readAll(path_, records, stats));
        return records;
    }

    std::string test_dir_;
    std::string path_;
};

TEST_F(ArchiveWriterTest, AppendOneFramePerBatch) {
    ArchiveWriter writer(3);
    ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, 0, TailPolicy::KEEP_AND_WARN));

    ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("alice", 0, 10)));
    uint64_t after_first = writer.getFileSize();
    EXPECT_GT(after_first, 0u);
    EXPECT_EQ(static_cast<int64_t>(after_first), file_size_of(path_));

    ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("bob", 10, 5)));
    EXPECT_GT(writer.getFileSize(), after_first);

    const WriterStats& stats = writer.getStats();
    EXPECT_EQ(2u, stats.batches_written);
    EXPECT_EQ(15u, stats.records_written);
    EXPECT_EQ(2u, stats.sync_operations);

    ASSERT_EQ(WriterResult::SUCCESS, writer.close());

    std::vector<Record> records = readBack();
    ASSERT_EQ(15u, records.size());
    EXPECT_EQ("alice", records[0].username);
    EXPECT_EQ("message 0", records[0].content);
    EXPECT_EQ("bob", records[14].username);
    EXPECT_EQ("message 14", records[14].content);
}

TEST_F(ArchiveWriterTest, ReopenAppendsWithoutRewriting) {
    uint64_t committed = 0;
    {
        ArchiveWriter writer(3);
        ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, 0, TailPolicy::KEEP_AND_WARN));
        ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("alice", 0, 3)));
        committed = writer.getFileSize();
    }
    std::vector<uint8_t> prefix = read_file_bytes(path_);

    ArchiveWriter writer(3);
    ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, committed, TailPolicy::KEEP_AND_WARN));
    EXPECT_EQ(committed, writer.getFileSize());
    ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("alice", 3, 3)));
    ASSERT_EQ(WriterResult::SUCCESS, writer.close());

    std::vector<uint8_t> after = read_file_bytes(path_);
    ASSERT_GT(after.size(), prefix.size());
    EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), after.begin()));

    std::vector<Record> records = readBack();
    ASSERT_EQ(6u, records.size());
    EXPECT_EQ("message 5", records[5].content);
}

TEST_F(ArchiveWriterTest, TruncatePolicyRollsBackTail) {
    uint64_t committed = 0;
    {
        ArchiveWriter writer(3);
        ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, 0, TailPolicy::TRUNCATE));
        ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("alice", 0, 3)));
        committed = writer.getFileSize();
        // Written but never checkpointed
        ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("alice", 3, 3)));
    }

    ArchiveWriter writer(3);
    ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, committed, TailPolicy::TRUNCATE));
    EXPECT_EQ(committed, writer.getFileSize());
    EXPECT_GT(writer.getStats().uncommitted_tail_bytes, 0u);
    EXPECT_EQ(static_cast<int64_t>(committed), file_size_of(path_));
    writer.close();

    EXPECT_EQ(3u, readBack().size());
}

TEST_F(ArchiveWriterTest, KeepPolicyLeavesTail) {
    uint64_t committed = 0;
    int64_t full_size = 0;
    {
        ArchiveWriter writer(3);
        ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, 0, TailPolicy::KEEP_AND_WARN));
        ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("alice", 0, 3)));
        committed = writer.getFileSize();
        ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("alice", 3, 3)));
        full_size = static_cast<int64_t>(writer.getFileSize());
    }

    ArchiveWriter writer(3);
    ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, committed, TailPolicy::KEEP_AND_WARN));
    EXPECT_EQ(static_cast<uint64_t>(full_size), writer.getFileSize());
    EXPECT_EQ(static_cast<uint64_t>(full_size) - committed,
              writer.getStats().uncommitted_tail_bytes);
    EXPECT_EQ(full_size, file_size_of(path_));
}

TEST_F(ArchiveWriterTest, ShorterThanCommittedIsInconsistent) {
    {
        ArchiveWriter writer(3);
        ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, 0, TailPolicy::KEEP_AND_WARN));
        ASSERT_EQ(WriterResult::SUCCESS, writer.append(batch("alice", 0, 3)));
    }

    ArchiveWriter writer(3);
    uint64_t claimed = static_cast<uint64_t>(file_size_of(path_)) + 100;
    EXPECT_EQ(WriterResult::ERR_INCONSISTENT,
              writer.open(path_, claimed, TailPolicy::TRUNCATE));
    EXPECT_FALSE(writer.isOpen());
    EXPECT_FALSE(writer.getLastError().empty());
}

TEST_F(ArchiveWriterTest, AppendRequiresOpen) {
    ArchiveWriter writer(3);
    EXPECT_EQ(WriterResult::ERR_NOT_OPEN, writer.append(batch("alice", 0, 1)));
}

TEST_F(ArchiveWriterTest, EmptyBatchRejected) {
    ArchiveWriter writer(3);
    ASSERT_EQ(WriterResult::SUCCESS, writer.open(path_, 0, TailPolicy::KEEP_AND_WARN));
    EXPECT_EQ(WriterResult::ERR_EMPTY_BATCH, writer.append(std::vector<std::string>()));
    EXPECT_EQ(0u, writer.getFileSize());
}
