#include <gtest/gtest.h>
#include "chanarc/spool_sealer.h"
#include "chanarc/archive_reader.h"
#include "chanarc/archive_writer.h"
#include "chanarc/record_codec.h"
#include "test_utils.h"
#include <random>
#include <string>
#include <vector>

using namespace chanarc;

class SpoolSealerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = make_test_dir("spool_sealer");
        spool_path_ = join_path(test_dir_, "chan.zst.backfill");
        archive_path_ = join_path(test_dir_, "chan.zst");
    }

    void TearDown() override {
        remove_directory(test_dir_);
    }

    /// Spool pages the way backfill does: newest page first, each ascending
    uint64_t writeSpool(const std::vector<std::vector<int>>& pages) {
        ArchiveWriter writer(3);
        EXPECT_EQ(WriterResult::SUCCESS, writer.open(spool_path_, 0, TailPolicy::TRUNCATE));
        for (const std::vector<int>& page : pages) {
            std::vector<std::string> records;
            for (int id : page) {
                std::string record;
                RecordCodec::encode("user", "m" + std::to_string(id), record);
                records.push_back(record);
            }
            EXPECT_EQ(WriterResult::SUCCESS, writer.append(records));
        }
        return writer.getFileSize();
    }

    std::vector<std::string> archivedContents() {
        ArchiveReader reader;
        std::vector<Record> records;
        ReaderStats stats;
        EXPECT_EQ(ReadResult::SUCCESS, reader.readAll(archive_path_, records, stats));
        std::vector<std::string> contents;
        for (const Record& record : records) {
            contents.push_back(record.content);
        }
        return contents;
    }

    std::string test_dir_;
    std::string spool_path_;
    std::string archive_path_;
};

TEST_F(SpoolSealerTest, ReversesFramesIntoAscendingArchive) {
    uint64_t committed = writeSpool({{7, 8, 9}, {4, 5, 6}, {1, 2, 3}});

    SpoolSealer sealer;
    SealStats stats;
    ASSERT_EQ(SealResult::SUCCESS, sealer.seal(spool_path_, committed, archive_path_, stats));
    EXPECT_EQ(3u, stats.frames_sealed);
    EXPECT_EQ(committed, stats.archive_bytes);
    EXPECT_EQ(static_cast<int64_t>(committed), file_size_of(archive_path_));

    std::vector<std::string> expected = {"m1", "m2", "m3", "m4", "m5", "m6", "m7", "m8", "m9"};
    EXPECT_EQ(expected, archivedContents());

    // Spool is left for the caller to remove after checkpointing
    EXPECT_TRUE(path_exists(spool_path_));
    EXPECT_FALSE(path_exists(archive_path_ + ".tmp"));
}

TEST_F(SpoolSealerTest, IgnoresUncommittedTail) {
    uint64_t committed = writeSpool({{3, 4}, {1, 2}});
    {
        ArchiveWriter writer(3);
        ASSERT_EQ(WriterResult::SUCCESS,
                  writer.open(spool_path_, committed, TailPolicy::KEEP_AND_WARN));
        std::string record;
        RecordCodec::encode("user", "m0", record);
        ASSERT_EQ(WriterResult::SUCCESS, writer.append({record}));
    }

    SpoolSealer sealer;
    SealStats stats;
    ASSERT_EQ(SealResult::SUCCESS, sealer.seal(spool_path_, committed, archive_path_, stats));
    EXPECT_EQ(2u, stats.frames_sealed);

    std::vector<std::string> expected = {"m1", "m2", "m3", "m4"};
    EXPECT_EQ(expected, archivedContents());
}

TEST_F(SpoolSealerTest, SealIsRepeatable) {
    uint64_t committed = writeSpool({{5, 6}, {3, 4}, {1, 2}});

    SpoolSealer sealer;
    SealStats stats;
    ASSERT_EQ(SealResult::SUCCESS, sealer.seal(spool_path_, committed, archive_path_, stats));
    std::vector<uint8_t> first = read_file_bytes(archive_path_);

    ASSERT_EQ(SealResult::SUCCESS, sealer.seal(spool_path_, committed, archive_path_, stats));
    EXPECT_EQ(first, read_file_bytes(archive_path_));
}

TEST_F(SpoolSealerTest, MissingSpoolGivesEmptyArchive) {
    SpoolSealer sealer;
    SealStats stats;
    ASSERT_EQ(SealResult::SUCCESS, sealer.seal(spool_path_, 0, archive_path_, stats));
    EXPECT_EQ(0u, stats.frames_sealed);
    EXPECT_EQ(0u, stats.archive_bytes);
    EXPECT_TRUE(path_exists(archive_path_));
    EXPECT_EQ(0, file_size_of(archive_path_));
}

TEST_F(SpoolSealerTest, ShortSpoolIsInconsistent) {
    uint64_t committed = writeSpool({{1, 2}});

    SpoolSealer sealer;
    SealStats stats;
    EXPECT_EQ(SealResult::ERR_INCONSISTENT,
              sealer.seal(spool_path_, committed + 10, archive_path_, stats));
    EXPECT_FALSE(path_exists(archive_path_));
}

TEST_F(SpoolSealerTest, CorruptSpoolRejected) {
    uint64_t committed = writeSpool({{3, 4}, {1, 2}});

    std::vector<uint8_t> data = read_file_bytes(spool_path_);
    data[0] ^= 0xFF;  // break the first frame magic
    write_file_bytes(spool_path_, data);

    SpoolSealer sealer;
    SealStats stats;
    EXPECT_EQ(SealResult::ERR_CORRUPTED_SPOOL,
              sealer.seal(spool_path_, committed, archive_path_, stats));
    EXPECT_FALSE(path_exists(archive_path_));
}

TEST_F(SpoolSealerTest, ListFramesExtents) {
    uint64_t committed = writeSpool({{1}, {2, 3}});

    SpoolSealer sealer;
    std::vector<FrameExtent> frames;
    ASSERT_EQ(SealResult::SUCCESS, sealer.listFrames(spool_path_, committed, frames));
    ASSERT_EQ(2u, frames.size());
    EXPECT_EQ(0u, frames[0].offset);
    EXPECT_EQ(frames[0].length, frames[1].offset);
    EXPECT_EQ(committed, frames[1].offset + frames[1].length);
}

TEST_F(SpoolSealerTest, FrameLargerThanReadWindow) {
    // Low-redundancy content so the middle frame stays well above 64 KiB
    std::mt19937 rng(7);
    std::string big_content;
    for (int i = 0; i < 400 * 1024; i++) {
        big_content.push_back(static_cast<char>('!' + rng() % 90));
    }

    uint64_t committed = 0;
    {
        ArchiveWriter writer(3);
        ASSERT_EQ(WriterResult::SUCCESS, writer.open(spool_path_, 0, TailPolicy::TRUNCATE));
        std::string record;
        RecordCodec::encode("user", "m3", record);
        ASSERT_EQ(WriterResult::SUCCESS, writer.append({record}));
        record.clear();
        RecordCodec::encode("user", big_content, record);
        ASSERT_EQ(WriterResult::SUCCESS, writer.append({record}));
        record.clear();
        RecordCodec::encode("user", "m1", record);
        ASSERT_EQ(WriterResult::SUCCESS, writer.append({record}));
        committed = writer.getFileSize();
    }

    SpoolSealer sealer;
    std::vector<FrameExtent> frames;
    ASSERT_EQ(SealResult::SUCCESS, sealer.listFrames(spool_path_, committed, frames));
    ASSERT_EQ(3u, frames.size());
    EXPECT_GT(frames[1].length, 64u * 1024);

    SealStats stats;
    ASSERT_EQ(SealResult::SUCCESS, sealer.seal(spool_path_, committed, archive_path_, stats));
    EXPECT_EQ(committed, stats.archive_bytes);

    std::vector<std::string> expected = {"m1", big_content, "m3"};
    EXPECT_EQ(expected, archivedContents());
}

TEST_F(SpoolSealerTest, StaleTempFileReplaced) {
    uint64_t committed = writeSpool({{3, 4}, {1, 2}});
    write_file_bytes(archive_path_ + ".tmp", std::vector<uint8_t>(5000, 0x77));

    SpoolSealer sealer;
    SealStats stats;
    ASSERT_EQ(SealResult::SUCCESS, sealer.seal(spool_path_, committed, archive_path_, stats));
    EXPECT_EQ(static_cast<int64_t>(committed), file_size_of(archive_path_));
    EXPECT_FALSE(path_exists(archive_path_ + ".tmp"));

    std::vector<std::string> expected = {"m1", "m2", "m3", "m4"};
    EXPECT_EQ(expected, archivedContents());
}
