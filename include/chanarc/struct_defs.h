#ifndef CHANARC_STRUCT_DEFS_H_
#define CHANARC_STRUCT_DEFS_H_

#include "constants.h"
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace chanarc {

// ============================================================================
// Magic Numbers (no null terminator, exactly 8 bytes)
// ============================================================================

constexpr char kCheckpointMagic[8] = {'C','H','A','N','C','K','P','T'};

constexpr uint16_t kCheckpointVersion = 0x0001;

// ============================================================================
// Enums
// ============================================================================

enum class CompressionType : uint8_t {
    COMP_ZSTD = 1
};

/// Pagination direction relative to a cursor
enum class Direction : uint8_t {
    BEFORE = 0,   // ids strictly less than the cursor (backfill)
    AFTER  = 1    // ids strictly greater than the cursor (catch-up)
};

// ============================================================================
// In-memory model
// ============================================================================

using MessageId = uint64_t;

/// One validated chat message
struct Message {
    MessageId   id = 0;
    std::string author;       // author.username
    std::string content;
    std::string created_at;   // ISO-8601, informational only
};

/// One page of messages, newest-first
struct Page {
    std::vector<Message> messages;
    uint32_t malformed_count = 0;      // skipped payloads
    MessageId min_seen_id = 0;         // over every id seen, malformed included
    MessageId max_seen_id = 0;

    bool empty() const { return messages.empty() && malformed_count == 0; }
};

/// Pagination progress
struct Checkpoint {
    std::optional<MessageId> oldest_archived_id;
    std::optional<MessageId> newest_archived_id;
    bool backfill_complete = false;

    uint64_t total_messages = 0;       // records durably written
    uint64_t uncompressed_bytes = 0;   // record bytes before compression
    uint64_t spool_bytes = 0;          // committed length of backfill spool
    uint64_t archive_bytes = 0;        // committed length of archive

    bool operator==(const Checkpoint& other) const {
        return oldest_archived_id == other.oldest_archived_id &&
               newest_archived_id == other.newest_archived_id &&
               backfill_complete == other.backfill_complete &&
               total_messages == other.total_messages &&
               uncompressed_bytes == other.uncompressed_bytes &&
               spool_bytes == other.spool_bytes &&
               archive_bytes == other.archive_bytes;
    }
    bool operator!=(const Checkpoint& other) const { return !(*this == other); }
};

// ============================================================================
// CheckpointRecordV1 (72 bytes, native little-endian, on disk)
// ============================================================================

enum class CheckpointFlagBit : uint16_t {
    CKB_HAS_OLDEST        = 0,
    CKB_HAS_NEWEST        = 1,
    CKB_BACKFILL_COMPLETE = 2
};

inline uint16_t checkpointFlag(CheckpointFlagBit bit) {
    return static_cast<uint16_t>(1u << static_cast<uint16_t>(bit));
}

#pragma pack(push, 1)

struct CheckpointRecordV1 {
    char     magic[8];               // "CHANCKPT"
    uint16_t version;                // = kCheckpointVersion
    uint16_t record_size;            // sizeof(CheckpointRecordV1)
    uint16_t flags;                  // CheckpointFlagBit
    uint16_t reserved0;

    uint64_t oldest_archived_id;     // valid if CKB_HAS_OLDEST
    uint64_t newest_archived_id;     // valid if CKB_HAS_NEWEST
    uint64_t total_messages;
    uint64_t uncompressed_bytes;
    uint64_t spool_bytes;
    uint64_t archive_bytes;

    uint32_t record_crc32;           // CRC32(record without this field)
    uint32_t reserved1;

    CheckpointRecordV1() {
        std::memset(this, 0, sizeof(*this));
        std::memcpy(magic, kCheckpointMagic, 8);
        version = kCheckpointVersion;
        record_size = sizeof(CheckpointRecordV1);
    }
};

#pragma pack(pop)

static_assert(sizeof(CheckpointRecordV1) == 72,
              "CheckpointRecordV1 must be exactly 72 bytes");

}  // namespace chanarc

#endif  // CHANARC_STRUCT_DEFS_H_
