#include "chanarc/checkpoint_store.h"
#include <zlib.h>
#include <cstddef>
#include <cstring>
#include <vector>

namespace chanarc {

CheckpointStore::CheckpointStore(const std::string& checkpoint_path,
                                 const std::string& lock_path)
    : checkpoint_path_(checkpoint_path), lock_path_(lock_path) {
}

CheckpointStore::~CheckpointStore() {
    releaseLock();
}

CheckpointResult CheckpointStore::acquireLock() {
    IOResult result = lock_.acquire(lock_path_);
    if (result == IOResult::ERR_LOCKED) {
        setError(lock_.getLastError());
        return CheckpointResult::ERR_LOCKED;
    }
    if (result != IOResult::SUCCESS) {
        setError(lock_.getLastError());
        return CheckpointResult::ERR_IO_FAILED;
    }
    return CheckpointResult::SUCCESS;
}

void CheckpointStore::releaseLock() {
    lock_.release();
}

bool CheckpointStore::validate(const Checkpoint& checkpoint) {
    // Both cursors are set together on the first write
    if (checkpoint.oldest_archived_id.has_value() != checkpoint.newest_archived_id.has_value()) {
        return false;
    }
    if (checkpoint.oldest_archived_id &&
        *checkpoint.oldest_archived_id > *checkpoint.newest_archived_id) {
        return false;
    }
    return true;
}

uint32_t CheckpointStore::calculateCRC32(const CheckpointRecordV1& record) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(&record),
                offsetof(CheckpointRecordV1, record_crc32));
    return static_cast<uint32_t>(crc);
}

CheckpointRecordV1 CheckpointStore::toRecord(const Checkpoint& checkpoint) {
    CheckpointRecordV1 record;

    if (checkpoint.oldest_archived_id) {
        record.flags |= checkpointFlag(CheckpointFlagBit::CKB_HAS_OLDEST);
        record.oldest_archived_id = *checkpoint.oldest_archived_id;
    }
    if (checkpoint.newest_archived_id) {
        record.flags |= checkpointFlag(CheckpointFlagBit::CKB_HAS_NEWEST);
        record.newest_archived_id = *checkpoint.newest_archived_id;
    }
    if (checkpoint.backfill_complete) {
        record.flags |= checkpointFlag(CheckpointFlagBit::CKB_BACKFILL_COMPLETE);
    }

    record.total_messages = checkpoint.total_messages;
    record.uncompressed_bytes = checkpoint.uncompressed_bytes;
    record.spool_bytes = checkpoint.spool_bytes;
    record.archive_bytes = checkpoint.archive_bytes;
    record.record_crc32 = calculateCRC32(record);

    return record;
}

bool CheckpointStore::fromRecord(const CheckpointRecordV1& record, Checkpoint& checkpoint) {
    if (std::memcmp(record.magic, kCheckpointMagic, 8) != 0) {
        return false;
    }
    if (record.version != kCheckpointVersion ||
        record.record_size != sizeof(CheckpointRecordV1)) {
        return false;
    }
    if (record.record_crc32 != calculateCRC32(record)) {
        return false;
    }

    Checkpoint parsed;
    if (record.flags & checkpointFlag(CheckpointFlagBit::CKB_HAS_OLDEST)) {
        parsed.oldest_archived_id = record.oldest_archived_id;
    }
    if (record.flags & checkpointFlag(CheckpointFlagBit::CKB_HAS_NEWEST)) {
        parsed.newest_archived_id = record.newest_archived_id;
    }
    parsed.backfill_complete =
        (record.flags & checkpointFlag(CheckpointFlagBit::CKB_BACKFILL_COMPLETE)) != 0;
    parsed.total_messages = record.total_messages;
    parsed.uncompressed_bytes = record.uncompressed_bytes;
    parsed.spool_bytes = record.spool_bytes;
    parsed.archive_bytes = record.archive_bytes;

    checkpoint = parsed;
    return true;
}

CheckpointResult CheckpointStore::load(Checkpoint& checkpoint) {
    std::vector<uint8_t> data;
    std::string error;
    IOResult io_result = readWholeFile(checkpoint_path_, data, error);

    if (io_result == IOResult::ERR_NOT_FOUND) {
        // First run: nothing archived yet
        checkpoint = Checkpoint();
        return CheckpointResult::SUCCESS;
    }
    if (io_result != IOResult::SUCCESS) {
        setError("Failed to read checkpoint: " + error);
        return CheckpointResult::ERR_IO_FAILED;
    }

    if (data.size() != sizeof(CheckpointRecordV1)) {
        setError("Checkpoint " + checkpoint_path_ + " has size " +
                 std::to_string(data.size()) + ", expected " +
                 std::to_string(sizeof(CheckpointRecordV1)));
        return CheckpointResult::ERR_CORRUPTED;
    }

    CheckpointRecordV1 record;
    std::memcpy(&record, data.data(), sizeof(record));

    Checkpoint parsed;
    if (!fromRecord(record, parsed)) {
        setError("Checkpoint " + checkpoint_path_ + " failed magic/version/CRC validation");
        return CheckpointResult::ERR_CORRUPTED;
    }
    if (!validate(parsed)) {
        setError("Checkpoint " + checkpoint_path_ + " violates cursor invariants");
        return CheckpointResult::ERR_CORRUPTED;
    }

    checkpoint = parsed;
    return CheckpointResult::SUCCESS;
}

CheckpointResult CheckpointStore::save(const Checkpoint& checkpoint) {
    if (!validate(checkpoint)) {
        setError("Refusing to save checkpoint that violates cursor invariants");
        return CheckpointResult::ERR_INVALID_STATE;
    }

    CheckpointRecordV1 record = toRecord(checkpoint);

    std::string error;
    IOResult io_result = atomicReplaceFile(checkpoint_path_, &record, sizeof(record), error);
    if (io_result != IOResult::SUCCESS) {
        setError("Failed to save checkpoint: " + error);
        return CheckpointResult::ERR_IO_FAILED;
    }

    return CheckpointResult::SUCCESS;
}

void CheckpointStore::setError(const std::string& message) {
    last_error_ = message;
}

}  // namespace chanarc
