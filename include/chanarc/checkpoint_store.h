#ifndef CHANARC_CHECKPOINT_STORE_H_
#define CHANARC_CHECKPOINT_STORE_H_

#include "struct_defs.h"
#include "file_io.h"
#include <cstdint>
#include <string>

namespace chanarc {

// ============================================================================
// Checkpoint Store - crash-safe persistence of pagination progress
// ============================================================================

/// Checkpoint operation result
enum class CheckpointResult {
    SUCCESS = 0,
    ERR_IO_FAILED,
    ERR_CORRUPTED,      // bad magic / version / size / CRC / invariants
    ERR_LOCKED,         // another process owns the archive
    ERR_INVALID_STATE   // refused to persist a checkpoint that breaks invariants
};

class CheckpointStore {
public:
    /// Constructor
    /// @param checkpoint_path Path of the checkpoint file
    /// @param lock_path Path of the lock file held for the process lifetime
    CheckpointStore(const std::string& checkpoint_path, const std::string& lock_path);

    /// Destructor (releases the lock)
    ~CheckpointStore();

    // Disable copy and move
    CheckpointStore(const CheckpointStore&) = delete;
    CheckpointStore& operator=(const CheckpointStore&) = delete;
    CheckpointStore(CheckpointStore&&) = delete;
    CheckpointStore& operator=(CheckpointStore&&) = delete;

    /// Take the exclusive archive lock (non-blocking)
    /// @return ERR_LOCKED if another run holds it
    CheckpointResult acquireLock();

    /// Release the archive lock
    void releaseLock();

    bool isLocked() const { return lock_.isHeld(); }

    /// Load the checkpoint
    /// @param checkpoint Output: zero value if no checkpoint file exists
    /// @return CheckpointResult
    CheckpointResult load(Checkpoint& checkpoint);

    /// Atomically replace the on-disk checkpoint
    /// @param checkpoint Progress whose archive bytes are already durable
    /// @return CheckpointResult
    CheckpointResult save(const Checkpoint& checkpoint);

    /// Check the Checkpoint invariants (oldest <= newest, set together)
    static bool validate(const Checkpoint& checkpoint);

    /// Serialize to the on-disk record (CRC filled in)
    static CheckpointRecordV1 toRecord(const Checkpoint& checkpoint);

    /// Parse an on-disk record
    /// @return false if magic, version, size or CRC do not match
    static bool fromRecord(const CheckpointRecordV1& record, Checkpoint& checkpoint);

    /// Get checkpoint file path
    const std::string& getPath() const { return checkpoint_path_; }

    /// Get last error message
    const std::string& getLastError() const { return last_error_; }

private:
    /// CRC32 over the record, excluding the trailing crc/reserved words
    static uint32_t calculateCRC32(const CheckpointRecordV1& record);

    void setError(const std::string& message);

    std::string checkpoint_path_;    // Checkpoint file path
    std::string lock_path_;          // Lock file path
    FileLock lock_;                  // Held for the store lifetime
    std::string last_error_;         // Last error message
};

}  // namespace chanarc

#endif  // CHANARC_CHECKPOINT_STORE_H_
