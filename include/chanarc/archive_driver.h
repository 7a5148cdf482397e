#ifndef CHANARC_ARCHIVE_DRIVER_H_
#define CHANARC_ARCHIVE_DRIVER_H_

#include "archiver_config.h"
#include "archive_writer.h"
#include "checkpoint_store.h"
#include "message_fetcher.h"
#include "retry_policy.h"
#include "struct_defs.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chanarc {

// ============================================================================
// Archive Driver - resumable backfill / catch-up loop
//
//   INIT -> BACKFILLING <-> (fetch / write / checkpoint)
//        -> BACKFILL_DONE -> CATCHING_UP <-> (fetch / write / checkpoint)
//        -> IDLE | ABORTED
//
// The checkpoint is saved only after the batch it describes is fsynced, so the
// checkpoint never claims data that is not on disk.
// ============================================================================

enum class DriverState {
    INIT = 0,
    BACKFILLING,
    BACKFILL_DONE,
    CATCHING_UP,
    IDLE,
    ABORTED
};

/// Run outcome. Everything except SUCCESS* leaves the driver in ABORTED.
enum class DriverResult {
    SUCCESS = 0,
    SUCCESS_INTERRUPTED,         // stop requested; exited at a batch boundary
    ERR_LOCKED,
    ERR_CHECKPOINT_CORRUPTED,
    ERR_CHECKPOINT_IO,
    ERR_INCONSISTENT,            // files on disk disagree with the checkpoint
    ERR_FETCH_FATAL,
    ERR_RETRIES_EXHAUSTED,
    ERR_WRITE_FAILED,
    ERR_SEAL_FAILED
};

const char* driverStateName(DriverState state);
const char* driverResultName(DriverResult result);

/// Run statistics
struct DriverStats {
    uint64_t fetches = 0;
    uint64_t batches_written = 0;
    uint64_t messages_written = 0;
    uint64_t malformed_skipped = 0;      // bad payloads and unframable usernames
    uint64_t empty_skipped = 0;          // skip_empty_content drops
    uint64_t out_of_range_dropped = 0;   // ids on the wrong side of the cursor
    uint64_t retries = 0;
    uint64_t rate_limit_waits = 0;
};

class ArchiveDriver {
public:
    /// Constructor
    /// @param config Finalized configuration (paths, batch size, retry policy)
    /// @param fetcher Page source (not owned)
    /// @param sleeper Backoff sleeper (not owned)
    ArchiveDriver(const ArchiverConfig& config, IPageFetcher* fetcher, ISleeper* sleeper);

    /// Destructor (closes any open writer, releases the lock)
    ~ArchiveDriver();

    // Disable copy and move
    ArchiveDriver(const ArchiveDriver&) = delete;
    ArchiveDriver& operator=(const ArchiveDriver&) = delete;
    ArchiveDriver(ArchiveDriver&&) = delete;
    ArchiveDriver& operator=(ArchiveDriver&&) = delete;

    /// Cooperative cancellation flag, checked between batches only
    void setStopFlag(const std::atomic<bool>* stop_flag) { stop_flag_ = stop_flag; }

    /// Run until IDLE or ABORTED
    DriverResult run();

    DriverState getState() const { return state_; }

    /// Last checkpoint saved (or loaded) by this driver
    const Checkpoint& getCheckpoint() const { return checkpoint_; }

    const DriverStats& getStats() const { return stats_; }

    const std::string& getLastError() const { return last_error_; }

private:
    /// Lock, load checkpoint, pick the starting state
    DriverResult initialize();

    /// One BEFORE page into the spool
    /// @param current Last saved checkpoint
    /// @param next Output: checkpoint after this step (saved)
    /// @param exhausted Output: true if the page was empty
    DriverResult backfillStep(const Checkpoint& current, Checkpoint& next, bool& exhausted);

    /// Seal the spool into the archive and mark backfill complete
    DriverResult finishBackfill(const Checkpoint& current, Checkpoint& next);

    /// One AFTER page appended to the archive
    DriverResult catchUpStep(const Checkpoint& current, Checkpoint& next, bool& exhausted);

    /// Fetch with backoff / rate-limit waits and bounded retries
    DriverResult fetchWithRetry(Direction direction,
                                std::optional<MessageId> cursor,
                                FetchResult& result);

    /// Drop messages on the wrong side of the cursor, return ascending order
    std::vector<Message> orderPage(Direction direction,
                                   std::optional<MessageId> cursor,
                                   const Page& page);

    /// Encode messages into records, skipping unframable ones
    void encodeBatch(const std::vector<Message>& ascending,
                     std::vector<std::string>& records,
                     uint64_t& record_bytes);

    /// Open the spool (BACKFILLING) or the archive (CATCHING_UP)
    DriverResult openWriter(const std::string& path, uint64_t committed, TailPolicy policy);

    /// Save and adopt a checkpoint
    DriverResult commit(const Checkpoint& next);

    DriverResult abort(DriverResult result, const std::string& message);

    bool stopRequested() const;

    void logProgress(const char* phase, size_t batch_records) const;

    ArchiverConfig config_;
    IPageFetcher* fetcher_;                  // not owned
    ISleeper* sleeper_;                      // not owned
    const std::atomic<bool>* stop_flag_;     // not owned, may be null
    RetryPolicy retry_policy_;

    std::unique_ptr<CheckpointStore> store_;
    std::unique_ptr<ArchiveWriter> writer_;

    DriverState state_;
    Checkpoint checkpoint_;
    DriverStats stats_;
    std::string last_error_;
};

}  // namespace chanarc

#endif  // CHANARC_ARCHIVE_DRIVER_H_
