#include "chanarc/archive_driver.h"
#include "chanarc/file_io.h"
#include "chanarc/record_codec.h"
#include "chanarc/spool_sealer.h"
#include <algorithm>
#include <iostream>

namespace chanarc {

const char* driverStateName(DriverState state) {
    switch (state) {
        case DriverState::INIT:          return "INIT";
        case DriverState::BACKFILLING:   return "BACKFILLING";
        case DriverState::BACKFILL_DONE: return "BACKFILL_DONE";
        case DriverState::CATCHING_UP:   return "CATCHING_UP";
        case DriverState::IDLE:          return "IDLE";
        case DriverState::ABORTED:       return "ABORTED";
        default: return "UNKNOWN";
    }
}

const char* driverResultName(DriverResult result) {
    switch (result) {
        case DriverResult::SUCCESS:                  return "SUCCESS";
        case DriverResult::SUCCESS_INTERRUPTED:      return "SUCCESS_INTERRUPTED";
        case DriverResult::ERR_LOCKED:               return "ERR_LOCKED";
        case DriverResult::ERR_CHECKPOINT_CORRUPTED: return "ERR_CHECKPOINT_CORRUPTED";
        case DriverResult::ERR_CHECKPOINT_IO:        return "ERR_CHECKPOINT_IO";
        case DriverResult::ERR_INCONSISTENT:         return "ERR_INCONSISTENT";
        case DriverResult::ERR_FETCH_FATAL:          return "ERR_FETCH_FATAL";
        case DriverResult::ERR_RETRIES_EXHAUSTED:    return "ERR_RETRIES_EXHAUSTED";
        case DriverResult::ERR_WRITE_FAILED:         return "ERR_WRITE_FAILED";
        case DriverResult::ERR_SEAL_FAILED:          return "ERR_SEAL_FAILED";
        default: return "UNKNOWN";
    }
}

ArchiveDriver::ArchiveDriver(const ArchiverConfig& config,
                             IPageFetcher* fetcher,
                             ISleeper* sleeper)
    : config_(config),
      fetcher_(fetcher),
      sleeper_(sleeper),
      stop_flag_(nullptr),
      retry_policy_(config.retry),
      state_(DriverState::INIT) {
}

ArchiveDriver::~ArchiveDriver() {
    writer_.reset();
    store_.reset();
}

bool ArchiveDriver::stopRequested() const {
    return stop_flag_ != nullptr && stop_flag_->load();
}

DriverResult ArchiveDriver::abort(DriverResult result, const std::string& message) {
    last_error_ = message;
    state_ = DriverState::ABORTED;
    std::cerr << "[ArchiveDriver] Aborting (" << driverResultName(result) << "): "
              << message << std::endl;

    // Everything durable is already covered by the saved checkpoint
    writer_.reset();
    store_.reset();
    return result;
}

// ============================================================================
// INIT
// ============================================================================

DriverResult ArchiveDriver::initialize() {
    store_ = std::make_unique<CheckpointStore>(config_.checkpointPath(), config_.lockPath());

    CheckpointResult ck_result = store_->acquireLock();
    if (ck_result == CheckpointResult::ERR_LOCKED) {
        return abort(DriverResult::ERR_LOCKED, store_->getLastError());
    }
    if (ck_result != CheckpointResult::SUCCESS) {
        return abort(DriverResult::ERR_CHECKPOINT_IO, store_->getLastError());
    }

    Checkpoint loaded;
    ck_result = store_->load(loaded);
    if (ck_result == CheckpointResult::ERR_CORRUPTED) {
        return abort(DriverResult::ERR_CHECKPOINT_CORRUPTED, store_->getLastError());
    }
    if (ck_result != CheckpointResult::SUCCESS) {
        return abort(DriverResult::ERR_CHECKPOINT_IO, store_->getLastError());
    }
    checkpoint_ = loaded;

    bool fresh = !fileExists(config_.checkpointPath());
    if (fresh && fileSize(config_.archive_path) > 0) {
        return abort(DriverResult::ERR_INCONSISTENT,
                     "Archive " + config_.archive_path +
                     " exists but has no checkpoint; refusing to overwrite it");
    }

    if (fresh) {
        std::cout << "[ArchiveDriver] No checkpoint found, starting a new archive at "
                  << config_.archive_path << std::endl;
    } else {
        std::cout << "[ArchiveDriver] Resuming " << config_.archive_path
                  << ": oldest=" << (checkpoint_.oldest_archived_id
                                         ? std::to_string(*checkpoint_.oldest_archived_id)
                                         : std::string("-"))
                  << " newest=" << (checkpoint_.newest_archived_id
                                        ? std::to_string(*checkpoint_.newest_archived_id)
                                        : std::string("-"))
                  << " backfill_complete=" << (checkpoint_.backfill_complete ? "yes" : "no")
                  << " messages=" << checkpoint_.total_messages
                  << " uncompressed=" << checkpoint_.uncompressed_bytes << " bytes"
                  << std::endl;
    }

    if (!checkpoint_.backfill_complete) {
        state_ = DriverState::BACKFILLING;
        return openWriter(config_.spoolPath(), checkpoint_.spool_bytes, TailPolicy::TRUNCATE);
    }

    // A spool left behind by a crash right after sealing
    if (fileExists(config_.spoolPath())) {
        std::string error;
        if (removeFile(config_.spoolPath(), error) != IOResult::SUCCESS) {
            std::cerr << "[ArchiveDriver] Warning: " << error << std::endl;
        }
    }

    state_ = DriverState::CATCHING_UP;
    return openWriter(config_.archive_path, checkpoint_.archive_bytes, TailPolicy::KEEP_AND_WARN);
}

DriverResult ArchiveDriver::openWriter(const std::string& path,
                                       uint64_t committed,
                                       TailPolicy policy) {
    writer_ = std::make_unique<ArchiveWriter>(config_.compression_level);
    WriterResult result = writer_->open(path, committed, policy);
    if (result == WriterResult::ERR_INCONSISTENT) {
        return abort(DriverResult::ERR_INCONSISTENT, writer_->getLastError());
    }
    if (result != WriterResult::SUCCESS) {
        return abort(DriverResult::ERR_WRITE_FAILED, writer_->getLastError());
    }
    return DriverResult::SUCCESS;
}

DriverResult ArchiveDriver::commit(const Checkpoint& next) {
    CheckpointResult result = store_->save(next);
    if (result != CheckpointResult::SUCCESS) {
        return abort(DriverResult::ERR_CHECKPOINT_IO, store_->getLastError());
    }
    checkpoint_ = next;
    return DriverResult::SUCCESS;
}

// ============================================================================
// Fetch with retry
// ============================================================================

DriverResult ArchiveDriver::fetchWithRetry(Direction direction,
                                           std::optional<MessageId> cursor,
                                           FetchResult& result) {
    uint32_t retries = 0;

    for (;;) {
        FetchStatus status = fetcher_->fetch(direction, cursor, config_.batch_size, result);
        stats_.fetches++;

        if (status == FetchStatus::SUCCESS) {
            return DriverResult::SUCCESS;
        }

        if (status == FetchStatus::FATAL) {
            return abort(DriverResult::ERR_FETCH_FATAL, result.cause);
        }

        if (retry_policy_.exhausted(retries)) {
            return abort(DriverResult::ERR_RETRIES_EXHAUSTED,
                         "Giving up after " + std::to_string(retries) + " retries: " +
                         result.cause);
        }

        std::chrono::milliseconds delay;
        if (status == FetchStatus::RATE_LIMITED) {
            delay = retry_policy_.rateLimitDelay(retries, result.retry_after);
            stats_.rate_limit_waits++;
        } else {
            delay = retry_policy_.backoffFor(retries);
        }

        std::cerr << "[ArchiveDriver] " << fetchStatusName(status) << ": " << result.cause
                  << "; retrying in " << delay.count() << " ms" << std::endl;

        sleeper_->sleepFor(delay);
        retries++;
        stats_.retries++;
    }
}

// ============================================================================
// Batch shaping
// ============================================================================

std::vector<Message> ArchiveDriver::orderPage(Direction direction,
                                              std::optional<MessageId> cursor,
                                              const Page& page) {
    std::vector<Message> ascending;
    ascending.reserve(page.messages.size());

    // Pages arrive newest-first; walk them backwards
    for (auto it = page.messages.rbegin(); it != page.messages.rend(); ++it) {
        bool in_range = true;
        if (cursor) {
            in_range = (direction == Direction::BEFORE) ? (it->id < *cursor)
                                                        : (it->id > *cursor);
        }
        if (!in_range) {
            std::cerr << "[ArchiveDriver] Dropping message " << it->id
                      << " outside the requested range" << std::endl;
            stats_.out_of_range_dropped++;
            continue;
        }
        if (!ascending.empty() && ascending.back().id >= it->id) {
            // Duplicate id inside one page
            stats_.out_of_range_dropped++;
            continue;
        }
        ascending.push_back(*it);
    }

    return ascending;
}

void ArchiveDriver::encodeBatch(const std::vector<Message>& ascending,
                                std::vector<std::string>& records,
                                uint64_t& record_bytes) {
    records.clear();
    record_bytes = 0;

    for (const Message& message : ascending) {
        if (config_.skip_empty_content && message.content.empty()) {
            stats_.empty_skipped++;
            continue;
        }

        std::string record;
        if (RecordCodec::encode(message.author, message.content, record) != CodecResult::SUCCESS) {
            std::cerr << "[ArchiveDriver] Skipping message " << message.id
                      << ": username cannot be framed" << std::endl;
            stats_.malformed_skipped++;
            continue;
        }

        record_bytes += record.size();
        records.push_back(std::move(record));
    }
}

void ArchiveDriver::logProgress(const char* phase, size_t batch_records) const {
    std::cout << "[ArchiveDriver] " << phase << " batch: " << batch_records
              << " records, TOTAL MESSAGES: " << checkpoint_.total_messages
              << ", TOTAL UNCOMPRESSED SIZE: " << checkpoint_.uncompressed_bytes
              << " bytes" << std::endl;
}

// ============================================================================
// BACKFILLING
// ============================================================================

DriverResult ArchiveDriver::backfillStep(const Checkpoint& current,
                                         Checkpoint& next,
                                         bool& exhausted) {
    exhausted = false;
    next = current;

    FetchResult fetched;
    DriverResult result = fetchWithRetry(Direction::BEFORE, current.oldest_archived_id, fetched);
    if (result != DriverResult::SUCCESS) {
        return result;
    }

    const Page& page = fetched.page;
    if (page.empty()) {
        exhausted = true;
        return DriverResult::SUCCESS;
    }

    stats_.malformed_skipped += page.malformed_count;
    if (page.max_seen_id == 0) {
        return abort(DriverResult::ERR_FETCH_FATAL,
                     "Page carried no usable message ids; cannot advance the cursor");
    }

    if (current.oldest_archived_id && page.min_seen_id >= *current.oldest_archived_id) {
        return abort(DriverResult::ERR_FETCH_FATAL,
                     "BEFORE page did not move past cursor " +
                     std::to_string(*current.oldest_archived_id));
    }

    std::vector<Message> ascending = orderPage(Direction::BEFORE, current.oldest_archived_id, page);

    std::vector<std::string> records;
    uint64_t record_bytes = 0;
    encodeBatch(ascending, records, record_bytes);

    if (!records.empty()) {
        WriterResult write_result = writer_->append(records);
        if (write_result != WriterResult::SUCCESS) {
            return abort(DriverResult::ERR_WRITE_FAILED, writer_->getLastError());
        }
    }

    // Cursor covers every id seen, so malformed or skipped messages are not refetched
    next.oldest_archived_id = page.min_seen_id;
    if (!next.newest_archived_id) {
        next.newest_archived_id = page.max_seen_id;
    }
    next.total_messages += records.size();
    next.uncompressed_bytes += record_bytes;
    next.spool_bytes = writer_->getFileSize();

    result = commit(next);
    if (result != DriverResult::SUCCESS) {
        return result;
    }

    stats_.batches_written++;
    stats_.messages_written += records.size();
    logProgress("Backfill", records.size());
    return DriverResult::SUCCESS;
}

DriverResult ArchiveDriver::finishBackfill(const Checkpoint& current, Checkpoint& next) {
    next = current;

    WriterResult close_result = writer_->close();
    writer_.reset();
    if (close_result != WriterResult::SUCCESS) {
        return abort(DriverResult::ERR_WRITE_FAILED, "Failed to close spool");
    }

    SpoolSealer sealer;
    SealStats seal_stats;
    SealResult seal_result = sealer.seal(config_.spoolPath(), current.spool_bytes,
                                         config_.archive_path, seal_stats);
    if (seal_result == SealResult::ERR_INCONSISTENT) {
        return abort(DriverResult::ERR_INCONSISTENT, sealer.getLastError());
    }
    if (seal_result != SealResult::SUCCESS) {
        return abort(DriverResult::ERR_SEAL_FAILED, sealer.getLastError());
    }

    next.backfill_complete = true;
    next.archive_bytes = seal_stats.archive_bytes;
    next.spool_bytes = 0;

    DriverResult result = commit(next);
    if (result != DriverResult::SUCCESS) {
        return result;
    }

    std::string error;
    if (removeFile(config_.spoolPath(), error) != IOResult::SUCCESS) {
        std::cerr << "[ArchiveDriver] Warning: " << error << std::endl;
    }

    std::cout << "[ArchiveDriver] Backfill complete: " << checkpoint_.total_messages
              << " messages in " << seal_stats.frames_sealed << " frames" << std::endl;
    return DriverResult::SUCCESS;
}

// ============================================================================
// CATCHING_UP
// ============================================================================

DriverResult ArchiveDriver::catchUpStep(const Checkpoint& current,
                                        Checkpoint& next,
                                        bool& exhausted) {
    exhausted = false;
    next = current;

    // An empty channel has no newest id yet: everything is "after 0"
    MessageId cursor = current.newest_archived_id.value_or(0);

    FetchResult fetched;
    DriverResult result = fetchWithRetry(Direction::AFTER, cursor, fetched);
    if (result != DriverResult::SUCCESS) {
        return result;
    }

    const Page& page = fetched.page;
    if (page.empty()) {
        exhausted = true;
        return DriverResult::SUCCESS;
    }

    stats_.malformed_skipped += page.malformed_count;
    if (page.max_seen_id == 0) {
        return abort(DriverResult::ERR_FETCH_FATAL,
                     "Page carried no usable message ids; cannot advance the cursor");
    }
    if (page.max_seen_id <= cursor) {
        return abort(DriverResult::ERR_FETCH_FATAL,
                     "AFTER page did not move past cursor " + std::to_string(cursor));
    }

    std::vector<Message> ascending = orderPage(Direction::AFTER, cursor, page);

    std::vector<std::string> records;
    uint64_t record_bytes = 0;
    encodeBatch(ascending, records, record_bytes);

    if (!records.empty()) {
        WriterResult write_result = writer_->append(records);
        if (write_result != WriterResult::SUCCESS) {
            return abort(DriverResult::ERR_WRITE_FAILED, writer_->getLastError());
        }
    }

    next.newest_archived_id = page.max_seen_id;
    if (!next.oldest_archived_id) {
        next.oldest_archived_id = std::max(page.min_seen_id, cursor + 1);
    }
    next.total_messages += records.size();
    next.uncompressed_bytes += record_bytes;
    next.archive_bytes = writer_->getFileSize();

    result = commit(next);
    if (result != DriverResult::SUCCESS) {
        return result;
    }

    stats_.batches_written++;
    stats_.messages_written += records.size();
    logProgress("Catch-up", records.size());
    return DriverResult::SUCCESS;
}

// ============================================================================
// Main loop
// ============================================================================

DriverResult ArchiveDriver::run() {
    if (state_ != DriverState::INIT) {
        last_error_ = "Driver already ran";
        return DriverResult::ERR_INCONSISTENT;
    }

    DriverResult result = initialize();
    if (result != DriverResult::SUCCESS) {
        return result;
    }

    while (state_ == DriverState::BACKFILLING) {
        if (stopRequested()) {
            break;
        }

        Checkpoint next;
        bool exhausted = false;
        result = backfillStep(checkpoint_, next, exhausted);
        if (result != DriverResult::SUCCESS) {
            return result;
        }

        if (exhausted) {
            state_ = DriverState::BACKFILL_DONE;
            result = finishBackfill(checkpoint_, next);
            if (result != DriverResult::SUCCESS) {
                return result;
            }
            state_ = DriverState::CATCHING_UP;
            result = openWriter(config_.archive_path, checkpoint_.archive_bytes,
                                TailPolicy::KEEP_AND_WARN);
            if (result != DriverResult::SUCCESS) {
                return result;
            }
        }
    }

    while (state_ == DriverState::CATCHING_UP) {
        if (stopRequested()) {
            break;
        }

        Checkpoint next;
        bool exhausted = false;
        result = catchUpStep(checkpoint_, next, exhausted);
        if (result != DriverResult::SUCCESS) {
            return result;
        }

        if (exhausted) {
            state_ = DriverState::IDLE;
        }
    }

    if (writer_) {
        WriterResult close_result = writer_->close();
        if (close_result != WriterResult::SUCCESS) {
            return abort(DriverResult::ERR_WRITE_FAILED, writer_->getLastError());
        }
        writer_.reset();
    }
    store_.reset();

    if (state_ != DriverState::IDLE) {
        std::cout << "[ArchiveDriver] Stop requested, exiting at batch boundary in "
                  << driverStateName(state_) << std::endl;
        state_ = DriverState::IDLE;
        return DriverResult::SUCCESS_INTERRUPTED;
    }

    std::cout << "[ArchiveDriver] Up to date. TOTAL MESSAGES: " << checkpoint_.total_messages
              << ", TOTAL UNCOMPRESSED SIZE: " << checkpoint_.uncompressed_bytes
              << " bytes" << std::endl;
    return DriverResult::SUCCESS;
}

}  // namespace chanarc
