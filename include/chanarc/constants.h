#ifndef CHANARC_CONSTANTS_H_
#define CHANARC_CONSTANTS_H_

#include <cstdint>

namespace chanarc {

// ============================================================================
// Record Framing
// ============================================================================

/// Field separator that opens a record and splits username from content
constexpr char kRecordFieldSeparator = '\0';

/// Record terminator
constexpr char kRecordTerminator = '\n';

/// Substituted for NUL / NEWLINE bytes found in message content
constexpr char kContentPlaceholder = ' ';

// ============================================================================
// Pagination
// ============================================================================

/// Default number of messages requested per page
constexpr uint32_t kDefaultBatchSize = 100u;

/// Platform maximum for the "limit" query parameter
constexpr uint32_t kMaxBatchSize = 100u;

// ============================================================================
// Retry / Backoff
// ============================================================================

constexpr uint32_t kDefaultInitialBackoffMs = 500u;
constexpr uint32_t kDefaultMaxBackoffMs = 60000u;      // 60s ceiling
constexpr uint32_t kDefaultMaxAttempts = 8u;           // then escalate to FATAL

// ============================================================================
// Compression
// ============================================================================

/// Default zstd level for archive frames (batches are small, favour ratio)
constexpr int kDefaultCompressionLevel = 19;

/// Upper bound on a frame's decompressed size. A full batch of maximum-length
/// messages stays far below it; larger header claims mean a corrupt frame.
constexpr uint64_t kMaxFrameContentSize = 64ull * 1024 * 1024;

/// zstd frame magic number (little-endian on disk: 28 B5 2F FD)
constexpr uint32_t kZstdFrameMagic = 0xFD2FB528u;

// ============================================================================
// File Naming
// ============================================================================

constexpr const char* kArchiveExtension = ".zst";
constexpr const char* kCheckpointSuffix = ".ckpt";
constexpr const char* kSpoolSuffix = ".backfill";
constexpr const char* kLockSuffix = ".lock";
constexpr const char* kTempSuffix = ".tmp";

}  // namespace chanarc

#endif  // CHANARC_CONSTANTS_H_
