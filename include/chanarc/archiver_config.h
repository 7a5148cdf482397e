#ifndef CHANARC_ARCHIVER_CONFIG_H_
#define CHANARC_ARCHIVER_CONFIG_H_

#include "constants.h"
#include "retry_policy.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace chanarc {

/// Config validation result
enum class ConfigResult {
    SUCCESS = 0,
    ERR_MISSING_TOKEN,
    ERR_MISSING_CHANNEL,
    ERR_INVALID_CHANNEL,
    ERR_INVALID_BATCH_SIZE,
    ERR_INVALID_LEVEL
};

/// Archiver configuration
struct ArchiverConfig {
    std::string token;             // sent as the Authorization header
    std::string channel_id;        // decimal snowflake
    std::string archive_path;      // empty: <channel_id>.zst

    std::string api_host;
    std::string api_port;
    std::string api_prefix;
    std::chrono::seconds request_timeout;

    uint32_t batch_size;
    int compression_level;
    bool skip_empty_content;       // drop records whose content is empty

    RetryConfig retry;

    ArchiverConfig()
        : api_host("discord.com"),
          api_port("443"),
          api_prefix("/api/v10"),
          request_timeout(30),
          batch_size(kDefaultBatchSize),
          compression_level(kDefaultCompressionLevel),
          skip_empty_content(false) {
    }

    /// Validate and fill derived defaults (archive path)
    /// @param error Output: description of the first problem found
    ConfigResult finalize(std::string& error);

    std::string checkpointPath() const { return archive_path + kCheckpointSuffix; }
    std::string spoolPath() const { return archive_path + kSpoolSuffix; }
    std::string lockPath() const { return checkpointPath() + kLockSuffix; }
};

// ============================================================================
// Command-line value parsing
// ============================================================================

/// Parse a --batch value; fails on trailing junk or anything above kMaxBatchSize
bool parseBatchSizeArg(const char* text, uint32_t& batch_size);

/// Parse a --level value; fails on trailing junk or values that do not fit
/// an int. The zstd range itself is checked by finalize().
bool parseCompressionLevelArg(const char* text, int& level);

}  // namespace chanarc

#endif  // CHANARC_ARCHIVER_CONFIG_H_
