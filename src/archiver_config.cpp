#include "chanarc/archiver_config.h"
#include "chanarc/message_fetcher.h"
#include <zstd.h>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace chanarc {

ConfigResult ArchiverConfig::finalize(std::string& error) {
    if (token.empty()) {
        error = "No access token given (--token or CHANARC_TOKEN)";
        return ConfigResult::ERR_MISSING_TOKEN;
    }

    if (channel_id.empty()) {
        error = "No channel id given (--channel)";
        return ConfigResult::ERR_MISSING_CHANNEL;
    }

    MessageId parsed = 0;
    if (!MessageFetcher::parseMessageId(channel_id, parsed)) {
        error = "Channel id must be a decimal snowflake, got '" + channel_id + "'";
        return ConfigResult::ERR_INVALID_CHANNEL;
    }

    if (batch_size == 0 || batch_size > kMaxBatchSize) {
        error = "Batch size must be between 1 and " + std::to_string(kMaxBatchSize) +
                ", got " + std::to_string(batch_size);
        return ConfigResult::ERR_INVALID_BATCH_SIZE;
    }

    if (compression_level < ZSTD_minCLevel() || compression_level > ZSTD_maxCLevel()) {
        error = "Compression level must be between " + std::to_string(ZSTD_minCLevel()) +
                " and " + std::to_string(ZSTD_maxCLevel());
        return ConfigResult::ERR_INVALID_LEVEL;
    }

    if (archive_path.empty()) {
        archive_path = channel_id + kArchiveExtension;
    }

    return ConfigResult::SUCCESS;
}

bool parseBatchSizeArg(const char* text, uint32_t& batch_size) {
    if (text == nullptr || *text < '0' || *text > '9') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text, &end, 10);
    if (*end != '\0' || errno == ERANGE || value > kMaxBatchSize) {
        return false;
    }
    batch_size = static_cast<uint32_t>(value);
    return true;
}

bool parseCompressionLevelArg(const char* text, int& level) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (*end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    level = static_cast<int>(value);
    return true;
}

}  // namespace chanarc
