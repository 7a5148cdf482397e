#ifndef CHANARC_ARCHIVE_READER_H_
#define CHANARC_ARCHIVE_READER_H_

#include "compressor.h"
#include "record_codec.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chanarc {

// ============================================================================
// Archive Reader - decodes a file of concatenated frames back into records
// ============================================================================

/// Read result
enum class ReadResult {
    SUCCESS = 0,
    ERR_NOT_FOUND,
    ERR_IO_FAILED,
    ERR_MALFORMED_RECORD     // a frame decompressed but its records do not parse
};

/// Reader statistics
struct ReaderStats {
    uint64_t frames_read = 0;
    uint64_t records_read = 0;
    uint64_t uncompressed_bytes = 0;
    uint64_t skipped_bytes = 0;      // torn or corrupt frames stepped over
    uint64_t corrupt_regions = 0;
};

class ArchiveReader {
public:
    ArchiveReader();

    // Disable copy and move
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    /// Decode every record of an archive file, in file order
    /// @param path Archive path
    /// @param records Output: decoded records
    /// @param stats Output: reader statistics
    /// @return ReadResult
    ReadResult readAll(const std::string& path,
                       std::vector<Record>& records,
                       ReaderStats& stats);

    /// Decode records from an in-memory archive image
    ReadResult readBuffer(const uint8_t* data,
                          size_t size,
                          std::vector<Record>& records,
                          ReaderStats& stats);

    /// Get last error message
    const std::string& getLastError() const { return last_error_; }

private:
    /// Offset of the next frame magic number at or after from, or size
    static size_t findNextFrame(const uint8_t* data, size_t size, size_t from);

    void setError(const std::string& message);

    std::unique_ptr<ICompressor> compressor_;
    std::string last_error_;
};

}  // namespace chanarc

#endif  // CHANARC_ARCHIVE_READER_H_
