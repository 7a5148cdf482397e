#ifndef CHANARC_ARCHIVE_WRITER_H_
#define CHANARC_ARCHIVE_WRITER_H_

#include "struct_defs.h"
#include "file_io.h"
#include "compressor.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chanarc {

// ============================================================================
// Archive Writer - appendable compressed sink, one frame per batch
// ============================================================================

/// Writer operation result
enum class WriterResult {
    SUCCESS = 0,
    ERR_OPEN_FAILED,
    ERR_NOT_OPEN,
    ERR_INCONSISTENT,        // file shorter than the committed length
    ERR_COMPRESSION_FAILED,
    ERR_IO_FAILED,
    ERR_EMPTY_BATCH
};

/// How bytes past the committed length are treated on open
enum class TailPolicy {
    KEEP_AND_WARN,   // archive: append-only, never truncated
    TRUNCATE         // spool: staging data, roll back to the checkpoint
};

/// Writer statistics
struct WriterStats {
    uint64_t batches_written = 0;
    uint64_t records_written = 0;
    uint64_t uncompressed_bytes = 0;
    uint64_t compressed_bytes = 0;
    uint64_t sync_operations = 0;
    uint64_t uncommitted_tail_bytes = 0;   // found on open
};

class ArchiveWriter {
public:
    /// Constructor
    /// @param compression_level zstd level for every frame
    explicit ArchiveWriter(int compression_level = kDefaultCompressionLevel);

    /// Destructor (closes the file)
    ~ArchiveWriter();

    // Disable copy and move
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;
    ArchiveWriter(ArchiveWriter&&) = delete;
    ArchiveWriter& operator=(ArchiveWriter&&) = delete;

    /// Open (or create) a compressed file for appending
    /// @param path File path
    /// @param committed_bytes Length recorded by the last saved checkpoint
    /// @param tail_policy Handling of bytes written after that checkpoint
    /// @return WriterResult
    WriterResult open(const std::string& path,
                      uint64_t committed_bytes,
                      TailPolicy tail_policy);

    /// Compress a batch of encoded records as one frame, append it and fsync
    /// @param records Encoded records, already in the order they must appear
    /// @return SUCCESS only once the frame is durable
    WriterResult append(const std::vector<std::string>& records);

    /// Sync and close the file
    WriterResult close();

    bool isOpen() const { return io_.isOpen(); }

    /// Current file length including every durable frame
    uint64_t getFileSize() const { return file_size_; }

    const WriterStats& getStats() const { return stats_; }

    const std::string& getLastError() const { return last_error_; }

private:
    void setError(const std::string& message);

    FileIO io_;
    std::unique_ptr<ICompressor> compressor_;
    int compression_level_;
    uint64_t file_size_;

    WriterStats stats_;
    std::string last_error_;
};

}  // namespace chanarc

#endif  // CHANARC_ARCHIVE_WRITER_H_
