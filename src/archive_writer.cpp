#include "chanarc/archive_writer.h"
#include <iostream>

namespace chanarc {

ArchiveWriter::ArchiveWriter(int compression_level)
    : compressor_(CompressorFactory::create(CompressionType::COMP_ZSTD)),
      compression_level_(compression_level),
      file_size_(0) {
}

ArchiveWriter::~ArchiveWriter() {
    if (io_.isOpen()) {
        WriterResult result = close();
        if (result != WriterResult::SUCCESS) {
            std::cerr << "[ArchiveWriter] Close on destruction failed: "
                      << last_error_ << std::endl;
        }
    }
}

WriterResult ArchiveWriter::open(const std::string& path,
                                 uint64_t committed_bytes,
                                 TailPolicy tail_policy) {
    if (!compressor_) {
        setError("zstd compressor unavailable");
        return WriterResult::ERR_OPEN_FAILED;
    }

    IOResult io_result = io_.open(path, true);
    if (io_result != IOResult::SUCCESS) {
        setError("Failed to open " + path + ": " + io_.getLastError());
        return WriterResult::ERR_OPEN_FAILED;
    }

    int64_t size = io_.getFileSize();
    if (size < 0) {
        setError("Failed to stat " + path);
        io_.close();
        return WriterResult::ERR_OPEN_FAILED;
    }

    uint64_t current = static_cast<uint64_t>(size);
    if (current < committed_bytes) {
        // The checkpoint claims bytes that are not on disk
        setError(path + " is " + std::to_string(current) + " bytes but " +
                 std::to_string(committed_bytes) + " bytes were committed");
        io_.close();
        return WriterResult::ERR_INCONSISTENT;
    }

    if (current > committed_bytes) {
        stats_.uncommitted_tail_bytes = current - committed_bytes;

        if (tail_policy == TailPolicy::TRUNCATE) {
            std::cerr << "[ArchiveWriter] Rolling back " << stats_.uncommitted_tail_bytes
                      << " uncommitted bytes in " << path << std::endl;
            io_result = io_.truncate(committed_bytes);
            if (io_result != IOResult::SUCCESS) {
                setError("Failed to roll back " + path + ": " + io_.getLastError());
                io_.close();
                return WriterResult::ERR_IO_FAILED;
            }
            current = committed_bytes;
        } else {
            std::cerr << "[ArchiveWriter] Warning: " << path << " holds "
                      << stats_.uncommitted_tail_bytes
                      << " bytes written after the last checkpoint; "
                      << "the next batch may repeat those messages" << std::endl;
        }
    }

    file_size_ = current;
    return WriterResult::SUCCESS;
}

WriterResult ArchiveWriter::append(const std::vector<std::string>& records) {
    if (!io_.isOpen()) {
        setError("Writer not open");
        return WriterResult::ERR_NOT_OPEN;
    }

    std::string batch;
    for (const std::string& record : records) {
        batch.append(record);
    }
    if (batch.empty()) {
        setError("Refusing to write an empty frame");
        return WriterResult::ERR_EMPTY_BATCH;
    }

    std::vector<uint8_t> frame;
    CompressionResult comp_result = CompressionHelper::compressWithAlloc(
        compressor_.get(), batch.data(), batch.size(), frame, compression_level_);
    if (comp_result != CompressionResult::SUCCESS) {
        setError("Failed to compress batch: " + compressor_->getLastError());
        return WriterResult::ERR_COMPRESSION_FAILED;
    }

    IOResult io_result = io_.append(frame.data(), frame.size());
    if (io_result != IOResult::SUCCESS) {
        setError("Failed to append frame: " + io_.getLastError());
        return WriterResult::ERR_IO_FAILED;
    }

    // Durable before the caller may checkpoint
    io_result = io_.sync();
    if (io_result != IOResult::SUCCESS) {
        setError("Failed to sync frame: " + io_.getLastError());
        return WriterResult::ERR_IO_FAILED;
    }

    file_size_ += frame.size();
    stats_.batches_written++;
    stats_.records_written += records.size();
    stats_.uncompressed_bytes += batch.size();
    stats_.compressed_bytes += frame.size();
    stats_.sync_operations++;

    return WriterResult::SUCCESS;
}

WriterResult ArchiveWriter::close() {
    if (!io_.isOpen()) {
        return WriterResult::SUCCESS;
    }

    IOResult io_result = io_.sync();
    io_.close();
    if (io_result != IOResult::SUCCESS) {
        setError("Failed to sync on close: " + io_.getLastError());
        return WriterResult::ERR_IO_FAILED;
    }

    return WriterResult::SUCCESS;
}

void ArchiveWriter::setError(const std::string& message) {
    last_error_ = message;
}

}  // namespace chanarc
