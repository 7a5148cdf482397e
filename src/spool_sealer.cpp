#include "chanarc/spool_sealer.h"
#include "chanarc/constants.h"
#include <algorithm>
#include <iostream>

namespace chanarc {

namespace {

/// First read size when looking for a frame boundary; doubled while a frame
/// is larger than the window
constexpr uint64_t kScanWindow = 64 * 1024;

}  // namespace

SpoolSealer::SpoolSealer()
    : compressor_(CompressorFactory::create(CompressionType::COMP_ZSTD)) {
}

SealResult SpoolSealer::openSpool(FileIO& spool,
                                  const std::string& spool_path,
                                  uint64_t spool_bytes) {
    IOResult io_result = spool.open(spool_path, false);
    if (io_result == IOResult::ERR_NOT_FOUND) {
        if (spool_bytes == 0) {
            // Empty channel: nothing was ever spooled
            return SealResult::SUCCESS;
        }
        setError("Spool " + spool_path + " is missing but " + std::to_string(spool_bytes) +
                 " bytes were committed");
        return SealResult::ERR_INCONSISTENT;
    }
    if (io_result != IOResult::SUCCESS) {
        setError("Failed to open spool: " + spool.getLastError());
        return SealResult::ERR_IO_FAILED;
    }

    int64_t size = spool.getFileSize();
    if (size < 0) {
        setError("Failed to stat spool " + spool_path);
        return SealResult::ERR_IO_FAILED;
    }
    if (static_cast<uint64_t>(size) < spool_bytes) {
        setError("Spool " + spool_path + " is " + std::to_string(size) +
                 " bytes but " + std::to_string(spool_bytes) + " bytes were committed");
        return SealResult::ERR_INCONSISTENT;
    }

    return SealResult::SUCCESS;
}

SealResult SpoolSealer::scanFrames(FileIO& spool,
                                   uint64_t spool_bytes,
                                   std::vector<FrameExtent>& frames) {
    frames.clear();

    const uint64_t max_window = compressor_->getMaxCompressedSize(kMaxFrameContentSize);
    std::vector<uint8_t> buffer;
    uint64_t offset = 0;
    uint64_t window = kScanWindow;

    while (offset < spool_bytes) {
        uint64_t remaining = spool_bytes - offset;
        uint64_t want = std::min(window, remaining);
        buffer.resize(want);
        if (spool.read(buffer.data(), want, offset) != IOResult::SUCCESS) {
            setError("Failed to read spool: " + spool.getLastError());
            return SealResult::ERR_IO_FAILED;
        }

        size_t frame_size = 0;
        CompressionResult result = compressor_->findFrameSize(buffer.data(), want, frame_size);
        if (result == CompressionResult::ERR_INCOMPLETE_FRAME &&
            want < remaining && window < max_window) {
            window *= 2;
            continue;
        }
        if (result != CompressionResult::SUCCESS) {
            setError("Bad frame at spool offset " + std::to_string(offset) + ": " +
                     compressor_->getLastError());
            return SealResult::ERR_CORRUPTED_SPOOL;
        }

        FrameExtent extent;
        extent.offset = offset;
        extent.length = frame_size;
        frames.push_back(extent);

        offset += frame_size;
        window = kScanWindow;
    }

    return SealResult::SUCCESS;
}

SealResult SpoolSealer::listFrames(const std::string& spool_path,
                                   uint64_t spool_bytes,
                                   std::vector<FrameExtent>& frames) {
    frames.clear();
    if (!compressor_) {
        setError("zstd compressor unavailable");
        return SealResult::ERR_IO_FAILED;
    }

    FileIO spool;
    SealResult result = openSpool(spool, spool_path, spool_bytes);
    if (result != SealResult::SUCCESS || !spool.isOpen()) {
        return result;
    }
    return scanFrames(spool, spool_bytes, frames);
}

SealResult SpoolSealer::seal(const std::string& spool_path,
                             uint64_t spool_bytes,
                             const std::string& archive_path,
                             SealStats& stats) {
    if (!compressor_) {
        setError("zstd compressor unavailable");
        return SealResult::ERR_IO_FAILED;
    }

    FileIO spool;
    SealResult result = openSpool(spool, spool_path, spool_bytes);
    if (result != SealResult::SUCCESS) {
        return result;
    }

    std::vector<FrameExtent> frames;
    if (spool.isOpen()) {
        result = scanFrames(spool, spool_bytes, frames);
        if (result != SealResult::SUCCESS) {
            return result;
        }
    }

    // A temp file left by an earlier failed seal is stale
    std::string tmp_path = archive_path + kTempSuffix;
    std::string error;
    if (removeFile(tmp_path, error) != IOResult::SUCCESS) {
        setError("Failed to clear " + tmp_path + ": " + error);
        return SealResult::ERR_IO_FAILED;
    }

    FileIO archive;
    if (archive.open(tmp_path, true) != IOResult::SUCCESS) {
        setError("Failed to create " + tmp_path + ": " + archive.getLastError());
        return SealResult::ERR_IO_FAILED;
    }

    std::vector<uint8_t> frame;
    for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
        frame.resize(it->length);
        if (spool.read(frame.data(), it->length, it->offset) != IOResult::SUCCESS) {
            setError("Failed to read spool: " + spool.getLastError());
            archive.close();
            discardTemp(tmp_path);
            return SealResult::ERR_IO_FAILED;
        }
        if (archive.append(frame.data(), frame.size()) != IOResult::SUCCESS) {
            setError("Failed to write archive: " + archive.getLastError());
            archive.close();
            discardTemp(tmp_path);
            return SealResult::ERR_IO_FAILED;
        }
    }

    if (archive.sync() != IOResult::SUCCESS) {
        setError("Failed to sync archive: " + archive.getLastError());
        archive.close();
        discardTemp(tmp_path);
        return SealResult::ERR_IO_FAILED;
    }
    uint64_t archive_bytes = archive.getStats().bytes_written;
    archive.close();

    if (durableRename(tmp_path, archive_path, error) != IOResult::SUCCESS) {
        setError("Failed to install archive: " + error);
        discardTemp(tmp_path);
        return SealResult::ERR_IO_FAILED;
    }

    stats.frames_sealed = frames.size();
    stats.archive_bytes = archive_bytes;

    std::cout << "[SpoolSealer] Sealed " << frames.size() << " frames ("
              << archive_bytes << " bytes) into " << archive_path << std::endl;

    return SealResult::SUCCESS;
}

void SpoolSealer::discardTemp(const std::string& tmp_path) {
    std::string error;
    if (removeFile(tmp_path, error) != IOResult::SUCCESS) {
        std::cerr << "[SpoolSealer] Warning: " << error << std::endl;
    }
}

void SpoolSealer::setError(const std::string& message) {
    last_error_ = message;
}

}  // namespace chanarc
