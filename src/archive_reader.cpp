#include "chanarc/archive_reader.h"
#include "chanarc/constants.h"
#include "chanarc/file_io.h"
#include <cstring>
#include <iostream>

namespace chanarc {

ArchiveReader::ArchiveReader()
    : compressor_(CompressorFactory::create(CompressionType::COMP_ZSTD)) {
}

size_t ArchiveReader::findNextFrame(const uint8_t* data, size_t size, size_t from) {
    const uint8_t magic[4] = {
        static_cast<uint8_t>(kZstdFrameMagic & 0xFF),
        static_cast<uint8_t>((kZstdFrameMagic >> 8) & 0xFF),
        static_cast<uint8_t>((kZstdFrameMagic >> 16) & 0xFF),
        static_cast<uint8_t>((kZstdFrameMagic >> 24) & 0xFF)
    };

    for (size_t pos = from; pos + 4 <= size; pos++) {
        if (std::memcmp(data + pos, magic, 4) == 0) {
            return pos;
        }
    }
    return size;
}

ReadResult ArchiveReader::readAll(const std::string& path,
                                  std::vector<Record>& records,
                                  ReaderStats& stats) {
    std::vector<uint8_t> data;
    std::string error;
    IOResult io_result = readWholeFile(path, data, error);
    if (io_result == IOResult::ERR_NOT_FOUND) {
        setError(error);
        return ReadResult::ERR_NOT_FOUND;
    }
    if (io_result != IOResult::SUCCESS) {
        setError(error);
        return ReadResult::ERR_IO_FAILED;
    }

    return readBuffer(data.data(), data.size(), records, stats);
}

ReadResult ArchiveReader::readBuffer(const uint8_t* data,
                                     size_t size,
                                     std::vector<Record>& records,
                                     ReaderStats& stats) {
    if (!compressor_) {
        setError("zstd compressor unavailable");
        return ReadResult::ERR_IO_FAILED;
    }

    size_t offset = 0;
    while (offset < size) {
        size_t frame_size = 0;
        std::vector<uint8_t> plain;

        CompressionResult result = compressor_->findFrameSize(data + offset, size - offset,
                                                              frame_size);
        if (result == CompressionResult::SUCCESS) {
            result = CompressionHelper::decompressFrameWithAlloc(compressor_.get(),
                                                                 data + offset,
                                                                 frame_size,
                                                                 plain);
        }

        if (result != CompressionResult::SUCCESS) {
            // Torn write or garbage: resynchronise on the next frame header
            size_t next = findNextFrame(data, size, offset + 1);
            std::cerr << "[ArchiveReader] Skipping " << (next - offset)
                      << " unreadable bytes at offset " << offset << ": "
                      << compressor_->getLastError() << std::endl;
            stats.skipped_bytes += next - offset;
            stats.corrupt_regions++;
            offset = next;
            continue;
        }

        size_t error_offset = 0;
        size_t before = records.size();
        CodecResult codec_result = RecordCodec::decodeAll(
            reinterpret_cast<const char*>(plain.data()), plain.size(), records, error_offset);
        if (codec_result != CodecResult::SUCCESS) {
            setError("Malformed record in frame at offset " + std::to_string(offset) +
                     " (record offset " + std::to_string(error_offset) + ")");
            return ReadResult::ERR_MALFORMED_RECORD;
        }

        stats.frames_read++;
        stats.records_read += records.size() - before;
        stats.uncompressed_bytes += plain.size();
        offset += frame_size;
    }

    return ReadResult::SUCCESS;
}

void ArchiveReader::setError(const std::string& message) {
    last_error_ = message;
}

}  // namespace chanarc
