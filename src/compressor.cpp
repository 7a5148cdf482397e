#include "chanarc/compressor.h"
#include <cstring>

namespace chanarc {

// Forward declarations for compressor implementations
std::unique_ptr<ICompressor> createZstdCompressor();

// ============================================================================
// CompressorFactory Implementation
// ============================================================================

std::unique_ptr<ICompressor> CompressorFactory::create(CompressionType type) {
    switch (type) {
        case CompressionType::COMP_ZSTD:
            return createZstdCompressor();

        default:
            return nullptr;
    }
}

// ============================================================================
// CompressionHelper Implementation
// ============================================================================

CompressionResult CompressionHelper::compressWithAlloc(
    ICompressor* compressor,
    const void* input,
    size_t input_size,
    std::vector<uint8_t>& compressed_data,
    int compression_level)
{
    if (!compressor || !input || input_size == 0) {
        return CompressionResult::ERR_INVALID_INPUT;
    }

    size_t max_compressed_size = compressor->getMaxCompressedSize(input_size);
    compressed_data.resize(max_compressed_size);

    size_t actual_compressed_size = 0;
    CompressionResult result = compressor->compress(
        input,
        input_size,
        compressed_data.data(),
        compressed_data.size(),
        actual_compressed_size,
        compression_level
    );

    if (result == CompressionResult::SUCCESS) {
        compressed_data.resize(actual_compressed_size);
    } else {
        compressed_data.clear();
    }

    return result;
}

CompressionResult CompressionHelper::decompressFrameWithAlloc(
    ICompressor* compressor,
    const void* input,
    size_t input_size,
    std::vector<uint8_t>& decompressed_data)
{
    if (!compressor || !input || input_size == 0) {
        return CompressionResult::ERR_INVALID_INPUT;
    }

    uint64_t expected_size = 0;
    CompressionResult result = compressor->getFrameContentSize(input, input_size, expected_size);
    if (result != CompressionResult::SUCCESS) {
        decompressed_data.clear();
        return result;
    }

    if (expected_size == 0) {
        decompressed_data.clear();
        return CompressionResult::SUCCESS;
    }

    decompressed_data.resize(expected_size);

    size_t actual_decompressed_size = 0;
    result = compressor->decompress(
        input,
        input_size,
        decompressed_data.data(),
        decompressed_data.size(),
        actual_decompressed_size
    );

    if (result == CompressionResult::SUCCESS) {
        // Frame header and payload must agree
        if (actual_decompressed_size != expected_size) {
            decompressed_data.clear();
            return CompressionResult::ERR_DECOMPRESSION_FAILED;
        }
    } else {
        decompressed_data.clear();
    }

    return result;
}

}  // namespace chanarc
