#include "chanarc/compressor.h"
#include "chanarc/constants.h"
#include <zstd.h>
#include <zstd_errors.h>
#include <cstring>

namespace chanarc {

// ============================================================================
// ZstdCompressor Implementation
// ============================================================================

class ZstdCompressor : public ICompressor {
public:
    ZstdCompressor() = default;
    ~ZstdCompressor() override = default;

    CompressionType getType() const override {
        return CompressionType::COMP_ZSTD;
    }

    size_t getMaxCompressedSize(size_t input_size) const override {
        return ZSTD_compressBound(input_size);
    }

    CompressionResult compress(const void* input,
                               size_t input_size,
                               void* output,
                               size_t output_size,
                               size_t& compressed_size,
                               int compression_level) override
    {
        if (!input || input_size == 0 || !output || output_size == 0) {
            last_error_ = "Invalid input parameters";
            return CompressionResult::ERR_INVALID_INPUT;
        }

        // Validate compression level (zstd: 1-22, negative for fast mode)
        if (compression_level < ZSTD_minCLevel() || compression_level > ZSTD_maxCLevel()) {
            compression_level = ZSTD_CLEVEL_DEFAULT;
        }

        // ZSTD_compress writes the content size into the frame header
        size_t result = ZSTD_compress(
            output,
            output_size,
            input,
            input_size,
            compression_level
        );

        if (ZSTD_isError(result)) {
            last_error_ = std::string("Zstd compression failed: ") + ZSTD_getErrorName(result);
            return CompressionResult::ERR_COMPRESSION_FAILED;
        }

        compressed_size = result;
        last_error_.clear();
        return CompressionResult::SUCCESS;
    }

    CompressionResult findFrameSize(const void* input,
                                    size_t input_size,
                                    size_t& frame_size) override
    {
        if (!input || input_size == 0) {
            last_error_ = "Invalid input parameters";
            return CompressionResult::ERR_INVALID_INPUT;
        }

        size_t result = ZSTD_findFrameCompressedSize(input, input_size);
        if (ZSTD_isError(result)) {
            last_error_ = std::string("Zstd frame scan failed: ") + ZSTD_getErrorName(result);
            // srcSize_wrong: the frame header is valid but the data stops early
            if (ZSTD_getErrorCode(result) == ZSTD_error_srcSize_wrong) {
                return CompressionResult::ERR_INCOMPLETE_FRAME;
            }
            return CompressionResult::ERR_DECOMPRESSION_FAILED;
        }

        frame_size = result;
        last_error_.clear();
        return CompressionResult::SUCCESS;
    }

    CompressionResult getFrameContentSize(const void* input,
                                          size_t input_size,
                                          uint64_t& content_size) override
    {
        if (!input || input_size == 0) {
            last_error_ = "Invalid input parameters";
            return CompressionResult::ERR_INVALID_INPUT;
        }

        unsigned long long size = ZSTD_getFrameContentSize(input, input_size);
        if (size == ZSTD_CONTENTSIZE_ERROR) {
            last_error_ = "Invalid zstd frame";
            return CompressionResult::ERR_DECOMPRESSION_FAILED;
        }
        if (size == ZSTD_CONTENTSIZE_UNKNOWN) {
            last_error_ = "Zstd frame does not record its content size";
            return CompressionResult::ERR_DECOMPRESSION_FAILED;
        }
        if (size > kMaxFrameContentSize) {
            last_error_ = "Zstd frame claims " + std::to_string(size) +
                          " content bytes, above the " +
                          std::to_string(kMaxFrameContentSize) + " byte frame limit";
            return CompressionResult::ERR_DECOMPRESSION_FAILED;
        }

        content_size = static_cast<uint64_t>(size);
        return CompressionResult::SUCCESS;
    }

    CompressionResult decompress(const void* input,
                                 size_t input_size,
                                 void* output,
                                 size_t output_size,
                                 size_t& decompressed_size) override
    {
        if (!input || input_size == 0 || !output || output_size == 0) {
            last_error_ = "Invalid input parameters";
            return CompressionResult::ERR_INVALID_INPUT;
        }

        unsigned long long content_size = ZSTD_getFrameContentSize(input, input_size);

        if (content_size == ZSTD_CONTENTSIZE_ERROR) {
            last_error_ = "Invalid zstd frame";
            return CompressionResult::ERR_DECOMPRESSION_FAILED;
        }

        if (content_size != ZSTD_CONTENTSIZE_UNKNOWN && content_size > output_size) {
            last_error_ = "Output buffer too small";
            return CompressionResult::ERR_BUFFER_TOO_SMALL;
        }

        size_t result = ZSTD_decompress(
            output,
            output_size,
            input,
            input_size
        );

        if (ZSTD_isError(result)) {
            last_error_ = std::string("Zstd decompression failed: ") + ZSTD_getErrorName(result);
            return CompressionResult::ERR_DECOMPRESSION_FAILED;
        }

        decompressed_size = result;
        last_error_.clear();
        return CompressionResult::SUCCESS;
    }

    std::string getLastError() const override {
        return last_error_;
    }

private:
    std::string last_error_;
};

// ============================================================================
// Factory function
// ============================================================================

std::unique_ptr<ICompressor> createZstdCompressor() {
    return std::make_unique<ZstdCompressor>();
}

}  // namespace chanarc
