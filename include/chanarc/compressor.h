#ifndef CHANARC_COMPRESSOR_H_
#define CHANARC_COMPRESSOR_H_

#include "chanarc/struct_defs.h"
#include <cstdint>
#include <cstddef>
#include <string>
#include <memory>
#include <vector>

namespace chanarc {

// ============================================================================
// Compression Result
// ============================================================================

enum class CompressionResult {
    SUCCESS = 0,
    ERR_INVALID_INPUT = 1,
    ERR_BUFFER_TOO_SMALL = 2,
    ERR_COMPRESSION_FAILED = 3,
    ERR_DECOMPRESSION_FAILED = 4,
    ERR_UNSUPPORTED_TYPE = 5,
    ERR_INCOMPLETE_FRAME = 6
};

// ============================================================================
// Compressor Interface
// ============================================================================

/// Abstract interface for frame-oriented compression algorithms.
/// Every compress() call emits exactly one self-contained frame, so a file
/// made of concatenated frames can be appended to without rewriting.
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /// Get compression type
    virtual CompressionType getType() const = 0;

    /// Get maximum compressed size for input data
    /// @param input_size Size of uncompressed data
    /// @return Maximum possible compressed size
    virtual size_t getMaxCompressedSize(size_t input_size) const = 0;

    /// Compress data into one frame
    /// @param input Input data buffer
    /// @param input_size Size of input data
    /// @param output Output buffer (must be at least getMaxCompressedSize bytes)
    /// @param output_size Size of output buffer
    /// @param compressed_size Output: actual compressed size
    /// @param compression_level Compression level (algorithm-specific)
    /// @return CompressionResult
    virtual CompressionResult compress(const void* input,
                                       size_t input_size,
                                       void* output,
                                       size_t output_size,
                                       size_t& compressed_size,
                                       int compression_level = 3) = 0;

    /// Locate the first frame in a buffer of concatenated frames
    /// @param input Buffer starting at a frame boundary
    /// @param input_size Bytes available
    /// @param frame_size Output: compressed size of the first frame
    /// @return ERR_INCOMPLETE_FRAME if the buffer ends inside the frame,
    ///         ERR_DECOMPRESSION_FAILED if it does not start with a frame
    virtual CompressionResult findFrameSize(const void* input,
                                            size_t input_size,
                                            size_t& frame_size) = 0;

    /// Get decompressed size recorded in a frame header
    /// @param input Buffer starting at a frame boundary
    /// @param input_size Size of the frame
    /// @param content_size Output: decompressed size
    /// @return CompressionResult
    virtual CompressionResult getFrameContentSize(const void* input,
                                                  size_t input_size,
                                                  uint64_t& content_size) = 0;

    /// Decompress a single frame
    /// @param input Compressed frame
    /// @param input_size Size of the frame
    /// @param output Output buffer for decompressed data
    /// @param output_size Size of output buffer
    /// @param decompressed_size Output: actual decompressed size
    /// @return CompressionResult
    virtual CompressionResult decompress(const void* input,
                                         size_t input_size,
                                         void* output,
                                         size_t output_size,
                                         size_t& decompressed_size) = 0;

    /// Get last error message
    virtual std::string getLastError() const = 0;
};

// ============================================================================
// Compressor Factory
// ============================================================================

/// Factory for creating compressor instances
class CompressorFactory {
public:
    /// Create compressor instance
    /// @param type Compression type
    /// @return Compressor instance, or nullptr if unsupported
    static std::unique_ptr<ICompressor> create(CompressionType type);
};

// ============================================================================
// Compression Helper - RAII buffer management
// ============================================================================

class CompressionHelper {
public:
    /// Compress data into one frame with automatic buffer allocation
    /// @param compressor Compressor instance
    /// @param input Input data
    /// @param input_size Size of input
    /// @param compressed_data Output: compressed frame
    /// @param compression_level Compression level
    /// @return CompressionResult
    static CompressionResult compressWithAlloc(ICompressor* compressor,
                                               const void* input,
                                               size_t input_size,
                                               std::vector<uint8_t>& compressed_data,
                                               int compression_level = 3);

    /// Decompress one frame, sizing the output from the frame header
    /// @param compressor Compressor instance
    /// @param input Compressed frame
    /// @param input_size Size of the frame
    /// @param decompressed_data Output: decompressed data
    /// @return CompressionResult
    static CompressionResult decompressFrameWithAlloc(ICompressor* compressor,
                                                      const void* input,
                                                      size_t input_size,
                                                      std::vector<uint8_t>& decompressed_data);
};

}  // namespace chanarc

#endif  // CHANARC_COMPRESSOR_H_
