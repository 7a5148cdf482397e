#ifndef CHANARC_SPOOL_SEALER_H_
#define CHANARC_SPOOL_SEALER_H_

#include "compressor.h"
#include "file_io.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chanarc {

// ============================================================================
// Spool Sealer - turns the backfill spool into the chronological archive
//
// The spool holds one frame per backfill page in fetch order (newest page
// first). Each frame is already ascending internally, so writing the frames
// in reverse yields the whole history in ascending id order. Frames are
// copied as-is, one frame at a time; nothing is recompressed.
// ============================================================================

/// Seal result
enum class SealResult {
    SUCCESS = 0,
    ERR_IO_FAILED,
    ERR_CORRUPTED_SPOOL,
    ERR_INCONSISTENT      // spool shorter than the committed length
};

/// Location of one frame inside the spool
struct FrameExtent {
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct SealStats {
    uint64_t frames_sealed = 0;
    uint64_t archive_bytes = 0;
};

class SpoolSealer {
public:
    SpoolSealer();

    // Disable copy and move
    SpoolSealer(const SpoolSealer&) = delete;
    SpoolSealer& operator=(const SpoolSealer&) = delete;

    /// Locate every frame in the committed part of the spool
    /// @param spool_path Backfill spool
    /// @param spool_bytes Committed spool length from the checkpoint
    /// @param frames Output: extents in spool order
    /// @return SealResult
    SealResult listFrames(const std::string& spool_path,
                          uint64_t spool_bytes,
                          std::vector<FrameExtent>& frames);

    /// Build the archive from the committed part of the spool
    /// @param spool_path Backfill spool
    /// @param spool_bytes Committed spool length from the checkpoint
    /// @param archive_path Destination, replaced atomically
    /// @param stats Output: frames and bytes written
    /// @return SealResult
    SealResult seal(const std::string& spool_path,
                    uint64_t spool_bytes,
                    const std::string& archive_path,
                    SealStats& stats);

    /// Get last error message
    const std::string& getLastError() const { return last_error_; }

private:
    SealResult openSpool(FileIO& spool, const std::string& spool_path, uint64_t spool_bytes);
    SealResult scanFrames(FileIO& spool, uint64_t spool_bytes, std::vector<FrameExtent>& frames);
    void discardTemp(const std::string& tmp_path);
    void setError(const std::string& message);

    std::unique_ptr<ICompressor> compressor_;
    std::string last_error_;
};

}  // namespace chanarc

#endif  // CHANARC_SPOOL_SEALER_H_
