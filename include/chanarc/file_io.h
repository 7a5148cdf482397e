#ifndef CHANARC_FILE_IO_H_
#define CHANARC_FILE_IO_H_

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace chanarc {

// ============================================================================
// FileIO: append-only file handle with explicit durability and positional reads
// ============================================================================

/// I/O operation result
enum class IOResult {
    SUCCESS = 0,
    ERR_OPENFD_FAILED,
    ERR_NOT_FOUND,
    ERR_IO_FAILED,
    ERR_INVALID_FD,
    ERR_LOCKED
};

/// I/O statistics
struct IOStats {
    uint64_t bytes_written = 0;
    uint64_t bytes_read = 0;
    uint64_t write_operations = 0;
    uint64_t sync_operations = 0;
};

class FileIO {
public:
    FileIO();

    /// Destructor (closes file if open)
    ~FileIO();

    // Disable copy and move
    FileIO(const FileIO&) = delete;
    FileIO& operator=(const FileIO&) = delete;
    FileIO(FileIO&&) = delete;
    FileIO& operator=(FileIO&&) = delete;

    /// Open file for appending (reads are positional and always allowed)
    /// @param path File path
    /// @param create_if_not_exists Create file if it doesn't exist
    /// @return IOResult indicating success or error
    IOResult open(const std::string& path, bool create_if_not_exists = true);

    /// Close file
    void close();

    /// Check if file is open
    bool isOpen() const { return fd_ >= 0; }

    /// Append data at end of file (handles short writes)
    /// @param data Data to write
    /// @param size Size in bytes
    /// @return IOResult indicating success or error
    IOResult append(const void* data, uint64_t size);

    /// Read exactly size bytes at offset (pread, handles short reads)
    /// @param buffer Destination buffer
    /// @param size Bytes to read
    /// @param offset File offset
    /// @return ERR_IO_FAILED if the file ends before size bytes
    IOResult read(void* buffer, uint64_t size, uint64_t offset);

    /// Sync data to disk (fsync)
    /// @return IOResult indicating success or error
    IOResult sync();

    /// Cut the file back to size bytes
    /// @param size New length (must not exceed current length)
    /// @return IOResult indicating success or error
    IOResult truncate(uint64_t size);

    /// Get current file size
    /// @return File size in bytes, or -1 on error
    int64_t getFileSize() const;

    /// Get I/O statistics
    const IOStats& getStats() const { return stats_; }

    /// Get last error message
    const std::string& getLastError() const { return last_error_; }

    /// Get file path
    const std::string& getPath() const { return path_; }

private:
    /// Set last error message
    void setError(const std::string& message);

    int fd_;                    // File descriptor (-1 if closed)
    std::string path_;          // File path
    IOStats stats_;             // I/O statistics
    std::string last_error_;    // Last error message
};

// ============================================================================
// FileLock: RAII exclusive advisory lock (flock) on a lock file
// ============================================================================

class FileLock {
public:
    FileLock();
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /// Create the lock file if needed and take a non-blocking exclusive lock
    /// @return ERR_LOCKED if another process (or descriptor) holds it
    IOResult acquire(const std::string& path);

    /// Release the lock and close the descriptor
    void release();

    bool isHeld() const { return fd_ >= 0; }

    const std::string& getLastError() const { return last_error_; }

private:
    int fd_;
    std::string last_error_;
};

// ============================================================================
// Whole-file helpers
// ============================================================================

/// Read an entire file into memory
/// @return ERR_NOT_FOUND if the file does not exist
IOResult readWholeFile(const std::string& path,
                       std::vector<uint8_t>& data,
                       std::string& error);

/// Replace path atomically: write <path>.tmp, fsync, rename, fsync directory
IOResult atomicReplaceFile(const std::string& path,
                           const void* data,
                           size_t size,
                           std::string& error);

/// Rename and make the rename durable (fsync parent directory)
IOResult durableRename(const std::string& from,
                       const std::string& to,
                       std::string& error);

/// Remove a file; a missing file is not an error
IOResult removeFile(const std::string& path, std::string& error);

/// Check whether a path exists
bool fileExists(const std::string& path);

/// Size of a file in bytes, -1 if it cannot be stat'ed
int64_t fileSize(const std::string& path);

}  // namespace chanarc

#endif  // CHANARC_FILE_IO_H_
