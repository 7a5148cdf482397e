#include "chanarc/file_io.h"
#include "chanarc/constants.h"
#include "chanarc/platform_compat.h"
#include <cerrno>
#include <cstring>

namespace chanarc {

namespace {

std::string errnoString() {
    return std::string(strerror(errno));
}

std::string parentDirectory(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

/// Write the full buffer, retrying on EINTR and short writes
bool writeFully(int fd, const void* data, uint64_t size) {
    const char* ptr = static_cast<const char*>(data);
    uint64_t remaining = size;
    while (remaining > 0) {
        ssize_t written = ::write(fd, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        ptr += written;
        remaining -= static_cast<uint64_t>(written);
    }
    return true;
}

IOResult syncDirectory(const std::string& dir, std::string& error) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) {
        error = "Failed to open directory " + dir + ": " + errnoString();
        return IOResult::ERR_OPENFD_FAILED;
    }
    int rc = ::fsync(dfd);
    int saved_errno = errno;
    ::close(dfd);
    if (rc != 0) {
        errno = saved_errno;
        error = "fsync on directory " + dir + " failed: " + errnoString();
        return IOResult::ERR_IO_FAILED;
    }
    return IOResult::SUCCESS;
}

}  // namespace

// ============================================================================
// FileIO Implementation
// ============================================================================

FileIO::FileIO()
    : fd_(-1) {
}

FileIO::~FileIO() {
    close();
}

IOResult FileIO::open(const std::string& path, bool create_if_not_exists) {
    if (fd_ >= 0) {
        close();
    }

    path_ = path;

    int flags = O_RDWR | O_APPEND | O_CLOEXEC;
    if (create_if_not_exists) {
        flags |= O_CREAT;
    }

    fd_ = ::open(path.c_str(), flags, 0644);
    if (fd_ < 0) {
        if (errno == ENOENT && !create_if_not_exists) {
            setError("File not found: " + path);
            return IOResult::ERR_NOT_FOUND;
        }
        setError("Failed to open file " + path + ": " + errnoString());
        return IOResult::ERR_OPENFD_FAILED;
    }

    return IOResult::SUCCESS;
}

void FileIO::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

IOResult FileIO::append(const void* data, uint64_t size) {
    if (fd_ < 0) {
        setError("File not open");
        return IOResult::ERR_INVALID_FD;
    }

    if (size == 0) {
        return IOResult::SUCCESS;
    }

    if (!writeFully(fd_, data, size)) {
        setError("write failed: " + errnoString());
        return IOResult::ERR_IO_FAILED;
    }

    stats_.bytes_written += size;
    stats_.write_operations++;

    return IOResult::SUCCESS;
}

IOResult FileIO::read(void* buffer, uint64_t size, uint64_t offset) {
    if (fd_ < 0) {
        setError("File not open");
        return IOResult::ERR_INVALID_FD;
    }

    char* ptr = static_cast<char*>(buffer);
    uint64_t done = 0;
    while (done < size) {
        ssize_t bytes_read = ::pread(fd_, ptr + done, size - done,
                                     static_cast<off_t>(offset + done));
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;
            }
            setError("pread failed: " + errnoString());
            return IOResult::ERR_IO_FAILED;
        }
        if (bytes_read == 0) {
            setError("Partial read: expected " + std::to_string(size) +
                     " bytes at offset " + std::to_string(offset) + ", read " +
                     std::to_string(done) + " bytes");
            return IOResult::ERR_IO_FAILED;
        }
        done += static_cast<uint64_t>(bytes_read);
    }

    stats_.bytes_read += size;
    return IOResult::SUCCESS;
}

IOResult FileIO::sync() {
    if (fd_ < 0) {
        setError("File not open");
        return IOResult::ERR_INVALID_FD;
    }

    if (::fsync(fd_) != 0) {
        setError("fsync failed: " + errnoString());
        return IOResult::ERR_IO_FAILED;
    }

    stats_.sync_operations++;
    return IOResult::SUCCESS;
}

IOResult FileIO::truncate(uint64_t size) {
    if (fd_ < 0) {
        setError("File not open");
        return IOResult::ERR_INVALID_FD;
    }

    int64_t current = getFileSize();
    if (current < 0) {
        return IOResult::ERR_IO_FAILED;
    }
    if (static_cast<uint64_t>(current) < size) {
        setError("Cannot truncate " + path_ + " to " + std::to_string(size) +
                 " bytes: file is only " + std::to_string(current) + " bytes");
        return IOResult::ERR_IO_FAILED;
    }

    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        setError("ftruncate failed: " + errnoString());
        return IOResult::ERR_IO_FAILED;
    }

    return sync();
}

int64_t FileIO::getFileSize() const {
    if (fd_ < 0) {
        return -1;
    }

    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        return -1;
    }

    return static_cast<int64_t>(st.st_size);
}

void FileIO::setError(const std::string& message) {
    last_error_ = message;
}

// ============================================================================
// FileLock Implementation
// ============================================================================

FileLock::FileLock()
    : fd_(-1) {
}

FileLock::~FileLock() {
    release();
}

IOResult FileLock::acquire(const std::string& path) {
    release();

    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        last_error_ = "Failed to open lock file " + path + ": " + errnoString();
        return IOResult::ERR_OPENFD_FAILED;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            last_error_ = "Archive is locked by another process: " + path;
            ::close(fd);
            return IOResult::ERR_LOCKED;
        }
        last_error_ = "flock failed on " + path + ": " + errnoString();
        ::close(fd);
        return IOResult::ERR_IO_FAILED;
    }

    fd_ = fd;
    return IOResult::SUCCESS;
}

void FileLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================================
// Whole-file helpers
// ============================================================================

IOResult readWholeFile(const std::string& path,
                       std::vector<uint8_t>& data,
                       std::string& error) {
    data.clear();

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            error = "File not found: " + path;
            return IOResult::ERR_NOT_FOUND;
        }
        error = "Failed to open " + path + ": " + errnoString();
        return IOResult::ERR_OPENFD_FAILED;
    }

    char buf[65536];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "read failed on " + path + ": " + errnoString();
            ::close(fd);
            return IOResult::ERR_IO_FAILED;
        }
        if (n == 0) {
            break;
        }
        data.insert(data.end(), buf, buf + n);
    }

    ::close(fd);
    return IOResult::SUCCESS;
}

IOResult atomicReplaceFile(const std::string& path,
                           const void* data,
                           size_t size,
                           std::string& error) {
    std::string tmp_path = path + kTempSuffix;

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "Failed to create " + tmp_path + ": " + errnoString();
        return IOResult::ERR_OPENFD_FAILED;
    }

    if (!writeFully(fd, data, size)) {
        error = "write failed on " + tmp_path + ": " + errnoString();
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return IOResult::ERR_IO_FAILED;
    }

    if (::fsync(fd) != 0) {
        error = "fsync failed on " + tmp_path + ": " + errnoString();
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return IOResult::ERR_IO_FAILED;
    }
    ::close(fd);

    return durableRename(tmp_path, path, error);
}

IOResult durableRename(const std::string& from,
                       const std::string& to,
                       std::string& error) {
    if (::rename(from.c_str(), to.c_str()) != 0) {
        error = "rename " + from + " -> " + to + " failed: " + errnoString();
        return IOResult::ERR_IO_FAILED;
    }
    return syncDirectory(parentDirectory(to), error);
}

IOResult removeFile(const std::string& path, std::string& error) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        error = "unlink " + path + " failed: " + errnoString();
        return IOResult::ERR_IO_FAILED;
    }
    return IOResult::SUCCESS;
}

bool fileExists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

int64_t fileSize(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return -1;
    }
    return static_cast<int64_t>(st.st_size);
}

}  // namespace chanarc
