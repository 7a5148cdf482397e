#ifndef CHANARC_RECORD_CODEC_H_
#define CHANARC_RECORD_CODEC_H_

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace chanarc {

// ============================================================================
// Record Codec
//
// Record layout:  0x00 <username utf-8> 0x00 <content utf-8> 0x0A
//
// Neither field may contain 0x00 or 0x0A. NUL / NEWLINE bytes in content are
// replaced by kContentPlaceholder before encoding (lossy). A username holding
// either byte is rejected.
// ============================================================================

enum class CodecResult {
    SUCCESS = 0,
    ERR_MALFORMED_RECORD,   // framing byte missing or in the wrong place
    ERR_INCOMPLETE          // buffer ends inside a record
};

/// One decoded record
struct Record {
    std::string username;
    std::string content;
};

class RecordCodec {
public:
    /// Replace every NUL / NEWLINE byte with the placeholder
    /// @return Number of bytes replaced
    static size_t sanitizeContent(std::string& content);

    /// Check that a username can be framed without ambiguity
    static bool isValidUsername(const std::string& username);

    /// Append one encoded record to out
    /// @param username Author name (must satisfy isValidUsername)
    /// @param content Message text (sanitized on the way in)
    /// @param out Output buffer; untouched on failure
    /// @return ERR_MALFORMED_RECORD if username is not framable
    static CodecResult encode(const std::string& username,
                              const std::string& content,
                              std::string& out);

    /// Decode the record at the head of a buffer
    /// @param data Buffer starting at a record boundary
    /// @param size Bytes available
    /// @param record Output: decoded fields
    /// @param consumed Output: bytes occupied by the record
    /// @return CodecResult
    static CodecResult decode(const char* data,
                              size_t size,
                              Record& record,
                              size_t& consumed);

    /// Decode a whole stream of records
    /// @param data Decompressed archive content
    /// @param size Size in bytes
    /// @param records Output: decoded records (appended)
    /// @param error_offset Output: offset of the first bad record on failure
    /// @return CodecResult
    static CodecResult decodeAll(const char* data,
                                 size_t size,
                                 std::vector<Record>& records,
                                 size_t& error_offset);
};

}  // namespace chanarc

#endif  // CHANARC_RECORD_CODEC_H_
