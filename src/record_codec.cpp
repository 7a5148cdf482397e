#include "chanarc/record_codec.h"
#include "chanarc/constants.h"
#include <utility>

namespace chanarc {

size_t RecordCodec::sanitizeContent(std::string& content) {
    size_t replaced = 0;
    for (char& c : content) {
        if (c == kRecordFieldSeparator || c == kRecordTerminator) {
            c = kContentPlaceholder;
            replaced++;
        }
    }
    return replaced;
}

bool RecordCodec::isValidUsername(const std::string& username) {
    return username.find(kRecordFieldSeparator) == std::string::npos &&
           username.find(kRecordTerminator) == std::string::npos;
}

CodecResult RecordCodec::encode(const std::string& username,
                                const std::string& content,
                                std::string& out) {
    if (!isValidUsername(username)) {
        return CodecResult::ERR_MALFORMED_RECORD;
    }

    std::string sanitized = content;
    sanitizeContent(sanitized);

    out.reserve(out.size() + username.size() + sanitized.size() + 3);
    out.push_back(kRecordFieldSeparator);
    out.append(username);
    out.push_back(kRecordFieldSeparator);
    out.append(sanitized);
    out.push_back(kRecordTerminator);

    return CodecResult::SUCCESS;
}

CodecResult RecordCodec::decode(const char* data,
                                size_t size,
                                Record& record,
                                size_t& consumed) {
    if (size == 0) {
        return CodecResult::ERR_INCOMPLETE;
    }

    if (data[0] != kRecordFieldSeparator) {
        return CodecResult::ERR_MALFORMED_RECORD;
    }

    // Username runs to the second separator
    size_t pos = 1;
    size_t name_begin = pos;
    while (pos < size && data[pos] != kRecordFieldSeparator) {
        if (data[pos] == kRecordTerminator) {
            return CodecResult::ERR_MALFORMED_RECORD;
        }
        pos++;
    }
    if (pos >= size) {
        return CodecResult::ERR_INCOMPLETE;
    }
    size_t name_end = pos;

    // Content runs to the terminator
    pos++;
    size_t content_begin = pos;
    while (pos < size && data[pos] != kRecordTerminator) {
        if (data[pos] == kRecordFieldSeparator) {
            return CodecResult::ERR_MALFORMED_RECORD;
        }
        pos++;
    }
    if (pos >= size) {
        return CodecResult::ERR_INCOMPLETE;
    }

    record.username.assign(data + name_begin, name_end - name_begin);
    record.content.assign(data + content_begin, pos - content_begin);
    consumed = pos + 1;

    return CodecResult::SUCCESS;
}

CodecResult RecordCodec::decodeAll(const char* data,
                                   size_t size,
                                   std::vector<Record>& records,
                                   size_t& error_offset) {
    size_t offset = 0;
    while (offset < size) {
        Record record;
        size_t consumed = 0;
        CodecResult result = decode(data + offset, size - offset, record, consumed);
        if (result != CodecResult::SUCCESS) {
            error_offset = offset;
            return result;
        }
        records.push_back(std::move(record));
        offset += consumed;
    }
    return CodecResult::SUCCESS;
}

}  // namespace chanarc
