#include "chanarc/message_fetcher.h"
#include "chanarc/constants.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>

namespace chanarc {

using json = nlohmann::json;

const char* fetchStatusName(FetchStatus status) {
    switch (status) {
        case FetchStatus::SUCCESS:      return "SUCCESS";
        case FetchStatus::RATE_LIMITED: return "RATE_LIMITED";
        case FetchStatus::TRANSIENT:    return "TRANSIENT";
        case FetchStatus::FATAL:        return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace {

std::chrono::milliseconds secondsToMillis(double seconds) {
    if (!(seconds > 0.0) || !std::isfinite(seconds)) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(seconds * 1000.0)));
}

/// Short excerpt of a payload for log lines
std::string excerpt(const std::string& text) {
    constexpr size_t kMaxExcerpt = 160;
    if (text.size() <= kMaxExcerpt) {
        return text;
    }
    return text.substr(0, kMaxExcerpt) + "...";
}

}  // namespace

MessageFetcher::MessageFetcher(ITransport* transport,
                               const std::string& channel_id,
                               const std::string& api_prefix)
    : transport_(transport), channel_id_(channel_id), api_prefix_(api_prefix) {
}

std::string MessageFetcher::buildTarget(Direction direction,
                                        std::optional<MessageId> cursor,
                                        uint32_t limit) const {
    uint32_t clamped = std::min(std::max(limit, 1u), kMaxBatchSize);

    std::string target = api_prefix_ + "/channels/" + channel_id_ +
                         "/messages?limit=" + std::to_string(clamped);
    if (cursor) {
        target += (direction == Direction::BEFORE) ? "&before=" : "&after=";
        target += std::to_string(*cursor);
    }
    return target;
}

bool MessageFetcher::parseMessageId(const std::string& text, MessageId& id) {
    if (text.empty() || text.size() > 20) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size() || value == 0) {
        return false;
    }
    id = static_cast<MessageId>(value);
    return true;
}

bool MessageFetcher::parsePage(const std::string& body, Page& page, std::string& error) {
    page = Page();

    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        error = "Expected a JSON array of messages, got: " + excerpt(body);
        return false;
    }

    bool seen_any = false;
    for (const json& item : doc) {
        // Resolve the id first so even a malformed message moves the cursor
        MessageId id = 0;
        bool has_id = false;
        if (item.is_object() && item.contains("id")) {
            const json& id_field = item["id"];
            if (id_field.is_string()) {
                has_id = parseMessageId(id_field.get<std::string>(), id);
            } else if (id_field.is_number_unsigned()) {
                id = id_field.get<MessageId>();
                has_id = id != 0;
            }
        }

        if (has_id) {
            if (!seen_any) {
                page.min_seen_id = id;
                page.max_seen_id = id;
                seen_any = true;
            } else {
                page.min_seen_id = std::min(page.min_seen_id, id);
                page.max_seen_id = std::max(page.max_seen_id, id);
            }
        }

        bool valid = has_id &&
                     item.contains("author") && item["author"].is_object() &&
                     item["author"].contains("username") &&
                     item["author"]["username"].is_string() &&
                     item.contains("content") && item["content"].is_string();
        if (!valid) {
            std::cerr << "[MessageFetcher] Skipping malformed message: "
                      << excerpt(item.dump(-1, ' ', false, json::error_handler_t::replace))
                      << std::endl;
            page.malformed_count++;
            continue;
        }

        Message message;
        message.id = id;
        message.author = item["author"]["username"].get<std::string>();
        message.content = item["content"].get<std::string>();
        if (item.contains("timestamp") && item["timestamp"].is_string()) {
            message.created_at = item["timestamp"].get<std::string>();
        }
        page.messages.push_back(std::move(message));
    }

    // Normalize to newest-first whatever order the platform used
    std::sort(page.messages.begin(), page.messages.end(),
              [](const Message& a, const Message& b) { return a.id > b.id; });

    return true;
}

std::chrono::milliseconds MessageFetcher::parseRetryAfter(const HttpResponse& response) {
    json doc = json::parse(response.body, nullptr, false);
    if (!doc.is_discarded() && doc.is_object() && doc.contains("retry_after") &&
        doc["retry_after"].is_number()) {
        auto delay = secondsToMillis(doc["retry_after"].get<double>());
        if (delay.count() > 0) {
            return delay;
        }
    }

    if (!response.retry_after.empty()) {
        char* end = nullptr;
        double seconds = std::strtod(response.retry_after.c_str(), &end);
        if (end != response.retry_after.c_str()) {
            return secondsToMillis(seconds);
        }
    }

    return std::chrono::milliseconds(0);
}

FetchStatus MessageFetcher::fetch(Direction direction,
                                  std::optional<MessageId> cursor,
                                  uint32_t limit,
                                  FetchResult& result) {
    result = FetchResult();

    if (direction == Direction::AFTER && !cursor) {
        result.cause = "AFTER requires a cursor";
        return FetchStatus::FATAL;
    }

    std::string target = buildTarget(direction, cursor, limit);

    HttpResponse response;
    TransportResult transport_result = transport_->get(target, response);
    if (transport_result != TransportResult::SUCCESS) {
        result.cause = "Transport error on " + target + ": " + transport_->getLastError();
        return FetchStatus::TRANSIENT;
    }

    int status = response.status_code;

    if (status >= 200 && status < 300) {
        std::string error;
        if (!parsePage(response.body, result.page, error)) {
            // A garbled 2xx body is usually a proxy or truncation problem
            result.cause = error;
            return FetchStatus::TRANSIENT;
        }
        return FetchStatus::SUCCESS;
    }

    if (status == 429) {
        result.retry_after = parseRetryAfter(response);
        result.cause = "Rate limited on " + target;
        return FetchStatus::RATE_LIMITED;
    }

    if (status >= 500 || status == 408) {
        result.cause = "HTTP " + std::to_string(status) + " on " + target;
        return FetchStatus::TRANSIENT;
    }

    switch (status) {
        case 401:
            result.cause = "HTTP 401: authentication failed (check the token)";
            break;
        case 403:
            result.cause = "HTTP 403: no access to channel " + channel_id_;
            break;
        case 404:
            result.cause = "HTTP 404: unknown channel " + channel_id_;
            break;
        default:
            result.cause = "HTTP " + std::to_string(status) + " on " + target + ": " +
                           excerpt(response.body);
            break;
    }
    return FetchStatus::FATAL;
}

}  // namespace chanarc
