#ifndef CHANARC_MESSAGE_FETCHER_H_
#define CHANARC_MESSAGE_FETCHER_H_

#include "struct_defs.h"
#include "transport.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace chanarc {

// ============================================================================
// Remote Fetcher - one page of channel history per call
// ============================================================================

/// Page-level outcome. Malformed individual messages are not an error: they
/// are skipped and counted in Page::malformed_count.
enum class FetchStatus {
    SUCCESS = 0,
    RATE_LIMITED,    // wait at least retry_after, then repeat the same request
    TRANSIENT,       // network / timeout / 5xx; retry with backoff
    FATAL            // auth failure, unknown channel, bad request; abort
};

/// Fetch outcome details
struct FetchResult {
    Page page;                                   // newest-first on SUCCESS
    std::chrono::milliseconds retry_after{0};    // RATE_LIMITED only
    std::string cause;                           // non-SUCCESS only
};

const char* fetchStatusName(FetchStatus status);

/// Source of pages, implemented by the REST fetcher and by test doubles
class IPageFetcher {
public:
    virtual ~IPageFetcher() = default;

    /// Request one page relative to a cursor
    /// @param direction BEFORE (older than cursor) or AFTER (newer than cursor)
    /// @param cursor Boundary id; unset with BEFORE means "from the newest"
    /// @param limit Maximum messages to return
    /// @param result Output: page or error details
    /// @return FetchStatus
    virtual FetchStatus fetch(Direction direction,
                              std::optional<MessageId> cursor,
                              uint32_t limit,
                              FetchResult& result) = 0;
};

/// Fetches pages from the Discord REST API through an ITransport
class MessageFetcher : public IPageFetcher {
public:
    /// Constructor
    /// @param transport Authenticated transport (not owned)
    /// @param channel_id Channel to read
    /// @param api_prefix Path prefix, e.g. "/api/v10"
    MessageFetcher(ITransport* transport,
                   const std::string& channel_id,
                   const std::string& api_prefix = "/api/v10");

    FetchStatus fetch(Direction direction,
                      std::optional<MessageId> cursor,
                      uint32_t limit,
                      FetchResult& result) override;

    /// Build the request target for a page
    std::string buildTarget(Direction direction,
                            std::optional<MessageId> cursor,
                            uint32_t limit) const;

    /// Parse a 2xx body into a newest-first page
    /// @return false if the body is not a JSON array
    static bool parsePage(const std::string& body, Page& page, std::string& error);

    /// Rate-limit delay from the JSON body, else the Retry-After header
    /// @return zero if neither carries a usable value
    static std::chrono::milliseconds parseRetryAfter(const HttpResponse& response);

    /// Parse a snowflake id given as decimal string or number
    static bool parseMessageId(const std::string& text, MessageId& id);

private:
    ITransport* transport_;      // not owned
    std::string channel_id_;
    std::string api_prefix_;
};

}  // namespace chanarc

#endif  // CHANARC_MESSAGE_FETCHER_H_
