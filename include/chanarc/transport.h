#ifndef CHANARC_TRANSPORT_H_
#define CHANARC_TRANSPORT_H_

#include <string>

namespace chanarc {

// ============================================================================
// Transport - authenticated request capability used by the fetcher
// ============================================================================

/// Transport-level outcome (HTTP status is reported separately)
enum class TransportResult {
    SUCCESS = 0,          // a response was received, whatever its status
    ERR_NETWORK,          // resolve / connect / TLS / read failure
    ERR_TIMEOUT
};

/// Minimal HTTP response view
struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::string retry_after;   // Retry-After header, empty if absent
};

/// Abstract transport: performs an authenticated GET against the platform
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Perform a GET request
    /// @param target Request target (path + query), e.g. "/api/v10/channels/1/messages?limit=100"
    /// @param response Output: status, body and rate-limit header
    /// @return TransportResult
    virtual TransportResult get(const std::string& target, HttpResponse& response) = 0;

    /// Get last error message
    virtual std::string getLastError() const = 0;
};

}  // namespace chanarc

#endif  // CHANARC_TRANSPORT_H_
