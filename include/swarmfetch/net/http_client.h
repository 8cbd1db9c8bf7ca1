#ifndef SWARMFETCH_NET_HTTP_CLIENT_H
#define SWARMFETCH_NET_HTTP_CLIENT_H

#include "swarmfetch/base/error_code.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <cstdint>

namespace swarmfetch {

struct Url {
    std::string scheme;  // http or https
    std::string host;
    uint16_t port = 0;
    std::string target = "/";  // path and query

    bool is_https() const { return scheme == "https"; }

    // Same scheme, host and port
    bool same_origin(const Url& other) const {
        return scheme == other.scheme && host == other.host && port == other.port;
    }

    // Resolve a Location header against this URL
    std::optional<Url> resolve(const std::string& location) const;

    std::string path() const;   // target without the query
    std::string query() const;  // target after '?', empty if none

    std::string to_string() const;

    static std::optional<Url> parse(const std::string& url);
};

struct HttpResult {
    int status = 0;                                        // 0 when no response was received
    std::string body;
    std::unordered_map<std::string, std::string> headers;  // lower-case names
    ErrorCode code = ErrorCode::Success;                   // transport failure kind
    std::string error;                                     // transport error, empty on success

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
    std::optional<std::string> header(const std::string& name) const;
};

// Synchronous plain HTTP/1.0 client over POSIX sockets for small JSON
// exchanges. The timeout bounds the whole exchange from connect to the
// last body byte.
class SimpleHttpClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    static HttpResult request(const std::string& method,
                              const std::string& url,
                              const std::string& body = "",
                              const Headers& headers = {},
                              uint32_t timeout_ms = 5000);
};

// Percent-encode for query strings
std::string url_encode(const std::string& value);

} // namespace swarmfetch

#endif // SWARMFETCH_NET_HTTP_CLIENT_H
