#include "swarmfetch/net/http_client.h"
#include "swarmfetch/base/config.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

// Socket includes
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace swarmfetch {

namespace {

using Clock = std::chrono::steady_clock;

// Socket wake-up interval so the exchange deadline is checked during reads
constexpr uint32_t READ_SLICE_MS = 100;
constexpr size_t MAX_HEADER_BYTES = 64 * 1024;
constexpr size_t MAX_BODY_BYTES = 16 * 1024 * 1024;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

void set_socket_timeout(int fd, int option, uint32_t timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv));
}

uint32_t remaining_ms(Clock::time_point deadline) {
    auto now = Clock::now();
    if (now >= deadline) return 0;
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
}

void fail(HttpResult& result, ErrorCode code, std::string message) {
    result.code = code;
    result.error = std::move(message);
}

enum class ReadStatus { Data, Idle, Closed, Error };

// One plain TCP connection; closes itself on destruction
class Connection {
public:
    Connection() = default;
    ~Connection() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const Url& url, Clock::time_point deadline, HttpResult& result) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* addrs = nullptr;
        std::string port = std::to_string(url.port);
        int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &addrs);
        if (rc != 0 || !addrs) {
            fail(result, ErrorCode::ConnectionFailed, "Failed to resolve host " + url.host);
            return false;
        }

        for (auto* ai = addrs; ai != nullptr; ai = ai->ai_next) {
            uint32_t budget = remaining_ms(deadline);
            if (budget == 0) break;
            int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;
            // SO_SNDTIMEO bounds connect() on Linux
            set_socket_timeout(fd, SO_SNDTIMEO, budget);
            if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
                fd_ = fd;
                break;
            }
            ::close(fd);
        }
        freeaddrinfo(addrs);

        if (fd_ < 0) {
            if (remaining_ms(deadline) == 0) {
                fail(result, ErrorCode::Timeout, "Timed out connecting to " + url.host + ":" + port);
            } else {
                fail(result, ErrorCode::ConnectionFailed, "Failed to connect to " + url.host + ":" + port);
            }
            return false;
        }

        int one = 1;
        setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        set_socket_timeout(fd_, SO_RCVTIMEO, READ_SLICE_MS);
        return true;
    }

    bool write_all(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                if (errno == EINTR) continue;
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    ReadStatus read_some(char* buffer, size_t size, size_t& got) {
        got = 0;
        ssize_t n = recv(fd_, buffer, size, 0);
        if (n > 0) {
            got = static_cast<size_t>(n);
            return ReadStatus::Data;
        }
        if (n == 0) return ReadStatus::Closed;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReadStatus::Idle;
        return ReadStatus::Error;
    }

private:
    int fd_ = -1;
};

std::string build_request(const std::string& method, const Url& url, const std::string& body,
                          const SimpleHttpClient::Headers& headers) {
    std::ostringstream request;
    request << method << " " << url.target << " HTTP/1.0\r\n";
    request << "Host: " << url.host;
    if (url.port != 80) {
        request << ":" << url.port;
    }
    request << "\r\n";
    request << "User-Agent: swarmfetch/" << SWARMFETCH_VERSION << "\r\n";

    bool has_content_type = false;
    for (const auto& h : headers) {
        request << h.first << ": " << h.second << "\r\n";
        if (to_lower(h.first) == "content-type") has_content_type = true;
    }

    if (!body.empty()) {
        if (!has_content_type) {
            request << "Content-Type: application/json\r\n";
        }
        request << "Content-Length: " << body.size() << "\r\n";
    }
    request << "Connection: close\r\n";
    request << "\r\n";
    request << body;
    return request.str();
}

// Parse "HTTP/1.x NNN reason" plus header lines into result
bool parse_head(const std::string& head, HttpResult& result) {
    std::istringstream stream(head);
    std::string status_line;
    if (!std::getline(stream, status_line)) return false;

    auto pos = status_line.find(' ');
    if (pos == std::string::npos || status_line.compare(0, 5, "HTTP/") != 0) return false;
    try {
        result.status = std::stoi(status_line.substr(pos + 1, 3));
    } catch (const std::exception&) {
        return false;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) continue;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        result.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

// Send the request and read up to the end of the response head.
// Bytes read past the head are left in leftover.
bool exchange_head(Connection& conn, const std::string& request, Clock::time_point deadline,
                   HttpResult& result, std::string& leftover) {
    if (!conn.write_all(request)) {
        fail(result, ErrorCode::NetworkError, "Failed to send request");
        return false;
    }

    std::string data;
    char buffer[8192];
    while (true) {
        if (Clock::now() >= deadline) {
            fail(result, ErrorCode::Timeout, "Timed out waiting for response");
            return false;
        }
        size_t got = 0;
        auto status = conn.read_some(buffer, sizeof(buffer), got);
        if (status == ReadStatus::Idle) {
            continue;
        }
        if (status != ReadStatus::Data) {
            fail(result, ErrorCode::NetworkError, "Connection closed before response headers");
            return false;
        }
        data.append(buffer, got);

        auto header_end = data.find("\r\n\r\n");
        if (header_end != std::string::npos) {
            if (!parse_head(data.substr(0, header_end), result)) {
                fail(result, ErrorCode::ProtocolError, "Invalid response");
                return false;
            }
            leftover = data.substr(header_end + 4);
            return true;
        }
        if (data.size() > MAX_HEADER_BYTES) {
            fail(result, ErrorCode::ProtocolError, "Response headers too large");
            return false;
        }
    }
}

// Read the body into result. Honors Content-Length when present.
bool read_body(Connection& conn, std::string leftover, Clock::time_point deadline,
               HttpResult& result) {
    std::optional<uint64_t> expected;
    if (auto len = result.header("content-length")) {
        try {
            expected = std::stoull(*len);
        } catch (const std::exception&) {
            fail(result, ErrorCode::ProtocolError, "Invalid Content-Length");
            return false;
        }
        if (*expected > MAX_BODY_BYTES) {
            fail(result, ErrorCode::ProtocolError, "Response body too large");
            return false;
        }
    }

    std::string body = std::move(leftover);
    if (expected && body.size() > *expected) {
        body.resize(static_cast<size_t>(*expected));
    }

    std::vector<char> buffer(64 * 1024);
    while (!expected || body.size() < *expected) {
        if (Clock::now() >= deadline) {
            fail(result, ErrorCode::Timeout, "Timed out reading body");
            return false;
        }
        size_t got = 0;
        auto status = conn.read_some(buffer.data(), buffer.size(), got);
        if (status == ReadStatus::Idle) {
            continue;
        }
        if (status == ReadStatus::Closed) {
            break;
        }
        if (status == ReadStatus::Error) {
            fail(result, ErrorCode::NetworkError, "Error reading body");
            return false;
        }
        if (expected) {
            got = static_cast<size_t>(std::min<uint64_t>(got, *expected - body.size()));
        }
        body.append(buffer.data(), got);
        if (body.size() > MAX_BODY_BYTES) {
            fail(result, ErrorCode::ProtocolError, "Response body too large");
            return false;
        }
    }

    if (expected && body.size() != *expected) {
        fail(result, ErrorCode::NetworkError,
             "Short body: got " + std::to_string(body.size()) + " of " +
             std::to_string(*expected) + " bytes");
        return false;
    }
    result.body = std::move(body);
    return true;
}

} // anonymous namespace

std::optional<Url> Url::parse(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    Url result;
    result.scheme = to_lower(url.substr(0, scheme_end));
    if (result.scheme != "http" && result.scheme != "https") return std::nullopt;

    std::string rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        result.target = rest.substr(path_start);
        if (result.target[0] == '?') result.target = "/" + result.target;
    }

    result.port = result.is_https() ? 443 : 80;
    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        try {
            int port = std::stoi(authority.substr(colon + 1));
            if (port <= 0 || port > 65535) return std::nullopt;
            result.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) return std::nullopt;
    result.host = authority;
    return result;
}

std::optional<Url> Url::resolve(const std::string& location) const {
    if (location.find("://") != std::string::npos) {
        return parse(location);
    }
    if (location.empty()) return std::nullopt;

    Url result = *this;
    if (location.compare(0, 2, "//") == 0) {
        return parse(scheme + ":" + location);
    }
    if (location[0] == '/') {
        result.target = location;
    } else {
        std::string base = path();
        base = base.substr(0, base.rfind('/') + 1);
        result.target = base + location;
    }
    return result;
}

std::string Url::path() const {
    return target.substr(0, target.find('?'));
}

std::string Url::query() const {
    auto pos = target.find('?');
    return pos == std::string::npos ? std::string() : target.substr(pos + 1);
}

std::string Url::to_string() const {
    return scheme + "://" + host + ":" + std::to_string(port) + target;
}

std::optional<std::string> HttpResult::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

HttpResult SimpleHttpClient::request(const std::string& method,
                                     const std::string& url,
                                     const std::string& body,
                                     const Headers& headers,
                                     uint32_t timeout_ms) {
    HttpResult result;
    auto parsed = Url::parse(url);
    if (!parsed) {
        fail(result, ErrorCode::InvalidArgument, "Invalid URL: " + url);
        return result;
    }
    if (parsed->is_https()) {
        fail(result, ErrorCode::InvalidArgument, "Only plain http:// endpoints are supported: " + url);
        return result;
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    Connection conn;
    if (!conn.open(*parsed, deadline, result)) {
        return result;
    }

    std::string leftover;
    if (!exchange_head(conn, build_request(method, *parsed, body, headers), deadline, result, leftover)) {
        return result;
    }

    read_body(conn, std::move(leftover), deadline, result);
    return result;
}

std::string url_encode(const std::string& value) {
    std::ostringstream oss;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace swarmfetch
