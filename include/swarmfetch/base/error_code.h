#ifndef SWARMFETCH_BASE_ERROR_CODE_H
#define SWARMFETCH_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace swarmfetch {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotFound = 1002,
    Timeout = 1004,
    Cancelled = 1005,
    InternalError = 1006,
    IoError = 1007,

    // Network errors (2000-2999)
    NetworkError = 2001,
    ConnectionFailed = 2002,
    ProtocolError = 2003,

    // Tracker errors (3000-3999)
    TrackerUnavailable = 3001,
    PublishFailed = 3002,

    // Swarm errors (4000-4999)
    SwarmStalled = 4001,
    SwarmUnavailable = 4002,
    IntegrityFailure = 4003,

    // Transfer errors (5000-5999)
    OriginFailed = 5001,
    DeadlineExceeded = 5002,
    DestinationUnwritable = 5003
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class SwarmFetchError : public std::exception {
public:
    SwarmFetchError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace swarmfetch

namespace std {
template <>
struct is_error_code_enum<swarmfetch::ErrorCode> : true_type {};
} // namespace std

#endif // SWARMFETCH_BASE_ERROR_CODE_H
