#include "swarmfetch/base/error_code.h"

namespace swarmfetch {

namespace {

class SwarmFetchCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "swarmfetch";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const SwarmFetchCategory& get_category() {
    static SwarmFetchCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::TrackerUnavailable: return "Tracker unavailable";
        case ErrorCode::PublishFailed: return "Publish failed";
        case ErrorCode::SwarmStalled: return "Swarm stalled";
        case ErrorCode::SwarmUnavailable: return "Swarm unavailable";
        case ErrorCode::IntegrityFailure: return "Integrity check failed";
        case ErrorCode::OriginFailed: return "Origin fetch failed";
        case ErrorCode::DeadlineExceeded: return "Deadline exceeded";
        case ErrorCode::DestinationUnwritable: return "Destination not writable";
        default: return "Unknown error";
    }
}

SwarmFetchError::SwarmFetchError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* SwarmFetchError::what() const noexcept {
    return message_.c_str();
}

} // namespace swarmfetch
