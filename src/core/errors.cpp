#include "tcpros/core/errors.hpp"

namespace tcpros::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::PermissionDenied: return "PermissionDenied";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Net: return "Net";
        case StatusDomain::Fs: return "Fs";
        case StatusDomain::Msg: return "Msg";
        case StatusDomain::Cli: return "Cli";
        }
        return "Unknown";
    }
} // namespace tcpros::core
