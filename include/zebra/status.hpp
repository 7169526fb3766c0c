#pragma once
// Status: error taxonomy for index operations
//
// Every engine operation reports its outcome as a Status value.
// Nothing in the public API throws; failures are returned to the
// immediate caller, which maps them to its own response codes.

#include <string>

namespace zebra {

enum class Errc {
    Ok,
    ValidationFailed,   // Resource failed its own validation
    AlreadyExists,      // Create with an identifier already indexed
    NotFound,           // Update of an identifier that is not indexed
    InvalidQuery,       // Malformed operator / value count
    Uninitialized,      // Engine is not Ready (never initialized, or wiped)
    Internal            // Replace transaction could not be staged
};

inline const char* errc_name(Errc code) {
    switch (code) {
        case Errc::Ok: return "ok";
        case Errc::ValidationFailed: return "validation_failed";
        case Errc::AlreadyExists: return "already_exists";
        case Errc::NotFound: return "not_found";
        case Errc::InvalidQuery: return "invalid_query";
        case Errc::Uninitialized: return "uninitialized";
        case Errc::Internal: return "internal";
    }
    return "unknown";
}

struct Status {
    Errc code = Errc::Ok;
    std::string error;

    static Status ok() { return {}; }

    static Status fail(Errc code, const std::string& message) {
        return {code, message};
    }

    bool is_ok() const { return code == Errc::Ok; }
    explicit operator bool() const { return is_ok(); }

    // "already_exists: resource r1 already indexed"
    std::string describe() const {
        if (is_ok()) return errc_name(code);
        return std::string(errc_name(code)) + ": " + error;
    }
};

} // namespace zebra
