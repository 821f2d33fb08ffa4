#pragma once
#include <string_view>

enum class Error {
    TransientLink,            // link failed, retry budget left
    FatalLink,                // retries exhausted
    Delivery,                 // sink returned false or threw
    PersistenceCorruption,    // unreadable record
    CaptureSourceUnavailable, // source could not start or went away
};

constexpr auto to_string(const Error error) -> std::string_view {
    switch(error) {
    case Error::TransientLink:
        return "transient link error";
    case Error::FatalLink:
        return "fatal link error";
    case Error::Delivery:
        return "delivery failure";
    case Error::PersistenceCorruption:
        return "persistence corruption";
    case Error::CaptureSourceUnavailable:
        return "capture source unavailable";
    }
    return "unknown";
}
