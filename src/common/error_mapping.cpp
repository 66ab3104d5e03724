#include <array>
#include <format>

#include "ytassist/error_mapping.h"

using namespace std;

namespace ytassist {
string ErrorCategory::message(int ev) const
{
    static constexpr auto msgs = to_array<string_view>({
        "OK",
        "Validation failed",
        "Conflict",
        "Not found",
        "Forbidden",
        "Invalid request",
        "Method not allowed",
        "Database request failed",
        "Generic error",
    });

    if (ev < 0 || static_cast<size_t>(ev) >= msgs.size()) {
        return format("Unknown error ytassist::pb::Error={}", ev);
    }
    return string{msgs[ev]};
}

int toHttpStatus(pb::Error error) noexcept
{
    switch(error) {
    case pb::Error::OK:
        return 200;
    case pb::Error::VALIDATION_FAILED:
    case pb::Error::INVALID_REQUEST:
        return 400;
    case pb::Error::FORBIDDEN:
        return 403;
    case pb::Error::NOT_FOUND:
        return 404;
    case pb::Error::METHOD_NOT_ALLOWED:
        return 405;
    case pb::Error::CONFLICT:
        return 409;
    case pb::Error::DATABASE_REQUEST_FAILED:
    case pb::Error::GENERIC_ERROR:
        return 500;
    default:
        return 500;
    }
}

string_view httpReason(int status) noexcept
{
    switch(status) {
    case 200:
        return "OK";
    case 201:
        return "Created";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 409:
        return "Conflict";
    default:
        return "Internal Server Error";
    }
}

} // ns

boost::system::error_code make_error_code(const ytassist::pb::Error& e) noexcept {
    static const ytassist::ErrorCategory category;
    return {static_cast<int>(e), category};
}
