#include <format>

#include <google/protobuf/util/time_util.h>

#include "ytassist/Services.h"
#include "ytassist/errors.h"
#include "ytassist/util.h"

using namespace std;

namespace ytassist {

int32_t resolveWorkspaceId(optional<string_view> header) noexcept
{
    if (header) {
        if (auto id = toPositiveInt(trim(*header))) {
            return *id;
        }
    }

    return DEFAULT_WORKSPACE_ID;
}

google::protobuf::Timestamp now()
{
    return google::protobuf::util::TimeUtil::GetCurrentTime();
}

namespace validate {

size_t textLength(string_view text) noexcept
{
    // Count everything but utf-8 continuation bytes
    size_t len = 0;
    for(const auto ch : text) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++len;
        }
    }
    return len;
}

string requiredText(string_view value, string_view field, size_t maxLength)
{
    const auto trimmed = trim(value);
    if (trimmed.empty()) {
        throw server_err{pb::Error::VALIDATION_FAILED, format("{} cannot be empty", field), string{field}};
    }

    if (textLength(trimmed) > maxLength) {
        throw server_err{pb::Error::VALIDATION_FAILED,
                         format("{} cannot be longer than {} characters", field, maxLength), string{field}};
    }

    return string{trimmed};
}

optional<string> optionalText(string_view value, string_view field, size_t maxLength)
{
    const auto trimmed = trim(value);
    if (trimmed.empty()) {
        return {};
    }

    if (textLength(trimmed) > maxLength) {
        throw server_err{pb::Error::VALIDATION_FAILED,
                         format("{} cannot be longer than {} characters", field, maxLength), string{field}};
    }

    return string{trimmed};
}

} // ns validate

} // ns
