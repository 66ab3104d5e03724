#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string_view>

#include "google/protobuf/util/json_util.h"

#include "ytassist.pb.h"
#include "ytassist/logging.h"

namespace ytassist {

// BOOST_SCOPE_EXIT confuses Clang-Tidy :/
template <typename T>
struct ScopedExit {
    explicit ScopedExit(T&& fn)
        : fn_{std::move(fn)} {}

    ScopedExit(const ScopedExit&) = delete;
    ScopedExit(ScopedExit&&) = delete;

    ~ScopedExit() {
        fn_();
    }

    ScopedExit& operator =(const ScopedExit&) = delete;
    ScopedExit& operator =(ScopedExit&&) = delete;

private:
    T fn_;
};


std::string getEnv(const char *name, std::string def = {});

/*! Remove leading and trailing white-space */
std::string_view trim(std::string_view input) noexcept;

/*! Case-insensitive compare (ASCII only) */
bool iequals(std::string_view a, std::string_view b) noexcept;

/*! Parse a strictly positive 32 bit integer.
 *
 *  The entire input must be digits. Returns an empty optional for anything else,
 *  including zero and values that overflow.
 */
std::optional<int32_t> toPositiveInt(std::string_view input) noexcept;

template <typename T>
concept ProtoMessage = std::is_base_of_v<google::protobuf::Message, T>;

/*! Serialize a protobuf message to json
 *
 *  mode:
 *      - 0 disabled, returns an empty string
 *      - 1 compact
 *      - 2 readable, with white-space
 */
template <ProtoMessage T>
std::string toJson(const T& obj, int mode = 1) {
    if (!mode) {
        return {};
    }

    std::string str;
    google::protobuf::util::JsonPrintOptions opts;
    opts.always_print_primitive_fields = true;
    opts.preserve_proto_field_names = true;
    opts.add_whitespace = mode == 2;
    auto res = google::protobuf::util::MessageToJsonString(obj, &str, opts);
    if (!res.ok()) {
        LOG_DEBUG << "Failed to convert object to json: "
                  << typeid(T).name() << ": "
                  << res.ToString();
        throw std::runtime_error{"Failed to convert object to json"};
    }
    return str;
}

/*! Serialize a range of protobuf messages to a json array */
template <std::ranges::range T>
requires ProtoMessage<std::ranges::range_value_t<T>>
std::string toJsonArray(const T& items) {
    std::string out{"["};
    for(const auto& item : items) {
        if (out.size() > 1) {
            out += ',';
        }
        out += toJson(item);
    }
    out += ']';
    return out;
}

/*! Parse json into a protobuf message.
 *
 *  Unknown fields are ignored.
 *  Returns false if the json is malformed or does not match the message.
 */
template <ProtoMessage T>
bool fromJson(std::string_view json, T& obj) {
    google::protobuf::util::JsonParseOptions opts;
    opts.ignore_unknown_fields = true;
    const auto res = google::protobuf::util::JsonStringToMessage(
        google::protobuf::StringPiece{json.data(), json.size()}, &obj, opts);
    if (!res.ok()) {
        LOG_DEBUG << "Failed to parse json to " << obj.GetDescriptor()->name()
                  << ": " << res.ToString();
        return false;
    }
    return true;
}

// Protobuf setters want std::string, the database gives us views
inline std::string pb_adapt(std::string_view v) {
    return std::string{v};
}

} // ns
