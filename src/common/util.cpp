
#include <cctype>
#include <limits>

#include "ytassist/util.h"
#include "ytassist/logging.h"


using namespace std;

namespace ytassist {

std::string getEnv(const char *name, std::string def) {
    if (auto var = std::getenv(name)) {
        return var;
    }

    return def;
}

string_view trim(string_view input) noexcept
{
    static constexpr string_view whitespace = " \t\r\n\f\v";

    const auto start = input.find_first_not_of(whitespace);
    if (start == string_view::npos) {
        return {};
    }

    const auto end = input.find_last_not_of(whitespace);
    return input.substr(start, end - start + 1);
}

bool iequals(string_view a, string_view b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }

    for(size_t i = 0; i < a.size(); ++i) {
        if (tolower(static_cast<unsigned char>(a[i])) != tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }

    return true;
}

optional<int32_t> toPositiveInt(string_view input) noexcept
{
    if (input.empty()) {
        return {};
    }

    int64_t value = 0;
    for(const auto ch : input) {
        if (ch < '0' || ch > '9') {
            return {};
        }
        value = (value * 10) + (ch - '0');
        if (value > numeric_limits<int32_t>::max()) {
            return {};
        }
    }

    if (value == 0) {
        return {};
    }

    return static_cast<int32_t>(value);
}

} // ns
