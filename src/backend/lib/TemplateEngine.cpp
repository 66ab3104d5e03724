#include <algorithm>

#include "ytassist/TemplateEngine.h"

using namespace std;

namespace ytassist {

namespace {

// Calls onText for literal runs and onPlaceholder for each `[name]` token.
template <typename TextT, typename PlaceholderT>
void scan(string_view content, TextT onText, PlaceholderT onPlaceholder)
{
    size_t pos = 0;
    while(pos < content.size()) {
        const auto open = content.find('[', pos);
        if (open == string_view::npos) {
            break;
        }

        auto end = open + 1;
        while(end < content.size() && TemplateEngine::isPlaceholderChar(content[end])) {
            ++end;
        }

        if (end == open + 1 || end >= content.size() || content[end] != ']') {
            // Not a placeholder. Emit the bracket and continue after it,
            // so "[[name]" still finds "[name]".
            onText(content.substr(pos, open + 1 - pos));
            pos = open + 1;
            continue;
        }

        onText(content.substr(pos, open - pos));
        onPlaceholder(content.substr(open + 1, end - open - 1), content.substr(open, end + 1 - open));
        pos = end + 1;
    }

    if (pos < content.size()) {
        onText(content.substr(pos));
    }
}

} // anon ns

bool TemplateEngine::isPlaceholderChar(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z')
           || (ch >= 'A' && ch <= 'Z')
           || (ch >= '0' && ch <= '9')
           || ch == '_' || ch == '-';
}

string TemplateEngine::apply(string_view content, const values_t& values)
{
    string out;
    out.reserve(content.size());

    scan(content,
        [&](string_view text) {
            out.append(text);
        },
        [&](string_view name, string_view token) {
            if (auto it = values.find(name); it != values.end()) {
                out.append(it->second);
            } else {
                out.append(token);
            }
        });

    return out;
}

vector<string> TemplateEngine::placeholders(string_view content)
{
    vector<string> names;
    scan(content,
        [](string_view) {},
        [&](string_view name, string_view) {
            if (ranges::find(names, name) == names.end()) {
                names.emplace_back(name);
            }
        });
    return names;
}

} // ns
