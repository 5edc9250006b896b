#include <presence/address.hpp>

#include <algorithm>
#include <cctype>

namespace presence {

namespace {
bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
}  // namespace

std::string trim(std::string_view s) {
    auto b = std::find_if_not(s.begin(), s.end(), is_space);
    auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (b >= e) return {};
    return std::string(b, e);
}

std::string to_upper(std::string_view s) {
    std::string r(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return r;
}

std::optional<std::string> normalize_mac(std::string_view s) {
    auto t = trim(s);
    // 6 octets, 5 separators
    if (t.size() != 17) return std::nullopt;

    char const sep = t[2];
    if (sep != ':' && sep != '-') return std::nullopt;

    for (size_t i = 0; i < t.size(); ++i) {
        if (i % 3 == 2) {
            if (t[i] != sep) return std::nullopt;
            t[i] = ':';
        } else if (!is_hex(t[i])) {
            return std::nullopt;
        }
    }
    return to_upper(t);
}

std::string normalize_identifier(std::string_view s) {
    if (auto mac = normalize_mac(s)) return *mac;
    return to_upper(trim(s));
}

}  // namespace presence
