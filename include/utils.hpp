#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace resilient_http {
namespace util {

inline std::string toupper(const std::string& str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'a' && c <= 'z')
            c -= 32;
    return s;
}

inline std::string tolower(std::string_view str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'A' && c <= 'Z')
            c += 32;
    return s;
}

inline std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

/**
 * Find the value of a header in "Name: value" lines, case-insensitive on the name.
 * The first occurrence wins.
 */
inline std::optional<std::string> findHeader(const std::vector<std::string>& headers, std::string_view name) {
    const std::string wanted = tolower(name);
    for (const auto& line : headers) {
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        if (tolower(trim(std::string_view(line).substr(0, colon))) == wanted)
            return std::string(trim(std::string_view(line).substr(colon + 1)));
    }
    return std::nullopt;
}

inline bool hasHeader(const std::vector<std::string>& headers, std::string_view name) {
    return findHeader(headers, name).has_value();
}

/**
 * Per-thread generator seeded from the random device and the thread id.
 */
inline std::mt19937_64 entropy_generator() {
    std::random_device rd;
    std::seed_seq seq{
        rd(), rd(), rd(), rd(),
        static_cast<unsigned>(
            std::hash<std::thread::id>{}(std::this_thread::get_id()))
    };
    return std::mt19937_64(seq);
}

} // namespace util
} // namespace resilient_http
