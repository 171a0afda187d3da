#include "dotenvpp/core/utils.hpp"

namespace dotenvpp::utils {

auto trim(std::string_view s) -> std::string {
    return trim_chars(s, " \t\n\r\v\f");
}

auto trim_chars(std::string_view s, std::string_view chars) -> std::string {
    auto start = s.find_first_not_of(chars);
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(chars);
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (true) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto join(const std::vector<std::string>& parts, std::string_view delim) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += delim;
        result += parts[i];
    }
    return result;
}

auto replace_all(std::string_view s, std::string_view from, std::string_view to) -> std::string {
    if (from.empty()) return std::string(s);

    std::string result;
    result.reserve(s.size());
    size_t pos = 0;
    while (true) {
        auto next = s.find(from, pos);
        if (next == std::string_view::npos) {
            result += s.substr(pos);
            break;
        }
        result += s.substr(pos, next - pos);
        result += to;
        pos = next + from.size();
    }
    return result;
}

} // namespace dotenvpp::utils
