#include "dotenvpp/dotenv/marshal.hpp"
#include "dotenvpp/core/utils.hpp"

#include <array>
#include <utility>
#include <vector>

namespace dotenvpp::dotenv {

namespace {

// Applied in order; the backslash must come first.
constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kEscapes = {{
    {"\\", "\\\\"},
    {"\n", "\\n"},
    {"\r", "\\r"},
    {"\"", "\\\""},
    {"!", "\\!"},
    {"`", "\\`"},
}};

} // anonymous namespace

auto double_quote_escape(std::string_view value) -> std::string {
    std::string result(value);
    for (const auto& [from, to] : kEscapes) {
        result = utils::replace_all(result, from, to);
    }
    return result;
}

auto marshal(const EnvMap& map) -> std::string {
    std::vector<std::string> lines;
    lines.reserve(map.len());
    map.iterate([&lines](std::string_view key, std::string_view value) {
        std::string line(key);
        line += "=\"";
        line += double_quote_escape(value);
        line += '"';
        lines.push_back(std::move(line));
    });
    return utils::join(lines, "\n") + "\n";
}

auto to_json(const EnvMap& map) -> nlohmann::ordered_json {
    auto j = nlohmann::ordered_json::object();
    for (const auto& [key, value] : map) {
        j[key] = value;
    }
    return j;
}

} // namespace dotenvpp::dotenv
