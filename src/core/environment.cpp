#include "dotenvpp/core/environment.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <unistd.h>

extern char** environ;

namespace dotenvpp {

auto ProcessEnvironment::get(const std::string& name) const -> std::optional<std::string> {
    if (auto* val = std::getenv(name.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

auto ProcessEnvironment::set(const std::string& name, const std::string& value) -> VoidResult {
    if (::setenv(name.c_str(), value.c_str(), 1) != 0) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Failed to set environment variable " + name,
                                          std::strerror(errno)));
    }
    return {};
}

auto ProcessEnvironment::snapshot() const -> std::vector<std::string> {
    std::vector<std::string> result;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        result.emplace_back(*entry);
    }
    return result;
}

auto MemoryEnvironment::get(const std::string& name) const -> std::optional<std::string> {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

auto MemoryEnvironment::set(const std::string& name, const std::string& value) -> VoidResult {
    if (name.empty() || name.find('=') != std::string::npos) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Invalid environment variable name", name));
    }
    vars_[name] = value;
    return {};
}

auto MemoryEnvironment::snapshot() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(vars_.size());
    for (const auto& [name, value] : vars_) {
        result.push_back(name + "=" + value);
    }
    return result;
}

auto process_environment() -> Environment& {
    static ProcessEnvironment env;
    return env;
}

} // namespace dotenvpp
