#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "dotenvpp/core/error.hpp"
#include "dotenvpp/export.hpp"

namespace dotenvpp {

/// Access to an environment table: the process environment in production,
/// an in-memory table in tests.
class DOTENVPP_API Environment {
public:
    virtual ~Environment() = default;

    /// Returns the value of `name`, or nullopt when the variable is unset.
    /// A variable set to the empty string is present.
    [[nodiscard]] virtual auto get(const std::string& name) const
        -> std::optional<std::string> = 0;

    virtual auto set(const std::string& name, const std::string& value) -> VoidResult = 0;

    /// All variables as `NAME=VALUE` strings, suitable for a child process.
    [[nodiscard]] virtual auto snapshot() const -> std::vector<std::string> = 0;

    [[nodiscard]] auto contains(const std::string& name) const -> bool {
        return get(name).has_value();
    }
};

/// The calling process's environment (getenv / setenv / environ).
class DOTENVPP_API ProcessEnvironment final : public Environment {
public:
    [[nodiscard]] auto get(const std::string& name) const
        -> std::optional<std::string> override;
    auto set(const std::string& name, const std::string& value) -> VoidResult override;
    [[nodiscard]] auto snapshot() const -> std::vector<std::string> override;
};

/// A self-contained environment table.
class DOTENVPP_API MemoryEnvironment final : public Environment {
public:
    MemoryEnvironment() = default;
    explicit MemoryEnvironment(std::map<std::string, std::string> vars)
        : vars_(std::move(vars)) {}

    [[nodiscard]] auto get(const std::string& name) const
        -> std::optional<std::string> override;
    auto set(const std::string& name, const std::string& value) -> VoidResult override;
    [[nodiscard]] auto snapshot() const -> std::vector<std::string> override;

    [[nodiscard]] auto vars() const -> const std::map<std::string, std::string>& { return vars_; }

private:
    std::map<std::string, std::string> vars_;
};

/// Shared accessor for the process environment.
auto process_environment() -> Environment&;

} // namespace dotenvpp
