#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dotenvpp/export.hpp"

namespace dotenvpp {

/// A key/value snapshot as stored in an EnvMap.
struct Pair {
    std::string key;
    std::string value;

    auto operator==(const Pair&) const -> bool = default;
};

/// Insertion-ordered key/value store with positional addressing.
///
/// Entries are kept in a sequence and mirrored by a key -> position index.
/// Every mutation keeps the two consistent: each key occurs once in the
/// sequence and the index maps it to its current slot.
///
/// Not thread-safe; callers sharing an instance must synchronize.
class DOTENVPP_API EnvMap {
public:
    /// Value and position of an entry.
    struct Entry {
        std::string value;
        std::size_t position = 0;

        auto operator==(const Entry&) const -> bool = default;
    };

    /// Result of a positional lookup. `next` is empty past the last slot.
    struct Cursor {
        Pair pair;
        std::optional<std::size_t> next;
    };

    using const_iterator = std::vector<Pair>::const_iterator;
    using Visitor = std::function<void(std::string_view key, std::string_view value)>;
    using LineFormatter =
        std::function<std::string(std::size_t position, std::string_view key, std::string_view value)>;

    EnvMap() = default;

    [[nodiscard]] auto len() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    /// Stores a value. An existing key keeps its position and its previous
    /// value is returned; a new key is appended and nullopt is returned.
    auto set(std::string key, std::string value) -> std::optional<std::string>;

    /// Stores a value at `at`. An existing key is first taken out of its
    /// slot; if that slot was before `at`, `at` is decremented to account
    /// for the shift. The target is then clamped to [0, len()].
    /// Returns the previous value and position when the key existed.
    auto set_at(std::string key, std::string value, std::ptrdiff_t at)
        -> std::optional<Entry>;

    [[nodiscard]] auto get(std::string_view key) const -> std::optional<Entry>;
    [[nodiscard]] auto contains(std::string_view key) const -> bool;

    /// Positional lookup, usable for index-chained iteration.
    [[nodiscard]] auto get_at(std::size_t at) const -> std::optional<Cursor>;

    /// Removes by key, returning the old value and position.
    auto remove(std::string_view key) -> std::optional<Entry>;

    /// Removes by position, returning the old key and value.
    auto remove_at(std::size_t at) -> std::optional<Pair>;

    /// Visits every entry in order.
    void iterate(const Visitor& visit) const;

    /// Writes the concatenation of `format` over every entry, in order.
    void export_to(std::ostream& out, const LineFormatter& format) const;

    /// Writes one `KEY="VALUE"` line per entry. With line numbers, each line
    /// is prefixed by its zero-padded position and a space.
    void emit(std::ostream& out, bool line_numbers) const;

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return entries_.end(); }

    auto operator==(const EnvMap& other) const -> bool { return entries_ == other.entries_; }

private:
    /// Recomputes index positions for entries_[from, end).
    void reindex(std::size_t from);

    std::vector<Pair> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace dotenvpp
