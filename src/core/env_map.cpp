#include "dotenvpp/core/env_map.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace dotenvpp {

namespace {

/// Number of decimal digits in `n`, i.e. floor(log10(n)) + 1 for n >= 1.
auto decimal_width(std::size_t n) -> std::size_t {
    std::size_t width = 1;
    while (n >= 10) {
        n /= 10;
        ++width;
    }
    return width;
}

} // anonymous namespace

auto EnvMap::set(std::string key, std::string value) -> std::optional<std::string> {
    if (auto it = index_.find(key); it != index_.end()) {
        auto& slot = entries_[it->second];
        auto previous = std::exchange(slot.value, std::move(value));
        return previous;
    }

    index_.emplace(key, entries_.size());
    entries_.push_back(Pair{std::move(key), std::move(value)});
    return std::nullopt;
}

auto EnvMap::set_at(std::string key, std::string value, std::ptrdiff_t at)
    -> std::optional<Entry> {
    std::optional<Entry> previous;

    if (auto it = index_.find(key); it != index_.end()) {
        auto old_at = it->second;
        previous = Entry{std::move(entries_[old_at].value), old_at};
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(old_at));
        index_.erase(it);
        if (static_cast<std::ptrdiff_t>(old_at) < at) {
            --at;
        }
    }

    auto target = static_cast<std::size_t>(
        std::clamp<std::ptrdiff_t>(at, 0, static_cast<std::ptrdiff_t>(entries_.size())));

    entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(target),
                    Pair{key, std::move(value)});
    index_.emplace(std::move(key), target);

    // Everything from the first touched slot onwards may have moved.
    auto from = previous ? std::min(previous->position, target) : target;
    reindex(from);

    return previous;
}

auto EnvMap::get(std::string_view key) const -> std::optional<Entry> {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return Entry{entries_[it->second].value, it->second};
}

auto EnvMap::contains(std::string_view key) const -> bool {
    return index_.contains(std::string(key));
}

auto EnvMap::get_at(std::size_t at) const -> std::optional<Cursor> {
    if (at >= entries_.size()) {
        return std::nullopt;
    }

    Cursor cursor{entries_[at], std::nullopt};
    if (at + 1 < entries_.size()) {
        cursor.next = at + 1;
    }
    return cursor;
}

auto EnvMap::remove(std::string_view key) -> std::optional<Entry> {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return std::nullopt;
    }

    auto at = it->second;
    Entry removed{std::move(entries_[at].value), at};
    index_.erase(it);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(at));
    reindex(at);
    return removed;
}

auto EnvMap::remove_at(std::size_t at) -> std::optional<Pair> {
    if (at >= entries_.size()) {
        return std::nullopt;
    }

    Pair removed = std::move(entries_[at]);
    index_.erase(removed.key);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(at));
    reindex(at);
    return removed;
}

void EnvMap::iterate(const Visitor& visit) const {
    for (const auto& p : entries_) {
        visit(p.key, p.value);
    }
}

void EnvMap::export_to(std::ostream& out, const LineFormatter& format) const {
    std::string buffer;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        buffer += format(i, entries_[i].key, entries_[i].value);
    }
    out << buffer;
}

void EnvMap::emit(std::ostream& out, bool line_numbers) const {
    auto width = decimal_width(entries_.size());
    export_to(out, [&](std::size_t at, std::string_view key, std::string_view value) {
        std::ostringstream line;
        if (line_numbers) {
            line << std::setfill('0') << std::setw(static_cast<int>(width)) << at << ' ';
        }
        line << key << "=\"" << value << "\"\n";
        return line.str();
    });
}

void EnvMap::reindex(std::size_t from) {
    for (auto i = from; i < entries_.size(); ++i) {
        index_[entries_[i].key] = i;
    }
}

} // namespace dotenvpp
