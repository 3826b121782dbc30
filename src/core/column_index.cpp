#include <tabula/core/column_index.hpp>

#include <fmt/format.h>

#include <unordered_set>

namespace tabula {

namespace {

auto find_duplicate(const std::vector<std::string>& names) -> std::optional<std::string> {
    std::unordered_set<std::string_view> seen;
    seen.reserve(names.size());
    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            return name;
        }
    }
    return std::nullopt;
}

}  // namespace

void throw_negative_position(ErrorKind kind, long long position) {
    throw TableError(Error{.kind = kind, .message = fmt::format("negative position {}", position)});
}

auto ColumnKey::to_string() const -> std::string {
    if (is_name()) {
        return name();
    }
    return fmt::format("#{}", position());
}

ColumnIndex::ColumnIndex(std::vector<std::string> names) {
    *this = unwrap(make(std::move(names)));
}

auto ColumnIndex::make(std::vector<std::string> names) -> Result<ColumnIndex> {
    if (auto dup = find_duplicate(names)) {
        return make_error(ErrorKind::DuplicateColumn,
                          fmt::format("duplicate column name '{}'", *dup));
    }
    ColumnIndex index;
    index.names_ = std::move(names);
    index.rebuild();
    return index;
}

void ColumnIndex::rebuild() {
    lookup_.clear();
    lookup_.reserve(names_.size());
    for (std::size_t i = 0; i < names_.size(); ++i) {
        lookup_.emplace(names_[i], i);
    }
}

auto ColumnIndex::contains(const ColumnKey& key) const -> bool {
    if (key.is_position()) {
        return key.position() < names_.size();
    }
    return lookup_.contains(key.name());
}

auto ColumnIndex::find(std::string_view name) const -> std::optional<std::size_t> {
    auto it = lookup_.find(std::string(name));
    if (it == lookup_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto ColumnIndex::position(const ColumnKey& key) const -> Result<std::size_t> {
    if (key.is_position()) {
        if (key.position() >= names_.size()) {
            return make_error(ErrorKind::UnknownColumn,
                              fmt::format("column position {} out of range for {} columns",
                                          key.position(), names_.size()));
        }
        return key.position();
    }
    auto it = lookup_.find(key.name());
    if (it == lookup_.end()) {
        return make_error(ErrorKind::UnknownColumn,
                          fmt::format("unknown column '{}'", key.name()));
    }
    return it->second;
}

auto ColumnIndex::resolve(const std::vector<ColumnKey>& keys) const
    -> Result<std::vector<std::size_t>> {
    std::vector<std::size_t> positions;
    positions.reserve(keys.size());
    for (const auto& key : keys) {
        auto pos = position(key);
        if (!pos) {
            return std::unexpected(pos.error());
        }
        positions.push_back(*pos);
    }
    return positions;
}

auto ColumnIndex::resolve(const std::vector<bool>& mask) const
    -> Result<std::vector<std::size_t>> {
    if (mask.size() != names_.size()) {
        return make_error(ErrorKind::LengthMismatch,
                          fmt::format("column mask has length {} but table has {} columns",
                                      mask.size(), names_.size()));
    }
    return mask_positions(mask);
}

auto ColumnIndex::insert(std::string name) -> Result<std::size_t> {
    if (lookup_.contains(name)) {
        return make_error(ErrorKind::DuplicateColumn,
                          fmt::format("column '{}' already exists", name));
    }
    std::size_t pos = names_.size();
    lookup_.emplace(name, pos);
    names_.push_back(std::move(name));
    return pos;
}

auto ColumnIndex::insert_at(std::size_t position, std::string name) -> Result<void> {
    if (position > names_.size()) {
        return make_error(ErrorKind::NonContiguousInsert,
                          fmt::format("cannot insert at position {} into {} columns", position,
                                      names_.size()));
    }
    if (lookup_.contains(name)) {
        return make_error(ErrorKind::DuplicateColumn,
                          fmt::format("column '{}' already exists", name));
    }
    names_.insert(names_.begin() + static_cast<std::ptrdiff_t>(position), std::move(name));
    rebuild();
    return {};
}

auto ColumnIndex::rename(const ColumnKey& key, std::string new_name) -> Result<void> {
    auto pos = position(key);
    if (!pos) {
        return std::unexpected(pos.error());
    }
    if (names_[*pos] == new_name) {
        return {};
    }
    if (lookup_.contains(new_name)) {
        return make_error(ErrorKind::DuplicateColumn,
                          fmt::format("cannot rename '{}' to '{}': name already exists",
                                      names_[*pos], new_name));
    }
    lookup_.erase(names_[*pos]);
    lookup_.emplace(new_name, *pos);
    names_[*pos] = std::move(new_name);
    return {};
}

auto ColumnIndex::set_names(std::vector<std::string> names) -> Result<void> {
    if (names.size() != names_.size()) {
        return make_error(ErrorKind::LengthMismatch,
                          fmt::format("expected {} names, got {}", names_.size(), names.size()));
    }
    if (auto dup = find_duplicate(names)) {
        return make_error(ErrorKind::DuplicateColumn,
                          fmt::format("duplicate column name '{}'", *dup));
    }
    names_ = std::move(names);
    rebuild();
    return {};
}

auto ColumnIndex::remove(std::size_t position) -> Result<void> {
    if (position >= names_.size()) {
        return make_error(ErrorKind::UnknownColumn,
                          fmt::format("column position {} out of range for {} columns", position,
                                      names_.size()));
    }
    names_.erase(names_.begin() + static_cast<std::ptrdiff_t>(position));
    rebuild();
    return {};
}

auto ColumnIndex::next_name(std::string_view prefix) const -> std::string {
    std::size_t k = names_.size() + 1;
    std::string candidate = fmt::format("{}{}", prefix, k);
    while (lookup_.contains(candidate)) {
        candidate = fmt::format("{}{}", prefix, ++k);
    }
    return candidate;
}

auto generate_names(std::size_t count, std::string_view prefix) -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(count);
    for (std::size_t i = 1; i <= count; ++i) {
        names.push_back(fmt::format("{}{}", prefix, i));
    }
    return names;
}

auto mask_positions(const std::vector<bool>& mask) -> std::vector<std::size_t> {
    std::vector<std::size_t> positions;
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) {
            positions.push_back(i);
        }
    }
    return positions;
}

}  // namespace tabula
