#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlaudit {

// ============================================================================
// Basic Enums
// ============================================================================

enum class OperationKind {
    UNKNOWN,
    INSERT,
    UPDATE,
    DELETE
};

[[nodiscard]] inline constexpr std::string_view operation_kind_to_string(OperationKind k) {
    switch (k) {
        case OperationKind::INSERT:  return "Insert";
        case OperationKind::UPDATE:  return "Update";
        case OperationKind::DELETE:  return "Delete";
        case OperationKind::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

// ============================================================================
// Values
// ============================================================================

/// Text form of a database value; std::nullopt is SQL NULL.
using SqlValue = std::optional<std::string>;

/// Column name -> value. Empty is a valid snapshot (before of INSERT, after of DELETE).
using RowSnapshot = std::map<std::string, SqlValue>;

/// Free-form string properties attached to an audit record.
using PropertyMap = std::map<std::string, std::string>;

inline constexpr char kParamSigil = '$';

/**
 * @brief Parameter name -> bound value, in binding order
 *
 * A name that is not present is "absent"; a name bound to std::nullopt is
 * bound to SQL NULL. Lookups tolerate callers that write "$1" and callers
 * that write "1".
 */
class ParameterMap {
public:
    using Entry = std::pair<std::string, SqlValue>;

    ParameterMap() = default;
    ParameterMap(std::initializer_list<Entry> init) {
        for (const auto& [name, value] : init) {
            set(name, value);
        }
    }

    /// Bind (or rebind) a parameter
    void set(const std::string& name, SqlValue value) {
        if (auto* existing = find_mutable(name)) {
            *existing = std::move(value);
            return;
        }
        entries_.emplace_back(name, std::move(value));
    }

    /// Lookup by exact name, then with the sigil added or removed.
    [[nodiscard]] const SqlValue* find(std::string_view name) const {
        for (const auto& [key, value] : entries_) {
            if (key == name) return &value;
        }
        const std::string alternate = toggle_sigil(name);
        for (const auto& [key, value] : entries_) {
            if (key == alternate) return &value;
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    void clear() { entries_.clear(); }

    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }

    /**
     * @brief Values ordered by parameter number ($1 first)
     *
     * Gaps are filled with NULL. Names that are not numeric are skipped.
     */
    [[nodiscard]] std::vector<SqlValue> positional() const {
        std::vector<SqlValue> values;
        for (const auto& [key, value] : entries_) {
            const auto number = parameter_number(key);
            if (!number) continue;
            if (*number > values.size()) values.resize(*number);
            values[*number - 1] = value;
        }
        return values;
    }

    /// "$3" or "3" -> 3; nullopt when the name is not a positional reference
    [[nodiscard]] static std::optional<size_t> parameter_number(std::string_view name) {
        if (!name.empty() && name.front() == kParamSigil) name.remove_prefix(1);
        if (name.empty() || name.size() > 6) return std::nullopt;
        size_t n = 0;
        for (const char c : name) {
            if (c < '0' || c > '9') return std::nullopt;
            n = n * 10 + static_cast<size_t>(c - '0');
        }
        if (n == 0) return std::nullopt;
        return n;
    }

    [[nodiscard]] static std::string strip_sigil(std::string_view name) {
        if (!name.empty() && name.front() == kParamSigil) name.remove_prefix(1);
        return std::string(name);
    }

private:
    static std::string toggle_sigil(std::string_view name) {
        if (!name.empty() && name.front() == kParamSigil) {
            return std::string(name.substr(1));
        }
        std::string with_sigil;
        with_sigil.reserve(name.size() + 1);
        with_sigil += kParamSigil;
        with_sigil += name;
        return with_sigil;
    }

    SqlValue* find_mutable(std::string_view name) {
        for (auto& [key, value] : entries_) {
            if (key == name) return &value;
        }
        return nullptr;
    }

    std::vector<Entry> entries_;
};

// ============================================================================
// Table identity
// ============================================================================

struct TableName {
    std::optional<std::string> schema;  // nullopt = resolved through search_path
    std::string table;

    TableName() = default;
    TableName(std::string t) : table(std::move(t)) {}
    TableName(std::optional<std::string> s, std::string t)
        : schema(std::move(s)), table(std::move(t)) {}

    std::string full_name() const {
        return schema ? (*schema + "." + table) : table;
    }
};

} // namespace sqlaudit
