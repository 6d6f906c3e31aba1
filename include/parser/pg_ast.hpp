#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlaudit {

/**
 * @brief Read-only view into a libpg_query JSON parse tree
 *
 * Wraps glz::json_t. The parsed document is shared between all views taken
 * from it, so child access never copies subtrees. Accessing a missing key or
 * index yields a null node, which keeps recursive AST walks free of checks.
 *
 * Tree shape: {"version": N, "stmts": [{"stmt": {"InsertStmt": {...}},
 * "stmt_location": 0, "stmt_len": 42}]}
 */
class AstNode {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    AstNode() = default;

    [[nodiscard]] static AstNode parse(std::string_view json_text) {
        auto doc = std::make_shared<glz::json_t>();
        const std::string buffer(json_text);
        auto ec = glz::read_json(*doc, buffer);
        if (ec) {
            throw parse_error("parse tree is not valid JSON");
        }
        const glz::json_t* root = doc.get();
        return AstNode(std::move(doc), root);
    }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return node_ == nullptr || node_->is_null(); }
    [[nodiscard]] bool is_object() const { return node_ != nullptr && node_->is_object(); }
    [[nodiscard]] bool is_array() const { return node_ != nullptr && node_->is_array(); }
    [[nodiscard]] bool is_string() const { return node_ != nullptr && node_->is_string(); }
    [[nodiscard]] bool is_number() const { return node_ != nullptr && node_->is_number(); }
    [[nodiscard]] bool is_boolean() const { return node_ != nullptr && node_->is_boolean(); }

    [[nodiscard]] size_t size() const {
        if (is_array()) return node_->get_array().size();
        if (is_object()) return node_->get_object().size();
        return 0;
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!is_object()) return false;
        const auto& obj = node_->get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Element Access =====

    [[nodiscard]] AstNode operator[](std::string_view key) const {
        if (!is_object()) return {};
        const auto& obj = node_->get_object();
        auto it = obj.find(std::string(key));
        if (it == obj.end()) return {};
        return AstNode(doc_, &it->second);
    }

    [[nodiscard]] AstNode operator[](size_t idx) const {
        if (!is_array()) return {};
        const auto& arr = node_->get_array();
        if (idx >= arr.size()) return {};
        return AstNode(doc_, &arr[idx]);
    }

    // ===== Value Extraction =====

    [[nodiscard]] std::string as_string() const {
        return is_string() ? node_->get<std::string>() : std::string{};
    }

    [[nodiscard]] std::optional<int64_t> as_int() const {
        if (!is_number()) return std::nullopt;
        const double d = node_->get<double>();
        if (!std::isfinite(d) || d != std::floor(d)) return std::nullopt;
        return static_cast<int64_t>(d);
    }

    [[nodiscard]] bool as_bool() const {
        return is_boolean() && node_->get<bool>();
    }

    /// String member or empty
    [[nodiscard]] std::string get_string(std::string_view key) const {
        return (*this)[key].as_string();
    }

    /// Integer member or std::nullopt
    [[nodiscard]] std::optional<int64_t> get_int(std::string_view key) const {
        return (*this)[key].as_int();
    }

    /// True when the member exists and is not JSON null
    [[nodiscard]] bool has(std::string_view key) const {
        return !(*this)[key].is_null();
    }

    // ===== Node-tag helpers =====

    /**
     * @brief {"RangeVar": {...}} -> {...}; any other node is returned as is
     *
     * libpg_query wraps nodes of polymorphic fields in a one-key object named
     * after the node type, but embeds typed fields (InsertStmt.relation)
     * directly.
     */
    [[nodiscard]] AstNode unwrap(std::string_view type_name) const {
        if (contains(type_name)) return (*this)[type_name];
        return *this;
    }

    /// Node type tag of a wrapped node ({"ParamRef": {...}} -> "ParamRef")
    [[nodiscard]] std::string tag() const {
        if (!is_object() || node_->get_object().size() != 1) return {};
        return node_->get_object().begin()->first;
    }

    /// Body of a wrapped node ({"ParamRef": {...}} -> {...})
    [[nodiscard]] AstNode body() const {
        if (!is_object() || node_->get_object().size() != 1) return {};
        return AstNode(doc_, &node_->get_object().begin()->second);
    }

    /**
     * @brief Smallest "location" in this subtree, or std::nullopt
     *
     * Locations are byte offsets into the parsed text; -1 means unknown and
     * is ignored.
     */
    [[nodiscard]] std::optional<int64_t> min_location() const {
        int64_t best = std::numeric_limits<int64_t>::max();
        collect_min_location(node_, best);
        if (best == std::numeric_limits<int64_t>::max()) return std::nullopt;
        return best;
    }

    // ===== Array iteration =====

    class const_iterator {
        friend class AstNode;

        std::shared_ptr<const glz::json_t> doc_;
        const array_t* arr_ = nullptr;
        size_t idx_ = 0;

        const_iterator(std::shared_ptr<const glz::json_t> doc, const array_t* arr, size_t idx)
            : doc_(std::move(doc)), arr_(arr), idx_(idx) {}

    public:
        const_iterator() = default;

        [[nodiscard]] AstNode operator*() const { return AstNode(doc_, &(*arr_)[idx_]); }

        const_iterator& operator++() {
            ++idx_;
            return *this;
        }

        [[nodiscard]] bool operator==(const const_iterator& o) const { return idx_ == o.idx_; }
        [[nodiscard]] bool operator!=(const const_iterator& o) const { return !(*this == o); }
    };

    /// Iterates elements of an array; a non-array iterates as empty
    [[nodiscard]] const_iterator begin() const {
        if (!is_array()) return {};
        return const_iterator(doc_, &node_->get_array(), 0);
    }

    [[nodiscard]] const_iterator end() const {
        if (!is_array()) return {};
        return const_iterator(doc_, &node_->get_array(), node_->get_array().size());
    }

    /// Members of an object (key, child); empty for anything else
    [[nodiscard]] std::vector<std::pair<std::string, AstNode>> items() const {
        std::vector<std::pair<std::string, AstNode>> out;
        if (!is_object()) return out;
        for (const auto& [key, child] : node_->get_object()) {
            out.emplace_back(key, AstNode(doc_, &child));
        }
        return out;
    }

private:
    AstNode(std::shared_ptr<const glz::json_t> doc, const glz::json_t* node)
        : doc_(std::move(doc)), node_(node) {}

    static void collect_min_location(const glz::json_t* node, int64_t& best) {
        if (node == nullptr) return;
        if (node->is_array()) {
            for (const auto& child : node->get_array()) {
                collect_min_location(&child, best);
            }
            return;
        }
        if (!node->is_object()) return;
        for (const auto& [key, child] : node->get_object()) {
            if (key == "location" && child.is_number()) {
                const auto loc = static_cast<int64_t>(child.get<double>());
                if (loc >= 0 && loc < best) best = loc;
                continue;
            }
            collect_min_location(&child, best);
        }
    }

    std::shared_ptr<const glz::json_t> doc_;
    const glz::json_t* node_ = nullptr;
};

} // namespace sqlaudit
