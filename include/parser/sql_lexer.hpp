#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlaudit {

/**
 * @brief A lexical token of PostgreSQL SQL text
 *
 * begin/end are byte offsets into the scanned text (end exclusive).
 * Whitespace and comments never produce tokens.
 */
struct SqlToken {
    enum class Kind {
        WORD,            // keyword or unquoted identifier
        QUOTED_IDENT,    // "identifier"
        STRING,          // 'x', E'x', B'x', X'x', N'x', U&'x'
        DOLLAR_STRING,   // $$x$$ / $tag$x$tag$
        NUMBER,
        PARAMETER,       // $1
        OPERATOR,        // run of operator characters
        PUNCT            // ( ) , ; [ ] .
    };

    Kind kind;
    size_t begin;
    size_t end;

    [[nodiscard]] size_t size() const { return end - begin; }
};

/**
 * @brief Literal- and comment-aware scanner for PostgreSQL text
 *
 * Supplies token positions for edits that must not be fooled by keywords
 * appearing inside string literals, quoted identifiers or comments:
 * locating the WHERE keyword, finding the end of the last real token of a
 * statement, renumbering $n parameters.
 *
 * Unterminated literals and comments run to the end of the text.
 */
class SqlLexer {
public:
    /**
     * @brief Tokenize the whole text
     */
    [[nodiscard]] static std::vector<SqlToken> tokenize(std::string_view sql);

    /**
     * @brief True when token is a WORD equal to keyword (case-insensitive)
     */
    [[nodiscard]] static bool is_keyword(std::string_view sql, const SqlToken& token,
                                         std::string_view keyword);

    /**
     * @brief Parameter number of a PARAMETER token ($12 -> 12), 0 if not one
     */
    [[nodiscard]] static size_t parameter_number(std::string_view sql, const SqlToken& token);
};

} // namespace sqlaudit
