#include "parser/sql_lexer.hpp"

#include <cstdint>

namespace sqlaudit {

// ============================================================================
// Lookup table for character classification (locale independent)
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER   = 0,
    CC_SPACE   = 1,
    CC_DIGIT   = 2,
    CC_ALPHA   = 4,   // a-z A-Z _ and bytes >= 0x80 (UTF-8 identifiers)
    CC_OPER    = 8,
    CC_PUNCT   = 16,
};

struct CharTable {
    uint8_t cls[256];

    constexpr CharTable() : cls{} {
        for (int i = 0; i < 256; ++i) {
            cls[i] = (i >= 0x80) ? CC_ALPHA : CC_OTHER;
        }
        cls[static_cast<unsigned char>(' ')] = CC_SPACE;
        cls[static_cast<unsigned char>('\t')] = CC_SPACE;
        cls[static_cast<unsigned char>('\n')] = CC_SPACE;
        cls[static_cast<unsigned char>('\r')] = CC_SPACE;
        cls[static_cast<unsigned char>('\f')] = CC_SPACE;
        cls[static_cast<unsigned char>('\v')] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 'A'; i <= 'Z'; ++i) cls[i] = CC_ALPHA;
        cls[static_cast<unsigned char>('_')] = CC_ALPHA;

        for (const char c : {'+', '-', '*', '/', '<', '>', '=', '~', '!',
                             '@', '#', '%', '^', '&', '|', '`', '?', ':'}) {
            cls[static_cast<unsigned char>(c)] = CC_OPER;
        }
        for (const char c : {'(', ')', ',', ';', '[', ']', '.'}) {
            cls[static_cast<unsigned char>(c)] = CC_PUNCT;
        }
    }
};

constexpr CharTable CT{};

inline bool ct_space(unsigned char c)       { return CT.cls[c] == CC_SPACE; }
inline bool ct_digit(unsigned char c)       { return CT.cls[c] == CC_DIGIT; }
inline bool ct_ident_start(unsigned char c) { return CT.cls[c] == CC_ALPHA; }
inline bool ct_ident_cont(unsigned char c)  {
    return CT.cls[c] == CC_ALPHA || CT.cls[c] == CC_DIGIT || c == '$';
}
inline bool ct_oper(unsigned char c)        { return CT.cls[c] == CC_OPER; }
inline bool ct_punct(unsigned char c)       { return CT.cls[c] == CC_PUNCT; }

inline unsigned char at(std::string_view s, size_t i) {
    return i < s.size() ? static_cast<unsigned char>(s[i]) : '\0';
}

inline char lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

// Returns position after the closing quote. Doubled quotes are escapes;
// with backslash_escapes, \x escapes the next byte too.
size_t scan_quoted(std::string_view sql, size_t pos, char quote, bool backslash_escapes) {
    size_t i = pos + 1;
    while (i < sql.size()) {
        const char c = sql[i];
        if (backslash_escapes && c == '\\') {
            i += 2;
            continue;
        }
        if (c == quote) {
            if (at(sql, i + 1) == static_cast<unsigned char>(quote)) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return sql.size();
}

// Block comments nest in PostgreSQL
size_t scan_block_comment(std::string_view sql, size_t pos) {
    size_t i = pos + 2;
    int depth = 1;
    while (i < sql.size() && depth > 0) {
        if (sql[i] == '/' && at(sql, i + 1) == '*') {
            ++depth;
            i += 2;
        } else if (sql[i] == '*' && at(sql, i + 1) == '/') {
            --depth;
            i += 2;
        } else {
            ++i;
        }
    }
    return i;
}

// $tag$ opener at pos; returns length of the tag delimiter or 0
size_t dollar_tag_length(std::string_view sql, size_t pos) {
    size_t i = pos + 1;
    if (at(sql, i) == '$') return 2;
    if (!ct_ident_start(at(sql, i))) return 0;
    while (i < sql.size() && (ct_ident_start(at(sql, i)) || ct_digit(at(sql, i)))) {
        ++i;
    }
    if (at(sql, i) != '$') return 0;
    return i - pos + 1;
}

size_t scan_number(std::string_view sql, size_t pos) {
    size_t i = pos;
    while (i < sql.size()) {
        const unsigned char c = at(sql, i);
        if (ct_digit(c) || ct_ident_start(c) || c == '.') {
            if (c == '.' && at(sql, i + 1) == '.') break;
            if ((c == 'e' || c == 'E') && (at(sql, i + 1) == '+' || at(sql, i + 1) == '-') &&
                ct_digit(at(sql, i + 2))) {
                i += 2;
                continue;
            }
            ++i;
            continue;
        }
        break;
    }
    return i;
}

} // anonymous namespace

std::vector<SqlToken> SqlLexer::tokenize(std::string_view sql) {
    std::vector<SqlToken> tokens;
    tokens.reserve(sql.size() / 4 + 1);

    const size_t len = sql.size();
    size_t i = 0;
    while (i < len) {
        const unsigned char c = at(sql, i);
        const unsigned char next = at(sql, i + 1);

        if (ct_space(c)) {
            ++i;
            continue;
        }

        // Comments
        if (c == '-' && next == '-') {
            while (i < len && sql[i] != '\n') ++i;
            continue;
        }
        if (c == '/' && next == '*') {
            i = scan_block_comment(sql, i);
            continue;
        }

        // String literal prefixes: E'..' B'..' X'..' N'..' U&'..'
        if ((c == 'e' || c == 'E') && next == '\'') {
            const size_t end = scan_quoted(sql, i + 1, '\'', true);
            tokens.push_back({SqlToken::Kind::STRING, i, end});
            i = end;
            continue;
        }
        if ((c == 'b' || c == 'B' || c == 'x' || c == 'X' || c == 'n' || c == 'N') && next == '\'') {
            const size_t end = scan_quoted(sql, i + 1, '\'', false);
            tokens.push_back({SqlToken::Kind::STRING, i, end});
            i = end;
            continue;
        }
        if ((c == 'u' || c == 'U') && next == '&' &&
            (at(sql, i + 2) == '\'' || at(sql, i + 2) == '"')) {
            const char quote = sql[i + 2];
            const size_t end = scan_quoted(sql, i + 2, quote, false);
            tokens.push_back({quote == '\'' ? SqlToken::Kind::STRING : SqlToken::Kind::QUOTED_IDENT,
                              i, end});
            i = end;
            continue;
        }

        if (c == '\'') {
            const size_t end = scan_quoted(sql, i, '\'', false);
            tokens.push_back({SqlToken::Kind::STRING, i, end});
            i = end;
            continue;
        }

        if (c == '"') {
            const size_t end = scan_quoted(sql, i, '"', false);
            tokens.push_back({SqlToken::Kind::QUOTED_IDENT, i, end});
            i = end;
            continue;
        }

        if (c == '$') {
            if (ct_digit(next)) {
                size_t end = i + 1;
                while (end < len && ct_digit(at(sql, end))) ++end;
                tokens.push_back({SqlToken::Kind::PARAMETER, i, end});
                i = end;
                continue;
            }
            const size_t tag_len = dollar_tag_length(sql, i);
            if (tag_len > 0) {
                const std::string_view tag = sql.substr(i, tag_len);
                const size_t close = sql.find(tag, i + tag_len);
                const size_t end = (close == std::string_view::npos) ? len : close + tag_len;
                tokens.push_back({SqlToken::Kind::DOLLAR_STRING, i, end});
                i = end;
                continue;
            }
            tokens.push_back({SqlToken::Kind::OPERATOR, i, i + 1});
            ++i;
            continue;
        }

        if (ct_digit(c) || (c == '.' && ct_digit(next))) {
            const size_t end = scan_number(sql, i);
            tokens.push_back({SqlToken::Kind::NUMBER, i, end});
            i = end;
            continue;
        }

        if (ct_ident_start(c)) {
            size_t end = i + 1;
            while (end < len && ct_ident_cont(at(sql, end))) ++end;
            tokens.push_back({SqlToken::Kind::WORD, i, end});
            i = end;
            continue;
        }

        if (ct_punct(c)) {
            tokens.push_back({SqlToken::Kind::PUNCT, i, i + 1});
            ++i;
            continue;
        }

        if (ct_oper(c)) {
            size_t end = i;
            while (end < len && ct_oper(at(sql, end))) {
                // A comment start terminates the operator
                if (end > i && ((sql[end] == '-' && at(sql, end + 1) == '-') ||
                                (sql[end] == '/' && at(sql, end + 1) == '*'))) {
                    break;
                }
                ++end;
            }
            tokens.push_back({SqlToken::Kind::OPERATOR, i, end});
            i = end;
            continue;
        }

        // Anything else (stray control bytes, backslash): single-byte operator
        tokens.push_back({SqlToken::Kind::OPERATOR, i, i + 1});
        ++i;
    }

    return tokens;
}

bool SqlLexer::is_keyword(std::string_view sql, const SqlToken& token, std::string_view keyword) {
    if (token.kind != SqlToken::Kind::WORD || token.size() != keyword.size()) {
        return false;
    }
    for (size_t k = 0; k < keyword.size(); ++k) {
        if (lower(sql[token.begin + k]) != lower(keyword[k])) {
            return false;
        }
    }
    return true;
}

size_t SqlLexer::parameter_number(std::string_view sql, const SqlToken& token) {
    if (token.kind != SqlToken::Kind::PARAMETER) {
        return 0;
    }
    size_t n = 0;
    for (size_t k = token.begin + 1; k < token.end; ++k) {
        n = n * 10 + static_cast<size_t>(sql[k] - '0');
    }
    return n;
}

} // namespace sqlaudit
