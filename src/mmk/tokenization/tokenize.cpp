#include <algorithm>
#include <functional>
#include <span>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "mmk/tokenization/tokenize.hpp"

namespace metamark::mmk {

namespace {

enum struct Anchor : Default_Underlying {
    /// @brief The rule can match at any position.
    anywhere,
    /// @brief The rule can only match at the first column of a line.
    /// Such rules include any indentation in their lexeme.
    line_start
};

/// @brief A lexical rule.
/// `match` returns the length of the lexeme at the start of the given string,
/// or zero if the rule does not match.
struct Rule {
    Token_Type type;
    int priority;
    Anchor anchor;
    Size (*match)(std::string_view) noexcept;
};

struct Rule_Match {
    const Rule* rule;
    Size length;
};

[[nodiscard]] Size match_code_fence(std::string_view str) noexcept
{
    Size i = match_blank(str);
    if (!str.substr(i).starts_with("```")) {
        return 0;
    }
    i += 3;
    while (i < str.size() && !is_line_break(str[i])) {
        ++i;
    }
    return i + match_line_break(str.substr(i));
}

[[nodiscard]] Size match_closing_code_fence(std::string_view str) noexcept
{
    Size i = match_blank(str);
    if (!str.substr(i).starts_with("```")) {
        return 0;
    }
    i += 3;
    i += match_blank(str.substr(i));
    if (i != str.size() && !is_line_break(str[i])) {
        return 0;
    }
    return i + match_line_break(str.substr(i));
}

[[nodiscard]] Size match_frontmatter_delimiter(std::string_view str) noexcept
{
    if (!str.starts_with("---")) {
        return 0;
    }
    const Size i = 3 + match_blank(str.substr(3));
    if (i == str.size()) {
        return i;
    }
    const Size line_break = match_line_break(str.substr(i));
    return line_break == 0 ? 0 : i + line_break;
}

/// @brief Matches `open`, one or more characters that are neither `stop` nor line breaks (unless
/// `multiline` is set), and `close`.
[[nodiscard]] Size match_enclosed(std::string_view str,
                                  std::string_view open,
                                  char stop,
                                  std::string_view close,
                                  bool multiline = false) noexcept
{
    if (!str.starts_with(open)) {
        return 0;
    }
    Size i = open.size();
    while (i < str.size() && str[i] != stop && (multiline || !is_line_break(str[i]))) {
        ++i;
    }
    if (i == open.size() || !str.substr(i).starts_with(close)) {
        return 0;
    }
    return i + close.size();
}

[[nodiscard]] Size match_component_start(std::string_view str) noexcept
{
    return match_enclosed(str, "[[component:", ']', "]]");
}

[[nodiscard]] Size match_component_end(std::string_view str) noexcept
{
    constexpr std::string_view marker = "[[/component]]";
    return str.starts_with(marker) ? marker.size() : 0;
}

[[nodiscard]] Size match_annotation(std::string_view str) noexcept
{
    return match_enclosed(str, "@[", ']', "]");
}

[[nodiscard]] Size match_comment(std::string_view str) noexcept
{
    Size i = match_blank(str);
    if (!str.substr(i).starts_with("%%")) {
        return 0;
    }
    i += 2;
    if (i < str.size() && !is_space(str[i])) {
        return 0;
    }
    while (i < str.size() && !is_line_break(str[i])) {
        ++i;
    }
    return i;
}

[[nodiscard]] Size match_bold(std::string_view str) noexcept
{
    return match_enclosed(str, "**", '*', "**");
}

[[nodiscard]] Size match_italic(std::string_view str) noexcept
{
    return match_enclosed(str, "*", '*', "*");
}

[[nodiscard]] Size match_inline_code(std::string_view str) noexcept
{
    return match_enclosed(str, "`", '`', "`");
}

[[nodiscard]] Size match_link(std::string_view str) noexcept
{
    const Size text_length = match_enclosed(str, "[", ']', "](");
    if (text_length == 0) {
        return 0;
    }
    Size i = text_length;
    while (i < str.size() && str[i] != ')' && !is_line_break(str[i])) {
        ++i;
    }
    if (i == text_length || i == str.size() || str[i] != ')') {
        return 0;
    }
    return i + 1;
}

[[nodiscard]] Size match_block_math(std::string_view str) noexcept
{
    return match_enclosed(str, "$$", '$', "$$", true);
}

[[nodiscard]] Size match_inline_math(std::string_view str) noexcept
{
    return match_enclosed(str, "$", '$', "$");
}

[[nodiscard]] Size match_unordered_list_marker(std::string_view str) noexcept
{
    const Size indentation = std::min(str.find_first_not_of(' '), str.size());
    return str.substr(indentation).starts_with("- ") ? indentation + 2 : 0;
}

[[nodiscard]] Size match_ordered_list_marker(std::string_view str) noexcept
{
    const Size indentation = std::min(str.find_first_not_of(' '), str.size());
    const Size digits = match_decimal_digits(str.substr(indentation));
    if (digits == 0 || !str.substr(indentation + digits).starts_with(". ")) {
        return 0;
    }
    return indentation + digits + 2;
}

[[nodiscard]] Size match_heading_marker(std::string_view str) noexcept
{
    const Size indentation = match_blank(str);
    const Size level = std::min(str.find_first_not_of('#', indentation), str.size()) - indentation;
    if (level < 1 || level > 6 || !str.substr(indentation + level).starts_with(' ')) {
        return 0;
    }
    return indentation + level + 1;
}

[[nodiscard]] Size match_whitespace(std::string_view str) noexcept
{
    return match_blank(str);
}

[[nodiscard]] Size match_newline(std::string_view str) noexcept
{
    return std::min(str.find_first_not_of("\r\n"), str.size());
}

[[nodiscard]] Size match_text(std::string_view str) noexcept;

[[nodiscard]] Size match_frontmatter_text(std::string_view str) noexcept
{
    const auto end = std::ranges::find_if(
        str, [](char c) { return is_space(c) || is_illegal_control(c); });
    return Size(end - str.begin());
}

// clang-format off
constexpr Rule normal_rules[] {
    { Token_Type::code_fence_start,      3, Anchor::line_start, match_code_fence },
    { Token_Type::frontmatter_delimiter, 2, Anchor::line_start, match_frontmatter_delimiter },
    { Token_Type::component_start,       2, Anchor::anywhere,   match_component_start },
    { Token_Type::component_end,         2, Anchor::anywhere,   match_component_end },
    { Token_Type::annotation,            2, Anchor::anywhere,   match_annotation },
    { Token_Type::comment,               2, Anchor::line_start, match_comment },
    { Token_Type::bold,                  2, Anchor::anywhere,   match_bold },
    { Token_Type::italic,                2, Anchor::anywhere,   match_italic },
    { Token_Type::inline_code,           2, Anchor::anywhere,   match_inline_code },
    { Token_Type::link,                  2, Anchor::anywhere,   match_link },
    { Token_Type::block_math,            2, Anchor::anywhere,   match_block_math },
    { Token_Type::inline_math,           2, Anchor::anywhere,   match_inline_math },
    { Token_Type::unordered_list_marker, 2, Anchor::line_start, match_unordered_list_marker },
    { Token_Type::ordered_list_marker,   2, Anchor::line_start, match_ordered_list_marker },
    { Token_Type::heading_marker,        2, Anchor::line_start, match_heading_marker },
    { Token_Type::whitespace,            2, Anchor::anywhere,   match_whitespace },
    { Token_Type::newline,               2, Anchor::anywhere,   match_newline },
    { Token_Type::text,                  1, Anchor::anywhere,   match_text },
};

constexpr Rule frontmatter_rules[] {
    { Token_Type::frontmatter_delimiter, 2, Anchor::line_start, match_frontmatter_delimiter },
    { Token_Type::whitespace,            2, Anchor::anywhere,   match_whitespace },
    { Token_Type::newline,               2, Anchor::anywhere,   match_newline },
    { Token_Type::text,                  1, Anchor::anywhere,   match_frontmatter_text },
};
// clang-format on

static_assert(std::ranges::is_sorted(normal_rules, std::ranges::greater {}, &Rule::priority));
static_assert(std::ranges::is_sorted(frontmatter_rules, std::ranges::greater {}, &Rule::priority));

/// @brief Returns the winning rule at the start of `str`.
/// Rules are tried in order of descending priority; once some rule has matched, rules of lower
/// priority are no longer considered.
[[nodiscard]] Rule_Match match_rules(std::span<const Rule> rules,
                                     std::string_view str,
                                     bool line_start) noexcept
{
    Rule_Match best { nullptr, 0 };
    for (const Rule& rule : rules) {
        if (best.rule != nullptr && rule.priority < best.rule->priority) {
            break;
        }
        if (rule.anchor == Anchor::line_start && !line_start) {
            continue;
        }
        if (const Size length = rule.match(str); length > best.length) {
            best = { &rule, length };
        }
    }
    return best;
}

[[nodiscard]] constexpr bool can_start_inline_rule(char c) noexcept
{
    return c == '*' || c == '`' || c == '[' || c == '$' || c == '@';
}

/// @brief Returns `true` if some rule that can appear in the middle of a line matches at the start
/// of `str`.
[[nodiscard]] bool matches_inline_rule(std::string_view str) noexcept
{
    return std::ranges::any_of(normal_rules, [str](const Rule& rule) {
        return rule.anchor == Anchor::anywhere && rule.type != Token_Type::text
            && rule.match(str) != 0;
    });
}

Size match_text(std::string_view str) noexcept
{
    Size i = 0;
    for (; i < str.size(); ++i) {
        const char c = str[i];
        if (is_space(c) || is_illegal_control(c)) {
            break;
        }
        if (i != 0 && can_start_inline_rule(c) && matches_inline_rule(str.substr(i))) {
            break;
        }
    }
    return i;
}

/// @brief Returns the index of the first tab in list indentation at the start of `line`,
/// or `npos` if `line` is not a list item or has no tabs in its indentation.
[[nodiscard]] Size find_tab_in_list_indentation(std::string_view line) noexcept
{
    const Size indentation = match_blank(line);
    const Size tab = line.substr(0, indentation).find('\t');
    if (tab == std::string_view::npos) {
        return tab;
    }
    const std::string_view content = line.substr(indentation);
    const Size digits = match_decimal_digits(content);
    const bool is_list_item = content.starts_with("- ")
        || (digits != 0 && content.substr(digits).starts_with(". "));
    return is_list_item ? tab : std::string_view::npos;
}

} // namespace

Result<std::optional<Token>, Tokenize_Error> Scanner::next()
{
    switch (m_mode) {
    case Mode::document_start:
        m_mode = Mode::normal;
        if (const Size length = match_frontmatter_delimiter(m_source)) {
            m_mode = Mode::frontmatter;
            return std::optional<Token> { emit(Token_Type::frontmatter_delimiter, length) };
        }
        break;
    case Mode::code_content: return next_code_content();
    case Mode::code_fence_end: return std::optional<Token> { next_code_fence_end() };
    case Mode::normal:
    case Mode::frontmatter: break;
    }

    if (eof()) {
        return std::optional<Token> {};
    }
    Result<Token, Tokenize_Error> result
        = m_mode == Mode::frontmatter ? next_frontmatter() : next_normal();
    if (!result) {
        return result.error();
    }
    return std::optional<Token> { *result };
}

Result<Token, Tokenize_Error> Scanner::next_normal()
{
    const std::string_view str = rest();
    const bool line_start = at_line_start();

    if (line_start) {
        if (const Size tab = find_tab_in_list_indentation(str); tab != std::string_view::npos) {
            return Tokenize_Error { .code = Tokenize_Error_Code::tab_in_list_indentation,
                                    .pos = { .line = m_pos.line,
                                             .column = m_pos.column + tab,
                                             .begin = m_pos.begin + tab } };
        }
    }

    const Rule_Match match = match_rules(normal_rules, str, line_start);
    if (match.rule == nullptr) {
        return Tokenize_Error { .code = Tokenize_Error_Code::illegal_character, .pos = m_pos };
    }
    const Token result = emit(match.rule->type, match.length);
    if (result.type == Token_Type::code_fence_start) {
        m_mode = Mode::code_content;
    }
    return result;
}

Result<Token, Tokenize_Error> Scanner::next_frontmatter()
{
    const Rule_Match match = match_rules(frontmatter_rules, rest(), at_line_start());
    if (match.rule == nullptr) {
        return Tokenize_Error { .code = Tokenize_Error_Code::illegal_character, .pos = m_pos };
    }
    const Token result = emit(match.rule->type, match.length);
    if (result.type == Token_Type::frontmatter_delimiter) {
        m_mode = Mode::normal;
    }
    return result;
}

std::optional<Token> Scanner::next_code_content()
{
    // The content ends at the first line which consists of nothing but a closing fence.
    Size line_begin = m_pos.begin;
    bool closed = false;
    while (line_begin < m_source.size()) {
        if (match_closing_code_fence(m_source.substr(line_begin)) != 0) {
            closed = true;
            break;
        }
        const std::string_view line = m_source.substr(line_begin);
        const Size line_end = Size(std::ranges::find_if(line, is_line_break) - line.begin());
        line_begin += line_end + match_line_break(line.substr(line_end));
    }

    const Size length = line_begin - m_pos.begin;
    m_mode = closed ? Mode::code_fence_end : Mode::normal;
    if (length != 0) {
        return emit(Token_Type::code_content, length);
    }
    if (closed) {
        return next_code_fence_end();
    }
    return std::nullopt;
}

Token Scanner::next_code_fence_end()
{
    const Size length = match_closing_code_fence(rest());
    METAMARK_ASSERT(length != 0);
    m_mode = Mode::normal;
    return emit(Token_Type::code_fence_end, length);
}

Token Scanner::emit(Token_Type type, Size length) noexcept
{
    const Token result { .pos = { m_pos, length }, .type = type };
    advance(length);
    return result;
}

void Scanner::advance(Size length) noexcept
{
    const Size end = m_pos.begin + length;
    for (; m_pos.begin < end; ++m_pos.begin) {
        const char c = m_source[m_pos.begin];
        const bool is_lone_carriage_return = c == '\r'
            && (m_pos.begin + 1 == m_source.size() || m_source[m_pos.begin + 1] != '\n');
        if (c == '\n' || is_lone_carriage_return) {
            ++m_pos.line;
            m_pos.column = 1;
            m_line_begin = m_pos.begin + 1;
        }
        else if (c != '\r' && !is_utf8_continuation(c)) {
            ++m_pos.column;
        }
    }
}

Result<void, Tokenize_Error> tokenize(std::pmr::vector<Token>& out, std::string_view source)
{
    Scanner scanner { source };
    while (true) {
        Result<std::optional<Token>, Tokenize_Error> next = scanner.next();
        if (!next) {
            return next.error();
        }
        if (!*next) {
            return {};
        }
        out.push_back(**next);
    }
}

} // namespace metamark::mmk
