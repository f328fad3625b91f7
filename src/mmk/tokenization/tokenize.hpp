#ifndef METAMARK_MMK_TOKENIZE_HPP
#define METAMARK_MMK_TOKENIZE_HPP

#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include "common/result.hpp"
#include "common/source_position.hpp"

#include "mmk/tokenization/token.hpp"
#include "mmk/tokenization/tokenize_error.hpp"

namespace metamark::mmk {

/// @brief A cursor which produces MetaMark tokens one at a time.
///
/// The scanner is a plain value: it holds only a view of the source and its current position.
/// Copying a scanner yields an independent cursor which continues at the same position.
///
/// At every position, a table of lexical rules is tried in order of descending priority.
/// Among the rules of the highest priority that match at all, the longest match wins,
/// and among equally long matches, the rule listed first wins.
/// Fenced code and frontmatter switch the scanner into modes where fewer rules apply:
/// fenced code is emitted as a single `code_content` token,
/// and frontmatter only consists of text, whitespace, and line breaks.
struct Scanner {
private:
    enum struct Mode : Default_Underlying {
        /// @brief Nothing has been scanned yet, so frontmatter may begin.
        document_start,
        normal,
        frontmatter,
        code_content,
        code_fence_end,
    };

    std::string_view m_source;
    Local_Source_Position m_pos { .line = 1, .column = 1, .begin = 0 };
    Size m_line_begin = 0;
    Mode m_mode = Mode::document_start;

public:
    [[nodiscard]] explicit Scanner(std::string_view source) noexcept
        : m_source(source)
    {
    }

    /// @brief Scans the next token.
    /// @return The next token, `std::nullopt` if the input is exhausted, or an error if the
    /// input at the current position matches no lexical rule.
    [[nodiscard]] Result<std::optional<Token>, Tokenize_Error> next();

    [[nodiscard]] Local_Source_Position get_position() const noexcept
    {
        return m_pos;
    }

    [[nodiscard]] std::string_view get_source() const noexcept
    {
        return m_source;
    }

    [[nodiscard]] bool eof() const noexcept
    {
        return m_pos.begin == m_source.size();
    }

private:
    [[nodiscard]] Result<Token, Tokenize_Error> next_normal();
    [[nodiscard]] Result<Token, Tokenize_Error> next_frontmatter();
    [[nodiscard]] std::optional<Token> next_code_content();
    [[nodiscard]] Token next_code_fence_end();

    [[nodiscard]] std::string_view rest() const noexcept
    {
        return m_source.substr(m_pos.begin);
    }

    [[nodiscard]] bool at_line_start() const noexcept
    {
        return m_pos.begin == m_line_begin;
    }

    /// @brief Creates a token of the given length at the current position and advances past it.
    [[nodiscard]] Token emit(Token_Type type, Size length) noexcept;

    void advance(Size length) noexcept;
};

/// @brief Scans the whole `source` into `out`.
/// Tokens which were scanned before an error occurred are kept in `out`.
Result<void, Tokenize_Error> tokenize(std::pmr::vector<Token>& out, std::string_view source);

} // namespace metamark::mmk

#endif
