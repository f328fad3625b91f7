#ifndef METAMARK_CODE_STRING_HPP
#define METAMARK_CODE_STRING_HPP

#include <charconv>
#include <concepts>
#include <memory_resource>
#include <string_view>
#include <system_error>
#include <vector>

#include "common/assert.hpp"
#include "common/code_span_type.hpp"
#include "common/config.hpp"

namespace metamark {

struct Code_String_Span {
    Size begin;
    Size length;
    Code_Span_Type type;

    [[nodiscard]] constexpr Size end() const
    {
        return begin + length;
    }
};

/// @brief A string where some ranges of text are tagged with a `Code_Span_Type`.
/// This is the common output format of diagnostics, AST dumps, and the MetaMark writer,
/// which lets the caller decide whether to print with colors or as plain text.
struct Code_String {
public:
    using iterator = Code_String_Span*;
    using const_iterator = const Code_String_Span*;

private:
    std::pmr::vector<char> m_text;
    std::pmr::vector<Code_String_Span> m_spans;

public:
    [[nodiscard]] Code_String(std::pmr::memory_resource* memory = std::pmr::get_default_resource())
        : m_text(memory)
        , m_spans(memory)
    {
    }

    [[nodiscard]] Size get_text_length() const
    {
        return m_text.size();
    }

    [[nodiscard]] Size get_span_count() const
    {
        return m_spans.size();
    }

    [[nodiscard]] std::string_view get_text() const
    {
        return { m_text.data(), m_text.size() };
    }

    [[nodiscard]] std::string_view get_text(const Code_String_Span& span) const
    {
        return get_text().substr(span.begin, span.length);
    }

    void clear() noexcept
    {
        m_text.clear();
        m_spans.clear();
    }

    /// @brief Appends a raw range of text to the string.
    /// This is typically useful for e.g. whitespace between pieces of code.
    void append(std::string_view text)
    {
        m_text.insert(m_text.end(), text.begin(), text.end());
    }

    void append(char c)
    {
        m_text.push_back(c);
    }

    void append(Size amount, char c)
    {
        m_text.insert(m_text.end(), amount, c);
    }

    /// @brief Appends a span of the given type.
    /// Empty text is ignored, so that no empty spans are ever created.
    void append(std::string_view text, Code_Span_Type type)
    {
        if (text.empty()) {
            return;
        }
        m_spans.push_back({ .begin = m_text.size(), .length = text.size(), .type = type });
        m_text.insert(m_text.end(), text.begin(), text.end());
    }

    void append(char c, Code_Span_Type type)
    {
        m_spans.push_back({ .begin = m_text.size(), .length = 1, .type = type });
        m_text.push_back(c);
    }

    template <std::integral T>
    void append_integer(T x)
    {
        char buffer[24];
        const auto result = std::to_chars(buffer, buffer + sizeof(buffer), x);
        METAMARK_ASSERT(result.ec == std::errc {});
        append(std::string_view(buffer, result.ptr));
    }

    template <std::integral T>
    void append_integer(T x, Code_Span_Type type)
    {
        char buffer[24];
        const auto result = std::to_chars(buffer, buffer + sizeof(buffer), x);
        METAMARK_ASSERT(result.ec == std::errc {});
        append(std::string_view(buffer, result.ptr), type);
    }

    struct Scoped_Builder;

    /// @brief Starts building a single code span out of multiple parts which will be fused
    /// together.
    /// For example:
    /// ```
    /// string.build(Code_Span_Type::diagnostic_code_position)
    ///     .append(file)
    ///     .append(':')
    ///     .append_integer(line);
    /// ```
    /// @param type the type of the appended span as a whole
    Scoped_Builder build(Code_Span_Type type) &;

    [[nodiscard]] iterator begin()
    {
        return m_spans.data();
    }

    [[nodiscard]] iterator end()
    {
        return m_spans.data() + Difference(m_spans.size());
    }

    [[nodiscard]] const_iterator begin() const
    {
        return m_spans.data();
    }

    [[nodiscard]] const_iterator end() const
    {
        return m_spans.data() + Difference(m_spans.size());
    }
};

struct [[nodiscard]] Code_String::Scoped_Builder {
private:
    Code_String& self;
    Size initial_size;
    Code_Span_Type type;

public:
    Scoped_Builder(Code_String& self, Code_Span_Type type)
        : self { self }
        , initial_size { self.m_text.size() }
        , type { type }
    {
    }

    ~Scoped_Builder() noexcept(false)
    {
        METAMARK_ASSERT(self.m_text.size() >= initial_size);
        const Size length = self.m_text.size() - initial_size;
        if (length != 0) {
            self.m_spans.push_back({ .begin = initial_size, .length = length, .type = type });
        }
    }

    Scoped_Builder(const Scoped_Builder&) = delete;
    Scoped_Builder& operator=(const Scoped_Builder&) = delete;

    Scoped_Builder& append(char c)
    {
        self.append(c);
        return *this;
    }

    Scoped_Builder& append(Size amount, char c)
    {
        self.append(amount, c);
        return *this;
    }

    Scoped_Builder& append(std::string_view text)
    {
        self.append(text);
        return *this;
    }

    template <std::integral T>
    Scoped_Builder& append_integer(T x)
    {
        self.append_integer(x);
        return *this;
    }
};

inline Code_String::Scoped_Builder Code_String::build(Code_Span_Type type) &
{
    return { *this, type };
}

} // namespace metamark

#endif
