#include <algorithm>
#include <charconv>
#include <initializer_list>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "mmk/metadata/toml.hpp"

namespace metamark::mmk {

namespace {

using Path = std::pmr::vector<std::pmr::string>;

/// @brief Identifies a value within the document.
/// Keys are prefixed with `.`, and elements of arrays with `#`.
using Location = std::pmr::vector<std::pmr::string>;

enum struct Table_Origin : Default_Underlying { header, dotted_key };

[[nodiscard]] constexpr bool is_bare_key_character(char c) noexcept
{
    return is_ascii_alpha(c) || is_decimal_digit(c) || c == '_' || c == '-';
}

[[nodiscard]] constexpr bool is_value_delimiter(char c) noexcept
{
    return is_space(c) || c == '#' || c == ',' || c == ']' || c == '}';
}

[[nodiscard]] constexpr bool is_date(std::string_view str) noexcept
{
    return str.length() == 10 && match_decimal_digits(str) == 4 && str[4] == '-'
        && match_decimal_digits(str.substr(5)) == 2 && str[7] == '-'
        && match_decimal_digits(str.substr(8)) == 2;
}

[[nodiscard]] constexpr bool is_time_prefix(std::string_view str) noexcept
{
    return str.length() >= 5 && match_decimal_digits(str) == 2 && str[2] == ':'
        && match_decimal_digits(str.substr(3, 2)) == 2;
}

/// @brief Returns `true` if `str` looks like an offset date-time, local date-time, local date,
/// or local time.
[[nodiscard]] constexpr bool is_date_time(std::string_view str) noexcept
{
    if (!is_date(str.substr(0, 10)) && !is_time_prefix(str)) {
        return false;
    }
    return str.find_first_not_of("0123456789-:.TtZz+ ") == std::string_view::npos;
}

struct Toml_Parser {
private:
    std::string_view m_source;
    std::pmr::memory_resource* m_memory;
    Local_Source_Position m_pos { 1, 1, 0 };
    Meta_Object m_root;
    /// @brief The key path of the most recent table header.
    Path m_table;
    /// @brief Tables defined by a table header or an array of tables header.
    std::pmr::vector<Location> m_defined_tables;
    /// @brief Tables created by dotted keys.
    std::pmr::vector<Location> m_dotted_tables;
    /// @brief Inline tables and arrays, which are complete once their value ends.
    std::pmr::vector<Location> m_sealed;
    Size m_depth = 0;

public:
    [[nodiscard]] Toml_Parser(std::string_view source, std::pmr::memory_resource* memory)
        : m_source(source)
        , m_memory(memory)
        , m_root(memory)
        , m_table(memory)
        , m_defined_tables(memory)
        , m_dotted_tables(memory)
        , m_sealed(memory)
    {
    }

    [[nodiscard]] Result<Metadata, Metadata_Error> parse() &&
    {
        while (true) {
            skip_blank();
            if (eof()) {
                break;
            }
            if (peek() == '#') {
                skip_comment();
            }
            if (const Size line_break = match_line_break(rest())) {
                advance(line_break);
                continue;
            }
            if (eof()) {
                break;
            }
            Result<void, Metadata_Error> line
                = peek() == '[' ? parse_table_header() : parse_top_level_key_value();
            if (!line) {
                return std::move(line.error());
            }
            if (Result<void, Metadata_Error> end = expect_line_end(); !end) {
                return std::move(end.error());
            }
        }
        return std::move(m_root);
    }

private:
    [[nodiscard]] bool eof() const noexcept
    {
        return m_pos.begin >= m_source.length();
    }

    [[nodiscard]] char peek(Size offset = 0) const noexcept
    {
        const Size index = m_pos.begin + offset;
        return index < m_source.length() ? m_source[index] : '\0';
    }

    [[nodiscard]] std::string_view rest() const noexcept
    {
        return m_source.substr(std::min(m_pos.begin, m_source.length()));
    }

    void advance(Size length) noexcept
    {
        const Size end = std::min(m_pos.begin + length, m_source.length());
        for (; m_pos.begin < end; ++m_pos.begin) {
            const char c = m_source[m_pos.begin];
            const bool is_lone_carriage_return = c == '\r'
                && (m_pos.begin + 1 == m_source.length() || m_source[m_pos.begin + 1] != '\n');
            if (c == '\n' || is_lone_carriage_return) {
                ++m_pos.line;
                m_pos.column = 1;
            }
            else if (c != '\r' && !is_utf8_continuation(c)) {
                ++m_pos.column;
            }
        }
    }

    void skip_blank() noexcept
    {
        advance(match_blank(rest()));
    }

    void skip_comment() noexcept
    {
        const Size end = rest().find_first_of("\r\n");
        advance(end == std::string_view::npos ? rest().length() : end);
    }

    /// @brief Skips blanks, line breaks, and comments, as they may appear inside arrays.
    void skip_blank_lines_and_comments() noexcept
    {
        while (true) {
            skip_blank();
            if (peek() == '#') {
                skip_comment();
            }
            const Size line_break = match_line_break(rest());
            if (line_break == 0) {
                return;
            }
            advance(line_break);
        }
    }

    [[nodiscard]] Result<void, Metadata_Error> expect_line_end()
    {
        skip_blank();
        if (peek() == '#') {
            skip_comment();
        }
        if (eof()) {
            return {};
        }
        if (const Size line_break = match_line_break(rest())) {
            advance(line_break);
            return {};
        }
        return error("expected the end of the line after a value");
    }

    [[nodiscard]] std::pmr::string concat(std::initializer_list<std::string_view> parts) const
    {
        std::pmr::string result(m_memory);
        for (const std::string_view part : parts) {
            result += part;
        }
        return result;
    }

    [[nodiscard]] std::pmr::string join(std::span<const std::pmr::string> path) const
    {
        std::pmr::string result(m_memory);
        for (const std::pmr::string& key : path) {
            if (!result.empty()) {
                result += '.';
            }
            result += key;
        }
        return result;
    }

    [[nodiscard]] Metadata_Error error_at(Local_Source_Position pos, std::string_view message) const
    {
        return { Metadata_Error_Code::invalid_toml, pos, std::pmr::string(message, m_memory) };
    }

    [[nodiscard]] Metadata_Error error(std::string_view message) const
    {
        return error_at(m_pos, message);
    }

    [[nodiscard]] static bool contains(std::span<const Location> locations,
                                       const Location& location)
    {
        return std::ranges::find(locations, location) != locations.end();
    }

    void push_key(Location& location, std::string_view key) const
    {
        location.push_back(concat({ ".", key }));
    }

    void push_index(Location& location, Size index) const
    {
        char buffer[24];
        const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), index);
        METAMARK_ASSERT(ec == std::errc {});
        location.push_back(concat({ "#", std::string_view(buffer, end) }));
    }

    /// @brief Returns the table that `key` refers to within `table`, creating it if necessary.
    /// If `key` names an array of tables, its last element is returned.
    /// `location` is the location of `table`, and is extended to that of the result.
    /// @return The table, or `nullptr` if `key` holds some other value, or a table that cannot
    /// be extended from `origin`.
    [[nodiscard]] Meta_Object*
    descend(Meta_Object& table, std::string_view key, Location& location, Table_Origin origin)
    {
        push_key(location, key);
        if (contains(m_sealed, location)) {
            return nullptr;
        }
        Meta_Value* value = table.find(key);
        if (!value) {
            value = table.try_insert(key, Meta_Value { Meta_Object { m_memory } });
            if (origin == Table_Origin::dotted_key) {
                m_dotted_tables.push_back(location);
            }
        }
        if (Meta_Object* object = value->as_object()) {
            if (origin == Table_Origin::dotted_key && contains(m_defined_tables, location)) {
                return nullptr;
            }
            return object;
        }
        if (Meta_Array* array = value->as_array(); array && !array->empty()) {
            push_index(location, array->size() - 1);
            if (origin == Table_Origin::dotted_key) {
                return nullptr;
            }
            return array->back().as_object();
        }
        return nullptr;
    }

    [[nodiscard]] Meta_Object* navigate(std::span<const std::pmr::string> path, Location& location)
    {
        Meta_Object* table = &m_root;
        for (const std::pmr::string& key : path) {
            table = descend(*table, key, location, Table_Origin::header);
            if (!table) {
                return nullptr;
            }
        }
        return table;
    }

    [[nodiscard]] Result<std::pmr::string, Metadata_Error> parse_simple_key()
    {
        if (peek() == '"') {
            return parse_basic_string();
        }
        if (peek() == '\'') {
            return parse_literal_string();
        }
        Size length = 0;
        while (is_bare_key_character(peek(length))) {
            ++length;
        }
        if (length == 0) {
            return error("expected a key");
        }
        std::pmr::string result(rest().substr(0, length), m_memory);
        advance(length);
        return result;
    }

    [[nodiscard]] Result<void, Metadata_Error> parse_key(Path& out)
    {
        while (true) {
            skip_blank();
            Result<std::pmr::string, Metadata_Error> key = parse_simple_key();
            if (!key) {
                return std::move(key.error());
            }
            out.push_back(std::move(*key));
            skip_blank();
            if (peek() != '.') {
                return {};
            }
            advance(1);
        }
    }

    [[nodiscard]] Result<void, Metadata_Error> parse_table_header()
    {
        const Local_Source_Position header_pos = m_pos;
        advance(1);
        const bool is_array = peek() == '[';
        if (is_array) {
            advance(1);
        }

        Path path(m_memory);
        if (Result<void, Metadata_Error> key = parse_key(path); !key) {
            return key;
        }
        if (peek() != ']' || (is_array && peek(1) != ']')) {
            return error(is_array ? "expected ']]' at the end of an array of tables header"
                                  : "expected ']' at the end of a table header");
        }
        advance(is_array ? 2 : 1);

        Location location(m_memory);
        if (is_array) {
            const std::span<const std::pmr::string> parent_path(path.data(), path.size() - 1);
            Meta_Object* parent = navigate(parent_path, location);
            if (!parent) {
                return error_at(header_pos,
                                concat({ "cannot define '", join(path),
                                         "' because a key on its path already holds a value" }));
            }
            push_key(location, path.back());
            Meta_Value* existing = parent->find(path.back());
            if (!existing) {
                existing = parent->try_insert(path.back(), Meta_Value { Meta_Array(m_memory) });
            }
            Meta_Array* array = existing->as_array();
            if (!array || contains(m_sealed, location)) {
                return error_at(header_pos,
                                concat({ "cannot define '", join(path), "' as an array of tables ",
                                         "because it already holds a value" }));
            }
            array->push_back(Meta_Value { Meta_Object { m_memory } });
            push_index(location, array->size() - 1);
        }
        else {
            const std::pmr::string joined = join(path);
            if (!navigate(path, location)) {
                return error_at(header_pos,
                                concat({ "cannot define table '", joined,
                                         "' because a key on its path already holds a value" }));
            }
            if (contains(m_defined_tables, location) || contains(m_dotted_tables, location)) {
                return error_at(header_pos,
                                concat({ "table '", joined, "' is defined more than once" }));
            }
        }
        m_defined_tables.push_back(std::move(location));
        m_table = std::move(path);
        return {};
    }

    [[nodiscard]] Result<void, Metadata_Error> parse_top_level_key_value()
    {
        Location location(m_memory);
        Meta_Object* table = navigate(m_table, location);
        METAMARK_ASSERT(table);
        return parse_key_value(*table, location);
    }

    /// @param table_location the location of `table`
    [[nodiscard]] Result<void, Metadata_Error> parse_key_value(Meta_Object& table,
                                                               const Location& table_location)
    {
        const Local_Source_Position key_pos = m_pos;
        Path path(m_memory);
        if (Result<void, Metadata_Error> key = parse_key(path); !key) {
            return key;
        }
        if (peek() != '=') {
            return error("expected '=' after a key");
        }
        advance(1);
        skip_blank();

        Location location(table_location.begin(), table_location.end(), m_memory);
        Meta_Object* target = &table;
        for (Size i = 0; i + 1 < path.size(); ++i) {
            Meta_Object* const parent = target;
            target = descend(*parent, path[i], location, Table_Origin::dotted_key);
            if (!target) {
                const Meta_Value* blocking = parent->find(path[i]);
                if (blocking && (blocking->as_object() || blocking->as_array())) {
                    const std::span<const std::pmr::string> prefix(path.data(), i + 1);
                    return error_at(key_pos,
                                    concat({ "cannot assign to '", join(path), "' because '",
                                             join(prefix), "' cannot be extended" }));
                }
                return error_at(key_pos,
                                concat({ "cannot assign to '", join(path),
                                         "' because a key on its path already holds a value" }));
            }
        }
        push_key(location, path.back());

        Result<Meta_Value, Metadata_Error> value = parse_value(location);
        if (!value) {
            return std::move(value.error());
        }
        const bool is_sealed = value->as_object() || value->as_array();
        if (!target->try_insert(path.back(), std::move(*value))) {
            return error_at(key_pos, concat({ "duplicate key '", join(path), "'" }));
        }
        if (is_sealed) {
            m_sealed.push_back(std::move(location));
        }
        return {};
    }

    /// @param location the location that the value is assigned to
    [[nodiscard]] Result<Meta_Value, Metadata_Error> parse_value(const Location& location)
    {
        if (m_depth >= default_max_nesting_depth) {
            return error("values are nested too deeply");
        }
        ++m_depth;
        Result<Meta_Value, Metadata_Error> result = parse_value_impl(location);
        --m_depth;
        return result;
    }

    [[nodiscard]] Result<Meta_Value, Metadata_Error> parse_value_impl(const Location& location)
    {
        switch (peek()) {
        case '"':
            return to_value(rest().starts_with("\"\"\"") ? parse_multiline_basic_string()
                                                         : parse_basic_string());
        case '\'':
            return to_value(rest().starts_with("'''") ? parse_multiline_literal_string()
                                                      : parse_literal_string());
        case '[': return parse_array(location);
        case '{': return parse_inline_table(location);
        default: return parse_bare_value();
        }
    }

    [[nodiscard]] static Result<Meta_Value, Metadata_Error>
    to_value(Result<std::pmr::string, Metadata_Error>&& string)
    {
        if (!string) {
            return std::move(string.error());
        }
        return Meta_Value { std::move(*string) };
    }

    [[nodiscard]] Result<Meta_Value, Metadata_Error> parse_bare_value()
    {
        const Local_Source_Position value_pos = m_pos;
        const std::string_view remainder = rest();
        Size length = 0;
        while (length < remainder.length() && !is_value_delimiter(remainder[length])) {
            ++length;
        }
        // A local date may be followed by a space and a time.
        if (is_date(remainder.substr(0, length)) && peek(length) == ' '
            && is_time_prefix(remainder.substr(length + 1, 5))) {
            ++length;
            while (length < remainder.length() && !is_value_delimiter(remainder[length])) {
                ++length;
            }
        }

        const std::string_view token = remainder.substr(0, length);
        if (token.empty()) {
            return error("expected a value");
        }
        advance(length);

        if (token == "true") {
            return Meta_Value { true };
        }
        if (token == "false") {
            return Meta_Value { false };
        }
        if (is_date_time(token)) {
            return Meta_Value { std::pmr::string(token, m_memory) };
        }
        if (const std::optional<double> number = parse_number(token)) {
            return Meta_Value { *number };
        }
        return error_at(value_pos, concat({ "invalid value '", token, "'" }));
    }

    /// @brief Appends `digits` to `out` with underscores removed.
    /// @return `false` if an underscore is not surrounded by digits.
    [[nodiscard]] static bool
    append_without_underscores(std::pmr::string& out, std::string_view digits, bool hex)
    {
        const auto is_digit = [hex](char c) {
            return hex ? is_hexadecimal_digit(c) : is_decimal_digit(c);
        };
        for (Size i = 0; i < digits.length(); ++i) {
            if (digits[i] != '_') {
                out.push_back(digits[i]);
                continue;
            }
            if (i == 0 || i + 1 == digits.length() || !is_digit(digits[i - 1])
                || !is_digit(digits[i + 1])) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] std::optional<double> parse_number(std::string_view token) const
    {
        constexpr double infinity = std::numeric_limits<double>::infinity();
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();
        if (token == "inf" || token == "+inf") {
            return infinity;
        }
        if (token == "-inf") {
            return -infinity;
        }
        if (token == "nan" || token == "+nan" || token == "-nan") {
            return nan;
        }

        std::string_view digits = token;
        const bool negative = digits.starts_with('-');
        if (negative || digits.starts_with('+')) {
            digits.remove_prefix(1);
        }

        std::pmr::string number(m_memory);
        if (digits.length() > 2 && digits[0] == '0'
            && (digits[1] == 'x' || digits[1] == 'o' || digits[1] == 'b')) {
            if (digits.length() != token.length()) {
                return {};
            }
            const int base = digits[1] == 'x' ? 16 : digits[1] == 'o' ? 8 : 2;
            if (!append_without_underscores(number, digits.substr(2), base == 16)) {
                return {};
            }
            Uint64 value;
            const char* const end = number.data() + number.size();
            const auto [p, ec] = std::from_chars(number.data(), end, value, base);
            if (ec != std::errc {} || p != end) {
                return {};
            }
            return double(value);
        }

        if (negative) {
            number.push_back('-');
        }
        if (!append_without_underscores(number, digits, false)) {
            return {};
        }

        const std::string_view unsigned_part = std::string_view(number).substr(negative ? 1 : 0);
        Size i = match_decimal_digits(unsigned_part);
        if (i == 0 || (i > 1 && unsigned_part[0] == '0')) {
            return {};
        }
        bool is_float = false;
        if (i < unsigned_part.length() && unsigned_part[i] == '.') {
            const Size fraction = match_decimal_digits(unsigned_part.substr(i + 1));
            if (fraction == 0) {
                return {};
            }
            i += 1 + fraction;
            is_float = true;
        }
        if (i < unsigned_part.length() && (unsigned_part[i] == 'e' || unsigned_part[i] == 'E')) {
            ++i;
            if (i < unsigned_part.length()
                && (unsigned_part[i] == '+' || unsigned_part[i] == '-')) {
                ++i;
            }
            const Size exponent = match_decimal_digits(unsigned_part.substr(i));
            if (exponent == 0) {
                return {};
            }
            i += exponent;
            is_float = true;
        }
        if (i != unsigned_part.length()) {
            return {};
        }

        const char* const end = number.data() + number.size();
        if (is_float) {
            double value;
            const auto [p, ec] = std::from_chars(number.data(), end, value);
            if (ec != std::errc {} || p != end) {
                return {};
            }
            return value;
        }
        Int64 value;
        const auto [p, ec] = std::from_chars(number.data(), end, value);
        if (ec != std::errc {} || p != end) {
            return {};
        }
        return double(value);
    }

    [[nodiscard]] Result<void, Metadata_Error> parse_escape(std::pmr::string& out)
    {
        const Local_Source_Position escape_pos = m_pos;
        char replacement;
        switch (peek(1)) {
        case 'b': replacement = '\b'; break;
        case 't': replacement = '\t'; break;
        case 'n': replacement = '\n'; break;
        case 'f': replacement = '\f'; break;
        case 'r': replacement = '\r'; break;
        case 'e': replacement = '\x1b'; break;
        case '"': replacement = '"'; break;
        case '\\': replacement = '\\'; break;
        case 'u':
        case 'U': {
            const Size digit_count = peek(1) == 'u' ? 4 : 8;
            const std::string_view hex = rest().substr(2, digit_count);
            if (hex.length() != digit_count || !std::ranges::all_of(hex, is_hexadecimal_digit)) {
                return error_at(escape_pos, "expected hexadecimal digits in a Unicode escape");
            }
            Uint32 code_point = 0;
            std::from_chars(hex.data(), hex.data() + hex.size(), code_point, 16);
            if (!append_utf8(out, char32_t(code_point))) {
                return error_at(escape_pos, "escape sequence is not a Unicode scalar value");
            }
            advance(2 + digit_count);
            return {};
        }
        default: return error_at(escape_pos, "invalid escape sequence");
        }
        out.push_back(replacement);
        advance(2);
        return {};
    }

    [[nodiscard]] Result<std::pmr::string, Metadata_Error> parse_basic_string()
    {
        const Local_Source_Position start = m_pos;
        advance(1);
        std::pmr::string result(m_memory);
        while (true) {
            if (eof() || is_line_break(peek())) {
                return error_at(start, "unterminated string");
            }
            const char c = peek();
            if (c == '"') {
                advance(1);
                return result;
            }
            if (c == '\\') {
                if (Result<void, Metadata_Error> escape = parse_escape(result); !escape) {
                    return std::move(escape.error());
                }
                continue;
            }
            if (is_illegal_control(c)) {
                return error("control characters must be escaped in strings");
            }
            result.push_back(c);
            advance(1);
        }
    }

    [[nodiscard]] Result<std::pmr::string, Metadata_Error> parse_multiline_basic_string()
    {
        const Local_Source_Position start = m_pos;
        advance(3);
        advance(match_line_break(rest()));
        std::pmr::string result(m_memory);
        while (true) {
            if (eof()) {
                return error_at(start, "unterminated multi-line string");
            }
            if (rest().starts_with("\"\"\"")) {
                Size quotes = 3;
                while (quotes < 5 && peek(quotes) == '"') {
                    ++quotes;
                }
                result.append(quotes - 3, '"');
                advance(quotes);
                return result;
            }
            const char c = peek();
            if (c == '\\') {
                const Size blank = match_blank(rest().substr(1));
                if (match_line_break(rest().substr(1 + blank)) != 0) {
                    advance(1);
                    while (is_space(peek())) {
                        advance(1);
                    }
                    continue;
                }
                if (Result<void, Metadata_Error> escape = parse_escape(result); !escape) {
                    return std::move(escape.error());
                }
                continue;
            }
            if (const Size line_break = match_line_break(rest())) {
                result += rest().substr(0, line_break);
                advance(line_break);
                continue;
            }
            if (is_illegal_control(c)) {
                return error("control characters must be escaped in strings");
            }
            result.push_back(c);
            advance(1);
        }
    }

    [[nodiscard]] Result<std::pmr::string, Metadata_Error> parse_literal_string()
    {
        const Local_Source_Position start = m_pos;
        advance(1);
        const std::string_view remainder = rest();
        const Size end = remainder.find_first_of("'\r\n");
        if (end == std::string_view::npos || remainder[end] != '\'') {
            return error_at(start, "unterminated literal string");
        }
        std::pmr::string result(remainder.substr(0, end), m_memory);
        advance(end + 1);
        return result;
    }

    [[nodiscard]] Result<std::pmr::string, Metadata_Error> parse_multiline_literal_string()
    {
        const Local_Source_Position start = m_pos;
        advance(3);
        advance(match_line_break(rest()));
        const std::string_view remainder = rest();
        const Size end = remainder.find("'''");
        if (end == std::string_view::npos) {
            return error_at(start, "unterminated multi-line literal string");
        }
        Size quotes = 3;
        while (quotes < 5 && end + quotes < remainder.length() && remainder[end + quotes] == '\'') {
            ++quotes;
        }
        std::pmr::string result(remainder.substr(0, end + quotes - 3), m_memory);
        advance(end + quotes);
        return result;
    }

    [[nodiscard]] Result<Meta_Value, Metadata_Error> parse_array(const Location& location)
    {
        const Local_Source_Position start = m_pos;
        advance(1);
        Meta_Array result(m_memory);
        while (true) {
            skip_blank_lines_and_comments();
            if (eof()) {
                return error_at(start, "unterminated array");
            }
            if (peek() == ']') {
                advance(1);
                return Meta_Value { std::move(result) };
            }
            Location element_location(location.begin(), location.end(), m_memory);
            push_index(element_location, result.size());
            Result<Meta_Value, Metadata_Error> element = parse_value(element_location);
            if (!element) {
                return std::move(element.error());
            }
            result.push_back(std::move(*element));
            skip_blank_lines_and_comments();
            if (peek() == ',') {
                advance(1);
                continue;
            }
            if (peek() == ']') {
                advance(1);
                return Meta_Value { std::move(result) };
            }
            return eof() ? error_at(start, "unterminated array")
                         : error("expected ',' or ']' in an array");
        }
    }

    [[nodiscard]] Result<Meta_Value, Metadata_Error> parse_inline_table(const Location& location)
    {
        const Local_Source_Position start = m_pos;
        advance(1);
        Meta_Object result { m_memory };
        skip_blank();
        if (peek() == '}') {
            advance(1);
            return Meta_Value { std::move(result) };
        }
        while (true) {
            if (Result<void, Metadata_Error> member = parse_key_value(result, location);
                !member) {
                return std::move(member.error());
            }
            skip_blank();
            if (peek() == ',') {
                advance(1);
                continue;
            }
            if (peek() == '}') {
                advance(1);
                return Meta_Value { std::move(result) };
            }
            return eof() ? error_at(start, "unterminated inline table")
                         : error("expected ',' or '}' in an inline table");
        }
    }
};

} // namespace

Result<Metadata, Metadata_Error> parse_toml_metadata(std::string_view text,
                                                     std::pmr::memory_resource* memory)
{
    return Toml_Parser { text, memory }.parse();
}

} // namespace metamark::mmk
