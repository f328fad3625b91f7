#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <ryml.hpp>
#include <ryml_std.hpp>

#include "common/parse.hpp"

#include "mmk/metadata/yaml.hpp"

namespace metamark::mmk {

namespace {

struct Yaml_Syntax_Error {
    std::string message;
    Local_Source_Position pos;
};

[[noreturn]] void
throw_yaml_error(const char* message, std::size_t length, ryml::Location location, void*)
{
    // rapidyaml reports zero-based lines and columns, or npos when unknown.
    const bool has_position = location.line != ryml::npos && location.col != ryml::npos;
    const Local_Source_Position pos = has_position
        ? Local_Source_Position { Size(location.line) + 1, Size(location.col) + 1,
                                  Size(location.offset) }
        : Local_Source_Position { 1, 1, 0 };
    throw Yaml_Syntax_Error { std::string(message, length), pos };
}

/// @brief Returns callbacks which turn every rapidyaml error into a `Yaml_Syntax_Error`.
/// They are also installed globally, so that no code path inside rapidyaml falls back to the
/// default handler, which aborts.
const ryml::Callbacks& throwing_callbacks()
{
    static const ryml::Callbacks callbacks = [] {
        ryml::Callbacks result = ryml::get_callbacks();
        result.m_error = &throw_yaml_error;
        ryml::set_callbacks(result);
        return result;
    }();
    return callbacks;
}

[[nodiscard]] std::string_view to_string_view(ryml::csubstr str) noexcept
{
    return str.str == nullptr ? std::string_view {} : std::string_view { str.str, str.len };
}

[[nodiscard]] bool is_yaml_null(std::string_view scalar) noexcept
{
    return scalar.empty() || scalar == "~" || scalar == "null" || scalar == "Null"
        || scalar == "NULL";
}

[[nodiscard]] std::optional<bool> resolve_yaml_boolean(std::string_view scalar) noexcept
{
    if (scalar == "true" || scalar == "True" || scalar == "TRUE") {
        return true;
    }
    if (scalar == "false" || scalar == "False" || scalar == "FALSE") {
        return false;
    }
    return {};
}

template <typename T>
[[nodiscard]] std::optional<T> integer_from_chars(std::string_view str, int base = 10) noexcept
{
    T value;
    const char* const end = str.data() + str.size();
    const auto [p, ec] = std::from_chars(str.data(), end, value, base);
    if (ec != std::errc {} || p != end) {
        return {};
    }
    return value;
}

[[nodiscard]] std::optional<double> double_from_chars(std::string_view str) noexcept
{
    double value;
    const char* const end = str.data() + str.size();
    const auto [p, ec] = std::from_chars(str.data(), end, value);
    if (ec != std::errc {} || p != end) {
        return {};
    }
    return value;
}

/// @brief Resolves integers and floats of the YAML 1.2 core schema.
/// Integers are widened to `double`.
[[nodiscard]] std::optional<double> resolve_yaml_number(std::string_view scalar) noexcept
{
    constexpr double infinity = std::numeric_limits<double>::infinity();

    if (scalar.starts_with("0x")) {
        const std::optional<Uint64> value = integer_from_chars<Uint64>(scalar.substr(2), 16);
        return value ? std::optional<double>(double(*value)) : std::nullopt;
    }
    if (scalar.starts_with("0o")) {
        const std::optional<Uint64> value = integer_from_chars<Uint64>(scalar.substr(2), 8);
        return value ? std::optional<double>(double(*value)) : std::nullopt;
    }

    std::string_view unsigned_part = scalar;
    const bool negative = unsigned_part.starts_with('-');
    if (negative || unsigned_part.starts_with('+')) {
        unsigned_part.remove_prefix(1);
    }
    if (unsigned_part == ".inf" || unsigned_part == ".Inf" || unsigned_part == ".INF") {
        return negative ? -infinity : infinity;
    }
    if (scalar == ".nan" || scalar == ".NaN" || scalar == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // [0-9]+ | (\.[0-9]+ | [0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
    const Size integral = match_decimal_digits(unsigned_part);
    Size i = integral;
    Size fraction = 0;
    bool is_float = false;
    if (i < unsigned_part.length() && unsigned_part[i] == '.') {
        fraction = match_decimal_digits(unsigned_part.substr(i + 1));
        i += 1 + fraction;
        is_float = true;
    }
    if (integral == 0 && fraction == 0) {
        return {};
    }
    if (i < unsigned_part.length() && (unsigned_part[i] == 'e' || unsigned_part[i] == 'E')) {
        ++i;
        if (i < unsigned_part.length() && (unsigned_part[i] == '+' || unsigned_part[i] == '-')) {
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

    // std::from_chars accepts a leading minus sign, but no plus sign.
    const std::string_view signed_part = negative ? scalar : unsigned_part;
    if (!is_float) {
        if (const std::optional<Int64> value = integer_from_chars<Int64>(signed_part)) {
            return double(*value);
        }
    }
    return double_from_chars(signed_part);
}

struct Yaml_Converter {
    const ryml::Tree& tree;
    std::pmr::memory_resource* memory;
    Lossy_Scalar_Policy policy;

    [[nodiscard]] Metadata_Error error(Metadata_Error_Code code, std::string_view message) const
    {
        return { code, { 1, 1, 0 }, std::pmr::string(message, memory) };
    }

    /// @brief Produces the replacement for a value without `Meta_Value` counterpart.
    [[nodiscard]] Result<std::pmr::string, Metadata_Error> lossy(std::string_view what) const
    {
        if (policy == Lossy_Scalar_Policy::error) {
            std::pmr::string message(what, memory);
            message += " cannot be represented as metadata";
            return Metadata_Error { Metadata_Error_Code::unrepresentable_value, { 1, 1, 0 },
                                    std::move(message) };
        }
        return std::pmr::string(memory);
    }

    [[nodiscard]] Result<Meta_Value, Metadata_Error> convert_scalar(ryml::csubstr text,
                                                                    bool quoted) const
    {
        const std::string_view scalar = to_string_view(text);
        if (quoted) {
            return Meta_Value { std::pmr::string(scalar, memory) };
        }
        if (is_yaml_null(scalar)) {
            Result<std::pmr::string, Metadata_Error> replacement = lossy("a null value");
            if (!replacement) {
                return std::move(replacement.error());
            }
            return Meta_Value { std::move(*replacement) };
        }
        if (const std::optional<bool> boolean = resolve_yaml_boolean(scalar)) {
            return Meta_Value { *boolean };
        }
        if (const std::optional<double> number = resolve_yaml_number(scalar)) {
            return Meta_Value { *number };
        }
        return Meta_Value { std::pmr::string(scalar, memory) };
    }

    [[nodiscard]] Result<std::pmr::string, Metadata_Error> convert_key(ryml::id_type node) const
    {
        if (!tree.has_key(node)) {
            return lossy("a mapping key which is not a scalar");
        }
        const std::string_view key = to_string_view(tree.key(node));
        if (tree.is_key_quoted(node)) {
            return std::pmr::string(key, memory);
        }
        if (is_yaml_null(key) || resolve_yaml_boolean(key) || resolve_yaml_number(key)) {
            return lossy("a mapping key which is not a string");
        }
        return std::pmr::string(key, memory);
    }

    [[nodiscard]] Result<Meta_Value, Metadata_Error> convert(ryml::id_type node, Size depth) const
    {
        if (depth >= default_max_nesting_depth) {
            return error(Metadata_Error_Code::invalid_yaml, "values are nested too deeply");
        }
        if (tree.is_map(node)) {
            Result<Meta_Object, Metadata_Error> object = convert_map(node, depth);
            if (!object) {
                return std::move(object.error());
            }
            return Meta_Value { std::move(*object) };
        }
        if (tree.is_seq(node)) {
            Meta_Array array(memory);
            for (ryml::id_type child = tree.first_child(node); child != ryml::NONE;
                 child = tree.next_sibling(child)) {
                Result<Meta_Value, Metadata_Error> element = convert(child, depth + 1);
                if (!element) {
                    return std::move(element.error());
                }
                array.push_back(std::move(*element));
            }
            return Meta_Value { std::move(array) };
        }
        if (tree.has_val(node)) {
            return convert_scalar(tree.val(node), tree.is_val_quoted(node));
        }
        return convert_scalar({}, false);
    }

    [[nodiscard]] Result<Meta_Object, Metadata_Error> convert_map(ryml::id_type node,
                                                                  Size depth) const
    {
        Meta_Object result { memory };
        for (ryml::id_type child = tree.first_child(node); child != ryml::NONE;
             child = tree.next_sibling(child)) {
            // Duplicates are detected on the source text of the key, so that two keys which are
            // both replaced with empty strings are not mistaken for each other.
            for (ryml::id_type previous = tree.first_child(node); previous != child;
                 previous = tree.next_sibling(previous)) {
                if (tree.has_key(previous) && tree.has_key(child)
                    && tree.key(previous) == tree.key(child)) {
                    std::pmr::string message("duplicate mapping key '", memory);
                    message += to_string_view(tree.key(child));
                    message += '\'';
                    return Metadata_Error { Metadata_Error_Code::invalid_yaml, { 1, 1, 0 },
                                            std::move(message) };
                }
            }

            Result<std::pmr::string, Metadata_Error> key = convert_key(child);
            if (!key) {
                return std::move(key.error());
            }
            Result<Meta_Value, Metadata_Error> value = convert(child, depth + 1);
            if (!value) {
                return std::move(value.error());
            }
            result.insert_or_assign(*key, std::move(*value));
        }
        return result;
    }
};

} // namespace

Result<Metadata, Metadata_Error> parse_yaml_metadata(std::string_view text,
                                                     std::pmr::memory_resource* memory,
                                                     Lossy_Scalar_Policy policy)
{
    ryml::Tree tree { throwing_callbacks() };
    try {
        ryml::parse_in_arena(ryml::csubstr(text.data(), text.size()), &tree);
        tree.resolve();
    } catch (const Yaml_Syntax_Error& e) {
        return Metadata_Error { Metadata_Error_Code::invalid_yaml, e.pos,
                                std::pmr::string(e.message, memory) };
    }

    ryml::id_type root = tree.root_id();
    if (tree.is_stream(root)) {
        if (tree.num_children(root) > 1) {
            return Metadata_Error { Metadata_Error_Code::invalid_yaml, { 1, 1, 0 },
                                    std::pmr::string("expected a single YAML document", memory) };
        }
        if (tree.num_children(root) == 0) {
            return Meta_Object { memory };
        }
        root = tree.first_child(root);
    }
    if (!tree.is_map(root)) {
        return Metadata_Error { Metadata_Error_Code::invalid_yaml, { 1, 1, 0 },
                                std::pmr::string("the root of the YAML document is not a mapping",
                                                 memory) };
    }
    return Yaml_Converter { tree, memory, policy }.convert_map(root, 0);
}

} // namespace metamark::mmk
