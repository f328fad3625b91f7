#ifndef METAMARK_MMK_AST_HPP
#define METAMARK_MMK_AST_HPP

#include <functional>
#include <map>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "common/memory.hpp"
#include "common/source_position.hpp"

#include "mmk/fwd.hpp"
#include "mmk/metadata/meta_value.hpp"

namespace metamark::mmk::ast {

namespace detail {

struct Base {
    Local_Source_Span m_pos;

    [[nodiscard]] Local_Source_Span get_source_span() const
    {
        return m_pos;
    }
};

} // namespace detail

/// @brief A `@[kind: content]` note attached to the block in which it appears.
struct Annotation : detail::Base {
    static inline constexpr std::string_view self_name = "Annotation";

    std::pmr::string m_kind;
    std::pmr::string m_content;

    Annotation(const Local_Source_Span& pos, std::pmr::string&& kind, std::pmr::string&& content);

    [[nodiscard]] std::string_view get_kind() const
    {
        return m_kind;
    }

    [[nodiscard]] std::string_view get_content() const
    {
        return m_content;
    }
};

using Annotations = std::pmr::vector<Annotation>;

// INLINES =========================================================================================

struct Text : detail::Base {
    static inline constexpr std::string_view self_name = "Text";

    std::pmr::string m_text;

    Text(const Local_Source_Span& pos, std::pmr::string&& text);

    [[nodiscard]] std::string_view get_text() const
    {
        return m_text;
    }
};

/// @brief `**inner**`.
/// Emphasis does not nest, so the inner node is always `Text`.
struct Bold : detail::Base {
    static inline constexpr std::string_view self_name = "Bold";

    Unique_Ptr<Inline> m_inner;

    Bold(const Local_Source_Span& pos, Unique_Ptr<Inline>&& inner);

    [[nodiscard]] const Inline& get_inner() const;
};

/// @brief `*inner*`.
/// Emphasis does not nest, so the inner node is always `Text`.
struct Italic : detail::Base {
    static inline constexpr std::string_view self_name = "Italic";

    Unique_Ptr<Inline> m_inner;

    Italic(const Local_Source_Span& pos, Unique_Ptr<Inline>&& inner);

    [[nodiscard]] const Inline& get_inner() const;
};

struct Inline_Code : detail::Base {
    static inline constexpr std::string_view self_name = "Inline_Code";

    std::pmr::string m_code;

    Inline_Code(const Local_Source_Span& pos, std::pmr::string&& code);

    [[nodiscard]] std::string_view get_code() const
    {
        return m_code;
    }
};

struct Link : detail::Base {
    static inline constexpr std::string_view self_name = "Link";

    std::pmr::string m_text;
    std::pmr::string m_url;

    Link(const Local_Source_Span& pos, std::pmr::string&& text, std::pmr::string&& url);

    [[nodiscard]] std::string_view get_text() const
    {
        return m_text;
    }

    [[nodiscard]] std::string_view get_url() const
    {
        return m_url;
    }
};

struct Inline_Math : detail::Base {
    static inline constexpr std::string_view self_name = "Inline_Math";

    std::pmr::string m_content;

    Inline_Math(const Local_Source_Span& pos, std::pmr::string&& content);

    [[nodiscard]] std::string_view get_content() const
    {
        return m_content;
    }
};

struct Inline : std::variant<Text, Bold, Italic, Inline_Code, Link, Inline_Math> {
    using variant::variant;
};

[[nodiscard]] inline const Inline& Bold::get_inner() const
{
    return *m_inner;
}

[[nodiscard]] inline const Inline& Italic::get_inner() const
{
    return *m_inner;
}

// BLOCKS ==========================================================================================

struct Heading : detail::Base {
    static inline constexpr std::string_view self_name = "Heading";

    /// @brief The number of `#` characters, in range [1, 6].
    int m_level;
    std::pmr::string m_content;
    Annotations m_annotations;

    Heading(const Local_Source_Span& pos,
            int level,
            std::pmr::string&& content,
            Annotations&& annotations);

    [[nodiscard]] int get_level() const
    {
        return m_level;
    }

    [[nodiscard]] std::string_view get_content() const
    {
        return m_content;
    }

    [[nodiscard]] std::span<const Annotation> get_annotations() const
    {
        return m_annotations;
    }
};

struct Paragraph : detail::Base {
    static inline constexpr std::string_view self_name = "Paragraph";

    std::pmr::vector<Inline> m_content;
    Annotations m_annotations;

    Paragraph(const Local_Source_Span& pos,
              std::pmr::vector<Inline>&& content,
              Annotations&& annotations);

    [[nodiscard]] std::span<const Inline> get_content() const
    {
        return m_content;
    }

    [[nodiscard]] std::span<const Annotation> get_annotations() const
    {
        return m_annotations;
    }
};

/// @brief A named container of blocks, delimited by `[[component: ...]]` and `[[/component]]`.
struct Component : detail::Base {
    static inline constexpr std::string_view self_name = "Component";
    using Attributes = std::pmr::map<std::pmr::string, std::pmr::string, std::less<>>;

    std::pmr::string m_name;
    Attributes m_attributes;
    std::pmr::vector<Block> m_content;

    Component(const Local_Source_Span& pos,
              std::pmr::string&& name,
              Attributes&& attributes,
              std::pmr::vector<Block>&& content);

    [[nodiscard]] std::string_view get_name() const
    {
        return m_name;
    }

    [[nodiscard]] const Attributes& get_attributes() const
    {
        return m_attributes;
    }

    /// @brief Returns the value of the attribute named `key`, or `nullptr` if there is none.
    [[nodiscard]] const std::pmr::string* find_attribute(std::string_view key) const;

    [[nodiscard]] std::span<const Block> get_content() const;
};

struct Code_Block : detail::Base {
    static inline constexpr std::string_view self_name = "Code_Block";

    std::optional<std::pmr::string> m_language;
    std::pmr::string m_content;

    Code_Block(const Local_Source_Span& pos,
               std::optional<std::pmr::string>&& language,
               std::pmr::string&& content);

    [[nodiscard]] std::optional<std::string_view> get_language() const
    {
        if (m_language) {
            return *m_language;
        }
        return {};
    }

    [[nodiscard]] std::string_view get_content() const
    {
        return m_content;
    }
};

enum struct Diagram_Kind : Default_Underlying {
    mermaid,
    plantuml,
    graphviz,
};

[[nodiscard]] std::string_view diagram_kind_name(Diagram_Kind kind);

/// @brief Returns the kind of diagram that a fenced block with the given language tag
/// contains, if any.
/// The tags `mermaid`, `plantuml`, `graphviz`, and `dot` are recognized, ignoring case.
[[nodiscard]] std::optional<Diagram_Kind> diagram_kind_by_language(std::string_view language);

/// @brief A fenced block whose language tag names a diagram engine.
struct Diagram : detail::Base {
    static inline constexpr std::string_view self_name = "Diagram";

    Diagram_Kind m_kind;
    std::pmr::string m_content;

    Diagram(const Local_Source_Span& pos, Diagram_Kind kind, std::pmr::string&& content);

    [[nodiscard]] Diagram_Kind get_kind() const
    {
        return m_kind;
    }

    [[nodiscard]] std::string_view get_content() const
    {
        return m_content;
    }
};

struct Encryption_Info {
    std::pmr::string algorithm;
    std::pmr::string key_id;
    std::pmr::vector<unsigned char> nonce;
};

/// @brief An opaque encrypted region.
/// There is no surface syntax for it; such blocks are only created programmatically,
/// and the content is never decrypted here.
struct Secure_Block : detail::Base {
    static inline constexpr std::string_view self_name = "Secure_Block";

    std::pmr::vector<unsigned char> m_content;
    Encryption_Info m_encryption_info;

    Secure_Block(const Local_Source_Span& pos,
                 std::pmr::vector<unsigned char>&& content,
                 Encryption_Info&& encryption_info);

    [[nodiscard]] std::span<const unsigned char> get_content() const
    {
        return m_content;
    }

    [[nodiscard]] const Encryption_Info& get_encryption_info() const
    {
        return m_encryption_info;
    }
};

struct List_Item : detail::Base {
    static inline constexpr std::string_view self_name = "List_Item";

    std::pmr::vector<Block> m_content;
    /// @brief The nesting depth, which is the number of leading spaces divided by two.
    Size m_level;

    List_Item(const Local_Source_Span& pos, std::pmr::vector<Block>&& content, Size level);

    [[nodiscard]] std::span<const Block> get_content() const;

    [[nodiscard]] Size get_level() const
    {
        return m_level;
    }
};

struct List : detail::Base {
    static inline constexpr std::string_view self_name = "List";

    std::pmr::vector<List_Item> m_items;
    bool m_ordered;

    List(const Local_Source_Span& pos, std::pmr::vector<List_Item>&& items, bool ordered);

    [[nodiscard]] std::span<const List_Item> get_items() const
    {
        return m_items;
    }

    [[nodiscard]] bool is_ordered() const
    {
        return m_ordered;
    }
};

struct Comment : detail::Base {
    static inline constexpr std::string_view self_name = "Comment";

    std::pmr::string m_text;

    Comment(const Local_Source_Span& pos, std::pmr::string&& text);

    [[nodiscard]] std::string_view get_text() const
    {
        return m_text;
    }
};

/// @brief `$$content$$` at block level.
struct Math : detail::Base {
    static inline constexpr std::string_view self_name = "Math";

    std::pmr::string m_content;

    Math(const Local_Source_Span& pos, std::pmr::string&& content);

    [[nodiscard]] std::string_view get_content() const
    {
        return m_content;
    }
};

struct Block : std::variant<Heading,
                            Paragraph,
                            Component,
                            Code_Block,
                            Diagram,
                            Secure_Block,
                            List,
                            Comment,
                            Math> {
    using variant::variant;
};

[[nodiscard]] inline std::span<const Block> Component::get_content() const
{
    return m_content;
}

[[nodiscard]] inline std::span<const Block> List_Item::get_content() const
{
    return m_content;
}

struct Document {
    std::optional<Metadata> m_metadata;
    std::pmr::vector<Block> m_blocks;

    [[nodiscard]] const Metadata* get_metadata() const
    {
        return m_metadata ? &*m_metadata : nullptr;
    }

    [[nodiscard]] std::span<const Block> get_blocks() const
    {
        return m_blocks;
    }
};

// UTILITIES =======================================================================================

template <typename F, typename Node>
decltype(auto) visit(F&& f, Node&& node)
    requires std::is_base_of_v<Inline, std::remove_cvref_t<Node>>
    || std::is_base_of_v<Block, std::remove_cvref_t<Node>>
{
    using Base = std::conditional_t<std::is_base_of_v<Inline, std::remove_cvref_t<Node>>,
                                    typename Inline::variant,
                                    typename Block::variant>;
    using Forwarded_Base = std::conditional_t<std::is_const_v<std::remove_reference_t<Node>>,
                                              const Base&,
                                              Base&>;
    return std::visit(std::forward<F>(f), static_cast<Forwarded_Base>(node));
}

[[nodiscard]] inline std::string_view get_node_name(const Inline& node)
{
    return visit([]<typename T>(const T&) { return T::self_name; }, node);
}

[[nodiscard]] inline std::string_view get_node_name(const Block& node)
{
    return visit([]<typename T>(const T&) { return T::self_name; }, node);
}

[[nodiscard]] inline Local_Source_Span get_source_span(const Inline& node)
{
    return visit([](const detail::Base& n) { return n.get_source_span(); }, node);
}

[[nodiscard]] inline Local_Source_Span get_source_span(const Block& node)
{
    return visit([](const detail::Base& n) { return n.get_source_span(); }, node);
}

} // namespace metamark::mmk::ast

#endif
