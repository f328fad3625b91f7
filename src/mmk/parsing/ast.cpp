#include <type_traits>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "mmk/parsing/ast.hpp"

namespace metamark::mmk::ast {

static_assert(std::is_nothrow_move_constructible_v<Inline>);

Annotation::Annotation(const Local_Source_Span& pos,
                       std::pmr::string&& kind,
                       std::pmr::string&& content)
    : detail::Base { pos }
    , m_kind(std::move(kind))
    , m_content(std::move(content))
{
}

Text::Text(const Local_Source_Span& pos, std::pmr::string&& text)
    : detail::Base { pos }
    , m_text(std::move(text))
{
}

Bold::Bold(const Local_Source_Span& pos, Unique_Ptr<Inline>&& inner)
    : detail::Base { pos }
    , m_inner(std::move(inner))
{
    METAMARK_ASSERT(m_inner);
}

Italic::Italic(const Local_Source_Span& pos, Unique_Ptr<Inline>&& inner)
    : detail::Base { pos }
    , m_inner(std::move(inner))
{
    METAMARK_ASSERT(m_inner);
}

Inline_Code::Inline_Code(const Local_Source_Span& pos, std::pmr::string&& code)
    : detail::Base { pos }
    , m_code(std::move(code))
{
}

Link::Link(const Local_Source_Span& pos, std::pmr::string&& text, std::pmr::string&& url)
    : detail::Base { pos }
    , m_text(std::move(text))
    , m_url(std::move(url))
{
}

Inline_Math::Inline_Math(const Local_Source_Span& pos, std::pmr::string&& content)
    : detail::Base { pos }
    , m_content(std::move(content))
{
}

Heading::Heading(const Local_Source_Span& pos,
                 int level,
                 std::pmr::string&& content,
                 Annotations&& annotations)
    : detail::Base { pos }
    , m_level(level)
    , m_content(std::move(content))
    , m_annotations(std::move(annotations))
{
    METAMARK_ASSERT(level >= 1 && level <= 6);
}

Paragraph::Paragraph(const Local_Source_Span& pos,
                     std::pmr::vector<Inline>&& content,
                     Annotations&& annotations)
    : detail::Base { pos }
    , m_content(std::move(content))
    , m_annotations(std::move(annotations))
{
}

Component::Component(const Local_Source_Span& pos,
                     std::pmr::string&& name,
                     Attributes&& attributes,
                     std::pmr::vector<Block>&& content)
    : detail::Base { pos }
    , m_name(std::move(name))
    , m_attributes(std::move(attributes))
    , m_content(std::move(content))
{
}

const std::pmr::string* Component::find_attribute(std::string_view key) const
{
    const auto it = m_attributes.find(key);
    return it == m_attributes.end() ? nullptr : &it->second;
}

Code_Block::Code_Block(const Local_Source_Span& pos,
                       std::optional<std::pmr::string>&& language,
                       std::pmr::string&& content)
    : detail::Base { pos }
    , m_language(std::move(language))
    , m_content(std::move(content))
{
}

std::string_view diagram_kind_name(Diagram_Kind kind)
{
    using enum Diagram_Kind;
    switch (kind) {
        METAMARK_ENUM_STRING_CASE(mermaid);
        METAMARK_ENUM_STRING_CASE(plantuml);
        METAMARK_ENUM_STRING_CASE(graphviz);
    }
    METAMARK_ASSERT_UNREACHABLE("invalid diagram kind");
}

std::optional<Diagram_Kind> diagram_kind_by_language(std::string_view language)
{
    if (equals_ignore_case(language, "mermaid")) {
        return Diagram_Kind::mermaid;
    }
    if (equals_ignore_case(language, "plantuml")) {
        return Diagram_Kind::plantuml;
    }
    if (equals_ignore_case(language, "graphviz") || equals_ignore_case(language, "dot")) {
        return Diagram_Kind::graphviz;
    }
    return {};
}

Diagram::Diagram(const Local_Source_Span& pos, Diagram_Kind kind, std::pmr::string&& content)
    : detail::Base { pos }
    , m_kind(kind)
    , m_content(std::move(content))
{
}

Secure_Block::Secure_Block(const Local_Source_Span& pos,
                           std::pmr::vector<unsigned char>&& content,
                           Encryption_Info&& encryption_info)
    : detail::Base { pos }
    , m_content(std::move(content))
    , m_encryption_info(std::move(encryption_info))
{
}

List_Item::List_Item(const Local_Source_Span& pos, std::pmr::vector<Block>&& content, Size level)
    : detail::Base { pos }
    , m_content(std::move(content))
    , m_level(level)
{
}

List::List(const Local_Source_Span& pos, std::pmr::vector<List_Item>&& items, bool ordered)
    : detail::Base { pos }
    , m_items(std::move(items))
    , m_ordered(ordered)
{
}

Comment::Comment(const Local_Source_Span& pos, std::pmr::string&& text)
    : detail::Base { pos }
    , m_text(std::move(text))
{
}

Math::Math(const Local_Source_Span& pos, std::pmr::string&& content)
    : detail::Base { pos }
    , m_content(std::move(content))
{
}

} // namespace metamark::mmk::ast
