#include "common/assert.hpp"

#include "mmk/document_error.hpp"
#include "mmk/tokenization/token_type.hpp"

namespace metamark::mmk {

std::string_view document_error_kind_name(Document_Error_Kind kind)
{
    using enum Document_Error_Kind;
    switch (kind) {
        METAMARK_ENUM_STRING_CASE(lexical);
        METAMARK_ENUM_STRING_CASE(syntax);
        METAMARK_ENUM_STRING_CASE(metadata);
    }
    METAMARK_ASSERT_UNREACHABLE("invalid document error kind");
}

Document_Error_Kind Document_Error::get_kind() const
{
    switch (index()) {
    case 0: return Document_Error_Kind::lexical;
    case 1: return Document_Error_Kind::syntax;
    case 2: return Document_Error_Kind::metadata;
    }
    METAMARK_ASSERT_UNREACHABLE("valueless document error");
}

Local_Source_Position Document_Error::get_position() const
{
    return std::visit([](const auto& e) { return e.pos; }, static_cast<const variant&>(*this));
}

std::pmr::string Document_Error::get_message(std::pmr::memory_resource* memory) const
{
    std::pmr::string result(memory);
    if (const auto* e = std::get_if<Tokenize_Error>(this)) {
        result += to_prose(e->code);
    }
    else if (const auto* e = std::get_if<Parse_Error>(this)) {
        result += to_prose(e->code);
        if (e->code == Parse_Error_Code::unexpected_token
            || e->code == Parse_Error_Code::unexpected_token_in_frontmatter) {
            result += " Found ";
            result += token_type_readable_name(e->token_type);
            result += '.';
        }
    }
    else if (const auto* e = std::get_if<Metadata_Error>(this)) {
        result += to_prose(e->code);
        if (!e->message.empty()) {
            result += ' ';
            result += e->message;
        }
    }
    return result;
}

} // namespace metamark::mmk
