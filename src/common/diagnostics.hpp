#ifndef METAMARK_DIAGNOSTICS_HPP
#define METAMARK_DIAGNOSTICS_HPP

#include <iosfwd>
#include <span>
#include <string_view>

#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/io_error.hpp"
#include "common/source_position.hpp"

#include "mmk/fwd.hpp"

namespace metamark {

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`, without its line break.
std::string_view find_line(std::string_view source, Size index);

/// @brief Prints the location of the file nicely formatted.
void print_location_of_file(Code_String& out, std::string_view file);

/// @brief Prints a position within a file, consisting of the file name and line/column.
/// @param out the string to write to
/// @param file the file
/// @param pos the one-based position within the file
/// @param colon_suffix if `true`, appends a `:` to the string as part of the same token
void print_file_position(Code_String& out,
                         std::string_view file,
                         const Local_Source_Position& pos,
                         bool colon_suffix = true);

/// @brief Prints the contents of the affected line within `source` as well as a position indicator
/// which shows the column at which some diagnostic applies.
void print_affected_line(Code_String& out,
                         std::string_view source,
                         const Local_Source_Position& pos);

void print_tokenize_error(Code_String& out,
                          std::string_view file,
                          std::string_view source,
                          const mmk::Tokenize_Error& error);

void print_parse_error(Code_String& out,
                       std::string_view file,
                       std::string_view source,
                       const mmk::Parse_Error& error);

void print_metadata_error(Code_String& out,
                          std::string_view file,
                          std::string_view source,
                          const mmk::Metadata_Error& error);

void print_document_error(Code_String& out,
                          std::string_view file,
                          std::string_view source,
                          const mmk::Document_Error& error);

void print_write_error(Code_String& out, std::string_view file, mmk::Write_Error_Code error);

void print_assertion_error(Code_String& out, const Assertion_Error& error);

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error);

void print_tokens(Code_String& out, std::span<const mmk::Token> tokens, std::string_view source);

struct AST_Formatting_Options {
    int indent_width;
    /// @brief The maximum amount of characters of node text which are printed before the text is
    /// cut off with `...`.
    int max_node_text_length;
    /// @brief If `true`, the line and column of every node is printed.
    bool show_positions = true;
};

void print_ast(Code_String& out,
               const mmk::ast::Document& document,
               AST_Formatting_Options options);

/// @brief Prints metadata as an indented tree, one value per line.
void print_metadata(Code_String& out,
                    const mmk::Metadata& metadata,
                    int indent_width,
                    int level = 0);

void print_internal_error_notice(Code_String& out);

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors);

} // namespace metamark

#endif
