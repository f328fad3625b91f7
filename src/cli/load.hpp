#ifndef METAMARK_CLI_LOAD_HPP
#define METAMARK_CLI_LOAD_HPP

#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "mmk/options.hpp"
#include "mmk/parsing/ast.hpp"
#include "mmk/tokenization/token.hpp"

namespace metamark {

/// @brief Reads the whole file, or prints an error and exits.
std::pmr::string load_file(std::string_view file, std::pmr::memory_resource* memory);

/// @brief Scans `source` into tokens, or prints an error and exits.
std::pmr::vector<mmk::Token>
tokenize_file(std::string_view source, std::string_view file, std::pmr::memory_resource* memory);

/// @brief Parses `source` into a document, or prints an error and exits.
mmk::ast::Document parse_file(std::string_view source,
                              std::string_view file,
                              std::pmr::memory_resource* memory,
                              const mmk::Parse_Options& options);

} // namespace metamark

#endif
