#include <cstdlib>
#include <iostream>

#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/tty.hpp"

#include "mmk/parsing/parse.hpp"
#include "mmk/tokenization/tokenize.hpp"

#include "cli/load.hpp"

namespace metamark {

std::pmr::string load_file(std::string_view file, std::pmr::memory_resource* memory)
{
    Result<std::pmr::string, IO_Error_Code> result = file_to_string(file, memory);
    if (!result) {
        Code_String out { memory };
        print_io_error(out, file, result.error());
        print_code_string(std::cerr, out, is_stderr_tty);
        std::exit(1);
    }
    return std::move(*result);
}

std::pmr::vector<mmk::Token>
tokenize_file(std::string_view source, std::string_view file, std::pmr::memory_resource* memory)
{
    std::pmr::vector<mmk::Token> tokens(memory);
    if (const Result<void, mmk::Tokenize_Error> result = mmk::tokenize(tokens, source)) {
        return tokens;
    }
    else {
        Code_String out { memory };
        print_tokenize_error(out, file, source, result.error());
        print_code_string(std::cerr, out, is_stderr_tty);
        std::exit(1);
    }
}

mmk::ast::Document parse_file(std::string_view source,
                              std::string_view file,
                              std::pmr::memory_resource* memory,
                              const mmk::Parse_Options& options)
{
    Result<mmk::ast::Document, mmk::Document_Error> parsed
        = mmk::parse_document(source, memory, options);
    if (!parsed) {
        Code_String out { memory };
        print_document_error(out, file, source, parsed.error());
        print_code_string(std::cerr, out, is_stderr_tty);
        std::exit(1);
    }
    return std::move(*parsed);
}

} // namespace metamark
