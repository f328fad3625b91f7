#include <iostream>
#include <memory_resource>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "common/ansi.hpp"
#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/tty.hpp"

#include "mmk/options.hpp"
#include "mmk/parsing/ast.hpp"
#include "mmk/writing/write.hpp"

#include "cli/load.hpp"

namespace metamark {
namespace {

int dump_tokens(std::string_view file, std::pmr::memory_resource* memory)
{
    const std::pmr::string source = load_file(file, memory);
    const std::pmr::vector<mmk::Token> tokens = tokenize_file(source, file, memory);
    Code_String out { memory };
    print_tokens(out, tokens, source);
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

int dump_ast(std::string_view file,
             const mmk::Parse_Options& options,
             std::pmr::memory_resource* memory)
{
    const std::pmr::string source = load_file(file, memory);
    const mmk::ast::Document document = parse_file(source, file, memory, options);
    Code_String out { memory };
    print_ast(out, document, { .indent_width = 2, .max_node_text_length = 30 });
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

int check(std::string_view file,
          const mmk::Parse_Options& options,
          std::pmr::memory_resource* memory)
{
    const std::pmr::string source = load_file(file, memory);
    [[maybe_unused]] const mmk::ast::Document document = parse_file(source, file, memory, options);

    Code_String out { memory };
    out.append("All checks passed.", Code_Span_Type::diagnostic_success);
    out.append('\n');
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

int format(std::string_view file,
           std::optional<std::string_view> out_file,
           const mmk::Parse_Options& options,
           std::pmr::memory_resource* memory)
{
    const std::pmr::string source = load_file(file, memory);
    const mmk::ast::Document document = parse_file(source, file, memory, options);

    Code_String out { memory };
    if (Result<void, mmk::Write_Error_Code> r = mmk::write_document(out, document); !r) {
        Code_String error { memory };
        print_write_error(error, file, r.error());
        print_code_string(std::cerr, error, is_stderr_tty);
        return 1;
    }

    if (!out_file) {
        print_code_string(std::cout, out, is_stdout_tty);
        return 0;
    }
    if (Result<void, IO_Error_Code> r = string_to_file(*out_file, out.get_text()); !r) {
        Code_String error { memory };
        print_io_error(error, *out_file, r.error());
        print_code_string(std::cerr, error, is_stderr_tty);
        return 1;
    }
    return 0;
}

struct Command_Help {
    std::string_view name;
    std::string_view arguments;
    std::string_view description;
};

constexpr Command_Help command_helps[] {
    { "dump_tokens", "FILE", "Prints the MetaMark tokens of the file." },
    { "dump_ast", "FILE", "Prints the MetaMark document tree, including metadata." },
    { "check", "FILE", "Parses the file and reports the first error, if any." },
    { "format", "FILE [OUTPUT_FILE]",
      "Writes the parsed document back as normalized MetaMark, or prints to stdout." },
};

void print_help(std::string_view program_name)
{
    const bool colors = is_stdout_tty;
    const auto color = [colors](std::string_view c) { return colors ? c : std::string_view {}; };

    std::cout << color(ansi::black) << "Usage: " << color(ansi::reset) << program_name //
              << color(ansi::yellow) << " COMMAND " //
              << color(ansi::h_green) << "[--strict-metadata] ...\n";
    for (const Command_Help& help : command_helps) {
        std::cout << "    " << color(ansi::yellow) << help.name << " " //
                  << color(ansi::h_green) << help.arguments << '\n' //
                  << "      " << color(ansi::reset) << help.description << '\n';
    }
    std::cout << "    " << color(ansi::h_green) << "--strict-metadata\n" //
              << "      " << color(ansi::reset)
              << "Rejects metadata values which have no counterpart in the metadata model,\n"
                 "      instead of replacing them with empty strings.\n";
}

int main(int argc, const char** argv)
try {
    const std::span<const char*> all_args(argv, std::size_t(argc));
    const std::string_view program_name = all_args.empty() ? "metamark" : all_args[0];

    mmk::Parse_Options options;
    std::vector<std::string_view> args;
    for (std::size_t i = 1; i < all_args.size(); ++i) {
        const std::string_view arg = all_args[i];
        if (arg == "--strict-metadata") {
            options.lossy_scalars = mmk::Lossy_Scalar_Policy::error;
        }
        else {
            args.push_back(arg);
        }
    }

    if (args.size() < 2) {
        print_help(program_name);
        return 1;
    }

    std::pmr::unsynchronized_pool_resource memory;

    if (args[0] == "dump_tokens") {
        return dump_tokens(args[1], &memory);
    }
    else if (args[0] == "dump_ast") {
        return dump_ast(args[1], options, &memory);
    }
    else if (args[0] == "check") {
        return check(args[1], options, &memory);
    }
    else if (args[0] == "format") {
        return format(args[1], args.size() > 2 ? args[2] : std::optional<std::string_view> {},
                      options, &memory);
    }
    else {
        std::cerr << "Unknown command '" << args[0] << "'\n";
        return 1;
    }
} catch (const Assertion_Error& e) {
    Code_String out;
    print_assertion_error(out, e);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
} catch (const std::exception& e) {
    Code_String out;
    out.append("Unhandled exception! ", Code_Span_Type::diagnostic_error_text);
    out.append("An exception with the following message has been raised:",
               Code_Span_Type::diagnostic_text);
    out.append("\n\n");
    out.append(e.what(), Code_Span_Type::diagnostic_text);
    out.append("\n\n");
    print_internal_error_notice(out);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
}

} // namespace
} // namespace metamark

int main(int argc, const char** argv)
{
    return metamark::main(argc, argv);
}
