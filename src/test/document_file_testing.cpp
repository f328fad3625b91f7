#include <iostream>
#include <memory_resource>
#include <string>

#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/tty.hpp"

#include "mmk/document_error.hpp"
#include "mmk/parsing/parse.hpp"
#include "mmk/writing/write.hpp"

#include "test/diagnostic_policy.hpp"
#include "test/document_file_testing.hpp"

namespace metamark {
namespace {

const bool should_print_colors = is_tty(stdout);

/// @brief A `Diagnostic_Policy` which stores extra `file` and `source` members to enable
/// printing errors.
struct Printing_Diagnostic_Policy : Diagnostic_Policy {
    std::string_view file;
    std::string_view source;
};

bool test_validity(std::string_view file,
                   Printing_Diagnostic_Policy& policy,
                   const mmk::Parse_Options& options)
{
#define METAMARK_SWITCH_ON_POLICY_ACTION(...)                                                      \
    switch (__VA_ARGS__) {                                                                         \
    case Policy_Action::success: return true;                                                      \
    case Policy_Action::failure: return false;                                                     \
    case Policy_Action::keep_going: break;                                                         \
    }

    const std::string full_path = "test/" + std::string(file);
    policy.file = full_path;

    std::pmr::monotonic_buffer_resource memory;
    Result<std::pmr::string, IO_Error_Code> source_data = file_to_string(full_path, &memory);
    if (!source_data) {
        return policy.error(source_data.error()) == Policy_Action::success;
    }
    METAMARK_SWITCH_ON_POLICY_ACTION(policy.done(Document_Stage::load_file));
    const std::string_view source = *source_data;
    policy.source = source;

    Result<mmk::ast::Document, mmk::Document_Error> document
        = mmk::parse_document(source, &memory, options);
    if (!document) {
        METAMARK_SWITCH_ON_POLICY_ACTION(policy.error(document.error()));
        return policy.is_success();
    }
    METAMARK_SWITCH_ON_POLICY_ACTION(policy.done(Document_Stage::parse));

    Code_String written { &memory };
    if (Result<void, mmk::Write_Error_Code> r = mmk::write_document(written, *document); !r) {
        METAMARK_SWITCH_ON_POLICY_ACTION(policy.error(r.error()));
        return policy.is_success();
    }

    // The written text must be a fixed point of parsing and writing.
    policy.source = written.get_text();
    Result<mmk::ast::Document, mmk::Document_Error> reparsed
        = mmk::parse_document(written.get_text(), &memory, options);
    if (!reparsed) {
        METAMARK_SWITCH_ON_POLICY_ACTION(policy.error(reparsed.error()));
        return policy.is_success();
    }
    Code_String rewritten { &memory };
    if (Result<void, mmk::Write_Error_Code> r = mmk::write_document(rewritten, *reparsed); !r) {
        METAMARK_SWITCH_ON_POLICY_ACTION(policy.error(r.error()));
        return policy.is_success();
    }
    if (written.get_text() != rewritten.get_text()) {
        Code_String out;
        out.append("Writing the document is not stable. First output:\n\n",
                   Code_Span_Type::diagnostic_error_text);
        out.append(written.get_text());
        out.append("\nSecond output:\n\n", Code_Span_Type::diagnostic_error_text);
        out.append(rewritten.get_text());
        print_code_string(std::cout, out, should_print_colors);
        return false;
    }
    METAMARK_SWITCH_ON_POLICY_ACTION(policy.done(Document_Stage::write));

    return policy.is_success();
#undef METAMARK_SWITCH_ON_POLICY_ACTION
}

/// @brief This policy has succeeded when all stages up to a given stage pass without errors.
/// It has failed when any error is raised.
struct Expect_Success_Diagnostic_Policy final : Printing_Diagnostic_Policy {
private:
    Policy_Action m_action = Policy_Action::keep_going;
    Document_Stage m_max_stage;

public:
    explicit Expect_Success_Diagnostic_Policy(Document_Stage max_stage)
        : m_max_stage(max_stage)
    {
    }

    bool is_success() const final
    {
        return m_action == Policy_Action::success;
    }

    Policy_Action error(IO_Error_Code e) final
    {
        Code_String out;
        print_io_error(out, file, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action error(const mmk::Document_Error& e) final
    {
        Code_String out;
        print_document_error(out, file, source, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action error(mmk::Write_Error_Code e) final
    {
        Code_String out;
        print_write_error(out, file, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action done(Document_Stage stage) final
    {
        if (stage < m_max_stage) {
            return Policy_Action::keep_going;
        }
        return m_action = Policy_Action::success;
    }
};

/// @brief This policy has succeeded when parsing fails with the expected error.
/// It has failed when another error is raised, or if parsing succeeds.
struct Expect_Document_Error_Diagnostic_Policy final : Printing_Diagnostic_Policy {
private:
    Policy_Action m_action = Policy_Action::keep_going;
    Document_Error_Expectations m_expectations;

public:
    explicit Expect_Document_Error_Diagnostic_Policy(
        const Document_Error_Expectations& expectations)
        : m_expectations(expectations)
    {
    }

    bool is_success() const final
    {
        return m_action == Policy_Action::success;
    }

    Policy_Action error(IO_Error_Code e) final
    {
        Code_String out;
        print_io_error(out, file, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action error(const mmk::Document_Error& e) final
    {
        if (meets_expectations(e)) {
            return m_action = Policy_Action::success;
        }
        Code_String out;
        out.append("The error does not meet the expectations:\n",
                   Code_Span_Type::diagnostic_error_text);
        print_document_error(out, file, source, e);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

    Policy_Action error(mmk::Write_Error_Code) final
    {
        METAMARK_ASSERT_UNREACHABLE("Writing happens only after successful parsing.");
    }

    Policy_Action done(Document_Stage stage) final
    {
        if (stage < Document_Stage::parse) {
            return Policy_Action::keep_going;
        }
        Code_String out;
        out.append("Parsing succeeded, but an error was expected.\n",
                   Code_Span_Type::diagnostic_error_text);
        print_code_string(std::cout, out, should_print_colors);
        return m_action = Policy_Action::failure;
    }

private:
    [[nodiscard]] bool meets_expectations(const mmk::Document_Error& e) const
    {
        const Local_Source_Position pos = e.get_position();
        if (e.get_kind() != m_expectations.kind) {
            return false;
        }
        if (m_expectations.line && pos.line != *m_expectations.line) {
            return false;
        }
        if (m_expectations.column && pos.column != *m_expectations.column) {
            return false;
        }
        if (const auto* t = std::get_if<mmk::Tokenize_Error>(&e);
            t && m_expectations.tokenize_code && t->code != *m_expectations.tokenize_code) {
            return false;
        }
        if (const auto* p = std::get_if<mmk::Parse_Error>(&e);
            p && m_expectations.parse_code && p->code != *m_expectations.parse_code) {
            return false;
        }
        if (const auto* m = std::get_if<mmk::Metadata_Error>(&e);
            m && m_expectations.metadata_code && m->code != *m_expectations.metadata_code) {
            return false;
        }
        return true;
    }
};

} // namespace

bool test_for_success(std::string_view file,
                      Document_Stage until_stage,
                      const mmk::Parse_Options& options)
{
    Expect_Success_Diagnostic_Policy policy { until_stage };
    return test_validity(file, policy, options);
}

bool test_for_diagnostic(std::string_view file,
                         const Document_Error_Expectations& expectations,
                         const mmk::Parse_Options& options)
{
    Expect_Document_Error_Diagnostic_Policy policy { expectations };
    return test_validity(file, policy, options);
}

} // namespace metamark
