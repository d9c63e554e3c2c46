#include <iostream>
#include <memory_resource>
#include <string>

#include "common/ansi.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/tty.hpp"

#include "md/html/render.hpp"

#include "test/diagnostic_policy.hpp"
#include "test/document_file_testing.hpp"

namespace slugmark {
namespace {

const bool should_print_colors = is_tty(stdout);

std::string_view color(std::string_view c)
{
    return should_print_colors ? c : "";
}

std::string full_path_of(std::string_view file)
{
    return "test/md/" + std::string(file);
}

struct Printing_Document_Diagnostic_Policy : Document_Diagnostic_Policy {
    std::string_view file;
    std::string_view source;

    Policy_Action print_and_fail(IO_Error_Code e)
    {
        Code_String out;
        print_io_error(out, file, e);
        print_code_string(std::cout, out, should_print_colors);
        return Policy_Action::failure;
    }

    Policy_Action print_and_fail(const md::Render_Error& e)
    {
        Code_String out;
        print_render_error(out, file, source, e);
        print_code_string(std::cout, out, should_print_colors);
        return Policy_Action::failure;
    }
};

bool test_validity(std::string_view file, Printing_Document_Diagnostic_Policy& policy)
{
#define SLUGMARK_SWITCH_ON_POLICY_ACTION(...)                                                      \
    switch (__VA_ARGS__) {                                                                         \
    case Policy_Action::success: return true;                                                      \
    case Policy_Action::failure: return false;                                                     \
    case Policy_Action::keep_going: break;                                                         \
    }

    const std::string full_path = full_path_of(file);
    policy.file = full_path;

    std::pmr::monotonic_buffer_resource memory;
    Result<std::pmr::vector<char>, IO_Error_Code> source_data = file_to_bytes(full_path, &memory);
    if (!source_data) {
        return policy.error(source_data.error()) == Policy_Action::success;
    }
    SLUGMARK_SWITCH_ON_POLICY_ACTION(policy.done(Document_Stage::load_file));
    const std::string_view source { source_data->data(), source_data->size() };
    policy.source = source;

    const Result<md::Render_Result, md::Render_Error> result
        = md::render_markdown(source, {}, &memory);
    if (!result) {
        SLUGMARK_SWITCH_ON_POLICY_ACTION(policy.error(result.error()));
    }
    else {
        SLUGMARK_SWITCH_ON_POLICY_ACTION(policy.rendered(*result));
    }
    SLUGMARK_SWITCH_ON_POLICY_ACTION(policy.done(Document_Stage::render));

    return policy.is_success();
#undef SLUGMARK_SWITCH_ON_POLICY_ACTION
}

struct Expect_Success_Diagnostic_Policy : Printing_Document_Diagnostic_Policy {
protected:
    Policy_Action m_action = Policy_Action::keep_going;

public:
    bool is_success() const final
    {
        return m_action == Policy_Action::success;
    }

    Policy_Action error(IO_Error_Code e) final
    {
        return m_action = print_and_fail(e);
    }

    Policy_Action error(const md::Render_Error& e) final
    {
        return m_action = print_and_fail(e);
    }

    Policy_Action rendered(const md::Render_Result&) override
    {
        return Policy_Action::keep_going;
    }

    Policy_Action done(Document_Stage stage) final
    {
        if (stage < Document_Stage::render) {
            return Policy_Action::keep_going;
        }
        return m_action = Policy_Action::success;
    }
};

struct Expect_HTML_Diagnostic_Policy final : Expect_Success_Diagnostic_Policy {
    std::string_view expected_html;

    Policy_Action rendered(const md::Render_Result& result) final
    {
        if (result.html == expected_html) {
            return Policy_Action::keep_going;
        }
        std::cout << color(ansi::red) << file << ": rendered HTML does not match.\n"
                  << color(ansi::reset) << "Expected:\n"
                  << expected_html << "Actual:\n"
                  << result.html;
        return m_action = Policy_Action::failure;
    }
};

struct Expect_Headings_Diagnostic_Policy final : Expect_Success_Diagnostic_Policy {
    std::span<const Heading_Expectation> expectations;

    Policy_Action rendered(const md::Render_Result& result) final
    {
        if (result.headings.size() != expectations.size()) {
            std::cout << color(ansi::red) << file << ": expected " << expectations.size()
                      << " headings, but got " << result.headings.size() << ".\n"
                      << color(ansi::reset);
            return m_action = Policy_Action::failure;
        }
        for (Size i = 0; i < expectations.size(); ++i) {
            const md::Heading& actual = result.headings[i];
            const Heading_Expectation& expected = expectations[i];
            if (actual.level != expected.level || actual.text != expected.text
                || actual.slug != expected.slug) {
                std::cout << color(ansi::red) << file << ": heading #" << i << " differs.\n"
                          << color(ansi::reset) << "Expected: " << expected.level << ' '
                          << expected.text << " (" << expected.slug << ")\n"
                          << "Actual:   " << actual.level << ' ' << actual.text << " ("
                          << actual.slug << ")\n";
                return m_action = Policy_Action::failure;
            }
        }
        return Policy_Action::keep_going;
    }
};

struct Expect_Error_Diagnostic_Policy final : Printing_Document_Diagnostic_Policy {
private:
    Policy_Action m_action = Policy_Action::keep_going;

public:
    Render_Error_Expectations expectations;

    explicit Expect_Error_Diagnostic_Policy(const Render_Error_Expectations& expectations)
        : expectations(expectations)
    {
    }

    bool is_success() const final
    {
        return m_action == Policy_Action::success;
    }

    Policy_Action error(IO_Error_Code e) final
    {
        return m_action = print_and_fail(e);
    }

    Policy_Action error(const md::Render_Error& e) final
    {
        if (e.code != expectations.code) {
            std::cout << color(ansi::red) << file << ": expected " << md::name_of(expectations.code)
                      << ", but got:\n"
                      << color(ansi::reset);
            return m_action = print_and_fail(e);
        }
        if (expectations.line && e.pos.line + 1 != *expectations.line) {
            std::cout << color(ansi::red) << file << ": expected error on line "
                      << *expectations.line << ", but got:\n"
                      << color(ansi::reset);
            return m_action = print_and_fail(e);
        }
        return m_action = Policy_Action::success;
    }

    Policy_Action rendered(const md::Render_Result&) final
    {
        std::cout << color(ansi::red) << file << ": expected " << md::name_of(expectations.code)
                  << ", but the document rendered successfully.\n"
                  << color(ansi::reset);
        return m_action = Policy_Action::failure;
    }

    Policy_Action done(Document_Stage) final
    {
        return Policy_Action::keep_going;
    }
};

} // namespace

bool test_for_success(std::string_view file)
{
    Expect_Success_Diagnostic_Policy policy;
    return test_validity(file, policy);
}

bool test_for_html(std::string_view file, std::string_view expected_html_file)
{
    const std::string expected_path = full_path_of(expected_html_file);
    std::pmr::monotonic_buffer_resource memory;
    Result<std::pmr::vector<char>, IO_Error_Code> expected
        = file_to_bytes(expected_path, &memory);
    if (!expected) {
        Code_String out;
        print_io_error(out, expected_path, expected.error());
        print_code_string(std::cout, out, should_print_colors);
        return false;
    }

    Expect_HTML_Diagnostic_Policy policy;
    policy.expected_html = { expected->data(), expected->size() };
    return test_validity(file, policy);
}

bool test_for_headings(std::string_view file, std::span<const Heading_Expectation> expectations)
{
    Expect_Headings_Diagnostic_Policy policy;
    policy.expectations = expectations;
    return test_validity(file, policy);
}

bool test_for_diagnostic(std::string_view file, const Render_Error_Expectations& expectations)
{
    Expect_Error_Diagnostic_Policy policy { expectations };
    return test_validity(file, policy);
}

} // namespace slugmark
