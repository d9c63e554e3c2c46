#ifndef SLUGMARK_TEST_DOCUMENT_FILE_TESTING_HPP
#define SLUGMARK_TEST_DOCUMENT_FILE_TESTING_HPP

#include <optional>
#include <span>
#include <string_view>

#include "common/config.hpp"

#include "md/render_error.hpp"

namespace slugmark {

struct Render_Error_Expectations {
    md::Render_Error_Code code;
    /// @brief The one-based line of the error.
    std::optional<Size> line {};
};

struct Heading_Expectation {
    int level;
    std::string_view text;
    std::string_view slug;
};

/// @brief Returns `true` if the document under `test/md/` renders without error.
bool test_for_success(std::string_view file);

/// @brief Returns `true` if the document under `test/md/` renders to exactly the contents of
/// `expected_html_file`, which is also located under `test/md/`.
bool test_for_html(std::string_view file, std::string_view expected_html_file);

/// @brief Returns `true` if the document under `test/md/` renders successfully with exactly the
/// expected outline.
bool test_for_headings(std::string_view file, std::span<const Heading_Expectation> expectations);

/// @brief Returns `true` if rendering the document under `test/md/` fails as expected.
bool test_for_diagnostic(std::string_view file, const Render_Error_Expectations& expectations);

} // namespace slugmark

#endif
