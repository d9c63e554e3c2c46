#ifndef SLUGMARK_MD_HTML_WRITER_HPP
#define SLUGMARK_MD_HTML_WRITER_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "common/assert.hpp"
#include "common/config.hpp"

#include "md/fwd.hpp"

namespace slugmark::md {

/// @brief Returns `true` if `id` is a lowercase HTML tag or attribute name, such as `h1` or `id`.
[[nodiscard]] constexpr bool is_html_identifier(std::string_view id)
{
    if (id.empty() || !(id[0] >= 'a' && id[0] <= 'z')) {
        return false;
    }
    for (const char c : id) {
        if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-')) {
            return false;
        }
    }
    return true;
}

/// @brief Appends `text` to `out`, replacing `&`, `<`, `>`, `"`, and `'` with character
/// references.
/// The result is safe to use both as element content and as a double-quoted attribute value.
void append_html_escaped(std::pmr::string& out, std::string_view text);

/// @brief A class which provides member functions for writing HTML fragments correctly.
/// This writer only performs checks that are possible without additional memory.
/// These include:
/// - verifying that given tag and attribute names are appropriate
/// - ensuring that the number of opened tags matches the number of closed tags
///
/// To correctly use this class, the opening tags must match the closing tags.
/// I.e. for every `open_tag(id)` or `open_tag_with_attributes(id)`,
/// there must be a matching `close_tag(id)`.
/// Misuse is reported by throwing `Assertion_Error`.
struct HTML_Writer {
public:
    friend struct Attribute_Writer;
    using Self = HTML_Writer;

private:
    std::pmr::string& m_out;

    Size m_depth = 0;
    bool m_in_attributes = false;

public:
    /// @brief Constructor.
    /// Writes nothing to `out`.
    /// @param out the string to which HTML is appended
    explicit HTML_Writer(std::pmr::string& out);

    HTML_Writer(const HTML_Writer&) = delete;
    HTML_Writer& operator=(const HTML_Writer&) = delete;

    /// @brief Validates whether the HTML fragment is complete, i.e. whether all opened tags have
    /// been closed.
    /// @return `true` if the writer is in a state where the HTML fragment could be considered
    /// complete, `false` otherwise.
    [[nodiscard]] bool is_done() const
    {
        return m_depth == 0 && !m_in_attributes;
    }

    /// @brief Returns the amount of tags which have been opened but not closed yet.
    [[nodiscard]] Size get_depth() const
    {
        return m_depth;
    }

    /// @brief Writes an empty tag such as `<br />` or `<hr />`.
    Self& write_empty_tag(std::string_view id);

    /// @brief Writes an opening tag such as `<p>`.
    Self& open_tag(std::string_view id);

    /// @brief Writes an incomplete opening tag such as `<h1`.
    /// Returns an `Attribute_Writer` which must be used to write attributes (if any)
    /// and complete the opening tag.
    [[nodiscard]] Attribute_Writer open_tag_with_attributes(std::string_view id);

    /// @brief Writes a closing tag, such as `</p>`.
    /// The most recent unclosed call to `open_tag` or `open_tag_with_attributes` shall have been
    /// made with the same `id`.
    Self& close_tag(std::string_view id);

    /// @brief Writes text between tags.
    /// Characters which interfere with HTML are converted to character references.
    Self& write_inner_text(std::string_view text);

    /// @brief Writes HTML content between tags.
    /// Unlike `write_inner_text`, does not escape anything.
    ///
    /// WARNING: Improper use of this function can easily result in incorrect HTML output.
    Self& write_inner_html(std::string_view html);

    /// @brief Writes a line break into the HTML source.
    /// This has no effect on the rendered document other than possibly white space between
    /// inline elements.
    Self& write_line_break();

private:
    Self& write_attribute(std::string_view key, std::string_view value);
    Self& end_attributes();
    Self& end_empty_tag_attributes();
};

/// @brief RAII helper class which lets us write attributes more conveniently.
/// This class is not intended to be used directly, but with the help of `HTML_Writer`.
struct Attribute_Writer {
private:
    HTML_Writer& m_writer;

public:
    explicit Attribute_Writer(HTML_Writer& writer)
        : m_writer(writer)
    {
    }

    Attribute_Writer(const Attribute_Writer&) = delete;
    Attribute_Writer& operator=(const Attribute_Writer&) = delete;

    /// @brief Writes an attribute, such as `id="intro"`.
    /// The value is always double-quoted and escaped.
    /// If `value` is empty, writes `key` on its own.
    /// @param key the attribute key; `is_html_identifier(key)` shall be `true`.
    /// @param value the attribute value, or an empty string
    /// @return `*this`
    Attribute_Writer& write_attribute(std::string_view key, std::string_view value = "")
    {
        m_writer.write_attribute(key, value);
        return *this;
    }

    /// @brief Writes `>` and finishes writing attributes.
    /// This function or `end_empty()` shall be called exactly once prior to destruction of this
    /// writer.
    Attribute_Writer& end()
    {
        m_writer.end_attributes();
        return *this;
    }

    /// @brief Writes ` />` and finishes writing attributes.
    /// This function or `end()` shall be called exactly once prior to destruction of this
    /// writer.
    Attribute_Writer& end_empty()
    {
        m_writer.end_empty_tag_attributes();
        return *this;
    }

    /// @brief Destructor.
    /// A call to `end()` or `end_empty()` shall have been made prior to destruction.
    ~Attribute_Writer() noexcept(false)
    {
        // This indicates that end() or end_empty() weren't called.
        SLUGMARK_ASSERT(!m_writer.m_in_attributes);
    }
};

} // namespace slugmark::md

#endif
