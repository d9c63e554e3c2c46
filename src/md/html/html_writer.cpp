#include <algorithm>

#include "md/html/html_writer.hpp"

namespace slugmark::md {

void append_html_escaped(std::pmr::string& out, std::string_view text)
{
    while (!text.empty()) {
        const Size special_pos = text.find_first_of("&<>\"'");
        out.append(text.substr(0, std::min(text.length(), special_pos)));
        if (special_pos == std::string_view::npos) {
            break;
        }
        switch (text[special_pos]) {
        case '&': out.append("&amp;"); break;
        case '<': out.append("&lt;"); break;
        case '>': out.append("&gt;"); break;
        case '"': out.append("&quot;"); break;
        case '\'': out.append("&#39;"); break;
        default: SLUGMARK_ASSERT_UNREACHABLE("Logical mistake.");
        }
        text = text.substr(special_pos + 1);
    }
}

HTML_Writer::HTML_Writer(std::pmr::string& out)
    : m_out(out)
{
}

auto HTML_Writer::write_inner_text(std::string_view text) -> Self&
{
    SLUGMARK_ASSERT(!m_in_attributes);
    append_html_escaped(m_out, text);
    return *this;
}

auto HTML_Writer::write_inner_html(std::string_view html) -> Self&
{
    SLUGMARK_ASSERT(!m_in_attributes);
    m_out.append(html);
    return *this;
}

auto HTML_Writer::write_line_break() -> Self&
{
    SLUGMARK_ASSERT(!m_in_attributes);
    m_out += '\n';
    return *this;
}

auto HTML_Writer::write_empty_tag(std::string_view id) -> Self&
{
    SLUGMARK_ASSERT(!m_in_attributes);
    SLUGMARK_ASSERT(is_html_identifier(id));

    m_out += '<';
    m_out.append(id);
    m_out.append(" />");

    return *this;
}

auto HTML_Writer::open_tag(std::string_view id) -> Self&
{
    SLUGMARK_ASSERT(!m_in_attributes);
    SLUGMARK_ASSERT(is_html_identifier(id));

    m_out += '<';
    m_out.append(id);
    m_out += '>';
    ++m_depth;

    return *this;
}

Attribute_Writer HTML_Writer::open_tag_with_attributes(std::string_view id)
{
    SLUGMARK_ASSERT(!m_in_attributes);
    SLUGMARK_ASSERT(is_html_identifier(id));

    m_out += '<';
    m_out.append(id);
    m_in_attributes = true;

    return Attribute_Writer { *this };
}

auto HTML_Writer::close_tag(std::string_view id) -> Self&
{
    SLUGMARK_ASSERT(!m_in_attributes);
    SLUGMARK_ASSERT(is_html_identifier(id));
    SLUGMARK_ASSERT(m_depth != 0);

    --m_depth;

    m_out.append("</");
    m_out.append(id);
    m_out += '>';

    return *this;
}

auto HTML_Writer::write_attribute(std::string_view key, std::string_view value) -> Self&
{
    SLUGMARK_ASSERT(m_in_attributes);
    SLUGMARK_ASSERT(is_html_identifier(key));

    m_out += ' ';
    m_out.append(key);

    if (!value.empty()) {
        m_out.append("=\"");
        append_html_escaped(m_out, value);
        m_out += '"';
    }

    return *this;
}

auto HTML_Writer::end_attributes() -> Self&
{
    SLUGMARK_ASSERT(m_in_attributes);

    m_out += '>';
    m_in_attributes = false;
    ++m_depth;

    return *this;
}

auto HTML_Writer::end_empty_tag_attributes() -> Self&
{
    SLUGMARK_ASSERT(m_in_attributes);

    m_out.append(" />");
    m_in_attributes = false;

    return *this;
}

} // namespace slugmark::md
