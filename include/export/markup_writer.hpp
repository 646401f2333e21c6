#pragma once

#include <string>
#include <vector>

namespace Roster {

/**
 * @brief Minimal indented XML document builder.
 *
 * Usage:
 *   MarkupWriter w;
 *   w.open("data");
 *   w.open("row");
 *   w.text_element("id", "1");
 *   w.close();
 *   w.close();
 *   std::string doc = w.finish();
 *
 * Element names are used as given; pass column names through
 * to_element_name() first. Text is escaped.
 */
class MarkupWriter {
public:
    explicit MarkupWriter(int indent_width = 2);

    void open(const std::string& name);
    void close();
    void text_element(const std::string& name, const std::string& text);
    void empty_element(const std::string& name);

    /**
     * @brief Close any open elements and return the document.
     */
    std::string finish();

    static std::string escape_text(const std::string& text);

private:
    void indent();

    std::string out_;
    std::vector<std::string> stack_;
    std::vector<bool> has_children_;
    int indent_width_;
};

/**
 * @brief Turn an arbitrary column name into a valid XML element name.
 *
 * The name is read as UTF-8. Code points outside the XML 1.0 name set
 * become '_', as does each byte of a malformed sequence. A leading character that
 * cannot start a name, and names starting with "xml" in any case, get a '_'
 * prefix. The empty name becomes "_". Valid names pass through unchanged.
 */
std::string to_element_name(const std::string& column);

} // namespace Roster
