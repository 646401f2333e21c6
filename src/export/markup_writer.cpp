#include <export/markup_writer.hpp>
#include <cctype>
#include <cstdint>

namespace Roster {

namespace {

// XML 1.0 NameStartChar, without ':' (reserved for namespaces)
bool is_name_start(char32_t cp) {
    return (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z') || cp == '_' ||
           (cp >= 0xC0 && cp <= 0xD6) || (cp >= 0xD8 && cp <= 0xF6) ||
           (cp >= 0xF8 && cp <= 0x2FF) || (cp >= 0x370 && cp <= 0x37D) ||
           (cp >= 0x37F && cp <= 0x1FFF) || (cp >= 0x200C && cp <= 0x200D) ||
           (cp >= 0x2070 && cp <= 0x218F) || (cp >= 0x2C00 && cp <= 0x2FEF) ||
           (cp >= 0x3001 && cp <= 0xD7FF) || (cp >= 0xF900 && cp <= 0xFDCF) ||
           (cp >= 0xFDF0 && cp <= 0xFFFD) || (cp >= 0x10000 && cp <= 0xEFFFF);
}

bool is_name_char(char32_t cp) {
    return is_name_start(cp) || (cp >= '0' && cp <= '9') || cp == '-' || cp == '.' ||
           cp == 0xB7 || (cp >= 0x300 && cp <= 0x36F) || (cp >= 0x203F && cp <= 0x2040);
}

/**
 * Decode the UTF-8 sequence at s[i].
 * @return Sequence length, or 0 if the bytes there are not well-formed
 *         (bad lead byte, truncated, overlong, surrogate, > U+10FFFF).
 */
size_t decode_utf8(const std::string& s, size_t i, char32_t& cp) {
    uint8_t c = static_cast<uint8_t>(s[i]);
    size_t len = 0;
    char32_t min = 0;

    if (c < 0x80) { cp = c; return 1; }
    else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; min = 0x80; }
    else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; min = 0x800; }
    else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; min = 0x10000; }
    else return 0;

    if (i + len > s.size()) return 0;

    for (size_t j = 1; j < len; ++j) {
        uint8_t cc = static_cast<uint8_t>(s[i + j]);
        if ((cc >> 6) != 0x2) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

} // namespace

std::string to_element_name(const std::string& column) {
    if (column.empty()) return "_";

    std::string name;
    name.reserve(column.size() + 1);
    bool needs_prefix = false;

    for (size_t i = 0; i < column.size();) {
        char32_t cp = 0;
        size_t len = decode_utf8(column, i, cp);

        if (len == 0) {
            // One '_' per malformed byte
            name.push_back('_');
            ++i;
            continue;
        }

        if (is_name_char(cp)) {
            if (i == 0 && !is_name_start(cp)) needs_prefix = true;
            name.append(column, i, len);
        } else {
            name.push_back('_');
        }
        i += len;
    }

    bool reserved = name.size() >= 3 &&
                    std::tolower(static_cast<unsigned char>(name[0])) == 'x' &&
                    std::tolower(static_cast<unsigned char>(name[1])) == 'm' &&
                    std::tolower(static_cast<unsigned char>(name[2])) == 'l';

    if (needs_prefix || reserved) {
        name.insert(name.begin(), '_');
    }
    return name;
}

MarkupWriter::MarkupWriter(int indent_width)
    : out_("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"), indent_width_(indent_width) {}

std::string MarkupWriter::escape_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:
                // Control characters other than tab/LF/CR are not allowed in XML 1.0
                if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') break;
                out.push_back(ch);
        }
    }
    return out;
}

void MarkupWriter::indent() {
    out_.append(stack_.size() * static_cast<size_t>(indent_width_), ' ');
}

void MarkupWriter::open(const std::string& name) {
    if (!stack_.empty() && !has_children_.back()) {
        out_ += ">\n";
        has_children_.back() = true;
    }
    indent();
    out_ += "<" + name;
    stack_.push_back(name);
    has_children_.push_back(false);
}

void MarkupWriter::close() {
    if (stack_.empty()) return;

    std::string name = stack_.back();
    bool children = has_children_.back();
    stack_.pop_back();
    has_children_.pop_back();

    if (!children) {
        out_ += "/>\n";
        return;
    }
    indent();
    out_ += "</" + name + ">\n";
}

void MarkupWriter::text_element(const std::string& name, const std::string& text) {
    if (text.empty()) {
        empty_element(name);
        return;
    }
    open(name);
    out_ += ">" + escape_text(text) + "</" + name + ">\n";
    stack_.pop_back();
    has_children_.pop_back();
}

void MarkupWriter::empty_element(const std::string& name) {
    open(name);
    close();
}

std::string MarkupWriter::finish() {
    while (!stack_.empty()) close();
    return out_;
}

} // namespace Roster
