#include <algorithm>
#include <optional>
#include <ostream>
#include <span>
#include <variant>
#include <vector>

#include "common/ansi.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/source_position.hpp"

#include "mda/ast.hpp"
#include "mda/diagnostic.hpp"
#include "mda/document.hpp"
#include "mda/parsing/parse_error.hpp"
#include "mda/resolution/citations.hpp"
#include "mda/resolution/resolution_error.hpp"
#include "mda/resolution/resolve.hpp"

namespace markdown_academic {

namespace {

[[nodiscard]] std::string_view highlight_color_of(Code_Span_Type type)
{
    using enum Code_Span_Type;
    switch (type) {
    case diagnostic_text:
    case diagnostic_code_citation:
    case diagnostic_punctuation: return ansi::reset;

    case diagnostic_code_position:
    case diagnostic_internal: return ansi::h_black;

    case diagnostic_error_text:
    case diagnostic_error: return ansi::h_red;

    case diagnostic_warning:
    case diagnostic_line_number: return ansi::h_yellow;

    case diagnostic_note: return ansi::h_white;

    case diagnostic_position_indicator: return ansi::h_green;

    case diagnostic_internal_error_notice: return ansi::h_yellow;

    case diagnostic_operand: return ansi::h_magenta;

    case diagnostic_tag: return ansi::h_blue;

    case diagnostic_attribute: return ansi::h_magenta;

    case diagnostic_escape: return ansi::h_yellow;
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Unknown code span type.");
}

constexpr std::string_view error_prefix = "error:";
constexpr std::string_view note_prefix = "note:";

[[nodiscard]] Size decimal_digits(Size x)
{
    Size result = 1;
    for (; x >= 10; x /= 10) {
        ++result;
    }
    return result;
}

[[nodiscard]] Code_Span_Type severity_span_type(mda::Severity severity)
{
    using enum mda::Severity;
    switch (severity) {
    case debug:
    case info: return Code_Span_Type::diagnostic_note;
    case warning: return Code_Span_Type::diagnostic_warning;
    case error:
    case none: return Code_Span_Type::diagnostic_error;
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid severity.");
}

/// @brief Returns pointers to the entries of an unordered map, sorted by key.
template <typename Map>
[[nodiscard]] std::vector<const typename Map::value_type*> sorted_entries(const Map& map)
{
    std::vector<const typename Map::value_type*> result;
    result.reserve(map.size());
    for (const auto& entry : map) {
        result.push_back(&entry);
    }
    std::ranges::sort(result, [](const auto* x, const auto* y) { return x->first < y->first; });
    return result;
}

} // namespace

std::string_view to_prose(mda::Parse_Error_Code e)
{
    using enum mda::Parse_Error_Code;
    switch (e) {
    case unterminated_front_matter: //
        return "The front matter was opened with '+++', but no closing '+++' line was found.";
    case front_matter_syntax: //
        return "Malformed syntax in the front matter.";
    case front_matter_type: //
        return "This front matter key has a value of the wrong type.";
    case front_matter_duplicate_key: //
        return "This key has already been assigned a value in the same table.";
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("invalid error code");
}

std::string_view to_prose(mda::Resolution_Error_Code e)
{
    using enum mda::Resolution_Error_Code;
    switch (e) {
    case duplicate_label: //
        return "The following label is declared more than once:";
    case unknown_reference: //
        return "Reference to a label which is never declared:";
    case unknown_citation: //
        return "Citation of a key which is not in the bibliography:";
    case undefined_footnote: //
        return "Reference to a footnote which is never defined:";
    case duplicate_footnote: //
        return "The following footnote is defined more than once:";
    case bibliography_unreadable: //
        return "Failed to read the bibliography file:";
    case bibliography_invalid: //
        return "Failed to parse the bibliography file:";
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("invalid error code");
}

std::string_view to_prose(IO_Error_Code e)
{
    using enum IO_Error_Code;
    switch (e) {
    case cannot_open: //
        return "Failed to open file.";
    case read_error: //
        return "I/O error occurred when reading from file.";
    case write_error: //
        return "I/O error occurred when writing to file.";
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("invalid error code");
}

void print_file_position(Code_String& out,
                         std::string_view file,
                         const Local_Source_Position& pos,
                         bool suffix_colon)
{
    auto builder = out.build(Code_Span_Type::diagnostic_code_position);
    builder.append(file)
        .append(':')
        .append_integer(pos.line + 1)
        .append(':')
        .append_integer(pos.column + 1);
    if (suffix_colon) {
        builder.append(':');
    }
}

std::string_view find_line(std::string_view source, Size index)
{
    MARKDOWN_ACADEMIC_ASSERT(index <= source.size());
    if (source.empty()) {
        return source;
    }

    if (index == source.size() || source[index] == '\n') {
        // Positions at the end of a line or past the end of the source belong to the line
        // which they end.
        if (index == 0) {
            return {};
        }
        --index;
    }

    Size begin = source.rfind('\n', index);
    begin = begin != std::string_view::npos ? begin + 1 : 0;

    Size end = std::min(source.find('\n', index + 1), source.size());

    return source.substr(begin, end - begin);
}

void print_location_of_file(Code_String& out, std::string_view file)
{
    out.build(Code_Span_Type::diagnostic_code_position).append(file).append(':');
}

void print_affected_line(Code_String& out, std::string_view source, const Local_Source_Span& pos)
{
    std::string_view line = find_line(source, pos.begin);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    const Size line_digits = decimal_digits(pos.line + 1);
    constexpr Size pad_max = 6;
    const Size pad_length = pad_max - std::min(line_digits, Size { pad_max - 1 });
    out.append(pad_length, ' ');
    out.append_integer(pos.line + 1, Code_Span_Type::diagnostic_line_number);
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    out.append(line, Code_Span_Type::diagnostic_code_citation);
    out.append('\n');

    const Size align_length = std::max(pad_max, line_digits + 1);
    out.append(align_length, ' ');
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    out.append(pos.column, ' ');
    {
        auto builder = out.build(Code_Span_Type::diagnostic_position_indicator);
        builder.append('^');
        const Size column_end = std::min(pos.column + pos.length, line.size());
        for (Size i = pos.column + 1; i < column_end; ++i) {
            builder.append('~');
        }
    }
    out.append('\n');
}

void print_parse_error(Code_String& out,
                       std::string_view file,
                       std::string_view source,
                       const mda::Parse_Error& error)
{
    print_file_position(out, file, error.pos);
    out.append(' ');
    out.append(error_prefix, Code_Span_Type::diagnostic_error);
    out.append(' ');
    out.append(to_prose(error.code), Code_Span_Type::diagnostic_text);
    out.append('\n');

    if (!error.subject.empty()) {
        print_file_position(out, file, error.pos);
        out.append(' ');
        out.append(note_prefix, Code_Span_Type::diagnostic_note);
        out.append(' ');
        out.append("in key ", Code_Span_Type::diagnostic_text);
        out.append(error.subject, Code_Span_Type::diagnostic_operand);
        out.append('\n');
    }

    if (!source.empty()) {
        print_affected_line(out, source, error.pos);
    }
}

void print_resolution_error(Code_String& out,
                            std::string_view file,
                            const mda::Resolution_Error& error)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.append(error_prefix, Code_Span_Type::diagnostic_error);
    out.append(' ');
    out.append(to_prose(error.code), Code_Span_Type::diagnostic_text);
    out.append(' ');
    out.append(error.subject, Code_Span_Type::diagnostic_operand);
    out.append('\n');

    if (!error.detail.empty()) {
        print_location_of_file(out, file);
        out.append(' ');
        out.append(note_prefix, Code_Span_Type::diagnostic_note);
        out.append(' ');
        out.append(error.detail, Code_Span_Type::diagnostic_text);
        out.append('\n');
    }
}

void print_assertion_error(Code_String& out, const Assertion_Error& error)
{
    out.append("Assertion failed! ", Code_Span_Type::diagnostic_error);

    const std::string_view message = error.type == Assertion_Error_Type::expression
        ? "The following expression evaluated to 'false', but was expected to be 'true':"
        : "Code which must be unreachable has been reached.";
    out.append(message, Code_Span_Type::diagnostic_text);
    out.append("\n\n");

    // source_location counts lines and columns from one.
    const Local_Source_Position pos { .line = error.location.line() - 1,
                                      .column = error.location.column() - 1,
                                      .begin = {} };
    print_file_position(out, error.location.file_name(), pos);
    out.append(' ');
    out.append(error.message, Code_Span_Type::diagnostic_error_text);
    out.append("\n\n");
    print_internal_error_notice(out);
}

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.append(to_prose(error), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_diagnostic(Code_String& out, std::string_view file, const mda::Diagnostic& diagnostic)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.build(severity_span_type(diagnostic.severity))
        .append(mda::severity_name(diagnostic.severity))
        .append(':');
    out.append(' ');
    out.append(diagnostic.message, Code_Span_Type::diagnostic_text);
    out.append(' ');
    out.build(Code_Span_Type::diagnostic_internal).append('[').append(diagnostic.id).append(']');
    out.append('\n');
}

namespace {

struct AST_Printer {
    Code_String& out;
    const AST_Formatting_Options options;

    void print_metadata(const mda::Metadata& metadata)
    {
        out.append("Metadata", Code_Span_Type::diagnostic_tag);
        out.append('\n');
        print_field("title", metadata.title);
        print_field("subtitle", metadata.subtitle);
        print_list_field("authors", metadata.authors);
        print_field("date", metadata.date);
        print_field("abstract", metadata.abstract);
        print_list_field("keywords", metadata.keywords);
        print_field("institution", metadata.institution);
        print_field("department", metadata.department);
        print_field("advisor", metadata.advisor);
        print_field("language", metadata.language);
        print_field("bibliography", metadata.bibliography);
        for (const auto& [name, macro] : metadata.macros) {
            indent(1);
            out.build(Code_Span_Type::diagnostic_attribute).append("macro ").append('\\').append(name);
            out.append('(', Code_Span_Type::diagnostic_punctuation);
            out.append_integer(macro.arg_count, Code_Span_Type::diagnostic_internal);
            out.append(')', Code_Span_Type::diagnostic_punctuation);
            out.append('=', Code_Span_Type::diagnostic_punctuation);
            print_cut_off(macro.body);
            out.append('\n');
        }
    }

    void print(const mda::ast::Block& block, int level)
    {
        indent(level);
        out.append(get_node_name(block), Code_Span_Type::diagnostic_tag);
        std::visit([this, level](const auto& b) { print_details(b, level); }, block);
    }

    void print(const mda::ast::Inline& node, int level)
    {
        indent(level);
        out.append(get_node_name(node), Code_Span_Type::diagnostic_tag);
        std::visit([this, level](const auto& n) { print_details(n, level); }, node);
    }

    void print_blocks(std::span<const mda::ast::Block> blocks, int level)
    {
        for (const mda::ast::Block& b : blocks) {
            print(b, level);
        }
    }

    void print_inlines(std::span<const mda::ast::Inline> inlines, int level)
    {
        for (const mda::ast::Inline& n : inlines) {
            print(n, level);
        }
    }

private:
    void indent(int level)
    {
        MARKDOWN_ACADEMIC_ASSERT(level >= 0);
        MARKDOWN_ACADEMIC_ASSERT(options.indent_width >= 0);
        out.append(Size(options.indent_width * level), ' ');
    }

    void print_field(std::string_view name, const std::optional<std::pmr::string>& value)
    {
        if (value) {
            indent(1);
            out.append(name, Code_Span_Type::diagnostic_attribute);
            out.append('=', Code_Span_Type::diagnostic_punctuation);
            print_cut_off(*value);
            out.append('\n');
        }
    }

    void print_list_field(std::string_view name, std::span<const std::pmr::string> values)
    {
        if (values.empty()) {
            return;
        }
        indent(1);
        out.append(name, Code_Span_Type::diagnostic_attribute);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        out.append('[', Code_Span_Type::diagnostic_punctuation);
        for (Size i = 0; i < values.size(); ++i) {
            if (i != 0) {
                out.append(", ", Code_Span_Type::diagnostic_punctuation);
            }
            out.append(values[i], Code_Span_Type::diagnostic_code_citation);
        }
        out.append(']', Code_Span_Type::diagnostic_punctuation);
        out.append('\n');
    }

    void open()
    {
        out.append('(', Code_Span_Type::diagnostic_punctuation);
    }

    void close()
    {
        out.append(')', Code_Span_Type::diagnostic_punctuation);
        out.append('\n');
    }

    void attribute(std::string_view name, std::string_view value, bool first = false)
    {
        if (!first) {
            out.append(", ", Code_Span_Type::diagnostic_punctuation);
        }
        out.append(name, Code_Span_Type::diagnostic_attribute);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        print_cut_off(value);
    }

    void optional_attribute(std::string_view name,
                            const std::optional<std::pmr::string>& value,
                            bool first = false)
    {
        if (value) {
            attribute(name, *value, first);
        }
    }

    void print_caption(const std::optional<std::pmr::vector<mda::ast::Inline>>& caption, int level)
    {
        if (caption) {
            indent(level + 1);
            out.append("caption:", Code_Span_Type::diagnostic_attribute);
            out.append('\n');
            print_inlines(*caption, level + 2);
        }
    }

    // BLOCKS ======================================================================================

    void print_details(const mda::ast::Paragraph& p, int level)
    {
        out.append('\n');
        print_inlines(p.content, level + 1);
    }

    void print_details(const mda::ast::Heading& h, int level)
    {
        open();
        out.append("level", Code_Span_Type::diagnostic_attribute);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        out.append_integer(h.level, Code_Span_Type::diagnostic_code_citation);
        optional_attribute("label", h.label);
        close();
        print_inlines(h.content, level + 1);
    }

    void print_details(const mda::ast::Code_Block& c, int)
    {
        open();
        if (c.language) {
            attribute("language", *c.language, true);
            attribute("code", c.code);
        }
        else {
            attribute("code", c.code, true);
        }
        close();
    }

    void print_details(const mda::ast::Block_Quote& q, int level)
    {
        out.append('\n');
        print_blocks(q.content, level + 1);
    }

    void print_details(const mda::ast::List& l, int level)
    {
        open();
        attribute("ordered", l.ordered ? "true" : "false", true);
        if (l.start) {
            out.append(", ", Code_Span_Type::diagnostic_punctuation);
            out.append("start", Code_Span_Type::diagnostic_attribute);
            out.append('=', Code_Span_Type::diagnostic_punctuation);
            out.append_integer(*l.start, Code_Span_Type::diagnostic_code_citation);
        }
        close();
        for (const mda::ast::List_Item& item : l.items) {
            indent(level + 1);
            out.append("List_Item", Code_Span_Type::diagnostic_tag);
            if (item.checked) {
                open();
                attribute("checked", *item.checked ? "true" : "false", true);
                close();
            }
            else {
                out.append('\n');
            }
            print_blocks(item.content, level + 2);
        }
    }

    void print_details(const mda::ast::Display_Math& m, int)
    {
        open();
        attribute("source", m.source, true);
        optional_attribute("label", m.label);
        close();
    }

    void print_details(const mda::ast::Environment& e, int level)
    {
        open();
        attribute("kind", display_name(e.kind), true);
        optional_attribute("label", e.label);
        close();
        print_blocks(e.content, level + 1);
        print_caption(e.caption, level);
    }

    void print_details(const mda::ast::Html_Block& h, int)
    {
        open();
        attribute("html", h.html, true);
        close();
    }

    void print_details(const mda::ast::Table& t, int level)
    {
        open();
        out.append("columns", Code_Span_Type::diagnostic_attribute);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        out.append('[', Code_Span_Type::diagnostic_punctuation);
        for (Size i = 0; i < t.alignments.size(); ++i) {
            if (i != 0) {
                out.append(", ", Code_Span_Type::diagnostic_punctuation);
            }
            out.append(mda::alignment_name(t.alignments[i]), Code_Span_Type::diagnostic_code_citation);
        }
        out.append(']', Code_Span_Type::diagnostic_punctuation);
        optional_attribute("label", t.label);
        close();
        print_row("header", t.headers, level + 1);
        for (const mda::ast::Table_Row& row : t.rows) {
            print_row("row", row, level + 1);
        }
        print_caption(t.caption, level);
    }

    void print_row(std::string_view name, const mda::ast::Table_Row& row, int level)
    {
        indent(level);
        out.append(name, Code_Span_Type::diagnostic_attribute);
        out.append(':', Code_Span_Type::diagnostic_punctuation);
        out.append('\n');
        for (const mda::ast::Table_Cell& cell : row) {
            indent(level + 1);
            out.append("cell", Code_Span_Type::diagnostic_attribute);
            out.append(':', Code_Span_Type::diagnostic_punctuation);
            out.append('\n');
            print_inlines(cell, level + 2);
        }
    }

    void print_details(const mda::ast::Description_List& d, int level)
    {
        out.append('\n');
        for (const mda::ast::Description_Item& item : d.items) {
            indent(level + 1);
            out.append("term:", Code_Span_Type::diagnostic_attribute);
            out.append('\n');
            print_inlines(item.term, level + 2);
            indent(level + 1);
            out.append("details:", Code_Span_Type::diagnostic_attribute);
            out.append('\n');
            print_blocks(item.details, level + 2);
        }
    }

    void print_details(const mda::ast::Abstract& a, int level)
    {
        out.append('\n');
        print_blocks(a.content, level + 1);
    }

    void print_details(const mda::ast::Footnote_Definition& f, int level)
    {
        open();
        attribute("id", f.id, true);
        close();
        print_inlines(f.content, level + 1);
    }

    // INLINES =====================================================================================

    void print_details(const mda::ast::Text& t, int)
    {
        open();
        print_cut_off(t.text);
        close();
    }

    template <typename T>
        requires requires(const T& n) { n.content; }
    void print_details(const T& n, int level)
    {
        out.append('\n');
        print_inlines(n.content, level + 1);
    }

    void print_details(const mda::ast::Code& c, int)
    {
        open();
        print_cut_off(c.code);
        close();
    }

    void print_details(const mda::ast::Link& l, int level)
    {
        open();
        attribute("url", l.url, true);
        optional_attribute("title", l.title);
        close();
        print_inlines(l.content, level + 1);
    }

    void print_details(const mda::ast::Image& i, int)
    {
        open();
        attribute("url", i.url, true);
        attribute("alt", i.alt);
        optional_attribute("title", i.title);
        close();
    }

    void print_details(const mda::ast::Inline_Math& m, int)
    {
        open();
        print_cut_off(m.source);
        close();
    }

    void print_details(const mda::ast::Citation& c, int)
    {
        open();
        out.append("keys", Code_Span_Type::diagnostic_attribute);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        out.append('[', Code_Span_Type::diagnostic_punctuation);
        for (Size i = 0; i < c.keys.size(); ++i) {
            if (i != 0) {
                out.append(", ", Code_Span_Type::diagnostic_punctuation);
            }
            out.append(c.keys[i], Code_Span_Type::diagnostic_code_citation);
        }
        out.append(']', Code_Span_Type::diagnostic_punctuation);
        attribute("style", mda::citation_style_name(c.style));
        optional_attribute("prefix", c.prefix);
        optional_attribute("locator", c.locator);
        close();
    }

    void print_details(const mda::ast::Reference& r, int)
    {
        open();
        attribute("label", r.label, true);
        optional_attribute("resolved", r.resolved);
        close();
    }

    void print_details(const mda::ast::Footnote& f, int level)
    {
        if (f.id) {
            open();
            attribute("id", *f.id, true);
            close();
        }
        else {
            out.append('\n');
        }
        print_inlines(f.content, level + 1);
    }

    void print_details(const mda::ast::Inline_Html& h, int)
    {
        open();
        print_cut_off(h.html);
        close();
    }

    /// @brief Fallback for nodes without any properties or children.
    template <typename T>
    void print_details(const T&, int)
    {
        out.append('\n');
    }

    /// @brief Prints text which is cut off at some point.
    /// Nodes often contain very long text, making it impractical to print everything.
    /// @param v the text to print
    void print_cut_off(std::string_view v)
    {
        MARKDOWN_ACADEMIC_ASSERT(options.max_node_text_length >= 0);

        int visual_length = 0;

        for (Size i = 0; i < v.length();) {
            if (visual_length >= options.max_node_text_length) {
                out.append("...", Code_Span_Type::diagnostic_punctuation);
                break;
            }

            if (v[i] == '\r') {
                out.append("\\r", Code_Span_Type::diagnostic_escape);
                visual_length += 2;
                ++i;
            }
            else if (v[i] == '\t') {
                out.append("\\t", Code_Span_Type::diagnostic_escape);
                visual_length += 2;
                ++i;
            }
            else if (v[i] == '\n') {
                out.append("\\n", Code_Span_Type::diagnostic_escape);
                visual_length += 2;
                ++i;
            }
            else {
                const auto remainder
                    = v.substr(i, Size(options.max_node_text_length - visual_length));
                const auto part = remainder.substr(0, remainder.find_first_of("\r\t\n"));
                out.append(part, Code_Span_Type::diagnostic_code_citation);
                visual_length += int(part.size());
                i += part.size();
            }
        }
    }
};

void print_table_heading(Code_String& out, std::string_view name)
{
    out.build(Code_Span_Type::diagnostic_tag).append(name).append(':');
    out.append('\n');
}

} // namespace

void print_ast(Code_String& out, const mda::Document& document, AST_Formatting_Options options)
{
    AST_Printer printer { out, options };
    printer.print_metadata(document.metadata);
    out.append("Document", Code_Span_Type::diagnostic_tag);
    out.append('\n');
    printer.print_blocks(document.blocks, 1);
}

void print_resolved_document(Code_String& out, const mda::Resolved_Document& document)
{
    print_table_heading(out, "Labels");
    for (const auto* entry : sorted_entries(document.labels())) {
        out.append("  ");
        out.append(entry->first, Code_Span_Type::diagnostic_operand);
        out.append(" -> ", Code_Span_Type::diagnostic_punctuation);
        out.build(Code_Span_Type::diagnostic_code_citation)
            .append('"')
            .append(entry->second.display)
            .append('"');
        out.append(' ');
        out.build(Code_Span_Type::diagnostic_internal).append('#').append(entry->second.id);
        out.append('\n');
    }

    print_table_heading(out, "Section numbers");
    for (const auto* entry : sorted_entries(document.section_numbers())) {
        out.append("  ");
        out.append(entry->first, Code_Span_Type::diagnostic_operand);
        out.append(" -> ", Code_Span_Type::diagnostic_punctuation);
        out.append(entry->second, Code_Span_Type::diagnostic_code_citation);
        out.append('\n');
    }

    print_table_heading(out, "Environment numbers");
    for (const auto* entry : sorted_entries(document.env_numbers())) {
        out.append("  ");
        out.append(entry->first, Code_Span_Type::diagnostic_operand);
        out.append(" -> ", Code_Span_Type::diagnostic_punctuation);
        out.append_integer(entry->second, Code_Span_Type::diagnostic_code_citation);
        out.append('\n');
    }

    print_table_heading(out, "Footnotes");
    std::pmr::memory_resource* const memory = std::pmr::get_default_resource();
    for (const mda::Footnote_Entry& entry : document.footnotes()) {
        out.append("  ");
        out.append(entry.id, Code_Span_Type::diagnostic_operand);
        out.append(" -> ", Code_Span_Type::diagnostic_punctuation);
        out.append(mda::ast::to_plain_text(entry.content, memory),
                   Code_Span_Type::diagnostic_code_citation);
        out.append('\n');
    }

    print_table_heading(out, "Citations");
    for (const std::pmr::string& key : mda::citation_order(document.document(), memory)) {
        out.append("  ");
        out.append(key, Code_Span_Type::diagnostic_operand);
        if (!document.citations().contains(key)) {
            out.append(" (not in bibliography)", Code_Span_Type::diagnostic_warning);
        }
        out.append('\n');
    }
}

void print_internal_error_notice(Code_String& out)
{
    constexpr std::string_view notice
        = "This is an internal error. Please report this bug together with the document.\n";
    out.append(notice, Code_Span_Type::diagnostic_internal_error_notice);
}

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors)
{
    const std::string_view text = string.get_text();
    if (!colors) {
        return out << text;
    }

    Code_String_Span previous {};
    for (Code_String_Span span : string) {
        const Size previous_end = previous.begin + previous.length;
        MARKDOWN_ACADEMIC_ASSERT(span.begin >= previous_end);
        if (previous_end != span.begin) {
            out << text.substr(previous_end, span.begin - previous_end);
        }
        out << highlight_color_of(span.type) << text.substr(span.begin, span.length) << ansi::reset;
        previous = span;
    }
    const Size last_span_end = previous.begin + previous.length;
    if (last_span_end != text.size()) {
        out << text.substr(last_span_end);
    }

    return out;
}

} // namespace markdown_academic
