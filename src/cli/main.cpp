#include <iostream>
#include <memory_resource>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "common/ansi.hpp"
#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/tty.hpp"

#include "mda/document.hpp"
#include "mda/resolution/resolve.hpp"

#include "cli/compile.hpp"

namespace markdown_academic {
namespace {

int dump_ast(std::string_view file, std::pmr::memory_resource* memory)
{
    const std::pmr::string source = load_file(file, memory);
    const mda::Document document = parse_mda_file(source, file, memory);

    Code_String out { memory };
    print_ast(out, document, { .indent_width = 2, .max_node_text_length = 40 });
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

struct Resolve_Flags {
    bool strict_citations = false;
    bool strict_references = false;
};

int resolve(std::string_view file, Resolve_Flags flags, std::pmr::memory_resource* memory)
{
    std::pmr::unsynchronized_pool_resource memory_resource(memory);
    const std::pmr::string source = load_file(file, &memory_resource);
    mda::Document document = parse_mda_file(source, file, &memory_resource);

    Printing_Logger logger { file, is_stdout_tty, &memory_resource };
    const mda::Resolve_Config config { .base_path = parent_directory(file),
                                       .strict_citations = flags.strict_citations,
                                       .strict_references = flags.strict_references,
                                       .logger = &logger };
    const mda::Resolved_Document resolved
        = resolve_document(std::move(document), file, config, &memory_resource);

    Code_String out { &memory_resource };
    print_resolved_document(out, resolved);
    print_code_string(std::cout, out, is_stdout_tty);
    return 0;
}

/// Unlike `resolve`, references are always strict.
/// Citations are only strict on request because no bibliography parser is built in,
/// so every citation of a document with a bibliography would otherwise be unknown.
int check(std::string_view file, bool strict_citations, std::pmr::memory_resource* memory)
{
    std::pmr::unsynchronized_pool_resource memory_resource(memory);
    const std::pmr::string source = load_file(file, &memory_resource);
    mda::Document document = parse_mda_file(source, file, &memory_resource);

    Printing_Logger logger { file, is_stdout_tty, &memory_resource };
    const mda::Resolve_Config config { .base_path = parent_directory(file),
                                       .strict_citations = strict_citations,
                                       .strict_references = true,
                                       .logger = &logger };
    [[maybe_unused]] const mda::Resolved_Document resolved
        = resolve_document(std::move(document), file, config, &memory_resource);

    if (is_stdout_tty) {
        std::cout << ansi::green;
    }
    std::cout << "All checks passed.\n";
    if (is_stdout_tty) {
        std::cout << ansi::reset;
    }
    return 0;
}

struct Command_Help {
    std::string_view name;
    std::string_view arguments;
    std::string_view description;
};

constexpr Command_Help command_helps[] {
    { "dump_ast", "FILE", "Prints the front matter and the abstract syntax tree of the document." },
    { "resolve", "FILE [--strict] [--strict-citations] [--strict-references]",
      "Resolves the document and prints labels, numbers, footnotes, and citations." },
    { "check", "FILE [--strict-citations]",
      "Resolves the document with strict references. Unknown citations are only warnings unless "
      "--strict-citations is given, since no bibliography parser is built in." },
};

void print_help(std::string_view program_name)
{
    std::cout << ansi::black << "Usage: " << ansi::reset << program_name //
              << ansi::yellow << " COMMAND " //
              << ansi::h_green << "...\n";
    for (const Command_Help& help : command_helps) {
        std::cout << "    " << ansi::yellow << help.name << " " //
                  << ansi::h_green << help.arguments << '\n' //
                  << "      " << ansi::reset << help.description << '\n';
    }
}

int main(int argc, const char** argv)
try {
    const std::vector<std::string_view> args(argv, argv + argc);
    const std::string_view program_name = args.size() == 0 ? "mda" : args[0];

    if (args.size() < 3) {
        print_help(program_name);
        return 1;
    }

    std::pmr::unsynchronized_pool_resource memory;

    if (args[1] == "dump_ast") {
        return dump_ast(args[2], &memory);
    }
    else if (args[1] == "resolve") {
        Resolve_Flags flags;
        for (std::size_t i = 3; i < args.size(); ++i) {
            if (args[i] == "--strict") {
                flags.strict_citations = true;
                flags.strict_references = true;
            }
            else if (args[i] == "--strict-citations") {
                flags.strict_citations = true;
            }
            else if (args[i] == "--strict-references") {
                flags.strict_references = true;
            }
            else {
                std::cout << "Unknown option '" << args[i] << "'\n";
                return 1;
            }
        }
        return resolve(args[2], flags, &memory);
    }
    else if (args[1] == "check") {
        bool strict_citations = false;
        for (std::size_t i = 3; i < args.size(); ++i) {
            if (args[i] == "--strict-citations") {
                strict_citations = true;
            }
            else {
                std::cout << "Unknown option '" << args[i] << "'\n";
                return 1;
            }
        }
        return check(args[2], strict_citations, &memory);
    }
    else {
        std::cout << "Unknown command '" << args[1] << "'\n";
        return 1;
    }
} catch (const Assertion_Error& e) {
    Code_String out;
    print_assertion_error(out, e);
    print_code_string(std::cout, out, is_stdout_tty);
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
    print_code_string(std::cout, out, is_stdout_tty);
    return 1;
}

} // namespace
} // namespace markdown_academic

int main(int argc, const char** argv)
{
    return markdown_academic::main(argc, argv);
}
