#include <cstdlib>
#include <iostream>

#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/tty.hpp"

#include "mda/parsing/parse.hpp"

#include "cli/compile.hpp"

namespace markdown_academic {

void Printing_Logger::operator()(mda::Diagnostic&& diagnostic)
{
    Code_String out { memory };
    print_diagnostic(out, file, diagnostic);
    print_code_string(std::cout, out, colors);
}

std::pmr::string load_file(std::string_view file, std::pmr::memory_resource* memory)
{
    Result<std::pmr::string, IO_Error_Code> result = file_to_string(file, memory);
    if (!result) {
        Code_String out { memory };
        print_io_error(out, file, result.error());
        print_code_string(std::cout, out, is_stdout_tty);
        std::exit(1);
    }
    return std::move(*result);
}

mda::Document
parse_mda_file(std::string_view source, std::string_view file, std::pmr::memory_resource* memory)
{
    Result<mda::Document, mda::Parse_Error> parsed = mda::parse(source, memory);
    if (!parsed) {
        Code_String out { memory };
        print_parse_error(out, file, source, parsed.error());
        print_code_string(std::cout, out, is_stdout_tty);
        std::exit(1);
    }
    return std::move(*parsed);
}

mda::Resolved_Document resolve_document(mda::Document&& document,
                                        std::string_view file,
                                        const mda::Resolve_Config& config,
                                        std::pmr::memory_resource* memory)
{
    Result<mda::Resolved_Document, mda::Resolution_Error> resolved
        = mda::resolve(std::move(document), config, memory);
    if (!resolved) {
        Code_String out { memory };
        print_resolution_error(out, file, resolved.error());
        print_code_string(std::cout, out, is_stdout_tty);
        std::exit(1);
    }
    return std::move(*resolved);
}

std::string_view parent_directory(std::string_view file)
{
    const Size slash = file.find_last_of('/');
    if (slash == std::string_view::npos) {
        return {};
    }
    return slash == 0 ? file.substr(0, 1) : file.substr(0, slash);
}

} // namespace markdown_academic
