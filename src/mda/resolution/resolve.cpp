#include "common/assert.hpp"
#include "common/io.hpp"

#include "mda/resolution/citations.hpp"
#include "mda/resolution/macros.hpp"
#include "mda/resolution/resolve.hpp"

namespace markdown_academic::mda {

std::string_view resolution_error_code_name(Resolution_Error_Code code)
{
    using enum Resolution_Error_Code;
    switch (code) {
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(duplicate_label);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(unknown_reference);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(unknown_citation);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(undefined_footnote);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(duplicate_footnote);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(bibliography_unreadable);
        MARKDOWN_ACADEMIC_ENUM_STRING_CASE(bibliography_invalid);
    }
    MARKDOWN_ACADEMIC_ASSERT_UNREACHABLE("Invalid resolution error code.");
}

namespace {

void log_pass(Logger& logger, std::string_view pass, std::pmr::memory_resource* memory)
{
    if (logger.can_log(Severity::debug)) {
        std::pmr::string message("Completed pass: ", memory);
        message += pass;
        logger(Diagnostic { Severity::debug, "resolve.pass", std::move(message) });
    }
}

Result<Bibliography, Resolution_Error>
load_bibliography(const Metadata& metadata, const Resolve_Config& config, Logger& logger,
                  std::pmr::memory_resource* memory)
{
    if (config.bibliography) {
        return Bibliography(*config.bibliography, memory);
    }
    if (!metadata.bibliography) {
        return Bibliography(memory);
    }

    const std::pmr::string path = join_path(config.base_path, *metadata.bibliography, memory);
    Result<std::pmr::string, IO_Error_Code> text = file_to_string(path, memory);
    if (!text) {
        return Resolution_Error { .code = Resolution_Error_Code::bibliography_unreadable,
                                  .subject = path };
    }
    if (!config.parse_bibliography) {
        if (logger.can_log(Severity::warning)) {
            std::pmr::string message("No bibliography parser is available; the bibliography \"",
                                     memory);
            message += path;
            message += "\" is ignored.";
            logger(Diagnostic { Severity::warning, "bibliography.no_parser", std::move(message) });
        }
        return Bibliography(memory);
    }

    Result<Bibliography, std::pmr::string> parsed = config.parse_bibliography(*text, memory);
    if (!parsed) {
        return Resolution_Error { .code = Resolution_Error_Code::bibliography_invalid,
                                  .subject = path,
                                  .detail = std::move(parsed).error() };
    }
    return std::move(*parsed);
}

} // namespace

Result<Resolved_Document, Resolution_Error>
resolve(Document&& document, const Resolve_Config& config, std::pmr::memory_resource* memory)
{
    Ignorant_Logger ignorant_logger;
    Logger& logger = config.logger ? *config.logger : ignorant_logger;

    Result<Bibliography, Resolution_Error> bibliography
        = load_bibliography(document.metadata, config, logger, memory);
    if (!bibliography) {
        return std::move(bibliography).error();
    }
    log_pass(logger, "bibliography", memory);

    expand_document_macros(document, logger, memory);
    log_pass(logger, "macros", memory);

    Numbering numbering = assign_numbers(document, memory);
    log_pass(logger, "numbering", memory);

    Result<Label_Registry, Resolution_Error> labels
        = build_label_registry(document, numbering, memory);
    if (!labels) {
        return std::move(labels).error();
    }
    log_pass(logger, "labels", memory);

    const Reference_Options reference_options { .strict = config.strict_references,
                                                .bibliography = *bibliography,
                                                .logger = logger };
    if (auto r = resolve_references(document, *labels, reference_options, memory); !r) {
        return std::move(r).error();
    }
    log_pass(logger, "references", memory);

    // Footnote bodies are copied into the table, so they are collected from the resolved tree.
    Result<Footnote_Table, Resolution_Error> footnotes = collect_footnotes(
        document, Footnote_Options { .strict = config.strict_references, .logger = logger }, memory);
    if (!footnotes) {
        return std::move(footnotes).error();
    }
    log_pass(logger, "footnotes", memory);

    const Citation_Options citation_options { .strict = config.strict_citations, .logger = logger };
    if (auto r = validate_citations(document, *bibliography, citation_options, memory); !r) {
        return std::move(r).error();
    }
    log_pass(logger, "citations", memory);

    return Resolved_Document { std::move(document), std::move(*labels), std::move(*bibliography),
                               std::move(*footnotes), std::move(numbering) };
}

} // namespace markdown_academic::mda
