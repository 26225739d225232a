#ifndef MARKDOWN_ACADEMIC_MDA_RESOLVE_HPP
#define MARKDOWN_ACADEMIC_MDA_RESOLVE_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "common/function_ref.hpp"
#include "common/result.hpp"

#include "mda/diagnostic.hpp"
#include "mda/document.hpp"
#include "mda/resolution/bibliography.hpp"
#include "mda/resolution/footnotes.hpp"
#include "mda/resolution/labels.hpp"
#include "mda/resolution/numbering.hpp"
#include "mda/resolution/resolution_error.hpp"

namespace markdown_academic::mda {

/// @brief Parses the text of a bibliography file.
/// On failure, returns a message describing the problem.
using Bibliography_Parser
    = Function_Ref<Result<Bibliography, std::pmr::string>(std::string_view, std::pmr::memory_resource*)>;

struct Resolve_Config {
    /// @brief The directory which the bibliography path of the metadata is relative to.
    std::string_view base_path {};
    bool strict_citations = false;
    bool strict_references = false;
    /// @brief An already parsed bibliography.
    /// If set, the bibliography path in the metadata is ignored.
    const Bibliography* bibliography = nullptr;
    /// @brief Used to parse the bibliography file named by the metadata.
    Bibliography_Parser parse_bibliography {};
    /// @brief Receives warnings and progress messages. If null, they are discarded.
    Logger* logger = nullptr;
};

/// @brief A document whose references are resolved, together with the tables built during
/// resolution.
/// The tables are only accessible for reading.
struct Resolved_Document {
private:
    Document m_document;
    Label_Registry m_labels;
    Bibliography m_citations;
    Footnote_Table m_footnotes;
    Section_Numbers m_section_numbers;
    Environment_Numbers m_env_numbers;

public:
    [[nodiscard]] Resolved_Document(Document&& document,
                                    Label_Registry&& labels,
                                    Bibliography&& citations,
                                    Footnote_Table&& footnotes,
                                    Numbering&& numbering)
        : m_document(std::move(document))
        , m_labels(std::move(labels))
        , m_citations(std::move(citations))
        , m_footnotes(std::move(footnotes))
        , m_section_numbers(std::move(numbering.section_numbers))
        , m_env_numbers(std::move(numbering.env_numbers))
    {
    }

    [[nodiscard]] const Document& document() const noexcept
    {
        return m_document;
    }

    [[nodiscard]] const Metadata& metadata() const noexcept
    {
        return m_document.metadata;
    }

    [[nodiscard]] const Label_Registry& labels() const noexcept
    {
        return m_labels;
    }

    /// @brief The bibliography which citations were validated against.
    [[nodiscard]] const Bibliography& citations() const noexcept
    {
        return m_citations;
    }

    [[nodiscard]] const Footnote_Table& footnotes() const noexcept
    {
        return m_footnotes;
    }

    [[nodiscard]] const Section_Numbers& section_numbers() const noexcept
    {
        return m_section_numbers;
    }

    [[nodiscard]] const Environment_Numbers& env_numbers() const noexcept
    {
        return m_env_numbers;
    }
};

/// @brief Resolves the document by running the following passes in order:
/// loading the bibliography, macro expansion, numbering, building the label registry,
/// resolving references, collecting footnotes, and validating citations.
/// Each pass sees the complete result of all previous passes.
[[nodiscard]] Result<Resolved_Document, Resolution_Error>
resolve(Document&& document, const Resolve_Config& config, std::pmr::memory_resource* memory);

} // namespace markdown_academic::mda

#endif
