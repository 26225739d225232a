#ifndef MARKDOWN_ACADEMIC_MDA_DIAGNOSTIC_HPP
#define MARKDOWN_ACADEMIC_MDA_DIAGNOSTIC_HPP

#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "mda/fwd.hpp"

namespace markdown_academic::mda {

enum struct Severity : Default_Underlying {
    debug,
    info,
    warning,
    error,
    /// @brief Greater than all other severities; a logger with this minimum logs nothing.
    none,
};

[[nodiscard]] std::string_view severity_name(Severity severity);

/// @brief A message about a non-fatal problem or a step of processing.
struct Diagnostic {
    Severity severity;
    /// @brief A stable, dotted identifier such as `"reference.unresolved"`.
    std::string_view id;
    std::pmr::string message;
};

/// @brief A consumer for diagnostics emitted during resolution.
struct Logger {
    Severity min_severity;

    [[nodiscard]] explicit Logger(Severity min_severity)
        : min_severity { min_severity }
    {
    }

    virtual ~Logger() = default;

    /// @brief Returns `true` if diagnostics of the given severity are consumed at all.
    /// This can be checked before composing an expensive message.
    [[nodiscard]] bool can_log(Severity severity) const noexcept
    {
        return severity >= min_severity;
    }

    /// @brief Consumes a diagnostic.
    /// Only called with diagnostics for which `can_log(diagnostic.severity)` is `true`.
    virtual void operator()(Diagnostic&& diagnostic) = 0;

    void log(Severity severity, std::string_view id, std::pmr::string&& message)
    {
        if (can_log(severity)) {
            (*this)(Diagnostic { severity, id, std::move(message) });
        }
    }
};

/// @brief A logger which discards everything.
struct Ignorant_Logger final : Logger {
    [[nodiscard]] Ignorant_Logger()
        : Logger { Severity::none }
    {
    }

    void operator()(Diagnostic&&) override { }
};

/// @brief A logger which stores all diagnostics in a vector, in the order they were emitted.
struct Collecting_Logger final : Logger {
    std::pmr::vector<Diagnostic> diagnostics;

    [[nodiscard]] explicit Collecting_Logger(std::pmr::memory_resource* memory,
                                             Severity min_severity = Severity::debug)
        : Logger { min_severity }
        , diagnostics { memory }
    {
    }

    void operator()(Diagnostic&& diagnostic) override
    {
        diagnostics.push_back(std::move(diagnostic));
    }

    /// @brief Returns the number of collected diagnostics with the given identifier.
    [[nodiscard]] Size count(std::string_view id) const noexcept
    {
        Size result = 0;
        for (const Diagnostic& d : diagnostics) {
            result += d.id == id;
        }
        return result;
    }
};

} // namespace markdown_academic::mda

#endif
