#pragma once

#include "expander.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mview::expander
{
    // Emitted in place of the expression when any stage aborts.
    inline constexpr std::string_view kStandInOutput = "()";

    struct TranslationResult
    {
        std::string output;
        std::vector<Diagnostic> diagnostics;
        bool succeeded{false};
    };

    /// Runs lexer, parser and expander over one template body.
    ///
    /// Stops at the first stage that reports an error. Warnings from earlier
    /// stages are kept in `diagnostics` either way.
    [[nodiscard]] TranslationResult translate(std::string_view source, const ExpanderOptions& options = {});
} // namespace mview::expander
