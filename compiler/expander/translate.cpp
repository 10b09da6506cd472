#include "translate.hpp"

#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"

#include <algorithm>
#include <utility>

namespace mview::expander
{
    namespace
    {
        void append(std::vector<Diagnostic>& into, const std::vector<Diagnostic>& from)
        {
            into.insert(into.end(), from.begin(), from.end());
        }

        bool hasError(const std::vector<Diagnostic>& diagnostics)
        {
            return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& diag) {
                return !diag.isWarning;
            });
        }

        TranslationResult standIn(std::vector<Diagnostic> diagnostics)
        {
            TranslationResult result;
            result.output = std::string{kStandInOutput};
            result.diagnostics = std::move(diagnostics);
            result.succeeded = false;
            return result;
        }
    } // namespace

    TranslationResult translate(std::string_view source, const ExpanderOptions& options)
    {
        std::vector<Diagnostic> diagnostics;

        frontend::Lexer lexer{source};
        lexer.lex();
        append(diagnostics, lexer.diagnostics());
        if (lexer.hasErrors())
        {
            return standIn(std::move(diagnostics));
        }

        frontend::Parser parser{lexer.tokens(), source};
        auto children = parser.parse();
        append(diagnostics, parser.diagnostics());
        if (!children.has_value() || hasError(parser.diagnostics()))
        {
            return standIn(std::move(diagnostics));
        }

        Expander expander{options};
        auto expression = expander.expand(*children);
        append(diagnostics, expander.diagnostics());
        if (!expression.has_value())
        {
            return standIn(std::move(diagnostics));
        }

        TranslationResult result;
        result.output = std::move(*expression);
        result.diagnostics = std::move(diagnostics);
        result.succeeded = true;
        return result;
    }
} // namespace mview::expander
