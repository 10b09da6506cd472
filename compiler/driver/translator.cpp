#include "translator.hpp"

#include "../expander/translate.hpp"
#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"
#include "../frontend/printer.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace mview
{
    namespace
    {
        std::optional<std::string> loadFile(const std::string& path, std::istream& input)
        {
            if (path == "-")
            {
                return std::string{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
            }

            std::ifstream stream(path, std::ios::binary);
            if (!stream)
            {
                return std::nullopt;
            }

            std::ostringstream buffer;
            buffer << stream.rdbuf();
            return buffer.str();
        }

        void reportDiagnostics(const std::vector<frontend::Diagnostic>& diagnostics, std::ostream& errors)
        {
            for (const auto& diagnostic : diagnostics)
            {
                errors << diagnostic.code << ' '
                       << "L" << diagnostic.span.begin.line << ":C" << diagnostic.span.begin.column
                       << " -> "
                       << diagnostic.message << '\n';
            }
        }

        void dumpTokens(const std::string& source, const std::string& path, std::ostream& log)
        {
            frontend::Lexer lexer{source};
            lexer.lex();

            const auto& tokens = lexer.tokens();
            log << "[debug] Lexed " << tokens.size() << " tokens from '" << path << "'.\n";
            const std::size_t previewCount = std::min<std::size_t>(tokens.size(), 16);
            for (std::size_t index = 0; index < previewCount; ++index)
            {
                const auto& token = tokens[index];
                log << "    "
                    << frontend::toString(token.kind)
                    << " @ L" << token.span.begin.line << ":C" << token.span.begin.column;
                if (!token.text.empty())
                {
                    log << " -> '" << token.text << "'";
                }
                log << '\n';
            }
        }

        // Returns the canonical AST dump, or nullopt after reporting diagnostics.
        std::optional<std::string> emitAst(const std::string& source, std::ostream& errors)
        {
            frontend::Lexer lexer{source};
            lexer.lex();
            if (lexer.hasErrors())
            {
                reportDiagnostics(lexer.diagnostics(), errors);
                return std::nullopt;
            }

            frontend::Parser parser{lexer.tokens(), source};
            auto children = parser.parse();
            reportDiagnostics(parser.diagnostics(), errors);
            if (!children.has_value())
            {
                return std::nullopt;
            }
            return frontend::canonicalPrint(*children);
        }
    } // namespace

    DriverStreams standardStreams(const CommandLineOptions& options)
    {
        std::ostream& log = options.outputPath.has_value() ? std::cout : std::clog;
        return DriverStreams{std::cin, std::cout, log, std::cerr};
    }

    int runTranslator(const CommandLineOptions& options, const DriverStreams& streams)
    {
        std::ostream& log = streams.log;
        std::ostream& errors = streams.errors;

        log << "[information] mviewc translator starting.\n";
        log << "[information] emit kind: " << (options.emitKind == EmitKind::Ast ? "ast" : "expr") << '\n';
        log << "[information] crate path: " << options.cratePath << '\n';
        for (const auto& path : options.inputPaths)
        {
            log << "  input: " << path << "\n";
        }

        expander::ExpanderOptions expanderOptions;
        expanderOptions.cratePath = options.cratePath;

        int exitCode = 0;
        std::string collected;
        for (const auto& path : options.inputPaths)
        {
            const auto content = loadFile(path, streams.input);
            if (!content.has_value())
            {
                errors << "MVIEW-E3000 InputReadFailed: unable to open '" << path << "'.\n";
                exitCode = 1;
                continue;
            }

            if (options.dumpTokens)
            {
                dumpTokens(*content, path, log);
            }

            if (options.emitKind == EmitKind::Ast)
            {
                auto dump = emitAst(*content, errors);
                if (!dump.has_value())
                {
                    exitCode = 1;
                    continue;
                }
                log << "[notice] Parsed '" << path << "'.\n";
                collected += *dump;
                continue;
            }

            const expander::TranslationResult result = expander::translate(*content, expanderOptions);
            reportDiagnostics(result.diagnostics, errors);
            if (!result.succeeded)
            {
                exitCode = 1;
            }
            else
            {
                log << "[notice] Translated '" << path << "'.\n";
            }

            // The stand-in is written as well so consumers always find an expression.
            collected += result.output;
            collected += '\n';
        }

        if (options.outputPath.has_value())
        {
            std::ofstream out(*options.outputPath, std::ios::binary);
            if (!out)
            {
                errors << "MVIEW-E3001 OutputWriteFailed: unable to open '" << *options.outputPath << "'.\n";
                return 1;
            }
            out << collected;
            log << "[notice] Output written to " << *options.outputPath << "\n";
        }
        else
        {
            streams.output << collected;
        }

        if (exitCode == 0)
        {
            log << "[notice] Translation completed.\n";
        }
        else
        {
            errors << "MVIEW-W3002 Translation halted with errors.\n";
        }

        return exitCode;
    }
} // namespace mview
