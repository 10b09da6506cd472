#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mview
{
    enum class EmitKind
    {
        Expression,
        Ast
    };

    struct CommandLineOptions
    {
        std::vector<std::string> inputPaths;
        std::optional<std::string> outputPath;
        std::string cratePath{"leptos"};
        EmitKind emitKind{EmitKind::Expression};
        bool showHelp{false};
        bool showVersion{false};
        bool dumpTokens{false};
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument.rfind("--emit=", 0) == 0)
                {
                    const std::string_view kind = argument.substr(7);
                    if (kind == "expr")
                    {
                        options.emitKind = EmitKind::Expression;
                    }
                    else if (kind == "ast")
                    {
                        options.emitKind = EmitKind::Ast;
                    }
                    else
                    {
                        std::cerr << "MVIEW-E1004 UnknownEmitKind: '" << kind << "' (expected 'expr' or 'ast').\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--crate-path=", 0) == 0)
                {
                    constexpr std::string_view crateOpt = "--crate-path=";
                    options.cratePath = std::string{argument.substr(crateOpt.size())};
                    if (options.cratePath.empty())
                    {
                        std::cerr << "MVIEW-E1003 EmptyCratePath: expected a path after --crate-path=.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument == "--dump-tokens")
                {
                    options.dumpTokens = true;
                    continue;
                }

                if (argument.rfind("-o", 0) == 0)
                {
                    if (argument.size() > 2)
                    {
                        options.outputPath = std::string{argument.substr(2)};
                    }
                    else if (index + 1 < argc)
                    {
                        options.outputPath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "MVIEW-E1000 MissingOutput: expected path after -o option.\n";
                        return std::nullopt;
                    }

                    continue;
                }

                // A lone '-' names standard input.
                if (argument.size() > 1 && argument[0] == '-')
                {
                    std::cerr << "MVIEW-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.inputPaths.emplace_back(argument);
            }

            if (options.inputPaths.empty())
            {
                std::cerr << "MVIEW-E1002 MissingInput: at least one input file is required.\n";
                return std::nullopt;
            }

            return options;
        }
    };
} // namespace mview
