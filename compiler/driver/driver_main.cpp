#include "command_line.hpp"
#include "translator.hpp"

#include <iostream>

#ifndef MVIEW_BUILD_PROFILE
#define MVIEW_BUILD_PROFILE "local"
#endif

namespace mview
{
    void printHelp()
    {
        std::cout << "mviewc - template markup to builder-call translator\n"
                  << "Usage: mviewc [options] <input>...\n\n"
                  << "Options:\n"
                  << "  --help                 Show this help text and exit.\n"
                  << "  --version              Show version information and exit.\n"
                  << "  --emit=<kind>          Select output kind (expr, ast). Default: expr.\n"
                  << "  --crate-path=<path>    Runtime crate path used in emitted calls. Default: leptos.\n"
                  << "  --dump-tokens          Print a preview of the lexed tokens.\n"
                  << "  -o <path>              Write output to the specified path.\n"
                  << "  -                      Read the template from standard input.\n\n"
                  << "Without -o only the output is written to stdout; progress goes to stderr.\n";
    }

    void printVersion()
    {
        std::cout << "mviewc 0.1 (build profile: " << MVIEW_BUILD_PROFILE << ")\n";
    }
} // namespace mview

int main(int argc, char** argv)
{
    mview::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        mview::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        mview::printVersion();
        return 0;
    }

    return mview::runTranslator(options.value(), mview::standardStreams(options.value()));
}
