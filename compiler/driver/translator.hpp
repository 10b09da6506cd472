#pragma once

#include "command_line.hpp"

#include <iosfwd>

namespace mview
{
    struct DriverStreams
    {
        std::istream& input;   // read for the `-` input path
        std::ostream& output;  // translated expressions when no `-o` is given
        std::ostream& log;     // [information]/[notice]/[debug] lines
        std::ostream& errors;  // diagnostics
    };

    /// Process streams for a run. Progress lines go to stdout only when the
    /// translation itself is written to a file, so stdout never mixes the two.
    [[nodiscard]] DriverStreams standardStreams(const CommandLineOptions& options);

    /// Translates every input and writes the results. Returns the exit code.
    int runTranslator(const CommandLineOptions& options, const DriverStreams& streams);
} // namespace mview
