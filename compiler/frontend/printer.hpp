#pragma once

#include "ast.hpp"

#include <iosfwd>
#include <string>

namespace mview::frontend
{
    void print(const Children& children, std::ostream& stream);
    std::string canonicalPrint(const Children& children);
} // namespace mview::frontend
