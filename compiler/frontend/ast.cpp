#include "ast.hpp"

#include <cctype>

namespace mview::frontend
{
    std::string kebabText(const KebabIdent& ident)
    {
        std::string text;
        for (std::size_t index = 0; index < ident.segments.size(); ++index)
        {
            if (index != 0)
            {
                text.push_back('-');
            }
            text.append(ident.segments[index]);
        }
        return text;
    }

    std::string toIdentifier(const KebabIdent& ident)
    {
        std::string text;
        for (std::size_t index = 0; index < ident.segments.size(); ++index)
        {
            if (index != 0)
            {
                text.push_back('_');
            }
            text.append(ident.segments[index]);
        }
        return text;
    }

    std::string toStringLiteral(const KebabIdent& ident)
    {
        return "\"" + kebabText(ident) + "\"";
    }

    std::string toSnakeCase(std::string_view pascalName)
    {
        std::string result;
        result.reserve(pascalName.size() + 4);
        for (std::size_t index = 0; index < pascalName.size(); ++index)
        {
            const unsigned char ch = static_cast<unsigned char>(pascalName[index]);
            if (std::isupper(ch))
            {
                if (index != 0 && result.back() != '_')
                {
                    result.push_back('_');
                }
                result.push_back(static_cast<char>(std::tolower(ch)));
            }
            else
            {
                result.push_back(static_cast<char>(ch));
            }
        }
        return result;
    }

    std::string_view toString(DirectiveKind kind)
    {
        switch (kind)
        {
        case DirectiveKind::Class: return "class";
        case DirectiveKind::Style: return "style";
        case DirectiveKind::On: return "on";
        case DirectiveKind::Prop: return "prop";
        case DirectiveKind::Attr: return "attr";
        case DirectiveKind::Clone: return "clone";
        case DirectiveKind::Use: return "use";
        }

        return "unknown";
    }

    std::optional<DirectiveKind> directiveFromKeyword(std::string_view keyword)
    {
        if (keyword == "class") return DirectiveKind::Class;
        if (keyword == "style") return DirectiveKind::Style;
        if (keyword == "on") return DirectiveKind::On;
        if (keyword == "prop") return DirectiveKind::Prop;
        if (keyword == "attr") return DirectiveKind::Attr;
        if (keyword == "clone") return DirectiveKind::Clone;
        if (keyword == "use") return DirectiveKind::Use;
        return std::nullopt;
    }
} // namespace mview::frontend
