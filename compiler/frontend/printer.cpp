#include "printer.hpp"

#include <ostream>
#include <sstream>

namespace mview::frontend
{
    namespace
    {
        void printIndent(std::ostream& stream, int level)
        {
            for (int i = 0; i < level; ++i)
            {
                stream << "  ";
            }
        }

        std::string_view literalName(LiteralKind kind)
        {
            switch (kind)
            {
            case LiteralKind::None: return "none";
            case LiteralKind::String: return "string";
            case LiteralKind::Integer: return "integer";
            case LiteralKind::Float: return "float";
            case LiteralKind::Character: return "character";
            case LiteralKind::Boolean: return "boolean";
            }
            return "unknown";
        }

        std::string_view tagKindName(TagKind kind)
        {
            switch (kind)
            {
            case TagKind::Element: return "element";
            case TagKind::Component: return "component";
            case TagKind::Slot: return "slot";
            }
            return "unknown";
        }

        void printValue(const Value& value, std::ostream& stream)
        {
            switch (value.kind)
            {
            case ValueKind::Literal:
                stream << "literal(" << literalName(value.literalKind) << ") " << value.text;
                break;
            case ValueKind::Block:
                stream << "block {" << value.text << "}";
                break;
            case ValueKind::BracketClosure:
                stream << "closure [" << value.text << "]";
                break;
            }
        }

        void printAttribute(const Attribute& attribute, std::ostream& stream, int level)
        {
            printIndent(stream, level);
            switch (attribute.kind)
            {
            case AttributeKind::KeyValue:
                stream << "attr " << kebabText(attribute.key);
                break;
            case AttributeKind::Boolean:
                stream << "flag " << kebabText(attribute.key);
                break;
            case AttributeKind::Directive:
                stream << "directive " << toString(attribute.directive) << ':'
                       << attribute.literalKey.value_or(kebabText(attribute.key));
                break;
            case AttributeKind::Spread:
                stream << "spread " << attribute.spreadExpression << "\n";
                return;
            }

            if (attribute.isShorthand)
            {
                stream << " (shorthand)";
            }
            if (attribute.value.has_value())
            {
                stream << " = ";
                printValue(*attribute.value, stream);
            }
            stream << "\n";
        }

        void printChildren(const Children& children, std::ostream& stream, int level);

        void printElement(const Element& element, std::ostream& stream, int level)
        {
            const Selector& selector = element.selector;

            printIndent(stream, level);
            stream << tagKindName(selector.kind) << ' ' << selector.tag;
            if (selector.generics.has_value())
            {
                stream << '<' << *selector.generics << '>';
            }
            stream << "\n";

            for (const auto& name : selector.classes)
            {
                printIndent(stream, level + 1);
                stream << "class " << kebabText(name) << "\n";
            }
            if (selector.id.has_value())
            {
                printIndent(stream, level + 1);
                stream << "id " << kebabText(*selector.id) << "\n";
            }

            for (const auto& attribute : element.attributes)
            {
                printAttribute(attribute, stream, level + 1);
            }

            if (element.closureParameters.has_value())
            {
                printIndent(stream, level + 1);
                stream << "parameters (";
                for (std::size_t index = 0; index < element.closureParameters->size(); ++index)
                {
                    stream << (index == 0 ? "" : ", ") << (*element.closureParameters)[index];
                }
                stream << ")\n";
            }

            if (element.children.has_value())
            {
                printIndent(stream, level + 1);
                stream << "children (" << element.children->items.size() << ")\n";
                printChildren(*element.children, stream, level + 2);
            }
            else if (element.selfClosing)
            {
                printIndent(stream, level + 1);
                stream << "self-closing\n";
            }
        }

        void printChildren(const Children& children, std::ostream& stream, int level)
        {
            for (const auto& child : children.items)
            {
                if (child.kind == ChildKind::Element)
                {
                    printElement(*child.element, stream, level);
                    continue;
                }

                printIndent(stream, level);
                stream << "value ";
                printValue(child.value, stream);
                stream << "\n";
            }
        }
    } // namespace

    void print(const Children& children, std::ostream& stream)
    {
        stream << "children (" << children.items.size() << ")\n";
        printChildren(children, stream, 1);
    }

    std::string canonicalPrint(const Children& children)
    {
        std::ostringstream stream;
        print(children, stream);
        return stream.str();
    }
} // namespace mview::frontend
