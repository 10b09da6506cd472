#include "expander.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

namespace mview::expander
{
    using frontend::Attribute;
    using frontend::AttributeKind;
    using frontend::Child;
    using frontend::ChildKind;
    using frontend::DirectiveKind;
    using frontend::Element;
    using frontend::TagKind;
    using frontend::Value;
    using frontend::ValueKind;

    namespace
    {
        // self, Self, super and crate cannot be written as raw identifiers.
        constexpr std::array<std::string_view, 47> kHostKeywords = {
            "abstract", "as", "async", "await", "become", "box", "break", "const", "continue", "do",
            "dyn", "else", "enum", "extern", "false", "final", "fn", "for", "if", "impl",
            "in", "let", "loop", "macro", "match", "mod", "move", "mut", "override", "priv",
            "pub", "ref", "return", "static", "struct", "trait", "true", "try", "type", "typeof",
            "unsafe", "unsized", "use", "virtual", "where", "while", "yield"};

        // Builder setter names must stay callable when a prop is named after a keyword.
        std::string hostIdentifier(std::string name)
        {
            if (std::find(kHostKeywords.begin(), kHostKeywords.end(), name) != kHostKeywords.end())
            {
                return "r#" + name;
            }
            return name;
        }

        bool isSlot(const Child& child)
        {
            return child.kind == ChildKind::Element && child.element->selector.kind == TagKind::Slot;
        }

        std::string directiveKey(const Attribute& attribute)
        {
            if (attribute.literalKey.has_value())
            {
                return *attribute.literalKey;
            }
            return frontend::toStringLiteral(attribute.key);
        }

        std::string joinParameters(const std::vector<std::string>& parameters)
        {
            std::string joined;
            for (std::size_t index = 0; index < parameters.size(); ++index)
            {
                if (index != 0)
                {
                    joined += ", ";
                }
                joined += parameters[index];
            }
            return joined;
        }
    } // namespace

    Expander::Expander(ExpanderOptions options)
        : m_options(std::move(options))
    {
    }

    std::optional<std::string> Expander::expand(const frontend::Children& roots)
    {
        m_diagnostics.clear();

        // A single root expands on its own; anything else becomes a fragment.
        if (roots.items.size() == 1)
        {
            const Child& root = roots.items.front();
            if (isSlot(root))
            {
                emitError("MVIEW-E2201", "Slots should be inside a parent that supports slots.", root.element->selector.span);
                return std::nullopt;
            }
            return expandChild(root);
        }

        std::vector<const Child*> children;
        children.reserve(roots.items.size());
        for (const auto& root : roots.items)
        {
            if (isSlot(root))
            {
                emitError("MVIEW-E2201", "Slots should be inside a parent that supports slots.", root.element->selector.span);
                return std::nullopt;
            }
            children.emplace_back(&root);
        }

        return expandFragment(children);
    }

    const std::vector<Diagnostic>& Expander::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::optional<std::string> Expander::expandChild(const Child& child)
    {
        if (child.kind == ChildKind::Value)
        {
            return expandValue(child.value);
        }
        return expandElement(*child.element);
    }

    std::optional<std::string> Expander::expandElement(const Element& element)
    {
        switch (element.selector.kind)
        {
        case TagKind::Element:
            return expandHtmlElement(element);
        case TagKind::Component:
            return expandComponent(element);
        case TagKind::Slot:
            break;
        }

        emitError("MVIEW-E2201", "Slots should be inside a parent that supports slots.", element.selector.span);
        return std::nullopt;
    }

    std::optional<std::string> Expander::expandHtmlElement(const Element& element)
    {
        const frontend::Selector& selector = element.selector;

        std::string output = m_options.cratePath + "::html::" + selector.tag;
        if (selector.generics.has_value())
        {
            output += "::<" + *selector.generics + ">";
        }
        output += "()";

        for (const auto& name : selector.classes)
        {
            output += ".classes(" + frontend::toStringLiteral(name) + ")";
        }
        if (selector.id.has_value())
        {
            output += ".id(" + frontend::toStringLiteral(*selector.id) + ")";
        }

        std::vector<const Attribute*> spreads;
        for (const auto& attribute : element.attributes)
        {
            if (attribute.kind == AttributeKind::Spread)
            {
                spreads.emplace_back(&attribute);
                continue;
            }

            auto call = applyHtmlAttribute(attribute);
            if (!call.has_value())
            {
                return std::nullopt;
            }
            output += *call;
        }
        for (const Attribute* spread : spreads)
        {
            output += ".attrs(" + spread->spreadExpression + ")";
        }

        if (element.closureParameters.has_value())
        {
            emitError("MVIEW-E2212",
                      "Children of HTML element '" + selector.tag + "' cannot take closure parameters; only components accept them.",
                      element.span);
            return std::nullopt;
        }

        if (!element.children.has_value() || element.children->items.empty())
        {
            return output;
        }

        std::vector<const Child*> children;
        for (const auto& child : element.children->items)
        {
            if (isSlot(child))
            {
                emitError("MVIEW-E2201", "Slots should be inside a parent that supports slots.", child.element->selector.span);
                return std::nullopt;
            }
            children.emplace_back(&child);
        }

        auto attached = children.size() == 1 ? expandChild(*children.front()) : expandFragment(children);
        if (!attached.has_value())
        {
            return std::nullopt;
        }
        return output + ".child(" + *attached + ")";
    }

    std::optional<std::string> Expander::expandComponent(const Element& element)
    {
        if (!checkNoSelectorShorthand(element))
        {
            return std::nullopt;
        }

        std::string name = element.selector.tag;
        if (element.selector.generics.has_value())
        {
            name += "::<" + *element.selector.generics + ">";
        }

        std::string chained;
        auto properties = applyProperties(element, chained);
        if (!properties.has_value())
        {
            return std::nullopt;
        }

        const std::string& crate = m_options.cratePath;
        return crate + "::component_view(&" + name + ", " + crate + "::component_props_builder(&" + name + ")" + *properties
               + ".build())" + chained;
    }

    std::optional<std::string> Expander::expandSlot(const Element& element)
    {
        if (!checkNoSelectorShorthand(element))
        {
            return std::nullopt;
        }

        std::string name = element.selector.tag;
        if (element.selector.generics.has_value())
        {
            name += "::<" + *element.selector.generics + ">";
        }

        std::string chained;
        auto properties = applyProperties(element, chained);
        if (!properties.has_value())
        {
            return std::nullopt;
        }
        return name + "::builder()" + *properties + ".build()";
    }

    std::optional<std::string> Expander::expandFragment(const std::vector<const Child*>& children)
    {
        std::string output = m_options.cratePath + "::Fragment::lazy(|| vec![";
        for (std::size_t index = 0; index < children.size(); ++index)
        {
            auto child = expandChild(*children[index]);
            if (!child.has_value())
            {
                return std::nullopt;
            }
            if (index != 0)
            {
                output += ", ";
            }
            output += *child + ".into_view()";
        }
        output += "])";
        return output;
    }

    std::string Expander::expandValue(const Value& value) const
    {
        switch (value.kind)
        {
        case ValueKind::Literal:
            return value.text;
        case ValueKind::Block:
            return "{" + value.text + "}";
        case ValueKind::BracketClosure:
            return "{move || " + value.text + "}";
        }
        return value.text;
    }

    std::optional<std::string> Expander::applyHtmlAttribute(const Attribute& attribute)
    {
        const std::string value = attribute.value.has_value() ? expandValue(*attribute.value) : "()";

        if (attribute.kind != AttributeKind::Directive)
        {
            if (attribute.key.segments.size() == 1 && attribute.key.segments.front() == "ref")
            {
                return ".node_ref(" + value + ")";
            }
            return ".attr(" + frontend::toStringLiteral(attribute.key) + ", " + value + ")";
        }

        switch (attribute.directive)
        {
        case DirectiveKind::Class:
            return ".class(" + directiveKey(attribute) + ", " + value + ")";
        case DirectiveKind::Style:
            return ".style(" + directiveKey(attribute) + ", " + value + ")";
        case DirectiveKind::Prop:
            return ".prop(" + directiveKey(attribute) + ", " + value + ")";
        case DirectiveKind::Attr:
            return ".attr(" + directiveKey(attribute) + ", " + value + ")";
        case DirectiveKind::On:
            return ".on(" + m_options.cratePath + "::ev::" + frontend::toIdentifier(attribute.key) + ", " + value + ")";
        case DirectiveKind::Use:
            return ".directive(" + frontend::toIdentifier(attribute.key) + ", " + value + ")";
        case DirectiveKind::Clone:
            break;
        }

        emitError("MVIEW-E2211",
                  "'clone:' is only supported on components whose children take a closure.",
                  attribute.span);
        return std::nullopt;
    }

    std::optional<std::string> Expander::applyProperty(const Element& element,
                                                       const Attribute& attribute,
                                                       std::string& chained,
                                                       std::vector<std::string>& clones)
    {
        const bool onSlot = element.selector.kind == TagKind::Slot;
        const std::string target = std::string{onSlot ? "slot '" : "component '"} + element.selector.tag + "'";

        if (attribute.kind == AttributeKind::Spread)
        {
            emitError("MVIEW-E2210", "Spread attributes are not supported on " + target + "; pass named properties instead.", attribute.span);
            return std::nullopt;
        }

        if (attribute.kind != AttributeKind::Directive)
        {
            return "." + hostIdentifier(frontend::toIdentifier(attribute.key)) + "(" + expandValue(*attribute.value) + ")";
        }

        const std::string value = attribute.value.has_value() ? expandValue(*attribute.value) : "()";
        switch (attribute.directive)
        {
        case DirectiveKind::Clone:
            clones.emplace_back(frontend::toIdentifier(attribute.key));
            return std::string{};
        case DirectiveKind::On:
            if (!onSlot)
            {
                chained += ".on(" + m_options.cratePath + "::ev::" + frontend::toIdentifier(attribute.key) + ", " + value + ")";
                return std::string{};
            }
            break;
        case DirectiveKind::Use:
            if (!onSlot)
            {
                chained += ".directive(" + frontend::toIdentifier(attribute.key) + ", " + value + ")";
                return std::string{};
            }
            break;
        case DirectiveKind::Class:
        case DirectiveKind::Style:
        case DirectiveKind::Prop:
        case DirectiveKind::Attr:
            break;
        }

        emitError("MVIEW-E2210",
                  "'" + std::string{frontend::toString(attribute.directive)} + ":' directives are not supported on " + target + ".",
                  attribute.span);
        return std::nullopt;
    }

    std::optional<std::string> Expander::applyProperties(const Element& element, std::string& chained)
    {
        std::string properties;
        std::vector<std::string> clones;

        for (const auto& attribute : element.attributes)
        {
            auto call = applyProperty(element, attribute, chained, clones);
            if (!call.has_value())
            {
                return std::nullopt;
            }
            properties += *call;
        }

        if (element.children.has_value())
        {
            for (const auto& child : element.children->items)
            {
                if (!isSlot(child))
                {
                    continue;
                }

                auto slot = expandSlot(*child.element);
                if (!slot.has_value())
                {
                    return std::nullopt;
                }
                properties += "." + hostIdentifier(frontend::toSnakeCase(child.element->selector.tag)) + "(" + *slot + ")";
            }
        }

        auto children = componentChildren(element, clones);
        if (!children.has_value())
        {
            return std::nullopt;
        }
        return properties + *children;
    }

    std::optional<std::string> Expander::componentChildren(const Element& element, const std::vector<std::string>& clones)
    {
        std::vector<const Child*> children;
        if (element.children.has_value())
        {
            for (const auto& child : element.children->items)
            {
                if (!isSlot(child))
                {
                    children.emplace_back(&child);
                }
            }
        }

        const bool takesParameters = element.closureParameters.has_value();
        if (children.empty() && !takesParameters)
        {
            if (!clones.empty())
            {
                emitError("MVIEW-E2211", "'clone:' on '" + element.selector.tag + "' needs a children block to clone into.", element.span);
                return std::nullopt;
            }
            return std::string{};
        }

        auto body = expandFragment(children);
        if (!body.has_value())
        {
            return std::nullopt;
        }

        std::string closure = takesParameters ? "move |" + joinParameters(*element.closureParameters) + "| " + *body
                                              : "Box::new(move || " + *body + ")";
        if (!clones.empty())
        {
            std::string block = "{ ";
            for (const auto& name : clones)
            {
                block += "let " + name + " = " + name + ".clone(); ";
            }
            closure = block + closure + " }";
        }
        return ".children(" + closure + ")";
    }

    bool Expander::checkNoSelectorShorthand(const Element& element)
    {
        const frontend::Selector& selector = element.selector;
        if (selector.classes.empty() && !selector.id.has_value())
        {
            return true;
        }

        emitError("MVIEW-E2213",
                  "Selector shorthand ('.class' or '#id') is not supported on '" + selector.tag + "'; it only applies to HTML elements.",
                  selector.span);
        return false;
    }

    void Expander::emitError(const std::string& code, const std::string& message, SourceSpan span)
    {
        Diagnostic diag;
        diag.code = code;
        diag.message = message;
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
    }
} // namespace mview::expander
