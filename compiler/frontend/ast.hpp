#pragma once

#include "token.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mview::frontend
{
    // An identifier that may contain single inner hyphens, e.g. `data-index`.
    struct KebabIdent
    {
        std::vector<std::string> segments;
        SourceSpan span;
    };

    [[nodiscard]] std::string kebabText(const KebabIdent& ident);
    [[nodiscard]] std::string toIdentifier(const KebabIdent& ident);
    [[nodiscard]] std::string toStringLiteral(const KebabIdent& ident);
    [[nodiscard]] std::string toSnakeCase(std::string_view pascalName);

    enum class ValueKind : std::uint8_t
    {
        Literal,
        Block,
        BracketClosure
    };

    enum class LiteralKind : std::uint8_t
    {
        None,
        String,
        Integer,
        Float,
        Character,
        Boolean
    };

    /// Attribute or child value.
    ///
    /// `text` holds the literal exactly as written for `Literal`, and the
    /// host expression between the delimiters (outer whitespace trimmed) for
    /// `Block` and `BracketClosure`. Expressions are never re-parsed.
    struct Value
    {
        ValueKind kind{ValueKind::Literal};
        LiteralKind literalKind{LiteralKind::None};
        std::string text;
        SourceSpan span;
    };

    enum class AttributeKind : std::uint8_t
    {
        KeyValue,
        Boolean,
        Directive,
        Spread
    };

    enum class DirectiveKind : std::uint8_t
    {
        Class,
        Style,
        On,
        Prop,
        Attr,
        Clone,
        Use
    };

    struct Attribute
    {
        AttributeKind kind{AttributeKind::KeyValue};
        DirectiveKind directive{DirectiveKind::Class};
        KebabIdent key;
        // Set instead of `key` for `class:"a b"` and `style:"x"` directives.
        std::optional<std::string> literalKey;
        std::optional<Value> value;
        bool isShorthand{false};
        std::string spreadExpression;
        SourceSpan span;
    };

    enum class TagKind : std::uint8_t
    {
        Element,
        Component,
        Slot
    };

    struct Selector
    {
        std::string tag;
        TagKind kind{TagKind::Element};
        // Verbatim text between `<` and `>`, without the brackets.
        std::optional<std::string> generics;
        std::vector<KebabIdent> classes;
        std::optional<KebabIdent> id;
        SourceSpan span;
    };

    struct Element;

    enum class ChildKind : std::uint8_t
    {
        Value,
        Element
    };

    struct Child
    {
        ChildKind kind{ChildKind::Value};
        Value value;
        std::unique_ptr<Element> element;
        SourceSpan span;
    };

    struct Children
    {
        std::vector<Child> items;
        SourceSpan span;
    };

    struct Element
    {
        Selector selector;
        std::vector<Attribute> attributes;
        std::optional<std::vector<std::string>> closureParameters;
        std::optional<Children> children;
        bool selfClosing{false};
        SourceSpan span;
    };

    [[nodiscard]] std::string_view toString(DirectiveKind kind);
    [[nodiscard]] std::optional<DirectiveKind> directiveFromKeyword(std::string_view keyword);
} // namespace mview::frontend
