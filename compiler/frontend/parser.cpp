#include "parser.hpp"

#include <cctype>
#include <utility>

namespace mview::frontend
{
    Parser::Parser(const std::vector<Token>& tokens, std::string_view source)
        : m_tokens(tokens)
        , m_source(source)
    {
    }

    std::optional<Children> Parser::parse()
    {
        m_current = 0;
        m_diagnostics.clear();
        m_furthestFailure = Failure{};
        m_aborted = false;

        Children children = parseChildren();
        if (m_aborted)
        {
            return std::nullopt;
        }

        if (!isAtEnd())
        {
            reportFurthestFailure("MVIEW-E2100", "Unexpected token '" + peek().text + "'.");
            return std::nullopt;
        }

        return children;
    }

    const std::vector<Diagnostic>& Parser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    bool Parser::aborted() const noexcept
    {
        return m_aborted;
    }

    std::size_t Parser::position() const noexcept
    {
        return m_current;
    }

    std::optional<KebabIdent> Parser::parseKebabIdent()
    {
        return speculate([&]() -> std::optional<KebabIdent> {
            if (m_aborted)
            {
                return std::nullopt;
            }

            if (!check(TokenKind::Identifier))
            {
                fail("Expected an identifier.");
                return std::nullopt;
            }

            const Token& first = advance();
            KebabIdent ident{};
            ident.segments.emplace_back(first.text);
            ident.span = first.span;

            // `-` and the following segment must both touch the previous token.
            while (check(TokenKind::Minus) && !peek().spaceBefore)
            {
                const Token& next = lookAhead(1);
                const bool isSegment = next.kind == TokenKind::Identifier
                                       || next.kind == TokenKind::IntegerLiteral
                                       || next.kind == TokenKind::KeywordTrue
                                       || next.kind == TokenKind::KeywordFalse;
                if (!isSegment || next.spaceBefore)
                {
                    break;
                }

                advance();
                const Token& part = advance();
                ident.segments.emplace_back(part.text);
                ident.span.end = part.span.end;
            }

            return ident;
        });
    }

    std::optional<Value> Parser::parseValue()
    {
        return speculate([&]() -> std::optional<Value> {
            if (m_aborted)
            {
                return std::nullopt;
            }

            const Token& token = peek();
            if (token.kind == TokenKind::LeftBracket || token.kind == TokenKind::LeftBrace)
            {
                const ValueKind kind = token.kind == TokenKind::LeftBracket ? ValueKind::BracketClosure : ValueKind::Block;
                auto capture = captureGroup();
                if (!capture.has_value())
                {
                    return std::nullopt;
                }
                return Value{kind, LiteralKind::None, std::move(capture->text), capture->span};
            }

            LiteralKind literal = LiteralKind::None;
            switch (token.kind)
            {
            case TokenKind::StringLiteral: literal = LiteralKind::String; break;
            case TokenKind::IntegerLiteral: literal = LiteralKind::Integer; break;
            case TokenKind::FloatLiteral: literal = LiteralKind::Float; break;
            case TokenKind::CharacterLiteral: literal = LiteralKind::Character; break;
            case TokenKind::KeywordTrue:
            case TokenKind::KeywordFalse: literal = LiteralKind::Boolean; break;
            default:
                fail("Expected a value: a literal, a '{...}' block or a '[...]' closure.");
                return std::nullopt;
            }

            advance();
            return Value{ValueKind::Literal, literal, token.text, token.span};
        });
    }

    std::optional<Attribute> Parser::parseAttribute()
    {
        return speculate([&]() -> std::optional<Attribute> {
            if (m_aborted)
            {
                return std::nullopt;
            }

            const Token& token = peek();
            if (token.kind == TokenKind::Identifier && lookAhead(1).kind == TokenKind::Colon)
            {
                if (const auto directive = directiveFromKeyword(token.text))
                {
                    return parseDirective(*directive);
                }
            }

            if (token.kind == TokenKind::LeftBrace)
            {
                return parseBraceAttribute();
            }

            return parseKeyValueOrBoolean();
        });
    }

    std::optional<Selector> Parser::parseSelector()
    {
        return speculate([&]() -> std::optional<Selector> {
            if (m_aborted)
            {
                return std::nullopt;
            }

            if (!check(TokenKind::Identifier))
            {
                fail("Expected an element or component name.");
                return std::nullopt;
            }

            Selector selector{};
            const Token& tag = advance();
            selector.span = tag.span;

            if (tag.text == "slot" && check(TokenKind::Colon) && lookAhead(1).kind == TokenKind::Identifier)
            {
                advance();
                const Token& name = advance();
                selector.tag = name.text;
                selector.kind = TagKind::Slot;
                selector.span.end = name.span.end;
            }
            else
            {
                selector.tag = tag.text;
                selector.kind = std::isupper(static_cast<unsigned char>(tag.text.front())) ? TagKind::Component : TagKind::Element;
            }

            if (check(TokenKind::LessThan))
            {
                auto generics = parseGenerics();
                if (!generics.has_value())
                {
                    return std::nullopt;
                }
                selector.generics = std::move(generics);
                selector.span.end = previous().span.end;
            }

            while (!m_aborted)
            {
                if (check(TokenKind::Dot) && lookAhead(1).kind == TokenKind::Identifier)
                {
                    advance();
                    auto name = parseKebabIdent();
                    selector.span.end = name->span.end;
                    selector.classes.emplace_back(std::move(*name));
                    continue;
                }

                if (check(TokenKind::Hash))
                {
                    const Token& hash = peek();
                    if (!hash.spaceBefore)
                    {
                        abortWith("MVIEW-E2130", "An id selector needs a space before '#', e.g. 'nav #primary'.", hash.span);
                        return std::nullopt;
                    }
                    if (lookAhead(1).kind != TokenKind::Identifier)
                    {
                        break;
                    }

                    advance();
                    auto id = parseKebabIdent();
                    if (selector.id.has_value())
                    {
                        warn("MVIEW-W2101",
                             "Element '" + selector.tag + "' already has id '" + kebabText(*selector.id) + "'; the last id selector wins.",
                             id->span);
                    }
                    selector.span.end = id->span.end;
                    selector.id = std::move(id);
                    continue;
                }

                break;
            }

            if (m_aborted)
            {
                return std::nullopt;
            }
            return selector;
        });
    }

    std::optional<Element> Parser::parseElement()
    {
        return speculate([&]() -> std::optional<Element> {
            auto selector = parseSelector();
            if (!selector.has_value())
            {
                return std::nullopt;
            }

            Element element{};
            element.span = selector->span;
            element.selector = std::move(*selector);
            const std::string& tag = element.selector.tag;

            while (auto attribute = parseAttribute())
            {
                element.span.end = attribute->span.end;
                element.attributes.emplace_back(std::move(*attribute));
            }
            if (m_aborted)
            {
                return std::nullopt;
            }

            if (check(TokenKind::Pipe))
            {
                auto parameters = parseClosureParameters();
                if (!parameters.has_value())
                {
                    return std::nullopt;
                }
                element.closureParameters = std::move(parameters);

                if (!check(TokenKind::LeftBrace))
                {
                    abortWith("MVIEW-E2141", "Expected '{' with children after the closure parameters of '" + tag + "'.", peek().span);
                    return std::nullopt;
                }
            }

            if (check(TokenKind::LeftBrace))
            {
                const Token& open = advance();
                Children children = parseChildren();
                if (m_aborted)
                {
                    return std::nullopt;
                }

                if (!check(TokenKind::RightBrace))
                {
                    reportFurthestFailure("MVIEW-E2142", "Expected '}' to close the children of '" + tag + "'.");
                    return std::nullopt;
                }

                const Token& close = advance();
                children.span = {open.span.begin, close.span.end};
                element.children = std::move(children);
                element.span.end = close.span.end;
                return element;
            }

            if (match(TokenKind::Semicolon))
            {
                element.selfClosing = true;
                element.span.end = previous().span.end;
                return element;
            }

            // The last item of a child list may leave out its terminator.
            if (peek().kind == TokenKind::RightBrace || peek().kind == TokenKind::EndOfFile)
            {
                return element;
            }

            fail("Expected '{' with children or ';' after element '" + tag + "'.");
            return std::nullopt;
        });
    }

    std::optional<Child> Parser::parseChild()
    {
        return speculate([&]() -> std::optional<Child> {
            if (m_aborted)
            {
                return std::nullopt;
            }

            if (auto value = parseValue())
            {
                if (value->kind == ValueKind::Literal && value->literalKind != LiteralKind::String)
                {
                    abortWith("MVIEW-E2150", "Only string literals are allowed in children; wrap other values in '{...}'.", value->span);
                    return std::nullopt;
                }

                Child child{};
                child.kind = ChildKind::Value;
                child.span = value->span;
                child.value = std::move(*value);
                return child;
            }

            if (auto element = parseElement())
            {
                Child child{};
                child.kind = ChildKind::Element;
                child.span = element->span;
                child.element = std::make_unique<Element>(std::move(*element));
                return child;
            }

            if (!m_aborted)
            {
                fail("Expected a child: a string, a '{...}' block, a '[...]' closure or an element.");
            }
            return std::nullopt;
        });
    }

    Children Parser::parseChildren()
    {
        Children children{};
        children.span = peek().span;

        while (auto child = parseChild())
        {
            children.span.end = child->span.end;
            children.items.emplace_back(std::move(*child));
        }

        return children;
    }

    const Token& Parser::peek() const
    {
        return m_tokens[m_current];
    }

    const Token& Parser::previous() const
    {
        return m_tokens[m_current - 1];
    }

    const Token& Parser::lookAhead(std::size_t offset) const
    {
        const std::size_t index = m_current + offset;
        if (index >= m_tokens.size())
        {
            return m_tokens.back();
        }
        return m_tokens[index];
    }

    const Token& Parser::advance()
    {
        if (!isAtEnd())
        {
            ++m_current;
        }

        const std::size_t index = (m_current == 0) ? 0 : (m_current - 1);
        return m_tokens[index];
    }

    bool Parser::isAtEnd() const
    {
        return peek().kind == TokenKind::EndOfFile;
    }

    bool Parser::check(TokenKind kind) const
    {
        if (isAtEnd()) return false;
        return peek().kind == kind;
    }

    bool Parser::match(TokenKind kind)
    {
        if (check(kind))
        {
            advance();
            return true;
        }
        return false;
    }

    void Parser::fail(std::string_view message)
    {
        if (m_furthestFailure.recorded && m_current < m_furthestFailure.position)
        {
            return;
        }

        m_furthestFailure.position = m_current;
        m_furthestFailure.message = std::string{message};
        m_furthestFailure.span = peek().span;
        m_furthestFailure.recorded = true;
    }

    void Parser::abortWith(std::string_view code, std::string message, SourceSpan span)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::move(message);
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
        m_aborted = true;
    }

    void Parser::warn(std::string_view code, std::string message, SourceSpan span)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::move(message);
        diag.span = span;
        diag.isWarning = true;
        m_diagnostics.emplace_back(std::move(diag));
    }

    void Parser::reportFurthestFailure(std::string_view code, std::string_view fallback)
    {
        if (m_furthestFailure.recorded && m_furthestFailure.position >= m_current)
        {
            abortWith(code, m_furthestFailure.message, m_furthestFailure.span);
            return;
        }
        abortWith(code, std::string{fallback}, peek().span);
    }

    SourceSpan Parser::spanFrom(const SourceSpan& begin) const
    {
        SourceSpan span{};
        span.begin = begin.begin;
        span.end = previous().span.end;
        return span;
    }

    std::optional<Parser::Capture> Parser::captureGroup()
    {
        const Token& opener = advance();
        switch (opener.kind)
        {
        case TokenKind::LeftBrace: return captureUntil(TokenKind::RightBrace, opener);
        case TokenKind::LeftBracket: return captureUntil(TokenKind::RightBracket, opener);
        case TokenKind::LeftParen: return captureUntil(TokenKind::RightParen, opener);
        default:
            fail("Expected a delimited group.");
            return std::nullopt;
        }
    }

    std::optional<Parser::Capture> Parser::captureUntil(TokenKind closer, const Token& opener)
    {
        std::vector<TokenKind> expected{closer};
        const std::size_t firstIndex = m_current;

        while (!expected.empty())
        {
            if (isAtEnd())
            {
                abortWith("MVIEW-E2110", "Unterminated '" + opener.text + "' group.", opener.span);
                return std::nullopt;
            }

            const Token& token = advance();
            switch (token.kind)
            {
            case TokenKind::LeftBrace:
                expected.emplace_back(TokenKind::RightBrace);
                break;
            case TokenKind::LeftBracket:
                expected.emplace_back(TokenKind::RightBracket);
                break;
            case TokenKind::LeftParen:
                expected.emplace_back(TokenKind::RightParen);
                break;
            case TokenKind::RightBrace:
            case TokenKind::RightBracket:
            case TokenKind::RightParen:
                if (token.kind != expected.back())
                {
                    abortWith("MVIEW-E2110", "Mismatched '" + token.text + "' inside '" + opener.text + "' group.", token.span);
                    return std::nullopt;
                }
                expected.pop_back();
                break;
            default:
                break;
            }
        }

        const std::size_t closingIndex = m_current - 1;
        Capture capture{};
        capture.span = {opener.span.begin, m_tokens[closingIndex].span.end};
        if (closingIndex > firstIndex)
        {
            const std::size_t begin = m_tokens[firstIndex].span.begin.offset;
            const std::size_t end = m_tokens[closingIndex - 1].span.end.offset;
            capture.text = std::string{m_source.substr(begin, end - begin)};
        }
        return capture;
    }

    std::optional<std::string> Parser::parseGenerics()
    {
        advance(); // '<'
        const std::size_t firstIndex = m_current;
        int depth = 1;

        while (!isAtEnd())
        {
            const Token& token = advance();
            if (token.kind == TokenKind::LessThan)
            {
                ++depth;
                continue;
            }

            if (token.kind == TokenKind::GreaterThan)
            {
                // `->` in `Fn() -> T` does not close an argument list.
                const Token& before = m_tokens[m_current - 2];
                if (before.kind == TokenKind::Minus && !token.spaceBefore)
                {
                    continue;
                }
                if (--depth == 0)
                {
                    if (m_current - 1 == firstIndex)
                    {
                        return std::string{};
                    }
                    const std::size_t begin = m_tokens[firstIndex].span.begin.offset;
                    return std::string{m_source.substr(begin, before.span.end.offset - begin)};
                }
                continue;
            }

            if (token.kind == TokenKind::LeftBrace || token.kind == TokenKind::Semicolon)
            {
                break;
            }
        }

        fail("Unterminated generic argument list.");
        return std::nullopt;
    }

    std::optional<std::vector<std::string>> Parser::parseClosureParameters()
    {
        advance(); // opening '|'
        std::vector<std::string> parameters;

        while (!check(TokenKind::Pipe))
        {
            if (!check(TokenKind::Identifier))
            {
                abortWith("MVIEW-E2140", "Children closure parameters must be plain identifiers separated by ','.", peek().span);
                return std::nullopt;
            }

            parameters.emplace_back(advance().text);
            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        if (!match(TokenKind::Pipe))
        {
            abortWith("MVIEW-E2140", "Expected '|' to close the children closure parameters.", peek().span);
            return std::nullopt;
        }
        return parameters;
    }

    std::optional<Attribute> Parser::parseDirective(DirectiveKind directive)
    {
        const Token& keyword = advance();
        advance(); // ':'

        Attribute attribute{};
        attribute.kind = AttributeKind::Directive;
        attribute.directive = directive;
        attribute.span = keyword.span;

        // The colon commits to this production: failures from here on abort.
        bool parsed = false;
        switch (directive)
        {
        case DirectiveKind::Clone:
            if (!check(TokenKind::Identifier))
            {
                abortWith("MVIEW-E2120", "Expected an identifier to clone after 'clone:'.", peek().span);
                return std::nullopt;
            }
            attribute.key.segments.emplace_back(advance().text);
            attribute.key.span = previous().span;
            parsed = true;
            break;
        case DirectiveKind::Use:
            parsed = parseDirectiveKey(attribute, false, false) && parseDirectiveValue(attribute, true);
            break;
        case DirectiveKind::Class:
        case DirectiveKind::Style:
            parsed = parseDirectiveKey(attribute, true, true) && parseDirectiveValue(attribute, false);
            break;
        case DirectiveKind::On:
        case DirectiveKind::Prop:
        case DirectiveKind::Attr:
            parsed = parseDirectiveKey(attribute, false, false) && parseDirectiveValue(attribute, false);
            break;
        }

        if (!parsed)
        {
            return std::nullopt;
        }

        attribute.span = spanFrom(keyword.span);
        return attribute;
    }

    std::optional<Attribute> Parser::parseBraceAttribute()
    {
        const Token& opener = peek();

        if (lookAhead(1).kind == TokenKind::DotDot)
        {
            advance();
            advance();
            auto capture = captureUntil(TokenKind::RightBrace, opener);
            if (!capture.has_value())
            {
                return std::nullopt;
            }
            if (capture->text.empty())
            {
                abortWith("MVIEW-E2124", "Expected an expression after '..' in spread attributes.", capture->span);
                return std::nullopt;
            }

            Attribute attribute{};
            attribute.kind = AttributeKind::Spread;
            attribute.spreadExpression = std::move(capture->text);
            attribute.span = capture->span;
            return attribute;
        }

        auto ident = parseBraced([&]() { return parseKebabIdent(); });
        if (!ident.has_value())
        {
            if (!m_aborted)
            {
                fail("Expected an attribute shorthand such as '{name}'.");
            }
            return std::nullopt;
        }

        Attribute attribute{};
        attribute.kind = AttributeKind::KeyValue;
        attribute.isShorthand = true;
        attribute.span = spanFrom(opener.span);
        attribute.value = shorthandValue(*ident, attribute.span);
        attribute.key = std::move(*ident);
        return attribute;
    }

    std::optional<Attribute> Parser::parseKeyValueOrBoolean()
    {
        return speculate([&]() -> std::optional<Attribute> {
            auto key = parseKebabIdent();
            if (!key.has_value())
            {
                return std::nullopt;
            }

            Attribute attribute{};
            attribute.span = key->span;

            if (match(TokenKind::Equals))
            {
                auto value = parseValue();
                if (!value.has_value())
                {
                    if (!m_aborted)
                    {
                        fail("Expected a value after '='; non-literal values must be wrapped in '{...}'.");
                    }
                    return std::nullopt;
                }

                attribute.kind = AttributeKind::KeyValue;
                attribute.span.end = value->span.end;
                attribute.value = std::move(value);
            }
            else
            {
                attribute.kind = AttributeKind::Boolean;
                attribute.value = Value{ValueKind::Literal, LiteralKind::Boolean, "true", key->span};
            }

            attribute.key = std::move(*key);
            return attribute;
        });
    }

    bool Parser::parseDirectiveKey(Attribute& attribute, bool allowKebab, bool allowStringKey)
    {
        const std::string prefix = std::string{toString(attribute.directive)} + ":";

        if (check(TokenKind::LeftBrace))
        {
            const Token& opener = peek();
            auto ident = parseBraced([&]() { return parseKebabIdent(); });
            if (!ident.has_value() || (!allowKebab && ident->segments.size() > 1))
            {
                if (!m_aborted)
                {
                    abortWith("MVIEW-E2123", "Expected a single identifier in '" + prefix + "{...}' shorthand.", opener.span);
                }
                return false;
            }

            attribute.isShorthand = true;
            attribute.value = shorthandValue(*ident, spanFrom(opener.span));
            attribute.key = std::move(*ident);
            return true;
        }

        if (allowStringKey && check(TokenKind::StringLiteral))
        {
            const Token& literal = advance();
            attribute.literalKey = literal.text;
            attribute.key.span = literal.span;
            return true;
        }

        auto ident = parseKebabIdent();
        if (!ident.has_value())
        {
            if (!m_aborted)
            {
                abortWith("MVIEW-E2120",
                          allowStringKey ? "Expected an identifier or string literal after '" + prefix + "'."
                                         : "Expected an identifier after '" + prefix + "'.",
                          peek().span);
            }
            return false;
        }
        if (!allowKebab && ident->segments.size() > 1)
        {
            abortWith("MVIEW-E2120", "Directive '" + prefix + "' requires a plain identifier key, found '" + kebabText(*ident) + "'.", ident->span);
            return false;
        }

        attribute.key = std::move(*ident);
        return true;
    }

    bool Parser::parseDirectiveValue(Attribute& attribute, bool optional)
    {
        if (attribute.value.has_value())
        {
            return true;
        }

        if (!match(TokenKind::Equals))
        {
            if (optional)
            {
                return true;
            }
            abortWith("MVIEW-E2121", "Expected '=' after directive '" + std::string{toString(attribute.directive)} + ":"
                          + attribute.literalKey.value_or(kebabText(attribute.key)) + "'.",
                      peek().span);
            return false;
        }

        auto value = parseValue();
        if (!value.has_value())
        {
            if (!m_aborted)
            {
                abortWith("MVIEW-E2122", "Expected a value after '='; non-literal values must be wrapped in '{...}'.", peek().span);
            }
            return false;
        }

        attribute.value = std::move(value);
        return true;
    }

    Value Parser::shorthandValue(const KebabIdent& ident, SourceSpan span) const
    {
        return Value{ValueKind::Block, LiteralKind::None, toIdentifier(ident), span};
    }
} // namespace mview::frontend
