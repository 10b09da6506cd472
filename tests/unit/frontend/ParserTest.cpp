#include <gtest/gtest.h>

#include "lexer.hpp"
#include "parser.hpp"
#include "printer.hpp"

#include <algorithm>

namespace mview::frontend
{
namespace
{
    std::optional<Children> parseSource(const std::string& source, std::vector<Diagnostic>& outDiagnostics)
    {
        Lexer lexer{source};
        lexer.lex();

        Parser parser{lexer.tokens(), source};
        auto children = parser.parse();
        outDiagnostics = parser.diagnostics();
        return children;
    }

    bool hasDiagnostic(const std::vector<Diagnostic>& diagnostics, const std::string& code)
    {
        return std::any_of(diagnostics.begin(), diagnostics.end(), [&](const Diagnostic& diag) {
            return diag.code == code;
        });
    }

    const Element& onlyElement(const Children& children)
    {
        EXPECT_EQ(children.items.size(), 1u);
        EXPECT_EQ(children.items.front().kind, ChildKind::Element);
        return *children.items.front().element;
    }

    TEST(ParserTest, ParsesNestedElementsWithSelectorClass)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource(R"(div.primary { strong { "hello" } })", diagnostics);

        ASSERT_TRUE(children.has_value());
        ASSERT_TRUE(diagnostics.empty());
        const Element& div = onlyElement(*children);
        EXPECT_EQ(div.selector.tag, "div");
        EXPECT_EQ(div.selector.kind, TagKind::Element);
        ASSERT_EQ(div.selector.classes.size(), 1u);
        EXPECT_EQ(kebabText(div.selector.classes.front()), "primary");
        ASSERT_TRUE(div.children.has_value());

        const Element& strong = onlyElement(*div.children);
        EXPECT_EQ(strong.selector.tag, "strong");
        ASSERT_TRUE(strong.children.has_value());
        ASSERT_EQ(strong.children->items.size(), 1u);
        const Child& text = strong.children->items.front();
        EXPECT_EQ(text.kind, ChildKind::Value);
        EXPECT_EQ(text.value.literalKind, LiteralKind::String);
        EXPECT_EQ(text.value.text, "\"hello\"");
    }

    TEST(ParserTest, ParsesSelfClosingElementWithBooleanAttribute)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource(R"(input type="text" checked;)", diagnostics);

        ASSERT_TRUE(children.has_value());
        const Element& input = onlyElement(*children);
        EXPECT_TRUE(input.selfClosing);
        EXPECT_FALSE(input.children.has_value());
        ASSERT_EQ(input.attributes.size(), 2u);

        const Attribute& type = input.attributes[0];
        EXPECT_EQ(type.kind, AttributeKind::KeyValue);
        EXPECT_EQ(kebabText(type.key), "type");
        ASSERT_TRUE(type.value.has_value());
        EXPECT_EQ(type.value->text, "\"text\"");

        const Attribute& checked = input.attributes[1];
        EXPECT_EQ(checked.kind, AttributeKind::Boolean);
        ASSERT_TRUE(checked.value.has_value());
        EXPECT_EQ(checked.value->literalKind, LiteralKind::Boolean);
        EXPECT_EQ(checked.value->text, "true");
    }

    TEST(ParserTest, ParsesKebabIdentOnlyWhenAdjacent)
    {
        Lexer lexer{"data-index"};
        lexer.lex();
        Parser parser{lexer.tokens(), "data-index"};

        auto ident = parser.parseKebabIdent();
        ASSERT_TRUE(ident.has_value());
        ASSERT_EQ(ident->segments.size(), 2u);
        EXPECT_EQ(toIdentifier(*ident), "data_index");

        const std::string spaced = "data - index";
        Lexer spacedLexer{spaced};
        spacedLexer.lex();
        Parser spacedParser{spacedLexer.tokens(), spaced};

        auto single = spacedParser.parseKebabIdent();
        ASSERT_TRUE(single.has_value());
        EXPECT_EQ(single->segments.size(), 1u);
        EXPECT_EQ(spacedParser.position(), 1u);
    }

    TEST(ParserTest, FailedProductionDoesNotAdvance)
    {
        const std::vector<std::string> snippets{"= 5", ";", ")", "..", "#id", "|x|"};

        for (const auto& source : snippets)
        {
            Lexer lexer{source};
            lexer.lex();
            Parser parser{lexer.tokens(), source};

            EXPECT_FALSE(parser.parseKebabIdent().has_value()) << source;
            EXPECT_FALSE(parser.parseValue().has_value()) << source;
            EXPECT_FALSE(parser.parseAttribute().has_value()) << source;
            EXPECT_FALSE(parser.parseSelector().has_value()) << source;
            EXPECT_FALSE(parser.parseElement().has_value()) << source;
            EXPECT_FALSE(parser.parseChild().has_value()) << source;
            EXPECT_EQ(parser.position(), 0u) << source;
            EXPECT_FALSE(parser.aborted()) << source;
            EXPECT_TRUE(parser.diagnostics().empty()) << source;
        }
    }

    TEST(ParserTest, FailedElementAfterPartialMatchRewinds)
    {
        const std::string source = "div \"text\"";
        Lexer lexer{source};
        lexer.lex();
        Parser parser{lexer.tokens(), source};

        EXPECT_FALSE(parser.parseElement().has_value());
        EXPECT_EQ(parser.position(), 0u);
        EXPECT_FALSE(parser.aborted());
    }

    TEST(ParserTest, CapturesBlockAndBracketValuesVerbatim)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("p title={ format!(\"{}\", name) } { [count.get() + 1] }", diagnostics);

        ASSERT_TRUE(children.has_value());
        const Element& p = onlyElement(*children);
        ASSERT_EQ(p.attributes.size(), 1u);
        ASSERT_TRUE(p.attributes.front().value.has_value());
        EXPECT_EQ(p.attributes.front().value->kind, ValueKind::Block);
        EXPECT_EQ(p.attributes.front().value->text, "format!(\"{}\", name)");

        ASSERT_TRUE(p.children.has_value());
        ASSERT_EQ(p.children->items.size(), 1u);
        const Value& closure = p.children->items.front().value;
        EXPECT_EQ(closure.kind, ValueKind::BracketClosure);
        EXPECT_EQ(closure.text, "count.get() + 1");
    }

    TEST(ParserTest, ParsesDirectives)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource(
            R"(button on:click={handler} class:active={is_active} style:"font-size"="12px" use:tooltip;)", diagnostics);

        ASSERT_TRUE(children.has_value()) << (diagnostics.empty() ? "" : diagnostics.front().message);
        const Element& button = onlyElement(*children);
        ASSERT_EQ(button.attributes.size(), 4u);

        EXPECT_EQ(button.attributes[0].kind, AttributeKind::Directive);
        EXPECT_EQ(button.attributes[0].directive, DirectiveKind::On);
        EXPECT_EQ(kebabText(button.attributes[0].key), "click");

        EXPECT_EQ(button.attributes[1].directive, DirectiveKind::Class);
        EXPECT_EQ(button.attributes[1].value->text, "is_active");

        EXPECT_EQ(button.attributes[2].directive, DirectiveKind::Style);
        ASSERT_TRUE(button.attributes[2].literalKey.has_value());
        EXPECT_EQ(*button.attributes[2].literalKey, "\"font-size\"");

        EXPECT_EQ(button.attributes[3].directive, DirectiveKind::Use);
        EXPECT_FALSE(button.attributes[3].value.has_value());
    }

    TEST(ParserTest, ParsesShorthandAndSpreadAttributes)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("div {aria-label} class:{hidden} {..extra};", diagnostics);

        ASSERT_TRUE(children.has_value());
        const Element& div = onlyElement(*children);
        ASSERT_EQ(div.attributes.size(), 3u);

        const Attribute& label = div.attributes[0];
        EXPECT_EQ(label.kind, AttributeKind::KeyValue);
        EXPECT_TRUE(label.isShorthand);
        EXPECT_EQ(kebabText(label.key), "aria-label");
        EXPECT_EQ(label.value->kind, ValueKind::Block);
        EXPECT_EQ(label.value->text, "aria_label");

        const Attribute& hidden = div.attributes[1];
        EXPECT_EQ(hidden.kind, AttributeKind::Directive);
        EXPECT_TRUE(hidden.isShorthand);
        EXPECT_EQ(hidden.value->text, "hidden");

        const Attribute& spread = div.attributes[2];
        EXPECT_EQ(spread.kind, AttributeKind::Spread);
        EXPECT_EQ(spread.spreadExpression, "extra");
    }

    TEST(ParserTest, ParsesComponentWithGenericsParametersAndSlot)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource(
            R"(Each<Row> rows={rows} |row, index| { slot:Header label="h"; "body" })", diagnostics);

        ASSERT_TRUE(children.has_value()) << (diagnostics.empty() ? "" : diagnostics.front().message);
        const Element& each = onlyElement(*children);
        EXPECT_EQ(each.selector.kind, TagKind::Component);
        ASSERT_TRUE(each.selector.generics.has_value());
        EXPECT_EQ(*each.selector.generics, "Row");
        ASSERT_TRUE(each.closureParameters.has_value());
        EXPECT_EQ(*each.closureParameters, (std::vector<std::string>{"row", "index"}));

        ASSERT_TRUE(each.children.has_value());
        ASSERT_EQ(each.children->items.size(), 2u);
        const Child& header = each.children->items[0];
        ASSERT_EQ(header.kind, ChildKind::Element);
        EXPECT_EQ(header.element->selector.kind, TagKind::Slot);
        EXPECT_EQ(header.element->selector.tag, "Header");
    }

    TEST(ParserTest, RepeatedIdKeepsLastAndWarns)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("section #first #second;", diagnostics);

        ASSERT_TRUE(children.has_value());
        const Element& section = onlyElement(*children);
        ASSERT_TRUE(section.selector.id.has_value());
        EXPECT_EQ(kebabText(*section.selector.id), "second");
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "MVIEW-W2101");
        EXPECT_TRUE(diagnostics.front().isWarning);
    }

    TEST(ParserTest, IdSelectorWithoutSpaceAborts)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("div#main;", diagnostics);

        EXPECT_FALSE(children.has_value());
        EXPECT_TRUE(hasDiagnostic(diagnostics, "MVIEW-E2130"));
    }

    TEST(ParserTest, NonStringLiteralChildAborts)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("p { 5 }", diagnostics);

        EXPECT_FALSE(children.has_value());
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "MVIEW-E2150");
        EXPECT_EQ(diagnostics.front().span.begin.column, 5u);
    }

    TEST(ParserTest, DirectiveWithoutValueAborts)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("button on:click;", diagnostics);

        EXPECT_FALSE(children.has_value());
        EXPECT_TRUE(hasDiagnostic(diagnostics, "MVIEW-E2121"));
    }

    TEST(ParserTest, MismatchedDelimiterInBlockAborts)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("p { {value] }", diagnostics);

        EXPECT_FALSE(children.has_value());
        EXPECT_TRUE(hasDiagnostic(diagnostics, "MVIEW-E2110"));
    }

    TEST(ParserTest, UnterminatedChildBlockAborts)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("div { \"a\"", diagnostics);

        EXPECT_FALSE(children.has_value());
        EXPECT_TRUE(hasDiagnostic(diagnostics, "MVIEW-E2142"));
    }

    TEST(ParserTest, LeftoverInputIsReported)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("div; )", diagnostics);

        EXPECT_FALSE(children.has_value());
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "MVIEW-E2100");
        EXPECT_EQ(diagnostics.front().span.begin.column, 6u);
    }

    TEST(ParserTest, EmptyInputProducesNoChildren)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("  // nothing here\n", diagnostics);

        ASSERT_TRUE(children.has_value());
        EXPECT_TRUE(children->items.empty());
        EXPECT_TRUE(diagnostics.empty());
    }

    TEST(ParserTest, LastChildMayOmitTerminator)
    {
        std::vector<Diagnostic> diagnostics;
        auto children = parseSource("ul { li { \"a\" } li }", diagnostics);

        ASSERT_TRUE(children.has_value());
        const Element& ul = onlyElement(*children);
        ASSERT_TRUE(ul.children.has_value());
        ASSERT_EQ(ul.children->items.size(), 2u);
        EXPECT_FALSE(ul.children->items[1].element->selfClosing);
    }

    TEST(ParserTest, ParsingIgnoresLayoutDifferences)
    {
        std::vector<Diagnostic> compactDiagnostics;
        std::vector<Diagnostic> spacedDiagnostics;
        auto compact = parseSource("div.a{span;\"x\"}", compactDiagnostics);
        auto spaced = parseSource("div.a {\n    span;\n    \"x\"\n}\n", spacedDiagnostics);

        ASSERT_TRUE(compact.has_value());
        ASSERT_TRUE(spaced.has_value());
        EXPECT_EQ(canonicalPrint(*compact), canonicalPrint(*spaced));
    }
} // namespace
} // namespace mview::frontend
