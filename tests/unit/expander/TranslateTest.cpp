#include <gtest/gtest.h>

#include "translate.hpp"

namespace mview::expander
{
namespace
{
    TEST(TranslateTest, TranslatesTemplate)
    {
        const TranslationResult result = translate(R"(div.primary { strong { "hello" } })");

        EXPECT_TRUE(result.succeeded);
        EXPECT_TRUE(result.diagnostics.empty());
        EXPECT_EQ(result.output, R"(leptos::html::div().classes("primary").child(leptos::html::strong().child("hello")))");
    }

    TEST(TranslateTest, LexicalErrorProducesStandIn)
    {
        const TranslationResult result = translate("p { \"unterminated }");

        EXPECT_FALSE(result.succeeded);
        EXPECT_EQ(result.output, "()");
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().code, "MVIEW-E2002");
    }

    TEST(TranslateTest, ParseErrorProducesStandIn)
    {
        const TranslationResult result = translate("p { 42 }");

        EXPECT_FALSE(result.succeeded);
        EXPECT_EQ(result.output, std::string{kStandInOutput});
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().code, "MVIEW-E2150");
    }

    TEST(TranslateTest, ExpansionErrorProducesStandIn)
    {
        const TranslationResult result = translate("Button class:active={x};");

        EXPECT_FALSE(result.succeeded);
        EXPECT_EQ(result.output, "()");
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().code, "MVIEW-E2210");
    }

    TEST(TranslateTest, WarningsDoNotStopTranslation)
    {
        const TranslationResult result = translate("div #a #b;");

        EXPECT_TRUE(result.succeeded);
        EXPECT_EQ(result.output, R"(leptos::html::div().id("b"))");
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_TRUE(result.diagnostics.front().isWarning);
        EXPECT_EQ(result.diagnostics.front().code, "MVIEW-W2101");
    }

    TEST(TranslateTest, AcceptsNonAsciiHostCode)
    {
        const TranslationResult character = translate("p { {c == '\xC3\xA9'} }");
        EXPECT_TRUE(character.succeeded);
        EXPECT_EQ(character.output, "leptos::html::p().child({c == '\xC3\xA9'})");

        const TranslationResult identifier = translate("p { {gr\xC3\xB6\xC3\x9F" "e + 1} }");
        EXPECT_TRUE(identifier.succeeded);
        EXPECT_EQ(identifier.output, "leptos::html::p().child({gr\xC3\xB6\xC3\x9F" "e + 1})");
    }

    TEST(TranslateTest, UsesConfiguredCratePath)
    {
        ExpanderOptions options;
        options.cratePath = "::leptos";
        const TranslationResult result = translate("br;", options);

        EXPECT_TRUE(result.succeeded);
        EXPECT_EQ(result.output, "::leptos::html::br()");
    }
} // namespace
} // namespace mview::expander
