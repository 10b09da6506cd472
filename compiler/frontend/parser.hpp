#pragma once

#include "ast.hpp"
#include "lexer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mview::frontend
{
    /// Recursive-descent parser for template markup.
    ///
    /// Every production returns `std::nullopt` on a soft failure and leaves
    /// `position()` where it was before the attempt, so callers can try the
    /// next alternative. Committed productions that fail later record an
    /// error diagnostic and latch `aborted()`; once aborted, every production
    /// fails immediately.
    class Parser
    {
    public:
        Parser(const std::vector<Token>& tokens, std::string_view source);

        /// Parses the whole token stream as top-level children.
        [[nodiscard]] std::optional<Children> parse();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;
        [[nodiscard]] bool aborted() const noexcept;
        [[nodiscard]] std::size_t position() const noexcept;

        [[nodiscard]] std::optional<KebabIdent> parseKebabIdent();
        [[nodiscard]] std::optional<Value> parseValue();
        [[nodiscard]] std::optional<Attribute> parseAttribute();
        [[nodiscard]] std::optional<Selector> parseSelector();
        [[nodiscard]] std::optional<Element> parseElement();
        [[nodiscard]] std::optional<Child> parseChild();
        [[nodiscard]] Children parseChildren();

    private:
        struct Capture
        {
            std::string text;
            SourceSpan span{};
        };

        struct Failure
        {
            std::size_t position{0};
            std::string message;
            SourceSpan span{};
            bool recorded{false};
        };

        template <typename Production>
        auto speculate(Production production) -> decltype(production())
        {
            const std::size_t fork = m_current;
            auto result = production();
            if (!result.has_value())
            {
                m_current = fork;
            }
            return result;
        }

        // Parses `{ T }` where T must consume the whole group.
        template <typename Production>
        auto parseBraced(Production production) -> decltype(production())
        {
            return speculate([&]() -> decltype(production()) {
                if (!match(TokenKind::LeftBrace))
                {
                    fail("Expected '{'.");
                    return std::nullopt;
                }

                auto inner = production();
                if (!inner.has_value())
                {
                    return std::nullopt;
                }

                if (!match(TokenKind::RightBrace))
                {
                    fail("Expected '}' to close braced group.");
                    return std::nullopt;
                }
                return inner;
            });
        }

        const Token& peek() const;
        const Token& previous() const;
        const Token& lookAhead(std::size_t offset) const;
        const Token& advance();
        bool isAtEnd() const;
        bool check(TokenKind kind) const;
        bool match(TokenKind kind);

        void fail(std::string_view message);
        void abortWith(std::string_view code, std::string message, SourceSpan span);
        void warn(std::string_view code, std::string message, SourceSpan span);
        void reportFurthestFailure(std::string_view code, std::string_view fallback);
        SourceSpan spanFrom(const SourceSpan& begin) const;

        std::optional<Capture> captureGroup();
        std::optional<Capture> captureUntil(TokenKind closer, const Token& opener);
        std::optional<std::string> parseGenerics();
        std::optional<std::vector<std::string>> parseClosureParameters();

        std::optional<Attribute> parseDirective(DirectiveKind directive);
        std::optional<Attribute> parseBraceAttribute();
        std::optional<Attribute> parseKeyValueOrBoolean();
        bool parseDirectiveKey(Attribute& attribute, bool allowKebab, bool allowStringKey);
        bool parseDirectiveValue(Attribute& attribute, bool optional);
        Value shorthandValue(const KebabIdent& ident, SourceSpan span) const;

    private:
        const std::vector<Token>& m_tokens;
        std::string_view m_source;
        std::size_t m_current{0};
        std::vector<Diagnostic> m_diagnostics;
        Failure m_furthestFailure;
        bool m_aborted{false};
    };
} // namespace mview::frontend
