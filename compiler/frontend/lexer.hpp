#pragma once

#include "token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mview::frontend
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span;
        bool isWarning{false};
    };

    class Lexer
    {
    public:
        explicit Lexer(std::string_view source);

        [[nodiscard]] const std::vector<Token>& tokens() const noexcept;
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;
        [[nodiscard]] bool hasErrors() const noexcept;

        void lex();

    private:
        void pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text);
        void lexIdentifierOrKeyword();
        void lexNumber();
        void lexString();
        bool lexRawString();
        void lexCharacterOrApostrophe();
        bool skipComment();
        void emitSingle(TokenKind kind);
        void emitDouble(TokenKind kind);
        void reportError(std::string_view code, std::string_view message, SourceLocation start);
        bool match(char expected);
        char peek() const;
        char peekAt(std::size_t distance) const;
        char advance();
        bool isAtEnd() const;
        std::string_view slice(const SourceLocation& start) const;

    private:
        std::string_view m_source;
        std::vector<Token> m_tokens;
        std::vector<Diagnostic> m_diagnostics;
        std::size_t m_current{0};
        SourceLocation m_location{};
        bool m_pendingSpace{false};
    };
} // namespace mview::frontend
