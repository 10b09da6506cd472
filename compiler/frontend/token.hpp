#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mview::frontend
{
    enum class TokenKind : std::uint16_t
    {
        EndOfFile,
        Identifier,
        IntegerLiteral,
        FloatLiteral,
        StringLiteral,
        CharacterLiteral,

        // Keywords recognised by the template grammar itself
        KeywordTrue,
        KeywordFalse,

        // Punctuation
        LeftBrace,
        RightBrace,
        LeftParen,
        RightParen,
        LeftBracket,
        RightBracket,
        LessThan,
        GreaterThan,
        Comma,
        Colon,
        PathSeparator,
        Semicolon,
        Dot,
        DotDot,
        Equals,
        Pipe,
        Minus,
        Hash,

        // Any other operator character; only meaningful inside host expressions
        Punctuation
    };

    struct SourceLocation
    {
        std::uint32_t line{1};
        std::uint32_t column{1};
        std::size_t offset{0};
    };

    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfFile};
        SourceSpan span{};
        std::string text{};
        bool spaceBefore{false};
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
} // namespace mview::frontend
