#include "token.hpp"

namespace mview::frontend
{
    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::EndOfFile: return "endOfFile";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::IntegerLiteral: return "integerLiteral";
        case TokenKind::FloatLiteral: return "floatLiteral";
        case TokenKind::StringLiteral: return "stringLiteral";
        case TokenKind::CharacterLiteral: return "characterLiteral";

        case TokenKind::KeywordTrue: return "true";
        case TokenKind::KeywordFalse: return "false";

        case TokenKind::LeftBrace: return "leftBrace";
        case TokenKind::RightBrace: return "rightBrace";
        case TokenKind::LeftParen: return "leftParen";
        case TokenKind::RightParen: return "rightParen";
        case TokenKind::LeftBracket: return "leftBracket";
        case TokenKind::RightBracket: return "rightBracket";
        case TokenKind::LessThan: return "lessThan";
        case TokenKind::GreaterThan: return "greaterThan";
        case TokenKind::Comma: return "comma";
        case TokenKind::Colon: return "colon";
        case TokenKind::PathSeparator: return "pathSeparator";
        case TokenKind::Semicolon: return "semicolon";
        case TokenKind::Dot: return "dot";
        case TokenKind::DotDot: return "dotDot";
        case TokenKind::Equals: return "equals";
        case TokenKind::Pipe: return "pipe";
        case TokenKind::Minus: return "minus";
        case TokenKind::Hash: return "hash";

        case TokenKind::Punctuation: return "punctuation";
        }

        return "unknown";
    }
} // namespace mview::frontend
