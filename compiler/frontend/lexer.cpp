#include "lexer.hpp"

#include <cctype>

namespace
{
    using namespace mview::frontend;

    // Bytes of multi-byte UTF-8 sequences are taken as identifier characters;
    // the host grammar decides whether they are valid.
    bool isNonAscii(char ch)
    {
        return static_cast<unsigned char>(ch) >= 0x80;
    }

    bool isIdentifierStart(char ch)
    {
        return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_' || isNonAscii(ch);
    }

    bool isIdentifierPart(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || isNonAscii(ch);
    }

    // Byte length of the UTF-8 code point starting with `lead`.
    std::size_t codePointWidth(char lead)
    {
        const unsigned char byte = static_cast<unsigned char>(lead);
        if (byte >= 0xF0) return 4;
        if (byte >= 0xE0) return 3;
        if (byte >= 0xC0) return 2;
        return 1;
    }

    bool isOperatorCharacter(char ch)
    {
        switch (ch)
        {
        case '+':
        case '*':
        case '/':
        case '%':
        case '&':
        case '!':
        case '^':
        case '~':
        case '?':
        case '@':
        case '$':
        case '\\':
            return true;
        default:
            return false;
        }
    }

    TokenKind keywordLookup(std::string_view text)
    {
        if (text == "true") return TokenKind::KeywordTrue;
        if (text == "false") return TokenKind::KeywordFalse;
        return TokenKind::Identifier;
    }
} // namespace

namespace mview::frontend
{
    Lexer::Lexer(std::string_view source)
        : m_source(source)
        , m_location{1, 1, 0}
    {
    }

    const std::vector<Token>& Lexer::tokens() const noexcept
    {
        return m_tokens;
    }

    const std::vector<Diagnostic>& Lexer::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    bool Lexer::hasErrors() const noexcept
    {
        for (const auto& diagnostic : m_diagnostics)
        {
            if (!diagnostic.isWarning)
            {
                return true;
            }
        }
        return false;
    }

    void Lexer::lex()
    {
        m_tokens.clear();
        m_diagnostics.clear();
        m_current = 0;
        m_location = {1, 1, 0};
        m_pendingSpace = false;

        while (!isAtEnd())
        {
            const char ch = peek();
            if (std::isspace(static_cast<unsigned char>(ch)))
            {
                advance();
                m_pendingSpace = true;
                continue;
            }

            if (ch == '/' && skipComment())
            {
                m_pendingSpace = true;
                continue;
            }

            const SourceLocation startLocation = m_location;

            if (ch == 'r' && lexRawString())
            {
                continue;
            }

            if (isIdentifierStart(ch))
            {
                lexIdentifierOrKeyword();
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(ch)))
            {
                lexNumber();
                continue;
            }

            switch (ch)
            {
            case '"':
                lexString();
                break;
            case '\'':
                lexCharacterOrApostrophe();
                break;
            case '{':
                emitSingle(TokenKind::LeftBrace);
                break;
            case '}':
                emitSingle(TokenKind::RightBrace);
                break;
            case '(':
                emitSingle(TokenKind::LeftParen);
                break;
            case ')':
                emitSingle(TokenKind::RightParen);
                break;
            case '[':
                emitSingle(TokenKind::LeftBracket);
                break;
            case ']':
                emitSingle(TokenKind::RightBracket);
                break;
            case '<':
                emitSingle(TokenKind::LessThan);
                break;
            case '>':
                emitSingle(TokenKind::GreaterThan);
                break;
            case ',':
                emitSingle(TokenKind::Comma);
                break;
            case ';':
                emitSingle(TokenKind::Semicolon);
                break;
            case '=':
                emitSingle(TokenKind::Equals);
                break;
            case '|':
                emitSingle(TokenKind::Pipe);
                break;
            case '-':
                emitSingle(TokenKind::Minus);
                break;
            case '#':
                emitSingle(TokenKind::Hash);
                break;
            case ':':
                if (peekAt(1) == ':')
                {
                    emitDouble(TokenKind::PathSeparator);
                }
                else
                {
                    emitSingle(TokenKind::Colon);
                }
                break;
            case '.':
                if (peekAt(1) == '.')
                {
                    emitDouble(TokenKind::DotDot);
                }
                else
                {
                    emitSingle(TokenKind::Dot);
                }
                break;
            default:
                if (isOperatorCharacter(ch))
                {
                    emitSingle(TokenKind::Punctuation);
                    break;
                }

                advance();
                reportError("MVIEW-E2000", "Unexpected character in template source.", startLocation);
                break;
            }
        }

        const SourceLocation eofLocation = m_location;
        pushToken(TokenKind::EndOfFile, eofLocation, eofLocation, "");
    }

    void Lexer::pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text)
    {
        Token token;
        token.kind = kind;
        token.span = {start, end};
        token.text = std::string{text};
        token.spaceBefore = m_pendingSpace || m_tokens.empty();
        m_tokens.emplace_back(std::move(token));
        m_pendingSpace = false;
    }

    void Lexer::lexIdentifierOrKeyword()
    {
        const SourceLocation startLocation = m_location;

        advance(); // consume first character
        while (isIdentifierPart(peek()))
        {
            advance();
        }

        const std::string_view text = slice(startLocation);
        pushToken(keywordLookup(text), startLocation, m_location, text);
    }

    void Lexer::lexNumber()
    {
        const SourceLocation startLocation = m_location;
        TokenKind kind = TokenKind::IntegerLiteral;

        advance(); // consume first digit
        while (isIdentifierPart(peek()))
        {
            advance();
        }

        // `1.5` is a float, `0..5` is a range and `1.max(2)` is a method call.
        if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peekAt(1))))
        {
            kind = TokenKind::FloatLiteral;
            advance();
            while (isIdentifierPart(peek()))
            {
                advance();
            }
        }

        pushToken(kind, startLocation, m_location, slice(startLocation));
    }

    void Lexer::lexString()
    {
        const SourceLocation startLocation = m_location;

        advance(); // consume opening quote
        bool closed = false;
        while (!isAtEnd())
        {
            const char ch = advance();
            if (ch == '"')
            {
                closed = true;
                break;
            }
            if (ch == '\\' && !isAtEnd())
            {
                advance(); // skip escaped char
            }
        }

        if (!closed)
        {
            reportError("MVIEW-E2002", "Unterminated string literal.", startLocation);
            return;
        }

        pushToken(TokenKind::StringLiteral, startLocation, m_location, slice(startLocation));
    }

    bool Lexer::lexRawString()
    {
        std::size_t hashes = 0;
        while (peekAt(1 + hashes) == '#')
        {
            ++hashes;
        }
        if (peekAt(1 + hashes) != '"')
        {
            return false;
        }

        const SourceLocation startLocation = m_location;
        for (std::size_t index = 0; index < hashes + 2; ++index)
        {
            advance(); // consume `r`, the hashes and the opening quote
        }

        while (!isAtEnd())
        {
            if (advance() != '"')
            {
                continue;
            }

            std::size_t closing = 0;
            while (closing < hashes && peek() == '#')
            {
                advance();
                ++closing;
            }
            if (closing == hashes)
            {
                pushToken(TokenKind::StringLiteral, startLocation, m_location, slice(startLocation));
                return true;
            }
        }

        reportError("MVIEW-E2002", "Unterminated raw string literal.", startLocation);
        return true;
    }

    void Lexer::lexCharacterOrApostrophe()
    {
        const SourceLocation startLocation = m_location;

        if (peekAt(1) == '\\')
        {
            advance(); // opening quote
            advance(); // backslash
            while (!isAtEnd() && peek() != '\'' && peek() != '\n')
            {
                advance();
            }
            if (!match('\''))
            {
                reportError("MVIEW-E2004", "Unterminated character literal.", startLocation);
                return;
            }
            pushToken(TokenKind::CharacterLiteral, startLocation, m_location, slice(startLocation));
            return;
        }

        const std::size_t width = codePointWidth(peekAt(1));
        if (peekAt(1) != '\0' && peekAt(1) != '\'' && peekAt(1 + width) == '\'')
        {
            for (std::size_t index = 0; index < width + 2; ++index)
            {
                advance();
            }
            pushToken(TokenKind::CharacterLiteral, startLocation, m_location, slice(startLocation));
            return;
        }

        // lifetime or label, e.g. `'static`
        emitSingle(TokenKind::Punctuation);
    }

    bool Lexer::skipComment()
    {
        const SourceLocation startLocation = m_location;

        if (peekAt(1) == '/')
        {
            while (!isAtEnd() && peek() != '\n')
            {
                advance();
            }
            return true;
        }

        if (peekAt(1) != '*')
        {
            return false;
        }

        advance();
        advance();
        while (!isAtEnd())
        {
            if (peek() == '*' && peekAt(1) == '/')
            {
                advance();
                advance();
                return true;
            }
            advance();
        }

        reportError("MVIEW-E2003", "Unterminated block comment.", startLocation);
        return true;
    }

    void Lexer::emitSingle(TokenKind kind)
    {
        const SourceLocation startLocation = m_location;
        advance();
        pushToken(kind, startLocation, m_location, slice(startLocation));
    }

    void Lexer::emitDouble(TokenKind kind)
    {
        const SourceLocation startLocation = m_location;
        advance();
        advance();
        pushToken(kind, startLocation, m_location, slice(startLocation));
    }

    void Lexer::reportError(std::string_view code, std::string_view message, SourceLocation start)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = {start, m_location};
        m_diagnostics.emplace_back(std::move(diag));
    }

    bool Lexer::match(char expected)
    {
        if (isAtEnd()) return false;
        if (m_source[m_current] != expected) return false;
        advance();
        return true;
    }

    char Lexer::peek() const
    {
        if (isAtEnd()) return '\0';
        return m_source[m_current];
    }

    char Lexer::peekAt(std::size_t distance) const
    {
        if (m_current + distance >= m_source.size()) return '\0';
        return m_source[m_current + distance];
    }

    char Lexer::advance()
    {
        const char ch = m_source[m_current++];
        if (ch == '\n')
        {
            ++m_location.line;
            m_location.column = 1;
        }
        else
        {
            ++m_location.column;
        }
        m_location.offset = m_current;
        return ch;
    }

    bool Lexer::isAtEnd() const
    {
        return m_current >= m_source.size();
    }

    std::string_view Lexer::slice(const SourceLocation& start) const
    {
        return m_source.substr(start.offset, m_current - start.offset);
    }
} // namespace mview::frontend
