#pragma once

#include <ostream>
#include <string>

#include <parsable/Types.hpp>
#include <parsable/lexer/TokenKind.hpp>

namespace parsable::lexer {

using LineIndex = u32;
using ColumnIndex = u32;

struct SourceLocation
{
    LineIndex line = 0;
    ColumnIndex column = 0;

    constexpr SourceLocation() noexcept = default;
    constexpr SourceLocation(LineIndex line, ColumnIndex col) noexcept
        : line(line)
        , column(col)
    {
    }
};

class Token
{
public:
    Token() = default;

    Token(TokenKind kind, std::string lexeme, SourceLocation loc)
        : myKind(kind)
        , myLexeme(std::move(lexeme))
        , myLoc(loc)
    {
    }

public:
    TokenKind          kind    () const noexcept { return myKind      ; }
    std::string const& lexeme  () const noexcept { return myLexeme    ; }
    SourceLocation     location() const noexcept { return myLoc       ; }
    LineIndex          line    () const noexcept { return myLoc.line  ; }
    ColumnIndex        column  () const noexcept { return myLoc.column; }

private:
    TokenKind myKind = TokenKind::Undefined;
    std::string myLexeme;
    SourceLocation myLoc;
};

inline std::ostream& operator << (std::ostream& sink, SourceLocation loc)
{
    return sink << loc.line << ':' << loc.column;
}

} // namespace parsable::lexer
