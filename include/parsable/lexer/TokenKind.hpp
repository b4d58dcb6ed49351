#pragma once

namespace parsable::lexer {

#define TOKEN_DEFINITIONS(X) \
    X(Undefined, "undefined") \
    X(Literal  , "literal"  ) \
    X(Word     , "word"     )

#define X(A,B) A,
enum class TokenKind
{
TOKEN_DEFINITIONS(X)
};
#undef X

const char* to_string(TokenKind kind);

} // namespace parsable::lexer
