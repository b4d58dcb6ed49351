#include <parsable/lexer/TokenKind.hpp>

namespace parsable::lexer {

const char* to_string(TokenKind kind)
{
    #define X(A,B) B,
    static const char* tokenKindStringTable[] =
    {
    TOKEN_DEFINITIONS(X)
    };
    #undef X

    return tokenKindStringTable[static_cast<int>(kind)];
}

} // namespace parsable::lexer
