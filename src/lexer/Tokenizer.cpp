#include <parsable/lexer/Tokenizer.hpp>

#include <algorithm>
#include <cctype>

#include <parsable/Diagnostics.hpp>

namespace parsable::lexer {

bool isSpace(char c)
{
    switch (c) {
    case ' ':
    case '\f':
    case '\n':
    case '\r':
    case '\t':
    case '\v':
        return true;

    default:
        return false;
    }
}

bool isWordChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

namespace {
    bool isWordLike(std::string_view s)
    {
        for ( auto c : s )
            if ( !isWordChar(c) )
                return false;

        return !s.empty();
    }
}

bool checkLiterals(std::set<std::string> const& literals, Diagnostics& dgn)
{
    auto const errors = dgn.errorCount();
    for ( auto const& s : literals ) {
        if ( s.empty() ) {
            dgn.error(diag::token_empty, s);
            continue;
        }

        bool space = false;
        for ( auto c : s )
            space = space || isSpace(c);

        if ( space ) {
            dgn.error(diag::token_whitespace, s);
            continue;
        }

        for ( auto const& t : literals ) {
            if ( &t == &s || t.size() <= s.size() )
                continue;

            auto pos = t.find(s, 1);
            if ( pos != std::string::npos )
                dgn.error(diag::token_ambiguous, s).see(t);
        }
    }

    return dgn.errorCount() == errors;
}

//
// Tokenizer

Tokenizer::Tokenizer(std::set<std::string> literals)
    : myLiterals(std::move(literals))
{
    Diagnostics dgn;
    if ( !checkLiterals(myLiterals, dgn) )
        dgn.die("invalid literal token set");

    for ( auto const& l : myLiterals )
        if ( l.size() > myLongest )
            myLongest = l.size();
}

std::vector<Token> Tokenizer::tokenize(std::string_view input) const
{
    std::vector<Token> ret;
    SourceLocation loc(1, 1);
    SourceLocation wordLoc;
    std::string word;

    auto bump = [&](char c) {
        if ( c == '\n' ) {
            ++loc.line;
            loc.column = 1;
        }
        else {
            ++loc.column;
        }
    };

    auto flush = [&] {
        if ( word.empty() )
            return;

        ret.emplace_back(TokenKind::Word, std::move(word), wordLoc);
        word.clear();
    };

    for ( uz i = 0; i < input.size(); ) {
        auto c = input[i];
        if ( isSpace(c) ) {
            flush();
            bump(c);
            ++i;
            continue;
        }

        if ( auto len = matchAt(input, i) ) {
            flush();
            ret.emplace_back(TokenKind::Literal, std::string(input.substr(i, len)), loc);
            for ( uz e = i + len; i != e; ++i )
                bump(input[i]);

            continue;
        }

        if ( word.empty() )
            wordLoc = loc;

        word += c;
        bump(c);
        ++i;
    }

    flush();
    return ret;
}

uz Tokenizer::matchAt(std::string_view input, uz pos) const
{
    auto len = std::min(myLongest, input.size() - pos);
    for ( ; len; --len ) {
        auto candidate = input.substr(pos, len);
        if ( myLiterals.find(std::string(candidate)) == end(myLiterals) )
            continue;

        if ( isWordLike(candidate) ) {
            if ( pos > 0 && isWordChar(input[pos - 1]) )
                continue;

            if ( pos + len < input.size() && isWordChar(input[pos + len]) )
                continue;
        }

        return len;
    }

    return 0;
}

} // namespace parsable::lexer
