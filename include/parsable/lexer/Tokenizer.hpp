#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <parsable/Types.hpp>
#include <parsable/lexer/Token.hpp>

namespace parsable {
    class Diagnostics;
}

namespace parsable::lexer {

bool isSpace(char c);
bool isWordChar(char c);

/**
 * Reports literal token sets that cannot be scanned deterministically
 *
 * A literal that occurs inside another literal at a non-zero offset allows
 * two tokenizations of the longer one. A literal that is a prefix of another
 * is resolved by maximal munch and is accepted.
 */
bool checkLiterals(std::set<std::string> const& literals, Diagnostics& dgn);

/**
 * Maximal-munch scanner
 *
 * Input is split on whitespace. Inside each chunk the longest literal that
 * matches at the current position is taken; literals made only of word
 * characters match only at word boundaries. Everything else accumulates into
 * word tokens.
 */
class Tokenizer
{
public:
    explicit Tokenizer(std::set<std::string> literals);

public:
    std::vector<Token> tokenize(std::string_view input) const;

protected:
    uz matchAt(std::string_view input, uz pos) const;

private:
    std::set<std::string> myLiterals;
    uz myLongest = 0;
};

} // namespace parsable::lexer
