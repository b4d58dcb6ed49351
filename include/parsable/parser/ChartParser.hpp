#pragma once

#include <vector>

#include <parsable/Types.hpp>
#include <parsable/lexer/Token.hpp>
#include <parsable/parser/ParseTree.hpp>

namespace parsable::grammar {
    class Grammar;
}

namespace parsable::parser {

struct ParserOptions
{
    // Upper bound on the trees returned for one input
    uz maxTrees = 256;
};

/**
 * Earley chart parser over a grammar::Grammar
 *
 * Lexical categories are matched against whole tokens with their membership
 * predicate. Every production has at least one constituent, so the chart
 * never holds empty completions. parse() returns the trees rooted at any of
 * the grammar's start symbols that span the whole token sequence.
 */
class ChartParser
{
public:
    explicit ChartParser(grammar::Grammar const& grammar,
                         ParserOptions options = ParserOptions());

public:
    bool recognize(std::vector<lexer::Token> const& tokens) const;
    std::vector<ParseTreePtr> parse(std::vector<lexer::Token> const& tokens) const;

private:
    struct Item
    {
        uz production;
        uz dot;
        uz origin;

        bool operator < (Item const& rhs) const;
    };

    using Column = std::vector<Item>;

    std::vector<Column> chart(std::vector<lexer::Token> const& tokens) const;

private:
    grammar::Grammar const* myGrammar = nullptr;
    ParserOptions myOptions;
};

} // namespace parsable::parser
