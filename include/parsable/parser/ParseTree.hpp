#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <parsable/grammar/Production.hpp>
#include <parsable/grammar/Symbol.hpp>

namespace parsable::parser {

#define PARSE_TREE_KINDS(X) \
    X(Terminal   , "terminal"   ) \
    X(Nonterminal, "nonterminal") \
    X(Empty      , "empty"      )

class ParseTree;
using ParseTreePtr = std::shared_ptr<ParseTree const>;

/**
 * Immutable parse tree node
 *
 * Nodes are shared between the alternative trees of one parse, so they are
 * handed out as ParseTreePtr and never modified after construction.
 */
class ParseTree
{
public:
    enum class Kind
    {
#define X(a,b) a,
        PARSE_TREE_KINDS(X)
#undef X
    };

public:
    static ParseTreePtr mkTerminal(grammar::Symbol const& sym, std::string lexeme);
    static ParseTreePtr mkNonterminal(grammar::Symbol const& head, std::vector<ParseTreePtr> children);
    static ParseTreePtr mkEmpty(grammar::Symbol const& sym);

    ParseTree(Kind kind,
              grammar::Symbol const& sym,
              std::string lexeme,
              std::vector<ParseTreePtr> children);

public:
    Kind kind() const;
    grammar::Symbol const& symbol() const;
    std::string const& lexeme() const;
    std::vector<ParseTreePtr> const& children() const;

    // (head, child tags) of a nonterminal node
    grammar::Production production() const;

private:
    Kind myKind;
    grammar::Symbol const* mySymbol = nullptr;
    std::string myLexeme;
    std::vector<ParseTreePtr> myChildren;
};

const char* to_string(ParseTree::Kind kind);

std::ostream& operator << (std::ostream& sink, ParseTree const& tree);

} // namespace parsable::parser
