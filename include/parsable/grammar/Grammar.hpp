#pragma once

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include <parsable/grammar/Production.hpp>
#include <parsable/grammar/Symbol.hpp>

namespace parsable {
    class Diagnostics;
}

namespace parsable::grammar {

class Grammar
{
public:
    Grammar(std::vector<Production> productions,
            SymbolSet lexicalCategories,
            SymbolSet startSymbols);

public:
    std::vector<Production> const& productions() const;
    SymbolSet const& lexicalCategories() const;
    SymbolSet const& startSymbols() const;

    // Indices into productions() whose head is \p head
    std::vector<uz> const& productionsFor(Symbol const& head) const;

    // Reports nonterminals that can never be derived from
    bool check(Diagnostics& dgn) const;

private:
    std::vector<Production> myProductions;
    SymbolSet myLexicalCategories;
    SymbolSet myStartSymbols;
    std::map<Symbol const*, std::vector<uz>, SymbolOrder> myIndex;
};

// One production per declared rule of \p sym; nothing for other kinds
std::vector<Production> deriveProductions(Symbol const& sym);

// Tokens of \p root and of every symbol of \p closure
std::set<std::string> collectTokens(Symbol const& root, SymbolSet const& closure);

Grammar assemble(Symbol const& root, SymbolSet const& closure);

std::ostream& operator << (std::ostream& sink, Grammar const& g);

} // namespace parsable::grammar
