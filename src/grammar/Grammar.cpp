#include <parsable/grammar/Grammar.hpp>

#include <iterator>

#include <parsable/Diagnostics.hpp>

namespace parsable::grammar {

//
// Grammar

Grammar::Grammar(std::vector<Production> productions,
                 SymbolSet lexicalCategories,
                 SymbolSet startSymbols)
    : myProductions(std::move(productions))
    , myLexicalCategories(std::move(lexicalCategories))
    , myStartSymbols(std::move(startSymbols))
{
    for ( uz i = 0; i < myProductions.size(); ++i )
        myIndex[myProductions[i].head].push_back(i);
}

std::vector<Production> const& Grammar::productions() const
{
    return myProductions;
}

SymbolSet const& Grammar::lexicalCategories() const
{
    return myLexicalCategories;
}

SymbolSet const& Grammar::startSymbols() const
{
    return myStartSymbols;
}

std::vector<uz> const& Grammar::productionsFor(Symbol const& head) const
{
    static std::vector<uz> const none;

    auto e = myIndex.find(&head);
    if ( e == end(myIndex) )
        return none;

    return e->second;
}

bool Grammar::check(Diagnostics& dgn) const
{
    auto const errors = dgn.errorCount();
    SymbolSet reported;
    auto visit = [&](Symbol const& sym, Symbol const* user) {
        if ( !sym.as<NonterminalSymbol>() || !productionsFor(sym).empty() )
            return;

        if ( !reported.insert(&sym).second )
            return;

        auto p = dgn.error(diag::grammar_no_productions, sym.name());
        if ( user )
            p.see(user->name());
    };

    for ( auto s : myStartSymbols )
        visit(*s, nullptr);

    for ( auto const& p : myProductions )
        for ( auto c : p.children )
            visit(*c, p.head);

    return dgn.errorCount() == errors;
}

std::vector<Production> deriveProductions(Symbol const& sym)
{
    std::vector<Production> ret;
    if ( auto nt = sym.as<NonterminalSymbol>() )
        for ( auto const& r : nt->rules() )
            ret.emplace_back(sym, r);

    return ret;
}

std::set<std::string> collectTokens(Symbol const& root, SymbolSet const& closure)
{
    std::set<std::string> ret = root.tokens();
    for ( auto s : closure )
        ret.insert(begin(s->tokens()), end(s->tokens()));

    return ret;
}

Grammar assemble(Symbol const& root, SymbolSet const& closure)
{
    SymbolSet all = closure;
    all.insert(&root);

    std::vector<Production> productions;
    SymbolSet lexicalCategories;
    for ( auto s : all ) {
        if ( s->kind() == SymbolKind::LexicalCategory )
            lexicalCategories.insert(s);

        auto p = deriveProductions(*s);
        productions.insert(end(productions),
                           std::make_move_iterator(begin(p)),
                           std::make_move_iterator(end(p)));
    }

    return Grammar(std::move(productions), std::move(lexicalCategories), SymbolSet{&root});
}

std::ostream& operator << (std::ostream& sink, Grammar const& g)
{
    sink << "start:";
    for ( auto s : g.startSymbols() )
        sink << ' ' << *s;

    sink << "\nlexical categories:";
    for ( auto s : g.lexicalCategories() )
        sink << ' ' << *s;

    sink << "\nproductions:\n";
    for ( auto const& p : g.productions() )
        sink << "    " << p << '\n';

    return sink;
}

} // namespace parsable::grammar
