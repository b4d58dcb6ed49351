#include <parsable/parser/ChartParser.hpp>

#include <map>
#include <set>
#include <tuple>

#include <parsable/Utilities.hpp>
#include <parsable/grammar/Categories.hpp>
#include <parsable/grammar/Grammar.hpp>

namespace parsable::parser {

namespace {
    using Span = std::pair<uz, uz>;

    /**
     * Enumerates the trees of a recognized input from its completed items
     *
     * A symbol over a span is expanded at most once along any path from the
     * root, which cuts unary cycles such as A -> B, B -> A. Results computed
     * while such a cut was in effect depend on the path and are not
     * memoized.
     */
    class TreeExtractor
    {
    public:
        TreeExtractor(grammar::Grammar const& g,
                      std::vector<lexer::Token> const& tokens,
                      std::map<Span, std::vector<uz>> completed,
                      uz maxTrees)
            : myGrammar(g)
            , myTokens(tokens)
            , myCompleted(std::move(completed))
            , myMaxTrees(maxTrees)
        {
        }

    public:
        std::vector<ParseTreePtr> trees(grammar::Symbol const& sym, uz start, uz end)
        {
            if ( auto lex = sym.as<grammar::LexicalCategory>() ) {
                if ( end == start + 1 && lex->member(myTokens[start].lexeme()) )
                    return { ParseTree::mkTerminal(sym, myTokens[start].lexeme()) };

                return {};
            }

            if ( !sym.as<grammar::NonterminalSymbol>() )
                return {};

            Key key(sym.serial(), start, end);
            auto memo = myMemo.find(key);
            if ( memo != myMemo.end() )
                return memo->second;

            if ( !myActive.insert(key).second ) {
                ++myCuts;
                return {};
            }

            scope_exit {
                myActive.erase(key);
            };

            auto const cuts = myCuts;
            std::vector<ParseTreePtr> ret;
            auto e = myCompleted.find(Span(start, end));
            if ( e != myCompleted.end() ) {
                for ( auto p : e->second ) {
                    auto const& prod = myGrammar.productions()[p];
                    if ( prod.head != &sym )
                        continue;

                    for ( auto& children : sequences(prod.children, 0, start, end) ) {
                        if ( ret.size() == myMaxTrees )
                            break;

                        ret.push_back(ParseTree::mkNonterminal(sym, std::move(children)));
                    }
                }
            }

            if ( cuts == myCuts )
                myMemo[key] = ret;

            return ret;
        }

    private:
        // Every way of covering [start, end) with constituents [index, ..)
        std::vector<std::vector<ParseTreePtr>> sequences(grammar::Constituents const& constituents,
                                                         uz index,
                                                         uz start,
                                                         uz end)
        {
            std::vector<std::vector<ParseTreePtr>> ret;
            auto const remaining = constituents.size() - index;
            if ( remaining == 0 ) {
                if ( start == end )
                    ret.emplace_back();

                return ret;
            }

            // every constituent covers at least one token
            if ( end - start < remaining )
                return ret;

            auto const last = end - (remaining - 1);
            for ( auto mid = start + 1; mid <= last; ++mid ) {
                if ( remaining == 1 && mid != end )
                    continue;

                auto heads = trees(*constituents[index], start, mid);
                if ( heads.empty() )
                    continue;

                auto tails = sequences(constituents, index + 1, mid, end);
                for ( auto const& h : heads ) {
                    for ( auto const& t : tails ) {
                        if ( ret.size() == myMaxTrees )
                            return ret;

                        std::vector<ParseTreePtr> seq;
                        seq.reserve(t.size() + 1);
                        seq.push_back(h);
                        seq.insert(seq.end(), t.begin(), t.end());
                        ret.emplace_back(std::move(seq));
                    }
                }
            }

            return ret;
        }

    private:
        using Key = std::tuple<u32, uz, uz>;

        grammar::Grammar const& myGrammar;
        std::vector<lexer::Token> const& myTokens;
        std::map<Span, std::vector<uz>> myCompleted;
        uz myMaxTrees = 0;

        std::map<Key, std::vector<ParseTreePtr>> myMemo;
        std::set<Key> myActive;
        uz myCuts = 0;
    };
}

//
// ChartParser

bool ChartParser::Item::operator < (Item const& rhs) const
{
    return std::tie(production, dot, origin) < std::tie(rhs.production, rhs.dot, rhs.origin);
}

ChartParser::ChartParser(grammar::Grammar const& grammar, ParserOptions options)
    : myGrammar(&grammar)
    , myOptions(options)
{
}

std::vector<ChartParser::Column> ChartParser::chart(std::vector<lexer::Token> const& tokens) const
{
    auto const& productions = myGrammar->productions();
    auto const n = tokens.size();

    std::vector<Column> ret(n + 1);
    std::vector<std::set<Item>> seen(n + 1);
    auto add = [&](uz k, Item item) {
        if ( seen[k].insert(item).second )
            ret[k].push_back(item);
    };

    for ( auto s : myGrammar->startSymbols() )
        for ( auto p : myGrammar->productionsFor(*s) )
            add(0, Item{p, 0, 0});

    for ( uz k = 0; k <= n; ++k ) {
        // ret[k] grows while it is walked
        for ( uz i = 0; i < ret[k].size(); ++i ) {
            auto const item = ret[k][i];
            auto const& prod = productions[item.production];

            if ( item.dot == prod.children.size() ) {
                // completed items span at least one token, so origin < k
                for ( uz j = 0; j < ret[item.origin].size(); ++j ) {
                    auto const waiting = ret[item.origin][j];
                    auto const& w = productions[waiting.production];
                    if ( waiting.dot < w.children.size() && w.children[waiting.dot] == prod.head )
                        add(k, Item{waiting.production, waiting.dot + 1, waiting.origin});
                }

                continue;
            }

            auto next = prod.children[item.dot];
            if ( next->as<grammar::NonterminalSymbol>() ) {
                for ( auto p : myGrammar->productionsFor(*next) )
                    add(k, Item{p, 0, k});
            }
            else if ( auto lex = next->as<grammar::LexicalCategory>() ) {
                if ( k < n && lex->member(tokens[k].lexeme()) )
                    add(k + 1, Item{item.production, item.dot + 1, item.origin});
            }
        }
    }

    return ret;
}

bool ChartParser::recognize(std::vector<lexer::Token> const& tokens) const
{
    auto const c = chart(tokens);
    auto const& productions = myGrammar->productions();
    auto const& starts = myGrammar->startSymbols();
    for ( auto const& item : c.back() ) {
        auto const& prod = productions[item.production];
        if ( item.origin == 0 && item.dot == prod.children.size() && starts.count(prod.head) )
            return true;
    }

    return false;
}

std::vector<ParseTreePtr> ChartParser::parse(std::vector<lexer::Token> const& tokens) const
{
    std::vector<ParseTreePtr> ret;
    if ( tokens.empty() )
        return ret;

    auto const c = chart(tokens);
    auto const& productions = myGrammar->productions();

    std::map<Span, std::vector<uz>> completed;
    for ( uz k = 0; k < c.size(); ++k ) {
        for ( auto const& item : c[k] ) {
            if ( item.dot == productions[item.production].children.size() )
                completed[Span(item.origin, k)].push_back(item.production);
        }
    }

    TreeExtractor extract(*myGrammar, tokens, std::move(completed), myOptions.maxTrees);
    for ( auto s : myGrammar->startSymbols() ) {
        for ( auto& t : extract.trees(*s, 0, tokens.size()) ) {
            if ( ret.size() == myOptions.maxTrees )
                return ret;

            ret.push_back(std::move(t));
        }
    }

    return ret;
}

} // namespace parsable::parser
