#include <parsable/parser/ParseTree.hpp>

#include <parsable/grammar/Categories.hpp>

namespace parsable::parser {

const char* to_string(ParseTree::Kind kind)
{
    static const char* PARSE_TREE_KIND_STRING[] = {
    #define X(a,b) b,
        PARSE_TREE_KINDS(X)
    #undef X
    };

    return PARSE_TREE_KIND_STRING[static_cast<unsigned>(kind)];
}

//
// ParseTree

ParseTreePtr ParseTree::mkTerminal(grammar::Symbol const& sym, std::string lexeme)
{
    return std::make_shared<ParseTree>(Kind::Terminal, sym, std::move(lexeme), std::vector<ParseTreePtr>());
}

ParseTreePtr ParseTree::mkNonterminal(grammar::Symbol const& head, std::vector<ParseTreePtr> children)
{
    return std::make_shared<ParseTree>(Kind::Nonterminal, head, std::string(), std::move(children));
}

ParseTreePtr ParseTree::mkEmpty(grammar::Symbol const& sym)
{
    return std::make_shared<ParseTree>(Kind::Empty, sym, std::string(), std::vector<ParseTreePtr>());
}

ParseTree::ParseTree(Kind kind,
                     grammar::Symbol const& sym,
                     std::string lexeme,
                     std::vector<ParseTreePtr> children)
    : myKind(kind)
    , mySymbol(&sym)
    , myLexeme(std::move(lexeme))
    , myChildren(std::move(children))
{
}

ParseTree::Kind ParseTree::kind() const
{
    return myKind;
}

grammar::Symbol const& ParseTree::symbol() const
{
    return *mySymbol;
}

std::string const& ParseTree::lexeme() const
{
    return myLexeme;
}

std::vector<ParseTreePtr> const& ParseTree::children() const
{
    return myChildren;
}

grammar::Production ParseTree::production() const
{
    grammar::Constituents tags;
    tags.reserve(myChildren.size());
    for ( auto const& c : myChildren )
        tags.push_back(&c->symbol());

    return grammar::Production(*mySymbol, std::move(tags));
}

std::ostream& operator << (std::ostream& sink, ParseTree const& tree)
{
    switch (tree.kind()) {
    case ParseTree::Kind::Terminal: {
        auto lex = tree.symbol().as<grammar::LexicalCategory>();
        if ( lex && !lex->literal() )
            return sink << tree.symbol() << "(\"" << tree.lexeme() << "\")";

        return sink << '"' << tree.lexeme() << '"';
    }

    case ParseTree::Kind::Empty:
        return sink << "<empty>";

    case ParseTree::Kind::Nonterminal:
        break;
    }

    sink << tree.symbol() << '(';
    auto first = true;
    for ( auto const& c : tree.children() ) {
        if ( !first )
            sink << ", ";

        sink << *c;
        first = false;
    }

    return sink << ')';
}

} // namespace parsable::parser
