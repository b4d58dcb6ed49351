#include <parsable/grammar/Derivation.hpp>

#include <parsable/Diagnostics.hpp>

namespace parsable::grammar {

namespace {
    std::set<std::string> checkedTokens(Symbol const& root, Grammar const& grammar)
    {
        auto ret = collectTokens(root, root.closure());

        Diagnostics dgn;
        auto valid = lexer::checkLiterals(ret, dgn);
        valid = grammar.check(dgn) && valid;
        if ( !valid )
            dgn.die("invalid grammar configuration");

        return ret;
    }
}

Derivation::Derivation(Symbol const& root)
    : root(root)
    , grammar(assemble(root, root.closure()))
    , tokens(checkedTokens(root, grammar))
    , tokenizer(tokens)
    , parser(grammar)
{
}

} // namespace parsable::grammar
