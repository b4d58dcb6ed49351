#pragma once

#include <set>
#include <string>

#include <parsable/grammar/Grammar.hpp>
#include <parsable/grammar/Symbol.hpp>
#include <parsable/lexer/Tokenizer.hpp>
#include <parsable/parser/ChartParser.hpp>

namespace parsable::grammar {

/**
 * Everything needed to parse a root symbol
 *
 * Constructed once per root by Symbol::derivation(). Throws
 * ConfigurationError when the literal tokens or the productions of the
 * closure are malformed.
 */
struct Derivation
{
    explicit Derivation(Symbol const& root);

    Derivation(Derivation const&) = delete;
    void operator = (Derivation const&) = delete;

    Symbol const& root;
    Grammar grammar;
    std::set<std::string> tokens;
    lexer::Tokenizer tokenizer;
    parser::ChartParser parser;
};

} // namespace parsable::grammar
