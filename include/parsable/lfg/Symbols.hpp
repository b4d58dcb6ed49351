#pragma once

#include <optional>
#include <string>

#include <parsable/grammar/Categories.hpp>
#include <parsable/grammar/Nonterminal.hpp>
#include <parsable/lfg/Equation.hpp>
#include <parsable/lfg/Expression.hpp>
#include <parsable/lfg/Identifier.hpp>

namespace parsable::lfg {

using RelativeExpression = Expression<RelativeIdentifier>;
using RelativeEquation = Equation<RelativeIdentifier>;
using AbsoluteEquation = Equation<AbsoluteIdentifier>;

#define OR_SEMANTICS_KINDS(X) \
    X(Conjunction, "conjunction") \
    X(Disjunction, "disjunction")

/**
 * What `Equation OR Equation` constructs
 *
 * Conjunction is the established behaviour and the default; Disjunction is
 * the logically expected reading.
 */
enum class OrSemantics
{
#define X(a,b) a,
    OR_SEMANTICS_KINDS(X)
#undef X
};

const char* to_string(OrSemantics s);
std::optional<OrSemantics> orSemanticsFromString(std::string const& text);

bool isKeyword(std::string const& text);
bool isIdentifier(std::string const& text);
bool isAttribute(std::string const& text);
bool isValue(std::string const& text);

/**
 * Grammar symbols of functional-structure equations
 *
 *     Equation   := NOT Equation
 *                 | Equation AND Equation
 *                 | Equation OR Equation
 *                 | Expression (= | IN | =c | INc) Expression
 *                 | Expression
 *                 | ( Equation )
 *     Expression := Identifier | ( Expression Attribute ) | Value
 */
class LfgSymbols
{
public:
    explicit LfgSymbols(OrSemantics orSemantics);

    LfgSymbols(LfgSymbols const&) = delete;
    void operator = (LfgSymbols const&) = delete;

public:
    OrSemantics orSemantics() const;

private:
    OrSemantics myOrSemantics;

public:
    grammar::LexicalCategory identifier;
    grammar::LexicalCategory attribute;
    grammar::LexicalCategory value;
    grammar::Nonterminal<RelativeExpression> expression;
    grammar::Nonterminal<RelativeEquation> equation;
};

LfgSymbols const& lfgSymbols(OrSemantics orSemantics = OrSemantics::Conjunction);

} // namespace parsable::lfg
