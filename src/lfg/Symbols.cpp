#include <parsable/lfg/Symbols.hpp>

#include <cctype>

namespace parsable::lfg {

namespace {
    bool isNameChar(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    bool isUpperName(std::string const& text)
    {
        if ( text.empty() || !std::isupper(static_cast<unsigned char>(text.front())) )
            return false;

        for ( auto c : text )
            if ( std::islower(static_cast<unsigned char>(c)) || !isNameChar(c) )
                return false;

        return true;
    }

    bool isLowerWord(std::string const& text)
    {
        if ( text.empty() || !std::islower(static_cast<unsigned char>(text.front())) )
            return false;

        for ( auto c : text )
            if ( !isNameChar(c) )
                return false;

        return true;
    }

    bool isQuoted(std::string const& text)
    {
        return text.size() >= 2 && text.front() == '\'' && text.back() == '\'';
    }

    using R = RelativeIdentifier;
}

const char* to_string(OrSemantics s)
{
    static const char* OR_SEMANTICS_STRING[] = {
    #define X(a,b) b,
        OR_SEMANTICS_KINDS(X)
    #undef X
    };

    return OR_SEMANTICS_STRING[static_cast<unsigned>(s)];
}

std::optional<OrSemantics> orSemanticsFromString(std::string const& text)
{
#define X(a,b) if ( text == b ) return OrSemantics::a;
    OR_SEMANTICS_KINDS(X)
#undef X

    return std::nullopt;
}

bool isKeyword(std::string const& text)
{
    return text == "NOT" || text == "AND" || text == "OR" || text == "IN" || text == "INc";
}

bool isIdentifier(std::string const& text)
{
    return !isKeyword(text) && RelativeIdentifier::fromString(text).has_value();
}

bool isAttribute(std::string const& text)
{
    return !isKeyword(text) && isUpperName(text);
}

bool isValue(std::string const& text)
{
    return isLowerWord(text) || isQuoted(text);
}

//
// LfgSymbols

LfgSymbols::LfgSymbols(OrSemantics orSemantics)
    : myOrSemantics(orSemantics)
    , identifier("Identifier", isIdentifier)
    , attribute("Attribute", isAttribute)
    , value("Value", isValue)
    , expression("Expression")
    , equation("Equation")
{
    using grammar::terminal;

    expression
        .rule([](std::string const& s) -> std::optional<RelativeExpression> {
                  auto id = RelativeIdentifier::fromString(s);
                  if ( !id )
                      return std::nullopt;

                  return RelativeExpression::identifier(std::move(*id));
              },
              identifier)
        .rule([](std::string const&, RelativeExpression base, std::string attr, std::string const&) {
                  return RelativeExpression::application(std::move(base), std::move(attr));
              },
              terminal("("), expression, attribute, terminal(")"))
        .rule([](std::string text) {
                  return RelativeExpression::value(std::move(text));
              },
              value);

    auto const disjoin = myOrSemantics == OrSemantics::Disjunction;
    equation
        .rule([](std::string const&, RelativeEquation const& e) {
                  return e.negation();
              },
              terminal("NOT"), equation)
        .rule([](RelativeEquation const& l, std::string const&, RelativeEquation const& r) {
                  return RelativeEquation(CompoundEquation<R>(Conjunction<R>(l, r)));
              },
              equation, terminal("AND"), equation)
        .rule([disjoin](RelativeEquation const& l, std::string const&, RelativeEquation const& r) {
                  if ( disjoin )
                      return RelativeEquation(CompoundEquation<R>(Disjunction<R>(l, r)));

                  return RelativeEquation(CompoundEquation<R>(Conjunction<R>(l, r)));
              },
              equation, terminal("OR"), equation)
        .rule([](RelativeExpression l, std::string const&, RelativeExpression r) {
                  return RelativeEquation(DefiningEquation<R>(Assignment<R>{std::move(l), std::move(r)}));
              },
              expression, terminal("="), expression)
        .rule([](RelativeExpression e, std::string const&, RelativeExpression c) {
                  return RelativeEquation(DefiningEquation<R>(Containment<R>{std::move(e), std::move(c)}));
              },
              expression, terminal("IN"), expression)
        .rule([](RelativeExpression l, std::string const&, RelativeExpression r) {
                  return RelativeEquation(ConstraintEquation<R>(Equals<R>{true, std::move(l), std::move(r)}));
              },
              expression, terminal("=c"), expression)
        .rule([](RelativeExpression e, std::string const&, RelativeExpression c) {
                  return RelativeEquation(ConstraintEquation<R>(Contains<R>{true, std::move(e), std::move(c)}));
              },
              expression, terminal("INc"), expression)
        .rule([](RelativeExpression e) {
                  return RelativeEquation(ConstraintEquation<R>(Exists<R>{true, std::move(e)}));
              },
              expression)
        .rule([](std::string const&, RelativeEquation e, std::string const&) {
                  return e;
              },
              terminal("("), equation, terminal(")"));
}

OrSemantics LfgSymbols::orSemantics() const
{
    return myOrSemantics;
}

LfgSymbols const& lfgSymbols(OrSemantics orSemantics)
{
    static LfgSymbols const conjunction(OrSemantics::Conjunction);
    static LfgSymbols const disjunction(OrSemantics::Disjunction);

    return orSemantics == OrSemantics::Disjunction ? disjunction : conjunction;
}

} // namespace parsable::lfg
