#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>

#include <parsable/Utilities.hpp>
#include <parsable/lfg/Identifier.hpp>

namespace parsable::lfg {

#define EXPRESSION_KINDS(X) \
    X(Identifier , "identifier" ) \
    X(Application, "application") \
    X(Value      , "value"      )

/**
 * Functional-structure term
 *
 * An identifier, an attribute applied to a term (`(%f SUBJ)`), or an atomic
 * value (`sg`, `'pred'`).
 */
template <typename ID>
class Expression
{
public:
    enum class Kind
    {
#define X(a,b) a,
        EXPRESSION_KINDS(X)
#undef X
    };

public:
    static Expression identifier(ID id)
    {
        return Expression(Kind::Identifier, std::move(id), nullptr, std::string());
    }

    static Expression application(Expression base, std::string attribute)
    {
        return Expression(Kind::Application,
                          std::nullopt,
                          std::make_shared<Expression>(std::move(base)),
                          std::move(attribute));
    }

    static Expression value(std::string text)
    {
        return Expression(Kind::Value, std::nullopt, nullptr, std::move(text));
    }

public:
    Kind kind() const
    {
        return myKind;
    }

    ID const& id() const
    {
        ENFORCE(myKind == Kind::Identifier, "expression is not an identifier");
        return *myId;
    }

    Expression const& base() const
    {
        ENFORCE(myKind == Kind::Application, "expression is not an application");
        return *myBase;
    }

    // Attribute of an application, text of a value
    std::string const& text() const
    {
        ENFORCEC(myKind != Kind::Identifier);
        return myText;
    }

    std::set<ID> identifiers() const
    {
        switch (myKind) {
        case Kind::Identifier:  return { *myId };
        case Kind::Application: return myBase->identifiers();
        case Kind::Value:
            break;
        }

        return {};
    }

    bool operator == (Expression const& rhs) const
    {
        if ( myKind != rhs.myKind || myText != rhs.myText )
            return false;

        switch (myKind) {
        case Kind::Identifier:  return *myId == *rhs.myId;
        case Kind::Application: return *myBase == *rhs.myBase;
        case Kind::Value:
            break;
        }

        return true;
    }

    bool operator != (Expression const& rhs) const
    {
        return !operator==(rhs);
    }

private:
    Expression(Kind kind,
               std::optional<ID> id,
               std::shared_ptr<Expression const> base,
               std::string text)
        : myKind(kind)
        , myId(std::move(id))
        , myBase(std::move(base))
        , myText(std::move(text))
    {
    }

private:
    Kind myKind;
    std::optional<ID> myId;
    std::shared_ptr<Expression const> myBase;
    std::string myText;
};

template <typename ID>
std::ostream& operator << (std::ostream& sink, Expression<ID> const& e)
{
    using Kind = typename Expression<ID>::Kind;
    switch (e.kind()) {
    case Kind::Identifier:  return sink << e.id();
    case Kind::Application: return sink << '(' << e.base() << ' ' << e.text() << ')';
    case Kind::Value:       return sink << e.text();
    }

    return sink;
}

Expression<AbsoluteIdentifier> ground(Expression<RelativeIdentifier> const& e,
                                      AbsoluteIdentifier const& up,
                                      AbsoluteIdentifier const& down);

} // namespace parsable::lfg
