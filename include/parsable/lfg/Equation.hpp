#pragma once

#include <memory>
#include <ostream>
#include <set>
#include <variant>

#include <parsable/lfg/Expression.hpp>
#include <parsable/lfg/Identifier.hpp>

namespace parsable::lfg {

template <typename ID> class Equation;

template <typename ID>
std::set<ID> unite(std::set<ID> lhs, std::set<ID> const& rhs)
{
    lhs.insert(begin(rhs), end(rhs));
    return lhs;
}

//
// constraint equations

template <typename ID>
struct Equals
{
    bool positive;
    Expression<ID> left;
    Expression<ID> right;
};

template <typename ID>
struct Contains
{
    bool positive;
    Expression<ID> element;
    Expression<ID> container;
};

template <typename ID>
struct Exists
{
    bool positive;
    Expression<ID> expression;
};

template <typename ID>
Equals<ID> negate(Equals<ID> const& e)
{
    return { !e.positive, e.left, e.right };
}

template <typename ID>
Contains<ID> negate(Contains<ID> const& e)
{
    return { !e.positive, e.element, e.container };
}

template <typename ID>
Exists<ID> negate(Exists<ID> const& e)
{
    return { !e.positive, e.expression };
}

template <typename ID>
std::set<ID> identifiers(Equals<ID> const& e)
{
    return unite(e.left.identifiers(), e.right.identifiers());
}

template <typename ID>
std::set<ID> identifiers(Contains<ID> const& e)
{
    return unite(e.element.identifiers(), e.container.identifiers());
}

template <typename ID>
std::set<ID> identifiers(Exists<ID> const& e)
{
    return e.expression.identifiers();
}

template <typename ID>
bool operator == (Equals<ID> const& lhs, Equals<ID> const& rhs)
{
    return lhs.positive == rhs.positive && lhs.left == rhs.left && lhs.right == rhs.right;
}

template <typename ID>
bool operator == (Contains<ID> const& lhs, Contains<ID> const& rhs)
{
    return lhs.positive == rhs.positive && lhs.element == rhs.element && lhs.container == rhs.container;
}

template <typename ID>
bool operator == (Exists<ID> const& lhs, Exists<ID> const& rhs)
{
    return lhs.positive == rhs.positive && lhs.expression == rhs.expression;
}

/**
 * Signed test against an existing structure
 */
template <typename ID>
class ConstraintEquation
{
public:
    using Variant = std::variant<Equals<ID>, Contains<ID>, Exists<ID>>;

public:
    /*implicit*/ ConstraintEquation(Equals<ID> e) : myVariant(std::move(e)) {}
    /*implicit*/ ConstraintEquation(Contains<ID> e) : myVariant(std::move(e)) {}
    /*implicit*/ ConstraintEquation(Exists<ID> e) : myVariant(std::move(e)) {}

public:
    template <typename T>
    T const* as() const
    {
        return std::get_if<T>(&myVariant);
    }

    Variant const& variant() const
    {
        return myVariant;
    }

    ConstraintEquation negation() const
    {
        return std::visit([](auto const& e) { return ConstraintEquation(lfg::negate(e)); }, myVariant);
    }

    std::set<ID> identifiers() const
    {
        return std::visit([](auto const& e) { return lfg::identifiers(e); }, myVariant);
    }

    bool operator == (ConstraintEquation const& rhs) const { return myVariant == rhs.myVariant; }
    bool operator != (ConstraintEquation const& rhs) const { return !operator==(rhs); }

private:
    Variant myVariant;
};

//
// defining equations

template <typename ID>
struct Assignment
{
    Expression<ID> left;
    Expression<ID> right;
};

template <typename ID>
struct Containment
{
    Expression<ID> element;
    Expression<ID> container;
};

// Defining equations have no negative form; their negation is a constraint
template <typename ID>
Equals<ID> negate(Assignment<ID> const& e)
{
    return { false, e.left, e.right };
}

template <typename ID>
Contains<ID> negate(Containment<ID> const& e)
{
    return { false, e.element, e.container };
}

template <typename ID>
std::set<ID> identifiers(Assignment<ID> const& e)
{
    return unite(e.left.identifiers(), e.right.identifiers());
}

template <typename ID>
std::set<ID> identifiers(Containment<ID> const& e)
{
    return unite(e.element.identifiers(), e.container.identifiers());
}

template <typename ID>
bool operator == (Assignment<ID> const& lhs, Assignment<ID> const& rhs)
{
    return lhs.left == rhs.left && lhs.right == rhs.right;
}

template <typename ID>
bool operator == (Containment<ID> const& lhs, Containment<ID> const& rhs)
{
    return lhs.element == rhs.element && lhs.container == rhs.container;
}

/**
 * Equation that builds structure
 */
template <typename ID>
class DefiningEquation
{
public:
    using Variant = std::variant<Assignment<ID>, Containment<ID>>;

public:
    /*implicit*/ DefiningEquation(Assignment<ID> e) : myVariant(std::move(e)) {}
    /*implicit*/ DefiningEquation(Containment<ID> e) : myVariant(std::move(e)) {}

public:
    template <typename T>
    T const* as() const
    {
        return std::get_if<T>(&myVariant);
    }

    Variant const& variant() const
    {
        return myVariant;
    }

    ConstraintEquation<ID> negation() const
    {
        return std::visit([](auto const& e) { return ConstraintEquation<ID>(lfg::negate(e)); }, myVariant);
    }

    std::set<ID> identifiers() const
    {
        return std::visit([](auto const& e) { return lfg::identifiers(e); }, myVariant);
    }

    bool operator == (DefiningEquation const& rhs) const { return myVariant == rhs.myVariant; }
    bool operator != (DefiningEquation const& rhs) const { return !operator==(rhs); }

private:
    Variant myVariant;
};

//
// compound equations

template <typename ID>
class BinaryEquation
{
public:
    BinaryEquation(Equation<ID> left, Equation<ID> right)
        : myLeft(std::make_shared<Equation<ID>>(std::move(left)))
        , myRight(std::make_shared<Equation<ID>>(std::move(right)))
    {
    }

public:
    Equation<ID> const& left() const { return *myLeft; }
    Equation<ID> const& right() const { return *myRight; }

private:
    std::shared_ptr<Equation<ID> const> myLeft;
    std::shared_ptr<Equation<ID> const> myRight;
};

template <typename ID>
struct Disjunction : BinaryEquation<ID>
{
    using BinaryEquation<ID>::BinaryEquation;
};

template <typename ID>
struct Conjunction : BinaryEquation<ID>
{
    using BinaryEquation<ID>::BinaryEquation;
};

template <typename ID>
Conjunction<ID> negate(Disjunction<ID> const& e)
{
    return { e.left().negation(), e.right().negation() };
}

template <typename ID>
Disjunction<ID> negate(Conjunction<ID> const& e)
{
    return { e.left().negation(), e.right().negation() };
}

template <typename ID>
std::set<ID> identifiers(BinaryEquation<ID> const& e)
{
    return unite(e.left().identifiers(), e.right().identifiers());
}

template <typename ID>
bool operator == (Disjunction<ID> const& lhs, Disjunction<ID> const& rhs)
{
    return lhs.left() == rhs.left() && lhs.right() == rhs.right();
}

template <typename ID>
bool operator == (Conjunction<ID> const& lhs, Conjunction<ID> const& rhs)
{
    return lhs.left() == rhs.left() && lhs.right() == rhs.right();
}

template <typename ID>
class CompoundEquation
{
public:
    using Variant = std::variant<Disjunction<ID>, Conjunction<ID>>;

public:
    /*implicit*/ CompoundEquation(Disjunction<ID> e) : myVariant(std::move(e)) {}
    /*implicit*/ CompoundEquation(Conjunction<ID> e) : myVariant(std::move(e)) {}

public:
    template <typename T>
    T const* as() const
    {
        return std::get_if<T>(&myVariant);
    }

    Variant const& variant() const
    {
        return myVariant;
    }

    CompoundEquation negation() const
    {
        return std::visit([](auto const& e) { return CompoundEquation(lfg::negate(e)); }, myVariant);
    }

    std::set<ID> identifiers() const
    {
        return std::visit([](auto const& e) { return lfg::identifiers(e); }, myVariant);
    }

    bool operator == (CompoundEquation const& rhs) const { return myVariant == rhs.myVariant; }
    bool operator != (CompoundEquation const& rhs) const { return !operator==(rhs); }

private:
    Variant myVariant;
};

/**
 * Functional-structure equation over identifiers of type \p ID
 *
 * Equations over RelativeIdentifier come out of the parser; ground() turns
 * them into equations over AbsoluteIdentifier. There is no ground() for
 * absolute equations.
 */
template <typename ID>
class Equation
{
public:
    using Variant = std::variant<CompoundEquation<ID>, DefiningEquation<ID>, ConstraintEquation<ID>>;

public:
    /*implicit*/ Equation(CompoundEquation<ID> e) : myVariant(std::move(e)) {}
    /*implicit*/ Equation(DefiningEquation<ID> e) : myVariant(std::move(e)) {}
    /*implicit*/ Equation(ConstraintEquation<ID> e) : myVariant(std::move(e)) {}

public:
    template <typename T>
    T const* as() const
    {
        return std::get_if<T>(&myVariant);
    }

    Variant const& variant() const
    {
        return myVariant;
    }

    // Pushes the negation down to the leaves; defining equations become
    // negative constraints
    Equation negation() const
    {
        return std::visit([](auto const& e) { return Equation(e.negation()); }, myVariant);
    }

    std::set<ID> identifiers() const
    {
        return std::visit([](auto const& e) { return e.identifiers(); }, myVariant);
    }

    bool operator == (Equation const& rhs) const { return myVariant == rhs.myVariant; }
    bool operator != (Equation const& rhs) const { return !operator==(rhs); }

private:
    Variant myVariant;
};

//
// printing

inline const char* signName(bool positive)
{
    return positive ? "true" : "false";
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, Equals<ID> const& e)
{
    return sink << "Equals(" << signName(e.positive) << ", " << e.left << ", " << e.right << ')';
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, Contains<ID> const& e)
{
    return sink << "Contains(" << signName(e.positive) << ", " << e.element << ", " << e.container << ')';
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, Exists<ID> const& e)
{
    return sink << "Exists(" << signName(e.positive) << ", " << e.expression << ')';
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, Assignment<ID> const& e)
{
    return sink << "Assignment(" << e.left << ", " << e.right << ')';
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, Containment<ID> const& e)
{
    return sink << "Containment(" << e.element << ", " << e.container << ')';
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, Disjunction<ID> const& e)
{
    return sink << "Disjunction(" << e.left() << ", " << e.right() << ')';
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, Conjunction<ID> const& e)
{
    return sink << "Conjunction(" << e.left() << ", " << e.right() << ')';
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, ConstraintEquation<ID> const& e)
{
    std::visit([&sink](auto const& c) { sink << c; }, e.variant());
    return sink;
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, DefiningEquation<ID> const& e)
{
    std::visit([&sink](auto const& d) { sink << d; }, e.variant());
    return sink;
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, CompoundEquation<ID> const& e)
{
    std::visit([&sink](auto const& c) { sink << c; }, e.variant());
    return sink;
}

template <typename ID>
std::ostream& operator << (std::ostream& sink, Equation<ID> const& e)
{
    std::visit([&sink](auto const& x) { sink << x; }, e.variant());
    return sink;
}

//
// grounding

Equation<AbsoluteIdentifier> ground(Equation<RelativeIdentifier> const& e,
                                    AbsoluteIdentifier const& up,
                                    AbsoluteIdentifier const& down);

CompoundEquation<AbsoluteIdentifier> ground(CompoundEquation<RelativeIdentifier> const& e,
                                            AbsoluteIdentifier const& up,
                                            AbsoluteIdentifier const& down);

DefiningEquation<AbsoluteIdentifier> ground(DefiningEquation<RelativeIdentifier> const& e,
                                            AbsoluteIdentifier const& up,
                                            AbsoluteIdentifier const& down);

ConstraintEquation<AbsoluteIdentifier> ground(ConstraintEquation<RelativeIdentifier> const& e,
                                              AbsoluteIdentifier const& up,
                                              AbsoluteIdentifier const& down);

} // namespace parsable::lfg
