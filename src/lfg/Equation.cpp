#include <parsable/lfg/Equation.hpp>

namespace parsable::lfg {

namespace {
    using R = RelativeIdentifier;
    using A = AbsoluteIdentifier;

    Equals<A> groundLeaf(Equals<R> const& e, A const& up, A const& down)
    {
        return { e.positive, ground(e.left, up, down), ground(e.right, up, down) };
    }

    Contains<A> groundLeaf(Contains<R> const& e, A const& up, A const& down)
    {
        return { e.positive, ground(e.element, up, down), ground(e.container, up, down) };
    }

    Exists<A> groundLeaf(Exists<R> const& e, A const& up, A const& down)
    {
        return { e.positive, ground(e.expression, up, down) };
    }

    Assignment<A> groundLeaf(Assignment<R> const& e, A const& up, A const& down)
    {
        return { ground(e.left, up, down), ground(e.right, up, down) };
    }

    Containment<A> groundLeaf(Containment<R> const& e, A const& up, A const& down)
    {
        return { ground(e.element, up, down), ground(e.container, up, down) };
    }

    Disjunction<A> groundLeaf(Disjunction<R> const& e, A const& up, A const& down)
    {
        return { ground(e.left(), up, down), ground(e.right(), up, down) };
    }

    Conjunction<A> groundLeaf(Conjunction<R> const& e, A const& up, A const& down)
    {
        return { ground(e.left(), up, down), ground(e.right(), up, down) };
    }
}

Equation<A> ground(Equation<R> const& e, A const& up, A const& down)
{
    return std::visit([&](auto const& x) { return Equation<A>(ground(x, up, down)); }, e.variant());
}

CompoundEquation<A> ground(CompoundEquation<R> const& e, A const& up, A const& down)
{
    return std::visit([&](auto const& x) { return CompoundEquation<A>(groundLeaf(x, up, down)); }, e.variant());
}

DefiningEquation<A> ground(DefiningEquation<R> const& e, A const& up, A const& down)
{
    return std::visit([&](auto const& x) { return DefiningEquation<A>(groundLeaf(x, up, down)); }, e.variant());
}

ConstraintEquation<A> ground(ConstraintEquation<R> const& e, A const& up, A const& down)
{
    return std::visit([&](auto const& x) { return ConstraintEquation<A>(groundLeaf(x, up, down)); }, e.variant());
}

} // namespace parsable::lfg
