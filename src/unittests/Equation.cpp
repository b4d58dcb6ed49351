#include <catch2/catch.hpp>

#include <set>
#include <sstream>
#include <string>

#include <parsable/lfg/Equation.hpp>

namespace parsable::unittests {

using namespace lfg;

namespace {
    using R = RelativeIdentifier;
    using A = AbsoluteIdentifier;
    using RExp = Expression<R>;
    using REq = Equation<R>;

    RExp var(std::string const& name)
    {
        return RExp::identifier(*R::fromString(name));
    }

    REq assign(std::string const& l, std::string const& r)
    {
        return DefiningEquation<R>(Assignment<R>{var(l), var(r)});
    }

    REq contain(std::string const& e, std::string const& c)
    {
        return DefiningEquation<R>(Containment<R>{var(e), var(c)});
    }

    REq equals(bool positive, std::string const& l, std::string const& r)
    {
        return ConstraintEquation<R>(Equals<R>{positive, var(l), var(r)});
    }

    REq exists(bool positive, std::string const& e)
    {
        return ConstraintEquation<R>(Exists<R>{positive, var(e)});
    }

    REq conj(REq l, REq r)
    {
        return CompoundEquation<R>(Conjunction<R>(std::move(l), std::move(r)));
    }

    REq disj(REq l, REq r)
    {
        return CompoundEquation<R>(Disjunction<R>(std::move(l), std::move(r)));
    }

    template <typename T>
    std::string str(T const& x)
    {
        std::ostringstream s;
        s << x;
        return s.str();
    }
}

TEST_CASE("constraint negation flips the sign", "[Equation]")
{
    auto e = equals(true, "X", "Y");
    CHECK(e.negation() == equals(false, "X", "Y"));
    CHECK(e.negation().negation() == e);

    auto x = exists(true, "X");
    CHECK(x.negation() == exists(false, "X"));
    CHECK(x.negation().negation() == x);

    auto c = REq(ConstraintEquation<R>(Contains<R>{false, var("X"), var("Y")}));
    auto cn = c.negation();
    REQUIRE(cn.as<ConstraintEquation<R>>());
    REQUIRE(cn.as<ConstraintEquation<R>>()->as<Contains<R>>());
    CHECK(cn.as<ConstraintEquation<R>>()->as<Contains<R>>()->positive);
    CHECK(cn.negation() == c);
}

TEST_CASE("defining equations negate to constraints", "[Equation]")
{
    auto a = assign("X", "Y");
    auto n = a.negation();

    CHECK_FALSE(n.as<DefiningEquation<R>>());
    REQUIRE(n.as<ConstraintEquation<R>>());
    CHECK(n == equals(false, "X", "Y"));

    // the positive constraint comes back, not the assignment
    CHECK(n.negation() == equals(true, "X", "Y"));
    CHECK(n.negation() != a);
    CHECK(n.negation().identifiers() == a.identifiers());

    auto c = contain("X", "Y");
    CHECK(c.negation() == REq(ConstraintEquation<R>(Contains<R>{false, var("X"), var("Y")})));
    CHECK(str(c.negation()) == "Contains(false, X, Y)");

    auto d = DefiningEquation<R>(Assignment<R>{var("X"), var("Y")});
    CHECK(d.negation() == ConstraintEquation<R>(Equals<R>{false, var("X"), var("Y")}));
}

TEST_CASE("compound negation applies De Morgan", "[Equation]")
{
    auto l = equals(true, "X", "Y");
    auto r = exists(false, "Z");

    auto c = conj(l, r);
    CHECK(c.negation() == disj(l.negation(), r.negation()));
    CHECK(c.negation().negation() == c);

    auto d = disj(l, r);
    CHECK(d.negation() == conj(l.negation(), r.negation()));
    CHECK(d.negation().negation() == d);

    CHECK(str(c) == "Conjunction(Equals(true, X, Y), Exists(false, Z))");
    CHECK(str(d.negation()) == "Conjunction(Equals(false, X, Y), Exists(true, Z))");
}

TEST_CASE("identifiers are compositional", "[Equation]")
{
    auto l = assign("X", "Y");
    auto r = contain("%f", "^");

    auto expected = std::set<R>{R::local("X"), R::local("Y"), R::local("%f"), R::up()};
    CHECK(conj(l, r).identifiers() == expected);
    CHECK(disj(l, r).identifiers() == expected);
    CHECK(conj(l, r).identifiers() == unite(l.identifiers(), r.identifiers()));
    CHECK(exists(true, "X").identifiers() == std::set<R>{R::local("X")});

    CHECK(l.identifiers() == std::set<R>{R::local("X"), R::local("Y")});
    CHECK(r.identifiers() == std::set<R>{R::local("%f"), R::up()});

    auto contains = REq(ConstraintEquation<R>(Contains<R>{true, var("!"), var("Z")}));
    CHECK(contains.identifiers() == std::set<R>{R::down(), R::local("Z")});
    CHECK(r.negation().identifiers() == r.identifiers());

    auto applied = RExp::application(var("X"), "SUBJ");
    auto valued = REq(ConstraintEquation<R>(Equals<R>{true, applied, RExp::value("sg")}));
    CHECK(valued.identifiers() == std::set<R>{R::local("X")});
    CHECK(valued.negation().identifiers() == valued.identifiers());
}

TEST_CASE("relative identifiers", "[Equation][Identifier]")
{
    CHECK(R::fromString("^") == R::up());
    CHECK(R::fromString("!") == R::down());
    CHECK(R::fromString("%f") == R::local("%f"));
    CHECK(R::fromString("X") == R::local("X"));
    CHECK_FALSE(R::fromString("x"));
    CHECK_FALSE(R::fromString("%"));
    CHECK_FALSE(R::fromString(""));
    CHECK_FALSE(R::fromString("X-Y"));

    A up("f1");
    A down("f2");
    CHECK(R::up().ground(up, down) == up);
    CHECK(R::down().ground(up, down) == down);
    CHECK(R::local("%f").ground(up, down) == A("f2/%f"));
    CHECK(R::local("X").ground(up, down) == A("f2/X"));
}

TEST_CASE("grounding binds every identifier", "[Equation]")
{
    A up("f1");
    A down("f2");

    auto subj = RExp::application(RExp::identifier(R::local("%f")), "SUBJ");
    auto e = REq(ConstraintEquation<R>(Equals<R>{true, subj, RExp::identifier(R::up())}));

    auto g = ground(e, up, down);
    CHECK(g.identifiers() == std::set<A>{A("f2/%f"), A("f1")});
    CHECK(str(g) == "Equals(true, (f2/%f SUBJ), f1)");

    auto c = ground(conj(assign("X", "!"), e.negation()), up, down);
    CHECK(c.identifiers() == std::set<A>{A("f2/X"), A("f2"), A("f2/%f"), A("f1")});
    CHECK(str(c) == "Conjunction(Assignment(f2/X, f2), Equals(false, (f2/%f SUBJ), f1))");

    CHECK(ground(RExp::value("sg"), up, down) == Expression<A>::value("sg"));
}

TEST_CASE("expression accessors follow the kind", "[Equation]")
{
    auto x = var("X");
    auto subj = RExp::application(x, "SUBJ");

    CHECK(subj.text() == "SUBJ");
    CHECK(subj.base() == x);
    CHECK(x.id() == R::local("X"));
    CHECK(RExp::value("sg").text() == "sg");

    CHECK_THROWS_AS(x.text(), RuntimeException);
    CHECK_THROWS_AS(x.base(), RuntimeException);
    CHECK_THROWS_AS(subj.id(), RuntimeException);
}

TEST_CASE("grounding keeps distinct locals apart", "[Equation][Identifier]")
{
    A up("f1");
    A down("f2");

    auto e = assign("%X", "X");
    auto g = ground(e, up, down);
    CHECK(e.identifiers().size() == 2);
    CHECK(g.identifiers().size() == e.identifiers().size());
    CHECK(str(g) == "Assignment(f2/%X, f2/X)");

    auto n = ground(e.negation(), up, down);
    CHECK(str(n) == "Equals(false, f2/%X, f2/X)");
}

} // namespace parsable::unittests
