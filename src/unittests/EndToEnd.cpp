#include <catch2/catch.hpp>

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <parsable/Diagnostics.hpp>
#include <parsable/Parsable.hpp>
#include <parsable/grammar/Categories.hpp>
#include <parsable/grammar/Nonterminal.hpp>
#include <parsable/lfg/Symbols.hpp>

namespace parsable::unittests {

namespace {
    using R = lfg::RelativeIdentifier;
    using A = lfg::AbsoluteIdentifier;
    using lfg::RelativeEquation;
    using lfg::RelativeExpression;

    bool isNumber(std::string const& s)
    {
        return !s.empty() && std::all_of(begin(s), end(s), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
    }

    template <typename T>
    std::string str(T const& x)
    {
        std::ostringstream s;
        s << x;
        return s.str();
    }

    std::vector<std::string> lexemes(std::vector<lexer::Token> const& tokens)
    {
        std::vector<std::string> ret;
        for ( auto const& t : tokens )
            ret.push_back(t.lexeme());

        return ret;
    }
}

TEST_CASE("sum of two numbers", "[EndToEnd]")
{
    grammar::LexicalCategory num("Num", isNumber);
    grammar::Nonterminal<int> sum("Sum");
    sum.rule([](std::string const& l, std::string const&, std::string const& r) {
                 return std::stoi(l) + std::stoi(r);
             },
             num, grammar::terminal("+"), num);

    auto result = sum.parse("3 + 4");
    CHECK(lexemes(result.tokens) == std::vector<std::string>{"3", "+", "4"});
    REQUIRE(result.trees.size() == 1);
    CHECK(str(*result.trees.front()) == "Sum(Num(\"3\"), \"+\", Num(\"4\"))");
    CHECK(result.values == std::vector<int>{7});
    CHECK(result.status() == ParseStatus::Ok);

    CHECK(sum.derivation().tokens == std::set<std::string>{"+"});
    CHECK(sum.parse("3 +").status() == ParseStatus::NoParse);
}

TEST_CASE("negated assignment", "[EndToEnd][Equation]")
{
    auto const& eq = lfg::lfgSymbols().equation;

    auto result = eq.parse("NOT ( X = Y )");
    REQUIRE(result.status() == ParseStatus::Ok);
    REQUIRE(result.values.size() == 1);

    auto const& e = result.values.front();
    REQUIRE(e.as<lfg::ConstraintEquation<R>>());
    CHECK(str(e) == "Equals(false, X, Y)");
    CHECK(e.identifiers() == std::set<R>{R::local("X"), R::local("Y")});

    // negating once more restores a positive constraint
    CHECK(str(e.negation()) == "Equals(true, X, Y)");
}

TEST_CASE("grounded constraint", "[EndToEnd][Equation]")
{
    auto const& eq = lfg::lfgSymbols().equation;

    auto result = eq.parse("(%f SUBJ) =c %g");
    REQUIRE(result.values.size() == 1);

    auto const& e = result.values.front();
    CHECK(str(e) == "Equals(true, (%f SUBJ), %g)");
    CHECK(e.identifiers() == std::set<R>{R::local("%f"), R::local("%g")});

    auto g = lfg::ground(e, A("f1"), A("f2"));
    CHECK(str(g) == "Equals(true, (f2/%f SUBJ), f2/%g)");
    CHECK(g.identifiers() == std::set<A>{A("f2/%f"), A("f2/%g")});
}

TEST_CASE("equation surface syntax", "[EndToEnd][Equation]")
{
    auto const& eq = lfg::lfgSymbols().equation;

    auto single = [&](std::string const& text) {
        auto result = eq.parse(text);
        REQUIRE(result.values.size() == 1);
        return str(result.values.front());
    };

    CHECK(single("(^ SUBJ) = !") == "Assignment((^ SUBJ), !)");
    CHECK(single("! IN (^ ADJ)") == "Containment(!, (^ ADJ))");
    CHECK(single("%f INc (^ ADJ)") == "Contains(true, %f, (^ ADJ))");
    CHECK(single("(^ NUM) = sg") == "Assignment((^ NUM), sg)");
    CHECK(single("((^ SUBJ) CASE) =c 'nom'") == "Equals(true, ((^ SUBJ) CASE), 'nom')");
    CHECK(single("(^ TENSE)") == "Exists(true, (^ TENSE))");
    CHECK(single("NOT (^ TENSE)") == "Exists(false, (^ TENSE))");
    CHECK(single("X = Y AND NOT Z") == "Conjunction(Assignment(X, Y), Exists(false, Z))");

    CHECK(eq.parse("X AND Y AND Z").values.size() == 2);
    CHECK(eq.parse("X =").status() == ParseStatus::NoParse);
    CHECK(eq.parse("").status() == ParseStatus::NoParse);
}

TEST_CASE("OR semantics is a named choice", "[EndToEnd][Equation]")
{
    auto const text = "X = Y OR Z = W";

    auto literal = lfg::lfgSymbols().equation.parse(text);
    REQUIRE(literal.values.size() == 1);
    CHECK(str(literal.values.front()) == "Conjunction(Assignment(X, Y), Assignment(Z, W))");

    auto intended = lfg::lfgSymbols(lfg::OrSemantics::Disjunction).equation.parse(text);
    REQUIRE(intended.values.size() == 1);
    CHECK(str(intended.values.front()) == "Disjunction(Assignment(X, Y), Assignment(Z, W))");

    CHECK(lfg::orSemanticsFromString("disjunction") == lfg::OrSemantics::Disjunction);
    CHECK(lfg::orSemanticsFromString("conjunction") == lfg::OrSemantics::Conjunction);
    CHECK_FALSE(lfg::orSemanticsFromString("xor"));

    CHECK(lfg::lfgSymbols().orSemantics() == lfg::OrSemantics::Conjunction);
    CHECK(lfg::lfgSymbols(lfg::OrSemantics::Disjunction).orSemantics() == lfg::OrSemantics::Disjunction);
}

TEST_CASE("parse failures are reported", "[EndToEnd][Diagnostics]")
{
    Diagnostics dgn;
    CHECK_FALSE(report(dgn, ParseStatus::Ok, "X"));
    CHECK(report(dgn, ParseStatus::NoParse, "X ="));
    CHECK(report(dgn, ParseStatus::NoInterpretation, "3"));
    CHECK(dgn.errorCount() == 2);
    CHECK(dgn.fatalCount() == 0);

    CHECK(std::string(to_string(ParseStatus::Ok)) == "ok");
    CHECK(std::string(to_string(ParseStatus::NoParse)) == "no valid parse");
    CHECK(std::string(to_string(ParseStatus::NoInterpretation)) == "no valid interpretation");

    std::ostringstream s;
    dgn.dumpErrors(s);
    CHECK(s.str() == "error: 'X =' no valid parse\nerror: '3' no valid interpretation\n");

    CHECK_THROWS_AS(dgn.die("parse failed"), ConfigurationError);
    CHECK(std::string(dgn.dieReason()) == "parse failed");
}

} // namespace parsable::unittests
