#include <catch2/catch.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <variant>

#include <parsable/Diagnostics.hpp>
#include <parsable/Utilities.hpp>
#include <parsable/grammar/Categories.hpp>
#include <parsable/grammar/Nonterminal.hpp>
#include <parsable/parser/ChartParser.hpp>

namespace parsable::unittests {

using namespace grammar;

namespace {
    bool isNumber(std::string const& s)
    {
        return !s.empty() && std::all_of(begin(s), end(s), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
    }

    int toInt(std::string const& s)
    {
        return std::stoi(s);
    }

    int add(int l, std::string const&, int r)
    {
        return l + r;
    }

    std::vector<diag> configurationCodes(Symbol const& root)
    {
        try {
            root.derivation();
        }
        catch (ConfigurationError const& e) {
            return e.codes();
        }

        return {};
    }
}

TEST_CASE("chart parser recognizes", "[ChartParser]")
{
    LexicalCategory num("Num", isNumber);
    Nonterminal<int> sum("Sum");
    sum.rule([](std::string const& l, std::string const&, std::string const& r) {
                 return toInt(l) + toInt(r);
             },
             num, terminal("+"), num);

    auto const& d = sum.derivation();
    CHECK(d.parser.recognize(d.tokenizer.tokenize("3 + 4")));
    CHECK_FALSE(d.parser.recognize(d.tokenizer.tokenize("3 +")));
    CHECK_FALSE(d.parser.recognize(d.tokenizer.tokenize("3 + x")));
    CHECK_FALSE(d.parser.recognize(d.tokenizer.tokenize("")));
    CHECK(d.parser.parse(d.tokenizer.tokenize("3 4")).empty());
}

TEST_CASE("chart parser returns every tree", "[ChartParser]")
{
    LexicalCategory num("Num", isNumber);
    Nonterminal<int> expr("Expr");
    expr.rule(toInt, num)
        .rule(add, expr, terminal("+"), expr);

    auto const& d = expr.derivation();

    auto trees = d.parser.parse(d.tokenizer.tokenize("1 + 2 + 3"));
    CHECK(trees.size() == 2);
    CHECK(expr.reconstructAll(trees) == std::vector<int>{6, 6});

    CHECK(d.parser.parse(d.tokenizer.tokenize("1 + 2 + 3 + 4")).size() == 5);
    CHECK(d.parser.parse(d.tokenizer.tokenize("1")).size() == 1);

    SECTION("bounded")
    {
        parser::ParserOptions options;
        options.maxTrees = 1;
        parser::ChartParser bounded(d.grammar, options);
        CHECK(bounded.parse(d.tokenizer.tokenize("1 + 2 + 3 + 4")).size() == 1);
    }
}

TEST_CASE("chart parser cuts unary cycles", "[ChartParser]")
{
    LexicalCategory num("Num", isNumber);
    Nonterminal<int> a("A");
    Nonterminal<int> b("B");
    a.rule([](int n) { return n; }, b)
     .rule(toInt, num);
    b.rule([](int n) { return n; }, a);

    auto result = a.parse("7");
    REQUIRE(result.trees.size() == 1);
    CHECK(result.values == std::vector<int>{7});

    std::ostringstream s;
    s << *result.trees.front();
    CHECK(s.str() == "A(Num(\"7\"))");
}

TEST_CASE("empty category never matches", "[ChartParser]")
{
    LexicalCategory num("Num", isNumber);
    Nonterminal<int> never("Never");
    never.rule([](std::monostate, std::string const& s) { return toInt(s); }, emptyCategory(), num);

    auto result = never.parse("1");
    CHECK(result.trees.empty());
    CHECK(result.status() == ParseStatus::NoParse);
}

TEST_CASE("malformed declarations are rejected", "[ChartParser][Diagnostics]")
{
    LexicalCategory num("Num", isNumber);

    SECTION("duplicate rule")
    {
        Nonterminal<int> dup("Dup");
        dup.rule(toInt, num);
        CHECK_THROWS_AS(dup.rule(toInt, num), RuntimeException);
        CHECK(dup.rules().size() == 1);
    }

    SECTION("rule without constituents")
    {
        Nonterminal<int> none("None");
        CHECK_THROWS_AS(none.rule([] { return 0; }), RuntimeException);
    }

    SECTION("nonterminal without productions")
    {
        Nonterminal<int> top("Top");
        Nonterminal<int> hole("Hole");
        top.rule([](int n) { return n; }, hole);

        CHECK(configurationCodes(top) == std::vector<diag>{diag::grammar_no_productions});
        CHECK_THROWS_AS(top.parse("1"), ConfigurationError);

        Nonterminal<int> lonely("Lonely");
        CHECK(configurationCodes(lonely) == std::vector<diag>{diag::grammar_no_productions});
    }

    SECTION("ambiguous literal tokens")
    {
        Nonterminal<bool> cmp("Cmp");
        cmp.rule([](std::string const& l, std::string const&, std::string const& r) {
                     return toInt(l) <= toInt(r);
                 },
                 num, terminal("<="), num)
           .rule([](std::string const& l, std::string const&, std::string const& r) {
                     return toInt(l) == toInt(r);
                 },
                 num, terminal("="), num);

        CHECK(configurationCodes(cmp) == std::vector<diag>{diag::token_ambiguous});
    }
}

} // namespace parsable::unittests
