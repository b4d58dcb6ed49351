#include <catch2/catch.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include <parsable/Parsable.hpp>
#include <parsable/grammar/Categories.hpp>
#include <parsable/grammar/Nonterminal.hpp>
#include <parsable/parser/ParseTree.hpp>

namespace parsable::unittests {

using namespace grammar;
using parser::ParseTree;

namespace {
    bool isNumber(std::string const& s)
    {
        return !s.empty() && std::all_of(begin(s), end(s), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
    }

    struct Arithmetic
    {
        LexicalCategory num{"Num", isNumber};
        Nonterminal<int> sum{"Sum"};

        Arithmetic()
        {
            sum.rule([](std::string const& l, std::string const&, std::string const& r) {
                         return std::stoi(l) + std::stoi(r);
                     },
                     num, terminal("+"), num);
        }
    };

    Arithmetic const& arithmetic()
    {
        static Arithmetic const ret;
        return ret;
    }
}

TEST_CASE("reconstruction matches the exact production", "[Reconstruct]")
{
    auto const& a = arithmetic();

    auto good = ParseTree::mkNonterminal(a.sum, {
        ParseTree::mkTerminal(a.num, "3"),
        ParseTree::mkTerminal(terminal("+"), "+"),
        ParseTree::mkTerminal(a.num, "4"),
    });
    CHECK(a.sum.reconstruct(*good) == std::optional<int>(7));

    SECTION("unknown constituents")
    {
        auto minus = ParseTree::mkNonterminal(a.sum, {
            ParseTree::mkTerminal(a.num, "3"),
            ParseTree::mkTerminal(terminal("-"), "-"),
            ParseTree::mkTerminal(a.num, "4"),
        });
        CHECK_FALSE(a.sum.reconstruct(*minus));
    }

    SECTION("missing constituent")
    {
        auto shorter = ParseTree::mkNonterminal(a.sum, {
            ParseTree::mkTerminal(a.num, "3"),
            ParseTree::mkTerminal(terminal("+"), "+"),
        });
        CHECK_FALSE(a.sum.reconstruct(*shorter));
    }

    SECTION("other head")
    {
        Nonterminal<int> other("Other");
        auto foreign = ParseTree::mkNonterminal(other, good->children());
        CHECK_FALSE(a.sum.reconstruct(*foreign));
    }

    SECTION("terminal where a nonterminal is declared")
    {
        CHECK_FALSE(a.sum.reconstruct(*ParseTree::mkTerminal(a.num, "7")));
    }
}

TEST_CASE("lexical categories reconstruct member lexemes", "[Reconstruct]")
{
    auto const& a = arithmetic();

    CHECK(a.num.reconstruct(*ParseTree::mkTerminal(a.num, "42")) == std::optional<std::string>("42"));
    CHECK_FALSE(a.num.reconstruct(*ParseTree::mkTerminal(a.num, "x")));
    CHECK_FALSE(a.num.reconstruct(*ParseTree::mkTerminal(terminal("+"), "42")));
    CHECK_FALSE(a.num.reconstruct(*ParseTree::mkEmpty(a.num)));

    CHECK(terminal("+").literal());
    CHECK_FALSE(a.num.literal());
    CHECK(&terminal("+") == &terminal("+"));
    CHECK(terminal("+").name() == "\"+\"");
    CHECK(terminal("+").tokens() == std::set<std::string>{"+"});

    SECTION("a failing child fails the node")
    {
        auto bad = ParseTree::mkNonterminal(a.sum, {
            ParseTree::mkTerminal(a.num, "3"),
            ParseTree::mkTerminal(terminal("+"), "+"),
            ParseTree::mkTerminal(a.num, "four"),
        });
        CHECK_FALSE(a.sum.reconstruct(*bad));
    }
}

TEST_CASE("empty category never reconstructs", "[Reconstruct]")
{
    auto const& e = emptyCategory();
    CHECK(&e == &emptyCategory());
    CHECK(e.kind() == SymbolKind::Empty);
    CHECK_FALSE(e.reconstruct(*ParseTree::mkEmpty(e)));
}

TEST_CASE("constructors may decline", "[Reconstruct]")
{
    LexicalCategory num("Num", isNumber);
    Nonterminal<int> even("Even");
    even.rule([](std::string const& s) -> std::optional<int> {
                  auto n = std::stoi(s);
                  if ( n % 2 )
                      return std::nullopt;

                  return n;
              },
              num);

    auto odd = even.parse("3");
    CHECK(odd.trees.size() == 1);
    CHECK(odd.values.empty());
    CHECK(odd.status() == ParseStatus::NoInterpretation);

    auto four = even.parse("4");
    CHECK(four.values == std::vector<int>{4});
    CHECK(four.status() == ParseStatus::Ok);
}

} // namespace parsable::unittests
