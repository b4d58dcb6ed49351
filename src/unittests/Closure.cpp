#include <catch2/catch.hpp>

#include <sstream>
#include <string>

#include <parsable/grammar/Categories.hpp>
#include <parsable/grammar/Closure.hpp>
#include <parsable/grammar/Grammar.hpp>
#include <parsable/grammar/Nonterminal.hpp>

namespace parsable::unittests {

using namespace grammar;

namespace {
    bool isItem(std::string const& s)
    {
        return s == "i";
    }
}

TEST_CASE("closure of a self-recursive symbol", "[Closure]")
{
    LexicalCategory item("Item", isItem);
    Nonterminal<int> list("List");
    list.rule([](std::string const&) { return 1; }, item)
        .rule([](int n, std::string const&) { return n + 1; }, list, item);

    auto c = closure(list);
    CHECK(c.size() == 1);
    CHECK(c.count(&item) == 1);
    CHECK(c.count(&list) == 0);
}

TEST_CASE("closure of mutually recursive symbols", "[Closure]")
{
    Nonterminal<int> a("A");
    Nonterminal<int> b("B");
    a.rule([](int n, std::string const&) { return n; }, b, terminal("a"));
    b.rule([](int n, std::string const&) { return n; }, a, terminal("b"))
     .rule([](std::string const&) { return 0; }, terminal("c"));

    auto ca = closure(a);
    CHECK(ca == SymbolSet{&b, &terminal("a"), &terminal("b"), &terminal("c")});

    auto cb = closure(b);
    CHECK(cb == SymbolSet{&a, &terminal("a"), &terminal("b"), &terminal("c")});
}

TEST_CASE("closure expands shared symbols once", "[Closure]")
{
    Nonterminal<int> top("Top");
    Nonterminal<int> left("Left");
    Nonterminal<int> right("Right");
    Nonterminal<int> leaf("Leaf");

    top.rule([](int l, int r) { return l + r; }, left, right);
    left.rule([](int n) { return n; }, leaf);
    right.rule([](int n) { return n; }, leaf);
    leaf.rule([](std::string const&) { return 1; }, terminal("x"));

    auto c = closure(top);
    CHECK(c == SymbolSet{&left, &right, &leaf, &terminal("x")});
    CHECK(closure(leaf) == SymbolSet{&terminal("x")});
    CHECK(closure(terminal("x")).empty());

    SECTION("cached per symbol")
    {
        auto const& first = top.closure();
        CHECK(&first == &top.closure());
        CHECK(first == c);
    }

    SECTION("assembled grammar")
    {
        auto g = assemble(top, top.closure());
        CHECK(g.productions().size() == 4);
        CHECK(g.lexicalCategories() == SymbolSet{&terminal("x")});
        CHECK(g.startSymbols() == SymbolSet{&top});
        CHECK(g.productionsFor(left).size() == 1);
        CHECK(g.productionsFor(terminal("x")).empty());
        CHECK(collectTokens(top, top.closure()) == std::set<std::string>{"x"});

        std::ostringstream s;
        s << g.productions()[g.productionsFor(top).front()];
        CHECK(s.str() == "Top -> Left Right");
    }
}

TEST_CASE("productions derive from declared rules only", "[Closure]")
{
    LexicalCategory item("Item", isItem);
    Nonterminal<int> pair("Pair");
    pair.rule([](std::string const&, std::string const&) { return 2; }, item, item)
        .rule([](std::string const&) { return 1; }, item);

    auto p = deriveProductions(pair);
    REQUIRE(p.size() == 2);
    CHECK(p[0] == Production(pair, Constituents{&item, &item}));
    CHECK(p[1] == Production(pair, Constituents{&item}));
    CHECK(deriveProductions(item).empty());
    CHECK(deriveProductions(emptyCategory()).empty());
}

} // namespace parsable::unittests
