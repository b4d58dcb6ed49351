#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <parsable/Parsable.hpp>
#include <parsable/Utilities.hpp>
#include <parsable/grammar/Production.hpp>
#include <parsable/grammar/Symbol.hpp>
#include <parsable/parser/ParseTree.hpp>

namespace parsable::grammar {

/**
 * Nonterminal carrying typed productions
 *
 * Each rule() pairs a sequence of typed constituents with a constructor
 * taking their values. Reconstruction looks up the rule whose
 * (head, constituents) key equals the production of the tree node,
 * reconstructs the children through the declared constituents and hands
 * their values to the constructor. Any failure along the way, including a
 * constructor returning std::nullopt, makes the whole tree uninterpretable.
 *
 * Rules must all be declared before the symbol is first parsed.
 */
template <typename A>
class Nonterminal : public NonterminalSymbol, public Parsable<A>
{
public:
    using Children = std::vector<parser::ParseTreePtr>;
    using Constructor = std::function<std::optional<A>(Children const&)>;

public:
    explicit Nonterminal(std::string name)
        : NonterminalSymbol(std::move(name))
    {
    }

    ~Nonterminal() override = default;

public:
    template <typename F, typename... B>
    Nonterminal& rule(F f, Parsable<B> const&... parts)
    {
        ENFORCE(sizeof...(B) > 0, "production of " + name() + " has no constituents");

        Production key(*this, Constituents{ &parts.symbol()... });
        ENFORCE(myIndex.find(key) == end(myIndex), "production declared twice: " + name());

        auto index = addRule(key.children);
        myIndex.emplace(std::move(key), index);
        myConstructors.emplace_back(
            [f = std::move(f), typed = std::make_tuple(&parts...)](Children const& children) -> std::optional<A> {
                return construct(f, typed, children, std::index_sequence_for<B...>());
            });

        return *this;
    }

    // Parsable
public:
    Symbol const& symbol() const override
    {
        return *this;
    }

    std::optional<A> reconstruct(parser::ParseTree const& tree) const override
    {
        if ( tree.kind() != parser::ParseTree::Kind::Nonterminal || &tree.symbol() != this )
            return std::nullopt;

        auto e = myIndex.find(tree.production());
        if ( e == end(myIndex) )
            return std::nullopt;

        return myConstructors[e->second](tree.children());
    }

private:
    template <typename F, typename Typed, uz... I>
    static std::optional<A> construct(F const& f,
                                      Typed const& typed,
                                      Children const& children,
                                      std::index_sequence<I...>)
    {
        if ( children.size() != sizeof...(I) )
            return std::nullopt;

        auto values = std::make_tuple(std::get<I>(typed)->reconstruct(*children[I])...);
        if ( !(static_cast<bool>(std::get<I>(values)) && ...) )
            return std::nullopt;

        return std::optional<A>(f(std::move(*std::get<I>(values))...));
    }

private:
    std::map<Production, uz> myIndex;
    std::vector<Constructor> myConstructors;
};

} // namespace parsable::grammar
