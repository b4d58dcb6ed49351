#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include <parsable/Parsable.hpp>
#include <parsable/grammar/Symbol.hpp>

namespace parsable::grammar {

/**
 * Terminal symbol matching whole tokens through a membership predicate
 *
 * Reconstruction yields the lexeme of a terminal node carrying this very
 * symbol, provided the lexeme is still a member.
 */
class LexicalCategory : public Symbol, public Parsable<std::string>
{
public:
    using Predicate = std::function<bool(std::string const&)>;

public:
    LexicalCategory(std::string name, Predicate member);
    ~LexicalCategory() override;

protected:
    struct literal_tag {};
    LexicalCategory(literal_tag, std::string literal);

public:
    bool member(std::string const& lexeme) const;

    // Whether this category matches exactly one literal token
    bool literal() const;

    // Parsable
public:
    Symbol const& symbol() const override;
    std::optional<std::string> reconstruct(parser::ParseTree const& tree) const override;

private:
    Predicate myMember;
    bool myLiteral = false;

    friend LexicalCategory const& terminal(std::string const& literal);
};

/**
 * Category of exactly one literal string
 *
 * The same literal always returns the same symbol. The literal is
 * contributed to the tokenizer of every grammar that mentions it.
 */
LexicalCategory const& terminal(std::string const& literal);

/**
 * Symbol that never matches anything
 */
class EmptyCategory : public Symbol, public Parsable<std::monostate>
{
public:
    EmptyCategory();
    ~EmptyCategory() override;

    // Parsable
public:
    Symbol const& symbol() const override;
    std::optional<std::monostate> reconstruct(parser::ParseTree const& tree) const override;
};

EmptyCategory const& emptyCategory();

template<> inline LexicalCategory const* Symbol::as<LexicalCategory>() const
{
    return myKind == SymbolKind::LexicalCategory ? static_cast<LexicalCategory const*>(this) : nullptr;
}

template<> inline EmptyCategory const* Symbol::as<EmptyCategory>() const
{
    return myKind == SymbolKind::Empty ? static_cast<EmptyCategory const*>(this) : nullptr;
}

} // namespace parsable::grammar
