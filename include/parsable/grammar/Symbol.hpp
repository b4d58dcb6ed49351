#pragma once

#include <memory>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include <parsable/Types.hpp>

namespace parsable::grammar {

#define SYMBOL_KINDS(X)                                               \
    X(Nonterminal    , "nonterminal"     , NonterminalSymbol)         \
    X(LexicalCategory, "lexical category", LexicalCategory  )         \
    X(Empty          , "empty"           , EmptyCategory    )

enum class SymbolKind
{
#define X(a,b,c) a,
    SYMBOL_KINDS(X)
#undef X
};

const char* to_string(SymbolKind kind);

class Symbol;
class NonterminalSymbol;
class LexicalCategory;
class EmptyCategory;
struct Derivation;

struct SymbolOrder
{
    bool operator()(Symbol const* lhs, Symbol const* rhs) const;
};

using SymbolSet = std::set<Symbol const*, SymbolOrder>;
using Constituents = std::vector<Symbol const*>;

/**
 * Grammar symbol
 *
 * Symbols are declared once, live for the whole process and are compared by
 * identity. Use as<T>() with a type from SYMBOL_KINDS to reach the capability
 * of a given kind.
 *
 * The closure and the derivation of a symbol are computed once on first use
 * and shared read-only afterwards.
 */
class Symbol
{
protected:
    Symbol(SymbolKind kind, std::string name);

public:
    Symbol(Symbol const&) = delete;
    void operator = (Symbol const&) = delete;

    Symbol(Symbol&&) = delete;
    void operator = (Symbol&&) = delete;

    virtual ~Symbol();

public:
    SymbolKind kind() const;
    u32 serial() const;
    std::string const& name() const;

    // Literal strings this symbol adds to the tokenizer
    std::set<std::string> const& tokens() const;

    SymbolSet const& closure() const;
    Derivation const& derivation() const;

    template <typename T> T const* as() const = delete;

protected:
    void addToken(std::string token);

private:
    SymbolKind myKind;
    u32 mySerial = 0;
    std::string myName;
    std::set<std::string> myTokens;

    mutable std::once_flag myClosureFlag;
    mutable SymbolSet myClosure;

    mutable std::once_flag myDerivationFlag;
    mutable std::unique_ptr<Derivation> myDerivation;
};

/**
 * Untyped half of a nonterminal: the declared constituent sequences
 */
class NonterminalSymbol : public Symbol
{
protected:
    explicit NonterminalSymbol(std::string name);

public:
    ~NonterminalSymbol() override;

public:
    std::vector<Constituents> const& rules() const;

protected:
    uz addRule(Constituents constituents);

private:
    std::vector<Constituents> myRules;
};

template<> inline NonterminalSymbol const* Symbol::as<NonterminalSymbol>() const
{
    return myKind == SymbolKind::Nonterminal ? static_cast<NonterminalSymbol const*>(this) : nullptr;
}

// Union of the symbols named in the rules of a nonterminal
SymbolSet constituentsOf(Symbol const& sym);

std::ostream& operator << (std::ostream& sink, Symbol const& sym);

} // namespace parsable::grammar
