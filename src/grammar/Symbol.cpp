#include <parsable/grammar/Symbol.hpp>

#include <atomic>

#include <parsable/grammar/Closure.hpp>
#include <parsable/grammar/Derivation.hpp>

namespace parsable::grammar {

namespace {
    u32 nextSerial()
    {
        static std::atomic<u32> counter{0};
        return ++counter;
    }
}

const char* to_string(SymbolKind kind)
{
    static const char* SYMBOL_KIND_STRING[] = {
    #define X(a,b,c) b,
        SYMBOL_KINDS(X)
    #undef X
    };

    return SYMBOL_KIND_STRING[static_cast<unsigned>(kind)];
}

bool SymbolOrder::operator()(Symbol const* lhs, Symbol const* rhs) const
{
    return lhs->serial() < rhs->serial();
}

//
// Symbol

Symbol::Symbol(SymbolKind kind, std::string name)
    : myKind(kind)
    , mySerial(nextSerial())
    , myName(std::move(name))
{
}

Symbol::~Symbol() = default;

SymbolKind Symbol::kind() const
{
    return myKind;
}

u32 Symbol::serial() const
{
    return mySerial;
}

std::string const& Symbol::name() const
{
    return myName;
}

std::set<std::string> const& Symbol::tokens() const
{
    return myTokens;
}

SymbolSet const& Symbol::closure() const
{
    std::call_once(myClosureFlag, [this] {
        myClosure = grammar::closure(*this);
    });

    return myClosure;
}

Derivation const& Symbol::derivation() const
{
    std::call_once(myDerivationFlag, [this] {
        myDerivation = std::make_unique<Derivation>(*this);
    });

    return *myDerivation;
}

void Symbol::addToken(std::string token)
{
    myTokens.insert(std::move(token));
}

//
// NonterminalSymbol

NonterminalSymbol::NonterminalSymbol(std::string name)
    : Symbol(SymbolKind::Nonterminal, std::move(name))
{
}

NonterminalSymbol::~NonterminalSymbol() = default;

std::vector<Constituents> const& NonterminalSymbol::rules() const
{
    return myRules;
}

uz NonterminalSymbol::addRule(Constituents constituents)
{
    myRules.emplace_back(std::move(constituents));
    return myRules.size() - 1;
}

SymbolSet constituentsOf(Symbol const& sym)
{
    SymbolSet ret;
    if ( auto nt = sym.as<NonterminalSymbol>() )
        for ( auto const& r : nt->rules() )
            ret.insert(begin(r), end(r));

    return ret;
}

std::ostream& operator << (std::ostream& sink, Symbol const& sym)
{
    return sink << sym.name();
}

} // namespace parsable::grammar
