#include <parsable/grammar/Categories.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace parsable::grammar {

//
// LexicalCategory

LexicalCategory::LexicalCategory(std::string name, Predicate member)
    : Symbol(SymbolKind::LexicalCategory, std::move(name))
    , myMember(std::move(member))
{
}

LexicalCategory::LexicalCategory(literal_tag, std::string literal)
    : Symbol(SymbolKind::LexicalCategory, '"' + literal + '"')
    , myMember([literal](std::string const& lexeme) { return lexeme == literal; })
    , myLiteral(true)
{
    addToken(std::move(literal));
}

LexicalCategory::~LexicalCategory() = default;

bool LexicalCategory::member(std::string const& lexeme) const
{
    return myMember && myMember(lexeme);
}

bool LexicalCategory::literal() const
{
    return myLiteral;
}

Symbol const& LexicalCategory::symbol() const
{
    return *this;
}

std::optional<std::string> LexicalCategory::reconstruct(parser::ParseTree const& tree) const
{
    if ( tree.kind() != parser::ParseTree::Kind::Terminal || &tree.symbol() != this )
        return std::nullopt;

    if ( !member(tree.lexeme()) )
        return std::nullopt;

    return tree.lexeme();
}

LexicalCategory const& terminal(std::string const& literal)
{
    static std::mutex mutex;
    static std::map<std::string, std::unique_ptr<LexicalCategory>> interned;

    std::lock_guard<std::mutex> lock(mutex);
    auto& ret = interned[literal];
    if ( !ret )
        ret.reset(new LexicalCategory(LexicalCategory::literal_tag{}, literal));

    return *ret;
}

//
// EmptyCategory

EmptyCategory::EmptyCategory()
    : Symbol(SymbolKind::Empty, "<empty>")
{
}

EmptyCategory::~EmptyCategory() = default;

Symbol const& EmptyCategory::symbol() const
{
    return *this;
}

std::optional<std::monostate> EmptyCategory::reconstruct(parser::ParseTree const&) const
{
    return std::nullopt;
}

EmptyCategory const& emptyCategory()
{
    static EmptyCategory const instance;
    return instance;
}

} // namespace parsable::grammar
