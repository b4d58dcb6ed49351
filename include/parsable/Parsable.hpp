#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parsable/grammar/Derivation.hpp>
#include <parsable/grammar/Symbol.hpp>
#include <parsable/lexer/Token.hpp>
#include <parsable/parser/ParseTree.hpp>

namespace parsable {

class Diagnostics;

#define PARSE_STATUS_KINDS(X) \
    X(Ok              , "ok"                       ) \
    X(NoParse         , "no valid parse"           ) \
    X(NoInterpretation, "no valid interpretation"  )

enum class ParseStatus
{
#define X(a,b) a,
    PARSE_STATUS_KINDS(X)
#undef X
};

const char* to_string(ParseStatus status);

template <typename A>
struct ParseResult
{
    std::vector<lexer::Token> tokens;
    std::vector<parser::ParseTreePtr> trees;
    std::vector<A> values;

    ParseStatus status() const
    {
        if ( trees.empty() )
            return ParseStatus::NoParse;

        if ( values.empty() )
            return ParseStatus::NoInterpretation;

        return ParseStatus::Ok;
    }
};

// Adds a report for anything but ParseStatus::Ok; returns whether it did
bool report(Diagnostics& dgn, ParseStatus status, std::string const& input);

/**
 * Typed view of a grammar symbol
 *
 * reconstruct() turns a parse tree rooted at symbol() back into a value. A
 * tree that does not correspond to a well-formed value yields std::nullopt;
 * mismatches are expected outcomes and never throw.
 */
template <typename A>
class Parsable
{
public:
    using value_type = A;

public:
    virtual ~Parsable() = default;

public:
    virtual grammar::Symbol const& symbol() const = 0;
    virtual std::optional<A> reconstruct(parser::ParseTree const& tree) const = 0;

public:
    std::vector<A> reconstructAll(std::vector<parser::ParseTreePtr> const& trees) const
    {
        std::vector<A> ret;
        for ( auto const& t : trees ) {
            if ( auto v = reconstruct(*t) )
                ret.emplace_back(std::move(*v));
        }

        return ret;
    }

    ParseResult<A> parse(std::string_view input) const
    {
        auto const& d = symbol().derivation();

        ParseResult<A> ret;
        ret.tokens = d.tokenizer.tokenize(input);
        ret.trees = d.parser.parse(ret.tokens);
        ret.values = reconstructAll(ret.trees);
        return ret;
    }
};

} // namespace parsable
