#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include <parsable/Diagnostics.hpp>
#include <parsable/lexer/Tokenizer.hpp>

namespace parsable::unittests {

using lexer::TokenKind;
using lexer::Tokenizer;

namespace {
    std::vector<std::string> lexemes(std::vector<lexer::Token> const& tokens)
    {
        std::vector<std::string> ret;
        for ( auto const& t : tokens )
            ret.push_back(t.lexeme());

        return ret;
    }

    std::vector<diag> rejectedCodes(std::set<std::string> literals)
    {
        try {
            Tokenizer t(std::move(literals));
        }
        catch (ConfigurationError const& e) {
            return e.codes();
        }

        return {};
    }
}

TEST_CASE("tokenizer splits on whitespace", "[Tokenizer]")
{
    Tokenizer t({"+"});
    auto tokens = t.tokenize("3 + 4");

    REQUIRE(tokens.size() == 3);
    CHECK(lexemes(tokens) == std::vector<std::string>{"3", "+", "4"});
    CHECK(tokens[0].kind() == TokenKind::Word);
    CHECK(tokens[1].kind() == TokenKind::Literal);
    CHECK(tokens[2].kind() == TokenKind::Word);
    CHECK(tokens[2].line() == 1);
    CHECK(tokens[2].column() == 5);
}

TEST_CASE("tokenizer splits literals out of chunks", "[Tokenizer]")
{
    Tokenizer t({"+", "(", ")"});
    CHECK(lexemes(t.tokenize("3+4")) == std::vector<std::string>{"3", "+", "4"});
    CHECK(lexemes(t.tokenize("(%f SUBJ)")) == std::vector<std::string>{"(", "%f", "SUBJ", ")"});
    CHECK(t.tokenize("").empty());
    CHECK(t.tokenize(" \t\n ").empty());
}

TEST_CASE("tokenizer takes the longest literal", "[Tokenizer]")
{
    Tokenizer t({"=", "=c", "IN", "INc"});

    CHECK(lexemes(t.tokenize("X =c Y")) == std::vector<std::string>{"X", "=c", "Y"});
    CHECK(lexemes(t.tokenize("X=Y")) == std::vector<std::string>{"X", "=", "Y"});
    CHECK(lexemes(t.tokenize("%f INc %g")) == std::vector<std::string>{"%f", "INc", "%g"});
    CHECK(lexemes(t.tokenize("%f IN %g")) == std::vector<std::string>{"%f", "IN", "%g"});
}

TEST_CASE("tokenizer respects word boundaries", "[Tokenizer]")
{
    Tokenizer t({"IN", "NOT"});

    auto tokens = t.tokenize("INSIDE NOTE IN");
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0].lexeme() == "INSIDE");
    CHECK(tokens[0].kind() == TokenKind::Word);
    CHECK(tokens[1].lexeme() == "NOTE");
    CHECK(tokens[2].kind() == TokenKind::Literal);
}

TEST_CASE("tokenizer tracks lines", "[Tokenizer]")
{
    Tokenizer t({"AND"});

    auto tokens = t.tokenize("X\n  AND Y");
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[1].line() == 2);
    CHECK(tokens[1].column() == 3);
    CHECK(tokens[2].line() == 2);
    CHECK(tokens[2].column() == 7);

    std::ostringstream s;
    s << tokens[2].location();
    CHECK(s.str() == "2:7");
}

TEST_CASE("literal token sets are checked", "[Tokenizer][Diagnostics]")
{
    CHECK(rejectedCodes({"=", "=c"}).empty());
    CHECK(rejectedCodes({""}) == std::vector<diag>{diag::token_empty});
    CHECK(rejectedCodes({"a b"}) == std::vector<diag>{diag::token_whitespace});
    CHECK(rejectedCodes({"<=", "="}) == std::vector<diag>{diag::token_ambiguous});

    Diagnostics dgn;
    CHECK_FALSE(lexer::checkLiterals({"ab", "b", "xby"}, dgn));
    CHECK(dgn.errorCount() == 2);
    CHECK(dgn.fatalCount() == 2);
}

} // namespace parsable::unittests
