#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <parsable/Diagnostics.hpp>
#include <parsable/Parsable.hpp>
#include <parsable/Utilities.hpp>

#include <parsable/grammar/Derivation.hpp>
#include <parsable/lexer/Tokenizer.hpp>
#include <parsable/lfg/Symbols.hpp>
#include <parsable/parser/ChartParser.hpp>

namespace parsable {

struct Options
{
    lfg::OrSemantics orSemantics = lfg::OrSemantics::Conjunction;
    parser::ParserOptions parser;
};

grammar::Nonterminal<lfg::RelativeEquation> const& equationSymbol(Options const& opts)
{
    return lfg::lfgSymbols(opts.orSemantics).equation;
}

int runScannerDump(std::ostream& out, Options const& opts, std::string const& text)
{
    auto const& d = equationSymbol(opts).derivation();
    for ( auto const& token : d.tokenizer.tokenize(text) ) {
        out << token.location()
            << " [" << lexer::to_string(token.kind()) << "][" << token.lexeme() << "]\n";
    }

    return EXIT_SUCCESS;
}

int runGrammarDump(std::ostream& out, Options const& opts)
{
    auto const& d = equationSymbol(opts).derivation();
    auto const& symbols = lfg::lfgSymbols(opts.orSemantics);
    out << "OR: " << lfg::to_string(symbols.orSemantics()) << '\n';
    out << d.grammar;
    out << "tokens:";
    for ( auto const& t : d.tokens )
        out << ' ' << t;

    out << '\n';
    return EXIT_SUCCESS;
}

std::optional<ParseResult<lfg::RelativeEquation>> parseEquations(std::ostream& out,
                                                                 Options const& opts,
                                                                 std::string const& text)
{
    auto const& eq = equationSymbol(opts);
    auto const& d = eq.derivation();
    parser::ChartParser chart(d.grammar, opts.parser);

    StopWatch sw;
    ParseResult<lfg::RelativeEquation> ret;
    ret.tokens = d.tokenizer.tokenize(text);
    ret.trees = chart.parse(ret.tokens);
    ret.values = eq.reconstructAll(ret.trees);

    auto parseTime = sw.reset();
    out << "parse: " << text
        << "; trees: " << ret.trees.size()
        << "; values: " << ret.values.size()
        << "; status: " << to_string(ret.status())
        << "; time: " << parseTime.count() << '\n';

    Diagnostics dgn;
    if ( report(dgn, ret.status(), text) ) {
        dgn.dumpErrors(out);
        return std::nullopt;
    }

    return ret;
}

int runParse(std::ostream& out, Options const& opts, std::string const& text)
{
    auto result = parseEquations(out, opts, text);
    if ( !result )
        return EXIT_FAILURE;

    for ( auto const& t : result->trees )
        out << "tree: " << *t << '\n';

    for ( auto const& e : result->values )
        out << "equation: " << e << '\n';

    return EXIT_SUCCESS;
}

int runNegate(std::ostream& out, Options const& opts, std::string const& text)
{
    auto result = parseEquations(out, opts, text);
    if ( !result )
        return EXIT_FAILURE;

    for ( auto const& e : result->values )
        out << e.negation() << '\n';

    return EXIT_SUCCESS;
}

int runIdentifiers(std::ostream& out, Options const& opts, std::string const& text)
{
    auto result = parseEquations(out, opts, text);
    if ( !result )
        return EXIT_FAILURE;

    for ( auto const& e : result->values ) {
        out << '{';
        auto first = true;
        for ( auto const& id : e.identifiers() ) {
            out << (first ? "" : ", ") << id;
            first = false;
        }

        out << "}\n";
    }

    return EXIT_SUCCESS;
}

int runGround(std::ostream& out,
              Options const& opts,
              std::string const& up,
              std::string const& down,
              std::string const& text)
{
    auto result = parseEquations(out, opts, text);
    if ( !result )
        return EXIT_FAILURE;

    lfg::AbsoluteIdentifier upId(up);
    lfg::AbsoluteIdentifier downId(down);
    for ( auto const& e : result->values )
        out << lfg::ground(e, upId, downId) << '\n';

    return EXIT_SUCCESS;
}

void printHelp(std::ostream& out, std::string const& arg0)
{
    auto cmd = arg0.substr(arg0.find_last_of("/\\") + 1);

    out << cmd <<
        " COMMAND [OPTIONS] [ARGS]\n"
        "\n"
        "COMMAND:\n"
        "  scan TEXT              Prints the tokens of an equation\n"
        "  parse TEXT             Prints the parse trees and equations\n"
        "  negate TEXT            Prints the negation of each equation\n"
        "  identifiers TEXT       Prints the identifiers of each equation\n"
        "  ground UP DOWN TEXT    Binds relative identifiers to UP and DOWN\n"
        "  grammar                Prints the derived equation grammar\n"
        "\n"
        "OPTIONS:\n"
        "  --or=conjunction|disjunction   Meaning of OR (default: conjunction)\n"
        "  --max-trees=N                  Upper bound on parse trees (default: 256)\n";
}

// Strips recognized options from args; false on a malformed option
bool parseOptions(std::ostream& out, std::vector<std::string>& args, Options& opts)
{
    std::vector<std::string> rest;
    for ( auto const& a : args ) {
        if ( a.rfind("--or=", 0) == 0 ) {
            auto s = lfg::orSemanticsFromString(a.substr(5));
            if ( !s ) {
                out << "Unknown OR semantics: " << a.substr(5) << '\n';
                return false;
            }

            opts.orSemantics = *s;
            continue;
        }

        if ( a.rfind("--max-trees=", 0) == 0 ) {
            auto n = a.substr(12);
            if ( n.empty() || n.find_first_not_of("0123456789") != std::string::npos ) {
                out << "Invalid tree bound: " << n << '\n';
                return false;
            }

            opts.parser.maxTrees = std::stoull(n);
            continue;
        }

        if ( a.rfind("--", 0) == 0 ) {
            out << "Unknown option: " << a << '\n';
            return false;
        }

        rest.push_back(a);
    }

    args.swap(rest);
    return true;
}

} // namespace parsable

int main(int argc, char const* argv[])
{
    using namespace parsable;

    auto& out = std::cout;
    try {
        if ( argc < 2 ) {
            printHelp(out, argv[0]);
            return EXIT_FAILURE;
        }

        std::string command = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        Options opts;
        if ( !parseOptions(out, args, opts) ) {
            printHelp(out, argv[0]);
            return EXIT_FAILURE;
        }

        if ( command == "grammar" ) {
            if ( !args.empty() ) {
                printHelp(out, argv[0]);
                return EXIT_FAILURE;
            }

            return runGrammarDump(out, opts);
        }

        if ( command == "ground" ) {
            if ( args.size() != 3 ) {
                printHelp(out, argv[0]);
                return EXIT_FAILURE;
            }

            return runGround(out, opts, args[0], args[1], args[2]);
        }

        if ( args.size() != 1 ) {
            printHelp(out, argv[0]);
            return EXIT_FAILURE;
        }

        auto const& text = args.front();
        if ( command == "scan" || command == "lex" )
            return runScannerDump(out, opts, text);

        if ( command == "parse" )
            return runParse(out, opts, text);

        if ( command == "negate" )
            return runNegate(out, opts, text);

        if ( command == "identifiers" || command == "ids" )
            return runIdentifiers(out, opts, text);

        out << "Unknown command: " << command << '\n';
        printHelp(out, argv[0]);
    }
    catch (ConfigurationError const& e) {
        out << e.what() << '\n';
    }
    catch (RuntimeException const& e) {
        out << "ICE:" << e.file() << ":" << e.line() << ": " << e.what() << '\n';
    }
    catch (std::exception const& e) {
        out << "ICE: " << e.what() << '\n';
    }

    return EXIT_FAILURE;
}
