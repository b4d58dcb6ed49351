#include <parsable/Parsable.hpp>

#include <parsable/Diagnostics.hpp>

namespace parsable {

const char* to_string(ParseStatus status)
{
    #define X(a,b) b,
    static const char* statusStringTable[] =
    {
    PARSE_STATUS_KINDS(X)
    };
    #undef X

    return statusStringTable[static_cast<int>(status)];
}

bool report(Diagnostics& dgn, ParseStatus status, std::string const& input)
{
    switch (status) {
    case ParseStatus::NoParse:
        dgn.error(diag::parse_no_tree, input);
        return true;

    case ParseStatus::NoInterpretation:
        dgn.error(diag::parse_no_interpretation, input);
        return true;

    case ParseStatus::Ok:
        break;
    }

    return false;
}

} // namespace parsable
