#include <parsable/Diagnostics.hpp>

#include <sstream>

#include <parsable/Utilities.hpp>

namespace parsable {

const char* to_string(diag d)
{
    static const char* DIAG_STRING[] = {
    #define X(a,b) b,
        DEFINE_DIAGNOSTIC_KINDS(X)
    #undef X
    };

    return DIAG_STRING[unsigned(d)];
}

bool isFatal(diag d)
{
    switch (d) {
    case diag::token_empty:
    case diag::token_whitespace:
    case diag::token_ambiguous:
    case diag::grammar_no_productions:
        return true;

    default:
        return false;
    }
}

//
// Report

Report::Report(diag code, std::string subject)
    : myCode(code)
    , mySubject(std::move(subject))
{
}

diag Report::code() const
{
    return myCode;
}

std::string const& Report::subject() const
{
    return mySubject;
}

std::vector<std::string> const& Report::sentence() const
{
    return mySentence;
}

void Report::append(std::string word)
{
    mySentence.emplace_back(std::move(word));
}

//
// Diagnostics

Diagnostics::Diagnostics() noexcept = default;

Diagnostics::~Diagnostics() noexcept = default;

void Diagnostics::die(const char* reason)
{
    myDieReason = reason;

    std::vector<diag> codes;
    std::ostringstream text;
    text << reason;
    for ( auto const& e : myErrors ) {
        codes.push_back(e->code());
        text << '\n';
        ascii::write(text, *e);
    }

    throw ConfigurationError(reason, std::move(codes), text.str());
}

ReportProxy Diagnostics::error(diag code, std::string subject)
{
    myErrors.emplace_back(std::make_unique<Report>(code, std::move(subject)));
    return { *myErrors.back() };
}

const char* Diagnostics::dieReason() const
{
    return myDieReason;
}

uz Diagnostics::errorCount() const
{
    return myErrors.size();
}

uz Diagnostics::fatalCount() const
{
    uz ret = 0;
    for ( auto const& e : myErrors )
        if ( isFatal(e->code()) )
            ++ret;

    return ret;
}

void Diagnostics::dumpErrors(std::ostream& stream) const
{
    for ( auto const& e : myErrors ) {
        ascii::write(stream, *e);
        stream << '\n';
    }
}

//
// ReportProxy

ReportProxy& ReportProxy::see(std::string subject)
{
    myReport->append(std::move(subject));
    return *this;
}

//
// ConfigurationError

ConfigurationError::ConfigurationError(std::string reason,
                                       std::vector<diag> codes,
                                       std::string text)
    : myReason(std::move(reason))
    , myCodes(std::move(codes))
    , myText(std::move(text))
{
}

const char* ConfigurationError::what() const noexcept
{
    return myText.c_str();
}

std::string const& ConfigurationError::reason() const noexcept
{
    return myReason;
}

std::vector<diag> const& ConfigurationError::codes() const noexcept
{
    return myCodes;
}

    namespace ascii {
        void write(std::ostream& sink, Report const& err)
        {
            sink << "error: ";
            if ( !err.subject().empty() )
                sink << '\'' << err.subject() << "' ";

            sink << to_string(err.code());
            for ( auto const& word : err.sentence() )
                sink << "; see '" << word << '\'';
        }
    }

} // namespace parsable
