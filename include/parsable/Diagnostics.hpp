#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <parsable/Types.hpp>

namespace parsable {

class StopWatch
{
public:
    StopWatch()
        : myStart(std::chrono::system_clock::now())
    {
    }

    std::chrono::duration<double> elapsed()
    {
        return std::chrono::system_clock::now() - myStart;
    }

    std::chrono::duration<double> reset()
    {
        auto now = std::chrono::system_clock::now();
        auto elapsed = now - myStart;
        myStart = now;
        return elapsed;
    }

private:
    std::chrono::system_clock::time_point myStart;
};

#define DEFINE_DIAGNOSTIC_KINDS(X) \
    X(token_empty, "literal token is empty") \
    X(token_whitespace, "literal token contains whitespace") \
    X(token_ambiguous, "literal token occurs inside another literal token") \
    \
    X(grammar_no_productions, "nonterminal declares no productions") \
    \
    X(parse_no_tree, "no valid parse") \
    X(parse_no_interpretation, "no valid interpretation")

enum class diag
{
#define X(a,b) a,
    DEFINE_DIAGNOSTIC_KINDS(X)
#undef X
};

const char* to_string(diag d);

// Configuration problems are fatal before any parse is attempted
bool isFatal(diag d);

class Report
{
public:
    Report(diag code, std::string subject);

    Report(Report& rhs) = delete;
    void operator = (Report&) = delete;

public:
    diag code() const;
    std::string const& subject() const;
    std::vector<std::string> const& sentence() const;

public:
    void append(std::string word);

private:
    diag myCode;
    std::string mySubject;
    std::vector<std::string> mySentence;
};

class ReportProxy;

class Diagnostics
{
public:
    Diagnostics() noexcept;
    ~Diagnostics() noexcept;

public:
    void die(const char* reason = "");

    ReportProxy error(diag code, std::string subject);

    const char* dieReason() const;
    uz errorCount() const;
    uz fatalCount() const;

    void dumpErrors(std::ostream& stream) const;

private:
    const char* myDieReason = nullptr;
    std::vector<std::unique_ptr<Report>> myErrors;
};

class ReportProxy
{
public:
    /*implicit*/ ReportProxy(Report& r)
        : myReport(&r)
    {
    }

public:
    ReportProxy& see(std::string subject);

private:
    Report* myReport = nullptr;
};

class ConfigurationError : public std::exception
{
public:
    ConfigurationError(std::string reason,
                       std::vector<diag> codes,
                       std::string text);

    // std::exception
public:
    const char* what() const noexcept override;

public:
    std::string const& reason() const noexcept;
    std::vector<diag> const& codes() const noexcept;

private:
    std::string myReason;
    std::vector<diag> myCodes;
    std::string myText;
};

namespace ascii {
    void write(std::ostream& sink, Report const& err);
}

} // namespace parsable
