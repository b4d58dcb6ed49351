#pragma once

#include <exception>
#include <string>
#include <utility>

namespace parsable {

template <template<typename> class>
struct deducto_syntacto_impl {};

template <typename F>
struct ScopeExit
{
    F f;

    explicit ScopeExit(F&& f)
        : f(std::forward<F>(f))
    {
    }

    ScopeExit(ScopeExit const&) = delete;
    ScopeExit(ScopeExit&&) = default;
    ScopeExit& operator=(ScopeExit&&) = default;

    ~ScopeExit() { f(); }
};

template <typename F>
ScopeExit<F> operator*(deducto_syntacto_impl<ScopeExit>, F&& f)
{
    return ScopeExit<F>(std::forward<F>(f));
}

#define PARSABLE_LABEL_CAT(a,b) a##b
#define PARSABLE_LABEL_SCOPEEXIT(a) PARSABLE_LABEL_CAT(scope_exit_, a)
#define scope_exit [[maybe_unused]] auto PARSABLE_LABEL_SCOPEEXIT(__COUNTER__) = deducto_syntacto_impl<ScopeExit>{} * [&]

class RuntimeException : public std::exception
{
public:
    RuntimeException(const char* file, unsigned line, std::string msg)
        : myFile(file)
        , myMsg(std::move(msg))
        , myLine(line)
    {
    }

    // std::exception
public:
    const char* what() const noexcept override { return myMsg.c_str(); }

public:
    const char* message() const noexcept { return myMsg.c_str(); }
    const char* file() const noexcept { return myFile; }
    unsigned line() const noexcept { return myLine; }

private:
    const char* myFile;
    std::string myMsg;
    unsigned myLine;
};

#define ENFORCE(V, M) enforce(!!(V), M, __FILE__, __LINE__)
#define ENFORCEC(V) enforce(!!(V), #V, __FILE__, __LINE__)
#define ENFORCEU(M) throw RuntimeException(__FILE__, __LINE__, M)

inline void enforce(bool value, std::string msg, const char* file, unsigned line)
{
    if ( !value )
        throw RuntimeException(file, line, std::move(msg));
}

} // namespace parsable
