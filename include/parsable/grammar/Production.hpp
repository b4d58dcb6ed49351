#pragma once

#include <ostream>
#include <vector>

#include <parsable/grammar/Symbol.hpp>

namespace parsable::grammar {

struct Production
{
    Symbol const* head = nullptr;
    Constituents children;

    Production() = default;
    Production(Symbol const& head, Constituents children)
        : head(&head)
        , children(std::move(children))
    {
    }

    bool operator < (Production const& rhs) const;
    bool operator == (Production const& rhs) const;
    bool operator != (Production const& rhs) const { return !operator==(rhs); }
};

std::ostream& operator << (std::ostream& sink, Production const& p);

} // namespace parsable::grammar
