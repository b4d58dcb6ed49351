#include <parsable/grammar/Production.hpp>

namespace parsable::grammar {

namespace {
    std::vector<u32> serials(Constituents const& c)
    {
        std::vector<u32> ret;
        ret.reserve(c.size());
        for ( auto s : c )
            ret.push_back(s->serial());

        return ret;
    }
}

bool Production::operator < (Production const& rhs) const
{
    if ( head != rhs.head )
        return head->serial() < rhs.head->serial();

    return serials(children) < serials(rhs.children);
}

bool Production::operator == (Production const& rhs) const
{
    return head == rhs.head && children == rhs.children;
}

std::ostream& operator << (std::ostream& sink, Production const& p)
{
    sink << *p.head << " ->";
    for ( auto c : p.children )
        sink << ' ' << *c;

    return sink;
}

} // namespace parsable::grammar
