#include <parsable/lfg/Identifier.hpp>

#include <cctype>
#include <tuple>

#include <parsable/Utilities.hpp>

namespace parsable::lfg {

namespace {
    bool isNameChar(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    bool isName(std::string const& text, std::string::size_type from)
    {
        if ( text.size() <= from )
            return false;

        for ( auto i = from; i < text.size(); ++i )
            if ( !isNameChar(text[i]) )
                return false;

        return true;
    }
}

//
// AbsoluteIdentifier

AbsoluteIdentifier::AbsoluteIdentifier(std::string address)
    : myAddress(std::move(address))
{
}

std::string const& AbsoluteIdentifier::address() const
{
    return myAddress;
}

bool AbsoluteIdentifier::operator < (AbsoluteIdentifier const& rhs) const
{
    return myAddress < rhs.myAddress;
}

bool AbsoluteIdentifier::operator == (AbsoluteIdentifier const& rhs) const
{
    return myAddress == rhs.myAddress;
}

bool AbsoluteIdentifier::operator != (AbsoluteIdentifier const& rhs) const
{
    return !operator==(rhs);
}

//
// RelativeIdentifier

RelativeIdentifier::RelativeIdentifier(Kind kind, std::string name)
    : myKind(kind)
    , myName(std::move(name))
{
}

RelativeIdentifier RelativeIdentifier::up()
{
    return RelativeIdentifier(Kind::Up, "^");
}

RelativeIdentifier RelativeIdentifier::down()
{
    return RelativeIdentifier(Kind::Down, "!");
}

RelativeIdentifier RelativeIdentifier::local(std::string name)
{
    ENFORCE(!name.empty(), "empty local identifier");
    return RelativeIdentifier(Kind::Local, std::move(name));
}

std::optional<RelativeIdentifier> RelativeIdentifier::fromString(std::string const& text)
{
    if ( text.empty() )
        return std::nullopt;

    if ( text == "^" )
        return up();

    if ( text == "!" )
        return down();

    if ( text.front() == '%' && isName(text, 1) )
        return local(text);

    if ( std::isupper(static_cast<unsigned char>(text.front())) && isName(text, 0) )
        return local(text);

    return std::nullopt;
}

RelativeIdentifier::Kind RelativeIdentifier::kind() const
{
    return myKind;
}

std::string const& RelativeIdentifier::name() const
{
    return myName;
}

AbsoluteIdentifier RelativeIdentifier::ground(AbsoluteIdentifier const& up,
                                              AbsoluteIdentifier const& down) const
{
    switch (myKind) {
    case Kind::Up:   return up;
    case Kind::Down: return down;
    case Kind::Local:
        break;
    }

    // distinct local names ground to distinct addresses
    return AbsoluteIdentifier(down.address() + "/" + myName);
}

bool RelativeIdentifier::operator < (RelativeIdentifier const& rhs) const
{
    return std::tie(myKind, myName) < std::tie(rhs.myKind, rhs.myName);
}

bool RelativeIdentifier::operator == (RelativeIdentifier const& rhs) const
{
    return myKind == rhs.myKind && myName == rhs.myName;
}

bool RelativeIdentifier::operator != (RelativeIdentifier const& rhs) const
{
    return !operator==(rhs);
}

std::ostream& operator << (std::ostream& sink, AbsoluteIdentifier const& id)
{
    return sink << id.address();
}

std::ostream& operator << (std::ostream& sink, RelativeIdentifier const& id)
{
    return sink << id.name();
}

} // namespace parsable::lfg
