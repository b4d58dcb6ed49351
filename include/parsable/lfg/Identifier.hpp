#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace parsable::lfg {

/**
 * Address of a node in a functional structure
 */
class AbsoluteIdentifier
{
public:
    explicit AbsoluteIdentifier(std::string address);

public:
    std::string const& address() const;

    bool operator <  (AbsoluteIdentifier const& rhs) const;
    bool operator == (AbsoluteIdentifier const& rhs) const;
    bool operator != (AbsoluteIdentifier const& rhs) const;

private:
    std::string myAddress;
};

/**
 * Identifier relative to the node an equation annotates
 *
 * Up (`^`) names the dominating node, Down (`!`) the node itself, and a
 * local name (`%f` or a capitalized name such as `X`) a node scoped below
 * the node itself.
 */
class RelativeIdentifier
{
public:
    enum class Kind
    {
        Up,
        Down,
        Local,
    };

public:
    static RelativeIdentifier up();
    static RelativeIdentifier down();
    static RelativeIdentifier local(std::string name);

    // std::nullopt unless \p text is `^`, `!`, `%name` or a capitalized name
    static std::optional<RelativeIdentifier> fromString(std::string const& text);

public:
    Kind kind() const;
    std::string const& name() const;

    AbsoluteIdentifier ground(AbsoluteIdentifier const& up,
                              AbsoluteIdentifier const& down) const;

    bool operator <  (RelativeIdentifier const& rhs) const;
    bool operator == (RelativeIdentifier const& rhs) const;
    bool operator != (RelativeIdentifier const& rhs) const;

private:
    RelativeIdentifier(Kind kind, std::string name);

private:
    Kind myKind;
    std::string myName;
};

std::ostream& operator << (std::ostream& sink, AbsoluteIdentifier const& id);
std::ostream& operator << (std::ostream& sink, RelativeIdentifier const& id);

} // namespace parsable::lfg
