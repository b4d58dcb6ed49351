#include <parsable/lfg/Expression.hpp>

namespace parsable::lfg {

Expression<AbsoluteIdentifier> ground(Expression<RelativeIdentifier> const& e,
                                      AbsoluteIdentifier const& up,
                                      AbsoluteIdentifier const& down)
{
    using Kind = Expression<RelativeIdentifier>::Kind;
    using Grounded = Expression<AbsoluteIdentifier>;

    switch (e.kind()) {
    case Kind::Identifier:  return Grounded::identifier(e.id().ground(up, down));
    case Kind::Application: return Grounded::application(ground(e.base(), up, down), e.text());
    case Kind::Value:       return Grounded::value(e.text());
    }

    ENFORCEU("unknown expression kind");
}

} // namespace parsable::lfg
