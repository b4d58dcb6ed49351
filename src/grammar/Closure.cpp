#include <parsable/grammar/Closure.hpp>

namespace parsable::grammar {

namespace {
    SymbolSet expand(SymbolSet const& layer, SymbolSet const& prohibited)
    {
        SymbolSet ret;
        for ( auto s : layer )
            for ( auto c : constituentsOf(*s) )
                if ( !prohibited.count(c) )
                    ret.insert(c);

        return ret;
    }
}

SymbolSet closure(Symbol const& root)
{
    SymbolSet prohibited{&root};
    SymbolSet ret;

    auto layer = expand(prohibited, prohibited);
    while ( !layer.empty() ) {
        prohibited.insert(begin(layer), end(layer));
        ret.insert(begin(layer), end(layer));
        layer = expand(layer, prohibited);
    }

    return ret;
}

} // namespace parsable::grammar
