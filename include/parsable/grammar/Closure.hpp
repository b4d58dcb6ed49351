#pragma once

#include <parsable/grammar/Symbol.hpp>

namespace parsable::grammar {

/**
 * Every symbol reachable from \p root through declared production
 * constituents, \p root itself excluded
 *
 * The search keeps a prohibited set seeded with \p root. Each layer is the
 * union of the constituents of the previous layer minus everything already
 * prohibited, and is prohibited in turn before the next layer is expanded.
 * A symbol is therefore expanded at most once, however the declarations
 * refer to each other.
 */
SymbolSet closure(Symbol const& root);

} // namespace parsable::grammar
