#pragma once

#include "shroud/fhe/Ciphertext.hpp"
#include "shroud/state/StateStore.hpp"

namespace shroud {

// Access every persisted ciphertext of a strategy is released under:
// the engine, the owner and, once enabled, the compliance reporter.
fhe::AclPolicy storagePolicy(const StateStore& store, const StrategyId& id);

}
