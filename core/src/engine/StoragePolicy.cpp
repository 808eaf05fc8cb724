#include "shroud/engine/StoragePolicy.hpp"

namespace shroud {

fhe::AclPolicy storagePolicy(const StateStore& store, const StrategyId& id) {
    fhe::AclPolicy policy;
    policy.self = true;

    const Strategy* s = store.findStrategy(id);
    if (s) {
        policy.add(s->owner);
    }

    ComplianceState c = store.compliance(id);
    if (c.enabled) {
        policy.add(c.reporter);
    }
    return policy;
}

}
