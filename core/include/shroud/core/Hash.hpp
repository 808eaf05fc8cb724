#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "shroud/core/Types.hpp"

namespace shroud {

// FNV-1a 32-bit hash - deterministic, fast, cross-platform stable
static inline uint32_t fnv1a_32(std::string_view s) {
    uint32_t hash = 0x811C9DC5u;  // FNV offset basis
    for (char c : s) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 0x01000193u;  // FNV prime
    }
    return hash;
}

Bytes32 sha256(std::string_view data);

// Strategy ids are usually derived from a human label by the client.
StrategyId strategyIdFromLabel(const std::string& label);

struct PoolKey {
    Asset currency0;
    Asset currency1;
    uint32_t fee = 3000;        // hundredths of a bip
    int32_t tick_spacing = 60;
    std::string hooks;
};

// Currencies are sorted before hashing so both orderings of a pair
// address the same pool.
PoolKey canonicalPoolKey(const PoolKey& key);
PoolId poolIdOf(const PoolKey& key);

// Deterministic 64-bit draw from block entropy, used for the encrypted
// timing offset.
uint64_t blockEntropy(
    uint64_t block_seed,
    BlockNumber block,
    const StrategyId& id
);

}
