#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace shroud {

using Bytes32 = std::array<uint8_t, 32>;

using StrategyId = Bytes32;
using PoolId = Bytes32;

// Account-style identifier ("0x..." address) of a caller.
using Principal = std::string;

// Token address.
using Asset = std::string;

using BlockNumber = uint64_t;

// Plaintext domain of the encrypted integers. Signed so that trade
// deltas and realised swap deltas carry their direction.
using Int128 = __int128;

struct CallContext {
    Principal sender;
    BlockNumber block_number = 0;
    uint64_t block_seed = 0;  // prevrandao-style entropy for the block
};

std::string toHex(const Bytes32& b);
Bytes32 fromHex(const std::string& hex);
bool isZero(const Bytes32& b);

std::string int128ToString(Int128 v);

struct Bytes32Hash {
    size_t operator()(const Bytes32& b) const noexcept;
};

}
