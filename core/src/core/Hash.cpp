#include "shroud/core/Hash.hpp"

#include <openssl/evp.h>

#include <cstring>
#include <utility>
#include <stdexcept>

namespace shroud {

Bytes32 sha256(std::string_view data) {
    Bytes32 digest{};
    unsigned int digest_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    bool ok =
        EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
        EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
        EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) == 1;

    EVP_MD_CTX_free(ctx);

    if (!ok || digest_len != digest.size()) {
        throw std::runtime_error("sha256 digest failed");
    }
    return digest;
}

StrategyId strategyIdFromLabel(const std::string& label) {
    return sha256("shroud.strategy:" + label);
}

static std::string lower(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (c >= 'A' && c <= 'F') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

PoolKey canonicalPoolKey(const PoolKey& key) {
    PoolKey k = key;
    k.currency0 = lower(key.currency0);
    k.currency1 = lower(key.currency1);
    k.hooks = lower(key.hooks);
    if (k.currency1 < k.currency0) {
        std::swap(k.currency0, k.currency1);
    }
    return k;
}

PoolId poolIdOf(const PoolKey& key) {
    PoolKey k = canonicalPoolKey(key);

    std::string encoded;
    encoded.reserve(k.currency0.size() + k.currency1.size() + k.hooks.size() + 16);
    encoded += k.currency0;
    encoded += '|';
    encoded += k.currency1;
    encoded += '|';
    encoded += std::to_string(k.fee);
    encoded += '|';
    encoded += std::to_string(k.tick_spacing);
    encoded += '|';
    encoded += k.hooks;

    return sha256(encoded);
}

uint64_t blockEntropy(
    uint64_t block_seed,
    BlockNumber block,
    const StrategyId& id
) {
    std::string buf(16 + id.size(), '\0');
    std::memcpy(&buf[0], &block_seed, sizeof(block_seed));
    std::memcpy(&buf[8], &block, sizeof(block));
    std::memcpy(&buf[16], id.data(), id.size());

    Bytes32 h = sha256(buf);
    uint64_t out = 0;
    for (int i = 0; i < 8; ++i) {
        out = (out << 8) | h[i];
    }
    return out;
}

}
