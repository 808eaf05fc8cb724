#pragma once

#include <cstdint>
#include <unordered_map>
#include <unordered_set>

#include "shroud/fhe/IFheCoprocessor.hpp"

namespace shroud::fhe {

// In-process stand-in for the encryption coprocessor. Values are held in
// the clear behind opaque handles; only principals on a handle's ACL may
// decrypt it. Used by the tests and the demo driver.
class MockCoprocessor : public IFheCoprocessor {
public:
    // `compute_principal` is the account whose operations the coprocessor
    // serves (the engine); operands must be allowed to it.
    explicit MockCoprocessor(const Principal& compute_principal);

    CtHandle trivialEncrypt(Int128 value, FheType type) override;

    CtHandle binary(
        BinaryOp op,
        const CtHandle& lhs,
        const CtHandle& rhs
    ) override;

    CtHandle logicalNot(const CtHandle& v) override;

    CtHandle select(
        const CtHandle& cond,
        const CtHandle& if_true,
        const CtHandle& if_false
    ) override;

    void allow(const CtHandle& h, const Principal& p) override;
    bool isAllowed(const CtHandle& h, const Principal& p) const override;
    bool exists(const CtHandle& h) const override;

    // Client side: encrypt an input readable by `owner` only.
    CtHandle encrypt(Int128 value, const Principal& owner);
    CtHandle encryptBool(bool value, const Principal& owner);

    // Out-of-band disclosure. Throws FheError when `requester` is not on
    // the handle's ACL.
    Int128 decrypt(const CtHandle& h, const Principal& requester) const;
    bool decryptBool(const CtHandle& h, const Principal& requester) const;

    // Fail every evaluated operation after `n` more have succeeded.
    void failAfter(uint64_t n);
    void clearFailure();

    uint64_t evaluated() const { return eval_count; }
    size_t ciphertextCount() const { return values.size(); }

private:
    struct Entry {
        Int128 value = 0;
        FheType type = FheType::EINT128;
        std::unordered_set<Principal> acl;
    };

    CtHandle store(Int128 value, FheType type);
    const Entry& fetch(const CtHandle& h, FheType expected) const;
    void countOperation();

    Principal compute;
    uint64_t next_id = 1;
    uint64_t eval_count = 0;
    bool failure_armed = false;
    uint64_t fail_budget = 0;
    std::unordered_map<uint64_t, Entry> values;
};

}
