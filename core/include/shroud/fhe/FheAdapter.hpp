#pragma once

#include <cstdint>

#include "shroud/fhe/IFheCoprocessor.hpp"

namespace shroud::fhe {

// Thin layer over the coprocessor. Every result is granted to the engine
// principal and returned as a Sealed value; persisting code widens the
// policy with share().
class FheAdapter {
public:
    FheAdapter(
        IFheCoprocessor& coprocessor,
        const Principal& self
    );

    Sealed add(const Sealed& a, const Sealed& b);
    Sealed sub(const Sealed& a, const Sealed& b);
    Sealed mul(const Sealed& a, const Sealed& b);
    Sealed div(const Sealed& a, const Sealed& b);

    Sealed gt(const Sealed& a, const Sealed& b);
    Sealed lt(const Sealed& a, const Sealed& b);
    Sealed lte(const Sealed& a, const Sealed& b);
    Sealed ne(const Sealed& a, const Sealed& b);

    Sealed land(const Sealed& a, const Sealed& b);
    Sealed lor(const Sealed& a, const Sealed& b);
    Sealed lnot(const Sealed& a);

    Sealed select(
        const Sealed& cond,
        const Sealed& if_true,
        const Sealed& if_false
    );

    Sealed encryptConstant(Int128 value);
    Sealed encryptBool(bool value);
    Sealed zero();

    // |a - b| without leaving the encrypted domain.
    Sealed absDiff(const Sealed& a, const Sealed& b);

    void grant(const CtHandle& h, const Principal& p);
    void grantSelf(const CtHandle& h);

    // Grants every reader in `policy` and records them on the value.
    Sealed share(Sealed value, const AclPolicy& policy);

    // Accepts a caller-supplied ciphertext: it must exist with the expected
    // type and be readable by the caller. The engine takes its own compute
    // right on it.
    bool verifyInput(
        const CtHandle& h,
        const Principal& caller,
        FheType expected = FheType::EINT128
    ) const;
    Sealed adopt(const CtHandle& h);

    const Principal& self() const { return self_principal; }
    uint64_t operations() const { return op_count; }

private:
    Sealed binary(BinaryOp op, const Sealed& a, const Sealed& b);
    Sealed produced(const CtHandle& h);
    CtHandle operand(const Sealed& v, FheType type);

    IFheCoprocessor& cop;
    Principal self_principal;
    uint64_t op_count = 0;
};

}
