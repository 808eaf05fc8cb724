#pragma once

#include <functional>

#include "shroud/fhe/Ciphertext.hpp"

namespace shroud::fhe {

enum class BinaryOp : uint8_t {
    ADD,
    SUB,
    MUL,
    DIV,
    GT,
    LT,
    LTE,
    NE,
    AND,
    OR
};

inline const char* binaryOpToString(BinaryOp op) {
    switch (op) {
        case BinaryOp::ADD: return "add";
        case BinaryOp::SUB: return "sub";
        case BinaryOp::MUL: return "mul";
        case BinaryOp::DIV: return "div";
        case BinaryOp::GT:  return "gt";
        case BinaryOp::LT:  return "lt";
        case BinaryOp::LTE: return "lte";
        case BinaryOp::NE:  return "ne";
        case BinaryOp::AND: return "and";
        case BinaryOp::OR:  return "or";
        default:            return "unknown";
    }
}

// Boundary to the encrypted-arithmetic service. Calls are synchronous;
// failures surface as FheError. Implementations never hand plaintext
// back through this interface.
class IFheCoprocessor {
public:
    virtual ~IFheCoprocessor() = default;

    virtual CtHandle trivialEncrypt(Int128 value, FheType type) = 0;

    virtual CtHandle binary(
        BinaryOp op,
        const CtHandle& lhs,
        const CtHandle& rhs
    ) = 0;

    virtual CtHandle logicalNot(const CtHandle& v) = 0;

    virtual CtHandle select(
        const CtHandle& cond,
        const CtHandle& if_true,
        const CtHandle& if_false
    ) = 0;

    virtual void allow(const CtHandle& h, const Principal& p) = 0;
    virtual bool isAllowed(const CtHandle& h, const Principal& p) const = 0;
    // True when the handle names a live ciphertext of its declared type.
    virtual bool exists(const CtHandle& h) const = 0;

    // Fired after every evaluated operation. Lets a host observe (or, in
    // tests, re-enter the engine from) coprocessor traffic.
    std::function<void(BinaryOp)> on_operation;
};

}
