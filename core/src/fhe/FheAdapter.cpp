#include "shroud/fhe/FheAdapter.hpp"

#include <algorithm>

namespace shroud::fhe {

bool AclPolicy::allows(const Principal& p) const {
    return std::find(readers.begin(), readers.end(), p) != readers.end();
}

void AclPolicy::add(const Principal& p) {
    if (p.empty() || allows(p)) return;
    readers.push_back(p);
}

FheAdapter::FheAdapter(
    IFheCoprocessor& coprocessor,
    const Principal& self
) : cop(coprocessor),
    self_principal(self) {}

Sealed FheAdapter::produced(const CtHandle& h) {
    ++op_count;
    cop.allow(h, self_principal);

    Sealed out;
    out.handle = h;
    out.acl.self = true;
    return out;
}

CtHandle FheAdapter::operand(const Sealed& v, FheType type) {
    if (v.valid()) return v.handle;
    return cop.trivialEncrypt(0, type);
}

Sealed FheAdapter::binary(BinaryOp op, const Sealed& a, const Sealed& b) {
    FheType in_type =
        (op == BinaryOp::AND || op == BinaryOp::OR)
            ? FheType::EBOOL
            : FheType::EINT128;

    return produced(cop.binary(op, operand(a, in_type), operand(b, in_type)));
}

Sealed FheAdapter::add(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::ADD, a, b);
}

Sealed FheAdapter::sub(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::SUB, a, b);
}

Sealed FheAdapter::mul(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::MUL, a, b);
}

Sealed FheAdapter::div(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::DIV, a, b);
}

Sealed FheAdapter::gt(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::GT, a, b);
}

Sealed FheAdapter::lt(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::LT, a, b);
}

Sealed FheAdapter::lte(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::LTE, a, b);
}

Sealed FheAdapter::ne(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::NE, a, b);
}

Sealed FheAdapter::land(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::AND, a, b);
}

Sealed FheAdapter::lor(const Sealed& a, const Sealed& b) {
    return binary(BinaryOp::OR, a, b);
}

Sealed FheAdapter::lnot(const Sealed& a) {
    return produced(cop.logicalNot(operand(a, FheType::EBOOL)));
}

Sealed FheAdapter::select(
    const Sealed& cond,
    const Sealed& if_true,
    const Sealed& if_false
) {
    return produced(cop.select(
        operand(cond, FheType::EBOOL),
        operand(if_true, FheType::EINT128),
        operand(if_false, FheType::EINT128)
    ));
}

Sealed FheAdapter::encryptConstant(Int128 value) {
    return produced(cop.trivialEncrypt(value, FheType::EINT128));
}

Sealed FheAdapter::encryptBool(bool value) {
    return produced(cop.trivialEncrypt(value ? 1 : 0, FheType::EBOOL));
}

Sealed FheAdapter::zero() {
    return encryptConstant(0);
}

Sealed FheAdapter::absDiff(const Sealed& a, const Sealed& b) {
    Sealed a_above = gt(a, b);
    return select(a_above, sub(a, b), sub(b, a));
}

void FheAdapter::grant(const CtHandle& h, const Principal& p) {
    if (!h.valid() || p.empty()) return;
    cop.allow(h, p);
}

void FheAdapter::grantSelf(const CtHandle& h) {
    grant(h, self_principal);
}

Sealed FheAdapter::share(Sealed value, const AclPolicy& policy) {
    if (!value.valid()) return value;

    if (policy.self && !value.acl.self) {
        grantSelf(value.handle);
        value.acl.self = true;
    }
    for (const auto& reader : policy.readers) {
        if (value.acl.allows(reader)) continue;
        grant(value.handle, reader);
        value.acl.add(reader);
    }
    return value;
}

bool FheAdapter::verifyInput(
    const CtHandle& h,
    const Principal& caller,
    FheType expected
) const {
    return h.valid() && h.type == expected && cop.exists(h) &&
           cop.isAllowed(h, caller);
}

Sealed FheAdapter::adopt(const CtHandle& h) {
    cop.allow(h, self_principal);

    Sealed out;
    out.handle = h;
    out.acl.self = true;
    return out;
}

}
