#include "shroud/fhe/MockCoprocessor.hpp"

#include <string>

namespace shroud::fhe {

using U128 = unsigned __int128;

static Int128 wrapAdd(Int128 a, Int128 b) {
    return static_cast<Int128>(static_cast<U128>(a) + static_cast<U128>(b));
}

static Int128 wrapSub(Int128 a, Int128 b) {
    return static_cast<Int128>(static_cast<U128>(a) - static_cast<U128>(b));
}

static Int128 wrapMul(Int128 a, Int128 b) {
    return static_cast<Int128>(static_cast<U128>(a) * static_cast<U128>(b));
}

// Truncating division; the one overflowing quotient (MIN / -1) wraps.
static Int128 wrapDiv(Int128 a, Int128 b) {
    if (b == -1) return wrapSub(0, a);
    return a / b;
}

MockCoprocessor::MockCoprocessor(
    const Principal& compute_principal
) : compute(compute_principal) {}

CtHandle MockCoprocessor::store(Int128 value, FheType type) {
    CtHandle h;
    h.id = next_id++;
    h.type = type;

    Entry e;
    e.value = (type == FheType::EBOOL) ? (value != 0 ? 1 : 0) : value;
    e.type = type;
    e.acl.insert(compute);  // transient right of the requesting account
    values.emplace(h.id, std::move(e));
    return h;
}

const MockCoprocessor::Entry& MockCoprocessor::fetch(
    const CtHandle& h,
    FheType expected
) const {
    auto it = values.find(h.id);
    if (it == values.end()) {
        throw FheError("unknown ciphertext handle " + std::to_string(h.id));
    }
    if (it->second.type != expected) {
        throw FheError(
            std::string("type mismatch: expected ") +
            fheTypeToString(expected) + ", got " +
            fheTypeToString(it->second.type));
    }
    if (!it->second.acl.count(compute)) {
        throw FheError(
            "ACL: " + compute + " may not use handle " +
            std::to_string(h.id));
    }
    return it->second;
}

void MockCoprocessor::countOperation() {
    if (failure_armed) {
        if (fail_budget == 0) {
            throw FheError("coprocessor unavailable");
        }
        --fail_budget;
    }
    ++eval_count;
}

CtHandle MockCoprocessor::trivialEncrypt(Int128 value, FheType type) {
    countOperation();
    return store(value, type);
}

CtHandle MockCoprocessor::binary(
    BinaryOp op,
    const CtHandle& lhs,
    const CtHandle& rhs
) {
    countOperation();

    bool logical = (op == BinaryOp::AND || op == BinaryOp::OR);
    FheType in_type = logical ? FheType::EBOOL : FheType::EINT128;

    Int128 a = fetch(lhs, in_type).value;
    Int128 b = fetch(rhs, in_type).value;

    CtHandle out;
    switch (op) {
        case BinaryOp::ADD: out = store(wrapAdd(a, b), FheType::EINT128); break;
        case BinaryOp::SUB: out = store(wrapSub(a, b), FheType::EINT128); break;
        case BinaryOp::MUL: out = store(wrapMul(a, b), FheType::EINT128); break;
        case BinaryOp::DIV:
            if (b == 0) {
                throw FheError("division by encrypted zero");
            }
            out = store(wrapDiv(a, b), FheType::EINT128);
            break;
        case BinaryOp::GT:  out = store(a > b, FheType::EBOOL); break;
        case BinaryOp::LT:  out = store(a < b, FheType::EBOOL); break;
        case BinaryOp::LTE: out = store(a <= b, FheType::EBOOL); break;
        case BinaryOp::NE:  out = store(a != b, FheType::EBOOL); break;
        case BinaryOp::AND: out = store(a && b, FheType::EBOOL); break;
        case BinaryOp::OR:  out = store(a || b, FheType::EBOOL); break;
        default:
            throw FheError("unsupported operation");
    }

    if (on_operation) {
        on_operation(op);
    }
    return out;
}

CtHandle MockCoprocessor::logicalNot(const CtHandle& v) {
    countOperation();
    return store(fetch(v, FheType::EBOOL).value == 0, FheType::EBOOL);
}

CtHandle MockCoprocessor::select(
    const CtHandle& cond,
    const CtHandle& if_true,
    const CtHandle& if_false
) {
    countOperation();

    bool c = fetch(cond, FheType::EBOOL).value != 0;
    const Entry& t = fetch(if_true, FheType::EINT128);
    const Entry& f = fetch(if_false, FheType::EINT128);
    return store(c ? t.value : f.value, FheType::EINT128);
}

void MockCoprocessor::allow(const CtHandle& h, const Principal& p) {
    auto it = values.find(h.id);
    if (it == values.end()) {
        throw FheError("allow on unknown handle " + std::to_string(h.id));
    }
    it->second.acl.insert(p);
}

bool MockCoprocessor::isAllowed(const CtHandle& h, const Principal& p) const {
    auto it = values.find(h.id);
    if (it == values.end()) return false;
    return it->second.acl.count(p) > 0;
}

bool MockCoprocessor::exists(const CtHandle& h) const {
    auto it = values.find(h.id);
    return it != values.end() && it->second.type == h.type;
}

CtHandle MockCoprocessor::encrypt(Int128 value, const Principal& owner) {
    CtHandle h;
    h.id = next_id++;
    h.type = FheType::EINT128;

    Entry e;
    e.value = value;
    e.type = FheType::EINT128;
    e.acl.insert(owner);
    values.emplace(h.id, std::move(e));
    return h;
}

CtHandle MockCoprocessor::encryptBool(bool value, const Principal& owner) {
    CtHandle h;
    h.id = next_id++;
    h.type = FheType::EBOOL;

    Entry e;
    e.value = value ? 1 : 0;
    e.type = FheType::EBOOL;
    e.acl.insert(owner);
    values.emplace(h.id, std::move(e));
    return h;
}

Int128 MockCoprocessor::decrypt(
    const CtHandle& h,
    const Principal& requester
) const {
    auto it = values.find(h.id);
    if (it == values.end()) {
        throw FheError("decrypt of unknown handle " + std::to_string(h.id));
    }
    if (!it->second.acl.count(requester)) {
        throw FheError(
            "ACL: " + requester + " may not decrypt handle " +
            std::to_string(h.id));
    }
    return it->second.value;
}

bool MockCoprocessor::decryptBool(
    const CtHandle& h,
    const Principal& requester
) const {
    return decrypt(h, requester) != 0;
}

void MockCoprocessor::failAfter(uint64_t n) {
    failure_armed = true;
    fail_budget = n;
}

void MockCoprocessor::clearFailure() {
    failure_armed = false;
    fail_budget = 0;
}

}
