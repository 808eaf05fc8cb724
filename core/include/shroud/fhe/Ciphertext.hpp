#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "shroud/core/Types.hpp"

namespace shroud::fhe {

enum class FheType : uint8_t {
    EBOOL = 0,
    EINT128 = 1
};

inline const char* fheTypeToString(FheType t) {
    switch (t) {
        case FheType::EBOOL:   return "ebool";
        case FheType::EINT128: return "eint128";
        default:               return "unknown";
    }
}

// Opaque reference to a ciphertext held by the coprocessor. Id 0 is the
// uninitialised handle and reads as an encrypted zero.
struct CtHandle {
    uint64_t id = 0;
    FheType type = FheType::EINT128;

    bool valid() const { return id != 0; }

    bool operator==(const CtHandle& o) const {
        return id == o.id && type == o.type;
    }
    bool operator!=(const CtHandle& o) const { return !(*this == o); }
};

// Who may use a ciphertext. `self` is the engine's own compute right;
// `readers` may request decryption out-of-band.
struct AclPolicy {
    bool self = false;
    std::vector<Principal> readers;

    bool allows(const Principal& p) const;
    void add(const Principal& p);
};

// A ciphertext together with the access it was released under. Every
// value the engine produces or persists is carried in this form.
struct Sealed {
    CtHandle handle;
    AclPolicy acl;

    bool valid() const { return handle.valid(); }
};

class FheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
