#pragma once

#include <string>

#include "shroud/state/StateStore.hpp"

namespace shroud {

// JSON snapshot of a state store. Ciphertexts are stored as coprocessor
// handles plus their ACL, so a snapshot is only meaningful next to the
// coprocessor state that issued those handles.
class StatePersistence {
public:
    explicit StatePersistence(const std::string& path);

    void save(const StateStore& store) const;

    // Fills an empty store. Returns false when no snapshot exists. A
    // malformed snapshot throws std::runtime_error and leaves the store
    // as it was.
    bool load(StateStore& store) const;

    std::string toJson(const StateStore& store) const;
    void fromJson(const std::string& data, StateStore& store) const;

private:
    std::string file;
};

}
