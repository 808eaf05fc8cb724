#pragma once

#include <cstdint>
#include <fstream>
#include <string>

#include "shroud/core/Types.hpp"

namespace shroud {

// Append-only journal where every line carries SHA-256(previous hash +
// line). Editing or dropping a line breaks every hash after it.
class HashAuditJournal {
public:
    // An empty path keeps the chain in memory only. An existing file is
    // resumed from its last hash.
    explicit HashAuditJournal(const std::string& path);

    std::string append(const std::string& line);

    const std::string& lastHash() const { return previous_hash; }
    uint64_t entries() const { return count; }
    const std::string& path() const { return file; }

    // Recomputes the chain of a journal file.
    static bool verify(const std::string& path);

private:
    static std::string chainHash(
        const std::string& previous,
        const std::string& line
    );

    std::string file;
    std::ofstream out;
    std::string previous_hash;
    uint64_t count = 0;
};

}
