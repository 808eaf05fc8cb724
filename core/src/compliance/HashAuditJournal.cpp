#include "shroud/compliance/HashAuditJournal.hpp"
#include "shroud/core/Hash.hpp"

#include <iostream>
#include <stdexcept>

namespace shroud {

HashAuditJournal::HashAuditJournal(
    const std::string& path
) : file(path) {
    if (file.empty()) return;

    // An existing journal is extended: the chain continues from its last
    // recorded hash.
    std::ifstream existing(file);
    std::string row;
    while (std::getline(existing, row)) {
        size_t comma = row.rfind(',');
        if (comma == std::string::npos) {
            throw std::runtime_error(
                "malformed audit journal " + file + " at line " +
                std::to_string(count + 1));
        }
        previous_hash = row.substr(comma + 1);
        count++;
    }
    existing.close();

    if (count > 0) {
        std::cout << "[AUDIT] resuming " << file << " at entry " << count
                  << "\n";
    }

    out.open(file, std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open audit journal " + file);
    }
}

std::string HashAuditJournal::chainHash(
    const std::string& previous,
    const std::string& line
) {
    return toHex(sha256(previous + line));
}

std::string HashAuditJournal::append(const std::string& line) {
    if (line.find('\n') != std::string::npos) {
        throw std::invalid_argument("journal lines must be single-line");
    }

    std::string hash = chainHash(previous_hash, line);

    if (out.is_open()) {
        out << line << "," << hash << "\n";
        out.flush();
    }

    previous_hash = hash;
    count++;
    return hash;
}

bool HashAuditJournal::verify(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[AUDIT] cannot open " << path << "\n";
        return false;
    }

    std::string previous;
    std::string row;
    uint64_t line_no = 0;

    while (std::getline(in, row)) {
        line_no++;
        size_t comma = row.rfind(',');
        if (comma == std::string::npos) {
            std::cerr << "[AUDIT] malformed line " << line_no << "\n";
            return false;
        }

        std::string line = row.substr(0, comma);
        std::string recorded = row.substr(comma + 1);
        std::string expected = chainHash(previous, line);

        if (recorded != expected) {
            std::cerr << "[AUDIT] chain broken at line " << line_no << "\n";
            return false;
        }
        previous = expected;
    }
    return true;
}

}
