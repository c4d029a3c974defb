#pragma once

#include <cstdint>
#include <string>

namespace council {

// Size plus xxHash64 of a file's bytes.
struct ContentDigest {
    std::uint64_t size{0};
    std::uint64_t hash{0};

    bool operator==(const ContentDigest& other) const {
        return size == other.size && hash == other.hash;
    }
    bool operator!=(const ContentDigest& other) const { return !(*this == other); }

    // 16 lowercase hex digits
    std::string hex() const;
};

ContentDigest digest_of(const std::string& content);

}  // namespace council
