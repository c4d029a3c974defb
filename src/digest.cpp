#include <council/digest.hpp>

#include <cstdio>

#include <xxhash.h>

namespace council {

std::string ContentDigest::hex() const {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

ContentDigest digest_of(const std::string& content) {
    ContentDigest d;
    d.size = content.size();
    d.hash = XXH64(content.data(), content.size(), 0);
    return d;
}

}  // namespace council
