#include "dedup.hpp"
#include "util.hpp"
#include <openssl/sha.h>
#include <cstdio>

namespace replywatch {

DedupSet::DedupSet(size_t prefix_length) : prefix_length_(prefix_length) {}

std::string DedupSet::fingerprint(const std::string& text) const {
    std::string prefix = utf8_prefix_chars(text, prefix_length_);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(prefix.data()), prefix.size(), hash);

    std::string hex;
    hex.reserve(SHA256_DIGEST_LENGTH * 2);
    char buf[3];
    for (unsigned char b : hash) {
        std::snprintf(buf, sizeof(buf), "%02x", b);
        hex += buf;
    }
    return hex;
}

void DedupSet::record(const std::string& text) {
    fingerprints_.insert(fingerprint(text));
}

bool DedupSet::contains(const std::string& text) const {
    return fingerprints_.count(fingerprint(text)) > 0;
}

} // namespace replywatch
