#pragma once
#include <string>
#include <unordered_set>
#include <cstddef>

namespace replywatch {

// Fingerprints of text we dispatched, used to recognise our own replies when
// they reappear in the message log. A fingerprint covers only the first
// prefix_length characters (UTF-8 code points), so unrelated text sharing
// that prefix also matches.
// Entries never expire.
class DedupSet {
public:
    static constexpr size_t DEFAULT_PREFIX_LENGTH = 100;

    explicit DedupSet(size_t prefix_length = DEFAULT_PREFIX_LENGTH);

    void record(const std::string& text);
    bool contains(const std::string& text) const;

    size_t size() const { return fingerprints_.size(); }
    size_t prefix_length() const { return prefix_length_; }

    // Hex SHA-256 of the first prefix_length characters of text
    std::string fingerprint(const std::string& text) const;

private:
    size_t prefix_length_;
    std::unordered_set<std::string> fingerprints_;
};

} // namespace replywatch
