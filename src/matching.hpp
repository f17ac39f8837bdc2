#pragma once
#include "profile.hpp"
#include <string>
#include <vector>

namespace replywatch {

// Per-attribute contributions to a match score. Each *_score is already
// weighted, so total() is their sum.
struct MatchBreakdown {
    double interests_score = 0.0;
    double complementary_score = 0.0;
    double skills_score = 0.0;
    double industry_score = 0.0;

    std::vector<std::string> shared_interests;
    std::vector<std::string> shared_skills;
    std::vector<std::string> complementary;  // looking_for items the other side satisfies
    std::string industry;                     // set when both share it

    double total() const;
};

// Deterministic compatibility scoring between two profiles.
class MatchingEngine {
public:
    static constexpr double DEFAULT_THRESHOLD = 0.75;

    static constexpr double INTERESTS_WEIGHT = 0.40;
    static constexpr double COMPLEMENTARY_WEIGHT = 0.30;
    static constexpr double SKILLS_WEIGHT = 0.15;
    static constexpr double INDUSTRY_WEIGHT = 0.15;

    explicit MatchingEngine(double threshold = DEFAULT_THRESHOLD);

    // Weighted attribute overlap in [0, 1]. Symmetric in a and b.
    double calculate_match_score(const Profile& a, const Profile& b) const;

    // score >= threshold (inclusive)
    bool is_high_match(double score) const;

    // Names the attributes contributing most, strongest first
    std::string get_match_reason(const Profile& a, const Profile& b, double score) const;

    MatchBreakdown breakdown(const Profile& a, const Profile& b) const;

    double threshold() const { return threshold_; }

private:
    double threshold_;
};

} // namespace replywatch
