#include "matching.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <sstream>

namespace replywatch {

namespace {

std::set<std::string> normalized_set(const std::vector<std::string>& items) {
    std::set<std::string> out;
    for (const auto& item : items) {
        auto n = to_lower(trim(item));
        if (!n.empty()) out.insert(n);
    }
    return out;
}

// |A ∩ B| / |A ∪ B|; 0 when both are empty. Fills shared in sorted order.
double jaccard(const std::set<std::string>& a, const std::set<std::string>& b,
               std::vector<std::string>& shared) {
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                          std::back_inserter(shared));
    size_t union_size = a.size() + b.size() - shared.size();
    if (union_size == 0) return 0.0;
    return static_cast<double>(shared.size()) / static_cast<double>(union_size);
}

// A wanted item is satisfied by the other side's role (substring) or one of
// its skills (exact).
bool satisfies(const std::string& wanted, const std::string& role,
               const std::set<std::string>& skills) {
    if (!role.empty() && role.find(wanted) != std::string::npos) return true;
    return skills.count(wanted) > 0;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

} // namespace

double MatchBreakdown::total() const {
    double sum = interests_score + complementary_score + skills_score + industry_score;
    return std::min(1.0, std::max(0.0, sum));
}

MatchingEngine::MatchingEngine(double threshold) : threshold_(threshold) {}

MatchBreakdown MatchingEngine::breakdown(const Profile& a, const Profile& b) const {
    MatchBreakdown m;

    auto interests_a = normalized_set(a.interests);
    auto interests_b = normalized_set(b.interests);
    m.interests_score = INTERESTS_WEIGHT * jaccard(interests_a, interests_b, m.shared_interests);

    auto skills_a = normalized_set(a.skills);
    auto skills_b = normalized_set(b.skills);
    m.skills_score = SKILLS_WEIGHT * jaccard(skills_a, skills_b, m.shared_skills);

    // Complementary roles: what each side looks for, answered by the other
    auto wants_a = normalized_set(a.looking_for);
    auto wants_b = normalized_set(b.looking_for);
    std::string role_a = to_lower(trim(a.role));
    std::string role_b = to_lower(trim(b.role));
    size_t wanted = wants_a.size() + wants_b.size();
    size_t satisfied = 0;
    std::set<std::string> matched;
    for (const auto& w : wants_a) {
        if (satisfies(w, role_b, skills_b)) { ++satisfied; matched.insert(w); }
    }
    for (const auto& w : wants_b) {
        if (satisfies(w, role_a, skills_a)) { ++satisfied; matched.insert(w); }
    }
    m.complementary.assign(matched.begin(), matched.end());
    if (wanted > 0) {
        m.complementary_score = COMPLEMENTARY_WEIGHT *
            static_cast<double>(satisfied) / static_cast<double>(wanted);
    }

    std::string industry_a = to_lower(trim(a.industry));
    if (!industry_a.empty() && industry_a == to_lower(trim(b.industry))) {
        m.industry = industry_a;
        m.industry_score = INDUSTRY_WEIGHT;
    }

    return m;
}

double MatchingEngine::calculate_match_score(const Profile& a, const Profile& b) const {
    return breakdown(a, b).total();
}

bool MatchingEngine::is_high_match(double score) const {
    return score >= threshold_;
}

std::string MatchingEngine::get_match_reason(const Profile& a, const Profile& b,
                                             double score) const {
    auto m = breakdown(a, b);

    struct Part { double weight; std::string text; };
    // Fixed order here breaks ties in the stable sort below
    std::vector<Part> parts;
    if (!m.shared_interests.empty())
        parts.push_back({m.interests_score, "shared interests: " + join(m.shared_interests)});
    if (!m.complementary.empty())
        parts.push_back({m.complementary_score, "complementary goals: " + join(m.complementary)});
    if (!m.shared_skills.empty())
        parts.push_back({m.skills_score, "shared skills: " + join(m.shared_skills)});
    if (!m.industry.empty())
        parts.push_back({m.industry_score, "same industry: " + m.industry});

    std::stable_sort(parts.begin(), parts.end(),
                     [](const Part& x, const Part& y) { return x.weight > y.weight; });

    std::ostringstream ss;
    ss << static_cast<int>(std::lround(score * 100.0)) << "% match";
    if (parts.empty()) {
        ss << " (no significant overlap)";
        return ss.str();
    }
    ss << ": ";
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) ss << "; ";
        ss << parts[i].text;
    }
    return ss.str();
}

} // namespace replywatch
