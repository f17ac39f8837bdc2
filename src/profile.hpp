#pragma once
#include "result.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace replywatch {

struct Profile {
    std::string user_id;
    std::string name;
    std::string role;
    std::string company;
    std::string industry;
    std::vector<std::string> interests;
    std::vector<std::string> skills;
    std::vector<std::string> looking_for;
    std::string phone;
    std::string email;
};

// Missing keys default to empty; unknown keys are ignored.
// Contact details may be top level or nested under "contact".
Profile profile_from_json(const nlohmann::json& j);
nlohmann::json profile_to_json(const Profile& p);

// Lookup of profile records for the decision gate.
class ProfileDirectory {
public:
    virtual ~ProfileDirectory() = default;

    // NotFound when no profile has this user id
    virtual Result<Profile> find(const std::string& user_id) const = 0;

    // Match a message handle (phone or email) against profile contacts.
    // NotFound when no profile carries this handle.
    virtual Result<Profile> find_by_contact(const std::string& handle) const = 0;
};

// Profiles read once from a JSON file: either an array of profile objects
// or {"profiles": [...]}. A missing or malformed file yields an empty
// directory.
class JsonProfileDirectory : public ProfileDirectory {
public:
    explicit JsonProfileDirectory(const std::string& path);

    // In-memory directory (tests, embedding)
    explicit JsonProfileDirectory(std::vector<Profile> profiles);

    Result<Profile> find(const std::string& user_id) const override;
    Result<Profile> find_by_contact(const std::string& handle) const override;

    size_t size() const { return profiles_.size(); }

private:
    void index();

    std::vector<Profile> profiles_;
    std::unordered_map<std::string, size_t> by_id_;
    std::unordered_map<std::string, size_t> by_contact_;
};

} // namespace replywatch
