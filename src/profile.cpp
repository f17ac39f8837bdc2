#include "profile.hpp"
#include "registry.hpp"
#include "util.hpp"
#include <fstream>
#include <iostream>
#include <utility>

namespace replywatch {

static std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

static std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

Profile profile_from_json(const nlohmann::json& j) {
    Profile p;
    if (!j.is_object()) return p;
    p.user_id = string_field(j, "user_id");
    if (p.user_id.empty()) p.user_id = string_field(j, "id");
    p.name = string_field(j, "name");
    p.role = string_field(j, "role");
    p.company = string_field(j, "company");
    p.industry = string_field(j, "industry");
    p.interests = string_list(j, "interests");
    p.skills = string_list(j, "skills");
    p.looking_for = string_list(j, "looking_for");
    p.phone = string_field(j, "phone");
    p.email = string_field(j, "email");
    if (j.contains("contact") && j["contact"].is_object()) {
        const auto& c = j["contact"];
        if (p.phone.empty()) p.phone = string_field(c, "phone");
        if (p.email.empty()) p.email = string_field(c, "email");
    }
    return p;
}

nlohmann::json profile_to_json(const Profile& p) {
    return {
        {"user_id", p.user_id},
        {"name", p.name},
        {"role", p.role},
        {"company", p.company},
        {"industry", p.industry},
        {"interests", p.interests},
        {"skills", p.skills},
        {"looking_for", p.looking_for},
        {"contact", {{"phone", p.phone}, {"email", p.email}}}
    };
}

// Phones compare without formatting, emails case-insensitively
static std::string contact_key(const std::string& handle) {
    std::string h = trim(handle);
    if (h.find('@') != std::string::npos) return to_lower(h);
    return ConversationRegistry::normalize_sender(h);
}

JsonProfileDirectory::JsonProfileDirectory(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[profiles] No profile directory at " << path << "\n";
        return;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        const nlohmann::json* list = &j;
        if (j.is_object() && j.contains("profiles")) list = &j["profiles"];
        if (list->is_array()) {
            for (const auto& item : *list) {
                profiles_.push_back(profile_from_json(item));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[profiles] Ignoring malformed " << path << ": " << e.what() << "\n";
        profiles_.clear();
    }
    index();
}

JsonProfileDirectory::JsonProfileDirectory(std::vector<Profile> profiles)
    : profiles_(std::move(profiles)) {
    index();
}

void JsonProfileDirectory::index() {
    by_id_.clear();
    by_contact_.clear();
    for (size_t i = 0; i < profiles_.size(); ++i) {
        const auto& p = profiles_[i];
        if (!p.user_id.empty()) by_id_.emplace(p.user_id, i);
        if (!p.phone.empty()) by_contact_.emplace(contact_key(p.phone), i);
        if (!p.email.empty()) by_contact_.emplace(contact_key(p.email), i);
    }
}

Result<Profile> JsonProfileDirectory::find(const std::string& user_id) const {
    auto it = by_id_.find(user_id);
    if (it == by_id_.end()) {
        return Error{ErrorKind::NotFound, "no profile for user " + user_id};
    }
    return profiles_[it->second];
}

Result<Profile> JsonProfileDirectory::find_by_contact(const std::string& handle) const {
    auto it = by_contact_.find(contact_key(handle));
    if (it == by_contact_.end()) {
        return Error{ErrorKind::NotFound, "no profile for contact " + handle};
    }
    return profiles_[it->second];
}

} // namespace replywatch
