#include "summary.hpp"
#include "conversation_store.hpp"
#include "generation.hpp"
#include "util.hpp"
#include <iostream>

using json = nlohmann::json;

namespace replywatch {

const char* urgency_to_string(Urgency u) {
    switch (u) {
        case Urgency::Low: return "low";
        case Urgency::Medium: return "medium";
        case Urgency::High: return "high";
    }
    return "medium";
}

bool urgency_from_string(const std::string& s, Urgency& out) {
    std::string v = to_lower(trim(s));
    if (v == "low") { out = Urgency::Low; return true; }
    if (v == "medium") { out = Urgency::Medium; return true; }
    if (v == "high") { out = Urgency::High; return true; }
    return false;
}

const char* sentiment_to_string(Sentiment s) {
    switch (s) {
        case Sentiment::Positive: return "positive";
        case Sentiment::Neutral: return "neutral";
        case Sentiment::Negative: return "negative";
    }
    return "neutral";
}

bool sentiment_from_string(const std::string& s, Sentiment& out) {
    std::string v = to_lower(trim(s));
    if (v == "positive") { out = Sentiment::Positive; return true; }
    if (v == "neutral") { out = Sentiment::Neutral; return true; }
    if (v == "negative") { out = Sentiment::Negative; return true; }
    return false;
}

std::string strip_code_fences(const std::string& raw) {
    std::string text = trim(raw);
    if (text.compare(0, 3, "```") != 0) return text;

    // Drop the opening fence line (``` or ```json)
    auto newline = text.find('\n');
    if (newline == std::string::npos) return "";
    text = text.substr(newline + 1);

    auto close = text.rfind("```");
    if (close != std::string::npos) {
        text = text.substr(0, close);
    }
    return trim(text);
}

static bool read_string_array(const json& j, const char* key,
                              std::vector<std::string>& out) {
    if (!j.contains(key) || !j[key].is_array()) return false;
    out.clear();
    for (const auto& item : j[key]) {
        if (!item.is_string()) return false;
        out.push_back(item.get<std::string>());
    }
    return true;
}

Result<ConversationSummary> try_parse_summary(const std::string& raw) {
    auto j = json::parse(strip_code_fences(raw), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorKind::MalformedResponse, "summary is not a JSON object"};
    }

    ConversationSummary s;
    for (const char* key : {"who", "intent", "urgency", "sentiment", "one_liner"}) {
        if (!j.contains(key) || !j[key].is_string()) {
            return Error{ErrorKind::MalformedResponse,
                         std::string("summary missing string key: ") + key};
        }
    }
    s.who = j["who"].get<std::string>();
    s.intent = j["intent"].get<std::string>();
    s.one_liner = j["one_liner"].get<std::string>();

    if (!urgency_from_string(j["urgency"].get<std::string>(), s.urgency)) {
        return Error{ErrorKind::MalformedResponse,
                     "invalid urgency: " + j["urgency"].get<std::string>()};
    }
    if (!sentiment_from_string(j["sentiment"].get<std::string>(), s.sentiment)) {
        return Error{ErrorKind::MalformedResponse,
                     "invalid sentiment: " + j["sentiment"].get<std::string>()};
    }
    if (!read_string_array(j, "requirements", s.requirements)) {
        return Error{ErrorKind::MalformedResponse,
                     std::string("summary requirements must be an array of strings")};
    }
    if (!read_string_array(j, "action_items", s.action_items)) {
        return Error{ErrorKind::MalformedResponse,
                     std::string("summary action_items must be an array of strings")};
    }
    return s;
}

ConversationSummary parse_summary(const std::string& raw, const std::string& sender) {
    auto parsed = try_parse_summary(raw);
    if (parsed) return parsed.value();

    std::cerr << "[summary] Falling back to raw text for " << sender
              << ": " << parsed.error().message << "\n";
    ConversationSummary s;
    s.one_liner = trim(raw);
    s.who = sender;
    s.intent = "unknown";
    s.urgency = Urgency::Medium;
    s.sentiment = Sentiment::Neutral;
    s.degraded = true;
    return s;
}

json summary_to_json(const ConversationSummary& s) {
    json j = {
        {"who", s.who},
        {"intent", s.intent},
        {"requirements", s.requirements},
        {"urgency", urgency_to_string(s.urgency)},
        {"sentiment", sentiment_to_string(s.sentiment)},
        {"action_items", s.action_items},
        {"one_liner", s.one_liner}
    };
    if (s.degraded) j["degraded"] = true;
    return j;
}

ConversationSummary summary_from_json(const json& j) {
    ConversationSummary s;
    if (!j.is_object()) return s;
    s.who = j.value("who", "");
    s.intent = j.value("intent", "");
    s.one_liner = j.value("one_liner", "");
    if (j.contains("urgency") && j["urgency"].is_string())
        urgency_from_string(j["urgency"].get<std::string>(), s.urgency);
    if (j.contains("sentiment") && j["sentiment"].is_string())
        sentiment_from_string(j["sentiment"].get<std::string>(), s.sentiment);
    read_string_array(j, "requirements", s.requirements);
    read_string_array(j, "action_items", s.action_items);
    if (j.contains("degraded") && j["degraded"].is_boolean())
        s.degraded = j["degraded"].get<bool>();
    return s;
}

std::string build_transcript(const Conversation& convo) {
    std::string out;
    for (const auto& msg : convo.messages) {
        if (!out.empty()) out += '\n';
        if (msg.direction == Direction::Outbound) {
            out += "[AGENT]: ";
        } else {
            out += "[" + msg.sender + "]: ";
        }
        out += msg.text;
    }
    return out;
}

std::string build_summary_task(const Conversation& convo) {
    return "Produce a structured JSON summary of this iMessage conversation. "
           "Return ONLY valid JSON with these keys: who (string - who contacted), "
           "intent (string - what do they want), requirements (array of strings - "
           "specific requirements/asks), urgency (low/medium/high), sentiment "
           "(positive/neutral/negative), action_items (array of strings), "
           "one_liner (string - 1 sentence summary).\n\n"
           "Summarize this conversation:\n\n" + build_transcript(convo);
}

Result<ConversationSummary> summarize_conversation(ConversationStore& store,
                                                   GenerationService& generator,
                                                   const std::string& conversation_id) {
    auto convo = store.get(conversation_id);
    if (!convo) {
        return Error{ErrorKind::NotFound, "conversation not found: " + conversation_id};
    }

    auto raw = generator.complete(build_summary_task(*convo));
    if (!raw) return raw.error();

    auto summary = parse_summary(raw.value(), convo->sender);
    if (!store.update_summary(conversation_id, summary)) {
        return Error{ErrorKind::NotFound,
                     "conversation " + conversation_id + " was removed while summarizing"};
    }
    return summary;
}

size_t summarize_all(ConversationStore& store, GenerationService& generator) {
    size_t written = 0;
    for (const auto& convo : store.get_all()) {
        if (convo.summary) continue;

        auto result = summarize_conversation(store, generator, convo.conversation_id);
        if (!result) {
            std::cerr << "[summary] Skipping " << convo.conversation_id << ": "
                      << result.error().message << "\n";
            continue;
        }
        ++written;
    }
    return written;
}

} // namespace replywatch
