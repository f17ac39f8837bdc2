#pragma once
#include "result.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace replywatch {

class ConversationStore;  // forward declaration
class GenerationService;  // forward declaration
struct Conversation;      // forward declaration

enum class Urgency { Low, Medium, High };
enum class Sentiment { Positive, Neutral, Negative };

const char* urgency_to_string(Urgency u);
bool urgency_from_string(const std::string& s, Urgency& out);
const char* sentiment_to_string(Sentiment s);
bool sentiment_from_string(const std::string& s, Sentiment& out);

struct ConversationSummary {
    std::string who;
    std::string intent;
    std::vector<std::string> requirements;
    Urgency urgency = Urgency::Medium;
    Sentiment sentiment = Sentiment::Neutral;
    std::vector<std::string> action_items;
    std::string one_liner;
    bool degraded = false; // built by the fallback path, not parsed
};

// Remove a leading ``` / ```json fence line and a trailing ``` fence, if present
std::string strip_code_fences(const std::string& raw);

// Strict parse: all seven keys present with the right types and enum values.
// MalformedResponse otherwise.
Result<ConversationSummary> try_parse_summary(const std::string& raw);

// Strict parse, or the degraded record built from the raw text and sender.
ConversationSummary parse_summary(const std::string& raw, const std::string& sender);

nlohmann::json summary_to_json(const ConversationSummary& s);
// Lenient read of a stored summary; missing keys keep their defaults
ConversationSummary summary_from_json(const nlohmann::json& j);

// One "[sender]: text" line per message, outbound messages as "[AGENT]: text"
std::string build_transcript(const Conversation& convo);

// Task text sent to the generation service for one conversation
std::string build_summary_task(const Conversation& convo);

// Generate, parse and store the summary of one conversation.
// NotFound when the conversation is absent, including when it disappears
// before the summary is written; generation errors propagate.
Result<ConversationSummary> summarize_conversation(ConversationStore& store,
                                                   GenerationService& generator,
                                                   const std::string& conversation_id);

// Summarize every conversation that has no summary yet. Returns the number
// of summaries written; failures are logged and skipped.
size_t summarize_all(ConversationStore& store, GenerationService& generator);

} // namespace replywatch
