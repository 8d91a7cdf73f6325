#include "mapping.hpp"

namespace llm_client {

void to_json(nlohmann::json& j, const Message& m) {
    j = nlohmann::json{{"role", m.role}, {"content", m.content}};
}

void from_json(const nlohmann::json& j, Message& m) {
    j.at("role").get_to(m.role);
    j.at("content").get_to(m.content);
}

nlohmann::json buildChatRequest(const ClientConfig& config,
                                const std::vector<Message>& messages,
                                bool stream) {
    nlohmann::json payload;
    payload["model"]      = config.model;
    payload["messages"]   = messages;
    payload["max_tokens"] = config.maxTokens;
    if (stream) {
        payload["stream"] = true;
    }
    return payload;
}

namespace {

// choices[0].<section>.content, tolerating any shape mismatch.
std::optional<std::string> firstChoiceContent(const nlohmann::json& root,
                                              const char* section) {
    if (!root.is_object()) return std::nullopt;

    auto choices = root.find("choices");
    if (choices == root.end() || !choices->is_array() || choices->empty()) {
        return std::nullopt;
    }

    const auto& choice = choices->front();
    if (!choice.is_object()) return std::nullopt;

    auto part = choice.find(section);
    if (part == choice.end() || !part->is_object()) return std::nullopt;

    auto content = part->find("content");
    if (content == part->end() || !content->is_string()) return std::nullopt;

    return content->get<std::string>();
}

} // namespace

std::optional<std::string> extractAssistantText(const nlohmann::json& response) {
    return firstChoiceContent(response, "message");
}

std::optional<std::string> extractDeltaText(const nlohmann::json& chunk) {
    return firstChoiceContent(chunk, "delta");
}

std::optional<std::string> extractErrorMessage(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    auto error = parsed.find("error");
    if (error == parsed.end()) return std::nullopt;

    if (error->is_string()) return error->get<std::string>();
    if (error->is_object()) {
        auto message = error->find("message");
        if (message != error->end() && message->is_string()) {
            return message->get<std::string>();
        }
    }
    return std::nullopt;
}

} // namespace llm_client
