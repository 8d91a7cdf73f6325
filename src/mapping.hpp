#pragma once

#include "config.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace llm_client {

/// Path of the chat-completions endpoint, relative to the base URL.
constexpr const char* kChatCompletionsPath = "/v1/chat/completions";

/// Build the request body: {model, messages, max_tokens[, stream]}.
nlohmann::json buildChatRequest(const ClientConfig& config,
                                const std::vector<Message>& messages,
                                bool stream);

/// choices[0].message.content of a non-streaming response, if present.
std::optional<std::string> extractAssistantText(const nlohmann::json& response);

/// choices[0].delta.content of one streamed chunk, if present.
std::optional<std::string> extractDeltaText(const nlohmann::json& chunk);

/// error.message (or a top-level string "error") of an error body, if present.
std::optional<std::string> extractErrorMessage(const std::string& body);

} // namespace llm_client
