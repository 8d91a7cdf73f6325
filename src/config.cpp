#include "config.hpp"
#include "util.hpp"

#include <stdexcept>

namespace llm_client {

void ClientConfig::validate() const {
    UrlParts parts;
    try {
        parts = parseUrl(baseUrl);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(std::string("baseUrl: ") + e.what());
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("baseUrl: unsupported scheme '" +
                                    parts.scheme + "'");
    }

    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
    if (maxConcurrent == 0) {
        throw std::invalid_argument("maxConcurrent must be at least 1");
    }
    if (retryAttempts < 1) {
        throw std::invalid_argument("retryAttempts must be at least 1");
    }
    if (retryBaseDelay.count() < 0 || maxRetryDelay.count() < 0) {
        throw std::invalid_argument("retry delays must not be negative");
    }
    if (maxRetryDelay < retryBaseDelay) {
        throw std::invalid_argument("maxRetryDelay must be >= retryBaseDelay");
    }
    if (connectTimeout.count() <= 0) {
        throw std::invalid_argument("connectTimeout must be positive");
    }
    if (maxTokens < 1) {
        throw std::invalid_argument("maxTokens must be at least 1");
    }
    if (model.empty()) {
        throw std::invalid_argument("model must not be empty");
    }
}

} // namespace llm_client
