#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace llm_client {

/// Immutable client settings, shared by every request issued through one
/// ChatClient.  Defaults match a local development backend.
struct ClientConfig {
    std::string               baseUrl        = "http://localhost:3000";
    std::chrono::milliseconds timeout        {30000};  // overall default budget
    std::size_t               maxConcurrent  = 32;     // permits and pooled connections
    std::chrono::milliseconds keepAlive      {60000};
    int                       retryAttempts  = 3;      // total attempts per call
    std::chrono::milliseconds retryBaseDelay {100};
    std::chrono::milliseconds maxRetryDelay  {5000};

    std::chrono::milliseconds connectTimeout {5000};
    std::chrono::seconds      dnsCacheTtl    {300};
    std::string               model          = "test-model";
    int                       maxTokens      = 100;
    std::string               clientTag      = "cpp";  // idempotency key prefix
    std::uint64_t             jitterSeed     = 0;      // 0: seed from std::random_device
    bool                      verbose        = false;

    /// Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

} // namespace llm_client
