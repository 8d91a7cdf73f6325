#include "chat_client.hpp"
#include "mapping.hpp"
#include "models.hpp"

#include <cstdlib>
#include <future>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

struct CliOptions {
    llm_client::ClientConfig client;
    std::string              prompt   = "Hello";
    int                      requests = 1;
    bool                     stream   = false;
};

static void printUsage() {
    std::cout
        << "Usage: llm_client_cli [options]\n\n"
        << "Options:\n"
        << "  --base-url URL       Backend base URL          "
           "(default: http://localhost:3000)\n"
        << "  --model NAME         Model id                  (default: test-model)\n"
        << "  --prompt TEXT        User message              (default: Hello)\n"
        << "  --max-tokens N       max_tokens in the request (default: 100)\n"
        << "  --stream             Use the streaming endpoint\n"
        << "  --requests N         Concurrent calls to issue (default: 1)\n"
        << "  --max-concurrent N   In-flight call limit      (default: 32)\n"
        << "  --timeout-ms N       Per-call deadline in ms   (default: 30000)\n"
        << "  --retries N          Attempts per call         (default: 3)\n"
        << "  --verbose            Enable verbose diagnostics\n"
        << "  --help, -h           Show this message\n";
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--base-url") && i + 1 < argc) {
            opts.client.baseUrl = argv[++i];
        } else if ((arg == "--model") && i + 1 < argc) {
            opts.client.model = argv[++i];
        } else if ((arg == "--prompt") && i + 1 < argc) {
            opts.prompt = argv[++i];
        } else if ((arg == "--max-tokens") && i + 1 < argc) {
            opts.client.maxTokens = std::stoi(argv[++i]);
        } else if (arg == "--stream") {
            opts.stream = true;
        } else if ((arg == "--requests") && i + 1 < argc) {
            opts.requests = std::stoi(argv[++i]);
        } else if ((arg == "--max-concurrent") && i + 1 < argc) {
            opts.client.maxConcurrent = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            opts.client.timeout = std::chrono::milliseconds(std::stol(argv[++i]));
        } else if ((arg == "--retries") && i + 1 < argc) {
            opts.client.retryAttempts = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            opts.client.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    opts.client.clientTag = "cli";
    return opts;
}

// One call; returns the assistant text (or the concatenated deltas).
static std::string runOnce(llm_client::ChatClient& client,
                           const std::vector<llm_client::Message>& messages,
                           bool stream) {
    const auto deadline = llm_client::Clock::now() + client.config().timeout;

    if (!stream) {
        auto response = client.chatCompletion(messages, deadline);
        return llm_client::extractAssistantText(response.body).value_or(response.body.dump());
    }

    std::string text;
    auto events = client.streamChatCompletion(messages, deadline);
    while (auto event = events.next()) {
        text += llm_client::extractDeltaText(*event).value_or("");
    }
    return text;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions opts = parseArgs(argc, argv);

        std::cout
            << "=== llm_client ===\n"
            << "Base URL:        " << opts.client.baseUrl               << "\n"
            << "Model:           " << opts.client.model                 << "\n"
            << "Mode:            " << (opts.stream ? "stream" : "unary") << "\n"
            << "Requests:        " << opts.requests                     << "\n"
            << "Max concurrent:  " << opts.client.maxConcurrent         << "\n"
            << "Timeout:         " << opts.client.timeout.count()       << " ms\n"
            << "==================\n\n";

        llm_client::ChatClient client(opts.client);
        const std::vector<llm_client::Message> messages{{"user", opts.prompt}};

        std::vector<std::future<std::string>> calls;
        calls.reserve(static_cast<std::size_t>(opts.requests));
        for (int i = 0; i < opts.requests; ++i) {
            calls.push_back(std::async(std::launch::async, [&] {
                return runOnce(client, messages, opts.stream);
            }));
        }

        int failures = 0;
        for (std::size_t i = 0; i < calls.size(); ++i) {
            try {
                const auto text = calls[i].get();
                std::cout << std::setw(4) << (i + 1) << "  " << text << "\n";
            } catch (const llm_client::ClientError& e) {
                ++failures;
                std::cerr << std::setw(4) << (i + 1) << "  failed: " << e.what()
                          << " (elapsed " << e.elapsed().count() << " ms)\n";
            }
        }

        const auto stats = client.stats();
        std::cout
            << "\n=== Summary Report ===\n"
            << "Calls:               " << stats.totalCalls      << "\n"
            << "Succeeded:           " << stats.successfulCalls << "\n"
            << "Failed:              " << stats.failedCalls     << "\n"
            << "Attempts:            " << stats.totalAttempts   << "\n"
            << "Retries:             " << stats.totalRetries    << "\n"
            << "Rate limited:        " << stats.rateLimited     << "\n"
            << "Events delivered:    " << stats.eventsDelivered << "\n"
            << "Malformed frames:    " << stats.malformedFrames << "\n"
            << "Peak in flight:      " << stats.peakInFlight    << "\n"
            << "======================\n";

        return failures == 0 ? 0 : 2;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
