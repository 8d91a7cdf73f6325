#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <stdexcept>

namespace llm_client {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(),
                   parts.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        const bool numeric = !parts.port.empty() &&
            std::all_of(parts.port.begin(), parts.port.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; });
        if (!numeric) {
            throw std::invalid_argument("Invalid URL (bad port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string joinPath(const std::string& base, const std::string& path) {
    std::string out = base;
    while (!out.empty() && out.back() == '/') out.pop_back();
    if (path.empty() || path.front() != '/') out.push_back('/');
    out += path;
    return out;
}

std::chrono::milliseconds parseRetryAfter(const std::string& value) {
    const std::chrono::milliseconds fallback{1000};

    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) return fallback;
    auto last = value.find_last_not_of(" \t");
    const std::string trimmed = value.substr(first, last - first + 1);

    // delta-seconds: decimal digits with an optional fraction, nothing else
    if (!std::isdigit(static_cast<unsigned char>(trimmed[0]))) return fallback;
    if (trimmed.find_first_not_of("0123456789.") != std::string::npos) return fallback;

    char* end = nullptr;
    double seconds = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size()) return fallback;  // HTTP-date or junk
    if (!std::isfinite(seconds) || seconds < 0.0) return fallback;

    // Keeps the millisecond count and later chrono conversions in range.
    seconds = std::min(seconds, kMaxRetryAfterSeconds);
    return std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

std::string generateIdempotencyKey(const std::string& tag) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static constexpr char kHex[] = "0123456789abcdef";

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::uniform_int_distribution<int> digit(0, 15);
    std::string suffix(9, '0');
    for (auto& c : suffix) c = kHex[digit(rng)];

    return tag + "-" + std::to_string(millis) + "-" + suffix;
}

std::chrono::milliseconds remainingUntil(Deadline deadline, Deadline now) {
    if (now >= deadline) return std::chrono::milliseconds{0};
    return toMillis(deadline - now);
}

std::chrono::milliseconds toMillis(Clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d);
}

} // namespace llm_client
