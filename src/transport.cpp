#include "transport.hpp"

#include <algorithm>
#include <cctype>

namespace llm_client {

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

namespace {

std::string lookup(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(toLowerAscii(name));
    return it == headers.end() ? std::string{} : it->second;
}

} // namespace

std::string RawResponse::header(const std::string& name) const {
    return lookup(headers, name);
}

std::string ChunkSource::header(const std::string& name) const {
    return lookup(headers(), name);
}

std::string ChunkSource::readAll(Deadline deadline) {
    std::string out;
    char chunk[4096];
    for (;;) {
        const std::size_t n = read(chunk, sizeof(chunk), deadline);
        if (n == 0) break;
        out.append(chunk, n);
    }
    return out;
}

} // namespace llm_client
