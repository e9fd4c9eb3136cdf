#include "../../include/http_client.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace mediagrab {

namespace {

bool iequals(const std::string_view a, const std::string_view b) {
    return std::ranges::equal(a, b, [](const unsigned char x, const unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

} // namespace

std::optional<std::string> HttpResponseHead::header(const std::string_view name) const {
    const auto it = std::ranges::find_if(headers, [&](const auto& h) { return iequals(h.first, name); });
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::string read_text(IResponseStream& response, const std::size_t max_bytes) {
    std::string out;
    std::array<char, 16 * 1024> chunk{};
    for (;;) {
        const std::size_t got = response.read(chunk);
        if (got == 0) break;
        if (out.size() + got > max_bytes) {
            throw TransportError(TransportError::Reason::Protocol,
                                 "response body exceeds " + std::to_string(max_bytes) + " bytes");
        }
        out.append(chunk.data(), got);
    }
    return out;
}

} // namespace mediagrab
