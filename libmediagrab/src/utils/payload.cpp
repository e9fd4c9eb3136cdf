#include "../../include/payload.hpp"
#include "../../include/error_report.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <ostream>

namespace mediagrab {

std::size_t PayloadSource::pull(const std::span<char> buffer) {
    const std::size_t got = read_some(buffer);
    pulled_ += got;
    if (limit_ != 0 && pulled_ > limit_) {
        throw FetchError(ErrorKind::PayloadTooLarge, owner_,
                         "transfer exceeded the maximum size of " + std::to_string(limit_) + " bytes");
    }
    return got;
}

std::size_t PayloadSource::read(const std::span<char> buffer) {
    if (buffer.empty()) return 0;

    if (lookahead_pos_ < lookahead_.size()) {
        const std::size_t n = std::min(buffer.size(), lookahead_.size() - lookahead_pos_);
        std::memcpy(buffer.data(), lookahead_.data() + lookahead_pos_, n);
        lookahead_pos_ += n;
        if (lookahead_pos_ == lookahead_.size()) {
            lookahead_.clear();
            lookahead_pos_ = 0;
        }
        delivered_ += n;
        return n;
    }

    const std::size_t got = pull(buffer);
    delivered_ += got;
    return got;
}

std::string_view PayloadSource::peek(const std::size_t n) {
    std::array<char, 4096> chunk{};
    while (lookahead_.size() < n) {
        const std::size_t want = std::min(chunk.size(), n - lookahead_.size());
        const std::size_t got = pull({chunk.data(), want});
        if (got == 0) break;
        lookahead_.append(chunk.data(), got);
    }
    return std::string_view(lookahead_).substr(lookahead_pos_, n);
}

void PayloadSource::set_limit(const std::uint64_t max_bytes, const std::optional<ProviderId> owner) {
    limit_ = max_bytes;
    owner_ = owner;
}

std::size_t BufferSource::read_some(const std::span<char> buffer) {
    const std::size_t n = std::min(buffer.size(), data_.size() - pos_);
    std::memcpy(buffer.data(), data_.data() + pos_, n);
    pos_ += n;
    return n;
}

std::string MediaArtifact::read_all() {
    std::string out;
    if (!body) return out;
    if (size_bytes) {
        out.reserve(static_cast<std::size_t>(*size_bytes));
    }
    std::array<char, 64 * 1024> chunk{};
    for (;;) {
        const std::size_t got = body->read(chunk);
        if (got == 0) break;
        out.append(chunk.data(), got);
    }
    return out;
}

std::uint64_t MediaArtifact::write_to(std::ostream& out) {
    std::uint64_t total = 0;
    if (!body) return total;
    std::array<char, 64 * 1024> chunk{};
    for (;;) {
        const std::size_t got = body->read(chunk);
        if (got == 0) break;
        out.write(chunk.data(), static_cast<std::streamsize>(got));
        if (!out) {
            throw std::runtime_error("failed to write artifact bytes");
        }
        total += got;
    }
    return total;
}

} // namespace mediagrab
