/**
 * @file payload.hpp
 * @brief Streaming byte sources and the two result shapes built on them:
 * RetrievedPayload (provider output) and MediaArtifact (normalized output).
 */

#ifndef MEDIAGRAB_PAYLOAD_HPP
#define MEDIAGRAB_PAYLOAD_HPP

#include "media_types.hpp"
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mediagrab {

/**
 * @brief Pull-based source of payload bytes.
 *
 * @details Providers hand back a PayloadSource instead of a filled buffer so
 * the caller can forward bytes while the transfer is still running. The base
 * class adds two things on top of the concrete read_some():
 * - a look-ahead buffer, so the first bytes can be inspected (peek) for MIME
 *   sniffing without being lost for the consumer;
 * - a size guard that throws FetchError(PayloadTooLarge) as soon as more bytes
 *   than the configured limit have been pulled from the underlying transport.
 */
class PayloadSource {
public:
    virtual ~PayloadSource() = default;

    /**
     * @brief Read up to buffer.size() bytes.
     * @return Number of bytes written into @p buffer, 0 at end of stream.
     * @throws FetchError on transport errors, cancellation or size overflow.
     */
    std::size_t read(std::span<char> buffer);

    /**
     * @brief Returns up to @p n bytes from the start of the stream without consuming them.
     *
     * Only valid before the first read().
     */
    std::string_view peek(std::size_t n);

    /**
     * @brief Enables the size guard.
     * @param max_bytes Maximum number of bytes, 0 disables the guard.
     * @param owner Provider reported in the PayloadTooLarge error.
     */
    void set_limit(std::uint64_t max_bytes, std::optional<ProviderId> owner);

    /// @return Bytes handed to the consumer so far.
    [[nodiscard]] std::uint64_t bytes_read() const noexcept { return delivered_; }

protected:
    /**
     * @brief Transport-specific read.
     * @return Bytes read, 0 at end of stream.
     */
    virtual std::size_t read_some(std::span<char> buffer) = 0;

private:
    std::size_t pull(std::span<char> buffer);

    std::string lookahead_;
    std::size_t lookahead_pos_ = 0;
    std::uint64_t delivered_ = 0;
    std::uint64_t pulled_ = 0;
    std::uint64_t limit_ = 0;
    std::optional<ProviderId> owner_;
};

/**
 * @brief PayloadSource over bytes already held in memory.
 */
class BufferSource final : public PayloadSource {
public:
    explicit BufferSource(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

protected:
    std::size_t read_some(std::span<char> buffer) override;

private:
    std::string data_;
    std::size_t pos_ = 0;
};

/**
 * @brief Raw output of a provider: the byte source plus provenance.
 */
struct RetrievedPayload {
    ProviderId source_provider = ProviderId::GenericHttp;
    std::string suggested_name;                ///< Unsanitized name proposal
    std::optional<std::string> declared_mime;  ///< MIME announced by the upstream, if any
    std::optional<std::uint64_t> size_bytes;   ///< Size announced by the upstream, if any
    std::unique_ptr<PayloadSource> body;
};

/**
 * @brief The normalized success result of a routing pass.
 *
 * filename is sanitized and never empty; mime_type is never empty.
 */
struct MediaArtifact {
    std::string filename;
    std::string mime_type;
    std::optional<std::uint64_t> size_bytes;
    ProviderId provider = ProviderId::GenericHttp;
    std::unique_ptr<PayloadSource> body;

    /**
     * @brief Drains the body into a string.
     */
    std::string read_all();

    /**
     * @brief Streams the body into @p out.
     * @return Number of bytes written.
     */
    std::uint64_t write_to(std::ostream& out);
};

} // namespace mediagrab

#endif // MEDIAGRAB_PAYLOAD_HPP
