/**
 * @file result_assembler.hpp
 * @brief Normalizes provider output into a MediaArtifact and failures into an ErrorReport.
 */

#ifndef MEDIAGRAB_RESULT_ASSEMBLER_HPP
#define MEDIAGRAB_RESULT_ASSEMBLER_HPP

#include "error_report.hpp"
#include "payload.hpp"
#include <exception>
#include <optional>

namespace mediagrab {

///< Number of leading bytes handed to the content sniffer.
inline constexpr std::size_t kSniffBytes = 4096;

/**
 * @brief Builds the artifact for a payload.
 *
 * The filename is sanitized. The MIME type is the first of:
 * the declared type (unless application/octet-stream), the type of the
 * filename extension, the libmagic guess on the first kSniffBytes,
 * application/octet-stream. A filename without an extension, or with one
 * of another media family than the resolved type, gets the type's
 * extension appended.
 *
 * @throws FetchError if sniffing reads from a failing body.
 */
[[nodiscard]] MediaArtifact assemble_artifact(RetrievedPayload payload);

/**
 * @brief Normalizes any exception escaping a provider into an ErrorReport.
 *
 * FetchError keeps its report; transport and spawn failures get their
 * natural kinds; everything else becomes a non-recoverable Unknown.
 */
[[nodiscard]] ErrorReport report_from(const std::exception& error, std::optional<ProviderId> provider);

} // namespace mediagrab

#endif // MEDIAGRAB_RESULT_ASSEMBLER_HPP
