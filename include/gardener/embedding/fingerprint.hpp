#pragma once

#include <string>
#include <string_view>

namespace gardener::embedding {

/// Maps "\r\n" and lone "\r" to "\n" and drops trailing whitespace, per line
/// and at the end of the text. Leading indentation is kept.
[[nodiscard]] std::string normalize_content(std::string_view content);

/// sha256 hex over (normalized content, backend identity, config version).
[[nodiscard]] std::string make_fingerprint(std::string_view content,
                                           std::string_view backend_identity,
                                           std::string_view config_version);

} // namespace gardener::embedding
