#include "gardener/embedding/fingerprint.hpp"

#include "gardener/common/hash.hpp"

namespace gardener::embedding {

namespace {

bool is_blank(const char ch) { return ch == ' ' || ch == '\t' || ch == '\f' || ch == '\v'; }

} // namespace

std::string normalize_content(const std::string_view content) {
  std::string out;
  out.reserve(content.size());

  // "\r\n" and lone "\r" both end a line.
  const auto end_line = [&out] {
    while (!out.empty() && is_blank(out.back())) {
      out.pop_back();
    }
    out.push_back('\n');
  };
  for (std::size_t i = 0; i < content.size(); ++i) {
    const char ch = content[i];
    if (ch == '\r') {
      if (i + 1 < content.size() && content[i + 1] == '\n') {
        ++i;
      }
      end_line();
    } else if (ch == '\n') {
      end_line();
    } else {
      out.push_back(ch);
    }
  }

  while (!out.empty() && (out.back() == '\n' || is_blank(out.back()))) {
    out.pop_back();
  }
  return out;
}

std::string make_fingerprint(const std::string_view content, const std::string_view backend_identity,
                             const std::string_view config_version) {
  std::string material = normalize_content(content);
  // NUL separators keep ("ab","c") and ("a","bc") apart.
  material.push_back('\0');
  material.append(backend_identity);
  material.push_back('\0');
  material.append(config_version);
  return common::sha256_hex(material);
}

} // namespace gardener::embedding
