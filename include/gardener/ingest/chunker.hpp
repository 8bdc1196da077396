#pragma once

#include "gardener/config/schema.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace gardener::ingest {

struct SourceChunk {
  std::string content;
  // 1-based, inclusive.
  std::size_t start_line = 0;
  std::size_t end_line = 0;
};

/// Line-oriented chunking for source files. Chunks stay within
/// `max_chunk_size` characters (a single longer line is hard-split), each
/// chunk repeats up to `overlap` characters of trailing lines from the one
/// before, and chunks shorter than `min_chunk_size` after trimming are
/// dropped unless the file yields nothing else.
[[nodiscard]] std::vector<SourceChunk> chunk_source(std::string_view text,
                                                    const config::ChunkingConfig &config);

} // namespace gardener::ingest
