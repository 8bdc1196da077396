#include "gardener/ingest/chunker.hpp"

#include "gardener/common/fs.hpp"

#include <algorithm>

namespace gardener::ingest {

namespace {

struct Piece {
  std::string text;
  std::size_t line = 0;
};

std::vector<Piece> split_pieces(const std::string_view text, const std::size_t max_size) {
  std::vector<Piece> pieces;
  std::size_t line_number = 1;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (line.size() <= max_size) {
      pieces.push_back(Piece{.text = std::string(line), .line = line_number});
    } else {
      for (std::size_t offset = 0; offset < line.size(); offset += max_size) {
        pieces.push_back(Piece{.text = std::string(line.substr(offset, max_size)),
                               .line = line_number});
      }
    }

    if (end == text.size()) {
      break;
    }
    start = end + 1;
    ++line_number;
  }
  return pieces;
}

} // namespace

std::vector<SourceChunk> chunk_source(const std::string_view text,
                                      const config::ChunkingConfig &config) {
  const std::size_t max_size = std::max<std::size_t>(config.max_chunk_size, 1);
  const auto pieces = split_pieces(text, max_size);

  std::vector<SourceChunk> chunks;
  std::size_t i = 0;
  while (i < pieces.size()) {
    const std::size_t start = i;
    std::size_t size = 0;
    std::string content;
    while (i < pieces.size() && (i == start || size + pieces[i].text.size() + 1 <= max_size)) {
      if (i != start) {
        content += '\n';
      }
      content += pieces[i].text;
      size += pieces[i].text.size() + 1;
      ++i;
    }
    chunks.push_back(SourceChunk{
        .content = std::move(content),
        .start_line = pieces[start].line,
        .end_line = pieces[i - 1].line,
    });

    if (i >= pieces.size()) {
      break;
    }
    // Step back over trailing lines that fit in the overlap, but always move
    // forward by at least one piece.
    std::size_t back = i;
    std::size_t carried = 0;
    while (back - 1 > start && carried + pieces[back - 1].text.size() + 1 <= config.overlap) {
      --back;
      carried += pieces[back].text.size() + 1;
    }
    i = back;
  }

  std::vector<SourceChunk> kept;
  for (auto &chunk : chunks) {
    if (common::trim(chunk.content).size() >= config.min_chunk_size) {
      kept.push_back(std::move(chunk));
    }
  }
  if (kept.empty()) {
    // Small files still get one chunk so they remain searchable.
    for (auto &chunk : chunks) {
      if (!common::trim(chunk.content).empty()) {
        kept.push_back(std::move(chunk));
        break;
      }
    }
  }
  return kept;
}

} // namespace gardener::ingest
