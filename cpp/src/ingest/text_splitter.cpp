#include "rgkb/text_splitter.hpp"

#include "rgkb/errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace rgkb {
namespace {

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
}

// Positions where a piece starts. The separator stays attached to the piece it introduces.
std::vector<std::size_t> SplitPoints(std::string_view text,
                                     std::size_t begin,
                                     std::size_t end,
                                     std::string_view separator) {
  std::vector<std::size_t> points{};
  std::size_t cursor = begin + 1;
  while (cursor < end) {
    const auto found = text.find(separator, cursor);
    if (found == std::string_view::npos || found + separator.size() > end) {
      break;
    }
    points.push_back(found);
    cursor = found + separator.size();
  }
  return points;
}

}  // namespace

RecursiveTextSplitter::RecursiveTextSplitter(int chunk_size, int chunk_overlap)
    : RecursiveTextSplitter(chunk_size, chunk_overlap, DefaultSeparators()) {}

RecursiveTextSplitter::RecursiveTextSplitter(int chunk_size,
                                             int chunk_overlap,
                                             std::vector<std::string> separators)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap), separators_(std::move(separators)) {
  if (chunk_size_ <= 0) {
    throw ConfigError("RecursiveTextSplitter chunk_size must be positive");
  }
  if (chunk_overlap_ < 0 || chunk_overlap_ >= chunk_size_) {
    throw ConfigError("RecursiveTextSplitter chunk_overlap must be in [0, chunk_size)");
  }
  for (const auto& separator : separators_) {
    if (separator.empty()) {
      throw ConfigError("RecursiveTextSplitter separators must not be empty");
    }
  }
}

std::vector<std::string> RecursiveTextSplitter::DefaultSeparators() {
  return {
      "\n\n# ",
      "\n\n## ",
      "\n\n### ",
      "\n\n**",
      "\n\n",
      "\n",
      ". ",
      " ",
  };
}

void RecursiveTextSplitter::Segment(std::string_view text,
                                    std::size_t begin,
                                    std::size_t end,
                                    std::size_t separator_level,
                                    std::vector<TextSpan>& out) const {
  const auto budget = static_cast<std::size_t>(chunk_size_ - chunk_overlap_);
  if (end - begin <= budget) {
    out.push_back(TextSpan{begin, end - begin});
    return;
  }

  std::vector<std::size_t> points{};
  std::size_t level = separator_level;
  for (; level < separators_.size(); ++level) {
    points = SplitPoints(text, begin, end, separators_[level]);
    if (!points.empty()) {
      break;
    }
  }
  if (points.empty()) {
    out.push_back(TextSpan{begin, end - begin});
    return;
  }

  std::vector<std::pair<std::size_t, std::size_t>> pieces{};
  pieces.reserve(points.size() + 1);
  std::size_t piece_begin = begin;
  for (const auto point : points) {
    pieces.emplace_back(piece_begin, point);
    piece_begin = point;
  }
  pieces.emplace_back(piece_begin, end);

  // Greedy merge of consecutive pieces; oversized pieces recurse with the next separator.
  std::size_t merged_begin = begin;
  std::size_t merged_end = begin;
  const auto flush = [&]() {
    if (merged_end > merged_begin) {
      out.push_back(TextSpan{merged_begin, merged_end - merged_begin});
    }
  };
  for (const auto& [piece_start, piece_end] : pieces) {
    const auto piece_length = piece_end - piece_start;
    if (piece_length > budget) {
      flush();
      Segment(text, piece_start, piece_end, level + 1, out);
      merged_begin = piece_end;
      merged_end = piece_end;
      continue;
    }
    if (piece_end - merged_begin > budget) {
      flush();
      merged_begin = piece_start;
    }
    merged_end = piece_end;
  }
  flush();
}

std::vector<TextSpan> RecursiveTextSplitter::SplitSpans(std::string_view text) const {
  std::vector<TextSpan> segments{};
  if (text.empty()) {
    return segments;
  }
  Segment(text, 0, text.size(), 0, segments);

  const auto overlap = static_cast<std::size_t>(chunk_overlap_);
  std::vector<TextSpan> chunks{};
  chunks.reserve(segments.size());
  for (const auto& segment : segments) {
    if (IsBlank(text.substr(segment.start, segment.length))) {
      continue;
    }
    if (chunks.empty()) {
      chunks.push_back(segment);
      continue;
    }
    const auto start = segment.start >= overlap ? segment.start - overlap : 0;
    chunks.push_back(TextSpan{start, segment.start + segment.length - start});
  }
  return chunks;
}

std::vector<std::string> RecursiveTextSplitter::SplitText(std::string_view text) const {
  std::vector<std::string> out{};
  for (const auto& span : SplitSpans(text)) {
    out.emplace_back(text.substr(span.start, span.length));
  }
  return out;
}

}  // namespace rgkb
