#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace rgkb {

struct TextSpan {
  std::size_t start = 0;
  std::size_t length = 0;
};

// Recursive separator splitter. Text is first cut into contiguous segments of at most
// chunk_size - chunk_overlap characters along the highest-priority separator present,
// narrowing to lower-priority separators for pieces that still do not fit. Each chunk after
// the first is then extended backwards by chunk_overlap characters, so consecutive chunks
// share exactly chunk_overlap characters once the parent is long enough. A piece with no
// separator left is kept whole.
class RecursiveTextSplitter {
 public:
  RecursiveTextSplitter(int chunk_size, int chunk_overlap);
  RecursiveTextSplitter(int chunk_size, int chunk_overlap, std::vector<std::string> separators);

  [[nodiscard]] std::vector<TextSpan> SplitSpans(std::string_view text) const;
  [[nodiscard]] std::vector<std::string> SplitText(std::string_view text) const;

  [[nodiscard]] int chunk_size() const { return chunk_size_; }
  [[nodiscard]] int chunk_overlap() const { return chunk_overlap_; }
  [[nodiscard]] const std::vector<std::string>& separators() const { return separators_; }

  static std::vector<std::string> DefaultSeparators();

 private:
  void Segment(std::string_view text,
               std::size_t begin,
               std::size_t end,
               std::size_t separator_level,
               std::vector<TextSpan>& out) const;

  int chunk_size_;
  int chunk_overlap_;
  std::vector<std::string> separators_;
};

}  // namespace rgkb
