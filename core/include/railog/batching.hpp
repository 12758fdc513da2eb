#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <railog/embedder.hpp>
#include <railog/preprocessor.hpp>
#include <railog/types.hpp>
#include <span>
#include <string>
#include <vector>

namespace railog {

  inline constexpr size_t DEFAULT_BATCH_SIZE = 1024;

  // Lazily splits a line source into groups of at most `batch_size` lines,
  // in input order. Restart by re-opening the source.
  class LineBatcher {
  public:
    explicit LineBatcher(std::istream& in, size_t batch_size = DEFAULT_BATCH_SIZE);

    // Empty at end of input; never yields an empty batch
    [[nodiscard]] std::optional<std::vector<std::string>> next_batch();

    [[nodiscard]] size_t batch_size() const noexcept { return batch_size_; }
    [[nodiscard]] size_t lines_read() const noexcept { return lines_read_; }

  private:
    std::istream& in_;
    size_t batch_size_;
    size_t lines_read_ = 0;
  };

  // Row-wise concatenation; ShapeError when column counts differ
  [[nodiscard]] EmbeddingMatrix concat_rows(std::span<const EmbeddingMatrix> blocks);

  // Normalizes and embeds `in` batch by batch, then concatenates the blocks.
  // Empty when the input has no lines, which is distinct from a corpus that
  // later yields no clusters.
  [[nodiscard]] std::optional<EmbeddingMatrix> embed_in_batches(std::istream& in,
                                                                const Preprocessor& preprocessor,
                                                                IEmbedder& embedder,
                                                                size_t batch_size
                                                                = DEFAULT_BATCH_SIZE);

}  // namespace railog
