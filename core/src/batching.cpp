#include <format>
#include <railog/batching.hpp>
#include <railog/errors.hpp>
#include <railog/io.hpp>
#include <railog/logging.hpp>
#include <railog/tracy.hpp>
#include <stdexcept>

namespace railog {

  LineBatcher::LineBatcher(std::istream& in, size_t batch_size) : in_(in), batch_size_(batch_size) {
    if (batch_size == 0) {
      throw std::invalid_argument("batch_size must be positive");
    }
  }

  std::optional<std::vector<std::string>> LineBatcher::next_batch() {
    std::vector<std::string> batch;
    batch.reserve(batch_size_);
    std::string line;
    while (batch.size() < batch_size_ && read_line(in_, line)) {
      batch.push_back(std::move(line));
    }
    if (in_.bad()) {
      throw IoError(std::format("Read failed after {} lines", lines_read_ + batch.size()));
    }
    if (batch.empty()) return std::nullopt;
    lines_read_ += batch.size();
    return batch;
  }

  EmbeddingMatrix concat_rows(std::span<const EmbeddingMatrix> blocks) {
    if (blocks.empty()) return {};

    const auto cols = blocks.front().cols();
    Eigen::Index rows = 0;
    for (size_t i = 0; i < blocks.size(); ++i) {
      if (blocks[i].cols() != cols) {
        throw ShapeError(std::format("block {} has {} columns, expected {}", i, blocks[i].cols(), cols));
      }
      rows += blocks[i].rows();
    }

    EmbeddingMatrix out(rows, cols);
    Eigen::Index offset = 0;
    for (const auto& block : blocks) {
      out.middleRows(offset, block.rows()) = block;
      offset += block.rows();
    }
    return out;
  }

  std::optional<EmbeddingMatrix> embed_in_batches(std::istream& in, const Preprocessor& preprocessor,
                                                  IEmbedder& embedder, size_t batch_size) {
    RAILOG_ZONE;
    LineBatcher batcher(in, batch_size);
    std::vector<EmbeddingMatrix> blocks;

    while (auto batch = batcher.next_batch()) {
      std::vector<std::string> canonical;
      canonical.reserve(batch->size());
      for (const auto& line : *batch) {
        canonical.push_back(preprocessor.normalize(line));
      }

      log_info("Generating embeddings for batch of {} log messages...", canonical.size());
      auto block = embedder.embed(canonical);
      if (static_cast<size_t>(block.rows()) != canonical.size()) {
        throw ShapeError(std::format("embedder returned {} rows for a batch of {}", block.rows(),
                                     canonical.size()));
      }
      blocks.push_back(std::move(block));
    }

    if (blocks.empty()) return std::nullopt;
    return concat_rows(blocks);
  }

}  // namespace railog
