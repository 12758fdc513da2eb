#pragma once
#include <cstddef>
#include <memory>
#include <railog/types.hpp>
#include <span>
#include <string>
#include <string_view>

namespace railog {

  // Abstract sentence embedder. Implementations return one unit-length row per
  // input, with the same dimension for every call; failures throw EmbedderError.
  class IEmbedder {
  public:
    virtual ~IEmbedder() = default;

    IEmbedder(const IEmbedder&) = delete;
    IEmbedder& operator=(const IEmbedder&) = delete;
    IEmbedder(IEmbedder&&) = delete;
    IEmbedder& operator=(IEmbedder&&) = delete;

    // Shape: (batch.size(), dim())
    [[nodiscard]] virtual EmbeddingMatrix embed(std::span<const std::string> batch) = 0;

    [[nodiscard]] virtual size_t dim() const noexcept = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  protected:
    IEmbedder() = default;
  };

  /**
   * Feature-hashing bag-of-tokens embedder.
   *
   * Text is lowercased and split on non-alphanumeric characters; each token is
   * hashed (64-bit FNV-1a) into one of `dim` buckets with a sign taken from
   * the high hash bit, then the row is L2-normalized. Output depends only on
   * the text and `dim`, so centroids stay comparable across processes.
   */
  class HashingEmbedder final : public IEmbedder {
  public:
    static constexpr size_t DEFAULT_DIM = 384;

    explicit HashingEmbedder(size_t dim = DEFAULT_DIM);

    [[nodiscard]] EmbeddingMatrix embed(std::span<const std::string> batch) override;
    [[nodiscard]] size_t dim() const noexcept override { return dim_; }
    [[nodiscard]] std::string_view name() const noexcept override { return "hashing"; }

    [[nodiscard]] EmbeddingVector embed_one(std::string_view text) const;

  private:
    size_t dim_;
  };

  // Builds the embedder named in the configuration ("hashing")
  [[nodiscard]] std::unique_ptr<IEmbedder> create_embedder(std::string_view model, size_t dim);

}  // namespace railog
