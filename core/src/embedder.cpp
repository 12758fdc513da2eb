#include <cctype>
#include <cstdint>
#include <format>
#include <railog/embedder.hpp>
#include <railog/errors.hpp>
#include <railog/tracy.hpp>
#include <stdexcept>

namespace railog {

  namespace {

    constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
    constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

    uint64_t fnv1a(std::string_view token) noexcept {
      uint64_t hash = FNV_OFFSET_BASIS;
      for (unsigned char c : token) {
        hash ^= c;
        hash *= FNV_PRIME;
      }
      return hash;
    }

  }  // namespace

  HashingEmbedder::HashingEmbedder(size_t dim) : dim_(dim) {
    if (dim == 0) {
      throw std::invalid_argument("embedding dimension must be positive");
    }
  }

  EmbeddingVector HashingEmbedder::embed_one(std::string_view text) const {
    EmbeddingVector vec = EmbeddingVector::Zero(static_cast<Eigen::Index>(dim_));
    size_t n_tokens = 0;

    auto add_token = [&](std::string_view token) {
      uint64_t h = fnv1a(token);
      auto bucket = static_cast<Eigen::Index>(h % dim_);
      vec(bucket) += (h >> 63) != 0 ? -1.0f : 1.0f;
      ++n_tokens;
    };

    std::string token;
    for (unsigned char c : text) {
      if (std::isalnum(c)) {
        token += static_cast<char>(std::tolower(c));
      } else if (!token.empty()) {
        add_token(token);
        token.clear();
      }
    }
    if (!token.empty()) add_token(token);

    float norm = vec.norm();
    // Empty text, or tokens that cancelled out: fall back to the empty token
    if (n_tokens == 0 || norm == 0.0f) {
      vec.setZero();
      add_token("");
      norm = vec.norm();
    }

    vec /= norm;
    return vec;
  }

  EmbeddingMatrix HashingEmbedder::embed(std::span<const std::string> batch) {
    RAILOG_ZONE;
    EmbeddingMatrix out(static_cast<Eigen::Index>(batch.size()), static_cast<Eigen::Index>(dim_));
    for (size_t i = 0; i < batch.size(); ++i) {
      out.row(static_cast<Eigen::Index>(i)) = embed_one(batch[i]).transpose();
    }
    return out;
  }

  std::unique_ptr<IEmbedder> create_embedder(std::string_view model, size_t dim) {
    if (model == "hashing") {
      return std::make_unique<HashingEmbedder>(dim);
    }
    throw EmbedderError(std::format("Unknown embedding model: '{}'", model));
  }

}  // namespace railog
