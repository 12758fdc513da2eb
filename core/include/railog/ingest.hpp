#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <railog/cluster.hpp>
#include <railog/embedder.hpp>
#include <railog/preprocessor.hpp>
#include <railog/timestamp.hpp>
#include <railog/types.hpp>
#include <string>
#include <unordered_set>

namespace railog {

  struct IngestParams {
    float threshold = 0.5f;      // match when nearest distance is strictly below
    float learning_rate = 0.1f;  // in (0, 1]

    // Throws std::invalid_argument
    void validate() const;
  };

  struct IngestSummary {
    size_t total = 0;  // records past the time gate and dedup
    size_t matched = 0;

    [[nodiscard]] size_t unmatched() const noexcept { return total - matched; }
  };

  // centroid <- centroid + rate * (embedding - centroid)
  void update_centroid(EmbeddingMatrix& centroids, size_t row, const EmbeddingVector& embedding,
                       float learning_rate);

  [[nodiscard]] LogRecord make_record(std::string raw, const Preprocessor& preprocessor,
                                      TimePoint now);

  /**
   * One ingestion run over a mutable CentroidSet.
   *
   * Records older than `cutoff` are skipped, as is any canonical string already
   * seen in this run. Survivors are embedded and matched against the nearest
   * centroid: matches pull that centroid toward the embedding, non-matches are
   * appended to `overflow` as one line each. The caller persists the centroids
   * once the run is over; nothing here touches the centroid file.
   */
  class Ingestor {
  public:
    Ingestor(EmbeddingMatrix& centroids, IEmbedder& embedder, std::ostream& overflow,
             IngestParams params, TimePoint cutoff);

    Ingestor(const Ingestor&) = delete;
    Ingestor& operator=(const Ingestor&) = delete;

    // Empty when the record was skipped (too old, or a duplicate)
    std::optional<MatchDecision> process(const LogRecord& record);

    [[nodiscard]] const IngestSummary& summary() const noexcept { return summary_; }
    [[nodiscard]] size_t skipped_stale() const noexcept { return skipped_stale_; }
    [[nodiscard]] size_t skipped_duplicate() const noexcept { return skipped_duplicate_; }

  private:
    EmbeddingVector embed(const std::string& canonical);

    EmbeddingMatrix& centroids_;
    IEmbedder& embedder_;
    std::ostream& overflow_;
    IngestParams params_;
    TimePoint cutoff_;
    ClusterEngine engine_;

    std::unordered_set<std::string> seen_;
    IngestSummary summary_;
    size_t skipped_stale_ = 0;
    size_t skipped_duplicate_ = 0;
  };

}  // namespace railog
