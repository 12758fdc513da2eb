#include <cmath>
#include <format>
#include <railog/errors.hpp>
#include <railog/ingest.hpp>
#include <railog/logging.hpp>
#include <railog/tracy.hpp>
#include <stdexcept>

namespace railog {

  void IngestParams::validate() const {
    if (!(threshold > 0.0f)) {
      throw std::invalid_argument(std::format("threshold must be positive, got {}", threshold));
    }
    if (!(learning_rate > 0.0f && learning_rate <= 1.0f)) {
      throw std::invalid_argument(
          std::format("learning_rate must be in (0, 1], got {}", learning_rate));
    }
  }

  void update_centroid(EmbeddingMatrix& centroids, size_t row, const EmbeddingVector& embedding,
                       float learning_rate) {
    if (static_cast<Eigen::Index>(row) >= centroids.rows()) {
      throw std::out_of_range(
          std::format("centroid {} out of range for {} centroids", row, centroids.rows()));
    }
    if (embedding.size() != centroids.cols()) {
      throw ShapeError(std::format("embedding has dimension {}, centroids have {}", embedding.size(),
                                   centroids.cols()));
    }
    auto centroid = centroids.row(static_cast<Eigen::Index>(row));
    centroid += learning_rate * (embedding.transpose() - centroid);
  }

  LogRecord make_record(std::string raw, const Preprocessor& preprocessor, TimePoint now) {
    LogRecord record;
    record.timestamp = record_timestamp(raw, now);
    record.canonical = preprocessor.normalize(raw);
    record.raw = std::move(raw);
    return record;
  }

  Ingestor::Ingestor(EmbeddingMatrix& centroids, IEmbedder& embedder, std::ostream& overflow,
                     IngestParams params, TimePoint cutoff)
      : centroids_(centroids),
        embedder_(embedder),
        overflow_(overflow),
        params_(params),
        cutoff_(cutoff),
        engine_(embedder.dim()) {
    params_.validate();
    if (centroids_.rows() > 0 && static_cast<size_t>(centroids_.cols()) != embedder_.dim()) {
      throw ShapeError(std::format("centroids have dimension {}, embedder produces {}",
                                   centroids_.cols(), embedder_.dim()));
    }
  }

  EmbeddingVector Ingestor::embed(const std::string& canonical) {
    auto rows = embedder_.embed(std::span<const std::string>(&canonical, 1));
    if (rows.rows() != 1) {
      throw ShapeError(std::format("embedder returned {} rows for a single message", rows.rows()));
    }
    return rows.row(0).transpose();
  }

  std::optional<MatchDecision> Ingestor::process(const LogRecord& record) {
    RAILOG_ZONE;
    if (record.timestamp < cutoff_) {
      ++skipped_stale_;
      return std::nullopt;
    }
    if (!seen_.insert(record.canonical).second) {
      ++skipped_duplicate_;
      return std::nullopt;
    }

    auto embedding = embed(record.canonical);
    auto decision = decide(engine_.assign(centroids_, embedding), params_.threshold);

    std::visit(overloaded{[&](const Matched& m) {
                            ++summary_.matched;
                            log_debug("'{}' -> Match Cluster {} (distance: {:.4f})",
                                      record.canonical, m.centroid, m.distance);
                            update_centroid(centroids_, m.centroid, embedding,
                                            params_.learning_rate);
                          },
                          [&](const Unmatched& u) {
                            log_debug("'{}' -> No match (distance: {:.4f})", record.canonical,
                                      u.distance);
                            overflow_ << record.canonical << '\n';
                            if (!overflow_) {
                              throw IoError("Failed to write unmatched message");
                            }
                          }},
               decision);

    ++summary_.total;
    return decision;
  }

}  // namespace railog
