#include <format>
#include <railog/centroid_store.hpp>
#include <railog/commands.hpp>
#include <railog/errors.hpp>
#include <railog/io.hpp>
#include <railog/logging.hpp>
#include <railog/retrain.hpp>
#include <railog/tracy.hpp>
#include <span>
#include <string>
#include <variant>

namespace railog {

  namespace {

    void print_assignments(const std::string& input_file, std::span<const ClassificationTag> tags,
                           std::ostream& out) {
      auto in = open_input(input_file);
      out << "--- Cluster Assignments ---\n";
      std::string line;
      for (const auto& tag : tags) {
        if (!read_line(in, line)) break;
        std::visit(overloaded{[&](const Noise&) { out << std::format("'{}' -> Noise\n", line); },
                              [&](const auto& member) {
                                out << std::format("'{}' -> Cluster {}\n", line, member.cluster);
                              }},
                   tag);
      }
      out << "-------------------------\n";
    }

  }  // namespace

  std::optional<TrainSummary> train(const TrainOptions& options, const Preprocessor& preprocessor,
                                    IEmbedder& embedder, std::ostream& out) {
    RAILOG_ZONE;
    options.params.validate();

    out << std::format("Reading and parsing log file in batches: {}\n", options.input_file);
    auto in = open_input(options.input_file);
    auto embeddings = embed_in_batches(in, preprocessor, embedder, options.batch_size);
    if (!embeddings) {
      out << "No log messages found in input file.\n";
      return std::nullopt;
    }

    out << std::format("Running DBSCAN clustering with epsilon={} and min_points={}...\n",
                       options.params.epsilon, options.params.min_points);
    auto tags = dbscan(*embeddings, options.params);
    if (options.verbose) {
      print_assignments(options.input_file, tags, out);
    }

    auto result = reduce_clusters(*embeddings, tags);
    if (result.centroids.rows() == 0) {
      throw NoClustersFoundError();
    }

    CentroidStore(options.output_file).save(result.centroids);

    TrainSummary summary;
    summary.messages = static_cast<size_t>(embeddings->rows());
    summary.clusters = static_cast<size_t>(result.centroids.rows());
    summary.noise_points = result.noise_points;

    out << std::format("DBSCAN found {} clusters and {} noise points.\n", summary.clusters,
                       summary.noise_points);
    out << std::format("Successfully saved {} centroids to {}\n", summary.clusters,
                       options.output_file);
    return summary;
  }

  IngestSummary ingest(const IngestOptions& options, const Preprocessor& preprocessor,
                       IEmbedder& embedder, std::ostream& out) {
    RAILOG_ZONE;
    CentroidStore store(options.centroids_file);

    out << std::format("Loading centroids from {}...\n", options.centroids_file);
    const auto cutoff = store.last_modified();
    auto centroids = store.load();

    out << std::format("Reading and parsing new log file: {}\n", options.input_file);
    auto in = open_input(options.input_file);
    auto overflow = open_append(options.unmatched_file);

    Ingestor ingestor(centroids, embedder, overflow, options.params, cutoff);
    std::string line;
    while (read_line(in, line)) {
      (void)ingestor.process(make_record(line, preprocessor, Clock::now()));
    }
    if (in.bad()) {
      throw IoError(std::format("Failed to read {}", options.input_file));
    }

    overflow.flush();
    if (!overflow) {
      throw IoError(std::format("Failed to write {}", options.unmatched_file));
    }
    log_debug("Skipped {} stale and {} duplicate messages", ingestor.skipped_stale(),
              ingestor.skipped_duplicate());

    const auto summary = ingestor.summary();
    out << "Ingestion complete.\n";
    out << std::format("{} messages matched and updated centroids.\n", summary.matched);
    out << std::format("{} messages did not match and were written to {}.\n", summary.unmatched(),
                       options.unmatched_file);

    store.save(centroids);
    out << "Centroids file updated.\n";
    return summary;
  }

  RetrainSummary retrain(const RetrainOptions& options, const Preprocessor& preprocessor,
                         IEmbedder& embedder, std::ostream& out) {
    RAILOG_ZONE;
    CentroidStore store(options.centroids_file);

    out << std::format("Loading existing centroids from {}...\n", options.centroids_file);
    auto centroids = store.load();

    out << std::format("Reading and parsing new training data from {}\n", options.input_file);
    if (options.verbose) {
      auto in = open_input(options.input_file);
      std::string line;
      while (read_line(in, line)) {
        out << std::format("Adding new centroid from: '{}'\n", preprocessor.normalize(line));
      }
    }

    auto in = open_input(options.input_file);
    auto new_rows = embed_in_batches(in, preprocessor, embedder, options.batch_size);
    if (!new_rows) {
      out << "Input file is empty. No new centroids to add.\n";
      return {0, static_cast<size_t>(centroids.rows())};
    }

    append_centroids(centroids, *new_rows);
    store.save(centroids);

    RetrainSummary summary{static_cast<size_t>(new_rows->rows()),
                           static_cast<size_t>(centroids.rows())};
    out << std::format("Successfully added {} new centroids. Total centroids: {}\n", summary.added,
                       summary.total);
    return summary;
  }

  size_t test_patterns(const std::string& input_file, const Preprocessor& preprocessor,
                       std::ostream& out) {
    out << std::format("Testing patterns on log file: {}\n", input_file);
    auto in = open_input(input_file);
    size_t count = 0;
    std::string line;
    while (read_line(in, line)) {
      out << std::format("Original:  '{}'\n", line);
      out << std::format("Processed: '{}'\n\n", preprocessor.normalize(line));
      ++count;
    }
    if (in.bad()) {
      throw IoError(std::format("Failed to read {}", input_file));
    }
    return count;
  }

}  // namespace railog
