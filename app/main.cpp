#include <charconv>
#include <exception>
#include <expected>
#include <format>
#include <iostream>
#include <optional>
#include <railog/commands.hpp>
#include <railog/config.hpp>
#include <railog/embedder.hpp>
#include <railog/logging.hpp>
#include <railog/preprocessor.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace {

  constexpr int EXIT_FATAL = 1;
  constexpr int EXIT_USAGE = 2;

  struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Values given on the command line; unset fields keep the config or
  // per-command default
  struct CliOptions {
    std::string command;
    std::optional<std::string> config_file;
    std::optional<std::string> patterns_file;
    std::optional<std::string> input_file;
    std::optional<std::string> output_file;
    std::optional<std::string> centroids_file;
    std::optional<std::string> unmatched_file;
    std::optional<float> epsilon;
    std::optional<size_t> min_points;
    std::optional<float> threshold;
    std::optional<float> learning_rate;
    std::optional<size_t> batch_size;
    std::optional<size_t> embedding_dim;
    bool verbose = false;
    bool help = false;
  };

  void print_usage(std::ostream& os, const char* prog) {
    os << "Usage: " << prog << " <command> [OPTIONS]\n\n"
       << "COMMANDS:\n"
       << "  train          Cluster a log corpus into centroids\n"
       << "  ingest         Match new logs against centroids, update them, log unknowns\n"
       << "  retrain        Add every backlog message as a new centroid\n"
       << "  test-patterns  Show each line before and after preprocessing\n\n"
       << "train OPTIONS:\n"
       << "  --input-file FILE       Corpus to train on (default: example.txt)\n"
       << "  --output-file FILE      Centroids output (default: centroids.json)\n"
       << "  --epsilon E             DBSCAN neighborhood radius (default: 0.5)\n"
       << "  --min-points N          DBSCAN density threshold (default: 3)\n\n"
       << "ingest OPTIONS:\n"
       << "  --input-file FILE       New logs (default: new_logs.txt)\n"
       << "  --centroids-file FILE   Centroids to match and update (default: centroids.json)\n"
       << "  --unmatched-file FILE   Unmatched messages, appended (default: unmatched.log)\n"
       << "  --threshold T           Match distance threshold (default: 0.5)\n"
       << "  --learning-rate R       Centroid update rate (default: 0.1)\n\n"
       << "retrain OPTIONS:\n"
       << "  --input-file FILE       Backlog of messages (default: unmatched.log)\n"
       << "  --centroids-file FILE   Centroids to extend (default: centroids.json)\n\n"
       << "test-patterns OPTIONS:\n"
       << "  --input-file FILE       Lines to preprocess (default: new_logs.txt)\n\n"
       << "GLOBAL OPTIONS:\n"
       << "  --patterns-file FILE    Preprocessing rules (default: patterns.txt)\n"
       << "  -c, --config FILE       JSON configuration file\n"
       << "  --batch-size N          Lines per embedding batch (default: 1024)\n"
       << "  --embedding-dim D       Embedding dimension (default: 384)\n"
       << "  -v, --verbose           Verbose output\n"
       << "  -h, --help              Show this help\n";
  }

  template <typename T> T parse_number(std::string_view flag, std::string_view text) {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
      throw UsageError(std::format("Invalid value for {}: '{}'", flag, text));
    }
    return value;
  }

  bool command_accepts(std::string_view command, std::string_view flag) {
    if (flag == "--input-file") return true;
    if (command == "train") {
      return flag == "--output-file" || flag == "--epsilon" || flag == "--min-points";
    }
    if (command == "ingest") {
      return flag == "--centroids-file" || flag == "--unmatched-file" || flag == "--threshold"
             || flag == "--learning-rate";
    }
    if (command == "retrain") return flag == "--centroids-file";
    return false;
  }

  CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
      std::string_view arg = argv[i];

      auto value = [&]() -> std::string_view {
        if (++i >= argc) throw UsageError(std::format("Missing value for {}", arg));
        return argv[i];
      };

      if (arg == "--help" || arg == "-h") {
        opts.help = true;
      } else if (arg == "--verbose" || arg == "-v") {
        opts.verbose = true;
      } else if (arg == "--config" || arg == "-c") {
        opts.config_file = std::string(value());
      } else if (arg == "--patterns-file") {
        opts.patterns_file = std::string(value());
      } else if (arg == "--batch-size") {
        opts.batch_size = parse_number<size_t>(arg, value());
      } else if (arg == "--embedding-dim") {
        opts.embedding_dim = parse_number<size_t>(arg, value());
      } else if (!arg.empty() && arg[0] != '-') {
        if (!opts.command.empty()) {
          throw UsageError(std::format("Unexpected argument '{}'", arg));
        }
        opts.command = arg;
      } else if (opts.command.empty()) {
        throw UsageError(std::format("Option {} must follow a command", arg));
      } else if (!command_accepts(opts.command, arg)) {
        throw UsageError(std::format("Unknown option {} for {}", arg, opts.command));
      } else if (arg == "--input-file") {
        opts.input_file = std::string(value());
      } else if (arg == "--output-file") {
        opts.output_file = std::string(value());
      } else if (arg == "--centroids-file") {
        opts.centroids_file = std::string(value());
      } else if (arg == "--unmatched-file") {
        opts.unmatched_file = std::string(value());
      } else if (arg == "--epsilon") {
        opts.epsilon = parse_number<float>(arg, value());
      } else if (arg == "--min-points") {
        opts.min_points = parse_number<size_t>(arg, value());
      } else if (arg == "--threshold") {
        opts.threshold = parse_number<float>(arg, value());
      } else if (arg == "--learning-rate") {
        opts.learning_rate = parse_number<float>(arg, value());
      }
    }

    if (opts.help) return opts;
    if (opts.command.empty()) throw UsageError("A command is required");
    if (opts.command != "train" && opts.command != "ingest" && opts.command != "retrain"
        && opts.command != "test-patterns") {
      throw UsageError(std::format("Unknown command '{}'", opts.command));
    }
    return opts;
  }

  railog::RailogConfig resolve_config(const CliOptions& opts) {
    auto config = opts.config_file ? railog::RailogConfig::from_json(*opts.config_file)
                                   : railog::RailogConfig{};
    if (opts.patterns_file) config.patterns_file = *opts.patterns_file;
    if (opts.batch_size) config.batching.batch_size = *opts.batch_size;
    if (opts.embedding_dim) config.embedding.dim = *opts.embedding_dim;
    if (opts.epsilon) config.training.epsilon = *opts.epsilon;
    if (opts.min_points) config.training.min_points = *opts.min_points;
    if (opts.threshold) config.ingest.threshold = *opts.threshold;
    if (opts.learning_rate) config.ingest.learning_rate = *opts.learning_rate;
    config.validate();
    return config;
  }

  void run(const CliOptions& opts) {
    const auto config = resolve_config(opts);
    const auto preprocessor = railog::Preprocessor::from_file(config.patterns_file);

    if (opts.command == "test-patterns") {
      (void)railog::test_patterns(opts.input_file.value_or("new_logs.txt"), preprocessor,
                                  std::cout);
      return;
    }

    auto embedder = railog::create_embedder(config.embedding.model, config.embedding.dim);
    railog::log_debug("Using {} embedder, dimension {}", embedder->name(), embedder->dim());

    if (opts.command == "train") {
      railog::TrainOptions options;
      if (opts.input_file) options.input_file = *opts.input_file;
      if (opts.output_file) options.output_file = *opts.output_file;
      options.params = config.training;
      options.batch_size = config.batching.batch_size;
      options.verbose = opts.verbose;
      (void)railog::train(options, preprocessor, *embedder, std::cout);
    } else if (opts.command == "ingest") {
      railog::IngestOptions options;
      if (opts.input_file) options.input_file = *opts.input_file;
      if (opts.centroids_file) options.centroids_file = *opts.centroids_file;
      if (opts.unmatched_file) options.unmatched_file = *opts.unmatched_file;
      options.params = config.ingest;
      (void)railog::ingest(options, preprocessor, *embedder, std::cout);
    } else {
      railog::RetrainOptions options;
      if (opts.input_file) options.input_file = *opts.input_file;
      if (opts.centroids_file) options.centroids_file = *opts.centroids_file;
      options.batch_size = config.batching.batch_size;
      options.verbose = opts.verbose;
      (void)railog::retrain(options, preprocessor, *embedder, std::cout);
    }
  }

  std::expected<void, std::string> dispatch(const CliOptions& opts) {
    try {
      run(opts);
    } catch (const std::exception& e) {
      return std::unexpected(e.what());
    }
    return {};
  }

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  try {
    opts = parse_args(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << "Error: " << e.what() << "\n\n";
    print_usage(std::cerr, argv[0]);
    return EXIT_USAGE;
  }

  if (opts.help) {
    print_usage(std::cout, argv[0]);
    return 0;
  }

  if (opts.verbose) {
    railog::default_logger().set_level(railog::LogLevel::Debug);
  }

  if (auto result = dispatch(opts); !result) {
    std::cout.flush();
    std::cerr << "Error: " << result.error() << '\n';
    return EXIT_FATAL;
  }
  return 0;
}
