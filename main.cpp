#include "./lib.cpp" // Include all definitions from lib.cpp

// Standard Headers needed by main itself
#include <csignal>  // For ignoring SIGPIPE
#include <iostream> // For std::cout, std::cerr

int main(int argc, char *argv[]) {
  // 1. Parse Arguments
  Config config = parse_arguments(argc, argv);

  // 2. A clipboard helper that exits early must not kill the process
  std::signal(SIGPIPE, SIG_IGN);

  // 3. Tokenizer, searched in --encoding-dir first
  BpeTokenCounter counter(default_encoding_search_dirs(config.encodingDir));

  bool success = false;
  try {
    TokenizerScope tokenizer(counter, config.encoding);

    // 4. Interactive selection when no targets were given
    if (config.fzfMode && config.targets.empty()) {
      if (!select_with_fzf(config.targets)) {
        return 1;
      }
      if (config.targets.empty()) {
        std::cerr << "No files selected.\n\n";
        print_usage(argv[0]);
        return 0;
      }
    }

    if (config.targets.empty()) {
      std::cerr << "ERROR: No targets given.\n\n";
      print_usage(argv[0]);
      return 1;
    }

    // 5. Aggregate and hand off
    AggregationResult result =
        aggregate_targets(config, tokenizer.counter(), fetch_url);
    success = deliver_result(config, result);
  } catch (const std::exception &e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    success = false;
  } catch (...) {
    std::cerr << "ERROR: Unknown unhandled exception during processing."
              << std::endl;
    success = false;
  }

  return success ? 0 : 1;
}
