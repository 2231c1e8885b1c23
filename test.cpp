#include "lib.cpp" // Include the implementation directly for testing

#include <atomic>
#include <cassert>
#include <filesystem> // Already included via lib.cpp but good practice
#include <functional> // For std::function
#include <iostream>   // For std::cerr, std::cout, std::endl
#include <sstream> // For std::stringstream
#include <string>
#include <vector>

#include <sys/resource.h> // For getrusage

const std::string TEST_DIR_NAME = "test_dir_llmcat"; // Use a unique name
const fs::path TEST_DIR_PATH = fs::absolute(TEST_DIR_NAME);

// --- Helper Functions for Testing ---

void cleanup_test_directories() {
  std::error_code ec;
  fs::remove_all(TEST_DIR_PATH, ec);
}

// Creates a test file, ensuring parent directory exists
void create_test_file(const fs::path &absolute_path,
                      const std::string &content) {
  try {
    if (absolute_path.has_parent_path()) {
      fs::create_directories(absolute_path.parent_path());
    }
    std::ofstream file(absolute_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      std::cerr << "Error creating test file: " << normalize_path(absolute_path)
                << std::endl;
      return;
    }
    file << content;
  } catch (const std::exception &e) {
    std::cerr << "Exception creating test file "
              << normalize_path(absolute_path) << ": " << e.what() << std::endl;
  }
}

// Creates the main test directory structure
void create_test_directory_structure() {
  cleanup_test_directories(); // Clean first
  create_test_file(TEST_DIR_PATH / "scenario" / "a.txt", "abc");
  create_test_file(TEST_DIR_PATH / "scenario" / "sub" / "b.txt", "de");

  create_test_file(TEST_DIR_PATH / "tree" / "b.txt", "second\n");
  create_test_file(TEST_DIR_PATH / "tree" / "a.txt", "first\n");
  create_test_file(TEST_DIR_PATH / "tree" / "c" / "d.txt", "nested\n");
  create_test_file(TEST_DIR_PATH / "tree" / "c" / "e" / "f.txt", "deeper\n");

  fs::create_directories(TEST_DIR_PATH / "empty");
}

// Captures stdout
std::string capture_stdout(const std::function<void()> &func) {
  std::stringstream buffer;
  std::streambuf *oldCout = std::cout.rdbuf();
  std::cout.rdbuf(buffer.rdbuf());
  func();
  std::cout.rdbuf(oldCout);
  return buffer.str();
}

// Captures stderr
std::string capture_stderr(const std::function<void()> &func) {
  std::stringstream buffer;
  std::streambuf *oldCerr = std::cerr.rdbuf();
  std::cerr.rdbuf(buffer.rdbuf());
  func();
  std::cerr.rdbuf(oldCerr);
  return buffer.str();
}

// Counts one token per byte and records its lifecycle calls
class ByteCountingTokenizer : public TokenCounter {
public:
  bool initialize(const std::string &encoding, std::string &error) override {
    ++initializeCalls;
    if (encoding == "broken") {
      error = "broken encoding";
      return false;
    }
    return true;
  }
  size_t count(std::string_view text) const override { return text.size(); }
  void teardown() override { ++teardownCalls; }

  int initializeCalls = 0;
  int teardownCalls = 0;
};

FetchResult unreachable_fetch(const std::string &url) {
  FetchResult result;
  result.error = "unexpected fetch of " + url;
  return result;
}

Config get_default_config(const std::vector<std::string> &targets) {
  Config config;
  config.targets = targets;
  return config;
}

// Splits an aggregated buffer before each fragment header, sorted
std::vector<std::string> sorted_blocks(const std::string &buffer) {
  std::vector<std::string> blocks;
  size_t start = 0;
  size_t pos = 0;
  while ((pos = buffer.find("\n\n[ ", start)) != std::string::npos) {
    blocks.push_back(buffer.substr(start, pos + 2 - start));
    start = pos + 2;
  }
  if (start < buffer.size())
    blocks.push_back(buffer.substr(start));
  std::sort(blocks.begin(), blocks.end());
  return blocks;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

// Answers HTTP/1.1 requests on 127.0.0.1 from a background thread:
// /ok and /created succeed, /redir redirects relatively to /ok, /loop
// redirects to itself and anything else is a 404.
class LocalHttpServer {
public:
  LocalHttpServer()
      : acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
    accept();
    thread_ = std::thread([this]() { ioc_.run(); });
  }
  ~LocalHttpServer() {
    ioc_.stop();
    thread_.join();
  }

  LocalHttpServer(const LocalHttpServer &) = delete;
  LocalHttpServer &operator=(const LocalHttpServer &) = delete;

  std::string url(const std::string &target) const {
    return "http://127.0.0.1:" +
           std::to_string(acceptor_.local_endpoint().port()) + target;
  }
  int loop_requests() const { return loopRequests_; }

private:
  void accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (ec)
        return;
      serve(socket);
      accept();
    });
  }

  void serve(tcp::socket &socket) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec)
      return;

    const std::string target(req.target().data(), req.target().size());
    http::response<http::string_body> res{http::status::ok, req.version()};
    if (target == "/ok") {
      res.body() = "fetched body";
    } else if (target == "/created") {
      res.result(http::status::created);
      res.body() = "new";
    } else if (target == "/redir") {
      res.result(http::status::found);
      res.set(http::field::location, "ok");
    } else if (target == "/loop") {
      ++loopRequests_;
      res.result(http::status::found);
      res.set(http::field::location, "/loop");
    } else {
      res.result(http::status::not_found);
      res.body() = "nothing here";
    }
    res.keep_alive(false);
    res.prepare_payload();
    http::write(socket, res, ec);
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

  asio::io_context ioc_;
  tcp::acceptor acceptor_;
  std::thread thread_;
  std::atomic<int> loopRequests_{0};
};

// --- Test Functions ---

void test_trim() {
  std::cout << "Test: Trim..." << std::flush;
  assert(trim("  hello  ") == "hello");
  assert(trim("\tworld\n") == "world");
  assert(trim("no whitespace") == "no whitespace");
  assert(trim("") == "");
  std::cout << " Passed\n";
}

void test_should_exclude() {
  std::cout << "Test: Exclusion patterns..." << std::flush;
  assert(should_exclude("node_modules", {"node_modules"}));       // Exact
  assert(should_exclude("src/lib/main.log", {".log"}));           // Suffix
  assert(should_exclude("a/node_modules/x.js", {"node_modules"})); // Substring
  assert(should_exclude("build/out.o", {"build"}));               // Directory
  assert(should_exclude("build/out.o", {"build/"}));
  assert(!should_exclude("src/main.cpp", {}));
  assert(!should_exclude("src/main.cpp", {"test", ".hpp"}));
  assert(should_exclude("src/main.cpp", {"test", "main"})); // Any pattern
  // Single characters match almost everything
  assert(should_exclude("src/main.cpp", {"m"}));
  assert(!should_exclude("src/lib.cpp", {"z"}));
  std::cout << " Passed\n";
}

void test_target_helpers() {
  std::cout << "Test: Target helpers..." << std::flush;
  assert(is_url_target("http://example.com"));
  assert(is_url_target("https://example.com/a"));
  assert(!is_url_target("ftp://example.com"));
  assert(!is_url_target("src/http://x"));

  assert(join_target_path("src", "a.txt") == "src/a.txt");
  assert(join_target_path("src/", "a.txt") == "src/a.txt");
  assert(join_target_path("src", "c/d.txt") == "src/c/d.txt");

  FileTask relative{"c/d.txt", "tree/", false, false};
  assert(task_location(relative) == "tree/c/d.txt");
  FileTask full{"notes.md", "", true, false};
  assert(task_location(full) == "notes.md");
  FileTask url{"https://x.org", "", true, true};
  assert(task_location(url) == "https://x.org");
  assert(format_fragment_header(relative) == "[ tree/c/d.txt ]\n");
  assert(format_fragment_header(url) == "[ URL: https://x.org ]\n");
  std::cout << " Passed\n";
}

void test_expand_targets_urls_and_missing() {
  std::cout << "Test: Expand URLs and missing targets..." << std::flush;
  const std::string missing = TEST_DIR_NAME + "/missing.txt";
  ExpandedTargets expanded =
      expand_targets({"https://example.com/a", missing}, {});
  assert(expanded.structureLines.size() == 2);
  assert(expanded.structureLines[0] == "URL: https://example.com/a");
  assert(expanded.structureLines[1] == missing);
  assert(expanded.tasks.size() == 1); // Missing paths are listed, not read
  assert(expanded.tasks[0].isUrl);
  assert(expanded.tasks[0].path == "https://example.com/a");
  std::cout << " Passed\n";
}

void test_expand_targets_directory_order() {
  std::cout << "Test: Expand directory in sorted order..." << std::flush;
  const std::string target = TEST_DIR_NAME + "/tree";
  ExpandedTargets expanded = expand_targets({target}, {});

  std::vector<std::string> expected_lines = {
      target + "/",          target + "/a.txt",   target + "/b.txt",
      target + "/c/",        target + "/c/d.txt", target + "/c/e/",
      target + "/c/e/f.txt"};
  assert(expanded.structureLines == expected_lines);

  assert(expanded.tasks.size() == 4);
  assert(expanded.tasks[0].path == "a.txt");
  assert(expanded.tasks[2].path == "c/d.txt");
  assert(!expanded.tasks[2].isFullPath);
  assert(expanded.tasks[2].originTarget == target);
  assert(task_location(expanded.tasks[3]) == target + "/c/e/f.txt");

  // A trailing separator on the target is not doubled
  ExpandedTargets slashed = expand_targets({target + "/"}, {});
  assert(slashed.structureLines == expected_lines);
  assert(task_location(slashed.tasks[0]) == target + "/a.txt");
  std::cout << " Passed\n";
}

void test_expand_targets_exclusions() {
  std::cout << "Test: Expand with exclusions..." << std::flush;
  const std::string target = TEST_DIR_NAME + "/tree";

  ExpandedTargets no_d = expand_targets({target}, {"d.txt"});
  assert(no_d.tasks.size() == 3);
  for (const auto &line : no_d.structureLines) {
    assert(!contains(line, "d.txt"));
  }

  // Excluding a directory drops it and everything below it
  ExpandedTargets no_e = expand_targets({target}, {"c/e"});
  std::vector<std::string> expected_lines = {
      target + "/", target + "/a.txt", target + "/b.txt", target + "/c/",
      target + "/c/d.txt"};
  assert(no_e.structureLines == expected_lines);
  assert(no_e.tasks.size() == 3);

  // Top-level targets are filtered too
  ExpandedTargets none = expand_targets({target}, {"tree"});
  assert(none.structureLines.empty());
  assert(none.tasks.empty());

  // Empty directories are listed but produce no tasks
  ExpandedTargets empty = expand_targets({TEST_DIR_NAME + "/empty"}, {});
  assert(empty.structureLines.size() == 1);
  assert(empty.structureLines[0] == TEST_DIR_NAME + "/empty/");
  assert(empty.tasks.empty());
  std::cout << " Passed\n";
}

void test_render_structure() {
  std::cout << "Test: Render structure..." << std::flush;
  assert(render_structure({}) == "[ STRUCTURE ]\n\n");
  assert(render_structure({"a/", "a/b.txt"}) ==
         "[ STRUCTURE ]\na/\na/b.txt\n\n");
  std::cout << " Passed\n";
}

void test_read_file_bounded() {
  std::cout << "Test: Bounded file read..." << std::flush;
  std::string content;
  std::string error;
  assert(read_file_bounded(TEST_DIR_PATH / "tree" / "a.txt", MAX_READ_BYTES,
                           content, error));
  assert(content == "first\n");

  content.clear();
  assert(!read_file_bounded(TEST_DIR_PATH / "nope.txt", MAX_READ_BYTES,
                            content, error));
  assert(!error.empty());

  error.clear();
  assert(!read_file_bounded(TEST_DIR_PATH / "tree" / "b.txt", 3, content,
                            error));
  assert(contains(error, "file too large"));

  error.clear();
  assert(!read_file_bounded(TEST_DIR_PATH / "tree", MAX_READ_BYTES, content,
                            error));
  assert(error == "is a directory");
  std::cout << " Passed\n";
}

void test_task_queue() {
  std::cout << "Test: Task queue claims..." << std::flush;
  TaskQueue queue(3);
  size_t index = 0;
  assert(queue.claim(index) && index == 0);
  assert(queue.claim(index) && index == 1);
  assert(queue.claim(index) && index == 2);
  assert(!queue.claim(index));
  assert(!queue.claim(index));
  assert(queue.size() == 3);

  TaskQueue empty(0);
  assert(!empty.claim(index));
  std::cout << " Passed\n";
}

void test_dispatch_runs_each_task_once() {
  std::cout << "Test: Dispatch runs each task exactly once..." << std::flush;
  const std::vector<size_t> task_counts = {0, 1, 2, 3, 7, 64, 257};
  const std::vector<unsigned int> thread_counts = {1, 2, 4, 16};

  for (size_t n : task_counts) {
    for (unsigned int t : thread_counts) {
      std::vector<std::atomic<int>> runs(n + 1);

      const size_t spawned =
          dispatch_tasks(n, t, [&](size_t index) { runs[index]++; });

      for (size_t i = 0; i < n; ++i) {
        assert(runs[i] == 1);
      }
      assert(runs[n] == 0);

      const size_t workers = effective_worker_count(t, n);
      assert(workers == std::min<size_t>(t, n));
      assert(spawned == (workers <= 1 ? 0 : workers));
    }
  }
  std::cout << " Passed\n";
}

void test_aggregate_scenario_files_and_directory() {
  std::cout << "Test: Aggregate a file and a directory..." << std::flush;
  ByteCountingTokenizer tokenizer;
  const std::string file_target = TEST_DIR_NAME + "/scenario/a.txt";
  const std::string dir_target = TEST_DIR_NAME + "/scenario/sub/";
  Config config = get_default_config({file_target, dir_target});

  AggregationResult result =
      aggregate_targets(config, tokenizer, unreachable_fetch);

  const std::string structure = "[ STRUCTURE ]\n" + file_target + "\n" +
                                dir_target + "\n" + dir_target + "b.txt\n\n";
  const std::string fragment_a = "[ " + file_target + " ]\nabc\n\n";
  const std::string fragment_b = "[ " + dir_target + "b.txt ]\nde\n\n";

  assert(result.buffer.rfind(structure, 0) == 0);
  assert(contains(result.buffer, fragment_a));
  assert(contains(result.buffer, fragment_b));
  assert(result.buffer.size() ==
         structure.size() + fragment_a.size() + fragment_b.size());
  assert(result.totalTokens == 5);
  assert(result.fileCount == 2);
  assert(result.workersSpawned == 2);
  std::cout << " Passed\n";
}

void test_aggregate_scenario_exclusion() {
  std::cout << "Test: Aggregate with an excluded directory..." << std::flush;
  ByteCountingTokenizer tokenizer;
  const std::string target = TEST_DIR_NAME + "/scenario";
  Config config = get_default_config({target});
  config.excludePatterns = {"sub"};

  AggregationResult result =
      aggregate_targets(config, tokenizer, unreachable_fetch);
  assert(result.buffer == "[ STRUCTURE ]\n" + target + "/\n" + target +
                              "/a.txt\n\n[ " + target + "/a.txt ]\nabc\n\n");
  assert(result.totalTokens == 3);
  assert(result.fileCount == 1);
  assert(result.workersSpawned == 0); // A single task runs inline

  // Excluding the target itself leaves only the header
  Config excluded = get_default_config({target + "/sub/"});
  excluded.excludePatterns = {"sub"};
  AggregationResult nothing =
      aggregate_targets(excluded, tokenizer, unreachable_fetch);
  assert(nothing.buffer == "[ STRUCTURE ]\n\n");
  assert(nothing.fileCount == 0);
  assert(nothing.totalTokens == 0);
  std::cout << " Passed\n";
}

void test_aggregate_url_failure() {
  std::cout << "Test: Aggregate a failing URL..." << std::flush;
  ByteCountingTokenizer tokenizer;
  const std::string url = "https://example.test/missing";
  Config config = get_default_config({url});
  UrlFetcher not_found = [](const std::string &) {
    FetchResult result;
    result.status = 404;
    result.error = "HTTP 404 Not Found";
    return result;
  };

  AggregationResult result = aggregate_targets(config, tokenizer, not_found);
  assert(result.buffer == "[ STRUCTURE ]\nURL: " + url + "\n\n[ URL: " + url +
                              " ]\nError fetching URL: HTTP 404 Not Found\n\n");
  assert(result.totalTokens == 0);
  assert(result.fileCount == 1);
  std::cout << " Passed\n";
}

void test_aggregate_url_success_and_exception() {
  std::cout << "Test: Aggregate URL content and fetch exceptions..."
            << std::flush;
  ByteCountingTokenizer tokenizer;
  UrlFetcher fetcher = [](const std::string &url) {
    if (url == "https://boom.test")
      throw std::runtime_error("boom");
    FetchResult result;
    result.ok = true;
    result.status = 200;
    result.body = "hello";
    return result;
  };

  Config config = get_default_config({"https://ok.test", "https://boom.test"});
  AggregationResult result = aggregate_targets(config, tokenizer, fetcher);
  assert(contains(result.buffer, "[ URL: https://ok.test ]\nhello\n\n"));
  assert(contains(result.buffer,
                  "[ URL: https://boom.test ]\nError fetching URL: boom\n\n"));
  assert(result.totalTokens == 5);
  assert(result.fileCount == 2);
  std::cout << " Passed\n";
}

void test_aggregate_oversized_file() {
  std::cout << "Test: Aggregate an oversized file..." << std::flush;
  const fs::path big = TEST_DIR_PATH / "big" / "huge.bin";
  create_test_file(big, std::string(MAX_READ_BYTES + 1, 'x'));

  ByteCountingTokenizer tokenizer;
  const std::string target = TEST_DIR_NAME + "/big/huge.bin";
  Config config = get_default_config({target});
  AggregationResult result =
      aggregate_targets(config, tokenizer, unreachable_fetch);
  assert(contains(result.buffer,
                  "[ " + target + " ]\nError reading file: file too large"));
  assert(result.totalTokens == 0);
  assert(result.fileCount == 1);

  fs::remove_all(TEST_DIR_PATH / "big");
  std::cout << " Passed\n";
}

void test_aggregate_is_repeatable() {
  std::cout << "Test: Aggregation is repeatable..." << std::flush;
  ByteCountingTokenizer tokenizer;
  Config config = get_default_config({TEST_DIR_NAME + "/tree"});
  config.threads = 3;

  AggregationResult first =
      aggregate_targets(config, tokenizer, unreachable_fetch);
  AggregationResult second =
      aggregate_targets(config, tokenizer, unreachable_fetch);
  assert(first.totalTokens == second.totalTokens);
  assert(first.totalTokens == 6 + 7 + 7 + 7);
  assert(first.buffer.size() == second.buffer.size());
  assert(sorted_blocks(first.buffer) == sorted_blocks(second.buffer));
  std::cout << " Passed\n";
}

void test_aggregate_many_files() {
  std::cout << "Test: Aggregate many files on many threads..." << std::flush;
  size_t expected_tokens = 0;
  for (int i = 0; i < 200; ++i) {
    std::string name = std::to_string(i);
    name.insert(0, 3 - name.size(), '0');
    const std::string content(static_cast<size_t>(i % 7 + 1), 'x');
    create_test_file(TEST_DIR_PATH / "many" / ("f" + name + ".txt"), content);
    expected_tokens += content.size();
  }

  ByteCountingTokenizer tokenizer;
  const std::string target = TEST_DIR_NAME + "/many";
  Config config = get_default_config({target});
  config.threads = 8;
  AggregationResult result =
      aggregate_targets(config, tokenizer, unreachable_fetch);

  assert(result.fileCount == 200);
  assert(result.totalTokens == expected_tokens);
  assert(result.workersSpawned == 8);
  for (int i = 0; i < 200; ++i) {
    std::string name = std::to_string(i);
    name.insert(0, 3 - name.size(), '0');
    const std::string header = "[ " + target + "/f" + name + ".txt ]\n";
    const size_t first = result.buffer.find(header);
    assert(first != std::string::npos);
    assert(result.buffer.find(header, first + 1) == std::string::npos);
  }

  fs::remove_all(TEST_DIR_PATH / "many");
  std::cout << " Passed\n";
}

void test_aggregate_rejects_bad_config() {
  std::cout << "Test: Aggregate rejects unusable configurations..."
            << std::flush;
  ByteCountingTokenizer tokenizer;

  bool threw = false;
  try {
    Config config = get_default_config({TEST_DIR_NAME + "/tree"});
    config.threads = 0;
    aggregate_targets(config, tokenizer, unreachable_fetch);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    aggregate_targets(get_default_config({}), tokenizer, unreachable_fetch);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
  std::cout << " Passed\n";
}

void test_tokenizer_scope() {
  std::cout << "Test: Tokenizer scope lifecycle..." << std::flush;
  {
    ByteCountingTokenizer tokenizer;
    {
      TokenizerScope scope(tokenizer, "bytes");
      assert(tokenizer.initializeCalls == 1);
      assert(tokenizer.teardownCalls == 0);
      assert(scope.counter().count("four") == 4);
    }
    assert(tokenizer.teardownCalls == 1);
  }
  {
    ByteCountingTokenizer tokenizer;
    bool threw = false;
    try {
      TokenizerScope scope(tokenizer, "broken");
    } catch (const std::runtime_error &e) {
      threw = true;
      assert(contains(e.what(), "'broken'"));
      assert(contains(e.what(), "broken encoding"));
    }
    assert(threw);
    assert(tokenizer.teardownCalls == 1);
  }
  {
    ByteCountingTokenizer tokenizer;
    try {
      TokenizerScope scope(tokenizer, "bytes");
      throw std::logic_error("failure inside the scope");
    } catch (const std::logic_error &) {
    }
    assert(tokenizer.teardownCalls == 1);
  }
  std::cout << " Passed\n";
}

void test_decode_base64() {
  std::cout << "Test: Base64 decoding..." << std::flush;
  std::string out;
  assert(decode_base64("YQ==", out) && out == "a");
  assert(decode_base64("YWI=", out) && out == "ab");
  assert(decode_base64("YWJj", out) && out == "abc");
  assert(decode_base64("IA==", out) && out == " ");
  assert(!decode_base64("YQ=", out));
  assert(!decode_base64("Y*==", out));
  std::cout << " Passed\n";
}

void test_split_pretokens() {
  std::cout << "Test: Pretokenizer splits..." << std::flush;
  const std::string text = "Hello world's 1234!!\n\n  x";

  std::vector<std::string_view> gpt2 =
      split_pretokens(text, PretokenizerStyle::Gpt2);
  std::vector<std::string_view> expected_gpt2 = {
      "Hello", " world", "'s", " 1234", "!!", "\n\n ", " x"};
  assert(gpt2 == expected_gpt2);

  std::vector<std::string_view> cl100k =
      split_pretokens(text, PretokenizerStyle::Cl100k);
  std::vector<std::string_view> expected_cl100k = {
      "Hello", " world", "'s", " ", "123", "4", "!!\n\n", " ", " x"};
  assert(cl100k == expected_cl100k);

  std::vector<std::string_view> newlines =
      split_pretokens("\n\nabc", PretokenizerStyle::Cl100k);
  std::vector<std::string_view> expected_newlines = {"\n\n", "abc"};
  assert(newlines == expected_newlines);

  // Contractions ignore case only in the cl100k pattern
  std::vector<std::string_view> upper =
      split_pretokens("IT'S", PretokenizerStyle::Cl100k);
  std::vector<std::string_view> expected_upper = {"IT", "'S"};
  assert(upper == expected_upper);

  assert(split_pretokens("", PretokenizerStyle::Gpt2).empty());
  std::cout << " Passed\n";
}

void test_split_pretokens_o200k() {
  std::cout << "Test: o200k pretokenizer splits..." << std::flush;
  const PretokenizerStyle style = find_encoding_spec("o200k_base")->style;
  assert(style == PretokenizerStyle::O200k);

  // Contractions stay on the word before them
  std::vector<std::string_view> dont = split_pretokens("don't", style);
  std::vector<std::string_view> expected_dont = {"don't"};
  assert(dont == expected_dont);

  // Words split where lower case turns back to upper case
  std::vector<std::string_view> camel = split_pretokens("HelloWorld", style);
  std::vector<std::string_view> expected_camel = {"Hello", "World"};
  assert(camel == expected_camel);

  std::vector<std::string_view> acronym =
      split_pretokens("HTMLParser SHOUT quiet", style);
  std::vector<std::string_view> expected_acronym = {"HTMLParser", " SHOUT",
                                                    " quiet"};
  assert(acronym == expected_acronym);

  std::vector<std::string_view> latin =
      split_pretokens("\u00dcberStra\u00dfe", style);
  std::vector<std::string_view> expected_latin = {"\u00dcber",
                                                  "Stra\u00dfe"};
  assert(latin == expected_latin);

  std::vector<std::string_view> mixed =
      split_pretokens("Hello world's 1234!!\n/\n  x", style);
  std::vector<std::string_view> expected_mixed = {
      "Hello", " world's", " ", "123", "4", "!!\n/\n", " ", " x"};
  assert(mixed == expected_mixed);
  std::cout << " Passed\n";
}

// A 10 MiB input must not cost memory per input byte while counting
void test_bpe_token_counter_large_input() {
  std::cout << "Test: BPE counting of a large input..." << std::flush;
  const fs::path rank_dir = TEST_DIR_PATH / "encodings";
  create_test_file(rank_dir / "r50k_base.tiktoken",
                   "YQ== 0\nYg== 1\nIA== 2\nYWI= 3\nYw== 4\n");
  BpeTokenCounter counter({rank_dir});
  std::string error;
  assert(counter.initialize("r50k_base", error));

  const size_t repeats = MAX_READ_BYTES / 3;
  std::string text;
  text.reserve(repeats * 3);
  for (size_t i = 0; i < repeats; ++i)
    text += "ab ";

  struct rusage before {};
  getrusage(RUSAGE_SELF, &before);
  const size_t tokens = counter.count(text);
  struct rusage after {};
  getrusage(RUSAGE_SELF, &after);

  // "ab", then " ab" per repeat, then the trailing " "
  assert(tokens == 1 + 2 * (repeats - 1) + 1);
  const long grown_kib = after.ru_maxrss - before.ru_maxrss;
  assert(grown_kib < 64 * 1024);
  counter.teardown();
  std::cout << " Passed\n";
}

void test_bpe_token_counter() {
  std::cout << "Test: BPE token counter..." << std::flush;
  const fs::path rank_dir = TEST_DIR_PATH / "encodings";
  create_test_file(rank_dir / "r50k_base.tiktoken",
                   "YQ== 0\nYg== 1\nIA== 2\nYWI= 3\nYw== 4\n");

  BpeTokenCounter counter({rank_dir});
  std::string error;
  assert(counter.initialize("r50k_base", error));
  assert(counter.count("") == 0);
  assert(counter.count("ab") == 1);
  assert(counter.count("abc") == 2);
  assert(counter.count("ab ab") == 3);
  assert(counter.count("<|endoftext|>ab") == 2);
  assert(counter.count("ab<|endoftext|>") == 2);
  counter.teardown();
  assert(counter.count("ab") == 0);

  error.clear();
  assert(!counter.initialize("no_such_encoding", error));
  assert(contains(error, "unknown encoding"));

  error.clear();
  assert(!counter.initialize("cl100k_base", error)); // No rank file here
  assert(contains(error, "cl100k_base.tiktoken"));

  const fs::path bad_dir = TEST_DIR_PATH / "bad_encodings";
  create_test_file(bad_dir / "p50k_base.tiktoken", "YQ== zero\n");
  BpeTokenCounter bad_counter({bad_dir});
  error.clear();
  assert(!bad_counter.initialize("p50k_edit", error));
  assert(contains(error, "invalid rank"));
  std::cout << " Passed\n";
}

void test_encoding_search_dirs() {
  std::cout << "Test: Encoding search directories..." << std::flush;
  std::vector<fs::path> dirs = default_encoding_search_dirs("custom/dir");
  assert(!dirs.empty());
  assert(dirs.front() == fs::path("custom/dir"));
  assert(dirs.back() == fs::path("/usr/share/llmcat/encodings"));

  std::vector<fs::path> defaults = default_encoding_search_dirs("");
  assert(defaults.size() == dirs.size() - 1);
  assert(find_encoding_spec("p50k_edit") != nullptr);
  assert(find_encoding_spec("p50k_edit")->rankFile == "p50k_base.tiktoken");
  assert(find_encoding_spec("gpt2") == nullptr);
  std::cout << " Passed\n";
}

void test_parse_url() {
  std::cout << "Test: URL parsing..." << std::flush;
  ParsedUrl url;
  assert(parse_url("https://example.com", url));
  assert(url.scheme == "https" && url.host == "example.com");
  assert(url.port == "443" && url.target == "/");

  assert(parse_url("http://user:pw@[::1]:8080/a/b?x=1#frag", url));
  assert(url.host == "::1" && url.port == "8080");
  assert(url.target == "/a/b?x=1");

  assert(parse_url("HTTP://example.com?q=1", url));
  assert(url.scheme == "http" && url.port == "80");
  assert(url.target == "/?q=1");

  assert(!parse_url("ftp://example.com", url));
  assert(!parse_url("http://", url));
  assert(!parse_url("http://example.com:80x/", url));
  std::cout << " Passed\n";
}

void test_url_helpers() {
  std::cout << "Test: Host header and redirect targets..." << std::flush;
  assert(host_header({"http", "example.com", "80", "/"}) == "example.com");
  assert(host_header({"https", "example.com", "8443", "/"}) ==
         "example.com:8443");
  assert(host_header({"http", "::1", "80", "/"}) == "[::1]");

  ParsedUrl base{"https", "example.com", "443", "/docs/page?x=1"};
  assert(resolve_location(base, "https://other.org/x") ==
         "https://other.org/x");
  assert(resolve_location(base, "//cdn.example.com/y") ==
         "https://cdn.example.com/y");
  assert(resolve_location(base, "/root") == "https://example.com/root");
  assert(resolve_location(base, "next") == "https://example.com/docs/next");
  assert(is_redirect(http::status::found));
  assert(!is_redirect(http::status::not_modified));
  std::cout << " Passed\n";
}

void test_fetch_url_failures() {
  std::cout << "Test: Fetch failures are reported..." << std::flush;
  FetchResult invalid = fetch_url("http://");
  assert(!invalid.ok);
  assert(contains(invalid.error, "invalid URL"));

  FetchResult refused = fetch_url("http://127.0.0.1:1/");
  assert(!refused.ok);
  assert(!refused.error.empty());
  std::cout << " Passed\n";
}

void test_fetch_url_local_server() {
  std::cout << "Test: Fetch from a local HTTP server..." << std::flush;
  LocalHttpServer server;

  FetchResult ok = fetch_url(server.url("/ok"));
  assert(ok.ok);
  assert(ok.status == 200);
  assert(ok.body == "fetched body");
  assert(ok.error.empty());

  FetchResult created = fetch_url(server.url("/created"));
  assert(created.ok); // Any 2xx is success
  assert(created.status == 201);
  assert(created.body == "new");

  FetchResult missing = fetch_url(server.url("/missing"));
  assert(!missing.ok);
  assert(missing.status == 404);
  assert(missing.error == "HTTP 404 Not Found");

  FetchResult redirected = fetch_url(server.url("/redir"));
  assert(redirected.ok);
  assert(redirected.status == 200);
  assert(redirected.body == "fetched body");

  FetchResult loop = fetch_url(server.url("/loop"));
  assert(!loop.ok);
  assert(loop.error == "too many redirects");
  assert(server.loop_requests() == 1 + MAX_REDIRECTS);

  // Through the engine: the failure is inline and the other URL still lands
  ByteCountingTokenizer tokenizer;
  Config config =
      get_default_config({server.url("/missing"), server.url("/ok")});
  AggregationResult result = aggregate_targets(config, tokenizer, fetch_url);
  assert(contains(result.buffer, "[ URL: " + server.url("/missing") +
                                     " ]\nError fetching URL: HTTP 404 "
                                     "Not Found\n\n"));
  assert(contains(result.buffer,
                  "[ URL: " + server.url("/ok") + " ]\nfetched body\n\n"));
  assert(result.totalTokens == std::string("fetched body").size());
  std::cout << " Passed\n";
}

void test_parse_thread_count() {
  std::cout << "Test: Thread count parsing..." << std::flush;
  unsigned int threads = 0;
  assert(parse_thread_count("4", threads) && threads == 4);
  assert(parse_thread_count("1", threads) && threads == 1);
  assert(!parse_thread_count("0", threads));
  assert(!parse_thread_count("-1", threads));
  assert(!parse_thread_count("abc", threads));
  assert(!parse_thread_count("", threads));
  assert(!parse_thread_count("99999999999999999999", threads));
  std::cout << " Passed\n";
}

void test_parse_arguments() {
  std::cout << "Test: Argument parsing..." << std::flush;
  std::vector<std::string> args = {"llmcat",       "-e",        "node_modules",
                                   "--exclude",    ".git",      "-t",
                                   "8",            "-p",        "--encoding",
                                   "o200k_base",   "src",       "https://x.org",
                                   "--count-files", "-o",       "out.txt"};
  std::vector<char *> argv;
  for (auto &arg : args)
    argv.push_back(arg.data());

  Config config = parse_arguments(static_cast<int>(argv.size()), argv.data());
  assert(config.excludePatterns ==
         std::vector<std::string>({"node_modules", ".git"}));
  assert(config.threads == 8);
  assert(config.print);
  assert(config.encoding == "o200k_base");
  assert(config.targets == std::vector<std::string>({"src", "https://x.org"}));
  assert(config.countFiles);
  assert(!config.countTokensOnly);
  assert(config.outputFile == fs::path("out.txt"));
  assert(!config.fzfMode);

  std::vector<std::string> bare = {"llmcat"};
  std::vector<char *> bare_argv = {bare[0].data()};
  Config interactive = parse_arguments(1, bare_argv.data());
  assert(interactive.fzfMode);
  assert(interactive.targets.empty());
  assert(interactive.threads == 4);
  assert(interactive.encoding == "cl100k_base");
  std::cout << " Passed\n";
}

void test_write_output_file() {
  std::cout << "Test: Output file creation..." << std::flush;
  const fs::path output = TEST_DIR_PATH / "out" / "nested" / "result.txt";
  assert(write_output_file(output, "payload\n"));
  std::ifstream in(output, std::ios::binary);
  std::string written((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  assert(written == "payload\n");

  assert(!write_output_file(TEST_DIR_PATH / "out", "payload\n"));
  std::cout << " Passed\n";
}

void test_deliver_result() {
  std::cout << "Test: Result delivery..." << std::flush;
  AggregationResult result;
  result.buffer = "[ STRUCTURE ]\nx\n\n[ x ]\ny\n\n";
  result.totalTokens = 7;
  result.fileCount = 2;

  Config print_config;
  print_config.print = true;
  print_config.outputFile = TEST_DIR_PATH / "deliver" / "result.txt";
  bool ok = false;
  std::string printed =
      capture_stdout([&]() { ok = deliver_result(print_config, result); });
  assert(ok);
  assert(printed == result.buffer);
  std::ifstream in(print_config.outputFile, std::ios::binary);
  std::string written((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  assert(written == result.buffer);

  Config count_config;
  count_config.countTokensOnly = true;
  count_config.countFiles = true;
  printed =
      capture_stdout([&]() { ok = deliver_result(count_config, result); });
  assert(ok);
  assert(printed == "Token count: 7\nProcessed 2 files\n");

  // Nothing to hand off: no clipboard is touched
  AggregationResult empty;
  empty.buffer = "[ STRUCTURE ]\n\n";
  Config quiet_config;
  printed =
      capture_stdout([&]() { ok = deliver_result(quiet_config, empty); });
  assert(ok);
  assert(printed.empty());
  std::cout << " Passed\n";
}

void test_print_usage_names_rank_files() {
  std::cout << "Test: Usage explains where rank files live..." << std::flush;
  const std::string usage = capture_stderr([]() { print_usage("llmcat"); });
  assert(contains(usage, "Usage: llmcat"));
  assert(contains(usage, "<encoding>.tiktoken"));
  assert(contains(usage, std::string(TIKTOKEN_DOWNLOAD_BASE)));
  assert(contains(usage, "$LLMCAT_ENCODING_DIR"));
  assert(contains(usage, "$HOME/.local/share/llmcat/encodings"));
  assert(contains(usage, "/usr/local/share/llmcat/encodings"));
  assert(contains(usage, "/usr/share/llmcat/encodings"));

  BpeTokenCounter counter({TEST_DIR_PATH / "no_ranks_here"});
  std::string error;
  assert(!counter.initialize("o200k_base", error));
  assert(contains(error, std::string(TIKTOKEN_DOWNLOAD_BASE) +
                             "o200k_base.tiktoken"));
  std::cout << " Passed\n";
}

void test_shell_quote() {
  std::cout << "Test: Shell quoting..." << std::flush;
  assert(shell_quote("plain") == "'plain'");
  assert(shell_quote("") == "''");
  assert(shell_quote("/tmp/it's here") == "'/tmp/it'\\''s here'");
  std::cout << " Passed\n";
}

void test_write_selection_list() {
  std::cout << "Test: fzf selection list files..." << std::flush;
  const fs::path dir = TEST_DIR_PATH / "tmp dir's";
  fs::create_directories(dir);

  fs::path first;
  fs::path second;
  std::string error;
  assert(write_selection_list(dir, {"a.txt", "sub/b c.txt"}, first, error));
  assert(write_selection_list(dir, {"x.txt"}, second, error));
  assert(first != second); // Every list gets a fresh name
  assert(first.parent_path() == dir);
  assert(fs::is_regular_file(first));

  // The quoted path survives a shell even with a quote in the directory name
  const std::string command = "cat " + shell_quote(first.string());
  FILE *pipe = popen(command.c_str(), "r");
  assert(pipe != nullptr);
  std::string output;
  std::array<char, 256> buffer{};
  size_t n = 0;
  while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0)
    output.append(buffer.data(), n);
  assert(pclose(pipe) == 0);
  assert(output == "a.txt\nsub/b c.txt\n");

  fs::path unused;
  assert(!write_selection_list(TEST_DIR_PATH / "no_such_dir", {"a.txt"},
                               unused, error));
  assert(contains(error, "could not create a file list"));
  std::cout << " Passed\n";
}

int main() {
  try {
    create_test_directory_structure(); // Create base structure for most tests

    // Run tests
    test_trim();
    test_should_exclude();
    test_target_helpers();
    test_expand_targets_urls_and_missing();
    test_expand_targets_directory_order(); // Uses TEST_DIR_PATH
    test_expand_targets_exclusions();      // Uses TEST_DIR_PATH
    test_render_structure();
    test_read_file_bounded(); // Uses TEST_DIR_PATH
    test_task_queue();
    test_dispatch_runs_each_task_once();
    test_aggregate_scenario_files_and_directory();
    test_aggregate_scenario_exclusion();
    test_aggregate_url_failure();
    test_aggregate_url_success_and_exception();
    test_aggregate_oversized_file();
    test_aggregate_is_repeatable();
    test_aggregate_many_files();
    test_aggregate_rejects_bad_config();
    test_tokenizer_scope();
    test_decode_base64();
    test_split_pretokens();
    test_split_pretokens_o200k();
    test_bpe_token_counter();             // Uses TEST_DIR_PATH
    test_bpe_token_counter_large_input(); // Uses TEST_DIR_PATH
    test_encoding_search_dirs();
    test_parse_url();
    test_url_helpers();
    test_fetch_url_failures();
    test_fetch_url_local_server();
    test_parse_thread_count();
    test_parse_arguments();
    test_print_usage_names_rank_files(); // Uses TEST_DIR_PATH
    test_shell_quote();
    test_write_selection_list(); // Uses TEST_DIR_PATH
    test_write_output_file(); // Uses TEST_DIR_PATH
    test_deliver_result();    // Uses TEST_DIR_PATH

    // Cleanup after all tests
    cleanup_test_directories();
    std::cout << "\nAll tests passed successfully!\n";
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "\n\n!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n";
    std::cerr << "Test failed with exception: " << e.what() << std::endl;
    std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n\n";
    cleanup_test_directories(); // Attempt cleanup even on failure
    return 1;
  } catch (...) {
    std::cerr << "\n\n!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n";
    std::cerr << "Test failed with unknown exception!" << std::endl;
    std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n\n";
    cleanup_test_directories();
    return 1;
  }
}
