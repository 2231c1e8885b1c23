#include <algorithm>
#include <array>
#include <atomic>
#include <cctype> // For std::isalpha, std::tolower
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>  // For popen/pclose
#include <cstdlib> // For std::getenv, std::system, mkstemp
#include <cstring> // For std::strerror
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator> // For std::istreambuf_iterator
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error> // For filesystem errors
#include <thread>
#include <unordered_map>
#include <utility> // For std::move
#include <vector>

#include <unistd.h> // For close

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h> // For SSL_set_tlsext_host_name

namespace fs = std::filesystem;
namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// --- Configuration ---
struct Config {
  std::vector<std::string> targets;         // Files, directories or URLs
  std::vector<std::string> excludePatterns; // Checked by should_exclude
  unsigned int threads = 4;
  std::string encoding = "cl100k_base";
  fs::path encodingDir; // Searched first for <encoding>.tiktoken
  fs::path outputFile;  // Absolute or relative path
  bool print = false;
  bool fzfMode = false;
  bool countFiles = false;
  bool countTokensOnly = false;
};

constexpr unsigned long long MAX_READ_BYTES = 10ULL * 1024 * 1024;
constexpr int MAX_REDIRECTS = 3;
constexpr std::string_view USER_AGENT = "llmcat/1.0";
constexpr std::string_view TIKTOKEN_DOWNLOAD_BASE =
    "https://openaipublic.blob.core.windows.net/encodings/";

// --- Utility Functions ---

std::string trim(std::string_view str) {
  constexpr std::string_view whitespace = " \t\n\r\f\v";
  size_t start = str.find_first_not_of(whitespace);
  if (start == std::string_view::npos)
    return "";
  size_t end = str.find_last_not_of(whitespace);
  return std::string(str.substr(start, end - start + 1));
}

// Normalizes path separators to '/' and simplifies lexically
std::string normalize_path(const fs::path &path) {
  std::string path_str = path.lexically_normal().string();
  std::replace(path_str.begin(), path_str.end(), '\\', '/');
  return path_str;
}

// --- Exclusion Filter ---

// A path is excluded when a pattern equals it, ends it, occurs anywhere in
// it, or names a directory it lives under. Patterns are tried in order and
// the first hit wins. Substring matching makes short patterns very broad.
bool should_exclude(std::string_view path,
                    const std::vector<std::string> &patterns) {
  for (const auto &pattern : patterns) {
    if (path == pattern)
      return true;
    if (path.size() >= pattern.size() &&
        path.compare(path.size() - pattern.size(), pattern.size(), pattern) ==
            0)
      return true;
    if (path.find(pattern) != std::string_view::npos)
      return true;

    std::string dir_pattern = pattern;
    if (dir_pattern.empty() || dir_pattern.back() != '/')
      dir_pattern += '/';
    if (path.rfind(dir_pattern, 0) == 0)
      return true;
  }
  return false;
}

// --- Target Expansion ---

struct FileTask {
  std::string path;         // Relative to originTarget unless isFullPath
  std::string originTarget; // Directory target the path came from
  bool isFullPath = true;
  bool isUrl = false;
};

struct ExpandedTargets {
  std::vector<std::string> structureLines;
  std::vector<FileTask> tasks;
};

bool is_url_target(std::string_view target) {
  return target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0;
}

// Joins a target and a relative entry without doubling the separator
std::string join_target_path(std::string_view target,
                             std::string_view relative) {
  std::string joined(target);
  if (!joined.empty() && joined.back() != '/')
    joined += '/';
  joined += relative;
  return joined;
}

// Where a task's content lives: a URL, a path as given, or target + entry
std::string task_location(const FileTask &task) {
  if (task.isUrl || task.isFullPath)
    return task.path;
  return join_target_path(task.originTarget, task.path);
}

// Depth-first walk in sorted name order. Listing lines and tasks are emitted
// from the same exclusion decision so the two outputs always agree.
void expand_directory(const std::string &target, const fs::path &dir_path,
                      const std::string &relative_prefix,
                      const std::vector<std::string> &exclude_patterns,
                      ExpandedTargets &expanded) {
  std::vector<fs::directory_entry> entries;
  std::error_code ec;
  fs::directory_iterator it(dir_path,
                            fs::directory_options::skip_permission_denied, ec);
  for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec) {
    std::cerr << "WARNING: Cannot read directory " << normalize_path(dir_path)
              << ": " << ec.message() << '\n';
    return;
  }

  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename().string() <
                     b.path().filename().string();
            });

  for (const auto &entry : entries) {
    const std::string name = entry.path().filename().string();
    const std::string relative =
        relative_prefix.empty() ? name : relative_prefix + '/' + name;
    const std::string full_path = join_target_path(target, relative);

    if (should_exclude(full_path, exclude_patterns) ||
        should_exclude(relative, exclude_patterns)) {
      continue; // Descendants of an excluded directory match as well
    }

    std::error_code type_ec;
    const bool is_symlink = entry.is_symlink(type_ec);
    const bool is_directory = entry.is_directory(type_ec);
    if (is_directory) {
      expanded.structureLines.push_back(full_path + '/');
      if (!is_symlink) {
        expand_directory(target, entry.path(), relative, exclude_patterns,
                         expanded);
      }
      continue;
    }

    expanded.structureLines.push_back(full_path);
    if (entry.is_regular_file(type_ec)) {
      expanded.tasks.push_back({relative, target, false, false});
    }
  }
}

// Turns raw targets into the structure listing and the task list. Runs on a
// single thread before any task is dispatched.
ExpandedTargets expand_targets(const std::vector<std::string> &targets,
                               const std::vector<std::string> &exclude_patterns) {
  ExpandedTargets expanded;
  for (const auto &target : targets) {
    if (is_url_target(target)) {
      expanded.structureLines.push_back("URL: " + target);
      expanded.tasks.push_back({target, "", true, true});
      continue;
    }

    if (should_exclude(target, exclude_patterns))
      continue;

    std::error_code ec;
    const fs::file_status status = fs::status(target, ec);
    if (ec || !fs::exists(status)) {
      expanded.structureLines.push_back(target); // Listed as given, not read
      continue;
    }

    if (fs::is_directory(status)) {
      expanded.structureLines.push_back(
          target.back() == '/' ? target : target + '/');
      expand_directory(target, target, "", exclude_patterns, expanded);
    } else {
      expanded.structureLines.push_back(target);
      if (fs::is_regular_file(status)) {
        expanded.tasks.push_back({target, "", true, false});
      }
    }
  }
  return expanded;
}

std::string render_structure(const std::vector<std::string> &lines) {
  std::string out = "[ STRUCTURE ]\n";
  for (const auto &line : lines) {
    out += line;
    out += '\n';
  }
  out += '\n';
  return out;
}

// --- File Reading ---

// Reads a whole file, refusing anything larger than max_bytes
bool read_file_bounded(const fs::path &path, unsigned long long max_bytes,
                       std::string &content, std::string &error) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    error = "is a directory";
    return false;
  }
  const unsigned long long size = fs::file_size(path, ec);
  if (ec) {
    error = ec.message();
    return false;
  }
  if (size > max_bytes) {
    error = "file too large (" + std::to_string(size) + " bytes, limit " +
            std::to_string(max_bytes) + ")";
    return false;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "could not open file";
    return false;
  }
  content.assign(std::istreambuf_iterator<char>(file),
                 std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "read failed";
    return false;
  }
  // The file may have grown between the size check and the read
  if (content.size() > max_bytes) {
    content.clear();
    error = "file too large (limit " + std::to_string(max_bytes) + " bytes)";
    return false;
  }
  return true;
}

// --- URL Fetching ---

struct FetchResult {
  bool ok = false;
  unsigned int status = 0;
  std::string body;
  std::string error;
};

using UrlFetcher = std::function<FetchResult(const std::string &url)>;

struct ParsedUrl {
  std::string scheme; // "http" or "https"
  std::string host;
  std::string port;
  std::string target; // Path and query, always starting with '/'
};

bool parse_url(const std::string &url, ParsedUrl &parsed) {
  const size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos)
    return false;
  parsed.scheme = url.substr(0, scheme_end);
  std::transform(parsed.scheme.begin(), parsed.scheme.end(),
                 parsed.scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (parsed.scheme != "http" && parsed.scheme != "https")
    return false;

  const size_t authority_start = scheme_end + 3;
  const size_t path_start = url.find_first_of("/?#", authority_start);
  std::string authority =
      url.substr(authority_start, path_start == std::string::npos
                                      ? std::string::npos
                                      : path_start - authority_start);
  const size_t at = authority.rfind('@');
  if (at != std::string::npos)
    authority.erase(0, at + 1); // Credentials are not sent

  parsed.host.clear();
  parsed.port.clear();
  if (!authority.empty() && authority[0] == '[') {
    const size_t close = authority.find(']');
    if (close == std::string::npos)
      return false;
    parsed.host = authority.substr(1, close - 1);
    const std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':')
        return false;
      parsed.port = rest.substr(1);
    }
  } else {
    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      parsed.host = authority.substr(0, colon);
      parsed.port = authority.substr(colon + 1);
    } else {
      parsed.host = authority;
    }
  }
  if (parsed.host.empty())
    return false;
  if (parsed.port.empty())
    parsed.port = parsed.scheme == "https" ? "443" : "80";
  if (!std::all_of(parsed.port.begin(), parsed.port.end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    return false;

  parsed.target =
      path_start == std::string::npos ? "/" : url.substr(path_start);
  const size_t fragment = parsed.target.find('#');
  if (fragment != std::string::npos)
    parsed.target.erase(fragment);
  if (parsed.target.empty() || parsed.target[0] != '/')
    parsed.target.insert(0, "/");
  return true;
}

// Host header value; the port is only spelled out when it is not the default
std::string host_header(const ParsedUrl &url) {
  const bool default_port = (url.scheme == "http" && url.port == "80") ||
                            (url.scheme == "https" && url.port == "443");
  std::string host = url.host.find(':') != std::string::npos
                         ? "[" + url.host + "]"
                         : url.host;
  return default_port ? host : host + ":" + url.port;
}

// Resolves a Location header against the URL that produced it
std::string resolve_location(const ParsedUrl &base, const std::string &location) {
  if (location.find("://") != std::string::npos)
    return location;
  const std::string origin = base.scheme + "://" + host_header(base);
  if (location.rfind("//", 0) == 0)
    return base.scheme + ":" + location;
  if (!location.empty() && location[0] == '/')
    return origin + location;

  std::string directory = base.target.substr(0, base.target.find('?'));
  directory.erase(directory.rfind('/') + 1);
  return origin + directory + location;
}

bool is_redirect(http::status status) {
  return status == http::status::moved_permanently ||
         status == http::status::found ||
         status == http::status::see_other ||
         status == http::status::temporary_redirect ||
         status == http::status::permanent_redirect;
}

template <class Stream>
http::response<http::string_body> send_get(Stream &stream,
                                           const ParsedUrl &url) {
  http::request<http::empty_body> req{http::verb::get, url.target, 11};
  req.set(http::field::host, host_header(url));
  req.set(http::field::user_agent, std::string(USER_AGENT));
  http::write(stream, req);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(std::numeric_limits<std::uint64_t>::max());
  http::read(stream, buffer, parser);
  return parser.release();
}

// One request/response exchange; throws beast::system_error on I/O failure
http::response<http::string_body> fetch_once(const ParsedUrl &url) {
  asio::io_context ioc;
  tcp::resolver resolver(ioc);
  auto const results = resolver.resolve(url.host, url.port);

  if (url.scheme == "https") {
    asio::ssl::context ctx(asio::ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(asio::ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
      throw beast::system_error(
          beast::error_code(static_cast<int>(::ERR_get_error()),
                            asio::error::get_ssl_category()));
    }
    stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(asio::ssl::stream_base::client);

    auto response = send_get(stream, url);

    beast::error_code ec;
    stream.shutdown(ec);
    // Many servers close without a TLS close_notify; the body is complete.
    if (ec && ec != asio::ssl::error::stream_truncated &&
        ec != asio::error::eof) {
      std::cerr << "WARNING: TLS shutdown with " << url.host << ": "
                << ec.message() << '\n';
    }
    return response;
  }

  beast::tcp_stream stream(ioc);
  stream.connect(results);
  auto response = send_get(stream, url);

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    std::cerr << "WARNING: Socket shutdown with " << url.host << ": "
              << ec.message() << '\n';
  }
  return response;
}

// GETs a URL, following up to MAX_REDIRECTS redirects. Any 2xx is success.
FetchResult fetch_url(const std::string &url) {
  FetchResult result;
  std::string current = url;
  try {
    for (int redirects = 0;; ++redirects) {
      ParsedUrl parsed;
      if (!parse_url(current, parsed)) {
        result.error = "invalid URL: " + current;
        return result;
      }

      auto response = fetch_once(parsed);
      result.status = response.result_int();

      auto location = response.find(http::field::location);
      if (is_redirect(response.result()) && location != response.end()) {
        if (redirects >= MAX_REDIRECTS) {
          result.error = "too many redirects";
          return result;
        }
        current = resolve_location(
            parsed, std::string(location->value().data(),
                                location->value().size()));
        continue;
      }

      if (result.status < 200 || result.status >= 300) {
        auto reason = response.reason();
        result.error = "HTTP " + std::to_string(result.status);
        if (!reason.empty())
          result.error += " " + std::string(reason.data(), reason.size());
        return result;
      }

      result.body = std::move(response.body());
      result.ok = true;
      return result;
    }
  } catch (const std::exception &e) {
    result.error = e.what();
  }
  return result;
}

// --- Token Accounting ---

// Tokenizer capability handed to the engine. count() must be safe to call
// from several workers at once after a successful initialize().
class TokenCounter {
public:
  virtual ~TokenCounter() = default;
  virtual bool initialize(const std::string &encoding, std::string &error) = 0;
  virtual size_t count(std::string_view text) const = 0;
  virtual void teardown() = 0;
};

// Holds one initialize/teardown cycle. teardown() runs exactly once, also
// when initialize() fails, in which case the constructor throws.
class TokenizerScope {
public:
  TokenizerScope(TokenCounter &counter, const std::string &encoding)
      : counter_(counter) {
    std::string error;
    if (!counter_.initialize(encoding, error)) {
      counter_.teardown();
      throw std::runtime_error("Failed to initialize tokenizer with encoding '" +
                               encoding + "': " + error);
    }
  }
  ~TokenizerScope() { counter_.teardown(); }

  TokenizerScope(const TokenizerScope &) = delete;
  TokenizerScope &operator=(const TokenizerScope &) = delete;

  const TokenCounter &counter() const { return counter_; }

private:
  TokenCounter &counter_;
};

enum class PretokenizerStyle { Gpt2, Cl100k, O200k };

struct EncodingSpec {
  std::string_view name;
  std::string_view rankFile;
  PretokenizerStyle style;
  std::vector<std::string_view> specialTokens;
};

const EncodingSpec *find_encoding_spec(std::string_view name) {
  static const std::vector<EncodingSpec> specs = {
      {"r50k_base", "r50k_base.tiktoken", PretokenizerStyle::Gpt2,
       {"<|endoftext|>"}},
      {"p50k_base", "p50k_base.tiktoken", PretokenizerStyle::Gpt2,
       {"<|endoftext|>"}},
      {"p50k_edit",
       "p50k_base.tiktoken",
       PretokenizerStyle::Gpt2,
       {"<|endoftext|>", "<|fim_prefix|>", "<|fim_middle|>", "<|fim_suffix|>"}},
      {"cl100k_base",
       "cl100k_base.tiktoken",
       PretokenizerStyle::Cl100k,
       {"<|endoftext|>", "<|fim_prefix|>", "<|fim_middle|>", "<|fim_suffix|>",
        "<|endofprompt|>"}},
      {"o200k_base",
       "o200k_base.tiktoken",
       PretokenizerStyle::O200k,
       {"<|endoftext|>", "<|endofprompt|>"}},
  };
  for (const auto &spec : specs) {
    if (spec.name == name)
      return &spec;
  }
  return nullptr;
}

// Directories searched for <encoding>.tiktoken, most specific first
std::vector<fs::path> default_encoding_search_dirs(const fs::path &configured) {
  std::vector<fs::path> dirs;
  if (!configured.empty())
    dirs.push_back(configured);
  const char *env_dir = std::getenv("LLMCAT_ENCODING_DIR");
  if (env_dir && *env_dir)
    dirs.emplace_back(env_dir);
  const char *home = std::getenv("HOME");
  if (home && *home)
    dirs.push_back(fs::path(home) / ".local/share/llmcat/encodings");
  dirs.emplace_back("/usr/local/share/llmcat/encodings");
  dirs.emplace_back("/usr/share/llmcat/encodings");
  return dirs;
}

bool decode_base64(std::string_view input, std::string &output) {
  static constexpr std::string_view alphabet =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  output.clear();
  if (input.size() % 4 != 0)
    return false;

  unsigned int buffer = 0;
  int bits = 0;
  size_t padding = 0;
  for (char c : input) {
    if (c == '=') {
      ++padding;
      continue;
    }
    if (padding > 0)
      return false; // Data after padding
    const size_t value = alphabet.find(c);
    if (value == std::string_view::npos)
      return false;
    buffer = (buffer << 6) | static_cast<unsigned int>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      output.push_back(static_cast<char>((buffer >> bits) & 0xFF));
    }
  }
  return padding <= 2;
}

// Loads a tiktoken rank file: one "<base64 token> <rank>" pair per line
bool load_tiktoken_ranks(const fs::path &path,
                         std::unordered_map<std::string, std::uint32_t> &ranks,
                         std::string &error) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    error = "cannot open " + normalize_path(path);
    return false;
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    line = trim(line);
    if (line.empty())
      continue;

    const std::string location =
        normalize_path(path) + ":" + std::to_string(line_number);
    const size_t space = line.find(' ');
    if (space == std::string::npos) {
      error = location + ": expected '<base64 token> <rank>'";
      return false;
    }
    std::string token;
    if (!decode_base64(std::string_view(line).substr(0, space), token)) {
      error = location + ": invalid base64 token";
      return false;
    }
    try {
      const unsigned long long rank = std::stoull(line.substr(space + 1));
      if (rank >= std::numeric_limits<std::uint32_t>::max())
        throw std::out_of_range("rank exceeds 32 bits");
      ranks[token] = static_cast<std::uint32_t>(rank);
    } catch (const std::exception &e) {
      error = location + ": invalid rank (" + e.what() + ")";
      return false;
    }
  }
  if (ranks.empty()) {
    error = normalize_path(path) + " contains no ranks";
    return false;
  }
  return true;
}

enum class CharClass { Letter, Number, Space, Other };
enum class LetterCase { Upper, Lower, Caseless };

struct CodePoint {
  size_t length; // Bytes
  char32_t value;
  CharClass cls;
  LetterCase letterCase;
};

// Approximates the Unicode categories the tiktoken patterns rely on.
// Non-ASCII code points default to letters.
CharClass classify_code_point(char32_t cp) {
  if (cp < 0x80) {
    const unsigned char c = static_cast<unsigned char>(cp);
    if (std::isalpha(c))
      return CharClass::Letter;
    if (std::isdigit(c))
      return CharClass::Number;
    if (std::isspace(c))
      return CharClass::Space;
    return CharClass::Other;
  }
  switch (cp) {
  case 0x85:
  case 0xA0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
    return CharClass::Space;
  default:
    break;
  }
  if (cp >= 0x2000 && cp <= 0x200A)
    return CharClass::Space;
  if ((cp >= 0x660 && cp <= 0x669) || (cp >= 0x6F0 && cp <= 0x6F9) ||
      (cp >= 0x966 && cp <= 0x96F) || (cp >= 0xFF10 && cp <= 0xFF19))
    return CharClass::Number;
  if ((cp >= 0xA1 && cp <= 0xBF && cp != 0xAA && cp != 0xB5 && cp != 0xBA) ||
      cp == 0xD7 || cp == 0xF7 || (cp >= 0x2010 && cp <= 0x2027) ||
      (cp >= 0x2030 && cp <= 0x205E) || (cp >= 0x20A0 && cp <= 0x20CF) ||
      (cp >= 0x2190 && cp <= 0x2BFF) || (cp >= 0x3001 && cp <= 0x3003) ||
      (cp >= 0x3008 && cp <= 0x3011) || (cp >= 0xFF01 && cp <= 0xFF0F) ||
      (cp >= 0x1F000 && cp <= 0x1FAFF))
    return CharClass::Other;
  return CharClass::Letter;
}

// Case of a letter for the o200k word rules. Covers ASCII, Latin-1,
// Latin Extended-A, Greek and Cyrillic; other letters and combining marks
// are caseless and may join either side of a word.
LetterCase letter_case(char32_t cp) {
  if (cp < 0x80) {
    const unsigned char c = static_cast<unsigned char>(cp);
    if (std::isupper(c))
      return LetterCase::Upper;
    if (std::islower(c))
      return LetterCase::Lower;
    return LetterCase::Caseless;
  }
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7)
    return LetterCase::Upper;
  if (cp >= 0xDF && cp <= 0xFF && cp != 0xF7)
    return LetterCase::Lower;
  if (cp >= 0x100 && cp <= 0x17F)
    return cp % 2 == 0 ? LetterCase::Upper : LetterCase::Lower;
  if (cp >= 0x391 && cp <= 0x3AB)
    return LetterCase::Upper;
  if (cp >= 0x3AC && cp <= 0x3CE)
    return LetterCase::Lower;
  if (cp >= 0x400 && cp <= 0x42F)
    return LetterCase::Upper;
  if (cp >= 0x430 && cp <= 0x45F)
    return LetterCase::Lower;
  return LetterCase::Caseless;
}

// Decodes the code point starting at byte pos. Invalid UTF-8 decodes as a
// single byte so every input byte is covered.
CodePoint decode_code_point(std::string_view text, size_t pos) {
  const unsigned char lead = static_cast<unsigned char>(text[pos]);
  size_t length = 1;
  char32_t value = lead;
  if (lead >= 0xC0 && lead < 0xE0) {
    length = 2;
    value = lead & 0x1F;
  } else if (lead >= 0xE0 && lead < 0xF0) {
    length = 3;
    value = lead & 0x0F;
  } else if (lead >= 0xF0 && lead < 0xF8) {
    length = 4;
    value = lead & 0x07;
  }
  if (length > 1) {
    bool valid = pos + length <= text.size();
    for (size_t k = 1; valid && k < length; ++k) {
      const unsigned char cont = static_cast<unsigned char>(text[pos + k]);
      if ((cont & 0xC0) != 0x80)
        valid = false;
      else
        value = (value << 6) | (cont & 0x3F);
    }
    if (!valid) {
      length = 1;
      value = lead;
    }
  }
  const CharClass cls = classify_code_point(value);
  return {length, value, cls,
          cls == CharClass::Letter ? letter_case(value) : LetterCase::Caseless};
}

// Length in bytes of an English contraction ('s 't 're 've 'm 'll 'd)
// starting at pos, or 0
size_t contraction_length(std::string_view text, size_t pos,
                          bool case_insensitive) {
  if (pos >= text.size() || text[pos] != '\'')
    return 0;
  static constexpr std::array<std::string_view, 7> suffixes = {
      "s", "t", "re", "ve", "m", "ll", "d"};
  for (std::string_view suffix : suffixes) {
    if (pos + suffix.size() >= text.size())
      continue;
    bool matched = true;
    for (size_t k = 0; matched && k < suffix.size(); ++k) {
      char c = text[pos + 1 + k];
      if (case_insensitive)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      matched = c == suffix[k];
    }
    if (matched)
      return suffix.size() + 1;
  }
  return 0;
}

// Calls visit(piece) for each piece that is byte-pair merged independently,
// in text order. Gpt2 follows the r50k/p50k pattern, Cl100k the cl100k one
// and O200k the o200k one. Code points are decoded on the fly, so memory use
// does not grow with the text.
template <class Visitor>
void for_each_pretoken(std::string_view text, PretokenizerStyle style,
                       Visitor &&visit) {
  const size_t n = text.size();
  auto at = [&](size_t pos) { return decode_code_point(text, pos); };
  auto is_class = [&](size_t pos, CharClass cls) {
    return pos < n && at(pos).cls == cls;
  };
  auto is_newline = [](const CodePoint &cp) {
    return cp.value == '\r' || cp.value == '\n';
  };
  // [^\r\n\p{L}\p{N}]
  auto is_word_prefix = [&](const CodePoint &cp) {
    return cp.cls != CharClass::Letter && cp.cls != CharClass::Number &&
           !is_newline(cp);
  };
  auto run_end = [&](size_t pos, CharClass cls) {
    while (pos < n) {
      const CodePoint cp = at(pos);
      if (cp.cls != cls)
        break;
      pos += cp.length;
    }
    return pos;
  };
  // \p{N}{1,3}
  auto number_end = [&](size_t pos) {
    for (int k = 0; k < 3 && pos < n; ++k) {
      const CodePoint cp = at(pos);
      if (cp.cls != CharClass::Number)
        break;
      pos += cp.length;
    }
    return pos;
  };
  // \s+(?!\S)|\s+ : a run before non-space text leaves its last character
  // to prefix the next piece
  auto whitespace_end = [&](size_t pos) {
    size_t end = pos;
    size_t last = pos;
    size_t count = 0;
    while (end < n) {
      const CodePoint cp = at(end);
      if (cp.cls != CharClass::Space)
        break;
      last = end;
      end += cp.length;
      ++count;
    }
    if (end == n || count == 1)
      return end;
    return last;
  };
  // \s*[\r\n]+ ahead of the plain whitespace rules
  auto space_piece_end = [&](size_t pos) {
    size_t end = pos;
    size_t after_newline = 0;
    while (end < n) {
      const CodePoint cp = at(end);
      if (cp.cls != CharClass::Space)
        break;
      end += cp.length;
      if (is_newline(cp))
        after_newline = end;
    }
    return after_newline > pos ? after_newline : whitespace_end(pos);
  };
  // ` ?[^\s\p{L}\p{N}]+` followed by line breaks (and '/' for o200k)
  auto symbol_or_space_end = [&](size_t pos, bool slash_tail) {
    size_t start = pos;
    if (text[pos] == ' ' && is_class(pos + 1, CharClass::Other))
      start = pos + 1;
    if (!is_class(start, CharClass::Other))
      return space_piece_end(pos);
    size_t end = run_end(start, CharClass::Other);
    while (end < n && (text[end] == '\r' || text[end] == '\n' ||
                       (slash_tail && text[end] == '/')))
      ++end;
    return end;
  };
  // o200k words: [Upper]*[lower]+ or else [Upper]+[lower]*, each with an
  // optional contraction. Caseless letters count on both sides. Returns
  // start when no word begins there.
  auto cased_word_end = [&](size_t start) {
    auto in_upper = [](const CodePoint &cp) {
      return cp.cls == CharClass::Letter && cp.letterCase != LetterCase::Lower;
    };
    auto in_lower = [](const CodePoint &cp) {
      return cp.cls == CharClass::Letter && cp.letterCase != LetterCase::Upper;
    };

    size_t upper_end = start;
    size_t last_lower = n; // Last code point of the upper run that is caseless
    size_t last_lower_length = 0;
    while (upper_end < n) {
      const CodePoint cp = at(upper_end);
      if (!in_upper(cp))
        break;
      if (in_lower(cp)) {
        last_lower = upper_end;
        last_lower_length = cp.length;
      }
      upper_end += cp.length;
    }
    size_t end = upper_end;
    while (end < n) {
      const CodePoint cp = at(end);
      if (!in_lower(cp))
        break;
      end += cp.length;
    }
    if (end == upper_end) {
      if (last_lower != n)
        end = last_lower + last_lower_length; // Upper run gives one back
      else if (upper_end > start)
        end = upper_end;
      else
        return start;
    }
    return end + contraction_length(text, end, true);
  };

  size_t i = 0;
  while (i < n) {
    const CodePoint cp = at(i);
    size_t end = i + cp.length;

    if (style == PretokenizerStyle::Gpt2) {
      const size_t contraction = contraction_length(text, i, false);
      if (contraction > 0) {
        end = i + contraction;
      } else {
        size_t start = i;
        if (cp.value == ' ' && i + 1 < n && !is_class(i + 1, CharClass::Space))
          start = i + 1;
        const CharClass cls = at(start).cls;
        end = cls != CharClass::Space ? run_end(start, cls) : whitespace_end(i);
      }
    } else if (style == PretokenizerStyle::Cl100k) {
      const size_t contraction = contraction_length(text, i, true);
      if (contraction > 0) {
        end = i + contraction;
      } else if (cp.cls == CharClass::Letter) {
        end = run_end(i, CharClass::Letter);
      } else if (is_word_prefix(cp) && is_class(end, CharClass::Letter)) {
        end = run_end(end, CharClass::Letter);
      } else if (cp.cls == CharClass::Number) {
        end = number_end(i);
      } else {
        end = symbol_or_space_end(i, false);
      }
    } else {
      size_t word_end = i;
      if (cp.cls == CharClass::Letter) {
        word_end = cased_word_end(i);
      } else if (is_word_prefix(cp)) {
        const size_t after_prefix = cased_word_end(end);
        if (after_prefix > end)
          word_end = after_prefix;
      }

      if (word_end > i)
        end = word_end;
      else if (cp.cls == CharClass::Number)
        end = number_end(i);
      else
        end = symbol_or_space_end(i, true);
    }

    visit(text.substr(i, end - i));
    i = end;
  }
}

std::vector<std::string_view> split_pretokens(std::string_view text,
                                              PretokenizerStyle style) {
  std::vector<std::string_view> pieces;
  for_each_pretoken(text, style,
                    [&](std::string_view piece) { pieces.push_back(piece); });
  return pieces;
}

// Byte-pair encoder over tiktoken rank files. Only the number of tokens is
// computed, never the token ids.
class BpeTokenCounter : public TokenCounter {
public:
  explicit BpeTokenCounter(std::vector<fs::path> search_dirs)
      : search_dirs_(std::move(search_dirs)) {}

  bool initialize(const std::string &encoding, std::string &error) override {
    const EncodingSpec *spec = find_encoding_spec(encoding);
    if (spec == nullptr) {
      error = "unknown encoding (known: r50k_base, p50k_base, p50k_edit, "
              "cl100k_base, o200k_base)";
      return false;
    }

    std::string searched;
    for (const auto &dir : search_dirs_) {
      const fs::path candidate = dir / spec->rankFile;
      std::error_code ec;
      if (!fs::is_regular_file(candidate, ec)) {
        searched += searched.empty() ? "" : ", ";
        searched += normalize_path(dir);
        continue;
      }
      std::unordered_map<std::string, std::uint32_t> ranks;
      if (!load_tiktoken_ranks(candidate, ranks, error))
        return false;
      ranks_ = std::move(ranks);
      spec_ = spec;
      return true;
    }
    error = "rank file " + std::string(spec->rankFile) +
            " not found (searched: " + searched + "). Download it from " +
            std::string(TIKTOKEN_DOWNLOAD_BASE) + std::string(spec->rankFile) +
            " or pass --encoding-dir";
    return false;
  }

  size_t count(std::string_view text) const override {
    if (spec_ == nullptr)
      return 0;

    size_t total = 0;
    while (!text.empty()) {
      // Earliest special token wins, the longer one on a tie
      size_t special_pos = std::string_view::npos;
      size_t special_len = 0;
      for (std::string_view special : spec_->specialTokens) {
        const size_t pos = text.find(special);
        if (pos == std::string_view::npos)
          continue;
        if (pos < special_pos ||
            (pos == special_pos && special.size() > special_len)) {
          special_pos = pos;
          special_len = special.size();
        }
      }

      for_each_pretoken(
          text.substr(0, special_pos), spec_->style,
          [&](std::string_view piece) { total += count_piece(piece); });
      if (special_pos == std::string_view::npos)
        break;
      total += 1;
      text.remove_prefix(special_pos + special_len);
    }
    return total;
  }

  void teardown() override {
    std::unordered_map<std::string, std::uint32_t>().swap(ranks_);
    spec_ = nullptr;
  }

private:
  std::uint32_t rank_of(std::string_view bytes) const {
    auto it = ranks_.find(std::string(bytes));
    return it == ranks_.end() ? std::numeric_limits<std::uint32_t>::max()
                              : it->second;
  }

  // Merges the lowest-ranked adjacent pair until no pair has a rank
  size_t count_piece(std::string_view piece) const {
    constexpr std::uint32_t NO_RANK = std::numeric_limits<std::uint32_t>::max();
    if (piece.size() <= 1)
      return piece.size();
    if (rank_of(piece) != NO_RANK)
      return 1;

    // (start offset, rank of the pair starting here)
    std::vector<std::pair<size_t, std::uint32_t>> parts;
    parts.reserve(piece.size() + 1);
    for (size_t i = 0; i + 1 < piece.size(); ++i)
      parts.emplace_back(i, rank_of(piece.substr(i, 2)));
    parts.emplace_back(piece.size() - 1, NO_RANK);
    parts.emplace_back(piece.size(), NO_RANK);

    auto pair_rank = [&](size_t i) {
      if (i + 3 < parts.size())
        return rank_of(
            piece.substr(parts[i].first, parts[i + 3].first - parts[i].first));
      return NO_RANK;
    };

    while (true) {
      size_t min_index = 0;
      std::uint32_t min_rank = NO_RANK;
      for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (parts[i].second < min_rank) {
          min_rank = parts[i].second;
          min_index = i;
        }
      }
      if (min_rank == NO_RANK)
        break;

      if (min_index > 0)
        parts[min_index - 1].second = pair_rank(min_index - 1);
      parts[min_index].second = pair_rank(min_index);
      parts.erase(parts.begin() + static_cast<std::ptrdiff_t>(min_index) + 1);
    }
    return parts.size() - 1;
  }

  std::vector<fs::path> search_dirs_;
  const EncodingSpec *spec_ = nullptr;
  std::unordered_map<std::string, std::uint32_t> ranks_;
};

// --- Task Dispatch ---

// Pre-enumerated indices handed out by a single atomic cursor
class TaskQueue {
public:
  explicit TaskQueue(size_t size) : size_(size) {}

  // Claims the next index; false once every index has been handed out
  bool claim(size_t &index) {
    index = cursor_.fetch_add(1, std::memory_order_relaxed);
    return index < size_;
  }

  size_t size() const { return size_; }

private:
  std::atomic<size_t> cursor_{0};
  const size_t size_;
};

size_t effective_worker_count(unsigned int requested_threads,
                              size_t task_count) {
  return std::min<size_t>(requested_threads, task_count);
}

// Calls process_task once for each index in [0, task_count). Small batches
// run on the calling thread. Returns the number of threads spawned.
size_t dispatch_tasks(size_t task_count, unsigned int requested_threads,
                      const std::function<void(size_t)> &process_task) {
  const size_t workers = effective_worker_count(requested_threads, task_count);
  if (workers == 0)
    return 0;
  if (workers == 1 || task_count == 1) {
    for (size_t i = 0; i < task_count; ++i)
      process_task(i);
    return 0;
  }

  TaskQueue queue(task_count);
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    try {
      threads.emplace_back([&queue, &process_task]() {
        size_t index = 0;
        while (queue.claim(index))
          process_task(index);
      });
    } catch (const std::system_error &e) {
      // Running workers drain the queue on their own
      std::cerr << "WARNING: Started " << threads.size() << " of " << workers
                << " worker threads: " << e.what() << '\n';
      break;
    }
  }

  if (threads.empty()) {
    size_t index = 0;
    while (queue.claim(index))
      process_task(index);
    return 0;
  }
  for (auto &thread : threads) {
    thread.join();
  }
  return threads.size();
}

// --- Result Aggregation ---

struct AggregationResult {
  std::string buffer;        // Structure listing followed by fragments
  size_t totalTokens = 0;
  size_t fileCount = 0;      // Tasks enumerated
  size_t workersSpawned = 0; // 0 when tasks ran on the calling thread
};

// The one shared buffer and token total; both only change under mutex_
class ResultAggregator {
public:
  explicit ResultAggregator(std::string initial)
      : buffer_(std::move(initial)) {}

  void merge(const std::string &fragment, size_t tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += fragment;
    total_tokens_ += tokens;
  }

  // Only call once every worker has been joined
  std::string take_buffer() { return std::move(buffer_); }
  size_t total_tokens() const { return total_tokens_; }

private:
  std::mutex mutex_;
  std::string buffer_;
  size_t total_tokens_ = 0;
};

std::string format_fragment_header(const FileTask &task) {
  if (task.isUrl)
    return "[ URL: " + task.path + " ]\n";
  return "[ " + task_location(task) + " ]\n";
}

// Builds a task's fragment privately, then merges it. Failures become inline
// text and add no tokens.
void process_task(const FileTask &task, const TokenCounter &counter,
                  const UrlFetcher &fetcher, ResultAggregator &aggregator) {
  std::string fragment = format_fragment_header(task);
  size_t tokens = 0;
  const std::string error_prefix =
      task.isUrl ? "Error fetching URL: " : "Error reading file: ";

  try {
    std::string content;
    std::string error;
    bool ok = false;
    if (task.isUrl) {
      FetchResult fetched = fetcher(task.path);
      ok = fetched.ok;
      content = std::move(fetched.body);
      error = std::move(fetched.error);
    } else {
      ok = read_file_bounded(task_location(task), MAX_READ_BYTES, content,
                             error);
    }

    if (ok) {
      tokens = counter.count(content);
      fragment += content;
      fragment += "\n\n";
    } else {
      fragment += error_prefix + error + "\n\n";
    }
  } catch (const std::exception &e) {
    tokens = 0;
    fragment = format_fragment_header(task) + error_prefix + e.what() + "\n\n";
  }

  aggregator.merge(fragment, tokens);
}

// Expands the targets, runs every task and returns the merged document.
// Throws std::invalid_argument for configurations that must not dispatch.
AggregationResult aggregate_targets(const Config &config,
                                    const TokenCounter &counter,
                                    const UrlFetcher &fetcher) {
  if (config.targets.empty())
    throw std::invalid_argument("No targets to process");
  if (config.threads == 0)
    throw std::invalid_argument("Thread count must be at least 1");

  const ExpandedTargets expanded =
      expand_targets(config.targets, config.excludePatterns);

  ResultAggregator aggregator(render_structure(expanded.structureLines));
  AggregationResult result;
  result.fileCount = expanded.tasks.size();
  result.workersSpawned =
      dispatch_tasks(expanded.tasks.size(), config.threads, [&](size_t index) {
        process_task(expanded.tasks[index], counter, fetcher, aggregator);
      });

  result.totalTokens = aggregator.total_tokens();
  result.buffer = aggregator.take_buffer();
  return result;
}

// --- Result Handoff ---

bool write_output_file(const fs::path &output_file, const std::string &content) {
  try {
    const fs::path absOutputPath = fs::absolute(output_file);
    const fs::path parentPath = absOutputPath.parent_path();

    if (!parentPath.empty() && !fs::exists(parentPath)) {
      fs::create_directories(parentPath);
      std::cerr << "Info: Created output directory: "
                << normalize_path(parentPath) << '\n';
    }
    if (fs::is_directory(absOutputPath)) {
      std::cerr << "ERROR: Output path is an existing directory: "
                << normalize_path(absOutputPath) << '\n';
      return false;
    }

    // Binary mode keeps the bytes exactly as aggregated
    std::ofstream out(absOutputPath,
                      std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
      std::cerr << "ERROR: Could not open output file for writing: "
                << normalize_path(absOutputPath) << '\n';
      return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
      std::cerr << "ERROR: Failed to write to output file: "
                << normalize_path(absOutputPath) << '\n';
      return false;
    }
  } catch (const fs::filesystem_error &e) {
    std::cerr << "ERROR: Cannot prepare output file "
              << normalize_path(output_file) << ": " << e.what() << '\n';
    return false;
  }
  return true;
}

bool command_exists(const std::string &name) {
  const std::string lookup = "command -v " + name + " >/dev/null 2>&1";
  return std::system(lookup.c_str()) == 0;
}

// Feeds data to a command's stdin; true only if it was all written and the
// command exited with status 0
bool pipe_to_command(const std::string &command, const std::string &data) {
  FILE *pipe = popen(command.c_str(), "w");
  if (!pipe)
    return false;
  const size_t written = std::fwrite(data.data(), 1, data.size(), pipe);
  const int status = pclose(pipe);
  return written == data.size() && status == 0;
}

bool copy_to_clipboard(const std::string &content) {
  const char *wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland && *wayland && command_exists("wl-copy") &&
      pipe_to_command("wl-copy", content)) {
    return true;
  }
  return command_exists("xclip") &&
         pipe_to_command("xclip -selection clipboard", content);
}

// Hands the finished document to the configured sinks
bool deliver_result(const Config &config, const AggregationResult &result) {
  if (config.countTokensOnly) {
    std::cout << "Token count: " << result.totalTokens << '\n';
    if (config.countFiles)
      std::cout << "Processed " << result.fileCount << " files\n";
    return true;
  }

  if (result.fileCount == 0) {
    if (config.print)
      std::cout << result.buffer << std::flush;
    std::cerr << "No files to process.\n";
    return true;
  }

  if (config.print) {
    std::cout << result.buffer << std::flush;
  }

  if (!config.outputFile.empty()) {
    if (!write_output_file(config.outputFile, result.buffer))
      return false;
    std::cerr << "Content written to "
              << normalize_path(fs::absolute(config.outputFile)) << '\n';
  } else if (!config.print) {
    if (!copy_to_clipboard(result.buffer)) {
      std::cerr << "ERROR: Failed to copy content to clipboard (tried wl-copy "
                   "and xclip).\n";
      return false;
    }
    std::cerr << "Content copied to clipboard!\n";
  }

  std::cerr << "Token count: " << result.totalTokens << '\n';
  if (config.countFiles)
    std::cerr << "Processed " << result.fileCount << " files\n";
  return true;
}

// --- Interactive Selection ---

// Regular files under root, relative and sorted, as offered to fzf
std::vector<std::string> list_selectable_files(const fs::path &root) {
  std::vector<std::string> files;
  std::error_code ec;
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  for (fs::recursive_directory_iterator end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec))
      files.push_back(normalize_path(it->path().lexically_relative(root)));
  }
  if (ec) {
    std::cerr << "WARNING: Stopped scanning " << normalize_path(root) << ": "
              << ec.message() << '\n';
  }
  std::sort(files.begin(), files.end());
  return files;
}

// Single-quotes a word for /bin/sh
std::string shell_quote(std::string_view word) {
  std::string quoted = "'";
  for (char c : word) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += '\'';
  return quoted;
}

// Writes one line per file to a new file under dir. mkstemp picks a fresh
// name and creates it exclusively, so an existing file or link is never
// opened.
bool write_selection_list(const fs::path &dir,
                          const std::vector<std::string> &files,
                          fs::path &list_path, std::string &error) {
  const std::string name_template = (dir / "llmcat-fzf-XXXXXX").string();
  std::vector<char> name(name_template.begin(), name_template.end());
  name.push_back('\0');
  const int fd = ::mkstemp(name.data());
  if (fd == -1) {
    error = "could not create a file list in " + normalize_path(dir) + ": " +
            std::strerror(errno);
    return false;
  }
  list_path = name.data();

  FILE *list = ::fdopen(fd, "w");
  bool ok = list != nullptr;
  if (!ok) {
    error = "could not open " + normalize_path(list_path) + ": " +
            std::strerror(errno);
    ::close(fd);
  } else {
    for (const auto &file : files) {
      if (std::fputs(file.c_str(), list) == EOF ||
          std::fputc('\n', list) == EOF) {
        ok = false;
        break;
      }
    }
    if (std::fclose(list) != 0)
      ok = false;
    if (!ok)
      error = "could not write " + normalize_path(list_path);
  }

  if (!ok) {
    std::error_code ec;
    fs::remove(list_path, ec);
    if (ec)
      error += " (left behind: " + ec.message() + ")";
  }
  return ok;
}

bool select_with_fzf(std::vector<std::string> &selected) {
  if (!command_exists("fzf")) {
    std::cerr << "ERROR: fzf is not installed or not in PATH.\n";
    return false;
  }

  fs::path list_path;
  std::string error;
  std::error_code temp_ec;
  const fs::path temp_dir = fs::temp_directory_path(temp_ec);
  if (temp_ec) {
    std::cerr << "ERROR: No temporary directory: " << temp_ec.message()
              << '\n';
    return false;
  }
  if (!write_selection_list(temp_dir, list_selectable_files("."), list_path,
                            error)) {
    std::cerr << "ERROR: " << error << '\n';
    return false;
  }

  const std::string command =
      "fzf -m --height=40% --border --preview 'cat {}' < " +
      shell_quote(list_path.string());
  FILE *pipe = popen(command.c_str(), "r");
  std::string output;
  int status = -1;
  if (pipe) {
    std::array<char, 4096> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
      output.append(buffer.data(), n);
    }
    status = pclose(pipe);
  }

  std::error_code ec;
  fs::remove(list_path, ec);
  if (ec) {
    std::cerr << "WARNING: Could not remove " << normalize_path(list_path)
              << ": " << ec.message() << '\n';
  }

  if (status != 0) {
    std::cerr << "ERROR: fzf exited without a selection.\n";
    return false;
  }

  std::istringstream lines(output);
  std::string line;
  while (std::getline(lines, line)) {
    line = trim(line);
    if (!line.empty())
      selected.push_back(line);
  }
  return true;
}

// --- Argument Parsing ---

void print_usage(const char *program) {
  std::cerr << "Usage: " << program << " [options] [targets...]\n";
  std::cerr << "Concatenates files, directory trees and URLs into one "
               "document and counts its tokens.\n\n";
  std::cerr << "Targets can be files, directories or URLs (http:// or "
               "https://).\n";
  std::cerr << "Without targets, files are picked interactively with fzf.\n\n";
  std::cerr << "Options:\n";

  std::vector<std::pair<std::string, std::string>> options = {
      {"-p, --print", "Print the result to stdout."},
      {"-o, --output <file>",
       "Write the result to <file> instead of the clipboard."},
      {"-e, --exclude <pattern>",
       "Skip paths equal to, ending with, containing or under <pattern>. "
       "May be repeated."},
      {"-t, --threads <n>", "Number of worker threads. Default: 4."},
      {"-f, --fzf", "Pick files interactively with fzf."},
      {"--encoding <name>",
       "Tokenizer encoding (r50k_base, p50k_base, p50k_edit, cl100k_base, "
       "o200k_base). Default: cl100k_base."},
      {"--encoding-dir <dir>",
       "Directory searched first for <encoding>.tiktoken (see below)."},
      {"--count-files", "Also report the number of files processed."},
      {"--count-tokens", "Only report the token count."},
      {"-h, --help", "Show this help message."}};

  size_t max_option_length = 0;
  for (const auto &option : options) {
    max_option_length = std::max(max_option_length, option.first.length());
  }
  for (const auto &option : options) {
    std::cerr << "  " << std::left << std::setw(max_option_length + 2)
              << option.first << option.second << "\n";
  }

  std::cerr << "\nEncodings:\n";
  std::cerr << "  Token counts need the tiktoken rank file <encoding>.tiktoken "
               "(p50k_edit\n  uses p50k_base.tiktoken). llmcat ships none; "
               "download them from\n  "
            << TIKTOKEN_DOWNLOAD_BASE << "<encoding>.tiktoken\n";
  std::cerr << "  Searched in order:\n";
  std::cerr << "    --encoding-dir <dir>\n";
  std::cerr << "    $LLMCAT_ENCODING_DIR\n";
  std::cerr << "    $HOME/.local/share/llmcat/encodings\n";
  std::cerr << "    /usr/local/share/llmcat/encodings\n";
  std::cerr << "    /usr/share/llmcat/encodings\n";
}

// Accepts a positive decimal integer that fits in an unsigned int
bool parse_thread_count(const std::string &value, unsigned int &threads) {
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    return false;
  try {
    const unsigned long long parsed = std::stoull(value);
    if (parsed == 0 || parsed > std::numeric_limits<unsigned int>::max())
      return false;
    threads = static_cast<unsigned int>(parsed);
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

Config parse_arguments(int argc, char *argv[]) {
  Config config;

  if (argc < 2) {
    config.fzfMode = true;
    return config;
  }
  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == "-h" ||
        std::string_view(argv[i]) == "--help") {
      print_usage(argv[0]);
      exit(0);
    }
  }

  auto require_value = [&](int &i, std::string_view option) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "ERROR: Missing value for " << option << "\n\n";
      print_usage(argv[0]);
      exit(1);
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.empty() || arg[0] != '-') {
      config.targets.emplace_back(arg);
    } else if (arg == "-p" || arg == "--print") {
      config.print = true;
    } else if (arg == "-o" || arg == "--output") {
      config.outputFile = require_value(i, arg);
    } else if (arg == "-e" || arg == "--exclude") {
      config.excludePatterns.push_back(require_value(i, arg));
    } else if (arg == "-t" || arg == "--threads") {
      const std::string value = require_value(i, arg);
      if (!parse_thread_count(value, config.threads)) {
        std::cerr << "ERROR: Invalid thread count: '" << value
                  << "'. Use a positive integer.\n";
        exit(1);
      }
    } else if (arg == "-f" || arg == "--fzf") {
      config.fzfMode = true;
    } else if (arg == "--encoding") {
      config.encoding = require_value(i, arg);
    } else if (arg == "--encoding-dir") {
      config.encodingDir = require_value(i, arg);
    } else if (arg == "--count-files") {
      config.countFiles = true;
    } else if (arg == "--count-tokens") {
      config.countTokensOnly = true;
    } else {
      std::cerr << "ERROR: Unknown or invalid option: " << arg << "\n\n";
      print_usage(argv[0]);
      exit(1);
    }
  }

  return config;
}
