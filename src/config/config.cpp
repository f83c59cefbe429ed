#include "line_chunker/config.hpp"
#include <cctype>
#include <charconv>
#include <limits>

namespace lc {

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

std::string upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

bool parse_positive(std::string_view s, std::size_t& out) {
  std::size_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size() || v == 0) return false;
  out = v;
  return true;
}

bool parse_mib(std::string_view s, std::size_t& out) {
  std::size_t mb = 0;
  if (!parse_positive(s, mb)) return false;
  if (mb > std::numeric_limits<std::size_t>::max() / kMiB) return false;
  out = mb * kMiB;
  return true;
}

bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

}

bool parse_line_ending(std::string_view name, std::string& out, std::string* err_out) {
  const std::string u = upper(name);
  if (u == "LF")   { out = "\n";   return true; }
  if (u == "CRLF") { out = "\r\n"; return true; }
  if (u == "CR")   { out = "\r";   return true; }
  if (u.rfind("CUSTOM:", 0) == 0) {
    std::string_view lit = name.substr(7);
    std::string v;
    v.reserve(lit.size());
    for (std::size_t i = 0; i < lit.size(); ++i) {
      if (lit[i] == '\\' && i + 1 < lit.size() && (lit[i+1] == 'n' || lit[i+1] == 'r')) {
        v.push_back(lit[i+1] == 'n' ? '\n' : '\r');
        ++i;
      } else {
        v.push_back(lit[i]);
      }
    }
    if (v.empty()) return fail(err_out, "custom line ending must not be empty");
    out = std::move(v);
    return true;
  }
  return fail(err_out, "invalid line ending '" + std::string(name) + "' (use LF, CRLF, CR or custom:xxx)");
}

bool is_help_request(const std::vector<std::string>& args) {
  for (std::size_t i = 1; i < args.size(); ++i)
    if (args[i] == "-h" || args[i] == "--help") return true;
  return false;
}

bool parse_args(const std::vector<std::string>& args, SplitConfig& out, std::string* err_out) {
  SplitConfig c;
  std::vector<std::string_view> pos;

  for (std::size_t i = 1; i < args.size(); ++i) {
    std::string_view a(args[i]);
    auto eat = [&](std::string_view pfx, std::string_view* v) {
      if (a.substr(0, pfx.size()) != pfx) return false;
      *v = a.substr(pfx.size());
      return true;
    };
    std::string_view v;
    if (eat("--level=", &v)) {
      std::size_t lvl = 0;
      if (!parse_positive(v, lvl) || lvl > 9) return fail(err_out, "--level must be 1..9");
      c.level = static_cast<int>(lvl);
      continue;
    }
    if (eat("--read-mb=", &v)) {
      if (!parse_mib(v, c.read_bytes)) return fail(err_out, "--read-mb must be a positive integer");
      continue;
    }
    if (eat("--report=", &v)) {
      if (v.empty()) return fail(err_out, "--report needs a path");
      c.report_path = std::string(v);
      continue;
    }
    if (a == "--quiet") { c.quiet = true; continue; }
    if (a.size() > 2 && a.substr(0, 2) == "--") return fail(err_out, "unknown option " + std::string(a));
    pos.push_back(a);
  }

  if (pos.size() < 2) return fail(err_out, "missing <input_file> and/or <output_prefix>");
  if (pos.size() > 5) return fail(err_out, "too many arguments");

  c.input_path = std::string(pos[0]);
  c.output_prefix = std::string(pos[1]);
  if (c.output_prefix.empty()) return fail(err_out, "output prefix must not be empty");

  if (pos.size() >= 3 && !parse_mib(pos[2], c.chunk_bytes))
    return fail(err_out, "invalid chunk size '" + std::string(pos[2]) + "' (positive integer, MB)");

  if (pos.size() >= 4 && !parse_line_ending(pos[3], c.line_ending, err_out)) return false;

  if (pos.size() >= 5) {
    auto enc = parse_encoding(pos[4]);
    if (!enc) return fail(err_out, "unsupported encoding '" + std::string(pos[4]) +
                                   "' (UTF-8, GBK, GB18030, UTF-16LE, UTF-16BE, ISO-8859-1)");
    c.encoding = *enc;
  }

  out = std::move(c);
  return true;
}

std::string usage(std::string_view argv0) {
  std::string u = "Usage: ";
  u += argv0;
  u += " <input_file> <output_prefix> [chunk_size_mb] [line_ending] [encoding]\n"
       "       [--level=1..9] [--read-mb=N] [--report=PATH] [--quiet]\n"
       "  chunk_size_mb  target uncompressed chunk size in MB (default 100)\n"
       "  line_ending    LF (\\n, default) | CRLF (\\r\\n) | CR (\\r) | custom:<literal>\n"
       "                 e.g. custom:\\r\\n\\r\\n\n"
       "  encoding       UTF-8 (default) | GBK | GB18030 | UTF-16LE | UTF-16BE | ISO-8859-1\n"
       "  --level        gzip level (default 6)\n"
       "  --read-mb      read block size in MB (default 8)\n"
       "  --report       write a JSON run report\n"
       "Output: <output_prefix>.001.gz, <output_prefix>.002.gz, ...\n";
  return u;
}

}
