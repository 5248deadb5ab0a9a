#include "spicelib.hpp"
#include "spice_text.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace spice {

namespace {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  for (;;) {
    auto nl = text.find('\n', start);
    if (nl == std::string_view::npos) { out.emplace_back(text.substr(start)); break; }
    out.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v'; }

std::string lstrip(const std::string& s) {
  std::size_t i = 0; while (i < s.size() && is_blank(s[i])) ++i;
  return s.substr(i);
}

bool only_blanks(const std::string& s, std::size_t from = 0) {
  for (std::size_t i = from; i < s.size(); ++i) if (!is_blank(s[i])) return false;
  return true;
}

// Text after the first unescaped '$' is a comment.
std::string strip_eol_comment(const std::string& s) {
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '$' && (i == 0 || s[i-1] != '\\')) return s.substr(0, i);
  }
  return s;
}

// Any run of blanks becomes one space; the ends are trimmed.
std::string collapse_blanks(const std::string& s) {
  std::string out; out.reserve(s.size());
  bool pending = false;
  for (char c : s) {
    if (is_blank(c)) { pending = true; continue; }
    if (pending && !out.empty()) out.push_back(' ');
    pending = false;
    out.push_back(c);
  }
  return out;
}

// An '=' that belongs to <=, >=, != or == is an operator, not an assignment.
bool is_assignment(const std::string& s, std::size_t i) {
  if (i > 0 && std::string("<>!=").find(s[i-1]) != std::string::npos) return false;
  return !(i + 1 < s.size() && s[i+1] == '=');
}

std::string tighten_assignments(const std::string& s) {
  std::string out; out.reserve(s.size());
  bool after_assign = false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == ' ') {
      if (after_assign) continue;
      if (i + 1 < s.size() && s[i+1] == '=' && is_assignment(s, i + 1)) continue;
    } else {
      after_assign = (s[i] == '=' && is_assignment(s, i));
    }
    out.push_back(s[i]);
  }
  return out;
}

bool is_include(const std::string& s) {
  static const std::string kw = ".include";
  if (s.size() < kw.size()) return false;
  for (std::size_t i = 0; i < kw.size(); ++i)
    if (std::tolower((unsigned char)s[i]) != kw[i]) return false;
  return true;
}

} // namespace

std::string remove_enclosed_space(std::string_view line) {
  std::string out; out.reserve(line.size());
  bool quoted = false;
  for (char c : line) {
    if (c == '\'') quoted = !quoted;
    else if (quoted && c == ' ') continue;
    out.push_back(c);
  }
  return out;
}

// The order of the steps matters.
std::string clean_netlist(const std::vector<std::string>& lines) {
  std::vector<std::string> a;
  for (const auto& raw : lines) {
    std::string line = lstrip(raw);
    if (only_blanks(line)) continue;
    if (line[0] == '*') continue;
    if (line[0] == '+' && only_blanks(line, 1)) continue;
    a.push_back(std::move(line));
  }

  for (auto& line : a) line = strip_eol_comment(line);

  // A continuation with nothing before it starts a line of its own.
  std::vector<std::string> b;
  for (auto& line : a) {
    if (!line.empty() && line[0] == '+') {
      std::string rest = lstrip(line.substr(1));
      if (b.empty()) b.push_back(rest);
      else b.back() += " " + rest;
    } else {
      b.push_back(std::move(line));
    }
  }

  std::ostringstream oss;
  for (std::size_t i = 0; i < b.size(); ++i) {
    std::string line = collapse_blanks(b[i]);
    line = remove_enclosed_space(line);
    line = tighten_assignments(line);
    if (!is_include(line)) line = detail::to_lower(line);
    if (i) oss << '\n';
    oss << line;
  }
  return oss.str();
}

std::string clean_netlist(std::string_view text) {
  return clean_netlist(split_lines(text));
}

std::string read_netlist(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw parse_error("could not open file: " + path);
  std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return clean_netlist(content);
}

void write_netlist(const std::string& text, const std::string& path) {
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("could not write file: " + path);
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  ofs << "* Netlist written: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "\n";
  ofs << text;
  if (!ofs) throw std::runtime_error("failed writing file: " + path);
}

} // namespace spice
