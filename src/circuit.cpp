#include "spicelib.hpp"
#include "spice_grammar.hpp"
#include "spice_actions.hpp"
#include "spice_text.hpp"
#include <tao/pegtl.hpp>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <regex>
#include <sstream>
#include <unordered_set>

using namespace tao::pegtl;

namespace spice {

namespace {

using detail::to_lower;

std::string describe(const std::string& msg, std::size_t line, const std::string& text) {
  return msg + " (line " + std::to_string(line) + ": '" + text + "')";
}

std::string trim(std::string_view s) {
  auto a = s.find_first_not_of(" \t\r\n");
  auto b = s.find_last_not_of(" \t\r\n");
  return (a == std::string_view::npos) ? std::string() : std::string(s.substr(a, b - a + 1));
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (const auto& p : parts) {
    if (p.empty()) continue;
    if (!out.empty()) out += sep;
    out += p;
  }
  return out;
}

} // namespace

// ---------- errors ----------

parse_error::parse_error(const std::string& msg)
  : std::runtime_error(msg) {}

parse_error::parse_error(const std::string& msg, std::size_t line, std::string text)
  : std::runtime_error(describe(msg, line, text)), line_(line), text_(std::move(text)) {}

unknown_element_type::unknown_element_type(std::size_t line, std::string text)
  : parse_error("unknown element type", line, std::move(text)) {}

duplicate_identifier::duplicate_identifier(std::size_t line, std::string text)
  : parse_error("duplicate element identifier", line, std::move(text)) {}

// ---------- elements ----------

std::string Element::port_string() const {
  std::vector<std::string> nodes;
  for (const auto& p : ports) nodes.push_back(p.second);
  return join(nodes, " ");
}

std::string Element::to_line() const {
  return join({ instance, port_string(), join(args, " ") }, " ");
}

bool operator==(const Element& a, const Element& b) {
  return a.instance == b.instance && a.category == b.category && a.ports == b.ports &&
         a.location == b.location && a.args == b.args;
}
bool operator!=(const Element& a, const Element& b) { return !(a == b); }

// FNV-1a over the line index and the line text.
Uid make_uid(std::size_t index, std::string_view text) {
  std::uint64_t h = 14695981039346656037ull;
  auto mix = [&](char c) { h ^= (unsigned char)c; h *= 1099511628211ull; };
  for (char c : std::to_string(index)) mix(c);
  mix('\n');
  for (char c : text) mix(c);
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
  return Uid(buf);
}

std::string ParseContext::location() const {
  std::string out;
  for (const auto& h : hierarchy) {
    if (!out.empty()) out += '/';
    out += h;
  }
  return out;
}

// ---------- line parser ----------

std::optional<Element> parse_line(std::string_view raw, std::size_t index, ParseContext& ctx) {
  const std::string line = trim(raw);
  if (line.empty() || line[0] == '*' || to_lower(line) == ".end") return std::nullopt;

  actions::LineState st;
  memory_input in(line.data(), line.size(), "netlist line " + std::to_string(index));
  try {
    if (!tao::pegtl::parse< grammar::statement, actions::action >(in, st)) {
      throw parse_error("malformed line", index, line);
    }
  } catch (const tao::pegtl::parse_error& e) {
    throw parse_error(e.what(), index, line);
  }

  const std::string head = to_lower(st.instance);
  if (ctx.in_control || head == ".control") {
    ctx.in_control = (head != ".endc");
    return std::nullopt;
  }

  if (head == ".subckt") {
    if (!st.subckt_name) throw parse_error(".subckt without a name", index, line);
    ctx.hierarchy.push_back(*st.subckt_name);
  }
  if (head == ".ends" && ctx.hierarchy.size() <= 1) {
    throw parse_error(".ends without an open .subckt", index, line);
  }

  const ElementType* type = find_element_type(st.instance);
  if (!type) throw unknown_element_type(index, line);
  if (st.fields.size() < type->ports.size()) {
    throw parse_error("too few ports for " + type->category, index, line);
  }

  Element e;
  e.instance = st.instance;
  e.category = type->category;
  for (std::size_t i = 0; i < type->ports.size(); ++i)
    e.ports.emplace_back(type->ports[i], st.fields[i]);
  e.args.assign(st.fields.begin() + type->ports.size(), st.fields.end());
  e.location = ctx.location();

  if (head == ".ends") ctx.hierarchy.pop_back();
  return e;
}

Elements parse_netlist(std::string_view text) {
  Elements out;
  ParseContext ctx;
  std::size_t index = 0, start = 0;
  for (;;) {
    auto nl = text.find('\n', start);
    std::string_view line = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
    if (auto e = parse_line(line, index, ctx)) {
      Uid uid = make_uid(index, line);
      if (out.contains(uid)) throw duplicate_identifier(index, std::string(line));
      out.order.push_back(uid);
      out.by_uid.emplace(std::move(uid), std::move(*e));
    }
    if (nl == std::string_view::npos) break;
    start = nl + 1;
    ++index;
  }
  return out;
}

// ---------- serializer ----------

std::string synthesize(const Elements& elements, const std::string& label) {
  std::ostringstream oss;
  oss << "* " << label << "\n\n";
  for (const auto& uid : elements.order) {
    const Element& e = elements.by_uid.at(uid);
    oss << e.to_line() << "\n";
    if (to_lower(e.instance) == ".ends") oss << "\n";
  }
  return oss.str();
}

// ---------- query ----------

Field field_from_string(const std::string& name) {
  if (name == "instance") return Field::Instance;
  if (name == "type" || name == "category") return Field::Category;
  if (name == "ports") return Field::Ports;
  if (name == "location") return Field::Location;
  if (name == "args") throw std::invalid_argument("args is not a matchable field");
  throw std::invalid_argument("unknown element field: " + name);
}

std::string field_value(const Element& e, Field f) {
  switch (f) {
    case Field::Instance: return e.instance;
    case Field::Category: return e.category;
    case Field::Ports:    return e.port_string();
    case Field::Location: return e.location;
  }
  return {};
}

// ---------- circuit ----------

Circuit::Circuit(std::string filename, Elements parsed)
  : filename_(std::move(filename)), parsed_(std::move(parsed)), circuit_(parsed_) {}

Circuit Circuit::from_file(const std::string& path) {
  return Circuit(path, parse_netlist(read_netlist(path)));
}

Circuit Circuit::from_string(std::string_view text, std::string label) {
  return Circuit(std::move(label), parse_netlist(clean_netlist(text)));
}

const Element& Circuit::get(const Uid& uid) const {
  auto it = circuit_.by_uid.find(uid);
  if (it == circuit_.by_uid.end()) throw std::out_of_range("no element with id " + uid);
  return it->second;
}

Element& Circuit::get(const Uid& uid) {
  auto it = circuit_.by_uid.find(uid);
  if (it == circuit_.by_uid.end()) throw std::out_of_range("no element with id " + uid);
  return it->second;
}

void Circuit::set(const Uid& uid, Element element) { get(uid) = std::move(element); }

void Circuit::reset() { circuit_ = parsed_; }

Uid Circuit::append(std::string_view raw) {
  const std::string line = clean_netlist(raw);
  if (line.find('\n') != std::string::npos)
    throw parse_error("append takes a single statement", size(), line);

  ParseContext ctx;
  auto e = parse_line(line, size(), ctx);
  if (!e) throw parse_error("line carries no circuit element", size(), line);

  std::size_t count = 0;
  Uid uid;
  do { uid = make_uid(count++, line); } while (circuit_.contains(uid));
  circuit_.order.push_back(uid);
  circuit_.by_uid.emplace(uid, std::move(*e));
  return uid;
}

std::string Circuit::netlist() const { return synthesize(circuit_, filename_); }

void Circuit::write(const std::string& path) const { write_netlist(netlist(), path); }

std::vector<Uid> Circuit::match(const std::string& field, const std::string& pattern) const {
  const Field f = field_from_string(field);
  const std::regex re(pattern);
  std::vector<Uid> out;
  for (const auto& uid : circuit_.order) {
    if (std::regex_match(field_value(circuit_.by_uid.at(uid), f), re)) out.push_back(uid);
  }
  return out;
}

std::vector<Uid> Circuit::filter(const std::string& field, const std::string& pattern) const {
  return match(field, pattern);
}

std::vector<Uid> Circuit::filter(const Criteria& criteria) const {
  if (criteria.empty()) return circuit_.order;
  std::vector<Uid> matches = match(criteria.front().first, criteria.front().second);
  for (std::size_t i = 1; i < criteria.size() && !matches.empty(); ++i) {
    auto next = match(criteria[i].first, criteria[i].second);
    std::unordered_set<Uid> keep(next.begin(), next.end());
    std::vector<Uid> narrowed;
    for (auto& uid : matches) if (keep.count(uid)) narrowed.push_back(uid);
    matches = std::move(narrowed);
  }
  return matches;
}

std::size_t Circuit::apply(const Transform& fn, const Criteria& criteria) {
  const auto matches = filter(criteria);
  for (const auto& uid : matches) {
    Element& slot = get(uid);
    slot = fn(slot);
  }
  return matches.size();
}

std::size_t Circuit::apply(const ParamTransform& fn, const Criteria& criteria, const Params& params) {
  return apply([&](Element e) { return fn(std::move(e), params); }, criteria);
}

} // namespace spice
