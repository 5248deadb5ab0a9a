#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <unordered_map>
#include <functional>
#include <stdexcept>
#include <cstddef>
#include <utility>

namespace spice {

// ---------- errors ----------

struct parse_error : std::runtime_error {
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  explicit parse_error(const std::string& msg);
  parse_error(const std::string& msg, std::size_t line, std::string text);

  std::size_t line() const { return line_; }
  const std::string& text() const { return text_; }

private:
  std::size_t line_ = npos;
  std::string text_;
};

struct unknown_element_type : parse_error {
  unknown_element_type(std::size_t line, std::string text);
};

struct duplicate_identifier : parse_error {
  duplicate_identifier(std::size_t line, std::string text);
};

struct malformed_argument : std::runtime_error { using std::runtime_error::runtime_error; };

// ---------- text normalizer ----------

std::string clean_netlist(std::string_view text);
std::string clean_netlist(const std::vector<std::string>& lines);
std::string remove_enclosed_space(std::string_view line);

std::string read_netlist(const std::string& path);
void write_netlist(const std::string& text, const std::string& path);

// ---------- element type table ----------

struct ElementType {
  std::string prefix;               // "r", "xm", ...
  std::string category;             // "resistor", "mosfet", ...
  std::vector<std::string> ports;   // ordered port roles, empty = everything is args
};

// Classifies by the first one or two characters of `instance`.
// Returns nullptr for an unknown prefix.
const ElementType* find_element_type(std::string_view instance);
const std::vector<ElementType>& element_types();

// ---------- circuit model ----------

using Uid = std::string;
using PortMap = std::vector<std::pair<std::string, std::string>>;

struct Element {
  std::string instance;
  std::string category;
  PortMap ports;
  std::string location;
  std::vector<std::string> args;

  std::string port_string() const;  // node names, space joined
  std::string to_line() const;      // regenerated netlist line
};

bool operator==(const Element& a, const Element& b);
bool operator!=(const Element& a, const Element& b);

// Insertion ordered arena of elements.
struct Elements {
  std::vector<Uid> order;
  std::unordered_map<Uid, Element> by_uid;

  bool contains(const Uid& uid) const { return by_uid.count(uid) != 0; }
  std::size_t size() const { return order.size(); }
  bool empty() const { return order.empty(); }
};

Uid make_uid(std::size_t index, std::string_view text);

// Parse-time state carried from line to line.
struct ParseContext {
  std::vector<std::string> hierarchy{"root"};
  bool in_control = false;

  std::string location() const;
};

// Parses one normalized line; `ctx` follows .subckt/.ends and .control/.endc.
// Returns nothing for lines that carry no element.
std::optional<Element> parse_line(std::string_view line, std::size_t index, ParseContext& ctx);

// Parses normalized netlist text. Control sections are skipped.
Elements parse_netlist(std::string_view text);

std::string synthesize(const Elements& elements, const std::string& label);

enum class Field { Instance, Category, Ports, Location };
Field field_from_string(const std::string& name);
std::string field_value(const Element& e, Field f);

using Criterion = std::pair<std::string, std::string>;   // field, regex
using Criteria  = std::vector<Criterion>;
using Params    = std::vector<std::pair<std::string, std::string>>;

using Transform      = std::function<Element(Element)>;
using ParamTransform = std::function<Element(Element, const Params&)>;

class Circuit {
public:
  static Circuit from_file(const std::string& path);
  static Circuit from_string(std::string_view text, std::string label = "Netlist");

  const std::string& filename() const { return filename_; }
  const Elements& parsed_circuit() const { return parsed_; }
  const Elements& circuit() const { return circuit_; }
  const std::vector<Uid>& uids() const { return circuit_.order; }
  std::size_t size() const { return circuit_.size(); }

  const Element& get(const Uid& uid) const;
  Element& get(const Uid& uid);
  void set(const Uid& uid, Element element);
  Element& operator[](const Uid& uid) { return get(uid); }
  const Element& operator[](const Uid& uid) const { return get(uid); }

  void reset();
  Uid append(std::string_view line);

  std::string netlist() const;
  void write(const std::string& path) const;

  std::vector<Uid> match(const std::string& field, const std::string& pattern) const;
  std::vector<Uid> filter(const std::string& field, const std::string& pattern) const;
  std::vector<Uid> filter(const Criteria& criteria) const;

  std::size_t apply(const Transform& fn, const Criteria& criteria);
  std::size_t apply(const ParamTransform& fn, const Criteria& criteria, const Params& params);

private:
  Circuit(std::string filename, Elements parsed);

  std::string filename_;
  Elements parsed_;
  Elements circuit_;
};

// ---------- argument codec ----------

using ArgMap = std::vector<std::pair<std::string, std::optional<std::string>>>;

ArgMap unpack_args(const std::vector<std::string>& args);
std::vector<std::string> repack_args(const ArgMap& args);

// Sets `key` to `value` in the element's args. An absent key is appended as
// key=value. A key present as a bare token throws malformed_argument.
void replace_argument(Circuit& cir, const Uid& uid, const std::string& key, const std::string& value);

} // namespace spice
