#include "spicelib.hpp"
#include <cctype>

namespace spice {

const std::vector<ElementType>& element_types() {
  static const std::vector<ElementType> table = {
    {"*",  "comment",                        {}},
    {".",  "statement",                      {}},
    {"a",  "xspice",                         {}},
    {"b",  "behavioral source",              {"n+", "n-"}},
    {"c",  "capacitor",                      {"n+", "n-"}},
    {"d",  "diode",                          {"n+", "n-"}},
    {"e",  "vcvs",                           {"n+", "n-", "nc+", "nc-"}},
    {"f",  "cccs",                           {"n+", "n-"}},
    {"g",  "vccs",                           {"n+", "n-", "nc+", "nc-"}},
    {"h",  "ccvs",                           {"n+", "n-"}},
    {"i",  "isource",                        {"n+", "n-"}},
    {"j",  "jfet",                           {"n1", "n2", "n3"}},
    {"k",  "coupled inductor",               {}},
    {"l",  "inductor",                       {"n+", "n-"}},
    {"m",  "mosfet",                         {"n1", "n2", "n3", "n4"}},
    {"n",  "numerical device gss",           {}},
    {"o",  "lossy transmission line",        {"n1", "n2", "n3", "n4"}},
    {"p",  "coupled multiconductor line",    {}},
    {"q",  "bjt",                            {"n1", "n2", "n3", "n4"}},
    {"r",  "resistor",                       {"n+", "n-"}},
    {"s",  "vcsw",                           {"n+", "n-", "nc+", "nc-"}},
    {"t",  "lossless transmission line",     {"n1", "n2", "n3", "n4"}},
    {"u",  "uniformly distributed rc line",  {"n1", "n2", "n3"}},
    {"v",  "vsource",                        {"n+", "n-"}},
    {"w",  "icsw",                           {"n+", "n-"}},
    {"x",  "subcircuit",                     {}},
    {"xc", "capacitor",                      {"n1", "n2"}},
    {"xm", "mosfet",                         {"n1", "n2", "n3", "n4"}},
    {"y",  "single lossy transmission line", {"n1", "n2", "n3", "n4"}},
    {"z",  "mesfet",                         {"n1", "n2", "n3"}},
  };
  return table;
}

const ElementType* find_element_type(std::string_view instance) {
  if (instance.empty()) return nullptr;
  std::string key(1, (char)std::tolower((unsigned char)instance[0]));
  // Only subcircuit instances have two letter subtypes.
  if (key == "x" && instance.size() > 1) {
    char second = (char)std::tolower((unsigned char)instance[1]);
    if (second == 'm' || second == 'c') key.push_back(second);
  }
  for (const auto& t : element_types())
    if (t.prefix == key) return &t;
  return nullptr;
}

} // namespace spice
