#pragma once
#include "spicelib.hpp"
#include "spice_grammar.hpp"
#include <tao/pegtl.hpp>
#include <optional>
#include <string>
#include <vector>

namespace spice { namespace actions {

using namespace tao::pegtl;

// Tokens of one statement line.
struct LineState {
  std::string instance;
  std::vector<std::string> fields;   // everything after the instance
  std::optional<std::string> subckt_name;
};

// One argument token.
struct ArgState {
  std::string key;
  std::optional<std::string> value;
};

template<typename Rule>
struct action : tao::pegtl::nothing<Rule> {};

template<> struct action<spice::grammar::kw_subckt> {
  template<typename Input>
  static void apply(const Input& in, LineState& st) { st.instance = in.string(); }
};

template<> struct action<spice::grammar::subckt_name> {
  template<typename Input>
  static void apply(const Input& in, LineState& st) {
    st.subckt_name = in.string();
    st.fields.push_back(in.string());
  }
};

template<> struct action<spice::grammar::instance_tok> {
  template<typename Input>
  static void apply(const Input& in, LineState& st) { st.instance = in.string(); }
};

template<> struct action<spice::grammar::field_tok> {
  template<typename Input>
  static void apply(const Input& in, LineState& st) { st.fields.push_back(in.string()); }
};

template<> struct action<spice::grammar::arg_key> {
  template<typename Input>
  static void apply(const Input& in, ArgState& st) { st.key = in.string(); }
};

template<> struct action<spice::grammar::arg_value> {
  template<typename Input>
  static void apply(const Input& in, ArgState& st) { st.value = in.string(); }
};

}} // namespace spice::actions
