#include "spicelib.hpp"
#include "spice_grammar.hpp"
#include "spice_actions.hpp"
#include <tao/pegtl.hpp>
#include <algorithm>

using namespace tao::pegtl;

namespace spice {

namespace {

actions::ArgState split_argument(const std::string& token) {
  actions::ArgState st;
  memory_input in(token.data(), token.size(), "argument");
  try {
    if (!tao::pegtl::parse< grammar::argument, actions::action >(in, st)) {
      throw malformed_argument("could not split argument: " + token);
    }
  } catch (const tao::pegtl::parse_error& e) {
    throw malformed_argument(e.what());
  }
  return st;
}

ArgMap::iterator find_key(ArgMap& args, const std::string& key) {
  return std::find_if(args.begin(), args.end(), [&](const auto& kv) { return kv.first == key; });
}

} // namespace

ArgMap unpack_args(const std::vector<std::string>& args) {
  ArgMap out;
  for (const auto& token : args) {
    auto st = split_argument(token);
    auto it = find_key(out, st.key);
    if (it != out.end()) it->second = std::move(st.value);
    else out.emplace_back(std::move(st.key), std::move(st.value));
  }
  return out;
}

std::vector<std::string> repack_args(const ArgMap& args) {
  std::vector<std::string> out;
  out.reserve(args.size());
  for (const auto& kv : args) {
    out.push_back(kv.second ? kv.first + "=" + *kv.second : kv.first);
  }
  return out;
}

void replace_argument(Circuit& cir, const Uid& uid, const std::string& key, const std::string& value) {
  if (key.empty() || key.find('=') != std::string::npos)
    throw malformed_argument("invalid argument key '" + key + "'");

  Element& e = cir.get(uid);
  ArgMap args = unpack_args(e.args);
  auto it = find_key(args, key);
  if (it == args.end()) {
    args.emplace_back(key, value);
  } else if (!it->second) {
    throw malformed_argument("argument '" + key + "' of " + e.instance + " has no assignment");
  } else {
    it->second = value;
  }
  e.args = repack_args(args);
}

} // namespace spice
