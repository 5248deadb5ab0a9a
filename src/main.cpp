#include "spicelib.hpp"
#include <iostream>

int main(int argc, char** argv) {
  if (argc < 2) { std::cerr << "Usage: spparse <netlist> [-f field=regex]... [-o out]\n"; return 1; }

  std::string input, output;
  spice::Criteria criteria;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if ((a == "-f" || a == "-o") && i + 1 >= argc) { std::cerr << "missing value for " << a << "\n"; return 1; }
    if (a == "-f") {
      std::string f = argv[++i];
      auto eq = f.find('=');
      if (eq == std::string::npos) { std::cerr << "filter must be field=regex: " << f << "\n"; return 1; }
      criteria.emplace_back(f.substr(0, eq), f.substr(eq + 1));
    } else if (a == "-o") {
      output = argv[++i];
    } else {
      input = a;
    }
  }
  if (input.empty()) { std::cerr << "no netlist given\n"; return 1; }

  try {
    spice::Circuit cir = spice::Circuit::from_file(input);
    if (criteria.empty()) {
      if (output.empty()) std::cout << cir.netlist();
      else cir.write(output);
      return 0;
    }
    auto uids = cir.filter(criteria);
    for (const auto& uid : uids) {
      const auto& e = cir[uid];
      std::cout << uid << "  " << e.location << "  " << e.category << "  " << e.to_line() << "\n";
    }
    std::cout << "Matched elements: " << uids.size() << "\n";
  } catch (const spice::parse_error& e) {
    std::cerr << "Parse error: " << e.what() << "\n"; return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n"; return 3;
  }
  return 0;
}
