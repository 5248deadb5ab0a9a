#pragma once
#include "spicelib.hpp"
#include <string>
#include <vector>
#include <utility>

namespace spice {

// One analysis and what to report from it.
struct Simulation {
  std::string cmd;                   // e.g. "tran 1n 10u"
  std::vector<std::string> prints;
  std::vector<std::string> outputs;  // vectors written with wrdata
  std::vector<std::string> measure;  // meas lines, emitted verbatim
  std::vector<std::string> plots;
  std::string location;              // output directory, empty = ControlOptions::outputdir
  std::string name;                  // output file, empty = ControlOptions::outputfile

  std::string identifier() const;    // "TRAN", "AC", ...
};

// Analysis command builders.
std::string tran(const std::string& tstop, const std::string& tstep = "1n",
                 const std::string& tstart = "", const std::string& tmax = "",
                 const std::string& uic = "");
std::string dc(const std::string& srcname, const std::string& vstart,
               const std::string& vstop, const std::string& vincrement);
std::string ac(const std::string& fmin, const std::string& fmax, const std::string& pts,
               const std::string& method = "dec");
std::string tf(const std::string& outvar, const std::string& insrc);
std::string pz(const std::string& vinp, const std::string& vinn,
               const std::string& voutp, const std::string& voutn,
               const std::string& stype = "vol", const std::string& otype = "pz");
std::string noise(const std::string& vout, const std::string& src, int pts,
                  const std::string& fstart, const std::string& fstop,
                  const std::string& method = "dec", int pts_sum = 1);
std::string noise(const std::pair<std::string, std::string>& vout, const std::string& src, int pts,
                  const std::string& fstart, const std::string& fstop,
                  const std::string& method = "dec", int pts_sum = 1);

// A simulator option: bare flag or key=value.
struct Option {
  std::string key;
  std::string value;

  Option(const char* k) : key(k) {}
  Option(std::string k) : key(std::move(k)) {}
  Option(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}
};

struct ControlOptions {
  std::vector<std::string> includes;
  std::string sweep_num;
  std::vector<Option> sim_options;   // .option lines
  std::vector<Option> ng_options;    // set lines inside .control
  std::vector<std::string> save = {"all"};
  std::string outputfile = "output.csv";
  std::string outputdir = ".";
  std::string filetype = "ascii";
  bool wr_singlescale = true;
  bool wr_vecnames = true;
  bool exit_post_run = true;
};

class ControlSection {
public:
  virtual ~ControlSection() = default;
  virtual std::string netlist() const = 0;
};

// Control text taken as is from a file or a string.
class ExternalControlSection : public ControlSection {
public:
  static ExternalControlSection from_file(const std::string& path);
  static ExternalControlSection from_string(std::string_view text);

  std::string netlist() const override { return netlist_; }

private:
  explicit ExternalControlSection(std::string text) : netlist_(std::move(text)) {}
  std::string netlist_;
};

// Control text assembled from simulations and options.
class LogicalControlSection : public ControlSection {
public:
  explicit LogicalControlSection(std::vector<Simulation> simulations, ControlOptions options = {});

  std::vector<Simulation>& simulations() { return simulations_; }
  ControlOptions& options() { return options_; }

  std::string netlist() const override;

private:
  std::vector<Simulation> simulations_;
  ControlOptions options_;
};

std::string sim_netlist(const Circuit& cir, const ControlSection& ctl);
void write_sim_netlist(const Circuit& cir, const ControlSection& ctl,
                       const std::string& directory = ".",
                       const std::string& filename = "netlist.cir");

} // namespace spice
