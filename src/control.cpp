#include "spice_control.hpp"
#include "spice_text.hpp"
#include <sstream>

namespace spice {

namespace {

std::string collapse_spaces(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == ' ' && (out.empty() || out.back() == ' ')) continue;
    out.push_back(c);
  }
  while (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::string option_text(const Option& o) {
  return o.value.empty() ? o.key : o.key + "=" + o.value;
}

} // namespace

std::string Simulation::identifier() const {
  return detail::to_upper(cmd.substr(0, cmd.find(' ')));
}

std::string tran(const std::string& tstop, const std::string& tstep,
                 const std::string& tstart, const std::string& tmax, const std::string& uic) {
  std::string s = "tran " + tstep + " " + tstop;
  if (!tstart.empty()) s += " tstart=" + tstart;
  if (!tmax.empty())   s += " tmax=" + tmax;
  if (!uic.empty())    s += " uic=" + uic;
  return collapse_spaces(s);
}

std::string dc(const std::string& srcname, const std::string& vstart,
               const std::string& vstop, const std::string& vincrement) {
  return "dc " + srcname + " " + vstart + " " + vstop + " " + vincrement;
}

std::string ac(const std::string& fmin, const std::string& fmax, const std::string& pts,
               const std::string& method) {
  return "ac " + method + " " + pts + " " + fmin + " " + fmax;
}

std::string tf(const std::string& outvar, const std::string& insrc) {
  return "tf " + outvar + " " + detail::to_lower(insrc);
}

std::string pz(const std::string& vinp, const std::string& vinn,
               const std::string& voutp, const std::string& voutn,
               const std::string& stype, const std::string& otype) {
  return "pz " + vinp + " " + vinn + " " + voutp + " " + voutn + " " + stype + " " + otype;
}

std::string noise(const std::string& vout, const std::string& src, int pts,
                  const std::string& fstart, const std::string& fstop,
                  const std::string& method, int pts_sum) {
  std::ostringstream oss;
  oss << "noise v(" << vout << ") " << src << " " << method << " " << pts << " "
      << fstart << " " << fstop << " " << pts_sum;
  return oss.str();
}

std::string noise(const std::pair<std::string, std::string>& vout, const std::string& src, int pts,
                  const std::string& fstart, const std::string& fstop,
                  const std::string& method, int pts_sum) {
  return noise(vout.first + "," + vout.second, src, pts, fstart, fstop, method, pts_sum);
}

ExternalControlSection ExternalControlSection::from_file(const std::string& path) {
  return ExternalControlSection(read_netlist(path));
}

ExternalControlSection ExternalControlSection::from_string(std::string_view text) {
  return ExternalControlSection(clean_netlist(text));
}

LogicalControlSection::LogicalControlSection(std::vector<Simulation> simulations, ControlOptions options)
  : simulations_(std::move(simulations)), options_(std::move(options)) {}

std::string LogicalControlSection::netlist() const {
  const ControlOptions& o = options_;
  std::ostringstream oss;
  auto app = [&](const std::string& line) { oss << line << "\n"; };

  app(""); app("* Control section"); app(""); app(".control");
  app("set filetype=" + o.filetype);
  if (o.wr_singlescale) app("set wr_singlescale");
  if (o.wr_vecnames) app("set wr_vecnames");
  for (const auto& opt : o.ng_options) app("set " + option_text(opt));
  app("set ngbehavior=hsa");
  for (const auto& sig : o.save) app("save " + sig);

  for (const auto& sim : simulations_) {
    const std::string id = sim.identifier();
    app(sim.cmd);
    app("echo --- start " + id + " ---");
    for (const auto& p : sim.prints) app("print " + p);
    for (const auto& p : sim.plots) app("plot " + p);
    if (!sim.outputs.empty()) {
      const std::string& dir  = sim.location.empty() ? o.outputdir : sim.location;
      const std::string& file = sim.name.empty() ? o.outputfile : sim.name;
      std::string target = dir + "/" + detail::to_lower(id) + "_";
      if (!o.sweep_num.empty()) target += o.sweep_num + "_";
      target += file;
      std::string vectors;
      for (const auto& v : sim.outputs) vectors += (vectors.empty() ? "" : " ") + v;
      app("wrdata " + target + " " + vectors);
    }
    for (const auto& m : sim.measure) app(m);
    app("echo --- end " + id + " ---");
  }

  if (o.exit_post_run) app("exit");
  app(".endc");
  for (const auto& opt : o.sim_options) app(".option " + option_text(opt));
  for (const auto& inc : o.includes) app(".include \"" + inc + "\"");
  app(".end");
  return oss.str();
}

std::string sim_netlist(const Circuit& cir, const ControlSection& ctl) {
  return cir.netlist() + ctl.netlist();
}

void write_sim_netlist(const Circuit& cir, const ControlSection& ctl,
                       const std::string& directory, const std::string& filename) {
  write_netlist(sim_netlist(cir, ctl), directory + "/" + filename);
}

} // namespace spice
