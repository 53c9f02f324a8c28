#include <sstream>
#include <string>
#include <coldbar.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::string;
using std::stringstream;
using unixutils::mysystem2;

namespace coldbar {

namespace probe {

bool NcksProbe::run(string command, stringstream& output, string where, Error&
    error) {
  if (verbose_operation) {
    std::cout << "  Running '" << command << "'" << std::endl;
  }
  stringstream ess;
  if (mysystem2(command, output, ess) != 0) {
    auto e = ess.str();
    strutils::trim(e);
    error.set(ErrorKind::external_tool, where, "'" + command + "' failed: " +
        (e.empty() ? "no diagnostic from " + ncks_path : e));
    return false;
  }
  return true;
}

bool NcksProbe::dump(string filename, string variable, stringstream& output,
    Error& error) {
  static const string F = this_function_label(__func__);
  string command = ncks_path + " --trd -m";
  if (!variable.empty()) {
    command += " -v " + variable;
  }
  return run(command + " " + filename, output, F, error);
}

bool NcksProbe::dump_records(string filename, string variable, string
    dump_file, Error& error) {
  static const string F = this_function_label(__func__);
  stringstream oss;
  return run("/bin/sh -c \"" + ncks_path + " --trd -H -C -v " + variable + " "
      + filename + " > " + dump_file + "\"", oss, F, error);
}

} // end namespace coldbar::probe

} // end namespace coldbar
