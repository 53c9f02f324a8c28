#include <fstream>
#include <string>
#include <coldbar.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::string;
using strutils::split;
using strutils::trim;

namespace coldbar {

bool read_directives(std::istream& ifs, Directives& d, Error& error) {
  static const string F = this_function_label(__func__);
  string line;
  size_t num_lines = 0;
  while (std::getline(ifs, line)) {
    ++num_lines;
    trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    auto sp = split(line);
    if (sp.size() != 2) {
      error.set(ErrorKind::malformed_config, F, "line " + strutils::itos(
          num_lines) + " is not a 'key value' pair: '" + line + "'");
      return false;
    }
    if (sp[0] == "ncks") {
      d.ncks_path = sp[1];
    } else if (sp[0] == "tar") {
      d.tar_path = sp[1];
    } else if (sp[0] == "temp_path") {
      d.temp_path = sp[1];
    } else if (sp[0] == "dataset_pattern") {
      d.dataset_pattern = sp[1];
    } else {
      log_warning("ignoring unknown setting '" + sp[0] + "'", F);
    }
  }
  return true;
}

bool read_directives(string filename, Directives& d, Error& error) {
  static const string F = this_function_label(__func__);
  std::ifstream ifs(filename.c_str());
  if (!ifs.is_open()) {
    error.set(ErrorKind::not_found, F, "unable to open settings file '" +
        filename + "'");
    return false;
  }
  return read_directives(ifs, d, error);
}

} // end namespace coldbar
