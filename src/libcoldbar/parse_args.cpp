#include <string>
#include <vector>
#include <coldbar.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::string;
using std::vector;

namespace coldbar {

bool parse_args(char arg_delimiter, Error& error) {
  static const string F = this_function_label(__func__);
  verbose_operation = false;
  args.temp_loc = directives.temp_path;
  auto sp = strutils::split(args.args_string, string(1, arg_delimiter));
  if (sp.empty() || sp[0].empty()) {
    error.set(ErrorKind::malformed_config, F, "no command specified");
    return false;
  }
  args.command = sp[0];
  if (args.command != "explain" && args.command != "build") {
    error.set(ErrorKind::malformed_config, F, "unknown command '" + args.
        command + "'");
    return false;
  }
  vector<string> positional;
  for (size_t n = 1; n < sp.size(); ++n) {
    if (sp[n] == "-t" || sp[n] == "--tar") {
      args.is_archive = true;
    } else if (sp[n] == "-r" || sp[n] == "--rotated") {
      args.rotated = true;
    } else if (sp[n] == "-c" || sp[n] == "--cfg" || sp[n] == "-v" || sp[n] ==
        "--varname" || sp[n] == "-T") {
      if (n + 1 == sp.size()) {
        error.set(ErrorKind::malformed_config, F, "flag '" + sp[n] + "' "
            "requires a value");
        return false;
      }
      if (sp[n] == "-T") {
        args.temp_loc = sp[++n];
      } else if (sp[n] == "-c" || sp[n] == "--cfg") {
        args.cfg_path = sp[++n];
      } else {
        args.varname = sp[++n];
      }
    } else if (sp[n] == "-p" || sp[n] == "--print-config") {
      args.print_config = true;
    } else if (sp[n] == "-V") {
      verbose_operation = true;
    } else if (!sp[n].empty() && sp[n][0] == '-') {
      error.set(ErrorKind::malformed_config, F, "invalid flag '" + sp[n] + "'");
      return false;
    } else if (!sp[n].empty()) {
      positional.emplace_back(sp[n]);
    }
  }
  size_t expected = args.command == "build" ? 2 : 1;
  if (positional.size() != expected) {
    error.set(ErrorKind::malformed_config, F, "'" + args.command + "' expects "
        + strutils::itos(expected) + " file argument(s), found " + strutils::
        itos(positional.size()));
    return false;
  }
  args.source = positional[0];
  if (args.command == "build") {
    args.destination = positional[1];
    if (args.cfg_path.empty() && args.varname.empty()) {
      error.set(ErrorKind::malformed_config, F, "provide one of '--cfg <path>' "
          "or '--varname <name>'");
      return false;
    }
  } else if (args.rotated || !args.cfg_path.empty() || !args.varname.empty()) {
    log_warning("'explain' ignores '--rotated', '--cfg' and '--varname'", F);
  }
  return true;
}

} // end namespace coldbar
