#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <coldbar.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::cout;
using std::endl;
using std::string;
using std::stringstream;

namespace coldbar {

namespace pipeline {

static bool checkpoint(string stage, Error& error) {
  if (interrupted()) {
    error.set(ErrorKind::interrupted, stage, "run was interrupted");
    return false;
  }
  return true;
}

static bool create_workspace(TempDir& workspace, string where, Error& error) {
  if (!workspace.create(directives.temp_path)) {
    error.set(ErrorKind::io, where, "unable to create a temporary directory in "
        "'" + directives.temp_path + "'");
    return false;
  }
  if (verbose_operation) {
    cout << "  Workspace: '" << workspace.name() << "'" << endl;
  }
  return true;
}

bool explain(probe::Probe& probe, string source, bool is_archive, string& text,
    Error& error) {
  static const string F = this_function_label(__func__);
  TempDir workspace;
  if (!create_workspace(workspace, F, error)) {
    return false;
  }
  string dataset_file;
  if (!archive::resolve(source, is_archive, workspace, dataset_file, error)) {
    return false;
  }
  stringstream oss;
  if (!probe.dump(dataset_file, "", oss, error)) {
    return false;
  }
  text = oss.str();
  return true;
}

bool run(probe::Probe& probe, const Options& options, RunResult& result,
    Error& error) {
  static const string F = this_function_label(__func__);
  if (options.cfg_path.empty() && options.varname.empty()) {
    error.set(ErrorKind::malformed_config, F, "provide a configuration file "
        "or the name of the minimum temperature variable");
    return false;
  }
  if (!options.cfg_path.empty() && !options.varname.empty()) {
    log_warning("both a configuration file and a variable name were given; "
        "ignoring the variable name '" + options.varname + "'", F);
  }
  result = RunResult();

  // the workspace and anything extracted into it are removed on every return
  TempDir workspace;
  if (!create_workspace(workspace, F, error)) {
    return false;
  }
  if (!archive::resolve(options.source, options.is_archive, workspace, result.
      dataset_file, error)) {
    return false;
  }
  if (verbose_operation) {
    cout << "  Dataset: '" << result.dataset_file << "'" << endl;
  }
  if (!checkpoint(F, error)) {
    return false;
  }
  if (!options.cfg_path.empty()) {
    if (!config::from_file(options.cfg_path, result.config, error)) {
      return false;
    }
  } else {
    if (!config::infer(probe, result.dataset_file, options.varname, result.
        config, error)) {
      return false;
    }
    if (options.rotated && !config::infer_rotated_names(probe, result.
        dataset_file, result.config, error)) {
      return false;
    }
  }
  if (!checkpoint(F, error)) {
    return false;
  }
  coords::CoordinateStream stream;
  auto use_stream = options.rotated || result.config.is_rotated();
  if (use_stream) {
    if (!coords::expand(probe, result.dataset_file, result.config, workspace.
        name(), stream, error)) {
      return false;
    }
    if (!checkpoint(F, error)) {
      return false;
    }
  }
  std::ofstream ofs(options.destination.c_str());
  if (!ofs.is_open()) {
    error.set(ErrorKind::io, F, "unable to open '" + options.destination + "' "
        "for writing");
    return false;
  }
  if (!extract::extract(probe, result.dataset_file, result.config, use_stream ?
      &stream : nullptr, workspace.name(), ofs, result.summary, error)) {
    ofs.close();
    std::remove(options.destination.c_str());
    return false;
  }
  ofs.close();
  if (ofs.fail()) {
    error.set(ErrorKind::io, F, "error while closing '" + options.destination +
        "'");
    return false;
  }
  return true;
}

} // end namespace coldbar::pipeline

} // end namespace coldbar
