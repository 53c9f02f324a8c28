#include <sys/stat.h>
#include <regex>
#include <sstream>
#include <string>
#include <coldbar.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::regex;
using std::regex_search;
using std::string;
using std::stringstream;
using std::vector;
using strutils::split;
using strutils::trim;
using unixutils::mysystem2;

namespace coldbar {

namespace archive {

vector<string> list_dataset_entries(string listing, string pattern) {
  static const string F = this_function_label(__func__);
  vector<string> v; // return value
  regex re(pattern);
  auto sp = split(listing, "\n");
  for (auto& e : sp) {
    trim(e);

    // directory entries end with a slash and never hold a dataset
    if (e.empty() || e.back() == '/') {
      continue;
    }
    if (regex_search(e, re)) {
      if (e.find_first_of(" \t'\"") != string::npos) {
        log_warning("skipping archive entry '" + e + "': whitespace or quotes "
            "in the name", F);
        continue;
      }
      v.emplace_back(e);
    }
  }
  return v;
}

static bool is_regular_file(string path) {
  struct stat buf;
  return stat(path.c_str(), &buf) == 0 && S_ISREG(buf.st_mode);
}

bool resolve(string path, bool is_archive, TempDir& workspace, string&
    dataset_file, Error& error) {
  static const string F = this_function_label(__func__);
  if (!is_regular_file(path)) {
    error.set(ErrorKind::not_found, F, "'" + path + "' does not exist or is not "
        "a regular file");
    return false;
  }
  if (!is_archive) {
    dataset_file = path;
    return true;
  }
  stringstream oss, ess;
  if (mysystem2(directives.tar_path + " -tf " + path, oss, ess) != 0) {
    error.set(ErrorKind::external_tool, F, "unable to list archive '" + path +
        "': " + ess.str());
    return false;
  }
  auto entries = list_dataset_entries(oss.str(), directives.dataset_pattern);
  if (entries.empty()) {
    error.set(ErrorKind::no_dataset_in_archive, F, "no entry in '" + path +
        "' matches '" + directives.dataset_pattern + "'");
    return false;
  }
  if (entries.size() > 1) {
    log_warning("archive '" + path + "' holds " + strutils::itos(entries.size())
        + " datasets; only '" + entries.front() + "' will be processed", F);
  }
  oss.str("");
  ess.str("");
  if (mysystem2(directives.tar_path + " -xf " + path + " -C " + workspace.name()
      + " " + entries.front(), oss, ess) != 0) {
    error.set(ErrorKind::external_tool, F, "unable to extract '" + entries.
        front() + "' from '" + path + "': " + ess.str());
    return false;
  }
  dataset_file = workspace.name() + "/" + entries.front();
  if (!is_regular_file(dataset_file)) {
    error.set(ErrorKind::not_found, F, "'" + entries.front() + "' was not "
        "extracted from '" + path + "'");
    return false;
  }
  if (verbose_operation) {
    std::cout << "  Extracted '" << entries.front() << "' to '" << workspace.
        name() << "'" << std::endl;
  }
  return true;
}

} // end namespace coldbar::archive

} // end namespace coldbar
