#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <coldbar.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::regex;
using std::regex_search;
using std::string;
using std::stringstream;
using std::unordered_set;
using strutils::chop;
using strutils::has_beginning;
using strutils::has_ending;
using strutils::itos;
using strutils::split;
using strutils::to_lower;
using strutils::trim;

namespace coldbar {

namespace config {

bool operator==(const Config& left, const Config& right) {
  return left.varname == right.varname && left.var_display_name == right.
      var_display_name && left.var_position == right.var_position && left.
      time_position == right.time_position && left.x_position == right.
      x_position && left.y_position == right.y_position && left.time_origin ==
      right.time_origin && left.time_size == right.time_size && left.
      missing_value == right.missing_value && left.longitude_name == right.
      longitude_name && left.latitude_name == right.latitude_name;
}

bool operator!=(const Config& left, const Config& right) {
  return !(left == right);
}

// a variable declaration reads "<name>: type <T>, <n> dimensions, ..."
template <class Parts> static bool is_declaration(const Parts& sp) {
  return sp.size() > 1 && sp[1] == "type" && sp[0].length() > 1 && sp[0].back()
      == ':';
}

static bool is_numeric(string s) {
  if (s.empty()) {
    return false;
  }
  for (const auto& c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

// accepts digit strings whose value is below UNSET
static bool to_size(string s, size_t& value) {
  if (!is_numeric(s) || s.length() > 10) {
    return false;
  }
  auto n = std::stoull(s);
  if (n >= UNSET) {
    return false;
  }
  value = n;
  return true;
}

VariableNames parse_variable_names(const string& dump) {
  VariableNames names; // return value
  auto lines = split(dump, "\n");
  for (const auto& line : lines) {
    auto sp = split(line);
    if (is_declaration(sp)) {
      auto name = sp[0];
      chop(name);
      auto key = to_lower(name);
      if (names.table.find(key) == names.table.end()) {
        names.table.emplace(key, name);
        names.order.emplace_back(key);
      }
    }
  }
  return names;
}

bool resolve_variable(const VariableNames& names, string hint, string& key,
    string& display_name) {
  hint = to_lower(hint);
  trim(hint);
  if (hint.empty()) {
    return false;
  }
  auto it = names.table.find(hint);
  if (it == names.table.end()) {
    for (const auto& k : names.order) {
      if (has_beginning(k, hint)) {
        it = names.table.find(k);
        break;
      }
    }
  }
  if (it == names.table.end()) {
    return false;
  }
  key = it->first;
  display_name = it->second;
  return true;
}

DimensionList parse_dimensions(const string& var_dump, string var_name) {
  DimensionList dims; // return value
  auto lines = split(var_dump, "\n");
  for (const auto& line : lines) {

    // "<var> dimension <n>: <dim>, size = <s> ..."
    auto sp = split(line);
    if (sp.size() > 3 && sp[0] == var_name && sp[1] == "dimension" &&
        has_ending(sp[2], ":")) {
      auto ordinal = sp[2];
      chop(ordinal);
      auto name = sp[3];
      if (has_ending(name, ",")) {
        chop(name);
      }
      size_t n;
      if (to_size(ordinal, n)) {
        dims.emplace_back(n, name);
      }
    }
  }
  return dims;
}

size_t parse_dimension_count(const string& var_dump, string var_name) {
  auto lines = split(var_dump, "\n");
  for (const auto& line : lines) {
    auto sp = split(line);
    size_t n;
    if (is_declaration(sp) && sp[0] == var_name + ":" && sp.size() > 4 &&
        has_beginning(sp[4], "dimension") && to_size(sp[3], n)) {
      return n;
    }
  }
  return UNSET;
}

size_t find_dimension(const DimensionList& dims, string fragment) {
  for (const auto& d : dims) {
    if (to_lower(d.second).find(fragment) != string::npos) {
      return d.first;
    }
  }
  return UNSET;
}

string parse_missing_value(const string& var_dump, string var_name) {
  auto lines = split(var_dump, "\n");
  for (const auto& line : lines) {
    auto sp = split(line);
    if (sp.size() > 2 && sp[0] == var_name && sp[1] == "attribute" && line.
        find("missing_value") != string::npos) {
      return sp.back();
    }
  }
  return "";
}

string parse_time_origin(const string& dump) {
  static const string DAYS_SINCE = " days since ";
  auto lines = split(dump, "\n");
  for (const auto& line : lines) {
    auto idx = line.find(DAYS_SINCE);
    if (idx != string::npos) {
      auto origin = line.substr(idx + DAYS_SINCE.length());
      trim(origin);
      return origin;
    }
  }
  return "";
}

size_t parse_time_size(const string& dump) {
  static const regex SIZE_RE("size = ([0-9]+)");
  auto lines = split(dump, "\n");
  for (const auto& line : lines) {
    if (has_beginning(to_lower(line), "time dimension")) {
      std::smatch m;
      size_t n;
      if (regex_search(line, m, SIZE_RE) && to_size(m[1].str(), n)) {
        return n;
      }
    }
  }
  return 0;
}

bool parse_rotated_names(const string& dump, string& longitude_name, string&
    latitude_name) {
  longitude_name.clear();
  latitude_name.clear();
  auto lines = split(dump, "\n");
  for (const auto& line : lines) {

    // only "<name>: type <T>, 2 dimensions, ..." declares a 2-D coordinate
    auto sp = split(line);
    if (!is_declaration(sp) || sp.size() < 5 || sp[3] != "2" ||
        !has_beginning(sp[4], "dimension")) {
      continue;
    }
    auto name = sp[0];
    chop(name);
    auto l = to_lower(name);
    if (longitude_name.empty() && l.find("lon") != string::npos) {
      longitude_name = name;
    } else if (latitude_name.empty() && l.find("lat") != string::npos) {
      latitude_name = name;
    }
  }
  return !longitude_name.empty() && !latitude_name.empty();
}

static bool set_position(string key, string value, size_t& position, string
    where, Error& error) {
  if (!to_size(value, position)) {
    error.set(ErrorKind::malformed_config, where, "'" + key + "' must be a "
        "non-negative integer below 4294967295, found '" + value + "'");
    return false;
  }
  return true;
}

bool parse_config(std::istream& ifs, Config& config, Error& error) {
  static const string F = this_function_label(__func__);
  config = Config();
  string line;
  while (std::getline(ifs, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    auto idx = line.find_first_of(" \t");
    auto key = line.substr(0, idx);
    string value;
    if (idx != string::npos) {
      value = line.substr(idx);
      trim(value);
    }
    if (key == "varname" || key == "var_display_name") {
      config.var_display_name = value;
      config.varname = to_lower(value);
    } else if (key == "varpos" || key == "var_position") {
      if (!set_position(key, value, config.var_position, F, error)) {
        return false;
      }
    } else if (key == "tpos" || key == "time_position") {
      if (!set_position(key, value, config.time_position, F, error)) {
        return false;
      }
    } else if (key == "xpos" || key == "x_position") {
      if (!set_position(key, value, config.x_position, F, error)) {
        return false;
      }
    } else if (key == "ypos" || key == "y_position") {
      if (!set_position(key, value, config.y_position, F, error)) {
        return false;
      }
    } else if (key == "tsize" || key == "time_size") {
      if (!set_position(key, value, config.time_size, F, error)) {
        return false;
      }
    } else if (key == "t1" || key == "time_origin") {
      config.time_origin = value;
    } else if (key == "missing" || key == "missing_value") {
      config.missing_value = value;
    } else if (key == "longitude" || key == "longitude_name") {
      config.longitude_name = value;
    } else if (key == "latitude" || key == "latitude_name") {
      config.latitude_name = value;
    } else {
      log_warning("ignoring unknown key '" + key + "'", F);
    }
  }
  if (config.var_display_name.empty()) {
    error.set(ErrorKind::malformed_config, F, "missing required key "
        "'varname'");
    return false;
  }
  if (config.var_position == UNSET || config.x_position == UNSET || config.
      y_position == UNSET) {
    error.set(ErrorKind::malformed_config, F, "missing one or more of the "
        "required keys 'varpos', 'xpos', 'ypos'");
    return false;
  }
  unordered_set<size_t> positions{ config.var_position, config.x_position,
      config.y_position };
  size_t expected = 3;
  if (config.time_position != UNSET) {
    positions.emplace(config.time_position);
    ++expected;
  }
  if (positions.size() != expected) {
    error.set(ErrorKind::malformed_config, F, "positions 'varpos', 'tpos', "
        "'xpos' and 'ypos' must be distinct");
    return false;
  }
  if (config.longitude_name.empty() != config.latitude_name.empty()) {
    error.set(ErrorKind::malformed_config, F, "'longitude' and 'latitude' must "
        "be given together");
    return false;
  }
  return true;
}

bool from_file(string filename, Config& config, Error& error) {
  static const string F = this_function_label(__func__);
  std::ifstream ifs(filename.c_str());
  if (!ifs.is_open()) {
    error.set(ErrorKind::not_found, F, "unable to open configuration file '" +
        filename + "'");
    return false;
  }
  return parse_config(ifs, config, error);
}

bool infer(probe::Probe& probe, string filename, string hint, Config& config,
    Error& error) {
  static const string F = this_function_label(__func__);
  config = Config();
  stringstream file_dump;
  if (!probe.dump(filename, "", file_dump, error)) {
    return false;
  }
  auto dump = file_dump.str();
  auto names = parse_variable_names(dump);
  if (!resolve_variable(names, hint, config.varname, config.var_display_name)) {
    error.set(ErrorKind::variable_not_found, F, "no variable in '" + filename +
        "' matches '" + hint + "'");
    return false;
  }
  stringstream var_dump_s;
  if (!probe.dump(filename, config.var_display_name, var_dump_s, error)) {
    return false;
  }
  auto var_dump = var_dump_s.str();
  auto dims = parse_dimensions(var_dump, config.var_display_name);
  config.var_position = parse_dimension_count(var_dump, config.
      var_display_name);
  if (config.var_position == UNSET) {
    config.var_position = dims.size();
  }
  config.time_position = find_dimension(dims, "time");
  config.x_position = find_dimension(dims, "lon");
  config.y_position = find_dimension(dims, "lat");
  config.missing_value = parse_missing_value(var_dump, config.
      var_display_name);
  config.time_origin = parse_time_origin(dump);
  config.time_size = parse_time_size(dump);
  if (config.time_size == 0) {
    error.set(ErrorKind::time_dimension_not_found, F, "no time dimension is "
        "declared in '" + filename + "'");
    return false;
  }
  if (verbose_operation) {
    std::cout << "  Variable: '" << config.var_display_name << "' with " <<
        dims.size() << " dimensions" << std::endl;
    for (const auto& d : dims) {
      std::cout << "    dimension " << d.first << ": " << d.second << std::endl;
    }
    std::cout << "  Time origin: '" << config.time_origin << "', size: " <<
        config.time_size << std::endl;
    if (!config.missing_value.empty()) {
      std::cout << "  Missing value: " << config.missing_value << std::endl;
    }
  }
  return true;
}

bool infer_rotated_names(probe::Probe& probe, string filename, Config& config,
    Error& error) {
  static const string F = this_function_label(__func__);
  stringstream file_dump;
  if (!probe.dump(filename, "", file_dump, error)) {
    return false;
  }
  if (!parse_rotated_names(file_dump.str(), config.longitude_name, config.
      latitude_name)) {
    config.longitude_name.clear();
    config.latitude_name.clear();
    error.set(ErrorKind::unsupported_grid, F, "'" + filename + "' does not "
        "declare 2-D longitude and latitude variables");
    return false;
  }
  if (verbose_operation) {
    std::cout << "  Rotated grid coordinates: '" << config.longitude_name <<
        "', '" << config.latitude_name << "'" << std::endl;
  }
  return true;
}

static void append_position(string key, size_t position, string& s) {
  if (position != UNSET) {
    s += key + " " + itos(position) + "\n";
  }
}

static void append_text(string key, string value, string& s) {
  if (!value.empty()) {
    s += key + " " + value + "\n";
  }
}

string write(const Config& config) {
  string s; // return value
  append_text("varname", config.var_display_name, s);
  append_position("varpos", config.var_position, s);
  append_position("tpos", config.time_position, s);
  append_position("xpos", config.x_position, s);
  append_position("ypos", config.y_position, s);
  append_text("t1", config.time_origin, s);
  if (config.time_size > 0) {
    s += "tsize " + itos(config.time_size) + "\n";
  }
  append_text("missing", config.missing_value, s);
  append_text("longitude", config.longitude_name, s);
  append_text("latitude", config.latitude_name, s);
  return s;
}

} // end namespace coldbar::config

} // end namespace coldbar
