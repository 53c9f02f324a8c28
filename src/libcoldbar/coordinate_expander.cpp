#include <fstream>
#include <string>
#include <coldbar.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::string;
using std::vector;
using strutils::itos;

namespace coldbar {

namespace coords {

vector<string> parse_values(std::istream& dump) {
  vector<string> v; // return value
  string line;
  vector<string> tokens;
  while (std::getline(dump, line)) {
    if (extract::parse_record_line(line, tokens)) {
      v.emplace_back(tokens.back());
    }
  }
  return v;
}

bool pair_cells(const vector<string>& lons, const vector<string>& lats, vector<
    Coordinate>& cells, Error& error) {
  static const string F = this_function_label(__func__);
  if (lons.size() != lats.size()) {
    error.set(ErrorKind::unsupported_grid, F, "longitude and latitude hold "
        "different numbers of cells (" + itos(lons.size()) + " and " + itos(
        lats.size()) + ")");
    return false;
  }
  cells.clear();
  cells.reserve(lons.size());
  for (size_t n = 0; n < lons.size(); ++n) {
    cells.emplace_back(lons[n], lats[n]);
  }
  return true;
}

CoordinateStream replicate(const vector<Coordinate>& cells, size_t num_times) {
  return CoordinateStream(cells, num_times);
}

static bool read_values(probe::Probe& probe, string filename, string variable,
    string dump_dir, vector<string>& values, Error& error) {
  static const string F = this_function_label(__func__);
  auto dump_file = dump_dir + "/" + variable + ".trd";
  if (!probe.dump_records(filename, variable, dump_file, error)) {
    return false;
  }
  std::ifstream ifs(dump_file.c_str());
  if (!ifs.is_open()) {
    error.set(ErrorKind::io, F, "unable to open the record dump '" + dump_file +
        "'");
    return false;
  }
  values = parse_values(ifs);
  return true;
}

bool expand(probe::Probe& probe, string filename, const config::Config& config,
    string dump_dir, CoordinateStream& stream, Error& error) {
  static const string F = this_function_label(__func__);
  if (!config.is_rotated()) {
    error.set(ErrorKind::unsupported_grid, F, "no 2-D longitude and latitude "
        "variables are configured for '" + config.var_display_name + "'");
    return false;
  }
  if (config.time_size == 0) {
    error.set(ErrorKind::malformed_config, F, "the time size is required to "
        "expand rotated grid coordinates");
    return false;
  }
  vector<string> lons, lats;
  if (!read_values(probe, filename, config.longitude_name, dump_dir, lons,
      error) || !read_values(probe, filename, config.latitude_name, dump_dir,
      lats, error)) {
    return false;
  }
  vector<Coordinate> cells;
  if (!pair_cells(lons, lats, cells, error)) {
    return false;
  }
  stream = replicate(cells, config.time_size);
  if (verbose_operation) {
    std::cout << "  Expanded " << cells.size() << " grid cells over " << config.
        time_size << " time steps" << std::endl;
  }
  return true;
}

} // end namespace coldbar::coords

} // end namespace coldbar
