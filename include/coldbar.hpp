#ifndef COLDBAR_H
#define   COLDBAR_H

#include <deque>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <tempfile.hpp>

namespace coldbar {

extern bool verbose_operation;

enum class ErrorKind { none, not_found, no_dataset_in_archive,
    malformed_config, variable_not_found, time_dimension_not_found,
    unsupported_grid, external_tool, malformed_record, io, interrupted };

// Only the first failure of a run is recorded; set() on an error that already
// holds one is ignored, so callers can propagate by returning false.
struct Error {
  Error() : kind(ErrorKind::none), stage(), message() { }
  bool empty() const { return kind == ErrorKind::none; }
  void clear();
  bool set(ErrorKind k, std::string where, std::string what);
  std::string to_string() const;

  ErrorKind kind;
  std::string stage, message;
};

struct Directives {
  Directives() : ncks_path("/usr/bin/ncks"), tar_path("/bin/tar"), temp_path(
      "/tmp"), dataset_pattern("\\.nc$") { }

  std::string ncks_path, tar_path;
  std::string temp_path;
  std::string dataset_pattern;
};

struct Args {
  Args() : args_string(), command(), source(), destination(), cfg_path(),
      varname(), temp_loc(), is_archive(false), rotated(false), print_config(
      false) { }

  std::string args_string;
  std::string command;
  std::string source, destination;
  std::string cfg_path, varname;
  std::string temp_loc;
  bool is_archive, rotated, print_config;
};

extern Directives directives;
extern Args args;

extern bool interrupted();
extern std::string error_kind_name(ErrorKind kind);
extern void request_interrupt();
extern void log_warning(std::string message, std::string caller);
extern bool read_directives(std::string filename, Directives& d, Error& error);
extern bool read_directives(std::istream& ifs, Directives& d, Error& error);
extern bool parse_args(char arg_delimiter, Error& error);

namespace probe {

// Textual projections of a dataset. The metadata dump is the "ncks --trd -m"
// report; the record dump has one "dim[i]=v ... var[k]=v" line per scalar.
class Probe {
public:
  virtual ~Probe() { }

  // an empty variable requests the whole-file report
  virtual bool dump(std::string filename, std::string variable, std::
      stringstream& output, Error& error) = 0;

  // the record dump can be far larger than memory, so it goes to dump_file
  virtual bool dump_records(std::string filename, std::string variable, std::
      string dump_file, Error& error) = 0;
};

class NcksProbe : public Probe {
public:
  NcksProbe() : ncks_path(directives.ncks_path) { }
  explicit NcksProbe(std::string ncks) : ncks_path(ncks) { }

  bool dump(std::string filename, std::string variable, std::stringstream&
      output, Error& error) override;
  bool dump_records(std::string filename, std::string variable, std::string
      dump_file, Error& error) override;

private:
  bool run(std::string command, std::stringstream& output, std::string where,
      Error& error);

  std::string ncks_path;
};

} // end namespace coldbar::probe

namespace archive {

extern std::vector<std::string> list_dataset_entries(std::string listing, std::
    string pattern);
extern bool resolve(std::string path, bool is_archive, TempDir& workspace, std::
    string& dataset_file, Error& error);

} // end namespace coldbar::archive

namespace config {

static const size_t UNSET = 0xffffffff;

struct Config {
  Config() : varname(), var_display_name(), var_position(UNSET), time_position(
      UNSET), x_position(UNSET), y_position(UNSET), time_origin(), time_size(
      0), missing_value(), longitude_name(), latitude_name() { }

  bool is_rotated() const { return !longitude_name.empty() && !latitude_name.
      empty(); }

  std::string varname, var_display_name;
  size_t var_position, time_position, x_position, y_position;
  std::string time_origin;
  size_t time_size;
  std::string missing_value;
  std::string longitude_name, latitude_name;
};

extern bool operator==(const Config& left, const Config& right);
extern bool operator!=(const Config& left, const Config& right);

struct VariableNames {
  VariableNames() : table(), order() { }

  std::unordered_map<std::string, std::string> table;
  std::vector<std::string> order;
};

typedef std::vector<std::pair<size_t, std::string>> DimensionList;

extern VariableNames parse_variable_names(const std::string& dump);
extern bool resolve_variable(const VariableNames& names, std::string hint, std::
    string& key, std::string& display_name);
extern DimensionList parse_dimensions(const std::string& var_dump, std::string
    var_name);
extern size_t parse_dimension_count(const std::string& var_dump, std::string
    var_name);
extern size_t find_dimension(const DimensionList& dims, std::string fragment);
extern std::string parse_missing_value(const std::string& var_dump, std::string
    var_name);
extern std::string parse_time_origin(const std::string& dump);
extern size_t parse_time_size(const std::string& dump);
extern bool parse_rotated_names(const std::string& dump, std::string&
    longitude_name, std::string& latitude_name);

extern bool from_file(std::string filename, Config& config, Error& error);
extern bool parse_config(std::istream& ifs, Config& config, Error& error);
extern bool infer(probe::Probe& probe, std::string filename, std::string hint,
    Config& config, Error& error);
extern bool infer_rotated_names(probe::Probe& probe, std::string filename,
    Config& config, Error& error);
extern std::string write(const Config& config);

} // end namespace coldbar::config

namespace coords {

struct Coordinate {
  Coordinate() : lon(), lat() { }
  Coordinate(std::string longitude, std::string latitude) : lon(longitude),
      lat(latitude) { }

  std::string lon, lat;
};

// The per-record coordinates of a rotated grid: the cell list repeated once
// per time step. Entry n is cell n % num_cells(), so only the cells are held.
class CoordinateStream {
public:
  CoordinateStream() : cells(), num_times(0) { }
  CoordinateStream(const std::vector<Coordinate>& grid_cells, size_t
      time_steps) : cells(grid_cells), num_times(time_steps) { }

  bool empty() const { return size() == 0; }
  size_t num_cells() const { return cells.size(); }
  size_t num_time_steps() const { return num_times; }
  size_t size() const { return cells.size() * num_times; }
  const Coordinate& operator[](size_t n) const { return cells[n % cells.
      size()]; }

private:
  std::vector<Coordinate> cells;
  size_t num_times;
};

extern std::vector<std::string> parse_values(std::istream& dump);
extern bool pair_cells(const std::vector<std::string>& lons, const std::vector<
    std::string>& lats, std::vector<Coordinate>& cells, Error& error);
extern CoordinateStream replicate(const std::vector<Coordinate>& cells, size_t
    num_times);
extern bool expand(probe::Probe& probe, std::string filename, const config::
    Config& config, std::string dump_dir, CoordinateStream& stream, Error&
    error);

} // end namespace coldbar::coords

namespace extract {

struct Record {
  Record() : time(), x(), y(), value() { }

  std::string time, x, y, value;
};

struct Summary {
  Summary() : num_rows(0), last_rows() { }

  size_t num_rows;
  std::deque<std::string> last_rows;
};

extern bool parse_record_line(std::string line, std::vector<std::string>&
    tokens);
extern bool select_fields(const std::vector<std::string>& tokens, const config::
    Config& config, Record& record);
extern void merge_coordinate(Record& record, const coords::Coordinate&
    coordinate);
extern std::string to_csv(const Record& record);
extern bool extract_records(std::istream& dump, const config::Config& config,
    const coords::CoordinateStream *stream, std::ostream& sink, Summary&
    summary, Error& error);
extern bool extract(probe::Probe& probe, std::string filename, const config::
    Config& config, const coords::CoordinateStream *stream, std::string
    dump_dir, std::ostream& sink, Summary& summary, Error& error);

} // end namespace coldbar::extract

namespace pipeline {

struct Options {
  Options() : source(), destination(), cfg_path(), varname(), is_archive(false),
      rotated(false) { }

  std::string source, destination;
  std::string cfg_path, varname;
  bool is_archive, rotated;
};

struct RunResult {
  RunResult() : config(), dataset_file(), summary() { }

  config::Config config;
  std::string dataset_file;
  extract::Summary summary;
};

extern bool explain(probe::Probe& probe, std::string source, bool is_archive,
    std::string& text, Error& error);
extern bool run(probe::Probe& probe, const Options& options, RunResult& result,
    Error& error);

} // end namespace coldbar::pipeline

} // end namespace coldbar

#endif
