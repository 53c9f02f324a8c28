#include <algorithm>
#include <fstream>
#include <string>
#include <coldbar.hpp>
#include <strutils.hpp>
#include <utils.hpp>

using miscutils::this_function_label;
using std::string;
using std::vector;
using strutils::itos;
using strutils::replace_all;
using strutils::split;

namespace coldbar {

namespace extract {

static const size_t NUM_LAST_ROWS = 10;

bool parse_record_line(string line, vector<string>& tokens) {
  replace_all(line, "=", " ");
  auto sp = split(line);
  tokens.assign(sp.begin(), sp.end());
  return !tokens.empty();
}

// each dimension contributes a label token and a value token, so the value of
// the 0-based field p is token 2p+1
static size_t token_index(size_t position) {
  return position * 2 + 1;
}

bool select_fields(const vector<string>& tokens, const config::Config& config,
    Record& record) {
  auto last = std::max(config.var_position, std::max(config.x_position,
      config.y_position));
  if (config.time_position != config::UNSET) {
    last = std::max(last, config.time_position);
  }
  if (token_index(last) >= tokens.size()) {
    return false;
  }
  if (config.time_position != config::UNSET) {
    record.time = tokens[token_index(config.time_position)];
  } else {
    record.time.clear();
  }
  record.x = tokens[token_index(config.x_position)];
  record.y = tokens[token_index(config.y_position)];
  record.value = tokens[token_index(config.var_position)];
  return true;
}

void merge_coordinate(Record& record, const coords::Coordinate& coordinate) {
  record.x = coordinate.lon;
  record.y = coordinate.lat;
}

string to_csv(const Record& record) {
  return record.time + "," + record.x + "," + record.y + "," + record.value;
}

bool extract_records(std::istream& dump, const config::Config& config, const
    coords::CoordinateStream *stream, std::ostream& sink, Summary& summary,
    Error& error) {
  static const string F = this_function_label(__func__);
  if (config.x_position == config::UNSET || config.y_position == config::
      UNSET || config.var_position == config::UNSET) {
    error.set(ErrorKind::malformed_config, F, "the variable, longitude and "
        "latitude positions are required to extract '" + config.
        var_display_name + "'");
    return false;
  }
  if (stream != nullptr && config.time_position == config::UNSET) {
    error.set(ErrorKind::malformed_config, F, "the time position is required "
        "to merge rotated grid coordinates");
    return false;
  }
  summary = Summary();
  string line;
  vector<string> tokens;
  Record record;
  size_t num_lines = 0;
  while (std::getline(dump, line)) {
    ++num_lines;
    if (!parse_record_line(line, tokens)) {
      continue;
    }
    if (!select_fields(tokens, config, record)) {
      error.set(ErrorKind::malformed_record, F, "line " + itos(num_lines) +
          " of the record dump has too few fields: '" + line + "'");
      return false;
    }
    if (stream != nullptr) {
      if (summary.num_rows >= stream->size()) {
        error.set(ErrorKind::malformed_record, F, "the record dump has more "
            "rows than the " + itos(stream->size()) + " expanded coordinates");
        return false;
      }
      merge_coordinate(record, (*stream)[summary.num_rows]);
    }
    auto row = to_csv(record);
    sink << row << "\n";
    if (!sink) {
      error.set(ErrorKind::io, F, "unable to write row " + itos(summary.
          num_rows + 1));
      return false;
    }
    ++summary.num_rows;
    summary.last_rows.emplace_back(row);
    if (summary.last_rows.size() > NUM_LAST_ROWS) {
      summary.last_rows.pop_front();
    }
    if (summary.num_rows % 65536 == 0 && interrupted()) {
      error.set(ErrorKind::interrupted, F, "interrupted after " + itos(summary.
          num_rows) + " rows");
      return false;
    }
  }
  if (stream != nullptr && summary.num_rows != stream->size()) {
    log_warning(itos(stream->size() - summary.num_rows) + " expanded "
        "coordinates were not used", F);
  }
  return true;
}

bool extract(probe::Probe& probe, string filename, const config::Config&
    config, const coords::CoordinateStream *stream, string dump_dir, std::
    ostream& sink, Summary& summary, Error& error) {
  static const string F = this_function_label(__func__);
  auto dump_file = dump_dir + "/" + config.var_display_name + ".trd";
  if (!probe.dump_records(filename, config.var_display_name, dump_file,
      error)) {
    return false;
  }
  std::ifstream dump(dump_file.c_str());
  if (!dump.is_open()) {
    error.set(ErrorKind::io, F, "unable to open the record dump '" + dump_file +
        "'");
    return false;
  }
  if (!extract_records(dump, config, stream, sink, summary, error)) {
    return false;
  }
  sink.flush();
  if (verbose_operation) {
    std::cout << "  Wrote " << summary.num_rows << " rows for '" << config.
        var_display_name << "'" << std::endl;
  }
  return true;
}

} // end namespace coldbar::extract

} // end namespace coldbar
