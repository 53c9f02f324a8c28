#include <iostream>
#include <stdlib.h>
#include <signal.h>
#include <string>
#include <coldbar.hpp>
#include <utils.hpp>
#include <myerror.hpp>

using std::cerr;
using std::cout;
using std::endl;
using std::string;

coldbar::Directives coldbar::directives;
coldbar::Args coldbar::args;
bool coldbar::verbose_operation;
string myerror = "";
string mywarning = "";

static const string VERSION = "0.1";

extern "C" void clean_up() {
  if (!myerror.empty()) {
    cerr << myerror << endl;
  }
}

extern "C" void int_handler(int) {
  coldbar::request_interrupt();
}

void show_usage() {
  cout << "coldbar: Locate low-temperature land areas using NetCDF data" <<
      endl;
  cout << "\nusage: (1) coldbar explain [-t] [-T <dir>] [-V] SOURCE" << endl;
  cout << "   or: (2) coldbar build [-t] [-r] { -c <path> | -v <name> } [-p] "
      "[-T <dir>] [-V]" << endl;
  cout << "                 SOURCE DESTINATION" << endl;
  cout << "\n(1) prints the dimensions and variables in the input NetCDF file"
      << endl;
  cout << "(2) writes the minimum temperature records as CSV rows "
      "(time,lon,lat,value)" << endl;
  cout << "\noptions:" << endl;
  cout << "-t, --tar            SOURCE is a tar archive; use its first NetCDF "
      "file (1), (2)" << endl;
  cout << "-r, --rotated        longitude and latitude refer to a rotated pole "
      "grid (2)" << endl;
  cout << "-c, --cfg <path>     use a configuration file (2)" << endl;
  cout << "-v, --varname <name> name of the variable that holds minimum "
      "temperature values;" << endl;
  cout << "                     ignored when --cfg is given (2)" << endl;
  cout << "-p, --print-config   print the resolved configuration (2)" << endl;
  cout << "-T <dir>             parent of the temporary workspace (default "
      "/tmp)" << endl;
  cout << "-V                   verbose output" << endl;
  cout << "\nSettings are read from the file named by $COLDBAR_CONF, if set."
      << endl;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    show_usage();
    exit(1);
  }
  string first = argv[1];
  if (first == "--help" || first == "-h") {
    show_usage();
    exit(0);
  }
  if (first == "--version") {
    cout << "coldbar " << VERSION << endl;
    exit(0);
  }
  signal(SIGINT, int_handler);
  signal(SIGTERM, int_handler);
  signal(SIGHUP, int_handler);
  atexit(clean_up);
  coldbar::Error error;
  auto conf = getenv("COLDBAR_CONF");
  if (conf != nullptr && !coldbar::read_directives(conf, coldbar::directives,
      error)) {
    myerror = error.to_string();
    exit(1);
  }
  auto d = '%';
  coldbar::args.args_string = unixutils::unix_args_string(argc, argv, d);
  if (!coldbar::parse_args(d, error)) {
    myerror = error.to_string();
    exit(1);
  }
  coldbar::directives.temp_path = coldbar::args.temp_loc;
  coldbar::probe::NcksProbe probe;
  if (coldbar::args.command == "explain") {
    string text;
    if (!coldbar::pipeline::explain(probe, coldbar::args.source, coldbar::args.
        is_archive, text, error)) {
      myerror = error.to_string();
      exit(1);
    }
    cout << text;
    return 0;
  }
  coldbar::pipeline::Options options;
  options.source = coldbar::args.source;
  options.destination = coldbar::args.destination;
  options.cfg_path = coldbar::args.cfg_path;
  options.varname = coldbar::args.varname;
  options.is_archive = coldbar::args.is_archive;
  options.rotated = coldbar::args.rotated;
  coldbar::pipeline::RunResult result;
  auto ok = coldbar::pipeline::run(probe, options, result, error);
  if (coldbar::args.print_config || coldbar::verbose_operation) {
    cout << coldbar::config::write(result.config);
  }
  if (!ok) {
    myerror = error.to_string();
    exit(1);
  }
  if (coldbar::verbose_operation) {
    cout << "Wrote " << result.summary.num_rows << " rows to '" << options.
        destination << "'" << endl;
    for (const auto& row : result.summary.last_rows) {
      cout << row << endl;
    }
  }
  return 0;
}
