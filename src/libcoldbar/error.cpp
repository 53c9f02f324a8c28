#include <signal.h>
#include <iostream>
#include <string>
#include <coldbar.hpp>
#include <myerror.hpp>

using std::cerr;
using std::endl;
using std::string;

namespace coldbar {

static volatile sig_atomic_t g_interrupted = 0;

bool interrupted() {
  return g_interrupted != 0;
}

void request_interrupt() {
  g_interrupted = 1;
}

string error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::none: {
      return "none";
    }
    case ErrorKind::not_found: {
      return "NotFoundError";
    }
    case ErrorKind::no_dataset_in_archive: {
      return "NoDatasetInArchiveError";
    }
    case ErrorKind::malformed_config: {
      return "MalformedConfigError";
    }
    case ErrorKind::variable_not_found: {
      return "VariableNotFoundError";
    }
    case ErrorKind::time_dimension_not_found: {
      return "TimeDimensionNotFoundError";
    }
    case ErrorKind::unsupported_grid: {
      return "UnsupportedGridError";
    }
    case ErrorKind::external_tool: {
      return "ExternalToolError";
    }
    case ErrorKind::malformed_record: {
      return "MalformedRecordError";
    }
    case ErrorKind::io: {
      return "IOError";
    }
    case ErrorKind::interrupted: {
      return "InterruptedError";
    }
  }
  return "unknown";
}

void Error::clear() {
  kind = ErrorKind::none;
  stage.clear();
  message.clear();
}

bool Error::set(ErrorKind k, string where, string what) {
  if (kind != ErrorKind::none) {
    return false;
  }
  kind = k;
  stage = where;
  message = what;
  return true;
}

string Error::to_string() const {
  if (empty()) {
    return "";
  }
  return "Terminating - " + stage + ": " + error_kind_name(kind) + ": " +
      message;
}

void log_warning(string message, string caller) {
  if (!mywarning.empty()) {
    mywarning += "\n";
  }
  mywarning += caller + ": " + message;
  cerr << "Warning: " << caller << ": " << message << endl;
}

} // end namespace coldbar
