#include "log_sink.hpp"

#include <iostream>

namespace mbf_session {

using mbf::agent::v1::LogMsg;

namespace {

const char *diagnostic_tag(LogMsg::Level level) {
  switch (level) {
  case LogMsg::Trace:
    return "[agent:TRACE] ";
  case LogMsg::Debug:
    return "[agent:DEBUG] ";
  case LogMsg::Info:
    return "[agent:INFO] ";
  case LogMsg::Warn:
    return "[agent:WARN] ";
  case LogMsg::Error:
    return "[agent:ERROR] ";
  default:
    return "[agent] ";
  }
}

} // namespace

LogMsg make_log(LogMsg::Level level, const std::string &message) {
  LogMsg log;
  log.set_type("LogMsg");
  log.set_level(level);
  log.set_message(message);
  return log;
}

void log_event(const LogEventSink &sink, LogMsg::Level level,
               const std::string &msg) {
  if (level == LogMsg::Error) {
    std::cerr << "[mbf-link] ERROR: " << msg << "\n";
  } else if (level == LogMsg::Warn) {
    std::cerr << "[mbf-link] WARNING: " << msg << "\n";
  } else {
    std::cerr << "[mbf-link] " << msg << "\n";
  }

  if (sink) {
    sink(make_log(level, msg));
  }
}

void log_info(const LogEventSink &sink, const std::string &msg) {
  log_event(sink, LogMsg::Info, msg);
}

void log_from_agent(const LogMsg &log) {
  std::cerr << diagnostic_tag(log.level()) << log.message() << "\n";
}

} // namespace mbf_session
