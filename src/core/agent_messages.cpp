#include "agent_messages.hpp"

#include <google/protobuf/util/json_util.h>

#include "errors.hpp"

namespace mbf_session {

namespace {

using google::protobuf::util::JsonParseOptions;
using google::protobuf::util::JsonPrintOptions;
using google::protobuf::util::JsonStringToMessage;
using google::protobuf::util::MessageToJsonString;
using mbf_link::ProtocolError;

JsonParseOptions parse_options() {
  JsonParseOptions opts;
  // The agent may add fields this side does not model.
  opts.ignore_unknown_fields = true;
  return opts;
}

template <typename T> T parse_as(const std::string &frame) {
  T msg;
  const auto status = JsonStringToMessage(frame, &msg, parse_options());
  if (!status.ok()) {
    throw ProtocolError("Agent message " + frame + " is not a valid " +
                        std::string(T::descriptor()->name()) + ": " +
                        status.ToString());
  }
  return msg;
}

// An unknown level name is dropped by the parser, so it shows up as absent.
pb::LogMsg parse_log(const std::string &frame) {
  pb::LogMsg log = parse_as<pb::LogMsg>(frame);
  if (!log.has_level() || !pb::LogMsg::Level_IsValid(log.level())) {
    throw ProtocolError("Agent message " + frame +
                        " has a missing or unknown log level");
  }
  return log;
}

} // namespace

std::string encode_request(const Request &request) {
  return std::visit(
      [](const auto &req) {
        auto msg = req;
        msg.set_type(std::string(msg.GetDescriptor()->name()));

        JsonPrintOptions opts;
        opts.preserve_proto_field_names = true;
        opts.always_print_primitive_fields = true;
        opts.add_whitespace = false;

        std::string out;
        const auto status = MessageToJsonString(msg, &out, opts);
        if (!status.ok()) {
          throw ProtocolError("failed to serialize " + msg.type() +
                              " request: " + status.ToString());
        }
        return out;
      },
      request);
}

AgentMessage decode_message(const std::string &frame) {
  pb::Envelope envelope;
  const auto status = JsonStringToMessage(frame, &envelope, parse_options());
  if (!status.ok()) {
    throw ProtocolError("Agent message " + frame + " was not valid JSON");
  }

  const std::string &type = envelope.type();
  if (type == "LogMsg") {
    return parse_log(frame);
  } else if (type == "ModStatus") {
    return TerminalResult{parse_as<pb::ModStatus>(frame)};
  } else if (type == "Mods") {
    return TerminalResult{parse_as<pb::Mods>(frame)};
  } else if (type == "Patched") {
    return TerminalResult{parse_as<pb::Patched>(frame)};
  } else if (type == "ImportResult") {
    return TerminalResult{parse_as<pb::ImportResult>(frame)};
  } else if (type == "DowngradedManifest") {
    return TerminalResult{parse_as<pb::DowngradedManifest>(frame)};
  } else if (type == "FixedPlayerData") {
    return TerminalResult{parse_as<pb::FixedPlayerData>(frame)};
  }

  if (type.empty()) {
    throw ProtocolError("Agent message " + frame + " has no type");
  }
  throw ProtocolError("Agent message " + frame + " has unknown type '" + type +
                      "'");
}

std::string type_name(const Request &request) {
  return std::visit(
      [](const auto &m) { return std::string(m.GetDescriptor()->name()); },
      request);
}

std::string type_name(const TerminalResult &result) {
  return std::visit(
      [](const auto &m) { return std::string(m.GetDescriptor()->name()); },
      result);
}

const char *level_name(pb::LogMsg::Level level) {
  switch (level) {
  case pb::LogMsg::Trace:
    return "Trace";
  case pb::LogMsg::Debug:
    return "Debug";
  case pb::LogMsg::Info:
    return "Info";
  case pb::LogMsg::Warn:
    return "Warn";
  case pb::LogMsg::Error:
    return "Error";
  default:
    return "Unknown";
  }
}

std::string to_json(const google::protobuf::Message &message) {
  JsonPrintOptions opts;
  opts.preserve_proto_field_names = true;

  std::string out;
  const auto status = MessageToJsonString(message, &out, opts);
  if (!status.ok()) {
    throw std::runtime_error("failed to print " +
                             std::string(message.GetDescriptor()->name()) +
                             " as JSON: " + status.ToString());
  }
  return out;
}

} // namespace mbf_session
