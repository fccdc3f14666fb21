#include "playwarden/tools/tool.hpp"

#include "playwarden/common/json_util.hpp"

namespace playwarden::tools {

std::string_view severity_prefix(const Severity severity) {
  switch (severity) {
  case Severity::Success:
    return "SUCCESS";
  case Severity::Warning:
    return "WARNING";
  case Severity::Error:
    return "ERROR";
  }
  return "ERROR";
}

std::string ToolSpec::parameters_json() const {
  std::string properties;
  std::string required;
  for (const auto &param : params) {
    if (!properties.empty()) {
      properties += ",";
    }
    properties += "\"" + common::json_escape(param.name) + "\":{\"type\":\"string\"";
    if (!param.description.empty()) {
      properties += ",\"description\":\"" + common::json_escape(param.description) + "\"";
    }
    if (!param.default_value.empty()) {
      properties += ",\"default\":\"" + common::json_escape(param.default_value) + "\"";
    }
    properties += "}";
    if (param.required) {
      if (!required.empty()) {
        required += ",";
      }
      required += "\"" + common::json_escape(param.name) + "\"";
    }
  }
  return R"({"type":"object","required":[)" + required + R"(],"properties":{)" + properties +
         "}}";
}

std::string arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  return it == args.end() ? std::string() : it->second;
}

} // namespace playwarden::tools
