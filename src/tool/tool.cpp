#include "tool/tool.hpp"

#include <algorithm>

namespace stepagent {

json Tool::to_schema() const {
  return json{{"name", name()}, {"description", description()}, {"input_schema", parameters_schema()}};
}

json Tool::to_openai_schema() const {
  return json{{"type", "function"},
              {"function", {{"name", name()}, {"description", description()}, {"parameters", parameters_schema()}}}};
}

json SimpleTool::parameters_schema() const {
  json properties = json::object();
  json required = json::array();

  for (const auto &param : parameters()) {
    json prop = {{"type", param.type}, {"description", param.description}};
    if (param.default_value) {
      prop["default"] = *param.default_value;
    }
    if (param.enum_values) {
      prop["enum"] = *param.enum_values;
    }
    properties[param.name] = prop;

    if (param.required) {
      required.push_back(param.name);
    }
  }

  return json{{"type", "object"}, {"properties", properties}, {"required", required}};
}

ToolPtr find_tool(const std::vector<ToolPtr> &tools, const std::string &name) {
  auto it = std::find_if(tools.begin(), tools.end(), [&](const ToolPtr &tool) { return tool && tool->name() == name; });
  return it != tools.end() ? *it : nullptr;
}

}  // namespace stepagent
