#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace stepagent {

// Parameter schema for tool definition
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "integer", "boolean", "array", "object"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;
};

// Outcome of one tool execution. Failures are values, never exceptions.
struct ToolResult {
  bool success = true;
  std::string content;
  std::string error;

  static ToolResult ok(std::string content) {
    return ToolResult{true, std::move(content), {}};
  }

  static ToolResult failure(std::string error) {
    return ToolResult{false, {}, std::move(error)};
  }

  // Text fed back to the model as the tool message
  std::string to_message_content() const {
    return success ? content : "Error: " + error;
  }
};

// Abstract tool interface
class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  // JSON Schema object describing the arguments
  virtual json parameters_schema() const = 0;

  virtual std::future<ToolResult> execute(const json &args) = 0;

  // {name, description, input_schema}
  json to_schema() const;

  // {type: "function", function: {name, description, parameters}}
  json to_openai_schema() const;
};

using ToolPtr = std::shared_ptr<Tool>;

// Tool described by a flat parameter list
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string name, std::string description) : name_(std::move(name)), description_(std::move(description)) {}

  std::string name() const override {
    return name_;
  }

  std::string description() const override {
    return description_;
  }

  json parameters_schema() const override;

 protected:
  virtual std::vector<ParameterSchema> parameters() const = 0;

  std::string name_;
  std::string description_;
};

// Returns nullptr when no tool has that name
ToolPtr find_tool(const std::vector<ToolPtr> &tools, const std::string &name);

}  // namespace stepagent
