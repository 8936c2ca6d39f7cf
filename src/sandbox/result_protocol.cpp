#include "liteagent/sandbox/result_protocol.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/common/json_util.hpp"

#include <sstream>

namespace liteagent::sandbox {

namespace {

constexpr std::string_view DECODE_ERROR = "Error decoding result JSON";
constexpr std::string_view NO_SENTINEL_ERROR = "Execution failed or timed out";

bool is_line_end(const std::string &text, const std::size_t pos) {
  return pos == text.size() || text[pos] == '\n' || text[pos] == '\r';
}

std::optional<std::string> member_string(const common::JsonRawMap &members, const std::string &key) {
  const auto it = members.find(key);
  if (it == members.end()) {
    return std::nullopt;
  }
  return common::json_decode_string(it->second);
}

void append_block(std::string &logs, const std::string &block) {
  if (block.empty()) {
    return;
  }
  if (!logs.empty() && logs.back() != '\n') {
    logs.push_back('\n');
  }
  logs += block;
}

ExecutionResult decode_failure(ExecutionResult result, const std::string &payload) {
  result.success = false;
  result.result_json.reset();
  result.error = std::string(DECODE_ERROR);
  result.logs = std::string(DECODE_ERROR) + ": " + payload;
  return result;
}

} // namespace

std::string ExecutionResult::to_json() const {
  std::ostringstream out;
  out << "{\"result\":" << (result_json.has_value() ? *result_json : std::string("null"));
  out << ",\"logs\":" << common::json_quote(logs);
  out << ",\"success\":" << (success ? "true" : "false") << "}";
  return out.str();
}

std::size_t find_result_sentinel(const std::string &output) {
  const std::string sentinel(protocol::RESULT_SENTINEL);
  std::size_t pos = output.rfind(sentinel);
  while (pos != std::string::npos) {
    const bool at_line_start = pos == 0 || output[pos - 1] == '\n';
    if (at_line_start && is_line_end(output, pos + sentinel.size())) {
      return pos;
    }
    if (pos == 0) {
      break;
    }
    pos = output.rfind(sentinel, pos - 1);
  }
  return std::string::npos;
}

ExecutionResult parse_execution_output(const std::string &stdout_text,
                                       const std::string &stderr_text) {
  const std::string combined = stdout_text + stderr_text;
  ExecutionResult result;

  const std::size_t marker = find_result_sentinel(combined);
  if (marker == std::string::npos) {
    result.success = false;
    result.logs = combined;
    result.error = std::string(NO_SENTINEL_ERROR);
    return result;
  }
  result.sentinel_found = true;

  std::size_t payload_start = marker + protocol::RESULT_SENTINEL.size();
  if (payload_start < combined.size() && combined[payload_start] == '\r') {
    ++payload_start;
  }
  if (payload_start < combined.size() && combined[payload_start] == '\n') {
    ++payload_start;
  }
  const std::string payload = combined.substr(payload_start);

  const std::size_t begin = common::json_skip_ws(payload, 0);
  if (begin >= payload.size() || payload[begin] != '{') {
    return decode_failure(std::move(result), payload);
  }
  const std::size_t end = common::json_scan_value(payload, begin);
  if (end == std::string::npos) {
    return decode_failure(std::move(result), payload);
  }
  const auto parsed = common::json_parse_object(payload.substr(begin, end - begin));
  if (!parsed.ok()) {
    return decode_failure(std::move(result), payload);
  }
  const auto &members = parsed.value();

  if (const auto it = members.find("success"); it != members.end()) {
    result.success = common::json_decode_bool(it->second).value_or(false);
  }
  if (const auto it = members.find("result"); it != members.end()) {
    const std::string raw = common::trim(it->second);
    if (raw != "null") {
      result.result_json = raw;
    }
  }
  result.error = member_string(members, "error");
  result.traceback = member_string(members, "traceback");
  result.serialization_error = member_string(members, "serialization_error");
  result.logs = member_string(members, "output").value_or("");

  if (!result.success && result.traceback.has_value() &&
      result.logs.find(*result.traceback) == std::string::npos) {
    append_block(result.logs, *result.traceback);
  }

  // Anything after the object came from the engine's stderr, not the wrapper.
  append_block(result.logs, common::trim(payload.substr(end)));
  return result;
}

std::string extract_code_block(const std::string &text) {
  const std::string fence = "```";
  std::size_t open = text.find(fence + "python");
  if (open == std::string::npos) {
    open = text.find(fence);
  }
  if (open == std::string::npos) {
    return common::trim(text);
  }

  const std::size_t body_start = text.find('\n', open + fence.size());
  if (body_start == std::string::npos) {
    return common::trim(text);
  }
  const std::size_t close = text.find(fence, body_start + 1);
  if (close == std::string::npos) {
    return common::trim(text.substr(body_start + 1));
  }
  return common::trim(text.substr(body_start + 1, close - body_start - 1));
}

} // namespace liteagent::sandbox
