#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace liteagent::sandbox {

namespace protocol {

inline constexpr std::string_view RESULT_SENTINEL = "__LITEAGENT_RESULT_JSON__";
inline constexpr std::string_view CODE_FILENAME = "_liteagent_code.py";
inline constexpr std::string_view WRAPPER_FILENAME = "_liteagent_wrapper.py";
inline constexpr std::string_view RESULT_VARIABLE = "_liteagent_result";

/// Runs the submitted code inside the container. Program output on both streams
/// is captured in memory; the real stdout only ever receives the sentinel line
/// followed by one JSON object.
inline constexpr std::string_view WRAPPER_SCRIPT = R"PY(import json
import sys
import traceback
from io import StringIO

_liteagent_stdout = sys.stdout
_liteagent_out = StringIO()
sys.stdout = _liteagent_out
sys.stderr = _liteagent_out


def _liteagent_emit(payload):
    sys.stdout = _liteagent_stdout
    sys.stderr = sys.__stderr__
    print("\n__LITEAGENT_RESULT_JSON__\n" + payload)
    sys.stdout.flush()


try:
    with open('_liteagent_code.py', 'r') as _liteagent_file:
        _liteagent_source = _liteagent_file.read()
    _liteagent_namespace = {'__name__': '__main__'}
    exec(compile(_liteagent_source, '_liteagent_code.py', 'exec'), _liteagent_namespace)
    _liteagent_value = _liteagent_namespace.get('_liteagent_result', None)
    try:
        _liteagent_payload = json.dumps({
            'success': True,
            'result': _liteagent_value,
            'output': _liteagent_out.getvalue(),
        }, allow_nan=False)
    except Exception as _liteagent_error:
        _liteagent_payload = json.dumps({
            'success': True,
            'result': str(_liteagent_value),
            'output': _liteagent_out.getvalue(),
            'serialization_error': str(_liteagent_error),
        })
    _liteagent_emit(_liteagent_payload)
except BaseException as _liteagent_error:
    traceback.print_exc()
    _liteagent_emit(json.dumps({
        'success': False,
        'error': str(_liteagent_error),
        'traceback': traceback.format_exc(),
        'output': _liteagent_out.getvalue(),
    }))
)PY";

} // namespace protocol

/// Outcome of one `execute` call. Sandboxed-code failures live here, never in
/// a Status.
struct ExecutionResult {
  /// Raw JSON text of the `result` field; nullopt when the value was null or absent.
  std::optional<std::string> result_json;
  std::string logs;
  bool success = false;

  std::optional<std::string> error;
  std::optional<std::string> traceback;
  std::optional<std::string> serialization_error;
  bool sentinel_found = false;
  int exit_code = 0;
  bool timed_out = false;

  /// {"result": <value|null>, "logs": "...", "success": bool}
  [[nodiscard]] std::string to_json() const;
};

/// Extracts the structured outcome from the exec call's two output buffers,
/// concatenated stdout first. Never throws.
[[nodiscard]] ExecutionResult parse_execution_output(const std::string &stdout_text,
                                                     const std::string &stderr_text);

/// Position of the last sentinel that occupies a whole line, or npos.
[[nodiscard]] std::size_t find_result_sentinel(const std::string &output);

/// Body of the first fenced code block, preferring one tagged `python`;
/// the trimmed input when there is no fence.
[[nodiscard]] std::string extract_code_block(const std::string &text);

} // namespace liteagent::sandbox
