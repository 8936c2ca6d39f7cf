#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace liteagent::common {

/// Failure categories surfaced by infrastructure operations.
enum class ErrorKind {
  None,
  Unknown,
  InvalidArgument,
  EngineUnavailable,
  ContainerCreate,
  ShadowCopy,
  Io,
  Config,
};

[[nodiscard]] constexpr std::string_view error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Unknown:
    return "unknown";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  case ErrorKind::EngineUnavailable:
    return "engine_unavailable";
  case ErrorKind::ContainerCreate:
    return "container_create";
  case ErrorKind::ShadowCopy:
    return "shadow_copy";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Config:
    return "config";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::Unknown) {
    return Status(kind == ErrorKind::None ? ErrorKind::Unknown : kind, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Unknown) {
    return Result(kind == ErrorKind::None ? ErrorKind::Unknown : kind, std::nullopt,
                  std::move(message));
  }
  static Result failure(const Status &status) { return failure(status.error(), status.kind()); }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(error_, kind_);
  }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace liteagent::common
