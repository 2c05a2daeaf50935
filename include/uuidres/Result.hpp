#pragma once

#include <string>
#include <utility>
#include <variant>

namespace uuidres {

enum class ErrorCode : int {
  BadlyFormatted,
  UnexistingIndex,
  NameAlreadyExists,
  Storage,
  Decoding,
  TaskFailed,
  BadDump
};

const char* errorCodeName(ErrorCode code);

struct Error {
  ErrorCode   code;
  std::string message;

  std::string describe() const {
    return std::string(errorCodeName(code)) + ": " + message;
  }
};

// Value-or-error returned by every resolver and store operation.
template <typename T>
class Result {
public:
  Result(const T& value) : _value(value) {}
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Error& error) : _value(error) {}
  Result(Error&& error) : _value(std::move(error)) {}

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Error& error() const { return std::get<Error>(_value); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }

  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

private:
  std::variant<T, Error> _value;
};

// Operations that only succeed or fail (insert).
template <>
class Result<void> {
public:
  Result() = default;
  Result(const Error& error) : _error(error), _failed(true) {}
  Result(Error&& error) : _error(std::move(error)), _failed(true) {}

  bool has_value() const { return !_failed; }
  explicit operator bool() const { return has_value(); }

  const Error& error() const { return _error; }

private:
  Error _error{ErrorCode::Storage, {}};
  bool  _failed = false;
};

inline Error badlyFormatted(const std::string& uid) {
  return Error{ErrorCode::BadlyFormatted, "Badly formatted index uid: " + uid};
}

inline Error unexistingIndex(const std::string& uid) {
  return Error{ErrorCode::UnexistingIndex, "Index \"" + uid + "\" doesn't exist."};
}

inline Error nameAlreadyExists(const std::string& uid) {
  return Error{ErrorCode::NameAlreadyExists, "Index \"" + uid + "\" already exists."};
}

} // namespace uuidres
