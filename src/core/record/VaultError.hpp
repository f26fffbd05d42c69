#pragma once
#include <stdexcept>
#include <string>

namespace vault {

enum class ErrorKind {
  None,
  Validation,
  InvalidSelection,
  InvalidId,
  NotFound,
  IoFailure,
  StoreFailure,
};

const char* to_string(ErrorKind kind);

class VaultError : public std::runtime_error {
public:
  VaultError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}
  ErrorKind kind() const noexcept { return kind_; }
private:
  ErrorKind kind_;
};

// Empty required input.
class ValidationError : public VaultError {
public:
  explicit ValidationError(const std::string& what)
    : VaultError(ErrorKind::Validation, what) {}
};

// Menu / sort / search selection outside the accepted set.
class InvalidSelectionError : public VaultError {
public:
  explicit InvalidSelectionError(const std::string& what)
    : VaultError(ErrorKind::InvalidSelection, what) {}
};

class InvalidIdError : public VaultError {
public:
  explicit InvalidIdError(const std::string& id)
    : VaultError(ErrorKind::InvalidId, "invalid record id: '" + id + "'") {}
};

class NotFoundError : public VaultError {
public:
  explicit NotFoundError(const std::string& id)
    : VaultError(ErrorKind::NotFound, "record not found: " + id) {}
};

// Backup / export write failures.
class IoError : public VaultError {
public:
  explicit IoError(const std::string& what)
    : VaultError(ErrorKind::IoFailure, what) {}
};

// SQL failure on an open connection.
class StoreError : public VaultError {
public:
  explicit StoreError(const std::string& what)
    : VaultError(ErrorKind::StoreFailure, what) {}
};

// Startup-only: the store could not be opened or initialized. Fatal.
class StoreUnavailable : public std::runtime_error {
public:
  explicit StoreUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Startup-only: required configuration is missing. Fatal.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace vault
