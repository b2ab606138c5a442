#pragma once

#include <stdexcept>
#include <string>

namespace bidsub::util {

/*
  Central error types.

  Input errors (InvalidReference, PastDeadline, NotFound, RetryExhausted,
  InvalidState) are thrown synchronously and never change job state.
  AuditWriteError is escalated; nothing may swallow it.
*/

class InvalidReferenceError : public std::runtime_error {
 public:
  explicit InvalidReferenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PastDeadlineError : public std::runtime_error {
 public:
  explicit PastDeadlineError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RetryExhaustedError : public std::runtime_error {
 public:
  explicit RetryExhaustedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidStateError : public std::runtime_error {
 public:
  explicit InvalidStateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedFormatError : public std::runtime_error {
 public:
  explicit UnsupportedFormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AssemblyError : public std::runtime_error {
 public:
  explicit AssemblyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AuditWriteError : public std::runtime_error {
 public:
  explicit AuditWriteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace bidsub::util
