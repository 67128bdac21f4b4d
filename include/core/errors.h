#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

enum class ErrorType { VALIDATION, NOT_FOUND, CONFLICT, UPSTREAM, INTERNAL };

inline const char *errorTypeToString(ErrorType type) {
  switch (type) {
  case ErrorType::VALIDATION:
    return "validation";
  case ErrorType::NOT_FOUND:
    return "not_found";
  case ErrorType::CONFLICT:
    return "conflict";
  case ErrorType::UPSTREAM:
    return "upstream";
  case ErrorType::INTERNAL:
    return "internal";
  }
  return "internal";
}

class QualityError : public std::runtime_error {
public:
  QualityError(ErrorType type, const std::string &message)
      : std::runtime_error(message), type_(type) {}

  ErrorType type() const { return type_; }
  const char *typeName() const { return errorTypeToString(type_); }

private:
  ErrorType type_;
};

// Malformed scope, ids or filters.
class ValidationError : public QualityError {
public:
  explicit ValidationError(const std::string &message)
      : QualityError(ErrorType::VALIDATION, message) {}
};

// Unknown session, group, violation, suggestion, project or database.
class NotFoundError : public QualityError {
public:
  explicit NotFoundError(const std::string &message)
      : QualityError(ErrorType::NOT_FOUND, message) {}
};

// AlreadyRunning, AlreadyMerged, AlreadyApplied.
class ConflictError : public QualityError {
public:
  explicit ConflictError(const std::string &message)
      : QualityError(ErrorType::CONFLICT, message) {}
};

// A target database or the service database is unreachable or corrupt.
class UpstreamError : public QualityError {
public:
  explicit UpstreamError(const std::string &message)
      : QualityError(ErrorType::UPSTREAM, message) {}
};

class InternalError : public QualityError {
public:
  explicit InternalError(const std::string &message)
      : QualityError(ErrorType::INTERNAL, message) {}
};

#endif
