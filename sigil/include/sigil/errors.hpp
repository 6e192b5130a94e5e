#pragma once
// Errors: what can go wrong inside the engine
//
// Components throw these internally. Engine-facing entry points
// (Engine, Pipeline, rpc::Handler) catch them and report structured
// results, so nothing unstructured crosses the engine boundary.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sigil {

enum class ErrorKind : uint8_t {
    UnknownOperator = 0,
    TypeMismatch = 1,
    MalformedExpression = 2,
    InvalidPatchSyntax = 3,
    PatchTestFailed = 4,
    PathNotFound = 5,
    RecordNotFound = 6,
    ResolutionFailed = 7,
    Storage = 8,
    InvalidRecord = 9,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownOperator: return "UnknownOperatorError";
        case ErrorKind::TypeMismatch: return "TypeMismatchError";
        case ErrorKind::MalformedExpression: return "MalformedExpressionError";
        case ErrorKind::InvalidPatchSyntax: return "InvalidPatchSyntaxError";
        case ErrorKind::PatchTestFailed: return "PatchTestFailedError";
        case ErrorKind::PathNotFound: return "PathNotFoundError";
        case ErrorKind::RecordNotFound: return "RecordNotFoundError";
        case ErrorKind::ResolutionFailed: return "ResolutionFailedError";
        case ErrorKind::Storage: return "StorageError";
        case ErrorKind::InvalidRecord: return "InvalidRecordError";
    }
    return "Error";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    const char* kind_name() const { return to_string(kind_); }

private:
    ErrorKind kind_;
};

// Expression errors

class UnknownOperatorError : public Error {
public:
    explicit UnknownOperatorError(const std::string& op)
        : Error(ErrorKind::UnknownOperator, "Unrecognized operation " + op), op_(op) {}

    const std::string& op() const { return op_; }

private:
    std::string op_;
};

class TypeMismatchError : public Error {
public:
    explicit TypeMismatchError(const std::string& message)
        : Error(ErrorKind::TypeMismatch, message) {}
};

class MalformedExpressionError : public Error {
public:
    explicit MalformedExpressionError(const std::string& message)
        : Error(ErrorKind::MalformedExpression, message) {}
};

// Patch errors

class InvalidPatchSyntaxError : public Error {
public:
    explicit InvalidPatchSyntaxError(const std::string& message)
        : Error(ErrorKind::InvalidPatchSyntax, message) {}
};

class PatchTestFailedError : public Error {
public:
    PatchTestFailedError(size_t index, const std::string& path)
        : Error(ErrorKind::PatchTestFailed,
                "Test operation " + std::to_string(index) + " failed at " + path),
          index_(index) {}

    size_t index() const { return index_; }

private:
    size_t index_;
};

class PathNotFoundError : public Error {
public:
    PathNotFoundError(size_t index, const std::string& path, const std::string& detail = "")
        : Error(ErrorKind::PathNotFound,
                "Operation " + std::to_string(index) + ": path " + path + " not found" +
                (detail.empty() ? "" : " (" + detail + ")")),
          index_(index) {}

    size_t index() const { return index_; }

private:
    size_t index_;
};

// Lookup and resolution errors

class RecordNotFoundError : public Error {
public:
    explicit RecordNotFoundError(const std::string& message)
        : Error(ErrorKind::RecordNotFound, message) {}
};

class ResolutionFailedError : public Error {
public:
    explicit ResolutionFailedError(const std::string& message)
        : Error(ErrorKind::ResolutionFailed, message) {}
};

class StorageError : public Error {
public:
    explicit StorageError(const std::string& message)
        : Error(ErrorKind::Storage, message) {}
};

class InvalidRecordError : public Error {
public:
    explicit InvalidRecordError(const std::string& message)
        : Error(ErrorKind::InvalidRecord, message) {}
};

} // namespace sigil
