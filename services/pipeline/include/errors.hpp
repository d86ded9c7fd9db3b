#pragma once
#include <stdexcept>
#include <string>

enum class FailureKind { Transient, Fatal, Integrity };

const char* to_string(FailureKind kind);

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad job descriptor; the job is never created.
class ValidationError : public PipelineError {
public:
    explicit ValidationError(const std::string& msg) : PipelineError(msg) {}
};

class NotFound : public PipelineError {
public:
    explicit NotFound(const std::string& msg) : PipelineError(msg) {}
};

class InvalidTransition : public PipelineError {
public:
    explicit InvalidTransition(const std::string& msg) : PipelineError(msg) {}
};

// Another worker already holds the job.
class ClaimConflict : public InvalidTransition {
public:
    explicit ClaimConflict(const std::string& msg) : InvalidTransition(msg) {}
};

// A broken internal invariant, such as two workers holding the same job.
// Never handled; the worker that sees it terminates the process.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& msg) : std::logic_error(msg) {}
};

// A stage (fetch, transfer, verify) failed. `detail` is a JSON object string.
class StageFailure : public PipelineError {
public:
    StageFailure(FailureKind kind, const std::string& msg, std::string detail = {})
        : PipelineError(msg), kind_(kind), detail_(std::move(detail)) {}
    FailureKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    FailureKind kind_;
    std::string detail_;
};

class TransientFailure : public StageFailure {
public:
    explicit TransientFailure(const std::string& msg, std::string detail = {})
        : StageFailure(FailureKind::Transient, msg, std::move(detail)) {}
};

class FatalFailure : public StageFailure {
public:
    explicit FatalFailure(const std::string& msg, std::string detail = {})
        : StageFailure(FailureKind::Fatal, msg, std::move(detail)) {}
};

class IntegrityMismatch : public StageFailure {
public:
    IntegrityMismatch(const std::string& expected, const std::string& actual);
};

// Raised by transfer backends. Connection, auth and mid-transfer drops all
// surface here; the backend decides whether a retry can help.
class TransferError : public StageFailure {
public:
    TransferError(const std::string& msg, bool retryable, std::string detail = {})
        : StageFailure(retryable ? FailureKind::Transient : FailureKind::Fatal, msg, std::move(detail)),
          retryable_(retryable) {}
    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};

// The worker observed a cancel or pause request and stopped.
class JobAborted : public PipelineError {
public:
    explicit JobAborted(const std::string& msg) : PipelineError(msg) {}
};
