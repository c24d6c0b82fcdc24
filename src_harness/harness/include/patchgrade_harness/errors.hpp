#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "model.hpp"

namespace patchgrade::harness {

/**
 * \brief Root of the harness error taxonomy.
 *
 * Every error raised while building or executing one instance derives from
 * this type; the instance runner maps kind() onto RunResult::error.
 */
class HarnessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    [[nodiscard]] virtual ErrorKind kind() const noexcept = 0;
};

/// Malformed or ambiguous EnvironmentSpec / Instance.
class InvalidSpecError : public HarnessError {
public:
    using HarnessError::HarnessError;

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::InvalidSpec; }
};

/// A build stage's commands exited non-zero (or never finished).
class BuildError : public HarnessError {
public:
    BuildError(std::string stage, int exit_code, std::string log_excerpt);

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::Build; }

    [[nodiscard]] const std::string& stage() const noexcept { return stage_; }
    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] const std::string& log_excerpt() const noexcept { return log_excerpt_; }

private:
    std::string stage_;
    int exit_code_;
    std::string log_excerpt_;
};

/// The candidate (or test) patch did not apply cleanly.
class PatchApplyError : public HarnessError {
public:
    PatchApplyError(std::size_t patch_index, int exit_code, std::string log_excerpt);

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::PatchApply; }

    [[nodiscard]] std::size_t patch_index() const noexcept { return patch_index_; }
    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] const std::string& log_excerpt() const noexcept { return log_excerpt_; }

private:
    std::size_t patch_index_;
    int exit_code_;
    std::string log_excerpt_;
};

/// The run exceeded its wall-clock budget. Partial output is kept for diagnostics.
class TimeoutError : public HarnessError {
public:
    TimeoutError(std::chrono::milliseconds timeout, std::string partial_stdout, std::string partial_stderr);

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::Timeout; }

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }
    [[nodiscard]] const std::string& partial_stdout() const noexcept { return partial_stdout_; }
    [[nodiscard]] const std::string& partial_stderr() const noexcept { return partial_stderr_; }

private:
    std::chrono::milliseconds timeout_;
    std::string partial_stdout_;
    std::string partial_stderr_;
};

/// Registry push/pull failure. Never fatal for an instance.
class RegistryError : public HarnessError {
public:
    RegistryError(const std::string& message, bool auth_failure);

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::Internal; }

    [[nodiscard]] bool auth_failure() const noexcept { return auth_failure_; }

private:
    bool auth_failure_;
};

/// Unexpected container-runtime failure.
class InternalError : public HarnessError {
public:
    using HarnessError::HarnessError;

    [[nodiscard]] ErrorKind kind() const noexcept override { return ErrorKind::Internal; }
};

}  // namespace patchgrade::harness
