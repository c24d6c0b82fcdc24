#include "patchgrade_harness/errors.hpp"

#include <string>
#include <utility>

namespace patchgrade::harness {

BuildError::BuildError(std::string stage, int exit_code, std::string log_excerpt)
    : HarnessError("build stage '" + stage + "' failed with exit code " + std::to_string(exit_code)),
      stage_{std::move(stage)},
      exit_code_{exit_code},
      log_excerpt_{std::move(log_excerpt)} {}

PatchApplyError::PatchApplyError(std::size_t patch_index, int exit_code, std::string log_excerpt)
    : HarnessError("patch #" + std::to_string(patch_index) + " did not apply (exit code " +
                   std::to_string(exit_code) + ")"),
      patch_index_{patch_index},
      exit_code_{exit_code},
      log_excerpt_{std::move(log_excerpt)} {}

TimeoutError::TimeoutError(std::chrono::milliseconds timeout, std::string partial_stdout,
                           std::string partial_stderr)
    : HarnessError("container timed out after " + std::to_string(timeout.count() / 1000) + " seconds"),
      timeout_{timeout},
      partial_stdout_{std::move(partial_stdout)},
      partial_stderr_{std::move(partial_stderr)} {}

RegistryError::RegistryError(const std::string& message, bool auth_failure)
    : HarnessError(message), auth_failure_{auth_failure} {}

}  // namespace patchgrade::harness
