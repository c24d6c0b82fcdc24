#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model.hpp"
#include "scheduler.hpp"

namespace patchgrade::harness {

/**
 * \brief Instances read from one dataset file.
 *
 * `raw_records` keeps each source line verbatim (by instance id) so that
 * produce mode can write the dataset back with updated expectations.
 * `inline_specs` holds the `spec_dict` objects embedded in instance records.
 */
struct Dataset {
    std::string source_file;
    std::vector<Instance> instances;
    std::map<std::string, std::string> raw_records;
    std::map<std::string, EnvironmentSpec> inline_specs;
    std::vector<std::string> warnings;
};

/**
 * \brief Environment specs from one document.
 *
 * A document holding a single spec (it has `test_cmd`) applies to every
 * instance; otherwise it maps version tags to specs.
 */
struct EnvironmentCatalog {
    std::optional<EnvironmentSpec> shared{};
    std::map<std::string, EnvironmentSpec> by_version;
    std::vector<std::string> warnings;

    /// Spec for `version_tag`, nullptr when the catalog has none.
    [[nodiscard]] const EnvironmentSpec* find(const std::string& version_tag) const;
};

/**
 * \brief Reads datasets, environment specs and predictions.
 *
 * Dataset and prediction files are JSON Lines; blank lines are ignored. Each
 * instance record carries `instance_id`, `repo`, `base_commit`, `patch`,
 * `test_patch`, `FAIL_TO_PASS`, `PASS_TO_PASS` and optionally `FAIL_TO_FAIL`,
 * `version`, `timeout` and `spec_dict`. Test lists may be JSON arrays or
 * strings holding a JSON-encoded array.
 *
 * Environment spec fields: `python`, `pre_install`, `install`, `packages`
 * (whitespace separated string or list), `pip_packages`, `requirements_lock`
 * (file path, relative to the spec document) or `frozen_requirements` (inline
 * manifest text), `eval_commands`, `test_cmd`.
 *
 * Every error is a std::runtime_error naming `file:line`.
 */
class DatasetLoader {
public:
    DatasetLoader() = default;

    [[nodiscard]] Dataset load_instances(const std::filesystem::path& file) const;

    [[nodiscard]] EnvironmentCatalog load_environment_specs(const std::filesystem::path& file) const;

    /// `instance_id` → `model_patch`.
    [[nodiscard]] std::map<std::string, std::string> load_predictions(const std::filesystem::path& file) const;
};

/**
 * \brief Pairs instances with their environment and candidate patch.
 *
 * Spec precedence: inline `spec_dict`, then the catalog's shared spec, then
 * the catalog entry for the instance's version tag. `instance_ids` (when not
 * empty) restricts and orders the selection; unknown ids are an error, as is
 * an instance without any spec. A prediction replaces the dataset patch.
 */
[[nodiscard]] std::vector<InstanceJob> assemble_jobs(const Dataset& dataset,
                                                     const EnvironmentCatalog& catalog,
                                                     const std::map<std::string, std::string>& predictions,
                                                     const std::vector<std::string>& instance_ids = {});

}  // namespace patchgrade::harness
