#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "model.hpp"
#include "transitions.hpp"

namespace patchgrade::harness {

/**
 * \brief Emits machine-readable and human-friendly reports for evaluation runs.
 *
 * - write_summary(): JSON document with aggregate counts, per-verdict indexes and per-instance records.
 * - write_detailed(): HTML report with a tabular view of the results.
 * - write_transitions(): produce-mode labels, keyed by instance id.
 * - write_produced_dataset(): the input dataset with FAIL_TO_PASS / PASS_TO_PASS / FAIL_TO_FAIL replaced.
 * - write_resolved_dataset(): the input records of the RESOLVED instances, unchanged.
 */
class ReportWriter {
public:
    ReportWriter() = default;
    explicit ReportWriter(std::string run_id);

    void write_summary(const std::filesystem::path& destination, const std::vector<RunResult>& results) const;

    void write_detailed(const std::filesystem::path& destination, const std::vector<RunResult>& results) const;

    void write_transitions(const std::filesystem::path& destination,
                           const std::vector<TransitionRecord>& records) const;

    /// Returns the number of records written. `only_with_fail_to_pass` drops instances without any FAIL_TO_PASS test.
    std::size_t write_produced_dataset(const std::filesystem::path& destination,
                                       const std::map<std::string, std::string>& raw_records,
                                       const std::vector<TransitionRecord>& records,
                                       bool only_with_fail_to_pass) const;

    /// Returns the number of records written, in result order.
    std::size_t write_resolved_dataset(const std::filesystem::path& destination,
                                       const std::map<std::string, std::string>& raw_records,
                                       const std::vector<RunResult>& results) const;

private:
    std::string run_id_;
};

}  // namespace patchgrade::harness
