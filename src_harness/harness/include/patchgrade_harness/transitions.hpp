#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model.hpp"

namespace patchgrade::harness {

/**
 * \brief Produce-mode labels of one instance.
 *
 * Lists are sorted. `error` is set (and the lists are empty) when the round
 * with the reference patch could not be evaluated.
 */
struct TransitionRecord {
    std::string instance_id;
    std::vector<std::string> fail_to_pass;
    std::vector<std::string> pass_to_pass;
    std::vector<std::string> fail_to_fail;
    std::vector<std::string> pass_to_fail;
    std::optional<std::string> error{};
};

/**
 * \brief Compares a run without the reference patch (`before`) with a run that has it (`after`).
 *
 * Passing means `passed`; failing means `failed` or `error`; tests that were
 * not run count as neither. When `before` itself errored, every test passing
 * after is FAIL_TO_PASS and every test failing after is FAIL_TO_FAIL.
 */
[[nodiscard]] TransitionRecord classify_transitions(const RunResult& before, const RunResult& after);

/**
 * \brief Test files a patch adds or modifies.
 *
 * Recognised names: `test_*.py`, `tests_*.py`, `*_test.py`, `*_tests.py`,
 * `test.py`, `tests.py`. Deleted files and files listed in the
 * whitespace-separated `black_list` are skipped. Sorted, without duplicates.
 */
[[nodiscard]] std::vector<std::string> extract_modified_test_files(std::string_view test_patch,
                                                                   std::string_view black_list = {});

}  // namespace patchgrade::harness
