#include "patchgrade_harness/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using patchgrade::harness::ErrorKind;
using patchgrade::harness::RunResult;
using patchgrade::harness::TransitionRecord;
using patchgrade::harness::Verdict;

double seconds_of(const RunResult& result) {
    return static_cast<double>(result.elapsed.count()) / 1000.0;
}

json result_to_json(const RunResult& result) {
    json tests = json::object();
    for (const auto& [id, outcome] : result.tests) {
        tests[id] = std::string{to_string(outcome)};
    }

    return json{
        {"instance_id", result.instance_id},
        {"verdict", std::string{to_string(result.verdict)}},
        {"error", std::string{to_string(result.error)}},
        {"elapsed_seconds", seconds_of(result)},
        {"tests", std::move(tests)},
        {"stale_expectations", result.stale_expectations},
        {"log_excerpt", result.log_excerpt},
    };
}

json build_summary(const std::string& run_id, const std::vector<RunResult>& results) {
    json summary = {
        {"run_id", run_id},
        {"total", results.size()},
        {"resolved", 0},
        {"unresolved", 0},
        {"errors", 0},
        {"resolved_instances", json::object()},
        {"unresolved_instances", json::object()},
        {"error_instances", json::object()},
        {"instances", json::array()},
    };

    std::size_t resolved = 0, unresolved = 0, errors = 0;
    for (const auto& result : results) {
        summary["instances"].push_back(result_to_json(result));
        switch (result.verdict) {
            case Verdict::Resolved:
                ++resolved;
                summary["resolved_instances"][result.instance_id] = seconds_of(result);
                break;
            case Verdict::Unresolved:
                ++unresolved;
                summary["unresolved_instances"][result.instance_id] = seconds_of(result);
                break;
            case Verdict::Error:
                ++errors;
                summary["error_instances"][result.instance_id] = std::string{to_string(result.error)};
                break;
        }
    }
    summary["resolved"] = resolved;
    summary["unresolved"] = unresolved;
    summary["errors"] = errors;
    return summary;
}

json transition_to_json(const TransitionRecord& record) {
    if (record.error) {
        return json{{"error", *record.error}};
    }
    return json{
        {"f2p", record.fail_to_pass},
        {"p2p", record.pass_to_pass},
        {"f2f", record.fail_to_fail},
        {"p2f", record.pass_to_fail},
    };
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string tests_to_html(const RunResult& result) {
    if (result.tests.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "<ul>";
    for (const auto& [id, outcome] : result.tests) {
        const std::string name{to_string(outcome)};
        oss << "<li class=\"test-" << name << "\">" << escape_html(id) << ": " << name << "</li>";
    }
    oss << "</ul>";
    return oss.str();
}

std::string render_html(const std::string& run_id, const std::vector<RunResult>& results) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>patchgrade evaluation report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "pre{white-space:pre-wrap;max-height:20rem;overflow:auto;margin:0;}"
        << ".verdict-RESOLVED{color:#0a7c2f;font-weight:bold;}"
        << ".verdict-UNRESOLVED{color:#c1121f;font-weight:bold;}"
        << ".verdict-ERROR{color:#b000b5;font-weight:bold;}"
        << ".test-failed,.test-error{color:#c1121f;}"
        << ".test-not-run{color:#7a7a7a;}"
        << "</style></head><body>";

    oss << "<h1>patchgrade evaluation report</h1>";
    if (!run_id.empty()) {
        oss << "<p>Run: " << escape_html(run_id) << "</p>";
    }

    std::map<std::string, std::size_t> counts;
    for (const auto& result : results) {
        ++counts[std::string{to_string(result.verdict)}];
    }

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Total instances: " << results.size() << "</li>";
    for (const auto& [verdict, count] : counts) {
        oss << "<li>" << escape_html(verdict) << ": " << count << "</li>";
    }
    oss << "</ul></section>";

    oss << "<section><h2>Instances</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>Instance</th>"
        << "<th>Verdict</th>"
        << "<th>Error</th>"
        << "<th>Seconds</th>"
        << "<th>Tests</th>"
        << "<th>Log excerpt</th>"
        << "</tr></thead><tbody>";

    for (std::size_t index = 0; index < results.size(); ++index) {
        const auto& result = results[index];
        const std::string verdict{to_string(result.verdict)};

        oss << "<tr>";
        oss << "<td>" << (index + 1) << "</td>";
        oss << "<td>" << escape_html(result.instance_id) << "</td>";
        oss << "<td class=\"verdict-" << verdict << "\">" << verdict << "</td>";
        oss << "<td>" << (result.error == ErrorKind::None ? "" : std::string{to_string(result.error)}) << "</td>";
        oss << "<td>" << seconds_of(result) << "</td>";
        oss << "<td>" << tests_to_html(result) << "</td>";
        oss << "<td><pre>" << escape_html(result.log_excerpt) << "</pre></td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
    if (!output) {
        throw std::runtime_error("Unable to write output file: " + destination.string());
    }
}

}  // namespace

namespace patchgrade::harness {

ReportWriter::ReportWriter(std::string run_id) : run_id_{std::move(run_id)} {}

void ReportWriter::write_summary(const std::filesystem::path& destination,
                                 const std::vector<RunResult>& results) const {
    const json summary = build_summary(run_id_, results);
    write_file(destination, summary.dump(2));
}

void ReportWriter::write_detailed(const std::filesystem::path& destination,
                                  const std::vector<RunResult>& results) const {
    write_file(destination, render_html(run_id_, results));
}

void ReportWriter::write_transitions(const std::filesystem::path& destination,
                                     const std::vector<TransitionRecord>& records) const {
    json report = json::object();
    for (const auto& record : records) {
        report[record.instance_id] = transition_to_json(record);
    }
    write_file(destination, report.dump(2));
}

std::size_t ReportWriter::write_produced_dataset(const std::filesystem::path& destination,
                                                 const std::map<std::string, std::string>& raw_records,
                                                 const std::vector<TransitionRecord>& records,
                                                 bool only_with_fail_to_pass) const {
    std::string out;
    std::size_t written = 0;
    for (const auto& record : records) {
        if (record.error) {
            continue;
        }
        if (only_with_fail_to_pass && record.fail_to_pass.empty()) {
            continue;
        }
        const auto raw = raw_records.find(record.instance_id);
        if (raw == raw_records.end()) {
            continue;
        }
        json line = json::parse(raw->second);
        line["FAIL_TO_PASS"] = record.fail_to_pass;
        line["PASS_TO_PASS"] = record.pass_to_pass;
        line["FAIL_TO_FAIL"] = record.fail_to_fail;
        out += line.dump();
        out += '\n';
        ++written;
    }
    write_file(destination, out);
    return written;
}

std::size_t ReportWriter::write_resolved_dataset(const std::filesystem::path& destination,
                                                 const std::map<std::string, std::string>& raw_records,
                                                 const std::vector<RunResult>& results) const {
    std::string out;
    std::size_t written = 0;
    for (const auto& result : results) {
        if (result.verdict != Verdict::Resolved) {
            continue;
        }
        const auto raw = raw_records.find(result.instance_id);
        if (raw == raw_records.end()) {
            continue;
        }
        out += raw->second;
        if (out.empty() || out.back() != '\n') {
            out += '\n';
        }
        ++written;
    }
    write_file(destination, out);
    return written;
}

}  // namespace patchgrade::harness
