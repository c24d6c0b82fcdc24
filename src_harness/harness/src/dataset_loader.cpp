#include "patchgrade_harness/dataset_loader.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

namespace fs = std::filesystem;
using nlohmann::json;
using patchgrade::harness::DependencyManifest;
using patchgrade::harness::EnvironmentSpec;
using patchgrade::harness::Instance;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string location(const fs::path& file, std::size_t line_no) {
    return file.string() + ":" + std::to_string(line_no);
}

std::string read_text(const fs::path& file, const std::string& what) {
    if (!fs::exists(file)) {
        throw std::runtime_error(what + " does not exist: " + file.string());
    }
    if (!fs::is_regular_file(file)) {
        throw std::runtime_error(what + " is not a regular file: " + file.string());
    }
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open " + what + ": " + file.string());
    }
    return std::string{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

// Calls `on_record(object, raw_line, line_no)` for every non-blank line of a JSON Lines file.
template <typename Fn>
void for_each_record(const fs::path& file, const std::string& what, Fn&& on_record) {
    std::istringstream input(read_text(file, what));
    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;
        if (trim_copy(raw_line).empty()) {
            continue;
        }
        json record;
        try {
            record = json::parse(raw_line);
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Invalid JSON at " + location(file, line_no) + ": " + e.what());
        }
        if (!record.is_object()) {
            throw std::runtime_error("Expected a JSON object at " + location(file, line_no));
        }
        try {
            on_record(record, raw_line, line_no);
        } catch (const json::exception& e) {
            throw std::runtime_error("Malformed record at " + location(file, line_no) + ": " + e.what());
        }
    }
}

const json& field_or_null(const json& record, const char* key) {
    static const json null_value;
    const auto it = record.find(key);
    return it == record.end() ? null_value : *it;
}

std::string require_string(const json& record, const char* key, const std::string& where) {
    const auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        throw std::runtime_error(std::string{"Missing string field '"} + key + "' at " + where);
    }
    return it->get<std::string>();
}

std::string optional_string(const json& record, const char* key) {
    const auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return {};
    }
    return it->get<std::string>();
}

// Version tags and runtime versions are sometimes written as numbers (3.9).
std::string scalar_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw std::runtime_error("expected a string or a number, got " + std::string{value.type_name()});
}

std::vector<std::string> string_list(const json& value, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (value.is_null()) {
        return out;
    }
    if (value.is_string()) {
        out.push_back(value.get<std::string>());
        return out;
    }
    if (!value.is_array()) {
        throw std::runtime_error(std::string{"Field '"} + key + "' must be a string or a list at " + where);
    }
    for (const auto& item : value) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream input(text);
    std::vector<std::string> out;
    std::string word;
    while (input >> word) {
        out.push_back(word);
    }
    return out;
}

// FAIL_TO_PASS and friends: a list, or a string holding a JSON-encoded list.
std::vector<std::string> test_list(const json& record, const char* key, const std::string& where) {
    const auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return {};
    }
    if (it->is_array()) {
        return it->get<std::vector<std::string>>();
    }
    if (it->is_string()) {
        const auto text = trim_copy(it->get<std::string>());
        if (text.empty()) {
            return {};
        }
        json decoded;
        try {
            decoded = json::parse(text);
        } catch (const json::parse_error&) {
            throw std::runtime_error(std::string{"Field '"} + key + "' is not a JSON-encoded list at " + where);
        }
        if (!decoded.is_array()) {
            throw std::runtime_error(std::string{"Field '"} + key + "' is not a JSON-encoded list at " + where);
        }
        return decoded.get<std::vector<std::string>>();
    }
    throw std::runtime_error(std::string{"Field '"} + key + "' must be a list at " + where);
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += separator;
        out += part;
    }
    return out;
}

EnvironmentSpec parse_spec(const json& doc,
                           const std::string& version_tag,
                           const fs::path& base_dir,
                           const std::string& where,
                           std::vector<std::string>& warnings) {
    if (!doc.is_object()) {
        throw std::runtime_error("Environment spec '" + version_tag + "' is not an object at " + where);
    }

    EnvironmentSpec spec;
    spec.version_tag = version_tag;
    if (const auto it = doc.find("python"); it != doc.end() && !it->is_null()) {
        spec.runtime_version = scalar_text(*it);
    }
    spec.pre_install = string_list(field_or_null(doc, "pre_install"), "pre_install", where);
    if (const auto it = doc.find("install"); it != doc.end() && !it->is_null()) {
        spec.install = it->is_array() ? join(it->get<std::vector<std::string>>(), " && ") : it->get<std::string>();
    }

    spec.packages = string_list(field_or_null(doc, "pip_packages"), "pip_packages", where);
    if (const auto it = doc.find("packages"); it != doc.end() && !it->is_null()) {
        const auto extra = it->is_string() ? split_words(it->get<std::string>())
                                           : string_list(*it, "packages", where);
        spec.packages.insert(spec.packages.end(), extra.begin(), extra.end());
    }

    const bool has_lock = doc.contains("requirements_lock") && !doc.at("requirements_lock").is_null();
    const bool has_frozen = doc.contains("frozen_requirements") && !doc.at("frozen_requirements").is_null();
    if (has_lock && has_frozen) {
        throw std::runtime_error("Environment spec '" + version_tag +
                                 "' sets both requirements_lock and frozen_requirements at " + where);
    }
    if (has_lock) {
        fs::path lock = doc.at("requirements_lock").get<std::string>();
        if (lock.is_relative()) {
            lock = base_dir / lock;
        }
        DependencyManifest manifest;
        manifest.name = lock.filename().string();
        manifest.content = read_text(lock, "requirements lock file");
        spec.frozen_manifest = std::move(manifest);
    } else if (has_frozen) {
        DependencyManifest manifest;
        manifest.content = doc.at("frozen_requirements").get<std::string>();
        spec.frozen_manifest = std::move(manifest);
    }

    spec.eval_commands = string_list(field_or_null(doc, "eval_commands"), "eval_commands", where);
    spec.test_cmd = optional_string(doc, "test_cmd");

    for (const char* unsupported : {"execute_test_as_nonroot", "nano_cpus", "no_use_env"}) {
        if (doc.contains(unsupported)) {
            warnings.push_back("environment '" + version_tag + "': key '" + unsupported + "' is not supported");
        }
    }
    return spec;
}

}  // namespace

namespace patchgrade::harness {

const EnvironmentSpec* EnvironmentCatalog::find(const std::string& version_tag) const {
    if (shared) {
        return &*shared;
    }
    const auto it = by_version.find(version_tag);
    return it == by_version.end() ? nullptr : &it->second;
}

Dataset DatasetLoader::load_instances(const std::filesystem::path& file) const {
    Dataset dataset;
    dataset.source_file = file.string();
    const auto base_dir = file.parent_path();

    std::set<std::string> seen;
    for_each_record(file, "dataset file", [&](const json& record, const std::string& raw_line, std::size_t line_no) {
        const auto where = location(file, line_no);

        Instance instance;
        instance.id = trim_copy(require_string(record, "instance_id", where));
        if (instance.id.empty()) {
            throw std::runtime_error("Empty instance_id at " + where);
        }
        if (!seen.insert(instance.id).second) {
            throw std::runtime_error("Duplicate instance_id '" + instance.id + "' at " + where);
        }
        instance.repo = require_string(record, "repo", where);
        instance.base_commit = require_string(record, "base_commit", where);
        instance.patch = optional_string(record, "patch");
        instance.test_patch = optional_string(record, "test_patch");
        instance.expected.fail_to_pass = test_list(record, "FAIL_TO_PASS", where);
        instance.expected.pass_to_pass = test_list(record, "PASS_TO_PASS", where);
        instance.expected.fail_to_fail = test_list(record, "FAIL_TO_FAIL", where);

        if (const auto it = record.find("version"); it != record.end() && !it->is_null()) {
            instance.environment_ref = scalar_text(*it);
        }
        if (const auto it = record.find("timeout"); it != record.end() && !it->is_null()) {
            const double seconds = it->get<double>();
            if (!(seconds > 0)) {
                throw std::runtime_error("Field 'timeout' must be positive at " + where);
            }
            instance.timeout = std::chrono::seconds{static_cast<long long>(std::ceil(seconds))};
        }
        if (const auto it = record.find("spec_dict"); it != record.end() && !it->is_null()) {
            dataset.inline_specs.emplace(instance.id,
                                         parse_spec(*it, instance.environment_ref, base_dir, where, dataset.warnings));
        }

        dataset.raw_records.emplace(instance.id, raw_line);
        dataset.instances.push_back(std::move(instance));
    });
    return dataset;
}

EnvironmentCatalog DatasetLoader::load_environment_specs(const std::filesystem::path& file) const {
    const auto text = read_text(file, "environment spec file");
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + file.string() + ": " + e.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Environment spec document is not an object: " + file.string());
    }

    EnvironmentCatalog catalog;
    const auto base_dir = file.parent_path();
    try {
        if (doc.contains("test_cmd")) {
            catalog.shared = parse_spec(doc, "default", base_dir, file.string(), catalog.warnings);
        } else {
            for (const auto& item : doc.items()) {
                const std::string tag = item.key();
                catalog.by_version.emplace(tag, parse_spec(item.value(), tag, base_dir,
                                                           file.string() + " [" + tag + "]", catalog.warnings));
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed environment spec in " + file.string() + ": " + e.what());
    }
    return catalog;
}

std::map<std::string, std::string> DatasetLoader::load_predictions(const std::filesystem::path& file) const {
    std::map<std::string, std::string> predictions;
    for_each_record(file, "predictions file", [&](const json& record, const std::string&, std::size_t line_no) {
        const auto where = location(file, line_no);
        const auto id = trim_copy(require_string(record, "instance_id", where));
        const auto it = record.find("model_patch");
        if (it == record.end()) {
            throw std::runtime_error("Missing field 'model_patch' at " + where);
        }
        predictions[id] = it->is_null() ? std::string{} : it->get<std::string>();
    });
    return predictions;
}

std::vector<InstanceJob> assemble_jobs(const Dataset& dataset,
                                       const EnvironmentCatalog& catalog,
                                       const std::map<std::string, std::string>& predictions,
                                       const std::vector<std::string>& instance_ids) {
    std::vector<const Instance*> selected;
    if (instance_ids.empty()) {
        for (const auto& instance : dataset.instances) {
            selected.push_back(&instance);
        }
    } else {
        std::vector<std::string> missing;
        for (const auto& id : instance_ids) {
            const auto it = std::find_if(dataset.instances.begin(), dataset.instances.end(),
                                         [&](const Instance& i) { return i.id == id; });
            if (it == dataset.instances.end()) {
                missing.push_back(id);
            } else {
                selected.push_back(&*it);
            }
        }
        if (!missing.empty()) {
            throw std::runtime_error("Instance IDs not found in " + dataset.source_file + ": " + join(missing, " "));
        }
    }

    std::vector<InstanceJob> jobs;
    jobs.reserve(selected.size());
    for (const auto* instance : selected) {
        InstanceJob job;
        job.instance = *instance;
        if (const auto it = dataset.inline_specs.find(instance->id); it != dataset.inline_specs.end()) {
            job.environment = it->second;
        } else if (const auto* spec = catalog.find(instance->environment_ref)) {
            job.environment = *spec;
        } else {
            throw std::runtime_error("No environment spec for version '" + instance->environment_ref +
                                     "' (instance " + instance->id + ")");
        }
        if (const auto it = predictions.find(instance->id); it != predictions.end()) {
            job.instance.patch = it->second;
        }
        jobs.push_back(std::move(job));
    }
    return jobs;
}

}  // namespace patchgrade::harness
