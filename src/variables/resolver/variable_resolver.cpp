#include "variable_resolver.hpp"

#include <simdjson.h>

#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../builtins/builtin_functions.hpp"

namespace variables {
    namespace {
        VariableMap read_string_pairs(simdjson::dom::object section) {
            VariableMap out;
            for (auto field : section) {
                std::string_view value;
                if (field.value.get_string().get(value) == simdjson::SUCCESS) {
                    out[std::string(field.key)] = std::string(value);
                }
            }
            return out;
        }
    }  // namespace

    void VariableResolver::load_environment(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            logging::get_logger()->debug("Environment file {} not found", path.string());
            std::unique_lock lock(mutex_);
            clear_environment_locked();
            return;
        }

        simdjson::padded_string json;
        if (auto error = simdjson::padded_string::load(path.string()).get(json); error != simdjson::SUCCESS) {
            logging::get_logger()->warn("Could not read environment file {}: {}", path.string(), simdjson::error_message(error));
            std::unique_lock lock(mutex_);
            clear_environment_locked();
            return;
        }

        load_environment_json(std::string_view(json.data(), json.size()));
    }

    void VariableResolver::load_environment_json(std::string_view json) {
        std::unique_lock lock(mutex_);
        clear_environment_locked();

        simdjson::dom::parser parser;
        const simdjson::padded_string padded(json);
        simdjson::dom::object root;
        if (auto error = parser.parse(padded).get_object().get(root); error != simdjson::SUCCESS) {
            logging::get_logger()->warn("Ignoring environment document: {}", simdjson::error_message(error));
            return;
        }

        for (auto field : root) {
            simdjson::dom::object section;
            if (field.value.get_object().get(section) != simdjson::SUCCESS) {
                continue;
            }

            if (field.key == constants::SHARED_ENVIRONMENT) {
                shared_ = read_string_pairs(section);
            } else {
                environments_[std::string(field.key)] = read_string_pairs(section);
            }
        }

        logging::get_logger()->debug("Loaded {} environment(s), shared section {}", environments_.size(), shared_.empty() ? "absent" : "present");
    }

    void VariableResolver::set_environment(std::string_view name) {
        std::unique_lock lock(mutex_);
        current_environment_ = name.empty() ? std::string(constants::DEFAULT_ENVIRONMENT) : std::string(name);
    }

    void VariableResolver::set_variable(const std::string& name, const std::string& value) {
        std::unique_lock lock(mutex_);
        overrides_[name] = value;
    }

    std::string VariableResolver::current_environment() const {
        std::shared_lock lock(mutex_);
        return current_environment_;
    }

    std::vector<std::string> VariableResolver::environment_names() const {
        std::shared_lock lock(mutex_);

        std::vector<std::string> names;
        names.reserve(environments_.size());
        for (const auto& [name, _] : environments_) {
            names.push_back(name);
        }
        return names;
    }

    std::optional<std::string> VariableResolver::lookup_environment(std::string_view name) const {
        std::shared_lock lock(mutex_);
        return lookup_environment_locked(name);
    }

    std::string VariableResolver::resolve(std::string_view input) const {
        static const VariableMap empty;
        return resolve(input, empty, empty);
    }

    std::string VariableResolver::resolve(std::string_view input, const VariableMap& local_variables, const VariableMap& file_variables) const {
        if (input.empty()) {
            return {};
        }

        std::shared_lock lock(mutex_);

        return string_utils::replace_placeholders(input, [&](std::string_view inner, std::string_view whole) -> std::optional<std::string> {
            const std::string_view name = string_utils::trim_view(inner);

            if (builtins::is_builtin(name)) {
                if (auto value = builtins::evaluate(name)) {
                    return value;
                }
                return std::string(whole);
            }

            if (auto it = local_variables.find(name); it != local_variables.end()) {
                return it->second;
            }
            if (auto it = file_variables.find(name); it != file_variables.end()) {
                return it->second;
            }
            if (auto value = lookup_environment_locked(name)) {
                return value;
            }

            return std::string(whole);
        });
    }

    void VariableResolver::clear_environment_locked() {
        environments_.clear();
        shared_.clear();
        overrides_.clear();
    }

    std::optional<std::string> VariableResolver::lookup_environment_locked(std::string_view name) const {
        if (auto it = overrides_.find(name); it != overrides_.end()) {
            return it->second;
        }

        if (auto env = environments_.find(current_environment_); env != environments_.end()) {
            if (auto it = env->second.find(name); it != env->second.end()) {
                return it->second;
            }
        }

        if (auto it = shared_.find(name); it != shared_.end()) {
            return it->second;
        }

        return std::nullopt;
    }
}  // namespace variables
