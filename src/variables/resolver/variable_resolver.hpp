#ifndef COURIER_VARIABLE_RESOLVER_HPP
#define COURIER_VARIABLE_RESOLVER_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../../document/model/model.hpp"
#include "../../utils/constants.hpp"

namespace variables {
    using document::model::VariableMap;

    // Resolves {{name}} placeholders. Precedence: built-in generators ($-prefixed), request-local
    // variables, file variables, then the selected environment. Unknown names pass through.
    class VariableResolver {
       public:
        VariableResolver() = default;

        ~VariableResolver() = default;
        VariableResolver(const VariableResolver&) = delete;
        VariableResolver& operator=(const VariableResolver&) = delete;
        VariableResolver(VariableResolver&&) = delete;
        VariableResolver& operator=(VariableResolver&&) = delete;

        // Replaces every environment and every set_variable() value. A missing or malformed
        // document leaves the environment empty.
        void load_environment(const std::filesystem::path& path);
        void load_environment_json(std::string_view json);

        void set_environment(std::string_view name);
        void set_variable(const std::string& name, const std::string& value);

        [[nodiscard]] std::string current_environment() const;
        [[nodiscard]] std::vector<std::string> environment_names() const;
        [[nodiscard]] std::optional<std::string> lookup_environment(std::string_view name) const;

        [[nodiscard]] std::string resolve(std::string_view input) const;
        [[nodiscard]] std::string resolve(std::string_view input, const VariableMap& local_variables, const VariableMap& file_variables) const;

       private:
        void clear_environment_locked();
        [[nodiscard]] std::optional<std::string> lookup_environment_locked(std::string_view name) const;

        mutable std::shared_mutex mutex_;
        std::map<std::string, VariableMap> environments_;
        VariableMap shared_;
        VariableMap overrides_;
        std::string current_environment_ = constants::DEFAULT_ENVIRONMENT;
    };
}  // namespace variables

#endif
