#ifndef COURIER_CLI_OPTIONS_HPP
#define COURIER_CLI_OPTIONS_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../courier/config/execution_config.hpp"

namespace cli {
    struct UsageError : public std::runtime_error {
        explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
    };

    struct CliOptions {
        std::filesystem::path file_path_;
        std::optional<int> line_;
        std::optional<std::string> environment_;
        std::optional<std::filesystem::path> env_file_;
        std::optional<long> timeout_ms_;
        std::optional<long> max_redirects_;
        bool no_redirects_ = false;
        bool verbose_ = false;
        bool help_ = false;
    };

    // `args` excludes the program name. Throws UsageError on anything it cannot make sense of.
    CliOptions parse_arguments(const std::vector<std::string>& args);

    // http-client.env.json next to the document unless --env-file names one.
    std::optional<std::filesystem::path> environment_file_for(const CliOptions& options);

    courier::ExecutionConfig apply_cli_overrides(courier::ExecutionConfig config, const CliOptions& options);

    std::string usage();
}  // namespace cli

#endif
