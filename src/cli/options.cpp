#include "options.hpp"

#include <limits>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace cli {
    namespace {
        struct Flags {
            static constexpr const char* LINE = "--line";
            static constexpr const char* ENV = "--env";
            static constexpr const char* ENV_FILE = "--env-file";
            static constexpr const char* TIMEOUT_MS = "--timeout-ms";
            static constexpr const char* MAX_REDIRECTS = "--max-redirects";
            static constexpr const char* NO_REDIRECTS = "--no-redirects";
            static constexpr const char* VERBOSE = "--verbose";
            static constexpr const char* HELP = "--help";
        };

        const std::string& next_value(const std::vector<std::string>& args, size_t& i, const std::string& flag) {
            if (i + 1 >= args.size()) {
                throw UsageError(flag + " expects a value");
            }
            return args[++i];
        }

        long parse_number(const std::string& text, const std::string& flag, long min) {
            const auto parsed = string_utils::parse_integer(text);
            if (!parsed || *parsed < min || *parsed > std::numeric_limits<long>::max()) {
                throw UsageError(flag + " expects an integer >= " + std::to_string(min) + ", got '" + text + "'");
            }
            return static_cast<long>(*parsed);
        }
    }  // namespace

    CliOptions parse_arguments(const std::vector<std::string>& args) {
        CliOptions options;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == Flags::HELP || arg == "-h") {
                options.help_ = true;
            } else if (arg == Flags::LINE) {
                const long line = parse_number(next_value(args, i, arg), arg, 1);
                if (line > std::numeric_limits<int>::max()) {
                    throw UsageError("--line is out of range");
                }
                options.line_ = static_cast<int>(line);
            } else if (arg == Flags::ENV) {
                options.environment_ = next_value(args, i, arg);
            } else if (arg == Flags::ENV_FILE) {
                options.env_file_ = next_value(args, i, arg);
            } else if (arg == Flags::TIMEOUT_MS) {
                options.timeout_ms_ = parse_number(next_value(args, i, arg), arg, 1);
            } else if (arg == Flags::MAX_REDIRECTS) {
                options.max_redirects_ = parse_number(next_value(args, i, arg), arg, 0);
            } else if (arg == Flags::NO_REDIRECTS) {
                options.no_redirects_ = true;
            } else if (arg == Flags::VERBOSE || arg == "-v") {
                options.verbose_ = true;
            } else if (arg.starts_with("-")) {
                throw UsageError("Unknown option " + arg);
            } else if (options.file_path_.empty()) {
                options.file_path_ = arg;
            } else {
                throw UsageError("Unexpected argument " + arg);
            }
        }

        if (options.help_) {
            return options;
        }
        if (options.file_path_.empty()) {
            throw UsageError("No .http file given");
        }

        return options;
    }

    std::optional<std::filesystem::path> environment_file_for(const CliOptions& options) {
        if (options.env_file_) {
            return options.env_file_;
        }

        std::filesystem::path candidate = options.file_path_.parent_path() / constants::ENVIRONMENT_FILE_NAME;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
        return std::nullopt;
    }

    courier::ExecutionConfig apply_cli_overrides(courier::ExecutionConfig config, const CliOptions& options) {
        if (options.timeout_ms_) {
            config.timeout_ = std::chrono::milliseconds{*options.timeout_ms_};
        }
        if (options.max_redirects_) {
            config.max_redirects_ = *options.max_redirects_;
        }
        if (options.no_redirects_) {
            config.follow_redirects_ = false;
        }
        return config;
    }

    std::string usage() {
        return "usage: courier <file.http> [--line N] [--env NAME] [--env-file PATH] [--timeout-ms N]\n"
               "                      [--max-redirects N] [--no-redirects] [--verbose]\n";
    }
}  // namespace cli
