#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/cli/options.hpp"
#include "src/courier/config/execution_config.hpp"
#include "src/courier/executor/request_executor.hpp"
#include "src/document/parser/http_file_parser.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/client/curl_share.hpp"
#include "src/renderers/console_renderer.hpp"
#include "src/session/store/chain_session.hpp"
#include "src/utils/constants.hpp"
#include "src/utils/logging.hpp"
#include "src/variables/resolver/variable_resolver.hpp"

namespace {
    const int EXIT_USAGE = 1;
    const int EXIT_REQUEST_FAILED = 2;

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot open " + path.string());
        }
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }
}  // namespace

int main(int argc, char** argv) {
    cli::CliOptions options;
    try {
        options = cli::parse_arguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const cli::UsageError& e) {
        std::cerr << e.what() << "\n" << cli::usage();
        return EXIT_USAGE;
    }

    if (options.help_) {
        std::cout << cli::usage();
        return 0;
    }

    try {
        //
        // Collect
        //

        if (options.verbose_) {
            logging::set_level("debug");
        }

        const std::string content = read_file(options.file_path_);
        const courier::ExecutionConfig config = cli::apply_cli_overrides(courier::apply_environment_overrides(courier::ExecutionConfig{}), options);

        const document::parser::HttpFileParser parser;
        document::model::ParsedDocument document = parser.parse(content);

        std::vector<document::model::RequestDefinition> selected;
        if (options.line_) {
            auto found = parser.find_request_at(content, *options.line_);
            if (!found) {
                std::cerr << "No request at line " << *options.line_ << " in " << options.file_path_.string() << "\n";
                return EXIT_USAGE;
            }
            selected.push_back(std::move(*found));
        } else {
            selected = std::move(document.requests_);
        }

        if (selected.empty()) {
            logging::get_logger()->info("No requests in {}", options.file_path_.string());
            return 0;
        }

        //
        // Wire
        //

        http::client::CurlGlobal curl_global;
        auto curl_share = std::make_shared<http::client::CurlShare>();

        auto resolver = std::make_shared<variables::VariableResolver>();
        if (auto env_file = cli::environment_file_for(options)) {
            resolver->load_environment(*env_file);
        }
        resolver->set_environment(options.environment_.value_or(constants::DEFAULT_ENVIRONMENT));

        auto executor = courier::RequestExecutorBuilder()
                            .with_resolver(resolver)
                            .with_session(std::make_shared<session::ChainSession>())
                            .with_http_client_factory([curl_share](const http::client::ClientOptions& client_options) {
                                return std::make_unique<http::client::CurlEasy>(client_options, curl_share);
                            })
                            .with_config(config)
                            .validate()
                            .build();

        renderers::ConsoleRenderer renderer(std::cout);

        //
        // Run, in document order so later requests can chain on earlier ones
        //

        bool any_failed = false;
        for (const auto& request : selected) {
            const courier::ExecutionResult result = executor->execute(request, document.file_variables_);
            renderer.render(result);
            any_failed = any_failed || !result.success_;
        }

        return any_failed ? EXIT_REQUEST_FAILED : 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    }
}
