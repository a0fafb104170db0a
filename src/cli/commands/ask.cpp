// ask command
// Posts one question to a running router and prints the JSON answer

#include "cli/commands.h"
#include "cli/cli_client.h"
#include <iostream>

namespace cqr::cli::commands {

int ask(const AskOptions& options) {
    CliClient client(options.server);

    auto result = client.ask(options.question);
    if (result.error == CliError::ConnectionError) {
        std::cerr << "Error: " << result.error_message << std::endl;
        std::cerr << "Start the router with: cluster-query-router serve" << std::endl;
        return 2;
    }
    if (!result.ok()) {
        std::cerr << "Error: " << result.error_message << std::endl;
        if (result.data && result.data->is_object()) {
            const auto& error = (*result.data).value("error", nlohmann::json::object());
            if (error.is_object() && error.contains("recognized_questions")) {
                std::cerr << "\nRecognized questions:" << std::endl;
                for (const auto& q : error["recognized_questions"]) {
                    if (q.is_string()) {
                        std::cerr << "  - " << q.get<std::string>() << std::endl;
                    }
                }
            } else if (error.is_object() && error.contains("detail") && error["detail"].is_string()) {
                std::cerr << "Detail: " << error["detail"].get<std::string>() << std::endl;
            }
        }
        return 1;
    }

    std::cout << result.data->dump(2) << std::endl;
    return 0;
}

}  // namespace cqr::cli::commands
