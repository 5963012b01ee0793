#include <cstdlib>
#include <iostream>

#include "scribe_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
    try {
        const char *api_base_url = std::getenv("API_BASE_URL");
        std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

        scribe_cli::CliOptions options = scribe_cli::CliHandler::parse_arguments(argc, argv);

        scribe_cli::CliHandler handler(base_url);
        handler.execute_command(options);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
