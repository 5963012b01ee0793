#include "scribe_cli/cli_handler.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>

namespace scribe_cli {

namespace {

struct SlistDeleter {
    void operator()(curl_slist *list) const {
        curl_slist_free_all(list);
    }
};

bool is_finished_state(const std::string &state) {
    return state == "completed" || state == "cancelled" || state == "failed" || state == "idle";
}

}  // namespace

CliHandler::CliHandler(const std::string &api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler &&other) noexcept
    : api_base_url_(std::move(other.api_base_url_)), curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler &CliHandler::operator=(CliHandler &&other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
    userp->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    auto for_each_flag = [&](auto &&handle) {
        for (int i = 2; i + 1 < argc; i += 2) {
            handle(std::string(argv[i]), std::string(argv[i + 1]));
        }
    };
    auto to_int = [](const std::string &flag, const std::string &value) {
        try {
            return std::stoi(value);
        } catch (const std::exception &) {
            throw CliError("Invalid number for " + flag + ": " + value);
        }
    };

    if (command == "index" || command == "i") {
        options.command = Command::Index;
        for_each_flag([&](const std::string &flag, const std::string &value) {
            if (flag == "--file" || flag == "-f") {
                options.file_path = value;
            } else if (flag == "--id") {
                options.document_id = value;
            }
        });
        if (options.file_path.empty()) {
            throw CliError("Index command requires a file path. Usage: index --file <path>");
        }
    } else if (command == "delete" || command == "d") {
        options.command = Command::Delete;
        for_each_flag([&](const std::string &flag, const std::string &value) {
            if (flag == "--id" || flag == "-i") {
                options.document_id = value;
            }
        });
        if (options.document_id.empty()) {
            throw CliError("Delete command requires a document id. Usage: delete --id <document>");
        }
    } else if (command == "reindex" || command == "r") {
        options.command = Command::Reindex;
    } else if (command == "suggest" || command == "sg") {
        options.command = Command::Suggest;
        for_each_flag([&](const std::string &flag, const std::string &value) {
            if (flag == "--text" || flag == "-t") {
                options.text = value;
            } else if (flag == "--cursor" || flag == "-c") {
                options.cursor = to_int(flag, value);
            } else if (flag == "--wait-ms" || flag == "-w") {
                options.wait_ms = to_int(flag, value);
            }
        });
        if (options.text.empty()) {
            throw CliError("Suggest command requires text. Usage: suggest --text <text>");
        }
    } else if (command == "cancel" || command == "c") {
        options.command = Command::Cancel;
        for_each_flag([&](const std::string &flag, const std::string &value) {
            if (flag == "--id" || flag == "-i") {
                options.request_id = value;
            }
        });
        if (options.request_id.empty()) {
            throw CliError("Cancel command requires a request id. Usage: cancel --id <request_id>");
        }
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        for_each_flag([&](const std::string &flag, const std::string &value) {
            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--top-k" || flag == "-k") {
                options.top_k = to_int(flag, value);
            }
        });
        if (options.query.empty()) {
            throw CliError("Search command requires a query. Usage: search --query <query>");
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions &options) {
    switch (options.command) {
        case Command::Index:
            handle_index_command(options);
            break;
        case Command::Delete:
            handle_delete_command(options);
            break;
        case Command::Reindex:
            handle_reindex_command(options);
            break;
        case Command::Suggest:
            handle_suggest_command(options);
            break;
        case Command::Cancel:
            handle_cancel_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_index_command(const CliOptions &options) {
    std::cout << "Indexing file: " << options.file_path << std::endl;

    nlohmann::json request_data = {{"path", options.file_path}};
    if (!options.document_id.empty()) {
        request_data["document_id"] = options.document_id;
    }

    try {
        print_json_response(make_post_request("/documents", request_data));
    } catch (const std::exception &e) {
        print_error("Failed to index file: " + std::string(e.what()));
    }
}

void CliHandler::handle_delete_command(const CliOptions &options) {
    try {
        print_json_response(make_delete_request("/documents/" + options.document_id));
    } catch (const std::exception &e) {
        print_error("Failed to delete document: " + std::string(e.what()));
    }
}

void CliHandler::handle_reindex_command(const CliOptions &) {
    std::cout << "Re-indexing documents folder..." << std::endl;
    try {
        print_json_response(make_post_request("/documents/reindex", nlohmann::json::object()));
    } catch (const std::exception &e) {
        print_error("Failed to reindex: " + std::string(e.what()));
    }
}

void CliHandler::handle_suggest_command(const CliOptions &options) {
    nlohmann::json request_data = {{"text", options.text}};
    if (options.cursor >= 0) {
        request_data["cursor"] = options.cursor;
    }

    try {
        nlohmann::json accepted = make_post_request("/suggestions", request_data);
        const auto request_id = accepted.at("data").at("request_id").get<unsigned long long>();
        std::cout << "Suggestion request " << request_id << " submitted" << std::endl;

        const auto deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(options.wait_ms);
        nlohmann::json status;
        do {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            status = make_get_request("/suggestions/" + std::to_string(request_id));
            if (is_finished_state(status.at("data").value("state", ""))) {
                break;
            }
        } while (std::chrono::steady_clock::now() < deadline);

        print_suggestions(status);
    } catch (const std::exception &e) {
        print_error("Failed to get suggestions: " + std::string(e.what()));
    }
}

void CliHandler::handle_cancel_command(const CliOptions &options) {
    try {
        print_json_response(make_delete_request("/suggestions/" + options.request_id));
    } catch (const std::exception &e) {
        print_error("Failed to cancel request: " + std::string(e.what()));
    }
}

void CliHandler::handle_search_command(const CliOptions &options) {
    std::cout << "Search for: " << options.query << " (top_k: " << options.top_k << ")"
              << std::endl;

    nlohmann::json request_data = {{"query", options.query}, {"top_k", options.top_k}};

    try {
        print_search_response(make_post_request("/search", request_data));
    } catch (const std::exception &e) {
        print_error("Failed to search: " + std::string(e.what()));
    }
}

nlohmann::json CliHandler::perform(const std::string &url) {
    std::string response_buffer;
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200 && http_code != 202) {
        std::string detail;
        try {
            detail = nlohmann::json::parse(response_buffer).value("error", "");
        } catch (const nlohmann::json::exception &) {
            detail = response_buffer;
        }
        throw CliError("HTTP request failed with status code " + std::to_string(http_code) +
                       (detail.empty() ? "" : ": " + detail));
    }

    return nlohmann::json::parse(response_buffer);
}

nlohmann::json CliHandler::make_get_request(const std::string &endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    return perform(build_url(endpoint));
}

nlohmann::json CliHandler::make_post_request(const std::string &endpoint,
                                             const nlohmann::json &data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    return perform(build_url(endpoint));
}

nlohmann::json CliHandler::make_delete_request(const std::string &endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
    return perform(build_url(endpoint));
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_json_response(const nlohmann::json &response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_search_response(const nlohmann::json &response) {
    const auto &data = response.at("data");
    std::cout << "\n=== Search Results ===" << std::endl;
    if (data.value("fallback_triggered", false)) {
        std::cout << "(online fallback used"
                  << (data.value("cache_hit", false) ? ", cached" : "")
                  << (data.value("online_failed", false) ? ", online source failed" : "") << ")"
                  << std::endl;
    }

    for (const auto &result : data.at("results")) {
        std::string text = result.value("text", "");
        if (text.length() > 200) {
            text = text.substr(0, 200) + "...";
        }
        std::cout << "\n  [" << result.value("source", "") << "] " << result.value("attribution", "")
                  << " (score: " << std::fixed << std::setprecision(3)
                  << result.value("score", 0.0f) << ")" << std::endl;
        std::cout << "    " << text << std::endl;
    }
    if (data.at("results").empty()) {
        std::cout << "  No results." << std::endl;
    }
}

void CliHandler::print_suggestions(const nlohmann::json &response) {
    const auto &data = response.at("data");
    std::cout << "\nState: " << data.value("state", "unknown") << std::endl;
    if (data.contains("error")) {
        std::cout << "Error: " << data["error"].get<std::string>() << std::endl;
    }

    int index = 1;
    for (const auto &suggestion : data.at("suggestions")) {
        std::cout << "\n" << index++ << ". " << suggestion.value("text", "") << std::endl;
        for (const auto &attribution : suggestion.at("attributions")) {
            std::cout << "   [From: " << attribution.get<std::string>() << "]" << std::endl;
        }
    }
}

void CliHandler::print_error(const std::string &error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "Scribe CLI - local-first writing suggestions\n\n"
              << "Usage: scribe_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  index, i      --file <path> [--id <document>]   Index a document\n"
              << "  delete, d     --id <document>                   Remove a document\n"
              << "  reindex, r                                      Re-index the documents folder\n"
              << "  suggest, sg   --text <text> [--cursor <n>] [--wait-ms <ms>]\n"
              << "                                                  Request suggestions\n"
              << "  cancel, c     --id <request_id>                 Cancel a suggestion request\n"
              << "  search, s     --query <query> [--top-k <k>]     Retrieve reference text\n"
              << "  help, h                                         Show this help\n\n"
              << "Environment:\n"
              << "  API_BASE_URL  Server address (default http://127.0.0.1:3030)\n";
}

std::string CliHandler::build_url(const std::string &endpoint) const {
    return api_base_url_ + endpoint;
}

}  // namespace scribe_cli
