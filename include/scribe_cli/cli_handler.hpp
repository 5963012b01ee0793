#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <string>

namespace scribe_cli {

enum class Command { Index, Delete, Reindex, Suggest, Cancel, Search, Help };

struct CliOptions {
    Command command = Command::Help;
    std::string file_path;
    std::string document_id;
    std::string text;
    long long cursor = -1;  // -1 means end of text
    int wait_ms = 3000;
    std::string request_id;
    std::string query;
    int top_k = 5;
};

class CliError : public std::exception {
public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override {
        return message_.c_str();
    }

private:
    std::string message_;
};

class CliHandler {
public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_index_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options);
    void handle_reindex_command(const CliOptions &options);
    void handle_suggest_command(const CliOptions &options);
    void handle_cancel_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_delete_request(const std::string &endpoint);
    nlohmann::json perform(const std::string &url);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_search_response(const nlohmann::json &response);
    void print_suggestions(const nlohmann::json &response);
    void print_error(const std::string &error);
    static void print_help();
    std::string build_url(const std::string &endpoint) const;
};

}  // namespace scribe_cli
