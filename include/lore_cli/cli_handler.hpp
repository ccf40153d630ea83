#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lore_cli
{

  enum class Command
  {
    Ingest,
    Add,
    Search,
    Ask,
    List,
    Stats,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string source;
    std::string text;
    std::string query;
    std::optional<int> top_k;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    static constexpr const char *URL_ENV_VAR = "LORE_API_URL";
    static constexpr const char *DEFAULT_URL = "http://127.0.0.1:3030";

    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments. @throw CliError on unknown commands or missing flags
    static CliOptions parse_arguments(int argc, char *argv[]);

    // @throw CliError when the request fails or the server answers with an error
    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_ingest_command(const CliOptions &options);
    void handle_add_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_ask_command(const CliOptions &options);
    void handle_list_command();
    void handle_stats_command();

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform(const std::string &url);

    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_ingest_report(const nlohmann::json &response);
    void print_search_results(const nlohmann::json &results);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
