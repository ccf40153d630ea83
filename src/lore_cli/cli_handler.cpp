#include "lore_cli/cli_handler.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>

namespace lore_cli {

namespace {

// Collects "--flag value" pairs after the command name
std::optional<std::string> flag_value(int argc, char* argv[], const std::string& long_flag,
                                      const std::string& short_flag) {
    for (int i = 2; i + 1 < argc; ++i) {
        std::string flag = argv[i];
        if (flag == long_flag || flag == short_flag) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

std::string require_flag(int argc, char* argv[], const std::string& long_flag,
                         const std::string& short_flag, const std::string& usage) {
    std::optional<std::string> value = flag_value(argc, argv, long_flag, short_flag);
    if (!value || value->empty()) {
        throw CliError("Missing " + long_flag + ". Usage: " + usage);
    }
    return *value;
}

std::optional<int> parse_top_k(int argc, char* argv[]) {
    std::optional<std::string> value = flag_value(argc, argv, "--top-k", "-k");
    if (!value) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int top_k = std::stoi(*value, &consumed);
        if (consumed != value->size() || top_k < 1) {
            throw CliError("--top-k must be a positive integer, got '" + *value + "'");
        }
        return top_k;
    } catch (const std::logic_error&) {
        throw CliError("--top-k must be a positive integer, got '" + *value + "'");
    }
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
        options.file_path = require_flag(argc, argv, "--file", "-f", "ingest --file <path>");
    } else if (command == "add" || command == "a") {
        options.command = Command::Add;
        const std::string usage = "add --source <id> --text <text>";
        options.source = require_flag(argc, argv, "--source", "-s", usage);
        options.text = require_flag(argc, argv, "--text", "-t", usage);
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        options.query = require_flag(argc, argv, "--query", "-q", "search --query <query>");
        options.top_k = parse_top_k(argc, argv);
    } else if (command == "ask" || command == "q") {
        options.command = Command::Ask;
        options.query = require_flag(argc, argv, "--query", "-q", "ask --query <question>");
        options.top_k = parse_top_k(argc, argv);
    } else if (command == "list" || command == "l") {
        options.command = Command::List;
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Add:
            handle_add_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::List:
            handle_list_command();
            break;
        case Command::Stats:
            handle_stats_command();
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    // The server resolves paths against its own working directory
    std::string path = std::filesystem::absolute(options.file_path).string();
    std::cout << "Ingesting file: " << path << std::endl;
    print_ingest_report(make_post_request("/documents", {{"path", path}}));
}

void CliHandler::handle_add_command(const CliOptions& options) {
    std::cout << "Adding text as source: " << options.source << std::endl;
    print_ingest_report(
        make_post_request("/documents", {{"source", options.source}, {"text", options.text}}));
}

void CliHandler::handle_search_command(const CliOptions& options) {
    nlohmann::json request_data = {{"query", options.query}};
    if (options.top_k) {
        request_data["top_k"] = *options.top_k;
    }
    nlohmann::json response = make_post_request("/search", request_data);
    print_search_results(response["data"]["results"]);
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    nlohmann::json request_data = {{"query", options.query}};
    if (options.top_k) {
        request_data["top_k"] = *options.top_k;
    }
    nlohmann::json response = make_post_request("/query", request_data);
    const nlohmann::json& data = response["data"];

    std::cout << data.value("answer", "") << std::endl;
    const nlohmann::json& sources = data["sources"];
    if (sources.is_array() && !sources.empty()) {
        std::cout << "\nSources:" << std::endl;
        for (const auto& source : sources) {
            std::cout << "  - " << source.value("source", "") << " #"
                      << source.value("chunk_index", 0) << std::endl;
        }
    }
}

void CliHandler::handle_list_command() {
    nlohmann::json response = make_get_request("/documents");
    const nlohmann::json& documents = response["data"]["documents"];
    if (documents.empty()) {
        std::cout << "No documents ingested yet." << std::endl;
        return;
    }
    for (const auto& document : documents) {
        std::cout << std::setw(6) << document.value("chunk_count", 0) << "  "
                  << document.value("source", "") << std::endl;
    }
}

void CliHandler::handle_stats_command() {
    nlohmann::json response = make_get_request("/stats");
    const nlohmann::json& data = response["data"];
    std::cout << "Documents: " << data.value("documents", 0) << std::endl;
    std::cout << "Chunks:    " << data.value("chunks", 0) << std::endl;
    std::cout << "Dimension: " << data.value("dimension", 0) << std::endl;
    std::cout << "Snapshot:  " << (data.value("snapshot_enabled", false) ? "on" : "off")
              << std::endl;
}

void CliHandler::print_ingest_report(const nlohmann::json& response) {
    const nlohmann::json& data = response["data"];
    std::cout << "Stored " << data.value("stored_chunks", 0) << " of "
              << data.value("total_chunks", 0) << " chunk(s) from " << data.value("source", "")
              << std::endl;
}

void CliHandler::print_search_results(const nlohmann::json& results) {
    if (!results.is_array() || results.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }
    int rank = 1;
    for (const auto& result : results) {
        std::cout << rank++ << ". [" << std::fixed << std::setprecision(4)
                  << result.value("score", 0.0) << "] " << result.value("source", "") << " #"
                  << result.value("chunk_index", 0) << std::endl;
        std::cout << "   " << result.value("content", "") << std::endl;
    }
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPGET, 1L);
    return perform(url);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint,
                                             const nlohmann::json& data) {
    std::string url = build_url(endpoint);
    std::string body = data.dump();

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    return perform(url);
}

nlohmann::json CliHandler::perform(const std::string& url) {
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

    nlohmann::json response = nlohmann::json::parse(response_buffer, nullptr, false);
    if (response.is_discarded()) {
        throw CliError("Server returned invalid JSON (status " + std::to_string(http_code) + ")");
    }
    if (http_code != 200) {
        std::string error = response.is_object() ? response.value("error", "") : "";
        throw CliError("Request failed with status " + std::to_string(http_code) +
                       (error.empty() ? "" : ": " + error));
    }
    return response;
}

void CliHandler::print_help() {
    std::cout << "Usage: lore <command> [options]\n\n"
              << "Commands:\n"
              << "  ingest --file <path>               Ingest a text or markdown file\n"
              << "  add --source <id> --text <text>    Ingest raw text under a source id\n"
              << "  search --query <q> [--top-k n]     Show the best matching chunks\n"
              << "  ask --query <q> [--top-k n]        Answer a question from stored documents\n"
              << "  list                               List ingested documents\n"
              << "  stats                              Show store statistics\n"
              << "  help                               Show this message\n\n"
              << "The server address is read from " << URL_ENV_VAR << " (default "
              << DEFAULT_URL << ")." << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string base = api_base_url_;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

}  // namespace lore_cli
