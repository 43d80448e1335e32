#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace askdoc_cli {

enum class Command { Ingest, Query, Delete, List, Info, Stats, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string file_path;
  std::string title;
  std::optional<int> document_id;
  std::string question;
  std::optional<int> top_k;
  std::optional<int> chunk_size_tokens;
  std::optional<int> overlap_tokens;
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

  // Parse command line arguments. Throws CliError on unknown commands or
  // missing required flags.
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Reads and extracts a local file into the POST /documents body.
  static nlohmann::json build_ingest_body(const CliOptions &options);

  void execute_command(const CliOptions &options);

  std::string get_api_base_url() const;

 private:
  std::string api_base_url_;
  CURL *curl_handle_;

  // Command handlers
  void handle_ingest_command(const CliOptions &options);
  void handle_query_command(const CliOptions &options);
  void handle_delete_command(const CliOptions &options);
  void handle_list_command(const CliOptions &options);
  void handle_info_command(const CliOptions &options);
  void handle_stats_command(const CliOptions &options);

  // HTTP methods
  nlohmann::json make_get_request(const std::string &endpoint);
  nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
  nlohmann::json make_delete_request(const std::string &endpoint);
  nlohmann::json perform_request(const std::string &method,
                                 const std::string &endpoint,
                                 const nlohmann::json *data);

  // Helper methods
  void setup_curl_handle();
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  void print_json_response(const nlohmann::json &response);
  void print_query_response(const nlohmann::json &response);
  void print_help();
  std::string build_url(const std::string &endpoint);
};

}  // namespace askdoc_cli
