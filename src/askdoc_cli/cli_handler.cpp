#include "askdoc_cli/cli_handler.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>

#include "askdoc_core/extractors/text_extractor_factory.hpp"

namespace askdoc_cli {

namespace {

int parse_int_flag(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Flag " + flag + " expects an integer, got '" + value + "'");
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Flag " + flag + " expects an integer, got '" + value + "'");
  }
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
  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
  } else if (command == "query" || command == "q") {
    options.command = Command::Query;
  } else if (command == "delete" || command == "d") {
    options.command = Command::Delete;
  } else if (command == "list" || command == "l") {
    options.command = Command::List;
  } else if (command == "info") {
    options.command = Command::Info;
  } else if (command == "stats") {
    options.command = Command::Stats;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; i += 2) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw CliError("Flag " + flag + " requires a value");
    }
    std::string value = argv[i + 1];

    if (flag == "--file" || flag == "-f") {
      options.file_path = value;
    } else if (flag == "--title" || flag == "-t") {
      options.title = value;
    } else if (flag == "--id" || flag == "--document" || flag == "-d") {
      options.document_id = parse_int_flag(flag, value);
    } else if (flag == "--question" || flag == "-q") {
      options.question = value;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_int_flag(flag, value);
    } else if (flag == "--chunk-size") {
      options.chunk_size_tokens = parse_int_flag(flag, value);
    } else if (flag == "--overlap") {
      options.overlap_tokens = parse_int_flag(flag, value);
    } else {
      throw CliError("Unknown flag: " + flag);
    }
  }

  switch (options.command) {
    case Command::Ingest:
      if (options.file_path.empty() || !options.document_id.has_value()) {
        throw CliError("Ingest requires a file and an id. Usage: ingest --file <path> --id <n>");
      }
      break;
    case Command::Query:
      if (options.question.empty()) {
        throw CliError("Query requires a question. Usage: query --question <text>");
      }
      break;
    case Command::Delete:
    case Command::Info:
      if (!options.document_id.has_value()) {
        throw CliError("This command requires a document id. Usage: " + command + " --id <n>");
      }
      break;
    default:
      break;
  }
  return options;
}

nlohmann::json CliHandler::build_ingest_body(const CliOptions &options) {
  askdoc_core::TextExtractorFactory factory;
  const auto &extractor = factory.get_extractor_for(options.file_path);
  askdoc_core::ExtractedText extracted = extractor.extract(options.file_path);

  nlohmann::json body;
  body["document_id"] = *options.document_id;
  body["title"] = options.title.empty() ? std::filesystem::path(options.file_path).filename().string()
                                        : options.title;
  body["text"] = extracted.text;
  body["page_count"] = extracted.page_count;
  if (!extracted.page_offsets.empty()) {
    body["page_offsets"] = extracted.page_offsets;
  }
  if (options.chunk_size_tokens.has_value()) {
    body["chunk_size_tokens"] = *options.chunk_size_tokens;
  }
  if (options.overlap_tokens.has_value()) {
    body["overlap_tokens"] = *options.overlap_tokens;
  }
  return body;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ingest:
      handle_ingest_command(options);
      break;
    case Command::Query:
      handle_query_command(options);
      break;
    case Command::Delete:
      handle_delete_command(options);
      break;
    case Command::List:
      handle_list_command(options);
      break;
    case Command::Info:
      handle_info_command(options);
      break;
    case Command::Stats:
      handle_stats_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_ingest_command(const CliOptions &options) {
  std::cout << "Ingesting file: " << options.file_path << " as document " << *options.document_id
            << std::endl;
  nlohmann::json response = make_post_request("/documents", build_ingest_body(options));
  print_json_response(response);
}

void CliHandler::handle_query_command(const CliOptions &options) {
  nlohmann::json request_data = {{"question", options.question}};
  if (options.document_id.has_value()) {
    request_data["document_id"] = *options.document_id;
  }
  if (options.top_k.has_value()) {
    request_data["top_k"] = *options.top_k;
  }
  print_query_response(make_post_request("/query", request_data));
}

void CliHandler::handle_delete_command(const CliOptions &options) {
  print_json_response(make_delete_request("/documents/" + std::to_string(*options.document_id)));
}

void CliHandler::handle_list_command(const CliOptions &options) {
  std::cout << "Listing documents..." << std::endl;
  print_json_response(make_get_request("/documents"));
}

void CliHandler::handle_info_command(const CliOptions &options) {
  print_json_response(make_get_request("/documents/" + std::to_string(*options.document_id)));
}

void CliHandler::handle_stats_command(const CliOptions &options) {
  print_json_response(make_get_request("/stats"));
}

nlohmann::json CliHandler::make_get_request(const std::string &endpoint) {
  return perform_request("GET", endpoint, nullptr);
}

nlohmann::json CliHandler::make_post_request(const std::string &endpoint,
                                             const nlohmann::json &data) {
  return perform_request("POST", endpoint, &data);
}

nlohmann::json CliHandler::make_delete_request(const std::string &endpoint) {
  return perform_request("DELETE", endpoint, nullptr);
}

nlohmann::json CliHandler::perform_request(const std::string &method,
                                           const std::string &endpoint,
                                           const nlohmann::json *data) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }

  std::string url = build_url(endpoint);
  std::string request_json = data ? data->dump() : "";
  std::string response_buffer;
  struct curl_slist *headers = nullptr;

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  if (method == "POST") {
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
  } else if (method != "GET") {
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  CURLcode res = curl_easy_perform(curl_handle_);
  curl_slist_free_all(headers);
  if (res != CURLE_OK) {
    throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

  nlohmann::json response = nlohmann::json::parse(response_buffer, nullptr, false);
  if (http_code < 200 || http_code >= 300) {
    std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
    if (response.is_object() && response.contains("error")) {
      message += " (" + response.value("kind", std::string("error")) + ": " +
                 response["error"].get<std::string>() + ")";
    }
    throw CliError(message);
  }
  if (response.is_discarded()) {
    throw CliError("Server returned a response that is not JSON");
  }
  return response;
}

std::string CliHandler::get_api_base_url() const {
  return api_base_url_;
}

std::string CliHandler::build_url(const std::string &endpoint) {
  if (!api_base_url_.empty() && api_base_url_.back() == '/') {
    return api_base_url_.substr(0, api_base_url_.size() - 1) + endpoint;
  }
  return api_base_url_ + endpoint;
}

void CliHandler::print_json_response(const nlohmann::json &response) {
  std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_query_response(const nlohmann::json &response) {
  const nlohmann::json &data = response.contains("data") ? response["data"] : response;

  std::cout << "\n" << std::string(80, '=') << std::endl;
  std::cout << data.value("answer", std::string()) << std::endl;
  std::cout << std::string(80, '=') << std::endl;
  std::cout << "Confidence: " << std::fixed << std::setprecision(2)
            << data.value("confidence", 0.0f);
  if (data.value("confidence_derived", false)) {
    std::cout << " (derived from retrieval)";
  }
  std::cout << std::endl;

  if (data.contains("citations") && data["citations"].is_array() && !data["citations"].empty()) {
    std::cout << "\nSources:" << std::endl;
    for (const auto &citation : data["citations"]) {
      std::cout << "  - document " << citation["document_id"].get<int>() << ", chunk "
                << citation["chunk_index"].get<int>() << " (score: " << std::fixed
                << std::setprecision(3) << citation["score"].get<float>() << ")";
      if (citation.contains("page_numbers") && !citation["page_numbers"].empty()) {
        std::cout << ", pages " << citation["page_numbers"].dump();
      }
      std::cout << std::endl;

      std::string text = citation["text"].get<std::string>();
      std::cout << "    " << text.substr(0, 100);
      if (text.length() > 100) {
        std::cout << "...";
      }
      std::cout << std::endl;
    }
  }
}

void CliHandler::print_help() {
  std::cout << R"(
askdoc CLI - Ask questions about your documents

Usage: askdoc_cli <command> [options]

Commands:
  ingest, i     Ingest a .txt or .md file
    --file, -f <path>       File to ingest
    --id <n>                Document id
    --title, -t <title>     Title (defaults to the file name)
    --chunk-size <n>        Tokens per chunk
    --overlap <n>           Tokens shared by consecutive chunks

  query, q      Ask a question
    --question, -q <text>   The question
    --document, -d <n>      Only search this document
    --top-k, -k <n>         Number of chunks to retrieve

  delete, d     Delete a document
    --id <n>

  list, l       List documents
  info          Show one document
    --id <n>
  stats         Show index statistics
  help, h       Show this help

Environment:
  ASKDOC_API_URL   Server address (default http://127.0.0.1:3030)
)" << std::endl;
}

}  // namespace askdoc_cli
