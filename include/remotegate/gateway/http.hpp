#pragma once

#include "remotegate/common/result.hpp"

#include <string>
#include <unordered_map>

namespace remotegate::gateway {

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

/// Parses a request head (and whatever body follows it). Header names are
/// lower-cased.
[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);
[[nodiscard]] std::string status_text(int status);

[[nodiscard]] std::string header_lookup(const HttpRequest &request, const std::string &key);

[[nodiscard]] HttpResponse make_json_response(int status, const std::string &body);
[[nodiscard]] HttpResponse make_html_response(int status, const std::string &body);
/// `{"ok":false,"error":<message>}`
[[nodiscard]] HttpResponse make_error_response(int status, const std::string &message);

} // namespace remotegate::gateway
