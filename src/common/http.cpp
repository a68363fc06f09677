#include "parley/common/http.hpp"

#include "parley/common/fs.hpp"

#include <curl/curl.h>

#include <mutex>

namespace parley::common {

namespace {

struct WriteContext {
  std::string *body = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<WriteContext *>(userdata);
  if (context->on_chunk != nullptr && *context->on_chunk) {
    (*context->on_chunk)(std::string_view(ptr, total));
  } else if (context->body != nullptr) {
    context->body->append(ptr, total);
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);
  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    (*headers)[to_lower(trim(header.substr(0, separator)))] = trim(header.substr(separator + 1));
  }
  return total;
}

HttpResponse execute_post(const std::string &url, const HttpHeaders &headers,
                          const std::string &body, const std::uint64_t timeout_ms,
                          const StreamChunkCallback *on_chunk) {
  HttpResponse response;
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  WriteContext context{.body = &response.body, .on_chunk = on_chunk};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "Parley/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.network_error = !response.timeout;
    response.network_error_message = curl_easy_strerror(code);
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
  static std::once_flag init_once;
  std::call_once(init_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_post(url, headers, body, timeout_ms, nullptr);
}

HttpResponse CurlHttpClient::post_json_stream(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body,
                                              const std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk) {
  return execute_post(url, headers, body, timeout_ms, &on_chunk);
}

} // namespace parley::common
