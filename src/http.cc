// MIT License
//
// Copyright (c) 2019 the Shuttle authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "libshuttle/error.h"
#include "libshuttle/http.h"
#include "libshuttle/types.h"

namespace shuttle {

namespace {

std::once_flag curl_init_flag;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  std::string* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

struct EasyDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

typedef std::unique_ptr<CURL, EasyDeleter> EasyHandle;
typedef std::unique_ptr<curl_slist, SlistDeleter> HeaderList;

EasyHandle open_handle() {
  EasyHandle curl(curl_easy_init());
  if (!curl)
    throw UpstreamError("curl_easy_init failed", 0, true);
  return curl;
}

HttpResponse perform(CURL* curl, const std::string& url, long timeout) {
  HttpResponse resp = {0, ""};
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // required with threads
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    std::string reason = (errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc));
    throw UpstreamError("HTTP request to " + url + " failed: " + reason, 0,
                        true);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
  return resp;
}

}  // namespace

CurlHttpClient::CurlHttpClient() {
  std::call_once(curl_init_flag, []() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
      throw UpstreamError("curl_global_init failed");
  });
}

std::string CurlHttpClient::escape(const std::string& s) const {
  EasyHandle curl = open_handle();
  char* out = curl_easy_escape(curl.get(), s.c_str(), static_cast<int>(s.size()));
  if (out == nullptr)
    throw UpstreamError("curl_easy_escape failed");
  std::string escaped(out);
  curl_free(out);
  return escaped;
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const HttpParams& params, long timeout) {
  std::string full = url;
  char sep = (url.find('?') == std::string::npos ? '?' : '&');
  for (const auto& kv : params) {
    full += sep + escape(kv.first) + "=" + escape(kv.second);
    sep = '&';
  }
  EasyHandle curl = open_handle();
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  return perform(curl.get(), full, timeout);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const HttpHeaders& headers,
                                  const std::string& body, long timeout) {
  EasyHandle curl = open_handle();
  HeaderList list;
  for (const auto& kv : headers) {
    curl_slist* next =
      curl_slist_append(list.get(), (kv.first + ": " + kv.second).c_str());
    if (next == nullptr)
      throw UpstreamError("curl_slist_append failed");
    list.release();
    list.reset(next);
  }
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(body.size()));
  return perform(curl.get(), url, timeout);
}

}  // namespace shuttle
