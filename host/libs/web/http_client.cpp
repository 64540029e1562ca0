//
// Copyright (C) 2019 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "host/libs/web/http_client.h"

#include <fcntl.h>

#include <mutex>
#include <string>
#include <thread>

#include <android-base/logging.h>
#include <curl/curl.h>

#include "common/libs/fs/shared_buf.h"
#include "common/libs/fs/shared_fd.h"

namespace tdx {
namespace {

constexpr char kCaBundle[] = "/etc/ssl/certs/ca-certificates.crt";

size_t curl_to_function_cb(char* ptr, size_t, size_t nmemb, void* userdata) {
  HttpClient::DataCallback* callback = (HttpClient::DataCallback*)userdata;
  if (!(*callback)(ptr, nmemb)) {
    return 0;  // Signals error to curl
  }
  return nmemb;
}

class CurlClient : public HttpClient {
 public:
  CurlClient() {
    curl_ = curl_easy_init();
    if (!curl_) {
      LOG(ERROR) << "failed to initialize curl";
      return;
    }
  }
  ~CurlClient() { curl_easy_cleanup(curl_); }

  Result<HttpResponse<std::string>> DownloadToFile(
      const std::string& url, const std::string& path) override {
    LOG(DEBUG) << "Saving \"" << url << "\" to \"" << path << "\"";
    SharedFD file;
    auto callback = [&file, &path](char* data, size_t size) -> bool {
      if (data == nullptr) {
        file = SharedFD::Open(path, O_CREAT | O_WRONLY | O_TRUNC, 0644);
        if (!file->IsOpen()) {
          LOG(ERROR) << "Failed to open \"" << path
                     << "\": " << file->StrError();
          return false;
        }
        return true;
      }
      return WriteAll(file, data, size) == static_cast<ssize_t>(size);
    };
    auto response = TDX_EXPECT(DownloadToCallback(callback, url),
                               "Failed to download \"" << url << "\"");
    return HttpResponse<std::string>{path, response.http_code};
  }

  Result<HttpResponse<void>> DownloadToCallback(
      DataCallback callback, const std::string& url) override {
    std::lock_guard<std::mutex> lock(mutex_);
    TDX_EXPECT(curl_ != nullptr, "curl was not initialized");
    TDX_EXPECT(callback(nullptr, 0), "Callback failure");  // Signal start
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_CAINFO, kCaBundle);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, curl_to_function_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &callback);
    char error_buf[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buf);
    CURLcode res = curl_easy_perform(curl_);
    TDX_EXPECT(res == CURLE_OK,
               "curl_easy_perform() failed with \"" << curl_easy_strerror(res)
                                                    << "\": " << error_buf);
    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    LOG(DEBUG) << "HTTP " << http_code << " for \"" << url << "\"";
    return HttpResponse<void>{{}, http_code};
  }

 private:
  CURL* curl_;
  std::mutex mutex_;
};

class ServerErrorRetryClient : public HttpClient {
 public:
  ServerErrorRetryClient(HttpClient& inner, int retry_attempts,
                         std::chrono::milliseconds retry_delay)
      : inner_client_(inner),
        retry_attempts_(retry_attempts),
        retry_delay_(retry_delay) {}

  Result<HttpResponse<std::string>> DownloadToFile(
      const std::string& url, const std::string& path) override {
    return RetryImpl<std::string>(
        [&, this]() { return inner_client_.DownloadToFile(url, path); });
  }

  Result<HttpResponse<void>> DownloadToCallback(
      DataCallback cb, const std::string& url) override {
    return RetryImpl<void>(
        [&, this]() { return inner_client_.DownloadToCallback(cb, url); });
  }

 private:
  template <typename T>
  Result<HttpResponse<T>> RetryImpl(
      std::function<Result<HttpResponse<T>>()> attempt_fn) {
    HttpResponse<T> response;
    for (int attempt = 0; attempt != retry_attempts_; ++attempt) {
      if (attempt != 0) {
        LOG(WARNING) << "Server error " << response.http_code
                     << ", retrying in " << retry_delay_.count() << "ms";
        std::this_thread::sleep_for(retry_delay_);
      }
      response = TDX_EXPECT(attempt_fn());
      if (!response.HttpServerError()) {
        return response;
      }
    }
    return response;
  }

  HttpClient& inner_client_;
  int retry_attempts_;
  std::chrono::milliseconds retry_delay_;
};

}  // namespace

/* static */ std::unique_ptr<HttpClient> HttpClient::CurlClient() {
  return std::unique_ptr<HttpClient>(new class CurlClient());
}

/* static */ std::unique_ptr<HttpClient> HttpClient::ServerErrorRetryClient(
    HttpClient& inner, int retry_attempts,
    std::chrono::milliseconds retry_delay) {
  return std::unique_ptr<HttpClient>(
      new class ServerErrorRetryClient(inner, retry_attempts, retry_delay));
}

HttpClient::~HttpClient() = default;

}  // namespace tdx
