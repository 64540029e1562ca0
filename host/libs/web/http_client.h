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

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

#include "common/libs/utils/result.h"

namespace tdx {

static inline bool IsHttpSuccess(int http_code) {
  return http_code >= 200 && http_code <= 299;
};

struct HttpVoidResponse {};

template <typename T>
struct HttpResponse {
  bool HttpSuccess() const { return IsHttpSuccess(http_code); }
  bool HttpClientError() const { return http_code >= 400 && http_code <= 499; }
  bool HttpServerError() const { return http_code >= 500 && http_code <= 599; }

  typename std::conditional<std::is_void_v<T>, HttpVoidResponse, T>::type data;
  long http_code;
};

class HttpClient {
 public:
  typedef std::function<bool(char*, size_t)> DataCallback;

  static std::unique_ptr<HttpClient> CurlClient();
  // Repeats requests answered with a 5xx status, `retry_delay` apart.
  static std::unique_ptr<HttpClient> ServerErrorRetryClient(
      HttpClient&, int retry_attempts, std::chrono::milliseconds retry_delay);

  virtual ~HttpClient();

  // The response data is the path the body was written to. The file is
  // written even when the status is not a success.
  virtual Result<HttpResponse<std::string>> DownloadToFile(
      const std::string& url, const std::string& path) = 0;

  // The callback is invoked once with a null pointer before any data arrives.
  virtual Result<HttpResponse<void>> DownloadToCallback(
      DataCallback callback, const std::string& url) = 0;
};

}  // namespace tdx
