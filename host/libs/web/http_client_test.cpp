/*
 * Copyright (C) 2023 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "host/libs/web/http_client.h"

#include <chrono>
#include <deque>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace tdx {
namespace {

// Answers each request with the next queued status code.
class ScriptedHttpClient : public HttpClient {
 public:
  explicit ScriptedHttpClient(std::deque<long> codes)
      : codes_(std::move(codes)) {}

  Result<HttpResponse<std::string>> DownloadToFile(
      const std::string&, const std::string& path) override {
    return HttpResponse<std::string>{path, Next()};
  }

  Result<HttpResponse<void>> DownloadToCallback(
      DataCallback, const std::string&) override {
    HttpResponse<void> response;
    response.http_code = Next();
    return response;
  }

  int calls = 0;

 private:
  long Next() {
    calls++;
    long code = codes_.front();
    codes_.pop_front();
    return code;
  }

  std::deque<long> codes_;
};

TEST(HttpResponseTest, Classification) {
  EXPECT_TRUE(IsHttpSuccess(200));
  EXPECT_TRUE(IsHttpSuccess(299));
  EXPECT_FALSE(IsHttpSuccess(301));
  HttpResponse<void> response;
  response.http_code = 404;
  EXPECT_TRUE(response.HttpClientError());
  EXPECT_FALSE(response.HttpServerError());
  response.http_code = 502;
  EXPECT_TRUE(response.HttpServerError());
}

TEST(ServerErrorRetryClientTest, RetriesServerErrors) {
  ScriptedHttpClient inner({503, 500, 200});
  auto client = HttpClient::ServerErrorRetryClient(
      inner, 3, std::chrono::milliseconds(0));
  auto response = client->DownloadToFile("https://images.test/a", "/tmp/a");
  ASSERT_THAT(response, IsOk());
  EXPECT_EQ(response->http_code, 200);
  EXPECT_EQ(response->data, "/tmp/a");
  EXPECT_EQ(inner.calls, 3);
}

TEST(ServerErrorRetryClientTest, GivesUpAfterAttempts) {
  ScriptedHttpClient inner({503, 503, 503, 200});
  auto client = HttpClient::ServerErrorRetryClient(
      inner, 3, std::chrono::milliseconds(0));
  auto response = client->DownloadToFile("https://images.test/a", "/tmp/a");
  ASSERT_THAT(response, IsOk());
  EXPECT_EQ(response->http_code, 503);
  EXPECT_EQ(inner.calls, 3);
}

TEST(ServerErrorRetryClientTest, DoesNotRetryClientErrors) {
  ScriptedHttpClient inner({404, 200});
  auto client = HttpClient::ServerErrorRetryClient(
      inner, 3, std::chrono::milliseconds(0));
  auto response = client->DownloadToCallback(
      [](char*, size_t) { return true; }, "https://images.test/a");
  ASSERT_THAT(response, IsOk());
  EXPECT_EQ(response->http_code, 404);
  EXPECT_EQ(inner.calls, 1);
}

}  // namespace
}  // namespace tdx
