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

#include "host/libs/image/checksum.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"

namespace tdx {

using ::testing::IsEmpty;
using ::testing::Optional;

constexpr char kDigestA[] =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr char kDigestEmpty[] =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

TEST(ChecksumManifestTest, ParsesEntries) {
  std::string manifest = std::string(kDigestA) + " *noble.img\n" +
                         "\n# comment\n" + "not a digest line\n" +
                         "E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855" +
                         "  noble.img.manifest\n";
  auto entries = ParseChecksumManifest(manifest);
  ASSERT_EQ(entries.size(), 2);
  EXPECT_EQ(entries[0].digest, kDigestA);
  EXPECT_EQ(entries[0].file_name, "noble.img");
  EXPECT_EQ(entries[1].digest, kDigestEmpty);
  EXPECT_EQ(entries[1].file_name, "noble.img.manifest");
}

TEST(ChecksumManifestTest, RejectsShortDigests) {
  EXPECT_THAT(ParseChecksumManifest("abc123 noble.img\n"), IsEmpty());
  EXPECT_THAT(ParseChecksumManifest(std::string(kDigestA) + "noble.img\n"),
              IsEmpty());
}

TEST(ChecksumManifestTest, ExpectedDigestMatchesExactName) {
  auto entries = ParseChecksumManifest(
      std::string(kDigestA) + " *noble.img\n" + kDigestEmpty +
      " *noble.img.manifest\n");
  EXPECT_THAT(ExpectedDigest(entries, "noble.img"), Optional(std::string(kDigestA)));
  EXPECT_THAT(ExpectedDigest(entries, "noble.img.manifest"),
              Optional(std::string(kDigestEmpty)));
  EXPECT_EQ(ExpectedDigest(entries, "noble"), std::nullopt);
}

TEST(Sha256OfFileTest, KnownDigests) {
  TemporaryDir dir;
  auto abc = std::string(dir.path) + "/abc";
  auto empty = std::string(dir.path) + "/empty";
  ASSERT_THAT(WriteNewFile(abc, "abc"), IsOk());
  ASSERT_THAT(WriteNewFile(empty, ""), IsOk());
  EXPECT_THAT(Sha256OfFile(abc), IsOkAndValue(std::string(kDigestA)));
  EXPECT_THAT(Sha256OfFile(empty), IsOkAndValue(std::string(kDigestEmpty)));
}

TEST(Sha256OfFileTest, LargerThanOneChunk) {
  TemporaryDir dir;
  auto path = std::string(dir.path) + "/big";
  ASSERT_THAT(WriteNewFile(path, std::string(3 << 20, 'a')), IsOk());
  auto digest = Sha256OfFile(path);
  ASSERT_THAT(digest, IsOk());
  EXPECT_EQ(digest->size(), 64);
  EXPECT_NE(*digest, kDigestEmpty);
}

TEST(Sha256OfFileTest, MissingFile) {
  TemporaryDir dir;
  EXPECT_THAT(Sha256OfFile(std::string(dir.path) + "/missing"), IsError());
}

}  // namespace tdx
