// Copyright 2024 Google LLC
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


#include "bidder_gateway/adapters/media_type_resolver.h"

#include <memory>
#include <utility>

#include "absl/status/statusor.h"
#include "bidder_gateway/common/util/json_util.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace privacy_sandbox::bidder_gateway {
namespace {

using ::testing::HasSubstr;

constexpr char kRequest[] = R"JSON({
  "id": "auction-1",
  "imp": [
    {"id": "banner-only", "banner": {}},
    {"id": "video-only", "video": {}},
    {"id": "no-format"},
    {"id": "video-and-native", "native": {}, "video": {}},
    {"id": "audio-and-native", "audio": {}, "native": {}}
  ]
})JSON";

rapidjson::Document ParseBid(absl::string_view json) {
  absl::StatusOr<rapidjson::Document> document = ParseJsonString(json);
  EXPECT_TRUE(document.ok()) << document.status();
  return *std::move(document);
}

class MediaTypeResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<std::shared_ptr<const BidRequest>> request =
        BidRequest::Create(kRequest);
    ASSERT_TRUE(request.ok()) << request.status();
    request_ = *std::move(request);
  }

  absl::StatusOr<MediaType> Resolve(const MediaTypeResolver& resolver,
                                    absl::string_view bid_json) {
    return resolver.Resolve(ParseBid(bid_json), request_.get());
  }

  std::shared_ptr<const BidRequest> request_;
  MediaTypeResolver optional_ext_{
      ExtensionPolicy::kOptional,
      {MediaType::kBanner, MediaType::kVideo, MediaType::kNative,
       MediaType::kAudio}};
  MediaTypeResolver required_ext_{
      ExtensionPolicy::kRequired,
      {MediaType::kBanner, MediaType::kVideo, MediaType::kNative,
       MediaType::kAudio}};
};

TEST_F(MediaTypeResolverTest, ExplicitTypeWinsOverImpression) {
  EXPECT_EQ(*Resolve(optional_ext_,
                     R"({"impid": "banner-only",
                         "ext": {"prebid": {"type": "native"}}})"),
            MediaType::kNative);
}

TEST_F(MediaTypeResolverTest, PrebidKeyIsMatchedIgnoringCase) {
  EXPECT_EQ(*Resolve(required_ext_,
                     R"({"impid": "banner-only",
                         "ext": {"Prebid": {"type": "video"}}})"),
            MediaType::kVideo);
}

TEST_F(MediaTypeResolverTest, UnknownExplicitTypeIsAnError) {
  absl::StatusOr<MediaType> media_type =
      Resolve(optional_ext_, R"({"id": "b1", "impid": "banner-only",
                                 "ext": {"prebid": {"type": "audiovisual"}}})");
  ASSERT_TRUE(absl::IsInvalidArgument(media_type.status()));
  EXPECT_THAT(media_type.status().message(), HasSubstr("audiovisual"));
}

TEST_F(MediaTypeResolverTest, MalformedExtensionIsAnError) {
  EXPECT_FALSE(Resolve(optional_ext_, R"({"impid": "no-format", "ext": 1})")
                   .ok());
  EXPECT_FALSE(Resolve(optional_ext_,
                       R"({"impid": "no-format", "ext": {"prebid": []}})")
                   .ok());
  EXPECT_FALSE(
      Resolve(optional_ext_,
              R"({"impid": "no-format", "ext": {"prebid": {"type": 2}}})")
          .ok());
}

TEST_F(MediaTypeResolverTest, ExtensionWithoutTypeFallsBackToInference) {
  EXPECT_EQ(*Resolve(required_ext_,
                     R"({"impid": "video-only", "ext": {"prebid": {}}})"),
            MediaType::kVideo);
  EXPECT_EQ(*Resolve(required_ext_, R"({"impid": "video-only", "ext": {}})"),
            MediaType::kVideo);
}

TEST_F(MediaTypeResolverTest, MissingExtensionIsAnErrorWhenRequired) {
  absl::StatusOr<MediaType> media_type =
      Resolve(required_ext_, R"({"id": "b1", "impid": "video-only",
                                 "ext": null})");
  ASSERT_TRUE(absl::IsInvalidArgument(media_type.status()));
  EXPECT_THAT(media_type.status().message(), HasSubstr("b1"));

  EXPECT_FALSE(Resolve(required_ext_, R"({"impid": "video-only"})").ok());
}

TEST_F(MediaTypeResolverTest, MissingExtensionIsInferredWhenOptional) {
  EXPECT_EQ(*Resolve(optional_ext_, R"({"impid": "video-only"})"),
            MediaType::kVideo);
}

TEST_F(MediaTypeResolverTest, SingleFormatImpressionDecidesType) {
  EXPECT_EQ(*Resolve(optional_ext_, R"({"impid": "banner-only"})"),
            MediaType::kBanner);
  EXPECT_EQ(*Resolve(optional_ext_, R"({"impid": "video-only"})"),
            MediaType::kVideo);
}

TEST_F(MediaTypeResolverTest, ImpressionWithoutFormatIsBanner) {
  EXPECT_EQ(*Resolve(optional_ext_, R"({"impid": "no-format"})"),
            MediaType::kBanner);
}

TEST_F(MediaTypeResolverTest, UnknownImpressionIsBanner) {
  EXPECT_EQ(*Resolve(optional_ext_, R"({"impid": "not-requested"})"),
            MediaType::kBanner);
}

TEST_F(MediaTypeResolverTest, MissingPayloadIsBanner) {
  EXPECT_EQ(*optional_ext_.Resolve(ParseBid(R"({"impid": "video-only"})"),
                                   /*payload=*/nullptr),
            MediaType::kBanner);
}

TEST_F(MediaTypeResolverTest, MultiFormatImpressionFollowsPrecedence) {
  EXPECT_EQ(*Resolve(optional_ext_, R"({"impid": "video-and-native"})"),
            MediaType::kVideo);
  EXPECT_EQ(*Resolve(optional_ext_, R"({"impid": "audio-and-native"})"),
            MediaType::kNative);
}

TEST_F(MediaTypeResolverTest, MultiFormatImpressionOutsidePrecedenceFails) {
  MediaTypeResolver banner_only(ExtensionPolicy::kOptional,
                                {MediaType::kBanner});
  absl::StatusOr<MediaType> media_type =
      Resolve(banner_only, R"({"impid": "video-and-native"})");
  ASSERT_TRUE(absl::IsInvalidArgument(media_type.status()));
  EXPECT_THAT(media_type.status().message(), HasSubstr("Ambiguous"));
}

}  // namespace
}  // namespace privacy_sandbox::bidder_gateway
