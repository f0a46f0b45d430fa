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

#ifndef BIDDER_GATEWAY_OPENRTB_BID_REQUEST_H_
#define BIDDER_GATEWAY_OPENRTB_BID_REQUEST_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "bidder_gateway/openrtb/media_type.h"
#include "rapidjson/document.h"

namespace privacy_sandbox::bidder_gateway {

// One entry of the request's "imp" array.
struct Impression {
  std::string id;
  // Formats whose object ("banner", "video", ...) is present and not null,
  // in kAllMediaTypes order. Usually zero or one entry.
  std::vector<MediaType> formats;
  // The impression object inside the owning BidRequest's document.
  const rapidjson::Value* json = nullptr;

  bool HasFormat(MediaType media_type) const;
};

// The canonical OpenRTB bid request of one auction. The document is treated
// as opaque apart from the fields exposed here. Instances are immutable and
// shared read-only between adapters.
class BidRequest {
 public:
  // Parses `json`. Fails with InvalidArgument when the text is not a JSON
  // object, when "imp" is present but not an array, or when an impression is
  // not an object with a unique string "id".
  static absl::StatusOr<std::shared_ptr<const BidRequest>> Create(
      absl::string_view json);

  // Same checks as Create, starting from an already parsed document.
  static absl::StatusOr<std::shared_ptr<const BidRequest>> FromDocument(
      rapidjson::Document document);

  BidRequest(const BidRequest&) = delete;
  BidRequest& operator=(const BidRequest&) = delete;

  // The request "id", empty when absent.
  absl::string_view id() const { return id_; }

  const std::vector<Impression>& imps() const { return imps_; }

  // Returns the impression with the given id, or nullptr.
  const Impression* FindImp(absl::string_view imp_id) const;

  // device.ip, falling back to device.ipv6.
  std::optional<std::string> DeviceIp() const;

  // Compact JSON serialization of the document.
  const std::string& json() const { return json_; }

  // Returns a copy of this request whose "imp" array holds only the
  // impression at `imp_index`.
  absl::StatusOr<std::shared_ptr<const BidRequest>> WithSingleImp(
      std::size_t imp_index) const;

 private:
  explicit BidRequest(rapidjson::Document document);

  absl::Status Init();

  rapidjson::Document document_;
  std::string id_;
  std::vector<Impression> imps_;
  std::string json_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_OPENRTB_BID_REQUEST_H_
