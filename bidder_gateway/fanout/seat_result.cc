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

#include "bidder_gateway/fanout/seat_result.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

bool WriteString(JsonWriter& writer, absl::string_view value) {
  return writer.String(value.data(),
                       static_cast<rapidjson::SizeType>(value.size()));
}

bool WriteBid(JsonWriter& writer, const AdapterBid& bid) {
  return writer.StartObject() && writer.Key("impid") &&
         WriteString(writer, bid.imp_id) && writer.Key("mediatype") &&
         WriteString(writer, MediaTypeToString(bid.media_type)) &&
         writer.Key("cur") && WriteString(writer, bid.currency) &&
         writer.Key("bid") &&
         writer.RawValue(bid.bid_json.data(), bid.bid_json.size(),
                         rapidjson::kObjectType) &&
         writer.EndObject();
}

bool WriteError(JsonWriter& writer, const AdapterError& error) {
  return writer.StartObject() && writer.Key("type") &&
         WriteString(writer, AdapterErrorTypeToString(error.type())) &&
         writer.Key("message") && WriteString(writer, error.message()) &&
         writer.EndObject();
}

bool WriteSeat(JsonWriter& writer, const SeatResult& seat) {
  if (!writer.StartObject() || !writer.Key("seat") ||
      !WriteString(writer, seat.adapter_name) || !writer.Key("bids") ||
      !writer.StartArray()) {
    return false;
  }
  for (const AdapterBid& bid : seat.bids) {
    if (!WriteBid(writer, bid)) {
      return false;
    }
  }
  if (!writer.EndArray() || !writer.Key("errors") || !writer.StartArray()) {
    return false;
  }
  for (const AdapterError& error : seat.errors) {
    if (!WriteError(writer, error)) {
      return false;
    }
  }
  return writer.EndArray() && writer.EndObject();
}

}  // namespace

absl::StatusOr<std::string> SeatResultsToJson(
    absl::Span<const SeatResult> seat_results) {
  rapidjson::StringBuffer buffer;
  JsonWriter writer(buffer);
  if (!writer.StartArray()) {
    return absl::InternalError("Failed to start seat results array");
  }
  for (const SeatResult& seat : seat_results) {
    if (!WriteSeat(writer, seat)) {
      return absl::InternalError(
          absl::StrCat("Failed to serialize seat ", seat.adapter_name));
    }
  }
  if (!writer.EndArray()) {
    return absl::InternalError("Failed to end seat results array");
  }
  return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace privacy_sandbox::bidder_gateway
