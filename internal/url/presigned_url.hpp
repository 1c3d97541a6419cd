#pragma once

#include <string>
#include <string_view>

#include "internal/model/destination.hpp"

namespace upload::url {

inline constexpr char kDefaultRecordTagKey[] = "X-COS-RECORD-ID";

/*
  Splits a pre-signed upload URL into its destination.

    https://host[:port]/<bucket>/<key...>?...&X-Amz-Tagging=<url-encoded k=v&k=v>&...

  The first path segment is the bucket; the remainder (percent-decoded) is the
  key. Tags are optional. Throws util::InvalidArgument on anything else.
*/
model::Destination ParsePresignedUrl(std::string_view url);

// Percent-decoding; '+' is a space only when form_encoding is set.
std::string PercentDecode(std::string_view encoded, bool form_encoding = false);

// Parses "k1=v1&k2=v2" with each side percent-decoded.
model::ObjectTags ParseTagging(std::string_view tagging);

// Empty when the tag is absent.
std::string RecordId(const model::Destination& destination, const std::string& tag_key = kDefaultRecordTagKey);

} // namespace upload::url
