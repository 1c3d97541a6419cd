#include "presigned_url.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace upload::url {
namespace {

using util::InvalidArgument;

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

// Calls fn(name, value) for every '&'-separated pair; values stay encoded.
template <typename Fn>
void ForEachPair(std::string_view query, Fn&& fn) {
  while (!query.empty()) {
    auto amp  = query.find('&');
    auto pair = query.substr(0, amp);
    query     = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) continue;

    auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      fn(pair, std::string_view{});
    } else {
      fn(pair.substr(0, eq), pair.substr(eq + 1));
    }
  }
}

} // namespace

std::string PercentDecode(std::string_view encoded, bool form_encoding) {
  std::string out;
  out.reserve(encoded.size());
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '%') {
      if (i + 2 >= encoded.size()) {
        throw InvalidArgument("truncated percent escape in '" + std::string(encoded) + "'");
      }
      int hi = HexValue(encoded[i + 1]);
      int lo = HexValue(encoded[i + 2]);
      if (hi < 0 || lo < 0) {
        throw InvalidArgument("invalid percent escape in '" + std::string(encoded) + "'");
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else if (c == '+' && form_encoding) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

model::ObjectTags ParseTagging(std::string_view tagging) {
  model::ObjectTags tags;
  ForEachPair(tagging, [&](std::string_view name, std::string_view value) {
    auto key = PercentDecode(name, true);
    if (key.empty()) {
      throw InvalidArgument("empty tag key in '" + std::string(tagging) + "'");
    }
    tags[key] = PercentDecode(value, true);
  });
  return tags;
}

model::Destination ParsePresignedUrl(std::string_view url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    throw InvalidArgument("upload url has no scheme: " + std::string(url));
  }

  auto rest       = url.substr(scheme_end + 3);
  auto path_start = rest.find('/');
  if (path_start == std::string_view::npos || path_start == 0) {
    throw InvalidArgument("upload url has no object path: " + std::string(url));
  }

  rest = rest.substr(path_start + 1);
  std::string_view query;
  if (auto q = rest.find('?'); q != std::string_view::npos) {
    query = rest.substr(q + 1);
    rest  = rest.substr(0, q);
  }
  if (auto fragment = query.find('#'); fragment != std::string_view::npos) {
    query = query.substr(0, fragment);
  }

  auto slash = rest.find('/');
  if (slash == std::string_view::npos || slash == 0 || slash + 1 == rest.size()) {
    throw InvalidArgument("upload url path must be /<bucket>/<key>: " + std::string(url));
  }

  model::Destination destination;
  destination.bucket = PercentDecode(rest.substr(0, slash));
  destination.key    = PercentDecode(rest.substr(slash + 1));

  ForEachPair(query, [&](std::string_view name, std::string_view value) {
    if (EqualsIgnoreCase(name, "X-Amz-Tagging")) {
      destination.tags = ParseTagging(PercentDecode(value, true));
    }
  });

  return destination;
}

std::string RecordId(const model::Destination& destination, const std::string& tag_key) {
  auto it = destination.tags.find(tag_key);
  return it == destination.tags.end() ? std::string{} : it->second;
}

} // namespace upload::url
