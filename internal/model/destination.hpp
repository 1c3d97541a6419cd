#pragma once

#include <map>
#include <string>

namespace upload::model {

using ObjectTags = std::map<std::string, std::string>;

/*
  Where a file lands in the object store, as encoded by its pre-signed URL.
*/
struct Destination {
  std::string bucket;
  std::string key;
  ObjectTags  tags;
};

} // namespace upload::model
