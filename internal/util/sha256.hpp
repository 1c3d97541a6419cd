#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace upload::util {

/*
  SHA-256 helpers (OpenSSL EVP). All digests are lowercase hex.
*/

class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&)            = delete;
  Sha256& operator=(const Sha256&) = delete;

  void        Update(const void* data, std::size_t size);
  std::string HexDigest();

 private:
  struct Context;
  std::unique_ptr<Context> ctx_;
  bool                     finalized_ = false;
};

std::string Sha256Hex(std::string_view data);

struct LocalFile {
  std::uint64_t size = 0;
  std::string   sha256;
};

// Stats and hashes a local file. Throws PlanningError when unreadable.
LocalFile HashLocalFile(const std::string& path);

} // namespace upload::util
