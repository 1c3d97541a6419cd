#include "sha256.hpp"

#include <arrow/io/file.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace upload::util {

struct Sha256::Context {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> md{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
};

Sha256::Sha256() : ctx_(std::make_unique<Context>()) {
  if (!ctx_->md || EVP_DigestInit_ex(ctx_->md.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256: EVP init failed");
  }
}

Sha256::~Sha256() = default;

void Sha256::Update(const void* data, std::size_t size) {
  if (finalized_) throw std::logic_error("sha256: update after digest");
  if (EVP_DigestUpdate(ctx_->md.get(), data, size) != 1) {
    throw std::runtime_error("sha256: EVP update failed");
  }
}

std::string Sha256::HexDigest() {
  static constexpr char kHex[] = "0123456789abcdef";

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               length = 0;
  if (finalized_ || EVP_DigestFinal_ex(ctx_->md.get(), digest.data(), &length) != 1) {
    throw std::runtime_error("sha256: EVP final failed");
  }
  finalized_ = true;

  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

std::string Sha256Hex(std::string_view data) {
  Sha256 hasher;
  hasher.Update(data.data(), data.size());
  return hasher.HexDigest();
}

LocalFile HashLocalFile(const std::string& path) {
  static constexpr std::int64_t kChunk = 4 * 1024 * 1024;

  try {
    auto file = storage::common::Unwrap(arrow::io::ReadableFile::Open(path), "open");
    auto size = storage::common::Unwrap(file->GetSize(), "stat");

    Sha256                    hasher;
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(kChunk));
    std::int64_t              offset = 0;
    while (offset < size) {
      auto read = storage::common::Unwrap(file->ReadAt(offset, std::min(kChunk, size - offset), buffer.data()), "read");
      if (read <= 0) break;
      hasher.Update(buffer.data(), static_cast<std::size_t>(read));
      offset += read;
    }
    storage::common::Unwrap(file->Close(), "close");

    if (offset != size) {
      throw PlanningError("short read while hashing " + path);
    }
    return LocalFile{static_cast<std::uint64_t>(size), hasher.HexDigest()};
  } catch (const PlanningError&) {
    throw;
  } catch (const std::exception& e) {
    throw PlanningError("unable to hash " + path + ": " + e.what());
  }
}

} // namespace upload::util
