#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/storage/object_store.hpp"

namespace upload::storage {

/*
  In-process S3-compatible store.

  Implements the full multipart protocol (initiate, list, upload part,
  complete) with the same failure modes a real store reports: unknown
  upload ids, missing parts, ETag mismatches, unordered completion lists.
  Thread-safe; bodies are copied in under a single mutex.
*/
class MemoryObjectStore final : public ObjectStore {
 public:
  std::string InitiateMultipartUpload(const model::Destination& destination) override;

  std::vector<RemotePart> ListParts(const model::Destination& destination, const std::string& upload_id) override;

  UploadedPart UploadPart(const model::Destination& destination, const std::string& upload_id, int part_number, const ByteRange& body,
                          const ProgressFn& progress, const util::CancellationToken& cancel) override;

  void CompleteMultipartUpload(const model::Destination& destination, const std::string& upload_id,
                               const std::vector<UploadedPart>& ordered_parts) override;

  void PutObject(const model::Destination& destination, const ByteRange& body, const ProgressFn& progress,
                 const util::CancellationToken& cancel) override;

  // inspection
  std::optional<std::string>       GetObject(const std::string& bucket, const std::string& key) const;
  std::optional<model::ObjectTags> GetObjectTags(const std::string& bucket, const std::string& key) const;
  std::vector<int>                 PartNumbers(const std::string& upload_id) const;
  bool                             HasUpload(const std::string& upload_id) const;

  // Drops an outstanding upload, as a store-side lifecycle rule would.
  void ExpireUpload(const std::string& upload_id);

  std::uint64_t PutObjectCalls() const {
    return put_object_calls_.load();
  }
  std::uint64_t UploadPartCalls() const {
    return upload_part_calls_.load();
  }
  std::uint64_t InitiateCalls() const {
    return initiate_calls_.load();
  }

 private:
  struct StoredObject {
    std::string       data;
    model::ObjectTags tags;
  };

  struct StoredPart {
    std::string etag;
    std::string data;
  };

  struct PendingUpload {
    model::Destination        destination;
    std::map<int, StoredPart>  parts;
  };

  static std::string ObjectKey(const std::string& bucket, const std::string& key);
  static std::string MakeETag(const std::string& data);

  PendingUpload& FindUploadLocked(const model::Destination& destination, const std::string& upload_id);

  mutable std::mutex                             mutex_;
  std::unordered_map<std::string, StoredObject>  objects_;
  std::unordered_map<std::string, PendingUpload> uploads_;
  std::uint64_t                                  next_upload_ = 1;

  std::atomic<std::uint64_t> put_object_calls_{0};
  std::atomic<std::uint64_t> upload_part_calls_{0};
  std::atomic<std::uint64_t> initiate_calls_{0};
};

} // namespace upload::storage
