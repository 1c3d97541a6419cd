#include "memory_object_store.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"

namespace upload::storage {

using util::TransportError;

std::string MemoryObjectStore::ObjectKey(const std::string& bucket, const std::string& key) {
  return bucket + "/" + key;
}

std::string MemoryObjectStore::MakeETag(const std::string& data) {
  return "\"" + util::Sha256Hex(data).substr(0, 32) + "\"";
}

MemoryObjectStore::PendingUpload& MemoryObjectStore::FindUploadLocked(const model::Destination& destination, const std::string& upload_id) {
  auto it = uploads_.find(upload_id);
  if (it == uploads_.end()) {
    throw TransportError("NoSuchUpload: " + upload_id);
  }
  if (it->second.destination.bucket != destination.bucket || it->second.destination.key != destination.key) {
    throw TransportError("upload " + upload_id + " belongs to a different object");
  }
  return it->second;
}

std::string MemoryObjectStore::InitiateMultipartUpload(const model::Destination& destination) {
  ++initiate_calls_;
  std::lock_guard lock(mutex_);
  auto            upload_id = "upload-" + std::to_string(next_upload_++);
  uploads_[upload_id]       = PendingUpload{destination, {}};
  return upload_id;
}

std::vector<RemotePart> MemoryObjectStore::ListParts(const model::Destination& destination, const std::string& upload_id) {
  std::lock_guard lock(mutex_);
  auto&           upload = FindUploadLocked(destination, upload_id);

  std::vector<RemotePart> parts;
  parts.reserve(upload.parts.size());
  for (const auto& [number, part] : upload.parts) {
    parts.push_back(RemotePart{number, part.etag, part.data.size()});
  }
  return parts;
}

UploadedPart MemoryObjectStore::UploadPart(const model::Destination& destination, const std::string& upload_id, int part_number,
                                           const ByteRange& body, const ProgressFn& progress, const util::CancellationToken& cancel) {
  ++upload_part_calls_;
  if (part_number < 1 || part_number > 10000) {
    throw TransportError("InvalidPartNumber: " + std::to_string(part_number));
  }

  {
    std::lock_guard lock(mutex_);
    FindUploadLocked(destination, upload_id);
  }

  RangeReader reader(body, progress, &cancel);
  auto        data = reader.ReadRemaining();
  auto        etag = MakeETag(data);

  UploadedPart result;
  result.part_number      = part_number;
  result.etag             = etag;
  result.size             = data.size();
  result.checksums.sha256 = util::Sha256Hex(data);

  std::lock_guard lock(mutex_);
  auto&           upload = FindUploadLocked(destination, upload_id);
  upload.parts[part_number] = StoredPart{std::move(etag), std::move(data)};
  return result;
}

void MemoryObjectStore::CompleteMultipartUpload(const model::Destination& destination, const std::string& upload_id,
                                                const std::vector<UploadedPart>& ordered_parts) {
  std::lock_guard lock(mutex_);
  auto&           upload = FindUploadLocked(destination, upload_id);

  if (ordered_parts.empty()) {
    throw TransportError("MalformedXML: no parts to complete");
  }

  std::string assembled;
  int         previous = 0;
  for (const auto& part : ordered_parts) {
    if (part.part_number <= previous) {
      throw TransportError("InvalidPartOrder: part " + std::to_string(part.part_number));
    }
    previous = part.part_number;

    auto it = upload.parts.find(part.part_number);
    if (it == upload.parts.end() || it->second.etag != part.etag) {
      throw TransportError("InvalidPart: part " + std::to_string(part.part_number));
    }
    assembled += it->second.data;
  }

  objects_[ObjectKey(destination.bucket, destination.key)] = StoredObject{std::move(assembled), upload.destination.tags};
  uploads_.erase(upload_id);
}

void MemoryObjectStore::PutObject(const model::Destination& destination, const ByteRange& body, const ProgressFn& progress,
                                  const util::CancellationToken& cancel) {
  ++put_object_calls_;
  RangeReader reader(body, progress, &cancel);
  auto        data = reader.ReadRemaining();

  std::lock_guard lock(mutex_);
  objects_[ObjectKey(destination.bucket, destination.key)] = StoredObject{std::move(data), destination.tags};
}

std::optional<std::string> MemoryObjectStore::GetObject(const std::string& bucket, const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto            it = objects_.find(ObjectKey(bucket, key));
  if (it == objects_.end()) return std::nullopt;
  return it->second.data;
}

std::optional<model::ObjectTags> MemoryObjectStore::GetObjectTags(const std::string& bucket, const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto            it = objects_.find(ObjectKey(bucket, key));
  if (it == objects_.end()) return std::nullopt;
  return it->second.tags;
}

std::vector<int> MemoryObjectStore::PartNumbers(const std::string& upload_id) const {
  std::lock_guard  lock(mutex_);
  std::vector<int> numbers;
  auto             it = uploads_.find(upload_id);
  if (it == uploads_.end()) return numbers;
  for (const auto& [number, part] : it->second.parts) {
    numbers.push_back(number);
  }
  return numbers;
}

bool MemoryObjectStore::HasUpload(const std::string& upload_id) const {
  std::lock_guard lock(mutex_);
  return uploads_.count(upload_id) > 0;
}

void MemoryObjectStore::ExpireUpload(const std::string& upload_id) {
  std::lock_guard lock(mutex_);
  uploads_.erase(upload_id);
}

} // namespace upload::storage
