#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/destination.hpp"
#include "internal/storage/file_source.hpp"
#include "internal/util/cancellation.hpp"

namespace upload::storage {

struct PartChecksums {
  std::string crc32;
  std::string crc32c;
  std::string sha1;
  std::string sha256;
};

// Result of one successful UploadPart; also the unit passed to completion.
struct UploadedPart {
  int           part_number = 0;
  std::string   etag;
  std::uint64_t size = 0;
  PartChecksums checksums;
};

// One entry of the store's authoritative part list.
struct RemotePart {
  int           part_number = 0;
  std::string   etag;
  std::uint64_t size = 0;
};

/*
  S3-compatible multipart protocol.

  Every operation throws util::TransportError (or a subclass) on failure.
  Body-carrying operations stream the range through a RangeReader so that
  progress and cancellation are observed while bytes are read.

  Implementations:
    S3ObjectStore      → AWS SDK S3 client
    MemoryObjectStore  → in-process store used by tests
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual std::string InitiateMultipartUpload(const model::Destination& destination) = 0;

  virtual std::vector<RemotePart> ListParts(const model::Destination& destination, const std::string& upload_id) = 0;

  virtual UploadedPart UploadPart(const model::Destination& destination, const std::string& upload_id, int part_number,
                                  const ByteRange& body, const ProgressFn& progress, const util::CancellationToken& cancel) = 0;

  // ordered_parts must be sorted by part number
  virtual void CompleteMultipartUpload(const model::Destination& destination, const std::string& upload_id,
                                       const std::vector<UploadedPart>& ordered_parts) = 0;

  virtual void PutObject(const model::Destination& destination, const ByteRange& body, const ProgressFn& progress,
                         const util::CancellationToken& cancel) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace upload::storage
