#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/storage/object_store.hpp"

namespace Aws::S3 {
class S3Client;
}

namespace upload::storage {

struct S3ObjectStoreOptions {
  std::string   endpoint;
  std::string   region{"us-east-1"};
  std::string   scheme{"https"};
  std::string   access_key_id;
  std::string   secret_access_key;
  std::string   session_token;
  bool          verify_tls         = true;
  std::uint32_t connect_timeout_ms = 3000;
  std::uint32_t request_timeout_ms = 300000;
  bool          virtual_addressing = false;
};

/*
  ObjectStore over the AWS SDK S3 client.

  Part and object bodies are streamed straight from the shared FileSource
  through a bounded RangeStreamBuf; nothing larger than the stream buffer is
  held in memory per request. Every failed outcome surfaces as
  util::TransportError carrying the service error name.
*/
class S3ObjectStore final : public ObjectStore {
 public:
  explicit S3ObjectStore(const S3ObjectStoreOptions& options);
  ~S3ObjectStore() override;

  S3ObjectStore(const S3ObjectStore&)            = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;

  std::string InitiateMultipartUpload(const model::Destination& destination) override;

  std::vector<RemotePart> ListParts(const model::Destination& destination, const std::string& upload_id) override;

  UploadedPart UploadPart(const model::Destination& destination, const std::string& upload_id, int part_number, const ByteRange& body,
                          const ProgressFn& progress, const util::CancellationToken& cancel) override;

  void CompleteMultipartUpload(const model::Destination& destination, const std::string& upload_id,
                               const std::vector<UploadedPart>& ordered_parts) override;

  void PutObject(const model::Destination& destination, const ByteRange& body, const ProgressFn& progress,
                 const util::CancellationToken& cancel) override;

 private:
  std::shared_ptr<Aws::S3::S3Client> client_;
};

// URL-encoded "k1=v1&k2=v2", as the x-amz-tagging header expects.
std::string EncodeTagging(const model::ObjectTags& tags);

} // namespace upload::storage
