#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/ListPartsRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <chrono>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace upload::storage {
namespace {

namespace s3model = Aws::S3::Model;

constexpr char kAllocationTag[] = "upload-engine";

/*
  Aws::InitAPI / ShutdownAPI must bracket every client. Reference counted so
  several stores (or tests) can coexist.
*/
std::mutex      g_sdk_mutex;
int             g_sdk_refs = 0;
Aws::SDKOptions g_sdk_options;

void AcquireSdk() {
  std::lock_guard lock(g_sdk_mutex);
  if (g_sdk_refs++ == 0) {
    Aws::InitAPI(g_sdk_options);
  }
}

void ReleaseSdk() {
  std::lock_guard lock(g_sdk_mutex);
  if (--g_sdk_refs == 0) {
    Aws::ShutdownAPI(g_sdk_options);
  }
}

// Holds the streambuf so it is constructed before, and destroyed after, the iostream using it.
class RangeBufHolder {
 protected:
  explicit RangeBufHolder(RangeReader reader) : buf_(std::move(reader)) {
  }

  RangeStreamBuf buf_;
};

class RangeIOStream : private RangeBufHolder, public Aws::IOStream {
 public:
  explicit RangeIOStream(RangeReader reader) : RangeBufHolder(std::move(reader)), Aws::IOStream(&buf_) {
  }
};

std::shared_ptr<Aws::IOStream> MakeBody(const ByteRange& body, const ProgressFn& progress, const util::CancellationToken& cancel) {
  return Aws::MakeShared<RangeIOStream>(kAllocationTag, RangeReader(body, progress, &cancel));
}

template <typename Outcome>
void ThrowIfFailed(const Outcome& outcome, const std::string& op, const model::Destination& destination) {
  if (outcome.IsSuccess()) {
    return;
  }
  const auto& error = outcome.GetError();
  throw util::TransportError(op + " " + destination.bucket + "/" + destination.key + ": " + std::string(error.GetExceptionName()) + ": " +
                             std::string(error.GetMessage()));
}

class StoreCallTimer {
 public:
  explicit StoreCallTimer(std::string_view op) : op_(op), span_(std::string("object_store.") + std::string(op)), start_(std::chrono::steady_clock::now()) {
  }

  ~StoreCallTimer() {
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    observability::Metrics::Instance().RecordStoreCall(op_, success_, elapsed);
  }

  observability::SpanScope& Span() {
    return span_;
  }

  void Succeeded() {
    success_ = true;
  }

 private:
  std::string_view                      op_;
  observability::SpanScope              span_;
  std::chrono::steady_clock::time_point start_;
  bool                                  success_ = false;
};

} // namespace

std::string EncodeTagging(const model::ObjectTags& tags) {
  std::string encoded;
  for (const auto& [key, value] : tags) {
    if (!encoded.empty()) encoded += '&';
    encoded += std::string(Aws::Utils::StringUtils::URLEncode(key.c_str()));
    encoded += '=';
    encoded += std::string(Aws::Utils::StringUtils::URLEncode(value.c_str()));
  }
  return encoded;
}

S3ObjectStore::S3ObjectStore(const S3ObjectStoreOptions& options) {
  AcquireSdk();

  Aws::Client::ClientConfiguration config;
  config.region           = options.region;
  config.scheme           = options.scheme == "http" ? Aws::Http::Scheme::HTTP : Aws::Http::Scheme::HTTPS;
  config.verifySSL        = options.verify_tls;
  config.connectTimeoutMs = static_cast<long>(options.connect_timeout_ms);
  config.requestTimeoutMs = static_cast<long>(options.request_timeout_ms);
  if (!options.endpoint.empty()) {
    config.endpointOverride = options.endpoint;
  }

  Aws::Auth::AWSCredentials credentials(options.access_key_id, options.secret_access_key, options.session_token);

  client_ = Aws::MakeShared<Aws::S3::S3Client>(kAllocationTag, credentials, config,
                                               Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, options.virtual_addressing);

  UPLOAD_LOG_INFO("s3 object store ready", {observability::StringField("endpoint", options.endpoint.empty() ? "aws" : options.endpoint),
                                             observability::StringField("region", options.region)});
}

S3ObjectStore::~S3ObjectStore() {
  client_.reset();
  ReleaseSdk();
}

std::string S3ObjectStore::InitiateMultipartUpload(const model::Destination& destination) {
  StoreCallTimer timer("initiate");
  timer.Span().SetAttribute("key", destination.key);

  s3model::CreateMultipartUploadRequest request;
  request.SetBucket(destination.bucket);
  request.SetKey(destination.key);
  if (!destination.tags.empty()) {
    request.SetTagging(EncodeTagging(destination.tags));
  }

  auto outcome = client_->CreateMultipartUpload(request);
  ThrowIfFailed(outcome, "CreateMultipartUpload", destination);
  timer.Succeeded();
  return std::string(outcome.GetResult().GetUploadId());
}

std::vector<RemotePart> S3ObjectStore::ListParts(const model::Destination& destination, const std::string& upload_id) {
  StoreCallTimer timer("list_parts");
  timer.Span().SetAttribute("upload_id", upload_id);

  std::vector<RemotePart> parts;
  int                     marker = 0;
  while (true) {
    s3model::ListPartsRequest request;
    request.SetBucket(destination.bucket);
    request.SetKey(destination.key);
    request.SetUploadId(upload_id);
    if (marker > 0) {
      request.SetPartNumberMarker(marker);
    }

    auto outcome = client_->ListParts(request);
    ThrowIfFailed(outcome, "ListParts", destination);

    const auto& result = outcome.GetResult();
    for (const auto& part : result.GetParts()) {
      parts.push_back(RemotePart{part.GetPartNumber(), std::string(part.GetETag()), static_cast<std::uint64_t>(part.GetSize())});
    }

    if (!result.GetIsTruncated()) {
      break;
    }
    marker = result.GetNextPartNumberMarker();
  }

  timer.Succeeded();
  return parts;
}

UploadedPart S3ObjectStore::UploadPart(const model::Destination& destination, const std::string& upload_id, int part_number,
                                       const ByteRange& body, const ProgressFn& progress, const util::CancellationToken& cancel) {
  StoreCallTimer timer("upload_part");
  timer.Span().SetAttribute("part_number", static_cast<std::int64_t>(part_number));

  s3model::UploadPartRequest request;
  request.SetBucket(destination.bucket);
  request.SetKey(destination.key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(part_number);
  request.SetContentLength(static_cast<long long>(body.length));
  request.SetBody(MakeBody(body, progress, cancel));
  request.SetContinueRequestHandler([&cancel](const Aws::Http::HttpRequest*) { return !cancel.IsCancelled(); });

  auto outcome = client_->UploadPart(request);
  if (cancel.IsCancelled()) {
    throw util::Cancelled();
  }
  ThrowIfFailed(outcome, "UploadPart", destination);

  const auto&  result = outcome.GetResult();
  UploadedPart part;
  part.part_number      = part_number;
  part.etag             = std::string(result.GetETag());
  part.size             = body.length;
  part.checksums.crc32  = std::string(result.GetChecksumCRC32());
  part.checksums.crc32c = std::string(result.GetChecksumCRC32C());
  part.checksums.sha1   = std::string(result.GetChecksumSHA1());
  part.checksums.sha256 = std::string(result.GetChecksumSHA256());

  observability::Metrics::Instance().AddUploadedBytes(body.length);
  timer.Succeeded();
  return part;
}

void S3ObjectStore::CompleteMultipartUpload(const model::Destination& destination, const std::string& upload_id,
                                            const std::vector<UploadedPart>& ordered_parts) {
  StoreCallTimer timer("complete");
  timer.Span().SetAttribute("parts", static_cast<std::int64_t>(ordered_parts.size()));

  s3model::CompletedMultipartUpload upload;
  for (const auto& part : ordered_parts) {
    s3model::CompletedPart completed;
    completed.SetPartNumber(part.part_number);
    completed.SetETag(part.etag);
    if (!part.checksums.crc32.empty()) completed.SetChecksumCRC32(part.checksums.crc32);
    if (!part.checksums.crc32c.empty()) completed.SetChecksumCRC32C(part.checksums.crc32c);
    if (!part.checksums.sha1.empty()) completed.SetChecksumSHA1(part.checksums.sha1);
    if (!part.checksums.sha256.empty()) completed.SetChecksumSHA256(part.checksums.sha256);
    upload.AddParts(std::move(completed));
  }

  s3model::CompleteMultipartUploadRequest request;
  request.SetBucket(destination.bucket);
  request.SetKey(destination.key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(std::move(upload));

  auto outcome = client_->CompleteMultipartUpload(request);
  ThrowIfFailed(outcome, "CompleteMultipartUpload", destination);
  timer.Succeeded();
}

void S3ObjectStore::PutObject(const model::Destination& destination, const ByteRange& body, const ProgressFn& progress,
                              const util::CancellationToken& cancel) {
  StoreCallTimer timer("put_object");
  timer.Span().SetAttribute("key", destination.key);

  s3model::PutObjectRequest request;
  request.SetBucket(destination.bucket);
  request.SetKey(destination.key);
  request.SetContentLength(static_cast<long long>(body.length));
  request.SetBody(MakeBody(body, progress, cancel));
  request.SetContinueRequestHandler([&cancel](const Aws::Http::HttpRequest*) { return !cancel.IsCancelled(); });
  if (!destination.tags.empty()) {
    request.SetTagging(EncodeTagging(destination.tags));
  }

  auto outcome = client_->PutObject(request);
  if (cancel.IsCancelled()) {
    throw util::Cancelled();
  }
  ThrowIfFailed(outcome, "PutObject", destination);

  observability::Metrics::Instance().AddUploadedBytes(body.length);
  timer.Succeeded();
}

} // namespace upload::storage
