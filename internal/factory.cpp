#include "factory.hpp"

#include <unistd.h>

#include <cstdlib>

#include "internal/observability/logging.hpp"
#include "internal/url/presigned_url.hpp"
#include "internal/util/byte_size.hpp"
#include "internal/util/errors.hpp"

namespace upload::factory {

using upload::runtime::config::RuntimeConfig;

namespace {

constexpr std::uint32_t kDefaultThreads  = 4;
constexpr std::uint64_t kDefaultPartSize = 128 * util::kMiB;
constexpr std::uint64_t kDefaultWindow   = 1 * util::kGiB;

std::uint64_t SizeOr(const std::string& text, std::uint64_t fallback, const char* field) {
  if (text.empty()) return fallback;
  try {
    return util::ParseByteSize(text);
  } catch (const util::InvalidArgument& e) {
    throw util::InvalidArgument(std::string("upload.") + field + ": " + e.what());
  }
}

std::string EnvOr(const std::string& value, const char* env) {
  if (!value.empty()) return value;
  const char* from_env = std::getenv(env);
  return from_env ? from_env : "";
}

} // namespace

engine::EngineOptions BuildEngineOptions(const RuntimeConfig& config) {
  const auto& upload = config.upload();

  engine::EngineOptions options;
  options.threads             = upload.threads() > 0 ? upload.threads() : kDefaultThreads;
  options.part_size           = SizeOr(upload.part_size(), kDefaultPartSize, "part_size");
  options.multipart_threshold = SizeOr(upload.multipart_threshold(), options.part_size, "multipart_threshold");
  options.window_bytes        = SizeOr(upload.window_size(), kDefaultWindow, "window_size");
  options.record_tag_key      = upload.record_tag_key().empty() ? url::kDefaultRecordTagKey : upload.record_tag_key();

  if (options.part_size == 0) {
    throw util::InvalidArgument("upload.part_size must be positive");
  }
  if (options.part_size < 5 * util::kMiB) {
    UPLOAD_LOG_WARN("part size below the 5MiB S3 minimum; only stores without that limit will accept it",
                    {observability::BytesField("part_size", options.part_size)});
  }
  if (options.window_bytes == 0) {
    throw util::InvalidArgument("upload.window_size must be positive");
  }
  return options;
}

std::filesystem::path ResolveCacheDir(const RuntimeConfig& config) {
  if (!config.upload().cache_dir().empty()) {
    return config.upload().cache_dir();
  }
  if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "upload-engine";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".cache" / "upload-engine";
  }
  throw util::InvalidArgument("upload.cache_dir is unset and HOME is not defined");
}

progress::MonitorOptions BuildMonitorOptions(const RuntimeConfig& config) {
  const auto& monitor = config.monitor();

  progress::MonitorOptions options;
  options.hidden = monitor.hidden();
  options.fps    = monitor.fps() > 0 ? monitor.fps() : 4;
  options.width  = monitor.width() > 0 ? monitor.width() : 100;
  options.ansi   = ::isatty(STDOUT_FILENO) == 1;
  return options;
}

storage::S3ObjectStoreOptions BuildObjectStoreOptions(const RuntimeConfig& config) {
  const auto& store = config.object_store();

  storage::S3ObjectStoreOptions options;
  options.endpoint          = store.endpoint();
  options.region            = EnvOr(store.region(), "AWS_REGION");
  options.scheme            = store.scheme().empty() ? "https" : store.scheme();
  options.access_key_id     = EnvOr(store.access_key_id(), "AWS_ACCESS_KEY_ID");
  options.secret_access_key = EnvOr(store.secret_access_key(), "AWS_SECRET_ACCESS_KEY");
  options.session_token     = EnvOr(store.session_token(), "AWS_SESSION_TOKEN");
  options.verify_tls        = !store.skip_tls_verify();
  if (store.connect_timeout_ms() > 0) options.connect_timeout_ms = store.connect_timeout_ms();
  if (store.request_timeout_ms() > 0) options.request_timeout_ms = store.request_timeout_ms();
  options.virtual_addressing = store.virtual_addressing();

  if (options.region.empty()) {
    options.region = "us-east-1";
  }
  if (options.scheme != "http" && options.scheme != "https") {
    throw util::InvalidArgument("object_store.scheme must be http or https, got " + options.scheme);
  }
  return options;
}

std::vector<planner::UploadRequest> BuildRequests(const upload::v1::UploadManifest& manifest) {
  std::vector<planner::UploadRequest> requests;
  requests.reserve(manifest.files_size());

  for (const auto& entry : manifest.files()) {
    if (entry.path().empty()) {
      throw util::InvalidArgument("manifest entry without a path");
    }

    planner::UploadRequest request;
    request.path       = entry.path();
    request.upload_url = entry.upload_url();
    if (!entry.sha256().empty()) {
      request.local = util::LocalFile{entry.size(), entry.sha256()};
    }
    if (entry.has_remote() && !entry.remote().sha256().empty()) {
      request.remote = util::LocalFile{entry.remote().size(), entry.remote().sha256()};
    }
    requests.push_back(std::move(request));
  }
  return requests;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, storage::ObjectStorePtr store) {
  Application app;

  auto options = BuildEngineOptions(config);

  app.store       = store ? std::move(store) : std::make_shared<storage::S3ObjectStore>(BuildObjectStoreOptions(config));
  app.checkpoints = std::make_shared<checkpoint::CheckpointStore>(ResolveCacheDir(config));
  app.monitor     = std::make_shared<progress::ProgressMonitor>(BuildMonitorOptions(config));
  app.engine      = std::make_unique<engine::UploadEngine>(options, app.store, app.checkpoints, app.monitor);

  UPLOAD_LOG_DEBUG("runtime built", {observability::StringField("cache_dir", app.checkpoints->CacheDir().string()),
                                     observability::IntField("threads", static_cast<std::int64_t>(options.threads))});
  return app;
}

} // namespace upload::factory
