#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/byte_size.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "upload_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestRuntimeConfigIsParsed() {
  const auto yaml_path = WriteYaml("runtime", R"(logging:
  level: debug
upload:
  threads: 8
  part_size: "64MiB"
  window_size: 512MiB
  cache_dir: "/var/cache/uploads"
object_store:
  endpoint: "minio.local:9000"
  scheme: http
  skip_tls_verify: true
monitor:
  hidden: true
)");

  auto config = upload::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.upload().threads() == 8);
  assert(config.upload().part_size() == "64MiB");
  assert(config.upload().window_size() == "512MiB");
  assert(config.object_store().endpoint() == "minio.local:9000");
  assert(config.object_store().skip_tls_verify());
  assert(config.monitor().hidden());

  auto options = upload::factory::BuildEngineOptions(config);
  assert(options.threads == 8);
  assert(options.part_size == 64 * upload::util::kMiB);
  assert(options.multipart_threshold == options.part_size);
  assert(options.window_bytes == 512 * upload::util::kMiB);
  assert(upload::factory::ResolveCacheDir(config) == "/var/cache/uploads");

  auto store = upload::factory::BuildObjectStoreOptions(config);
  assert(store.scheme == "http");
  assert(!store.verify_tls);
}

void TestQuotedNumbersStayStrings() {
  auto config = upload::config::ConfigLoader::ParseYaml(R"(upload:
  part_size: "4096"
  record_tag_key: "X-RECORD"
)");
  assert(config.upload().part_size() == "4096");
  assert(upload::factory::BuildEngineOptions(config).part_size == 4096);
  assert(upload::factory::BuildEngineOptions(config).record_tag_key == "X-RECORD");
}

void TestEmptyConfigGetsDefaults() {
  auto config  = upload::config::ConfigLoader::ParseYaml("");
  auto options = upload::factory::BuildEngineOptions(config);

  assert(options.threads == 4);
  assert(options.part_size == 128 * upload::util::kMiB);
  assert(options.multipart_threshold == 128 * upload::util::kMiB);
  assert(options.window_bytes == upload::util::kGiB);
  assert(options.record_tag_key == "X-COS-RECORD-ID");

  auto store = upload::factory::BuildObjectStoreOptions(config);
  assert(store.scheme == "https");
  assert(store.verify_tls);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(upload:
  threads: 1
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)upload::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidSizesAreRejected() {
  for (const std::string yaml : {"upload:\n  part_size: \"12 parsecs\"\n", "upload:\n  window_size: \"0\"\n",
                                 "object_store:\n  scheme: ftp\n"}) {
    auto config = upload::config::ConfigLoader::ParseYaml(yaml);

    bool threw = false;
    try {
      (void)upload::factory::BuildEngineOptions(config);
      (void)upload::factory::BuildObjectStoreOptions(config);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw && "invalid upload settings must be rejected");
  }
}

void TestManifestIsParsed() {
  const auto yaml_path = WriteYaml("manifest", R"(files:
  - path: /data/a.bam
    upload_url: "https://s3.local/bucket/a.bam?X-Amz-Tagging=X-COS-RECORD-ID%3Drec-1"
  - path: /data/b.bam
    upload_url: "https://s3.local/bucket/b.bam"
    sha256: "abc"
    size: 42
    remote:
      sha256: "abc"
      size: 42
)");

  auto manifest = upload::config::ConfigLoader::LoadManifest(yaml_path.string());
  assert(manifest.files_size() == 2);

  auto requests = upload::factory::BuildRequests(manifest);
  assert(requests.size() == 2);
  assert(requests[0].path == "/data/a.bam");
  assert(!requests[0].local.has_value());
  assert(!requests[0].remote.has_value());
  assert(requests[1].local.has_value() && requests[1].local->size == 42);
  assert(requests[1].remote.has_value() && requests[1].remote->sha256 == "abc");
}

} // namespace

int main() {
  TestRuntimeConfigIsParsed();
  TestQuotedNumbersStayStrings();
  TestEmptyConfigGetsDefaults();
  TestUnknownFieldsAreRejected();
  TestInvalidSizesAreRejected();
  TestManifestIsParsed();

  std::cout << "upload_engine_unit_config_loader: pass\n";
  return 0;
}
