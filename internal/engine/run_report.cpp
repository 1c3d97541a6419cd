#include "run_report.hpp"

#include <spdlog/fmt/fmt.h>

namespace upload::engine {

std::size_t RunReport::Count(model::UploadStatus status) const {
  std::size_t count = 0;
  for (const auto& file : files) {
    if (file.status == status) ++count;
  }
  return count;
}

std::string RunReport::FailureReport() const {
  auto failed = Failed();
  if (failed == 0) return {};

  std::string out = fmt::format("\n{} files failed to upload\n", failed);
  for (const auto& file : files) {
    if (file.status != model::UploadStatus::kUploadFailed) continue;
    out += fmt::format("Upload {} failed with: \n{}\n\n", file.path, file.error);
  }
  return out;
}

std::string RunReport::Summary() const {
  std::string out;
  for (const auto& file : files) {
    out += fmt::format("{}: {}\n", file.path, model::ToString(file.status));
  }
  return out;
}

std::string RunReport::Render() const {
  return Summary() + FailureReport();
}

} // namespace upload::engine
