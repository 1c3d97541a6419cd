#include "progress_monitor.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iostream>

namespace upload::progress {
namespace {

using model::UploadStatus;

// frames are skipped while more than this many events wait
constexpr std::size_t kRenderBacklogLimit = 4096;

std::string ProgressBar(const FileProgress& file, std::uint32_t width) {
  double percent = file.size == 0 ? 100.0 : static_cast<double>(file.bytes) * 100.0 / static_cast<double>(file.size);
  percent        = std::min(percent, 100.0);

  auto bar_width = static_cast<int>(width) - static_cast<int>(file.path.size()) - 12;
  bar_width      = std::max(bar_width, 10);
  auto filled    = std::min(static_cast<int>(percent * bar_width / 100.0), bar_width);

  std::string bar;
  for (int i = 0; i < filled; ++i) bar += "█";
  bar.append(static_cast<std::size_t>(bar_width - filled), '-');

  return fmt::format("{}: [{}] {:6.2f}%\n", file.path, bar, percent);
}

std::string_view StatusText(UploadStatus status) {
  switch (status) {
    case UploadStatus::kUnprocessed:
      return "Preparing for upload";
    case UploadStatus::kPreviouslyUploaded:
      return "Previously uploaded, skipping";
    case UploadStatus::kMultipartCompletionInProgress:
      return "Completing multipart upload";
    case UploadStatus::kUploadCompleted:
      return "Upload completed";
    case UploadStatus::kUploadFailed:
      return "Upload failed";
    case UploadStatus::kUploadInProgress:
      break;
  }
  return {};
}

} // namespace

Summary Summarize(const std::vector<FileProgress>& files) {
  Summary summary;
  summary.total = files.size();
  for (const auto& file : files) {
    switch (file.status) {
      case UploadStatus::kPreviouslyUploaded:
        ++summary.skipped;
        break;
      case UploadStatus::kUploadCompleted:
        ++summary.succeeded;
        break;
      case UploadStatus::kUploadFailed:
        ++summary.failed;
        break;
      default:
        break;
    }
  }
  return summary;
}

std::string RenderTable(const std::vector<FileProgress>& files, std::uint32_t width) {
  std::string out = "Upload Status:\n";
  for (const auto& file : files) {
    if (file.status == UploadStatus::kUploadInProgress) {
      out += ProgressBar(file, width);
      continue;
    }
    auto pad = std::max<int>(static_cast<int>(width) - static_cast<int>(file.path.size()) - 1, 0);
    out += fmt::format("{}:{:>{}}\n", file.path, StatusText(file.status), pad);
  }

  auto summary = Summarize(files);
  out += fmt::format("\nTotal: {}, Skipped: {}, Success: {}", summary.total, summary.skipped, summary.succeeded);
  if (summary.Remaining() > 0) {
    out += fmt::format(", Remaining: {}", summary.Remaining());
  }
  out += "\n";
  return out;
}

ProgressMonitor::ProgressMonitor(MonitorOptions options) : options_(options) {
  if (options_.out == nullptr) {
    options_.out = &std::cout;
  }
  auto fps        = std::max<std::uint32_t>(options_.fps, 1);
  frame_interval_ = std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::seconds(1)) / fps;
}

ProgressMonitor::~ProgressMonitor() {
  Stop();
}

void ProgressMonitor::Start() {
  if (options_.hidden || thread_.joinable()) return;
  thread_ = std::thread(&ProgressMonitor::Run, this);
}

void ProgressMonitor::Post(Event event) {
  if (options_.hidden) return;
  events_.Push(std::move(event));
}

void ProgressMonitor::Stop() {
  events_.Close();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ProgressMonitor::Run() {
  auto next_frame = std::chrono::steady_clock::now() + frame_interval_;

  while (true) {
    auto wait = std::max(next_frame - std::chrono::steady_clock::now(), std::chrono::steady_clock::duration::zero());
    if (auto event = events_.PopFor(wait)) {
      Apply(*event);
      while (auto more = events_.TryPop()) {
        Apply(*more);
      }
    } else if (events_.Closed() && events_.Size() == 0) {
      break;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= next_frame) {
      if (options_.ansi && events_.Size() < kRenderBacklogLimit) {
        Render();
      }
      next_frame = now + frame_interval_;
    }
  }

  Render();
}

FileProgress* ProgressMonitor::Find(model::FileId id) {
  auto it = index_.find(id);
  return it == index_.end() ? nullptr : &files_[it->second];
}

void ProgressMonitor::Apply(const Event& event) {
  if (const auto* add = std::get_if<AddFile>(&event)) {
    if (index_.count(add->id) > 0) return;
    index_[add->id] = files_.size();
    files_.push_back(FileProgress{add->path, add->size, 0, UploadStatus::kUnprocessed});
    return;
  }

  if (const auto* update = std::get_if<UpdateBytes>(&event)) {
    if (auto* file = Find(update->id)) {
      file->bytes = std::min(file->bytes + update->delta, file->size);
    }
    return;
  }

  const auto& change = std::get<StatusChange>(event);
  if (auto* file = Find(change.id)) {
    file->status = change.status;
    if (change.total) {
      file->size = *change.total;
    }
    if (change.uploaded_bytes) {
      file->bytes = std::min(*change.uploaded_bytes, file->size);
    }
  }
}

void ProgressMonitor::Render() {
  auto  frame = RenderTable(files_, options_.width);
  auto& out   = *options_.out;

  if (options_.ansi && last_frame_lines_ > 0) {
    // back to the top of the previous frame, clear to end of screen
    out << "\033[" << last_frame_lines_ << "A\r\033[J";
  }
  out << frame << std::flush;
  last_frame_lines_ = static_cast<std::size_t>(std::count(frame.begin(), frame.end(), '\n'));
}

} // namespace upload::progress
