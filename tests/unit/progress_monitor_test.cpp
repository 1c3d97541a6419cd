#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/progress/progress_monitor.hpp"

namespace {

using upload::model::UploadStatus;
using upload::progress::FileProgress;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestSummaryCounts() {
  std::vector<FileProgress> files = {
      {"a", 10, 10, UploadStatus::kUploadCompleted},   {"b", 10, 0, UploadStatus::kPreviouslyUploaded},
      {"c", 10, 3, UploadStatus::kUploadInProgress},   {"d", 10, 0, UploadStatus::kUploadFailed},
      {"e", 10, 0, UploadStatus::kUnprocessed},
  };

  auto summary = upload::progress::Summarize(files);
  assert(summary.total == 5);
  assert(summary.skipped == 1);
  assert(summary.succeeded == 1);
  assert(summary.failed == 1);
  // failed files still count as remaining
  assert(summary.Remaining() == 3);
}

void TestTableShowsStatusesAndBars() {
  std::vector<FileProgress> files = {
      {"done.bin", 10, 10, UploadStatus::kUploadCompleted},
      {"half.bin", 200, 100, UploadStatus::kUploadInProgress},
      {"skip.bin", 10, 0, UploadStatus::kPreviouslyUploaded},
      {"closing.bin", 10, 10, UploadStatus::kMultipartCompletionInProgress},
  };

  auto table = upload::progress::RenderTable(files, 60);
  assert(table.rfind("Upload Status:\n", 0) == 0);
  assert(Contains(table, "done.bin:"));
  assert(Contains(table, "Upload completed\n"));
  assert(Contains(table, "Previously uploaded, skipping\n"));
  assert(Contains(table, "Completing multipart upload\n"));
  assert(Contains(table, "half.bin: ["));
  assert(Contains(table, " 50.00%\n"));
  assert(Contains(table, "\nTotal: 4, Skipped: 1, Success: 1, Remaining: 2\n"));
}

void TestRemainingIsOmittedWhenEverythingFinished() {
  std::vector<FileProgress> files = {
      {"a", 1, 1, UploadStatus::kUploadCompleted},
      {"b", 1, 0, UploadStatus::kPreviouslyUploaded},
  };
  auto table = upload::progress::RenderTable(files, 40);
  assert(Contains(table, "Total: 2, Skipped: 1, Success: 1\n"));
  assert(!Contains(table, "Remaining"));
}

void TestMonitorAppliesEventsInOrder() {
  std::ostringstream out;

  upload::progress::MonitorOptions options;
  options.fps  = 50;
  options.ansi = false;
  options.out  = &out;

  upload::progress::ProgressMonitor monitor(options);
  monitor.Start();

  monitor.Post(upload::progress::AddFile{0, "first.bin", 0});
  monitor.Post(upload::progress::AddFile{1, "second.bin", 0});
  monitor.Post(upload::progress::StatusChange{0, UploadStatus::kUploadInProgress, 100, 40});
  monitor.Post(upload::progress::UpdateBytes{0, 30});
  // clamped to the file size
  monitor.Post(upload::progress::UpdateBytes{0, 500});
  // unknown ids are ignored
  monitor.Post(upload::progress::UpdateBytes{7, 5});
  monitor.Post(upload::progress::StatusChange{1, UploadStatus::kUploadFailed, 10, std::nullopt});
  monitor.Stop();

  const auto& files = monitor.Files();
  assert(files.size() == 2);
  assert(files[0].path == "first.bin");
  assert(files[0].size == 100);
  assert(files[0].bytes == 100);
  assert(files[1].status == UploadStatus::kUploadFailed);

  // without ANSI only the final frame is written
  auto rendered = out.str();
  assert(rendered.find("Upload Status:") == rendered.rfind("Upload Status:"));
  assert(Contains(rendered, "Upload failed\n"));
}

void TestHiddenMonitorDropsEvents() {
  std::ostringstream out;

  upload::progress::MonitorOptions options;
  options.hidden = true;
  options.out    = &out;

  upload::progress::ProgressMonitor monitor(options);
  monitor.Start();
  monitor.Post(upload::progress::AddFile{0, "x", 1});
  monitor.Stop();

  assert(monitor.Files().empty());
  assert(out.str().empty());
}

} // namespace

int main() {
  TestSummaryCounts();
  TestTableShowsStatusesAndBars();
  TestRemainingIsOmittedWhenEverythingFinished();
  TestMonitorAppliesEventsInOrder();
  TestHiddenMonitorDropsEvents();

  std::cout << "upload_engine_unit_progress_monitor: pass\n";
  return 0;
}
