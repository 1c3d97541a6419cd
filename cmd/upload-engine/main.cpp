#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

static volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

static void Shutdown() {
  upload::observability::ShutdownLogging();
  upload::observability::ShutdownMetrics();
  upload::observability::ShutdownTracing();
}

static void PrintUsage() {
  std::cerr << "Usage: upload-engine --config <config.yaml> --manifest <manifest.yaml>" << std::endl;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string manifest_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--manifest" && i + 1 < argc) {
      manifest_path = argv[++i];
    } else {
      PrintUsage();
      return 2;
    }
  }
  if (config_path.empty() || manifest_path.empty()) {
    PrintUsage();
    return 2;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config   = upload::config::ConfigLoader::LoadFromYaml(config_path);
    auto manifest = upload::config::ConfigLoader::LoadManifest(manifest_path);

    upload::observability::InitializeTracing(config);
    upload::observability::InitializeMetrics(config);
    upload::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app      = upload::factory::Build(config);
    auto requests = upload::factory::BuildRequests(manifest);

    // Register signal handlers before starting the run to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> finished{false};
    std::thread       watcher([&] {
      while (!finished.load()) {
        if (g_interrupted) {
          UPLOAD_LOG_WARN("interrupted, cancelling uploads");
          app.engine->Cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    upload::engine::RunReport report;
    try {
      report = app.engine->Run(requests);
    } catch (const std::exception&) {
      finished = true;
      watcher.join();
      throw;
    }
    finished = true;
    watcher.join();

    std::cout << report.Render() << std::flush;

    Shutdown();
    return report.AllSucceeded() ? 0 : 1;
  } catch (const std::exception& e) {
    UPLOAD_LOG_ERROR("Fatal error", {upload::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }
}
