// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <thread>

#include "chunk_uploader.hpp"
#include "config_parser.hpp"
#include "hardware_id.hpp"
#include "http_transport.hpp"
#include "recording_lifecycle.hpp"
#include "remote_upload_client.hpp"
#include "upload_manager.hpp"
#include "upload_orchestrator.hpp"
#include "uploader_impl.hpp"

#define CAPSULE_LOG_COMPONENT "main"
#include <capsule_log_init.hpp>
#include <capsule_log_macros.hpp>

namespace capsule {
namespace uploader {

namespace {

std::atomic<bool> g_should_exit(false);

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_should_exit.store(true);
  }
}

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [OPTIONS]\n"
    << "\n"
    << "Capsule Uploader - resumable chunked upload of gameplay recordings\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH          Path to YAML configuration file\n"
    << "  --recordings DIR       Directory holding one folder per recording\n"
    << "  --api-url URL          Base URL of the upload API\n"
    << "  --api-key KEY          API key (default: CAPSULE_API_KEY)\n"
    << "  --unreliable           Request small chunks for flaky connections\n"
    << "  --delete-uploaded      Delete a recording folder once it is uploaded\n"
    << "  --once                 Upload pending recordings once and exit\n"
    << "  --help                 Show this help message\n"
    << "\n"
    << "Command-line arguments OVERRIDE config file values.\n"
    << "Ctrl+C pauses the running upload at the next chunk boundary and exits;\n"
    << "the next run resumes it.\n"
    << "\n"
    << "Examples:\n"
    << "  " << program_name << " --config config/capsule_uploader.yaml\n"
    << "  " << program_name << " --recordings /data/recordings \\\n"
    << "    --api-url https://api.example.com --once\n"
    << std::endl;
}

void print_progress(const ProgressData& data) {
  std::cout << "\r" << data.file_progress.current_file << ": " << std::fixed
            << std::setprecision(1) << data.percent << "% (" << std::setprecision(2)
            << data.speed_mbps << " MiB/s, eta " << std::setprecision(0) << data.eta_seconds
            << " s, " << data.file_progress.files_remaining << " left)   " << std::flush;
}

void print_event(const UploadEvent& event) {
  switch (event.type) {
    case UploadEventType::STARTED:
      std::cout << "\nUploading " << event.folder << " (" << event.message << ")" << std::endl;
      break;
    case UploadEventType::SUCCEEDED:
      std::cout << "\nUploaded " << event.folder << std::endl;
      break;
    case UploadEventType::SERVER_INVALID:
      std::cout << "\nRejected by server: " << event.folder << ": " << event.message << std::endl;
      break;
    case UploadEventType::PAUSED:
      std::cout << "\nPaused " << event.folder << std::endl;
      break;
    case UploadEventType::FAILED:
      std::cerr << "\nUpload of " << event.folder << " failed: " << event.message << std::endl;
      if (event.network_error) {
        std::cerr << "Check your internet connection and try again." << std::endl;
      }
      break;
    case UploadEventType::BATCH_FINISHED:
      break;
  }
}

// Run one batch, pausing it when a signal arrives
BatchStats run_one_batch(UploadManager& manager) {
  manager.upload_all();
  while (manager.is_running()) {
    if (g_should_exit.load()) {
      manager.pause();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  manager.wait();
  return manager.last_batch();
}

}  // namespace

}  // namespace uploader
}  // namespace capsule

int main(int argc, char* argv[]) {
  using namespace capsule::uploader;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  std::string config_file;
  std::string cli_recordings;
  std::string cli_api_url;
  std::string cli_api_key;
  bool cli_unreliable = false;
  bool cli_delete_uploaded = false;
  bool once = false;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--config") == 0) {
      if (i + 1 < argc) {
        config_file = argv[++i];
      } else {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--recordings") == 0) {
      if (i + 1 < argc) {
        cli_recordings = argv[++i];
      } else {
        std::cerr << "Error: --recordings requires a directory argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--api-url") == 0) {
      if (i + 1 < argc) {
        cli_api_url = argv[++i];
      } else {
        std::cerr << "Error: --api-url requires a URL argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--api-key") == 0) {
      if (i + 1 < argc) {
        cli_api_key = argv[++i];
      } else {
        std::cerr << "Error: --api-key requires a key argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--unreliable") == 0) {
      cli_unreliable = true;
    } else if (strcmp(argv[i], "--delete-uploaded") == 0) {
      cli_delete_uploaded = true;
    } else if (strcmp(argv[i], "--once") == 0) {
      once = true;
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  UploaderConfig config;
  if (!config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << config_file
                << "': " << parser.get_last_error() << std::endl;
      return 1;
    }
  }

  if (!cli_recordings.empty()) {
    config.recordings.directory = cli_recordings;
  }
  if (!cli_api_url.empty()) {
    config.api.base_url = cli_api_url;
  }
  if (!cli_api_key.empty()) {
    config.api.api_key = cli_api_key;
  }
  if (cli_unreliable) {
    config.upload.unreliable_connection = true;
  }
  if (cli_delete_uploaded) {
    config.recordings.delete_uploaded = true;
  }
  ConfigParser::apply_env_overrides(config);

  std::string error;
  if (!ConfigParser::validate(config, error)) {
    std::cerr << "Error: " << error << std::endl;
    print_usage(argv[0]);
    return 1;
  }

  capsule::logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  capsule::logging::apply_env_overrides(log_config);
  capsule::logging::init_logging(log_config);

  CAPSULE_LOG_INFO(
    "Capsule uploader starting" << capsule::logging::kv("recordings", config.recordings.directory)
                                << capsule::logging::kv("api", config.api.base_url)
                                << capsule::logging::kv(
                                     "unreliable", config.upload.unreliable_connection
                                   )
                                << capsule::logging::kv("once", once)
  );

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int exit_code = 0;
  {
    FileSystemImpl fs;
    FileStreamFactoryImpl streams;
    BeastHttpTransport transport(make_transport_config(config.api));
    RemoteUploadClient client(config.api.base_url, config.api.api_key, transport);
    RecordingLifecycle lifecycle(fs);
    ChunkUploader chunk_uploader(client, transport, make_retry_config(config.upload));
    UploadOrchestrator orchestrator(
      client, chunk_uploader, lifecycle, streams, fs, make_orchestrator_config(config.upload),
      [&fs]() {
        return read_hardware_id(fs);
      }
    );

    UploadManagerConfig manager_config;
    manager_config.recordings_directory = config.recordings.directory;
    manager_config.delete_uploaded = config.recordings.delete_uploaded;
    UploadManager manager(manager_config, orchestrator, lifecycle, client);
    manager.set_event_callback(print_event);
    manager.set_progress_callback(print_progress);

    while (!g_should_exit.load()) {
      auto stats = run_one_batch(manager);
      std::cout << "\nBatch: " << stats.succeeded << " uploaded, " << stats.failed << " failed, "
                << stats.server_invalid << " rejected" << (stats.paused ? ", paused" : "")
                << std::endl;
      if (once) {
        exit_code = stats.failed > 0 ? 1 : 0;
        break;
      }

      const auto next_scan =
        std::chrono::steady_clock::now() + std::chrono::seconds(config.recordings.scan_interval_sec);
      while (!g_should_exit.load() && std::chrono::steady_clock::now() < next_scan) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
    }
  }

  CAPSULE_LOG_INFO("Capsule uploader stopped");
  capsule::logging::shutdown_logging();
  return exit_code;
}
