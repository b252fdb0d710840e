//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <spdlog/spdlog.h>

#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <memory>
#include <string>
#include <thread>
#include <variant>

#include "app/job_orchestrator.hpp"
#include "app/local_staging_source.hpp"
#include "app/webdav_source.hpp"
#include "config/app_config.hpp"
#include "io/webdav/webdav_client.hpp"
#include "media/metadata_extractor.hpp"
#include "media/reverse_geocoder.hpp"
#include "renderer/asset_renderer.hpp"
#include "storage/controller/library/library_controller.hpp"
#include "storage/media_store.hpp"

namespace po = boost::program_options;

namespace {
constexpr int kExitOk             = 0;
constexpr int kExitFailure        = 1;
constexpr int kExitAlreadyRunning = 2;

std::atomic<bool> interrupted{false};

void OnSignal(int) { interrupted = true; }

auto StatusJson(const momento::JobStatus& status) -> nlohmann::json {
  return std::visit([](const auto& s) { return s.ToJson(); }, status);
}

auto StatusState(const momento::JobStatus& status) -> momento::JobState {
  return std::visit([](const auto& s) { return s.state_; }, status);
}

void PrintProgress(const momento::JobStatus& status) {
  if (const auto* import_status = std::get_if<momento::ImportJobStatus>(&status)) {
    spdlog::info("import: {}/{} files, {} imported, {} duplicates, {} failed",
                 import_status->processed_files_, import_status->total_files_,
                 import_status->successful_imports_, import_status->skipped_duplicates_,
                 import_status->failed_imports_);
  } else {
    const auto& regen = std::get<momento::RegenerationJobStatus>(status);
    spdlog::info("regeneration: {}/{} media, {} metadata, {} thumbnails, {} failed",
                 regen.processed_media_, regen.total_media_, regen.updated_metadata_,
                 regen.generated_thumbnails_, regen.failed_media_);
  }
}

auto MakeSource(const std::string& command, const momento::AppConfig& config,
                const momento::MediaStore& store) -> std::shared_ptr<momento::ImportSource> {
  if (command == "import-webdav") {
    if (!config.webdav_.enabled_) {
      throw std::runtime_error("WebDAV import is disabled in the configuration");
    }
    auto client = std::make_unique<momento::WebDavClient>(config.webdav_);
    return std::make_shared<momento::WebDavSource>(std::move(client), store.DownloadDir());
  }
  return std::make_shared<momento::LocalStagingSource>(store.StagingDir(),
                                                       config.import_.remove_duplicates_);
}

auto Run(const std::string& command, const momento::AppConfig& config, bool missing_only)
    -> int {
  auto store = std::make_shared<momento::MediaStore>(config.storage_.data_root_);
  store->EnsureLayout();
  auto repository =
      std::make_shared<momento::LibraryController>(config.storage_.DatabasePath());

  std::shared_ptr<momento::ReverseGeocoder> geocoder;
  if (config.reverse_geocoding_.enabled_) {
    geocoder = std::make_shared<momento::NominatimGeocoder>(config.reverse_geocoding_);
  }
  momento::JobOrchestrator orchestrator(
      repository, store, std::make_shared<momento::ExivMetadataExtractor>(),
      std::make_shared<momento::OpenCVAssetRenderer>(config.previews_), geocoder, config);

  if (command == "status") {
    std::cout << StatusJson(orchestrator.GetStatus()).dump(2) << std::endl;
    return kExitOk;
  }

  momento::JobStartResult started;
  if (command == "import-local" || command == "import-webdav") {
    started = orchestrator.StartImport(MakeSource(command, config, *store));
  } else if (command == "regenerate") {
    started = orchestrator.StartRegeneration(missing_only);
  } else if (command == "reset") {
    started = orchestrator.ResetLibrary();
  } else {
    spdlog::error("Unknown command '{}'", command);
    return kExitFailure;
  }

  if (started == momento::JobStartResult::ALREADY_RUNNING) {
    spdlog::error("A job is already running");
    return kExitAlreadyRunning;
  }
  if (started == momento::JobStartResult::SOURCE_UNAVAILABLE) {
    std::cout << StatusJson(orchestrator.GetStatus()).dump(2) << std::endl;
    return kExitFailure;
  }

  bool cancel_sent = false;
  while (!orchestrator.WaitForIdle(std::chrono::seconds(2))) {
    if (interrupted.load() && !cancel_sent) {
      orchestrator.Cancel();
      cancel_sent = true;
    }
    PrintProgress(orchestrator.GetStatus());
  }

  auto final_status = orchestrator.GetStatus();
  std::cout << StatusJson(final_status).dump(2) << std::endl;
  return StatusState(final_status) == momento::JobState::FAILED ? kExitFailure : kExitOk;
}
}  // namespace

int main(int argc, char* argv[]) {
  po::options_description desc("momento_ingest options");
  // clang-format off
  desc.add_options()
    ("help,h", "produce help message")
    ("config,c", po::value<std::string>()->default_value("momento.json")->value_name("path"),
     "configuration file")
    ("command", po::value<std::string>()->value_name("name"),
     "import-local | import-webdav | regenerate | reset | status")
    ("missing-only", po::bool_switch()->default_value(false),
     "regenerate only rows without dimensions or thumbnail");
  // clang-format on
  po::positional_options_description positional;
  positional.add("command", 1);

  po::variables_map args;
  try {
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
              args);
    po::notify(args);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << desc << std::endl;
    return kExitFailure;
  }

  if (args.count("help") > 0 || args.count("command") == 0) {
    std::cout << desc << std::endl;
    return args.count("help") > 0 ? kExitOk : kExitFailure;
  }

  try {
    auto config = momento::AppConfig::LoadFromFile(args["config"].as<std::string>());
    spdlog::set_level(spdlog::level::from_str(config.logging_.level_));

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);
    return Run(args["command"].as<std::string>(), config, args["missing-only"].as<bool>());
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return kExitFailure;
  }
}
