#include "app/application.hpp"
#include "app/config.hpp"
#include "app/local_destination.hpp"
#include "transfer/search_session.hpp"
#include "transfer/simulated_protocol_client.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <thread>

using namespace discofill;

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --config=<file>       JSON config file\n"
      << "  --username=<name>     P2P network user name\n"
      << "  --password=<pass>     P2P network password\n"
      << "  --download-dir=<path> Download directory (default: ~/Downloads/Soulseek)\n"
      << "  --simulate            Use the in-memory demo network\n"
      << "\n"
      << "Actions:\n"
      << "  --search=<query>      Search and list results\n"
      << "  --sort=<key>          arrival, size, speed, quality, queue (default: quality)\n"
      << "  --wait=<ms>           How long to collect results (default: 3000)\n"
      << "  --download=<n>        Download result n of the listing\n"
      << "  --folder              With --download: fetch the result's whole folder\n"
      << "  --discography=<mbid>  List an artist's release groups and releases\n"
      << "  --artist=<name>       Same, looking the artist up by name\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>    trace, debug, info, warn, error, critical (default: info)\n"
      << "  --debug=<component>   Trace logging for transfer, search, catalog, app, all\n"
      << "                        Can be comma-separated: --debug=transfer,search\n"
      << "\n"
      << "Other:\n"
      << "  --version             Show version information\n"
      << "  --help                Show this help message\n"
      << std::endl;
}

bool parse_sort(const std::string &name, transfer::SortOrder &order) {
  if (name == "arrival") {
    order = {transfer::SortKey::Arrival, false};
  } else if (name == "size") {
    order = {transfer::SortKey::Size, true};
  } else if (name == "speed") {
    order = {transfer::SortKey::Speed, true};
  } else if (name == "quality") {
    order = {transfer::SortKey::Quality, true};
  } else if (name == "queue") {
    order = {transfer::SortKey::QueueLength, false};
  } else {
    return false;
  }
  return true;
}

// A couple of peers sharing two albums, for --simulate
void seed_demo_network(transfer::SimulatedProtocolClient &network) {
  const char *tracks[] = {"01 - Intro", "02 - Harbour Lights", "03 - Undertow",
                          "04 - Long Way Home"};
  uint32_t n = 0;
  for (const char *track : tracks) {
    ++n;
    network.AddFile("vinylhead", std::string("Music\\Example Band\\2019 - Tidal\\") +
                                     track + ".flac",
                    30000000 + n * 1000000, std::nullopt, true);
    network.AddFile("mp3fan", std::string("shared/Example Band - Tidal/") + track +
                                  ".mp3",
                    8000000 + n * 250000, 320);
  }
  network.AddFile("vinylhead", "Music\\Example Band\\2019 - Tidal\\cover.jpg", 250000);
  network.AddFile("vinylhead", "Music\\Example Band\\2019 - Tidal\\Tidal.cue", 2000);
  network.AddFile("lofi", "incoming/example band - undertow.mp3", 4000000, 128);
}

void print_result(size_t index, const transfer::SearchResult &r) {
  std::cout << std::setw(3) << index << ". [" << ToString(transfer::ClassifyQuality(r))
            << "] " << r.file_path << "  (" << r.peer << ", "
            << (r.size_bytes / 1024) << " KiB";
  if (r.bitrate_kbps) {
    std::cout << ", " << *r.bitrate_kbps << " kbps";
  }
  std::cout << ", queue " << r.queue_length << ")\n";
}

void print_transfer(const transfer::Transfer &t) {
  std::cout << "  #" << t.id << " " << ToString(t.state) << " "
            << t.remote_path;
  if (t.state == transfer::TransferState::Completed) {
    std::cout << " -> " << t.local_path << " [match " << ToString(t.match_status)
              << "]";
  }
  if (!t.error.empty()) {
    std::cout << " (" << t.error << ")";
  }
  std::cout << "\n";
}

bool all_settled(const std::vector<transfer::Transfer> &transfers) {
  for (const auto &t : transfers) {
    if (!transfer::IsTerminal(t.state) ||
        (t.state == transfer::TransferState::Completed &&
         t.match_status == transfer::MatchStatus::Pending)) {
      return false;
    }
  }
  return true;
}

int run_discography(app::Application &app, const std::string &artist_id,
                    const std::string &artist_name) {
  auto future = artist_id.empty() ? app.FetchDiscographyByName(artist_name)
                                  : app.FetchDiscography(artist_id);
  catalog::DiscographyResult result;
  try {
    result = future.get();
  } catch (const catalog::CatalogError &e) {
    std::cerr << "Catalog error: " << e.what() << std::endl;
    return 1;
  }

  for (const auto &node : result.nodes) {
    const bool group = node.type == catalog::NodeType::ReleaseGroup;
    std::cout << (group ? "" : "    ") << node.title;
    if (node.date) {
      std::cout << " (" << *node.date << ")";
    }
    if (group && node.primary_type) {
      std::cout << " [" << *node.primary_type << "]";
    }
    std::cout << "  " << node.id << "\n";
  }
  std::cout << result.nodes.size() << " entries, " << result.total_requests()
            << " requests\n";
  if (result.truncated) {
    std::cout << "Incomplete listing:\n";
    for (const auto &error : result.errors) {
      std::cout << "  " << error << "\n";
    }
    return 2;
  }
  return 0;
}

int run_search(app::Application &app, const std::string &query,
               const transfer::SortOrder &order, std::chrono::milliseconds wait,
               int download_index, bool whole_folder) {
  auto &engine = app.orchestrator();
  const transfer::SessionId session = engine.open_session();

  auto subscription = engine.subscribe(session, [](const transfer::SessionEvent &event) {
    if (event.type == transfer::SessionEventType::Status) {
      std::cout << "* " << event.message << std::endl;
    }
  });

  engine.start_search(session, query);
  std::this_thread::sleep_for(wait);

  const auto results = engine.search_results(session, order);
  for (size_t i = 0; i < results.size(); ++i) {
    print_result(i + 1, results[i]);
  }
  if (results.empty()) {
    std::cout << "No results." << std::endl;
  }

  if (download_index <= 0) {
    return 0;
  }
  if (static_cast<size_t>(download_index) > results.size()) {
    std::cerr << "No result #" << download_index << std::endl;
    return 1;
  }

  const auto &chosen = results[download_index - 1];
  auto destination = std::make_shared<app::LocalFileDestination>(query);
  if (whole_folder) {
    const auto group = app.RequestFolderDownload(session, chosen, destination);
    std::cout << "Folder download started (group " << group << ")" << std::endl;
  } else {
    const auto id = app.RequestDownload(session, chosen, destination);
    std::cout << "Download started (transfer " << id << ")" << std::endl;
  }

  // Give the folder listing a moment to expand, then wait for the queue
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::minutes(10);
  while (std::chrono::steady_clock::now() < deadline && app.is_running()) {
    auto transfers = engine.list_session_transfers(session);
    if (!transfers.empty() && all_settled(transfers)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }

  std::cout << "Transfers:\n";
  for (const auto &t : engine.list_session_transfers(session)) {
    print_transfer(t);
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    app::AppConfig config;
    std::string config_path;
    std::string username, password, download_dir;
    bool simulate = false;
    std::string search_query, artist_id, artist_name;
    std::string sort_name = "quality";
    std::chrono::milliseconds wait(3000);
    int download_index = 0;
    bool whole_folder = false;
    std::string log_level;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--config=") == 0) {
        config_path = arg.substr(9);
      } else if (arg.find("--username=") == 0) {
        username = arg.substr(11);
      } else if (arg.find("--password=") == 0) {
        password = arg.substr(11);
      } else if (arg.find("--download-dir=") == 0) {
        download_dir = arg.substr(15);
      } else if (arg == "--simulate") {
        simulate = true;
      } else if (arg.find("--search=") == 0) {
        search_query = arg.substr(9);
      } else if (arg.find("--sort=") == 0) {
        sort_name = arg.substr(7);
      } else if (arg.find("--wait=") == 0) {
        wait = std::chrono::milliseconds(std::stoi(arg.substr(7)));
      } else if (arg.find("--download=") == 0) {
        download_index = std::stoi(arg.substr(11));
      } else if (arg == "--folder") {
        whole_folder = true;
      } else if (arg.find("--discography=") == 0) {
        artist_id = arg.substr(14);
      } else if (arg.find("--artist=") == 0) {
        artist_name = arg.substr(9);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=transfer,search
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    transfer::SortOrder order;
    if (!parse_sort(sort_name, order)) {
      std::cerr << "Unknown sort key: " << sort_name << std::endl;
      return 1;
    }

    util::LogManager::Initialize(log_level.empty() ? config.log_level : log_level,
                                 false);
    if (!config_path.empty()) {
      if (!app::LoadConfigFile(config_path, config)) {
        LOG_APP_WARN("Continuing with default settings");
      }
      const std::string level = log_level.empty() ? config.log_level : log_level;
      if (!config.log_file.empty()) {
        util::LogManager::Shutdown();
        util::LogManager::Initialize(level, true, config.log_file);
      } else {
        util::LogManager::SetLogLevel(level);
      }
    }

    for (const auto &component : debug_components) {
      if (component == "all") {
        util::LogManager::SetLogLevel("trace");
      } else {
        util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // Command line overrides the config file
    if (!username.empty()) {
      config.transfer.credentials.username = username;
    }
    if (!password.empty()) {
      config.transfer.credentials.password = password;
    }
    if (!download_dir.empty()) {
      config.transfer.download_dir = download_dir;
    }

    transfer::ProtocolClientPtr client;
    if (simulate || config.protocol_backend == "simulated") {
      config.protocol_backend = "simulated";
      auto network = std::make_shared<transfer::SimulatedProtocolClient>();
      network->SetMaterializeFiles(true);
      seed_demo_network(*network);
      client = network;
      if (config.transfer.credentials.empty()) {
        config.transfer.credentials = {"demo", "demo"};
      }
    }

    app::Application app(config, client, nullptr, [](const std::string &instruction) {
      std::cout << instruction << std::endl;
    });

    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      return 1;
    }
    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      return 1;
    }

    int rc = 0;
    if (!artist_id.empty() || !artist_name.empty()) {
      rc = run_discography(app, artist_id, artist_name);
    }
    if (rc == 0 && !search_query.empty()) {
      rc = run_search(app, search_query, order, wait, download_index, whole_folder);
    }
    if (artist_id.empty() && artist_name.empty() && search_query.empty()) {
      // Nothing to do but serve the engine; print the queue as it moves
      auto queue = app.orchestrator().subscribe_queue(
          [](const transfer::SessionEvent &event) {
            if (event.transfer) {
              print_transfer(*event.transfer);
            }
          });
      app.wait_for_shutdown();
    }

    app.stop();
    util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    util::LogManager::Shutdown();
    return 1;
  }
}
