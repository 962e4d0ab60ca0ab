/// @file cadence_cli.cpp
/// @brief Command-line interface for cadence tempo estimation.

#include <chrono>
#include <cstdio>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "cadence.h"

using namespace cadence;

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string command;
  std::string cache_dir;
  bool verbose = false;
  bool quiet = false;
  bool help = false;

  std::map<std::string, std::string> options;

  double get_double(const std::string& k, double def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stod(it->second) : def;
  }

  int get_int(const std::string& k, int def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stoi(it->second) : def;
  }

  bool has(const std::string& k) const { return options.count(k) > 0; }

  std::string get_string(const std::string& k, const std::string& def = "") const {
    auto it = options.find(k);
    return it != options.end() ? it->second : def;
  }
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgParser {
 public:
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
      } else if (arg == "--verbose" || arg == "-v") {
        args.verbose = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.quiet = true;
      } else if (arg == "--cache-dir" && i + 1 < argc) {
        args.cache_dir = argv[++i];
      } else if (arg.substr(0, 2) == "--") {
        parse_option(args, arg.substr(2), argv, i, argc);
      } else if (args.command.empty()) {
        args.command = arg;
      } else {
        throw CadenceException(ErrorCode::InvalidParameter, "Unexpected argument '" + arg + "'");
      }
    }

    return args;
  }

 private:
  static void parse_option(CliArgs& args, const std::string& key, char* argv[], int& i, int argc) {
    if (i + 1 < argc) {
      std::string next = argv[i + 1];
      bool is_option = next.size() > 1 && next[0] == '-' && next[1] == '-';
      if (!is_option) {
        args.options[key] = argv[++i];
        return;
      }
    }
    args.options[key] = "true";
  }
};

// ============================================================================
// Sinks
// ============================================================================

/// Prints every published estimate on one refreshed console line.
class ConsoleDisplay : public UiSink {
 public:
  explicit ConsoleDisplay(bool quiet) : quiet_(quiet) {}

  void set_bpm(float bpm) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++updates_;
    if (!quiet_) {
      std::cout << "\rBPM: " << format_fixed(bpm, 2) << "   " << std::flush;
    }
  }

  int updates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return updates_;
  }

 private:
  bool quiet_;
  mutable std::mutex mutex_;
  int updates_ = 0;
};

/// Stands in for a tempo-sync session by logging what it would broadcast.
class LoggingSyncPeer : public SyncPeer {
 public:
  void enable(bool enabled) override {
    log::logger()->info("Tempo sync {}", enabled ? "enabled" : "disabled");
  }

  void set_bpm(float bpm) override { log::logger()->debug("Tempo sync BPM {:.2f}", bpm); }
};

// ============================================================================
// Helpers
// ============================================================================

std::unique_ptr<TemplateStore> make_store(const CliArgs& args, const std::string& fallback_dir) {
  std::string dir = args.cache_dir.empty() ? fallback_dir : args.cache_dir;
  if (dir.empty()) {
    return std::make_unique<MemoryTemplateStore>();
  }
  return std::make_unique<FileTemplateStore>(dir);
}

std::vector<TempoBand> selected_bands(const CliArgs& args) {
  if (args.has("band")) {
    return {band_from_key(args.get_string("band"))};
  }
  return std::vector<TempoBand>(kAllBands.begin(), kAllBands.end());
}

std::vector<SyntheticDevice> default_devices(const ClickTrackConfig& track) {
  SyntheticDevice speaker;
  speaker.name = "Synthetic output";
  speaker.max_input_channels = 0;

  SyntheticDevice click;
  click.name = "Synthetic click track (" + format_fixed(track.bpm, 2) + " BPM)";
  click.track = track;

  return {speaker, click};
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs&) {
  std::cout << "cadence-cli version 1.0.0\n";
  std::cout << "libcadence version " << version() << "\n";
  return 0;
}

int cmd_patterns(const CliArgs& args) {
  PatternConfig config;
  auto store = make_store(args, "patterns");
  PatternFactory factory(config, *store);

  for (TempoBand band : selected_bands(args)) {
    auto templates = factory.load_or_generate(band);
    printf("  %-8s coarse %4d x %3d   fine %5d x %3d\n", band_key(band),
           templates->coarse.candidate_count(), templates->coarse.window_count(),
           templates->fine.candidate_count(), templates->fine.window_count());
  }
  return 0;
}

int cmd_devices(const CliArgs& args) {
  ClickTrackConfig track;
  track.bpm = args.get_double("bpm", 120.0);
  SyntheticBackend backend(default_devices(track));
  AudioCaptureBuffer capture(CaptureConfig{}, backend);

  for (const auto& device : capture.enumerate_devices()) {
    printf("  [%d] %s (%d input channel%s)\n", device.index, device.name.c_str(),
           device.max_input_channels, device.max_input_channels == 1 ? "" : "s");
  }
  return 0;
}

int cmd_simulate(const CliArgs& args) {
  EstimatorConfig config;
  config.initial_band = band_from_key(args.get_string("band", band_key(config.initial_band)));
  config.validate();

  ClickTrackConfig track;
  track.bpm = args.get_double("bpm", 120.0);
  track.noise = static_cast<float>(args.get_double("noise", 0.0));
  track.time_scale = static_cast<float>(args.get_double("speed", 1.0));
  CADENCE_CHECK_MSG(track.bpm > 0.0 && track.time_scale > 0.0f, ErrorCode::InvalidParameter,
                    "--bpm and --speed must be positive");
  double seconds = args.get_double("seconds", 30.0);

  auto store = make_store(args, "");
  PatternFactory factory(config.pattern, *store);
  TemplateLibrary templates;
  templates.set(factory.load_or_generate(config.initial_band));

  SyntheticBackend backend(default_devices(track));
  AudioCaptureBuffer capture(config.capture, backend);
  ConsoleDisplay display(args.quiet);
  LoggingSyncPeer link;
  TempoEstimator estimator(config, capture, std::move(templates), display, link);

  std::vector<DeviceInfo> devices = estimator.enumerate_devices();
  int device = args.get_int("device", devices.front().index);

  estimator.start(device);
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::duration<double>(seconds / track.time_scale);
  while (std::chrono::steady_clock::now() < deadline &&
         estimator.state() == EstimatorState::Running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  estimator.stop();

  if (!estimator.last_error().empty()) {
    std::cerr << "\nError: " << estimator.last_error() << "\n";
    return 1;
  }
  if (display.updates() == 0) {
    std::cout << "\nNo tempo detected\n";
    return 2;
  }
  std::cout << "\nEstimated BPM: " << estimator.current().text << "\n";
  return 0;
}

// ============================================================================
// Command Registry
// ============================================================================

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      {"simulate", "Estimate the tempo of a synthetic click track", cmd_simulate},
      {"patterns", "Generate or refresh the template cache", cmd_patterns},
      {"devices", "List capture devices", cmd_devices},
      {"version", "Show library version", cmd_version},
  };
  return commands;
}

const CommandInfo* find_command(const std::string& name) {
  for (const auto& cmd : get_commands()) {
    if (cmd.name == name) return &cmd;
  }
  return nullptr;
}

// ============================================================================
// Usage
// ============================================================================

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options]\n\n";

  std::cerr << "COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }

  std::cerr << "\nGLOBAL OPTIONS:\n"
            << "  --cache-dir <dir>  Template cache directory\n"
            << "  --verbose, -v      Debug logging\n"
            << "  --quiet, -q        Warnings and errors only\n"
            << "  --help, -h         Show help\n"
            << "\nSIMULATE OPTIONS:\n"
            << "  --bpm <x>          Click track tempo (default: 120)\n"
            << "  --band <range>     Tempo range: 60-160, 130-230 or 210-300 (default: 60-160)\n"
            << "  --seconds <n>      Audio duration to analyze (default: 30)\n"
            << "  --speed <k>        Delivery speed relative to real time (default: 1)\n"
            << "  --noise <x>        Noise amplitude 0-1 (default: 0)\n"
            << "  --device <index>   Device index (default: first input)\n"
            << "\nPATTERNS OPTIONS:\n"
            << "  --band <range>     Only this tempo range (default: all)\n"
            << "\nExamples:\n"
            << "  " << prog << " patterns --cache-dir ./patterns\n"
            << "  " << prog << " simulate --bpm 128 --speed 4\n"
            << "  " << prog << " simulate --bpm 150 --band 130-230 --cache-dir ./patterns\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    CliArgs args = ArgParser::parse(argc, argv);

    if (args.help) {
      print_usage(argv[0]);
      return 0;
    }

    if (args.command.empty()) {
      std::cerr << "Error: No command specified\n\n";
      print_usage(argv[0]);
      return 1;
    }

    const CommandInfo* cmd = find_command(args.command);
    if (!cmd) {
      std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
      print_usage(argv[0]);
      return 1;
    }

    if (args.verbose) {
      log::set_level(spdlog::level::debug);
    } else if (args.quiet) {
      log::set_level(spdlog::level::warn);
    }

    return cmd->handler(args);

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
