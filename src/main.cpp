/* @file main.cpp
 * @brief `amppoll` command-line front end
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// POSIX
#include <getopt.h>
#include <signal.h>

// AmpPoll headers
#include "core/ConfigLoader.hpp"
#include "core/RunCoordinator.hpp"

using namespace amppoll::core;

namespace {

  constexpr int kExitUsage = 2;

  void usage(std::ostream& os) {
    os << "usage: amppoll --image TAG --tasks a,b [options]\n"
          "  --config FILE         configuration (default: $AMPPOLL_CONFIG, config/amppoll.json,\n"
          "                        /etc/amppoll/amppoll.json)\n"
          "  --env NAME            environment whose relay is used (default: prod)\n"
          "  --device KEY=ADDRESS  device to run (repeatable)\n"
          "  --lookup HWID         resolve a hardware id to an address (repeatable)\n"
          "  --resolver CMD        lookup command, {hwid} is replaced by the id\n"
          "  --skip-relay          connect to devices directly\n"
          "  --timeout-ms N        override every step timeout\n"
          "  --deadline-s N        stop unfinished devices after N seconds\n"
          "  --output DIR          artifacts and run log (default: output)\n"
          "  --state-dir DIR       persisted device state (default: state)\n"
          "  --set KEY=VALUE       extra placeholder value (repeatable)\n";
  }

  std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ','))
      if (!item.empty())
        out.push_back(item);
    return out;
  }

  std::pair<std::string, std::string> splitPair(const std::string& s, const char* flag) {
    const auto eq = s.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == s.size())
      throw std::invalid_argument(std::string(flag) + " expects KEY=VALUE, got '" + s + "'");
    return { s.substr(0, eq), s.substr(eq + 1) };
  }

  long positive(const std::string& s, const char* flag) {
    std::size_t used = 0;
    long v = 0;
    try {
      v = std::stol(s, &used);
    } catch (const std::exception&) {
      used = 0;
    }
    if (used != s.size() || v <= 0)
      throw std::invalid_argument(std::string(flag) + " expects a positive integer, got '" + s + "'");
    return v;
  }

  RunOptions parseArgs(int argc, char** argv) {
    enum Opt { Config = 1, Image, Env, Tasks, Device, Lookup, Resolver, SkipRelay, Timeout, Deadline, Output,
               StateDir, Set, Help };
    static const option kOptions[] = {
      { "config", required_argument, nullptr, Config },       { "image", required_argument, nullptr, Image },
      { "env", required_argument, nullptr, Env },             { "tasks", required_argument, nullptr, Tasks },
      { "device", required_argument, nullptr, Device },       { "lookup", required_argument, nullptr, Lookup },
      { "resolver", required_argument, nullptr, Resolver },   { "skip-relay", no_argument, nullptr, SkipRelay },
      { "timeout-ms", required_argument, nullptr, Timeout },  { "deadline-s", required_argument, nullptr, Deadline },
      { "output", required_argument, nullptr, Output },       { "state-dir", required_argument, nullptr, StateDir },
      { "set", required_argument, nullptr, Set },             { "help", no_argument, nullptr, Help },
      { nullptr, 0, nullptr, 0 }
    };

    RunOptions opts;
    opts.environment = "prod";
    int c = 0;
    while ((c = ::getopt_long(argc, argv, "", kOptions, nullptr)) != -1) {
      const std::string arg = optarg ? optarg : "";
      switch (c) {
      case Config:
        opts.configPath = arg;
        break;
      case Image:
        opts.image = arg;
        break;
      case Env:
        opts.environment = arg;
        break;
      case Tasks:
        for (auto& t : splitList(arg))
          opts.tasks.push_back(t);
        break;
      case Device:
        opts.devices.push_back(splitPair(arg, "--device"));
        break;
      case Lookup:
        opts.lookups.push_back(arg);
        break;
      case Resolver:
        opts.resolverCommand = arg;
        break;
      case SkipRelay:
        opts.skipRelay = true;
        break;
      case Timeout:
        opts.timeout = std::chrono::milliseconds{ positive(arg, "--timeout-ms") };
        break;
      case Deadline:
        opts.deadline = std::chrono::seconds{ positive(arg, "--deadline-s") };
        break;
      case Output:
        opts.outputDir = arg;
        break;
      case StateDir:
        opts.stateDir = arg;
        break;
      case Set: {
        auto [k, v] = splitPair(arg, "--set");
        opts.context[k] = v;
        break;
      }
      case Help:
        usage(std::cout);
        std::exit(0);
      default:
        throw std::invalid_argument("unknown option");
      }
    }
    if (optind < argc)
      throw std::invalid_argument(std::string("unexpected argument '") + argv[optind] + "'");
    if (opts.image.empty())
      throw std::invalid_argument("--image is required");
    if (opts.configPath.empty()) {
      const auto found = ConfigLoader::locate();
      if (!found)
        throw std::invalid_argument("no --config given and no default configuration found");
      opts.configPath = found->string();
    }
    return opts;
  }

  void printReport(const RunReport& report) {
    for (const auto& device : report.devices) {
      std::cout << device.deviceKey << " (" << device.address << "): " << toString(device.outcome);
      if (device.failedAtStep)
        std::cout << " at step " << *device.failedAtStep;
      if (device.connectError)
        std::cout << " [" << toString(*device.connectError) << "]";
      if (device.haltedBy)
        std::cout << " halted by " << *device.haltedBy;
      std::cout << "\n";
      if (device.error)
        std::cout << "    " << *device.error << "\n";
      for (const auto& task : device.tasks) {
        std::cout << "    " << std::left << std::setw(28) << task.name << toString(task.status);
        if (task.detail)
          std::cout << "  " << *task.detail;
        std::cout << "\n";
        for (const auto& file : task.artifacts)
          std::cout << "        -> " << file.string() << "\n";
      }
      if (device.persistError)
        std::cout << "    state not saved: " << *device.persistError << "\n";
    }
  }

} // namespace

int main(int argc, char** argv) {
  RunOptions options;
  try {
    options = parseArgs(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << "amppoll: " << e.what() << "\n";
    usage(std::cerr);
    return kExitUsage;
  }

  // SIGINT/SIGTERM are taken by a watcher thread instead of an async handler
  sigset_t stopSignals;
  sigemptyset(&stopSignals);
  sigaddset(&stopSignals, SIGINT);
  sigaddset(&stopSignals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

  RunCoordinator coordinator(std::move(options));
  try {
    coordinator.initialize();
  } catch (const SetupError& e) {
    std::cerr << "amppoll: " << e.what() << "\n";
    return kExitUsage;
  }

  std::atomic<bool> finished{ false };
  std::thread signalWatcher([&] {
    const timespec poll{ 0, 200 * 1000 * 1000 };
    while (!finished) {
      if (::sigtimedwait(&stopSignals, nullptr, &poll) > 0) {
        std::cerr << "amppoll: stopping, waiting for sessions to close\n";
        coordinator.handleAbort();
      }
    }
  });

  RunReport report;
  int failure = 0;
  try {
    report = coordinator.run();
  } catch (const std::exception& e) {
    std::cerr << "amppoll: " << e.what() << "\n";
    failure = 1;
  }
  finished = true;
  signalWatcher.join();
  if (failure)
    return failure;

  printReport(report);
  return report.exitCode();
}
