#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50071";

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

struct Options {
  std::string                config_path;
  std::optional<std::string> bind_override;
  // load config and replay the log, then exit
  bool check_only = false;
};

void PrintUsage(std::ostream& out) {
  out << "usage: depgraph-server [--bind <host:port>] [--check] <config.yaml>\n"
         "       depgraph-server [--bind <host:port>] [--check] --config <config.yaml>\n";
}

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (arg == "--bind" && i + 1 < argc) {
      options.bind_override = argv[++i];
    } else if (arg == "--check") {
      options.check_only = true;
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }

  if (options.config_path.empty()) {
    return std::nullopt;
  }
  return options;
}

void StopObservability() {
  depgraph::observability::ShutdownLogging();
  depgraph::observability::ShutdownMetrics();
  depgraph::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    PrintUsage(std::cerr);
    return 1;
  }

  using depgraph::observability::StringField;

  try {
    auto config = depgraph::config::ConfigLoader::LoadFromYaml(options->config_path);
    if (options->bind_override) {
      config.mutable_server()->set_bind_address(*options->bind_override);
    } else if (config.server().bind_address().empty()) {
      config.mutable_server()->set_bind_address(kDefaultBindAddress);
    }

    depgraph::observability::InitializeTracing(config);
    depgraph::observability::InitializeMetrics(config);
    depgraph::observability::InitializeLogging(config);

    // replays the publication log before any RPC is accepted
    auto app = depgraph::factory::Build(config);

    if (options->check_only) {
      DEPGRAPH_LOG_INFO("configuration and publication log ok", {StringField("config", options->config_path)});
      StopObservability();
      return 0;
    }

    depgraph::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, RequestStop);
    std::signal(SIGTERM, RequestStop);

    server.Start();
    DEPGRAPH_LOG_INFO("depgraph server started", {StringField("config", options->config_path)});

    while (!g_stop_requested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    DEPGRAPH_LOG_INFO("depgraph server stopping");
    server.Stop();
    StopObservability();
  } catch (const std::exception& e) {
    DEPGRAPH_LOG_ERROR("depgraph server failed", {StringField("error", e.what())});
    StopObservability();
    return 2;
  }

  return 0;
}
