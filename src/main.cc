// Broker Admin Server - Main Application
//
// Story:
// Entry point for the broker admin server. Initializes the registries and
// the admin gRPC services, starts the server, and handles graceful shutdown
// on SIGINT/SIGTERM. The broker feeds the registries through the
// RegistryEventHandler and publishes live counters into the stats source.
//
// Usage:
//   ./broker_admin_server [--port=PORT] [--default-page-size=N]
//                         [--max-page-size=N]
//
// Options:
//   --port=PORT               Server port (default: 8084)
//   --default-page-size=N     Page size when a request omits it (default: 20)
//   --max-page-size=N         Largest page size served, 0 = no cap
//                             (default: 1000)
//   --help                    Show usage

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "admin_server.h"
#include "client_registry.h"
#include "pagination.h"
#include "registry_event_handler.h"
#include "session_controller.h"
#include "stats_source.h"
#include "subscription_registry.h"

namespace {

// =============================================================================
// Configuration
// =============================================================================

struct AdminServerConfig {
  uint16_t port = 8084;
  broker_admin::PageDefaults page_defaults;
};

// =============================================================================
// Global State (for signal handling)
// =============================================================================

std::atomic<bool> g_shutdown_requested{false};
std::mutex g_shutdown_mutex;
std::condition_variable g_shutdown_cv;

// =============================================================================
// Signal Handler
// =============================================================================

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested.store(true);
    g_shutdown_cv.notify_all();
  }
}

// =============================================================================
// Command-Line Parsing
// =============================================================================

void PrintUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Options:\n"
            << "  --port=PORT               Server port (default: 8084)\n"
            << "  --default-page-size=N     Page size when a request omits "
               "it (default: 20)\n"
            << "  --max-page-size=N         Largest page size served, 0 = no "
               "cap (default: 1000)\n"
            << "  --help                    Show this help message\n";
}

// Parses a non-negative integer flag value. Returns std::nullopt on error.
std::optional<uint32_t> ParseCount(const std::string& value) {
  try {
    long long parsed = std::stoll(value);
    if (parsed < 0 || parsed > UINT32_MAX) {
      return std::nullopt;
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception& e) {
    return std::nullopt;
  }
}

std::optional<AdminServerConfig> ParseArgs(int argc, char* argv[]) {
  AdminServerConfig config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return std::nullopt;
    }

    if (arg.rfind("--port=", 0) == 0) {
      std::string value = arg.substr(7);
      auto port = ParseCount(value);
      if (!port || *port == 0 || *port > 65535) {
        std::cerr << "Error: Invalid port number: " << value << std::endl;
        return std::nullopt;
      }
      config.port = static_cast<uint16_t>(*port);
      continue;
    }

    if (arg.rfind("--default-page-size=", 0) == 0) {
      std::string value = arg.substr(20);
      auto page_size = ParseCount(value);
      if (!page_size || *page_size == 0) {
        std::cerr << "Error: Invalid default page size: " << value
                  << std::endl;
        return std::nullopt;
      }
      config.page_defaults.default_page_size = *page_size;
      continue;
    }

    if (arg.rfind("--max-page-size=", 0) == 0) {
      std::string value = arg.substr(16);
      auto page_size = ParseCount(value);
      if (!page_size) {
        std::cerr << "Error: Invalid max page size: " << value << std::endl;
        return std::nullopt;
      }
      config.page_defaults.max_page_size = *page_size;
      continue;
    }

    std::cerr << "Error: Unknown argument: " << arg << std::endl;
    PrintUsage(argv[0]);
    return std::nullopt;
  }

  return config;
}

// =============================================================================
// Server Runner
// =============================================================================

int RunServer(const AdminServerConfig& config) {
  // Build server address
  std::string server_address = "0.0.0.0:" + std::to_string(config.port);

  // Create components
  broker_admin::InMemoryStatsSource stats_source;
  broker_admin::ClientRegistry client_registry(&stats_source);
  broker_admin::SubscriptionRegistry subscription_registry;

  // Broker hooks drive the registries
  broker_admin::RegistryEventHandler event_handler(&client_registry,
                                                   &subscription_registry);
  broker_admin::EventSessionController session_controller(&client_registry,
                                                          &event_handler);

  // Create service implementations
  broker_admin::ClientServiceImpl client_service(
      &client_registry, &session_controller, config.page_defaults);
  broker_admin::SubscriptionServiceImpl subscription_service(
      &subscription_registry, config.page_defaults);

  // Build and start server
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&client_service);
  builder.RegisterService(&subscription_service);

  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    std::cerr << "Error: Failed to start server on " << server_address
              << std::endl;
    return 1;
  }

  std::cout << "Broker admin server started on " << server_address
            << std::endl;
  std::cout << "Default page size: "
            << config.page_defaults.default_page_size
            << ", max page size: " << config.page_defaults.max_page_size
            << std::endl;
  std::cout << "Press Ctrl+C to shutdown..." << std::endl;

  // Start a thread that waits for shutdown signal and calls server->Shutdown()
  std::thread shutdown_thread([&server]() {
    std::unique_lock<std::mutex> lock(g_shutdown_mutex);
    g_shutdown_cv.wait(lock, []() { return g_shutdown_requested.load(); });

    std::cout << "\nShutdown requested, stopping server..." << std::endl;
    server->Shutdown();
  });

  // Wait for server to finish (will unblock when Shutdown() is called)
  server->Wait();

  shutdown_thread.join();

  std::cout << "Server shutdown complete." << std::endl;

  return 0;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  // Parse command-line arguments
  auto config = ParseArgs(argc, argv);
  if (!config) {
    return 1;
  }

  // Setup signal handlers
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // Run the server
  return RunServer(*config);
}
