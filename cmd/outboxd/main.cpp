#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/delivery/transport.hpp"
#include "internal/factory.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"

using outbox::observability::IntField;
using outbox::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

/*
  Stand-in for the host's HTTP client: logs every payload and reports 202.
*/
class LoggingTransport final : public outbox::delivery::Transport {
 public:
  outbox::delivery::TransportResult Send(const outbox::v1::StoredPayload& payload) override {
    OUTBOX_LOG_INFO("deliver", {StringField("id", payload.id().value()), StringField("resource", outbox::model::ToString(payload.resource_type())),
                                IntField("bytes", static_cast<int64_t>(payload.body().size())), IntField("retries", payload.retries())});
    return outbox::delivery::TransportResult::Response(202);
  }
};

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: outboxd <config.yaml> OR outboxd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = outbox::config::ConfigLoader::LoadFromYaml(config_path);

    outbox::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build outbox (dependency graph)
    // ------------------------------------------------------------
    auto box = outbox::factory::Build(config, std::make_shared<LoggingTransport>());

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    box->Start();
    OUTBOX_LOG_INFO("outboxd started", {StringField("root", config.storage().root_path())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    OUTBOX_LOG_INFO("Shutting down outboxd");

    box->Stop();
    outbox::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    OUTBOX_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    outbox::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
