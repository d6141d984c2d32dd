#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/resource_type.hpp"
#include "internal/observability/logging.hpp"
#include "outbox/v1.hpp"

using namespace outbox::v1;
using outbox::queue::PayloadQueue;

static void Usage() {
  std::cout << "Usage:\n"
            << "  outboxctl --config <file.yaml> list <resource>\n"
            << "  outboxctl --config <file.yaml> peek <resource>\n"
            << "  outboxctl --config <file.yaml> enqueue <resource> <file|->\n"
            << "  outboxctl --config <file.yaml> remove <resource> <id>\n"
            << "  outboxctl --config <file.yaml> purge <resource>\n"
            << "  outboxctl --config <file.yaml> stats\n"
            << "\n"
            << "  resource = errors|sessions\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                                 out;
  google::protobuf::util::JsonPrintOptions    options;
  options.preserve_proto_field_names = true;
  auto status                        = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return out;
}

static std::optional<std::string> ReadBody(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static std::shared_ptr<PayloadQueue> FindQueue(const std::vector<std::shared_ptr<PayloadQueue>>& queues, const std::string& name) {
  auto type = outbox::model::ParseResourceType(name);
  if (!type) {
    std::cerr << "unsupported resource: " << name << "\n";
    return nullptr;
  }
  for (const auto& queue : queues) {
    if (queue->Type() == *type) return queue;
  }
  std::cerr << "resource not configured: " << name << "\n";
  return nullptr;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  std::string config_path = argv[2];
  std::string cmd         = argv[3];

  try {
    auto config = outbox::config::ConfigLoader::LoadFromYaml(config_path);
    outbox::observability::InitializeLogging(config);

    auto queues = outbox::factory::OpenQueues(config);

    // ------------------------------------------------------------

    if (cmd == "stats") {
      StatsResponse resp;
      for (const auto& queue : queues) {
        auto* stats = resp.add_queues();
        stats->set_resource_type(queue->Type());
        stats->set_depth(queue->Size());
      }
      for (const auto& stats : resp.queues()) {
        std::cout << outbox::model::ToString(stats.resource_type()) << "=" << stats.depth() << "\n";
      }
      return 0;
    }

    if (argc < 5) {
      Usage();
      return 1;
    }

    auto queue = FindQueue(queues, argv[4]);
    if (!queue) return 1;

    // ------------------------------------------------------------

    if (cmd == "list") {
      for (const auto& id : queue->List()) {
        std::cout << id << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "peek") {
      auto head = queue->Peek();
      if (!head) {
        std::cout << "empty\n";
        return 0;
      }
      std::cout << ToJson(*head) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "enqueue") {
      if (argc < 6) return 1;

      auto body = ReadBody(argv[5]);
      if (!body) {
        std::cerr << "cannot read " << argv[5] << "\n";
        return 1;
      }

      auto id = queue->Enqueue(std::move(*body));
      if (!id) {
        std::cerr << "enqueue failed\n";
        return 2;
      }
      std::cout << id->value() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "remove") {
      if (argc < 6) return 1;

      PayloadID id;
      id.set_value(argv[5]);
      if (!queue->Remove(id)) {
        std::cerr << "remove failed\n";
        return 2;
      }
      std::cout << "ok\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "purge") {
      std::cout << "removed=" << queue->Purge() << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    outbox::observability::ShutdownLogging();
    return 2;
  }

  Usage();
  return 1;
}
