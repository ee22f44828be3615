#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/embedding_codec.hpp"
#include "internal/factory.hpp"
#include "internal/model/embedding.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using atelier::model::kBeautyStandardEmbeddingKey;

static constexpr std::size_t kPreviewElements = 8;

static void Usage() {
  std::cout << "Usage:\n"
            << "  atelierctl [--config <file.yaml>] resolve [key]\n"
            << "  atelierctl [--config <file.yaml>] persist <csv|base64:...> [path]\n"
            << "  atelierctl [--config <file.yaml>] state-get <session_id>\n"
            << "  atelierctl [--config <file.yaml>] state-put <session_id> <blob> [user_id] [request_id]\n"
            << "  atelierctl [--config <file.yaml>] state-delete <session_id>\n"
            << "  atelierctl [--config <file.yaml>] migrate-legacy\n";
}

static void PrintPreview(const atelier::model::Embedding& vector) {
  std::cout << "[";
  for (std::size_t i = 0; i < vector.size() && i < kPreviewElements; ++i) {
    if (i != 0) std::cout << ", ";
    std::cout << vector[i];
  }
  if (vector.size() > kPreviewElements) std::cout << ", ...";
  std::cout << "] (" << vector.size() << " elements)\n";
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  try {
    auto config = atelier::config::ConfigLoader::Load(config_path, atelier::util::ProcessEnvironment());
    atelier::observability::InitializeLogging(config);

    // ------------------------------------------------------------

    if (cmd == "resolve") {
      if (args.size() > 2) {
        Usage();
        return 1;
      }

      auto       resolver = atelier::factory::BuildResolver(config);
      const auto key      = args.size() == 2 ? args[1] : std::string(kBeautyStandardEmbeddingKey);
      const auto value    = resolver->Resolve(key);

      std::cout << "key=" << value.key << "\n"
                << "source=" << atelier::model::ToString(value.source) << "\n";
      PrintPreview(value.vector);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "persist") {
      if (args.size() < 2 || args.size() > 3) {
        Usage();
        return 1;
      }

      atelier::model::Embedding vector;
      try {
        vector = atelier::config::ParseEmbeddingText(args[1]);
      } catch (const atelier::util::MalformedSource& e) {
        std::cerr << "invalid vector: " << e.what() << "\n";
        return 1;
      }

      auto resolver = atelier::factory::BuildResolver(config);
      if (args.size() == 3) {
        resolver->Persist(vector, args[2]);
        std::cout << "persisted " << args[2] << "\n";
      } else {
        resolver->Persist(vector);
        std::cout << "persisted " << resolver->FilePathFor(std::string(kBeautyStandardEmbeddingKey)).string() << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd != "state-get" && cmd != "state-put" && cmd != "state-delete" && cmd != "migrate-legacy") {
      std::cerr << "unknown command: " << cmd << "\n";
      Usage();
      return 1;
    }

    auto repository = atelier::factory::BuildRepository(config);
    atelier::state::AgentStateStore store(repository);

    if (cmd == "state-get") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }

      auto record = store.Get(args[1]);
      if (!record) {
        std::cerr << "not found: " << args[1] << "\n";
        return 3;
      }

      std::cout << "session_id=" << record->session_id << "\n"
                << "user_id=" << record->user_id << "\n"
                << "request_id=" << record->request_id << "\n"
                << "created_at_ms=" << record->created_at_ms << "\n"
                << "updated_at_ms=" << record->updated_at_ms << "\n"
                << "bytes=" << record->state_blob.size() << "\n"
                << record->state_blob << "\n";
      return 0;
    }

    if (cmd == "state-put") {
      if (args.size() < 3 || args.size() > 5) {
        Usage();
        return 1;
      }

      atelier::state::UpsertOptions options;
      if (args.size() >= 4) options.user_id = args[3];
      if (args.size() == 5) options.request_id = args[4];

      store.Upsert(args[1], args[2], options);
      std::cout << "stored " << args[1] << "\n";
      return 0;
    }

    if (cmd == "state-delete") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }

      if (!store.Delete(args[1])) {
        std::cerr << "not found: " << args[1] << "\n";
        return 3;
      }
      std::cout << "deleted " << args[1] << "\n";
      return 0;
    }

    // migrate-legacy
    if (args.size() != 1) {
      Usage();
      return 1;
    }

    const auto result = store.MigrateFromLegacyCheckpoints();
    std::cout << "legacy_table_found=" << (result.legacy_table_found ? "true" : "false") << "\n"
              << "rows_discarded=" << result.rows_discarded << "\n";
    return 0;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    ATELIER_LOG_ERROR("command failed", {atelier::observability::StringField("command", cmd), atelier::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    return 2;
  }
}
