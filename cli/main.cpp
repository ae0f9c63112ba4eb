#include "common/config/engine_config.h"
#include "common/logging/logger.h"
#include "common/metrics/metrics.h"
#include "model/model_catalog.h"
#include "model/model_loader.h"
#include "scheduler/generation_engine.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace hiyo;

namespace {

std::atomic<int> g_interrupts{0};

// First Ctrl-C cancels the running generation; a second one exits.
void SignalHandler(int) {
  if (g_interrupts.fetch_add(1) + 1 >= 2) {
    std::_Exit(130);
  }
}

std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos || end == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  hiyo-chat [--config ~/.hiyo/config.yaml] [--model OWNER/NAME]\n"
      << "            [--temperature T] [--top-p P] [--max-tokens N] "
         "[--json-logs]\n"
      << "Commands inside the session:\n"
      << "  /load OWNER/NAME   load a model from the models directory\n"
      << "  /unload            release the current model\n"
      << "  /models            list catalog models\n"
      << "  /state             show the model lifecycle state\n"
      << "  /stats             dump engine metrics\n"
      << "  /reset             start a new conversation\n"
      << "  /quit              exit\n";
}

void PrintLoadResult(const LoadResult &result, const std::string &id) {
  switch (result.outcome) {
  case LoadResult::Outcome::kLoaded:
    std::cout << "Loaded " << id << std::endl;
    break;
  case LoadResult::Outcome::kSuperseded:
    std::cout << "Load of " << id << " was superseded" << std::endl;
    break;
  case LoadResult::Outcome::kFailed:
    std::cout << "Could not load " << id << ": " << result.message << " ("
              << LoadErrorCodeName(result.code) << ")" << std::endl;
    break;
  }
}

LoadResult LoadWithProgress(GenerationEngine &engine, const std::string &id) {
  int last_pct = -1;
  auto result = engine.LoadModel(id, [&](double p) {
    int pct = static_cast<int>(p * 100.0);
    if (pct / 10 != last_pct / 10) {
      last_pct = pct;
      std::cout << "\rLoading " << id << " " << pct << "%" << std::flush;
    }
  });
  std::cout << "\r";
  PrintLoadResult(result, id);
  return result;
}

// Streams one reply to stdout. Returns the text the model produced.
std::string RunGeneration(GenerationEngine &engine,
                          const std::vector<ChatMessage> &history,
                          const GenerationParams &params) {
  auto result = engine.Generate(history, params);
  if (!result.ok()) {
    const auto &st = result.status;
    std::cout << "[" << ErrorKindName(st.kind) << "] " << st.message
              << std::endl;
    return {};
  }

  g_interrupts.store(0);
  std::atomic<bool> done{false};
  GenerationStream *stream = result.stream.get();
  std::thread watcher([&] {
    while (!done.load()) {
      if (g_interrupts.load() > 0) {
        stream->Cancel();
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  std::string reply;
  std::string piece;
  while (stream->Next(&piece)) {
    std::cout << piece << std::flush;
    reply += piece;
  }
  done.store(true);
  watcher.join();
  g_interrupts.store(0);

  std::cout << std::endl;
  auto status = stream->Status();
  if (!status.ok) {
    std::cout << "[" << ErrorKindName(status.kind) << "] " << status.message
              << std::endl;
  } else if (stream->finish_reason() == FinishReason::kCancelled) {
    std::cout << "[cancelled]" << std::endl;
  }
  return reply;
}

} // namespace

int main(int argc, char **argv) {
  std::string config_path = DefaultConfigPath().string();
  std::string model;
  bool json_logs = false;
  float temperature = -1.0f;
  float top_p = -1.0f;
  int max_tokens = 0;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--model" && i + 1 < argc) {
        model = argv[++i];
      } else if (arg == "--temperature" && i + 1 < argc) {
        temperature = std::stof(argv[++i]);
      } else if ((arg == "--top-p" || arg == "--top_p") && i + 1 < argc) {
        top_p = std::stof(argv[++i]);
      } else if ((arg == "--max-tokens" || arg == "--max_tokens") &&
                 i + 1 < argc) {
        max_tokens = std::stoi(argv[++i]);
      } else if (arg == "--json-logs") {
        json_logs = true;
      } else if (arg == "--help" || arg == "-h") {
        PrintUsage();
        return 0;
      } else {
        std::cerr << "Unknown argument: " << arg << "\n";
        PrintUsage();
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Invalid numeric argument: " << e.what() << "\n";
    PrintUsage();
    return 1;
  }

  EngineConfig config = LoadEngineConfig(config_path);
  ApplyEnvOverrides(&config);
  if (json_logs) {
    config.logging.format = "json";
  }
  log::SetJsonMode(config.logging.format == "json");
  log::SetMinLevel(log::ParseLevel(config.logging.level));

  GenerationParams params = config.generation;
  if (temperature >= 0.0f)
    params.temperature = temperature;
  if (top_p >= 0.0f)
    params.top_p = top_p;
  if (max_tokens > 0)
    params.max_tokens = max_tokens;

  ModelCatalog catalog;
  if (!config.models.catalog.empty() &&
      !catalog.LoadFile(config.models.catalog)) {
    std::cerr << "Using the built-in model catalog" << std::endl;
  }

  LocalModelLoaderConfig loader_config;
  loader_config.models_dir = config.models.dir;
  loader_config.backend = config.models.backend;
  for (const auto &m : catalog.Models()) {
    if (config.models.restrict_to_catalog) {
      loader_config.allow_list.insert(m.id);
    }
    if (!m.path.empty()) {
      loader_config.directory_overrides[m.id] = m.path;
    }
  }

  EngineOptions options;
  options.limits = config.limits;
  options.channel_capacity = config.channel_capacity;
  options.governor = config.governor;
  GenerationEngine engine(
      std::make_shared<LocalModelLoader>(std::move(loader_config)), options);

  std::signal(SIGINT, SignalHandler);

  if (model.empty()) {
    model = config.models.default_model;
  }
  if (!model.empty()) {
    LoadWithProgress(engine, model);
  }

  std::cout << "Hiyo chat. Models from " << config.models.dir.string()
            << ". Type /quit to exit, Ctrl-C to stop a reply." << std::endl;

  std::vector<ChatMessage> history;
  std::string line;
  while (true) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    g_interrupts.store(0);
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    if (line == "/quit" || line == "/exit") {
      break;
    }
    if (line.rfind("/load", 0) == 0) {
      std::string id = Trim(line.substr(5));
      if (id.empty()) {
        std::cout << "Usage: /load OWNER/NAME" << std::endl;
      } else {
        LoadWithProgress(engine, id);
      }
      continue;
    }
    if (line == "/unload") {
      engine.UnloadModel();
      std::cout << "Model unloaded" << std::endl;
      continue;
    }
    if (line == "/models") {
      for (const auto &m : catalog.Models()) {
        std::cout << "  " << m.id << "  " << m.name << " (" << m.parameters
                  << ", " << m.size << ")  " << m.description << "\n";
      }
      std::cout << std::flush;
      continue;
    }
    if (line == "/state") {
      std::cout << engine.CurrentState().Describe() << std::endl;
      continue;
    }
    if (line == "/stats") {
      std::cout << GlobalMetrics().RenderText() << std::flush;
      continue;
    }
    if (line == "/reset") {
      history.clear();
      std::cout << "New conversation" << std::endl;
      continue;
    }
    if (line[0] == '/') {
      std::cout << "Unknown command" << std::endl;
      PrintUsage();
      continue;
    }

    history.push_back({"user", line});
    std::string reply = RunGeneration(engine, history, params);
    if (reply.empty()) {
      history.pop_back();
    } else {
      history.push_back({"assistant", reply});
    }
  }
  return 0;
}
