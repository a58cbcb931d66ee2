// llm-relay entry point
#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "relay/relay.hpp"

namespace {

void print_usage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [options]\n"
            << "\n"
            << "Options:\n"
            << "  --config <file>     Load configuration from file instead of the default locations\n"
            << "  --port <n>          Listen port (default 11731)\n"
            << "  --log-level <lvl>   trace, debug, info, warn, err, critical or off\n"
            << "  --version           Print version and exit\n"
            << "  --help              Show this help\n"
            << "\n"
            << "Environment: RELAY_LISTEN_HOST, RELAY_LISTEN_PORT, RELAY_THREADS, TARGET_BASE_URL,\n"
            << "  ANTHROPIC_BASE_URL, PROXY_URL, API_KEY, ENABLE_WEB_SEARCH, RELAY_UPSTREAM_TIMEOUT,\n"
            << "  RELAY_LOG_LEVEL, RELAY_LOG_FILE\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  // ----- 命令行参数 -----
  std::optional<std::string> config_file;
  std::optional<int> port;
  std::optional<std::string> log_level;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::optional<std::string> {
      if (i + 1 < argc) return std::string(argv[++i]);
      std::cerr << "Error: " << arg << " needs a value\n";
      return std::nullopt;
    };

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      std::cout << "llm-relay " << relay::version() << "\n";
      return 0;
    } else if (arg == "--config") {
      config_file = next();
      if (!config_file) return 2;
    } else if (arg == "--port") {
      auto value = next();
      if (!value) return 2;
      try {
        port = std::stoi(*value);
      } catch (const std::exception&) {
        std::cerr << "Error: invalid port '" << *value << "'\n";
        return 2;
      }
    } else if (arg == "--log-level") {
      log_level = next();
      if (!log_level) return 2;
    } else {
      std::cerr << "Error: unknown option " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
  }

  // ----- 加载配置 -----
  relay::Config config = config_file ? relay::Config::load(*config_file) : relay::Config::from_env();
  if (port) config.listen_port = *port;
  if (log_level) config.log_level = *log_level;
  if (config.threads < 1) config.threads = 1;

  relay::init(config);

  // ----- 启动服务 -----
  asio::io_context io_ctx(config.threads);
  relay::net::Dispatcher dispatcher(relay::net::DispatcherOptions::from_config(config));
  relay::proxy::ProxyService service(config, dispatcher);
  relay::server::HttpServer server(io_ctx, config, service);

  auto started = server.start();
  if (started.failed()) {
    spdlog::critical("{}", *started.error);
    return 1;
  }

  spdlog::info("llm-relay {} listening on http://{}:{}", relay::version(), config.listen_host, *started.value);
  spdlog::info("Upstream: {} | Anthropic: {} | Proxy: {}", config.openai_base_url, config.anthropic_base_url,
               config.proxy_url.value_or("none"));
  if (config.enable_web_search) {
    spdlog::info("Web search tool injection enabled");
  }

  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&](const std::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("Signal {} received, shutting down ({} upstream connections open)", signo, dispatcher.ledger().active());
    server.stop();
    io_ctx.stop();
  });

  std::vector<std::thread> workers;
  for (int i = 1; i < config.threads; ++i) {
    workers.emplace_back([&io_ctx]() {
      io_ctx.run();
    });
  }
  io_ctx.run();

  for (auto& t : workers) {
    t.join();
  }

  spdlog::info("Bye");
  return 0;
}
