#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <vector>

namespace relay {

namespace {

// 每次启动时轮转日志文件
// 策略：relay.log -> relay.0.log -> ... -> relay.9.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  auto dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto ext = current_log.extension().string();
  auto backup = [&](size_t i) {
    return dir / (stem + "." + std::to_string(i) + ext);
  };

  std::error_code ec;
  fs::remove(backup(max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    if (fs::exists(backup(i))) {
      fs::rename(backup(i), backup(i + 1), ec);
    }
  }

  fs::rename(current_log, backup(0), ec);
}

}  // namespace

void init_log(const std::string& level, const std::optional<std::string>& log_path, size_t max_files) {
  try {
    namespace fs = std::filesystem;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (log_path && !log_path->empty()) {
      fs::path actual_path = *log_path;

      // 确保日志目录存在
      std::error_code ec;
      if (actual_path.has_parent_path()) {
        fs::create_directories(actual_path.parent_path(), ec);
      }

      rotate_logs_on_startup(actual_path, max_files);

      // 每次启动都是新的干净文件
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true));
    }

    auto logger = std::make_shared<spdlog::logger>("llm_relay", sinks.begin(), sinks.end());

    // from_str 不认识的级别返回 off，这里退回 info
    auto log_level = spdlog::level::from_str(level);
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    logger->set_pattern("%H:%M:%S | %^%-8l%$ | %v");

    // 流式转发期间日志需要及时可见
    logger->flush_on(spdlog::level::info);

    spdlog::drop("llm_relay");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace relay
