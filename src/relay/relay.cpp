// Library initialization
#include "relay/relay.hpp"

#include "core/version.hpp"
#include "log/log.h"

namespace relay {

void init(const Config& config) {
  // 初始化日志系统
  std::optional<std::string> log_path;
  if (config.log_file) {
    log_path = config.log_file->string();
  }
  init_log(config.log_level, log_path);
}

std::string version() {
  return RELAY_VERSION_STRING;
}

}  // namespace relay
