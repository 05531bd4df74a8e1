#include "common/Logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace ddns::common {

std::shared_ptr<spdlog::logger> Logger::create(const std::string& sLevel,
                                               const std::optional<std::string>& oFilePath) {
  std::vector<spdlog::sink_ptr> vSinks;
  vSinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (oFilePath) {
    // One log per run: truncate instead of append
    vSinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*oFilePath, true));
  }

  auto spLogger = std::make_shared<spdlog::logger>(kLoggerName, vSinks.begin(), vSinks.end());
  spLogger->set_pattern(kPattern);
  spLogger->set_level(spdlog::level::from_str(sLevel));
  spLogger->flush_on(spdlog::level::info);
  return spLogger;
}

bool Logger::isValidLevel(const std::string& sLevel) {
  // from_str() maps unknown names to "off", so only accept "off" verbatim
  return spdlog::level::from_str(sLevel) != spdlog::level::off || sLevel == "off";
}

}  // namespace ddns::common
