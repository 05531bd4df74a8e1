#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "common/Types.hpp"
#include "core/ConfigStore.hpp"
#include "core/IpResolver.hpp"
#include "core/LivenessReporter.hpp"
#include "providers/IProvider.hpp"

namespace ddns::core {

/// Runs one DDNS pass: load config, resolve the public IP, push the
/// A record if it changed, persist, then ping the monitor.
/// Class abbreviation: ue
class UpdateEngine {
 public:
  static constexpr uint32_t kRecordTtl = 600;  // Porkbun minimum

  UpdateEngine(std::shared_ptr<spdlog::logger> spLog, ConfigStore& csStore,
               IpResolver& irResolver, providers::IProvider& ipProvider,
               LivenessReporter& lrReporter);
  ~UpdateEngine();

  /// Execute one run.
  /// Returns UpdateRejected (nothing persisted, no ping) when the provider
  /// answers non-200. Throws ConfigError on config problems and
  /// NetworkError when any HTTP call cannot be completed.
  common::RunResult run();

  /// Map a run outcome to the process exit status.
  static int exitCode(common::RunOutcome outcome);

 private:
  std::shared_ptr<spdlog::logger> _spLog;
  ConfigStore& _csStore;
  IpResolver& _irResolver;
  providers::IProvider& _ipProvider;
  LivenessReporter& _lrReporter;
};

}  // namespace ddns::core
