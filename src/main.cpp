#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ConfigStore.hpp"
#include "core/IpResolver.hpp"
#include "core/LivenessReporter.hpp"
#include "core/UpdateEngine.hpp"
#include "net/CurlHttpClient.hpp"
#include "providers/PorkbunProvider.hpp"

// One run per invocation; scheduling is left to cron or a systemd timer.

int main() {
  std::shared_ptr<spdlog::logger> spLog;
  try {
    // ── Step 1: Runtime settings and logging ─────────────────────────────
    const auto cfgApp = ddns::common::Config::load();
    spLog = ddns::common::Logger::create(cfgApp.sLogLevel, cfgApp.oLogFile);

    // ── Step 2: HTTP transport ───────────────────────────────────────────
    ddns::net::CurlGlobal cgCurl;
    ddns::net::CurlHttpClient hcClient("porkbun-ddns/1.0");

    // ── Step 3: Components ───────────────────────────────────────────────
    ddns::core::ConfigStore csStore(cfgApp.sConfigPath);
    ddns::core::IpResolver irResolver(hcClient, cfgApp.sIpEchoUrl);
    ddns::providers::PorkbunProvider ppProvider(hcClient, cfgApp.sPorkbunApiBase);
    ddns::core::LivenessReporter lrReporter(hcClient, cfgApp.sHealthchecksBase);

    // ── Step 4: Run ──────────────────────────────────────────────────────
    ddns::core::UpdateEngine ueEngine(spLog, csStore, irResolver, ppProvider, lrReporter);
    const auto rres = ueEngine.run();
    return ddns::core::UpdateEngine::exitCode(rres.outcome);
  } catch (const ddns::common::AppError& ex) {
    if (spLog) {
      spLog->critical("{} ({})", ex.what(), ex._sErrorCode);
    } else {
      std::cerr << "[fatal] " << ex.what() << " (" << ex._sErrorCode << ")\n";
    }
    return ex._iExitCode;
  } catch (const std::exception& ex) {
    if (spLog) {
      spLog->critical("Unexpected failure: {}", ex.what());
    } else {
      std::cerr << "[fatal] " << ex.what() << "\n";
    }
    return EXIT_FAILURE;
  }
}
