#include "core/UpdateEngine.hpp"

#include "common/Errors.hpp"

#include <utility>

namespace ddns::core {

UpdateEngine::UpdateEngine(std::shared_ptr<spdlog::logger> spLog, ConfigStore& csStore,
                           IpResolver& irResolver, providers::IProvider& ipProvider,
                           LivenessReporter& lrReporter)
    : _spLog(std::move(spLog)),
      _csStore(csStore),
      _irResolver(irResolver),
      _ipProvider(ipProvider),
      _lrReporter(lrReporter) {}

UpdateEngine::~UpdateEngine() = default;

int UpdateEngine::exitCode(common::RunOutcome outcome) {
  return outcome == common::RunOutcome::UpdateRejected ? 1 : 0;
}

common::RunResult UpdateEngine::run() {
  common::RunResult rres;

  // ── Step 1: Load config ───────────────────────────────────────────────
  DdnsConfig dcConfig = _csStore.load();
  _spLog->debug("Loaded config from {} (domain={})", _csStore.path(), dcConfig.sDomain);

  // ── Step 2: Resolve current IP ────────────────────────────────────────
  _spLog->info("Getting current IP");
  const auto rr = _irResolver.resolve();
  if (!rr.bSuccess) {
    throw common::NetworkError("ip_lookup_failed", rr.sErrorMessage);
  }
  const std::string& sCurrentIp = rr.sIp;

  _spLog->info("Last IP: {}", dcConfig.sLastIp);
  _spLog->info("Current IP: {}", sCurrentIp);

  // ── Step 3: Decide ────────────────────────────────────────────────────
  if (sCurrentIp == dcConfig.sLastIp) {
    rres.outcome = common::RunOutcome::NoChange;
    rres.sMessage = "No change";
    _spLog->info(rres.sMessage);
  } else {
    // Provider rejects a no-op edit, so only push on an actual change
    const auto acCreds = ConfigStore::credentials(dcConfig);

    common::DnsRecord drRecord;
    drRecord.sType = "A";
    drRecord.uTtl = kRecordTtl;
    drRecord.sValue = sCurrentIp;

    rres.sMessage = "Updating 'A' record for " + dcConfig.sDomain + " with " + sCurrentIp;
    _spLog->info(rres.sMessage);

    const auto prs = _ipProvider.updateRecord(acCreds, dcConfig.sDomain, drRecord);
    if (prs.status == common::PushStatus::Unreachable) {
      throw common::NetworkError("provider_unreachable",
                                 _ipProvider.name() + " API call failed: " + prs.sErrorMessage);
    }
    if (prs.status == common::PushStatus::Rejected) {
      _spLog->error("Error updating record (HTTP {}): {}", prs.iStatusCode, prs.sErrorMessage);
      rres.outcome = common::RunOutcome::UpdateRejected;
      return rres;
    }

    _spLog->info("Update successful, saving config data");
    dcConfig.sLastIp = sCurrentIp;
    _csStore.save(dcConfig);
    rres.outcome = common::RunOutcome::Updated;
  }

  // ── Step 4: Liveness ping ─────────────────────────────────────────────
  if (!dcConfig.sHealthchecksUuid.empty()) {
    _spLog->info("Pinging Healthchecks.io");
    const auto hr = _lrReporter.ping(dcConfig.sHealthchecksUuid, rres.sMessage);
    if (!hr.bCompleted) {
      throw common::NetworkError("healthchecks_unreachable",
                                 "Healthchecks ping failed: " + hr.sErrorMessage);
    }
    if (hr.iStatusCode < 200 || hr.iStatusCode >= 300) {
      _spLog->warn("Healthchecks ping returned HTTP {}", hr.iStatusCode);
    }
  }

  _spLog->info("Finished");
  return rres;
}

}  // namespace ddns::core
