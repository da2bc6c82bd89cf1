#include "sync/Reconciler.hpp"
#include "auth/Token.hpp"
#include "crypto/encode.hpp"
#include "firmware/Installer.hpp"
#include "rpc/Client.hpp"
#include "sampler/Provider.hpp"
#include "settings/Store.hpp"
#include "tasks/Scheduler.hpp"
#include "timeline/Manager.hpp"
#include "timeline/Timeline.hpp"

#include <chrono>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace fa::sync;
using json = nlohmann::json;

namespace {

constexpr std::string_view kSyncIdAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";

constexpr auto kAuthCall = "authenticate_result";
constexpr auto kSetFirmwareCall = "set_firmware_result";
constexpr auto kFirmwareCall = "firmware_result";
constexpr auto kConfCall = "conf_result";

std::string samplesCall(const std::string& sampler) { return "samples." + sampler; }
std::string timelineCall(const std::string& timeline) { return "timeline_result_" + timeline; }

}

namespace fa::sync {

std::string to_string(const CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Completed: return "completed";
        case CycleOutcome::ApprovalPending: return "approval pending";
        case CycleOutcome::ApprovalDenied: return "approval denied";
        case CycleOutcome::NoCredential: return "no credential";
    }
    return "unknown";
}

std::string makeSyncId() { return crypto::random_token(kSyncIdAlphabet, Reconciler::kSyncIdLength); }

}

Reconciler::Reconciler(const runtime::Context& ctx, Collaborators deps, device::Identity identity,
                       const int firmwareVersion, const bool checkFirmware)
    : ctx_(ctx), deps_(std::move(deps)), identity_(std::move(identity)),
      firmwareVersion_(firmwareVersion), checkFirmware_(checkFirmware) {
    if (!deps_.client || !deps_.token || !deps_.timelines || !deps_.samplers || !deps_.settings ||
        !deps_.tasks || !deps_.installer)
        throw std::invalid_argument("Reconciler requires every collaborator");
}

void Reconciler::onRestartRequested(RestartRequest fn) {
    std::scoped_lock lock(restartMutex_);
    restart_ = std::move(fn);
}

void Reconciler::requestRestart() {
    RestartRequest fn;
    {
        std::scoped_lock lock(restartMutex_);
        fn = restart_;
    }
    if (fn) fn();
    else ctx_.log->sync()->warn("[Reconciler] Firmware installed but nobody is listening for restarts");
}

std::optional<CycleOutcome> Reconciler::bootstrapApproval() {
    const auto log = ctx_.log->sync();
    auto& token = *deps_.token;

    if (!token.present() && token.isFileReference()) {
        const auto approval = deps_.client->call("device.check_approval", {
            {"company", identity_.company},
            {"serial", identity_.serial},
            {"name", identity_.name},
            {"info", identity_.info}
        });

        const auto state = approval.is_object() ? approval.value("state", std::string{}) : std::string{};
        if (state == "pending") {
            log->debug("[Reconciler] Device approval pending...");
            return CycleOutcome::ApprovalPending;
        }
        if (state != "approved") {
            log->error("[Reconciler] Device approval {}", state.empty() ? "refused" : state);
            return CycleOutcome::ApprovalDenied;
        }

        if (!approval.contains("auth_token") || !approval["auth_token"].is_string())
            throw ClientError("device approved but the server sent no auth token");

        try {
            token.persist(approval["auth_token"].get<std::string>());
        } catch (const std::exception& e) {
            throw ClientError(fmt::format("unable to write auth token to '{}': {}",
                                          token.file()->string(), e.what()));
        }
        log->info("[Reconciler] Device approved, credential written to {}", token.file()->string());
    }

    if (!token.present()) {
        log->error("[Reconciler] Sync failed: no auth token, has this device been registered?");
        return CycleOutcome::NoCredential;
    }
    return std::nullopt;
}

CycleReport Reconciler::sync() {
    std::scoped_lock cycle(cycleMutex_);
    const auto log = ctx_.log->sync();
    const auto start = std::chrono::steady_clock::now();

    CycleReport report;
    log->debug("[Reconciler] Syncing...");

    if (const auto early = bootstrapApproval()) {
        report.outcome = *early;
        return report;
    }

    report.sync_id = makeSyncId();
    const auto version = firmwareVersion_.load();

    std::vector<std::string> queuedSamplers;
    std::vector<std::string> queuedTimelines;

    auto batch = deps_.client->batch();

    batch.callWithId(kAuthCall, "device.check_auth", {
        {"device_class", identity_.device_class},
        {"serial", identity_.serial},
        {"auth_token", deps_.token->value()},
        {"sync_id", report.sync_id}
    });

    batch.callWithId(kSetFirmwareCall, "device.set_firmware", {{"version", version}});

    if (checkFirmware_) batch.callWithId(kFirmwareCall, "device.check_firmware", {{"current_version", version}});

    for (const auto& name : deps_.samplers->names()) {
        auto samples = deps_.samplers->snapshot(name);
        if (samples.empty()) {
            deps_.samplers->removeSnapshot(name);
            continue;
        }
        batch.callWithId(samplesCall(name), "device.add_samples", {
            {"device_class", identity_.device_class},
            {"serial", identity_.serial},
            {"sampler_name", name},
            {"samples", std::move(samples)}
        });
        queuedSamplers.push_back(name);
    }

    batch.callWithId(kConfCall, "device.update_conf_map", {{"conf_map", deps_.settings->contentsMap()}});

    for (const auto& timeline : deps_.timelines->all()) {
        auto events = json::array();
        for (auto& stored : timeline->listEvents()) events.push_back(std::move(stored.record));
        if (events.empty()) continue;

        batch.callWithId(timelineCall(timeline->name()), "device.add_events", {
            {"name", timeline->name()},
            {"events", std::move(events)}
        });
        queuedTimelines.push_back(timeline->name());
    }

    log->debug("[Reconciler] Sync {} sending {} call(s)", report.sync_id, batch.size());
    batch.send();

    try {
        (void)batch.getResult(kAuthCall);
    } catch (const rpc::CallFailed& e) {
        if (batch.transportError()) throw rpc::TransportFailure(*batch.transportError());
        throw AuthRejected(fmt::format("authentication failed: {}", e.detail()));
    }

    try {
        (void)batch.getResult(kSetFirmwareCall);
    } catch (const std::exception& e) {
        log->error("[Reconciler] Error setting current firmware version: {}", e.what());
    }

    resolveSamplers(batch, queuedSamplers, report);
    resolveSettings(batch);
    resolveTimelines(batch, queuedTimelines, report);

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    log->debug("[Reconciler] Sync {} complete {:.2f}s", report.sync_id, elapsed);

    if (checkFirmware_) resolveFirmware(batch, report);

    report.outcome = CycleOutcome::Completed;
    return report;
}

void Reconciler::resolveSamplers(const rpc::Batch& batch, const std::vector<std::string>& queued,
                                 CycleReport& report) {
    const auto log = ctx_.log->sync();
    for (const auto& name : queued) {
        try {
            const auto& accepted = batch.getResult(samplesCall(name));
            if (!accepted.is_boolean() || !accepted.get<bool>()) {
                log->warn("[Reconciler] Server did not accept samples for '{}', keeping snapshot", name);
                continue;
            }
            deps_.samplers->removeSnapshot(name);
            ++report.samplers_cleared;
        } catch (const std::exception& e) {
            log->error("[Reconciler] Error adding samples to '{}': {}", name, e.what());
        }
    }
}

void Reconciler::resolveSettings(const rpc::Batch& batch) {
    const auto log = ctx_.log->sync();
    try {
        const auto& changed = batch.getResult(kConfCall);
        if (changed.is_null() || changed.empty()) return;
        if (!changed.is_object()) {
            log->error("[Reconciler] Settings result is not a mapping, ignoring");
            return;
        }

        const auto written = deps_.settings->update(changed);
        if (written.empty()) return;
        deps_.tasks->settingsChanged(written);
        log->debug("[Reconciler] Settings file(s) changed: {}", fmt::join(written, ", "));
    } catch (const std::exception& e) {
        log->error("[Reconciler] Error sending settings: {}", e.what());
    }
}

void Reconciler::resolveTimelines(const rpc::Batch& batch, const std::vector<std::string>& queued,
                                  CycleReport& report) {
    const auto log = ctx_.log->sync();
    for (const auto& name : queued) {
        try {
            const auto& accepted = batch.getResult(timelineCall(name));
            if (!accepted.is_array()) {
                log->error("[Reconciler] Timeline '{}' result is not a list of ids", name);
                continue;
            }

            std::vector<std::string> ids;
            for (const auto& id : accepted)
                if (id.is_string()) ids.push_back(id.get<std::string>());

            const auto timeline = deps_.timelines->get(name);
            const auto before = timeline->size();
            timeline->clear(ids);
            report.events_cleared += before - timeline->size();
        } catch (const std::exception& e) {
            log->error("[Reconciler] Error sending timeline '{}': {}", name, e.what());
        }
    }
}

void Reconciler::resolveFirmware(const rpc::Batch& batch, CycleReport& report) {
    const auto log = ctx_.log->firmware();
    try {
        const auto& result = batch.getResult(kFirmwareCall);
        if (result.value("current", false)) {
            log->debug("[Reconciler] Firmware is current");
            return;
        }

        const auto payload = result.at("firmware").get<std::string>();
        const auto deviceClass = result.at("device_class").get<std::string>();
        const auto version = result.at("version").get<int>();

        log->debug("[Reconciler] New firmware v{} for device class '{}'", version, deviceClass);
        log->info("[Reconciler] Installing firmware v{}", version);
        const auto installed = deps_.installer->install(deviceClass, version, payload);
        log->info("[Reconciler] Firmware installed in \"{}\"", installed.string());

        firmwareVersion_.store(version);
        report.firmware_installed = installed;
    } catch (const std::exception& e) {
        log->error("[Reconciler] Firmware update failed: {}", e.what());
        return;
    }

    requestRestart();
}
