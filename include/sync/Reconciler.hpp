#pragma once

#include "runtime/Context.hpp"
#include "device/Identity.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fa::rpc { class Client; class Batch; }
namespace fa::timeline { class Manager; }
namespace fa::sampler { class Provider; }
namespace fa::settings { class Store; }
namespace fa::tasks { class Scheduler; }
namespace fa::firmware { class Installer; }
namespace fa::auth { class Token; }

namespace fa::sync {

// The server refused the device credential.
struct AuthRejected : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Local state the daemon cannot recover from by retrying.
struct ClientError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class CycleOutcome { Completed, ApprovalPending, ApprovalDenied, NoCredential };

std::string to_string(CycleOutcome outcome);

struct CycleReport {
    CycleOutcome outcome{CycleOutcome::Completed};
    std::string sync_id;
    size_t samplers_cleared{0};
    size_t events_cleared{0};
    std::optional<std::filesystem::path> firmware_installed;
};

struct Collaborators {
    std::shared_ptr<rpc::Client> client;
    std::shared_ptr<auth::Token> token;
    std::shared_ptr<timeline::Manager> timelines;
    std::shared_ptr<sampler::Provider> samplers;
    std::shared_ptr<settings::Store> settings;
    std::shared_ptr<tasks::Scheduler> tasks;
    std::shared_ptr<firmware::Installer> installer;
};

class Reconciler {
public:
    using RestartRequest = std::function<void()>;

    static constexpr size_t kSyncIdLength = 12;

    Reconciler(const runtime::Context& ctx, Collaborators deps, device::Identity identity,
               int firmwareVersion, bool checkFirmware);

    // One full cycle. Cycles are serialised: a concurrent caller waits for the
    // in-flight cycle. Throws AuthRejected, rpc::TransportFailure or ClientError;
    // everything after authentication is handled per item and never throws.
    CycleReport sync();

    // Invoked after a firmware update has been installed.
    void onRestartRequested(RestartRequest fn);

    [[nodiscard]] int firmwareVersion() const noexcept { return firmwareVersion_.load(); }
    [[nodiscard]] bool checksFirmware() const noexcept { return checkFirmware_; }
    [[nodiscard]] const device::Identity& identity() const noexcept { return identity_; }

private:
    runtime::Context ctx_;
    Collaborators deps_;
    device::Identity identity_;
    std::atomic<int> firmwareVersion_;
    bool checkFirmware_;

    std::mutex cycleMutex_;
    std::mutex restartMutex_;
    RestartRequest restart_;

    std::optional<CycleOutcome> bootstrapApproval();

    void resolveSamplers(const rpc::Batch& batch, const std::vector<std::string>& queued, CycleReport& report);
    void resolveSettings(const rpc::Batch& batch);
    void resolveTimelines(const rpc::Batch& batch, const std::vector<std::string>& queued, CycleReport& report);
    void resolveFirmware(const rpc::Batch& batch, CycleReport& report);

    void requestRestart();
};

std::string makeSyncId();

}
