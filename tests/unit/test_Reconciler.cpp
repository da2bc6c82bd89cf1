#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "auth/Token.hpp"
#include "firmware/Installer.hpp"
#include "rpc/Client.hpp"
#include "sampler/Provider.hpp"
#include "settings/Store.hpp"
#include "sync/Reconciler.hpp"
#include "tasks/Scheduler.hpp"
#include "timeline/Manager.hpp"
#include "timeline/Timeline.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace fa;
using nlohmann::json;

namespace {

class RecordingScheduler final : public tasks::Scheduler {
public:
    void start() override {}
    void stop() override {}
    void settingsChanged(const std::vector<std::string>& names) override { changes.push_back(names); }

    std::vector<std::vector<std::string>> changes;
};

std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

json allIds(const json& params) {
    auto ids = json::array();
    for (const auto& ev : params["events"]) ids.push_back(ev["_id"]);
    return ids;
}

}

class ReconcilerTest : public ::testing::Test {
protected:
    test::TempDir dir;
    runtime::Context ctx;
    std::shared_ptr<test::FakeTransport> transport = std::make_shared<test::FakeTransport>();
    std::shared_ptr<timeline::Manager> timelines;
    std::shared_ptr<sampler::Manager> samplers;
    std::shared_ptr<settings::Manager> settings;
    std::shared_ptr<RecordingScheduler> scheduler = std::make_shared<RecordingScheduler>();
    int restarts = 0;

    void SetUp() override {
        config::Config cfg;
        cfg.device.device_class = "pump";
        cfg.device.serial = "SN-1";
        cfg.device.name = "Pump one";
        cfg.device.company = "acme";
        cfg.device.auto_device_text = "rev B";
        cfg.firmware.version_file = dir / "firmware.yaml";
        cfg.firmware.install_path = dir / "fw";
        ctx = test::makeContext(cfg);

        timelines = std::make_shared<timeline::Manager>(ctx, dir / "timelines");
        timelines->newTimeline("t");
        samplers = std::make_shared<sampler::Manager>(ctx, dir / "samplers", std::vector<std::string>{"temp", "humidity"});
        settings = std::make_shared<settings::Manager>(ctx, dir / "settings");

        transport->returns("device.check_auth", true)
            .returns("device.set_firmware", nullptr)
            .returns("device.check_firmware", {{"current", true}})
            .returns("device.add_samples", true)
            .returns("device.update_conf_map", json::object())
            .on("device.add_events", allIds);
    }

    std::unique_ptr<sync::Reconciler> make(const std::string& tokenSource = "secret", const bool checkFirmware = false) {
        sync::Collaborators deps{
            .client = std::make_shared<rpc::Client>(ctx, transport),
            .token = std::make_shared<auth::Token>(tokenSource),
            .timelines = timelines,
            .samplers = samplers,
            .settings = settings,
            .tasks = scheduler,
            .installer = std::make_shared<firmware::DirectoryInstaller>(ctx),
        };
        auto r = std::make_unique<sync::Reconciler>(ctx, std::move(deps), device::Identity::fromConfig(ctx.conf().device),
                                                    firmware::readVersion(ctx.conf().firmware.version_file), checkFirmware);
        r->onRestartRequested([this] { ++restarts; });
        return r;
    }

    std::shared_ptr<timeline::Timeline> t() const { return timelines->get("t"); }
};

TEST_F(ReconcilerTest, BatchCarriesEveryStepInOrder) {
    t()->addEvent("TEXT", 1);
    samplers->sample("temp", 21.5, 10);

    const auto report = make("secret", true)->sync();
    EXPECT_EQ(report.outcome, sync::CycleOutcome::Completed);

    EXPECT_EQ(transport->lastBatchIds(), (std::vector<std::string>{
        "authenticate_result", "set_firmware_result", "firmware_result", "samples.temp", "conf_result",
        "timeline_result_t"}));
    EXPECT_EQ(transport->requests().size(), 1u);
}

TEST_F(ReconcilerTest, AuthenticateCarriesIdentityAndFreshSyncId) {
    const auto reconciler = make();
    const auto first = reconciler->sync();
    const auto second = reconciler->sync();

    const auto calls = transport->callsTo("device.check_auth");
    ASSERT_EQ(calls.size(), 2u);
    const auto& params = calls[0]["params"];
    EXPECT_EQ(params["device_class"], "pump");
    EXPECT_EQ(params["serial"], "SN-1");
    EXPECT_EQ(params["auth_token"], "secret");

    const auto syncId = params["sync_id"].get<std::string>();
    EXPECT_EQ(syncId, first.sync_id);
    ASSERT_EQ(syncId.size(), 12u);
    EXPECT_TRUE(std::ranges::all_of(syncId, [](const unsigned char c) { return std::isdigit(c) || std::islower(c); }));
    EXPECT_NE(first.sync_id, second.sync_id);
}

TEST_F(ReconcilerTest, EmptyTimelinesAndSamplersAreLeftOutOfTheBatch) {
    make()->sync();
    EXPECT_EQ(transport->lastBatchIds(), (std::vector<std::string>{
        "authenticate_result", "set_firmware_result", "conf_result"}));
}

TEST_F(ReconcilerTest, PartiallyAcceptedTimelineKeepsOnlyTheUnreturnedEvent) {
    t()->addEvent("TEXT", 1).addEvent("TEXT", 2);
    const auto events = t()->listEvents();
    transport->returns("device.add_events", json::array({events[0].id}));

    const auto report = make()->sync();

    const auto left = t()->listEvents();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].id, events[1].id);
    EXPECT_EQ(report.events_cleared, 1u);
}

TEST_F(ReconcilerTest, EventsAreDeletedOnlyWhenTheServerConfirmsThem) {
    t()->addEvent("TEXT", 1).addEvent("TEXT", 2);
    const auto events = t()->listEvents();
    const auto reconciler = make();

    transport->returns("device.add_events", json::array());
    reconciler->sync();
    EXPECT_EQ(t()->size(), 2u);

    transport->returns("device.add_events", json::array({"TEXT_0_0", 42}));
    reconciler->sync();
    EXPECT_EQ(t()->size(), 2u);

    transport->fails("device.add_events");
    reconciler->sync();
    EXPECT_EQ(t()->size(), 2u);

    transport->recovers("device.add_events").returns("device.add_events", json::array({events[1].id}));
    reconciler->sync();
    ASSERT_EQ(t()->size(), 1u);
    EXPECT_EQ(t()->listEvents()[0].id, events[0].id);

    transport->on("device.add_events", allIds);
    reconciler->sync();
    EXPECT_TRUE(t()->empty());
}

TEST_F(ReconcilerTest, MistypedEventRecordDoesNotBlockTheCycle) {
    t()->addEvent("TEXT", 5, {{"title", "kept"}});
    std::ofstream(t()->path() / "mistyped.json") << R"({"_id": "mistyped", "timestamp": "soon"})";

    const auto report = make()->sync();

    EXPECT_EQ(report.outcome, sync::CycleOutcome::Completed);
    EXPECT_EQ(transport->callsTo("device.check_auth").size(), 1u);
    const auto sent = transport->callsTo("device.add_events");
    ASSERT_EQ(sent.size(), 1u);
    ASSERT_EQ(sent[0]["params"]["events"].size(), 1u);
    EXPECT_EQ(sent[0]["params"]["events"][0]["title"], "kept");
}

TEST_F(ReconcilerTest, SubmittedEventsAreTheSortedStoredRecords) {
    t()->addEvent("TEXT", 20, {{"title", "late"}}).addEvent("TEXT", 10, {{"title", "early"}});
    make()->sync();

    const auto calls = transport->callsTo("device.add_events");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0]["params"]["name"], "t");
    const auto& submitted = calls[0]["params"]["events"];
    ASSERT_EQ(submitted.size(), 2u);
    EXPECT_EQ(submitted[0]["title"], "early");
    EXPECT_EQ(submitted[1]["title"], "late");
}

TEST_F(ReconcilerTest, AcceptedSamplesClearTheSnapshot) {
    samplers->sample("temp", 21.5, 10);
    const auto report = make()->sync();

    const auto calls = transport->callsTo("device.add_samples");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0]["params"]["sampler_name"], "temp");
    EXPECT_EQ(calls[0]["params"]["samples"], json::parse("[[10, 21.5]]"));
    EXPECT_FALSE(fs::exists(samplers->snapshotPath("temp")));
    EXPECT_EQ(report.samplers_cleared, 1u);
}

TEST_F(ReconcilerTest, RefusedOrFailedSamplesLeaveTheSnapshotByteIdentical) {
    samplers->sample("temp", 1.0, 1);
    const auto reconciler = make();

    transport->returns("device.add_samples", false);
    reconciler->sync();
    ASSERT_TRUE(fs::exists(samplers->snapshotPath("temp")));
    const auto original = slurp(samplers->snapshotPath("temp"));

    transport->fails("device.add_samples");
    reconciler->sync();
    EXPECT_EQ(slurp(samplers->snapshotPath("temp")), original);

    transport->recovers("device.add_samples").returns("device.add_samples", nullptr);
    reconciler->sync();
    EXPECT_EQ(slurp(samplers->snapshotPath("temp")), original);

    transport->returns("device.add_samples", true);
    reconciler->sync();
    EXPECT_FALSE(fs::exists(samplers->snapshotPath("temp")));
    EXPECT_EQ(transport->callsTo("device.add_samples").back()["params"]["samples"], json::parse("[[1, 1.0]]"));
}

TEST_F(ReconcilerTest, ChangedSettingsAreWrittenAndAnnounced) {
    settings->update({{"wifi", "ssid=old"}});
    transport->returns("device.update_conf_map", {{"wifi", "ssid=new"}, {"mqtt", "host=broker"}});

    make()->sync();

    const auto sent = transport->callsTo("device.update_conf_map");
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["params"]["conf_map"], (json{{"wifi", "ssid=old"}}));

    EXPECT_EQ(slurp(settings->dir() / "wifi"), "ssid=new");
    EXPECT_EQ(slurp(settings->dir() / "mqtt"), "host=broker");
    ASSERT_EQ(scheduler->changes.size(), 1u);
    auto names = scheduler->changes[0];
    std::ranges::sort(names);
    EXPECT_EQ(names, (std::vector<std::string>{"mqtt", "wifi"}));
}

TEST_F(ReconcilerTest, SettingThatCannotBeWrittenDoesNotHideTheOthers) {
    std::filesystem::create_directories(settings->dir() / "zzz");
    transport->returns("device.update_conf_map", {{"aaa", "x=1"}, {"zzz", "y=2"}});

    make()->sync();

    EXPECT_EQ(slurp(settings->dir() / "aaa"), "x=1");
    ASSERT_EQ(scheduler->changes.size(), 1u);
    EXPECT_EQ(scheduler->changes[0], std::vector<std::string>{"aaa"});
    EXPECT_FALSE(std::filesystem::exists(settings->dir() / "zzz.tmp"));
}

TEST_F(ReconcilerTest, UnchangedSettingsNotifyNobody) {
    make()->sync();
    EXPECT_TRUE(scheduler->changes.empty());
}

TEST_F(ReconcilerTest, OneFailingStepDoesNotStopTheOthers) {
    t()->addEvent("TEXT", 1);
    samplers->sample("temp", 3.0, 3);
    transport->fails("device.set_firmware").fails("device.update_conf_map");

    const auto report = make()->sync();

    EXPECT_EQ(report.outcome, sync::CycleOutcome::Completed);
    EXPECT_TRUE(t()->empty());
    EXPECT_EQ(report.samplers_cleared, 1u);
    EXPECT_TRUE(scheduler->changes.empty());
}

TEST_F(ReconcilerTest, RejectedCredentialAbortsWithoutClearingAnything) {
    t()->addEvent("TEXT", 1);
    samplers->sample("temp", 1.0, 1);
    transport->fails("device.check_auth", "bad token").returns("device.update_conf_map", {{"wifi", "x"}});

    EXPECT_THROW(make()->sync(), sync::AuthRejected);

    EXPECT_EQ(t()->size(), 1u);
    EXPECT_TRUE(fs::exists(samplers->snapshotPath("temp")));
    EXPECT_FALSE(fs::exists(settings->dir() / "wifi"));
}

TEST_F(ReconcilerTest, FailedRoundTripAbortsWithoutClearingAnything) {
    t()->addEvent("TEXT", 1);
    transport->goOffline();

    EXPECT_THROW(make()->sync(), rpc::TransportFailure);
    EXPECT_EQ(t()->size(), 1u);
}

TEST_F(ReconcilerTest, PendingApprovalEndsTheCycleQuietly) {
    const auto tokenFile = dir / "auth" / "token";
    t()->addEvent("TEXT", 1);
    transport->returns("device.check_approval", {{"state", "pending"}});

    sync::CycleReport report;
    EXPECT_NO_THROW(report = make("file:" + tokenFile.string())->sync());

    EXPECT_EQ(report.outcome, sync::CycleOutcome::ApprovalPending);
    EXPECT_FALSE(fs::exists(tokenFile));
    EXPECT_EQ(t()->size(), 1u);
    EXPECT_TRUE(transport->callsTo("device.check_auth").empty());

    const auto approval = transport->callsTo("device.check_approval");
    ASSERT_EQ(approval.size(), 1u);
    EXPECT_EQ(approval[0]["params"], (json{{"company", "acme"}, {"serial", "SN-1"}, {"name", "Pump one"}, {"info", "rev B"}}));
}

TEST_F(ReconcilerTest, DeniedApprovalEndsTheCycle) {
    transport->returns("device.check_approval", {{"state", "denied"}});
    EXPECT_EQ(make("file:" + (dir / "token").string())->sync().outcome, sync::CycleOutcome::ApprovalDenied);
    EXPECT_TRUE(transport->callsTo("device.check_auth").empty());
}

TEST_F(ReconcilerTest, ApprovalWritesTheCredentialAndContinues) {
    const auto tokenFile = dir / "auth" / "token";
    transport->returns("device.check_approval", {{"state", "approved"}, {"auth_token", "granted"}});
    const auto reconciler = make("file:" + tokenFile.string());

    EXPECT_EQ(reconciler->sync().outcome, sync::CycleOutcome::Completed);
    EXPECT_EQ(slurp(tokenFile), "granted");
    EXPECT_EQ(transport->callsTo("device.check_auth").at(0)["params"]["auth_token"], "granted");

    reconciler->sync();
    EXPECT_EQ(transport->callsTo("device.check_approval").size(), 1u);
}

TEST_F(ReconcilerTest, MissingCredentialMakesNoRemoteCalls) {
    EXPECT_EQ(make("")->sync().outcome, sync::CycleOutcome::NoCredential);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(ReconcilerTest, FirmwareIsNotCheckedWhenDisabled) {
    make("secret", false)->sync();
    EXPECT_TRUE(transport->callsTo("device.check_firmware").empty());
    EXPECT_EQ(transport->callsTo("device.set_firmware").at(0)["params"]["version"], 1);
}

TEST_F(ReconcilerTest, NewFirmwareIsInstalledAndRequestsRestart) {
    transport->returns("device.check_firmware",
                       {{"current", false}, {"firmware", "AQID"}, {"device_class", "pump"}, {"version", 4}});
    const auto reconciler = make("secret", true);

    const auto report = reconciler->sync();

    ASSERT_TRUE(report.firmware_installed.has_value());
    EXPECT_EQ(*report.firmware_installed, dir / "fw" / "pump" / "4");
    EXPECT_EQ(slurp(dir / "fw" / "pump" / "4" / "firmware.bin"), std::string("\x01\x02\x03"));
    EXPECT_EQ(firmware::readVersion(dir / "firmware.yaml"), 4);
    EXPECT_EQ(reconciler->firmwareVersion(), 4);
    EXPECT_EQ(restarts, 1);
    EXPECT_EQ(transport->callsTo("device.check_firmware").at(0)["params"]["current_version"], 1);
}

TEST_F(ReconcilerTest, CurrentFirmwareNeedsNoRestart) {
    make("secret", true)->sync();
    EXPECT_EQ(restarts, 0);
}

TEST_F(ReconcilerTest, FirmwareFailureIsContained) {
    transport->returns("device.check_firmware", {{"current", false}, {"firmware", "AQID"}});
    t()->addEvent("TEXT", 1);

    const auto report = make("secret", true)->sync();

    EXPECT_EQ(report.outcome, sync::CycleOutcome::Completed);
    EXPECT_FALSE(report.firmware_installed.has_value());
    EXPECT_EQ(restarts, 0);
    EXPECT_TRUE(t()->empty());
}

TEST_F(ReconcilerTest, CyclesNeverOverlap) {
    std::atomic<int> inFlight{0};
    std::atomic<int> maxSeen{0};
    transport->on("device.check_auth", [&](const json&) {
        const int now = ++inFlight;
        int seen = maxSeen.load();
        while (now > seen && !maxSeen.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --inFlight;
        return json(true);
    });

    const auto reconciler = make();
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
        threads.emplace_back([&] {
            for (int j = 0; j < 3; ++j) reconciler->sync();
        });
    for (auto& th : threads) th.join();

    EXPECT_EQ(maxSeen.load(), 1);
    EXPECT_EQ(transport->callsTo("device.check_auth").size(), 12u);
}
