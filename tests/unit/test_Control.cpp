#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "control/Server.hpp"

#include <atomic>
#include <mutex>
#include <thread>

using namespace fa;
using namespace fa::control;

class ControlTest : public ::testing::Test {
protected:
    runtime::Context ctx = [] {
        config::Config cfg;
        cfg.daemon.control_port = 0;
        return test::makeContext(cfg);
    }();

    std::mutex mutex;
    std::vector<std::string> received;

    std::unique_ptr<Server> server = std::make_unique<Server>(ctx, [this](const std::string& command) {
        std::scoped_lock lock(mutex);
        received.push_back(command);
        if (command == "FAIL") throw std::runtime_error("handler blew up");
        return "echo:" + command;
    });

    void SetUp() override { server->start(); }
    void TearDown() override { server->stop(); }

    [[nodiscard]] Client client() const { return {"127.0.0.1", server->port()}; }
};

TEST_F(ControlTest, BindsAnEphemeralLoopbackPort) {
    EXPECT_NE(server->port(), 0);
    EXPECT_TRUE(server->isRunning());
}

TEST_F(ControlTest, OneLineInOneLineOut) {
    EXPECT_EQ(client().send("STATUS"), "echo:STATUS");
    EXPECT_EQ(client().send("SYNC"), "echo:SYNC");

    std::scoped_lock lock(mutex);
    EXPECT_EQ(received, (std::vector<std::string>{"STATUS", "SYNC"}));
}

TEST_F(ControlTest, LineTerminatorsAreStripped) {
    EXPECT_EQ(client().send("STOP\r"), "echo:STOP");
}

TEST_F(ControlTest, CommandsAreCappedAt128Bytes) {
    const std::string longCommand(300, 'x');
    EXPECT_EQ(client().send(longCommand), "echo:" + std::string(kMaxCommandBytes, 'x'));
}

TEST_F(ControlTest, HandlerFailureIsRepliedAndServingContinues) {
    EXPECT_EQ(client().send("FAIL"), "handler blew up");
    EXPECT_EQ(client().send("STATUS"), "echo:STATUS");
}

TEST_F(ControlTest, StoppedServerIsReportedAsNotRunning) {
    const auto port = server->port();
    server->stop();
    EXPECT_FALSE(server->isRunning());
    EXPECT_THROW((void)Client("127.0.0.1", port).send("STATUS"), NotRunning);
}

TEST_F(ControlTest, StoppingOneServerLeavesOtherDescriptorsAlone) {
    std::atomic<bool> done{false};
    std::atomic<int> failures{0};
    std::thread traffic([&] {
        while (!done) {
            try {
                if (client().send("STATUS") != "echo:STATUS") ++failures;
            } catch (const std::exception&) {
                ++failures;
            }
        }
    });

    for (int i = 0; i < 50; ++i) {
        Server transient(ctx, [](const std::string&) { return std::string("OK"); });
        transient.start();
        EXPECT_EQ(Client("127.0.0.1", transient.port()).send("STATUS"), "OK");
        transient.stop();
    }

    done = true;
    traffic.join();
    EXPECT_EQ(failures.load(), 0);
    EXPECT_TRUE(server->isRunning());
    EXPECT_EQ(client().send("STATUS"), "echo:STATUS");
}

TEST(ControlLineTest, StripLineEnd) {
    EXPECT_EQ(stripLineEnd("SYNC\n"), "SYNC");
    EXPECT_EQ(stripLineEnd("SYNC\r\n"), "SYNC");
    EXPECT_EQ(stripLineEnd("SYNC\nextra"), "SYNC");
    EXPECT_EQ(stripLineEnd(""), "");
}
