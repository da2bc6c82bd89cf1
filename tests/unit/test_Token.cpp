#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "auth/Token.hpp"
#include "device/Identity.hpp"

#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace fa;

TEST(TokenTest, InlineTokenIsUsedAsIs) {
    const auth::Token token("abc123");
    EXPECT_FALSE(token.isFileReference());
    EXPECT_EQ(token.value(), "abc123");
    EXPECT_TRUE(token.present());
}

TEST(TokenTest, MissingFileMeansNoCredentialYet) {
    test::TempDir dir;
    auth::Token token("file:" + (dir / "auth").string());
    EXPECT_TRUE(token.isFileReference());
    EXPECT_FALSE(token.present());

    token.persist("granted");
    EXPECT_EQ(token.value(), "granted");

    struct stat st{};
    ASSERT_EQ(::stat((dir / "auth").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST(TokenTest, PersistCreatesParentDirectories) {
    test::TempDir dir;
    auth::Token token("file:" + (dir.path() / "a" / "b" / "token").string());
    token.persist("t");
    EXPECT_TRUE(fs::exists(dir.path() / "a" / "b" / "token"));
}

TEST(TokenTest, InlineTokenCannotBePersisted) {
    auth::Token token("abc");
    EXPECT_THROW(token.persist("other"), std::logic_error);
}

TEST(IdentityTest, SerialFallsBackToMachineIdThenRandom) {
    test::TempDir dir;
    std::ofstream(dir / "machine-id") << "0123abcd\n";

    config::DeviceConfig cfg;
    cfg.device_class = "pump";
    const auto fromMachine = device::Identity::fromConfig(cfg, dir / "machine-id");
    EXPECT_EQ(fromMachine.serial, "0123abcd");
    EXPECT_EQ(fromMachine.name, "0123abcd");

    const auto random = device::Identity::fromConfig(cfg, dir / "missing");
    EXPECT_EQ(random.serial.size(), 32u);

    cfg.serial = "SN-9";
    cfg.name = "Pump";
    const auto configured = device::Identity::fromConfig(cfg, dir / "machine-id");
    EXPECT_EQ(configured.serial, "SN-9");
    EXPECT_EQ(configured.name, "Pump");
}
