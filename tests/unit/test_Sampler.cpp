#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "sampler/Provider.hpp"

#include <fstream>

namespace fs = std::filesystem;
using namespace fa;
using nlohmann::json;

class SamplerTest : public ::testing::Test {
protected:
    test::TempDir dir;
    runtime::Context ctx = test::makeContext();
    sampler::Manager samplers{ctx, dir.path(), {"temp"}};
};

TEST_F(SamplerTest, SnapshotFreezesPendingSamples) {
    samplers.sample("temp", 20.0, 1);
    samplers.sample("temp", 21.0, 2);

    EXPECT_EQ(samplers.snapshot("temp"), json::parse("[[1, 20.0], [2, 21.0]]"));
    EXPECT_TRUE(fs::exists(samplers.snapshotPath("temp")));
    EXPECT_FALSE(fs::exists(samplers.samplesPath("temp")));
}

TEST_F(SamplerTest, ExistingSnapshotIsReturnedUnchangedUntilRemoved) {
    samplers.sample("temp", 20.0, 1);
    const auto first = samplers.snapshot("temp");

    samplers.sample("temp", 30.0, 5);
    EXPECT_EQ(samplers.snapshot("temp"), first);

    samplers.removeSnapshot("temp");
    EXPECT_EQ(samplers.snapshot("temp"), json::parse("[[5, 30.0]]"));
}

TEST_F(SamplerTest, NothingPendingYieldsAnEmptySnapshot) {
    EXPECT_TRUE(samplers.snapshot("temp").empty());
    EXPECT_FALSE(fs::exists(samplers.snapshotPath("temp")));
}

TEST_F(SamplerTest, MalformedSampleLinesAreSkipped) {
    samplers.sample("temp", 1.0, 1);
    std::ofstream(samplers.samplesPath("temp"), std::ios::app) << "oops\n";
    samplers.sample("temp", 2.0, 2);

    EXPECT_EQ(samplers.snapshot("temp").size(), 2u);
}

TEST_F(SamplerTest, UnknownSamplerIsRejected) {
    EXPECT_THROW(samplers.sample("pressure", 1.0), std::invalid_argument);
    EXPECT_THROW((void)sampler::Manager(ctx, dir.path(), {"../x"}), std::invalid_argument);
}
