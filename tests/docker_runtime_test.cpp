#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/docker_runtime.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

using namespace sandpit::runtime;

// True when flag is immediately followed by value
bool has_pair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (size_t i = 0; i + 1 < args.size(); i++) {
        if (args[i] == flag && args[i + 1] == value) return true;
    }
    return false;
}

EnvironmentSpec sample_spec() {
    EnvironmentSpec spec;
    spec.name = "sbx-0001";
    spec.image = "sandpit-python:latest";
    spec.workspace_path = "/var/lib/sandpit/sbx-0001";
    spec.constraints.memory_mb = 256;
    spec.constraints.cpu_quota = 0.5;
    spec.constraints.max_pids = 64;
    return spec;
}

TEST(DockerRuntimeTest, RunArgsApplyConstraints) {
    DockerRuntime docker;
    auto args = docker.build_run_args(sample_spec());

    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args[0], "run");
    EXPECT_EQ(args[1], "-d");
    EXPECT_TRUE(has_pair(args, "--name", "sbx-0001"));
    EXPECT_TRUE(has_pair(args, "--network", "none"));
    EXPECT_TRUE(has_pair(args, "--memory", "256m"));
    EXPECT_TRUE(has_pair(args, "--memory-swap", "256m"));
    EXPECT_TRUE(has_pair(args, "--cpus", "0.5"));
    EXPECT_TRUE(has_pair(args, "--pids-limit", "64"));
    EXPECT_TRUE(has_pair(args, "--cap-drop", "ALL"));
    EXPECT_TRUE(has_pair(args, "--security-opt", "no-new-privileges:true"));
    EXPECT_TRUE(has_pair(args, "-v", "/var/lib/sandpit/sbx-0001:/workspace:rw"));
    EXPECT_TRUE(has_pair(args, "-w", "/workspace"));

    // Image then the keep-alive command close the list
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "sandpit-python:latest");
    EXPECT_EQ(args[args.size() - 2], "sleep");
    EXPECT_EQ(args.back(), "infinity");
}

TEST(DockerRuntimeTest, NetworkAndUserOptions) {
    DockerRuntimeConfig config;
    config.user = "1000:1000";
    DockerRuntime docker(config);

    auto spec = sample_spec();
    spec.constraints.network = true;
    auto args = docker.build_run_args(spec);

    EXPECT_EQ(std::find(args.begin(), args.end(), "--network"), args.end());
    EXPECT_TRUE(has_pair(args, "--user", "1000:1000"));
}

TEST(DockerRuntimeTest, ParseDiffKeepsChangesOutsideWorkspace) {
    const std::string diff =
        "C /etc\n"
        "A /etc/evil.conf\n"
        "C /workspace\n"
        "A /workspace/main.py\n"
        "C /tmp\n"
        "A /tmp/scratch\n"
        "C /usr/lib/python3/site-packages\n"
        "A /usr/lib/python3/site-packages/requests\n"
        "D /root/.profile\n";

    auto changed = DockerRuntime::parse_diff(diff, {"/workspace", "/tmp"});
    EXPECT_THAT(changed, UnorderedElementsAre("/etc/evil.conf",
                                              "/usr/lib/python3/site-packages/requests",
                                              "/root/.profile"));
}

TEST(DockerRuntimeTest, ParseDiffOnlyWorkspaceIsClean) {
    auto changed = DockerRuntime::parse_diff("C /workspace\nA /workspace/out.txt\n",
                                             {"/workspace", "/tmp"});
    EXPECT_THAT(changed, IsEmpty());
    EXPECT_THAT(DockerRuntime::parse_diff("", {"/workspace"}), IsEmpty());
}

TEST(DockerRuntimeTest, ParseDiffPrefixNeedsComponentBoundary) {
    auto changed = DockerRuntime::parse_diff("A /workspace-evil\n", {"/workspace"});
    EXPECT_THAT(changed, ElementsAre("/workspace-evil"));
}

TEST(DockerRuntimeTest, ParseStats) {
    auto usage = DockerRuntime::parse_stats(
        R"({"CPUPerc":"12.50%","MemUsage":"64MiB / 512MiB","PIDs":"7","Name":"sbx-0001"})");
    ASSERT_TRUE(usage.has_value());
    EXPECT_DOUBLE_EQ(usage->cpu_percent, 12.5);
    EXPECT_EQ(usage->memory_bytes, 64ull * 1024 * 1024);
    EXPECT_EQ(usage->memory_limit_bytes, 512ull * 1024 * 1024);
    EXPECT_EQ(usage->pids, 7u);
}

TEST(DockerRuntimeTest, ParseStatsDecimalUnits) {
    auto usage = DockerRuntime::parse_stats(R"({"CPUPerc":"0.00%","MemUsage":"1.5kB / 1GB","PIDs":"1"})");
    ASSERT_TRUE(usage.has_value());
    EXPECT_EQ(usage->memory_bytes, 1500u);
    EXPECT_EQ(usage->memory_limit_bytes, 1000000000u);
}

TEST(DockerRuntimeTest, ParseStatsRejectsGarbage) {
    EXPECT_FALSE(DockerRuntime::parse_stats("not json").has_value());
}

TEST(DockerRuntimeTest, UnavailableBinary) {
    DockerRuntimeConfig config;
    config.docker_binary = "/nonexistent/docker";
    config.command_timeout = std::chrono::milliseconds(5000);
    DockerRuntime docker(config);
    EXPECT_FALSE(docker.available());
    EXPECT_FALSE(docker.healthy("missing"));
}

TEST(DockerRuntimeTest, FailedDiffCountsAsModified) {
    DockerRuntimeConfig config;
    config.docker_binary = "/nonexistent/docker";
    config.command_timeout = std::chrono::milliseconds(5000);
    DockerRuntime docker(config);
    EXPECT_THAT(docker.modified_outside_workspace("missing"),
                ElementsAre(std::string(DockerRuntime::DIFF_FAILED_ENTRY)));
}

}  // namespace
