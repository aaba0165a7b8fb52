#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "fake_runtime.hpp"
#include "kernel/executor.hpp"
#include "runtime/local_runtime.hpp"

#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

using namespace sandpit::kernel;
using sandpit::fakes::FakeRuntime;
using sandpit::runtime::ExecOutput;
using sandpit::runtime::ExecSpec;
using sandpit::runtime::ResourceConstraints;
using sandpit::runtime::ResourceUsage;
using std::chrono::milliseconds;

namespace fs = std::filesystem;

const char* PYTEST_OUTPUT =
    "============================= test session starts ==============================\n"
    "collected 2 items\n"
    "\n"
    "test_math.py .F                                                          [100%]\n"
    "\n"
    "=================================== FAILURES ===================================\n"
    "_________________________________ test_add ___________________________________\n"
    "\n"
    "    def test_add():\n"
    ">       assert 2 + 2 == 5\n"
    "E       assert 4 == 5\n"
    "\n"
    "test_math.py:4: AssertionError\n"
    "=========================== short test summary info ============================\n"
    "FAILED test_math.py::test_add - assert 4 == 5\n"
    "========================= 1 failed, 1 passed in 0.05s ==========================\n";

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

ExecutionRequest code(const std::string& payload) {
    ExecutionRequest request;
    request.payload = payload;
    request.mode = ExecutionMode::ARBITRARY_CODE;
    return request;
}

ExecutionRequest tests(const std::string& command) {
    ExecutionRequest request;
    request.payload = command;
    request.mode = ExecutionMode::TEST_RUN;
    return request;
}

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("sandpit_exec_" + std::to_string(getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
        runtime_ = std::make_shared<FakeRuntime>();
    }

    void TearDown() override {
        executor_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    SandpitConfig config() const {
        SandpitConfig c;
        c.workspace_root = root_.string();
        c.image = "sandpit-test:latest";
        c.pool.max_size = 2;
        c.pool.acquire_timeout_ms = 5000;
        c.pool.sweep_interval_sec = 0;
        c.retry_base_delay_ms = 1;
        c.retry_max_delay_ms = 10;
        return c;
    }

    Executor& make(const SandpitConfig& c) {
        executor_ = std::make_unique<Executor>(c, runtime_);
        return *executor_;
    }

    Executor& make() { return make(config()); }

    fs::path root_;
    std::shared_ptr<FakeRuntime> runtime_;
    std::unique_ptr<Executor> executor_;
};

// ============================================================================
// Arbitrary code
// ============================================================================

TEST_F(ExecutorTest, RunsCodeInBorrowedSandbox) {
    auto& executor = make();
    std::string written;
    runtime_->on_exec([&](const std::string&, const ExecSpec&) -> Result<ExecOutput> {
        written = read_file(fs::path(runtime_->created_specs.back().workspace_path) / "main.py");
        ExecOutput out;
        out.exit_code = 0;
        out.stdout_data = "2\n";
        out.duration = milliseconds(12);
        return out;
    });

    auto result = executor.execute(code("print(1 + 1)"));
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value().exit_code, 0);
    EXPECT_EQ(result.value().stdout_text, "2\n");
    EXPECT_EQ(result.value().sandbox_id, "sbx-0001");
    EXPECT_FALSE(result.value().sandbox_reused);
    EXPECT_EQ(result.value().attempts, 1u);
    EXPECT_THAT(result.value().request_id, HasSubstr("exec-"));
    EXPECT_EQ(written, "print(1 + 1)");

    EXPECT_THAT(runtime_->last_exec.argv, ElementsAre("python3", "main.py"));
    EXPECT_EQ(runtime_->last_exec.working_dir, ".");
    EXPECT_EQ(runtime_->last_exec.timeout, milliseconds(30000));
}

TEST_F(ExecutorTest, SecondRunReusesSandbox) {
    auto& executor = make();
    ASSERT_TRUE(executor.execute(code("x = 1")));
    executor.pool().wait_for_maintenance();

    auto second = executor.execute(code("x = 2"));
    ASSERT_TRUE(second);
    EXPECT_TRUE(second.value().sandbox_reused);
    EXPECT_EQ(second.value().sandbox_id, "sbx-0001");
    EXPECT_EQ(runtime_->create_calls.load(), 1);

    auto metrics = executor.get_metrics();
    EXPECT_EQ(metrics.executions, 2u);
    EXPECT_EQ(metrics.successes, 2u);
    EXPECT_EQ(metrics.pool_misses, 1u);
    EXPECT_EQ(metrics.pool_hits, 1u);
}

TEST_F(ExecutorTest, CustomTargetAndExtraFiles) {
    auto& executor = make();
    std::string helper;
    runtime_->on_exec([&](const std::string&, const ExecSpec&) -> Result<ExecOutput> {
        helper = read_file(fs::path(runtime_->created_specs.back().workspace_path) / "lib" / "helper.py");
        ExecOutput out;
        out.exit_code = 0;
        return out;
    });

    auto request = code("from lib.helper import VALUE\nprint(VALUE)");
    request.target_path = "app/run.py";
    request.files.push_back({"lib/helper.py", "VALUE = 42\n"});
    request.interpreter = "python";

    ASSERT_TRUE(executor.execute(request));
    EXPECT_EQ(helper, "VALUE = 42\n");
    EXPECT_THAT(runtime_->last_exec.argv, ElementsAre("python", "app/run.py"));
}

TEST_F(ExecutorTest, NonZeroExitIsExecutionError) {
    auto& executor = make();
    runtime_->script_exec(1, "", "Traceback...\nZeroDivisionError: division by zero\n");

    auto result = executor.execute(code("1 / 0"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::EXECUTION);
    EXPECT_THAT(result.error().message(), HasSubstr("process exited with code 1"));
    auto* details = result.error().details_as<ExecutionDetails>();
    ASSERT_NE(details, nullptr);
    EXPECT_EQ(details->exit_code, 1);
    EXPECT_THAT(details->stderr_text, HasSubstr("ZeroDivisionError"));
    EXPECT_EQ(details->sandbox_id, "sbx-0001");

    // A plain failure leaves the sandbox reusable
    executor.pool().wait_for_maintenance();
    EXPECT_EQ(executor.get_pool_stats().destroyed, 0u);
    EXPECT_EQ(executor.get_pool_stats().idle_count, 1u);
    EXPECT_EQ(executor.get_metrics().failures_of(ErrorKind::EXECUTION), 1u);
}

TEST_F(ExecutorTest, TimeoutTaintsSandbox) {
    auto& executor = make();
    runtime_->script_exec(137, "partial", "", true);

    auto request = code("while True: pass");
    request.timeout = milliseconds(500);
    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::EXECUTION);
    EXPECT_THAT(result.error().message(), HasSubstr("timed out after 500ms"));
    auto* details = result.error().details_as<ExecutionDetails>();
    ASSERT_NE(details, nullptr);
    EXPECT_TRUE(details->timed_out);
    EXPECT_EQ(details->stdout_text, "partial");
    EXPECT_EQ(runtime_->last_exec.timeout, milliseconds(500));

    executor.pool().wait_for_maintenance();
    auto stats = executor.get_pool_stats();
    EXPECT_EQ(stats.tainted_releases, 1u);
    EXPECT_EQ(stats.destroyed, 1u);
    EXPECT_EQ(runtime_->live_count(), 0u);

    auto metrics = executor.get_metrics();
    EXPECT_EQ(metrics.timeouts, 1u);
    EXPECT_EQ(metrics.tainted_releases, 1u);
}

TEST_F(ExecutorTest, CrashTaintsSandbox) {
    auto& executor = make();
    runtime_->script_exec(139);

    auto result = executor.execute(code("import ctypes; ctypes.string_at(0)"));
    ASSERT_FALSE(result);
    EXPECT_THAT(result.error().message(), HasSubstr("code 139"));

    executor.pool().wait_for_maintenance();
    EXPECT_EQ(executor.get_pool_stats().destroyed, 1u);
}

TEST_F(ExecutorTest, PackageInstallTaintsEvenOnSuccess) {
    auto& executor = make();
    auto result = executor.execute(code("import os\nos.system('pip install requests')\n"));
    ASSERT_TRUE(result);

    executor.pool().wait_for_maintenance();
    EXPECT_EQ(executor.get_pool_stats().destroyed, 1u);
    EXPECT_EQ(executor.get_metrics().tainted_releases, 1u);

    auto next = executor.execute(code("print('fresh')"));
    ASSERT_TRUE(next);
    EXPECT_FALSE(next.value().sandbox_reused);
    EXPECT_EQ(next.value().sandbox_id, "sbx-0002");
}

TEST_F(ExecutorTest, MemoryCeilingTaintsSandbox) {
    auto& executor = make();
    ResourceUsage usage;
    usage.memory_bytes = 512ull * 1024 * 1024;
    usage.memory_limit_bytes = 512ull * 1024 * 1024;
    runtime_->scripted_usage = usage;
    runtime_->script_exec(1, "", "MemoryError\n");

    ASSERT_FALSE(executor.execute(code("x = ' ' * 10**10")));
    executor.pool().wait_for_maintenance();
    EXPECT_EQ(executor.get_pool_stats().destroyed, 1u);

    auto metrics = executor.get_metrics();
    EXPECT_EQ(metrics.resource_samples, 1u);
    EXPECT_EQ(metrics.last_memory_bytes, 512ull * 1024 * 1024);
}

TEST_F(ExecutorTest, CancelledBeforeStart) {
    auto& executor = make();
    auto request = code("print('never')");
    request.cancel = std::make_shared<std::atomic<bool>>(true);

    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::EXECUTION);
    EXPECT_THAT(result.error().message(), HasSubstr("cancelled before it started"));
    EXPECT_EQ(runtime_->exec_calls.load(), 0);

    // Nothing ran, so the sandbox goes back clean
    executor.pool().wait_for_maintenance();
    EXPECT_EQ(executor.get_pool_stats().destroyed, 0u);
    EXPECT_EQ(executor.get_metrics().cancellations, 1u);
}

// ============================================================================
// Validation happens before the pool
// ============================================================================

TEST_F(ExecutorTest, PathTraversalRejectedBeforeAcquire) {
    auto& executor = make();
    auto request = code("print('x')");
    request.target_path = "../../etc/passwd";

    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::INPUT_VALIDATION);
    EXPECT_EQ(result.error().type_name(), "PathTraversalError");
    EXPECT_EQ(runtime_->create_calls.load(), 0);
    EXPECT_EQ(executor.get_pool_stats().created, 0u);

    auto metrics = executor.get_metrics();
    EXPECT_EQ(metrics.validation_rejections, 1u);
    EXPECT_EQ(metrics.failures_of(ErrorKind::INPUT_VALIDATION), 1u);

    auto security = executor.audit().get_entries(AuditCategory::SECURITY);
    ASSERT_EQ(security.size(), 1u);
    EXPECT_EQ(security[0].event_type, "PathTraversalError");
}

TEST_F(ExecutorTest, TraversalInExtraFileRejected) {
    auto& executor = make();
    auto request = code("print('x')");
    request.files.push_back({"../outside.py", "evil"});

    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().type_name(), "PathTraversalError");
    EXPECT_FALSE(fs::exists(root_ / "outside.py"));
}

TEST_F(ExecutorTest, CommandInjectionInTestRun) {
    auto& executor = make();
    auto result = executor.execute(tests("pytest; rm -rf /"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().type_name(), "CommandInjectionError");
    EXPECT_EQ(runtime_->create_calls.load(), 0);
}

TEST_F(ExecutorTest, BlockedProgramInTestRun) {
    auto& executor = make();
    auto result = executor.execute(tests("sudo pytest"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().type_name(), "CommandInjectionError");
}

TEST_F(ExecutorTest, InterpreterMustBeAllowed) {
    auto& executor = make();
    auto request = code("print(1)");
    request.interpreter = "perl";

    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().type_name(), "InputValidationError");
    EXPECT_THAT(result.error().message(), HasSubstr("interpreter"));
}

TEST_F(ExecutorTest, TimeoutOutOfRange) {
    auto& executor = make();
    auto request = code("print(1)");
    request.timeout = milliseconds(0);
    EXPECT_FALSE(executor.execute(request));

    request.timeout = milliseconds(601 * 1000);
    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::INPUT_VALIDATION);
    EXPECT_EQ(executor.get_metrics().validation_rejections, 2u);
}

TEST_F(ExecutorTest, ConstraintsAboveLimitsRejected) {
    auto& executor = make();
    auto request = code("print(1)");
    ResourceConstraints c;
    c.memory_mb = 8192;
    request.constraints = c;

    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::INPUT_VALIDATION);
    EXPECT_EQ(runtime_->create_calls.load(), 0);
}

TEST_F(ExecutorTest, NonFiniteCpuQuotaRejected) {
    auto& executor = make();
    auto request = code("print(1)");
    ResourceConstraints c;
    c.cpu_quota = std::numeric_limits<double>::quiet_NaN();
    request.constraints = c;

    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::INPUT_VALIDATION);

    c.cpu_quota = std::numeric_limits<double>::infinity();
    request.constraints = c;
    EXPECT_FALSE(executor.execute(request));

    EXPECT_EQ(runtime_->create_calls.load(), 0);
    EXPECT_EQ(executor.get_pool_stats().created, 0u);
}

TEST_F(ExecutorTest, PidsAboveCeilingRejected) {
    auto& executor = make();
    auto request = code("print(1)");
    ResourceConstraints c;
    c.max_pids = 4000000000u;
    request.constraints = c;

    auto result = executor.execute(request);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::INPUT_VALIDATION);
    EXPECT_THAT(result.error().message(), HasSubstr("processes"));
    EXPECT_EQ(runtime_->create_calls.load(), 0);

    c.max_pids = executor.config().constraints.pids_ceiling;
    request.constraints = c;
    ASSERT_TRUE(executor.execute(request));
    ASSERT_EQ(runtime_->created_specs.size(), 1u);
    EXPECT_EQ(runtime_->created_specs[0].constraints.max_pids, c.max_pids);
}

TEST_F(ExecutorTest, RequestedConstraintsReachRuntime) {
    auto& executor = make();
    auto request = code("print(1)");
    ResourceConstraints c;
    c.memory_mb = 256;
    c.cpu_quota = 1.0;
    c.max_pids = 32;
    request.constraints = c;

    ASSERT_TRUE(executor.execute(request));
    ASSERT_EQ(runtime_->created_specs.size(), 1u);
    EXPECT_EQ(runtime_->created_specs[0].constraints.memory_mb, 256u);
    EXPECT_EQ(runtime_->created_specs[0].constraints.max_pids, 32u);
    EXPECT_FALSE(runtime_->created_specs[0].constraints.network);
}

TEST_F(ExecutorTest, OversizedCodeRejected) {
    auto c = config();
    c.execution.max_code_length = 16;
    auto& executor = make(c);

    auto result = executor.execute(code("print('this is far too long')"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::INPUT_VALIDATION);
}

// ============================================================================
// Test runs
// ============================================================================

TEST_F(ExecutorTest, FailingTestsStillProduceReport) {
    auto& executor = make();
    runtime_->script_exec(1, PYTEST_OUTPUT);

    auto result = executor.execute(tests("python3 -m pytest -q"));
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value().exit_code, 1);
    ASSERT_TRUE(result.value().test_summary.has_value());
    EXPECT_EQ(result.value().test_summary->total, 2);
    EXPECT_EQ(result.value().test_summary->failed, 1);
    EXPECT_EQ(result.value().test_summary->passed, 1);

    EXPECT_THAT(runtime_->last_exec.argv, ElementsAre("python3", "-m", "pytest", "-q"));
    EXPECT_EQ(runtime_->last_exec.timeout, milliseconds(120000));
    EXPECT_EQ(executor.get_metrics().test_executions, 1u);
}

TEST_F(ExecutorTest, TestRunnerCrashIsError) {
    auto& executor = make();
    runtime_->script_exec(2, "", "ERROR: usage: pytest [options]\n");

    auto result = executor.execute(tests("pytest --bogus"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::EXECUTION);
}

TEST_F(ExecutorTest, TestRunUsesWorkingDirAndFiles) {
    auto& executor = make();
    bool test_file_present = false;
    runtime_->on_exec([&](const std::string&, const ExecSpec& spec) -> Result<ExecOutput> {
        fs::path ws(runtime_->created_specs.back().workspace_path);
        test_file_present = fs::exists(ws / spec.working_dir / "test_a.py");
        ExecOutput out;
        out.exit_code = 0;
        out.stdout_data = "1 passed in 0.01s\n";
        return out;
    });

    auto request = tests("pytest -q");
    request.target_path = "suite";
    request.files.push_back({"suite/test_a.py", "def test_a():\n    assert True\n"});

    auto result = executor.execute(request);
    ASSERT_TRUE(result);
    EXPECT_TRUE(test_file_present);
    EXPECT_EQ(runtime_->last_exec.working_dir, "suite");
    ASSERT_TRUE(result.value().test_summary.has_value());
    EXPECT_EQ(result.value().test_summary->passed, 1);
}

// ============================================================================
// Retry
// ============================================================================

Result<ExecOutput> runtime_failure(const std::string&, const ExecSpec&) {
    SandboxDetails details;
    details.operation = "exec";
    return Error::sandbox("environment vanished", details);
}

TEST_F(ExecutorTest, ExecFailureRetriesOnFreshSandbox) {
    auto& executor = make();
    runtime_->on_exec(runtime_failure);
    runtime_->script_exec(0, "ok\n");

    auto result = executor.execute(code("print('ok')"));
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value().attempts, 2u);
    EXPECT_EQ(result.value().stdout_text, "ok\n");
    EXPECT_EQ(result.value().sandbox_id, "sbx-0002");

    executor.pool().wait_for_maintenance();
    EXPECT_EQ(executor.get_metrics().retries, 1u);
    EXPECT_EQ(executor.get_pool_stats().destroyed, 1u);
}

TEST_F(ExecutorTest, ExecFailureGivesUpAfterMaxAttempts) {
    auto& executor = make();
    for (int i = 0; i < 3; i++) {
        runtime_->on_exec(runtime_failure);
    }

    auto result = executor.execute(code("print('ok')"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::SANDBOX);
    auto* details = result.error().details_as<SandboxDetails>();
    ASSERT_NE(details, nullptr);
    EXPECT_EQ(details->attempts, 3u);
    EXPECT_EQ(runtime_->exec_calls.load(), 3);
    EXPECT_EQ(executor.get_metrics().retries, 2u);
}

TEST_F(ExecutorTest, CreationFailureSurfacesSandboxError) {
    auto c = config();
    c.pool.create_attempts = 2;
    auto& executor = make(c);
    runtime_->create_failures_left = 5;

    auto result = executor.execute(code("print(1)"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::SANDBOX);
    EXPECT_EQ(runtime_->exec_calls.load(), 0);
}

// ============================================================================
// Pool, metrics and audit surface
// ============================================================================

TEST_F(ExecutorTest, ConcurrentRequestsShareBoundedPool) {
    auto& executor = make();
    for (int i = 0; i < 24; i++) {
        runtime_->on_exec([](const std::string&, const ExecSpec&) -> Result<ExecOutput> {
            std::this_thread::sleep_for(milliseconds(5));
            ExecOutput out;
            out.exit_code = 0;
            return out;
        });
    }

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 4; i++) {
                if (executor.execute(code("print(1)"))) ok++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(ok.load(), 24);
    auto stats = executor.get_pool_stats();
    EXPECT_LE(stats.peak_in_use, 2u);
    EXPECT_LE(stats.created, 2u);
    EXPECT_EQ(stats.executions, 24u);
}

TEST_F(ExecutorTest, ResetMetricsAndClearPool) {
    auto& executor = make();
    ASSERT_TRUE(executor.execute(code("print(1)")));
    executor.pool().wait_for_maintenance();

    executor.reset_metrics();
    EXPECT_EQ(executor.get_metrics().executions, 0u);
    EXPECT_EQ(executor.get_pool_stats().executions, 0u);
    EXPECT_EQ(executor.get_pool_stats().idle_count, 1u);

    executor.clear_pool();
    executor.pool().wait_for_maintenance();
    EXPECT_EQ(executor.get_pool_stats().current_size, 0u);
    EXPECT_EQ(runtime_->live_count(), 0u);
}

TEST_F(ExecutorTest, SampleResourcesCoversLiveSandboxes) {
    auto& executor = make();
    EXPECT_TRUE(executor.sample_resources().empty());

    ASSERT_TRUE(executor.execute(code("print(1)")));
    executor.pool().wait_for_maintenance();

    ResourceUsage usage;
    usage.memory_bytes = 1024;
    usage.cpu_percent = 3.5;
    usage.pids = 2;
    runtime_->scripted_usage = usage;

    auto samples = executor.sample_resources();
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0]["sandbox_id"], "sbx-0001");
    EXPECT_EQ(samples[0]["state"], "IDLE");
    EXPECT_EQ(executor.get_metrics().last_pids, 2u);
}

TEST_F(ExecutorTest, AuditTrailRecordsExecutionsAndSandboxes) {
    auto& executor = make();
    ASSERT_TRUE(executor.execute(code("print(1)")));
    runtime_->script_exec(3);
    ASSERT_FALSE(executor.execute(code("raise SystemExit(3)")));

    auto executions = executor.audit().get_entries(AuditCategory::EXECUTION);
    ASSERT_EQ(executions.size(), 2u);
    EXPECT_TRUE(executions[0].success);
    EXPECT_FALSE(executions[1].success);
    EXPECT_EQ(executions[1].details["error_type"], "ExecutionError");

    auto sandboxes = executor.audit().get_entries(AuditCategory::SANDBOX, "sbx-0001");
    ASSERT_FALSE(sandboxes.empty());
    EXPECT_EQ(sandboxes[0].event_type, "CREATED");
}

TEST(CreateRuntimeTest, KnownAndUnknownRuntimes) {
    SandpitConfig config;
    config.runtime = "local";
    config.enable_cgroups = false;
    config.enable_namespaces = false;
    auto local = create_runtime(config);
    ASSERT_TRUE(local);
    EXPECT_EQ(local.value()->name(), "local");

    config.runtime = "firecracker";
    auto unknown = create_runtime(config);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().kind(), ErrorKind::CONFIGURATION);
    EXPECT_THAT(unknown.error().message(), HasSubstr("firecracker"));
}

TEST(ExecutionModeTest, StringRoundTrip) {
    EXPECT_EQ(execution_mode_from_string("test-run"), ExecutionMode::TEST_RUN);
    EXPECT_EQ(execution_mode_from_string("arbitrary-code"), ExecutionMode::ARBITRARY_CODE);
    EXPECT_FALSE(execution_mode_from_string("shell").has_value());
}

TEST(ExecutionResultTest, TextRendering) {
    ExecutionResult result;
    result.exit_code = 0;
    result.stdout_text = "hello";
    result.stderr_text = "warn\n";
    result.truncated = true;

    EXPECT_EQ(result.to_text(),
              "Exit code: 0\n--- STDOUT ---\nhello\n--- STDERR ---\nwarn\n[output truncated]\n");
    EXPECT_EQ(result.to_json()["stdout"], "hello");
}

// ============================================================================
// Local runtime end to end
// ============================================================================

bool have_python() {
    return std::system("python3 -c 'pass' >/dev/null 2>&1") == 0;
}

class LocalExecutorTest : public ExecutorTest {
protected:
    void SetUp() override {
        ExecutorTest::SetUp();
        if (!have_python()) {
            GTEST_SKIP() << "python3 not available";
        }
        sandpit::runtime::LocalRuntimeConfig rc;
        rc.enable_cgroups = false;
        rc.enable_namespaces = false;
        auto c = config();
        executor_ = std::make_unique<Executor>(c, std::make_shared<sandpit::runtime::LocalRuntime>(rc));
    }
};

TEST_F(LocalExecutorTest, RunsPython) {
    auto result = executor_->execute(code("print(1 + 1)"));
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value().stdout_text, "2\n");
}

TEST_F(LocalExecutorTest, WorkspaceIsCurrentDirectory) {
    auto request = code("import os\nprint(sorted(os.listdir('.')))");
    request.files.push_back({"data.txt", "x"});
    auto result = executor_->execute(request);
    ASSERT_TRUE(result) << result.error().message();
    EXPECT_EQ(result.value().stdout_text, "['data.txt', 'main.py']\n");
}

TEST_F(LocalExecutorTest, SlowCodeTimesOutAndSandboxIsDestroyed) {
    auto request = code("import time\ntime.sleep(10)");
    request.timeout = milliseconds(500);

    auto start = std::chrono::steady_clock::now();
    auto result = executor_->execute(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result);
    EXPECT_THAT(result.error().message(), HasSubstr("timed out"));
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    executor_->pool().wait_for_maintenance();
    EXPECT_EQ(executor_->get_pool_stats().destroyed, 1u);
}

}  // namespace
