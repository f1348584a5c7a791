#include "daemon/core/process_lease.h"
#include "gtest/gtest.h"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

// Scripted process table for lease recovery tests.
class FakeProcessOps : public daemon_core::ProcessOps {
   public:
    pid_t selfPid = 1000;
    std::map<pid_t, std::vector<std::string>> processes;  // live pid -> argv
    std::vector<std::pair<pid_t, int>> sent;
    bool ignoreSigterm = false;
    bool ignoreSigkill = false;
    int signalError = 0;

    pid_t self() const override {
        return selfPid;
    }
    bool exists(pid_t pid) const override {
        return processes.count(pid) > 0;
    }
    std::optional<std::vector<std::string>> arguments(pid_t pid) const override {
        auto it = processes.find(pid);
        if (it == processes.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    }
    int signal(pid_t pid, int sig) override {
        sent.emplace_back(pid, sig);
        if (signalError != 0) {
            return signalError;
        }
        if (!exists(pid)) {
            return ESRCH;
        }
        if ((sig == SIGTERM && !ignoreSigterm) || (sig == SIGKILL && !ignoreSigkill)) {
            processes.erase(pid);
        }
        return 0;
    }
    void sleepFor(std::chrono::milliseconds) override {}
};

}  // namespace

class ProcessLeaseTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    FakeProcessOps ops;
    daemon_core::LeaseOptions options;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "process_lease";
        if (info) {
            name = std::string(info->test_suite_name()) + "_" + std::string(info->name());
        }
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("voxd_test_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);

        options.path = (tempDir / "voxd.pid").string();
        options.replaceRunning = true;
        options.grace = std::chrono::milliseconds(200);
        options.executableName = "voxd";
        options.identityMarkers = {"voxd"};
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeLease(const std::string& content) {
        std::ofstream file(options.path);
        file << content;
    }
};

TEST_F(ProcessLeaseTest, NoLeaseFileWritesOwnPid) {
    daemon_core::LeaseOutcome outcome;
    auto lease = daemon_core::ProcessLease::acquire(options, ops, &outcome);

    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::NoLease);
    EXPECT_EQ(daemon_core::ProcessLease::readPid(options.path), 1000);
    EXPECT_TRUE(ops.sent.empty());
}

TEST_F(ProcessLeaseTest, ReleaseRemovesOwnLease) {
    auto lease = daemon_core::ProcessLease::acquire(options, ops);
    ASSERT_TRUE(lease.has_value());
    EXPECT_TRUE(fs::exists(options.path));

    lease.reset();
    EXPECT_FALSE(fs::exists(options.path));
}

TEST_F(ProcessLeaseTest, ReleaseKeepsLeaseTakenOverByNewerInstance) {
    auto lease = daemon_core::ProcessLease::acquire(options, ops);
    ASSERT_TRUE(lease.has_value());

    writeLease("2222\n");
    lease.reset();
    EXPECT_TRUE(fs::exists(options.path));
    EXPECT_EQ(daemon_core::ProcessLease::readPid(options.path), 2222);
}

TEST_F(ProcessLeaseTest, DeadPidIsStaleAndReplaced) {
    writeLease("4242\n");

    daemon_core::LeaseOutcome outcome;
    auto lease = daemon_core::ProcessLease::acquire(options, ops, &outcome);

    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::StaleRemoved);
    EXPECT_EQ(daemon_core::ProcessLease::readPid(options.path), 1000);
    EXPECT_TRUE(ops.sent.empty());
}

TEST_F(ProcessLeaseTest, GarbageContentIsStale) {
    writeLease("not-a-pid");

    auto outcome = daemon_core::ProcessLease::recover(options, ops);
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::StaleRemoved);
    EXPECT_FALSE(fs::exists(options.path));
}

TEST_F(ProcessLeaseTest, RecoverDeletesLeaseOfMissingProcess) {
    writeLease("99999");

    EXPECT_EQ(daemon_core::ProcessLease::recover(options, ops),
              daemon_core::LeaseOutcome::StaleRemoved);
    EXPECT_FALSE(fs::exists(options.path));
    EXPECT_TRUE(ops.sent.empty());
}

TEST_F(ProcessLeaseTest, RecoverKeepsLeaseNamingOwnPid) {
    writeLease("1000");

    EXPECT_EQ(daemon_core::ProcessLease::recover(options, ops),
              daemon_core::LeaseOutcome::OwnPid);
    ASSERT_TRUE(fs::exists(options.path));
    std::ifstream in(options.path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "1000");
    EXPECT_TRUE(ops.sent.empty());
}

TEST_F(ProcessLeaseTest, OwnPidIsLeftUntouched) {
    writeLease("1000\n");

    daemon_core::LeaseOutcome outcome;
    auto lease = daemon_core::ProcessLease::acquire(options, ops, &outcome);

    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::OwnPid);
    EXPECT_TRUE(ops.sent.empty());
}

TEST_F(ProcessLeaseTest, LiveUnrelatedProcessIsNeverSignalled) {
    ops.processes[4242] = {"/usr/bin/firefox", "--new-window"};
    writeLease("4242\n");

    daemon_core::LeaseOutcome outcome;
    auto lease = daemon_core::ProcessLease::acquire(options, ops, &outcome);

    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::UnidentifiedRemoved);
    EXPECT_TRUE(ops.sent.empty());
    EXPECT_EQ(ops.processes.count(4242), 1u);
    EXPECT_EQ(daemon_core::ProcessLease::readPid(options.path), 1000);
}

TEST_F(ProcessLeaseTest, ReaderMentioningDaemonIsNeverSignalled) {
    ops.processes[4242] = {"watch", "-n", "0.2", "cat", "/tmp/voxd.state"};
    writeLease("4242\n");

    auto outcome = daemon_core::ProcessLease::recover(options, ops);
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::UnidentifiedRemoved);
    EXPECT_TRUE(ops.sent.empty());
    EXPECT_EQ(ops.processes.count(4242), 1u);
}

TEST_F(ProcessLeaseTest, ArgumentNamedLikeDaemonIsNotIdentity) {
    ops.processes[4242] = {"/usr/bin/less", "voxd"};
    writeLease("4242\n");

    auto outcome = daemon_core::ProcessLease::recover(options, ops);
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::UnidentifiedRemoved);
    EXPECT_TRUE(ops.sent.empty());
}

TEST_F(ProcessLeaseTest, EveryMarkerMustBePresent) {
    options.identityMarkers = {"voxd", "--config"};
    ops.processes[4242] = {"/usr/local/bin/voxd"};
    writeLease("4242\n");

    auto outcome = daemon_core::ProcessLease::recover(options, ops);
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::UnidentifiedRemoved);
    EXPECT_TRUE(ops.sent.empty());

    ops.processes[4242] = {"/usr/local/bin/voxd", "--config", "/etc/voxd.json"};
    writeLease("4242\n");
    outcome = daemon_core::ProcessLease::recover(options, ops);
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::PreviousTerminated);
}

TEST_F(ProcessLeaseTest, ExecutableNameDefaultsToOwnProgram) {
    options.executableName.clear();
    ops.processes[1000] = {"/opt/dictation/bin/voxd", "--config", "/etc/voxd.json"};
    ops.processes[4242] = {"voxd"};
    writeLease("4242\n");

    auto outcome = daemon_core::ProcessLease::recover(options, ops);
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::PreviousTerminated);
}

TEST_F(ProcessLeaseTest, UnreadableCommandLineIsUnidentified) {
    ops.processes[4242] = {};
    writeLease("4242\n");

    auto outcome = daemon_core::ProcessLease::recover(options, ops);
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::UnidentifiedRemoved);
    EXPECT_TRUE(ops.sent.empty());
}

TEST_F(ProcessLeaseTest, ConfirmedInstanceIsTerminated) {
    ops.processes[4242] = {"/usr/local/bin/voxd", "--config", "/etc/voxd.json"};
    writeLease("4242\n");

    daemon_core::LeaseOutcome outcome;
    auto lease = daemon_core::ProcessLease::acquire(options, ops, &outcome);

    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::PreviousTerminated);
    ASSERT_EQ(ops.sent.size(), 1u);
    EXPECT_EQ(ops.sent[0].first, 4242);
    EXPECT_EQ(ops.sent[0].second, SIGTERM);
    EXPECT_EQ(daemon_core::ProcessLease::readPid(options.path), 1000);
}

TEST_F(ProcessLeaseTest, StubbornInstanceGetsSigkill) {
    ops.processes[4242] = {"voxd"};
    ops.ignoreSigterm = true;
    writeLease("4242\n");

    auto outcome = daemon_core::ProcessLease::recover(options, ops);

    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::PreviousTerminated);
    ASSERT_EQ(ops.sent.size(), 2u);
    EXPECT_EQ(ops.sent[0].second, SIGTERM);
    EXPECT_EQ(ops.sent[1].second, SIGKILL);
}

TEST_F(ProcessLeaseTest, SurvivingSigkillIsConflict) {
    ops.processes[4242] = {"voxd"};
    ops.ignoreSigterm = true;
    ops.ignoreSigkill = true;
    writeLease("4242\n");

    daemon_core::LeaseOutcome outcome;
    auto lease = daemon_core::ProcessLease::acquire(options, ops, &outcome);

    EXPECT_FALSE(lease.has_value());
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::Conflict);
    EXPECT_EQ(daemon_core::ProcessLease::readPid(options.path), 4242);
}

TEST_F(ProcessLeaseTest, ReplaceDisabledIsConflict) {
    options.replaceRunning = false;
    ops.processes[4242] = {"voxd"};
    writeLease("4242\n");

    daemon_core::LeaseOutcome outcome;
    auto lease = daemon_core::ProcessLease::acquire(options, ops, &outcome);

    EXPECT_FALSE(lease.has_value());
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::Conflict);
    EXPECT_TRUE(ops.sent.empty());
    EXPECT_EQ(daemon_core::ProcessLease::readPid(options.path), 4242);
}

TEST_F(ProcessLeaseTest, PermissionDeniedSignalIsConflict) {
    ops.processes[4242] = {"voxd"};
    ops.signalError = EPERM;
    writeLease("4242\n");

    auto outcome = daemon_core::ProcessLease::recover(options, ops);
    EXPECT_EQ(outcome, daemon_core::LeaseOutcome::Conflict);
}

TEST_F(ProcessLeaseTest, MoveTransfersOwnership) {
    auto lease = daemon_core::ProcessLease::acquire(options, ops);
    ASSERT_TRUE(lease.has_value());

    daemon_core::ProcessLease moved(std::move(*lease));
    lease.reset();
    EXPECT_TRUE(fs::exists(options.path));
    EXPECT_EQ(moved.pid(), 1000);
}

TEST(ProcessLeaseNames, OutcomeToString) {
    EXPECT_STREQ(daemon_core::leaseOutcomeToString(daemon_core::LeaseOutcome::NoLease),
                 "no_lease");
    EXPECT_STREQ(daemon_core::leaseOutcomeToString(daemon_core::LeaseOutcome::Conflict),
                 "conflict");
}

TEST(SystemProcessOpsTest, SeesOwnProcess) {
    daemon_core::SystemProcessOps ops;
    EXPECT_EQ(ops.self(), getpid());
    EXPECT_TRUE(ops.exists(getpid()));
    EXPECT_FALSE(ops.exists(0));
    auto argv = ops.arguments(getpid());
    ASSERT_TRUE(argv.has_value());
    ASSERT_FALSE(argv->empty());
    EXPECT_FALSE(argv->front().empty());
}
