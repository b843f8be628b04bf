#include "http_upload.hpp"
#include "testing.hpp"
#include "workflow/retrieval_workflow.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace gssa {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// Plays the simulation server: uploads the configured payload to whatever
// target it is handed, either before returning or from a background task.
class FakeRemote final : public IRemoteActions {
  public:
    enum class Behavior { UploadNow, UploadLater, NothingToSend, Error };

    Behavior behavior = Behavior::UploadNow;
    std::string payload;
    std::map<std::string, std::string> diagnostic_files = {{"log", "solver.log"}};

    std::vector<std::string> guids;
    UploadTarget last_target;
    int last_status = 0;

    ~FakeRemote() override {
        if (later_.valid()) later_.wait();
    }

    Result RequestResults(const std::string& guid, const UploadTarget& target, bool& ok) override {
        ok = false;
        auto r = Act(guid, target);
        if (r.ok) ok = behavior != Behavior::NothingToSend;
        return r;
    }

    Result RequestDiagnostics(const std::string& guid,
                              const UploadTarget& target,
                              std::map<std::string, std::string>& files) override {
        auto r = Act(guid, target);
        if (r.ok && behavior != Behavior::NothingToSend) files = diagnostic_files;
        return r;
    }

  private:
    Result Act(const std::string& guid, const UploadTarget& target) {
        guids.push_back(guid);
        last_target = target;
        switch (behavior) {
        case Behavior::UploadNow:
            last_status = testutil::UploadFile(target.port, target.route, payload).status;
            return Result::Ok();
        case Behavior::UploadLater:
            later_ = std::async(std::launch::async, [this, target] {
                std::this_thread::sleep_for(50ms);
                last_status = testutil::UploadFile(target.port, target.route, payload).status;
            });
            return Result::Ok();
        case Behavior::NothingToSend:
            return Result::Ok();
        case Behavior::Error:
            return Result::Fail(ErrorKind::RemoteActionFailure, "simulation server unreachable");
        }
        return Result::Ok();
    }

    std::future<void> later_;
};

class RetrievalWorkflowTest : public ::testing::Test {
  protected:
    RetrievalWorkflow::Options Opts() const {
        RetrievalWorkflow::Options opt;
        opt.receiver.bind_address = "127.0.0.1";
        opt.receiver.port = 0;
        opt.receiver.drain_grace = 2s;
        opt.advertised_host = "127.0.0.1";
        opt.bundle_path = temp.Path() + "/bundle.tar";
        return opt;
    }

    static std::string TarBytes(const std::vector<testutil::TarEntry>& entries) {
        const auto tar = testutil::BuildTar(entries);
        return std::string(tar.begin(), tar.end());
    }

    testutil::TemporaryDirectory temp;
    FakeRemote remote;
};

TEST_F(RetrievalWorkflowTest, FetchResultsStoresAndExtractsBundle) {
    remote.payload = TarBytes({
        {"results/", "", AE_IFDIR},
        {"results/summary.csv", "t,value\n0,1\n", AE_IFREG},
    });

    auto opt = Opts();
    opt.destination = temp.Path() + "/results";

    std::string stored;
    auto r = RetrievalWorkflow(remote).FetchResults("sim-42", opt, stored);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(stored, fs::absolute(opt.bundle_path).string());
    EXPECT_EQ(remote.last_status, 200);
    ASSERT_EQ(remote.guids.size(), 1u);
    EXPECT_EQ(remote.guids[0], "sim-42");
    EXPECT_EQ(remote.last_target.route, "/receive");
    EXPECT_NE(remote.last_target.port, 0);
    EXPECT_EQ(remote.last_target.Url(),
              "http://127.0.0.1:" + std::to_string(remote.last_target.port) + "/receive");
    EXPECT_EQ(testutil::ReadFile(opt.destination + "/results/summary.csv"), "t,value\n0,1\n");
}

TEST_F(RetrievalWorkflowTest, FetchResultsWaitsForLateUpload) {
    remote.behavior = FakeRemote::Behavior::UploadLater;
    remote.payload = "not extracted";

    std::string stored;
    auto r = RetrievalWorkflow(remote).FetchResults("sim-43", Opts(), stored);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(testutil::ReadFile(stored), "not extracted");
}

TEST_F(RetrievalWorkflowTest, NothingToSendReturnsWithoutWaiting) {
    remote.behavior = FakeRemote::Behavior::NothingToSend;

    std::string stored;
    const auto start = std::chrono::steady_clock::now();
    auto r = RetrievalWorkflow(remote).FetchResults("unknown", Opts(), stored);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::RemoteActionFailure);
    EXPECT_TRUE(stored.empty());
    EXPECT_FALSE(fs::exists(Opts().bundle_path));
}

TEST_F(RetrievalWorkflowTest, RemoteErrorIsPropagated) {
    remote.behavior = FakeRemote::Behavior::Error;

    std::string stored;
    auto r = RetrievalWorkflow(remote).FetchDiagnostics("sim-44", Opts(), stored);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::RemoteActionFailure);
    EXPECT_EQ(r.msg, "simulation server unreachable");
}

TEST_F(RetrievalWorkflowTest, UnwritableBundlePathIsTransferFailure) {
    remote.payload = "ignored";

    auto opt = Opts();
    opt.bundle_path = temp.Path() + "/missing/bundle.tar";

    std::string stored;
    auto r = RetrievalWorkflow(remote).FetchResults("sim-45", opt, stored);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::TransferFailure);
    EXPECT_NE(r.msg.find("Failed to open output"), std::string::npos);
    EXPECT_EQ(remote.last_status, 500);
    EXPECT_TRUE(stored.empty());
}

TEST_F(RetrievalWorkflowTest, FetchDiagnosticsNormalizesBundle) {
    remote.payload = TarBytes({
        {"case-7/input.final/settings.xml", "<settings/>", AE_IFREG},
        {"case-7/input.final/mesh.dat", "mesh", AE_IFREG},
        {"case-7/output/solver.log", "converged", AE_IFREG},
    });

    auto opt = Opts();
    opt.destination = temp.Path() + "/inspect";
    opt.mode = GoosefootMode{};

    std::string stored;
    auto r = RetrievalWorkflow(remote).FetchDiagnostics("sim-46", opt, stored);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(testutil::ReadFile(opt.destination + "/input/settings.xml"), "<settings/>");
    EXPECT_EQ(testutil::ReadFile(opt.destination + "/input/mesh.dat"), "mesh");
    EXPECT_EQ(testutil::ReadFile(opt.destination + "/output/solver.log"), "converged");
    EXPECT_EQ(testutil::ReadFile(opt.destination + "/settings/settings.xml"), "<settings/>");
}

TEST_F(RetrievalWorkflowTest, NoDiagnosticFilesMeansNoWait) {
    remote.diagnostic_files.clear();

    std::string stored;
    auto r = RetrievalWorkflow(remote).FetchDiagnostics("sim-47", Opts(), stored);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::RemoteActionFailure);
}

TEST_F(RetrievalWorkflowTest, ExistingDestinationNeedsForce) {
    remote.payload = TarBytes({{"out/a.txt", "new", AE_IFREG}});

    auto opt = Opts();
    opt.destination = temp.Path() + "/results";
    fs::create_directories(opt.destination);
    testutil::WriteFile(opt.destination + "/old.txt", "old");

    std::string stored;
    auto r = RetrievalWorkflow(remote).FetchResults("sim-48", opt, stored);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::DestinationExistsError);
    EXPECT_TRUE(fs::exists(opt.destination + "/old.txt"));

    opt.force = true;
    ASSERT_TRUE(RetrievalWorkflow(remote).FetchResults("sim-48", opt, stored).ok);
    EXPECT_FALSE(fs::exists(opt.destination + "/old.txt"));
    EXPECT_EQ(testutil::ReadFile(opt.destination + "/out/a.txt"), "new");
}

TEST_F(RetrievalWorkflowTest, MissingBundlePathIsInvalidArgument) {
    auto opt = Opts();
    opt.bundle_path.clear();
    std::string stored;
    auto r = RetrievalWorkflow(remote).FetchResults("sim-49", opt, stored);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(remote.guids.empty());
}

} // namespace
} // namespace gssa
