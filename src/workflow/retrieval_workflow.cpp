#include "workflow/retrieval_workflow.hpp"

#include "bundle/bundle_normalizer.hpp"
#include "bundle/tar_stream_extractor.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <memory>

namespace gssa {

namespace fs = std::filesystem;

// Starts the receiver, runs request, then waits for the upload when request
// reports one is coming and cancels the wait otherwise. The receiver is
// always closed after the transfer has resolved.
Result RetrievalWorkflow::ReceiveAfter(const Options& opt,
                                       const std::function<Result(const UploadTarget&, bool&)>& request,
                                       std::string& stored_path) {
    if (opt.bundle_path.empty()) {
        return Result::Fail(ErrorKind::InvalidArgument, "No path given for the received bundle");
    }

    std::unique_ptr<SingleFileReceiver> receiver;
    if (auto r = SingleFileReceiver::Start(opt.receiver, opt.bundle_path, receiver); !r.ok) return r;

    UploadTarget target;
    target.host = opt.advertised_host;
    target.port = receiver->Port();
    target.route = opt.receiver.route;

    bool expect_upload = false;
    Result requested = request(target, expect_upload);
    if (!requested.ok || !expect_upload) {
        receiver->Cancel();
    }

    const auto stored = receiver->AwaitCompletion();
    const TransferState outcome = receiver->Outcome();
    const std::string reason = receiver->GetTransfer().FailureReason();
    receiver->Close();

    if (!requested.ok) return requested;
    if (!expect_upload) {
        return Result::Fail(ErrorKind::RemoteActionFailure, "Remote reported nothing to send");
    }
    if (!stored) {
        return Result::Fail(ErrorKind::TransferFailure,
                            std::string("Transfer ") + ToString(outcome) + ": " + reason);
    }

    stored_path = *stored;
    return Result::Ok();
}

Result RetrievalWorkflow::FetchResults(const std::string& guid, const Options& opt, std::string& stored_path) {
    LogInfo("Requesting results for %s", guid.c_str());

    auto request = [&](const UploadTarget& target, bool& expect_upload) {
        auto r = remote_.RequestResults(guid, target, expect_upload);
        if (r.ok && !expect_upload) {
            LogError("Simulation %s not found or has no results", guid.c_str());
        }
        return r;
    };
    if (auto r = ReceiveAfter(opt, request, stored_path); !r.ok) return r;

    if (opt.destination.empty()) return Result::Ok();

    if (auto r = PrepareDestination(opt.destination, opt.force); !r.ok) return r;
    std::error_code ec;
    fs::create_directories(opt.destination, ec);
    if (ec) {
        return Result::Fail(ErrorKind::ExtractionError,
                            "Cannot create " + opt.destination + ": " + ec.message(), ec.value());
    }

    TarStreamExtractor::Options extract_opt;
    extract_opt.verbose = opt.verbose;
    return TarStreamExtractor(extract_opt).ExtractFileToDir(stored_path, opt.destination);
}

Result RetrievalWorkflow::FetchDiagnostics(const std::string& guid,
                                           const Options& opt,
                                           std::string& stored_path) {
    LogInfo("Requesting diagnostics for %s", guid.c_str());

    auto request = [&](const UploadTarget& target, bool& expect_upload) {
        std::map<std::string, std::string> files;
        auto r = remote_.RequestDiagnostics(guid, target, files);
        if (!r.ok) return r;
        for (const auto& [label, filename] : files) {
            LogInfo("  %s: %s", label.c_str(), filename.c_str());
        }
        expect_upload = !files.empty();
        if (!expect_upload) {
            LogError("No diagnostic files produced for %s", guid.c_str());
        }
        return r;
    };
    if (auto r = ReceiveAfter(opt, request, stored_path); !r.ok) return r;

    if (opt.destination.empty()) return Result::Ok();

    BundleNormalizer::Options norm_opt;
    norm_opt.force = opt.force;
    norm_opt.verbose = opt.verbose;
    norm_opt.mode = opt.mode;
    return BundleNormalizer(norm_opt).Normalize(stored_path, opt.destination);
}

} // namespace gssa
