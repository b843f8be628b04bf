#pragma once

#include "bundle/inspection_mode.hpp"
#include "transfer/single_file_receiver.hpp"
#include "util/result.hpp"
#include "workflow/remote_actions.hpp"

#include <functional>
#include <optional>
#include <string>

namespace gssa {

class RetrievalWorkflow {
public:
    struct Options {
        SingleFileReceiver::Options receiver;
        // Host name the remote should upload to.
        std::string advertised_host = "localhost";

        // Where the received bundle is stored.
        std::string bundle_path;

        // Results: plain extraction target. Diagnostics: normalized inspection
        // tree. Empty skips the local step.
        std::string destination;
        bool force = false;
        bool verbose = false;
        std::optional<InspectionMode> mode;
    };

    explicit RetrievalWorkflow(IRemoteActions& remote) : remote_(remote) {}

    // stored_path is set to the received bundle on success.
    Result FetchResults(const std::string& guid, const Options& opt, std::string& stored_path);
    Result FetchDiagnostics(const std::string& guid, const Options& opt, std::string& stored_path);

private:
    Result ReceiveAfter(const Options& opt,
                        const std::function<Result(const UploadTarget&, bool&)>& request,
                        std::string& stored_path);

    IRemoteActions& remote_;
};

} // namespace gssa
