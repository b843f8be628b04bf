#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace gssa {

// Where a remote service should deliver the bundle it produces.
struct UploadTarget {
    std::string host;
    std::uint16_t port = 0;
    std::string route;

    std::string Url() const { return "http://" + host + ":" + std::to_string(port) + route; }
};

// Remote side of a retrieval. Implementations ask the simulation server to
// stream a bundle to target; they may return before the upload happens.
class IRemoteActions {
public:
    virtual ~IRemoteActions() = default;

    // ok=false when the remote has nothing to send (e.g. unknown simulation).
    virtual Result RequestResults(const std::string& guid, const UploadTarget& target, bool& ok) = 0;

    // label -> filename for every diagnostic file the remote will bundle;
    // empty when it produced none and no upload will follow.
    virtual Result RequestDiagnostics(const std::string& guid,
                                      const UploadTarget& target,
                                      std::map<std::string, std::string>& files) = 0;
};

} // namespace gssa
