#pragma once
#include <string>
#include <utility>

namespace gssa {

enum class ErrorKind : int {
    None = 0,
    InvalidArgument,
    ConfigError,
    BindError,
    TransferFailure,
    ArchiveOpenError,
    ExtractionError,
    DestinationExistsError,
    MissingFileError,
    RemoteActionFailure,
};

const char* ToString(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m, int e = -1) {
        return {.ok = false, .kind = k, .err = e, .msg = std::move(m)};
    }
};

} // namespace gssa
