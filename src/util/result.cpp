#include "util/result.hpp"

namespace gssa {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                   return "ok";
        case ErrorKind::InvalidArgument:        return "invalid argument";
        case ErrorKind::ConfigError:            return "config error";
        case ErrorKind::BindError:              return "bind error";
        case ErrorKind::TransferFailure:        return "transfer failure";
        case ErrorKind::ArchiveOpenError:       return "archive open error";
        case ErrorKind::ExtractionError:        return "extraction error";
        case ErrorKind::DestinationExistsError: return "destination exists";
        case ErrorKind::MissingFileError:       return "missing file";
        case ErrorKind::RemoteActionFailure:    return "remote action failure";
    }
    return "unknown";
}

} // namespace gssa
