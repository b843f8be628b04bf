#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace gssa {

// Headers of one part of a multipart/form-data body.
struct MultipartPart {
    std::string name;
    std::string filename;
    std::string content_type;

    bool is_file() const { return !filename.empty(); }
};

// Receives the parts of a multipart body as the scanner finds them. A failed
// Result stops the scan and is returned from Feed().
class IMultipartSink {
public:
    virtual ~IMultipartSink() = default;

    virtual Result OnPartBegin(const MultipartPart& part) = 0;
    virtual Result OnPartData(std::string_view data) = 0;
    virtual Result OnPartEnd() = 0;
};

// Boundary parameter of a "multipart/form-data; boundary=..." header value.
Result ExtractBoundary(std::string_view content_type, std::string& out_boundary);

// Incremental multipart/form-data scanner. Body bytes may be fed in chunks of
// any size; at most one delimiter length of part data (plus one header block)
// is buffered between calls.
class MultipartScanner {
public:
    static constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

    MultipartScanner(std::string_view boundary, IMultipartSink& sink);

    Result Feed(std::string_view data);

    // Fails unless the closing delimiter has been seen.
    Result Finish() const;

    bool Done() const { return state_ == State::Epilogue; }

private:
    enum class State { Preamble, Delimiter, Headers, Body, Epilogue, Failed };

    Result Step(bool& progressed);
    Result Fail(std::string msg);

    std::string delimiter_; // "--boundary"
    std::string closing_;   // "\r\n--boundary"
    IMultipartSink& sink_;
    State state_ = State::Preamble;
    std::string pending_;
};

} // namespace gssa
