#include "transfer/multipart.hpp"

#include <algorithm>
#include <cctype>

namespace gssa {

namespace {

constexpr std::string_view kCrlf = "\r\n";

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool IEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string Unquote(std::string_view v) {
    v = Trim(v);
    if (v.size() < 2 || v.front() != '"' || v.back() != '"') return std::string(v);

    std::string out;
    out.reserve(v.size() - 2);
    for (std::size_t i = 1; i + 1 < v.size(); ++i) {
        if (v[i] == '\\' && i + 2 < v.size()) ++i;
        out.push_back(v[i]);
    }
    return out;
}

// Next ';' at or after pos that is not inside a quoted string.
std::size_t FindParamSeparator(std::string_view s, std::size_t pos) {
    bool quoted = false;
    for (; pos < s.size(); ++pos) {
        const char c = s[pos];
        if (quoted && c == '\\') {
            ++pos;
        } else if (c == '"') {
            quoted = !quoted;
        } else if (c == ';' && !quoted) {
            return pos;
        }
    }
    return std::string_view::npos;
}

// Splits `value; k1=v1; k2="v;2"` and hands each parameter to fn(key, value).
template <typename Fn>
void ForEachParam(std::string_view header_value, Fn&& fn) {
    auto semi = FindParamSeparator(header_value, 0);
    while (semi != std::string_view::npos) {
        header_value.remove_prefix(semi + 1);
        semi = FindParamSeparator(header_value, 0);
        const auto param = Trim(header_value.substr(0, semi));
        const auto eq = param.find('=');
        if (eq == std::string_view::npos) continue;
        fn(Trim(param.substr(0, eq)), Unquote(param.substr(eq + 1)));
    }
}

Result ParsePartHeaders(std::string_view headers, MultipartPart& part) {
    bool has_disposition = false;
    while (!headers.empty()) {
        const auto eol = headers.find(kCrlf);
        const auto line = headers.substr(0, eol);
        headers.remove_prefix(eol == std::string_view::npos ? headers.size() : eol + kCrlf.size());
        if (line.empty()) continue;

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return Result::Fail(ErrorKind::TransferFailure, "malformed part header: " + std::string(line));
        }
        const auto key = Trim(line.substr(0, colon));
        const auto value = Trim(line.substr(colon + 1));

        if (IEquals(key, "Content-Disposition")) {
            has_disposition = true;
            ForEachParam(value, [&](std::string_view k, std::string v) {
                if (IEquals(k, "name")) part.name = std::move(v);
                else if (IEquals(k, "filename")) part.filename = std::move(v);
            });
        } else if (IEquals(key, "Content-Type")) {
            part.content_type = std::string(value);
        }
    }
    if (!has_disposition) {
        return Result::Fail(ErrorKind::TransferFailure, "part without Content-Disposition");
    }
    return Result::Ok();
}

} // namespace

Result ExtractBoundary(std::string_view content_type, std::string& out_boundary) {
    const auto semi = content_type.find(';');
    if (!IEquals(Trim(content_type.substr(0, semi)), "multipart/form-data")) {
        return Result::Fail(ErrorKind::TransferFailure,
                            "expected multipart/form-data, got: " + std::string(content_type));
    }

    out_boundary.clear();
    ForEachParam(content_type, [&](std::string_view k, std::string v) {
        if (IEquals(k, "boundary")) out_boundary = std::move(v);
    });

    // RFC 2046: 1 to 70 characters.
    if (out_boundary.empty() || out_boundary.size() > 70) {
        return Result::Fail(ErrorKind::TransferFailure, "missing or invalid multipart boundary");
    }
    return Result::Ok();
}

MultipartScanner::MultipartScanner(std::string_view boundary, IMultipartSink& sink)
    : delimiter_("--" + std::string(boundary)),
      closing_(std::string(kCrlf) + delimiter_),
      sink_(sink) {}

Result MultipartScanner::Fail(std::string msg) {
    state_ = State::Failed;
    pending_.clear();
    return Result::Fail(ErrorKind::TransferFailure, std::move(msg));
}

Result MultipartScanner::Feed(std::string_view data) {
    if (state_ == State::Failed) {
        return Result::Fail(ErrorKind::TransferFailure, "multipart scan already failed");
    }
    if (state_ == State::Epilogue) return Result::Ok();

    pending_.append(data);
    bool progressed = true;
    while (progressed) {
        progressed = false;
        if (auto r = Step(progressed); !r.ok) {
            state_ = State::Failed;
            pending_.clear();
            return r;
        }
    }
    return Result::Ok();
}

Result MultipartScanner::Step(bool& progressed) {
    switch (state_) {
    case State::Preamble: {
        const auto pos = pending_.find(delimiter_);
        if (pos == std::string::npos) {
            const std::size_t keep = delimiter_.size() - 1;
            if (pending_.size() > keep) pending_.erase(0, pending_.size() - keep);
            return Result::Ok();
        }
        pending_.erase(0, pos + delimiter_.size());
        state_ = State::Delimiter;
        progressed = true;
        return Result::Ok();
    }

    case State::Delimiter: {
        if (pending_.size() < 2) return Result::Ok();
        if (pending_.compare(0, 2, "--") == 0) {
            pending_.clear();
            state_ = State::Epilogue;
            return Result::Ok();
        }
        // Transport padding after the delimiter is allowed before the CRLF.
        const auto eol = pending_.find_first_not_of(" \t");
        if (eol == std::string::npos || pending_.size() < eol + kCrlf.size()) {
            if (pending_.size() > kMaxHeaderBytes) return Fail("malformed multipart delimiter line");
            return Result::Ok();
        }
        if (pending_.compare(eol, kCrlf.size(), kCrlf) != 0) {
            return Fail("malformed multipart delimiter line");
        }
        pending_.erase(0, eol + kCrlf.size());
        state_ = State::Headers;
        progressed = true;
        return Result::Ok();
    }

    case State::Headers: {
        std::size_t headers_len = 0;
        std::size_t consumed = 0;
        if (pending_.compare(0, kCrlf.size(), kCrlf) == 0) {
            consumed = kCrlf.size();
        } else {
            const auto end = pending_.find("\r\n\r\n");
            if (end == std::string::npos) {
                if (pending_.size() > kMaxHeaderBytes) return Fail("part headers too large");
                return Result::Ok();
            }
            headers_len = end;
            consumed = end + 4;
        }

        MultipartPart part;
        if (auto r = ParsePartHeaders(std::string_view(pending_).substr(0, headers_len), part); !r.ok) {
            return r;
        }
        pending_.erase(0, consumed);
        state_ = State::Body;
        progressed = true;
        return sink_.OnPartBegin(part);
    }

    case State::Body: {
        const auto pos = pending_.find(closing_);
        if (pos == std::string::npos) {
            const std::size_t keep = closing_.size() - 1;
            if (pending_.size() > keep) {
                const std::size_t n = pending_.size() - keep;
                if (auto r = sink_.OnPartData(std::string_view(pending_).substr(0, n)); !r.ok) return r;
                pending_.erase(0, n);
            }
            return Result::Ok();
        }
        if (pos > 0) {
            if (auto r = sink_.OnPartData(std::string_view(pending_).substr(0, pos)); !r.ok) return r;
        }
        pending_.erase(0, pos + closing_.size());
        state_ = State::Delimiter;
        progressed = true;
        return sink_.OnPartEnd();
    }

    case State::Epilogue:
        pending_.clear();
        return Result::Ok();

    case State::Failed:
        break;
    }
    return Result::Fail(ErrorKind::TransferFailure, "multipart scan already failed");
}

Result MultipartScanner::Finish() const {
    switch (state_) {
    case State::Epilogue:
        return Result::Ok();
    case State::Preamble:
        return Result::Fail(ErrorKind::TransferFailure, "multipart boundary not found in body");
    case State::Delimiter:
    case State::Headers:
        return Result::Fail(ErrorKind::TransferFailure, "unterminated part headers");
    case State::Body:
        return Result::Fail(ErrorKind::TransferFailure, "unterminated multipart body");
    case State::Failed:
        break;
    }
    return Result::Fail(ErrorKind::TransferFailure, "multipart scan failed");
}

} // namespace gssa
