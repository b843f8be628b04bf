#include "transfer/single_file_receiver.hpp"

#include "crypto/sha256.hpp"
#include "io/file_writer.hpp"
#include "transfer/multipart.hpp"
#include "util/logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <string_view>

namespace gssa {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace fs = std::filesystem;
using tcp = asio::ip::tcp;

namespace {

std::string_view ToStd(beast::string_view s) { return {s.data(), s.size()}; }

} // namespace

class SingleFileReceiver::Session : public std::enable_shared_from_this<Session>, private IMultipartSink {
public:
    Session(SingleFileReceiver& owner, tcp::socket socket)
        : owner_(owner), socket_(std::move(socket)), chunk_(std::max<std::size_t>(owner.opt_.read_chunk_bytes, 1)) {}

    void Start() {
        parser_.emplace();
        parser_->body_limit(owner_.opt_.body_limit_bytes);
        http::async_read_header(socket_, buffer_, *parser_,
                                beast::bind_front_handler(&Session::OnHeader, shared_from_this()));
    }

    void ForceClose() {
        if (finished_) return;
        beast::error_code ec;
        socket_.close(ec);
    }

private:
    struct Rejection {
        http::status status;
        std::string body;
    };

    std::string_view TargetPath() const {
        const std::string_view target = ToStd(parser_->get().target());
        return target.substr(0, target.find('?'));
    }

    bool ExpectsContinue() const {
        return beast::iequals(parser_->get()[http::field::expect], "100-continue");
    }

    void OnHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            RejectOversized();
            return;
        }
        if (ec) {
            if (ec != http::error::end_of_stream && ec != asio::error::operation_aborted) {
                LogWarn("Receiver read failed: %s", ec.message().c_str());
            }
            Shutdown();
            return;
        }

        const auto& req = parser_->get();
        const std::string_view method = ToStd(req.method_string());
        LogDebug("%.*s %.*s from %s", (int)method.size(), method.data(),
                 (int)req.target().size(), req.target().data(), RemoteAddress().c_str());

        if (TargetPath() != owner_.opt_.route) {
            RejectRequest(http::status::not_found, "Not Found\n");
            return;
        }
        if (req.method() != http::verb::post) {
            RejectRequest(http::status::method_not_allowed, "Method Not Allowed\n");
            return;
        }
        if (owner_.upload_in_progress_ || owner_.transfer_.State() != TransferState::Pending) {
            LogWarn("Ignoring additional upload: transfer is %s", ToString(owner_.transfer_.State()));
            RejectRequest(http::status::conflict, "Transfer already completed\n");
            return;
        }

        std::string boundary;
        if (auto r = ExtractBoundary(ToStd(req[http::field::content_type]), boundary); !r.ok) {
            StopMalformed(r.msg);
            SendRejectionOrDrain();
            return;
        }

        owner_.upload_in_progress_ = true;
        uploading_ = true;
        part_path_ = owner_.transfer_.Destination() + ".part";
        scanner_.emplace(boundary, static_cast<IMultipartSink&>(*this));

        if (ExpectsContinue() && !parser_->is_done()) {
            continue_ = http::response<http::empty_body>(http::status::continue_, req.version());
            http::async_write(socket_, continue_,
                              beast::bind_front_handler(&Session::OnContinueWritten, shared_from_this()));
            return;
        }
        ContinueOrRespond();
    }

    void OnContinueWritten(beast::error_code ec, std::size_t) {
        if (ec) {
            Interrupted(ec);
            return;
        }
        ContinueOrRespond();
    }

    // Rejected before any body byte was consumed. A client waiting for
    // 100-continue has not sent its body, anyone else gets it drained first.
    void RejectRequest(http::status status, std::string body) {
        rejection_ = Rejection{status, std::move(body)};
        SendRejectionOrDrain();
    }

    void SendRejectionOrDrain() {
        if (ExpectsContinue()) {
            Respond(rejection_->status, rejection_->body);
            return;
        }
        ContinueOrRespond();
    }

    void ContinueOrRespond() {
        if (!parser_->is_done()) {
            ReadBody();
            return;
        }
        if (rejection_) {
            Respond(rejection_->status, rejection_->body);
            return;
        }
        FinishUpload();
    }

    void ReadBody() {
        auto& body = parser_->get().body();
        body.data = chunk_.data();
        body.size = chunk_.size();
        http::async_read(socket_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::OnBody, shared_from_this()));
    }

    void OnBody(beast::error_code ec, std::size_t) {
        if (ec == http::error::need_buffer) ec = {};
        if (ec == http::error::body_limit) {
            RejectOversized();
            return;
        }
        if (ec) {
            Interrupted(ec);
            return;
        }

        const std::size_t n = chunk_.size() - parser_->get().body().size;
        if (uploading_ && owner_.stopping_.load()) {
            StopUpload("receiver closed during upload", http::status::internal_server_error,
                       "Failed to store upload\n");
        } else if (uploading_ && n > 0) {
            if (auto r = scanner_->Feed(std::string_view(chunk_.data(), n)); !r.ok) {
                if (persist_failed_) {
                    StopUpload(r.msg, http::status::internal_server_error, "Failed to store upload\n");
                } else {
                    StopMalformed(r.msg);
                }
            }
        }

        try {
            ContinueOrRespond();
        } catch (const std::exception& e) {
            StopUpload(std::string("internal error: ") + e.what(), http::status::internal_server_error,
                       "Failed to store upload\n");
            Respond(rejection_->status, rejection_->body);
        }
    }

    void RejectOversized() {
        LogWarn("Rejecting upload larger than %llu bytes", (unsigned long long)owner_.opt_.body_limit_bytes);
        if (uploading_ || IsUploadRoute()) {
            StopUpload("upload exceeds body limit", http::status::payload_too_large, "Upload too large\n");
        }
        Respond(http::status::payload_too_large, "Upload too large\n");
    }

    bool IsUploadRoute() const {
        if (!parser_ || !parser_->is_header_done()) return false;
        return parser_->get().method() == http::verb::post && TargetPath() == owner_.opt_.route &&
               !owner_.upload_in_progress_;
    }

    void Interrupted(beast::error_code ec) {
        if (ec != http::error::end_of_stream && ec != asio::error::operation_aborted) {
            LogWarn("Receiver read failed: %s", ec.message().c_str());
        }
        if (uploading_) {
            StopUpload("upload interrupted: " + ec.message(), http::status::bad_request, "");
        }
        Shutdown();
    }

    // IMultipartSink. Only the chosen file part reaches the .part file: the
    // part named file_field, or else the first part that carries a filename.
    Result OnPartBegin(const MultipartPart& part) override {
        capturing_ = false;
        const bool named = part.name == owner_.opt_.file_field;
        if (selection_ == Selection::Named) return Result::Ok();
        if (!named && (selection_ == Selection::Fallback || !part.is_file())) return Result::Ok();

        if (selection_ == Selection::Fallback) {
            LogDebug("Field '%s' replaces earlier file part", part.name.c_str());
            (void)writer_.Close();
        }
        selection_ = named ? Selection::Named : Selection::Fallback;

        if (auto r = FileWriter::Open(part_path_, writer_); !r.ok) {
            persist_failed_ = true;
            return r;
        }
        hasher_ = Sha256Hasher();
        written_ = 0;
        capturing_ = true;
        LogInfo("Receiving %s into %s", part.filename.empty() ? part.name.c_str() : part.filename.c_str(),
                owner_.transfer_.Destination().c_str());
        return Result::Ok();
    }

    Result OnPartData(std::string_view data) override {
        if (!capturing_) return Result::Ok();
        const std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(data.data()),
                                                  data.size());
        if (auto r = writer_.WriteAll(bytes); !r.ok) {
            persist_failed_ = true;
            return r;
        }
        hasher_.Update(bytes);
        written_ += bytes.size();
        return Result::Ok();
    }

    Result OnPartEnd() override {
        capturing_ = false;
        return Result::Ok();
    }

    void FinishUpload() {
        if (!uploading_) {
            Respond(http::status::internal_server_error, "Failed to store upload\n");
            return;
        }
        if (auto r = scanner_->Finish(); !r.ok) {
            StopMalformed(r.msg);
            Respond(rejection_->status, rejection_->body);
            return;
        }
        if (selection_ == Selection::None) {
            StopMalformed("no file field in upload");
            Respond(rejection_->status, rejection_->body);
            return;
        }
        if (auto r = PersistCompleted(); !r.ok) {
            StopUpload(r.msg, http::status::internal_server_error, "Failed to store upload\n");
            Respond(rejection_->status, rejection_->body);
            return;
        }
        Respond(http::status::ok, "Received\n");
    }

    Result PersistCompleted() {
        if (auto r = writer_.FsyncNow(); !r.ok) return r;
        if (auto r = writer_.Close(); !r.ok) return r;

        const std::string& destination = owner_.transfer_.Destination();
        std::error_code ec;
        fs::rename(part_path_, destination, ec);
        if (ec) {
            return Result::Fail(ErrorKind::TransferFailure, "cannot move upload into place: " + ec.message(),
                                ec.value());
        }
        part_path_.clear();

        fs::path stored = fs::absolute(destination, ec);
        if (ec) stored = destination;

        const std::string digest = hasher_.FinalHex();
        if (owner_.transfer_.Succeed(stored.string(), written_, digest)) {
            LogInfo("Stored %llu bytes at %s (sha256 %s)", (unsigned long long)written_,
                    stored.c_str(), digest.c_str());
        }
        uploading_ = false;
        owner_.upload_in_progress_ = false;
        return Result::Ok();
    }

    void StopMalformed(const std::string& reason) {
        LogError("Malformed upload: %s", reason.c_str());
        StopUpload("malformed upload: " + reason, http::status::bad_request, "Bad Request: " + reason + "\n");
    }

    // Fails the transfer and removes partial output. The rest of the body is
    // still drained before rejection_ is sent.
    void StopUpload(const std::string& reason, http::status status, std::string response) {
        (void)writer_.Close();
        if (!part_path_.empty()) {
            std::error_code ec;
            fs::remove(part_path_, ec);
            part_path_.clear();
        }
        if (owner_.transfer_.Fail(reason)) {
            LogError("Upload to %s failed: %s", owner_.transfer_.Destination().c_str(), reason.c_str());
        }
        if (uploading_) owner_.upload_in_progress_ = false;
        uploading_ = false;
        rejection_ = Rejection{status, std::move(response)};
    }

    void Respond(http::status status, std::string body) {
        const unsigned version = parser_ && parser_->is_header_done() ? parser_->get().version() : 11;
        res_ = http::response<http::string_body>(status, version);
        res_.set(http::field::server, "gssa-bundle");
        res_.set(http::field::content_type, "text/plain");
        if (status == http::status::method_not_allowed) {
            res_.set(http::field::allow, "POST");
        }
        res_.keep_alive(false);
        res_.body() = std::move(body);
        res_.prepare_payload();
        http::async_write(socket_, res_,
                          beast::bind_front_handler(&Session::OnWrite, shared_from_this()));
    }

    void OnWrite(beast::error_code ec, std::size_t) {
        if (ec && ec != asio::error::operation_aborted) {
            LogWarn("Receiver response write failed: %s", ec.message().c_str());
        }
        Shutdown();
    }

    void Shutdown() {
        if (finished_) return;
        finished_ = true;
        beast::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_send, ec);
        socket_.close(ec);
        owner_.SessionFinished();
    }

    std::string RemoteAddress() const {
        beast::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? std::string("unknown") : ep.address().to_string();
    }

    enum class Selection { None, Fallback, Named };

    SingleFileReceiver& owner_;
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::buffer_body>> parser_;
    std::vector<char> chunk_;
    http::response<http::empty_body> continue_;
    http::response<http::string_body> res_;
    std::optional<Rejection> rejection_;

    std::optional<MultipartScanner> scanner_;
    Selection selection_ = Selection::None;
    bool uploading_ = false;
    bool capturing_ = false;
    bool persist_failed_ = false;

    std::string part_path_;
    FileWriter writer_;
    Sha256Hasher hasher_;
    std::uint64_t written_ = 0;
    bool finished_ = false;
};

SingleFileReceiver::SingleFileReceiver(const Options& opt, std::string destination)
    : opt_(opt),
      work_(asio::make_work_guard(io_)),
      acceptor_(io_),
      transfer_(std::move(destination)) {}

SingleFileReceiver::~SingleFileReceiver() { Close(); }

Result SingleFileReceiver::Start(const Options& opt,
                                 std::string destination,
                                 std::unique_ptr<SingleFileReceiver>& out) {
    if (destination.empty()) {
        return Result::Fail(ErrorKind::InvalidArgument, "Receiver destination is empty");
    }
    if (opt.route.empty() || opt.route.front() != '/') {
        return Result::Fail(ErrorKind::InvalidArgument, "Receiver route must start with '/': " + opt.route);
    }

    std::unique_ptr<SingleFileReceiver> receiver(new SingleFileReceiver(opt, std::move(destination)));
    if (auto r = receiver->Listen(); !r.ok) return r;

    receiver->DoAccept();
    receiver->WatchSignals();

    SingleFileReceiver* self = receiver.get();
    receiver->reactor_ = std::thread([self] {
        while (true) {
            try {
                self->io_.run();
                break;
            } catch (const std::exception& e) {
                LogError("Receiver reactor: %s", e.what());
            }
        }
    });

    LogInfo("Waiting for upload on %s:%u%s -> %s", opt.bind_address.c_str(), (unsigned)receiver->port_,
            opt.route.c_str(), receiver->Destination().c_str());
    out = std::move(receiver);
    return Result::Ok();
}

Result SingleFileReceiver::Listen() {
    boost::system::error_code ec;
    const auto address = asio::ip::make_address(opt_.bind_address, ec);
    if (ec) {
        return Result::Fail(ErrorKind::InvalidArgument,
                            "Invalid bind address " + opt_.bind_address + ": " + ec.message(), ec.value());
    }
    const tcp::endpoint endpoint(address, opt_.port);
    const std::string where = opt_.bind_address + ":" + std::to_string(opt_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return Result::Fail(ErrorKind::BindError, "Cannot open socket for " + where + ": " + ec.message(),
                            ec.value());
    }
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        return Result::Fail(ErrorKind::BindError, "setsockopt failed for " + where + ": " + ec.message(),
                            ec.value());
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
        return Result::Fail(ErrorKind::BindError, "Cannot bind " + where + ": " + ec.message(), ec.value());
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return Result::Fail(ErrorKind::BindError, "Cannot listen on " + where + ": " + ec.message(),
                            ec.value());
    }

    port_ = acceptor_.local_endpoint(ec).port();
    if (ec) {
        return Result::Fail(ErrorKind::BindError, "Cannot query bound port: " + ec.message(), ec.value());
    }
    return Result::Ok();
}

void SingleFileReceiver::DoAccept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (ec) {
            LogWarn("Receiver accept failed: %s", ec.message().c_str());
        } else if (stopping_.load()) {
            boost::system::error_code ignored;
            socket.close(ignored);
            return;
        } else {
            auto session = std::make_shared<Session>(*this, std::move(socket));
            SessionStarted(session);
            session->Start();
        }
        if (acceptor_.is_open()) DoAccept();
    });
}

void SingleFileReceiver::WatchSignals() {
    if (!opt_.cancel_on_signals) return;
    signals_.emplace(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        LogWarn("Signal %d received, canceling transfer", signo);
        Cancel();
    });
}

void SingleFileReceiver::SessionStarted(const std::shared_ptr<Session>& session) {
    std::erase_if(sessions_, [](const std::weak_ptr<Session>& w) { return w.expired(); });
    sessions_.push_back(session);
    std::lock_guard<std::mutex> lk(drain_mu_);
    ++active_sessions_;
}

void SingleFileReceiver::SessionFinished() {
    {
        std::lock_guard<std::mutex> lk(drain_mu_);
        if (active_sessions_ > 0) --active_sessions_;
    }
    drain_cv_.notify_all();
}

std::optional<std::string> SingleFileReceiver::AwaitCompletion() {
    auto stored = transfer_.Wait();
    if (stored) {
        LogDebug("Transfer completed: %s", stored->c_str());
    } else {
        LogInfo("Transfer %s: %s", ToString(transfer_.State()), transfer_.FailureReason().c_str());
    }
    return stored;
}

void SingleFileReceiver::Cancel() {
    if (transfer_.Cancel()) {
        LogInfo("Transfer to %s canceled", transfer_.Destination().c_str());
    }
}

void SingleFileReceiver::Close() {
    std::lock_guard<std::mutex> close_lk(close_mu_);
    if (closed_) return;
    closed_ = true;

    if (!reactor_.joinable()) {
        boost::system::error_code ec;
        acceptor_.close(ec);
        transfer_.Cancel();
        return;
    }

    asio::post(io_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (signals_) signals_->cancel(ec);
    });

    {
        std::unique_lock<std::mutex> lk(drain_mu_);
        if (!drain_cv_.wait_for(lk, opt_.drain_grace, [this] { return active_sessions_ == 0; })) {
            LogWarn("Forcing %zu receiver connection(s) closed after %llds", active_sessions_,
                    (long long)opt_.drain_grace.count());
        }
    }

    stopping_.store(true);
    asio::post(io_, [this] {
        for (auto& weak : sessions_) {
            if (auto session = weak.lock()) session->ForceClose();
        }
        sessions_.clear();
    });
    work_.reset();
    reactor_.join();

    if (transfer_.Cancel()) {
        LogWarn("Receiver closed before the transfer resolved");
    }
    LogDebug("Receiver on port %u closed", (unsigned)port_);
}

} // namespace gssa
