#pragma once

#include "transfer/transfer.hpp"
#include "util/result.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gssa {

inline constexpr std::uint16_t kDefaultReceiverPort = 18103;

// Transient HTTP endpoint that accepts exactly one multipart file upload and
// stores it at a caller-chosen path. The listener runs on its own reactor
// thread; the caller blocks in AwaitCompletion() or resolves the wait early
// with Cancel(). Close() must come after the Transfer has been resolved.
class SingleFileReceiver {
public:
    struct Options {
        std::string bind_address = "0.0.0.0";
        std::uint16_t port = kDefaultReceiverPort; // 0 picks an ephemeral port
        std::string route = "/receive";
        std::string file_field = "file";
        std::chrono::seconds drain_grace{60};
        std::uint64_t body_limit_bytes = 2ULL * 1024 * 1024 * 1024;
        std::size_t read_chunk_bytes = 64 * 1024; // body bytes handled per reactor turn
        bool cancel_on_signals = false; // SIGINT/SIGTERM cancel the pending wait
    };

    // BindError when the address/port cannot be bound.
    static Result Start(const Options& opt, std::string destination, std::unique_ptr<SingleFileReceiver>& out);

    ~SingleFileReceiver();

    SingleFileReceiver(const SingleFileReceiver&) = delete;
    SingleFileReceiver& operator=(const SingleFileReceiver&) = delete;

    std::uint16_t Port() const { return port_; }
    const std::string& Destination() const { return transfer_.Destination(); }

    // Absolute path of the stored file, or nullopt when the transfer failed or
    // was canceled. Use Outcome() to tell those apart.
    std::optional<std::string> AwaitCompletion();

    void Cancel();

    // Stops accepting, waits up to drain_grace for open connections, then
    // forces them closed and joins the reactor. Idempotent.
    void Close();

    TransferState Outcome() const { return transfer_.State(); }
    const Transfer& GetTransfer() const { return transfer_; }

private:
    class Session;

    SingleFileReceiver(const Options& opt, std::string destination);

    Result Listen();
    void DoAccept();
    void WatchSignals();

    void SessionStarted(const std::shared_ptr<Session>& session);
    void SessionFinished();

    Options opt_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::optional<boost::asio::signal_set> signals_;
    std::thread reactor_;
    std::uint16_t port_ = 0;

    Transfer transfer_;

    // Reactor thread only.
    std::vector<std::weak_ptr<Session>> sessions_;
    bool upload_in_progress_ = false;

    std::mutex drain_mu_;
    std::condition_variable drain_cv_;
    std::size_t active_sessions_ = 0;

    std::atomic<bool> stopping_{false};
    std::mutex close_mu_;
    bool closed_ = false;
};

} // namespace gssa
