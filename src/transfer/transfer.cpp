#include "transfer/transfer.hpp"

#include <utility>

namespace gssa {

const char* ToString(TransferState state) {
    switch (state) {
        case TransferState::Pending:   return "pending";
        case TransferState::Succeeded: return "succeeded";
        case TransferState::Failed:    return "failed";
        case TransferState::Canceled:  return "canceled";
    }
    return "unknown";
}

Transfer::Transfer(std::string destination) : destination_(std::move(destination)) {}

bool Transfer::ResolveLocked(TransferState state) {
    if (state_ != TransferState::Pending) return false;
    state_ = state;
    return true;
}

bool Transfer::Succeed(std::string stored_path, std::uint64_t bytes, std::string sha256_hex) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!ResolveLocked(TransferState::Succeeded)) return false;
        stored_path_ = std::move(stored_path);
        bytes_ = bytes;
        sha256_ = std::move(sha256_hex);
    }
    cv_.notify_all();
    return true;
}

bool Transfer::Fail(std::string reason) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!ResolveLocked(TransferState::Failed)) return false;
        failure_ = std::move(reason);
    }
    cv_.notify_all();
    return true;
}

bool Transfer::Cancel() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!ResolveLocked(TransferState::Canceled)) return false;
        failure_ = "canceled";
    }
    cv_.notify_all();
    return true;
}

std::optional<std::string> Transfer::Wait() const {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return state_ != TransferState::Pending; });
    if (state_ == TransferState::Succeeded) return stored_path_;
    return std::nullopt;
}

TransferState Transfer::State() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::string Transfer::FailureReason() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failure_;
}

std::uint64_t Transfer::Bytes() const {
    std::lock_guard<std::mutex> lk(mu_);
    return bytes_;
}

std::string Transfer::Sha256() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sha256_;
}

} // namespace gssa
