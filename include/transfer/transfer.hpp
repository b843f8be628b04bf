#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace gssa {

enum class TransferState {
    Pending,
    Succeeded,
    Failed,
    Canceled,
};

const char* ToString(TransferState state);

// One tracked upload. Resolution is first-wins: once Succeed, Fail or Cancel
// has returned true, every later attempt is a no-op returning false.
class Transfer {
public:
    explicit Transfer(std::string destination);

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    const std::string& Destination() const { return destination_; }

    bool Succeed(std::string stored_path, std::uint64_t bytes, std::string sha256_hex);
    bool Fail(std::string reason);
    bool Cancel();

    // Blocks until resolved. The stored path on success, nullopt otherwise.
    std::optional<std::string> Wait() const;

    TransferState State() const;
    std::string FailureReason() const;
    std::uint64_t Bytes() const;
    std::string Sha256() const;

private:
    bool ResolveLocked(TransferState state);

    const std::string destination_;

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    TransferState state_ = TransferState::Pending;
    std::string stored_path_;
    std::string failure_;
    std::uint64_t bytes_ = 0;
    std::string sha256_;
};

} // namespace gssa
