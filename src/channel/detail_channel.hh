#pragma once

#include "ledger/client.hh"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace coanneal {

// ============================================================================
// Detail Channel Types
// ============================================================================

struct PollOptions {
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds interval{10};
};

struct DetailResult {
    Status status = Status::OK;
    std::string reason;
    DetailMap details;    // writer -> key -> value

    [[nodiscard]] bool ok() const { return status == Status::OK; }

    // Value written by `writer` under `key`, if any
    [[nodiscard]] std::optional<std::string> value(const std::string& writer,
                                                   const std::string& key) const;
};

struct PollResult {
    Status status = Status::OK;
    std::string reason;
    std::string value;
    std::uint32_t attempts = 0;

    [[nodiscard]] bool ok() const { return status == Status::OK; }
};

using AcceptPredicate = std::function<bool(const std::string& value)>;
using StopPredicate = std::function<bool()>;

// ============================================================================
// Detail Channel - permissioned key/value exchange over account details
// ============================================================================
//
// Every write is a SetAccountDetail created and signed by `self`. Writes into
// another party's account need a live can_set_my_account_detail grant from
// that party. Reads always see committed state only.

class DetailChannel {
public:
    explicit DetailChannel(LedgerClient& client);

    SubmitResult publish(const Identity& self, const std::string& key, const std::string& value);

    SubmitResult publish_to(const Identity& self, const AccountId& target,
                            const std::string& key, const std::string& value);

    // Details on self's own account. Nothing written yet is an empty map.
    [[nodiscard]] DetailResult read(const Identity& self,
                                    const std::optional<std::string>& key = std::nullopt,
                                    const std::optional<std::string>& writer = std::nullopt);

    [[nodiscard]] DetailResult read_from(const Identity& self, const AccountId& owner,
                                         const std::optional<std::string>& key = std::nullopt,
                                         const std::optional<std::string>& writer = std::nullopt);

    // Re-read self's account until `writer` has a value under `key` that
    // `accept` takes. Ends with TIMEOUT, CANCELLED (should_stop returned true)
    // or the first non-recoverable read error.
    [[nodiscard]] PollResult poll(const Identity& self, const AccountId& writer,
                                  const std::string& key, const AcceptPredicate& accept,
                                  PollOptions options = {},
                                  const StopPredicate& should_stop = {});

    // Fail-fast checks applied before anything reaches the ledger
    [[nodiscard]] static Status validate(const std::string& key, const std::string& value);

private:
    LedgerClient& client_;

    SubmitResult write(const Identity& self, const std::string& owner,
                       const std::string& key, const std::string& value);
};

}  // namespace coanneal
