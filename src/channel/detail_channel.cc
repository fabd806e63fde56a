#include "detail_channel.hh"
#include "core/logging.hh"
#include <thread>

namespace coanneal {

std::optional<std::string> DetailResult::value(const std::string& writer,
                                               const std::string& key) const {
    auto w = details.find(writer);
    if (w == details.end()) {
        return std::nullopt;
    }
    auto k = w->second.find(key);
    if (k == w->second.end()) {
        return std::nullopt;
    }
    return k->second;
}

DetailChannel::DetailChannel(LedgerClient& client)
    : client_(client) {}

Status DetailChannel::validate(const std::string& key, const std::string& value) {
    if (!is_valid_detail_key(key)) {
        return Status::INVALID_ARGUMENT;
    }
    auto length = utf8_length(value);
    if (!length) {
        return Status::INVALID_ARGUMENT;
    }
    if (*length > MAX_DETAIL_VALUE_SIZE) {
        return Status::VALUE_TOO_LARGE;
    }
    return Status::OK;
}

SubmitResult DetailChannel::publish(const Identity& self, const std::string& key,
                                    const std::string& value) {
    return write(self, self.account_id(), key, value);
}

SubmitResult DetailChannel::publish_to(const Identity& self, const AccountId& target,
                                       const std::string& key, const std::string& value) {
    return write(self, target.to_string(), key, value);
}

SubmitResult DetailChannel::write(const Identity& self, const std::string& owner,
                                  const std::string& key, const std::string& value) {
    if (auto check = validate(key, value); check != Status::OK) {
        log::detail.warn() << "Refusing detail '" << key << "' for " << owner << ": "
                           << status_string(check);
        return SubmitResult{check, check == Status::VALUE_TOO_LARGE
                                       ? "value exceeds " + std::to_string(MAX_DETAIL_VALUE_SIZE) + " characters"
                                       : "invalid detail key or value encoding",
                            {}};
    }

    auto result = client_.submit({SetAccountDetail{owner, key, value}}, self);
    if (result.ok()) {
        COANNEAL_LOG_DEBUG(log::detail) << self.account_id() << " wrote '" << key
                                        << "' into " << owner;
    } else {
        log::detail.warn() << self.account_id() << " failed to write '" << key << "' into "
                           << owner << ": " << status_string(result.status) << " "
                           << result.reason;
    }
    return result;
}

DetailResult DetailChannel::read(const Identity& self,
                                 const std::optional<std::string>& key,
                                 const std::optional<std::string>& writer) {
    return read_from(self, self.account(), key, writer);
}

DetailResult DetailChannel::read_from(const Identity& self, const AccountId& owner,
                                      const std::optional<std::string>& key,
                                      const std::optional<std::string>& writer) {
    auto response = client_.query(
        GetAccountDetail{owner.to_string(), writer, key}, self);

    DetailResult result;
    if (response.status == Status::NOT_FOUND) {
        // Account or details not visible yet
        return result;
    }
    result.status = response.status;
    result.reason = std::move(response.reason);
    result.details = std::move(response.details);
    return result;
}

PollResult DetailChannel::poll(const Identity& self, const AccountId& writer,
                               const std::string& key, const AcceptPredicate& accept,
                               PollOptions options, const StopPredicate& should_stop) {
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    const auto writer_id = writer.to_string();
    PollResult result;

    while (true) {
        ++result.attempts;
        auto read_result = read(self, key, writer_id);
        if (!read_result.ok()) {
            log::detail.warn() << "Polling '" << key << "' from " << writer_id << " failed: "
                               << status_string(read_result.status) << " "
                               << read_result.reason;
            result.status = read_result.status;
            result.reason = std::move(read_result.reason);
            return result;
        }

        if (auto value = read_result.value(writer_id, key); value && (!accept || accept(*value))) {
            result.value = std::move(*value);
            return result;
        }

        if (should_stop && should_stop()) {
            result.status = Status::CANCELLED;
            result.reason = "polling cancelled";
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            COANNEAL_LOG_DEBUG(log::detail) << "Timed out waiting for '" << key << "' from "
                                            << writer_id << " after " << result.attempts
                                            << " reads";
            result.status = Status::TIMEOUT;
            result.reason = "no acceptable value for '" + key + "' from " + writer_id;
            return result;
        }
        std::this_thread::sleep_for(options.interval);
    }
}

}  // namespace coanneal
