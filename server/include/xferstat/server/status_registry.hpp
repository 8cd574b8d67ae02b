#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "xferstat/clock.hpp"
#include "xferstat/player.hpp"
#include "xferstat/protocol.hpp"
#include "xferstat/transfer_status.hpp"

namespace xferstat::server
{

    struct StatusEntry
    {
        protocol::TransferKind kind{};
        std::shared_ptr<TransferStatus> status;
    };

    // Statuses of the transfers in progress, per kind. A removed stream status
    // stays available as its player's inactive status until the player starts
    // a new stream, which reuses it.
    class StatusRegistry
    {
    public:
        explicit StatusRegistry(MillisClock clock = system_millis);

        std::shared_ptr<TransferStatus> create(protocol::TransferKind kind, std::shared_ptr<const Player> player);

        void remove(protocol::TransferKind kind, const std::shared_ptr<TransferStatus> &status);

        std::vector<std::shared_ptr<TransferStatus>> statuses(protocol::TransferKind kind) const;

        std::vector<std::shared_ptr<TransferStatus>> statuses_for_player(protocol::TransferKind kind,
                                                                         const std::string &player_id) const;

        std::optional<StatusEntry> find(const std::string &id) const;

        // False when the id is unknown or the transfer is no longer active.
        bool terminate(const std::string &id);

        std::vector<StatusEntry> all() const;

        // Active transfers without a sample for longer than threshold_millis.
        std::vector<StatusEntry> find_stalled(std::int64_t threshold_millis) const;

    private:
        using StatusList = std::vector<std::shared_ptr<TransferStatus>>;

        StatusList &active_list(protocol::TransferKind kind);
        const StatusList &active_list(protocol::TransferKind kind) const;
        StatusList stream_statuses_locked() const;

        MillisClock clock_;
        mutable std::mutex mutex_;
        StatusList streams_;
        StatusList downloads_;
        StatusList uploads_;
        // Keyed by player id.
        std::unordered_map<std::string, std::shared_ptr<TransferStatus>> inactive_streams_;
    };

} // namespace xferstat::server
