#include "xferstat/server/status_registry.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace xferstat::server
{

    namespace
    {

        const std::string &player_id_of(const TransferStatus &status)
        {
            static const std::string kNoPlayer;
            return status.player() ? status.player()->id : kNoPlayer;
        }

    } // namespace

    StatusRegistry::StatusRegistry(MillisClock clock)
        : clock_(std::move(clock))
    {
    }

    std::shared_ptr<TransferStatus> StatusRegistry::create(protocol::TransferKind kind,
                                                           std::shared_ptr<const Player> player)
    {
        std::lock_guard lock(mutex_);
        std::shared_ptr<TransferStatus> status;
        if (kind == protocol::TransferKind::Stream && player)
        {
            if (auto it = inactive_streams_.find(player->id); it != inactive_streams_.end())
            {
                status = std::move(it->second);
                inactive_streams_.erase(it);
                status->set_active(true);
                // A termination requested for the previous stream does not carry over.
                (void)status->terminated();
                spdlog::debug("Reusing stream status {} for player {}", status->id(), player->id);
            }
        }
        if (!status)
        {
            status = std::make_shared<TransferStatus>(std::move(player), clock_);
            spdlog::debug("Created {} status {}", protocol::to_string(kind), status->id());
        }
        active_list(kind).push_back(status);
        return status;
    }

    void StatusRegistry::remove(protocol::TransferKind kind, const std::shared_ptr<TransferStatus> &status)
    {
        if (!status)
        {
            return;
        }
        std::lock_guard lock(mutex_);
        auto &list = active_list(kind);
        const auto it = std::find(list.begin(), list.end(), status);
        if (it == list.end())
        {
            return;
        }
        list.erase(it);
        status->set_active(false);
        if (kind == protocol::TransferKind::Stream && status->player())
        {
            inactive_streams_[status->player()->id] = status;
        }
        spdlog::debug("Removed {} status {} after {} bytes", protocol::to_string(kind), status->id(),
                      status->bytes_transferred());
    }

    std::vector<std::shared_ptr<TransferStatus>> StatusRegistry::statuses(protocol::TransferKind kind) const
    {
        std::lock_guard lock(mutex_);
        if (kind == protocol::TransferKind::Stream)
        {
            return stream_statuses_locked();
        }
        return active_list(kind);
    }

    std::vector<std::shared_ptr<TransferStatus>> StatusRegistry::statuses_for_player(
        protocol::TransferKind kind, const std::string &player_id) const
    {
        std::lock_guard lock(mutex_);
        StatusList result;
        for (const auto &status : active_list(kind))
        {
            if (player_id_of(*status) == player_id)
            {
                result.push_back(status);
            }
        }
        if (result.empty() && kind == protocol::TransferKind::Stream)
        {
            if (auto it = inactive_streams_.find(player_id); it != inactive_streams_.end())
            {
                result.push_back(it->second);
            }
        }
        return result;
    }

    std::optional<StatusEntry> StatusRegistry::find(const std::string &id) const
    {
        for (auto &entry : all())
        {
            if (entry.status->id() == id)
            {
                return entry;
            }
        }
        return std::nullopt;
    }

    bool StatusRegistry::terminate(const std::string &id)
    {
        auto entry = find(id);
        if (!entry || !entry->status->is_active())
        {
            return false;
        }
        entry->status->terminate();
        spdlog::info("Termination requested for {}", entry->status->describe());
        return true;
    }

    std::vector<StatusEntry> StatusRegistry::all() const
    {
        std::lock_guard lock(mutex_);
        std::vector<StatusEntry> result;
        for (const auto &status : stream_statuses_locked())
        {
            result.push_back({protocol::TransferKind::Stream, status});
        }
        for (const auto &status : downloads_)
        {
            result.push_back({protocol::TransferKind::Download, status});
        }
        for (const auto &status : uploads_)
        {
            result.push_back({protocol::TransferKind::Upload, status});
        }
        return result;
    }

    std::vector<StatusEntry> StatusRegistry::find_stalled(std::int64_t threshold_millis) const
    {
        auto entries = all();
        std::erase_if(entries, [threshold_millis](const StatusEntry &entry)
                      { return !entry.status->is_active() ||
                               entry.status->millis_since_last_update() <= threshold_millis; });
        return entries;
    }

    StatusRegistry::StatusList &StatusRegistry::active_list(protocol::TransferKind kind)
    {
        switch (kind)
        {
        case protocol::TransferKind::Download:
            return downloads_;
        case protocol::TransferKind::Upload:
            return uploads_;
        case protocol::TransferKind::Stream:
        default:
            return streams_;
        }
    }

    const StatusRegistry::StatusList &StatusRegistry::active_list(protocol::TransferKind kind) const
    {
        return const_cast<StatusRegistry *>(this)->active_list(kind);
    }

    StatusRegistry::StatusList StatusRegistry::stream_statuses_locked() const
    {
        StatusList result = streams_;
        std::unordered_set<std::string> active_players;
        for (const auto &status : streams_)
        {
            active_players.insert(player_id_of(*status));
        }
        for (const auto &[player_id, status] : inactive_streams_)
        {
            if (!active_players.contains(player_id))
            {
                result.push_back(status);
            }
        }
        return result;
    }

} // namespace xferstat::server
