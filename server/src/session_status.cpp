#include "xferstat/server/session.hpp"

#include <array>
#include <vector>

#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace xferstat::server
{

    namespace
    {

        constexpr std::array<protocol::TransferKind, 3> kAllKinds{
            protocol::TransferKind::Stream,
            protocol::TransferKind::Download,
            protocol::TransferKind::Upload,
        };

        std::vector<StatusEntry> select_entries(const StatusRegistry &registry, const protocol::StatusListRequest &request)
        {
            if (!request.kind && !request.player_id)
            {
                return registry.all();
            }
            std::vector<StatusEntry> entries;
            for (const auto kind : kAllKinds)
            {
                if (request.kind && *request.kind != kind)
                {
                    continue;
                }
                const auto statuses = request.player_id ? registry.statuses_for_player(kind, *request.player_id)
                                                        : registry.statuses(kind);
                for (const auto &status : statuses)
                {
                    entries.push_back({kind, status});
                }
            }
            return entries;
        }

    } // namespace

    void Session::handle_status_list(const protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<protocol::StatusListRequest>();
            protocol::StatusListResponse response;
            for (const auto &entry : select_entries(services_.registry, request))
            {
                response.transfers.push_back(session_common::make_snapshot(entry, request.include_history));
            }
            send_response(session_common::make_ok_response(response, envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_status_get(const protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<protocol::StatusGetRequest>();
            const auto entry = services_.registry.find(request.transfer_id);
            if (!entry)
            {
                send_error(ErrorCode::NotFound, "Unknown transfer", envelope.request_id);
                return;
            }
            send_response(session_common::make_ok_response(
                session_common::make_snapshot(*entry, request.include_history), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
    }

    void Session::handle_status_terminate(const protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<protocol::TransferRequest>();
            if (!services_.registry.terminate(request.transfer_id))
            {
                send_error(ErrorCode::NotFound, "No active transfer " + request.transfer_id, envelope.request_id);
                return;
            }
            spdlog::info("{} requested termination of {}", peer_, request.transfer_id);
            send_response(session_common::make_ok_response(nlohmann::json::object(), envelope.request_id));
        }
        catch (const std::exception &ex)
        {
            send_error(ErrorCode::InvalidPayload, ex.what(), envelope.request_id);
        }
    }

} // namespace xferstat::server
