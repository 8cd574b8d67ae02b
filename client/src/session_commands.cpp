#include "xferstat/client/session.hpp"

#include <chrono>
#include <iomanip>
#include <iterator>
#include <optional>
#include <iostream>
#include <sstream>
#include <thread>

namespace xferstat::client
{

    namespace
    {

        std::string format_bytes(double bytes)
        {
            static constexpr const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
            std::size_t unit = 0;
            while (bytes >= 1024.0 && unit + 1 < std::size(kUnits))
            {
                bytes /= 1024.0;
                ++unit;
            }
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << bytes << ' ' << kUnits[unit];
            return oss.str();
        }

        std::string format_rate(const std::optional<double> &rate)
        {
            return rate ? format_bytes(*rate) + "/s" : "-";
        }

        std::string format_progress(const protocol::TransferSnapshot &snapshot)
        {
            const auto done = snapshot.bytes_transferred + snapshot.bytes_skipped;
            if (snapshot.bytes_total <= 0)
            {
                return format_bytes(static_cast<double>(done));
            }
            std::ostringstream oss;
            oss << format_bytes(static_cast<double>(done)) << " / " << format_bytes(static_cast<double>(snapshot.bytes_total))
                << " (" << std::fixed << std::setprecision(1)
                << 100.0 * static_cast<double>(done) / static_cast<double>(snapshot.bytes_total) << "%)";
            return oss.str();
        }

        void print_snapshot_line(const protocol::TransferSnapshot &snapshot)
        {
            std::cout << std::left << std::setw(38) << snapshot.id << std::setw(10) << protocol::to_string(snapshot.kind)
                      << std::setw(12) << snapshot.player_id << std::setw(9) << (snapshot.active ? "active" : "idle")
                      << std::setw(32) << format_progress(snapshot) << format_rate(snapshot.recent_rate) << "\n"
                      << "    " << snapshot.file << std::endl;
        }

        void print_samples(const protocol::TransferSnapshot &snapshot)
        {
            if (!snapshot.samples)
            {
                return;
            }
            std::cout << "  samples (" << snapshot.samples->size() << ", window "
                      << snapshot.history_length_millis / 1000 << " s):" << std::endl;
            for (const auto &sample : *snapshot.samples)
            {
                std::cout << "    " << sample.timestamp << "  " << sample.bytes_transferred << std::endl;
            }
        }

    } // namespace

    bool ClientSession::handle_status(const std::vector<std::string> &args)
    {
        protocol::StatusListRequest request;
        for (const auto &arg : args)
        {
            if (arg == "--history")
            {
                request.include_history = true;
            }
            else if (arg == "--mine")
            {
                request.player_id = config_.player_id;
            }
            else if (auto kind = protocol::transfer_kind_from_string(arg))
            {
                request.kind = kind;
            }
            else
            {
                std::cout << "Usage: STATUS [--history] [--mine] [STREAM|DOWNLOAD|UPLOAD]" << std::endl;
                return true;
            }
        }

        auto response = rpc(protocol::Command::StatusList, request);
        if (response.kind == protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        const auto list = response.payload.get<protocol::StatusListResponse>();
        if (list.transfers.empty())
        {
            std::cout << "No transfers." << std::endl;
            return true;
        }
        for (const auto &snapshot : list.transfers)
        {
            print_snapshot_line(snapshot);
            print_samples(snapshot);
        }
        return true;
    }

    bool ClientSession::handle_show(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2 || (args.size() == 2 && args[1] != "--history"))
        {
            std::cout << "Usage: SHOW <id> [--history]" << std::endl;
            return true;
        }
        protocol::StatusGetRequest request{.transfer_id = args[0], .include_history = args.size() == 2};
        auto response = rpc(protocol::Command::StatusGet, request);
        if (response.kind == protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        const auto snapshot = response.payload.get<protocol::TransferSnapshot>();
        std::cout << "id:            " << snapshot.id << "\n"
                  << "kind:          " << protocol::to_string(snapshot.kind) << "\n"
                  << "player:        " << snapshot.player_name << " (" << snapshot.player_id << ")\n"
                  << "file:          " << snapshot.file << "\n"
                  << "state:         " << (snapshot.active ? "active" : "idle") << "\n"
                  << "transferred:   " << snapshot.bytes_transferred << "\n"
                  << "skipped:       " << snapshot.bytes_skipped << "\n"
                  << "total:         " << snapshot.bytes_total << "\n"
                  << "last update:   " << snapshot.millis_since_last_update << " ms ago\n"
                  << "average rate:  " << format_rate(snapshot.average_rate) << "\n"
                  << "recent rate:   " << format_rate(snapshot.recent_rate) << "\n"
                  << "remaining:     "
                  << (snapshot.eta_millis ? std::to_string(*snapshot.eta_millis / 1000) + " s" : std::string("-"))
                  << std::endl;
        print_samples(snapshot);
        return true;
    }

    bool ClientSession::handle_terminate(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "Usage: TERMINATE <id>" << std::endl;
            return true;
        }
        auto response = rpc(protocol::Command::StatusTerminate, protocol::TransferRequest{.transfer_id = args[0]});
        if (response.kind == protocol::ResponseKind::Error)
        {
            print_error(response);
            return true;
        }
        std::cout << "OK" << std::endl;
        return true;
    }

    bool ClientSession::handle_watch(const std::vector<std::string> &args)
    {
        if (args.empty() || args.size() > 2)
        {
            std::cout << "Usage: WATCH <count> [seconds]" << std::endl;
            return true;
        }
        int count = 0;
        int seconds = 5;
        try
        {
            count = std::stoi(args[0]);
            if (args.size() == 2)
            {
                seconds = std::stoi(args[1]);
            }
        }
        catch (const std::exception &)
        {
            std::cout << "Usage: WATCH <count> [seconds]" << std::endl;
            return true;
        }
        if (count <= 0 || seconds <= 0)
        {
            std::cout << "Count and interval must be positive." << std::endl;
            return true;
        }
        for (int i = 0; i < count; ++i)
        {
            if (i > 0)
            {
                std::this_thread::sleep_for(std::chrono::seconds(seconds));
                std::cout << std::endl;
            }
            handle_status({});
        }
        return true;
    }

} // namespace xferstat::client
