#include "xferstat/client/session.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>

#include "xferstat/crypto.hpp"
#include "xferstat/encoding/base64.hpp"
#include "xferstat/throughput.hpp"
#include "xferstat/transfer_status.hpp"

namespace xferstat::client
{

    namespace
    {

        void print_progress(const TransferStatus &status)
        {
            const auto rate = windowed_rate(status.history(), 30'000);
            std::cout << "\rFetched " << status.bytes_transferred() << " / " << status.bytes_total() << " bytes";
            if (rate)
            {
                std::cout << " at " << std::fixed << std::setprecision(1) << *rate / 1024.0 << " KiB/s";
            }
            std::cout << std::flush;
        }

    } // namespace

    bool ClientSession::handle_fetch(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            std::cout << "Usage: FETCH <remote> <local>" << std::endl;
            return true;
        }
        return perform_fetch(args[0], args[1]);
    }

    bool ClientSession::perform_fetch(const std::string &remote_path, const std::filesystem::path &local_target)
    {
        if (std::filesystem::exists(local_target))
        {
            std::cout << "ERROR: file_exists" << std::endl;
            std::cout << "Local file already exists." << std::endl;
            return true;
        }

        protocol::StreamOpenRequest request{
            .path = remote_path,
            .player_id = config_.player_id,
            .player_name = config_.player_id,
            .kind = protocol::TransferKind::Download,
        };
        auto open_response = rpc(protocol::Command::StreamOpen, request);
        if (open_response.kind == protocol::ResponseKind::Error)
        {
            print_error(open_response);
            return true;
        }
        const auto descriptor = open_response.payload.get<protocol::StreamDescriptor>();
        std::cout << "Transfer " << descriptor.transfer_id << " (" << descriptor.total_size << " bytes)" << std::endl;

        auto part_path = local_target;
        part_path += ".part";
        std::ofstream part(part_path, std::ios::binary | std::ios::trunc);
        if (!part.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Failed to open " << part_path.string() << " for writing." << std::endl;
            rpc(protocol::Command::StreamClose, protocol::TransferRequest{.transfer_id = descriptor.transfer_id});
            return true;
        }

        // Local view of the same transfer, for the progress line.
        TransferStatus local(std::make_shared<const Player>(Player{.id = config_.player_id, .name = config_.player_id}));
        local.set_file(local_target);
        local.set_bytes_total(static_cast<std::int64_t>(descriptor.total_size));

        std::uint64_t offset = 0;
        bool aborted = false;
        while (offset < descriptor.total_size)
        {
            auto chunk_response = rpc(protocol::Command::StreamChunk,
                                      protocol::StreamChunkRequest{
                                          .transfer_id = descriptor.transfer_id,
                                          .offset = offset,
                                          .max_bytes = descriptor.chunk_size,
                                      });
            if (chunk_response.kind == protocol::ResponseKind::Error)
            {
                std::cout << std::endl;
                print_error(chunk_response);
                aborted = true;
                break;
            }
            const auto chunk = chunk_response.payload.get<protocol::StreamChunkResponse>();
            const auto data = encoding::decode_base64(chunk.data_base64);
            if (!data || data->size() != chunk.bytes || chunk.offset != offset || (chunk.bytes == 0 && !chunk.done))
            {
                std::cout << std::endl << "ERROR: invalid_response" << std::endl;
                aborted = true;
                break;
            }
            if (crypto::hash_bytes(*data) != chunk.chunk_hash)
            {
                std::cout << std::endl << "ERROR: hash_mismatch" << std::endl;
                aborted = true;
                break;
            }
            part.write(reinterpret_cast<const char *>(data->data()), static_cast<std::streamsize>(data->size()));
            if (!part)
            {
                std::cout << std::endl << "ERROR: file_io" << std::endl;
                aborted = true;
                break;
            }
            offset += data->size();
            local.add_bytes_transferred(static_cast<std::int64_t>(data->size()));
            print_progress(local);
            if (chunk.done)
            {
                break;
            }
        }
        local.set_active(false);
        part.close();

        if (aborted)
        {
            if (offset < descriptor.total_size)
            {
                // The server may still hold the transfer open after a client side failure.
                const auto closed = rpc(protocol::Command::StreamClose,
                                        protocol::TransferRequest{.transfer_id = descriptor.transfer_id});
                logger_.log("fetch", "aborted ", descriptor.transfer_id, " close=", protocol::to_string(closed.kind));
            }
            std::error_code ec;
            std::filesystem::remove(part_path, ec);
            return true;
        }
        std::cout << std::endl;

        if (crypto::hash_file(part_path) != descriptor.content_hash)
        {
            std::cout << "ERROR: hash_mismatch" << std::endl;
            std::cout << "Downloaded content does not match the remote file." << std::endl;
            std::error_code ec;
            std::filesystem::remove(part_path, ec);
            return true;
        }
        std::filesystem::rename(part_path, local_target);

        const auto rate = average_rate(local.history());
        std::cout << "OK " << local_target.string();
        if (rate)
        {
            std::cout << " (" << std::fixed << std::setprecision(1) << *rate / 1024.0 << " KiB/s average)";
        }
        std::cout << std::endl;
        logger_.log("fetch", remote_path, " -> ", local_target.string(), " bytes=", offset);
        return true;
    }

} // namespace xferstat::client
