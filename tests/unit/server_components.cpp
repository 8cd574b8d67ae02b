#include <cassert>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include "session_common.hpp"
#include "xferstat/server/media_library.hpp"
#include "xferstat/server/status_registry.hpp"
#include "xferstat/status_error.hpp"

using namespace xferstat;
using namespace xferstat::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::shared_ptr<const Player> make_player(const std::string &id)
    {
        return std::make_shared<const Player>(Player{.id = id, .name = id, .address = "10.0.0.2"});
    }

    template <typename Fn>
    bool throws_status(Fn &&fn, ErrorCode expected)
    {
        try
        {
            fn();
        }
        catch (const StatusError &ex)
        {
            return ex.code() == expected;
        }
        return false;
    }

    template <typename Fn>
    bool throws_library(Fn &&fn, ErrorCode expected)
    {
        try
        {
            fn();
        }
        catch (const LibraryError &ex)
        {
            return ex.code() == expected;
        }
        return false;
    }

    void test_stream_status_reuse()
    {
        std::int64_t now = 0;
        StatusRegistry registry([&now] { return now; });
        const auto player = make_player("kitchen");

        auto first = registry.create(protocol::TransferKind::Stream, player);
        first->add_bytes_transferred(4096);
        assert(registry.statuses(protocol::TransferKind::Stream).size() == 1);

        now = 1000;
        registry.remove(protocol::TransferKind::Stream, first);
        assert(!first->is_active());
        // The finished stream stays visible as the player's inactive status.
        const auto remaining = registry.statuses(protocol::TransferKind::Stream);
        assert(remaining.size() == 1);
        assert(remaining.front() == first);

        now = 2000;
        auto second = registry.create(protocol::TransferKind::Stream, player);
        assert(second == first);
        assert(second->is_active());
        assert(second->bytes_transferred() == 0);
        assert(registry.statuses(protocol::TransferKind::Stream).size() == 1);

        auto other = registry.create(protocol::TransferKind::Stream, make_player("bedroom"));
        assert(other != first);
        assert(registry.statuses(protocol::TransferKind::Stream).size() == 2);
        assert(registry.statuses_for_player(protocol::TransferKind::Stream, "bedroom").front() == other);
        assert(registry.statuses_for_player(protocol::TransferKind::Stream, "garage").empty());
    }

    void test_download_status_is_dropped()
    {
        StatusRegistry registry;
        const auto player = make_player("office");
        auto download = registry.create(protocol::TransferKind::Download, player);
        assert(registry.statuses(protocol::TransferKind::Download).size() == 1);
        assert(registry.statuses(protocol::TransferKind::Stream).empty());

        const auto entry = registry.find(download->id());
        assert(entry.has_value());
        assert(entry->kind == protocol::TransferKind::Download);

        registry.remove(protocol::TransferKind::Download, download);
        assert(registry.statuses(protocol::TransferKind::Download).empty());
        assert(!registry.find(download->id()).has_value());

        auto again = registry.create(protocol::TransferKind::Download, player);
        assert(again != download);
        assert(registry.all().size() == 1);
    }

    void test_terminate()
    {
        StatusRegistry registry;
        auto status = registry.create(protocol::TransferKind::Stream, make_player("attic"));
        assert(!registry.terminate("no-such-transfer"));
        assert(registry.terminate(status->id()));
        assert(status->terminated());
        assert(!status->terminated());

        registry.remove(protocol::TransferKind::Stream, status);
        assert(registry.find(status->id()).has_value());
        assert(!registry.terminate(status->id()));
        assert(!status->terminated());
    }

    void test_reused_stream_drops_pending_termination()
    {
        std::int64_t now = 0;
        StatusRegistry registry([&now] { return now; });
        const auto player = make_player("kitchen");
        auto first = registry.create(protocol::TransferKind::Stream, player);
        first->add_bytes_transferred(1024);

        // Stalled and marked, but closed before the next chunk observes the request.
        now = 120'000;
        const auto stalled = registry.find_stalled(60'000);
        assert(stalled.size() == 1);
        stalled.front().status->terminate();
        registry.remove(protocol::TransferKind::Stream, first);

        auto second = registry.create(protocol::TransferKind::Stream, player);
        assert(second == first);
        assert(!second->terminated());

        assert(registry.terminate(second->id()));
        assert(second->terminated());
    }

    void test_find_stalled()
    {
        std::int64_t now = 0;
        StatusRegistry registry([&now] { return now; });
        auto busy = registry.create(protocol::TransferKind::Stream, make_player("a"));
        auto idle = registry.create(protocol::TransferKind::Download, make_player("b"));
        busy->add_bytes_transferred(10);
        idle->add_bytes_transferred(10);

        now = 70'000;
        busy->add_bytes_transferred(10);

        const auto stalled = registry.find_stalled(60'000);
        assert(stalled.size() == 1);
        assert(stalled.front().status == idle);
        assert(registry.find_stalled(80'000).empty());

        registry.remove(protocol::TransferKind::Stream, busy);
        now = 200'000;
        assert(registry.find_stalled(60'000).size() == 1);
    }

    void test_snapshot()
    {
        std::int64_t now = 0;
        StatusRegistry registry([&now] { return now; });
        auto status = registry.create(protocol::TransferKind::Stream, make_player("den"));
        status->set_file("album/track01.flac");
        status->set_bytes_total(10'000);
        status->add_bytes_transferred(0);
        now = 5000;
        status->add_bytes_transferred(5000);

        const auto entry = registry.find(status->id());
        assert(entry.has_value());
        const auto snapshot = session_common::make_snapshot(*entry, false);
        assert(snapshot.id == status->id());
        assert(snapshot.kind == protocol::TransferKind::Stream);
        assert(snapshot.player_id == "den");
        assert(snapshot.file == "album/track01.flac");
        assert(snapshot.bytes_transferred == 5000);
        assert(snapshot.active);
        assert(snapshot.millis_since_last_update == 0);
        assert(snapshot.average_rate == 1000.0);
        assert(snapshot.recent_rate == 1000.0);
        assert(snapshot.eta_millis == std::optional<std::int64_t>(5000));
        assert(!snapshot.samples.has_value());

        registry.remove(protocol::TransferKind::Stream, status);
        const auto finished = session_common::make_snapshot(*registry.find(status->id()), true);
        assert(!finished.active);
        assert(!finished.eta_millis.has_value());
        assert(finished.samples.has_value());
        assert(finished.samples->size() == 3);
    }

    void test_read_chunk()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "xferstat_chunk_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);
        const auto path = temp_root / "track.flac";
        {
            std::ofstream file(path, std::ios::binary);
            file << "0123456789";
        }

        MediaLibrary library(temp_root);
        auto track = library.resolve("track.flac");
        assert(track.size == 10);

        const auto head = session_common::read_chunk(track, 0, 4);
        assert(head.size() == 4);
        assert(head[0] == std::byte{'0'});
        const auto tail = session_common::read_chunk(track, 8, 4);
        assert(tail.size() == 2);
        assert(tail[1] == std::byte{'9'});
        assert(session_common::read_chunk(track, 10, 4).empty());

        // Truncated after the stream was opened.
        {
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            file << "0123";
        }
        assert((throws_status([&] { (void)session_common::read_chunk(track, 6, 4); }, ErrorCode::InternalError)));

        std::filesystem::remove(path);
        assert((throws_status([&] { (void)session_common::read_chunk(track, 0, 4); }, ErrorCode::InternalError)));

        cleanup_path(temp_root);
    }

    void test_media_library_paths()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "xferstat_library_test";
        const auto outside = std::filesystem::temp_directory_path() / "xferstat_library_outside.txt";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root / "album");
        {
            std::ofstream file(temp_root / "album" / "track01.flac", std::ios::binary);
            file << "hello";
        }
        {
            std::ofstream file(outside);
            file << "secret";
        }

        MediaLibrary library(temp_root);
        const auto track = library.resolve("album/track01.flac");
        assert(track.size == 5);
        assert(track.relative == "album/track01.flac");
        assert(library.resolve("/album/./track01.flac").path == track.path);

        assert((throws_library([&] { (void)library.resolve("../xferstat_library_outside.txt"); },
                               ErrorCode::InvalidArgument)));
        assert((throws_library([&] { (void)library.resolve("album/missing.flac"); }, ErrorCode::NotFound)));
        assert((throws_library([&] { (void)library.resolve("album"); }, ErrorCode::Unsupported)));
        assert((throws_library([&] { (void)library.resolve(""); }, ErrorCode::InvalidArgument)));

        std::error_code ec;
        std::filesystem::create_symlink(outside, temp_root / "escape.txt", ec);
        if (!ec)
        {
            assert((throws_library([&] { (void)library.resolve("escape.txt"); }, ErrorCode::InvalidArgument)));
        }

        assert((throws_library([&] { MediaLibrary missing(temp_root / "nope"); }, ErrorCode::NotFound)));

        cleanup_path(temp_root);
        cleanup_path(outside);
    }

} // namespace

void run_server_component_tests()
{
    test_stream_status_reuse();
    test_download_status_is_dropped();
    test_terminate();
    test_reused_stream_drops_pending_termination();
    test_find_stalled();
    test_snapshot();
    test_read_chunk();
    test_media_library_paths();
}
