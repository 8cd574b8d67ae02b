#include <atomic>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "xferstat/sample_history.hpp"
#include "xferstat/status_error.hpp"
#include "xferstat/throughput.hpp"
#include "xferstat/transfer_status.hpp"

using namespace xferstat;

namespace
{

    std::shared_ptr<const Player> make_player(const std::string &id)
    {
        return std::make_shared<const Player>(Player{.id = id, .name = id, .address = "127.0.0.1"});
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

    void test_history_eviction()
    {
        SampleHistory history(3);
        assert(history.empty());
        assert((throws_status([&] { (void)history.last(); }, ErrorCode::PreconditionFailed)));
        assert((throws_status([&] { (void)history.first(); }, ErrorCode::PreconditionFailed)));

        for (std::int64_t i = 1; i <= 5; ++i)
        {
            history.add(Sample{.bytes_transferred = i * 10, .timestamp = i});
        }
        assert(history.full());
        assert(history.size() == 3);
        assert(history.first().timestamp == 3);
        assert(history.last().timestamp == 5);
        assert(history[1].bytes_transferred == 40);

        bool caught = false;
        try
        {
            (void)history.at(3);
        }
        catch (const std::out_of_range &)
        {
            caught = true;
        }
        assert(caught);

        auto copy = history;
        history.add(Sample{.bytes_transferred = 60, .timestamp = 6});
        assert(copy.last().timestamp == 5);
        assert(history.last().timestamp == 6);

        history.clear();
        assert(history.empty());
        assert(history.capacity() == 3);

        assert((throws_status([] { SampleHistory none(0); }, ErrorCode::InvalidArgument)));
    }

    void test_sampling_interval()
    {
        std::int64_t now = 0;
        TransferStatus status(make_player("kitchen"), [&now] { return now; });
        assert(status.history().empty());
        assert(status.millis_since_last_update() == 0);

        status.add_bytes_transferred(100);
        now = 1000;
        status.add_bytes_transferred(100);
        now = 6000;
        status.add_bytes_transferred(100);

        const auto history = status.history();
        assert(history.size() == 2);
        assert(history[0] == (Sample{.bytes_transferred = 100, .timestamp = 0}));
        assert(history[1] == (Sample{.bytes_transferred = 300, .timestamp = 6000}));

        now = 6500;
        assert(status.millis_since_last_update() == 500);

        // Exactly one interval after the last sample.
        now = 11000;
        status.add_bytes_transferred(1);
        assert(status.history().size() == 3);
        // The earlier copy does not see the new sample.
        assert(history.size() == 2);
        assert(history.last().timestamp == 6000);
    }

    void test_history_is_bounded()
    {
        std::int64_t now = 0;
        TransferStatus status(make_player("bounded"), [&now] { return now; });
        for (std::size_t i = 0; i <= TransferStatus::kHistoryLength; ++i)
        {
            now = static_cast<std::int64_t>(i) * TransferStatus::kSampleIntervalMillis;
            status.add_bytes_transferred(1);
        }
        const auto history = status.history();
        assert(history.size() == TransferStatus::kHistoryLength);
        assert(history.first().timestamp == TransferStatus::kSampleIntervalMillis);
        assert(status.history_length_millis() == 995000);
    }

    void test_activation_cycle()
    {
        std::int64_t now = 0;
        TransferStatus status(make_player("bedroom"), [&now] { return now; });
        status.set_bytes_total(1000);
        status.add_bytes_skipped(200);
        status.add_bytes_transferred(300);
        assert(status.is_active());

        now = 1000;
        status.set_active(false);
        assert(!status.is_active());
        auto history = status.history();
        assert(history.size() == 2);
        assert(history.last() == (Sample{.bytes_transferred = 300, .timestamp = 1000}));
        assert(status.bytes_transferred() == 300);

        now = 2000;
        status.set_active(true);
        assert(status.is_active());
        assert(status.bytes_transferred() == 0);
        assert(status.bytes_skipped() == 0);
        assert(status.bytes_total() == 0);
        // Within the sampling interval of the final sample.
        assert(status.history().size() == 2);

        now = 7000;
        status.set_active(true);
        assert(status.history().size() == 3);
        assert(status.history().last().bytes_transferred == 0);
    }

    void test_terminated_is_observed_once()
    {
        TransferStatus status(make_player("garage"));
        assert(!status.terminated());
        status.terminate();
        assert(status.describe().find("terminated: true") != std::string::npos);
        assert(status.terminated());
        assert(!status.terminated());

        status.terminate();
        std::atomic<int> observed{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back([&] {
                if (status.terminated())
                {
                    ++observed;
                }
            });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        assert(observed.load() == 1);
    }

    void test_concurrent_updates()
    {
        std::atomic<std::int64_t> now{0};
        TransferStatus status(make_player("office"), [&now] { return now.fetch_add(7); });
        constexpr int kThreads = 8;
        constexpr int kUpdates = 1000;
        std::atomic<bool> writing{true};
        std::atomic<int> torn_reads{0};

        std::vector<std::thread> readers;
        for (int i = 0; i < 2; ++i)
        {
            readers.emplace_back([&] {
                while (writing.load())
                {
                    const auto history = status.history();
                    if (history.size() > TransferStatus::kHistoryLength)
                    {
                        ++torn_reads;
                    }
                    for (std::size_t j = 1; j < history.size(); ++j)
                    {
                        if (history[j].timestamp < history[j - 1].timestamp ||
                            history[j].bytes_transferred < history[j - 1].bytes_transferred)
                        {
                            ++torn_reads;
                        }
                    }
                    if (status.millis_since_last_update() < 0)
                    {
                        ++torn_reads;
                    }
                }
            });
        }

        std::vector<std::thread> writers;
        for (int i = 0; i < kThreads; ++i)
        {
            writers.emplace_back([&] {
                for (int j = 0; j < kUpdates; ++j)
                {
                    status.add_bytes_transferred(2);
                    status.add_bytes_skipped(1);
                }
            });
        }
        for (auto &thread : writers)
        {
            thread.join();
        }
        writing.store(false);
        for (auto &thread : readers)
        {
            thread.join();
        }

        assert(torn_reads.load() == 0);
        assert(status.bytes_transferred() == kThreads * kUpdates * 2);
        assert(status.bytes_skipped() == kThreads * kUpdates);
        const auto history = status.history();
        assert(!history.empty());
        assert(history.size() <= TransferStatus::kHistoryLength);
    }

    void test_rejects_negative_counts()
    {
        TransferStatus status(make_player("attic"));
        assert((throws_status([&] { status.add_bytes_transferred(-1); }, ErrorCode::InvalidArgument)));
        assert((throws_status([&] { status.set_bytes_total(-5); }, ErrorCode::InvalidArgument)));
        assert((throws_status([&] { status.add_bytes_skipped(-2); }, ErrorCode::InvalidArgument)));
        assert(status.bytes_transferred() == 0);
        assert(status.bytes_total() == 0);
    }

    void test_identity()
    {
        TransferStatus first(make_player("a"));
        TransferStatus second(nullptr);
        assert(first.id() != second.id());
        assert(first.id().size() == 36);
        assert(first.id()[14] == '4');
        assert(second.describe().find("player: none") != std::string::npos);

        first.set_file("album/track01.flac");
        assert(first.file() == std::filesystem::path("album/track01.flac"));
    }

    void test_throughput()
    {
        SampleHistory history;
        assert(!average_rate(history).has_value());
        history.add(Sample{.bytes_transferred = 0, .timestamp = 0});
        assert(!average_rate(history).has_value());
        history.add(Sample{.bytes_transferred = 5000, .timestamp = 5000});
        history.add(Sample{.bytes_transferred = 15000, .timestamp = 10000});

        assert(average_rate(history) == 1500.0);
        assert(windowed_rate(history, 5000) == 2000.0);
        assert(windowed_rate(history, 60000) == 1500.0);
        assert(!windowed_rate(history, 1000).has_value());

        // Counter reset by a reactivation.
        history.add(Sample{.bytes_transferred = 100, .timestamp = 15000});
        assert(!average_rate(history).has_value());

        assert(estimate_remaining_millis(500, 1500, 100.0) == std::optional<std::int64_t>(10000));
        assert(!estimate_remaining_millis(1500, 1500, 100.0).has_value());
        assert(!estimate_remaining_millis(0, 0, 100.0).has_value());
        assert(!estimate_remaining_millis(0, 1500, 0.0).has_value());
    }

} // namespace

void run_transfer_status_tests()
{
    test_history_eviction();
    test_sampling_interval();
    test_history_is_bounded();
    test_activation_cycle();
    test_terminated_is_observed_once();
    test_concurrent_updates();
    test_rejects_negative_counts();
    test_identity();
    test_throughput();
}
