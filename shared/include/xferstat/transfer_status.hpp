/**
 * xferstat - Progress of a single transfer (stream, download or upload).
 *
 * Byte counters are lock-free atomics that the transfer pipeline updates on
 * every chunk. Each update of the transferred counter may record a sample into
 * a bounded history, at most one per sampling interval, which readers use to
 * derive throughput. All members are safe to call from any thread.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "xferstat/clock.hpp"
#include "xferstat/player.hpp"
#include "xferstat/sample_history.hpp"

namespace xferstat
{

    class TransferStatus
    {
    public:
        static constexpr std::size_t kHistoryLength = SampleHistory::kDefaultCapacity;
        static constexpr std::int64_t kSampleIntervalMillis = 5000;

        explicit TransferStatus(std::shared_ptr<const Player> player, MillisClock clock = system_millis);

        TransferStatus(const TransferStatus &) = delete;
        TransferStatus &operator=(const TransferStatus &) = delete;

        const std::string &id() const noexcept { return id_; }
        const std::shared_ptr<const Player> &player() const noexcept { return player_; }

        std::int64_t bytes_transferred() const noexcept;
        void add_bytes_transferred(std::int64_t count);
        // Absolute store, for resumed or corrected transfers.
        void set_bytes_transferred(std::int64_t value);

        // Bytes not sent, e.g. when a download resumes at an offset.
        std::int64_t bytes_skipped() const noexcept;
        void add_bytes_skipped(std::int64_t count);
        void set_bytes_skipped(std::int64_t value);

        // 0 when unknown.
        std::int64_t bytes_total() const noexcept;
        void set_bytes_total(std::int64_t value);

        std::filesystem::path file() const;
        void set_file(std::filesystem::path file);

        // Independent copy of the sample history.
        SampleHistory history() const;

        // Time span covered by a full history at the sampling interval.
        std::int64_t history_length_millis() const noexcept;

        // 0 when nothing has been sampled yet.
        std::int64_t millis_since_last_update() const;

        // Requests cooperative cancellation; the pipeline polls terminated().
        void terminate() noexcept;

        // Returns the termination request and clears it. A request is observed once.
        bool terminated() noexcept;

        // Whether the connection of the transfer is still established.
        bool is_active() const noexcept;

        // Reactivation resets all counters, deactivation records a final sample.
        void set_active(bool active);

        std::string describe() const;

    private:
        void create_sample(bool force);
        void create_sample_locked(bool force);

        const std::string id_;
        const std::shared_ptr<const Player> player_;
        const MillisClock clock_;

        std::atomic<std::int64_t> bytes_transferred_{0};
        std::atomic<std::int64_t> bytes_skipped_{0};
        std::atomic<std::int64_t> bytes_total_{0};
        std::atomic<bool> terminated_{false};
        std::atomic<bool> active_{true};

        mutable std::mutex history_mutex_;
        SampleHistory history_{kHistoryLength};

        mutable std::mutex file_mutex_;
        std::filesystem::path file_;
    };

} // namespace xferstat
