#include "xferstat/transfer_status.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include "xferstat/status_error.hpp"

namespace xferstat
{

    namespace
    {

        // Random (version 4) UUID, e.g. 1b4e28ba-2fa1-41d2-883f-0016d3cca427.
        std::string generate_status_id()
        {
            static std::mutex mutex;
            static std::mt19937_64 rng{std::random_device{}()};

            std::uint64_t high = 0;
            std::uint64_t low = 0;
            {
                std::lock_guard lock(mutex);
                high = rng();
                low = rng();
            }
            high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
            low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

            std::ostringstream oss;
            oss << std::hex << std::setfill('0')
                << std::setw(8) << (high >> 32) << '-'
                << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
                << std::setw(4) << (high & 0xFFFF) << '-'
                << std::setw(4) << (low >> 48) << '-'
                << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
            return oss.str();
        }

        void require_non_negative(std::int64_t value, const char *what)
        {
            if (value < 0)
            {
                throw StatusError(ErrorCode::InvalidArgument,
                                  std::string(what) + " must not be negative: " + std::to_string(value));
            }
        }

    } // namespace

    TransferStatus::TransferStatus(std::shared_ptr<const Player> player, MillisClock clock)
        : id_(generate_status_id()),
          player_(std::move(player)),
          clock_(clock ? std::move(clock) : MillisClock{system_millis})
    {
    }

    std::int64_t TransferStatus::bytes_transferred() const noexcept
    {
        return bytes_transferred_.load();
    }

    void TransferStatus::add_bytes_transferred(std::int64_t count)
    {
        require_non_negative(count, "Transferred byte count");
        bytes_transferred_.fetch_add(count);
        create_sample(false);
    }

    void TransferStatus::set_bytes_transferred(std::int64_t value)
    {
        require_non_negative(value, "Transferred byte count");
        bytes_transferred_.store(value);
        create_sample(false);
    }

    std::int64_t TransferStatus::bytes_skipped() const noexcept
    {
        return bytes_skipped_.load();
    }

    void TransferStatus::add_bytes_skipped(std::int64_t count)
    {
        require_non_negative(count, "Skipped byte count");
        bytes_skipped_.fetch_add(count);
    }

    void TransferStatus::set_bytes_skipped(std::int64_t value)
    {
        require_non_negative(value, "Skipped byte count");
        bytes_skipped_.store(value);
    }

    std::int64_t TransferStatus::bytes_total() const noexcept
    {
        return bytes_total_.load();
    }

    void TransferStatus::set_bytes_total(std::int64_t value)
    {
        require_non_negative(value, "Total byte count");
        bytes_total_.store(value);
    }

    std::filesystem::path TransferStatus::file() const
    {
        std::lock_guard lock(file_mutex_);
        return file_;
    }

    void TransferStatus::set_file(std::filesystem::path file)
    {
        std::lock_guard lock(file_mutex_);
        file_ = std::move(file);
    }

    SampleHistory TransferStatus::history() const
    {
        std::lock_guard lock(history_mutex_);
        return history_;
    }

    std::int64_t TransferStatus::history_length_millis() const noexcept
    {
        return kSampleIntervalMillis * static_cast<std::int64_t>(kHistoryLength - 1);
    }

    std::int64_t TransferStatus::millis_since_last_update() const
    {
        std::lock_guard lock(history_mutex_);
        if (history_.empty())
        {
            return 0;
        }
        return clock_() - history_.last().timestamp;
    }

    void TransferStatus::terminate() noexcept
    {
        terminated_.store(true);
    }

    bool TransferStatus::terminated() noexcept
    {
        return terminated_.exchange(false);
    }

    bool TransferStatus::is_active() const noexcept
    {
        return active_.load();
    }

    void TransferStatus::set_active(bool active)
    {
        std::lock_guard lock(history_mutex_);
        active_.store(active);
        if (active)
        {
            bytes_skipped_.store(0);
            bytes_total_.store(0);
            bytes_transferred_.store(0);
            create_sample_locked(false);
        }
        else
        {
            create_sample_locked(true);
        }
    }

    std::string TransferStatus::describe() const
    {
        const auto player_id = player_ ? player_->id : std::string("none");
        return "TransferStatus-" + id_ + " [player: " + player_id + ", file: " + file().string() +
               ", terminated: " + (terminated_.load() ? "true" : "false") +
               ", active: " + (active_.load() ? "true" : "false") + "]";
    }

    void TransferStatus::create_sample(bool force)
    {
        std::lock_guard lock(history_mutex_);
        create_sample_locked(force);
    }

    void TransferStatus::create_sample_locked(bool force)
    {
        const auto now = clock_();
        if (history_.empty() || force || now - history_.last().timestamp >= kSampleIntervalMillis)
        {
            history_.add(Sample{.bytes_transferred = bytes_transferred_.load(), .timestamp = now});
        }
    }

} // namespace xferstat
