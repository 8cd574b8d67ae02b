/**
 * xferstat - Bounded history of byte-count samples.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace xferstat
{

    // Cumulative bytes transferred at a point in time (milliseconds since epoch).
    struct Sample
    {
        std::int64_t bytes_transferred{};
        std::int64_t timestamp{};

        bool operator==(const Sample &) const = default;
    };

    // Fixed-capacity circular buffer of samples, oldest first. Adding to a full
    // history overwrites the oldest sample.
    class SampleHistory
    {
    public:
        static constexpr std::size_t kDefaultCapacity = 200;

        explicit SampleHistory(std::size_t capacity = kDefaultCapacity);

        void add(const Sample &sample);

        void clear() noexcept;

        bool empty() const noexcept { return count_ == 0; }
        std::size_t size() const noexcept { return count_; }
        std::size_t capacity() const noexcept { return slots_.size(); }
        bool full() const noexcept { return count_ == slots_.size(); }

        // Throw StatusError(PreconditionFailed) on an empty history.
        const Sample &first() const;
        const Sample &last() const;

        // Index 0 is the oldest sample.
        const Sample &operator[](std::size_t index) const;
        const Sample &at(std::size_t index) const;

        std::vector<Sample> to_vector() const;

    private:
        std::size_t slot_of(std::size_t index) const noexcept;

        std::vector<Sample> slots_;
        std::size_t head_{0};
        std::size_t count_{0};
    };

} // namespace xferstat
