#include "xferstat/sample_history.hpp"

#include <stdexcept>
#include <string>

#include "xferstat/status_error.hpp"

namespace xferstat
{

    SampleHistory::SampleHistory(std::size_t capacity)
    {
        if (capacity == 0)
        {
            throw StatusError(ErrorCode::InvalidArgument, "Sample history capacity must be positive");
        }
        slots_.resize(capacity);
    }

    void SampleHistory::add(const Sample &sample)
    {
        slots_[slot_of(count_ == slots_.size() ? 0 : count_)] = sample;
        if (count_ == slots_.size())
        {
            // The oldest slot was just overwritten, the next one is now the oldest.
            head_ = (head_ + 1) % slots_.size();
        }
        else
        {
            ++count_;
        }
    }

    void SampleHistory::clear() noexcept
    {
        head_ = 0;
        count_ = 0;
    }

    const Sample &SampleHistory::first() const
    {
        if (empty())
        {
            throw StatusError(ErrorCode::PreconditionFailed, "Sample history is empty");
        }
        return slots_[head_];
    }

    const Sample &SampleHistory::last() const
    {
        if (empty())
        {
            throw StatusError(ErrorCode::PreconditionFailed, "Sample history is empty");
        }
        return slots_[slot_of(count_ - 1)];
    }

    const Sample &SampleHistory::operator[](std::size_t index) const
    {
        return slots_[slot_of(index)];
    }

    const Sample &SampleHistory::at(std::size_t index) const
    {
        if (index >= count_)
        {
            throw std::out_of_range("Sample index " + std::to_string(index) + " out of range");
        }
        return (*this)[index];
    }

    std::vector<Sample> SampleHistory::to_vector() const
    {
        std::vector<Sample> result;
        result.reserve(count_);
        for (std::size_t i = 0; i < count_; ++i)
        {
            result.push_back((*this)[i]);
        }
        return result;
    }

    std::size_t SampleHistory::slot_of(std::size_t index) const noexcept
    {
        return (head_ + index) % slots_.size();
    }

} // namespace xferstat
