#pragma once

#include <atomic>
#include <cstddef>

/**
 * @brief Caps the number of conversions running at once.
 *
 * tryAcquire() never blocks: callers beyond the cap are turned away so the
 * HTTP layer can answer 503 instead of queueing.
 */
class ConversionLimiter
{
public:
    /**
     * @brief Holds one in-flight slot until destroyed
     */
    class Slot
    {
    public:
        Slot() = default;
        explicit Slot(ConversionLimiter *owner) : owner_(owner) {}
        ~Slot() { reset(); }

        Slot(Slot &&other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot &operator=(Slot &&other) noexcept
        {
            if (this != &other)
            {
                reset();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }
        Slot(const Slot &) = delete;
        Slot &operator=(const Slot &) = delete;

        explicit operator bool() const { return owner_ != nullptr; }

        void reset() noexcept
        {
            if (owner_ != nullptr)
            {
                owner_->in_flight_.fetch_sub(1);
                owner_ = nullptr;
            }
        }

    private:
        ConversionLimiter *owner_ = nullptr;
    };

    explicit ConversionLimiter(size_t max_in_flight) : max_in_flight_(max_in_flight) {}

    Slot tryAcquire()
    {
        size_t current = in_flight_.load();
        while (current < max_in_flight_.load())
        {
            if (in_flight_.compare_exchange_weak(current, current + 1))
            {
                return Slot(this);
            }
        }
        return Slot();
    }

    // Lowering the cap never cancels running conversions; it only turns away new ones
    void setMaxInFlight(size_t max_in_flight) { max_in_flight_.store(max_in_flight); }

    size_t maxInFlight() const { return max_in_flight_.load(); }
    size_t inFlight() const { return in_flight_.load(); }

private:
    std::atomic<size_t> max_in_flight_;
    std::atomic<size_t> in_flight_{0};
};
