#ifndef ORDER_PACING_POLICY_HPP
#define ORDER_PACING_POLICY_HPP

#include <chrono>
#include <memory>
#include <thread>

namespace ReinvestTrader {
namespace Core {

// Pause taken between two consecutive order submissions
class OrderPacingPolicy {
public:
    virtual ~OrderPacingPolicy() = default;
    virtual void wait_between_orders() = 0;
};

class FixedDelayPacing : public OrderPacingPolicy {
private:
    std::chrono::milliseconds delay;

public:
    explicit FixedDelayPacing(int delay_milliseconds) : delay(delay_milliseconds) {}

    void wait_between_orders() override {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }
};

using OrderPacingPtr = std::unique_ptr<OrderPacingPolicy>;

} // namespace Core
} // namespace ReinvestTrader

#endif // ORDER_PACING_POLICY_HPP
