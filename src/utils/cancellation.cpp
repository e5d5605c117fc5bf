#include "sb/cancellation.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace sb {

namespace {
std::atomic<Cancellation*> g_active{nullptr};

void on_interrupt(int)
{
    if (Cancellation* c = g_active.load()) c->cancel();
}
} // namespace

struct InterruptGuard::Impl {
    struct sigaction previous{};
};

InterruptGuard::InterruptGuard(Cancellation& cancel)
  : impl_(new Impl)
{
    g_active.store(&cancel);
    struct sigaction sa{};
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &impl_->previous);
}

InterruptGuard::~InterruptGuard()
{
    sigaction(SIGINT, &impl_->previous, nullptr);
    g_active.store(nullptr);
    delete impl_;
}

bool wait_unless_cancelled(std::chrono::milliseconds total,
                           const Cancellation& cancel,
                           std::chrono::milliseconds tick)
{
    const auto deadline = std::chrono::steady_clock::now() + total;
    if (tick <= std::chrono::milliseconds::zero()) tick = std::chrono::milliseconds(1);
    while (!cancel.is_cancelled())
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(tick, left));
    }
    return false;
}

} // namespace sb
