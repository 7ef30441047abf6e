#include "fq/concurrency.hpp"

#include <stdexcept>

namespace fq {

void WaitGroup::add(int n)
{
    std::lock_guard<std::mutex> lk(mtx_);
    pending_ += n;
}

void WaitGroup::done()
{
    bool idle = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (pending_ == 0) throw std::logic_error("WaitGroup::done without matching add");
        --pending_;
        idle = pending_ == 0;
    }
    if (idle) cv_.notify_all();
}

void WaitGroup::wait()
{
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [&]{ return pending_ == 0; });
}

bool WaitGroup::wait_for(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [&]{ return pending_ == 0; });
}

int WaitGroup::pending() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_;
}

} // namespace fq
