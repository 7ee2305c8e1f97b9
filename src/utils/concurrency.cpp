#include "lp/concurrency.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lp {

struct ThreadPool::Impl {
    explicit Impl(int n)
        : stop(false), active(0)
    {
        if (n <= 0) n = 1;
        workers.reserve(n);
        for (int i = 0; i < n; ++i)
        {
            workers.emplace_back([this]{ this->worker_loop(); });
        }
    }

    ~Impl()
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            stop = true;
        }
        cv_task.notify_all();
        for (auto& th : workers) if (th.joinable()) th.join();
    }

    bool submit(std::function<void()> task)
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (stop) return false;
            q.push(std::move(task));
        }
        cv_task.notify_one();
        return true;
    }

    void wait_idle()
    {
        std::unique_lock<std::mutex> lk(mtx);
        cv_idle.wait(lk, [&]{ return q.empty() && active == 0; });
    }

    std::exception_ptr first_exception() const
    {
        std::lock_guard<std::mutex> lk(mtx);
        return first_ex;
    }

private:
    void set_first_exception(std::exception_ptr ep)
    {
        if (!ep) return;
        std::lock_guard<std::mutex> lk(mtx);
        if (!first_ex) first_ex = std::move(ep);
    }

    void worker_loop()
    {
        for(;;)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(mtx);
                cv_task.wait(lk, [&]{ return stop || !q.empty(); });
                if (stop && q.empty()) return;
                task = std::move(q.front());
                q.pop();
                ++active;
            }
            try {
                task();
            } catch (...) {
                // kept for the owner, see first_exception()
                set_first_exception(std::current_exception());
            }
            {
                std::lock_guard<std::mutex> lk(mtx);
                --active;
                if (q.empty() && active == 0) cv_idle.notify_all();
            }
        }
    }

    mutable std::mutex mtx;
    std::condition_variable cv_task;
    std::condition_variable cv_idle;
    std::queue<std::function<void()>> q;
    std::vector<std::thread> workers;
    bool stop;
    size_t active;
    std::exception_ptr first_ex;
};

ThreadPool::ThreadPool(int threads)
  : impl_(new Impl(threads))
{}

ThreadPool::~ThreadPool()
{
    delete impl_;
}

bool ThreadPool::submit(std::function<void()> task)
{
    return impl_->submit(std::move(task));
}

void ThreadPool::wait_idle()
{
    impl_->wait_idle();
}

std::exception_ptr ThreadPool::first_exception() const
{
    return impl_->first_exception();
}

} // namespace lp
