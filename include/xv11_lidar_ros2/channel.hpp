#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

// Unbounded multi-producer / single-consumer queue. Dropping every Sender
// disconnects the Receiver and dropping the Receiver makes send() fail.
namespace xv11
{

    enum class RecvStatus
    {
        Ok,
        Empty,
        Disconnected,
    };

    namespace detail
    {
        template <typename T>
        struct ChannelState
        {
            std::mutex m;
            std::condition_variable cv;
            std::deque<T> q;
            size_t senders{1};
            bool receiver_alive{true};
        };
    }

    template <typename T>
    class Sender
    {
    public:
        explicit Sender(std::shared_ptr<detail::ChannelState<T>> s) : s_(std::move(s)) {}

        Sender(const Sender &o) : s_(o.s_)
        {
            if (s_)
            {
                std::lock_guard<std::mutex> lk(s_->m);
                ++s_->senders;
            }
        }

        Sender(Sender &&o) noexcept : s_(std::move(o.s_)) {}

        Sender &operator=(Sender o) noexcept
        {
            std::swap(s_, o.s_);
            return *this;
        }

        ~Sender() { release(); }

        // False when the receiver is gone; the value is dropped.
        bool send(T v)
        {
            if (!s_)
                return false;
            {
                std::lock_guard<std::mutex> lk(s_->m);
                if (!s_->receiver_alive)
                    return false;
                s_->q.push_back(std::move(v));
            }
            s_->cv.notify_one();
            return true;
        }

    private:
        void release()
        {
            if (!s_)
                return;
            {
                std::lock_guard<std::mutex> lk(s_->m);
                --s_->senders;
            }
            s_->cv.notify_all();
            s_.reset();
        }

        std::shared_ptr<detail::ChannelState<T>> s_;
    };

    template <typename T>
    class Receiver
    {
    public:
        explicit Receiver(std::shared_ptr<detail::ChannelState<T>> s) : s_(std::move(s)) {}

        Receiver(const Receiver &) = delete;
        Receiver &operator=(const Receiver &) = delete;

        Receiver(Receiver &&o) noexcept : s_(std::move(o.s_)) {}

        Receiver &operator=(Receiver &&o) noexcept
        {
            if (this != &o)
            {
                release();
                s_ = std::move(o.s_);
            }
            return *this;
        }

        ~Receiver() { release(); }

        // Queued values are still delivered after the last sender is gone.
        RecvStatus try_recv(T &out)
        {
            if (!s_)
                return RecvStatus::Disconnected;
            std::lock_guard<std::mutex> lk(s_->m);
            return pop_locked(out);
        }

        // Blocks until a value arrives or every sender is gone.
        bool recv(T &out)
        {
            if (!s_)
                return false;
            std::unique_lock<std::mutex> lk(s_->m);
            s_->cv.wait(lk, [this]
                        { return !s_->q.empty() || s_->senders == 0; });
            return pop_locked(out) == RecvStatus::Ok;
        }

        template <typename Rep, typename Period>
        RecvStatus recv_for(T &out, std::chrono::duration<Rep, Period> timeout)
        {
            if (!s_)
                return RecvStatus::Disconnected;
            std::unique_lock<std::mutex> lk(s_->m);
            s_->cv.wait_for(lk, timeout, [this]
                            { return !s_->q.empty() || s_->senders == 0; });
            return pop_locked(out);
        }

    private:
        RecvStatus pop_locked(T &out)
        {
            if (!s_->q.empty())
            {
                out = std::move(s_->q.front());
                s_->q.pop_front();
                return RecvStatus::Ok;
            }
            return s_->senders == 0 ? RecvStatus::Disconnected : RecvStatus::Empty;
        }

        void release()
        {
            if (!s_)
                return;
            {
                std::lock_guard<std::mutex> lk(s_->m);
                s_->receiver_alive = false;
                s_->q.clear();
            }
            s_.reset();
        }

        std::shared_ptr<detail::ChannelState<T>> s_;
    };

    template <typename T>
    std::pair<Sender<T>, Receiver<T>> make_channel()
    {
        auto s = std::make_shared<detail::ChannelState<T>>();
        return {Sender<T>(s), Receiver<T>(s)};
    }

} // namespace xv11
