#ifndef CIRCULARQUEUE_H
#define CIRCULARQUEUE_H

#include <vector>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <atomic>
#include <chrono>
using namespace std;

// Fixed-capacity ring buffer shared between one producer side that must never
// block (try_enqueue) and a consumer that waits with a timeout.
template <typename T>
class CircularQueue
{
private:
    vector<T> buffer_;
    int head_;
    int tail_;
    int capacity_;
    atomic<int> size_;
    mutex mtx_;
    condition_variable not_empty_;
    bool shutdown_;

public:
    CircularQueue(int capacity)
        : head_(0), tail_(0), capacity_(capacity), size_(0), shutdown_(false)
    {
        if (capacity <= 0)
        {
            throw invalid_argument("CircularQueue capacity must be positive");
        }
        buffer_.resize(capacity);
    }

    ~CircularQueue()
    {
        shutdown();
    }

    bool try_enqueue(const T &item)
    {
        unique_lock<mutex> lock(mtx_);

        if (size_.load() >= capacity_ || shutdown_)
        {
            return false;
        }

        buffer_[tail_] = item;
        tail_ = (tail_ + 1) % capacity_;
        size_++;

        not_empty_.notify_one();
        return true;
    }

    bool try_dequeue(T &item)
    {
        unique_lock<mutex> lock(mtx_);

        if (size_.load() == 0)
        {
            return false;
        }

        item = buffer_[head_];
        head_ = (head_ + 1) % capacity_;
        size_--;
        return true;
    }

    // Returns false on timeout, or once shut down and drained.
    bool wait_dequeue(T &item, chrono::milliseconds timeout)
    {
        unique_lock<mutex> lock(mtx_);

        if (!not_empty_.wait_for(lock, timeout, [this]()
                                 { return size_.load() > 0 || shutdown_; }))
        {
            return false;
        }

        if (size_.load() == 0)
        {
            return false;
        }

        item = buffer_[head_];
        head_ = (head_ + 1) % capacity_;
        size_--;
        return true;
    }

    void shutdown()
    {
        lock_guard<mutex> lock(mtx_);
        shutdown_ = true;
        not_empty_.notify_all();
    }

    bool is_shutdown()
    {
        lock_guard<mutex> lock(mtx_);
        return shutdown_;
    }

    int size() const { return size_.load(); }
    int capacity() const { return capacity_; }
    bool empty() const { return size_.load() == 0; }
};

#endif
