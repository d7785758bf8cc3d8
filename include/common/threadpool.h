#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * Job queues of a ThreadPool, one per worker.
 *
 * A tag is bound to a worker the first time it is pushed, so the jobs of a
 * tag are popped in push order by a single worker.
 */
template <typename Tag, typename Job, int n>
class JobQueues {
public:
    JobQueues() : m_nextWorker(0), m_closed(false) {}

    /** Bind `tag` to a worker if needed and append `job` to its queue. */
    void push(const Tag &tag, Job job) {
        unsigned int worker = workerOf(tag);
        Lane &lane = m_lanes[worker];
        {
            std::unique_lock<std::mutex> lock(lane.mutex);
            lane.jobs.push_back(std::move(job));
        }
        lane.ready.notify_one();
    }

    /**
     * Wait for a job of `worker`.
     *
     * @return false once the queues are closed and the lane is drained.
     */
    bool pop(unsigned int worker, Job &job) {
        Lane &lane = m_lanes[worker];
        std::unique_lock<std::mutex> lock(lane.mutex);
        lane.ready.wait(lock, [&]() { return !lane.jobs.empty() || m_closed; });
        if (lane.jobs.empty())
            return false;
        job = std::move(lane.jobs.front());
        lane.jobs.pop_front();
        return true;
    }

    /** Wake every worker; they exit once their lane is empty. */
    void close() {
        m_closed = true;
        for (Lane &lane : m_lanes) {
            std::unique_lock<std::mutex> lock(lane.mutex);
            lane.ready.notify_all();
        }
    }

private:
    struct Lane {
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<Job> jobs;
    };

    unsigned int workerOf(const Tag &tag) {
        std::unique_lock<std::mutex> lock(m_bindingsMutex);
        auto it = m_bindings.find(tag);
        if (it != m_bindings.end())
            return it->second;
        unsigned int worker = m_nextWorker;
        m_nextWorker = (m_nextWorker + 1) % n;
        m_bindings.emplace(tag, worker);
        return worker;
    }

    std::unordered_map<Tag, unsigned int> m_bindings;
    unsigned int m_nextWorker;
    std::mutex m_bindingsMutex;
    std::atomic_bool m_closed;
    std::array<Lane, n> m_lanes;
};


/**
 * A fixed pool of `n` workers running tagged jobs.
 *
 * Jobs sharing a tag run in scheduling order on the same worker. wait()
 * blocks until every job scheduled so far is done and leaves the pool
 * usable. join() (also run by the destructor) drains the pool and stops it.
 */
template <typename Tag, int n>
class ThreadPool {
public:
    ThreadPool(): m_pending(0) {
        for (unsigned int i = 0; i < n; ++i) {
            m_workers.emplace_back(&ThreadPool::work, this, i);
        }
    }

    ~ThreadPool() {
        join();
    }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    void schedule(Tag tag, std::function<void()> job) {
        {
            std::unique_lock<std::mutex> lock(m_pendingMutex);
            m_pending++;
        }
        m_queues.push(tag, std::move(job));
    }

    void wait() {
        std::unique_lock<std::mutex> lock(m_pendingMutex);
        m_idle.wait(lock, [this]() { return m_pending == 0; });
    }

    void join() {
        m_queues.close();
        for (std::thread &worker : m_workers) {
            if (worker.joinable())
                worker.join();
        }
    }

private:
    void work(unsigned int index) {
        std::function<void()> job;
        while (m_queues.pop(index, job)) {
            job();
            std::unique_lock<std::mutex> lock(m_pendingMutex);
            if (--m_pending == 0)
                m_idle.notify_all();
        }
    }

    JobQueues<Tag, std::function<void()>, n> m_queues;
    size_t m_pending;
    std::mutex m_pendingMutex;
    std::condition_variable m_idle;
    std::vector<std::thread> m_workers;
};
