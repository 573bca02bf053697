#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace Tadpole {

using Task = std::function<void()>;

// Tasks queued for one worker. The owner runs them in submission order,
// thieves take from the other end.
class WorkStealingQueue {
private:
    std::deque<Task> queue;
    std::mutex mutex;

    bool take(Task& task, bool oldest);

public:
    void push(Task task);
    bool pop(Task& task) { return take(task, true); }
    bool steal(Task& task) { return take(task, false); }
};

// Fixed set of workers, each with its own queue; idle workers steal from
// the back of the other queues. run_batch() is the only way to submit work
// and returns once every task of the batch has finished.
class ThreadPool {
private:
    std::vector<std::thread> threads;
    std::vector<std::unique_ptr<WorkStealingQueue>> queues;
    std::atomic<bool> stop;

    std::mutex sleepMutex;
    std::condition_variable sleepCondition;
    size_t queuedTasks;

    std::mutex batchMutex;

    void start(size_t numThreads);
    void shutdown();
    void worker_loop(size_t threadId);
    bool take_task(size_t threadId, Task& task);

public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Only while no batch is running
    void resize(size_t numThreads);
    size_t size() const { return threads.size(); }

    // Rethrows the first exception a task threw
    void run_batch(std::vector<Task> tasks);
};

}
