#include "tadpole/thread.hpp"
#include "tadpole/misc.hpp"
#include <algorithm>

namespace Tadpole {

void WorkStealingQueue::push(Task task) {
    std::lock_guard lock(mutex);
    queue.push_back(std::move(task));
}

bool WorkStealingQueue::take(Task& task, bool oldest) {
    std::lock_guard lock(mutex);
    if (queue.empty())
        return false;

    if (oldest) {
        task = std::move(queue.front());
        queue.pop_front();
    } else {
        task = std::move(queue.back());
        queue.pop_back();
    }
    return true;
}

ThreadPool::ThreadPool(size_t numThreads) : stop(false), queuedTasks(0) {
    start(numThreads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::start(size_t numThreads) {
    numThreads = std::max<size_t>(numThreads, 1);
    stop = false;
    queuedTasks = 0;

    queues.clear();
    for (size_t i = 0; i < numThreads; ++i)
        queues.push_back(std::make_unique<WorkStealingQueue>());

    for (size_t i = 0; i < numThreads; ++i) {
        threads.emplace_back([this, i]() {
            worker_loop(i);
        });
    }
    Log::debug("Thread pool started with ", numThreads, " workers");
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(sleepMutex);
        stop = true;
    }
    sleepCondition.notify_all();

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    threads.clear();
}

void ThreadPool::resize(size_t numThreads) {
    std::lock_guard batch(batchMutex);
    shutdown();
    start(numThreads);
}

bool ThreadPool::take_task(size_t threadId, Task& task) {
    // Own queue first
    if (queues[threadId]->pop(task))
        return true;

    // Then steal from the other workers
    for (size_t i = 1; i < queues.size(); ++i) {
        if (queues[(threadId + i) % queues.size()]->steal(task))
            return true;
    }
    return false;
}

void ThreadPool::worker_loop(size_t threadId) {
    while (true) {
        {
            std::unique_lock lock(sleepMutex);
            sleepCondition.wait(lock, [this] { return stop || queuedTasks > 0; });
            if (stop)
                return;
            --queuedTasks;
        }

        // A task is reserved for this worker, it sits in one of the queues
        Task task;
        while (!take_task(threadId, task))
            std::this_thread::yield();

        task();
    }
}

void ThreadPool::run_batch(std::vector<Task> tasks) {
    if (tasks.empty())
        return;

    std::lock_guard batch(batchMutex);

    std::mutex doneMutex;
    std::condition_variable doneCondition;
    size_t remaining = tasks.size();
    std::exception_ptr firstError;

    for (size_t i = 0; i < tasks.size(); ++i) {
        Task wrapped = [&, task = std::move(tasks[i])]() {
            std::exception_ptr error;
            try {
                task();
            } catch (...) {
                error = std::current_exception();
            }

            std::lock_guard lock(doneMutex);
            if (error && !firstError)
                firstError = error;
            if (--remaining == 0)
                doneCondition.notify_one();
        };
        queues[i % queues.size()]->push(std::move(wrapped));
    }

    {
        std::lock_guard lock(sleepMutex);
        queuedTasks += tasks.size();
    }
    sleepCondition.notify_all();

    std::unique_lock lock(doneMutex);
    doneCondition.wait(lock, [&] { return remaining == 0; });

    if (firstError)
        std::rethrow_exception(firstError);
}

}
