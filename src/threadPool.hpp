#ifndef THREADPOOL_HPP
#define THREADPOOL_HPP

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <string>


class ThreadPool{
    public:
        ThreadPool(size_t threadCount, std::string name);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        // false once the pool is stopping; the task is dropped
        template<class F>
        bool enqueue(F&& task){
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                if(stop){
                    return false;
                }
                tasks.emplace(std::forward<F>(task));
            }
            condition.notify_one();
            return true;
        }

        // Blocks until the queue is empty and no task is running
        void waitIdle();

    private:
        std::string name;
        std::vector<std::thread> workers;
        std::queue<std::function<void()>> tasks;

        std::mutex queueMutex;
        std::condition_variable condition;
        std::condition_variable idleCondition;
        size_t running;
        bool stop;

        // false once the pool stops and the queue has drained
        bool takeTask(std::function<void()> &task);
        void workerLoop();

        // Top-level handler: a failing task is logged, the worker lives on
        void runGuarded(std::function<void()> &task);
};



#endif // THREADPOOL_HPP
