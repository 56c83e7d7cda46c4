#include "threadPool.hpp"
#include "logger.hpp"

#include <exception>


ThreadPool::ThreadPool(size_t threadCount, std::string name) : name(std::move(name)), running(0), stop(false){
    workers.reserve(threadCount);
    for(size_t i = 0; i < threadCount; ++i){
        workers.emplace_back(&ThreadPool::workerLoop, this);
    }
}

bool ThreadPool::takeTask(std::function<void()> &task){
    std::unique_lock<std::mutex> lock(queueMutex);
    condition.wait(lock, [this]{ return stop || !tasks.empty(); });
    if(tasks.empty()){
        return false;
    }
    task = std::move(tasks.front());
    tasks.pop();
    ++running;
    return true;
}

void ThreadPool::workerLoop(){
    std::function<void()> task;
    while(takeTask(task)){
        runGuarded(task);
        task = nullptr;

        std::lock_guard<std::mutex> lock(queueMutex);
        if(--running == 0 && tasks.empty()){
            idleCondition.notify_all();
        }
    }
}


ThreadPool::~ThreadPool(){
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        stop = true;
    }
    condition.notify_all();
    for(auto &worker: workers){
       if(worker.joinable()){
           worker.join();
       }
    }
}

void ThreadPool::waitIdle(){
    std::unique_lock<std::mutex> lock(queueMutex);
    idleCondition.wait(lock, [this]{ return running == 0 && tasks.empty(); });
}

void ThreadPool::runGuarded(std::function<void()> &task){
    try {
        task();
    } catch (const std::exception &e) {
        Logger::getInstance().logError(-1, name + " task failed: " + e.what());
    } catch (...) {
        Logger::getInstance().logError(-1, name + " task failed with a non-standard exception");
    }
}
