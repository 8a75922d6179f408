#include <hdrguard/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace hdrguard {

ThreadPool::ThreadPool(unsigned n){
  if (n==0) n = std::max(1u, std::thread::hardware_concurrency());
  for (unsigned i=0;i<n;i++){
    workers.emplace_back([this]{
      for(;;){
        std::function<void()> job;
        { std::unique_lock<std::mutex> lk(m);
          cv.wait(lk,[&]{ return stop || !q.empty(); });
          if (stop && q.empty()) return;
          job = std::move(q.front()); q.pop();
        }
        try {
          job();
        } catch (const std::exception& e) {
          spdlog::error("thread pool job failed: {}", e.what());
        }
      }
    });
  }
}

ThreadPool::~ThreadPool(){
  { std::lock_guard<std::mutex> lk(m); stop=true; }
  cv.notify_all();
  for(auto& t:workers) t.join();
}

void ThreadPool::submit(std::function<void()> fn){
  { std::lock_guard<std::mutex> lk(m); q.emplace(std::move(fn)); }
  cv.notify_one();
}

} // namespace hdrguard
