#include "thread_guard.hh"

namespace page_rank {
ThreadGuard::ThreadGuard(std::vector<std::thread> &threads)
    : threads_(threads) {}

ThreadGuard::~ThreadGuard() { JoinAll(); }

void ThreadGuard::JoinAll() {
  for (auto &thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}
} // namespace page_rank
