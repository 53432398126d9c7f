#ifndef __PAGE_RANK_THREAD_GUARD_HH__
#define __PAGE_RANK_THREAD_GUARD_HH__

#include <thread>
#include <vector>

namespace page_rank {
class ThreadGuard {
public:
  // Joins every joinable thread in `threads` on destruction, including when
  // the scope is left by an exception partway through starting them.
  explicit ThreadGuard(std::vector<std::thread> &threads);
  ~ThreadGuard();

  ThreadGuard(const ThreadGuard &) = delete;
  ThreadGuard &operator=(const ThreadGuard &) = delete;

  // Join now. Safe to call more than once.
  void JoinAll();

private:
  std::vector<std::thread> &threads_;
};
} // namespace page_rank

#endif
