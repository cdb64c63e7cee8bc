/**
 * @file WorkerGroup.hpp
 * @brief Owned set of worker threads, joined on destruction
 */

#ifndef TREEMERGE_WORKERGROUP_HPP
#define TREEMERGE_WORKERGROUP_HPP

#include <cstddef>
#include <functional>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace treemerge {

class WorkerGroup {
public:
    using Spawner = std::function<std::thread(std::function<void()>)>;

    WorkerGroup() : WorkerGroup(Spawner()) {}

    /// @p spawn replaces std::thread construction; empty means std::thread
    explicit WorkerGroup(Spawner spawn)
        : spawn_(spawn ? std::move(spawn) : default_spawner())
    {}

    ~WorkerGroup() { join(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    /**
     * @brief Start up to @p count threads running @p body
     *
     * If thread creation fails part-way the threads already running are
     * kept and the shortfall is visible in the return value.
     *
     * @return Number of threads started by this call
     * @throws std::system_error if no thread could be started
     */
    std::size_t start(std::size_t count, const std::function<void()>& body) {
        threads_.reserve(threads_.size() + count);
        std::size_t started = 0;
        for (; started < count; ++started) {
            try {
                threads_.push_back(spawn_(body));
            } catch (const std::system_error&) {
                if (started == 0) throw;
                break;
            }
        }
        return started;
    }

    void join() {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
    }

    std::size_t size() const noexcept { return threads_.size(); }

private:
    static Spawner default_spawner() {
        return [](std::function<void()> body) { return std::thread(std::move(body)); };
    }

    Spawner spawn_;
    std::vector<std::thread> threads_;
};

} // namespace treemerge

#endif // TREEMERGE_WORKERGROUP_HPP
