#pragma once

#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>

namespace beamdrop::core {

// Shared worker pool that runs transfer sessions and background cleanup.
class Runtime : public std::enable_shared_from_this<Runtime> {
public:
    explicit Runtime(std::size_t workers = 4);
    ~Runtime();
    
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;
    
    static std::shared_ptr<Runtime> create(std::size_t workers = 4);
    
    template<typename F>
    auto spawn(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        auto future = packaged->get_future();
        boost::asio::post(pool_, [packaged]() { (*packaged)(); });
        return future;
    }
    
    // Fire-and-forget; exceptions are logged and dropped.
    void post(std::function<void()> task);
    
    // Waits for queued work to finish and joins the workers.
    void shutdown();
    
    std::size_t worker_count() const { return workers_; }
    bool is_stopped() const { return stopped_.load(); }

private:
    std::size_t workers_;
    boost::asio::thread_pool pool_;
    std::atomic<bool> stopped_;
};

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    
    // Throws TransferError{Cancelled} when cancelled.
    void throw_if_cancelled() const;

private:
    std::atomic<bool> cancelled_{false};
};

}
