#include "beamdrop/core/runtime.hpp"
#include "beamdrop/core/error.hpp"
#include "beamdrop/core/logger.hpp"

namespace beamdrop::core {

Runtime::Runtime(std::size_t workers)
    : workers_(workers == 0 ? 1 : workers)
    , pool_(workers_)
    , stopped_(false) {
    LOG_DEBUG("Runtime started with {} workers", workers_);
}

Runtime::~Runtime() {
    shutdown();
}

std::shared_ptr<Runtime> Runtime::create(std::size_t workers) {
    return std::make_shared<Runtime>(workers);
}

void Runtime::post(std::function<void()> task) {
    boost::asio::post(pool_, [task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Background task failed: {}", e.what());
        }
    });
}

void Runtime::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    pool_.join();
    LOG_DEBUG("Runtime stopped");
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw TransferError(ErrorCode::Cancelled, "operation cancelled");
    }
}

}
