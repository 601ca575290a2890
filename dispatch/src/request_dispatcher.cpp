#include "../include/request_dispatcher.hpp"

request_dispatcher::request_dispatcher() : work_guard_(boost::asio::make_work_guard(io_context_)), running_(true) {
    worker_thread_ = std::thread([this]() {
        io_context_.run();
    });
}

request_dispatcher::~request_dispatcher() {
    stop();
}

bool
request_dispatcher::is_worker_thread() const {
    return std::this_thread::get_id() == worker_thread_.get_id();
}

void
request_dispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_.store(false);
        // Without the guard run() returns once the queued requests are done
        work_guard_.reset();
    }
    if (is_worker_thread())
        return;
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_thread_.joinable())
        worker_thread_.join();
}
