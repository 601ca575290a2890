/**
 * @file request_dispatcher.hpp
 * @brief Runs requests one after another on a dedicated worker thread.
 *
 * Every request is posted to a Boost.Asio io_context driven by a single worker thread and
 * its result is delivered through a std::future. Since there is only one worker, requests
 * never overlap, which keeps a non thread-safe client handle confined to one thread.
 */
#ifndef REQUEST_DISPATCHER_HPP
#define REQUEST_DISPATCHER_HPP

#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

class request_dispatcher {
private:
    boost::asio::io_context io_context_; /**< the io context managing the worker thread. */
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_; /**< the work guard for the io_context_. */
    std::thread worker_thread_; /**< the worker thread executing the requests. */
    std::atomic<bool> running_; /**< flag to indicate whether requests are accepted. */
    std::mutex state_mutex_; /**< guards accepting a request against stopping the dispatcher. */
    std::mutex join_mutex_; /**< serializes joining the worker thread. */
public:
    /**
     * @brief Constructs the dispatcher and starts its worker thread.
     * 
     */
    request_dispatcher();

    /**
     * @brief Stops the dispatcher, see stop().
     * 
     */
    ~request_dispatcher();

    request_dispatcher(const request_dispatcher&) = delete;
    request_dispatcher& operator= (const request_dispatcher&) = delete;

    /**
     * @brief Posts a request to the worker thread.
     * 
     * @tparam Result the result type of the request.
     * @param _request the request.
     * @return std::future<Result> the future receiving the result or the exception thrown by the request.
     * If the dispatcher is stopped the future holds a std::runtime_error.
     */
    template<typename Result>
    std::future<Result>
    dispatch(std::function<Result()> _request) {
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(_request));
        std::future<Result> result = task->get_future();
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_.load()) {
            std::promise<Result> rejected;
            rejected.set_exception(std::make_exception_ptr(std::runtime_error("request dispatcher is stopped")));
            return rejected.get_future();
        }
        // Posted while the work guard is held, so the worker runs it before run() returns
        boost::asio::post(io_context_, [task]() {
            (*task)();
        });
        return result;
    }

    /**
     * @brief Returns whether the calling thread is the worker thread.
     */
    bool
    is_worker_thread() const;

    /**
     * @brief Completes the pending requests, then joins the worker thread. Futures of requests
     * dispatched afterwards hold an error. Safe to call from several threads at once.
     * 
     */
    void
    stop();
};

#endif // REQUEST_DISPATCHER_HPP
