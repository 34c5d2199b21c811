#pragma once
/**
 * @file store_service.hpp
 * @brief Standalone message store served over a ZMQ ROUTER socket.
 *
 * StoreService owns a KeySpace and answers requests from ZmqMessageStore clients. Frames:
 *
 *   request:  [identity, 'C', "<OP>_REQ", json]
 *   reply:    [identity, 'C', "<OP>_ACK" | "ERROR", json]
 *
 * Every body carries the client's `correlation_id`. Successful replies have
 * `{"status":"success","result":...}`; errors have `{"status":"error","error_code":...,
 * "message":...}`.
 *
 * A BLPOP_REQ whose keys are all empty is parked. Parked waiters are served in arrival order
 * whenever a push makes one of their keys non-empty, and are answered with `timeout:true` once
 * their deadline passes. If a waiter's peer has disconnected by the time its item is ready, the
 * item is put back at the head of its queue.
 *
 * All socket I/O is single-threaded (run() loop); only stop() is thread-safe.
 */
#include "relayhub_utils_export.h"

#include <functional>
#include <memory>
#include <string>

namespace relayhub::store
{

class StoreServiceImpl;

class RELAYHUB_UTILS_EXPORT StoreService
{
  public:
    struct Config
    {
        std::string endpoint{"tcp://127.0.0.1:5580"};

        /// Optional: called from run() after bind() with the resolved endpoint.
        /// Useful for tests using dynamic port assignment (endpoint="tcp://127.0.0.1:*").
        std::function<void(const std::string &bound_endpoint)> on_ready;
    };

    explicit StoreService(Config cfg);
    ~StoreService();

    StoreService(const StoreService &) = delete;
    StoreService &operator=(const StoreService &) = delete;

    /**
     * @brief Main event loop. Blocks until stop() is called.
     * Requires the "ZMQContext" lifecycle module.
     * @throws zmq::error_t if the endpoint cannot be bound.
     */
    void run();

    /// Signal the run() loop to exit. Thread-safe and async-signal-safe.
    void stop() noexcept;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<StoreServiceImpl> pImpl;
};

} // namespace relayhub::store
