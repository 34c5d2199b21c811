#pragma once
// tests/test_layer3_relay/workers/store_workers.h
// StoreService / ZmqMessageStore worker declarations, plus the in-thread service handle that
// the relay workers share.

#include "rlh_relay.hpp"

#include <memory>
#include <string>
#include <thread>

namespace relayhub::tests::worker::store
{

/**
 * @brief Owns a StoreService and the thread running it.
 * start_store_in_thread() returns once the service is bound.
 */
struct StoreHandle
{
    std::unique_ptr<relayhub::store::StoreService> service;
    std::thread thread;
    std::string endpoint;

    void stop_and_join();
};

StoreHandle start_store_in_thread(const std::string &endpoint);

/** Every MessageStore operation through the ZMQ client, checked against expected values. */
int ops_roundtrip(const std::string &endpoint);

/** blpop parked by the service is served by a push from another client; FIFO among waiters. */
int parked_blpop_is_served(const std::string &endpoint);

/** blpop with a finite timeout gets a timeout reply, not an error. */
int blpop_times_out(const std::string &endpoint);

/** Stopping the service releases parked waiters with SHUTTING_DOWN. */
int stop_releases_waiters(const std::string &endpoint);

/** An item popped for a waiter whose socket has gone is put back at the head of its list. */
int vanished_waiter_item_is_requeued(const std::string &endpoint);

/**
 * A waiter that stops reading fills its reply pipe. Replies to it are dropped, its item is
 * requeued, and other clients are still served.
 */
int stalled_waiter_item_is_requeued(const std::string &endpoint);

/** Unknown operations and malformed JSON get ERROR replies; the service keeps serving. */
int bad_requests_get_error_replies(const std::string &endpoint);

/** A client with nobody listening times out with StoreError; ping() reports false. */
int unreachable_store_times_out(const std::string &endpoint);

} // namespace relayhub::tests::worker::store
