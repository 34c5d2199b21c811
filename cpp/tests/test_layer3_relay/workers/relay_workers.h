#pragma once
// tests/test_layer3_relay/workers/relay_workers.h
// Multi-process relay channel worker declarations. Every worker takes the store endpoint as
// its first argument; the store itself runs in a separate "relay.store_server" worker.

#include <string>

namespace relayhub::tests::worker::relay
{

/** Hosts a StoreService until a value is pushed on the shutdown key. */
int store_server(const std::string &endpoint);

/** Pushes the shutdown key that store_server waits on. */
int shutdown_store(const std::string &endpoint);

/** Member 1: broadcasts 1..count, then expects "ack" from member 2. */
int counting_sender(const std::string &endpoint, int count);

/** Member 2: expects 1..count from member 1 in order, then replies "ack". */
int counting_receiver(const std::string &endpoint, int count);

/** Member 2: blocks before any sender exists and still receives the late sender's message. */
int late_joiner_receiver(const std::string &endpoint);

/** Member 1: joins after member 2 is already blocked, then sends to it. */
int late_joiner_sender(const std::string &endpoint);

/** Races `contenders` processes for one id; exactly one must win. Reports on stderr. */
int id_contender(const std::string &endpoint, const std::string &tag);

} // namespace relayhub::tests::worker::relay
