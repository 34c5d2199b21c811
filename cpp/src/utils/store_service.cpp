#include "rlh_service.hpp"
#include "utils/store_service.hpp"
#include "utils/key_space.hpp"
#include "utils/zmq_context.hpp"

#include "store_protocol.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>
#include <zmq_addon.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <deque>
#include <optional>
#include <vector>

namespace relayhub::store
{

using namespace protocol;
using Clock = std::chrono::steady_clock;

namespace
{
/// A BLPOP_REQ that could not be served when it arrived.
struct ParkedWaiter
{
    std::string identity;
    std::string correlation_id;
    std::vector<std::string> keys;
    std::optional<Clock::time_point> deadline; ///< nullopt waits forever.
};
} // namespace

// ============================================================================
// StoreServiceImpl: all private state and logic
// ============================================================================

class StoreServiceImpl
{
  public:
    StoreService::Config cfg;
    KeySpace keys;
    std::deque<ParkedWaiter> waiters;
    std::atomic<bool> stop_requested{false};

    void run();

    void process_message(zmq::socket_t &socket, const std::string &identity,
                         const std::string &msg_type, const nlohmann::json &payload);

    /// Returns the `result` value of the reply, or nullopt if the request was parked.
    std::optional<nlohmann::json> handle_op(const std::string &op, const nlohmann::json &req,
                                            const std::string &identity);

    void serve_waiters(zmq::socket_t &socket);
    void expire_waiters(zmq::socket_t &socket);
    void fail_all_waiters(zmq::socket_t &socket);

    /// @return false if the peer is gone (ROUTER_MANDATORY, EHOSTUNREACH) or its pipe is full.
    static bool send_reply(zmq::socket_t &socket, const std::string &identity,
                           const std::string &msg_type, const nlohmann::json &body);

    static nlohmann::json make_success(const std::string &correlation_id,
                                       nlohmann::json result);
    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
    static nlohmann::json make_error(const std::string &correlation_id,
                                     const std::string &error_code,
                                     const std::string &message);
};

// ============================================================================
// StoreServiceImpl::run(): main event loop
// ============================================================================

void StoreServiceImpl::run()
{
    zmq::socket_t router(get_zmq_context(), zmq::socket_type::router);
    router.set(zmq::sockopt::linger, 0);
    router.set(zmq::sockopt::router_mandatory, 1);

    router.bind(cfg.endpoint);
    const std::string bound = router.get(zmq::sockopt::last_endpoint);
    if (cfg.on_ready)
    {
        cfg.on_ready(bound);
    }
    LOGGER_INFO("StoreService: listening on {}", bound);

    while (!stop_requested.load(std::memory_order_acquire))
    {
        std::vector<zmq::pollitem_t> items = {{router.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, kPollTimeout);

        expire_waiters(router);

        if ((items[0].revents & ZMQ_POLLIN) == 0)
        {
            continue;
        }

        std::vector<zmq::message_t> frames;
        static_cast<void>(zmq::recv_multipart(router, std::back_inserter(frames)));
        // Expected layout: [identity, 'C', msg_type_string, json_body]
        if (frames.size() < 4)
        {
            LOGGER_WARN("StoreService: malformed message (expected 4 frames, got {})",
                        frames.size());
            continue;
        }
        if (frames[1].size() != 1 || *frames[1].data<char>() != kFrameTypeControl)
        {
            LOGGER_WARN("StoreService: unexpected frame type; dropping message");
            continue;
        }

        const std::string identity = frames[0].to_string();
        const std::string msg_type = frames[2].to_string();
        nlohmann::json payload;
        try
        {
            payload = nlohmann::json::parse(frames[3].to_string());
        }
        catch (const nlohmann::json::exception &e)
        {
            LOGGER_WARN("StoreService: malformed JSON in {}: {}", msg_type, e.what());
            send_reply(router, identity, kErrorType,
                       make_error("", kErrBadRequest, std::string("malformed JSON: ") + e.what()));
            continue;
        }
        process_message(router, identity, msg_type, payload);
    }

    fail_all_waiters(router);
    // Linger briefly so the SHUTTING_DOWN replies are not dropped by close().
    router.set(zmq::sockopt::linger, static_cast<int>(kShutdownLinger.count()));
    router.close();
    LOGGER_INFO("StoreService: stopped.");
}

// ============================================================================
// Message dispatch
// ============================================================================

void StoreServiceImpl::process_message(zmq::socket_t &socket, const std::string &identity,
                                       const std::string &msg_type,
                                       const nlohmann::json &payload)
{
    std::string corr_id;
    if (payload.is_object() && payload.contains("correlation_id") &&
        payload.at("correlation_id").is_string())
    {
        corr_id = payload.at("correlation_id").get<std::string>();
    }

    const std::string req_suffix = kReqSuffix;
    if (msg_type.size() <= req_suffix.size() ||
        msg_type.compare(msg_type.size() - req_suffix.size(), req_suffix.size(), req_suffix) != 0)
    {
        LOGGER_WARN("StoreService: unknown msg_type '{}'", msg_type);
        send_reply(socket, identity, kErrorType,
                   make_error(corr_id, kErrUnknownOp, "Unknown message type: " + msg_type));
        return;
    }
    const std::string op = msg_type.substr(0, msg_type.size() - req_suffix.size());

    std::optional<nlohmann::json> result;
    try
    {
        result = handle_op(op, payload, identity);
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_WARN("StoreService: bad {} request: {}", msg_type, e.what());
        send_reply(socket, identity, kErrorType, make_error(corr_id, kErrBadRequest, e.what()));
        return;
    }
    catch (const std::invalid_argument &e)
    {
        send_reply(socket, identity, kErrorType, make_error(corr_id, kErrUnknownOp, e.what()));
        return;
    }

    if (result)
    {
        send_reply(socket, identity, op + kAckSuffix, make_success(corr_id, std::move(*result)));
    }
    if (op == "RPUSH")
    {
        serve_waiters(socket);
    }
}

std::optional<nlohmann::json> StoreServiceImpl::handle_op(const std::string &op,
                                                          const nlohmann::json &req,
                                                          const std::string &identity)
{
    auto str = [&req](const char *name) { return req.at(name).get<std::string>(); };

    if (op == "PING")
        return nlohmann::json("PONG");
    if (op == "SADD")
        return keys.sadd(str("key"), str("member"));
    if (op == "SREM")
        return keys.srem(str("key"), str("member"));
    if (op == "SISMEMBER")
        return keys.sismember(str("key"), str("member"));
    if (op == "SMEMBERS")
        return keys.smembers(str("key"));
    if (op == "HSET")
        return keys.hset(str("key"), str("field"), str("value"));
    if (op == "HGET")
    {
        auto value = keys.hget(str("key"), str("field"));
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }
    if (op == "HDEL")
        return keys.hdel(str("key"), str("field"));
    if (op == "HEXISTS")
        return keys.hexists(str("key"), str("field"));
    if (op == "HGETALL")
        return keys.hgetall(str("key"));
    if (op == "RPUSH")
        return keys.rpush(str("key"), str("value"));
    if (op == "EXISTS")
        return keys.exists(req.at("keys").get<std::vector<std::string>>());
    if (op == "FLUSHALL")
    {
        keys.clear();
        return nlohmann::json(true);
    }
    if (op == "BLPOP")
    {
        auto wanted = req.at("keys").get<std::vector<std::string>>();
        if (auto item = keys.pop_first(wanted))
        {
            return nlohmann::json{{"timeout", false}, {"key", item->key}, {"value", item->value}};
        }
        const auto timeout_ms = req.value("timeout_ms", std::int64_t{0});
        ParkedWaiter w{identity, req.at("correlation_id").get<std::string>(), std::move(wanted),
                       std::nullopt};
        if (timeout_ms > 0)
        {
            w.deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
        }
        waiters.push_back(std::move(w));
        LOGGER_DEBUG("StoreService: parked BLPOP ({} waiters)", waiters.size());
        return std::nullopt;
    }
    throw std::invalid_argument("Unknown operation: " + op);
}

// ============================================================================
// Parked BLPOP waiters
// ============================================================================

void StoreServiceImpl::serve_waiters(zmq::socket_t &socket)
{
    for (auto it = waiters.begin(); it != waiters.end();)
    {
        auto item = keys.pop_first(it->keys);
        if (!item)
        {
            ++it;
            continue;
        }
        nlohmann::json result{{"timeout", false}, {"key", item->key}, {"value", item->value}};
        if (!send_reply(socket, it->identity, std::string("BLPOP") + kAckSuffix,
                        make_success(it->correlation_id, std::move(result))))
        {
            LOGGER_WARN("StoreService: BLPOP waiter unreachable; requeueing item on '{}'",
                        item->key);
            keys.push_front(item->key, item->value);
        }
        it = waiters.erase(it);
    }
}

void StoreServiceImpl::expire_waiters(zmq::socket_t &socket)
{
    if (waiters.empty())
        return;
    const auto now = Clock::now();
    for (auto it = waiters.begin(); it != waiters.end();)
    {
        if (it->deadline && *it->deadline <= now)
        {
            send_reply(socket, it->identity, std::string("BLPOP") + kAckSuffix,
                       make_success(it->correlation_id, nlohmann::json{{"timeout", true}}));
            it = waiters.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void StoreServiceImpl::fail_all_waiters(zmq::socket_t &socket)
{
    if (!waiters.empty())
    {
        LOGGER_INFO("StoreService: releasing {} parked BLPOP waiters", waiters.size());
    }
    for (const auto &w : waiters)
    {
        send_reply(socket, w.identity, kErrorType,
                   make_error(w.correlation_id, kErrShuttingDown, "store service stopping"));
    }
    waiters.clear();
}

// ============================================================================
// Wire helpers
// ============================================================================

bool StoreServiceImpl::send_reply(zmq::socket_t &socket, const std::string &identity,
                                  const std::string &msg_type, const nlohmann::json &body)
{
    const std::string body_str = body.dump();
    std::vector<zmq::const_buffer> frames = {zmq::buffer(identity),
                                             zmq::buffer(&kFrameTypeControl, 1),
                                             zmq::buffer(msg_type), zmq::buffer(body_str)};
    try
    {
        // dontwait: a peer whose pipe is at its high-water mark must not stall the loop.
        if (!zmq::send_multipart(socket, frames, zmq::send_flags::dontwait))
        {
            LOGGER_DEBUG("StoreService: {} reply not sent; peer pipe is full", msg_type);
            return false;
        }
    }
    catch (const zmq::error_t &e)
    {
        if (e.num() == EHOSTUNREACH)
        {
            return false;
        }
        throw;
    }
    return true;
}

nlohmann::json StoreServiceImpl::make_success(const std::string &correlation_id,
                                              nlohmann::json result)
{
    nlohmann::json j;
    j["status"] = kStatusSuccess;
    j["correlation_id"] = correlation_id;
    j["result"] = std::move(result);
    return j;
}

nlohmann::json StoreServiceImpl::make_error(const std::string &correlation_id,
                                            const std::string &error_code,
                                            const std::string &message)
{
    nlohmann::json j;
    j["status"] = kStatusError;
    j["correlation_id"] = correlation_id;
    j["error_code"] = error_code;
    j["message"] = message;
    return j;
}

// ============================================================================
// StoreService: public API
// ============================================================================

StoreService::StoreService(Config cfg) : pImpl(std::make_unique<StoreServiceImpl>())
{
    pImpl->cfg = std::move(cfg);
}

StoreService::~StoreService() = default;

void StoreService::run()
{
    pImpl->run();
}

void StoreService::stop() noexcept
{
    pImpl->stop_requested.store(true, std::memory_order_release);
}

} // namespace relayhub::store
