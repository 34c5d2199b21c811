#include "rlh_service.hpp"
#include "utils/store_client.hpp"
#include "utils/zmq_context.hpp"

#include "store_protocol.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>
#include <zmq_addon.hpp>

#include <atomic>

namespace relayhub::store
{

using namespace protocol;
using Clock = std::chrono::steady_clock;

namespace
{
std::atomic<std::uint64_t> g_next_correlation{1};

std::string next_correlation_id()
{
    return fmt::format("{}-{}", platform::get_pid(),
                       g_next_correlation.fetch_add(1, std::memory_order_relaxed));
}
} // namespace

class ZmqMessageStoreImpl
{
  public:
    ZmqMessageStoreImpl(const std::string &ep, std::chrono::milliseconds timeout)
        : endpoint(ep), request_timeout(timeout),
          socket(get_zmq_context(), zmq::socket_type::dealer)
    {
        socket.set(zmq::sockopt::linger, 0);
        try
        {
            socket.connect(endpoint);
        }
        catch (const zmq::error_t &e)
        {
            throw StoreError(fmt::format("store: cannot connect to '{}': {}", endpoint, e.what()));
        }
    }

    /**
     * @brief Sends `<op>_REQ` and waits for the matching reply.
     * @param wait_budget Extra time the server may legitimately hold the request (blpop).
     *                    std::nullopt means no limit.
     * @return The `result` member of the success reply.
     */
    nlohmann::json request(const std::string &op, nlohmann::json body,
                           std::optional<std::chrono::milliseconds> wait_budget =
                               std::chrono::milliseconds{0})
    {
        const std::string corr_id = next_correlation_id();
        body["correlation_id"] = corr_id;
        const std::string msg_type = op + kReqSuffix;
        const std::string payload_str = body.dump();
        std::vector<zmq::const_buffer> msgs = {zmq::buffer(&kFrameTypeControl, 1),
                                               zmq::buffer(msg_type), zmq::buffer(payload_str)};
        try
        {
            if (!zmq::send_multipart(socket, msgs))
            {
                throw StoreError(fmt::format("store: {} send to '{}' failed", msg_type, endpoint));
            }

            std::optional<Clock::time_point> deadline;
            if (wait_budget)
            {
                deadline = Clock::now() + request_timeout + *wait_budget;
            }

            for (;;)
            {
                auto slice = std::chrono::milliseconds(-1);
                if (deadline)
                {
                    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                        *deadline - Clock::now());
                    if (left.count() <= 0)
                    {
                        throw StoreError(fmt::format("store: {} to '{}' timed out", msg_type,
                                                     endpoint));
                    }
                    slice = left;
                }
                std::vector<zmq::pollitem_t> items = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
                zmq::poll(items, slice);
                if ((items[0].revents & ZMQ_POLLIN) == 0)
                {
                    continue;
                }

                std::vector<zmq::message_t> recv_msgs;
                static_cast<void>(zmq::recv_multipart(socket, std::back_inserter(recv_msgs)));
                // Expected layout: ['C', msg_type, json_body]
                if (recv_msgs.size() < 3)
                {
                    LOGGER_WARN("store: {} invalid response ({} frames); ignoring", msg_type,
                                recv_msgs.size());
                    continue;
                }
                nlohmann::json reply = nlohmann::json::parse(recv_msgs.back().to_string());
                if (reply.value("correlation_id", std::string{}) != corr_id)
                {
                    LOGGER_DEBUG("store: discarding stale reply '{}'", recv_msgs[1].to_string());
                    continue;
                }
                if (reply.value("status", std::string{}) != kStatusSuccess)
                {
                    throw StoreError(fmt::format(
                        "store: {} failed: {}: {}", msg_type,
                        reply.value("error_code", std::string("UNKNOWN")),
                        reply.value("message", std::string("unknown"))));
                }
                return reply.value("result", nlohmann::json{});
            }
        }
        catch (const zmq::error_t &e)
        {
            throw StoreError(fmt::format("store: ZMQ error in {}: {}", msg_type, e.what()));
        }
        catch (const nlohmann::json::exception &e)
        {
            throw StoreError(fmt::format("store: malformed {} reply: {}", msg_type, e.what()));
        }
    }

    std::string endpoint;
    std::chrono::milliseconds request_timeout;
    zmq::socket_t socket;
};

ZmqMessageStore::ZmqMessageStore(const std::string &endpoint,
                                 std::chrono::milliseconds request_timeout)
    : pImpl(std::make_unique<ZmqMessageStoreImpl>(endpoint, request_timeout))
{
}

ZmqMessageStore::~ZmqMessageStore() = default;

bool ZmqMessageStore::ping()
{
    try
    {
        return pImpl->request("PING", nlohmann::json::object()) == "PONG";
    }
    catch (const StoreError &e)
    {
        LOGGER_DEBUG("store: ping failed: {}", e.what());
        return false;
    }
}

bool ZmqMessageStore::sadd(const std::string &key, const std::string &member)
{
    return pImpl->request("SADD", {{"key", key}, {"member", member}}).get<bool>();
}

bool ZmqMessageStore::srem(const std::string &key, const std::string &member)
{
    return pImpl->request("SREM", {{"key", key}, {"member", member}}).get<bool>();
}

bool ZmqMessageStore::sismember(const std::string &key, const std::string &member)
{
    return pImpl->request("SISMEMBER", {{"key", key}, {"member", member}}).get<bool>();
}

std::vector<std::string> ZmqMessageStore::smembers(const std::string &key)
{
    return pImpl->request("SMEMBERS", {{"key", key}}).get<std::vector<std::string>>();
}

bool ZmqMessageStore::hset(const std::string &key, const std::string &field,
                           const std::string &value)
{
    return pImpl->request("HSET", {{"key", key}, {"field", field}, {"value", value}}).get<bool>();
}

std::optional<std::string> ZmqMessageStore::hget(const std::string &key, const std::string &field)
{
    auto result = pImpl->request("HGET", {{"key", key}, {"field", field}});
    if (result.is_null())
        return std::nullopt;
    return result.get<std::string>();
}

bool ZmqMessageStore::hdel(const std::string &key, const std::string &field)
{
    return pImpl->request("HDEL", {{"key", key}, {"field", field}}).get<bool>();
}

bool ZmqMessageStore::hexists(const std::string &key, const std::string &field)
{
    return pImpl->request("HEXISTS", {{"key", key}, {"field", field}}).get<bool>();
}

std::map<std::string, std::string> ZmqMessageStore::hgetall(const std::string &key)
{
    return pImpl->request("HGETALL", {{"key", key}}).get<std::map<std::string, std::string>>();
}

std::size_t ZmqMessageStore::rpush(const std::string &key, const std::string &value)
{
    return pImpl->request("RPUSH", {{"key", key}, {"value", value}}).get<std::size_t>();
}

std::optional<PoppedItem> ZmqMessageStore::blpop(const std::vector<std::string> &keys,
                                                 std::chrono::milliseconds timeout)
{
    nlohmann::json body;
    body["keys"] = keys;
    body["timeout_ms"] = timeout.count() > 0 ? timeout.count() : 0;
    std::optional<std::chrono::milliseconds> budget;
    if (timeout.count() > 0)
        budget = timeout;

    auto result = pImpl->request("BLPOP", std::move(body), budget);
    if (result.value("timeout", false))
        return std::nullopt;
    return PoppedItem{result.at("key").get<std::string>(), result.at("value").get<std::string>()};
}

std::size_t ZmqMessageStore::exists(const std::vector<std::string> &keys)
{
    nlohmann::json body;
    body["keys"] = keys;
    return pImpl->request("EXISTS", std::move(body)).get<std::size_t>();
}

void ZmqMessageStore::flushall()
{
    static_cast<void>(pImpl->request("FLUSHALL", nlohmann::json::object()));
}

StoreConnector make_zmq_connector(std::string endpoint, std::chrono::milliseconds request_timeout)
{
    return [endpoint = std::move(endpoint), request_timeout]() -> std::unique_ptr<MessageStore>
    { return std::make_unique<ZmqMessageStore>(endpoint, request_timeout); };
}

} // namespace relayhub::store
