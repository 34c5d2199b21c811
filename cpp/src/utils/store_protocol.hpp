#pragma once
// Wire constants shared by StoreService and ZmqMessageStore.

#include <chrono>

namespace relayhub::store::protocol
{

// Universal framing: frame 0 (after the ROUTER identity) is a type byte.
constexpr char kFrameTypeControl = 'C';

constexpr const char *kReqSuffix = "_REQ";
constexpr const char *kAckSuffix = "_ACK";
constexpr const char *kErrorType = "ERROR";

constexpr const char *kStatusSuccess = "success";
constexpr const char *kStatusError = "error";

// Error codes
constexpr const char *kErrBadRequest = "BAD_REQUEST";
constexpr const char *kErrUnknownOp = "UNKNOWN_MSG_TYPE";
constexpr const char *kErrShuttingDown = "SHUTTING_DOWN";

// Service poll timeout; bounds the resolution of blpop deadlines and stop() latency.
constexpr std::chrono::milliseconds kPollTimeout{100};
constexpr std::chrono::milliseconds kShutdownLinger{200};

} // namespace relayhub::store::protocol
