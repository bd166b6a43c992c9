#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "Models/errors.h"
#include "Protocol/callContext.h"

// Base64 for bytes fields carried in JSON
std::string base64Encode(const std::string& data);
bool base64Decode(const std::string& text, std::string& out);

// Frame layout: 4-byte big-endian length, then the JSON payload
std::string encodeFrame(const std::string& payload);
bool decodeFrameLength(const unsigned char header[4], uint32_t& length);

// Request / response envelopes
std::string encodeRequest(const std::string& method, uint64_t id,
                          const nlohmann::json& body, const callContext& callCtx);
rpcStatus decodeResponse(const std::string& payload, uint64_t expectedId, nlohmann::json& body);

// "host:port" (or "[v6]:port") -> parts
bool splitAddress(const std::string& address, std::string& host, int& port);

// Waits until `fd` is ready for `events` (POLLIN / POLLOUT), in slices so that
// cancellation of the context is noticed promptly
rpcStatus waitForSocket(int fd, short events, const callContext& callCtx);
