#pragma once
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "Models/errors.h"
#include "Protocol/callContext.h"

struct tlsMaterial;

// One logical connection able to carry unary request/response calls
class rpcChannel {
public:
    virtual ~rpcChannel() = default;

    virtual rpcStatus call(const std::string& method, const nlohmann::json& request,
                           nlohmann::json& response, const callContext& callCtx) = 0;
    virtual void close() = 0;
};

// Opens a channel to `address`; plain TCP when `material` is null, mutual TLS
// otherwise. Returns null and fills `err` with a Connection error on failure.
using channelDialer = std::function<std::unique_ptr<rpcChannel>(
    const std::string& address, const tlsMaterial* material,
    const callContext& callCtx, clientError& err)>;

channelDialer defaultDialer();
