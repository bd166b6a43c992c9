#include "models.h"
#include "Protocol/wireCodec.h"
#include <stdexcept>

void to_json(nlohmann::json& j, const nodeConfig& config) {
    j = nlohmann::json{
        {"node_id", config.nodeId},
        {"rpc_address", config.rpcAddress},
        {"cert", base64Encode(config.cert)},
        {"key", base64Encode(config.key)},
        {"target_cert", base64Encode(config.targetCert)},
        {"app_node_addr", config.appNodeAddr},
        {"app_node_cert", base64Encode(config.appNodeCert)}
    };
}

static std::string decodeField(const nlohmann::json& j, const char* name) {
    std::string decoded;
    if (!base64Decode(j.value(name, std::string()), decoded)) {
        throw std::invalid_argument(std::string("field '") + name + "' is not valid base64");
    }
    return decoded;
}

void from_json(const nlohmann::json& j, nodeConfig& config) {
    config.nodeId = j.at("node_id").get<uint32_t>();
    config.rpcAddress = j.value("rpc_address", std::string());
    config.cert = decodeField(j, "cert");
    config.key = decodeField(j, "key");
    config.targetCert = decodeField(j, "target_cert");
    config.appNodeAddr = j.value("app_node_addr", std::string());
    config.appNodeCert = decodeField(j, "app_node_cert");
}
