#include "messages.h"
#include "Protocol/wireCodec.h"

static bool decodeBytes(const nlohmann::json& body, const char* field, std::string& out, std::string& why) {
    if (!base64Decode(body.value(field, std::string()), out)) {
        why = std::string("field '") + field + "' is not valid base64";
        return false;
    }
    return true;
}

nlohmann::json encodeNodeInfoRequest() {
    return nlohmann::json::object();
}

bool decodeNodeInfo(const nlohmann::json& body, nodeInfo& out, std::string& why) {
    try {
        out.nodeId = body.at("node_id").get<uint32_t>();
        out.rpcAddress = body.value("rpc_address", std::string());
        return decodeBytes(body, "cert", out.cert, why) &&
               decodeBytes(body, "key", out.key, why);
    } catch (const nlohmann::json::exception& e) {
        why = e.what();
        return false;
    }
}

nlohmann::json encodePeerNodeRequest(const std::string& nodeTypeFilter) {
    return nlohmann::json{{"node_type", nodeTypeFilter}};
}

bool decodePeerNodes(const nlohmann::json& body, std::vector<peerNode>& out, std::string& why) {
    out.clear();
    try {
        if (!body.contains("peers")) return true;
        for (const auto& item : body.at("peers")) {
            peerNode peer;
            peer.id = item.value("id", uint32_t(0));
            peer.rpcAddress = item.value("rpc_address", std::string());
            peer.type = item.value("type", uint32_t(0));
            if (!decodeBytes(item, "cert", peer.cert, why)) return false;
            out.push_back(peer);
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        why = e.what();
        return false;
    }
}

nlohmann::json encodeSignRequest(const signRequest& request) {
    return nlohmann::json{
        {"from", request.from},
        {"public_key_info", base64Encode(request.publicKeyInfo)},
        {"msg", base64Encode(request.msg)},
        {"protocol", request.protocol},
        {"curve", request.curve}
    };
}

bool decodeSignResponse(const nlohmann::json& body, signResponse& out, std::string& why) {
    try {
        out.success = body.value("success", false);
        out.error = body.value("error", std::string());
        out.signature.clear();
        // A rejected request carries no usable signature
        if (!out.success) return true;
        return decodeBytes(body, "signature", out.signature, why);
    } catch (const nlohmann::json::exception& e) {
        why = e.what();
        return false;
    }
}

nlohmann::json encodeAppIdRequest(const std::string& appId) {
    return nlohmann::json{{"app_id", appId}};
}

bool decodeAppPublicKey(const nlohmann::json& body, appPublicKey& out, std::string& why) {
    try {
        out.publicKey = body.value("publickey", std::string());
        out.protocol = body.value("protocol", std::string());
        out.curve = body.value("curve", std::string());
        return true;
    } catch (const nlohmann::json::exception& e) {
        why = e.what();
        return false;
    }
}
