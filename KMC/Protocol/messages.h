#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Models/models.h"

// JSON bodies of the remote services' requests and responses.
// Decoders return false and explain in `why` when a body is malformed.

nlohmann::json encodeNodeInfoRequest();
bool decodeNodeInfo(const nlohmann::json& body, nodeInfo& out, std::string& why);

nlohmann::json encodePeerNodeRequest(const std::string& nodeTypeFilter);
bool decodePeerNodes(const nlohmann::json& body, std::vector<peerNode>& out, std::string& why);

nlohmann::json encodeSignRequest(const signRequest& request);
bool decodeSignResponse(const nlohmann::json& body, signResponse& out, std::string& why);

nlohmann::json encodeAppIdRequest(const std::string& appId);
bool decodeAppPublicKey(const nlohmann::json& body, appPublicKey& out, std::string& why);
