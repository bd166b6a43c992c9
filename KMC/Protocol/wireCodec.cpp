#include "wireCodec.h"
#include "Models/constants.h"
#include <openssl/evp.h>
#include <poll.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <vector>

static constexpr std::chrono::milliseconds POLL_SLICE{50};

std::string base64Encode(const std::string& data) {
    if (data.empty()) return "";
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    return std::string(reinterpret_cast<char*>(out.data()), len);
}

bool base64Decode(const std::string& text, std::string& out) {
    out.clear();
    if (text.empty()) return true;
    if (text.size() % 4 != 0) return false;

    std::vector<unsigned char> buf(3 * (text.size() / 4) + 1);
    int len = EVP_DecodeBlock(buf.data(),
                              reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (len < 0) return false;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    int padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.assign(reinterpret_cast<char*>(buf.data()), len - padding);
    return true;
}

std::string encodeFrame(const std::string& payload) {
    uint32_t len = static_cast<uint32_t>(payload.size());
    std::string frame;
    frame.reserve(payload.size() + 4);
    frame.push_back(static_cast<char>((len >> 24) & 0xFF));
    frame.push_back(static_cast<char>((len >> 16) & 0xFF));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
    frame += payload;
    return frame;
}

bool decodeFrameLength(const unsigned char header[4], uint32_t& length) {
    length = (static_cast<uint32_t>(header[0]) << 24) |
             (static_cast<uint32_t>(header[1]) << 16) |
             (static_cast<uint32_t>(header[2]) << 8) |
             static_cast<uint32_t>(header[3]);
    return length <= MAX_FRAME_BYTES;
}

std::string encodeRequest(const std::string& method, uint64_t id,
                          const nlohmann::json& body, const callContext& callCtx) {
    nlohmann::json request = {
        {"method", method},
        {"id", id},
        {"timeout_ms", callCtx.deadline() ? callCtx.remaining().count() : 0},
        {"body", body}
    };
    return request.dump();
}

rpcStatus decodeResponse(const std::string& payload, uint64_t expectedId, nlohmann::json& body) {
    try {
        nlohmann::json response = nlohmann::json::parse(payload);
        if (response.value("id", uint64_t(0)) != expectedId) {
            return {statusCode::Internal, "response id does not match request"};
        }
        rpcStatus st{statusFromInt(response.value("status", 0)),
                     response.value("message", std::string())};
        if (!st.ok()) return st;
        body = response.value("body", nlohmann::json::object());
        return st;
    } catch (const nlohmann::json::exception& e) {
        return {statusCode::Internal, std::string("malformed response: ") + e.what()};
    }
}

bool splitAddress(const std::string& address, std::string& host, int& port) {
    auto colon = address.find_last_of(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) {
        return false;
    }
    host = address.substr(0, colon);
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    std::string portText = address.substr(colon + 1);
    if (!std::all_of(portText.begin(), portText.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }) || portText.size() > 5) {
        return false;
    }
    port = std::stoi(portText);
    return port > 0 && port <= 65535;
}

rpcStatus waitForSocket(int fd, short events, const callContext& callCtx) {
    for (;;) {
        rpcStatus st = callCtx.status();
        if (!st.ok()) return st;

        auto slice = std::min(callCtx.remaining(), std::chrono::milliseconds(POLL_SLICE));
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int rc = poll(&pfd, 1, static_cast<int>(slice.count()));
        if (rc > 0) return {};
        if (rc < 0 && errno != EINTR) {
            return {statusCode::Unavailable, std::string("poll: ") + std::strerror(errno)};
        }
    }
}
