#include "protocolUtils.h"
#include "Models/constants.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>

static std::optional<uint32_t> parseTag(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        unsigned long long value = std::stoull(text);
        if (value > std::numeric_limits<uint32_t>::max()) return std::nullopt;
        return static_cast<uint32_t>(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

uint32_t parseProtocol(const std::string& protocol) {
    if (protocol == "schnorr") return PROTOCOL_SCHNORR;
    if (protocol == "ecdsa") return PROTOCOL_ECDSA;
    return parseTag(protocol).value_or(PROTOCOL_SCHNORR);
}

uint32_t parseCurve(const std::string& curve) {
    if (curve == "ed25519") return CURVE_ED25519;
    if (curve == "secp256k1") return CURVE_SECP256K1;
    if (curve == "secp256r1") return CURVE_SECP256R1;
    return parseTag(curve).value_or(CURVE_ED25519);
}
