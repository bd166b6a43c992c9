#pragma once
#include <cstdint>
#include <string>

// "ecdsa" / "schnorr" or a decimal tag; anything else falls back to Schnorr
uint32_t parseProtocol(const std::string& protocol);

// "ed25519" / "secp256k1" / "secp256r1" or a decimal tag; anything else falls back to Ed25519
uint32_t parseCurve(const std::string& curve);
