#pragma once
#include <string>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include "Models/errors.h"

// PEM material for a mutually authenticated connection
struct tlsMaterial {
    std::string cert;         // own certificate
    std::string key;          // own private key
    std::string trustedCert;  // trust anchor for the peer
};

// Checks that every blob parses and that the key belongs to the certificate
bool createTLSMaterial(const std::string& cert, const std::string& key,
                       const std::string& trustedCert, tlsMaterial& out, clientError& err);

// In-memory PEM readers; caller frees the result
X509* readCertificatePem(const std::string& pem);
EVP_PKEY* readPrivateKeyPem(const std::string& pem);

// Empties the OpenSSL error queue into one line
std::string openSSLErrors();
