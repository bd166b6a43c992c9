#include "tlsMaterial.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <iostream>

std::string openSSLErrors() {
    std::string out;
    unsigned long code;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

X509* readCertificatePem(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) return nullptr;
    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return cert;
}

EVP_PKEY* readPrivateKeyPem(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) return nullptr;
    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return pkey;
}

bool createTLSMaterial(const std::string& cert, const std::string& key,
                       const std::string& trustedCert, tlsMaterial& out, clientError& err) {
    X509* own = readCertificatePem(cert);
    if (!own) {
        err.set(errorKind::Connection, "failed to parse client certificate", openSSLErrors());
        std::cerr << "[TLS] " << err.describe() << "\n";
        return false;
    }

    EVP_PKEY* pkey = readPrivateKeyPem(key);
    if (!pkey) {
        X509_free(own);
        err.set(errorKind::Connection, "failed to parse client private key", openSSLErrors());
        std::cerr << "[TLS] " << err.describe() << "\n";
        return false;
    }

    bool matches = X509_check_private_key(own, pkey) == 1;
    EVP_PKEY_free(pkey);
    X509_free(own);
    if (!matches) {
        err.set(errorKind::Connection, "client private key does not match certificate", openSSLErrors());
        std::cerr << "[TLS] " << err.describe() << "\n";
        return false;
    }

    X509* peer = readCertificatePem(trustedCert);
    if (!peer) {
        err.set(errorKind::Connection, "failed to parse server certificate", openSSLErrors());
        std::cerr << "[TLS] " << err.describe() << "\n";
        return false;
    }
    X509_free(peer);

    out.cert = cert;
    out.key = key;
    out.trustedCert = trustedCert;
    return true;
}
