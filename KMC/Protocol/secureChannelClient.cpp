#include "secureChannelClient.h"
#include "Protocol/wireCodec.h"
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <openssl/err.h>
#include <openssl/x509.h>

namespace {

// Granularity of a call waiting for the channel held by another call
constexpr std::chrono::milliseconds LOCK_SLICE{20};

// OpenSSL writes to the socket with write(), so a peer that went away raises
// SIGPIPE. Blocks it on this thread and discards any instance raised meanwhile.
class sigpipeGuard {
public:
    sigpipeGuard() : alreadyPending(false), blocked(false) {
        sigemptyset(&pipeSet);
        sigaddset(&pipeSet, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0) alreadyPending = sigismember(&pending, SIGPIPE) == 1;
        blocked = pthread_sigmask(SIG_BLOCK, &pipeSet, &previous) == 0;
    }

    ~sigpipeGuard() {
        if (!blocked) return;
        if (!alreadyPending) {
            timespec zero{0, 0};
            while (sigtimedwait(&pipeSet, nullptr, &zero) == SIGPIPE) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    }

    sigpipeGuard(const sigpipeGuard&) = delete;
    sigpipeGuard& operator=(const sigpipeGuard&) = delete;

private:
    sigset_t pipeSet;
    sigset_t previous;
    bool alreadyPending;
    bool blocked;
};

}

secureChannelClient::secureChannelClient()
    : ctx(nullptr), ssl(nullptr), server_fd(-1), closed(false), nextId(0) {
    OPENSSL_init_ssl(0, nullptr);
}

secureChannelClient::~secureChannelClient() {
    close();
    if (ctx) SSL_CTX_free(ctx);
}

bool secureChannelClient::initClientContext(const tlsMaterial& material, clientError& err) {
    if (ctx) {
        SSL_CTX_free(ctx);
        ctx = nullptr;
    }
    ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) {
        err.set(errorKind::Connection, "failed to create SSL context", openSSLErrors());
        std::cerr << "[Channel] " << err.describe() << "\n";
        return false;
    }
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

    X509* cert = readCertificatePem(material.cert);
    EVP_PKEY* key = readPrivateKeyPem(material.key);
    bool loaded = cert && key &&
                  SSL_CTX_use_certificate(ctx, cert) == 1 &&
                  SSL_CTX_use_PrivateKey(ctx, key) == 1;
    if (cert) X509_free(cert);
    if (key) EVP_PKEY_free(key);
    if (!loaded) {
        err.set(errorKind::Connection, "failed to load client certificate or key", openSSLErrors());
        std::cerr << "[Channel] " << err.describe() << "\n";
        return false;
    }
    if (!SSL_CTX_check_private_key(ctx)) {
        err.set(errorKind::Connection, "private key does not match certificate", openSSLErrors());
        std::cerr << "[Channel] " << err.describe() << "\n";
        return false;
    }

    // The peer certificate from the configuration service is the trust anchor
    X509* trusted = readCertificatePem(material.trustedCert);
    bool added = trusted && X509_STORE_add_cert(SSL_CTX_get_cert_store(ctx), trusted) == 1;
    if (trusted) X509_free(trusted);
    if (!added) {
        err.set(errorKind::Connection, "failed to load server certificate", openSSLErrors());
        std::cerr << "[Channel] " << err.describe() << "\n";
        return false;
    }

    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);

    if (SSL_CTX_set_cipher_list(ctx,
        "ECDHE-ECDSA-AES256-GCM-SHA384:ECDHE-RSA-AES256-GCM-SHA384") != 1) {
        err.set(errorKind::Connection, "failed to set cipher list", openSSLErrors());
        std::cerr << "[Channel] " << err.describe() << "\n";
        return false;
    }
    return true;
}

bool secureChannelClient::connectToServer(const std::string& address, const callContext& callCtx,
                                          clientError& err) {
    std::lock_guard<std::timed_mutex> lock(callMutex);
    sigpipeGuard noSigpipe;
    dropConnection();
    this->address = address;
    closed = false;

    rpcStatus st = dial(callCtx);
    if (!st.ok()) {
        err.fromStatus(errorKind::Connection, "failed to connect to " + address, st);
        std::cerr << "[Channel] " << err.describe() << "\n";
        return false;
    }
    return true;
}

bool secureChannelClient::isConnected() const {
    return server_fd != -1;
}

rpcStatus secureChannelClient::dial(const callContext& callCtx) {
    std::string host;
    int port = 0;
    if (!splitAddress(address, host, port)) {
        return {statusCode::InvalidArgument, "malformed address '" + address + "'"};
    }

    rpcStatus st = createSocket(host, port, callCtx);
    if (!st.ok()) return st;

    if (ctx) {
        st = handshake(callCtx);
        if (!st.ok()) {
            dropConnection();
            return st;
        }
        std::cout << "[Channel] Secure channel established with " << address
                  << " using " << SSL_get_version(ssl) << " / " << SSL_get_cipher(ssl) << "\n";
    } else {
        std::cout << "[Channel] Plain channel established with " << address << "\n";
    }
    return {};
}

rpcStatus secureChannelClient::createSocket(const std::string& host, int port, const callContext& callCtx) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0) {
        return {statusCode::Unavailable, "no such host " + host + ": " + gai_strerror(rc)};
    }

    rpcStatus last{statusCode::Unavailable, "no usable address for " + host};
    for (addrinfo* ai = res; ai && server_fd == -1; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last = {statusCode::Unavailable, std::string("socket: ") + std::strerror(errno)};
            continue;
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                last = {statusCode::Unavailable, std::string("connect: ") + std::strerror(errno)};
                ::close(fd);
                continue;
            }
            rpcStatus ready = waitForSocket(fd, POLLOUT, callCtx);
            if (!ready.ok()) {
                ::close(fd);
                last = ready;
                break;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len);
            if (soError != 0) {
                last = {statusCode::Unavailable, std::string("connect: ") + std::strerror(soError)};
                ::close(fd);
                continue;
            }
        }
        server_fd = fd;
    }
    freeaddrinfo(res);

    if (server_fd == -1) return last;

    int one = 1;
    setsockopt(server_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return {};
}

rpcStatus secureChannelClient::handshake(const callContext& callCtx) {
    ssl = SSL_new(ctx);
    if (!ssl) {
        return {statusCode::Internal, "failed to create SSL structure: " + openSSLErrors()};
    }
    SSL_set_fd(ssl, server_fd);

    for (;;) {
        int ret = SSL_connect(ssl);
        if (ret == 1) break;
        int sslError = SSL_get_error(ssl, ret);
        short events = 0;
        if (sslError == SSL_ERROR_WANT_READ) events = POLLIN;
        else if (sslError == SSL_ERROR_WANT_WRITE) events = POLLOUT;
        if (events == 0) {
            return {statusCode::Unavailable,
                    "SSL handshake failed (error: " + std::to_string(sslError) + ") " + openSSLErrors()};
        }
        rpcStatus ready = waitForSocket(server_fd, events, callCtx);
        if (!ready.ok()) return ready;
    }

    long verifyResult = SSL_get_verify_result(ssl);
    if (verifyResult != X509_V_OK) {
        return {statusCode::Unavailable,
                std::string("certificate verification failed: ") + X509_verify_cert_error_string(verifyResult)};
    }
    return {};
}

rpcStatus secureChannelClient::sendData(const std::string& data, const callContext& callCtx) {
    size_t offset = 0;
    while (offset < data.size()) {
        const char* chunk = data.data() + offset;
        size_t left = data.size() - offset;
        short events = 0;
        ssize_t written = 0;

        if (ssl) {
            int n = SSL_write(ssl, chunk, static_cast<int>(left));
            if (n <= 0) {
                int sslError = SSL_get_error(ssl, n);
                if (sslError == SSL_ERROR_WANT_READ) events = POLLIN;
                else if (sslError == SSL_ERROR_WANT_WRITE) events = POLLOUT;
                else return {statusCode::Unavailable,
                             "SSL_write failed (error: " + std::to_string(sslError) + ") " + openSSLErrors()};
            }
            written = n;
        } else {
            written = ::send(server_fd, chunk, left, MSG_NOSIGNAL);
            if (written < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    return {statusCode::Unavailable, std::string("send: ") + std::strerror(errno)};
                }
                events = POLLOUT;
            }
        }

        if (events != 0) {
            rpcStatus ready = waitForSocket(server_fd, events, callCtx);
            if (!ready.ok()) return ready;
            continue;
        }
        offset += static_cast<size_t>(written);
    }
    return {};
}

rpcStatus secureChannelClient::receiveData(size_t length, std::string& out, const callContext& callCtx) {
    out.assign(length, '\0');
    size_t offset = 0;
    while (offset < length) {
        char* chunk = &out[offset];
        size_t left = length - offset;
        short events = 0;
        ssize_t got = 0;

        if (ssl) {
            int n = SSL_read(ssl, chunk, static_cast<int>(left));
            if (n <= 0) {
                int sslError = SSL_get_error(ssl, n);
                if (sslError == SSL_ERROR_WANT_READ) events = POLLIN;
                else if (sslError == SSL_ERROR_WANT_WRITE) events = POLLOUT;
                else if (sslError == SSL_ERROR_ZERO_RETURN) return {statusCode::Unavailable, "connection closed by peer"};
                else return {statusCode::Unavailable,
                             "SSL_read failed (error: " + std::to_string(sslError) + ") " + openSSLErrors()};
            }
            got = n;
        } else {
            got = ::recv(server_fd, chunk, left, 0);
            if (got == 0) return {statusCode::Unavailable, "connection closed by peer"};
            if (got < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    return {statusCode::Unavailable, std::string("recv: ") + std::strerror(errno)};
                }
                events = POLLIN;
            }
        }

        if (events != 0) {
            rpcStatus ready = waitForSocket(server_fd, events, callCtx);
            if (!ready.ok()) return ready;
            continue;
        }
        offset += static_cast<size_t>(got);
    }
    return {};
}

rpcStatus secureChannelClient::call(const std::string& method, const nlohmann::json& request,
                                    nlohmann::json& response, const callContext& callCtx) {
    // Another call may hold the link; keep honouring our own context meanwhile
    std::unique_lock<std::timed_mutex> lock(callMutex, std::defer_lock);
    while (!lock.try_lock_for(LOCK_SLICE)) {
        rpcStatus waited = callCtx.status();
        if (!waited.ok()) return waited;
    }
    if (closed || address.empty()) return {statusCode::Unavailable, "channel closed"};

    rpcStatus st = callCtx.status();
    if (!st.ok()) return st;

    sigpipeGuard noSigpipe;

    // A link dropped by an earlier failure is re-dialled here
    if (server_fd == -1) {
        st = dial(callCtx);
        if (!st.ok()) return st;
    }

    uint64_t id = ++nextId;
    st = sendData(encodeFrame(encodeRequest(method, id, request, callCtx)), callCtx);
    if (!st.ok()) {
        dropConnection();
        return st;
    }

    std::string header;
    st = receiveData(4, header, callCtx);
    if (!st.ok()) {
        dropConnection();
        return st;
    }
    uint32_t length = 0;
    if (!decodeFrameLength(reinterpret_cast<const unsigned char*>(header.data()), length)) {
        dropConnection();
        return {statusCode::ResourceExhausted, "response frame of " + std::to_string(length) + " bytes exceeds limit"};
    }

    std::string payload;
    st = receiveData(length, payload, callCtx);
    if (!st.ok()) {
        dropConnection();
        return st;
    }

    st = decodeResponse(payload, id, response);
    if (st.code == statusCode::Internal) {
        std::cerr << "[Channel] " << method << ": " << st.message << "\n";
        dropConnection();
    }
    return st;
}

void secureChannelClient::dropConnection() {
    if (ssl) {
        SSL_shutdown(ssl);
        SSL_free(ssl);
        ssl = nullptr;
    }
    if (server_fd != -1) {
        ::close(server_fd);
        server_fd = -1;
    }
}

void secureChannelClient::close() {
    std::lock_guard<std::timed_mutex> lock(callMutex);
    sigpipeGuard noSigpipe;
    dropConnection();
    closed = true;
}

channelDialer defaultDialer() {
    return [](const std::string& address, const tlsMaterial* material,
              const callContext& callCtx, clientError& err) -> std::unique_ptr<rpcChannel> {
        auto channel = std::make_unique<secureChannelClient>();
        if (material && !channel->initClientContext(*material, err)) {
            return nullptr;
        }
        if (!channel->connectToServer(address, callCtx, err)) {
            return nullptr;
        }
        return channel;
    };
}
