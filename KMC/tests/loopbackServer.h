#pragma once
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <openssl/ssl.h>
#include <nlohmann/json.hpp>
#include "Protocol/tlsMaterial.h"
#include "Protocol/wireCodec.h"

// Plain-TCP test server speaking the framed JSON protocol on 127.0.0.1.
// The responder returns {"status", "message", "body"}; the id is filled in.
class loopbackServer {
public:
    using responder = std::function<nlohmann::json(const std::string& method, const nlohmann::json& body)>;

    explicit loopbackServer(responder respond)
        : respond(std::move(respond)), listen_fd(-1), boundPort(0), stopping(false), accepted(0) {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            listen(listen_fd, 5) == 0) {
            socklen_t len = sizeof(addr);
            getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len);
            boundPort = ntohs(addr.sin_port);
        }
        worker = std::thread([this] { run(); });
    }

    ~loopbackServer() {
        stopping = true;
        if (worker.joinable()) worker.join();
        if (listen_fd >= 0) ::close(listen_fd);
    }

    std::string address() const { return "127.0.0.1:" + std::to_string(boundPort); }
    int connections() const { return accepted.load(); }

private:
    responder respond;
    int listen_fd;
    int boundPort;
    std::atomic<bool> stopping;
    std::atomic<int> accepted;
    std::thread worker;

    bool waitReadable(int fd) {
        while (!stopping) {
            pollfd pfd{fd, POLLIN, 0};
            int rc = poll(&pfd, 1, 50);
            if (rc > 0) return true;
            if (rc < 0) return false;
        }
        return false;
    }

    bool readExact(int fd, std::string& out, size_t length) {
        out.assign(length, '\0');
        size_t offset = 0;
        while (offset < length) {
            if (!waitReadable(fd)) return false;
            ssize_t n = ::recv(fd, &out[offset], length - offset, 0);
            if (n <= 0) return false;
            offset += static_cast<size_t>(n);
        }
        return true;
    }

    void serve(int fd) {
        for (;;) {
            std::string header;
            if (!readExact(fd, header, 4)) return;
            uint32_t length = 0;
            if (!decodeFrameLength(reinterpret_cast<const unsigned char*>(header.data()), length)) return;
            std::string payload;
            if (!readExact(fd, payload, length)) return;

            nlohmann::json request = nlohmann::json::parse(payload);
            nlohmann::json response = respond(request.at("method").get<std::string>(),
                                               request.value("body", nlohmann::json::object()));
            response["id"] = request.at("id");
            std::string frame = encodeFrame(response.dump());
            if (::send(fd, frame.data(), frame.size(), MSG_NOSIGNAL) != static_cast<ssize_t>(frame.size())) return;
        }
    }

    void run() {
        while (!stopping) {
            if (!waitReadable(listen_fd)) continue;
            int fd = accept(listen_fd, nullptr, nullptr);
            if (fd < 0) continue;
            accepted++;
            serve(fd);
            ::close(fd);
        }
    }
};

// Mutual-TLS counterpart of loopbackServer. It presents `identity` and
// requires a client certificate issued as `trustedClientCert`.
class tlsLoopbackServer {
public:
    enum class behaviour {
        Serve,      // answer every frame through the responder
        ServeOnce,  // answer one frame, then close the connection
        HangUp,     // close right after the handshake
        Silent      // read frames, never answer
    };

    tlsLoopbackServer(const std::string& cert, const std::string& key, const std::string& trustedClientCert,
                      behaviour mode, loopbackServer::responder respond = nullptr)
        : respond(std::move(respond)), mode(mode), ctx(nullptr), listen_fd(-1), boundPort(0),
          stopping(false), accepted(0), handshakes(0) {
        ctx = SSL_CTX_new(TLS_server_method());
        X509* own = readCertificatePem(cert);
        EVP_PKEY* pkey = readPrivateKeyPem(key);
        X509* client = readCertificatePem(trustedClientCert);
        if (own) SSL_CTX_use_certificate(ctx, own);
        if (pkey) SSL_CTX_use_PrivateKey(ctx, pkey);
        if (client) X509_STORE_add_cert(SSL_CTX_get_cert_store(ctx), client);
        if (own) X509_free(own);
        if (pkey) EVP_PKEY_free(pkey);
        if (client) X509_free(client);
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);

        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        int opt = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            listen(listen_fd, 5) == 0) {
            socklen_t len = sizeof(addr);
            getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &len);
            boundPort = ntohs(addr.sin_port);
        }
        worker = std::thread([this] { run(); });
    }

    ~tlsLoopbackServer() {
        stopping = true;
        if (worker.joinable()) worker.join();
        if (listen_fd >= 0) ::close(listen_fd);
        SSL_CTX_free(ctx);
    }

    std::string address() const { return "127.0.0.1:" + std::to_string(boundPort); }
    int connections() const { return accepted.load(); }
    int completedHandshakes() const { return handshakes.load(); }

private:
    loopbackServer::responder respond;
    behaviour mode;
    SSL_CTX* ctx;
    int listen_fd;
    int boundPort;
    std::atomic<bool> stopping;
    std::atomic<int> accepted;
    std::atomic<int> handshakes;
    std::thread worker;

    bool waitReadable(int fd) {
        while (!stopping) {
            pollfd pfd{fd, POLLIN, 0};
            int rc = poll(&pfd, 1, 50);
            if (rc > 0) return true;
            if (rc < 0) return false;
        }
        return false;
    }

    bool readExact(SSL* ssl, int fd, std::string& out, size_t length) {
        out.assign(length, '\0');
        size_t offset = 0;
        while (offset < length) {
            if (SSL_pending(ssl) == 0 && !waitReadable(fd)) return false;
            int n = SSL_read(ssl, &out[offset], static_cast<int>(length - offset));
            if (n <= 0) return false;
            offset += static_cast<size_t>(n);
        }
        return true;
    }

    void serve(SSL* ssl, int fd) {
        if (mode == behaviour::HangUp) return;
        for (;;) {
            std::string header;
            if (!readExact(ssl, fd, header, 4)) return;
            uint32_t length = 0;
            if (!decodeFrameLength(reinterpret_cast<const unsigned char*>(header.data()), length)) return;
            std::string payload;
            if (!readExact(ssl, fd, payload, length)) return;
            if (mode == behaviour::Silent) continue;

            nlohmann::json request = nlohmann::json::parse(payload);
            nlohmann::json response = respond(request.at("method").get<std::string>(),
                                               request.value("body", nlohmann::json::object()));
            response["id"] = request.at("id");
            std::string frame = encodeFrame(response.dump());
            if (SSL_write(ssl, frame.data(), static_cast<int>(frame.size())) <= 0) return;
            if (mode == behaviour::ServeOnce) return;
        }
    }

    void run() {
        // Clients under test may vanish mid-connection
        sigset_t pipeSet;
        sigemptyset(&pipeSet);
        sigaddset(&pipeSet, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &pipeSet, nullptr);

        while (!stopping) {
            if (!waitReadable(listen_fd)) continue;
            int fd = accept(listen_fd, nullptr, nullptr);
            if (fd < 0) continue;
            accepted++;
            timeval limit{5, 0};
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &limit, sizeof(limit));

            SSL* ssl = SSL_new(ctx);
            SSL_set_fd(ssl, fd);
            if (SSL_accept(ssl) == 1) {
                handshakes++;
                serve(ssl, fd);
                SSL_shutdown(ssl);
            }
            SSL_free(ssl);
            ::close(fd);
        }
    }
};
