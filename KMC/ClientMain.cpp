#include "Client/client.h"
#include "Models/constants.h"
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

static std::string toHex(const std::string& bytes) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char b : bytes) ss << std::setw(2) << static_cast<int>(b);
    return ss.str();
}

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <config-server-addr> [app-id] [message]\n"
              << "  config-server-addr  host:port of the configuration service (default localhost:50052)\n"
              << "  app-id              application whose registered key signs the message\n"
              << "  message             text to sign\n";
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        usage(argv[0]);
        return 0;
    }
    std::string configServerAddr = argc > 1 ? argv[1] : "localhost:50052";
    std::string appId = argc > 2 ? argv[2] : "secure-messaging-app";
    std::string message = argc > 3 ? argv[3] : "Hello from AppID Service!";

    // Writes to a peer that went away must surface as errors, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "[CLIENT] Starting client against config server " << configServerAddr << "...\n";
    client myClient(configServerAddr);

    clientError err;
    if (!myClient.init(err)) {
        std::cerr << "[CLIENT] Client initialization failed: " << err.describe() << "\n";
        return 1;
    }

    std::cout << "\n1. Get public key by app ID\n";
    clientError keyErr;
    std::optional<appPublicKey> key = myClient.getPublicKeyByAppId(appId, keyErr);
    if (!key) {
        std::cerr << "[CLIENT] Failed to get public key by app ID: " << keyErr.describe() << "\n";
    } else {
        std::cout << "Public key for app ID " << appId << ":\n"
                  << "  - Protocol: " << key->protocol << "\n"
                  << "  - Curve: " << key->curve << "\n"
                  << "  - Public Key: " << key->publicKey << "\n";
    }

    std::cout << "\n2. Sign message with app ID\n";
    clientError signErr;
    std::optional<std::string> signature = myClient.signWithAppId(message, appId, signErr);
    if (!signature) {
        std::cerr << "[CLIENT] Signing with app ID failed: " << signErr.describe() << "\n";
        myClient.close();
        return 1;
    }

    std::cout << "Signing with app ID successful!\n"
              << "Message: " << message << "\n"
              << "Signature: " << toHex(*signature) << "\n";

    myClient.close();
    return 0;
}
