#include <cassert>
#include <iostream>

#include "Protocol/secureChannelClient.h"
#include "Protocol/tlsMaterial.h"
#include "testCerts.h"

int main() {
    testIdentity node = makeTestIdentity("node-1001");
    testIdentity tee = makeTestIdentity("tee-node");
    assert(!node.cert.empty() && !node.key.empty());

    {
        tlsMaterial material;
        clientError err;
        assert(createTLSMaterial(node.cert, node.key, tee.cert, material, err));
        assert(!err.isSet());
        assert(material.cert == node.cert);
        assert(material.key == node.key);
        assert(material.trustedCert == tee.cert);

        secureChannelClient channel;
        assert(channel.initClientContext(material, err));
        assert(!channel.isConnected());
    }

    {
        tlsMaterial material;
        clientError err;
        assert(!createTLSMaterial("not a certificate", node.key, tee.cert, material, err));
        assert(err.kind == errorKind::Connection);
        assert(err.message == "failed to parse client certificate");
        assert(material.cert.empty());
    }

    {
        tlsMaterial material;
        clientError err;
        assert(!createTLSMaterial(node.cert, "not a key", tee.cert, material, err));
        assert(err.kind == errorKind::Connection);
        assert(err.message == "failed to parse client private key");
    }

    {
        // Key from another identity
        tlsMaterial material;
        clientError err;
        assert(!createTLSMaterial(node.cert, tee.key, tee.cert, material, err));
        assert(err.kind == errorKind::Connection);
        assert(err.message == "client private key does not match certificate");
    }

    {
        tlsMaterial material;
        clientError err;
        assert(!createTLSMaterial(node.cert, node.key, "", material, err));
        assert(err.kind == errorKind::Connection);
        assert(err.message == "failed to parse server certificate");
    }

    {
        secureChannelClient channel;
        clientError err;
        assert(!channel.initClientContext(tlsMaterial{node.cert, node.key, "garbage"}, err));
        assert(err.kind == errorKind::Connection);
    }

    {
        // Unparseable address fails before any socket is opened
        secureChannelClient channel;
        clientError err;
        assert(!channel.connectToServer("no-port-here", callContext::background(), err));
        assert(err.kind == errorKind::Connection);
        assert(err.status == statusCode::InvalidArgument);
        assert(!channel.isConnected());
    }

    std::cout << "TLS material tests: OK\n";
    return 0;
}
