#pragma once

#include <cstddef>
#include <functional>
#include <string>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// What the server presented during the handshake.
struct HostKeyInfo {
    std::string host;
    int port = 0;
    std::string key_type;      // "ssh-ed25519", "ssh-rsa", ...
    std::string fingerprint;   // "SHA256:<base64>" (OpenSSH format)
};

// Host identity policy. Return false to abort the connection.
using HostKeyVerifier = std::function<bool(const HostKeyInfo&)>;

// Trust every host key. Insecure: logs the fingerprint and a warning.
bool accept_any_host_key(const HostKeyInfo& info);

// Read key type and SHA-256 fingerprint from a session after handshake.
HostKeyInfo read_host_key(LIBSSH2_SESSION* session, const std::string& host, int port);

// Unpadded base64, as used by OpenSSH fingerprints.
std::string base64_encode_unpadded(const unsigned char* data, size_t len);
