#include "host_key.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>

static const char B64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode_unpadded(const unsigned char* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    for (size_t i = 0; i < len; i += 3) {
        unsigned val = data[i] << 16;
        if (i + 1 < len) val |= data[i + 1] << 8;
        if (i + 2 < len) val |= data[i + 2];
        out += B64_CHARS[(val >> 18) & 0x3F];
        out += B64_CHARS[(val >> 12) & 0x3F];
        if (i + 1 < len) out += B64_CHARS[(val >> 6) & 0x3F];
        if (i + 2 < len) out += B64_CHARS[val & 0x3F];
    }
    return out;
}

static std::string key_type_name(int type) {
    switch (type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:       return "ssh-rsa";
        case LIBSSH2_HOSTKEY_TYPE_DSS:       return "ssh-dss";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ecdsa-sha2-nistp256";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ecdsa-sha2-nistp384";
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ecdsa-sha2-nistp521";
        case LIBSSH2_HOSTKEY_TYPE_ED25519:   return "ssh-ed25519";
        default:                             return "unknown";
    }
}

HostKeyInfo read_host_key(LIBSSH2_SESSION* session, const std::string& host, int port) {
    HostKeyInfo info;
    info.host = host;
    info.port = port;

    size_t key_len = 0;
    int key_type = LIBSSH2_HOSTKEY_TYPE_UNKNOWN;
    if (libssh2_session_hostkey(session, &key_len, &key_type)) {
        info.key_type = key_type_name(key_type);
    } else {
        info.key_type = "unknown";
    }

    const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash) {
        info.fingerprint = "SHA256:" + base64_encode_unpadded(
            reinterpret_cast<const unsigned char*>(hash), 32);
    }
    return info;
}

bool accept_any_host_key(const HostKeyInfo& info) {
    bssh_log(fmt::format("WARNING: accepting unverified host key for {}:{} ({} {})",
                         info.host, info.port, info.key_type, info.fingerprint));
    return true;
}
