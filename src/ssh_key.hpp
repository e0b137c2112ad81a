#pragma once
#include <cstdint>
#include <string>

namespace sshmcp {

enum class KeyFileKind { NotAKey, PublicKey, PrivateKey };

struct KeyInfo {
    KeyFileKind kind = KeyFileKind::NotAKey;
    std::string algorithm;    // wire name, e.g. "ssh-ed25519"; empty if unknown
    std::string type;         // short name: rsa, dsa, ecdsa, ed25519, ...
    uint32_t bits = 0;        // 0 when unknown
    std::string fingerprint;  // "SHA256:..." or empty when unknown
    std::string comment;      // public keys only
    std::string format;       // openssh, pem, pkcs8, putty, public
    bool encrypted = false;   // private keys only
};

// Classify a key file by name and content and extract what can be learned
// without a passphrase. Returns kind NotAKey for files that are neither.
// Throws std::invalid_argument when the file looks like a key but its body
// cannot be decoded.
KeyInfo inspect_key_file(const std::string& file_name, const std::string& contents);

// Parse one "algorithm base64 [comment]" public key line.
// Throws std::invalid_argument on malformed input.
KeyInfo parse_public_key_line(const std::string& line);

// Fill algorithm/type/bits/fingerprint from an SSH wire-format public key
// blob. Throws std::invalid_argument if the blob is truncated.
void describe_public_blob(const std::string& blob, KeyInfo& info);

// OpenSSH-style "SHA256:<unpadded base64>" fingerprint of a key blob
std::string sha256_fingerprint(const std::string& blob);

// Short type name for a wire algorithm name
std::string key_type_name(const std::string& algorithm);

} // namespace sshmcp
