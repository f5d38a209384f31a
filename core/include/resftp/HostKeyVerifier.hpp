// Host key pinning: compares the server key against an operator-configured
// "<key-type> <base64>" string.
#pragma once
#include "RemoteTypes.hpp"
#include <string>

namespace resftp {

struct HostKey {
    std::string type; // e.g. "ssh-ed25519"
    std::string blob; // SSH wire encoding of the public key
};

enum class HostKeyVerdict {
    Accepted,         // matches the pinned key
    AcceptedUnpinned, // nothing pinned; caller must warn with the fingerprint
    Rejected          // pinned key differs
};

// Reads the algorithm name embedded at the start of a key blob. Returns an
// empty string when the blob is malformed.
std::string hostKeyTypeFromBlob(const std::string &blob);

// "<type> <base64(blob)>", the format accepted as a trusted key.
std::string hostKeyFingerprint(const HostKey &key);

HostKeyVerdict verifyHostKey(const std::string &trustedKey,
                             const HostKey &observed);

// Message used for a Rejected verdict.
std::string hostKeyMismatchMessage(const std::string &trustedKey,
                                   const HostKey &observed);

// Applies the verdict for a connect attempt: logs the insecure-default
// warning with the observed fingerprint, or fills a Trust error.
bool acceptHostKey(const std::string &trustedKey, const HostKey &observed,
                   Error &err);

} // namespace resftp
