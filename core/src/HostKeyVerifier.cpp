#include "resftp/HostKeyVerifier.hpp"
#include "resftp/Logging.hpp"

#include <QByteArray>

#include <cstdint>

namespace resftp {

std::string hostKeyTypeFromBlob(const std::string &blob) {
    if (blob.size() < 4)
        return {};
    const auto *p = reinterpret_cast<const unsigned char *>(blob.data());
    const std::uint32_t len = (std::uint32_t(p[0]) << 24) |
                              (std::uint32_t(p[1]) << 16) |
                              (std::uint32_t(p[2]) << 8) | std::uint32_t(p[3]);
    if (len == 0 || len > blob.size() - 4)
        return {};
    return blob.substr(4, len);
}

std::string hostKeyFingerprint(const HostKey &key) {
    const QByteArray raw(key.blob.data(), static_cast<int>(key.blob.size()));
    return key.type + " " + raw.toBase64().toStdString();
}

HostKeyVerdict verifyHostKey(const std::string &trustedKey,
                             const HostKey &observed) {
    if (trustedKey.empty())
        return HostKeyVerdict::AcceptedUnpinned;
    return trustedKey == hostKeyFingerprint(observed)
               ? HostKeyVerdict::Accepted
               : HostKeyVerdict::Rejected;
}

std::string hostKeyMismatchMessage(const std::string &trustedKey,
                                   const HostKey &observed) {
    return "SSH-key verification: expected \"" + trustedKey + "\" but got \"" +
           hostKeyFingerprint(observed) + "\"";
}

bool acceptHostKey(const std::string &trustedKey, const HostKey &observed,
                   Error &err) {
    switch (verifyHostKey(trustedKey, observed)) {
    case HostKeyVerdict::Accepted:
        return true;
    case HostKeyVerdict::AcceptedUnpinned:
        qCWarning(rsSession).noquote()
            << "WARNING: SSH-key verification is *NOT* in effect: to fix, "
               "add this trusted key:"
            << QStringLiteral("\"%1\"").arg(qs(hostKeyFingerprint(observed)));
        return true;
    case HostKeyVerdict::Rejected:
        err.set(ErrorKind::Trust, hostKeyMismatchMessage(trustedKey, observed));
        return false;
    }
    return false;
}

} // namespace resftp
