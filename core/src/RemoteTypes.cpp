#include "resftp/RemoteTypes.hpp"

namespace resftp {

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Connect:
        return "Connect";
    case ErrorKind::Trust:
        return "Trust";
    case ErrorKind::Transport:
        return "Transport";
    case ErrorKind::TransportLost:
        return "TransportLost";
    case ErrorKind::LocalIO:
        return "LocalIO";
    case ErrorKind::Canceled:
        return "Canceled";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

CancelCheck cancelAfter(std::chrono::steady_clock::duration timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    return [deadline]() { return std::chrono::steady_clock::now() >= deadline; };
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return name;
    if (name.empty())
        return base;
    const bool baseSlash = base.back() == '/';
    const bool nameSlash = name.front() == '/';
    if (baseSlash && nameSlash)
        return base + name.substr(1);
    if (baseSlash || nameSlash)
        return base + name;
    return base + "/" + name;
}

std::vector<std::string> remoteAncestors(const std::string &remote_path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= remote_path.size()) {
        std::size_t slash = remote_path.find('/', start);
        if (slash == std::string::npos)
            slash = remote_path.size();
        std::string seg = remote_path.substr(start, slash - start);
        if (!seg.empty() && seg != ".")
            segments.push_back(std::move(seg));
        start = slash + 1;
    }
    // The last segment names the file itself.
    if (!segments.empty())
        segments.pop_back();

    std::vector<std::string> out;
    out.reserve(segments.size());
    std::string cur = (!remote_path.empty() && remote_path.front() == '/')
                          ? std::string("/")
                          : std::string();
    for (const auto &seg : segments) {
        cur = joinRemotePath(cur, seg);
        out.push_back(cur);
    }
    return out;
}

} // namespace resftp
