#include "resftp/RemoteSession.hpp"

#include <memory>

namespace resftp {

bool readAll(RemoteFile &file, std::string &out, Error &err,
             const CancelCheck &shouldCancel) {
    const std::size_t CHUNK = 64 * 1024;
    std::unique_ptr<char[]> buf(new char[CHUNK]);
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorKind::Canceled, "read canceled: " + file.path());
            return false;
        }
        const long long n = file.read(buf.get(), CHUNK, err);
        if (n < 0)
            return false;
        if (n == 0)
            return true;
        out.append(buf.get(), static_cast<std::size_t>(n));
    }
}

} // namespace resftp
