#include "resftp/RemoteWalker.hpp"

#include <algorithm>

namespace resftp {

RemoteWalker::RemoteWalker(RemoteSession &session, std::string root)
    : session_(session) {
    Item first;
    first.path = std::move(root);
    session_.lstat(first.path, first.info, first.err);
    stack_.push_back(std::move(first));
}

bool RemoteWalker::step() {
    if (descend_ && cur_.err.ok() && cur_.info.is_dir) {
        std::vector<FileInfo> entries;
        Error err;
        if (!session_.readDir(cur_.path, entries, err)) {
            // Report the failure on the directory itself.
            cur_.err = std::move(err);
            stack_.push_back(cur_);
        } else {
            std::sort(entries.begin(), entries.end(),
                      [](const FileInfo &a, const FileInfo &b) {
                          return a.name < b.name;
                      });
            for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
                Item child;
                child.path = joinRemotePath(cur_.path, it->name);
                child.info = *it;
                stack_.push_back(std::move(child));
            }
        }
    }
    if (stack_.empty())
        return false;
    cur_ = std::move(stack_.back());
    stack_.pop_back();
    descend_ = true;
    return true;
}

} // namespace resftp
