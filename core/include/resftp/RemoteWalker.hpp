// Depth-first, pre-order traversal of a remote tree.
//
//   RemoteWalker w(session, "/reports");
//   while (w.step()) {
//       if (!w.error().ok()) { ... break; }
//       if (!w.info().is_dir) use(w.path());
//   }
#pragma once
#include "RemoteSession.hpp"
#include <string>
#include <vector>

namespace resftp {

class RemoteWalker {
public:
    RemoteWalker(RemoteSession &session, std::string root);

    // Advances to the next entry. Returns false once the walk is complete.
    // A failing lstat/readDir is reported through error() on the step of the
    // entry it belongs to.
    bool step();

    // Do not descend into the directory returned by the last step().
    void skipDir() { descend_ = false; }

    const std::string &path() const { return cur_.path; }
    const FileInfo &info() const { return cur_.info; }
    const Error &error() const { return cur_.err; }

private:
    struct Item {
        std::string path;
        FileInfo info;
        Error err;
    };

    RemoteSession &session_;
    std::vector<Item> stack_;
    Item cur_;
    bool descend_ = false;
};

} // namespace resftp
