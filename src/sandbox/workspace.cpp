#include "sandbox/workspace.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"

namespace codebox::sandbox {
using namespace std;

workspace::workspace(const filesystem::path &scratch_root) {
    filesystem::create_directories(scratch_root);

    filesystem::path dir = scratch_root / ("codebox-" + random_uuid());
    if (!filesystem::create_directory(dir))
        throw filesystem::filesystem_error("workspace already exists", dir, make_error_code(errc::file_exists));
    root = dir;

    try {
        filesystem::permissions(root, filesystem::perms::owner_all);
        workdir = root / "workdir";
        filesystem::create_directory(workdir);
        filesystem::permissions(workdir, filesystem::perms::all);
    } catch (...) {
        // 构造失败时不会调用析构函数
        remove();
        throw;
    }
    VLOG(1) << "Created workspace " << workdir;
}

workspace::~workspace() {
    remove();
}

const filesystem::path &workspace::path() const {
    return workdir;
}

void workspace::remove() noexcept {
    if (root.empty()) return;

    error_code ec;
    filesystem::remove_all(root, ec);
    if (ec) {
        LOG(ERROR) << "Unable to remove workspace " << root << ": " << ec.message();
    } else {
        VLOG(1) << "Removed workspace " << root;
    }
    root.clear();
}

}  // namespace codebox::sandbox
