#include "ojudge/workspace.hpp"
#include <glog/logging.h>
#include <system_error>
#include "ojudge/common/exceptions.hpp"
#include "ojudge/common/io_utils.hpp"
#include "ojudge/common/utils.hpp"

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;

static void restore_permissions(const fs::path &dir) noexcept {
    error_code ec;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        error_code ignored;
        if (it->is_directory(ignored) && !it->is_symlink(ignored))
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ignored);
    }
}

workspace workspace::create(const fs::path &root, const string &task_id) {
    try {
        assert_safe_path(task_id);
    } catch (invalid_argument &e) {
        throw workspace_allocation_error("invalid task id: " + string(e.what()));
    }

    error_code ec;
    // 命令在工作目录中执行，传给命令的路径必须是绝对路径
    fs::path base = fs::absolute(root, ec);
    if (ec)
        throw workspace_allocation_error("unable to resolve scratch directory " + root.string() + ": " + ec.message());

    fs::create_directories(base, ec);
    if (ec)
        throw workspace_allocation_error("unable to create scratch directory " + base.string() + ": " + ec.message());

    fs::path dir = base / (task_id + "-" + random_uuid());
    // create_directory 在目录已存在时返回 false，这样不会复用其他任务的工作目录
    if (!fs::create_directory(dir, ec)) {
        if (ec)
            throw workspace_allocation_error("unable to create workspace " + dir.string() + ": " + ec.message());
        throw workspace_allocation_error("workspace " + dir.string() + " already exists");
    }

    fs::permissions(dir, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec, ec);
    if (ec) LOG(WARNING) << "Unable to set permissions of workspace " << dir << ": " << ec.message();

    DLOG(INFO) << "Allocated workspace " << dir;
    return workspace(dir);
}

workspace::workspace(fs::path dir) : dir(move(dir)) {}

workspace::workspace(workspace &&other) noexcept
    : dir(move(other.dir)), released(other.released) {
    other.released = true;
}

workspace::~workspace() {
    destroy();
}

const fs::path &workspace::path() const {
    return dir;
}

fs::path workspace::write_source(const language_profile &profile, const string &code) const {
    if (released)
        throw internal_error("workspace " + dir.string() + " has been destroyed");
    fs::path source = dir / profile.source_file();
    write_file_content(source, code);
    return source;
}

bool workspace::destroy() noexcept {
    if (released) return false;
    released = true;

    error_code ec;
    auto removed = fs::remove_all(dir, ec);
    if (ec) {
        // 用户程序可能去掉了自己创建的目录的写权限，恢复权限后再试一次
        restore_permissions(dir);
        ec.clear();
        removed = fs::remove_all(dir, ec);
    }
    if (ec) {
        LOG(ERROR) << "Unable to delete workspace " << dir << ": " << ec.message();
    } else {
        DLOG(INFO) << "Deleted workspace " << dir << " (" << removed << " files)";
    }
    return true;
}

bool workspace::destroyed() const {
    return released;
}

}  // namespace ojudge
