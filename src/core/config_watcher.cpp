#include "core/config_watcher.hpp"

#include <utility>

#ifdef __linux__
#include <sys/stat.h>
#endif

namespace crane {

ConfigWatcher::ConfigWatcher(std::string path) : path_(std::move(path)) {
    (void)readMtime(path_, last_mtime_ns_);
}

bool ConfigWatcher::readMtime(const std::string& path, int64_t& mtime_ns) {
#ifdef __linux__
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + static_cast<int64_t>(st.st_mtim.tv_nsec);
    return true;
#else
    (void)path;
    (void)mtime_ns;
    return false;
#endif
}

bool ConfigWatcher::changed() {
    int64_t mtime_ns = 0;
    if (!readMtime(path_, mtime_ns) || mtime_ns == last_mtime_ns_) {
        return false;
    }
    last_mtime_ns_ = mtime_ns;
    return true;
}

}  // namespace crane
