#pragma once

#include <cstdint>
#include <string>

namespace crane {

// Reports when a file's modification time moves.
class ConfigWatcher {
public:
    explicit ConfigWatcher(std::string path);

    // True once per observed change; a missing file is not a change.
    bool changed();
    const std::string& path() const { return path_; }

private:
    static bool readMtime(const std::string& path, int64_t& mtime_ns);

    std::string path_;
    int64_t last_mtime_ns_{-1};
};

}  // namespace crane
