#pragma once

#include <string>

namespace leaguesched::core::util {

class AtomicFileWriter {
public:
    // Writes to `path`.tmp, then renames over `path`. Missing parent
    // directories are created.
    static bool Write(const std::string& path, const std::string& contents, std::string* error);
};

}  // namespace leaguesched::core::util
