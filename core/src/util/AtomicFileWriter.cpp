#include "leaguesched/core/util/AtomicFileWriter.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace leaguesched::core::util {

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents, std::string* error) {
    const std::filesystem::path target(path);
    std::error_code ec;
    if (!target.parent_path().empty()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            if (error) {
                *error = "Failed to create directory " + target.parent_path().string() + ": " + ec.message();
            }
            return false;
        }
    }

    const std::string temp_path = path + ".tmp";
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            if (error) {
                *error = "Failed to open temp file: " + temp_path;
            }
            return false;
        }
        output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        output.flush();
        if (!output) {
            if (error) {
                *error = "Failed to write temp file: " + temp_path;
            }
            return false;
        }
    }

    std::filesystem::rename(temp_path, target, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        if (error) {
            *error = "Failed to replace " + path;
        }
        return false;
    }
    return true;
}

}  // namespace leaguesched::core::util
