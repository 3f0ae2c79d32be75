#include "copy_ngin/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace copy_ngin {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    const std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot create directory " + path.parent_path().string() +
                                        ": " + ec.message(),
                                    "ConfigBase");
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath, "ConfigBase");
    }
    try {
        file << std::setw(4) << to_json() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Cannot serialize config: ") + e.what(), "ConfigBase");
    }
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Write failed: " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }

    try {
        nlohmann::json j;
        file >> j;
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Error parsing " + filepath + ": " + e.what(), "ConfigBase");
    }

    return validate();
}

}  // namespace copy_ngin
