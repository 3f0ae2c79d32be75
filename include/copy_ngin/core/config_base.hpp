// include/copy_ngin/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "copy_ngin/core/error.hpp"

namespace copy_ngin {

/**
 * @brief JSON-backed base for copier, backtest and logger settings
 *
 * Derived types read only the keys present in the document, so a partial
 * file overrides a subset of the defaults.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write the configuration as indented JSON
     *
     * Missing parent directories are created.
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read a JSON file, apply it and validate the result
     * @return FILE_NOT_FOUND, JSON_PARSE_ERROR, or the validate() error
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check value ranges after loading
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace copy_ngin
