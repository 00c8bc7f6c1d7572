/**
 * @file ISmartBackend.hpp
 * @brief Interface of the SMART data source
 */

#pragma once

#include "models/DiskType.hpp"
#include "models/SmartData.hpp"
#include "util/Result.hpp"

#include <expected>
#include <string>

namespace diskinfo {

/**
 * @struct SmartQuery
 * @brief Parameters of one SMART read
 */
struct SmartQuery {
    std::string device_path;           ///< e.g. /dev/sda
    DiskType type = DiskType::HDD;     ///< Selects the attribute shape to parse
    bool check_standby = true;         ///< Do not wake a sleeping device
};

/**
 * @class ISmartBackend
 * @brief Abstract SMART data source
 *
 * Failures use SMART_UNAVAILABLE (backend missing, permission denied, device
 * not openable) or SMART_PARSE (output not understood).
 */
class ISmartBackend {
public:
    virtual ~ISmartBackend() = default;

    /**
     * @brief Read SMART data of a device
     * @param query Device and standby policy
     * @return Report, or a SMART_* error
     */
    [[nodiscard]] virtual auto read(const SmartQuery& query)
        -> std::expected<SmartReport, util::Error> = 0;
};

}  // namespace diskinfo
