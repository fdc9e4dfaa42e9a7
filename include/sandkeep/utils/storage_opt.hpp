/**
 * @file storage_opt.hpp
 * @brief Conversions for the engine's per-container storage quota option
 *
 * Quotas are exchanged with the engine through `HostConfig.StorageOpt["size"]`.
 * Values written by this project are plain byte counts; values written by
 * other tooling may carry binary unit suffixes (`10G`, `512m`, `1.5GiB`).
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace sandkeep {
namespace utils {

/// Key of the size quota inside StorageOpt
inline constexpr const char* kStorageOptSizeKey = "size";

/// Bytes per GB (binary, as the engine interprets size suffixes)
inline constexpr double kBytesPerGB = 1024.0 * 1024.0 * 1024.0;

/**
 * @class StorageOptError
 * @brief Thrown when a StorageOpt size value cannot be parsed
 */
class StorageOptError : public std::invalid_argument {
public:
    explicit StorageOptError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Parse a size string into bytes
 * @param value Byte count with optional k/m/g/t suffix (optionally followed by i and/or b)
 * @throws StorageOptError on malformed input or a size beyond int64 range
 */
std::int64_t ParseSizeBytes(const std::string& value);

/**
 * @brief Read the configured quota from a StorageOpt map, in GB
 * @return 0 if the map has no size entry
 * @throws StorageOptError if the size entry is malformed
 */
double ParseStorageOptSizeGB(const std::map<std::string, std::string>& storage_opt);

/**
 * @brief Convert GB to a byte count, truncating toward zero
 * @throws StorageOptError if the byte count does not fit in int64
 */
std::int64_t GBToBytes(double gb);

double BytesToGB(std::int64_t bytes);

} // namespace utils
} // namespace sandkeep
