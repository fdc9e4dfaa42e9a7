/**
 * @file storage_opt.cpp
 * @brief Implementation of StorageOpt size conversions
 *
 * @date 2025
 */

#include "sandkeep/utils/storage_opt.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace sandkeep {
namespace utils {

namespace {

// 2^63; every double at or above it overflows int64
constexpr double kInt64Limit = 9223372036854775808.0;

std::int64_t ToByteCount(double bytes, const std::string& source) {
    if (!(bytes < kInt64Limit) || bytes < 0.0) {
        throw StorageOptError("size out of range: " + source);
    }
    return static_cast<std::int64_t>(bytes);
}

} // anonymous namespace

std::int64_t ParseSizeBytes(const std::string& value) {
    std::string trimmed = StringUtils::Trim(value);
    if (trimmed.empty()) {
        throw StorageOptError("empty size value");
    }

    // Split numeric prefix from unit suffix
    std::size_t pos = 0;
    while (pos < trimmed.size() &&
           (std::isdigit(static_cast<unsigned char>(trimmed[pos])) || trimmed[pos] == '.')) {
        ++pos;
    }

    std::string number = trimmed.substr(0, pos);
    std::string unit = StringUtils::ToLower(StringUtils::Trim(trimmed.substr(pos)));

    if (number.empty() || number == ".") {
        throw StorageOptError("invalid size value: " + value);
    }

    char* end = nullptr;
    double amount = std::strtod(number.c_str(), &end);
    if (end == nullptr || *end != '\0' || !std::isfinite(amount)) {
        throw StorageOptError("invalid size value: " + value);
    }

    double multiplier = 1.0;
    if (!unit.empty()) {
        switch (unit[0]) {
            case 'b': multiplier = 1.0; break;
            case 'k': multiplier = 1024.0; break;
            case 'm': multiplier = 1024.0 * 1024.0; break;
            case 'g': multiplier = kBytesPerGB; break;
            case 't': multiplier = kBytesPerGB * 1024.0; break;
            default:
                throw StorageOptError("unknown size unit in: " + value);
        }

        // Accept "g", "gb", "gi", "gib" (and "b" alone)
        std::string rest = unit.substr(1);
        if (unit[0] == 'b' ? !rest.empty()
                           : !(rest.empty() || rest == "b" || rest == "i" || rest == "ib")) {
            throw StorageOptError("unknown size unit in: " + value);
        }
    }

    return ToByteCount(amount * multiplier, value);
}

double ParseStorageOptSizeGB(const std::map<std::string, std::string>& storage_opt) {
    auto it = storage_opt.find(kStorageOptSizeKey);
    if (it == storage_opt.end()) {
        return 0.0;
    }
    return BytesToGB(ParseSizeBytes(it->second));
}

std::int64_t GBToBytes(double gb) {
    return ToByteCount(gb * kBytesPerGB, std::to_string(gb) + " GB");
}

double BytesToGB(std::int64_t bytes) {
    return static_cast<double>(bytes) / kBytesPerGB;
}

} // namespace utils
} // namespace sandkeep
