#pragma once

#include <cstdint>

namespace mediatime {

/**
 * @brief Narrowing failure for tick counts written into fixed-width fields
 *
 * Codec containers store many timing fields as 32-bit integers. A tick count
 * that does not fit the field is reported with this type instead of being
 * truncated.
 */
struct ConversionError {
    enum class Kind : uint8_t {
        negative,    ///< Negative value for an unsigned target
        out_of_range ///< Magnitude exceeds the target width
    };

    Kind kind;
    int64_t value{0}; ///< Value that failed to convert

    /**
     * @brief Get human-readable error message
     */
    [[nodiscard]] const char* message() const noexcept {
        switch (kind) {
            case Kind::negative:
                return "Negative value for unsigned target";
            case Kind::out_of_range:
                return "Value out of range for target type";
        }
        return "Unknown conversion error";
    }

    constexpr bool operator==(const ConversionError&) const noexcept = default;
};

} // namespace mediatime
