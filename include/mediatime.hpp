#pragma once

/**
 * @file mediatime.hpp
 * @brief Convenience header for the core time types
 *
 * Wall clock (nanoseconds since the Unix epoch):
 * - Instant: absolute time, checked arithmetic with Span
 * - Span: signed nanosecond interval
 *
 * Codec clock (90 kHz ticks since the Unix epoch):
 * - CodecInstant: absolute time used for H264 sample timestamps
 * - CodecSpan: signed tick interval with checked add/sub/mul/div/rem
 *
 * Conversion:
 * - rescale(), checked_rescale(), checked_rescale_to_nanoseconds()
 *
 * Formatting for logs lives in mediatime/format.hpp (requires fmt).
 * Frame timing utilities live in mediatime/mediatime_utils.hpp.
 */

#include "mediatime/clock.hpp"
#include "mediatime/conversion_error.hpp"
#include "mediatime/expected.hpp"
#include "mediatime/instant.hpp"
#include "mediatime/rescale.hpp"
#include "mediatime/span.hpp"
