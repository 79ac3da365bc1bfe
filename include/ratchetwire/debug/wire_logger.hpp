#pragma once

/**
 * @file wire_logger.hpp
 * @brief Diagnostics for the wire codecs.
 *
 * RW_LOG_ERROR is always compiled in and writes one line to stderr.
 *
 * The byte dump macros write encoded and decoded messages to stdout and are
 * compiled in only with RATCHETWIRE_DEBUG_WIRE. Do not enable them in
 * production builds: dumps include MAC tags and signatures.
 *
 * Enable via CMake: -DRATCHETWIRE_DEBUG_WIRE=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace ratchetwire::debug {

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 64) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

}

#define RW_LOG_ERROR(component, message) \
    do { \
        fprintf(stderr, "[RW-ERROR] %s: %s\n", component, std::string(message).c_str()); \
    } while(0)

#ifdef RATCHETWIRE_DEBUG_WIRE

#define RW_LOG_BYTES(operation, name, data) \
    do { \
        fprintf(stdout, "[RW-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            ::ratchetwire::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define RW_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[RW-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#else

#define RW_LOG_BYTES(operation, name, data) do { } while(0)
#define RW_LOG_VALUE(operation, name, value) do { } while(0)

#endif
