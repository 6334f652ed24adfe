#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/*
 * CRX container layout (all integers little-endian u32):
 *
 *   CRX2: "Cr24" | version=2 | public key length | signature length | key | signature | zip
 *   CRX3: "Cr24" | version=3 | header size | protobuf header | zip
 */

inline constexpr std::string_view CRX_MAGIC = "Cr24";

enum class CrxVersion : uint32_t {
    V2 = 2,
    V3 = 3,
};

struct CrxHeader {
    CrxVersion version{};
    uint32_t public_key_length = 0; // V2 only
    uint32_t signature_length = 0;  // V2 only
    uint32_t header_size = 0;       // V3 only
    size_t archive_offset = 0;      // Start of the ZIP data, never past the end of the buffer
};

// Throws FormatError or UnsupportedVersionError.
CrxHeader parse_crx_header(std::span<const uint8_t> buffer);

// Offset of the embedded ZIP archive within a CRX buffer.
size_t compute_archive_offset(std::span<const uint8_t> buffer);
