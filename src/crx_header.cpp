#include "crx_header.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>

namespace {
    constexpr size_t MAGIC_SIZE = 4;
    constexpr size_t VERSION_OFFSET = 4;
    constexpr size_t CRX2_FIXED_SIZE = 16;
    constexpr size_t CRX3_FIXED_SIZE = 12;

    uint32_t read_u32_le(std::span<const uint8_t> buffer, size_t offset) {
        if (buffer.size() < offset + 4) {
            throw FormatError(string_format("error.crx_truncated", buffer.size(), offset + 4));
        }
        return static_cast<uint32_t>(buffer[offset]) |
               (static_cast<uint32_t>(buffer[offset + 1]) << 8) |
               (static_cast<uint32_t>(buffer[offset + 2]) << 16) |
               (static_cast<uint32_t>(buffer[offset + 3]) << 24);
    }

    // Lengths come straight from the file; sum in 64 bits so they cannot wrap.
    size_t checked_offset(uint64_t offset, std::span<const uint8_t> buffer) {
        if (offset > buffer.size()) {
            throw FormatError(string_format("error.crx_offset_out_of_range", offset, buffer.size()));
        }
        return static_cast<size_t>(offset);
    }

    CrxVersion to_crx_version(uint32_t raw) {
        switch (raw) {
            case static_cast<uint32_t>(CrxVersion::V2):
                return CrxVersion::V2;
            case static_cast<uint32_t>(CrxVersion::V3):
                return CrxVersion::V3;
        }
        throw UnsupportedVersionError(string_format("error.crx_unsupported_version", raw), raw);
    }
}

CrxHeader parse_crx_header(std::span<const uint8_t> buffer) {
    if (buffer.size() < MAGIC_SIZE ||
        !std::equal(CRX_MAGIC.begin(), CRX_MAGIC.end(), buffer.begin(),
                    [](char expected, uint8_t actual) { return static_cast<uint8_t>(expected) == actual; })) {
        throw FormatError(get_string("error.crx_bad_magic"));
    }

    CrxHeader header;
    header.version = to_crx_version(read_u32_le(buffer, VERSION_OFFSET));

    switch (header.version) {
        case CrxVersion::V2:
            header.public_key_length = read_u32_le(buffer, 8);
            header.signature_length = read_u32_le(buffer, 12);
            header.archive_offset = checked_offset(
                CRX2_FIXED_SIZE + static_cast<uint64_t>(header.public_key_length) + header.signature_length, buffer);
            break;
        case CrxVersion::V3:
            header.header_size = read_u32_le(buffer, 8);
            header.archive_offset = checked_offset(CRX3_FIXED_SIZE + static_cast<uint64_t>(header.header_size), buffer);
            break;
    }
    return header;
}

size_t compute_archive_offset(std::span<const uint8_t> buffer) {
    return parse_crx_header(buffer).archive_offset;
}
