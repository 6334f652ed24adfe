#include <gtest/gtest.h>
#include "crx_header.hpp"
#include "exception.hpp"
#include "crx_test_util.hpp"

#include <limits>

namespace {
    std::vector<uint8_t> zip_payload(size_t size) {
        std::vector<uint8_t> payload = {'P', 'K', 0x03, 0x04};
        std::vector<uint8_t> rest = filled_bytes(size, 0x11);
        payload.insert(payload.end(), rest.begin(), rest.end());
        return payload;
    }

    std::vector<uint8_t> with_version(uint32_t version) {
        std::vector<uint8_t> out = {'C', 'r', '2', '4'};
        append_u32_le(out, version);
        append_u32_le(out, 0);
        append_u32_le(out, 0);
        std::vector<uint8_t> payload = zip_payload(32);
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }
}

TEST(CrxHeaderTest, Crx2OffsetAndPayload) {
    const std::vector<std::pair<size_t, size_t>> sizes = {{0, 0}, {162, 128}, {294, 256}, {1, 4096}};
    for (const auto& [key_len, sig_len] : sizes) {
        std::vector<uint8_t> payload = zip_payload(500);
        std::vector<uint8_t> crx = make_crx2(filled_bytes(key_len, 0x30), filled_bytes(sig_len, 0x70), payload);

        size_t offset = compute_archive_offset(crx);
        EXPECT_EQ(offset, 16 + key_len + sig_len);
        EXPECT_EQ(std::vector<uint8_t>(crx.begin() + offset, crx.end()), payload);
    }
}

TEST(CrxHeaderTest, Crx3OffsetAndPayload) {
    for (size_t header_len : {size_t{0}, size_t{37}, size_t{1024}}) {
        std::vector<uint8_t> payload = zip_payload(777);
        std::vector<uint8_t> crx = make_crx3(filled_bytes(header_len, 0x42), payload);

        size_t offset = compute_archive_offset(crx);
        EXPECT_EQ(offset, 12 + header_len);
        EXPECT_EQ(std::vector<uint8_t>(crx.begin() + offset, crx.end()), payload);
    }
}

TEST(CrxHeaderTest, ParsedFields) {
    CrxHeader v2 = parse_crx_header(make_crx2(filled_bytes(10, 1), filled_bytes(20, 2), zip_payload(8)));
    EXPECT_EQ(v2.version, CrxVersion::V2);
    EXPECT_EQ(v2.public_key_length, 10u);
    EXPECT_EQ(v2.signature_length, 20u);
    EXPECT_EQ(v2.header_size, 0u);
    EXPECT_EQ(v2.archive_offset, 46u);

    CrxHeader v3 = parse_crx_header(make_crx3(filled_bytes(37, 3), zip_payload(8)));
    EXPECT_EQ(v3.version, CrxVersion::V3);
    EXPECT_EQ(v3.header_size, 37u);
    EXPECT_EQ(v3.public_key_length, 0u);
    EXPECT_EQ(v3.archive_offset, 49u);
}

TEST(CrxHeaderTest, EmptyArchiveAtEndOfBuffer) {
    std::vector<uint8_t> crx = make_crx3(filled_bytes(20, 9), {});
    EXPECT_EQ(compute_archive_offset(crx), crx.size());
}

TEST(CrxHeaderTest, BadMagic) {
    std::vector<uint8_t> crx = make_crx3(filled_bytes(37, 3), zip_payload(100));
    for (size_t i = 0; i < 4; ++i) {
        std::vector<uint8_t> broken = crx;
        broken[i] ^= 0x20;
        EXPECT_THROW(compute_archive_offset(broken), FormatError);
    }

    std::vector<uint8_t> zip = zip_payload(100);
    EXPECT_THROW(compute_archive_offset(zip), FormatError);
}

TEST(CrxHeaderTest, TooShortForMagic) {
    EXPECT_THROW(compute_archive_offset(std::vector<uint8_t>{}), FormatError);
    EXPECT_THROW(compute_archive_offset(std::vector<uint8_t>{'C', 'r', '2'}), FormatError);
}

TEST(CrxHeaderTest, TruncatedFixedHeader) {
    std::vector<uint8_t> magic_only = {'C', 'r', '2', '4'};
    EXPECT_THROW(compute_archive_offset(magic_only), FormatError);

    std::vector<uint8_t> v2 = make_crx2({}, {}, {});
    v2.resize(14);
    EXPECT_THROW(compute_archive_offset(v2), FormatError);

    std::vector<uint8_t> v3 = make_crx3({}, {});
    v3.resize(10);
    EXPECT_THROW(compute_archive_offset(v3), FormatError);
}

TEST(CrxHeaderTest, UnsupportedVersions) {
    for (uint32_t version : {0u, 1u, 4u, std::numeric_limits<uint32_t>::max()}) {
        try {
            compute_archive_offset(with_version(version));
            FAIL() << "version " << version << " was accepted";
        } catch (const UnsupportedVersionError& e) {
            EXPECT_EQ(e.version(), version);
        }
    }
}

TEST(CrxHeaderTest, Crx2LengthsPastEnd) {
    std::vector<uint8_t> crx = make_crx2(filled_bytes(16, 1), filled_bytes(16, 2), zip_payload(10));

    std::vector<uint8_t> key_too_long = crx;
    key_too_long[8] = 0xFF;
    EXPECT_THROW(compute_archive_offset(key_too_long), FormatError);

    std::vector<uint8_t> sig_too_long = crx;
    sig_too_long[13] = 0x10;
    EXPECT_THROW(compute_archive_offset(sig_too_long), FormatError);

    // Both at 0xFFFFFFFF would wrap a 32-bit sum.
    std::vector<uint8_t> huge = crx;
    std::fill(huge.begin() + 8, huge.begin() + 16, 0xFF);
    EXPECT_THROW(compute_archive_offset(huge), FormatError);
}

TEST(CrxHeaderTest, Crx3HeaderSizePastEnd) {
    std::vector<uint8_t> crx = make_crx3(filled_bytes(37, 3), zip_payload(10));
    size_t past_end = crx.size() - 12 + 1;
    crx[8] = static_cast<uint8_t>(past_end & 0xFF);
    crx[9] = static_cast<uint8_t>((past_end >> 8) & 0xFF);
    EXPECT_THROW(compute_archive_offset(crx), FormatError);

    std::fill(crx.begin() + 8, crx.begin() + 12, 0xFF);
    EXPECT_THROW(compute_archive_offset(crx), FormatError);
}

TEST(CrxHeaderTest, ErrorsShareBaseException) {
    EXPECT_THROW(compute_archive_offset(std::vector<uint8_t>{'x'}), CrxgetException);
    EXPECT_THROW(compute_archive_offset(with_version(7)), CrxgetException);
}
