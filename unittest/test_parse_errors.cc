//
// Parse failures of whole PNG streams and their error messages
//

#include <doctest/doctest.h>
#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngme;
using namespace test_bytes;

namespace {
    format_error parse_failure(const std::vector<std::byte>& bytes, const parse_options& options = {}) {
        try {
            (void)png::parse(bytes, options);
        } catch (const format_error& e) {
            return e;
        }
        FAIL("Should have thrown format_error");
        return format_error("unreachable");
    }
}

TEST_CASE("Signature errors") {
    SUBCASE("empty input") {
        auto e = parse_failure({});
        CHECK(e.reason() == format_error::kind::bad_signature);
    }

    SUBCASE("shorter than the signature") {
        auto bytes = signature();
        bytes.resize(7);
        CHECK(parse_failure(bytes).reason() == format_error::kind::bad_signature);
    }

    SUBCASE("wrong signature") {
        auto bytes = minimal_png();
        bytes[1] = std::byte{'p'};
        auto e = parse_failure(bytes);
        CHECK(e.reason() == format_error::kind::bad_signature);
        CHECK(std::string(e.what()).find("signature") != std::string::npos);
    }

    SUBCASE("chunk without signature") {
        auto bytes = chunk(chunk_types::IEND, std::vector<std::byte>{}).to_bytes();
        CHECK(parse_failure(bytes).reason() == format_error::kind::bad_signature);
    }
}

TEST_CASE("Chunk errors abort the whole parse") {
    SUBCASE("corrupted CRC in the middle") {
        auto bytes = minimal_png();
        // IHDR occupies 8..33, tEXt starts at 33; flip its last CRC byte
        std::size_t text_end = 8 + 25 + 12 + 13;
        bytes[text_end - 1] ^= std::byte{0x01};

        auto e = parse_failure(bytes);
        CHECK(e.reason() == format_error::kind::chunk);
        CHECK(e.chunk_reason() == malformed_chunk::kind::checksum_mismatch);
        CHECK(e.offset() == 33);

        std::string msg = e.what();
        CHECK(msg.find("offset 33") != std::string::npos);
        CHECK(msg.find("tEXt") != std::string::npos);
        CHECK(msg.find("checksum mismatch") != std::string::npos);
    }

    SUBCASE("invalid type code") {
        auto bytes = signature();
        auto bad = raw_chunk(0, "IE0D", "", 0);
        bytes.insert(bytes.end(), bad.begin(), bad.end());

        auto e = parse_failure(bytes);
        CHECK(e.chunk_reason() == malformed_chunk::kind::invalid_type);
        CHECK(e.offset() == 8);
    }

    SUBCASE("declared length past the end of the stream") {
        auto bytes = signature();
        auto text = raw_chunk(100, "teXt", "short", 0);
        bytes.insert(bytes.end(), text.begin(), text.end());

        auto e = parse_failure(bytes);
        CHECK(e.chunk_reason() == malformed_chunk::kind::length_mismatch);
    }

    SUBCASE("truncated final chunk") {
        auto bytes = minimal_png();
        bytes.resize(bytes.size() - 3);
        auto e = parse_failure(bytes);
        CHECK(e.reason() == format_error::kind::chunk);
        CHECK(e.chunk_reason() == malformed_chunk::kind::truncated);
    }

    SUBCASE("trailing garbage in strict mode") {
        auto bytes = minimal_png();
        append(bytes, "xyz");
        auto e = parse_failure(bytes);
        CHECK(e.chunk_reason() == malformed_chunk::kind::truncated);
        CHECK(e.offset() == minimal_png().size());
    }

    SUBCASE("chunk size limit") {
        parse_options opts;
        opts.max_chunk_size = 10;
        auto e = parse_failure(minimal_png(), opts);
        CHECK(e.chunk_reason() == malformed_chunk::kind::too_large);
        std::string msg = e.what();
        CHECK(msg.find("IHDR") != std::string::npos);
        CHECK(msg.find("13") != std::string::npos);
        CHECK(msg.find("10") != std::string::npos);
    }

    SUBCASE("errors are pngme_errors") {
        auto bytes = minimal_png();
        bytes.back() ^= std::byte{0xFF};
        CHECK_THROWS_AS(png::parse(bytes), pngme_error);
    }
}

TEST_CASE("Stream loading errors") {
    SUBCASE("stream in bad state") {
        std::istringstream stream("");
        stream.setstate(std::ios::badbit);
        CHECK_THROWS_AS(png::load(stream), io_error);
    }

    SUBCASE("stream content is validated") {
        std::istringstream stream("not a png at all");
        CHECK_THROWS_AS(png::load(stream), format_error);
    }
}
