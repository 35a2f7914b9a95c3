//
// Test the pngme command-line front end against temporary files
//

#include <doctest/doctest.h>
#include <pngme/png.hh>
#include <pngme/file_io.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "commands.hh"
#include "test_utils.hh"

using namespace pngme;
using namespace test_bytes;

namespace {
    struct run_result {
        int status;
        std::string out;
        std::string err;
    };

    run_result run_tool(std::vector<std::string> args) {
        std::vector<const char*> argv = {"pngme"};
        for (const auto& a : args) {
            argv.push_back(a.c_str());
        }
        std::ostringstream out;
        std::ostringstream err;
        int status = cli::execute(static_cast<int>(argv.size()), argv.data(), out, err);
        return {status, out.str(), err.str()};
    }
}

TEST_CASE("Command line parsing") {
    SUBCASE("encode") {
        const char* argv[] = {"pngme", "image.png", "encode", "-t", "ruSt", "hello world"};
        auto args = cli::parse_arguments(6, argv);
        CHECK(args.file == "image.png");
        CHECK(args.command == cli::command_kind::encode);
        REQUIRE(args.type.has_value());
        CHECK(args.type->to_string() == "ruSt");
        CHECK(args.message == "hello world");
        CHECK_FALSE(args.lenient);
    }

    SUBCASE("options may come first") {
        const char* argv[] = {"pngme", "--lenient", "-t", "ruSt", "image.png", "decode"};
        auto args = cli::parse_arguments(6, argv);
        CHECK(args.command == cli::command_kind::decode);
        CHECK(args.lenient);
    }

    SUBCASE("print needs no type") {
        const char* argv[] = {"pngme", "image.png", "print"};
        auto args = cli::parse_arguments(3, argv);
        CHECK(args.command == cli::command_kind::print);
        CHECK_FALSE(args.type.has_value());
    }

    SUBCASE("help") {
        const char* argv[] = {"pngme", "--help"};
        CHECK(cli::parse_arguments(2, argv).help);
    }

    SUBCASE("usage errors") {
        const char* missing_command[] = {"pngme", "image.png"};
        CHECK_THROWS_AS(cli::parse_arguments(2, missing_command), cli::usage_error);

        const char* unknown_command[] = {"pngme", "image.png", "hide"};
        CHECK_THROWS_AS(cli::parse_arguments(3, unknown_command), cli::usage_error);

        const char* missing_type[] = {"pngme", "image.png", "decode"};
        CHECK_THROWS_AS(cli::parse_arguments(3, missing_type), cli::usage_error);

        const char* dangling_t[] = {"pngme", "image.png", "decode", "-t"};
        CHECK_THROWS_AS(cli::parse_arguments(4, dangling_t), cli::usage_error);

        const char* missing_message[] = {"pngme", "image.png", "encode", "-t", "ruSt"};
        CHECK_THROWS_AS(cli::parse_arguments(5, missing_message), cli::usage_error);

        const char* extra[] = {"pngme", "image.png", "print", "more"};
        CHECK_THROWS_AS(cli::parse_arguments(4, extra), cli::usage_error);

        const char* unknown_option[] = {"pngme", "-x", "image.png", "print"};
        CHECK_THROWS_AS(cli::parse_arguments(4, unknown_option), cli::usage_error);
    }

    SUBCASE("-- ends option parsing") {
        const char* dash_message[] = {"pngme", "image.png", "encode", "-t", "ruSt", "--", "-note"};
        auto args = cli::parse_arguments(7, dash_message);
        CHECK(args.message == "-note");

        const char* help_message[] = {"pngme", "-t", "ruSt", "--", "image.png", "encode", "-h"};
        auto help = cli::parse_arguments(7, help_message);
        CHECK_FALSE(help.help);
        CHECK(help.message == "-h");

        const char* without_marker[] = {"pngme", "image.png", "encode", "-t", "ruSt", "-note"};
        CHECK_THROWS_AS(cli::parse_arguments(6, without_marker), cli::usage_error);
    }

    SUBCASE("print rejects a chunk type") {
        const char* argv[] = {"pngme", "image.png", "print", "-t", "ruSt"};
        CHECK_THROWS_AS(cli::parse_arguments(5, argv), cli::usage_error);
    }

    SUBCASE("invalid chunk type") {
        const char* argv[] = {"pngme", "image.png", "decode", "-t", "ru5t"};
        CHECK_THROWS_AS(cli::parse_arguments(5, argv), invalid_chunk_type);
    }
}

TEST_CASE("Commands on a container") {
    auto image = png::parse(minimal_png());

    SUBCASE("encode then decode") {
        cli::encode(image, "ruSt"_ct, "secret");
        CHECK(image.size() == 4);
        CHECK(cli::decode(image, "ruSt"_ct) == "secret");
    }

    SUBCASE("decode of a missing type") {
        CHECK_THROWS_AS((void)cli::decode(image, "ruSt"_ct), not_found_error);
    }

    SUBCASE("decode of binary data") {
        CHECK_THROWS_AS((void)cli::decode(image, chunk_types::IHDR), decode_error);
    }

    SUBCASE("remove") {
        auto removed = cli::remove(image, "tEXt"_ct);
        CHECK(removed.payload_as_text() == "made by pngme");
        CHECK(image.chunk_by_type("tEXt") == nullptr);
    }

    SUBCASE("print uses a placeholder for binary payloads") {
        std::ostringstream out;
        cli::print(image, out);
        std::istringstream lines(out.str());
        std::string first;
        std::getline(lines, first);
        CHECK(first == "chunk type: IHDR, length:      13, crc:  2908270238| <binary>");
        CHECK(out.str().find("chunk type: tEXt, length:      13") != std::string::npos);
        CHECK(out.str().find("| made by pngme\n") != std::string::npos);
        CHECK(out.str().find("chunk type: IEND, length:       0, crc:  2923585666| \n") != std::string::npos);
    }
}

TEST_CASE("Tool runs against files") {
    temp_file file(minimal_png());
    const std::string path = file.path().string();

    SUBCASE("encode rewrites the file") {
        auto r = run_tool({path, "encode", "-t", "ruSt", "hidden message"});
        CHECK(r.status == 0);
        CHECK(r.err.empty());

        auto image = png::parse(file.contents());
        REQUIRE(image.size() == 4);
        CHECK(image.chunks().back().type().to_string() == "ruSt");
        CHECK(image.chunks().back().payload_as_text() == "hidden message");
    }

    SUBCASE("decode prints the message") {
        REQUIRE(run_tool({path, "encode", "-t", "ruSt", "hidden message"}).status == 0);
        auto r = run_tool({path, "decode", "-t", "ruSt"});
        CHECK(r.status == 0);
        CHECK(r.out == "hidden message\n");
    }

    SUBCASE("message starting with a dash") {
        REQUIRE(run_tool({path, "encode", "-t", "ruSt", "--", "--not-an-option"}).status == 0);
        auto r = run_tool({path, "decode", "-t", "ruSt"});
        CHECK(r.status == 0);
        CHECK(r.out == "--not-an-option\n");
    }

    SUBCASE("encode then remove restores the original bytes") {
        auto original = file.contents();
        REQUIRE(run_tool({path, "encode", "-t", "ruSt", "a much longer hidden message"}).status == 0);
        auto r = run_tool({path, "remove", "-t", "ruSt"});
        CHECK(r.status == 0);
        // The file is truncated, not just overwritten from the start
        CHECK(file.contents() == original);
    }

    SUBCASE("remove of a missing type fails and leaves the file alone") {
        auto original = file.contents();
        auto r = run_tool({path, "remove", "-t", "ruSt"});
        CHECK(r.status == 1);
        CHECK(r.err.find("error: Cannot find chunk type ruSt") == 0);
        CHECK(file.contents() == original);
    }

    SUBCASE("print lists every chunk") {
        auto r = run_tool({path, "print"});
        CHECK(r.status == 0);
        CHECK(std::count(r.out.begin(), r.out.end(), '\n') == 3);
    }

    SUBCASE("not a png") {
        write_file(file.path(), bytes("definitely not a png"));
        auto r = run_tool({path, "print"});
        CHECK(r.status == 1);
        CHECK(r.err.find("signature") != std::string::npos);
    }

    SUBCASE("warnings go to stderr") {
        auto bytes = file.contents();
        append(bytes, "zz");
        write_file(file.path(), bytes);

        auto strict = run_tool({path, "print"});
        CHECK(strict.status == 1);

        auto lenient = run_tool({"--lenient", path, "print"});
        CHECK(lenient.status == 0);
        CHECK(lenient.err.find("warning: [trailing_data]") != std::string::npos);
    }

    SUBCASE("missing file") {
        auto r = run_tool({path + ".missing", "print"});
        CHECK(r.status == 1);
        CHECK(r.err.find("Failed to open file") != std::string::npos);
    }

    SUBCASE("usage error") {
        auto r = run_tool({path});
        CHECK(r.status == 2);
        CHECK(r.err.find("Usage:") != std::string::npos);
    }

    SUBCASE("help") {
        auto r = run_tool({"-h"});
        CHECK(r.status == 0);
        CHECK(r.out.find("encode -t TYPE MESSAGE") != std::string::npos);
    }
}
