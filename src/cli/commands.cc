//
// pngme command-line front end.
//

#include "commands.hh"

#include <pngme/file_io.hh>

#include <iomanip>
#include <iostream>
#include <vector>

namespace pngme::cli {

    namespace {
        command_kind parse_command(std::string_view name) {
            if (name == "encode") {
                return command_kind::encode;
            } else if (name == "decode") {
                return command_kind::decode;
            } else if (name == "remove") {
                return command_kind::remove;
            } else if (name == "print") {
                return command_kind::print;
            }
            throw usage_error(build_error_msg("Unknown command: ", name));
        }

        const chunk_type& require_type(const arguments& args) {
            if (!args.type) {
                throw usage_error("Missing chunk type (-t TYPE)");
            }
            return *args.type;
        }

        void print_warning(std::ostream& err, std::uint64_t offset,
                           std::string_view category, std::string_view message) {
            err << "warning: [" << category << "] at offset " << offset << ": " << message << "\n";
        }
    }

    arguments parse_arguments(int argc, const char* const* argv) {
        arguments args;
        std::vector<std::string_view> positional;
        bool options_done = false;

        for (int i = 1; i < argc; i++) {
            std::string_view arg = argv[i];
            if (options_done) {
                positional.push_back(arg);
            } else if (arg == "--") {
                options_done = true;
            } else if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            } else if (arg == "--lenient") {
                args.lenient = true;
            } else if (arg == "-t") {
                if (i + 1 >= argc) {
                    throw usage_error("Option -t requires a chunk type");
                }
                args.type = chunk_type::parse(argv[++i]);
            } else if (arg.size() > 1 && arg[0] == '-') {
                throw usage_error(build_error_msg("Unknown option: ", arg));
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.size() < 2) {
            throw usage_error("Expected a file and a command");
        }

        args.file = std::filesystem::path(positional[0]);
        args.command = parse_command(positional[1]);

        std::size_t expected = args.command == command_kind::encode ? 3 : 2;
        if (positional.size() != expected) {
            throw usage_error(args.command == command_kind::encode
                                  ? "encode expects exactly one MESSAGE"
                                  : build_error_msg("Unexpected argument: ", positional[expected]));
        }
        if (args.command == command_kind::encode) {
            args.message = std::string(positional[2]);
        }
        if (args.command == command_kind::print) {
            if (args.type) {
                throw usage_error("print does not take a chunk type");
            }
        } else {
            require_type(args);
        }
        return args;
    }

    void print_usage(std::ostream& os, std::string_view program) {
        os << "Usage: " << program << " [--lenient] <FILE> <command> [options]\n";
        os << "\n";
        os << "Hide messages in the chunks of a PNG file.\n";
        os << "\n";
        os << "Commands:\n";
        os << "  encode -t TYPE MESSAGE   Append a TYPE chunk holding MESSAGE\n";
        os << "  decode -t TYPE           Print the first TYPE chunk as text\n";
        os << "  remove -t TYPE           Remove the first TYPE chunk\n";
        os << "  print                    List every chunk\n";
        os << "\n";
        os << "Options:\n";
        os << "  --lenient   Ignore trailing bytes after the last chunk\n";
        os << "  --          Treat every later argument as positional\n";
        os << "  -h, --help  Show this help\n";
        os << "\n";
        os << "Examples:\n";
        os << "  " << program << " image.png encode -t ruSt \"hello\"\n";
        os << "  " << program << " image.png decode -t ruSt\n";
        os << "  " << program << " image.png encode -t ruSt -- \"-starts with a dash\"\n";
    }

    void encode(png& image, const chunk_type& type, std::string_view message) {
        image.append_chunk(chunk(type, message));
    }

    std::string decode(const png& image, const chunk_type& type) {
        const chunk* found = image.chunk_by_type(type.to_string_view());
        if (!found) {
            throw not_found_error(type.to_string(), build_error_msg("Cannot find chunk type ", type));
        }
        return found->payload_as_text();
    }

    chunk remove(png& image, const chunk_type& type) {
        return image.remove_chunk(type.to_string_view());
    }

    void print(const png& image, std::ostream& out) {
        for (const auto& c : image) {
            out << "chunk type: " << c.type()
                << ", length:" << std::setw(8) << c.length()
                << ", crc:" << std::setw(12) << c.crc()
                << "| " << c.payload_as_text_or(binary_placeholder) << "\n";
        }
    }

    void run(const arguments& args, std::ostream& out, std::ostream& err) {
        parse_options options;
        options.strict = !args.lenient;
        options.on_warning = [&err](std::uint64_t offset, std::string_view category, std::string_view message) {
            print_warning(err, offset, category, message);
        };

        png image = png::parse(read_file(args.file), options);

        switch (args.command) {
            case command_kind::encode:
                encode(image, require_type(args), args.message);
                write_file(args.file, image.to_bytes());
                break;
            case command_kind::decode:
                out << decode(image, require_type(args)) << "\n";
                break;
            case command_kind::remove:
                remove(image, require_type(args));
                write_file(args.file, image.to_bytes());
                break;
            case command_kind::print:
                print(image, out);
                break;
        }
    }

    int execute(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
        std::string_view program = argc > 0 ? argv[0] : "pngme";

        arguments args;
        try {
            args = parse_arguments(argc, argv);
        } catch (const usage_error& e) {
            err << "error: " << e.what() << "\n\n";
            print_usage(err, program);
            return 2;
        } catch (const pngme_error& e) {
            err << "error: " << e.what() << "\n";
            return 2;
        }

        if (args.help) {
            print_usage(out, program);
            return 0;
        }

        try {
            run(args, out, err);
        } catch (const pngme_error& e) {
            err << "error: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }
}
