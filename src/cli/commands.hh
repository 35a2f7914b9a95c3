//
// pngme command-line front end.
//

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>
#include <pngme/png.hh>

namespace pngme::cli {

    enum class command_kind {
        encode,
        decode,
        remove,
        print
    };

    struct arguments {
        std::filesystem::path file;
        command_kind command = command_kind::print;
        std::optional<chunk_type> type;   ///< -t, required by encode/decode/remove
        std::string message;              ///< encode only
        bool lenient = false;             ///< --lenient: non-strict parsing
        bool help = false;
    };

    // Bad command line; reported with the usage text
    class usage_error : public pngme_error {
    public:
        explicit usage_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /// Shown by print for payloads that are not UTF-8 text
    inline constexpr std::string_view binary_placeholder = "<binary>";

    /**
     * @brief Parse argv
     * @throws usage_error on a malformed command line
     * @throws invalid_chunk_type if the -t value is not a chunk type
     */
    arguments parse_arguments(int argc, const char* const* argv);

    void print_usage(std::ostream& os, std::string_view program);

    // Commands on an in-memory container
    void encode(png& image, const chunk_type& type, std::string_view message);
    [[nodiscard]] std::string decode(const png& image, const chunk_type& type);
    chunk remove(png& image, const chunk_type& type);
    void print(const png& image, std::ostream& out);

    /**
     * @brief Load the file, run the command, write the file back if it changed
     * @throws pngme_error on any failure
     */
    void run(const arguments& args, std::ostream& out, std::ostream& err);

    /**
     * @brief Whole program: arguments, command, diagnostics
     * @return 0 on success, 1 on a failed command, 2 on a usage error
     */
    int execute(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace pngme::cli
