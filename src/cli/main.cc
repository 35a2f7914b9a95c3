//
// pngme: hide messages in the chunks of a PNG file.
//

#include <iostream>

#include "commands.hh"

int main(int argc, char* argv[]) {
    return pngme::cli::execute(argc, argv, std::cout, std::cerr);
}
