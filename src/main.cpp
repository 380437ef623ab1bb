#include "statusview/output_stream.hpp"
#include "statusview/stream_display.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-f <file>] [-n] [-w <columns>] [-a] [-v]"
              << std::endl;
    std::cerr << "Render a JSON progress message stream.\n"
              << "Options:\n"
              << "  -f <file>        Read messages from file (default: standard input)\n"
              << "  -n               Plain output, even on a terminal\n"
              << "  -w <columns>     Render for a fixed terminal width\n"
              << "  -a               Print out-of-band (aux) payloads to stderr\n"
              << "  -v               Report the terminal capabilities in use\n"
              << "  -h, --help       Show this message" << std::endl;
}
} // namespace

int main(int argc, char** argv) {
    try {
        std::string input_path;
        bool plain = false;
        bool print_aux = false;
        bool verbose = false;
        statusview::DisplayOptions options;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-f") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }
                input_path = argv[arg_index + 1];
                arg_index += 2;
            } else if (option == "-w") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                try {
                    options.window_width = std::stoi(argv[arg_index + 1]);
                } catch (const std::exception&) {
                    throw std::runtime_error("Invalid width: " + std::string(argv[arg_index + 1]));
                }

                if (options.window_width <= 0) {
                    throw std::runtime_error("Width must be positive.");
                }
                arg_index += 2;
            } else if (option == "-n") {
                plain = true;
                ++arg_index;
            } else if (option == "-a") {
                print_aux = true;
                ++arg_index;
            } else if (option == "-v") {
                verbose = true;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (arg_index != argc) {
            printUsage(argv[0]);
            return 1;
        }

        std::ifstream file;
        if (!input_path.empty()) {
            file.open(input_path);
            if (!file) {
                throw std::runtime_error("Cannot open input file: " + input_path);
            }
        }
        std::istream& in = input_path.empty() ? std::cin : file;

        statusview::AuxCallback aux_callback;
        if (print_aux) {
            aux_callback = [](const statusview::Message& message) {
                std::cerr << message.aux->dump() << std::endl;
            };
        }

        statusview::StdoutStream out;
        statusview::StreamDisplay display(out.stream(), out.fd(), out.isTerminal() && !plain, options);
        if (verbose) {
            const auto* term_info = display.termInfo();
            if (term_info == nullptr) {
                std::cerr << "output is not a terminal, cursor control disabled" << std::endl;
            } else {
                const bool found = dynamic_cast<const statusview::NoTermInfo*>(term_info) == nullptr;
                std::cerr << fmt::format("terminal '{}': {}",
                                         options.term_name.empty() ? statusview::resolveTermName()
                                                                   : options.term_name,
                                         found ? "terminfo entry loaded" : "no terminfo entry, using ANSI sequences")
                          << std::endl;
            }
        }

        display.run(in, aux_callback);
        std::cout << std::flush;

    } catch (const std::exception& ex) {
        std::cout << std::flush;
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
