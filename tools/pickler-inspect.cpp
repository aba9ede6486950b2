// Prints the marker tree of pickler-encoded files
#include <pickler/errors.hpp>
#include <pickler/inspect.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] [file ...]\n";
    std::cerr << "\nReads standard input when no file is given.\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --offset <n>     Start at byte n\n";
    std::cerr << "  --max-depth <n>  Nesting limit (default 512)\n";
    std::cerr << "  -h, --help       Show this help\n";
}

std::vector<uint8_t> read_all(std::istream& in) {
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

int dump(const std::string& label, const std::vector<uint8_t>& bytes, size_t offset,
         uint32_t max_depth) {
    if (offset > bytes.size()) {
        std::cerr << fmt::format("{}: offset {} is past the end ({} bytes)\n",
                                 label, offset, bytes.size());
        return 1;
    }
    std::cout << fmt::format("# {} ({} bytes)\n", label, bytes.size() - offset);
    try {
        std::cout << pickler::inspect(std::span<const uint8_t>(bytes).subspan(offset), max_depth);
    } catch (const pickler::Error& e) {
        std::cerr << fmt::format("{}: {}\n", label, e.what());
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> files;
    size_t offset = 0;
    uint32_t max_depth = pickler::DEFAULT_MAX_DEPTH;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--offset" && i + 1 < argc) {
            offset = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "--max-depth" && i + 1 < argc) {
            max_depth = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        return dump("<stdin>", read_all(std::cin), offset, max_depth);
    }

    int status = 0;
    for (const auto& file : files) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            std::cerr << "Error: Cannot open " << file << "\n";
            status = 1;
            continue;
        }
        status |= dump(file, read_all(in), offset, max_depth);
    }
    return status;
}
