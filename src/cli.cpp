/**
 * @file cli.cpp
 * @brief msgjson command line interface.
 *
 * Reads one MessagePack value from a file (or stdin) and prints its
 * JSON-and-JavaScript-safe rendering to stdout.
 */

#include <msgjson/msgjson.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace msgjson;

static void print_version() {
    std::printf("msgjson %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("MessagePack to JavaScript-safe JSON (v%s C++)\n", version());
    std::printf("=============================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <input>\n", prog_name);
    std::printf("  %s [options] -            # read from stdin\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  --strict            Fail if bytes follow the first value\n");
    std::printf("  --max-depth N       Maximum container nesting (default %zu)\n", MAX_DEPTH);
    std::printf("  --hex               Render binary payloads as hex (default base64)\n");
    std::printf("  --escape-slashes    Emit '/' as '\\/' inside strings\n");
    std::printf("  --quote-keys        Quote non-string map keys\n");
    std::printf("  -h, --help          Show this help message\n");
    std::printf("  -v, --version       Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s message.mp\n", prog_name);
    std::printf("  cat message.mp | %s --strict -\n\n", prog_name);
}

static bool read_file(const std::string& path, std::vector<std::uint8_t>& buffer) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return false;
    }

    return true;
}

static bool read_stdin(std::vector<std::uint8_t>& buffer) {
    std::cin >> std::noskipws;
    buffer.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
}

static int do_decode(const char* input_path, const Options& options) {
    std::vector<std::uint8_t> input_data;
    bool ok = (std::strcmp(input_path, "-") == 0) ? read_stdin(input_data)
                                                   : read_file(input_path, input_data);
    if (!ok) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    Decoder decoder(options);
    std::string output;
    Error result = decoder.decode(input_data.data(), input_data.size(), output);

    if (result != Error::Ok) {
        if (result == Error::UnsupportedType) {
            std::fprintf(stderr, "Error: %s 0x%02x at offset %zu\n", error_string(result),
                         decoder.error_tag(), decoder.error_offset());
        } else {
            std::fprintf(stderr, "Error: %s at offset %zu\n", error_string(result),
                         decoder.error_offset());
        }
        return 1;
    }

    std::fwrite(output.data(), 1, output.size(), stdout);
    std::fputc('\n', stdout);

    if (decoder.bytes_consumed() < input_data.size()) {
        std::fprintf(stderr, "Warning: ignored %zu trailing bytes\n",
                     input_data.size() - decoder.bytes_consumed());
    }

    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    Options options;
    const char* input_path = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }

        if (std::strcmp(arg, "--strict") == 0) {
            options.allow_trailing_bytes = false;
        } else if (std::strcmp(arg, "--hex") == 0) {
            options.binary_encoding = BinaryEncoding::Hex;
        } else if (std::strcmp(arg, "--escape-slashes") == 0) {
            options.escape_slashes = true;
        } else if (std::strcmp(arg, "--quote-keys") == 0) {
            options.quote_non_string_keys = true;
        } else if (std::strcmp(arg, "--max-depth") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: --max-depth requires a value\n");
                return 1;
            }
            const char* value = argv[++i];
            char* end = nullptr;
            // strtoul accepts a sign and wraps negatives
            unsigned long depth = 0;
            if (value[0] != '-' && value[0] != '+') {
                depth = std::strtoul(value, &end, 10);
            }
            if (end == value || end == nullptr || *end != '\0' || depth == 0) {
                std::fprintf(stderr, "Error: --max-depth must be a positive integer\n");
                return 1;
            }
            options.max_depth = static_cast<std::size_t>(depth);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            std::fprintf(stderr, "Usage: %s [options] <input>\n", argv[0]);
            return 1;
        } else if (input_path == nullptr) {
            input_path = arg;
        } else {
            std::fprintf(stderr, "Error: Only one input may be given\n");
            return 1;
        }
    }

    if (input_path == nullptr) {
        std::fprintf(stderr, "Error: No input given\n");
        std::fprintf(stderr, "Usage: %s [options] <input>\n", argv[0]);
        return 1;
    }

    return do_decode(input_path, options);
}
