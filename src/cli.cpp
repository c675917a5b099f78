/**
 * @file cli.cpp
 * @brief Status list command line interface.
 *
 * Builds a status list from codes given on the command line, or decodes a
 * status list given as JSON or CBOR hex.
 */

#include <statuslist/statuslist.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using namespace statuslist;

static void print_version() {
    std::printf("statuslist %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("Token Status List encoder/decoder (v%s C++)\n", version());
    std::printf("=============================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <bits> <status>...\n", prog_name);
    std::printf("  %s [options] -c <bits> <status>...\n", prog_name);
    std::printf("  %s [options] -d <list>\n", prog_name);
    std::printf("  %s [options] -g <list> <index>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -c             Print the CBOR form as hex (default is JSON)\n");
    std::printf("  -d             Decode a list and print every status\n");
    std::printf("  -g             Decode a list and print one status\n");
    std::printf("  --verbose      Enable debug logging on stderr\n");
    std::printf("  --log-file F   Also write log records to rotating file F\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  bits           Bits per status: 1, 2, 4 or 8\n");
    std::printf("  status         Status value, 0 to 2^bits - 1\n");
    std::printf("  list           JSON object, or CBOR hex\n");
    std::printf("  index          Zero-based status index\n\n");
    std::printf("Examples:\n");
    std::printf("  %s 1 1 0 0 1 1 1 0 1          # build, print JSON\n", prog_name);
    std::printf("  %s -c 2 0 1 2                  # build, print CBOR hex\n", prog_name);
    std::printf("  %s -g '{\"bits\":1,\"lst\":\"eNrbuRgAAhcBXQ\"}' 3\n\n", prog_name);
}

static bool parse_unsigned(const char* text, unsigned long& value) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    value = std::strtoul(text, &end, 10);
    return errno == 0 && end != nullptr && *end == '\0';
}

static StatusList parse_list(const std::string& text) {
    // JSON documents start with '{' (after optional whitespace), CBOR hex never does
    std::size_t first = text.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && text[first] == '{') {
        return from_json(text);
    }
    return from_cbor_hex(text);
}

static const char* describe(StatusCode code) {
    auto type = to_status_type(code);
    return type ? status_type_name(*type) : "UNNAMED";
}

static int do_build(int bits, char** codes, int count, bool cbor) {
    StatusListBuilder builder(bits);
    for (int i = 0; i < count; ++i) {
        unsigned long value = 0;
        if (!parse_unsigned(codes[i], value) || value > 255UL) {
            std::fprintf(stderr, "Error: Invalid status value: %s\n", codes[i]);
            return 1;
        }
        builder.add_status(static_cast<unsigned>(value));
    }

    StatusList list = builder.build();
    if (cbor) {
        std::printf("%s\n", to_cbor_hex(list).c_str());
    } else {
        std::printf("%s\n", to_json(list).c_str());
    }
    return 0;
}

static int do_decode_all(const char* text) {
    StatusListDecoder decoder(parse_list(text));

    std::printf("bits:     %u\n", bit_count(decoder.bits()));
    std::printf("statuses: %zu\n", decoder.size());
    for (std::size_t i = 0; i < decoder.size(); ++i) {
        StatusCode code = decoder.get_status(i);
        std::printf("%zu\t%u\t%s\n", i, static_cast<unsigned>(code), describe(code));
    }
    return 0;
}

static int do_decode_one(const char* text, const char* index_text) {
    unsigned long index = 0;
    if (!parse_unsigned(index_text, index)) {
        std::fprintf(stderr, "Error: Invalid index: %s\n", index_text);
        return 1;
    }

    StatusListDecoder decoder(parse_list(text));
    StatusCode code = decoder.get_status(static_cast<std::size_t>(index));
    std::printf("%u\t%s\n", static_cast<unsigned>(code), describe(code));
    return 0;
}

static int run(int argc, char** argv, int arg_offset) {
    if (arg_offset >= argc) {
        print_help(argv[0]);
        return 1;
    }

    const char* mode = argv[arg_offset];

    if (std::strcmp(mode, "-d") == 0) {
        if (argc - arg_offset != 2) {
            std::fprintf(stderr, "Error: Decode requires 1 argument after -d\n");
            std::fprintf(stderr, "Usage: %s -d <list>\n", argv[0]);
            return 1;
        }
        return do_decode_all(argv[arg_offset + 1]);
    }

    if (std::strcmp(mode, "-g") == 0) {
        if (argc - arg_offset != 3) {
            std::fprintf(stderr, "Error: Lookup requires 2 arguments after -g\n");
            std::fprintf(stderr, "Usage: %s -g <list> <index>\n", argv[0]);
            return 1;
        }
        return do_decode_one(argv[arg_offset + 1], argv[arg_offset + 2]);
    }

    bool cbor = false;
    if (std::strcmp(mode, "-c") == 0) {
        cbor = true;
        ++arg_offset;
    }

    if (arg_offset >= argc) {
        std::fprintf(stderr, "Error: Missing bits argument\n");
        return 1;
    }

    unsigned long bits = 0;
    if (!parse_unsigned(argv[arg_offset], bits) || bits > 8UL) {
        std::fprintf(stderr, "Error: bits must be 1, 2, 4 or 8\n");
        return 1;
    }

    return do_build(static_cast<int>(bits), &argv[arg_offset + 1], argc - arg_offset - 1, cbor);
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    int arg_offset = 1;
    std::string log_file;
    auto level = spdlog::level::warn;
    while (arg_offset < argc) {
        if (std::strcmp(argv[arg_offset], "--verbose") == 0) {
            level = spdlog::level::debug;
            ++arg_offset;
        } else if (std::strcmp(argv[arg_offset], "--log-file") == 0) {
            if (arg_offset + 1 >= argc) {
                std::fprintf(stderr, "Error: --log-file requires a path\n");
                return 1;
            }
            log_file = argv[arg_offset + 1];
            arg_offset += 2;
        } else {
            break;
        }
    }
    LogManager::Instance().Initialize(log_file, level);

    try {
        return run(argc, argv, arg_offset);
    } catch (const StatusListException& ex) {
        std::fprintf(stderr, "Error: %s (code %d)\n", ex.what(), static_cast<int>(ex.code()));
        return 1;
    }
}
