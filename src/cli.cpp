/**
 * @file cli.cpp
 * @brief hashprim command line interface.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _   _    _    ____  _   _ ____  ____  ___ __  __
 * | | | |  / \  / ___|| | | |  _ \|  _ \|_ _|  \/  |
 * | |_| | / _ \ \___ \| |_| | |_) | |_) || || |\/| |
 * |  _  |/ ___ \ ___) |  _  |  __/|  _ < | || |  | |
 * |_| |_/_/   \_\____/|_| |_|_|   |_| \_\___|_|  |_|
 * ============================================================================
 * @endcond
 *
 * Evaluates the SHA-256 word primitives on command line operands, hashes
 * files and strings, and runs the built-in validation checks.
 *
 * @authors hashprim contributors
 *
 * @see https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf FIPS 180-4
 */

#include <hashprim/hashprim.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <system_error>
#include <vector>

using namespace hashprim;

static constexpr const char* BANNER = "                                                 \n"
                                      "  _   _    _    ____  _   _ ____  ____  ___ __  __\n"
                                      " | | | |  / \\  / ___|| | | |  _ \\|  _ \\|_ _|  \\/  |\n"
                                      " | |_| | / _ \\ \\___ \\| |_| | |_) | |_) || || |\\/| |\n"
                                      " |  _  |/ ___ \\ ___) |  _  |  __/|  _ < | || |  | |\n"
                                      " |_| |_/_/   \\_\\____/|_| |_|_|   |_| \\_\\___|_|  |_|\n"
                                      "                                                 \n"
                                      "          SHA-256 word primitives, FIPS 180-4     \n";

static void print_version() {
    std::printf("hashprim %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\n%s\n", BANNER);
    std::printf("FIPS 180-4 SHA-256 Word Primitives (v%s C++)\n", version());
    std::printf("=============================================\n\n");
    std::printf("References:\n");
    std::printf("  FIPS 180-4: https://nvlpubs.nist.gov/nistpubs/FIPS/NIST.FIPS.180-4.pdf\n\n");
    std::printf("Usage:\n");
    std::printf("  %s rotr|rotl|shr <x> <n>\n", prog_name);
    std::printf("  %s parity|ch|maj <x> <y> <z>\n", prog_name);
    std::printf("  %s to_uint32 <x>\n", prog_name);
    std::printf("  %s sha256 <file>\n", prog_name);
    std::printf("  %s sha256 -s <string>\n", prog_name);
    std::printf("  %s selftest\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Operands:\n");
    std::printf("  x, y, z        Integers, decimal or 0x-prefixed hex, optionally negative,\n");
    std::printf("                 any magnitude (reduced modulo 2^32)\n");
    std::printf("  n              Rotate/shift count 0-31\n\n");
    std::printf("Examples:\n");
    std::printf("  %s rotr 0x12345678 4                       # 0x81234567\n", prog_name);
    std::printf("  %s ch 0xFF00FF00 0x0F0F0F0F 0xF0F0F0F0     # 0x0ff00ff0\n", prog_name);
    std::printf("  %s sha256 -s abc\n\n", prog_name);
}

static constexpr std::size_t READ_CHUNK_BYTES = 64U * 1024U;

/**
 * @brief Hash a stream in fixed-size chunks.
 *
 * No size is needed up front, so pipes and /proc files work. A read error
 * (for example EISDIR on a directory) sets badbit and is reported as failure.
 */
static bool hash_stream(std::istream& input, Digest& digest, Error& result) {
    Sha256 ctx;
    std::vector<char> chunk(READ_CHUNK_BYTES);
    result = Error::Ok;

    while (input) {
        input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = input.gcount();
        if (got > 0) {
            result = ctx.update(reinterpret_cast<const std::uint8_t*>(chunk.data()),
                                static_cast<std::size_t>(got));
            if (result != Error::Ok) {
                return false;
            }
        }
    }

    if (input.bad()) {
        return false;
    }

    result = ctx.finalize(digest);
    return result == Error::Ok;
}

static bool parse_operand(const char* text, word_t& out) {
    auto result = parse_word(text, out);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Invalid integer operand: %s\n", text);
        return false;
    }
    return true;
}

static bool parse_shift_count(const char* text, int& out) {
    auto result = parse_count(text, out);
    if (result == Error::Ok) {
        result = check_count(out);
    }
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: count must be 0-31, got %s\n", error_string(result),
                     text);
        return false;
    }
    return true;
}

static void print_word(word_t value) {
    std::printf("0x%08x\n", static_cast<unsigned>(value));
}

static int do_count_op(const char* op, const char* x_text, const char* n_text) {
    word_t x = 0;
    int n = 0;
    if (!parse_operand(x_text, x) || !parse_shift_count(n_text, n)) {
        return 1;
    }

    if (std::strcmp(op, "rotr") == 0) {
        print_word(rotr(x, n));
    } else if (std::strcmp(op, "rotl") == 0) {
        print_word(rotl(x, n));
    } else {
        print_word(shr(x, n));
    }
    return 0;
}

static int do_mix_op(const char* op, const char* x_text, const char* y_text,
                     const char* z_text) {
    word_t x = 0;
    word_t y = 0;
    word_t z = 0;
    if (!parse_operand(x_text, x) || !parse_operand(y_text, y) || !parse_operand(z_text, z)) {
        return 1;
    }

    if (std::strcmp(op, "parity") == 0) {
        print_word(parity(x, y, z));
    } else if (std::strcmp(op, "ch") == 0) {
        print_word(ch(x, y, z));
    } else {
        print_word(maj(x, y, z));
    }
    return 0;
}

static int print_digest(const std::uint8_t* data, std::size_t size, const char* label) {
    Digest digest{};
    auto result = sha256(data, size, digest);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Hashing failed: %s\n", error_string(result));
        return 1;
    }

    std::printf("%s  %s\n", to_hex(digest.data(), digest.size()).c_str(), label);
    return 0;
}

static int do_sha256_file(const char* input_path) {
    std::error_code ec;
    if (std::filesystem::is_directory(input_path, ec)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s (is a directory)\n", input_path);
        return 1;
    }

    std::ifstream file(input_path, std::ios::binary);
    if (!file) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        return 1;
    }

    Digest digest{};
    Error result = Error::Ok;
    if (!hash_stream(file, digest, result)) {
        if (result != Error::Ok) {
            std::fprintf(stderr, "Error: Hashing failed: %s\n", error_string(result));
        } else {
            std::fprintf(stderr, "Error: Cannot read input file: %s\n", input_path);
        }
        return 1;
    }

    std::printf("%s  %s\n", to_hex(digest.data(), digest.size()).c_str(), input_path);
    return 0;
}

static int do_sha256_string(const char* text) {
    return print_digest(reinterpret_cast<const std::uint8_t*>(text), std::strlen(text), "-");
}

static bool report(const char* name, const std::string& expected, const std::string& got) {
    bool passed = expected == got;
    std::printf("[%s] %-34s expected %s got %s\n", passed ? "PASS" : "FAIL", name,
                expected.c_str(), got.c_str());
    return passed;
}

static int do_selftest() {
    bool all_pass = true;

    std::printf("Word primitives:\n");
    all_pass &= report("rotr(0x12345678, 4)", "81234567", format_word(rotr(0x12345678U, 4)));
    all_pass &= report("shr(0x80000000, 4)", "08000000", format_word(shr(0x80000000U, 4)));
    all_pass &= report("ch(0xFF00FF00, 0x0F0F0F0F, ...)", "0ff00ff0",
                       format_word(ch(0xFF00FF00U, 0x0F0F0F0FU, 0xF0F0F0F0U)));
    all_pass &= report("parity(0xAAAAAAAA, 0x55555555, ...)", "00000000",
                       format_word(parity(0xAAAAAAAAU, 0x55555555U, 0xFFFFFFFFU)));
    all_pass &= report("to_uint32(-1)", "ffffffff", format_word(to_uint32(-1)));

    struct Vector {
        const char* name;
        std::string message;
        const char* expected;
    };
    const Vector vectors[] = {
        {"sha256(\"\")", "",
         "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"},
        {"sha256(\"abc\")", "abc",
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
        {"sha256(448-bit message)", "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",
         "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1"},
        {"sha256(1,000,000 x 'a')", std::string(1000000, 'a'),
         "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0"},
    };

    std::printf("\nSHA-256 vectors (NIST FIPS 180-4):\n");
    for (const auto& v : vectors) {
        Digest digest{};
        auto result = sha256(reinterpret_cast<const std::uint8_t*>(v.message.data()),
                             v.message.size(), digest);
        std::string got = (result == Error::Ok) ? to_hex(digest.data(), digest.size())
                                                : std::string(error_string(result));
        all_pass &= report(v.name, v.expected, got);
    }

    std::printf("\nOverall: %s\n", all_pass ? "All checks passed" : "Some checks failed");
    return all_pass ? 0 : 1;
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

    const char* command = argv[1];

    if (std::strcmp(command, "rotr") == 0 || std::strcmp(command, "rotl") == 0 ||
        std::strcmp(command, "shr") == 0) {
        if (argc != 4) {
            std::fprintf(stderr, "Usage: %s %s <x> <n>\n", argv[0], command);
            return 1;
        }
        return do_count_op(command, argv[2], argv[3]);
    }

    if (std::strcmp(command, "parity") == 0 || std::strcmp(command, "ch") == 0 ||
        std::strcmp(command, "maj") == 0) {
        if (argc != 5) {
            std::fprintf(stderr, "Usage: %s %s <x> <y> <z>\n", argv[0], command);
            return 1;
        }
        return do_mix_op(command, argv[2], argv[3], argv[4]);
    }

    if (std::strcmp(command, "to_uint32") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Usage: %s to_uint32 <x>\n", argv[0]);
            return 1;
        }
        word_t x = 0;
        if (!parse_operand(argv[2], x)) {
            return 1;
        }
        print_word(x);
        return 0;
    }

    if (std::strcmp(command, "sha256") == 0) {
        if (argc == 4 && std::strcmp(argv[2], "-s") == 0) {
            return do_sha256_string(argv[3]);
        }
        if (argc == 3) {
            return do_sha256_file(argv[2]);
        }
        std::fprintf(stderr, "Usage: %s sha256 <file> | -s <string>\n", argv[0]);
        return 1;
    }

    if (std::strcmp(command, "selftest") == 0) {
        return do_selftest();
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", command);
    std::fprintf(stderr, "Run '%s --help' for usage.\n", argv[0]);
    return 1;
}
