/**
 * @file chunk_type_info.cpp
 * @brief Print the properties encoded in PNG-style chunk type codes
 *
 * Each argument is validated as a chunk type code and its four case
 * bits are decoded. With --strict the reserved bit must be valid too.
 */

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <string_view>

static const char* yes_no(bool v) {
    return v ? "yes" : "no";
}

int main(int argc, char* argv[]) {
    pngchunk::validation_options opts;
    int first = 1;
    if (argc > 1 && std::string_view(argv[1]) == "--strict") {
        opts.strict = true;
        first = 2;
    }

    if (first >= argc) {
        std::cout << "Usage: " << argv[0] << " [--strict] <chunk-type>...\n";
        std::cout << "\n";
        std::cout << "Decodes the critical/public/reserved/safe-to-copy bits of each code.\n";
        return 1;
    }

    opts.on_warning = [](std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "]: " << message << "\n";
    };

    int rc = 0;
    for (int i = first; i < argc; i++) {
        try {
            auto ct = pngchunk::chunk_type::from_string(argv[i], opts);
            std::cout << ct << "\n";
            std::cout << "  critical:      " << yes_no(ct.is_critical()) << "\n";
            std::cout << "  public:        " << yes_no(ct.is_public()) << "\n";
            std::cout << "  reserved ok:   " << yes_no(ct.is_reserved_bit_valid()) << "\n";
            std::cout << "  safe to copy:  " << yes_no(ct.is_safe_to_copy()) << "\n";
            std::cout << "  valid:         " << yes_no(ct.is_valid()) << "\n";
        } catch (const pngchunk::chunk_type_error& e) {
            std::cerr << "Error (" << pngchunk::to_string(e.code()) << "): " << e.what() << "\n";
            rc = 1;
        }
    }

    return rc;
}
