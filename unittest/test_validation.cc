//
// Test validation options, strict mode and warning callbacks
//

#include <doctest/doctest.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/validation.hh>
#include <pngchunk/exceptions.hh>
#include <algorithm>
#include <string>
#include <vector>

using namespace pngchunk;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::string_view category, std::string_view message) {
        warnings.push_back({std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }
};

TEST_CASE("validate") {
    SUBCASE("accepts letters") {
        CHECK_FALSE(validate("RuSt").has_value());
        CHECK_FALSE(validate("Rust").has_value());
        CHECK_FALSE(validate(chunk_type::bytes_type{82, 117, 83, 116}).has_value());
    }

    SUBCASE("reports the reason") {
        CHECK(validate("Ru1t") == validation_error::non_alphabetic);
        CHECK(validate("") == validation_error::wrong_length);
        CHECK(validate("RuStRuSt") == validation_error::wrong_length);
        CHECK(validate(chunk_type::bytes_type{'R', 'u', 0, 't'}) == validation_error::non_alphabetic);
    }

    SUBCASE("length is checked before content") {
        CHECK(validate("12345") == validation_error::wrong_length);
    }

    SUBCASE("strict mode checks the reserved bit") {
        validation_options opts;
        opts.strict = true;
        CHECK(validate("Rust", opts) == validation_error::reserved_bit);
        CHECK_FALSE(validate("RuSt", opts).has_value());
        CHECK(validate("Ru1t", opts) == validation_error::non_alphabetic);
    }

    SUBCASE("validate never calls the warning handler") {
        validation_options opts;
        warning_tracker tracker;
        opts.on_warning = std::ref(tracker);
        CHECK_FALSE(validate("Rust", opts).has_value());
        CHECK(tracker.warnings.empty());
    }
}

TEST_CASE("validation_error names") {
    CHECK(to_string(validation_error::wrong_length) == "wrong_length");
    CHECK(to_string(validation_error::non_alphabetic) == "non_alphabetic");
    CHECK(to_string(validation_error::reserved_bit) == "reserved_bit");
}

TEST_CASE("Strict construction") {
    validation_options opts;
    opts.strict = true;

    SUBCASE("invalid reserved bit is rejected") {
        try {
            chunk_type::from_string("Rust", opts);
            FAIL("Should have thrown exception");
        } catch (const chunk_type_error& e) {
            CHECK(e.code() == validation_error::reserved_bit);
        }
        CHECK_FALSE(chunk_type::try_from_string("Rust", opts).has_value());
        CHECK_FALSE(chunk_type::try_from_bytes({'R', 'u', 's', 't'}, opts).has_value());
    }

    SUBCASE("valid codes are accepted") {
        auto ct = chunk_type::from_string("RuSt", opts);
        CHECK(ct.is_valid());
    }

    SUBCASE("default options keep the alphabetic-only rule") {
        auto ct = chunk_type::from_string("Rust");
        CHECK(ct.is_alphabetic());
        CHECK_FALSE(ct.is_valid());
    }
}

TEST_CASE("Warning callbacks - reserved_bit") {
    validation_options opts;
    warning_tracker tracker;
    opts.on_warning = std::ref(tracker);

    SUBCASE("accepted code with lowercase third byte") {
        auto ct = chunk_type::from_string("Rust", opts);
        CHECK(ct.to_string() == "Rust");
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.has_warning("reserved_bit"));
        CHECK(tracker.warnings[0].message.find("'Rust'") != std::string::npos);
    }

    SUBCASE("try_ variants warn as well") {
        CHECK(chunk_type::try_from_bytes({'a', 'b', 'c', 'd'}, opts).has_value());
        CHECK(tracker.has_warning("reserved_bit"));
    }

    SUBCASE("valid codes do not warn") {
        chunk_type::from_string("RuSt", opts);
        chunk_type::from_bytes({'I', 'H', 'D', 'R'}, opts);
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("rejected codes do not warn") {
        CHECK_THROWS_AS(chunk_type::from_string("Ru1t", opts), chunk_type_error);
        CHECK_FALSE(chunk_type::try_from_string("ru", opts).has_value());
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("raw construction does not warn") {
        auto ct = chunk_type::from_raw_bytes({'R', 'u', 's', 't'});
        CHECK_FALSE(ct.is_valid());
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("strict mode throws instead of warning") {
        opts.strict = true;
        CHECK_THROWS_AS(chunk_type::from_string("Rust", opts), chunk_type_error);
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("no handler set") {
        validation_options quiet;
        CHECK_NOTHROW(chunk_type::from_string("Rust", quiet));
    }
}
