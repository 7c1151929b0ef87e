#include <catch2/catch.hpp>
#include <verspec/result.hpp>
#include <verspec/version.hpp>
#include <string>

using namespace verspec;

// Helper function that uses VERSPEC_TRY
static Result<int> try_double(Result<int> input) {
    VERSPEC_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

// Parses both versions or fails with the first error
static Result<int> compare_texts(const std::string& a, const std::string& b) {
    auto va = Version::parse(a);
    VERSPEC_TRY(va);
    auto vb = Version::parse(b);
    VERSPEC_TRY(vb);
    return Result<int>::ok(va.value().compare(vb.value()));
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(VerspecError{VerspecError::Format, "bad version"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == VerspecError::Format);
    REQUIRE(r.error().message == "bad version");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(VerspecError{VerspecError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(7) == 3);
    REQUIRE(Result<int>::err(VerspecError{VerspecError::IO, "x"}).value_or(7) == 7);
}

TEST_CASE("to_optional drops the error", "[result]") {
    auto some = Result<std::string>::ok("1.0").to_optional();
    REQUIRE(some.has_value());
    REQUIRE(*some == "1.0");

    auto none = Result<std::string>::err(VerspecError{VerspecError::Format, "x"}).to_optional();
    REQUIRE_FALSE(none.has_value());
}

TEST_CASE("map() transforms Ok and passes Err through", "[result]") {
    auto major = Version::parse("4.2").map([](const Version& v) { return v.major(); });
    REQUIRE(major.is_ok());
    REQUIRE(major.value() == 4u);

    bool called = false;
    auto failed = Version::parse("4.x").map([&](const Version& v) {
        called = true;
        return v.major();
    });
    REQUIRE(failed.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(failed.error().code == VerspecError::Format);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto strict_again = [](const Version& v) {
        return Version::parse(v.to_string(), ParseMode::Strict);
    };

    auto ok = Version::parse(" 1.2.3 ").and_then(strict_again);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == Version(1, 2, 3));

    auto not_strict = Version::parse("1.2").and_then(strict_again);
    REQUIRE(not_strict.is_err());
    REQUIRE(not_strict.error().code == VerspecError::Format);

    auto empty = Version::parse("").and_then(strict_again);
    REQUIRE(empty.error().code == VerspecError::NullInput);
}

TEST_CASE("or_else() on Ok passes through", "[result]") {
    auto r = Version::parse("2.0");
    bool called = false;
    auto recovered = r.or_else([&](const VerspecError&) {
        called = true;
        return Result<Version>::ok(Version());
    });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == Version(2, 0, 0));
    REQUIRE_FALSE(called);
}

TEST_CASE("or_else() on Err calls recovery", "[result]") {
    auto r = Version::parse("not-a-version");
    VerspecError::Code seen = VerspecError::IO;
    auto recovered = r.or_else([&](const VerspecError& e) {
        seen = e.code;
        return Result<Version>::ok(Version(1, 0, 0));
    });
    REQUIRE(seen == VerspecError::Format);
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value().to_string() == "1.0.0");
}

TEST_CASE("VERSPEC_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(VerspecError{VerspecError::Parse, "syntax error"}));
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == VerspecError::Parse);
    REQUIRE(output.error().message == "syntax error");

    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("VERSPEC_TRY across result types", "[result]") {
    REQUIRE(compare_texts("1.0", "1.0.1").value() == -1);

    auto r = compare_texts("1.0", "nope");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("'nope'") != std::string::npos);
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(VerspecError{VerspecError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == VerspecError::Config);
}

TEST_CASE("VerspecError format() output", "[error]") {
    VerspecError e{VerspecError::Parse, "config TOML parse error", "check the syntax",
                   "config.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Parse]") != std::string::npos);
    REQUIRE(formatted.find("config TOML parse error") != std::string::npos);
    REQUIRE(formatted.find("hint: check the syntax") != std::string::npos);
    REQUIRE(formatted.find("--> config.toml:3") != std::string::npos);
}

TEST_CASE("VerspecError format() of a version error", "[error]") {
    auto r = Version::parse("1.2.3-", ParseMode::Strict);
    REQUIRE(r.is_err());
    auto formatted = r.error().format();
    REQUIRE(formatted.find("error[Format]: '1.2.3-' is not a valid version string")
            == 0);
    REQUIRE(formatted.find("hint: pre-release label must start with a letter")
            != std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("VerspecError code_name() for all codes", "[error]") {
    REQUIRE(std::string(VerspecError::code_name(VerspecError::IO)) == "IO");
    REQUIRE(std::string(VerspecError::code_name(VerspecError::Parse)) == "Parse");
    REQUIRE(std::string(VerspecError::code_name(VerspecError::Config)) == "Config");
    REQUIRE(std::string(VerspecError::code_name(VerspecError::NullInput)) == "NullInput");
    REQUIRE(std::string(VerspecError::code_name(VerspecError::Format)) == "Format");
    REQUIRE(std::string(VerspecError::code_name(VerspecError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(VerspecError::code_name(VerspecError::TypeMismatch)) == "TypeMismatch");
}

TEST_CASE("default VerspecError has a defined code", "[error]") {
    VerspecError e;
    REQUIRE(e.code == VerspecError::IO);
    REQUIRE(e.line == 0);
    REQUIRE(e.format() == "error[IO]: ");
}
