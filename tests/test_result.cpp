#include <catch2/catch.hpp>
#include <sitecfg/result.hpp>
#include <memory>
#include <string>

using namespace sitecfg;

static Result<int> parse_port(int raw) {
    if (raw <= 0 || raw > 65535) {
        return SiteError{SiteError::RangeViolation, "port out of range"}.at("server.port");
    }
    return Result<int>::ok(raw);
}

static Result<int> doubled_port(int raw) {
    auto port = parse_port(raw);
    SITECFG_TRY(port);
    return Result<int>::ok(port.value() * 2);
}

TEST_CASE("Ok result exposes its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result exposes its error", "[result]") {
    auto r = Result<int>::err(SiteError{SiteError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == SiteError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(SiteError{SiteError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(9) == 3);
    REQUIRE(Result<int>::err(SiteError{SiteError::IO, "x"}).value_or(9) == 9);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto ok = Result<int>::ok(5).and_then([](int x) { return Result<int>::ok(x + 10); });
    REQUIRE(ok.value() == 15);

    bool called = false;
    auto err = Result<int>::err(SiteError{SiteError::Parse, "bad"})
        .and_then([&](int x) { called = true; return Result<int>::ok(x); });
    REQUIRE(err.is_err());
    REQUIRE_FALSE(called);
}

TEST_CASE("SITECFG_TRY propagates errors and passes Ok through", "[result]") {
    REQUIRE(doubled_port(8080).value() == 16160);

    auto r = doubled_port(0);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiteError::RangeViolation);
    REQUIRE(r.error().key == "server.port");
}

TEST_CASE("Status Ok and Err", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(SiteError{SiteError::TypeMismatch, "bad config"});
    REQUIRE(s.error().code == SiteError::TypeMismatch);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
}

TEST_CASE("SiteError format() with key and file", "[error]") {
    SiteError e{SiteError::ReservedValue, "public is reserved", "pick another directory"};
    e.at("distDir").in_file("/app/site.config.toml");
    auto formatted = e.format();
    REQUIRE(formatted.find("error[ReservedValue]: public is reserved") != std::string::npos);
    REQUIRE(formatted.find("hint: pick another directory") != std::string::npos);
    REQUIRE(formatted.find("--> distDir (/app/site.config.toml)") != std::string::npos);
}

TEST_CASE("SiteError format() with file only", "[error]") {
    SiteError e{SiteError::Parse, "unexpected token"};
    e.in_file("site.config.toml");
    auto formatted = e.format();
    REQUIRE(formatted.find("--> site.config.toml") != std::string::npos);
    REQUIRE(formatted.find("hint:") == std::string::npos);
}

TEST_CASE("SiteError format() without hint, key or file", "[error]") {
    SiteError e{SiteError::EnumViolation, "bad target"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[EnumViolation]: bad target");
}

TEST_CASE("SiteError code_name() for all codes", "[error]") {
    REQUIRE(std::string(SiteError::code_name(SiteError::IO)) == "IO");
    REQUIRE(std::string(SiteError::code_name(SiteError::Parse)) == "Parse");
    REQUIRE(std::string(SiteError::code_name(SiteError::NotFound)) == "NotFound");
    REQUIRE(std::string(SiteError::code_name(SiteError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(SiteError::code_name(SiteError::TypeMismatch)) == "TypeMismatch");
    REQUIRE(std::string(SiteError::code_name(SiteError::RangeViolation)) == "RangeViolation");
    REQUIRE(std::string(SiteError::code_name(SiteError::EnumViolation)) == "EnumViolation");
    REQUIRE(std::string(SiteError::code_name(SiteError::StructuralViolation)) == "StructuralViolation");
    REQUIRE(std::string(SiteError::code_name(SiteError::UnsupportedSource)) == "UnsupportedSource");
    REQUIRE(std::string(SiteError::code_name(SiteError::ReservedValue)) == "ReservedValue");
}
