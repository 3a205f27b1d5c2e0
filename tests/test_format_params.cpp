#include <catch2/catch.hpp>
#include <resx/format_params.hpp>

using namespace resx;

TEST_CASE("plain text has no placeholders", "[format]") {
    REQUIRE(format_parameters("Hello world").empty());
    REQUIRE(format_parameters("").empty());
    REQUIRE(format_parameters("Hello").to_string() == "{}");
}

TEST_CASE("positional placeholders set their bit", "[format]") {
    auto m = format_parameters("{0} of {2}, again {0}");
    REQUIRE(m.test(0));
    REQUIRE_FALSE(m.test(1));
    REQUIRE(m.test(2));
    REQUIRE(m.count() == 2);
    REQUIRE(m.to_string() == "{0,2}");
}

TEST_CASE("alignment and format spec are accepted", "[format]") {
    REQUIRE(format_parameters("{0,5}").test(0));
    REQUIRE(format_parameters("{1,-5}").test(1));
    REQUIRE(format_parameters("{2:N2}").test(2));
    REQUIRE(format_parameters("{3,10:yyyy-MM-dd}").test(3));
}

TEST_CASE("format spec ends at the first closing brace", "[format]") {
    auto m = format_parameters("{0:x}{1}");
    REQUIRE(m.test(0));
    REQUIRE(m.test(1));
}

TEST_CASE("malformed braces are literal text", "[format]") {
    REQUIRE(format_parameters("{}").empty());
    REQUIRE(format_parameters("{name}").empty());
    REQUIRE(format_parameters("{0 }").empty());
    REQUIRE(format_parameters("{0,}").empty());
    REQUIRE(format_parameters("{0:}").empty());
    REQUIRE(format_parameters("{0").empty());
    REQUIRE(format_parameters("{{1}").test(1));
}

TEST_CASE("indices above the limit are not placeholders", "[format]") {
    REQUIRE(format_parameters("{65535}").test(65535));
    REQUIRE(format_parameters("{65536}").empty());
    REQUIRE(format_parameters("{99999999999999999999}").empty());
}

TEST_CASE("masks beyond 64 bits compare by content", "[format]") {
    auto a = format_parameters("{70} {3}");
    auto b = format_parameters("{3}{70}");
    auto c = format_parameters("{3}");
    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a.to_string() == "{3,70}");
}

TEST_CASE("mismatch needs two distinct placeholder sets", "[format]") {
    REQUIRE_FALSE(has_format_parameter_mismatch({}));
    REQUIRE_FALSE(has_format_parameter_mismatch({"Hello {0}"}));
    REQUIRE(has_format_parameter_mismatch({"Hello {0}", "Bonjour"}));
    REQUIRE_FALSE(has_format_parameter_mismatch({"Hello {0}", "Bonjour {0}"}));
    REQUIRE_FALSE(has_format_parameter_mismatch({"Hi", ""}));
    REQUIRE_FALSE(has_format_parameter_mismatch({"", "", ""}));
    REQUIRE(has_format_parameter_mismatch({"{0} {1}", "", "{1} {0}", "{0}"}));
}

TEST_CASE("order and repetition of placeholders do not matter", "[format]") {
    REQUIRE_FALSE(has_format_parameter_mismatch({"{0} and {1}", "{1}, {0}, {1}"}));
}

TEST_CASE("format_parameter_error compares against the neutral value", "[format]") {
    REQUIRE(format_parameter_error("Hello {0}", "Bonjour") == kFormatParameterMismatchError);
    REQUIRE(format_parameter_error("Hello {0}", "Bonjour {0}").empty());
    REQUIRE(format_parameter_error("Hello {0}", "").empty());
    REQUIRE(format_parameter_error("", "Bonjour {0}").empty());
}
