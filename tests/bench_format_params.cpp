#include <catch2/catch.hpp>
#include <resx/format_params.hpp>
#include <resx/resource_entity.hpp>
#include <chrono>
#include <string>

using namespace resx;

// One long value with many placeholders, alignments and format specs
static std::string generate_value(int placeholders) {
    std::string out;
    for (int i = 0; i < placeholders; ++i) {
        out += "item ";
        out += "{" + std::to_string(i % 100);
        if (i % 3 == 0) out += ",-8";
        if (i % 5 == 0) out += ":N2";
        out += "} ";
        out += "{not a placeholder} ";
    }
    return out;
}

TEST_CASE("format scan perf: 100K placeholders under 200ms", "[format][bench]") {
    auto value = generate_value(100000);

    auto start = std::chrono::steady_clock::now();
    auto mask = format_parameters(value);
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    REQUIRE(mask.count() == 100);
    CHECK(ms < 200);
}

TEST_CASE("entry validation perf: 2K entries x 8 cultures under 500ms", "[entry][bench]") {
    ResourceEntity entity("Bench", "Resources");
    std::vector<ResourceLanguage*> langs{&entity.neutral_language()};
    for (const char* name : {"de", "fr", "it", "es", "pt", "nl", "pl"}) {
        langs.push_back(entity.add_language(CultureKey::parse(name).value()).value());
    }
    for (int k = 0; k < 2000; ++k) {
        std::string key = "Key" + std::to_string(k);
        for (size_t l = 0; l < langs.size(); ++l) {
            // every 10th key drops {1} in one culture
            bool drop = (k % 10 == 0) && l == 3;
            langs[l]->set_value(key, drop ? "value {0}" : "value {0} of {1}");
        }
    }
    REQUIRE(entity.load_entries().is_ok());

    auto start = std::chrono::steady_clock::now();
    int mismatches = 0;
    for (auto* e : entity.entries()) {
        if (e->has_format_parameter_mismatch()) ++mismatches;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    REQUIRE(mismatches == 200);
    CHECK(ms < 500);
}
