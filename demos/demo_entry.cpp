// demo_entry.cpp
//
// A small standalone program that walks one resource entity through the
// typical editing steps: load three cultures, edit translations, look at the
// validation state, and rename keys (one accepted, one rejected).  Run it as:
//
//     ./resx_demo                     # built-in defaults
//     ./resx_demo my_config.toml      # with a config file
//
// Watch stderr for log output and stdout for the entry state.

#include <resx/config.hpp>
#include <resx/log.hpp>
#include <resx/resource_entity.hpp>

#include <iostream>
#include <string>

using namespace resx;

// ---------------------------------------------------------------------------
// Setup
// ---------------------------------------------------------------------------

static Result<Config> load_config(int argc, char** argv) {
    if (argc < 2) {
        return Result<Config>::ok(Config{});
    }
    return Config::load(argv[1]);
}

static Status fill_entity(ResourceEntity& entity) {
    auto de = entity.add_language(CultureKey::parse("de").value());
    RESX_TRY(de);
    auto fr = entity.add_language(CultureKey::parse("fr").value());
    RESX_TRY(fr);

    auto& neutral = entity.neutral_language();
    neutral.set_value("Greeting", "Hello {0}, you have {1} new messages");
    neutral.set_comment("Greeting", "{0} = user name, {1} = count");
    de.value()->set_value("Greeting", "Hallo {0}, du hast {1} neue Nachrichten");
    fr.value()->set_value("Greeting", "Bonjour {0}");

    neutral.set_value("Brand", "Contoso");
    neutral.set_value("Farewell", "Goodbye");
    de.value()->set_value("Farewell", "Auf Wiedersehen");

    return entity.load_entries();
}

static void print_entry(const ResourceEntry& entry) {
    std::cout << entry.key();
    if (entry.is_invariant()) std::cout << " (invariant)";
    if (entry.has_format_parameter_mismatch()) std::cout << " [mismatch]";
    std::cout << "\n";

    auto errors = entry.errors().items();
    auto values = entry.values().items();
    for (size_t i = 0; i < values.size(); ++i) {
        std::cout << "  " << values[i].first.display_name() << ": \""
                  << values[i].second << "\"";
        if (!errors[i].second.empty()) std::cout << "  <- " << errors[i].second;
        std::cout << "\n";
    }
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
    auto config = load_config(argc, argv);
    if (config.is_err()) {
        std::cerr << config.error().format() << "\n";
        return 1;
    }
    config.value().apply_logging();

    ResourceEntity entity("Demo", "Resources", config.value());
    auto filled = fill_entity(entity);
    if (filled.is_err()) {
        std::cerr << filled.error().format() << "\n";
        return 1;
    }

    auto* greeting = entity.find("Greeting");
    greeting->subscribe([](Property p) {
        log::debug("Greeting: %s changed", property_name(p));
    });

    std::cout << "== loaded\n";
    for (auto* entry : entity.entries()) print_entry(*entry);

    auto fr = CultureKey::parse("fr").value();
    auto fixed = greeting->values().set(
        fr, "Bonjour {0}, vous avez {1} nouveaux messages");
    if (fixed.is_err()) {
        std::cerr << fixed.error().format() << "\n";
        return 1;
    }

    auto* brand = entity.find("Brand");
    auto invariant = brand->set_invariant(true);
    if (invariant.is_err()) {
        std::cerr << invariant.error().format() << "\n";
        return 1;
    }

    std::cout << "\n== after fixing fr and marking Brand invariant\n";
    print_entry(*greeting);
    print_entry(*brand);

    std::cout << "\n== rename Greeting -> Welcome\n";
    auto renamed = greeting->set_key("Welcome");
    std::cout << (renamed.is_ok() ? "ok" : renamed.error().format()) << "\n";

    std::cout << "\n== rename Welcome -> Farewell\n";
    auto rejected = greeting->set_key("Farewell");
    std::cout << (rejected.is_ok() ? "ok" : rejected.error().format()) << "\n";

    std::cout << "\n== final\n";
    for (auto* entry : entity.entries()) print_entry(*entry);
    return 0;
}
