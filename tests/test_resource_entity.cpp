#include <catch2/catch.hpp>
#include <resx/resource_entity.hpp>
#include <resx/log.hpp>

using namespace resx;

TEST_CASE("new entity has only the neutral culture", "[entity]") {
    ResourceEntity entity("App", "Resources");
    REQUIRE(entity.project_name() == "App");
    REQUIRE(entity.base_name() == "Resources");
    REQUIRE(entity.cultures().size() == 1);
    REQUIRE(entity.cultures().front().is_neutral());
    REQUIRE(entity.neutral_language().is_neutral());
    REQUIRE(entity.entry_count() == 0);
}

TEST_CASE("add_language rejects a culture twice", "[entity]") {
    ResourceEntity entity("App", "Resources");
    auto de = CultureKey::parse("de").value();
    REQUIRE(entity.add_language(de).is_ok());

    auto again = entity.add_language(CultureKey::parse("DE").value());
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == ResxError::DuplicateKey);

    auto neutral = entity.add_language(CultureKey::neutral());
    REQUIRE(neutral.is_err());
}

TEST_CASE("language_map keeps the neutral language first", "[entity]") {
    ResourceEntity entity("App", "Resources");
    entity.add_language(CultureKey::parse("fr").value()).value();
    entity.add_language(CultureKey::parse("de").value()).value();

    auto map = entity.language_map();
    REQUIRE(map.size() == 3);
    REQUIRE(map.neutral() == &entity.neutral_language());
    auto cultures = map.cultures();
    REQUIRE(cultures[1].name() == "fr");
    REQUIRE(cultures[2].name() == "de");
}

TEST_CASE("load_entries creates one entry per distinct key", "[entity]") {
    ResourceEntity entity("App", "Resources");
    auto* de = entity.add_language(CultureKey::parse("de").value()).value();
    entity.neutral_language().set_value("A", "a");
    entity.neutral_language().set_value("B", "b");
    de->set_value("B", "b-de");
    de->set_value("C", "c-de");

    REQUIRE(entity.load_entries().is_ok());
    auto entries = entity.entries();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0]->key() == "A");
    REQUIRE(entries[1]->key() == "B");
    REQUIRE(entries[2]->key() == "C");
    REQUIRE(&entries[0]->owner() == &entity);
}

TEST_CASE("add creates a key in the neutral culture", "[entity]") {
    ResourceEntity entity("App", "Resources");
    auto r = entity.add("Title");
    REQUIRE(r.is_ok());
    REQUIRE(r.value()->key() == "Title");
    REQUIRE(entity.neutral_language().key_exists("Title"));
    REQUIRE(entity.find("Title") == r.value());
}

TEST_CASE("add rejects empty and existing keys", "[entity]") {
    ResourceEntity entity("App", "Resources");
    auto* de = entity.add_language(CultureKey::parse("de").value()).value();
    de->set_value("OnlyGerman", "x");

    REQUIRE(entity.add("").error().code == ResxError::InvalidArg);
    REQUIRE(entity.add("OnlyGerman").error().code == ResxError::DuplicateKey);
    REQUIRE(entity.add("Title").is_ok());
    REQUIRE(entity.add("Title").error().code == ResxError::DuplicateKey);
}

TEST_CASE("renaming onto another entry key fails", "[entity]") {
    ResourceEntity entity("App", "Resources");
    auto* title = entity.add("Title").value();
    auto* other = entity.add("Other").value();
    REQUIRE(other->set_key("Title").error().code == ResxError::DuplicateKey);
    REQUIRE(title->set_key("Heading").is_ok());
    REQUIRE(entity.find("Heading") == title);
    REQUIRE(entity.find("Title") == nullptr);
}

TEST_CASE("remove deletes the key everywhere", "[entity]") {
    ResourceEntity entity("App", "Resources");
    auto* de = entity.add_language(CultureKey::parse("de").value()).value();
    entity.neutral_language().set_value("A", "a");
    de->set_value("A", "a-de");
    REQUIRE(entity.load_entries().is_ok());

    REQUIRE(entity.remove("A").is_ok());
    REQUIRE(entity.find("A") == nullptr);
    REQUIRE_FALSE(entity.neutral_language().key_exists("A"));
    REQUIRE_FALSE(de->key_exists("A"));

    REQUIRE(entity.remove("A").error().code == ResxError::NotFound);
}

TEST_CASE("remove refuses read-only cultures", "[entity]") {
    ResourceEntity entity("App", "Resources");
    auto* de = entity.add_language(CultureKey::parse("de").value()).value();
    entity.neutral_language().set_value("A", "a");
    de->set_value("A", "a-de");
    REQUIRE(entity.load_entries().is_ok());
    de->set_read_only(true);

    auto r = entity.remove("A");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ResxError::Immutable);
    REQUIRE(entity.find("A") != nullptr);
    REQUIRE(entity.neutral_language().key_exists("A"));
}

TEST_CASE("adding a culture extends existing entries", "[entity]") {
    ResourceEntity entity("App", "Resources");
    entity.neutral_language().set_value("Greeting", "Hello {0}");
    REQUIRE(entity.load_entries().is_ok());
    auto* e = entity.find("Greeting");

    std::vector<Property> seen;
    e->subscribe([&](Property p) { seen.push_back(p); });

    auto fr = CultureKey::parse("fr").value();
    auto* fr_lang = entity.add_language(fr).value();
    REQUIRE(e->languages().size() == 2);
    REQUIRE(e->values().get(fr).value().empty());
    REQUIRE_FALSE(seen.empty());
    REQUIRE(seen.front() == Property::Values);

    REQUIRE(e->values().set(fr, "Bonjour").value());
    REQUIRE(fr_lang->get_value("Greeting") == "Bonjour");
    REQUIRE(e->has_format_parameter_mismatch());
    REQUIRE(e->neutral_culture().is_neutral());
}

TEST_CASE("can_edit reflects culture presence and read-only state", "[entity]") {
    ResourceEntity entity("App", "Resources");
    auto de = CultureKey::parse("de").value();
    auto* de_lang = entity.add_language(de).value();
    REQUIRE(entity.can_edit(de));
    REQUIRE(entity.can_edit(CultureKey::neutral()));
    REQUIRE_FALSE(entity.can_edit(CultureKey::parse("it").value()));

    de_lang->set_read_only(true);
    REQUIRE_FALSE(entity.can_edit(de));
}

TEST_CASE("entities are equal by project and base name", "[entity]") {
    ResourceEntity a("App", "Resources");
    ResourceEntity b("App", "Resources");
    ResourceEntity c("Lib", "Resources");
    REQUIRE(a == b);
    REQUIRE(a.hash() == b.hash());
    REQUIRE(a != c);
}
