#pragma once

#include "Models.hpp"
#include <cassert>
#include <functional>
#include <iostream>
#include <unordered_set>

namespace record_tests {

using namespace models;

// ============================================================================
// test_describe_table - column list followed by the primary key clause
// ============================================================================

void test_describe_table() {
    std::cout << "  test_describe_table..." << std::flush;

    EightiesMetal band;
    assert(band.table() == "EightiesMetal");
    assert(band.describe_table() ==
           "EightiesMetal (name TEXT,album TEXT,type INTEGER,defunct INTEGER,formed TEXT,"
           "active TEXT,members TEXT,studioAlbumYears TEXT,logo BLOB,PRIMARY KEY (name))");

    Album album;
    assert(album.describe_table() ==
           "Album (name TEXT,release TEXT,length BIGINT,PRIMARY KEY (name))");

    ChartEntry entry;
    assert(entry.describe_table() ==
           "ChartEntry (artist TEXT,year INTEGER,rank INTEGER,PRIMARY KEY (artist,year))");

    Gig gig;
    assert(gig.table() == "gigs");
    assert(gig.describe_table() == "gigs (venue TEXT,capacity REAL,PRIMARY KEY (venue))");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_primary_key_members - first member always, flagged members after it
// ============================================================================

void test_primary_key_members() {
    std::cout << "  test_primary_key_members..." << std::flush;

    ChartEntry entry("Slayer", 1986, 1);
    auto keys = entry.primary_key_members();
    assert(keys.size() == 2);
    assert(keys[0]->key() == "artist");
    assert(keys[1]->key() == "year");
    assert(entry.id_column() == "artist");

    // First member flagged as well: it must not appear twice
    FlaggedKey flagged(7, "seven");
    auto flagged_keys = flagged.primary_key_members();
    assert(flagged_keys.size() == 1);
    assert(flagged_keys[0]->key() == "id");
    assert(flagged.describe_table() == "FlaggedKey (id INTEGER,label TEXT,PRIMARY KEY (id))");

    auto schema = entry.schema();
    assert(schema.name == "ChartEntry");
    assert(schema.columns.size() == 3);
    assert(schema.columns[0].is_primary_key);
    assert(schema.columns[1].is_primary_key);
    assert(!schema.columns[2].is_primary_key);
    assert((schema.primary_key() == std::vector<std::string>{"artist", "year"}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_row_round_trip - to_row / from_map reproduce the record
// ============================================================================

void test_row_round_trip() {
    std::cout << "  test_row_round_trip..." << std::flush;

    auto band = slayer();
    auto row = band.to_row();
    assert(row.size() == 9);
    assert(std::get<std::string>(row.at("name")) == "Slayer");
    assert(std::get<int64_t>(row.at("type")) == 1);
    assert(std::get<int64_t>(row.at("defunct")) == 1);
    assert(std::get<std::string>(row.at("formed")) == "1981-01-01T00:00:00.000000Z");
    assert(std::get<std::string>(row.at("studioAlbumYears")) == "[1983,1985,1986,1988,1990]");
    assert(std::get<tabula::blob_t>(row.at("logo")).size() == 4);

    auto copy = EightiesMetal::from_map(row);
    assert(copy == band);
    assert(copy.name() == "Slayer");
    assert(copy.album().name() == "Reign in Blood");
    assert(copy.genre() == MetalSubGenre::thrash);
    assert(copy.defunct());
    assert(copy.formed() == make_date(1981, 1, 1));
    assert(copy.active().size() == 2);
    assert(copy.band_members().size() == 4);
    assert(copy.band_members()[1] == "Kerry King");
    assert(copy.studio_album_years().back() == 1990);
    assert(copy.logo() == band.logo());

    // Keys the record does not know about are ignored
    row["encore"] = std::string("Angel of Death");
    assert(EightiesMetal::from_map(row) == band);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unknown_field - a row without one of the member keys
// ============================================================================

void test_unknown_field() {
    std::cout << "  test_unknown_field..." << std::flush;

    auto row = slayer().to_row();
    row.erase("logo");

    bool threw = false;
    try {
        (void)EightiesMetal::from_map(row);
    } catch (const tabula::unknown_field_error& e) {
        threw = true;
        assert(e.key() == "logo");
        assert(std::string(e.what()) == "Unknown data member key: logo");
    }
    assert(threw);

    // A bad value inside an otherwise complete row
    row = slayer().to_row();
    row["formed"] = std::string("the early eighties");
    threw = false;
    try {
        (void)EightiesMetal::from_map(row);
    } catch (const tabula::decode_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_equality_and_hash
// ============================================================================

void test_equality_and_hash() {
    std::cout << "  test_equality_and_hash..." << std::flush;

    auto a = slayer();
    auto b = slayer();
    assert(a == b);
    assert(a.hash() == b.hash());

    b.set_genre(MetalSubGenre::speed);
    assert(a != b);

    // Changing any single member breaks equality, whatever its kind
    std::vector<std::function<void(EightiesMetal&)>> changes = {
        [](EightiesMetal& band) { band.member("name").set(std::string("Slayer II")); },
        [](EightiesMetal& band) {
            band.member("album").set(Album("Reign in Blood", make_date(1986, 10, 7), std::chrono::minutes{29}));
        },
        [](EightiesMetal& band) { band.set_genre(MetalSubGenre::death); },
        [](EightiesMetal& band) { band.set_defunct(false); },
        [](EightiesMetal& band) { band.member("formed").set(make_date(1982, 1, 1)); },
        [](EightiesMetal& band) {
            band.member("active").set(std::vector<DateRange>{DateRange(make_date(1981, 1, 1), make_date(1996, 1, 1))});
        },
        [](EightiesMetal& band) { band.member("members").set(std::vector<std::string>{"Tom Araya"}); },
        [](EightiesMetal& band) { band.member("studioAlbumYears").set(std::vector<int64_t>{1983}); },
        [](EightiesMetal& band) { band.member("logo").set(tabula::blob_t{0x00}); },
    };
    assert(changes.size() == a.members().size());
    for (const auto& change : changes) {
        auto changed = slayer();
        change(changed);
        assert(changed != a);
        assert(slayer() == a);
    }

    // Same member layout, different type
    Album album("Reign in Blood");
    Single single("Reign in Blood");
    assert(album != single);

    std::unordered_set<EightiesMetal, tabula::record_hash> bands;
    bands.insert(slayer());
    bands.insert(slayer());
    bands.insert(metallica());
    assert(bands.size() == 2);
    assert(bands.count(a) == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_schema_registry - TABULA_REGISTER at static init time
// ============================================================================

void test_schema_registry() {
    std::cout << "  test_schema_registry..." << std::flush;

    auto& registry = tabula::schema_registry::instance();

    auto* by_type = registry.get_schema(typeid(EightiesMetal));
    assert(by_type != nullptr);
    assert(by_type->name == "EightiesMetal");
    assert(by_type->columns.size() == 9);

    auto* by_name = registry.get_schema("ChartEntry");
    assert(by_name != nullptr);
    assert(by_name->describe() == ChartEntry().describe_table());

    assert(registry.get_schema(typeid(Switch)) == nullptr);
    assert(registry.get_schema("Nonexistent") == nullptr);
    assert(registry.all_schemas().size() >= 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all record tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Record Tests ---" << std::endl;

    test_describe_table();
    test_primary_key_members();
    test_row_round_trip();
    test_unknown_field();
    test_equality_and_hash();
    test_schema_registry();

    std::cout << "--- Record Tests: All passed ---" << std::endl;
}

} // namespace record_tests
