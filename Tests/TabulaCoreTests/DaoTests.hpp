#pragma once

#include "Models.hpp"
#include <TabulaSqlite.hpp>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace dao_tests {

using namespace models;

inline std::shared_ptr<tabula::sqlite_store> make_store() {
    return std::make_shared<tabula::sqlite_store>();
}

// ============================================================================
// test_create_and_get - rows come back equal, in insertion order
// ============================================================================

void test_create_and_get() {
    std::cout << "  test_create_and_get..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(EightiesMetal{});

    tabula::dao<EightiesMetal> bands(backend);
    assert(bands.table() == "EightiesMetal");
    assert(bands.get().empty());

    auto band = slayer();
    auto row_id = bands.create(band);
    assert(row_id == 1);

    auto all = bands.get();
    assert(all.size() == 1);
    assert(all[0] == band);
    assert(all[0].album().length() == std::chrono::seconds{1735});

    bands.create(metallica());
    all = bands.get();
    assert(all.size() == 2);
    assert(all[0].name() == "Slayer");
    assert(all[1].name() == "Metallica");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_slayer_lifecycle - insert, flag defunct, delete by name
// ============================================================================

void test_slayer_lifecycle() {
    std::cout << "  test_slayer_lifecycle..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(EightiesMetal{});
    tabula::dao<EightiesMetal> bands(backend);

    auto band = slayer();
    band.set_defunct(false);
    bands.create(band);

    auto all = bands.get();
    assert(all.size() == 1);
    assert(all[0] == band);
    assert(!all[0].defunct());

    band.set_defunct(true);
    assert(bands.update(band) == 1);

    all = bands.get();
    assert(all.size() == 1);
    assert(all[0].defunct());
    assert(all[0] == band);

    assert(bands.remove(std::string("Slayer")) == 1);
    assert(bands.get().empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_update - full row rewritten, matched on the primary key
// ============================================================================

void test_update() {
    std::cout << "  test_update..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(EightiesMetal{});
    tabula::dao<EightiesMetal> bands(backend);

    auto band = slayer();
    bands.create(band);
    bands.create(metallica());

    band.set_genre(MetalSubGenre::speed);
    assert(bands.update(band) == 1);

    auto all = bands.get();
    assert(all[0].genre() == MetalSubGenre::speed);
    assert(all[1].genre() == MetalSubGenre::thrash);

    // Nothing stored under this name
    bool threw = false;
    try {
        bands.update(EightiesMetal("Venom"));
    } catch (const tabula::no_rows_affected_error& e) {
        threw = true;
        assert(e.operation() == "update");
        assert(e.table() == "EightiesMetal");
    }
    assert(threw);
    assert(bands.get().size() == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_remove - by key, by object, and everything
// ============================================================================

void test_remove() {
    std::cout << "  test_remove..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(EightiesMetal{});
    tabula::dao<EightiesMetal> bands(backend);

    bands.create(slayer());
    bands.create(metallica());
    bands.create(EightiesMetal("Anthrax"));

    assert(bands.remove(std::string("Slayer")) == 1);
    assert(bands.get().size() == 2);

    bool threw = false;
    try {
        bands.remove(std::string("Slayer"));
    } catch (const tabula::no_rows_affected_error& e) {
        threw = true;
        assert(e.operation() == "remove");
    }
    assert(threw);

    assert(bands.remove(metallica()) == 1);

    threw = false;
    try {
        bands.remove(metallica());
    } catch (const tabula::no_rows_affected_error&) {
        threw = true;
    }
    assert(threw);

    assert(bands.remove_all() == 1);
    assert(bands.get().empty());
    assert(bands.remove_all() == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_where_clause - composite predicate over the key members
// ============================================================================

void test_where_clause() {
    std::cout << "  test_where_clause..." << std::flush;

    auto [where, args] = tabula::dao<ChartEntry>::where_clause(ChartEntry("A", 2000, 9));
    assert(where == "artist = ? AND year = ?");
    assert(args.size() == 2);
    assert(std::get<std::string>(args[0]) == "A");
    assert(std::get<int64_t>(args[1]) == 2000);

    auto [single_where, single_args] = tabula::dao<EightiesMetal>::where_clause(slayer());
    assert(single_where == "name = ?");
    assert(single_args.size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_composite_remove - default values are match criteria, not wildcards
// ============================================================================

void test_composite_remove() {
    std::cout << "  test_composite_remove..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(ChartEntry{});
    tabula::dao<ChartEntry> chart(backend);

    chart.create(ChartEntry("A", 2000, 1));
    chart.create(ChartEntry("A", 2001, 2));

    bool threw = false;
    try {
        chart.remove(ChartEntry("A"));
    } catch (const tabula::no_rows_affected_error&) {
        threw = true;
    }
    assert(threw);
    assert(chart.get().size() == 2);

    assert(chart.remove(ChartEntry("A", 2000)) == 1);
    auto left = chart.get();
    assert(left.size() == 1);
    assert(left[0].year() == 2001);
    assert(left[0].rank() == 2);

    // Updating by composite key touches only the matching row
    chart.create(ChartEntry("B", 2001, 5));
    assert(chart.update(ChartEntry("A", 2001, 3)) == 1);
    for (const auto& entry : chart.get()) {
        assert(entry.rank() == (entry.artist() == "A" ? 3 : 5));
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_multi_row_remove - a table without a uniqueness constraint
// ============================================================================

void test_multi_row_remove() {
    std::cout << "  test_multi_row_remove..." << std::flush;

    auto backend = make_store();
    backend->db().execute("CREATE TABLE ChartEntry (artist TEXT, year INTEGER, rank INTEGER)");
    tabula::dao<ChartEntry> chart(backend);

    chart.create(ChartEntry("B", 1999, 1));
    chart.create(ChartEntry("B", 1999, 2));
    chart.create(ChartEntry("B", 2000, 3));

    assert(chart.remove(ChartEntry("B", 1999)) == 2);
    assert(chart.get().size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_projection - a column subset cannot rebuild the record
// ============================================================================

void test_projection() {
    std::cout << "  test_projection..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(EightiesMetal{});
    tabula::dao<EightiesMetal> bands(backend);
    bands.create(slayer());

    auto rows = backend->query("EightiesMetal", std::vector<std::string>{"name", "type"});
    assert(rows.size() == 1);
    assert(rows[0].size() == 2);

    bool threw = false;
    try {
        bands.get(std::vector<std::string>{"name", "type"});
    } catch (const tabula::unknown_field_error& e) {
        threw = true;
        assert(e.key() == "album");
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_store_errors - SQLite failures surface as db_error
// ============================================================================

void test_store_errors() {
    std::cout << "  test_store_errors..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(EightiesMetal{});
    tabula::dao<EightiesMetal> bands(backend);
    bands.create(slayer());

    bool threw = false;
    try {
        bands.create(slayer());
    } catch (const tabula::db_error&) {
        threw = true;
    }
    assert(threw);
    assert(bands.get().size() == 1);

    // No table for this type
    tabula::dao<Switch> switches(backend);
    threw = false;
    try {
        (void)switches.get();
    } catch (const tabula::db_error&) {
        threw = true;
    }
    assert(threw);

    // db_error is part of the tabula hierarchy
    threw = false;
    try {
        backend->db().execute("NOT SQL");
    } catch (const tabula::tabula_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unencodable_values - rejected before the store sees them
// ============================================================================

void test_unencodable_values() {
    std::cout << "  test_unencodable_values..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(EightiesMetal{});
    tabula::dao<EightiesMetal> bands(backend);
    bands.create(metallica());

    auto band = slayer();
    band.member("members").set(std::vector<std::string>{"Tom Araya", "Kerry King", "Jeff Hanneman", "Dave L\xF6mbardo"});

    bool threw = false;
    try {
        bands.create(band);
    } catch (const tabula::encode_error&) {
        threw = true;
    }
    assert(threw);

    // The table stays readable
    auto all = bands.get();
    assert(all.size() == 1);
    assert(all[0] == metallica());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_transaction_guard - rolled back unless committed
// ============================================================================

void test_transaction_guard() {
    std::cout << "  test_transaction_guard..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(ChartEntry{});
    auto& db = backend->db();
    tabula::dao<ChartEntry> chart(backend);
    assert(!db.is_in_transaction());

    {
        tabula::transaction tx(db);
        assert(db.is_in_transaction());
        chart.create(ChartEntry("Slayer", 1986, 1));
        assert(chart.get().size() == 1);
    }
    assert(!db.is_in_transaction());
    assert(chart.get().empty());

    {
        tabula::transaction tx(db);
        chart.create(ChartEntry("Slayer", 1986, 1));
        chart.create(ChartEntry("Metallica", 1986, 2));
        tx.commit();
        assert(!db.is_in_transaction());
    }
    assert(chart.get().size() == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_bool_decode_from_store - any nonzero integer reads back as true
// ============================================================================

void test_bool_decode_from_store() {
    std::cout << "  test_bool_decode_from_store..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(Switch{});
    backend->db().execute("INSERT INTO Switch (name, enabled) VALUES ('zero', 0), ('one', 1), ('two', 2)");

    tabula::dao<Switch> switches(backend);
    auto all = switches.get();
    assert(all.size() == 3);
    assert(!all[0].enabled());
    assert(all[1].enabled());
    assert(all[2].enabled());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_ensure_tables - every registered schema, column types preserved
// ============================================================================

void test_ensure_tables() {
    std::cout << "  test_ensure_tables..." << std::flush;

    auto backend = make_store();
    backend->ensure_tables();

    assert(backend->db().table_exists("Album"));
    assert(backend->db().table_exists("EightiesMetal"));
    assert(backend->db().table_exists("ChartEntry"));
    assert(!backend->db().table_exists("Switch"));

    auto info = backend->db().get_table_info("Album");
    assert(info.size() == 3);
    assert(info["name"] == "TEXT");
    assert(info["length"] == "BIGINT");

    // Idempotent
    backend->ensure_tables();
    backend->ensure_table(Album{});

    tabula::dao<Album> albums(backend);
    albums.create(Album("Show No Mercy", make_date(1983, 12, 3), std::chrono::minutes{35}));
    assert(albums.get().at(0).release() == make_date(1983, 12, 3));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_real_column - REAL values and an overridden table name
// ============================================================================

void test_real_column() {
    std::cout << "  test_real_column..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(Gig{});
    tabula::dao<Gig> gigs(backend);
    assert(gigs.table() == "gigs");

    gigs.create(Gig("Hammersmith Odeon", 3487.0));
    gigs.create(Gig("The Ritz", 1500.5));
    auto all = gigs.get();
    assert(all.size() == 2);
    assert(all[0].capacity() == 3487.0);
    assert(all[1].capacity() == 1500.5);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_repository - pass-through over the DAO
// ============================================================================

void test_repository() {
    std::cout << "  test_repository..." << std::flush;

    auto backend = make_store();
    backend->ensure_table(EightiesMetal{});
    tabula::repository<EightiesMetal> repo(backend);

    assert(repo.create(slayer()) == 1);
    assert(repo.create(metallica()) == 2);

    auto band = slayer();
    band.set_genre(MetalSubGenre::death);
    assert(repo.update(band) == 1);
    assert(repo.get()[0].genre() == MetalSubGenre::death);

    assert(repo.remove(band) == 1);
    assert(repo.remove(std::string("Metallica")) == 1);
    assert(repo.remove_all() == 0);

    bool threw = false;
    try {
        repo.remove(std::string("Metallica"));
    } catch (const tabula::no_rows_affected_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_file_database - WAL file database survives reopening
// ============================================================================

void test_file_database() {
    std::cout << "  test_file_database..." << std::flush;

    auto path = (std::filesystem::temp_directory_path() /
                 ("tabula_dao_" + std::to_string(std::rand()) + ".db")).string();

    {
        tabula::configuration config(path);
        auto writer = std::make_shared<tabula::sqlite_store>(config);
        writer->ensure_table(EightiesMetal{});
        tabula::dao<EightiesMetal> bands(writer);
        bands.create(slayer());

        auto mode = writer->db().query("PRAGMA journal_mode");
        assert(std::get<std::string>(mode.at(0).at("journal_mode")) == "wal");

        // Concurrent read-only connection
        tabula::configuration reader_config(path);
        reader_config.read_only = true;
        auto reader = std::make_shared<tabula::sqlite_store>(reader_config);
        tabula::dao<EightiesMetal> readonly_bands(reader);
        auto all = readonly_bands.get();
        assert(all.size() == 1);
        assert(all[0] == slayer());

        bool threw = false;
        try {
            readonly_bands.create(metallica());
        } catch (const tabula::db_error&) {
            threw = true;
        }
        assert(threw);
    }

    {
        auto backend = std::make_shared<tabula::sqlite_store>(tabula::configuration(path));
        tabula::dao<EightiesMetal> bands(backend);
        assert(bands.get().size() == 1);
        bands.create(metallica());
        assert(bands.get().size() == 2);
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all access layer tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Access Layer Tests ---" << std::endl;

    test_create_and_get();
    test_slayer_lifecycle();
    test_update();
    test_remove();
    test_where_clause();
    test_composite_remove();
    test_multi_row_remove();
    test_projection();
    test_store_errors();
    test_unencodable_values();
    test_transaction_guard();
    test_bool_decode_from_store();
    test_ensure_tables();
    test_real_column();
    test_repository();
    test_file_database();

    std::cout << "--- Access Layer Tests: All passed ---" << std::endl;
}

} // namespace dao_tests
