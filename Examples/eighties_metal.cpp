// 80s metal bands kept in an in-memory SQLite table, with a notifier that
// prints the full list after every change.

#include <TabulaCore.hpp>
#include <TabulaSqlite.hpp>
#include <chrono>
#include <iostream>

enum class MetalSubGenre { death, thrash, speed, hair, doom, sludge };

static const std::vector<MetalSubGenre>& genres() {
    static const std::vector<MetalSubGenre> values = {
        MetalSubGenre::death, MetalSubGenre::thrash, MetalSubGenre::speed,
        MetalSubGenre::hair, MetalSubGenre::doom, MetalSubGenre::sludge
    };
    return values;
}

static const char* genre_name(MetalSubGenre genre) {
    switch (genre) {
        case MetalSubGenre::death: return "death";
        case MetalSubGenre::thrash: return "thrash";
        case MetalSubGenre::speed: return "speed";
        case MetalSubGenre::hair: return "hair";
        case MetalSubGenre::doom: return "doom";
        case MetalSubGenre::sludge: return "sludge";
    }
    return "unknown";
}

static tabula::timestamp_t date(int y, unsigned m, unsigned d) {
    return std::chrono::sys_days{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}};
}

struct Album : tabula::entity<Album> {
    Album(std::string name = "", tabula::timestamp_t release = {}, tabula::duration_t length = {}) {
        add(tabula::scalar_member("name", std::move(name)));
        add(tabula::timestamp_member("release", release));
        add(tabula::duration_member("length", length));
    }

    std::string name() const { return member(0).get<std::string>(); }
    std::chrono::minutes length() const { return member(2).get<std::chrono::minutes>(); }
};

// Activity period, stored as a nested map of two timestamps
class ActiveRange : public tabula::serializable {
public:
    ActiveRange() = default;
    ActiveRange(tabula::timestamp_t start, tabula::timestamp_t end)
        : start_("start", start), end_("end", end) {}

    tabula::row_t to_row() const override {
        return {{"start", start_.to_wire()}, {"end", end_.to_wire()}};
    }

    void from_row(const tabula::row_t& row) override {
        for (auto* m : {&start_, &end_}) {
            auto it = row.find(m->key());
            if (it == row.end()) throw tabula::unknown_field_error(m->key());
            m->from_wire(it->second);
        }
    }

private:
    tabula::timestamp_member start_{"start", {}};
    tabula::timestamp_member end_{"end", {}};
};

struct EightiesMetal : tabula::entity<EightiesMetal> {
    EightiesMetal(std::string name = "",
                  Album album = Album(),
                  MetalSubGenre genre = MetalSubGenre::thrash,
                  bool defunct = false,
                  tabula::timestamp_t formed = {},
                  std::vector<ActiveRange> active = {},
                  std::vector<std::string> band_members = {},
                  std::vector<int64_t> studio_album_years = {},
                  tabula::blob_t logo = {}) {
        // The first member is the primary key
        add(tabula::scalar_member("name", std::move(name)));
        add(tabula::object_member("album", std::move(album)));
        add(tabula::enum_member("type", genre, genres()));
        add(tabula::bool_member("defunct", defunct));
        add(tabula::timestamp_member("formed", formed));
        add(tabula::object_list_member("active", active));
        add(tabula::scalar_list_member("members", band_members));
        add(tabula::scalar_list_member("studioAlbumYears", studio_album_years));
        add(tabula::binary_member("logo", std::move(logo)));
    }

    std::string name() const { return member(0).get<std::string>(); }
    Album album() const { return member(1).get<Album>(); }
    MetalSubGenre genre() const { return member(2).get<MetalSubGenre>(); }
    void set_genre(MetalSubGenre genre) { member(2).set(genre); }
    bool defunct() const { return member(3).get<bool>(); }
    std::vector<std::string> band_members() const { return member(6).get<std::vector<std::string>>(); }
};

TABULA_REGISTER(EightiesMetal);

static void print(const std::vector<EightiesMetal>& bands) {
    std::cout << "-- " << bands.size() << " band(s)" << std::endl;
    for (const auto& band : bands) {
        auto album = band.album();
        std::cout << "   " << band.name() << " [" << genre_name(band.genre()) << "]"
                  << (band.defunct() ? " (defunct)" : "")
                  << ", " << band.band_members().size() << " members"
                  << ", best album: " << album.name() << " (" << album.length().count() << " min)"
                  << std::endl;
    }
}

int main(int argc, char** argv) {
    tabula::configuration config(argc > 1 ? argv[1] : ":memory:");
    config.log = tabula::log_level::warn;

    try {
        auto backend = std::make_shared<tabula::sqlite_store>(config);
        backend->ensure_tables();

        std::cout << "CREATE TABLE IF NOT EXISTS " << EightiesMetal().describe_table() << std::endl;

        tabula::notifier<EightiesMetal> bands(backend, config);
        auto token = bands.observe(print);

        using std::chrono::minutes;
        using std::chrono::seconds;

        EightiesMetal slayer(
            "Slayer",
            Album("Reign in Blood", date(1986, 10, 7), minutes{28} + seconds{55}),
            MetalSubGenre::thrash, true, date(1981, 1, 1),
            {ActiveRange(date(1981, 1, 1), date(2019, 11, 30))},
            {"Tom Araya", "Kerry King", "Jeff Hanneman", "Dave Lombardo"},
            {1983, 1985, 1986, 1988, 1990, 1994, 1998, 2001, 2006, 2009, 2015});

        EightiesMetal metallica(
            "Metallica",
            Album("Master of Puppets", date(1986, 3, 3), minutes{54} + seconds{47}),
            MetalSubGenre::thrash, false, date(1981, 10, 28),
            {ActiveRange(date(1981, 10, 28), date(2024, 1, 1))},
            {"James Hetfield", "Lars Ulrich", "Kirk Hammett", "Robert Trujillo"},
            {1983, 1984, 1986, 1988, 1991});

        EightiesMetal megadeth(
            "Megadeth",
            Album("Rust in Peace", date(1990, 9, 24), minutes{40} + seconds{36}),
            MetalSubGenre::speed, false, date(1983, 1, 1),
            {ActiveRange(date(1983, 1, 1), date(2002, 4, 1)),
             ActiveRange(date(2004, 1, 1), date(2024, 1, 1))},
            {"Dave Mustaine", "James LoMenzo", "Dirk Verbeuren", "Teemu Mantysaari"},
            {1985, 1986, 1988, 1990});

        bands.create(slayer);
        bands.create(metallica);
        bands.create(megadeth);

        megadeth.set_genre(MetalSubGenre::thrash);
        bands.update(megadeth);

        bands.remove(std::string("Metallica"));

        try {
            bands.update(EightiesMetal("Venom"));
        } catch (const tabula::no_rows_affected_error& e) {
            std::cout << "Not stored: " << e.what() << std::endl;
        }

        bands.remove_all();
        bands.dispose();
    } catch (const tabula::tabula_error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
