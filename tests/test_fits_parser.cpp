#include "photnorm/PhotometryParsers.hpp"
#include "TestHelpers.hpp"

#include <CCfits/CCfits>
#include <catch2/catch.hpp>
#include <string>
#include <vector>

using namespace photnorm;

namespace {

// VizieR style table: JD, m, band (+ a colour index row)
std::string write_vizier_table(const test::fs::path& p, bool with_band = true)
{
    std::vector<std::string> names{"JD", "m", "n_m"};
    std::vector<std::string> forms{"1D", "1E", "4A"};
    std::vector<std::string> units{"d", "mag", ""};
    if (with_band) {
        names.push_back("band");
        forms.push_back("8A");
        units.push_back("");
    }
    {
        CCfits::FITS fits("!" + p.string(), CCfits::Write);
        CCfits::Table* t = fits.addTable("phot", 3, names, forms, units);

        std::vector<double>      jd{2429000.5, 2429001.5, 2429002.5};
        std::vector<float>       m{11.5f, 11.75f, 0.5f};
        std::vector<std::string> note{"", ":", ""};
        t->column("JD").write(jd, 1);
        t->column("m").write(m, 1);
        t->column("n_m").write(note, 1);
        if (with_band) {
            std::vector<std::string> band{"B", "V", "(B-V)"};
            t->column("band").write(band, 1);
        }
    }
    return p.string();
}

} // namespace

TEST_CASE("fits_parser_reads_first_table_extension") {
    test::TempDir tmp;
    const auto path = write_vizier_table(tmp.path / "vizier.fits");
    const RawFile f = read_raw_file(path);

    FitsTableParser p;
    REQUIRE(p.applicable(f));

    auto t = p.parse(f);
    REQUIRE(t.has_value());
    REQUIRE(t->size() == 2);                    // "(B-V)" dropped
    REQUIRE(t->time[0] == 2429000.5);
    REQUIRE(t->mag[1] == Approx(11.75));
    REQUIRE(t->band[0] == "B");
    REQUIRE(t->band[1] == "V");
    REQUIRE(t->reference[0] == "N/A");
}

TEST_CASE("fits_parser_is_reached_through_the_chain") {
    test::TempDir tmp;
    const auto path = write_vizier_table(tmp.path / "vizier.dat");   // extension ignored

    auto r = load_photometry(path);
    REQUIRE(r.has_value());
    REQUIRE(r->parser == "fits");
}

TEST_CASE("fits_parser_needs_band_column") {
    test::TempDir tmp;
    const auto path = write_vizier_table(tmp.path / "noband.fits", false);

    FitsTableParser p;
    REQUIRE_FALSE(p.parse(read_raw_file(path)).has_value());
}

TEST_CASE("fits_parser_survives_truncated_file") {
    test::TempDir tmp;
    const auto path = test::write_file(tmp.path / "broken.fits",
                                       "SIMPLE  =                    T / truncated");
    FitsTableParser p;
    const RawFile f = read_raw_file(path.string());
    REQUIRE(p.applicable(f));
    REQUIRE_FALSE(p.parse(f).has_value());
}
