#include "photnorm/PhotometryParsers.hpp"
#include "TestHelpers.hpp"

#include <catch2/catch.hpp>
#include <cmath>
#include <stdexcept>

using namespace photnorm;

namespace {

const char* kDelimited =
    "Julian Date,Gregorian Day,Magnitude,Band,Ref\n"
    "2430000.5,1941 Jan 1,12.3,'B',\"Zwicky, F.\"\n"
    "2430001.5,1941 Jan 2,bad,V,IAUC 900\n"
    "\n"
    "2430002.5,1941 Jan 3,12.9,V\n";

const char* kTabular =
    "Julian Date\tGregorian Day\tMagnitude\tIndmag and Band\n"
    "2430000.5\t1941 Jan 1\t12.3\t'B' 0.05\n"
    "2430001.5\t1941 Jan 2\t12.5\tV\n";

const char* kNotes =
    "# photographic estimates\n"
    "JD  Date  Mag  Err  Band  Ref  Notes\n"
    "2428760.5  1937 Aug 28  8.4  0.1  pg  Baade 1938  maximum\n"
    "2428761.5  1937 Aug 29  8.6  null  pg  Baade 1938  hazy\n"
    "2428790.5  1937 Sep 27  > 12.0  null  pg  Baade 1938  limit\n";

/* ------------------------------------------------------------------- */
class StubParser final : public PhotometryParser {
public:
    StubParser(std::string name, bool applies, std::size_t rows, bool throws = false)
        : name_(std::move(name)), applies_(applies), rows_(rows), throws_(throws) {}

    std::string name() const override { return name_; }
    bool applicable(const RawFile&) const override { return applies_; }

    std::optional<PhotometryTable> parse(const RawFile&) const override
    {
        if (throws_) throw std::runtime_error("broken stub");
        std::vector<Observation> rows;
        for (std::size_t i = 0; i < rows_; ++i)
            rows.push_back({2430000.0 + double(i), 10.0, missing(), "B", "N/A"});
        return PhotometryTable::from_rows(rows);
    }

private:
    std::string name_;
    bool        applies_;
    std::size_t rows_;
    bool        throws_;
};

ParserChain stub_chain(std::vector<ParserPtr> v) { return ParserChain(std::move(v)); }

} // namespace

TEST_CASE("delimited_parser_reads_header_and_drops_bad_rows") {
    const RawFile f = make_raw_file(kDelimited);
    DelimitedTextParser p;
    REQUIRE(p.applicable(f));

    auto t = p.parse(f);
    REQUIRE(t.has_value());
    REQUIRE(t->size() == 2);
    REQUIRE(t->time[0] == 2430000.5);
    REQUIRE(t->band[0] == "B");                 // quotes stripped
    REQUIRE(t->reference[0] == "Zwicky, F.");
    REQUIRE(t->band[1] == "V");
    REQUIRE(t->reference[1] == "N/A");          // short row padded
    REQUIRE(std::isnan(t->magerr[0]));
}

TEST_CASE("delimited_parser_needs_time_and_magnitude_columns") {
    DelimitedTextParser p;
    REQUIRE_FALSE(p.applicable(make_raw_file("Date,Flux\n1,2\n")));
    REQUIRE_FALSE(p.applicable(make_raw_file(kTabular)));
    REQUIRE(p.applicable(make_raw_file("time,mag\n1,2\n")));
}

TEST_CASE("delimited_parser_rejects_rows_wider_than_header") {
    DelimitedTextParser p;
    auto t = p.parse(make_raw_file("JD,Mag\n1,2,3\n"));
    REQUIRE_FALSE(t.has_value());
}

TEST_CASE("tabular_parser_splits_indmag_and_band") {
    const RawFile f = make_raw_file(kTabular);
    TabularExportParser p;
    REQUIRE(p.applicable(f));

    auto t = p.parse(f);
    REQUIRE(t.has_value());
    REQUIRE(t->size() == 2);
    REQUIRE(t->band[0] == "B");
    REQUIRE(t->magerr[0] == Approx(0.05));
    REQUIRE(t->band[1] == "V");
    REQUIRE(std::isnan(t->magerr[1]));
}

TEST_CASE("tabular_parser_requires_full_header") {
    TabularExportParser p;
    REQUIRE_FALSE(p.applicable(make_raw_file("Julian Date\tMagnitude\n1\t2\n")));
}

TEST_CASE("notes_parser_skips_comments_and_limits") {
    const RawFile f = make_raw_file(kNotes);
    NotesAndLimitsParser p;
    REQUIRE(p.applicable(f));

    auto t = p.parse(f);
    REQUIRE(t.has_value());
    REQUIRE(t->size() == 2);
    REQUIRE(t->mag[0] == 8.4);
    REQUIRE(t->magerr[0] == Approx(0.1));
    REQUIRE(std::isnan(t->magerr[1]));          // "null"
    REQUIRE(t->band[1] == "pg");
    REQUIRE(t->reference[1] == "Baade 1938");
}

TEST_CASE("tabular_parser_uses_uncertainty_column_and_keeps_band_whole") {
    TabularExportParser p;
    auto t = p.parse(make_raw_file(
        "Julian Date\tGregorian Day\tMagnitude\tIndmag and Band\tUncertainty\n"
        "2430000.5\t1941 Jan 1\t12.3\tB\t0.1\n"
        "2430001.5\t1941 Jan 2\t12.5\t'B' 0.05\t0.2\n"));
    REQUIRE(t.has_value());
    REQUIRE(t->size() == 2);
    REQUIRE(t->magerr[0] == Approx(0.1));
    REQUIRE(t->magerr[1] == Approx(0.2));
    REQUIRE(t->band[0] == "B");
    REQUIRE(t->band[1] == "'B' 0.05");          // no split with an error column
}

TEST_CASE("tabular_parser_maps_reference_text") {
    TabularExportParser p;
    auto t = p.parse(make_raw_file(
        "Julian Date\tGregorian Day\tMagnitude\tIndmag and Band\tReference Text\n"
        "2430000.5\t1941 Jan 1\t12.3\tV\tHarvard plates\n"
        "2430001.5\t1941 Jan 2\t12.5\tV\t\n"));
    REQUIRE(t.has_value());
    REQUIRE(t->reference[0] == "Harvard plates");
    REQUIRE(t->reference[1] == "N/A");
}

TEST_CASE("notes_parser_pads_short_rows") {
    const RawFile f = make_raw_file(
        "JD  Date  Mag  Err  Band  Ref  Notes\n"
        "2428760.5  1937 Aug 28  8.4  0.1  pg  Baade 1938  maximum\n"
        "2428762.5  1937 Aug 30  8.9  0.2  pg\n"
        "2428763.5  1937 Aug 31  9.1  0.2\n");
    NotesAndLimitsParser p;
    REQUIRE(p.applicable(f));

    auto t = p.parse(f);
    REQUIRE(t.has_value());
    REQUIRE(t->size() == 3);
    REQUIRE(t->band[1] == "pg");
    REQUIRE(t->reference[1] == "N/A");
    REQUIRE(t->band[2] == kBlankBand);          // padded band cell
    REQUIRE(t->magerr[2] == Approx(0.2));
}

TEST_CASE("notes_parser_needs_seven_fields") {
    NotesAndLimitsParser p;
    REQUIRE_FALSE(p.applicable(make_raw_file(
        "JD  Mag  Band\n"
        "2428760.5  8.4  pg\n")));
}

TEST_CASE("chain_returns_nullopt_for_unparsable_bytes") {
    ParserChain chain;
    REQUIRE_FALSE(chain.try_parse(make_raw_file(std::string("\x01\x02\0\x03junk", 8))));
    REQUIRE_FALSE(chain.try_parse(make_raw_file("")));
    REQUIRE_FALSE(chain.try_parse(make_raw_file("hello world\nfoo bar\n")));
}

TEST_CASE("chain_does_not_read_fits_signature_as_text") {
    ParserChain chain;
    const RawFile f = make_raw_file("SIMPLE  =                    T\nJD,Mag\n1,2\n");
    REQUIRE(f.has_fits_signature());
    REQUIRE_FALSE(DelimitedTextParser{}.applicable(f));
    REQUIRE_FALSE(chain.try_parse(f));
}

TEST_CASE("chain_picks_the_matching_text_format") {
    ParserChain chain;
    REQUIRE(chain.try_parse(make_raw_file(kDelimited))->parser == "delimited");
    REQUIRE(chain.try_parse(make_raw_file(kTabular))->parser   == "tabular");
    REQUIRE(chain.try_parse(make_raw_file(kNotes))->parser     == "notes");
}

TEST_CASE("chain_default_order") {
    ParserChain chain;
    REQUIRE((chain.names() == std::vector<std::string>{"delimited", "tabular", "notes", "fits"}));
    REQUIRE(chain.find("fits") != nullptr);
    REQUIRE(chain.find("xlsx") == nullptr);
}

TEST_CASE("chain_earliest_applicable_parser_wins") {
    std::vector<ParserPtr> v;
    v.push_back(std::make_unique<StubParser>("first",  true, 1));
    v.push_back(std::make_unique<StubParser>("second", true, 3));
    auto chain = stub_chain(std::move(v));

    auto r = chain.try_parse(make_raw_file("x"));
    REQUIRE(r.has_value());
    REQUIRE(r->parser == "first");
    REQUIRE(r->table.size() == 1);
}

TEST_CASE("chain_falls_through_empty_or_failing_parsers") {
    std::vector<ParserPtr> v;
    v.push_back(std::make_unique<StubParser>("off",    false, 5));
    v.push_back(std::make_unique<StubParser>("empty",  true,  0));
    v.push_back(std::make_unique<StubParser>("throws", true,  2, true));
    v.push_back(std::make_unique<StubParser>("last",   true,  2));
    auto chain = stub_chain(std::move(v));

    auto r = chain.try_parse(make_raw_file("x"));
    REQUIRE(r.has_value());
    REQUIRE(r->parser == "last");
}

TEST_CASE("chain_forced_format") {
    ParserChain chain;
    REQUIRE(chain.try_parse(make_raw_file(kNotes), "notes")->parser == "notes");
    REQUIRE(chain.try_parse(make_raw_file(kNotes), "auto")->parser  == "notes");
    REQUIRE_FALSE(chain.try_parse(make_raw_file(kTabular), "delimited"));
    REQUIRE_THROWS_AS(chain.try_parse(make_raw_file(kNotes), "xlsx"), std::invalid_argument);
}

TEST_CASE("load_photometry_reads_from_disk") {
    test::TempDir tmp;
    const auto p = test::write_file(tmp.path / "phot.csv", kDelimited);

    auto r = load_photometry(p.string());
    REQUIRE(r.has_value());
    REQUIRE(r->parser == "delimited");
    REQUIRE(r->table.size() == 2);

    REQUIRE_THROWS_AS(load_photometry((tmp.path / "absent.csv").string()), std::runtime_error);
}
