#include "photnorm/JsonUtils.hpp"
#include "photnorm/Metadata.hpp"
#include "photnorm/Registry.hpp"
#include "TestHelpers.hpp"

#include <catch2/catch.hpp>
#include <cstdlib>
#include <stdexcept>

using namespace photnorm;
using nlohmann::json;

TEST_CASE("settings_parse_objects_sorted_with_defaults") {
    auto s = parse_settings(json::parse(R"({
        "rawDir":   "raw",
        "metadata": "meta.json",
        "objects": {
            "SN1954A": {"files": ["a.csv", {"name": "b.fits", "format": "fits"}]},
            "SN1937C": {"files": ["c.txt"], "magSystem": "AB"}
        }
    })"));

    REQUIRE(s.raw_dir == "raw");
    REQUIRE(s.output_dir == "snana_virgo_data");
    REQUIRE(s.survey == "VIRGO_PROJECT");
    REQUIRE(s.objects.size() == 2);
    REQUIRE(s.objects[0].name == "SN1937C");
    REQUIRE(s.objects[0].mag_system == "AB");

    const ObjectSpec* o = s.find("SN1954A");
    REQUIRE(o != nullptr);
    REQUIRE(o->mag_system == "Vega");
    REQUIRE(o->files.size() == 2);
    REQUIRE(o->files[0].format == "auto");
    REQUIRE(o->files[1].name == "b.fits");
    REQUIRE(o->files[1].format == "fits");
    REQUIRE(s.find("SN2000X") == nullptr);
}

TEST_CASE("settings_reject_malformed_content") {
    // no metadata catalogue
    REQUIRE_THROWS_AS(parse_settings(json::parse(R"({"objects": {}})")), std::runtime_error);
    // unknown parser name
    REQUIRE_THROWS_AS(parse_settings(json::parse(R"({
        "metadata": "m.json",
        "objects": {"X": {"files": [{"name": "a.xls", "format": "excel"}]}}
    })")), std::runtime_error);
    // files missing
    REQUIRE_THROWS_AS(parse_object("X", json::parse(R"({"magSystem": "Vega"})")),
                      std::runtime_error);
}

TEST_CASE("settings_load_expands_environment") {
    test::TempDir tmp;
    ::setenv("PHOTNORM_TEST_ROOT", "/data/virgo", 1);
    const auto p = test::write_file(tmp.path / "photnorm.json", R"({
        "rawDir": "${PHOTNORM_TEST_ROOT}/raw",
        "metadata": "m.json",
        "objects": {"SN1939A": {"files": ["x.csv"], "mag_system": "Vega"}}
    })");

    auto s = load_settings(p.string());
    REQUIRE(s.raw_dir == "/data/virgo/raw");
    REQUIRE(s.objects.at(0).files.at(0).name == "x.csv");
}

TEST_CASE("load_json_reports_missing_and_invalid_files") {
    test::TempDir tmp;
    REQUIRE_THROWS_AS(load_json((tmp.path / "none.json").string()), std::runtime_error);
    const auto bad = test::write_file(tmp.path / "bad.json", "{ not json");
    REQUIRE_THROWS_AS(load_json(bad.string()), std::runtime_error);
}

TEST_CASE("metadata_catalog_lookup") {
    JsonMetadataCatalog cat(json::parse(R"({
        "SN1939A": {"ra": 186.57, "dec": 4.33, "redshift": null, "mwebv": 0.02},
        "SN1960R": {"ra": 186.44, "dec": 12.9, "redshift": 0.0045},
        "SN1901B": {"dec": 10.0}
    })"));

    auto a = cat.lookup("SN1939A");
    REQUIRE(a.has_value());
    REQUIRE(a->ra == 186.57);
    REQUIRE(a->redshift == 0.0);
    REQUIRE(a->mwebv == 0.02);

    auto b = cat.lookup("SN1960R");
    REQUIRE(b->redshift == 0.0045);
    REQUIRE(b->mwebv == 0.0);

    REQUIRE_FALSE(cat.lookup("SN1901B").has_value());
    REQUIRE_FALSE(cat.lookup("SN2000X").has_value());

    REQUIRE_THROWS_AS(JsonMetadataCatalog(json::array()), std::runtime_error);
}

TEST_CASE("shipped_metadata_catalogue_note_is_not_an_object") {
    JsonMetadataCatalog cat(json::parse(R"({
        "_note": "one entry per registry object",
        "SN1939A": {"ra": 186.57, "dec": 4.33}
    })"));
    REQUIRE_FALSE(cat.lookup("_note").has_value());
    REQUIRE(cat.lookup("SN1939A").has_value());
}
