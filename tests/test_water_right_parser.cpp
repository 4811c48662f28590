#include <catch2/catch_all.hpp>
#include "../parse/wrx_department_parser.h"
#include "../parse/wrx_document_parser.h"
#include "../parse/wrx_root_parser.h"
#include "../utils/wrx_exceptions.h"
#include "test_report_events.h"

SCENARIO("Root pairs fill the water right metadata", "[parser][root]") {
    GIVEN("the root section of a report") {
        wrx_key_values root = {
            kv("Wasserbuchbeh\xC3\xB6rde", { "NLWKN Betriebsstelle Hannover" }),
            kv("Kennziffer", { "0815/1 (aktiv)" }),
            kv("erteilt durch /"),
            kv("abweichend"),
            kv("eingetragen durch:", { "Region Hannover" }),
            kv("erteilt durch:", { "-" }),
            kv("erteilt am:", { "01.02.2003" }),
            kv("erstmalig ertellt am:", { "03.04.1990" }),
            kv("Aktenzeichen:", { "66.31" }),
            kv("Das Recht ist befristet bis", { "31.12.2030" }),
            kv("Betreff:", { "Feldberegnung" })
        };
        wrx_water_right water_right(5);

        WHEN("it is parsed") {
            parse_root(root, water_right);

            THEN("each known key sets its field") {
                REQUIRE(*water_right.water_authority == "NLWKN Betriebsstelle Hannover");
                REQUIRE(*water_right.registering_authority == "Region Hannover");
                REQUIRE(*water_right.valid_from == "01.02.2003");
                REQUIRE(*water_right.initially_granted == "03.04.1990");
                REQUIRE(*water_right.file_reference == "66.31");
                REQUIRE(*water_right.valid_until == "31.12.2030");
                REQUIRE(*water_right.subject == "Feldberegnung");
            }

            THEN("the identifier is split into external identifier and status") {
                REQUIRE(*water_right.external_identifier == "0815/1");
                REQUIRE(*water_right.status == "aktiv");
            }

            THEN("dash values leave the field absent") {
                REQUIRE_FALSE(water_right.granting_authority);
            }
        }
    }

    GIVEN("a key the reports do not use") {
        wrx_key_values root = { kv("Rechtsinhaber:", { "Stadtwerke" }) };
        wrx_water_right water_right(5);

        THEN("parsing fails naming the key and values") {
            REQUIRE_THROWS_MATCHES(parse_root(root, water_right), wrx_unknown_key_error,
                Catch::Matchers::Message("invalid entry for the root, key: \"Rechtsinhaber:\", values: [\"Stadtwerke\"]"));
        }
    }

    GIVEN("an identifier without status") {
        wrx_key_values root = { kv("Kennziffer", { "X" }) };
        wrx_water_right water_right(5);

        THEN("parsing fails") {
            REQUIRE_THROWS_AS(parse_root(root, water_right), wrx_format_error);
        }
    }
}

SCENARIO("Department labels name abbreviation and description", "[parser][department]") {
    THEN("a dash separated label is split at the dash") {
        wrx_legal_department department = parse_department_label("E - Entnahme, Zutagef\xC3\xB6rderung");
        REQUIRE(department.abbreviation == wrx_department::E);
        REQUIRE(department.description == "Entnahme, Zutagef\xC3\xB6rderung");
    }

    THEN("a label without dash keeps the rest as description") {
        wrx_legal_department department = parse_department_label("A Entnahme...");
        REQUIRE(department.abbreviation == wrx_department::A);
        REQUIRE(department.description == "Entnahme...");
    }

    THEN("unknown abbreviations are rejected") {
        REQUIRE_THROWS_AS(parse_department_label("X - Sonstiges"), wrx_format_error);
        REQUIRE_THROWS_AS(parse_department_label("AB Entnahme"), wrx_format_error);
    }

    THEN("a missing description is rejected") {
        REQUIRE_THROWS_AS(parse_department_label("E"), wrx_format_error);
        REQUIRE_THROWS_AS(parse_department_label("E -"), wrx_format_error);
    }

    GIVEN("the same department in two sections") {
        std::vector<wrx_department_group> groups(2);
        groups[0].label = "E - Entnahme";
        groups[0].usage_locations = { { kv("Nutzungsort Lfd. Nr.:", { "1 (aktiv, real)" }) } };
        groups[1].label = "E - Entnahme (Fortsetzung)";
        groups[1].usage_locations = { { kv("Nutzungsort Lfd. Nr.:", { "2 (aktiv, real)" }) } };
        wrx_water_right water_right(9);

        WHEN("the departments are parsed") {
            parse_departments(groups, water_right);

            THEN("the usage locations are merged under the first description") {
                REQUIRE(water_right.legal_departments.size() == 1);
                const auto& department = water_right.legal_departments.at(wrx_department::E);
                REQUIRE(department.description == "Entnahme");
                REQUIRE(department.usage_locations.size() == 2);
                REQUIRE(*department.usage_locations[1].serial == "2");
            }
        }
    }
}

SCENARIO("Usage location pairs fill the typed fields", "[parser][usage_location]") {
    GIVEN("a complete usage location") {
        wrx_key_values items = {
            kv("Nutzungsort Lfd. Nr.:", { "3 (inaktiv, virtuell)" }),
            kv("Bezeichnung:", { "Brunnen\nNord" }),
            kv("Rechtszweck:", { "A70 Feldberegnung" }),
            kv("East und North:", { "32512345" }),
            kv("(ETRS89/UTM 32N)", { "5801234" }),
            kv("Top. Karte 1:25.000:", { "3 624", "Hannover" }),
            kv("Gemeindegebiet:", { "241001", "Hannover" }),
            kv("Gemarkung, Flur:", { "Foo 12" }),
            kv("Unterhaltungsverband:", { "41", "Leine" }),
            kv("Flurst\xC3\xBC" "ck:", { "17/2" }),
            kv("EU-Bearbeitungsgebiet:", { "21", "Leine/Ilme" }),
            kv("Gew\xC3\xA4sser:", { "Leine" }),
            kv("Einzugsgebietskennzahl:", { "488" }),
            kv("Verordnungszitat:", { "-" }),
            kv("Erlaubniswert:", { "Entnahmemenge 12 m\xC2\xB3/2a" }),
            kv("Erlaubniswert:", { "F\xC3\xB6rderleistung 30 m\xC2\xB3/h" })
        };
        wrx_usage_location usage_location;

        WHEN("it is parsed") {
            parse_usage_location(items, usage_location, wrx_department::E);

            THEN("header, name and purpose are set") {
                REQUIRE(*usage_location.serial == "3");
                REQUIRE(*usage_location.active == false);
                REQUIRE(*usage_location.real == false);
                REQUIRE(*usage_location.name == "Brunnen Nord");
                REQUIRE(usage_location.legal_purpose->first == "A70");
                REQUIRE(usage_location.legal_purpose->second == "Feldberegnung");
            }

            THEN("coordinates and codes are numbers") {
                REQUIRE(*usage_location.utm_easting == 32512345u);
                REQUIRE(*usage_location.utm_northing == 5801234u);
                REQUIRE(usage_location.map_excerpt->is_pair());
                REQUIRE(usage_location.map_excerpt->first() == 3624u);
                REQUIRE(usage_location.map_excerpt->second() == "Hannover");
                REQUIRE_FALSE(usage_location.catchment_area_code->is_pair());
                REQUIRE(usage_location.catchment_area_code->first() == 488u);
                REQUIRE(usage_location.municipal_area->first == 241001u);
                REQUIRE(usage_location.maintenance_association->second == "Leine");
                REQUIRE(usage_location.eu_survey_area->second == "Leine/Ilme");
            }

            THEN("the land record is typed") {
                REQUIRE(usage_location.land_record->is_expected());
                REQUIRE(usage_location.land_record->get_expected().district == "Foo");
                REQUIRE(usage_location.land_record->get_expected().field == 12);
            }

            THEN("the allowance values land in their rate records") {
                REQUIRE(usage_location.withdrawal_rates.size() == 1);
                REQUIRE(usage_location.pumping_rates.size() == 1);
                REQUIRE(usage_location.pumping_rates.begin()->get_expected().per.unit == wrx_duration_unit::hours);
            }

            THEN("dash values stay absent") {
                REQUIRE_FALSE(usage_location.regulation_citation);
                REQUIRE(*usage_location.plot == "17/2");
                REQUIRE(*usage_location.water_body == "Leine");
            }
        }
    }

    GIVEN("a numbered field with only its number") {
        wrx_key_values items = { kv("Gemeindegebiet:", { "241001" }) };
        wrx_usage_location usage_location;

        THEN("the arity mismatch fails the usage location") {
            REQUIRE_THROWS_AS(parse_usage_location(items, usage_location, wrx_department::E), wrx_unknown_key_error);
        }
    }

    GIVEN("more values than a key reads") {
        wrx_usage_location usage_location;

        THEN("a third value on a numbered field fails the usage location") {
            wrx_key_values items = { kv("Gemeindegebiet:", { "241001", "Hannover", "Linden" }) };
            REQUIRE_THROWS_AS(parse_usage_location(items, usage_location, wrx_department::E), wrx_unknown_key_error);
        }

        THEN("a second value on a single value field fails the usage location") {
            wrx_key_values items = { kv("Flurst\xC3\xBC" "ck:", { "17/2", "17/3" }) };
            REQUIRE_THROWS_AS(parse_usage_location(items, usage_location, wrx_department::E), wrx_unknown_key_error);
        }

        THEN("the surplus value is named in the error") {
            wrx_key_values items = { kv("Bezeichnung:", { "Brunnen Nord", "Brunnen S\xC3\xBC" "d" }) };
            try {
                parse_usage_location(items, usage_location, wrx_department::E);
                FAIL("surplus value accepted");
            } catch (const wrx_unknown_key_error& e) {
                REQUIRE(e.get_key() == "Bezeichnung:");
                REQUIRE(wrx_string(e.what()).find("Brunnen S\xC3\xBC" "d") != wrx_string::npos);
            }
        }
    }

    GIVEN("a malformed header") {
        wrx_key_values items = { kv("Nutzungsort Lfd. Nr.:", { "1" }) };
        wrx_usage_location usage_location;

        THEN("parsing fails") {
            REQUIRE_THROWS_AS(parse_usage_location(items, usage_location, wrx_department::E), wrx_format_error);
        }
    }

    GIVEN("an unknown key") {
        wrx_key_values items = { kv("Landkreis:", { "Hannover" }) };
        wrx_usage_location usage_location;

        THEN("parsing fails") {
            REQUIRE_THROWS_AS(parse_usage_location(items, usage_location, wrx_department::E), wrx_unknown_key_error);
        }
    }

    GIVEN("an empty usage location from the trailing flush") {
        wrx_usage_location usage_location;

        THEN("it parses to a location without fields") {
            REQUIRE_NOTHROW(parse_usage_location(wrx_key_values(), usage_location, wrx_department::E));
            REQUIRE_FALSE(usage_location.serial);
            REQUIRE(usage_location.withdrawal_rates.empty());
        }
    }
}

SCENARIO("Allowance values are routed by their kind", "[parser][allowance]") {
    wrx_usage_location usage_location;

    GIVEN("a withdrawal written with a colon") {
        parse_allowance_value("Entnahmemenge: 12 m\xC2\xB3/2a", usage_location, wrx_department::E);

        THEN("a typed rate per two years is recorded") {
            REQUIRE(usage_location.withdrawal_rates.size() == 1);
            const wrx_rate_value& rate = usage_location.withdrawal_rates.begin()->get_expected();
            REQUIRE(rate.value == 12);
            REQUIRE(rate.measurement == "m\xC2\xB3");
            REQUIRE(rate.per.unit == wrx_duration_unit::years);
            REQUIRE(rate.per.factor == 2);
        }
    }

    GIVEN("kinds with more than one word") {
        parse_allowance_value("Stauziel (H\xC3\xB6" "chststau), bezogen auf NN 52.4 m", usage_location, wrx_department::C);
        parse_allowance_value("Stauziel, bezogen auf NN 51 m", usage_location, wrx_department::C);
        parse_allowance_value("Abwasservolumenstrom, RW, Sekunde 15 l/s", usage_location, wrx_department::B);
        parse_allowance_value("Beregnungsfl\xC3\xA4" "che 40 ha", usage_location, wrx_department::E);

        THEN("each lands in its field") {
            REQUIRE(usage_location.dam_target_levels.max->value == Catch::Approx(52.4));
            REQUIRE(usage_location.dam_target_levels.default_level->unit == "m");
            REQUIRE_FALSE(usage_location.dam_target_levels.steady);
            REQUIRE(usage_location.waste_water_flow_volume.size() == 1);
            REQUIRE(usage_location.irrigation_area->value == 40);
            REQUIRE(usage_location.irrigation_area->unit == "ha");
        }
    }

    GIVEN("a rate that does not follow the grammar") {
        parse_allowance_value("Einleitungsmenge 12 m\xC2\xB3/Tag", usage_location, wrx_department::B);

        THEN("it is kept as fallback") {
            REQUIRE(usage_location.injection_rates.size() == 1);
            REQUIRE(usage_location.injection_rates.begin()->get_fallback() == "12 m\xC2\xB3/Tag");
        }
    }

    GIVEN("an unknown kind") {
        THEN("departments with injection limits record it as a limit") {
            parse_allowance_value("Phosphor gesamt 2 mg/l", usage_location, wrx_department::B);
            REQUIRE(usage_location.injection_limits.size() == 1);
            REQUIRE(usage_location.injection_limits[0].first == "Phosphor gesamt");
            REQUIRE(usage_location.injection_limits[0].second.value == 2);
            REQUIRE(usage_location.injection_limits[0].second.unit == "mg/l");
        }

        THEN("other departments fail") {
            REQUIRE_THROWS_AS(parse_allowance_value("Phosphor gesamt 2 mg/l", usage_location, wrx_department::E),
                              wrx_format_error);
        }
    }

    GIVEN("an allowance value without kind") {
        THEN("parsing fails") {
            REQUIRE_THROWS_AS(parse_allowance_value("12 m\xC2\xB3", usage_location, wrx_department::E), wrx_format_error);
            REQUIRE_THROWS_AS(parse_allowance_value("Stauziel, bezogen auf NN viel m", usage_location, wrx_department::C),
                              wrx_format_error);
        }
    }
}

SCENARIO("Whole reports are parsed from their key-value pairs", "[parser][document]") {
    wrx_document_parser parser;

    GIVEN("a minimal report with one department") {
        wrx_key_values pairs = {
            kv("Wasserbuchbeh\xC3\xB6rde", { "X" }),
            kv("Abteilung:", { "A Entnahme..." }),
            kv("Nutzungsort Lfd. Nr.:", { "1 (aktiv, real)" }),
            kv("Bezeichnung:", { "Brunnen 1" })
        };

        WHEN("it is parsed") {
            wrx_water_right water_right = parser.parse(4711, pairs);

            THEN("one department with one usage location results") {
                REQUIRE(water_right.no == 4711);
                REQUIRE(*water_right.water_authority == "X");
                REQUIRE(water_right.legal_departments.size() == 1);
                const auto& department = water_right.legal_departments.at(wrx_department::A);
                REQUIRE(department.usage_locations.size() == 1);
                REQUIRE(*department.usage_locations[0].active);
                REQUIRE(*department.usage_locations[0].real);
                REQUIRE(*department.usage_locations[0].name == "Brunnen 1");
            }
        }
    }

    GIVEN("a usage location with land records") {
        wrx_key_values typed = {
            kv("Abteilung:", { "E - Entnahme" }),
            kv("Nutzungsort Lfd. Nr.:", { "1 (aktiv, real)" }),
            kv("Gemarkung, Flur:", { "Foo12" })
        };
        wrx_key_values fallback = typed;
        fallback[2].second[0] = "12Foo";

        THEN("matching text is typed and other text kept as fallback") {
            wrx_water_right first = parser.parse(1, typed);
            wrx_water_right second = parser.parse(2, fallback);
            const auto& typed_record = *first.legal_departments.at(wrx_department::E).usage_locations[0].land_record;
            const auto& fallback_record = *second.legal_departments.at(wrx_department::E).usage_locations[0].land_record;
            REQUIRE(typed_record.is_expected());
            REQUIRE(typed_record.get_expected().district == "Foo");
            REQUIRE(typed_record.get_expected().field == 12);
            REQUIRE(fallback_record.is_fallback());
            REQUIRE(fallback_record.get_fallback() == "12Foo");
        }
    }

    GIVEN("a root key the parser does not know") {
        wrx_key_values pairs = {
            kv("Nutzungsort Lfd. Nr.:", { "1 (aktiv, real)" }),
            kv("Abteilung:", { "E - Entnahme" })
        };

        THEN("the report fails with an unknown key error") {
            REQUIRE_THROWS_AS(parser.parse(3, pairs), wrx_unknown_key_error);
        }
    }

    GIVEN("the drawing events of a report") {
        wrx_warnings warnings(4711);

        WHEN("they run through the whole pipeline") {
            wrx_water_right water_right = parser.parse(4711, sample_report_events(), warnings);

            THEN("the report is fully typed") {
                REQUIRE(*water_right.water_authority == "NLWKN Betriebsstelle");
                REQUIRE(*water_right.status == "aktiv");
                REQUIRE(*water_right.external_identifier == "12/3");
                const auto& department = water_right.legal_departments.at(wrx_department::E);
                REQUIRE(department.description == "Entnahme von Grundwasser");
                REQUIRE(department.usage_locations.size() == 1);
                const auto& rate = department.usage_locations[0].withdrawal_rates.begin()->get_expected();
                REQUIRE(rate.measurement == "m\xC2\xB3");
                REQUIRE(*water_right.annotation == "Bemerkung: wichtig");
                REQUIRE(warnings.empty());
            }
        }
    }
}

SCENARIO("Post processing cleans up a parsed water right", "[parser][post_process]") {
    GIVEN("a water right straight from the parser") {
        wrx_water_right water_right(77);
        water_right.annotation = wrx_string("Bemerkung: wichtig");
        water_right.registering_authority = wrx_string("Region Hannover");
        water_right.valid_from = wrx_string("01.02.2003");
        water_right.valid_until = wrx_string("unbefristet");
        water_right.last_change = wrx_string("24.12.2020");

        wrx_legal_department department;
        department.abbreviation = wrx_department::E;
        department.description = "Entnahme";
        wrx_usage_location zero;
        zero.utm_easting = 0;
        zero.utm_northing = 5801234;
        department.usage_locations.push_back(zero);
        water_right.legal_departments[wrx_department::E] = department;

        wrx_warnings warnings(77);

        WHEN("it is post processed") {
            post_process(water_right, warnings);

            THEN("the annotation loses its label") {
                REQUIRE(*water_right.annotation == "wichtig");
            }

            THEN("the registering authority is also the granting one") {
                REQUIRE(*water_right.granting_authority == "Region Hannover");
            }

            THEN("dates are normalized and invalid ones reported") {
                REQUIRE(*water_right.valid_from == "2003-02-01");
                REQUIRE(*water_right.last_change == "2020-12-24");
                REQUIRE(*water_right.valid_until == "unbefristet");
                REQUIRE(warnings.count(wrx_warning_kind::invalid_date_format) == 1);
                REQUIRE(warnings.list()[0].water_right_no == 77);
            }

            THEN("zero coordinates become absent") {
                const auto& usage_location = water_right.legal_departments.at(wrx_department::E).usage_locations[0];
                REQUIRE_FALSE(usage_location.utm_easting);
                REQUIRE(*usage_location.utm_northing == 5801234u);
            }
        }
    }

    GIVEN("an annotation that is only the label") {
        wrx_water_right water_right(78);
        water_right.annotation = wrx_string("Bemerkung:");
        water_right.granting_authority = wrx_string("Landkreis Celle");
        water_right.registering_authority = wrx_string("Region Hannover");
        wrx_warnings warnings(78);

        WHEN("it is post processed") {
            post_process(water_right, warnings);

            THEN("the annotation is removed") {
                REQUIRE_FALSE(water_right.annotation);
            }

            THEN("an existing granting authority is kept") {
                REQUIRE(*water_right.granting_authority == "Landkreis Celle");
                REQUIRE(warnings.empty());
            }
        }
    }
}
