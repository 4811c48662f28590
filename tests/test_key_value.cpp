#include <catch2/catch_all.hpp>
#include "../documents/text/wrx_key_value.h"
#include "test_report_events.h"

SCENARIO("Text blocks are grouped into key-value pairs by font role", "[text][key_value]") {
    wrx_font_roles roles;
    wrx_warnings warnings(100);
    wrx_key_value_grouper grouper(roles, warnings);

    GIVEN("labels followed by their values on one page") {
        std::vector<wrx_text_block> blocks = {
            make_block(0, "F1", 50, "Wasserbuchbeh\xC3\xB6rde"),
            make_block(0, "F2", 200, "NLWKN"),
            make_block(0, "F1", 50, "Gemeindegebiet:"),
            make_block(0, "F2", 200, "123"),
            make_block(0, "F3", 260, "Hannover"),
            make_block(0, "F1", 50, "Bemerkung:")
        };

        WHEN("the blocks are grouped") {
            wrx_key_values pairs = grouper.group(blocks);

            THEN("each label owns the values up to the next label") {
                REQUIRE(pairs.size() == 3);
                REQUIRE(pairs[0].first == "Wasserbuchbeh\xC3\xB6rde");
                REQUIRE(pairs[0].second == std::vector<wrx_string>{ "NLWKN" });
                REQUIRE(pairs[1].second == std::vector<wrx_string>{ "123", "Hannover" });
            }

            THEN("a label without values is kept dangling") {
                REQUIRE(pairs[2].first == "Bemerkung:");
                REQUIRE(pairs[2].second.empty());
                REQUIRE(warnings.empty());
            }
        }
    }

    GIVEN("blocks in unknown fonts and blocks without text") {
        wrx_text_block empty = make_block(0, "F1", 50, "x");
        empty.content.reset();
        std::vector<wrx_text_block> blocks = {
            make_block(0, "F9", 10, "Seite 1 von 2"),
            empty,
            make_block(0, "F1", 50, "Betreff:"),
            make_block(0, "F7", 10, "Fu\xC3\x9Fzeile"),
            make_block(0, "F2", 200, "Wasserentnahme")
        };

        WHEN("the blocks are grouped") {
            wrx_key_values pairs = grouper.group(blocks);

            THEN("they are skipped without affecting the pairs") {
                REQUIRE(pairs.size() == 1);
                REQUIRE(pairs[0].first == "Betreff:");
                REQUIRE(pairs[0].second == std::vector<wrx_string>{ "Wasserentnahme" });
            }
        }
    }

    GIVEN("configured font roles") {
        wrx_font_roles custom;
        custom.clear();
        custom.set("Bold", wrx_font_role::label);
        custom.set("Regular", wrx_font_role::value);
        wrx_key_value_grouper custom_grouper(custom, warnings);

        std::vector<wrx_text_block> blocks = {
            make_block(0, "Bold", 50, "Aktenzeichen:"),
            make_block(0, "Regular", 200, "62.1-123"),
            make_block(0, "F1", 50, "ignoriert")
        };

        THEN("the lookup table decides the roles") {
            wrx_key_values pairs = custom_grouper.group(blocks);
            REQUIRE(pairs.size() == 1);
            REQUIRE(pairs[0].second == std::vector<wrx_string>{ "62.1-123" });
        }
    }
}

SCENARIO("Values continue their pair across page breaks", "[text][key_value][column]") {
    wrx_font_roles roles;
    wrx_warnings warnings(200);
    wrx_key_value_grouper grouper(roles, warnings);

    GIVEN("a label at the bottom of a page whose value starts the next page") {
        std::vector<wrx_text_block> blocks = {
            make_block(0, "F1", 50, "Betreff:"),
            make_block(0, "F2", 200, "Entnahme von Grundwasser"),
            make_block(0, "F1", 50, "Aktenzeichen:"),
            make_block(1, "F2", 200, "62.1-123/45")
        };

        WHEN("the blocks are grouped") {
            wrx_key_values pairs = grouper.group(blocks);

            THEN("the value belongs to the last label") {
                REQUIRE(pairs.size() == 2);
                REQUIRE(pairs[0].second == std::vector<wrx_string>{ "Entnahme von Grundwasser" });
                REQUIRE(pairs[1].first == "Aktenzeichen:");
                REQUIRE(pairs[1].second == std::vector<wrx_string>{ "62.1-123/45" });
                REQUIRE(warnings.empty());
            }
        }
    }

    GIVEN("a two part value split by a page break") {
        std::vector<wrx_text_block> blocks = {
            make_block(0, "F1", 50, "Gemeindegebiet:"),
            make_block(0, "F2", 200, "123"),
            make_block(0, "F3", 260, "Hannover"),
            make_block(0, "F1", 50, "Unterhaltungsverband:"),
            make_block(0, "F2", 200, "45"),
            make_block(1, "F3", 260, "Leine-Verband"),
            make_block(1, "F1", 50, "Flurst\xC3\xBC" "ck:"),
            make_block(1, "F2", 200, "17/3")
        };

        WHEN("the blocks are grouped") {
            wrx_key_values pairs = grouper.group(blocks);

            THEN("both parts stay with their label") {
                REQUIRE(pairs.size() == 3);
                REQUIRE(pairs[0].second == std::vector<wrx_string>{ "123", "Hannover" });
                REQUIRE(pairs[1].second == std::vector<wrx_string>{ "45", "Leine-Verband" });
                REQUIRE(pairs[2].second == std::vector<wrx_string>{ "17/3" });
            }
        }
    }

    GIVEN("a page opening with a fragment in the label column") {
        std::vector<wrx_text_block> blocks = {
            make_block(0, "F1", 50, "Verordnungszitat:"),
            make_block(0, "F2", 200, "Verordnung \xC3\xBC" "ber das"),
            make_block(0, "F1", 320, "Gew\xC3\xA4sser:"),
            make_block(0, "F2", 420, "Leine"),
            make_block(1, "F2", 50.6, "Wasserschutzgebiet")
        };

        WHEN("the blocks are grouped") {
            wrx_key_values pairs = grouper.group(blocks);

            THEN("it is joined to the last value of the label in that column") {
                REQUIRE(pairs.size() == 2);
                REQUIRE(pairs[0].second == std::vector<wrx_string>{ "Verordnung \xC3\xBC" "ber das Wasserschutzgebiet" });
                REQUIRE(pairs[1].second == std::vector<wrx_string>{ "Leine" });
                REQUIRE(warnings.empty());
            }
        }
    }

    GIVEN("a label column fragment after a label on the same page") {
        std::vector<wrx_text_block> blocks = {
            make_block(0, "F1", 50, "Verordnungszitat:"),
            make_block(1, "F1", 50, "Betreff:"),
            make_block(1, "F2", 50, "Entnahme")
        };

        THEN("it is an ordinary value of the current label") {
            wrx_key_values pairs = grouper.group(blocks);
            REQUIRE(pairs[0].second.empty());
            REQUIRE(pairs[1].second == std::vector<wrx_string>{ "Entnahme" });
        }
    }

    GIVEN("a value before the first label of the report") {
        std::vector<wrx_text_block> blocks = {
            make_block(0, "F2", 200, "Kopfzeile"),
            make_block(0, "F1", 50, "Betreff:")
        };

        THEN("it is dropped with a warning") {
            wrx_key_values pairs = grouper.group(blocks);
            REQUIRE(pairs.size() == 1);
            REQUIRE(warnings.count(wrx_warning_kind::value_without_label) == 1);
        }
    }

    GIVEN("a column index") {
        wrx_column_index columns;
        columns.record(200.7, 3);
        columns.record(50.1, 1);
        columns.record(200.2, 5);

        THEN("coordinates are truncated to whole points") {
            size_t index = 0;
            REQUIRE(columns.size() == 2);
            REQUIRE(columns.lookup(200.99, index));
            REQUIRE(index == 5);
            REQUIRE_FALSE(columns.lookup(199.9, index));
        }
    }
}
