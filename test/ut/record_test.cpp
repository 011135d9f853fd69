//=============================================================================
// Record / FieldValue Tests
//=============================================================================

#include <boost/ut.hpp>
#include <pmc/record.h>

using namespace boost::ut;
using namespace pmc;

namespace {

Timestamp at(int64_t secs) {
    return Timestamp(std::chrono::seconds(secs));
}

} // namespace

suite field_value_tests = [] {
    "format"_test = [] {
        expect(formatValue(FieldValue{}) == "");
        expect(formatValue(FieldValue(std::string("abc"))) == "abc");
        expect(formatValue(FieldValue(int64_t(-42))) == "-42");
        expect(formatValue(FieldValue(true)) == "yes");
        expect(formatValue(FieldValue(false)) == "no");
        // 2025-10-09 08:53:20 UTC
        expect(formatValue(FieldValue(at(1760000000))) == "2025-10-09 08:53");
        expect(formatValue(FieldValue(StringList{"a", "b"})) == "a, b");
    };

    "parse integer"_test = [] {
        auto ok = parseValue(" 17 ", FieldKind::Integer);
        expect(ok.has_value() >> fatal);
        expect(std::get<int64_t>(*ok) == 17);
        expect(!parseValue("17x", FieldKind::Integer));
        expect(!parseValue("", FieldKind::Integer));
        expect(!parseValue("99999999999999999999", FieldKind::Integer));
    };

    "parse boolean"_test = [] {
        expect(std::get<bool>(*parseValue("Yes", FieldKind::Boolean)));
        expect(!std::get<bool>(*parseValue("off", FieldKind::Boolean)));
        expect(!parseValue("maybe", FieldKind::Boolean));
    };

    "parse timestamp"_test = [] {
        auto day = parseValue("2025-10-09", FieldKind::Timestamp);
        expect(day.has_value() >> fatal);
        expect(std::get<Timestamp>(*day) == at(1759968000));

        auto minute = parseValue("2025-10-09 08:53", FieldKind::Timestamp);
        expect(minute.has_value() >> fatal);
        expect(formatValue(*minute) == "2025-10-09 08:53");

        expect(!parseValue("yesterday", FieldKind::Timestamp));
        expect(!parseValue("2025-13-01", FieldKind::Timestamp));
        expect(!parseValue("2025-10-09 8", FieldKind::Timestamp));
        expect(!parseValue("2024-01-15xyz", FieldKind::Timestamp));
        expect(!parseValue("2024-01-15 10:30 pm", FieldKind::Timestamp));
        expect(!parseValue("2024-02-31", FieldKind::Timestamp)) << "no rollover into March";
        expect(!parseValue("2023-02-29", FieldKind::Timestamp));
        expect(parseValue("2024-02-29", FieldKind::Timestamp).has_value()) << "leap day";
    };

    "parse list and string"_test = [] {
        auto list = parseValue("a, b,,c ", FieldKind::List);
        expect(std::get<StringList>(*list) == StringList{"a", "b", "c"});
        auto text = parseValue("  keep spaces ", FieldKind::String);
        expect(std::get<std::string>(*text) == "  keep spaces ");
    };

    "compare"_test = [] {
        FieldValue null;
        FieldValue a(std::string("apple"));
        FieldValue B(std::string("Banana"));
        expect(compareValues(a, B) < 0) << "case-insensitive";
        expect(compareValues(B, a) > 0);
        expect(compareValues(a, FieldValue(std::string("APPLE"))) == 0);
        expect(compareValues(null, a) > 0) << "null after values";
        expect(compareValues(a, null) < 0);
        expect(compareValues(null, null) == 0);
        expect(compareValues(FieldValue(int64_t(2)), FieldValue(int64_t(10))) < 0);
        expect(compareValues(FieldValue(at(5)), FieldValue(at(3))) > 0);
    };

    "field kind names"_test = [] {
        expect(*parseFieldKind("Int") == FieldKind::Integer);
        expect(*parseFieldKind("date") == FieldKind::Timestamp);
        expect(!parseFieldKind("float"));
        expect(std::string(fieldKindName(FieldKind::List)) == "list");
    };
};

suite record_tests = [] {
    "get and text on missing fields"_test = [] {
        Record r{{"title", std::string("x")}};
        expect(isNull(r.get("nope")));
        expect(r.text("nope") == "");
        expect(r.text("title") == "x");
        expect(r.find("nope") == nullptr);
    };

    "digest tracks every change"_test = [] {
        Record r{{"title", std::string("x")}, {"priority", int64_t(1)}};
        r.setId("abc");
        uint64_t base = recordDigest(r, 0);
        expect(recordDigest(r, 0) == base);

        Record changed = r;
        changed.set("priority", int64_t(2));
        expect(recordDigest(changed, 0) != base);

        Record retyped = r;
        retyped.set("priority", std::string("1"));
        expect(recordDigest(retyped, 0) != base) << "same text, different type";

        Record renamed = r;
        renamed.setId("abd");
        expect(recordDigest(renamed, 0) != base);
    };

    "validation reports every violation"_test = [] {
        ValidationRules rules;
        rules.requiredFields = {"title", "status"};
        rules.fieldTypes = {{"priority", FieldKind::Integer}, {"title", FieldKind::String}};

        Record good{{"title", std::string("t")}, {"status", std::string("open")}, {"priority", int64_t(1)}};
        expect(rules.validate(good).empty());

        Record bad{{"title", std::string("")}, {"priority", std::string("high")}};
        auto violations = rules.validate(bad);
        expect(violations.size() == 3_u);
        expect(violations[0] == "title: required field missing");
        expect(violations[1] == "status: required field missing");
        expect(violations[2] == "priority: expected integer, got string");

        Record nullPriority{{"title", std::string("t")}, {"status", std::string("s")}, {"priority", FieldValue{}}};
        expect(rules.validate(nullPriority).empty()) << "null satisfies any type";

        Record shadowed{{"title", std::string("t")}, {"status", std::string("s")}, {"id", std::string("x")}};
        auto idViolations = rules.validate(shadowed);
        expect((idViolations.size() == 1_u) >> fatal);
        expect(idViolations[0] == "id: reserved for the record identifier");
        expect(ValidationRules{}.validate(shadowed).size() == 1_u);

        expect(rules.typeOf("priority") == std::optional<FieldKind>(FieldKind::Integer));
        expect(!rules.typeOf("due").has_value());
    };
};
