#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include "record.h"

using namespace geosync;

void test_absent_values() {
    std::cout << "Testing absent values..." << std::endl;

    assert(is_absent(Value{}));
    assert(is_absent(Value{std::numeric_limits<double>::quiet_NaN()}));
    assert(!is_absent(Value{0.0}));
    assert(!is_absent(Value{std::string()}));
    assert(std::holds_alternative<std::monostate>(normalize(Value{std::nan("")})));

    Record r;
    assert(is_absent(r.get("missing")));
    assert(!r.has("missing"));

    std::cout << "  Absent value test passed!" << std::endl;
}

void test_key_text() {
    std::cout << "Testing key canonicalization..." << std::endl;

    const std::string five = key_text(Value{std::int64_t{5}});
    assert(five == "5");
    assert(key_text(Value{5.0}) == five);
    assert(key_text(Value{std::string("5")}) == five);
    assert(key_text(Value{std::string(" 5 ")}) == five);
    assert(key_text(Value{5.5}) != five);
    assert(key_text(Value{std::string("A-12")}) == "A-12");
    assert(key_text(Value{}) == "");

    // Booleans keep their own keys apart from the integers 1 and 0.
    assert(key_text(Value{true}) == "true");
    assert(key_text(Value{true}) != key_text(Value{std::int64_t{1}}));
    assert(key_text(Value{false}) != key_text(Value{std::int64_t{0}}));

    std::cout << "  Key text test passed!" << std::endl;
}

void test_same_value() {
    std::cout << "Testing value comparison..." << std::endl;

    assert(same_value(Value{std::int64_t{2}}, Value{2.0}));
    assert(!same_value(Value{std::int64_t{2}}, Value{std::string("2")}));
    assert(same_value(Value{}, Value{std::nan("")}));
    assert(!same_value(Value{}, Value{std::int64_t{0}}));

    auto n = as_number(Value{std::string("12.5")});
    assert(n && *n == 12.5);
    assert(!as_number(Value{std::string("abc")}));
    assert(!as_number(Value{}));

    std::cout << "  Value comparison test passed!" << std::endl;
}

void test_table() {
    std::cout << "Testing table schema..." << std::endl;

    Table t;
    Record a;
    a.set("id", Value{std::int64_t{1}});
    a.set("name", Value{std::string("A")});
    t.append(a);
    Record b;
    b.set("id", Value{std::int64_t{2}});
    b.set("extra", Value{1.5});
    t.append(b);

    assert(t.size() == 2);
    assert(t.columns.size() == 3);
    assert(t.has_column("extra"));
    assert(t.schema_only().columns == t.columns);
    assert(t.schema_only().empty());

    auto u = union_columns({"id", "name"}, {"name", "x", "id", "y"});
    assert((u == std::vector<std::string>{"id", "name", "x", "y"}));

    Record c = a;
    c.set("name", Value{std::string("B")});
    assert(a != c);
    c.set("name", Value{std::string("A")});
    assert(a == c);

    std::cout << "  Table schema test passed!" << std::endl;
}

void test_rename_columns() {
    std::cout << "Testing column renaming..." << std::endl;

    Table t;
    t.columns = {"id", "x", "y"};
    Record r;
    r.set("id", Value{std::int64_t{1}});
    r.set("x", Value{-1050000.0});
    r.set("y", Value{-750000.0});
    t.rows = {r};

    // Exchanging two labels moves both values, nothing is lost.
    rename_columns(t, {{"x", "y"}, {"y", "x"}});
    assert((t.columns == std::vector<std::string>{"id", "y", "x"}));
    assert(t.rows[0].get("x") == Value{-750000.0});
    assert(t.rows[0].get("y") == Value{-1050000.0});
    assert(t.rows[0].fields.size() == 3);

    // Renaming onto an existing column replaces it instead of duplicating it.
    Table u;
    u.columns = {"id", "depth", "HLOUBKA"};
    Record s;
    s.set("id", Value{std::int64_t{2}});
    s.set("depth", Value{std::string("old")});
    s.set("HLOUBKA", Value{12.5});
    u.rows = {s};
    rename_columns(u, {{"HLOUBKA", "depth"}, {"missing", "other"}});
    assert((u.columns == std::vector<std::string>{"id", "depth"}));
    assert(u.rows[0].get("depth") == Value{12.5});
    assert(!u.rows[0].has("HLOUBKA"));
    assert(!u.rows[0].has("other"));

    std::cout << "  Column renaming test passed!" << std::endl;
}

int main() {
    try {
        test_absent_values();
        test_key_text();
        test_same_value();
        test_table();
        test_rename_columns();

        std::cout << std::endl;
        std::cout << "All record tests passed!" << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
