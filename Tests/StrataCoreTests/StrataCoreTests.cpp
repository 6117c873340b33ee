#include <strata/strata.hpp>
#include <cassert>
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <limits>
#include <set>
#include <thread>

using strata::document;

// ============================================================================
// Helpers
// ============================================================================

template<typename Error, typename Fn>
static bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

static void remove_database(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

static std::vector<std::string> sorted(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return v;
}

// ============================================================================
// Test: Name Codec
// ============================================================================

void test_codec_encoding() {
    std::cout << "Testing column identifier encoding..." << std::endl;

    auto id = strata::name_codec::encode("details/age_ind");
    assert(id == strata::name_codec::encode("details/age_ind"));
    assert(id.size() == 36);
    assert(id.rfind("col_", 0) == 0);
    assert(strata::name_codec::is_column_id(id));
    assert(!strata::name_codec::is_column_id("details"));
    assert(!strata::name_codec::is_column_id("col_XYZ"));

    // First 16 bytes of SHA-256("abc")
    assert(strata::name_codec::encode("abc") == "col_ba7816bf8f01cfea414140de5dae2223");

    // Path notation is part of the key: "a/b" and "a_b" are different fields
    assert(strata::name_codec::encode("a/b") != strata::name_codec::encode("a_b"));

    std::set<std::string> ids;
    for (int i = 0; i < 1000; i++) {
        ids.insert(strata::name_codec::encode("field" + std::to_string(i)));
    }
    assert(ids.size() == 1000);

    std::cout << "  Encoding test passed!" << std::endl;
}

void test_codec_mappings() {
    std::cout << "Testing name codec mappings..." << std::endl;

    strata::database db(":memory:");
    strata::name_mapping_store store(db);
    strata::name_codec codec(store);
    assert(codec.size() == 0);

    auto id = strata::name_codec::encode("user/name");
    assert(codec.record_mapping(id, "user/name"));
    assert(!codec.record_mapping(id, "user/name"));  // idempotent
    assert(codec.decode(id) == "user/name");

    // Staged until published
    assert(codec.size() == 0);
    codec.commit_pending();
    assert(codec.size() == 1);

    // Same identifier for another key is a collision
    assert(throws<strata::schema_conflict_error>([&] { codec.record_mapping(id, "user/other"); }));

    // Discarded mappings are forgotten by the codec
    auto staged = strata::name_codec::encode("staged");
    codec.record_mapping(staged, "staged");
    codec.discard_pending();
    assert(codec.size() == 1);

    assert(throws<strata::unknown_column_error>([&] { codec.decode("col_00000000000000000000000000000000"); }));
    assert(!codec.try_decode("col_00000000000000000000000000000000").has_value());

    std::cout << "  Codec mapping test passed!" << std::endl;
}

void test_collision_detection() {
    std::cout << "Testing column identifier collision detection..." << std::endl;

    strata::document_store store;

    // Simulate a digest collision: "a" already bound to the identifier of "b"
    store.db().execute("INSERT INTO _strata_name_mapping (hashed_name, original_name) VALUES (?, ?)",
                       {strata::name_codec::encode("a"), std::string("b")});

    assert(throws<strata::schema_conflict_error>([&] {
        store.insert_or_replace("things", {{"a", "1"}});
    }));

    // Aborted as a whole: no table claimed, no row
    assert(store.collections().empty());
    assert(store.count("things") == 0);

    std::cout << "  Collision detection test passed!" << std::endl;
}

// ============================================================================
// Test: Flatten / Unflatten
// ============================================================================

void test_flatten_round_trip() {
    std::cout << "Testing flatten/unflatten round trip..." << std::endl;

    strata::database db(":memory:");
    strata::name_mapping_store store(db);
    strata::name_codec codec(store);
    strata::document_flattener flattener(codec);

    document doc = {
        {"name", "Ada"},
        {"profile", {
            {"city", "London"},
            {"links", {{"home", "https://example.com"}}}
        }},
        {"empty", document::object()}
    };

    auto flat = flattener.flatten(doc);
    assert(flat.keys.size() == 3);
    assert(flat.values.size() == 3);
    assert(flat.keys.at(strata::name_codec::encode("profile/links/home")) == "profile/links/home");

    for (const auto& [column_id, flat_key] : flat.keys) {
        codec.record_mapping(column_id, flat_key);
    }
    codec.commit_pending();

    document back = flattener.unflatten_row(flat.values);
    document expected = doc;
    expected.erase("empty");  // empty objects carry no fields
    assert(back == expected);

    // Scalars come back as text
    auto scalars = flattener.flatten({{"n", 25}, {"f", 1.5}, {"b", true}, {"z", nullptr}});
    assert(scalars.values.at(strata::name_codec::encode("n")) == "25");
    assert(scalars.values.at(strata::name_codec::encode("f")) == "1.5");
    assert(scalars.values.at(strata::name_codec::encode("b")) == "true");
    assert(scalars.values.count(strata::name_codec::encode("z")) == 0);
    assert(scalars.null_columns.count(strata::name_codec::encode("z")) == 1);

    // Path notation addresses the same field as nesting
    auto nested = flattener.flatten({{"details", {{"age_ind", 28}}}});
    auto pathed = flattener.flatten({{"details/age_ind", 28}});
    assert(nested.values == pathed.values);

    std::cout << "  Round trip test passed!" << std::endl;
}

void test_flatten_rejections() {
    std::cout << "Testing flatten rejections..." << std::endl;

    strata::database db(":memory:");
    strata::name_mapping_store store(db);
    strata::name_codec codec(store);
    strata::document_flattener flattener(codec);

    assert(throws<strata::invalid_argument_error>([&] { flattener.flatten({{"tags", {1, 2, 3}}}); }));
    assert(throws<strata::invalid_argument_error>([&] { flattener.flatten(document::array()); }));
    assert(throws<strata::invalid_argument_error>([&] { flattener.flatten("text"); }));
    assert(throws<strata::invalid_argument_error>([&] { flattener.flatten({{"", "x"}}); }));
    assert(throws<strata::invalid_argument_error>([&] { flattener.flatten({{"a//b", "x"}}); }));
    assert(throws<strata::invalid_argument_error>([&] { flattener.flatten({{"a/", "x"}}); }));

    // "a" cannot be both a value and the parent of "a/b"
    assert(throws<strata::schema_conflict_error>([&] {
        flattener.flatten({{"a", "1"}, {"a/b", "2"}});
    }));

    std::cout << "  Flatten rejection test passed!" << std::endl;
}

void test_unflatten_conflict() {
    std::cout << "Testing unflatten structural conflict..." << std::endl;

    strata::database db(":memory:");
    strata::name_mapping_store mappings(db);
    strata::name_codec codec(mappings);
    strata::document_flattener flattener(codec);

    auto scalar_id = strata::name_codec::encode("a");
    auto nested_id = strata::name_codec::encode("a/b");
    codec.record_mapping(scalar_id, "a");
    codec.record_mapping(nested_id, "a/b");
    codec.commit_pending();

    strata::flat_row row = {{scalar_id, "scalar"}, {nested_id, "nested"}};
    assert(throws<strata::schema_conflict_error>([&] { flattener.unflatten_row(row); }));

    std::cout << "  Unflatten conflict test passed!" << std::endl;
}

void test_update_structure_conflict() {
    std::cout << "Testing updates that would nest under a value..." << std::endl;

    strata::document_store store;
    auto nested = store.insert_or_replace("shapes", {{"id_pri", "1"}, {"a", {{"b", "nested"}}}});
    store.insert_or_replace("shapes", {{"id_pri", "2"}, {"a", "scalar"}});

    // A value over an existing sub-document, and the reverse
    assert(throws<strata::schema_conflict_error>([&] {
        store.update("shapes", {{"a", "scalar"}}, "id_pri = '1'");
    }));
    assert(throws<strata::schema_conflict_error>([&] {
        store.update("shapes", {{"a/b", "x"}}, "id_pri = '2'");
    }));
    assert(throws<strata::schema_conflict_error>([&] {
        store.update_by_id("shapes", {{"a", "scalar"}}, nested);
    }));

    // Rejected updates leave every row readable and unchanged
    auto all = store.list_all("shapes");
    assert(all.size() == 2);
    assert(all[0] == document({{"id_pri", "1"}, {"a", {{"b", "nested"}}}}));
    assert(all[1] == document({{"id_pri", "2"}, {"a", "scalar"}}));

    // Only rows that hold the other shape conflict
    assert(store.update("shapes", {{"a/c", "y"}}, "id_pri = '1'") == 1);
    assert(store.get_by_id("shapes", nested) == document({{"id_pri", "1"}, {"a", {{"b", "nested"}, {"c", "y"}}}}));

    // Clearing the value first makes room for a sub-document
    assert(store.update("shapes", {{"a", nullptr}}, "id_pri = '2'") == 1);
    assert(store.update("shapes", {{"a/b", "now nested"}}, "id_pri = '2'") == 1);
    assert(store.list_all("shapes")[1] == document({{"id_pri", "2"}, {"a", {{"b", "now nested"}}}}));

    std::cout << "  Update structure conflict test passed!" << std::endl;
}

// ============================================================================
// Test: Schema Evolution
// ============================================================================

void test_schema_growth() {
    std::cout << "Testing schema growth..." << std::endl;

    strata::document_store store;
    store.insert_or_replace("events", {{"kind", "click"}, {"meta", {{"x", 1}}}});
    assert(sorted(store.fields("events")) == sorted({"kind", "meta/x"}));

    store.insert_or_replace("events", {{"kind", "scroll"}, {"meta", {{"y", 2}}}, {"extra", "e"}});
    assert(store.fields("events") == sorted({"extra", "kind", "meta/x", "meta/y"}));

    // Older rows are untouched and do not gain the new fields
    auto all = store.list_all("events");
    assert(all.size() == 2);
    assert(all[0] == document({{"kind", "click"}, {"meta", {{"x", "1"}}}}));
    assert(all[1] == document({{"kind", "scroll"}, {"meta", {{"y", "2"}}}, {"extra", "e"}}));

    // A narrower document never drops columns
    store.insert_or_replace("events", {{"kind", "tap"}});
    assert(store.fields("events").size() == 4);

    std::cout << "  Schema growth test passed!" << std::endl;
}

void test_key_derivation() {
    std::cout << "Testing primary key and index derivation..." << std::endl;

    strata::document_store store;
    store.insert_or_replace("scores", {{"player_pri", "p1"}, {"score_ind", 10}, {"note", "n"}});

    auto table = strata::schema_manager::table_name_for("scores");
    auto pk = store.schema().primary_key(table);
    assert(pk.size() == 1);
    assert(pk[0] == strata::name_codec::encode("player_pri"));

    auto indexes = store.schema().indexes(table);
    assert(indexes.size() == 1);
    assert(indexes[0] == strata::schema_manager::index_name(table, strata::name_codec::encode("score_ind")));

    // The key is fixed at first write; a later "_ind" field is indexed when it appears
    store.insert_or_replace("scores", {{"player_pri", "p2"}, {"level_ind", 3}, {"season_pri", "s1"}});
    assert(store.schema().primary_key(table) == pk);
    indexes = store.schema().indexes(table);
    assert(indexes.size() == 2);
    assert(std::count(indexes.begin(), indexes.end(),
                      strata::schema_manager::index_name(table, strata::name_codec::encode("level_ind"))) == 1);
    assert(store.count("scores") == 2);

    // Updates introduce index fields the same way
    assert(store.update("scores", {{"rank_ind", 1}}, "player_pri = 'p1'") == 1);
    assert(store.schema().indexes(table).size() == 3);

    // Existing columns never gain an index
    store.insert_or_replace("scores", {{"player_pri", "p3"}, {"note", "n"}});
    assert(store.schema().indexes(table).size() == 3);

    // Composite primary key
    store.insert_or_replace("pairs", {{"a_pri", "1"}, {"b_pri", "2"}, {"v", "x"}});
    store.insert_or_replace("pairs", {{"a_pri", "1"}, {"b_pri", "3"}, {"v", "y"}});
    store.insert_or_replace("pairs", {{"a_pri", "1"}, {"b_pri", "2"}, {"v", "z"}});
    assert(store.count("pairs") == 2);
    assert(store.schema().primary_key(strata::schema_manager::table_name_for("pairs")).size() == 2);

    std::cout << "  Key derivation test passed!" << std::endl;
}

// ============================================================================
// Test: Document Store
// ============================================================================

void test_upsert_replace() {
    std::cout << "Testing upsert with replace semantics..." << std::endl;

    strata::document_store store;
    auto id = store.insert_or_replace("users", {{"user_pri", "U1"}, {"a", "1"}, {"b", "2"}});
    assert(id > 0);

    auto again = store.insert_or_replace("users", {{"user_pri", "U1"}, {"a", "3"}});
    assert(again == id);  // row id is stable across replaces
    assert(store.count("users") == 1);
    assert(store.get_by_id("users", id) == document({{"user_pri", "U1"}, {"a", "3"}}));

    // Key-only document keeps the row and clears everything else
    assert(store.insert_or_replace("users", {{"user_pri", "U1"}}) == id);
    assert(store.get_by_id("users", id) == document({{"user_pri", "U1"}}));

    // Missing key value is rejected, with no partial effect
    assert(throws<strata::invalid_argument_error>([&] {
        store.insert_or_replace("users", {{"name", "nobody"}});
    }));
    assert(store.count("users") == 1);
    assert(store.fields("users") == sorted({"a", "b", "user_pri"}));
    assert(!store.codec().try_decode(strata::name_codec::encode("name")).has_value());

    // No primary key: every insert is a new row
    auto first = store.insert_or_replace("log", {{"msg", "hello"}});
    auto second = store.insert_or_replace("log", {{"msg", "hello"}});
    assert(first != second);
    assert(store.count("log") == 2);

    // Empty documents have nothing to store
    assert(throws<strata::invalid_argument_error>([&] { store.insert_or_replace("log", document::object()); }));

    std::cout << "  Upsert test passed!" << std::endl;
}

void test_null_filtering() {
    std::cout << "Testing null filtering..." << std::endl;

    strata::document_store store;
    auto id = store.insert_or_replace("items", {{"name", "lamp"}, {"color", nullptr}, {"dims", {{"w", 1}, {"h", nullptr}}}});

    auto doc = store.get_by_id("items", id);
    assert(doc == document({{"name", "lamp"}, {"dims", {{"w", "1"}}}}));
    assert(!doc.contains("color"));

    // Setting a field to null removes it from the document
    assert(store.update("items", {{"name", nullptr}, {"color", "red"}}, "name = 'lamp'") == 1);
    assert(store.get_by_id("items", id) == document({{"color", "red"}, {"dims", {{"w", "1"}}}}));

    std::cout << "  Null filtering test passed!" << std::endl;
}

void test_user_data_scenario() {
    std::cout << "Testing user_data scenario..." << std::endl;

    strata::document_store store;

    auto u1 = store.insert_or_replace("user_data",
        {{"user_pri", "U1"}, {"details", {{"age_ind", 25}, {"address", {{"city", "Shanghai"}}}}}});
    auto u2 = store.insert_or_replace("user_data",
        {{"user_pri", "U2"}, {"details", {{"age2_ind", 30}, {"address", {{"city", "Beijing"}}}}}});

    // Page 1, size 2, by details/age_ind descending: U1 (25) before U2 (missing, sorts as zero)
    auto page = store.query_paginated("user_data", "details/age_ind", strata::sort_direction::descending, 1, 2);
    assert(page.size() == 2);
    assert(page[0] == document({{"user_pri", "U1"}, {"details", {{"age_ind", "25"}, {"address", {{"city", "Shanghai"}}}}}}));
    assert(page[1] == document({{"user_pri", "U2"}, {"details", {{"age2_ind", "30"}, {"address", {{"city", "Beijing"}}}}}}));
    assert(!page[1]["details"].contains("age_ind"));

    // Partial update through path notation
    assert(store.update("user_data", {{"details/age_ind", 28}}, "user_pri = 'U1'") == 1);
    auto updated = store.get_by_id("user_data", u1);
    assert(updated["details"]["age_ind"] == "28");
    assert(updated["details"]["address"]["city"] == "Shanghai");
    assert(updated["user_pri"] == "U1");

    // Delete U2
    assert(store.remove("user_data", "user_pri = 'U2'") == 1);
    auto all = store.list_all("user_data");
    assert(all.size() == 1);
    assert(all[0]["user_pri"] == "U1");
    assert(throws<strata::not_found_error>([&] { store.get_by_id("user_data", u2); }));

    std::cout << "  user_data scenario passed!" << std::endl;
}

void test_update_and_delete() {
    std::cout << "Testing update and delete..." << std::endl;

    strata::document_store store;
    for (int i = 0; i < 6; i++) {
        store.insert_or_replace("tasks", {{"id_pri", std::to_string(i)},
                                          {"team", i % 2 == 0 ? "red" : "blue"},
                                          {"meta", {{"done", false}}}});
    }

    // Conjunctions, booleans and nested keys
    assert(store.update("tasks", {{"meta", {{"done", true}}}}, "team = 'red' AND meta/done = false") == 3);
    assert(store.find("tasks", "meta/done = true").size() == 3);
    assert(store.find("tasks", "team = 'blue' and meta/done = true").empty());

    // Numbers compare as their text
    assert(store.find("tasks", "id_pri = 4").size() == 1);

    // Unknown fields match nothing
    assert(store.update("tasks", {{"team", "green"}}, "missing = 'x'") == 0);
    assert(store.remove("tasks", "missing = 'x'") == 0);
    assert(store.find("tasks", "missing = 'x'").empty());

    // Update adds referenced columns but never creates collections
    assert(store.update("tasks", {{"owner", "sam"}}, "id_pri = '0'") == 1);
    assert(store.get_by_id("tasks", store.list_entries("tasks")[0].row_id)["owner"] == "sam");
    assert(store.update("nowhere", {{"x", "1"}}, "a = 'b'") == 0);
    assert(store.count("nowhere") == 0);
    assert(store.collections() == std::vector<std::string>{"tasks"});

    assert(store.remove("tasks", "team = 'blue'") == 3);
    assert(store.count("tasks") == 3);

    // Malformed conditions fail before touching anything
    assert(throws<strata::invalid_condition_error>([&] { store.remove("tasks", "team"); }));
    assert(throws<strata::invalid_condition_error>([&] { store.update("tasks", {{"x", "1"}}, ""); }));
    assert(throws<strata::invalid_condition_error>([&] { store.find("tasks", "team = red"); }));
    assert(store.count("tasks") == 3);
    assert(store.fields("tasks") == sorted({"id_pri", "meta/done", "owner", "team"}));

    std::cout << "  Update and delete test passed!" << std::endl;
}

void test_by_id_writes() {
    std::cout << "Testing update and delete by row id..." << std::endl;

    strata::document_store store;
    auto first = store.insert_or_replace("notes", {{"title", "one"}, {"body", {{"text", "a"}}}});
    auto second = store.insert_or_replace("notes", {{"title", "two"}});

    store.update_by_id("notes", {{"body/text", "b"}, {"tags", {{"pinned", true}}}}, first);
    assert(store.get_by_id("notes", first) ==
           document({{"title", "one"}, {"body", {{"text", "b"}}}, {"tags", {{"pinned", "true"}}}}));
    assert(store.get_by_id("notes", second) == document({{"title", "two"}}));

    // A missing row is reported and the write leaves no trace
    assert(throws<strata::not_found_error>([&] { store.update_by_id("notes", {{"extra", "x"}}, 999); }));
    assert(store.fields("notes") == sorted({"body/text", "tags/pinned", "title"}));
    assert(throws<strata::not_found_error>([&] { store.update_by_id("ghost", {{"x", "1"}}, first); }));
    assert(throws<strata::invalid_argument_error>([&] { store.update_by_id("notes", document::object(), first); }));

    store.remove_by_id("notes", second);
    assert(store.count("notes") == 1);
    assert(throws<strata::not_found_error>([&] { store.get_by_id("notes", second); }));
    assert(throws<strata::not_found_error>([&] { store.remove_by_id("notes", second); }));
    assert(throws<strata::not_found_error>([&] { store.remove_by_id("ghost", first); }));
    assert(store.list_entries("notes")[0].row_id == first);

    std::cout << "  By-id write test passed!" << std::endl;
}

void test_missing_collection() {
    std::cout << "Testing reads on a missing collection..." << std::endl;

    strata::document_store store;
    assert(store.list_all("ghost").empty());
    assert(store.list_entries("ghost").empty());
    assert(store.find("ghost", "a = 'b'").empty());
    assert(store.query_paginated("ghost", "a", strata::sort_direction::ascending, 1, 10).empty());
    assert(store.count("ghost") == 0);
    assert(store.fields("ghost").empty());
    assert(store.remove("ghost", "a = 'b'") == 0);
    assert(throws<strata::not_found_error>([&] { store.get_by_id("ghost", 1); }));

    store.insert_or_replace("real", {{"a", "b"}});
    assert(throws<strata::not_found_error>([&] { store.get_by_id("real", 999); }));

    std::cout << "  Missing collection test passed!" << std::endl;
}

// ============================================================================
// Test: Pagination
// ============================================================================

void test_pagination() {
    std::cout << "Testing pagination..." << std::endl;

    strata::document_store store;

    // seq identifies the row; every fifth document has no n_ind
    std::vector<std::pair<double, int>> expected;  // sort value, seq
    for (int i = 1; i <= 25; i++) {
        document doc = {{"seq", std::to_string(i)}};
        double value = 0;
        if (i % 5 != 0) {
            value = (i * 7) % 23;
            doc["n_ind"] = static_cast<int>(value);
        }
        store.insert_or_replace("numbers", doc);
        expected.emplace_back(value, i);
    }

    auto collect = [&](strata::sort_direction dir, int64_t page_size) {
        std::vector<int> seqs;
        for (int64_t page = 1;; page++) {
            auto docs = store.query_paginated("numbers", "n_ind", dir, page, page_size);
            for (const auto& doc : docs) {
                seqs.push_back(std::stoi(doc["seq"].get<std::string>()));
            }
            if (docs.size() < static_cast<size_t>(page_size)) break;
        }
        return seqs;
    };

    // Numeric order, missing values as zero, ties in insertion order
    auto ascending = expected;
    std::stable_sort(ascending.begin(), ascending.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    auto descending = expected;
    std::stable_sort(descending.begin(), descending.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    for (int64_t page_size : {1, 4, 7, 25, 100}) {
        auto asc = collect(strata::sort_direction::ascending, page_size);
        auto desc = collect(strata::sort_direction::descending, page_size);
        assert(asc.size() == 25);
        assert(desc.size() == 25);
        for (size_t i = 0; i < 25; i++) {
            assert(asc[i] == ascending[i].second);
            assert(desc[i] == descending[i].second);
        }
    }

    // Past the end
    assert(store.query_paginated("numbers", "n_ind", strata::sort_direction::ascending, 10, 5).empty());

    // Unknown sort field: insertion order
    auto by_unknown = store.query_paginated("numbers", "nope", strata::sort_direction::descending, 1, 3);
    assert(by_unknown.size() == 3);
    assert(by_unknown[0]["seq"] == "1");
    assert(by_unknown[2]["seq"] == "3");

    // Out of range arguments
    assert(throws<strata::invalid_argument_error>([&] {
        store.query_paginated("numbers", "n_ind", strata::sort_direction::ascending, 0, 5);
    }));
    assert(throws<strata::invalid_argument_error>([&] {
        store.query_paginated("numbers", "n_ind", strata::sort_direction::ascending, 1, 0);
    }));
    assert(throws<strata::invalid_argument_error>([&] {
        store.query_paginated("numbers", "n_ind", strata::sort_direction::ascending, -3, 5);
    }));
    assert(throws<strata::invalid_argument_error>([&] {
        store.query_paginated("numbers", "n_ind", strata::sort_direction::ascending,
                              std::numeric_limits<int64_t>::max(), 2);
    }));

    assert(strata::sort_direction_from_string("desc") == strata::sort_direction::descending);
    assert(strata::sort_direction_from_string("ASC") == strata::sort_direction::ascending);
    assert(throws<strata::invalid_argument_error>([] { strata::sort_direction_from_string("up"); }));

    std::cout << "  Pagination test passed!" << std::endl;
}

void test_natural_ordering() {
    std::cout << "Testing natural ordering of text values..." << std::endl;

    strata::document_store store;
    for (const char* v : {"10", "9", "banana", "2.5", "apple", "-1"}) {
        store.insert_or_replace("mixed", {{"v", v}});
    }

    std::vector<std::string> order;
    for (const auto& doc : store.query_paginated("mixed", "v", strata::sort_direction::ascending, 1, 10)) {
        order.push_back(doc["v"].get<std::string>());
    }
    assert((order == std::vector<std::string>{"-1", "2.5", "9", "10", "apple", "banana"}));

    std::cout << "  Natural ordering test passed!" << std::endl;
}

// ============================================================================
// Test: Conditions
// ============================================================================

void test_condition_parser() {
    std::cout << "Testing condition parser..." << std::endl;

    auto terms = strata::parse_condition("a = 'x' AND b/c=5 and \"d e\" = 'it''s'  AnD flag = true");
    assert(terms.size() == 4);
    assert(terms[0].key == "a" && terms[0].value == "x");
    assert(terms[1].key == "b/c" && terms[1].value == "5");
    assert(terms[2].key == "d e" && terms[2].value == "it's");
    assert(terms[3].key == "flag" && terms[3].value == "true");

    assert(strata::parse_condition("n = -2.5e3")[0].value == "-2.5e3");
    assert(strata::parse_condition("s = ''")[0].value.empty());

    for (const char* bad : {"", "   ", "a", "a =", "a = b", "a = 'x' OR b = 'y'",
                            "a = 'x' AND", "a = 'open", "= 'x'", "/a = 'x'",
                            "a = \"x\"", "a = 'x' b = 'y'"}) {
        assert(throws<strata::invalid_condition_error>([&] { strata::parse_condition(bad); }));
    }

    std::cout << "  Condition parser test passed!" << std::endl;
}

void test_injection_safety() {
    std::cout << "Testing injection safety..." << std::endl;

    strata::document_store store;
    const std::string hostile = "Robert'); DROP TABLE students;--";
    store.insert_or_replace("students", {{"name", hostile}, {"we\"ird key", "v"}});
    store.insert_or_replace("students", {{"name", "Alice"}, {"we\"ird key", "w"}});

    auto found = store.find("students", "name = 'Robert''); DROP TABLE students;--'");
    assert(found.size() == 1);
    assert(found[0]["name"] == hostile);
    assert(found[0]["we\"ird key"] == "v");

    assert(store.find("students", "name = 'x'' OR ''1''=''1'").empty());
    assert(store.update("students", {{"name", "'; DELETE FROM students; --"}}, "name = 'Alice'") == 1);
    assert(store.count("students") == 2);
    assert(store.find("students", "\"we\"\"ird key\" = 'w'")[0]["name"] == "'; DELETE FROM students; --");

    std::cout << "  Injection safety test passed!" << std::endl;
}

// ============================================================================
// Test: Collections
// ============================================================================

void test_collection_paths() {
    std::cout << "Testing collection paths..." << std::endl;

    assert(strata::schema_manager::table_name_for("org/team/members") == "org_team_members");
    for (const char* bad : {"", "/a", "a/", "a//b", "has space", "semi;colon", "_strata_name_mapping",
                            "sqlite_master", "_STRATA_x"}) {
        assert(throws<strata::invalid_argument_error>([&] { strata::schema_manager::table_name_for(bad); }));
    }

    strata::document_store store;
    store.insert_or_replace("a/b", {{"x", "1"}});

    // "a_b" would share table a_b with "a/b"
    assert(throws<strata::invalid_argument_error>([&] { store.insert_or_replace("a_b", {{"x", "2"}}); }));
    assert(throws<strata::invalid_argument_error>([&] { store.list_all("a_b"); }));
    assert(store.count("a/b") == 1);

    store.insert_or_replace("a/c", {{"x", "3"}});
    assert((store.collections() == std::vector<std::string>{"a/b", "a/c"}));

    // Table names ignore case, so "users" would land in the table of "Users"
    assert(strata::schema_manager::table_name_for("Org/Team") == "org_team");
    store.insert_or_replace("Users", {{"x", "1"}});
    assert(throws<strata::invalid_argument_error>([&] { store.insert_or_replace("users", {{"y", "2"}}); }));
    assert(throws<strata::invalid_argument_error>([&] { store.list_all("USERS"); }));
    assert(store.list_all("Users") == std::vector<document>{document({{"x", "1"}})});
    assert(store.fields("Users") == std::vector<std::string>{"x"});
    assert((store.collections() == std::vector<std::string>{"Users", "a/b", "a/c"}));

    std::cout << "  Collection path test passed!" << std::endl;
}

// ============================================================================
// Test: File-based Store
// ============================================================================

void test_mapping_reload() {
    std::cout << "Testing mapping reload across instances..." << std::endl;

    std::string test_path = "/tmp/strata_core_test.db";
    remove_database(test_path);

    strata::primary_key_t id = 0;
    size_t known = 0;
    {
        strata::document_store store(test_path);
        id = store.insert_or_replace("profiles", {{"handle_pri", "ada"}, {"bio", {{"lang", "en"}}}});
        known = store.codec().size();
        assert(known == 2);
    }

    {
        strata::document_store store(test_path);
        assert(store.codec().size() == known);
        assert(store.codec().decode(strata::name_codec::encode("bio/lang")) == "bio/lang");
        assert(store.get_by_id("profiles", id) == document({{"handle_pri", "ada"}, {"bio", {{"lang", "en"}}}}));
        assert(store.collections() == std::vector<std::string>{"profiles"});

        // Same key, same identifier: the upsert still hits the same row
        assert(store.insert_or_replace("profiles", {{"handle_pri", "ada"}, {"bio", {{"lang", "fr"}}}}) == id);
        assert(store.count("profiles") == 1);
    }

    remove_database(test_path);
    std::cout << "  Mapping reload test passed!" << std::endl;
}

void test_concurrent_writers() {
    std::cout << "Testing concurrent writers and readers..." << std::endl;

    std::string test_path = "/tmp/strata_core_concurrent.db";
    remove_database(test_path);

    {
        strata::document_store store(test_path);
        std::atomic<bool> done{false};
        std::atomic<int> failures{0};

        std::thread reader([&] {
            while (!done.load()) {
                try {
                    store.list_all("shared");
                    store.query_paginated("shared", "n_ind", strata::sort_direction::descending, 1, 5);
                } catch (const std::exception& e) {
                    std::cerr << "  reader: " << e.what() << std::endl;
                    failures++;
                }
            }
        });

        std::vector<std::thread> writers;
        for (int t = 0; t < 4; t++) {
            writers.emplace_back([&, t] {
                for (int i = 0; i < 25; i++) {
                    try {
                        // Every writer introduces new keys, racing on schema evolution
                        store.insert_or_replace("shared", {
                            {"id_pri", std::to_string(t) + "-" + std::to_string(i)},
                            {"n_ind", i},
                            {"w" + std::to_string(t), {{"k" + std::to_string(i % 5), "v"}}}
                        });
                    } catch (const std::exception& e) {
                        std::cerr << "  writer: " << e.what() << std::endl;
                        failures++;
                    }
                }
            });
        }
        for (auto& w : writers) w.join();
        done = true;
        reader.join();

        assert(failures.load() == 0);
        assert(store.count("shared") == 100);
        assert(store.fields("shared").size() == 2 + 4 * 5);
    }

    remove_database(test_path);
    std::cout << "  Concurrency test passed!" << std::endl;
}

// ============================================================================
// Test: Configuration
// ============================================================================

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    strata::configuration defaults;
    assert(defaults.is_in_memory());
    assert(defaults.busy_timeout_ms == 5000);
    assert(!defaults.level.has_value());

    setenv("STRATA_DATABASE_PATH", "/tmp/strata_env.db", 1);
    setenv("STRATA_LOG_LEVEL", "Warn", 1);
    auto config = strata::configuration::from_environment();
    assert(config.path == "/tmp/strata_env.db");
    assert(!config.is_in_memory());
    assert(config.level == strata::log_level::warn);

    setenv("STRATA_LOG_LEVEL", "loud", 1);
    assert(throws<strata::invalid_argument_error>([] { strata::configuration::from_environment(); }));

    unsetenv("STRATA_DATABASE_PATH");
    unsetenv("STRATA_LOG_LEVEL");
    assert(strata::configuration::from_environment().is_in_memory());

    // A configured level is applied when the store opens
    strata::configuration quiet;
    quiet.level = strata::log_level::error;
    {
        strata::document_store store(quiet);
        assert(strata::get_log_level() == strata::log_level::error);
    }
    strata::set_log_level(strata::log_level::off);

    assert(strata::log_level_from_string("DEBUG") == strata::log_level::debug);
    assert(strata::log_level_from_string("off") == strata::log_level::off);

    std::cout << "  Configuration test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== StrataCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Name codec
        test_codec_encoding();
        test_codec_mappings();
        test_collision_detection();

        // Flattener
        test_flatten_round_trip();
        test_flatten_rejections();
        test_unflatten_conflict();
        test_update_structure_conflict();

        // Schema
        test_schema_growth();
        test_key_derivation();

        // Document store
        test_upsert_replace();
        test_null_filtering();
        test_user_data_scenario();
        test_update_and_delete();
        test_by_id_writes();
        test_missing_collection();

        // Queries
        test_pagination();
        test_natural_ordering();
        test_condition_parser();
        test_injection_safety();
        test_collection_paths();

        // File-based store
        test_mapping_reload();
        test_concurrent_writers();

        test_configuration();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (23 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
