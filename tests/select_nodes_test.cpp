#include <jsonmanip-cpp/manipulator.hpp>

#include <jsonmanip-cpp/error.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace jsonmanip_cpp;

namespace {

constexpr auto with_slices = QueryOptions{.allow_slice = true};
constexpr auto relative = QueryOptions{.relative = true};

auto root_node(Array& root) -> Node { return Node{&root, std::int64_t{0}}; }

auto big_num() -> std::string { return "1" + std::string(30, '0'); }

auto select_error(const NodeList& nodes, const std::string& query, QueryOptions options = {})
    -> SyntaxError {
    try {
        (void)select_nodes(nodes, query, options);
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.lineno(), 1u);
        EXPECT_EQ(e.end_lineno(), 1u);
        return e;
    }
    ADD_FAILURE() << "expected a SyntaxError for: " << query;
    return SyntaxError{"", "", "", 0};
}

void expect_type_error(const Node& node, const std::string& query, QueryOptions options,
                       const std::string& prefix) {
    try {
        (void)select_nodes(node, query, options);
        ADD_FAILURE() << "expected a type_error for: " << query;
    } catch (const SyntaxError& e) {
        ADD_FAILURE() << "unexpected SyntaxError for " << query << ": " << e.what();
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::type_error) << query;
        EXPECT_EQ(std::string{e.what()}.rfind(prefix, 0), 0u) << query << ": " << e.what();
    }
}

}  // anonymous namespace

// -- Anchors ------------------------------------------------------------------

TEST(SelectNodes, root) {
    auto root = Array{0};
    EXPECT_EQ(select_nodes(root_node(root), "$"), NodeList{root_node(root)});
}

TEST(SelectNodes, multiple_levels) {
    auto root = Array{Value{Array{Value{Array{Value{Array{0}}}}}}};
    auto& inner = root[0].as_array()[0].as_array()[0].as_array();
    EXPECT_EQ(select_nodes(root_node(root), "$[0][0][0]"), (NodeList{Node{&inner, std::int64_t{0}}}));
}

TEST(SelectNodes, invalid_absolute_query) {
    struct Case { const char* query; const char* msg; std::size_t colno; };
    for (const auto& c : {Case{"", "Expecting an absolute query", 1},
                          Case{"@", "Expecting an absolute query", 1},
                          Case{"$[0", "Expecting a closing bracket", 4},
                          Case{"$ $ $", "Expecting end of file", 2}}) {
        const auto e = select_error({}, c.query);
        EXPECT_EQ(e.msg(), c.msg) << c.query;
        EXPECT_EQ(e.colno(), c.colno) << c.query;
    }
}

TEST(SelectNodes, invalid_relative_query) {
    for (const auto* query : {"", "$"}) {
        const auto e = select_error({}, query, relative);
        EXPECT_EQ(e.msg(), "Expecting a relative query") << query;
        EXPECT_EQ(e.colno(), 1u);
    }
}

TEST(SelectNodes, invalid_target) {
    auto root = Array{0};
    for (const auto* query : {"$[0]", "$[0]?", "$[0].b", "$[0][:]", "$[0][0]", "$[0]['']", "$[0][@]"}) {
        expect_type_error(root_node(root), query, {}, "Target must be array or object, not integer");
    }
}

// -- Optional marker ----------------------------------------------------------

TEST(SelectNodes, optional_marker_keeps_existing_keys) {
    auto empty = Array{};
    auto one = Array{0};
    auto empty_object = Object{};
    auto object = Object{{"", 0}};
    const auto all = Key{Slice{}};

    EXPECT_EQ(select_nodes(Node{&empty, all}, "$?", with_slices), (NodeList{Node{&empty, all}}));
    EXPECT_TRUE(select_nodes(Node{&empty, std::int64_t{0}}, "$?", with_slices).empty());
    EXPECT_EQ(select_nodes(Node{&one, std::int64_t{0}}, "$?", with_slices),
              (NodeList{Node{&one, std::int64_t{0}}}));
    EXPECT_TRUE(select_nodes(Node{&empty_object, ""}, "$?", with_slices).empty());
    EXPECT_EQ(select_nodes(Node{&object, ""}, "$?", with_slices), (NodeList{Node{&object, ""}}));
}

TEST(SelectNodes, optional_marker_mid_query) {
    auto root = Array{Value{Object{{"a", Object{{"b", 1}}}, {"c", 2}}}};
    auto& object = root[0].as_object();
    EXPECT_EQ(select_nodes(root_node(root), "$.a?.b"),
              (NodeList{Node{&object.at("a").as_object(), "b"}}));
    EXPECT_TRUE(select_nodes(root_node(root), "$.x?.b").empty());
}

TEST(SelectNodes, optional_marker_not_allowed_in_relative_query) {
    const auto e = select_error({}, "@?", relative);
    EXPECT_EQ(e.msg(), "Optional markers are not allowed in relative query");
    EXPECT_EQ(e.colno(), 2u);
    EXPECT_EQ(e.end_colno(), 3u);
}

TEST(SelectNodes, no_matches_without_optional_marker) {
    auto root = Array{Value{Array{}}};
    try {
        (void)select_nodes(root_node(root), "$[@]");
        FAIL() << "expected an Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::value_error);
        EXPECT_STREQ(e.what(), "Query has no matches: $[@]");
    }
    EXPECT_TRUE(select_nodes(root_node(root), "$[@]?").empty());
}

// -- Properties ---------------------------------------------------------------

TEST(SelectNodes, property) {
    auto root = Array{Value{Object{}}};
    auto* object = &root[0].as_object();
    for (const std::string key : {"A", "_", "A0", "AA", "A_", "0", "$", "a-b", "caf\xc3\xa9"}) {
        EXPECT_EQ(select_nodes(root_node(root), "$." + key), (NodeList{Node{object, key}})) << key;
    }
}

TEST(SelectNodes, property_tilde_escapes) {
    auto root = Array{Value{Object{}}};
    auto* object = &root[0].as_object();
    EXPECT_EQ(select_nodes(root_node(root), "$.a~.b"), (NodeList{Node{object, "a.b"}}));
    EXPECT_EQ(select_nodes(root_node(root), "$.~~"), (NodeList{Node{object, "~"}}));
    EXPECT_EQ(select_nodes(root_node(root), "$.~[~]"), (NodeList{Node{object, "[]"}}));
}

TEST(SelectNodes, invalid_property) {
    auto e = select_error({}, "$.");
    EXPECT_EQ(e.msg(), "Expecting property");
    EXPECT_EQ(e.colno(), 3u);

    e = select_error({}, "$.!");
    EXPECT_EQ(e.msg(), "Expecting property");

    e = select_error({}, "$.a~");
    EXPECT_EQ(e.msg(), "Expecting escaped character");
    EXPECT_EQ(e.colno(), 5u);

    e = select_error({}, "$.a~b");
    EXPECT_EQ(e.msg(), "Invalid tilde escape");
    EXPECT_EQ(e.colno(), 4u);
    EXPECT_EQ(e.end_colno(), 6u);
}

TEST(SelectNodes, property_on_an_array) {
    auto root = Array{Value{Array{}}};
    for (const auto* query : {"$.a", "$.a?", "$.a.b", "$.a[:]", "$.a[0]", "$.a['']", "$.a[@]"}) {
        expect_type_error(root_node(root), query, with_slices, "Array index must be integer or slice, not");
    }
}

TEST(SelectNodes, relative_property_on_an_array) {
    auto root = Array{Value{Array{}}};
    for (const auto* query : {"@.a", "@.a.b", "@.a[0]", "@.a['']"}) {
        expect_type_error(root_node(root), query, relative, "Array index must be integer, not");
    }
}

TEST(SelectNodes, quoted_key) {
    auto root = Array{Value{Object{}}};
    auto* object = &root[0].as_object();
    EXPECT_EQ(select_nodes(root_node(root), "$['']"), (NodeList{Node{object, ""}}));
    EXPECT_EQ(select_nodes(root_node(root), "$['a b.c']"), (NodeList{Node{object, "a b.c"}}));
    EXPECT_EQ(select_nodes(root_node(root), "$['it~'s']"), (NodeList{Node{object, "it's"}}));
}

// -- Indices and slices -------------------------------------------------------

TEST(SelectNodes, index) {
    auto root = Array{Value{Array{}}};
    auto* array = &root[0].as_array();
    for (const std::int64_t i : {-1, 0, 1, 10, 11}) {
        EXPECT_EQ(select_nodes(root_node(root), "$[" + std::to_string(i) + "]"),
                  (NodeList{Node{array, i}}));
    }
}

TEST(SelectNodes, start_and_end_sentinels) {
    auto root = Array{Value{Array{}}};
    auto* array = &root[0].as_array();
    EXPECT_EQ(select_nodes(root_node(root), "$[end]"), (NodeList{Node{array, end_index}}));
    EXPECT_EQ(select_nodes(root_node(root), "$[start]"), (NodeList{Node{array, start_index}}));
    EXPECT_EQ(select_nodes(root_node(root), "$[start:end]", with_slices),
              (NodeList{Node{array, Slice{start_index, end_index, std::nullopt}}}));
}

TEST(SelectNodes, too_big_index) {
    const auto num = big_num();
    const auto e = select_error({}, "$[" + num + "]");
    EXPECT_EQ(e.msg(), "Index is too big");
    EXPECT_EQ(e.colno(), 3u);
    EXPECT_EQ(e.end_colno(), 3 + num.size());
}

TEST(SelectNodes, index_on_an_object) {
    auto root = Array{Value{Object{}}};
    for (const auto* query : {"$[0]", "$[0]?", "$[0].b", "$[0][:]", "$[0][0]", "$[0]['']", "$[0][@]"}) {
        expect_type_error(root_node(root), query, {}, "Object key must be string, not");
    }
}

TEST(SelectNodes, slice) {
    struct Case { const char* query; Slice expected; };
    const auto none = std::optional<std::int64_t>{};
    const auto cases = std::vector<Case>{
        {"$[:]", Slice{none, none, none}},
        {"$[-1:]", Slice{-1, none, none}},
        {"$[0:]", Slice{0, none, none}},
        {"$[11:]", Slice{11, none, none}},
        {"$[:-1]", Slice{none, -1, none}},
        {"$[:10]", Slice{none, 10, none}},
        {"$[::]", Slice{none, none, none}},
        {"$[1::]", Slice{1, none, none}},
        {"$[:1:]", Slice{none, 1, none}},
        {"$[::-1]", Slice{none, none, -1}},
        {"$[::0]", Slice{none, none, 0}},
        {"$[::11]", Slice{none, none, 11}},
        {"$[1:2:3]", Slice{1, 2, 3}},
    };
    auto root = Array{Value{Array{}}};
    auto* array = &root[0].as_array();
    for (const auto& c : cases) {
        EXPECT_EQ(select_nodes(root_node(root), c.query, with_slices),
                  (NodeList{Node{array, c.expected}}))
            << c.query;
    }
}

TEST(SelectNodes, too_big_slice_bound) {
    const auto num = big_num();
    struct Case { std::string query; const char* msg; std::size_t colno; };
    for (const auto& c : {Case{"$[" + num + ":]", "Start is too big", 3},
                          Case{"$[" + num + "::]", "Start is too big", 3},
                          Case{"$[:" + num + "]", "Stop is too big", 4},
                          Case{"$[:" + num + ":]", "Stop is too big", 4},
                          Case{"$[::" + num + "]", "Step is too big", 5}}) {
        const auto e = select_error({}, c.query);
        EXPECT_EQ(e.msg(), c.msg);
        EXPECT_EQ(e.colno(), c.colno);
        EXPECT_EQ(e.end_colno(), c.colno + num.size());
    }
}

TEST(SelectNodes, slice_not_allowed_in_relative_query) {
    auto root = Array{Value{Array{}}};
    for (const auto* query : {"@[:]", "@[:].b", "@[:][:]", "@[:][0]", "@[:]['']"}) {
        expect_type_error(root_node(root), query, relative, "Array index must be integer, not");
    }
}

TEST(SelectNodes, slice_result_needs_allow_slice) {
    auto root = Array{Value{Array{}}};
    expect_type_error(root_node(root), "$[:]", {}, "Array index must be integer, not slice");
}

TEST(SelectNodes, slice_on_an_object) {
    auto root = Array{Value{Object{}}};
    for (const auto* query : {"$[:]", "$[:]?", "$[:].b", "$[:][:]", "$[:][0]", "$[:]['']", "$[:][@]"}) {
        expect_type_error(root_node(root), query, {}, "Object key must be string, not");
    }
}

TEST(SelectNodes, slice_fans_out_over_targets) {
    auto root = Array{Value{Array{Value{Object{{"a", 1}}}, Value{Object{{"a", 2}}}, Value{Object{{"a", 3}}}}}};
    auto& items = root[0].as_array();
    EXPECT_EQ(select_nodes(root_node(root), "$[::-2].a"),
              (NodeList{Node{&items[2].as_object(), "a"}, Node{&items[0].as_object(), "a"}}));
}

// -- Filters ------------------------------------------------------------------

TEST(SelectNodes, filter_over_array) {
    auto root = Array{Value{Array{1, 2, 3}}};
    auto* array = &root[0].as_array();
    EXPECT_EQ(select_nodes(root_node(root), "$[@]"),
              (NodeList{Node{array, std::int64_t{0}}, Node{array, std::int64_t{1}},
                        Node{array, std::int64_t{2}}}));
}

TEST(SelectNodes, filter_over_object) {
    auto root = Array{Value{Object{{"a", 1}, {"b", 2}, {"c", 3}}}};
    auto* object = &root[0].as_object();
    EXPECT_EQ(select_nodes(root_node(root), "$[@]"),
              (NodeList{Node{object, "a"}, Node{object, "b"}, Node{object, "c"}}));
}

TEST(SelectNodes, filter_with_comparison) {
    auto root = Array{Value{Object{
        {"items", Array{Value{Object{{"name", "pen"}, {"price", 2}}},
                        Value{Object{{"name", "book"}, {"price", 12}}},
                        Value{Object{{"name", "cup"}, {"price", 5.5}}}}},
    }}};
    auto& items = root[0].as_object().at("items").as_array();
    EXPECT_EQ(select_nodes(root_node(root), "$.items[@.price < 10].name"),
              (NodeList{Node{&items[0].as_object(), "name"}, Node{&items[2].as_object(), "name"}}));
}

TEST(SelectNodes, filter_not_allowed_in_relative_query) {
    const auto e = select_error({}, "@[@]", relative);
    EXPECT_EQ(e.msg(), "Filters are not allowed in relative query");
    EXPECT_EQ(e.colno(), 3u);
}

// -- Conditions ---------------------------------------------------------------

TEST(SelectNodes, condition_keeps_existing_keys) {
    auto one = Array{0};
    auto object = Object{{"", 0}};
    EXPECT_EQ(select_nodes(Node{&one, std::int64_t{0}}, "${@}"), (NodeList{Node{&one, std::int64_t{0}}}));
    EXPECT_EQ(select_nodes(Node{&object, ""}, "${@}"), (NodeList{Node{&object, ""}}));
}

TEST(SelectNodes, condition_drops_missing_keys) {
    auto empty = Array{};
    auto empty_object = Object{};
    EXPECT_TRUE(select_nodes(Node{&empty, std::int64_t{0}}, "${@}?").empty());
    EXPECT_TRUE(select_nodes(Node{&empty_object, ""}, "${@}?").empty());
    try {
        (void)select_nodes(Node{&empty, std::int64_t{0}}, "${@}");
        FAIL() << "expected an Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::value_error);
        EXPECT_STREQ(e.what(), "Query has no matches: ${@}");
    }
}

TEST(SelectNodes, condition_expands_slices_in_order) {
    auto root = Array{Value{Array{1, 2, 3}}};
    auto* array = &root[0].as_array();
    const auto all = NodeList{Node{array, std::int64_t{0}}, Node{array, std::int64_t{1}},
                              Node{array, std::int64_t{2}}};
    EXPECT_EQ(select_nodes(root_node(root), "$[:]{@}"), all);
    EXPECT_EQ(select_nodes(root_node(root), "$[::-1]{@}"), all);
    EXPECT_EQ(select_nodes(root_node(root), "$[:]{@ > 1}"), (NodeList{Node{array, std::int64_t{2}}}));
}

TEST(SelectNodes, condition_filters_the_current_nodes) {
    auto root = Array{Value{Object{{"a", Object{{"b", 1}}}}}};
    auto* object = &root[0].as_object();
    EXPECT_EQ(select_nodes(root_node(root), "$.a{@.b == 1}"), (NodeList{Node{object, "a"}}));
    EXPECT_TRUE(select_nodes(root_node(root), "$.a{@.b == 2}?").empty());
    EXPECT_EQ(select_nodes(root_node(root), "$.a{@.b}.b"),
              (NodeList{Node{&object->at("a").as_object(), "b"}}));
}

TEST(SelectNodes, condition_braces_in_properties) {
    auto root = Array{Value{Object{}}};
    auto* object = &root[0].as_object();
    EXPECT_EQ(select_nodes(root_node(root), "$.a~{~}"), (NodeList{Node{object, "a{}"}}));
}

TEST(SelectNodes, condition_not_allowed_in_relative_query) {
    const auto e = select_error({}, "@{@}", relative);
    EXPECT_EQ(e.msg(), "Conditions are not allowed in relative query");
    EXPECT_EQ(e.colno(), 3u);
}

TEST(SelectNodes, condition_needs_closing_bracket) {
    const auto e = select_error({}, "${@");
    EXPECT_EQ(e.msg(), "Expecting a closing bracket");
    EXPECT_EQ(e.colno(), 4u);
}

// -- Mapping ------------------------------------------------------------------

TEST(SelectNodes, mapping_rejects_fan_out) {
    auto e = select_error({}, "$[@]", QueryOptions{.mapping = true});
    EXPECT_EQ(e.msg(), "Expecting key");
    EXPECT_EQ(e.colno(), 3u);

    e = select_error({}, "$?", QueryOptions{.mapping = true});
    EXPECT_EQ(e.msg(), "Unexpected optional marker");
    EXPECT_EQ(e.colno(), 2u);
    EXPECT_EQ(e.end_colno(), 3u);

    e = select_error({}, "${@}", QueryOptions{.mapping = true});
    EXPECT_EQ(e.msg(), "Unexpected condition");
    EXPECT_EQ(e.colno(), 2u);
    EXPECT_EQ(e.end_colno(), 3u);
}

TEST(SelectNodes, mapping_rejects_slice_before_final_key) {
    auto root = Array{Value{Array{Value{Object{}}, Value{Object{}}}}};
    expect_type_error(root_node(root), "$[0:2].x", QueryOptions{.allow_slice = true, .mapping = true},
                      "Array index must be integer, not slice");
}

TEST(SelectNodes, relative_query_maps_each_node) {
    auto outer = Array{Value{Object{{"x", Object{}}}}, Value{Object{{"y", Object{}}}}};
    const auto starts = NodeList{Node{&outer[0].as_object(), "x"}, Node{&outer[1].as_object(), "y"}};
    EXPECT_EQ(select_nodes(starts, "@.k", QueryOptions{.mapping = true, .relative = true}),
              (NodeList{Node{&outer[0].as_object().at("x").as_object(), "k"},
                        Node{&outer[1].as_object().at("y").as_object(), "k"}}));
}

// -- Compiled queries ---------------------------------------------------------

TEST(Query, compiled_query_is_reusable) {
    const auto query = compile_query("$[@ > 1]");
    EXPECT_EQ(query.text(), "$[@ > 1]");
    EXPECT_FALSE(query.is_optional());
    EXPECT_EQ(query.segments().size(), 1u);

    auto first = Array{Value{Array{1, 2, 3}}};
    auto second = Array{Value{Array{5}}};
    EXPECT_EQ(query.evaluate(root_node(first)).size(), 2u);
    EXPECT_EQ(query.evaluate(root_node(second)).size(), 1u);
}

TEST(Query, optional_flag) {
    EXPECT_TRUE(compile_query("$.a?").is_optional());
    EXPECT_TRUE(compile_query("$?.a").is_optional());
}
