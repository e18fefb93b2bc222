// threading_test.cpp — Sharing compiled queries and a Manipulator across threads

#include <jsonmanip-cpp/jsonmanip.hpp>
#include <jsonmanip-cpp/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace jsonmanip_cpp;

namespace {

auto make_document(int seed) -> Value {
    auto items = Array{};
    for (int i = 0; i < 50; ++i) {
        items.push_back(Object{{"id", seed * 100 + i}, {"price", i % 10}});
    }
    return Object{{"owner", seed}, {"items", std::move(items)}};
}

}  // anonymous namespace

TEST(Threading, shared_query_on_independent_trees) {
    const auto query = compile_query("$.items[@.price < 3].id");
    auto errors = std::atomic<int>{0};

    auto threads = std::vector<std::jthread>{};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&query, &errors, t]() {
            for (int round = 0; round < 20; ++round) {
                auto root = Array{make_document(t)};
                const auto nodes = query.evaluate(Node{&root, std::int64_t{0}});
                if (nodes.size() != 15) ++errors;
                for (const auto& node : nodes) {
                    if (read(node).as_int() / 100 != t) ++errors;
                }
            }
        });
    }
    threads.clear();  // join all

    EXPECT_EQ(errors.load(), 0);
}

TEST(Threading, shared_manipulator_patches_independent_trees) {
    const auto manipulator = Manipulator{ManipulatorOptions{.use_decimal = true}};
    const auto patch = parse_json(R"([
        {"op": "del", "path": "$.items[@.price >= 5]"},
        {"op": "reverse", "path": "$.items"},
        {"op": "set", "path": "$.checked", "value": true},
        {"op": "assert", "expr": "@.checked == true"}
    ])");
    auto errors = std::atomic<int>{0};

    auto threads = std::vector<std::jthread>{};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&manipulator, &patch, &errors, t]() {
            for (int round = 0; round < 20; ++round) {
                try {
                    const auto result = manipulator.apply_patch(make_document(t), patch);
                    if (result.as_object().at("items").as_array().size() != 25) ++errors;
                    if (result.as_object().at("owner") != Value{t}) ++errors;
                } catch (const Error&) {
                    ++errors;
                }
            }
        });
    }
    threads.clear();  // join all

    EXPECT_EQ(errors.load(), 0);
}

TEST(Threading, concurrent_diffs) {
    auto errors = std::atomic<int>{0};

    auto threads = std::vector<std::jthread>{};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&errors, t]() {
            const auto old_value = make_document(t);
            const auto new_value = make_document(t + 1);
            const auto patch = make_patch(old_value, new_value);
            if (!deep_equal(apply_patch(old_value, Value{patch}), new_value)) ++errors;
        });
    }
    threads.clear();  // join all

    EXPECT_EQ(errors.load(), 0);
}
