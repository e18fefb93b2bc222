// basic_usage — demonstrates core jsonmanip-cpp API
//
// Shows querying with select_nodes(), filtering with apply_filter(),
// literal parsing, and patching a document with apply_patch().
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonmanip-cpp/jsonmanip.hpp>
#include <jsonmanip-cpp/json.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace jm = jsonmanip_cpp;

int main() {
    auto doc = jm::parse_json(R"({
        "store": "corner shop",
        "items": [
            {"name": "Milk", "price": 1.25, "stock": 10},
            {"name": "Eggs", "price": 3.5, "stock": 0},
            {"name": "Bread", "price": 2.0},
            {"name": "Cheese", "price": 12.75, "stock": 4}
        ]
    })");

    // -- Queries address nodes inside a root holder ---------------------------
    auto root = jm::Array{};
    root.push_back(std::move(doc));
    const auto document = jm::Node{&root, std::int64_t{0}};

    std::printf("Item names:\n");
    for (const auto& node : jm::select_nodes(document, "$.items[:].name")) {
        std::printf("  %s\n", jm::read(node).as_string().c_str());
    }

    // -- Filters keep the nodes whose conditions hold -------------------------
    std::printf("In stock under 5.00:\n");
    for (const auto& node : jm::select_nodes(document, "$.items[@.stock > 0 && @.price < 5]")) {
        std::printf("  %s\n", jm::dump_json(jm::read(node)).c_str());
    }

    const auto items = jm::select_nodes(document, "$.items");
    const auto untracked = jm::apply_filter(jm::children(jm::as_target(jm::at(items[0]))), "!@.stock");
    std::printf("Items without a stock count: %zu\n", untracked.size());

    // -- Optional queries match nothing instead of failing --------------------
    const auto missing = jm::select_nodes(document, "$.owner?");
    std::printf("Owner present: %s\n", missing.empty() ? "no" : "yes");

    // -- Query literals -------------------------------------------------------
    const auto literal = jm::load_query_value("'it~'s'");
    std::printf("Literal: %s\n", literal.as_string().c_str());

    // -- Patching -------------------------------------------------------------
    const auto patch = jm::parse_json(R"([
        {"op": "del", "path": "$.items[@.stock == 0]"},
        {"op": "set", "path": "$.items[@.name == 'Bread'].stock", "value": 25},
        {"op": "append", "path": "$.items", "value": {"name": "Jam", "price": 4.0, "stock": 2}},
        {"op": "assert", "expr": "@.store == 'corner shop'", "msg": "store renamed"}
    ])");

    try {
        const auto patched = jm::apply_patch(root[0], patch);
        std::printf("Patched:\n%s\n", jm::dump_json(patched, 2).c_str());
    } catch (const jm::Error& e) {
        std::printf("Patch failed (%s): %s\n",
                    std::string{jm::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }

    // -- Syntax errors point at the offending column --------------------------
    try {
        (void)jm::select_nodes(document, "$.items[@.price <]");
    } catch (const jm::SyntaxError& e) {
        for (const auto& line : jm::format_syntax_error(e)) std::printf("%s", line.c_str());
    }

    return 0;
}
