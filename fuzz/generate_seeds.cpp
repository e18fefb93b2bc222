// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <jsonmanip-cpp/jsonmanip.hpp>
#include <jsonmanip-cpp/json.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

static void write_seeds(const std::string& dir, const std::vector<std::string>& seeds) {
    std::filesystem::create_directories(dir);
    for (std::size_t i = 0; i < seeds.size(); ++i) {
        write_seed(dir + "/seed_" + std::to_string(i) + ".txt", seeds[i]);
    }
}

int main() {
    namespace jm = jsonmanip_cpp;

    write_seeds("fuzz/corpus/query", {
        "$",
        "$.a[0]",
        "$.a[-1:0:-1]",
        "$['']?",
        "$.a[@ > 1 && @ != 'x']",
        "$.b.c",
        "$.a[start]",
        "$[!@.a]",
    });

    write_seeds("fuzz/corpus/query_value", {
        "null", "true", "-0.5e-3", "'it~'s'", "9223372036854775807", "NaN", "-Infinity",
    });

    // Patches are generated from real diffs so they always apply
    const auto doc = jm::Value{jm::Object{
        {"items", jm::Array{3, 1, 2}},
        {"meta", jm::Object{{"name", "x"}, {"tags", jm::Array{"a", "b"}}}},
    }};
    const auto targets = std::vector<jm::Value>{
        jm::Object{{"items", jm::Array{1, 2, 3}}},
        jm::Object{{"items", jm::Array{3, 1, 2}}, {"meta", jm::Object{{"name", "y"}}}},
        jm::Array{},
    };
    auto patches = std::vector<std::string>{};
    for (const auto& target : targets) patches.push_back(jm::dump_json(jm::make_patch(doc, target)));
    patches.push_back(R"([{"op": "sort", "path": "$.items", "reverse": true}])");
    patches.push_back(R"({"op": "copy", "from": "@.meta.tags", "to": "$.items", "mode": "extend"})");
    write_seeds("fuzz/corpus/patch", patches);

    return 0;
}
