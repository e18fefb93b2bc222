// patch_roundtrip — diff two JSON files and replay the patch
//
// Computes make_patch(old, new), prints it, applies it to `old` and checks
// the result matches `new`. With no arguments a built-in pair is used.
//
// Build: cmake --build build
// Run:   ./build/examples/patch_roundtrip [old.json new.json]

#include <jsonmanip-cpp/jsonmanip.hpp>
#include <jsonmanip-cpp/json.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace jm = jsonmanip_cpp;

namespace {

auto load_file(const char* path) -> jm::Value {
    auto file = std::ifstream{path};
    if (!file) throw jm::Error{jm::ErrorKind::value_error, std::string{"Can not open "} + path};
    auto buffer = std::ostringstream{};
    buffer << file.rdbuf();
    return jm::parse_json(buffer.str(), path, true);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto old_value = jm::Value{};
        auto new_value = jm::Value{};
        if (argc == 3) {
            old_value = load_file(argv[1]);
            new_value = load_file(argv[2]);
        } else {
            old_value = jm::parse_json(R"({"name": "todo", "tasks": ["wash", "cook", "read"], "done": 1})");
            new_value = jm::parse_json(R"({"name": "todo", "tasks": ["cook", "read", "sleep"], "owner": "sam"})");
        }

        const auto patch = jm::Value{jm::make_patch(old_value, new_value)};
        std::printf("Patch (%zu operations):\n%s\n", patch.as_array().size(),
                    jm::dump_json(patch, 2).c_str());

        const auto patched = jm::apply_patch(old_value, patch);
        if (!jm::deep_equal(patched, new_value)) {
            std::printf("Round trip FAILED\n");
            return 1;
        }
        std::printf("Round trip OK\n");
    } catch (const jm::SyntaxError& e) {
        for (const auto& line : jm::format_syntax_error(e)) std::printf("%s", line.c_str());
        return 1;
    } catch (const jm::Error& e) {
        std::printf("Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
