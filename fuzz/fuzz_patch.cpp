// Fuzz target for the patch interpreter — the input is parsed as a JSON
// patch and applied to a fixed document. Any document that patches cleanly
// is diffed back against the original.

#include <jsonmanip-cpp/jsonmanip.hpp>
#include <jsonmanip-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    namespace jm = jsonmanip_cpp;

    const auto doc = jm::Value{jm::Object{
        {"items", jm::Array{3, 1, 2}},
        {"meta", jm::Object{{"name", "x"}, {"tags", jm::Array{"a", "b"}}}},
    }};

    try {
        const auto patch = jm::parse_json(text);
        const auto patched = jm::apply_patch(doc, patch);

        // Round-trip: the diff must rebuild the patched document
        const auto diff = jm::Value{jm::make_patch(doc, patched)};
        if (!jm::deep_equal(jm::apply_patch(doc, diff), patched)) __builtin_trap();
    } catch (const jm::Error&) {
    }
    return 0;
}
