// Fuzz target for the query compiler — any input must either compile or
// raise a SyntaxError, and a compiled query must evaluate without crashing.

#include <jsonmanip-cpp/jsonmanip.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    namespace jm = jsonmanip_cpp;

    auto root = jm::Array{};
    root.push_back(jm::Object{
        {"a", jm::Array{1, 2.5, "x", nullptr}},
        {"b", jm::Object{{"c", true}, {"", jm::Array{}}}},
    });

    try {
        const auto query = jm::compile_query(text, jm::QueryOptions{.allow_slice = true, .mapping = true});
        (void)query.evaluate(jm::Node{&root, std::int64_t{0}});
    } catch (const jm::SyntaxError& e) {
        // Positions must stay inside the query text
        if (e.start() > text.size() || e.end() > text.size()) __builtin_trap();
    } catch (const jm::Error&) {
        // Evaluation errors (missing keys, type mismatches) are expected
    }
    return 0;
}
