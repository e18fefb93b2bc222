// Fuzz target for query literals — exercises number, string and name
// parsing with and without Decimal and NaN/Infinity support.

#include <jsonmanip-cpp/jsonmanip.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    namespace jm = jsonmanip_cpp;

    for (const auto options : {jm::ManipulatorOptions{},
                               jm::ManipulatorOptions{.allow_nan_and_infinity = true, .use_decimal = true}}) {
        try {
            auto value = jm::Manipulator{options}.load_query_value(text);
            (void)value;
        } catch (const jm::SyntaxError&) {
        }
    }
    return 0;
}
