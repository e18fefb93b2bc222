#include <jsonmanip-cpp/diff.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonmanip_cpp {

namespace {

constexpr auto is_identifier_start(char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

constexpr auto is_identifier_char(char c) noexcept -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

/// Pending work for the diff loop: either compare two values or emit one
/// operation. Operations are built only when they are emitted.
struct Task {
    enum class Kind : std::uint8_t { diff, del, insert, set };

    Kind kind;
    std::string path;
    const Value* old_value{nullptr};
    const Value* new_value{nullptr};
};

auto make_operation(const Task& task) -> Value {
    switch (task.kind) {
        case Task::Kind::del:
            return Object{{"op", "del"}, {"path", task.path}};
        case Task::Kind::insert:
            return Object{{"op", "insert"}, {"path", task.path}, {"value", *task.new_value}};
        case Task::Kind::set:
        case Task::Kind::diff:
            break;
    }
    return Object{{"op", "set"}, {"path", task.path}, {"value", *task.new_value}};
}

/// The longest common subsequence of two arrays, as pointers into `old_items`.
/// On ties the backtrack steps back in `old_items` first.
auto longest_common_subsequence(const Array& old_items, const Array& new_items)
    -> std::vector<const Value*> {
    const auto n = old_items.size();
    const auto m = new_items.size();
    const auto width = m + 1;

    auto equal = std::vector<char>(n * m, 0);
    auto dp = std::vector<std::size_t>((n + 1) * width, 0);
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = 0; j < m; ++j) {
            if (deep_equal(old_items[i], new_items[j])) {
                equal[i * m + j] = 1;
                dp[(i + 1) * width + j + 1] = dp[i * width + j] + 1;
            } else {
                dp[(i + 1) * width + j + 1] =
                    std::max(dp[(i + 1) * width + j], dp[i * width + j + 1]);
            }
        }
    }

    auto lcs = std::vector<const Value*>{};
    auto i = n;
    auto j = m;
    while (i > 0 && j > 0) {
        if (equal[(i - 1) * m + j - 1]) {
            lcs.push_back(&old_items[i - 1]);
            --i;
            --j;
        } else if (dp[(i - 1) * width + j] >= dp[i * width + j - 1]) {
            --i;
        } else {
            --j;
        }
    }
    return {lcs.rbegin(), lcs.rend()};
}

// Tasks for two objects, in emission order.
void diff_objects(const Object& old_object, const Object& new_object, const std::string& path,
                  std::vector<Task>& out) {
    for (const auto& [key, old_item] : old_object) {
        auto child_path = path + encode_query_key(key);
        auto it = new_object.find(key);
        if (it != new_object.end()) {
            out.push_back(Task{Task::Kind::diff, std::move(child_path), &old_item, &it->second});
        } else {
            out.push_back(Task{Task::Kind::del, std::move(child_path)});
        }
    }
    for (const auto& [key, new_item] : new_object) {
        if (!old_object.contains(key)) {
            out.push_back(Task{Task::Kind::set, path + encode_query_key(key), nullptr, &new_item});
        }
    }
}

// Tasks for two arrays, in emission order. Paths use the index in the
// new array, which is where the element sits once earlier tasks ran.
void diff_arrays(const Array& old_items, const Array& new_items, const std::string& path,
                 std::vector<Task>& out) {
    const auto lcs = longest_common_subsequence(old_items, new_items);
    auto old_idx = std::size_t{0};
    auto new_idx = std::size_t{0};
    auto lcs_idx = std::size_t{0};
    while (old_idx < old_items.size() || new_idx < new_items.size()) {
        auto child_path = path + "[" + std::to_string(new_idx) + "]";
        const auto removed = old_idx < old_items.size() &&
            (lcs_idx >= lcs.size() || !deep_equal(old_items[old_idx], *lcs[lcs_idx]));
        const auto inserted = new_idx < new_items.size() &&
            (lcs_idx >= lcs.size() || !deep_equal(new_items[new_idx], *lcs[lcs_idx]));

        if (removed && inserted) {
            out.push_back(Task{Task::Kind::diff, std::move(child_path),
                               &old_items[old_idx], &new_items[new_idx]});
            ++old_idx;
            ++new_idx;
        } else if (removed) {
            out.push_back(Task{Task::Kind::del, std::move(child_path)});
            ++old_idx;
        } else if (inserted) {
            out.push_back(Task{Task::Kind::insert, std::move(child_path), nullptr, &new_items[new_idx]});
            ++new_idx;
        } else {
            ++old_idx;
            ++new_idx;
            ++lcs_idx;
        }
    }
}

}  // anonymous namespace

auto encode_query_key(std::string_view key) -> std::string {
    auto identifier = !key.empty() && is_identifier_start(key.front());
    for (auto c : key) identifier = identifier && is_identifier_char(c);
    if (identifier) return "." + std::string{key};

    auto result = std::string{"['"};
    for (auto c : key) {
        if (c == '\'' || c == '~') result.push_back('~');
        result.push_back(c);
    }
    result += "']";
    return result;
}

auto make_patch(const Value& old_value, const Value& new_value) -> Array {
    auto patch = Array{};
    auto pending = std::vector<Task>{};
    pending.push_back(Task{Task::Kind::diff, "$", &old_value, &new_value});

    auto children = std::vector<Task>{};
    while (!pending.empty()) {
        auto task = std::move(pending.back());
        pending.pop_back();

        if (task.kind != Task::Kind::diff) {
            patch.push_back(make_operation(task));
            continue;
        }

        const auto& old_item = *task.old_value;
        const auto& new_item = *task.new_value;
        if (deep_equal(old_item, new_item)) continue;

        children.clear();
        if (old_item.is_object() && new_item.is_object()) {
            diff_objects(old_item.as_object(), new_item.as_object(), task.path, children);
        } else if (old_item.is_array() && new_item.is_array()) {
            diff_arrays(old_item.as_array(), new_item.as_array(), task.path, children);
        } else {
            task.kind = Task::Kind::set;
            patch.push_back(make_operation(task));
            continue;
        }
        // Reversed, so the first child is handled next
        for (auto it = children.rbegin(); it != children.rend(); ++it) pending.push_back(std::move(*it));
    }
    return patch;
}

}  // namespace jsonmanip_cpp
