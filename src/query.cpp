#include <jsonmanip-cpp/query.hpp>

#include <jsonmanip-cpp/error.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace jsonmanip_cpp {

namespace {

// Targets of every node, in order.
auto collect_targets(const NodeList& nodes, bool allow_slice) -> std::vector<Target> {
    auto targets = std::vector<Target>{};
    targets.reserve(nodes.size());
    for (const auto& node : nodes) {
        for (auto target : get_targets(node, allow_slice)) targets.push_back(target);
    }
    return targets;
}

}  // anonymous namespace

auto compare(const Value& left, Operator op, const Value& right) -> bool {
    switch (op) {
        case Operator::equal:         return query_equal(left, right);
        case Operator::not_equal:     return !query_equal(left, right);
        case Operator::less:          return query_compare(left, right) < 0;
        case Operator::less_equal:    return query_compare(left, right) <= 0;
        case Operator::greater_equal: return query_compare(left, right) >= 0;
        case Operator::greater:       return query_compare(left, right) > 0;
    }
    return false;
}

// =============================================================================
// Filter
// =============================================================================

auto Filter::apply(NodeList nodes) const -> NodeList {
    for (const auto& condition : conditions_) {
        if (nodes.empty()) break;

        // Relative queries map every node to exactly one node
        const auto selected = condition.left->evaluate(nodes);
        auto kept = NodeList{};
        auto kept_selected = NodeList{};
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            if (has_key(selected[i]) != condition.negate) {
                kept.push_back(nodes[i]);
                kept_selected.push_back(selected[i]);
            }
        }

        if (!condition.op) {
            nodes = std::move(kept);
            continue;
        }

        auto matched = NodeList{};
        std::visit(overload{
            [&](const Value& literal) {
                for (std::size_t i = 0; i < kept.size(); ++i) {
                    if (compare(at(kept_selected[i]), *condition.op, literal)) matched.push_back(kept[i]);
                }
            },
            [&](const std::shared_ptr<const Query>& right) {
                const auto right_selected = right->evaluate(kept);
                for (std::size_t i = 0; i < kept.size(); ++i) {
                    if (has_key(right_selected[i]) &&
                        compare(at(kept_selected[i]), *condition.op, at(right_selected[i]))) {
                        matched.push_back(kept[i]);
                    }
                }
            },
        }, condition.right);
        nodes = std::move(matched);
    }
    return nodes;
}

// =============================================================================
// Query
// =============================================================================

auto Query::evaluate(NodeList nodes) const -> NodeList {
    for (const auto& segment : segments_) {
        std::visit(overload{
            [&](const OptionalMarker&) {
                auto present = NodeList{};
                for (const auto& node : nodes) {
                    check_key(node, true);
                    if (std::holds_alternative<Slice>(node.key) || has_key(node)) present.push_back(node);
                }
                nodes = std::move(present);
            },
            [&](const KeySegment& key_segment) {
                auto next = NodeList{};
                // Relative and mapping queries must not fan out over a slice
                for (auto target : collect_targets(nodes, !options_.relative && !options_.mapping)) {
                    next.push_back(Node{target, key_segment.key});
                }
                nodes = std::move(next);
            },
            [&](const FilterSegment& filter_segment) {
                auto expanded = NodeList{};
                for (auto target : collect_targets(nodes, true)) {
                    for (auto& child : children(target)) expanded.push_back(std::move(child));
                }
                nodes = filter_segment.filter.apply(std::move(expanded));
            },
            [&](const ConditionSegment& condition_segment) {
                auto expanded = NodeList{};
                for (const auto& node : nodes) {
                    const auto* slice = std::get_if<Slice>(&node.key);
                    if (slice == nullptr) {
                        expanded.push_back(node);
                        continue;
                    }
                    check_key(node, true);
                    auto* array = std::get<Array*>(node.target);
                    const auto range = slice->indices(array->size());
                    for (std::size_t i = 0; i < range.length; ++i) {
                        const auto j = range.step < 0 ? range.length - 1 - i : i;
                        expanded.push_back(Node{array, static_cast<std::int64_t>(range.at(j))});
                    }
                }
                nodes = condition_segment.filter.apply(std::move(expanded));
            },
        }, segment);
    }

    for (const auto& node : nodes) check_key(node, options_.allow_slice);

    if (nodes.empty() && !options_.relative && !optional_) {
        throw Error{ErrorKind::value_error, "Query has no matches: " + text_};
    }
    return nodes;
}

}  // namespace jsonmanip_cpp
