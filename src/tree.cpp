#include "tree.hpp"

#include <jsondb-cpp/error.hpp>
#include <jsondb-cpp/types.hpp>

#include <string>
#include <utility>

namespace jsondb_cpp::detail {

namespace {

using json = nlohmann::json;

auto describe(const PathStep& step) -> std::string {
    return std::visit(overload{
        [](const std::string& key) { return "key '" + key + "'"; },
        [](std::int64_t index) { return "index [" + std::to_string(index) + "]"; },
        [](AppendMarker) { return std::string{"append marker []"}; },
    }, step);
}

[[noreturn]] void throw_type_mismatch(const PathStep& step, const json& node) {
    throw Exception{ErrorKind::type_mismatch,
                    "cannot apply " + describe(step) + " to a JSON " + node.type_name()};
}

// Absent and null nodes may be replaced by whatever container a write needs.
auto is_vacant(const json* node) -> bool {
    return node == nullptr || node->is_null();
}

// Walk the steps of a write without modifying anything, so that every
// failure is reported before the first node is created.
void check_writable(const json& doc, const std::vector<PathStep>& steps) {
    const json* current = &doc;
    for (const auto& step : steps) {
        current = std::visit(overload{
            [&](const std::string& key) -> const json* {
                if (is_vacant(current)) return nullptr;
                if (!current->is_object()) throw_type_mismatch(step, *current);
                auto it = current->find(key);
                return it != current->end() ? &*it : nullptr;
            },
            [&](std::int64_t index) -> const json* {
                if (!is_vacant(current) && !current->is_array()) throw_type_mismatch(step, *current);
                auto size = is_vacant(current) ? std::size_t{0} : current->size();
                auto pos = insertion_index(index, size);
                return pos < size ? &(*current)[pos] : nullptr;
            },
            [&](AppendMarker) -> const json* {
                if (!is_vacant(current) && !current->is_array()) throw_type_mismatch(step, *current);
                return nullptr;
            },
        }, step);
    }
}

}  // anonymous namespace

auto element_index(std::int64_t index, std::size_t size) -> std::optional<std::size_t> {
    if (index >= 0) {
        auto pos = static_cast<std::size_t>(index);
        if (pos < size) return pos;
        return std::nullopt;
    }
    // -1 is the last element, -2 the one before, ...
    auto from_end = static_cast<std::size_t>(-(index + 1)) + 1;
    if (from_end > size) return std::nullopt;
    return size - from_end;
}

auto insertion_index(std::int64_t index, std::size_t size) -> std::size_t {
    if (auto pos = element_index(index, size)) return *pos;
    if (index >= 0 && static_cast<std::size_t>(index) == size) return size;
    throw Exception{ErrorKind::index_out_of_range,
                    "index [" + std::to_string(index) + "] is not a valid position in an array of " +
                    std::to_string(size) + " element(s)"};
}

auto find_node(const json& doc, const std::vector<PathStep>& steps) -> const json* {
    const json* current = &doc;
    for (const auto& step : steps) {
        current = std::visit(overload{
            [&](const std::string& key) -> const json* {
                if (!current->is_object()) return nullptr;
                auto it = current->find(key);
                return it != current->end() ? &*it : nullptr;
            },
            [&](std::int64_t index) -> const json* {
                if (!current->is_array()) return nullptr;
                auto pos = element_index(index, current->size());
                return pos ? &(*current)[*pos] : nullptr;
            },
            [](AppendMarker) -> const json* {
                throw Exception{ErrorKind::invalid_path,
                                "the append marker [] can only be used to write"};
            },
        }, step);
        if (!current) return nullptr;
    }
    return current;
}

auto find_node(json& doc, const std::vector<PathStep>& steps) -> json* {
    return const_cast<json*>(find_node(std::as_const(doc), steps));
}

void put_node(json& doc, const std::vector<PathStep>& steps, json value) {
    check_writable(doc, steps);

    json* current = &doc;
    for (const auto& step : steps) {
        current = std::visit(overload{
            [&](const std::string& key) -> json* {
                if (current->is_null()) *current = json::object();
                return &(*current)[key];
            },
            [&](std::int64_t index) -> json* {
                if (current->is_null()) *current = json::array();
                auto pos = insertion_index(index, current->size());
                if (pos == current->size()) current->push_back(nullptr);
                return &(*current)[pos];
            },
            [&](AppendMarker) -> json* {
                if (current->is_null()) *current = json::array();
                current->push_back(nullptr);
                return &current->back();
            },
        }, step);
    }
    *current = std::move(value);
}

void merge_node(json& doc, const std::vector<PathStep>& steps, json value) {
    auto* target = find_node(doc, steps);
    if (!target) {
        throw Exception{ErrorKind::merge_target_missing, "no data to merge into"};
    }

    if (value.is_object() && target->is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            (*target)[it.key()] = std::move(it.value());
        }
    } else if (value.is_array()) {
        if (!target->is_array()) {
            throw Exception{ErrorKind::type_mismatch,
                            std::string{"cannot merge an array into a JSON "} + target->type_name()};
        }
        for (auto& element : value) {
            target->push_back(std::move(element));
        }
    } else if (value.is_object() && target->is_array()) {
        throw Exception{ErrorKind::type_mismatch, "cannot merge an object into an array"};
    } else {
        *target = std::move(value);
    }
}

auto erase_node(json& doc, const std::vector<PathStep>& steps) -> bool {
    if (steps.empty()) {
        doc = json::object();
        return true;
    }

    auto parent_steps = std::vector<PathStep>(steps.begin(), steps.end() - 1);
    auto* parent = find_node(doc, parent_steps);
    if (!parent) return false;

    return std::visit(overload{
        [&](const std::string& key) -> bool {
            return parent->is_object() && parent->erase(key) > 0;
        },
        [&](std::int64_t index) -> bool {
            if (!parent->is_array()) return false;
            auto pos = element_index(index, parent->size());
            if (!pos) return false;
            parent->erase(*pos);
            return true;
        },
        [](AppendMarker) -> bool {
            throw Exception{ErrorKind::invalid_path,
                            "the append marker [] can only be used to write"};
        },
    }, steps.back());
}

}  // namespace jsondb_cpp::detail
