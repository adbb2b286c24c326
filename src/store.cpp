#include <jsondb-cpp/store.hpp>
#include <jsondb-cpp/log.hpp>

#include "document_file.hpp"
#include "tree.hpp"

#include <string>
#include <utility>

namespace jsondb_cpp {

Store::Store(StoreOptions options, Schema schema)
    : options_{std::move(options)} {
    validate_options(options_);
    for (const auto& [path, shape] : schema) {
        schema_.emplace(normalize_path(path, options_.separator), shape);
    }
    file_ = std::make_unique<detail::DocumentFile>(backing_file(options_), options_.human_readable);
}

Store::~Store() = default;

Store::Store(Store&&) noexcept = default;
auto Store::operator=(Store&&) noexcept -> Store& = default;

auto Store::options() const -> const StoreOptions& {
    return options_;
}

auto Store::schema() const -> const Schema& {
    return schema_;
}

auto Store::file() const -> const std::filesystem::path& {
    return file_->path();
}

auto Store::shape_of(std::string_view path) const -> Shape {
    auto it = schema_.find(normalize_path(path, options_.separator));
    return it != schema_.end() ? it->second : Shape::single;
}

auto Store::resolve(std::string_view path, const std::optional<Locator>& locator,
                    Access access) const -> std::vector<PathStep> {
    const auto canonical = resolve_path(path, shape_of(path), locator, access, options_.separator);
    return parse_path(canonical, options_.separator);
}

// -- Reading ------------------------------------------------------------------

auto Store::lookup(std::string_view path, const std::optional<Locator>& locator)
    -> const nlohmann::json* {
    // Without a locator a read addresses the whole entry, whatever its shape.
    const auto steps = locator ? resolve(path, locator, Access::read)
                               : parse_path(path, options_.separator);
    const auto* node = detail::find_node(file_->document(), steps);
    if (!node && options_.throw_on_missing) {
        throw Exception{ErrorKind::not_found, "no data at '" + std::string{path} + "'"};
    }
    return node;
}

auto Store::get(std::string_view path, const std::optional<Locator>& locator) -> nlohmann::json {
    const auto* node = lookup(path, locator);
    return node ? *node : nlohmann::json{};
}

auto Store::last(std::string_view path) -> nlohmann::json {
    if (shape_of(path) != Shape::array) {
        throw Exception{ErrorKind::type_mismatch,
                        "'" + std::string{path} + "' is not declared as an array"};
    }
    return get(path, last_index);
}

auto Store::exists(std::string_view path, const std::optional<Locator>& locator) -> bool {
    const auto steps = locator ? resolve(path, locator, Access::read)
                               : parse_path(path, options_.separator);
    return detail::find_node(file_->document(), steps) != nullptr;
}

auto Store::count(std::string_view path) -> std::size_t {
    const auto* node = lookup(path, std::nullopt);
    if (!node) return 0;
    if (!node->is_array() && !node->is_object()) {
        throw Exception{ErrorKind::type_mismatch,
                        "cannot count a JSON " + std::string{node->type_name()} + " at '" +
                        std::string{path} + "'"};
    }
    return node->size();
}

auto Store::children(std::string_view path, const Predicate& predicate, bool first_only)
    -> std::vector<nlohmann::json> {
    auto result = std::vector<nlohmann::json>{};
    const auto* node = lookup(path, std::nullopt);
    if (!node) return result;

    if (node->is_array()) {
        for (std::size_t i = 0; i < node->size(); ++i) {
            if (predicate((*node)[i], std::to_string(i))) {
                result.push_back((*node)[i]);
                if (first_only) break;
            }
        }
    } else if (node->is_object()) {
        for (auto it = node->begin(); it != node->end(); ++it) {
            if (predicate(it.value(), it.key())) {
                result.push_back(it.value());
                if (first_only) break;
            }
        }
    } else {
        throw Exception{ErrorKind::type_mismatch,
                        "'" + std::string{path} + "' holds a JSON " + node->type_name() +
                        ", expected an object or an array"};
    }
    return result;
}

auto Store::filter(std::string_view path, const Predicate& predicate)
    -> std::vector<nlohmann::json> {
    return children(path, predicate, false);
}

auto Store::find(std::string_view path, const Predicate& predicate)
    -> std::optional<nlohmann::json> {
    auto found = children(path, predicate, true);
    if (found.empty()) return std::nullopt;
    return std::move(found.front());
}

auto Store::data() -> const nlohmann::json& {
    return file_->document();
}

// -- Writing ------------------------------------------------------------------

void Store::set(std::string_view path, nlohmann::json data,
                const std::optional<Locator>& locator) {
    const auto steps = locator ? resolve(path, locator, Access::write)
                               : parse_path(path, options_.separator);
    detail::put_node(file_->document(), steps, std::move(data));
    commit();
}

void Store::push(std::string_view path, nlohmann::json data,
                 const std::optional<Locator>& locator) {
    if (shape_of(path) == Shape::dictionary && !locator) {
        throw Exception{ErrorKind::missing_key,
                        "a key is required to push into dictionary '" + std::string{path} + "'"};
    }
    const auto steps = resolve(path, locator, Access::write);
    detail::put_node(file_->document(), steps, std::move(data));
    commit();
}

void Store::merge(std::string_view path, nlohmann::json data,
                  const std::optional<Locator>& locator) {
    if (shape_of(path) == Shape::array && !locator) {
        throw Exception{ErrorKind::missing_index,
                        "an index is required to merge into array '" + std::string{path} + "'"};
    }
    const auto steps = locator ? resolve(path, locator, Access::read)
                               : parse_path(path, options_.separator);
    auto& doc = file_->document();
    if (!detail::find_node(doc, steps)) {
        throw Exception{ErrorKind::merge_target_missing,
                        "nothing stored at '" + std::string{path} + "' to merge into"};
    }
    detail::merge_node(doc, steps, std::move(data));
    commit();
}

void Store::remove(std::string_view path, const std::optional<Locator>& locator) {
    const auto steps = locator ? resolve(path, locator, Access::read)
                               : parse_path(path, options_.separator);
    if (detail::erase_node(file_->document(), steps)) {
        commit();
    } else {
        JSONDB_LOG_DEBUG("remove: nothing stored at '{}'", path);
    }
}

auto Store::push_if_not_exists(std::string_view path, nlohmann::json initial_value) -> bool {
    if (exists(path)) return false;
    set(path, std::move(initial_value));
    return true;
}

// -- Persistence --------------------------------------------------------------

void Store::commit() {
    file_->mark_dirty();
    if (options_.save_on_push) {
        file_->save(false);
    }
}

void Store::load() {
    file_->load();
}

void Store::save(bool force) {
    file_->save(force);
}

void Store::reload() {
    file_->reload();
}

auto Store::is_loaded() const -> bool {
    return file_->is_loaded();
}

auto Store::is_dirty() const -> bool {
    return file_->is_dirty();
}

}  // namespace jsondb_cpp
