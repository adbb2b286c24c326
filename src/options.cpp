#include <jsondb-cpp/options.hpp>
#include <jsondb-cpp/error.hpp>

#include <string_view>

namespace jsondb_cpp {

void validate_options(const StoreOptions& options) {
    if (options.filename.empty()) {
        throw Exception{ErrorKind::io_failure, "store filename must not be empty"};
    }
    if (options.separator.empty()) {
        throw Exception{ErrorKind::invalid_path, "path separator must not be empty"};
    }
    if (options.separator.find_first_of("[]") != std::string::npos) {
        throw Exception{ErrorKind::invalid_path,
                        "path separator '" + options.separator + "' must not contain brackets"};
    }
}

auto backing_file(const StoreOptions& options) -> std::filesystem::path {
    auto name = options.filename;
    if (!std::string_view{name}.ends_with(".json")) {
        name += ".json";
    }
    return std::filesystem::path{name};
}

}  // namespace jsondb_cpp
