// Fuzz target for Store loading — writes the input to a backing file, loads
// it, and passes any valid document through save() and reload().

#include <jsondb-cpp/jsondb.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto file = (std::filesystem::temp_directory_path() / "jsondb_fuzz_load.json");
    {
        auto out = std::ofstream{file, std::ios::binary | std::ios::trunc};
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    }

    jsondb_cpp::set_log_level(jsondb_cpp::LogLevel::off);
    auto db = jsondb_cpp::Store{jsondb_cpp::StoreOptions{.filename = file.string(), .save_on_push = false}};
    try {
        db.load();
        db.save(true);
        db.reload();
    } catch (const jsondb_cpp::Exception&) {
        // Invalid JSON is expected.
    }
    return 0;
}
