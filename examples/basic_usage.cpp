// basic_usage — demonstrates the core jsondb-cpp API
//
// Declares a schema with one entry of each shape, then sets, pushes,
// merges, reads, and removes data. Every mutation is saved to
// basic_usage.json in the current directory.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <jsondb-cpp/jsondb.hpp>

#include <cstdio>
#include <string>

namespace jdb = jsondb_cpp;
using json = nlohmann::json;

int main() {
    try {
        auto db = jdb::Store{
            jdb::StoreOptions{.filename = "basic_usage", .human_readable = true},
            jdb::Schema{
                {"/login", jdb::Shape::single},
                {"/restaurants", jdb::Shape::array},
                {"/teams", jdb::Shape::dictionary},
            }};

        // -- Single entry: set, then shallow merge --------------------------------
        db.set("/login", {{"username", "a"}, {"password", "b"}});
        db.merge("/login", {{"username", "c"}});
        std::printf("login: %s\n", db.get("/login").dump().c_str());

        // -- Array entry: set, push, read by index --------------------------------
        db.set("/restaurants", json::array({
            {{"name", "Chez Nous"}, {"chef", "Marie"}, {"memberCount", 4}},
            {{"name", "Trattoria"}, {"chef", "Luca"}, {"memberCount", 7}},
        }));
        db.push("/restaurants", {{"name", "Izakaya"}, {"chef", "Ken"}, {"memberCount", 3}});
        db.merge("/restaurants", {{"memberCount", 5}}, 0);

        std::printf("restaurants: %zu\n", db.count("/restaurants"));
        std::printf("last: %s\n", db.get("/restaurants", -1)["name"].get<std::string>().c_str());
        std::printf("first: %s\n", db.get("/restaurants", 0).dump().c_str());

        auto big = db.filter("/restaurants", [](const json& r, const std::string&) {
            return r["memberCount"].get<int>() >= 5;
        });
        std::printf("restaurants with 5+ members: %zu\n", big.size());

        // -- Dictionary entry: push and merge by key ------------------------------
        db.push("/teams", "v1", "alice");
        db.push("/teams", "v1", "bob");
        db.merge("/teams", "v2", "alice");
        if (auto alice = db.get<std::string>("/teams", "alice")) {
            std::printf("alice: %s\n", alice->c_str());
        }

        // -- Remove and existence checks ------------------------------------------
        db.remove("/teams", "bob");
        std::printf("bob exists: %s\n", db.exists("/teams", "bob") ? "yes" : "no");

        // -- Errors are reported as exceptions ------------------------------------
        try {
            db.push("/teams", "v3");
        } catch (const jdb::Exception& e) {
            std::printf("expected error: %s\n", e.what());
        }

        std::printf("\nfile %s:\n%s\n", db.file().string().c_str(), db.data().dump(4).c_str());
    } catch (const jdb::Exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
    return 0;
}
