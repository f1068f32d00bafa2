#include <catch2/catch_all.hpp>
#include <bon/bon.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {
    std::string read_example(const std::string& name) {
        fs::path p = fs::path(EXAMPLES_DIR) / name;
        REQUIRE(fs::exists(p));
        std::ifstream in(p);
        REQUIRE(in.good());
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
}

TEST_CASE("All example files parse and round-trip") {
    for (auto const& entry : fs::directory_iterator(EXAMPLES_DIR)) {
        if (entry.path().extension() != ".bon") continue;
        CAPTURE(entry.path().string());
        std::ifstream in(entry.path());
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        auto v = bon::parse(content);
        REQUIRE(bon::parse(bon::serialize(v)) == v);
    }
}

TEST_CASE("parse sample.bon") {
    auto v = bon::parse(read_example("sample.bon"));
    REQUIRE(v.keys() == std::vector<std::string>{"value", "list", "nested_object"});
    REQUIRE(v.at("value").as_string() == "data");
    REQUIRE(v.at("list").size() == 6);
    REQUIRE(v.at("list")[1].as_float() == 2e-5);
    REQUIRE(v.at("list")[3].is_float());
    REQUIRE(v.at("list")[4].is_string());
    REQUIRE(v.at("nested_object").at("hello").as_string() == "world");
}

TEST_CASE("parse physics.bon") {
    auto v = bon::parse(read_example("physics.bon"));
    REQUIRE(v.at("name").as_string() == "constants");
    REQUIRE(v.at("gravitational_constant").as_float() == 6.67e-11);
    REQUIRE(v.at("speed_of_light").as_int() == 299792458);
    REQUIRE(v.at("electron_charge").as_float() == -1.602176634e-19);
    REQUIRE(v.at("pi_ish").as_float() == 3.0);
    REQUIRE(v.at("tags")[2].as_string() == "it's quoted");
    REQUIRE(v.at("matrix").size() == 3);
    REQUIRE(v.at("matrix")[1][1].as_int() == 1);
    REQUIRE(v.at("empty_list").is_list());
    REQUIRE(v.at("empty_object").is_object());
    REQUIRE(v.at("object").at("deeper").at("depth").as_int() == 2);
}
