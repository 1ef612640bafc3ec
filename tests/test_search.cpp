#include <catch2/catch.hpp>
#include <drgrep/output.hpp>
#include <drgrep/search.hpp>
#include <sstream>

using namespace drgrep;

static const char* kPoem =
    "Rust:\n"
    "s\xC3\xA9" "curit\xC3\xA9, rapidit\xC3\xA9, productivit\xC3\xA9.\n"
    "Obtenez les trois en m\xC3\xAAme temps.\n"
    "C'est pas rustique.";

TEST_CASE("split_lines drops carriage returns and the final newline", "[search]") {
    REQUIRE(split_lines("a\r\nb\n") == std::vector<std::string>{"a", "b"});
    REQUIRE(split_lines("").empty());
    REQUIRE(split_lines("\n\nx") == std::vector<std::string>{"", "", "x"});
}

TEST_CASE("search_lines case sensitive", "[search]") {
    auto lines = search_lines("duct", kPoem, true);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("productivit") != std::string::npos);
    REQUIRE(search_lines("rust", kPoem, true) ==
            std::vector<std::string>{"C'est pas rustique."});
}

TEST_CASE("search_lines case insensitive", "[search]") {
    REQUIRE(search_lines("rUsT", kPoem, false) ==
            std::vector<std::string>{"Rust:", "C'est pas rustique."});
}

TEST_CASE("search_words flags matching words", "[search]") {
    auto results = search_words("rUst", "poem.txt", kPoem, false);
    REQUIRE(results.size() == 2);

    REQUIRE(results[0].line_no == 1);
    REQUIRE(results[0].source == "poem.txt");
    REQUIRE(results[0].parts.size() == 1);
    REQUIRE(results[0].parts[0].text == "Rust:");
    REQUIRE(results[0].parts[0].highlighted);

    REQUIRE(results[1].line_no == 4);
    REQUIRE(results[1].parts.size() == 3);
    REQUIRE_FALSE(results[1].parts[0].highlighted);
    REQUIRE(results[1].parts[2].highlighted);

    REQUIRE(search_words("Rust", "", kPoem, true).size() == 1);
}

TEST_CASE("search_regex selects lines and highlights words", "[search]") {
    auto r = Regex::compile("\\d+").value();
    auto results = search_regex(r, "", "room 101\nno digits\nfloor 3 of 4");
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].line_no == 1);
    REQUIRE(results[1].line_no == 3);

    const auto& parts = results[1].parts;
    REQUIRE(parts.size() == 4);
    REQUIRE_FALSE(parts[0].highlighted);
    REQUIRE(parts[1].highlighted);
    REQUIRE_FALSE(parts[2].highlighted);
    REQUIRE(parts[3].highlighted);
}

TEST_CASE("search_regex highlights against lowercase words", "[search]") {
    auto r = Regex::compile("^err").value();
    auto results = search_regex(r, "", "err: ERROR here");
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].parts[0].highlighted);
    REQUIRE(results[0].parts[1].highlighted);
    REQUIRE_FALSE(results[0].parts[2].highlighted);
}

// ===== Printer =====

static SearchResult sample(const std::string& source) {
    SearchResult r;
    r.source = source;
    r.line_no = 3;
    r.parts = {{"hello", false}, {"world", true}};
    return r;
}

TEST_CASE("printer plain output", "[output]") {
    std::ostringstream out;
    Printer(out, false).print(sample("f.txt"));
    REQUIRE(out.str() ==
            "source: f.txt\nline: 3\nhello world\n=================================\n\n");
}

TEST_CASE("printer omits an empty source", "[output]") {
    std::ostringstream out;
    Printer(out, false).print(sample(""));
    REQUIRE(out.str().find("source:") == std::string::npos);
    REQUIRE(out.str().rfind("line: 3\n", 0) == 0);
}

TEST_CASE("printer colors highlighted words", "[output]") {
    std::ostringstream out;
    Printer(out, true).print(sample("f.txt"));
    auto s = out.str();
    REQUIRE(s.find(std::string(color::BRIGHT_YELLOW) + "world" + color::RESET) != std::string::npos);
    REQUIRE(s.find(std::string(color::WHITE) + "hello" + color::RESET) != std::string::npos);
    REQUIRE(s.find(std::string(color::BRIGHT_BLUE) + "source: f.txt") != std::string::npos);
}
