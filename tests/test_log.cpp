#include <catch2/catch.hpp>
#include <drgrep/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define dup _dup
#define dup2 _dup2
#define fileno _fileno
#define read _read
#define close _close
#define pipe _pipe
#else
#include <unistd.h>
#endif

using namespace drgrep::log;

// Capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, n);
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name() and parse_level() agree", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Error)) == "error");

    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        auto parsed = parse_level(level_name(lvl));
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value() == lvl);
    }
    REQUIRE(parse_level("warning").value() == Warn);
}

TEST_CASE("parse_level() rejects unknown names", "[log]") {
    auto r = parse_level("loud");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == drgrep::DrgrepError::InvalidArg);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] { debug("walking %s", "src"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("skipping %s", "a.bin");
        error("cannot read %d file(s)", 2);
    });
    REQUIRE(output.find("warn: skipping a.bin\n") != std::string::npos);
    REQUIRE(output.find("error: cannot read 2 file(s)\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Colored level tag when color is forced on", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] { warn("hello"); });
    REQUIRE(output.find("\033[33mwarn\033[0m: hello") != std::string::npos);

    set_color_enabled(false);
}
