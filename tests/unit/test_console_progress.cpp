#include <catch2/catch_test_macros.hpp>
#include "peerdrop/app/console_progress.hpp"
#include <sstream>
using namespace peerdrop;
TEST_CASE("ConsoleProgress - Rendering", "[app][progress]") {
    std::ostringstream out;
    app::ConsoleProgress progress(out);
    SECTION("Start, progress and finish") {
        progress.OnTransferStarted("movie.mkv", 4 * 1024 * 1024);
        progress.OnProgress(2 * 1024 * 1024, 4 * 1024 * 1024);
        progress.OnTransferFinished(4 * 1024 * 1024);
        const auto text = out.str();
        REQUIRE(text.find("Transferring movie.mkv (4.0 MiB)") != std::string::npos);
        REQUIRE(text.find(" 50% 2.0 MiB/4.0 MiB") != std::string::npos);
        REQUIRE(text.find("Done: 4.0 MiB transferred") != std::string::npos);
    }
    SECTION("Unchanged percentage is not redrawn") {
        progress.OnTransferStarted("a.txt", 1000);
        progress.OnProgress(1, 1000);
        const auto before = out.str().size();
        progress.OnProgress(2, 1000);
        REQUIRE(out.str().size() == before);
    }
    SECTION("Empty file shows as complete") {
        progress.OnTransferStarted("empty", 0);
        REQUIRE(out.str().find("100% 0 B/0 B") != std::string::npos);
    }
}
