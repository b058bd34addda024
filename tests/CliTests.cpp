#include "CliCommands.h"

#include "swisspair/core/trf/TrfWriter.h"
#include "swisspair/core/util/AtomicFileWriter.h"

#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <sstream>

using namespace swisspair;
using core::model::Color;
using core::model::Match;
using core::model::MatchScore;

namespace {

class ScratchDir {
public:
    ScratchDir() : path_(std::filesystem::temp_directory_path() / "swisspair_cli_test") {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string File(const std::string& name) const { return (path_ / name).string(); }

    std::string Write(const std::string& name, const std::string& contents) const {
        const std::string path = File(name);
        REQUIRE(core::util::AtomicFileWriter::Write(path, contents));
        return path;
    }

private:
    std::filesystem::path path_;
};

std::string FiveNewPlayers() {
    core::model::Tournament tournament;
    const int ratings[] = {2400, 2300, 2200, 2100, 2000};
    for (int i = 0; i < 5; ++i) {
        tournament.AddPlayer("P" + std::to_string(i + 1), ratings[i]);
    }
    tournament.UpdatePlayerData();
    tournament.AssignRanks();
    return core::trf::TrfWriter::WriteTournament(tournament);
}

// Players 1 and 2 meet in both rounds.
std::string ReplayedPairing() {
    core::model::Tournament tournament;
    tournament.AddPlayer("Alpha", 2000);
    tournament.AddPlayer("Bravo", 1900);
    tournament.players[0].matches = {Match::Played(1, Color::White, MatchScore::Draw),
                                     Match::Played(1, Color::Black, MatchScore::Draw)};
    tournament.players[1].matches = {Match::Played(0, Color::Black, MatchScore::Draw),
                                     Match::Played(0, Color::White, MatchScore::Draw)};
    tournament.played_rounds = 2;
    tournament.UpdatePlayerData();
    tournament.AssignRanks();
    return core::trf::TrfWriter::WriteTournament(tournament);
}

struct CommandResult {
    int status = 0;
    std::string out;
    std::string err;
};

CommandResult Run(const std::vector<std::string>& args) {
    std::ostringstream out;
    std::ostringstream err;
    CommandResult result;
    result.status = cli::RunCommand(args, out, err);
    result.out = out.str();
    result.err = err.str();
    return result;
}

bool Contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

}  // namespace

TEST_CASE("check reports a replayed pairing", "[cli]") {
    ScratchDir dir;
    const std::string input = dir.Write("replay.trf", ReplayedPairing());

    const auto result = Run({"check", input});

    REQUIRE(result.status == 0);
    REQUIRE(Contains(result.out, "Round 2: 2 - 1: REPEAT_PAIRING\n"));
    REQUIRE(Contains(result.out, "[swisspair] Checked 2 games, 1 with violations."));
    REQUIRE(result.err.empty());
}

TEST_CASE("check fails on an unreadable file", "[cli]") {
    ScratchDir dir;

    const auto missing = Run({"check", dir.File("missing.trf")});
    REQUIRE(missing.status == 1);
    REQUIRE(Contains(missing.err, "[swisspair] Failed to open"));

    const auto broken = Run({"check", dir.Write("short.trf", "001    1 Alpha\r\n")});
    REQUIRE(broken.status == 1);
    REQUIRE(Contains(broken.err, "[swisspair] parse: Line 1"));
}

TEST_CASE("trf prints the pairing listing", "[cli]") {
    ScratchDir dir;
    const std::string input = dir.Write("round1.trf", FiveNewPlayers());

    SECTION("to stdout") {
        const auto result = Run({"trf", input});
        REQUIRE(result.status == 0);
        REQUIRE(result.out == "3\n1 3\n2 4\n5 0\n");
    }

    SECTION("to a file") {
        const std::string output = dir.File("out/pairs.txt");
        const auto result = Run({"trf", input, "--system", "dutch", "--output", output});
        REQUIRE(result.status == 0);
        REQUIRE(Contains(result.out, "[swisspair] Wrote pairing listing: " + output));

        std::string written;
        REQUIRE(core::util::ReadTextFile(output, written, nullptr));
        REQUIRE(written == "3\n1 3\n2 4\n5 0\n");
    }

    SECTION("unknown system") {
        const auto result = Run({"trf", input, "--system", "swiss"});
        REQUIRE(result.status == 1);
        REQUIRE(Contains(result.err, "[swisspair] configuration: Unknown pairing system: swiss"));
    }
}

TEST_CASE("pair rejects a bad config", "[cli]") {
    ScratchDir dir;

    const auto missing = Run({"pair", dir.File("none.json")});
    REQUIRE(missing.status == 1);
    REQUIRE(Contains(missing.err, "[swisspair] Failed to open config: " + dir.File("none.json")));

    const auto invalid = Run({"pair", dir.Write("config.json", R"({"tournament": {"round": 2}})")});
    REQUIRE(invalid.status == 1);
    REQUIRE(invalid.err == "[swisspair] tournament.id is required\n");
}

TEST_CASE("pair writes and stores the round", "[cli]") {
    ScratchDir dir;
    nlohmann::json players = nlohmann::json::array();
    const int ratings[] = {2400, 2300, 2200, 2100, 2000};
    for (int i = 0; i < 5; ++i) {
        players.push_back(nlohmann::json{{"id", "p" + std::to_string(i + 1)},
                                         {"name", "Player " + std::to_string(i + 1)},
                                         {"rating", ratings[i]}});
    }
    const nlohmann::json store = {{"tournaments", {{"club", {{"players", players}}}}}};
    const std::string store_path = dir.Write("store.json", store.dump());
    const std::string pairings_path = dir.File("round1.json");

    const nlohmann::json config = {
        {"store", {{"path", store_path}}},
        {"tournament", {{"id", "club"}, {"rounds", 5}}},
        {"output", {{"pairings_json", pairings_path}, {"persist", true}}},
    };
    const auto result = Run({"pair", dir.Write("config.json", config.dump())});

    REQUIRE(result.status == 0);
    REQUIRE(Contains(result.out, "Round 1 (Open)\n"));
    REQUIRE(Contains(result.out, "  1. p1 - p3\n"));
    REQUIRE(Contains(result.out, "  3. p5 bye\n"));
    REQUIRE(Contains(result.out, "[pairing] Stored round 1 (3 rows)"));

    std::string text;
    REQUIRE(core::util::ReadTextFile(pairings_path, text, nullptr));
    const auto written = nlohmann::json::parse(text);
    REQUIRE(written["success"] == true);
    REQUIRE(written["pairings"].size() == 3);

    REQUIRE(core::util::ReadTextFile(store_path, text, nullptr));
    const auto stored = nlohmann::json::parse(text);
    REQUIRE(stored["tournaments"]["club"]["pairings"].size() == 3);
}

TEST_CASE("unknown commands print the usage", "[cli]") {
    const auto result = Run({"rank", "file.trf"});

    REQUIRE(result.status == 1);
    REQUIRE(Contains(result.err, "Usage:"));
    REQUIRE(Run({}).status == 1);
}
