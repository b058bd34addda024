#include "CliCommands.h"

#include "swisspair/core/api/JsonPairingStore.h"
#include "swisspair/core/api/PairingConfig.h"
#include "swisspair/core/api/PairingService.h"
#include "swisspair/core/model/PairingError.h"
#include "swisspair/core/pairing/PairingSystem.h"
#include "swisspair/core/trf/FideCompliance.h"
#include "swisspair/core/trf/TrfReader.h"
#include "swisspair/core/trf/TrfWriter.h"
#include "swisspair/core/util/AtomicFileWriter.h"

#include <ostream>

namespace swisspair::cli {

namespace {

using core::api::JsonPairingStore;
using core::api::PairingConfig;
using core::api::PairingOutcome;
using core::api::PairingRequest;
using core::api::PairingService;
using core::model::PairingError;
using core::util::AtomicFileWriter;

void PrintUsage(std::ostream& err) {
    err << "Usage:\n"
        << "  swisspair pair <config.json>\n"
        << "  swisspair trf <input.trf> [--system dutch|burstein] [--output <file>]\n"
        << "  swisspair check <input.trf>\n";
}

void PrintError(std::ostream& err, const PairingError& error) {
    err << "[swisspair] " << core::model::PairingErrorKindToString(error.kind()) << ": "
        << error.what() << '\n';
}

bool WriteOutput(const std::string& path,
                 const std::string& contents,
                 const char* what,
                 std::ostream& out,
                 std::ostream& err) {
    if (path.empty()) {
        return true;
    }
    std::string error;
    if (!AtomicFileWriter::Write(path, contents, &error)) {
        err << "[swisspair] Failed to write " << what << ": " << error << '\n';
        return false;
    }
    out << "[swisspair] Wrote " << what << ": " << path << '\n';
    return true;
}

bool LoadTrf(const std::string& path, core::trf::TrfDocument& document, std::ostream& err) {
    std::string text;
    std::string error;
    if (!core::util::ReadTextFile(path, text, &error)) {
        err << "[swisspair] " << error << '\n';
        return false;
    }
    try {
        document = core::trf::TrfReader::Parse(text);
    } catch (const PairingError& ex) {
        PrintError(err, ex);
        return false;
    }
    return true;
}

}  // namespace

int RunPair(const std::string& config_path, std::ostream& out, std::ostream& err) {
    out << "[swisspair] Pairing config: " << config_path << '\n';

    PairingConfig config;
    std::string error;
    if (!PairingConfig::LoadFromFile(config_path, config, &error)) {
        err << "[swisspair] " << error << '\n';
        return 1;
    }

    JsonPairingStore store;
    if (!store.Open(config.store.path, &error)) {
        err << "[swisspair] " << error << '\n';
        return 1;
    }

    PairingService service(store, [&out](const std::string& line) { out << line << '\n'; });
    const PairingRequest request = PairingRequest::FromConfig(config);
    const PairingOutcome outcome = service.GeneratePairings(request);
    if (!outcome.success) {
        err << "[swisspair] ";
        if (outcome.error_kind) {
            err << core::model::PairingErrorKindToString(*outcome.error_kind) << ": ";
        }
        err << outcome.error << '\n';
        return 1;
    }

    out << "Round " << outcome.round << " (" << request.section << ")\n";
    for (const auto& record : outcome.records) {
        out << "  " << record.board << ". " << record.white_player_id;
        if (record.black_player_id) {
            out << " - " << *record.black_player_id;
        } else {
            out << " "
                << core::model::ByeTypeToString(
                       record.bye_type.value_or(core::model::ByeType::Bye));
        }
        out << '\n';
    }

    const auto& output = config.output;
    if (!WriteOutput(output.pairings_json, PairingService::OutcomeToJson(outcome).dump(2),
                     "pairings", out, err) ||
        !WriteOutput(output.trf, outcome.trf, "TRF", out, err) ||
        !WriteOutput(output.trf_pairings, outcome.pairing_listing, "pairing listing", out, err)) {
        return 1;
    }

    if (output.persist) {
        if (!service.PersistOutcome(request, outcome, &error)) {
            err << "[swisspair] Failed to store round " << outcome.round << ": " << error << '\n';
            return 1;
        }
    }
    return 0;
}

int RunTrf(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::string input;
    std::string system = "dutch";
    std::string output;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--system" && i + 1 < args.size()) {
            system = args[++i];
        } else if (arg == "--output" && i + 1 < args.size()) {
            output = args[++i];
        } else if (input.empty()) {
            input = arg;
        } else {
            PrintUsage(err);
            return 1;
        }
    }
    if (input.empty()) {
        PrintUsage(err);
        return 1;
    }

    core::trf::TrfDocument document;
    if (!LoadTrf(input, document, err)) {
        return 1;
    }

    std::string listing;
    try {
        auto pairing_system = core::pairing::CreatePairingSystem(system);
        const auto pairings = pairing_system->ComputeMatching(document.tournament);
        listing = core::trf::TrfWriter::WritePairingListing(pairings);
    } catch (const PairingError& ex) {
        PrintError(err, ex);
        return 1;
    }

    if (output.empty()) {
        out << listing;
        return 0;
    }
    return WriteOutput(output, listing, "pairing listing", out, err) ? 0 : 1;
}

int RunCheck(const std::string& input, std::ostream& out, std::ostream& err) {
    core::trf::TrfDocument document;
    if (!LoadTrf(input, document, err)) {
        return 1;
    }

    const auto audits = core::trf::FideCompliance::AuditTournament(document.tournament);
    int flagged = 0;
    for (const auto& audit : audits) {
        if (audit.report.valid) {
            continue;
        }
        ++flagged;
        out << "Round " << audit.round << ": " << audit.white_id + 1 << " - " << audit.black_id + 1
            << ":";
        for (const auto violation : audit.report.violations) {
            out << ' ' << core::trf::ViolationToString(violation);
        }
        out << '\n';
    }
    out << "[swisspair] Checked " << audits.size() << " games, " << flagged << " with violations."
        << '\n';
    return 0;
}

int RunCommand(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.size() < 2) {
        PrintUsage(err);
        return 1;
    }

    const std::string& mode = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    if (mode == "pair" && rest.size() == 1) {
        return RunPair(rest.front(), out, err);
    }
    if (mode == "trf") {
        return RunTrf(rest, out, err);
    }
    if (mode == "check" && rest.size() == 1) {
        return RunCheck(rest.front(), out, err);
    }
    PrintUsage(err);
    return 1;
}

}  // namespace swisspair::cli
