#include "landlord/MatchSummary.hh"
#include "landlord/RoundRecord.hh"
#include "main/Config.hh"
#include "main/MatchSession.hh"
#include "scoring/MatchAggregator.hh"
#include "statistics/StatisticsEngine.hh"
#include "storage/JsonRecordStore.hh"
#include "storage/PlayerStatisticsJsonSerializer.hh"
#include "Enumerate.hh"
#include "IoUtility.hh"
#include "Logging.hh"

#include <nlohmann/json.hpp>

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace Landlord;
using namespace std::string_view_literals;

constexpr auto DEFAULT_DATA_FILE = "landlord.json"sv;

const auto USAGE = R"EOF(Usage: landlord-cli [-v] [-f config] [-d data_file] <command> [args]

Commands:
  stats <playerId>    print the statistics of a player as JSON
  match <matchId>     print the rounds and running totals of a match
  rebuild <matchId>   recompute and store the summary of a match
)EOF"sv;

struct Options {
    std::string configPath;
    std::string dataFile;
    int verbosity {};
    std::vector<std::string> arguments;
};

Options parseOptions(int argc, char* argv[])
{
    auto options = Options {};

    const auto short_opt = "vf:d:";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'f' },
        option { "data", required_argument, 0, 'd' },
        option { nullptr, 0, 0, 0 },
    };
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++options.verbosity;
        } else if (c == 'f') {
            options.configPath = optarg;
        } else if (c == 'd') {
            options.dataFile = optarg;
        } else {
            std::cerr << USAGE;
            std::exit(EXIT_FAILURE);
        }
    }
    options.arguments.assign(argv + optind, argv + argc);
    return options;
}

class LandlordApp {
public:

    LandlordApp(const Options& options) :
        config {Main::configFromPath(options.configPath)},
        dataFile {options.dataFile}
    {
        if (options.verbosity == 0) {
            if (const auto level = config.getLogLevel()) {
                setupLogging(*level, std::cerr);
            }
        }
        if (dataFile.empty()) {
            dataFile = config.getDataFile().value_or(DEFAULT_DATA_FILE);
        }
        if (dataFile != "-" && !std::filesystem::exists(dataFile)) {
            log(LogLevel::WARNING, "%s does not exist, starting empty",
                dataFile);
        } else {
            store = processStreamFromPath(
                dataFile,
                [](auto& in) { return Storage::JsonRecordStore {in}; });
        }
        log(LogLevel::INFO, "Startup completed");
    }

    int run(const std::vector<std::string>& arguments)
    {
        if (arguments.size() != 2) {
            std::cerr << USAGE;
            return EXIT_FAILURE;
        }
        const auto& command = arguments[0];
        const auto& argument = arguments[1];
        if (command == "stats") {
            printStatistics(argument);
        } else if (command == "match") {
            printMatch(argument);
        } else if (command == "rebuild") {
            rebuild(argument);
        } else {
            std::cerr << USAGE;
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

private:

    void printStatistics(const PlayerId& playerId)
    {
        log(LogLevel::INFO, "Statistics of %s",
            config.getPlayerName(playerId));
        const auto stats = Statistics::computeStatistics(
            playerId, store.loadRoundRecordsForPlayer(playerId),
            store.loadMatchSummaries(playerId));
        std::cout << std::setw(4) << nlohmann::json(stats) << std::endl;
    }

    void printMatch(const std::string& matchId)
    {
        const auto summary = store.loadMatchSummary(matchId);
        const auto rounds = store.loadRoundRecordsForMatch(matchId);
        if (summary) {
            for (const auto seat : SEATS) {
                std::cout << seat << ": " <<
                    config.getPlayerName(summary->playerIds[seat]) << "\n";
            }
        } else {
            log(LogLevel::WARNING, "No summary stored for match %s", matchId);
        }
        const auto fold = Scoring::foldMatch(rounds);
        for (const auto [n, record] : enumerate(rounds)) {
            std::cout << record.roundIndex << ". landlord " <<
                record.landlord << ", " << record.deltas << " => " <<
                fold.scores.at(n) << "\n";
        }
        std::cout << "Total: " << Scoring::finalScore(fold) << "\n" <<
            "Highest: " << fold.maxSnapshot << "\n" <<
            "Lowest: " << fold.minSnapshot << std::endl;
    }

    void rebuild(const std::string& matchId)
    {
        const auto summary = Main::rebuildMatch(store, matchId);
        processStreamToPath(
            dataFile, [this](auto& out) { store.write(out); });
        std::cout << summary << std::endl;
    }

    Main::Config config;
    std::string dataFile;
    Storage::JsonRecordStore store;
};

}

int landlord_main(int argc, char* argv[])
{
    const auto options = parseOptions(argc, argv);
    setupLogging(getLogLevel(options.verbosity), std::cerr);
    return LandlordApp {options}.run(options.arguments);
}
