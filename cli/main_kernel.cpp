#include "kernel/Kernel.h"
#include "kernel/Replicates.h"
#include "kernel/StateMachine.h"
#include "io/ConfigOptions.h"
#include "io/Snapshot.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <stdexcept>
#include <string>

static void printHelp() {
    std::cerr << "Kernel Commands:\n"
              << "  step N             # advance N days\n"
              << "  state [agents]     # print JSON snapshot (optional: include agents)\n"
              << "  metrics            # print current metrics\n"
              << "  stats              # print detailed statistics (custody, capital, network)\n"
              << "  run [T] [log]      # run T days (default n_days), print a line every 'log' days\n"
              << "  set KEY VALUE      # change a parameter (applied on next reset)\n"
              << "  config             # print current parameters\n"
              << "  reset              # rebuild population and network from parameters\n"
              << "  export [PREFIX]    # write PREFIX.csv and PREFIX.yml (default: run file stem)\n"
              << "  sweep LO HI STEPS  # parallel coercive_capacity sweep over full horizon\n"
              << "  quit               # exit\n"
              << "\nOptions: --KEY=VALUE for any parameter, --config=FILE (YAML), --help\n"
              << "Environment: CRIMENET_SEED overrides the seed\n";
}

static void printOptions() {
    std::cerr << "\nParameters:\n";
    for (const auto& opt : configOptions()) {
        std::cerr << "  --" << std::left << std::setw(38) << (std::string(opt.key) + "=VALUE")
                  << opt.help << "\n";
    }
}

static std::string timestampNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

static void printTickLine(const TickMetrics& m) {
    std::cout << "Day " << m.day << ": "
              << std::fixed << std::setprecision(3)
              << "L=" << m.share(LegalStatus::Lawful) << ", "
              << "R=" << m.share(LegalStatus::AtRisk) << ", "
              << "C=" << m.share(LegalStatus::Criminal) << ", "
              << "D=" << m.share(LegalStatus::Detained) << ", "
              << "P=" << m.share(LegalStatus::Prison) << ", "
              << "crimes=" << m.crime_events << ", "
              << "arrests=" << m.arrests << ", "
              << "wrongful=" << m.wrongful_detentions << ", "
              << "convictions=" << m.convictions << "\n";
}

static void runCommand(Kernel& kernel, KernelConfig& cfg, const std::string& cmd, std::istringstream& iss) {
    if (cmd == "step") {
        int n = 1;
        iss >> n;
        if (n < 1) n = 1;
        kernel.stepN(n);
        std::cout << kernelToJson(kernel) << "\n";
        std::cout.flush();

    } else if (cmd == "state") {
        std::string opt;
        iss >> opt;
        std::cout << kernelToJson(kernel, opt == "agents") << "\n";
        std::cout.flush();

    } else if (cmd == "metrics") {
        const auto m = kernel.metrics().empty() ? kernel.computeMetrics() : kernel.metrics().back();
        std::cout << "Day: " << kernel.generation() << "\n" << std::fixed << std::setprecision(4);
        for (std::size_t k = 0; k < kStatusCount; ++k) {
            const auto s = static_cast<LegalStatus>(k);
            std::cout << statusName(s) << ": " << m.count(s) << " (" << m.share(s) << ")\n";
        }
        std::cout << "Crime events: " << m.crime_events << "\n"
                  << "Detentions: " << m.arrests << " (wrongful " << m.wrongful_detentions << ")\n"
                  << "Convictions: " << m.convictions << "\n"
                  << "Releases: " << m.releases() << "\n"
                  << "Edges: " << m.edge_count << "\n";
        std::cout.flush();

    } else if (cmd == "stats") {
        const auto stats = kernel.getStatistics();
        std::cout << "\n=== STATISTICS (day " << kernel.generation() << ") ===\n\n";
        std::cout << "Total agents: " << stats.totalAgents << "\n";
        for (std::size_t k = 0; k < kStatusCount; ++k) {
            const auto s = static_cast<LegalStatus>(k);
            std::cout << "  " << std::left << std::setw(10) << statusName(s) << std::right
                      << std::setw(6) << stats.statusCounts[k] << " ("
                      << std::fixed << std::setprecision(1)
                      << (stats.totalAgents ? 100.0 * stats.statusCounts[k] / stats.totalAgents : 0.0)
                      << "%)\n";
        }

        std::cout << "\n--- TRAITS ---\n" << std::setprecision(3)
                  << "Avg base propensity: " << stats.avgBasePropensity << "\n"
                  << "Avg stigma: " << stats.avgStigma << "\n"
                  << "Avg criminal capital: " << stats.avgCriminalCapital
                  << " (max " << stats.maxCriminalCapital << ")\n"
                  << "Avg crimes in window: " << stats.avgWindowCrimes << "\n";

        std::cout << "\n--- CUSTODY ---\n" << std::setprecision(1)
                  << "Avg remaining detention: " << stats.avgRemainingDetention << " days\n"
                  << "Avg remaining sentence: " << stats.avgRemainingSentence << " days\n";

        std::cout << "\n--- NETWORK ---\n"
                  << "Edges: " << stats.edgeCount << "\n"
                  << "Avg connections: " << std::setprecision(2) << stats.avgConnections << "\n"
                  << "Max degree: " << stats.maxDegree << "\n"
                  << "Isolated agents: " << stats.isolatedAgents << "\n";

        std::cout << "\n--- RUN TOTALS ---\n"
                  << "Crime events: " << stats.totalCrimeEvents << "\n"
                  << "Detentions: " << stats.totalArrests << " (wrongful " << stats.totalWrongful << ")\n"
                  << "Convictions: " << stats.totalConvictions << "\n\n";
        std::cout.flush();

    } else if (cmd == "run") {
        long ticks = static_cast<long>(cfg.horizonDays);
        long logFreq = 30;
        iss >> ticks >> logFreq;
        if (ticks < 1) ticks = 1;
        if (logFreq < 1) logFreq = 1;

        for (long t = 0; t < ticks; ++t) {
            kernel.step();
            if ((t + 1) % 100 == 0 || t == ticks - 1) {
                std::cerr << "Day " << (t + 1) << "/" << ticks << "\r";
                std::cerr.flush();
            }
            if (t % logFreq == 0 || t == ticks - 1) {
                printTickLine(kernel.metrics().back());
            }
        }
        std::cerr << "\n";
        std::cout << "Completed " << ticks << " days.\n";
        std::cout.flush();

    } else if (cmd == "set") {
        std::string key, value;
        if (!(iss >> key >> value)) {
            throw std::invalid_argument("usage: set KEY VALUE");
        }
        KernelConfig next = cfg;
        applyConfigOption(next, key, value);
        validateConfig(next);
        cfg = next;
        std::cout << key << " = " << configValue(cfg, key) << " (use 'reset' to apply)\n";

    } else if (cmd == "config") {
        writeConfig(cfg, std::cout);
        std::cout.flush();

    } else if (cmd == "reset") {
        kernel.reset(cfg);
        std::cout << "Reset: " << cfg.population << " agents, m=" << cfg.attachment
                  << ", seed=" << cfg.seed << ", edges=" << kernel.network().edgeCount() << "\n";
        std::cout.flush();

    } else if (cmd == "export") {
        std::string prefix;
        if (!(iss >> prefix)) {
            prefix = buildRunFileStem(kernel.config(), timestampNow());
        }
        exportRun(kernel, prefix);
        std::cout << "Wrote " << prefix << ".csv (" << kernel.metrics().size()
                  << " days) and " << prefix << ".yml\n";

    } else if (cmd == "sweep") {
        double lo = 0.0, hi = 0.0;
        std::uint32_t steps = 0;
        if (!(iss >> lo >> hi >> steps)) {
            throw std::invalid_argument("usage: sweep LO HI STEPS");
        }
        const auto configs = coerciveSweep(cfg, lo, hi, steps);
        std::cerr << "Running " << configs.size() << " runs x " << cfg.horizonDays
                  << " days on " << replicateThreadCount() << " threads...\n";
        const auto results = runReplicates(configs);

        std::cout << "coercive_capacity,mean_criminal,mean_detained,mean_prison,"
                     "detentions,wrongful_rate,convictions\n";
        std::cout << std::fixed << std::setprecision(4);
        for (std::size_t i = 0; i < results.size(); ++i) {
            const auto s = summarize(results[i]);
            std::cout << configs[i].coerciveCapacity << ","
                      << s.meanShares[toIndex(LegalStatus::Criminal)] << ","
                      << s.meanShares[toIndex(LegalStatus::Detained)] << ","
                      << s.meanShares[toIndex(LegalStatus::Prison)] << ","
                      << s.arrests << ","
                      << s.wrongfulRate() << ","
                      << s.convictions << "\n";
        }
        std::cout.flush();

    } else if (cmd == "help") {
        printHelp();

    } else {
        std::cerr << "Unknown command: " << cmd << "\n";
        printHelp();
    }
}

int main(int argc, char** argv) {
    KernelConfig cfg;

    const char* scriptArg = nullptr;
    try {
        if (const char* envSeed = std::getenv("CRIMENET_SEED")) {
            applyConfigOption(cfg, "seed", envSeed);
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                printHelp();
                printOptions();
                return 0;
            } else if (arg.rfind("--config=", 0) == 0) {
                cfg = readConfigFile(arg.substr(9), cfg);
            } else if (applyOptionArgument(cfg, arg)) {
                continue;
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        }
        validateConfig(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    Kernel kernel(cfg);

    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    int lineCount = 0;
    while (std::getline(*input, line)) {
        lineCount++;

        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd) || cmd[0] == '#') {
            continue;
        }
        if (cmd == "quit") {
            break;
        }

        try {
            runCommand(kernel, cfg, cmd, iss);
        } catch (const std::invalid_argument& e) {
            // Bad input: report and keep the session alive
            std::cerr << "Error (line " << lineCount << "): " << e.what() << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Fatal (line " << lineCount << "): " << e.what() << "\n";
            return 1;
        }
    }

    return 0;
}
