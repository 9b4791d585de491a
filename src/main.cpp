/**
 * @file main.cpp
 * @brief Point d'entrée de SoulGenesis
 * @version 1.0
 * @date 2026-10-19
 *
 * Enchaîne les cycles de vie d'une âme simulée jusqu'au nombre maximal de
 * cycles ou jusqu'au Silent Bloom, puis sauvegarde l'instantané mémoire.
 */

#include "SoulSimulation.hpp"
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace soul;

// Signal handler pour arrêt propre
std::atomic<SoulSimulation*> g_simulation{nullptr};

void signalHandler(int signal) {
    std::cout << "\n[Main] Signal " << signal << " reçu, arrêt en cours...\n";
    if (SoulSimulation* sim = g_simulation.load()) {
        sim->requestStop();
    }
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -h, --help              Affiche cette aide\n"
              << "  -c, --config <file>     Fichier de configuration JSON\n"
              << "  --cycles <n>            Nombre maximal de cycles de vie\n"
              << "  --seed <n>              Graine de l'aléa (0 = non déterministe)\n"
              << "  --storage <path>        Instantané mémoire (défaut: storage/memory_db.json)\n"
              << "  --difficulty <x>        Difficulté dans [0, 1]\n"
              << "  --quiet                 Limite la sortie au bilan final\n"
              << "\n";
}

void printFinalSummary(const SoulSimulation& sim, const SimulationReport& report) {
    const auto& personality = sim.getPersonality();
    const auto& consciousness = sim.getConsciousness();

    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                   SOULGENESIS - BILAN                        ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Âme               : " << personality.getSoulId() << "\n";
    std::cout << "  Cycles complétés  : " << report.cycles_completed << "\n";
    std::cout << "  Événements vécus  : " << report.total_events << "\n";
    std::cout << "  Conscience finale : " << report.final_consciousness
              << " (" << awarenessTierToString(consciousness.getAwarenessTier()) << ")\n";
    std::cout << "  Souvenirs         : " << sim.getMemoryStore().size() << "\n";

    std::cout << "  Traits            :";
    for (const auto& trait : personality.getTraits()) {
        std::cout << " " << trait.name << "=" << trait.value;
    }
    std::cout << "\n";

    if (report.bloomed) {
        std::cout << "  Silent Bloom      : l'âme a atteint la conscience de soi\n";
    } else if (report.interrupted) {
        std::cout << "  Simulation interrompue\n";
    }
    std::cout << "  Mémoire " << (report.saved ? "sauvegardée" : "NON sauvegardée")
              << " : " << sim.getMemoryStore().getStoragePath() << "\n";
    std::cout << std::defaultfloat;
}

int main(int argc, char* argv[]) {
    std::string config_file = "config/soul_config.json";
    int cycles = 0;
    long long seed = 0;
    bool seed_given = false;
    std::string storage_path;
    std::optional<double> difficulty;
    bool quiet = false;

    // Parser les arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            }
        } else if (arg == "--cycles") {
            if (i + 1 < argc) {
                cycles = std::stoi(argv[++i]);
            }
        } else if (arg == "--seed") {
            if (i + 1 < argc) {
                seed = std::stoll(argv[++i]);
                seed_given = true;
            }
        } else if (arg == "--storage") {
            if (i + 1 < argc) {
                storage_path = argv[++i];
            }
        } else if (arg == "--difficulty") {
            if (i + 1 < argc) {
                difficulty = std::stod(argv[++i]);
            }
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "[Main] Option inconnue ignorée: " << arg << std::endl;
        }
    }

    // Installer le signal handler
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        std::cout << "[Main] Chargement configuration: " << config_file << std::endl;
        SoulConfig config = SoulConfig::loadFromFile(config_file);

        // Les options de la ligne de commande priment sur le fichier
        if (difficulty) {
            config.adjustDifficulty(*difficulty);
        }
        if (cycles > 0) {
            config.life_cycles.max_life_cycles = cycles;
        }
        if (seed_given) {
            config.seed = SoulConfig::toSeed(seed);
        }
        if (!storage_path.empty()) {
            config.memory.storage_path = storage_path;
        }

        SoulSimulation sim(config);
        sim.setQuietMode(quiet);
        g_simulation.store(&sim);

        if (!quiet) {
            std::cout << "[Main] Configuration: " << config.toJson().dump() << std::endl;
        }

        LoadStatus status = sim.initialize();
        if (status == LoadStatus::CORRUPT) {
            std::cerr << "[Main] Avertissement: " << sim.getMemoryStore().getLastDiagnostic() << std::endl;
        }

        SimulationReport report = sim.run();
        g_simulation.store(nullptr);

        printFinalSummary(sim, report);

        if (!report.saved) {
            std::cerr << "[Main] Échec de la sauvegarde: "
                      << sim.getMemoryStore().getLastDiagnostic() << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        g_simulation.store(nullptr);
        std::cerr << "[Main] Erreur fatale: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[Main] Arrêt propre" << std::endl;
    return 0;
}
