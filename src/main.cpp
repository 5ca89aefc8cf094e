#include "dsss/engine.hpp"
#include "dsss/errors.hpp"
#include "dsss/fec.hpp"
#include "dsss/logging.hpp"
#include "interface/simulation_service.hpp"

#include <iostream>
#include <fstream>
#include <cstring>
#include <string>

namespace {

using dsss::interface::parseDouble;
using dsss::interface::parseOversampling;
using dsss::interface::parseUnsigned;

void printUsage(const char* prog) {
    std::cerr << "dsss - Direct-Sequence Spread Spectrum link simulator\n\n";
    std::cerr << "Usage: " << prog << " [options] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  simulate <msg>  Run one simulation and print the result\n";
    std::cerr << "  serve           Read service commands from stdin (HEALTH, SIMULATE, STAGE, QUIT)\n";
    std::cerr << "  info            Show defaults, coding schemes and stages\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -t <secret>         Transmitter secret (default: alpha)\n";
    std::cerr << "  -r <secret>         Receiver secret (default: same as -t)\n";
    std::cerr << "  -c <scheme>         Coding: nrz, manchester, rep3, hamming74 (default: nrz)\n";
    std::cerr << "  --chip-rate <hz>    Chip rate (default: 100000)\n";
    std::cerr << "  --carrier <hz>      Carrier frequency (default: 1000000)\n";
    std::cerr << "  --noise <power>     Noise variance (default: 0)\n";
    std::cerr << "  --bandwidth <hz>    Interference bandwidth (default: 5000)\n";
    std::cerr << "  --oversampling <n>  Samples per chip, 1..64 (default: 8)\n";
    std::cerr << "  --white             White noise instead of band-limited\n";
    std::cerr << "  --seed <n>          Seed channel noise for a reproducible run\n";
    std::cerr << "  --stage <name>      Also dump a stage (waveform + spectrum) as CSV\n";
    std::cerr << "  -o <file>           Write the CSV to a file instead of stdout\n";
    std::cerr << "  -v                  Verbose (DEBUG) logging\n";
    std::cerr << "  -q                  Only log errors\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " simulate \"HELLO DSSS\" -t alpha --chip-rate 50000 --carrier 500000 --oversampling 4\n";
    std::cerr << "  " << prog << " simulate \"HELLO\" -t alpha -r impostor-key\n";
    std::cerr << "  " << prog << " simulate \"HELLO\" --noise 2 -c hamming74 --stage channel -o channel.csv\n";
    std::cerr << "  echo 'SIMULATE message=\"hi there\" tx_secret=alpha rx_secret=alpha' | " << prog << " serve\n";
    std::cerr << "\n";
}

void printInfo(const dsss::EngineConfig& config) {
    dsss::SimulationRequest defaults;

    std::cout << "=== DSSS Link Simulator ===\n\n";

    std::cout << "Defaults:\n";
    std::cout << "  Chip rate:      " << defaults.chip_rate << " Hz\n";
    std::cout << "  Carrier:        " << defaults.carrier_freq << " Hz\n";
    std::cout << "  Oversampling:   " << defaults.oversampling << "\n";
    std::cout << "  Sample rate:    " << defaults.getSampleRate() << " Hz\n";
    std::cout << "  Noise:          " << defaults.noise_power << " ("
              << dsss::noiseModeName(defaults.noise_mode) << ", "
              << defaults.noise_bandwidth << " Hz)\n";
    std::cout << "  Cache size:     " << config.cache_size << " simulations\n";
    std::cout << "  Max points:     " << config.max_points << "\n";
    std::cout << "\n";

    std::cout << "Coding schemes:\n";
    for (auto scheme : dsss::kAllCodingSchemes) {
        std::cout << "  " << dsss::codingSchemeName(scheme)
                  << " (rate " << dsss::fec::codeRate(scheme) << ")\n";
    }
    std::cout << "\nStages:\n";
    for (auto stage : dsss::kAllStages) {
        std::cout << "  " << dsss::stageName(stage) << "\n";
    }
    std::cout << "\nSpreading factor: max(8, 4 x tx secret length) chips per bit\n";
    std::cout << "Secrets only seed the chip sequence; they are not encryption keys.\n";
}

void printResult(const dsss::SimulationResult& result) {
    std::cout << "Simulation:     " << result.simulation_id << "\n";
    std::cout << "Coding:         " << dsss::codingSchemeName(result.coding_scheme) << "\n";
    std::cout << "Chips per bit:  " << result.chips_per_bit << "\n";
    std::cout << "Payload bits:   " << result.payload_bits << "\n";
    std::cout << "Encoded bits:   " << result.encoded_bits << "\n";
    std::cout << "Sample rate:    " << result.sample_rate << " Hz\n";
    std::cout << "Decoded:        \"" << result.decoded_message << "\"\n";
    std::cout << "Result:         " << (result.mismatch ? "MISMATCH" : "OK") << "\n";
    std::cout << "Stages:\n";
    for (const auto& [stage, snapshot] : result.stages) {
        std::cout << "  " << dsss::stageName(stage) << ": "
                  << snapshot->waveform.size() << " samples\n";
    }
}

void writeStageCsv(const dsss::StageDetail& detail, std::ostream& out) {
    out << "# stage=" << dsss::stageName(detail.stage)
        << " sample_rate=" << detail.sample_rate << "\n";
    out << "index,sample\n";
    for (size_t i = 0; i < detail.samples.size(); ++i) {
        out << i << "," << detail.samples[i] << "\n";
    }
    out << "frequency_hz,magnitude\n";
    for (size_t i = 0; i < detail.spectrum.frequencies.size(); ++i) {
        out << detail.spectrum.frequencies[i] << "," << detail.spectrum.magnitudes[i] << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    dsss::SimulationRequest request;
    request.tx_secret = "alpha";
    std::string command;
    std::string message;
    std::string stage_name;
    const char* output_file = nullptr;
    bool rx_given = false;

    try {
        for (int i = 1; i < argc; i++) {
            const char* arg = argv[i];
            bool has_value = i + 1 < argc;

            if (strcmp(arg, "-t") == 0 && has_value) {
                request.tx_secret = argv[++i];
            } else if (strcmp(arg, "-r") == 0 && has_value) {
                request.rx_secret = argv[++i];
                rx_given = true;
            } else if (strcmp(arg, "-c") == 0 && has_value) {
                request.coding_scheme = dsss::parseCodingScheme(argv[++i]);
            } else if (strcmp(arg, "--chip-rate") == 0 && has_value) {
                request.chip_rate = parseDouble("--chip-rate", argv[++i]);
            } else if (strcmp(arg, "--carrier") == 0 && has_value) {
                request.carrier_freq = parseDouble("--carrier", argv[++i]);
            } else if (strcmp(arg, "--noise") == 0 && has_value) {
                request.noise_power = parseDouble("--noise", argv[++i]);
            } else if (strcmp(arg, "--bandwidth") == 0 && has_value) {
                request.noise_bandwidth = parseDouble("--bandwidth", argv[++i]);
            } else if (strcmp(arg, "--oversampling") == 0 && has_value) {
                request.oversampling = parseOversampling(argv[++i]);
            } else if (strcmp(arg, "--white") == 0) {
                request.noise_mode = dsss::NoiseMode::WHITE;
            } else if (strcmp(arg, "--seed") == 0 && has_value) {
                request.noise_seed = parseUnsigned("--seed", argv[++i]);
            } else if (strcmp(arg, "--stage") == 0 && has_value) {
                stage_name = argv[++i];
            } else if (strcmp(arg, "-o") == 0 && has_value) {
                output_file = argv[++i];
            } else if (strcmp(arg, "-v") == 0) {
                dsss::setLogLevel(dsss::LogLevel::DEBUG);
            } else if (strcmp(arg, "-q") == 0) {
                dsss::setLogLevel(dsss::LogLevel::ERROR);
            } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
                printUsage(argv[0]);
                return 0;
            } else if (command.empty()) {
                command = arg;
            } else if (message.empty()) {
                message = arg;
            } else {
                std::cerr << "Unexpected argument: " << arg << "\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << "\n";
        return 1;
    }

    if (!rx_given) request.rx_secret = request.tx_secret;
    request.message = message;

    dsss::EngineConfig config;

    if (command == "info") {
        printInfo(config);
        return 0;
    }

    try {
        dsss::Engine engine(config);
        dsss::interface::SimulationService service(engine);

        if (command == "serve") {
            service.serve(std::cin, std::cout);
            return 0;
        }

        if (command == "simulate") {
            dsss::interface::validateRequest(request);
            auto result = engine.simulate(request);
            printResult(result);

            if (!stage_name.empty()) {
                auto detail = engine.queryStage(result.simulation_id, dsss::parseStage(stage_name));
                if (output_file) {
                    std::ofstream out(output_file);
                    if (!out) {
                        std::cerr << "Cannot open output file: " << output_file << "\n";
                        return 1;
                    }
                    writeStageCsv(detail, out);
                    std::cerr << "Wrote " << dsss::stageName(detail.stage) << " to " << output_file << "\n";
                } else {
                    writeStageCsv(detail, std::cout);
                }
            }
            return result.mismatch ? 2 : 0;
        }
    } catch (const dsss::InvalidArgument& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    } catch (const dsss::NotFound& e) {
        std::cerr << "Not found: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("MAIN", "%s", e.what());
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    printUsage(argv[0]);
    return 1;
}
