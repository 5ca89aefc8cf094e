// Simulation service implementation

#include "simulation_service.hpp"
#include "dsss/errors.hpp"
#include "dsss/fec.hpp"
#include "dsss/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <istream>
#include <ostream>

namespace dsss {
namespace interface {

namespace {

std::string requireParam(const ParsedCommand& command, const std::string& key) {
    auto value = command.param(key);
    if (!value) throw InvalidArgument(key + ": field required");
    return *value;
}

// Runs a handler and maps engine errors onto status codes
template <typename Handler>
Response guarded(const char* what, Handler&& handler) {
    try {
        return handler();
    } catch (const InvalidArgument& e) {
        LOG_SERVICE(WARN, "%s rejected: %s", what, e.what());
        return Response::badRequest(e.what());
    } catch (const NotFound& e) {
        LOG_SERVICE(INFO, "%s: %s", what, e.what());
        return Response::notFound("Simulation or stage not found");
    } catch (const std::exception& e) {
        LOG_SERVICE(ERROR, "%s failed: %s", what, e.what());
        return Response::internalError(e.what());
    }
}

size_t peakBin(const std::vector<float>& magnitudes) {
    if (magnitudes.empty()) return 0;
    return static_cast<size_t>(
        std::max_element(magnitudes.begin(), magnitudes.end()) - magnitudes.begin());
}

} // namespace

double parseDouble(const std::string& key, const std::string& text) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::logic_error&) {
        throw InvalidArgument(key + ": not a number: " + text);
    }
}

uint64_t parseUnsigned(const std::string& key, const std::string& text) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        throw InvalidArgument(key + ": not an unsigned integer: " + text);
    }
    try {
        size_t used = 0;
        unsigned long long value = std::stoull(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::logic_error&) {
        throw InvalidArgument(key + ": not an unsigned integer: " + text);
    }
}

uint32_t parseOversampling(const std::string& text) {
    uint64_t os = parseUnsigned("oversampling", text);
    if (os > UINT32_MAX) throw InvalidArgument("oversampling: out of range: " + text);
    return static_cast<uint32_t>(os);
}

void validateRequest(const SimulationRequest& request, const RequestLimits& limits) {
    size_t message_chars = bitcodec::utf8Length(request.message);
    if (message_chars < 1 || message_chars > limits.max_message_chars) {
        throw InvalidArgument("message: length must be 1.." +
                              std::to_string(limits.max_message_chars) + " characters");
    }

    auto check_secret = [&](const char* field, const std::string& secret) {
        size_t n = bitcodec::utf8Length(secret);
        if (n < limits.min_secret_chars || n > limits.max_secret_chars) {
            throw InvalidArgument(std::string(field) + ": length must be " +
                                  std::to_string(limits.min_secret_chars) + ".." +
                                  std::to_string(limits.max_secret_chars) + " characters");
        }
    };
    check_secret("tx_secret", request.tx_secret);
    check_secret("rx_secret", request.rx_secret);

    if (!std::isfinite(request.chip_rate) || request.chip_rate <= 0.0) {
        throw InvalidArgument("chip_rate: must be > 0");
    }
    if (!std::isfinite(request.carrier_freq) || request.carrier_freq <= 0.0) {
        throw InvalidArgument("carrier_freq: must be > 0");
    }
    // Negated comparison so NaN is rejected too
    if (!(request.noise_power >= 0.0 && request.noise_power <= limits.max_noise_power)) {
        throw InvalidArgument("noise_power: must be in [0, " +
                              std::to_string(limits.max_noise_power) + "]");
    }
    if (!std::isfinite(request.noise_bandwidth) || request.noise_bandwidth <= 0.0) {
        throw InvalidArgument("noise_bandwidth: must be > 0");
    }
    if (request.oversampling < 1 || request.oversampling > limits.max_oversampling) {
        throw InvalidArgument("oversampling: must be in 1.." +
                              std::to_string(limits.max_oversampling));
    }
}

SimulationService::SimulationService(Engine& engine, const RequestLimits& limits)
    : engine_(engine)
    , limits_(limits)
{
}

SimulationRequest SimulationService::requestFromParams(const ParsedCommand& command) {
    SimulationRequest req;
    req.message = requireParam(command, "message");
    req.tx_secret = requireParam(command, "tx_secret");
    req.rx_secret = requireParam(command, "rx_secret");

    if (auto v = command.param("chip_rate")) req.chip_rate = parseDouble("chip_rate", *v);
    if (auto v = command.param("carrier_freq")) req.carrier_freq = parseDouble("carrier_freq", *v);
    if (auto v = command.param("noise_power")) req.noise_power = parseDouble("noise_power", *v);
    if (auto v = command.param("noise_bandwidth")) req.noise_bandwidth = parseDouble("noise_bandwidth", *v);
    if (auto v = command.param("oversampling")) req.oversampling = parseOversampling(*v);
    if (auto v = command.param("coding_scheme")) req.coding_scheme = parseCodingScheme(*v);
    if (auto v = command.param("noise_mode")) req.noise_mode = parseNoiseMode(*v);
    if (auto v = command.param("seed")) req.noise_seed = parseUnsigned("seed", *v);
    return req;
}

Response SimulationService::health() const {
    return Response::ok().add("status", "ok");
}

Response SimulationService::simulate(const SimulationRequest& request) {
    return guarded("SIMULATE", [&]() {
        validateRequest(request, limits_);
        SimulationResult result = engine_.simulate(request);

        std::vector<std::string> stages;
        for (const auto& entry : result.stages) {
            stages.push_back(stageName(entry.first));
        }

        Response r = Response::ok();
        r.add("simulation_id", result.simulation_id)
         .add("decoded_message", result.decoded_message)
         .add("status", "complete")
         .add("mismatch", result.mismatch)
         .add("coding_scheme", codingSchemeName(result.coding_scheme))
         .add("noise_bandwidth", result.noise_bandwidth)
         .add("chips_per_bit", result.chips_per_bit)
         .addList("available_stages", stages);

        for (Stage stage : engine_.getConfig().inline_spectra) {
            auto it = result.stages.find(stage);
            if (it == result.stages.end()) continue;

            Spectrum spec = engine_.stageSpectrum(*it->second);
            std::string prefix = std::string("spectrum.") + stageName(stage);
            size_t peak = peakBin(spec.magnitudes);
            r.add(prefix + ".points", spec.frequencies.size())
             .add(prefix + ".peak_hz", static_cast<double>(spec.frequencies[peak]))
             .add(prefix + ".sample_rate", it->second->sample_rate);
        }
        return r;
    });
}

Response SimulationService::stage(const std::string& simulation_id, const std::string& stage_name) {
    return guarded("STAGE", [&]() {
        Stage stage = parseStage(stage_name);
        if (simulation_id.size() < limits_.min_simulation_id_chars) {
            throw InvalidArgument("simulation_id: must be at least " +
                                  std::to_string(limits_.min_simulation_id_chars) + " characters");
        }

        StageDetail detail = engine_.queryStage(simulation_id, stage);

        Response r = Response::ok();
        r.add("stage", stageName(detail.stage))
         .add("sample_rate", detail.sample_rate)
         .add("waveform.points", detail.samples.size())
         .add("waveform.samples", detail.samples)
         .add("spectrum.points", detail.spectrum.frequencies.size())
         .add("spectrum.frequencies", detail.spectrum.frequencies)
         .add("spectrum.magnitudes", detail.spectrum.magnitudes);
        return r;
    });
}

Response SimulationService::simulateCommand(const ParsedCommand& command) {
    SimulationRequest request;
    Response parse_error = guarded("SIMULATE", [&]() {
        request = requestFromParams(command);
        return Response::ok();
    });
    if (parse_error.status() != Status::Ok) return parse_error;
    return simulate(request);
}

Response SimulationService::stageCommand(const ParsedCommand& command) {
    if (command.args.size() != 1) {
        return Response::badRequest("usage: STAGE <stage> simulation_id=<id>");
    }
    auto id = command.param("simulation_id");
    if (!id) {
        return Response::badRequest("simulation_id: field required");
    }
    return stage(*id, command.args[0]);
}

Response SimulationService::handle(const ParsedCommand& command) {
    switch (command.cmd) {
        case Command::Health:   return health();
        case Command::Simulate: return simulateCommand(command);
        case Command::Stage:    return stageCommand(command);
        case Command::Quit:     return Response::ok().add("status", "bye");
        case Command::Unknown:
        default:
            return Response::badRequest("Unknown command: " + command.name);
    }
}

Response SimulationService::handleLine(const std::string& line) {
    ParsedCommand command;
    Response parse_error = guarded("PARSE", [&]() {
        command = CommandParser::parse(line);
        return Response::ok();
    });
    if (parse_error.status() != Status::Ok) return parse_error;
    return handle(command);
}

size_t SimulationService::serve(std::istream& in, std::ostream& out) {
    size_t handled = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        ParsedCommand command;
        Response response = guarded("PARSE", [&]() {
            command = CommandParser::parse(line);
            return Response::ok();
        });
        if (response.status() == Status::Ok) {
            response = handle(command);
        }

        out << response.toString() << std::flush;
        handled++;

        if (command.cmd == Command::Quit) break;
    }
    LOG_SERVICE(INFO, "Session closed after %zu commands", handled);
    return handled;
}

} // namespace interface
} // namespace dsss
