// Simulation service - request validation and status mapping in front of
// the engine. Stands in for the web layer: InvalidArgument -> 400,
// NotFound -> 404, anything else -> 500.

#pragma once

#include "command_parser.hpp"
#include "response.hpp"
#include "dsss/engine.hpp"
#include <iosfwd>

namespace dsss {
namespace interface {

// Limits applied to incoming simulate requests
struct RequestLimits {
    size_t max_message_chars = 256;
    size_t min_secret_chars = 4;
    size_t max_secret_chars = 64;
    double max_noise_power = 100.0;
    uint32_t max_oversampling = 64;
    size_t min_simulation_id_chars = 8;
};

// Numeric field parsing; the whole text must be consumed. Throw
// InvalidArgument naming the field.
double parseDouble(const std::string& key, const std::string& text);
uint64_t parseUnsigned(const std::string& key, const std::string& text);
uint32_t parseOversampling(const std::string& text);

// Throws InvalidArgument naming the first offending field
void validateRequest(const SimulationRequest& request,
                     const RequestLimits& limits = RequestLimits());


class SimulationService {
public:
    explicit SimulationService(Engine& engine, const RequestLimits& limits = RequestLimits());

    // Dispatch one parsed command
    Response handle(const ParsedCommand& command);

    // Parse and dispatch one line
    Response handleLine(const std::string& line);

    Response health() const;
    Response simulate(const SimulationRequest& request);
    Response stage(const std::string& simulation_id, const std::string& stage_name);

    // Read commands until EOF or QUIT, writing one response per command.
    // Returns the number of commands handled.
    size_t serve(std::istream& in, std::ostream& out);

    // Build a request from SIMULATE parameters; throws InvalidArgument
    static SimulationRequest requestFromParams(const ParsedCommand& command);

private:
    Engine& engine_;
    RequestLimits limits_;

    Response simulateCommand(const ParsedCommand& command);
    Response stageCommand(const ParsedCommand& command);
};

} // namespace interface
} // namespace dsss
