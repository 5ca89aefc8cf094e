#pragma once

#include "types.hpp"
#include <memory>

namespace dsss {

/**
 * DSSS link simulator
 *
 * Runs message -> FEC -> spreading -> carrier -> noise -> coherent
 * receiver -> despreading -> FEC decode -> text, capturing the waveform at
 * each of the six stages. Recent runs are kept in a bounded cache so
 * their stages can be queried by simulation id.
 *
 * One instance is meant to be owned by the serving layer and shared by
 * its handlers; simulate() and the stage queries are thread-safe.
 */
class Engine {
public:
    explicit Engine(const EngineConfig& config = EngineConfig());
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Run one simulation. Either all six stages are cached under the
    // returned id, or an exception is thrown and the cache is untouched.
    SimulationResult simulate(const SimulationRequest& request);

    // Raw snapshot of one stage; throws NotFound
    StageSnapshotPtr getStage(const std::string& simulation_id, Stage stage) const;

    // Decimated waveform and spectrum of one stage; throws NotFound
    StageDetail queryStage(const std::string& simulation_id, Stage stage) const;

    // Decimated spectrum of a snapshot
    Spectrum stageSpectrum(const StageSnapshot& snapshot) const;

    // Number of simulations currently queryable
    size_t cachedSimulations() const;

    const EngineConfig& getConfig() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dsss
