#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <array>

namespace dsss {

// Core types
using Sample = float;                          // Waveform sample
using Samples = std::vector<Sample>;           // Waveform buffer
using Bytes = std::vector<uint8_t>;            // Message payload
using Bits = std::vector<uint8_t>;             // One 0/1 value per element
using Chips = std::vector<Sample>;             // One +/-1 value per element

// Spans for zero-copy operations
using SampleSpan = std::span<const Sample>;
using ByteSpan = std::span<const uint8_t>;
using BitSpan = std::span<const uint8_t>;

// Line codes / FEC applied before spreading
enum class CodingScheme : uint8_t {
    NRZ = 0,          // No coding
    MANCHESTER = 1,   // 1 -> 10, 0 -> 01 (rate 1/2)
    REP3 = 2,         // Each bit sent three times (rate 1/3)
    HAMMING74 = 3,    // Single-error-correcting block code (rate 4/7)
};

// Pipeline taps, in signal order
enum class Stage : uint8_t {
    SOURCE = 0,       // Encoded bits as NRZ levels
    SPREADER = 1,     // Oversampled chip waveform
    MODULATOR = 2,    // Chips on the carrier
    CHANNEL = 3,      // After noise
    CORRELATOR = 4,   // After coherent mix-down
    DECODER = 5,      // FEC-corrected code stream
};

constexpr std::array<Stage, 6> kAllStages = {
    Stage::SOURCE, Stage::SPREADER, Stage::MODULATOR,
    Stage::CHANNEL, Stage::CORRELATOR, Stage::DECODER,
};

constexpr std::array<CodingScheme, 4> kAllCodingSchemes = {
    CodingScheme::NRZ, CodingScheme::MANCHESTER,
    CodingScheme::REP3, CodingScheme::HAMMING74,
};

// Interference model for the channel
enum class NoiseMode : uint8_t {
    WHITE,            // Flat over the whole simulated band
    BAND_LIMITED,     // Confined to +/- bandwidth/2 around DC
};

// Name <-> enum conversion. Parsing throws InvalidArgument on unknown names.
const char* stageName(Stage stage);
Stage parseStage(std::string_view name);

const char* codingSchemeName(CodingScheme scheme);
CodingScheme parseCodingScheme(std::string_view name);

const char* noiseModeName(NoiseMode mode);
NoiseMode parseNoiseMode(std::string_view name);

// One captured waveform at a pipeline tap
struct StageSnapshot {
    Samples waveform;
    double sample_rate = 0.0;
};

using StageSnapshotPtr = std::shared_ptr<const StageSnapshot>;
using StageMap = std::map<Stage, StageSnapshotPtr>;

// Spectrum as (frequency axis, magnitude) pairs
struct Spectrum {
    std::vector<float> frequencies;   // Hz
    std::vector<float> magnitudes;    // Linear, normalized by sample count
};

// Parameters for one simulation run
struct SimulationRequest {
    std::string message;
    std::string tx_secret;
    std::string rx_secret;

    double chip_rate = 1e5;            // Hz
    double carrier_freq = 1e6;         // Hz
    double noise_power = 0.0;          // Noise variance
    double noise_bandwidth = 5e3;      // Hz, interference bandwidth
    uint32_t oversampling = 8;         // Samples per chip

    CodingScheme coding_scheme = CodingScheme::NRZ;
    NoiseMode noise_mode = NoiseMode::BAND_LIMITED;

    // Unset = nondeterministic channel noise
    std::optional<uint64_t> noise_seed;

    double getSampleRate() const {
        return chip_rate * oversampling;
    }
};

// Outcome of one simulation run
struct SimulationResult {
    std::string simulation_id;
    std::string decoded_message;
    bool mismatch = false;

    CodingScheme coding_scheme = CodingScheme::NRZ;
    double noise_bandwidth = 0.0;
    double sample_rate = 0.0;
    size_t chips_per_bit = 0;
    size_t payload_bits = 0;
    size_t encoded_bits = 0;

    StageMap stages;
};

// Stage query answer, decimated for transport
struct StageDetail {
    Stage stage = Stage::SOURCE;
    Samples samples;
    double sample_rate = 0.0;
    Spectrum spectrum;
};

// Engine configuration
struct EngineConfig {
    size_t cache_size = 16;            // Simulations kept for stage queries
    size_t max_points = 2048;          // Decimation limit for transport

    // Stages whose spectra are attached to a simulate response
    std::vector<Stage> inline_spectra = {Stage::MODULATOR, Stage::CHANNEL};
};

namespace presets {

// Noise-free loopback used by the demo and the end-to-end checks
inline SimulationRequest demo() {
    SimulationRequest req;
    req.message = "HELLO DSSS";
    req.tx_secret = "alpha";
    req.rx_secret = "alpha";
    req.chip_rate = 50000.0;
    req.carrier_freq = 500000.0;
    req.noise_power = 0.0;
    req.oversampling = 4;
    return req;
}

// Demo link with narrowband interference added
inline SimulationRequest interference(double noise_power, double bandwidth) {
    SimulationRequest req = demo();
    req.noise_power = noise_power;
    req.noise_bandwidth = bandwidth;
    req.noise_mode = NoiseMode::BAND_LIMITED;
    return req;
}

} // namespace presets

} // namespace dsss
