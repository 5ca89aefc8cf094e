#include "dsss/types.hpp"
#include "dsss/errors.hpp"

namespace dsss {

const char* stageName(Stage stage) {
    switch (stage) {
        case Stage::SOURCE:     return "source";
        case Stage::SPREADER:   return "spreader";
        case Stage::MODULATOR:  return "modulator";
        case Stage::CHANNEL:    return "channel";
        case Stage::CORRELATOR: return "correlator";
        case Stage::DECODER:    return "decoder";
        default:                return "unknown";
    }
}

Stage parseStage(std::string_view name) {
    for (Stage stage : kAllStages) {
        if (name == stageName(stage)) return stage;
    }
    throw InvalidArgument("Unknown stage: " + std::string(name));
}

const char* codingSchemeName(CodingScheme scheme) {
    switch (scheme) {
        case CodingScheme::NRZ:        return "nrz";
        case CodingScheme::MANCHESTER: return "manchester";
        case CodingScheme::REP3:       return "rep3";
        case CodingScheme::HAMMING74:  return "hamming74";
        default:                       return "unknown";
    }
}

CodingScheme parseCodingScheme(std::string_view name) {
    for (CodingScheme scheme : kAllCodingSchemes) {
        if (name == codingSchemeName(scheme)) return scheme;
    }
    throw InvalidArgument("Unsupported coding scheme: " + std::string(name));
}

const char* noiseModeName(NoiseMode mode) {
    switch (mode) {
        case NoiseMode::WHITE:        return "white";
        case NoiseMode::BAND_LIMITED: return "band";
        default:                      return "unknown";
    }
}

NoiseMode parseNoiseMode(std::string_view name) {
    if (name == "white") return NoiseMode::WHITE;
    if (name == "band" || name == "band_limited") return NoiseMode::BAND_LIMITED;
    throw InvalidArgument("Unknown noise mode: " + std::string(name));
}

} // namespace dsss
