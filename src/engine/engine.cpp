#include "dsss/engine.hpp"
#include "dsss/channel.hpp"
#include "dsss/dsp.hpp"
#include "dsss/errors.hpp"
#include "dsss/fec.hpp"
#include "dsss/logging.hpp"
#include "dsss/spread.hpp"
#include "stage_cache.hpp"

#include <stdexcept>

#include <sodium.h>

namespace dsss {

namespace {

constexpr size_t kSimulationIdBytes = 16;

// 128 random bits as lowercase hex
std::string newSimulationId() {
    unsigned char raw[kSimulationIdBytes];
    randombytes_buf(raw, sizeof(raw));

    char hex[kSimulationIdBytes * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), raw, sizeof(raw));
    return std::string(hex);
}

StageSnapshotPtr makeSnapshot(Samples waveform, double sample_rate) {
    auto snapshot = std::make_shared<StageSnapshot>();
    snapshot->waveform = std::move(waveform);
    snapshot->sample_rate = sample_rate;
    return snapshot;
}

// NRZ level of each bit held for `repeats` samples
Samples holdBits(BitSpan bits, size_t repeats) {
    return dsp::oversample(spread::nrz(bits), repeats);
}

} // namespace

struct Engine::Impl {
    EngineConfig config;
    StageCache cache;

    explicit Impl(const EngineConfig& cfg)
        : config(cfg)
        , cache(cfg.cache_size)
    {}
};

Engine::Engine(const EngineConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

Engine::~Engine() = default;

SimulationResult Engine::simulate(const SimulationRequest& request) {
    if (request.oversampling == 0) {
        throw InvalidArgument("oversampling must be >= 1");
    }

    const double sample_rate = request.getSampleRate();
    const size_t chips_per_bit = prn::chipsPerBit(request.tx_secret);
    const size_t oversampling = request.oversampling;
    const size_t samples_per_bit = chips_per_bit * oversampling;
    const size_t expected_bytes = request.message.size();

    Bits payload = bitcodec::textToBits(request.message);
    EncodedBits encoded = fec::encode(payload, request.coding_scheme);

    SimulationResult result;
    result.coding_scheme = request.coding_scheme;
    result.noise_bandwidth = request.noise_bandwidth;
    result.sample_rate = sample_rate;
    result.chips_per_bit = chips_per_bit;
    result.payload_bits = payload.size();
    result.encoded_bits = encoded.bits.size();

    if (encoded.bits.empty()) {
        // Nothing to transmit: one zero sample per tap
        for (Stage stage : kAllStages) {
            result.stages[stage] = makeSnapshot(Samples{0.0f}, sample_rate);
        }
        result.decoded_message.clear();
    } else {
        // Transmitter
        Chips tx_prn = prn::chipSequence(request.tx_secret, chips_per_bit);
        Chips chips = spread::spreadBits(encoded.bits, tx_prn, chips_per_bit);
        Samples chip_waveform = dsp::oversample(chips, oversampling);
        Samples source = holdBits(encoded.bits, samples_per_bit);

        ChannelModel::Config channel_cfg;
        channel_cfg.carrier_freq = request.carrier_freq;
        channel_cfg.sample_rate = sample_rate;
        channel_cfg.noise_power = request.noise_power;
        channel_cfg.noise_bandwidth = request.noise_bandwidth;
        channel_cfg.noise_mode = request.noise_mode;

        ChannelModel channel = request.noise_seed
            ? ChannelModel(channel_cfg, *request.noise_seed)
            : ChannelModel(channel_cfg);

        Samples tx_signal = channel.modulate(chip_waveform);
        Samples channel_out = channel.addNoise(tx_signal);

        // Receiver
        Samples rx_mixed = channel.demodulate(channel_out);
        Chips rx_prn = prn::chipSequence(request.rx_secret, chips_per_bit);
        Samples metrics = spread::despread(rx_mixed, rx_prn, chips_per_bit, oversampling);
        Bits recovered = spread::hardDecision(metrics);

        Bits decoded_bits = fec::decode(recovered, request.coding_scheme, encoded.meta);
        result.decoded_message = bitcodec::bitsToText(decoded_bits, expected_bytes);

        // Decoder tap shows the corrected code stream, same length as the encoded one
        Bits corrected = fec::encode(decoded_bits, request.coding_scheme).bits;
        corrected.resize(encoded.bits.size(), 0);
        Samples decoder = holdBits(corrected, samples_per_bit);

        result.stages[Stage::SOURCE] = makeSnapshot(std::move(source), sample_rate);
        result.stages[Stage::SPREADER] = makeSnapshot(std::move(chip_waveform), sample_rate);
        result.stages[Stage::MODULATOR] = makeSnapshot(std::move(tx_signal), sample_rate);
        result.stages[Stage::CHANNEL] = makeSnapshot(std::move(channel_out), sample_rate);
        result.stages[Stage::CORRELATOR] = makeSnapshot(std::move(rx_mixed), sample_rate);
        result.stages[Stage::DECODER] = makeSnapshot(std::move(decoder), sample_rate);
    }

    result.mismatch = result.decoded_message != request.message;
    result.simulation_id = newSimulationId();

    // Last step: nothing above touches the cache
    impl_->cache.store(result.simulation_id, result.stages);

    LOG_ENGINE(INFO, "Simulation %s: %s, %zu payload bits -> %zu coded bits, %zu chips/bit, %s",
               result.simulation_id.c_str(), codingSchemeName(request.coding_scheme),
               result.payload_bits, result.encoded_bits, chips_per_bit,
               result.mismatch ? "MISMATCH" : "match");
    return result;
}

StageSnapshotPtr Engine::getStage(const std::string& simulation_id, Stage stage) const {
    return impl_->cache.get(simulation_id, stage);
}

Spectrum Engine::stageSpectrum(const StageSnapshot& snapshot) const {
    Spectrum full = dsp::spectrum(snapshot.waveform, snapshot.sample_rate);
    Spectrum out;
    out.frequencies = dsp::decimate(full.frequencies, impl_->config.max_points);
    out.magnitudes = dsp::decimate(full.magnitudes, impl_->config.max_points);
    return out;
}

StageDetail Engine::queryStage(const std::string& simulation_id, Stage stage) const {
    StageSnapshotPtr snapshot = getStage(simulation_id, stage);

    StageDetail detail;
    detail.stage = stage;
    detail.sample_rate = snapshot->sample_rate;
    detail.samples = dsp::decimate(snapshot->waveform, impl_->config.max_points);
    detail.spectrum = stageSpectrum(*snapshot);
    return detail;
}

size_t Engine::cachedSimulations() const {
    return impl_->cache.size();
}

const EngineConfig& Engine::getConfig() const {
    return impl_->config;
}

} // namespace dsss
