#include "interface/simulation_service.hpp"
#include "dsss/errors.hpp"
#include "dsss/fec.hpp"
#include <iostream>
#include <sstream>
#include <string>

using namespace dsss;
using namespace dsss::interface;

std::string unquote(const std::string& text) {
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

// Test 1: Command tokenizer
bool testParser() {
    std::cout << "Test 1: Command parser..." << std::flush;

    ParsedCommand cmd = CommandParser::parse(
        "simulate message=\"hi \\\"there\\\"\" tx_secret=alpha extra");
    if (cmd.cmd != Command::Simulate || cmd.name != "simulate") {
        std::cout << " FAILED (command word)\n";
        return false;
    }
    if (cmd.param("message").value_or("") != "hi \"there\"" ||
        cmd.param("tx_secret").value_or("") != "alpha" ||
        cmd.param("rx_secret").has_value()) {
        std::cout << " FAILED (params)\n";
        return false;
    }
    if (cmd.args.size() != 1 || cmd.args[0] != "extra") {
        std::cout << " FAILED (args)\n";
        return false;
    }

    if (CommandParser::parse("exit").cmd != Command::Quit ||
        CommandParser::parse("FROB").cmd != Command::Unknown) {
        std::cout << " FAILED (lookup)\n";
        return false;
    }

    for (const char* bad : {"SIMULATE message=\"open", "SIMULATE =value"}) {
        try {
            CommandParser::parse(bad);
            std::cout << " FAILED (accepted: " << bad << ")\n";
            return false;
        } catch (const InvalidArgument&) {
        }
    }

    std::cout << " OK\n";
    return true;
}

// Test 2: Request validation bounds
bool testValidation() {
    std::cout << "Test 2: Request validation..." << std::flush;

    SimulationRequest ok = presets::demo();
    validateRequest(ok);

    // 256 two-byte characters is within the limit
    SimulationRequest wide = ok;
    wide.message.clear();
    for (int i = 0; i < 256; ++i) wide.message += "\xC3\xA9";
    validateRequest(wide);
    if (bitcodec::utf8Length(wide.message) != 256) {
        std::cout << " FAILED (utf8Length)\n";
        return false;
    }

    auto rejects = [](SimulationRequest req) {
        try {
            validateRequest(req);
            return false;
        } catch (const InvalidArgument&) {
            return true;
        }
    };

    SimulationRequest r = ok;
    r.message = "";
    bool all = rejects(r);
    r = ok; r.message = std::string(257, 'a'); all = all && rejects(r);
    r = ok; r.tx_secret = "abc"; all = all && rejects(r);
    r = ok; r.rx_secret = std::string(65, 'k'); all = all && rejects(r);
    r = ok; r.chip_rate = 0.0; all = all && rejects(r);
    r = ok; r.carrier_freq = -1.0; all = all && rejects(r);
    r = ok; r.noise_power = 100.5; all = all && rejects(r);
    r = ok; r.noise_power = -0.1; all = all && rejects(r);
    r = ok; r.noise_bandwidth = 0.0; all = all && rejects(r);
    r = ok; r.oversampling = 0; all = all && rejects(r);
    r = ok; r.oversampling = 65; all = all && rejects(r);
    if (!all) {
        std::cout << " FAILED (out-of-range request accepted)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

// Test 3: Numeric fields are range-checked, never wrapped
bool testNumericParsing() {
    std::cout << "Test 3: Numeric field parsing..." << std::flush;

    if (parseOversampling("64") != 64 || parseUnsigned("seed", "42") != 42 ||
        parseDouble("chip_rate", "5e4") != 50000.0) {
        std::cout << " FAILED (valid values)\n";
        return false;
    }

    // 2^32 + 4 must not come back as 4
    for (const char* bad : {"4294967300", "4294967296", "-1", "8x", "", "99999999999999999999"}) {
        try {
            parseOversampling(bad);
            std::cout << " FAILED (accepted oversampling \"" << bad << "\")\n";
            return false;
        } catch (const InvalidArgument&) {
        }
    }

    try {
        parseDouble("noise_power", "1.5dB");
        std::cout << " FAILED (trailing text accepted)\n";
        return false;
    } catch (const InvalidArgument&) {
    }

    std::cout << " OK\n";
    return true;
}

// Test 4: HEALTH and SIMULATE
bool testSimulate() {
    std::cout << "Test 4: HEALTH / SIMULATE..." << std::flush;

    Engine engine;
    SimulationService service(engine);

    Response health = service.handleLine("HEALTH");
    if (health.code() != 200 || unquote(health.field("status")) != "ok") {
        std::cout << " FAILED (health)\n";
        return false;
    }

    Response r = service.handleLine(
        "SIMULATE message=\"test message\" tx_secret=alpha rx_secret=alpha "
        "coding_scheme=hamming74 noise_bandwidth=20000 seed=5");
    if (r.code() != 200) {
        std::cout << " FAILED (code " << r.code() << ": " << r.field("detail") << ")\n";
        return false;
    }
    if (unquote(r.field("decoded_message")) != "test message" ||
        r.field("mismatch") != "false" ||
        unquote(r.field("status")) != "complete" ||
        unquote(r.field("coding_scheme")) != "hamming74" ||
        r.field("noise_bandwidth") != "20000" ||
        r.field("chips_per_bit") != "20") {
        std::cout << " FAILED (fields)\n";
        return false;
    }
    if (r.field("available_stages") != "source,spreader,modulator,channel,correlator,decoder") {
        std::cout << " FAILED (stages: " << r.field("available_stages") << ")\n";
        return false;
    }
    if (!r.has("spectrum.modulator.points") || !r.has("spectrum.channel.peak_hz")) {
        std::cout << " FAILED (inline spectra)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

// Test 5: STAGE lookups and their error codes
bool testStage() {
    std::cout << "Test 5: STAGE lookups..." << std::flush;

    Engine engine;
    SimulationService service(engine);

    Response sim = service.handleLine("SIMULATE message=hello tx_secret=alpha rx_secret=alpha");
    std::string id = unquote(sim.field("simulation_id"));
    if (sim.code() != 200 || id.size() != 32) {
        std::cout << " FAILED (simulate)\n";
        return false;
    }

    Response stage = service.handleLine("STAGE correlator simulation_id=" + id);
    if (stage.code() != 200 || unquote(stage.field("stage")) != "correlator" ||
        stage.field("waveform.points").empty() || stage.field("spectrum.magnitudes").empty()) {
        std::cout << " FAILED (stage lookup)\n";
        return false;
    }

    struct Case {
        std::string line;
        int code;
    };
    Case cases[] = {
        {"STAGE modulator simulation_id=0123456789abcdef", 404},
        {"STAGE modulator simulation_id=short", 400},
        {"STAGE warp simulation_id=" + id, 400},
        {"STAGE modulator", 400},
        {"STAGE simulation_id=" + id, 400},
    };
    for (const auto& c : cases) {
        Response r = service.handleLine(c.line);
        if (r.code() != c.code) {
            std::cout << " FAILED (" << c.line << " -> " << r.code() << ")\n";
            return false;
        }
    }

    Response missing = service.handleLine("STAGE source simulation_id=0123456789abcdef");
    if (unquote(missing.field("detail")) != "Simulation or stage not found") {
        std::cout << " FAILED (404 detail)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

// Test 6: Bad SIMULATE requests are 400s
bool testBadRequests() {
    std::cout << "Test 6: Bad requests..." << std::flush;

    Engine engine;
    SimulationService service(engine);

    const char* lines[] = {
        "SIMULATE message=hi tx_secret=abc rx_secret=alpha",
        "SIMULATE message=hi tx_secret=alpha rx_secret=alpha coding_scheme=turbo",
        "SIMULATE message=hi tx_secret=alpha rx_secret=alpha oversampling=65",
        "SIMULATE message=hi tx_secret=alpha rx_secret=alpha oversampling=-2",
        "SIMULATE message=hi tx_secret=alpha rx_secret=alpha oversampling=4294967300",
        "SIMULATE message=hi tx_secret=alpha rx_secret=alpha noise_power=abc",
        "SIMULATE message=hi tx_secret=alpha rx_secret=alpha noise_mode=pink",
        "SIMULATE tx_secret=alpha rx_secret=alpha",
        "SIMULATE message=\"unterminated",
        "TRANSMIT message=hi",
    };
    for (const char* line : lines) {
        Response r = service.handleLine(line);
        if (r.code() != 400 || !r.has("detail")) {
            std::cout << " FAILED (" << line << " -> " << r.code() << ")\n";
            return false;
        }
    }

    if (engine.cachedSimulations() != 0) {
        std::cout << " FAILED (rejected request was cached)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

// Test 7: Session loop over a stream
bool testServe() {
    std::cout << "Test 7: Serve loop..." << std::flush;

    Engine engine;
    SimulationService service(engine);

    std::istringstream in(
        "HEALTH\n"
        "\n"
        "SIMULATE message=\"hi there\" tx_secret=alpha rx_secret=impostor-key\n"
        "BOGUS\n"
        "QUIT\n"
        "HEALTH\n");
    std::ostringstream out;

    size_t handled = service.serve(in, out);
    std::string text = out.str();

    if (handled != 4) {
        std::cout << " FAILED (handled " << handled << ")\n";
        return false;
    }
    if (text.find("200 OK\nstatus=\"ok\"\n") != 0 ||
        text.find("mismatch=true") == std::string::npos ||
        text.find("400 Bad Request") == std::string::npos ||
        text.find("status=\"bye\"") == std::string::npos) {
        std::cout << " FAILED (output)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

int main() {
    std::cout << "=== Simulation Service Tests ===\n\n";

    int failures = 0;
    if (!testParser()) failures++;
    if (!testValidation()) failures++;
    if (!testNumericParsing()) failures++;
    if (!testSimulate()) failures++;
    if (!testStage()) failures++;
    if (!testBadRequests()) failures++;
    if (!testServe()) failures++;

    std::cout << "\n";
    if (failures == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    }
    std::cout << failures << " test(s) FAILED\n";
    return 1;
}
