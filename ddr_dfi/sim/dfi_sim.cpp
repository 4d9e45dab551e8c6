// Lua-scripted DFI controller simulator.
//
// Runs a DfiController against the behavioral PhyModel and exposes the
// testbench to a Lua script through a `ddr` table (sol2). The script
// owns the clock: nothing advances unless it calls ddr.tick(), ddr.train(),
// ddr.write() or ddr.read(). The simulation runs on the calling thread.
//
// Lua API:
//   ddr.configure{...}        Replace the configuration (before the first tick)
//   ddr.train()               Run calibration; returns a result table
//   ddr.write(rank, bank, bg, addr, data, mask)
//                             data/mask: a number or a table of per-beat values
//   ddr.read(rank, bank, bg, addr)
//                             Returns the captured words (1-based table)
//   ddr.tick(n)               Advance n cycles (default 1)
//   ddr.reset()               Pulse global reset
//   ddr.cycle()               Controller cycle count
//   ddr.state()               Mission sequencer state name
//   ddr.training_state()      Training sequencer state name
//   ddr.drain()               Remove and return every captured read word
//   ddr.violations()          PHY protocol violations seen so far
//
// Timeouts and cycle-budget exhaustion are raised as Lua errors.
//
// 64-bit words cross the Lua boundary as Lua integers holding the same bit
// pattern, so values above 0x7FFFFFFFFFFFFFFF appear negative in Lua.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <format>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <sol/sol.hpp>

#include "dfi_testbench.hpp"

using namespace ddr_dfi;

// ---------------------------------------------------------------------------
// Simulator session
// ---------------------------------------------------------------------------

/// State shared by every `ddr` binding.
struct SimSession {
    ControllerConfig config;
    PhyConfig phy;
    std::unique_ptr<DfiTestbench> bench;
    std::string vcd_path;
    uint64_t max_cycles = 0; ///< 0 = unlimited

    void build() {
        bench = std::make_unique<DfiTestbench>(config, phy);
        if (!vcd_path.empty()) {
            bench->open_trace(vcd_path);
        }
    }

    /// Raise a Lua error once the global cycle budget is spent.
    void check_budget() const {
        if (max_cycles != 0 && bench->cycle() >= max_cycles) {
            throw std::runtime_error(
                std::format("cycle budget exhausted ({} cycles)", max_cycles)
            );
        }
    }

    /// Per-operation budget, bounded by what is left of the global one.
    uint64_t op_budget() const {
        if (max_cycles == 0) {
            return DfiTestbench::DEFAULT_MAX_CYCLES;
        }
        uint64_t left = max_cycles - bench->cycle();
        return left < DfiTestbench::DEFAULT_MAX_CYCLES ? left : DfiTestbench::DEFAULT_MAX_CYCLES;
    }
};

// ---------------------------------------------------------------------------
// Lua value conversion
// ---------------------------------------------------------------------------

/// Read a number or a table of numbers as a list of per-beat values.
template <typename T>
static std::vector<T> beat_list(const sol::object& value) {
    std::vector<T> out;
    if (value.is<sol::table>()) {
        sol::table t = value.as<sol::table>();
        for (size_t i = 1; i <= t.size(); i++) {
            out.push_back(static_cast<T>(t[i].get<int64_t>()));
        }
    } else if (value.valid() && value.get_type() == sol::type::number) {
        out.push_back(static_cast<T>(value.as<int64_t>()));
    }
    return out;
}

static sol::table word_table(sol::state& lua, const std::vector<uint64_t>& words) {
    sol::table t = lua.create_table(static_cast<int>(words.size()), 0);
    for (size_t i = 0; i < words.size(); i++) {
        t[i + 1] = static_cast<int64_t>(words[i]);
    }
    return t;
}

/// Overwrite `field` with `opts[key]` when present.
template <typename T>
static void apply_opt(const sol::table& opts, const char* key, T& field) {
    sol::optional<T> value = opts[key];
    if (value) {
        field = *value;
    }
}

/// Apply a ddr.configure{} table to the session configuration.
static void apply_config(SimSession& session, const sol::table& opts) {
    ControllerConfig& c = session.config;

    sol::optional<std::string> preset = opts["preset"];
    if (preset) {
        if (*preset == "ddr4_2400") {
            c.timing = TimingConfig::ddr4_2400();
        } else if (*preset == "ddr4_3200") {
            c.timing = TimingConfig::ddr4_3200();
        } else {
            throw std::invalid_argument(std::format("unknown timing preset '{}'", *preset));
        }
    }

    TimingConfig& t = c.timing;
    apply_opt(opts, "tRCD", t.tRCD);
    apply_opt(opts, "tRP", t.tRP);
    apply_opt(opts, "tRC", t.tRC);
    apply_opt(opts, "tRRD", t.tRRD);
    apply_opt(opts, "tWRTP", t.tWRTP);
    apply_opt(opts, "tRTP", t.tRTP);
    apply_opt(opts, "tRFC", t.tRFC);
    apply_opt(opts, "tCL", t.tCL);
    apply_opt(opts, "tCWL", t.tCWL);
    apply_opt(opts, "burst_length", t.burst_length);
    apply_opt(opts, "dfi_ratio", t.dfi_ratio);
    apply_opt(opts, "stall_limit", t.stall_limit);

    TrainingConfig& tr = c.training;
    apply_opt(opts, "init_delay_target", tr.init_delay_target);
    apply_opt(opts, "write_lvl_training_cycles", tr.write_lvl_training_cycles);
    apply_opt(opts, "read_lvl_training_cycles", tr.read_lvl_training_cycles);
    apply_opt(opts, "eye_center_cycle", tr.eye_center_cycle);
    sol::optional<int64_t> pattern = opts["write_level_pattern"];
    if (pattern) {
        tr.write_level_pattern = static_cast<uint64_t>(*pattern);
    }

    apply_opt(opts, "queue_capacity", c.queue_capacity);
    sol::optional<std::string> policy = opts["overflow_policy"];
    if (policy) {
        if (*policy == "reject_new") {
            c.overflow_policy = OverflowPolicy::REJECT_NEW;
        } else if (*policy == "backpressure") {
            c.overflow_policy = OverflowPolicy::BACKPRESSURE;
        } else {
            throw std::invalid_argument(std::format("unknown overflow policy '{}'", *policy));
        }
    }

    // The PHY follows the controller timing unless told otherwise.
    session.phy = DfiTestbench::matching_phy(c);
    apply_opt(opts, "read_latency", session.phy.read_latency);
    apply_opt(opts, "init_latency", session.phy.init_latency);
    apply_opt(opts, "auto_init", session.phy.auto_init);
    apply_opt(opts, "respond_to_reads", session.phy.respond_to_reads);
}

// ---------------------------------------------------------------------------
// Lua bindings
// ---------------------------------------------------------------------------

static void bind_ddr(sol::state& lua, SimSession& session) {
    sol::table ddr = lua.create_named_table("ddr");

    // ddr.configure{...} -- rebuild controller and PHY with new parameters.
    ddr["configure"] = [&session](const sol::table& opts) {
        if (session.bench->cycle() != 0) {
            throw std::runtime_error("ddr.configure must be called before the first tick");
        }
        apply_config(session, opts);
        session.build();
    };

    // ddr.train() -- run one calibration sequence, return its outcome.
    ddr["train"] = [&session, &lua]() {
        session.check_budget();
        if (!session.bench->run_training(session.op_budget())) {
            throw std::runtime_error(
                std::format("training did not complete by cycle {}", session.bench->cycle())
            );
        }
        const TrainingResult& r = session.bench->controller().training().result();
        sol::table result = lua.create_table();
        result["complete"] = r.complete;
        result["write_level_done"] = r.write_level_done;
        result["read_level_done"] = r.read_level_done;
        result["eye_center_detected"] = r.eye_center_detected;
        return result;
    };

    ddr["write"] = [&session](
                       uint8_t rank,
                       uint8_t bank,
                       uint8_t bank_group,
                       uint32_t address,
                       sol::object data,
                       sol::object mask
                   ) {
        session.check_budget();
        bool ok = session.bench->write(
            rank,
            bank,
            bank_group,
            address,
            beat_list<uint64_t>(data),
            beat_list<uint8_t>(mask),
            session.op_budget()
        );
        if (!ok) {
            throw std::runtime_error(std::format(
                "WRITE rank=0x{:x} bank={} bg={} addr=0x{:x} timed out at cycle {}",
                rank,
                bank,
                bank_group,
                address,
                session.bench->cycle()
            ));
        }
    };

    ddr["read"] = [&session, &lua](uint8_t rank, uint8_t bank, uint8_t bank_group, uint32_t address) {
        session.check_budget();
        auto words = session.bench->read(rank, bank, bank_group, address, session.op_budget());
        if (!words) {
            throw std::runtime_error(std::format(
                "READ rank=0x{:x} bank={} bg={} addr=0x{:x} timed out at cycle {}",
                rank,
                bank,
                bank_group,
                address,
                session.bench->cycle()
            ));
        }
        return word_table(lua, *words);
    };

    ddr["tick"] = [&session](sol::optional<uint64_t> n) {
        uint64_t count = n.value_or(1);
        for (uint64_t i = 0; i < count; i++) {
            session.check_budget();
            session.bench->tick();
        }
    };

    ddr["reset"] = [&session]() {
        session.check_budget();
        session.bench->reset();
    };

    ddr["cycle"] = [&session]() {
        return session.bench->cycle();
    };

    ddr["state"] = [&session]() {
        return std::string(to_string(session.bench->controller().mission().current_state()));
    };

    ddr["training_state"] = [&session]() {
        return std::string(to_string(session.bench->controller().training().current_state()));
    };

    ddr["drain"] = [&session, &lua]() {
        return word_table(lua, session.bench->drain());
    };

    ddr["violations"] = [&session, &lua]() {
        sol::table t = lua.create_table();
        const auto& violations = session.bench->phy().violations();
        for (size_t i = 0; i < violations.size(); i++) {
            t[i + 1] = violations[i];
        }
        return t;
    };
}

/// Run the script. Returns false if it raised an error.
static bool run_script(const char* script_path, SimSession& session) {
    sol::state lua;
    lua.open_libraries(
        sol::lib::base,
        sol::lib::package,
        sol::lib::math,
        sol::lib::string,
        sol::lib::table,
        sol::lib::io,
        sol::lib::os
    );

    // Let scripts require() helpers next to themselves and in sim/lua/.
    {
        std::string path = lua["package"]["path"];
        std::string script_str(script_path);
        auto last_sep = script_str.find_last_of('/');
        if (last_sep != std::string::npos) {
            path += ";" + script_str.substr(0, last_sep + 1) + "?.lua";
        }
        path += ";ddr_dfi/sim/lua/?.lua";
        path += ";sim/lua/?.lua";
        lua["package"]["path"] = path;
    }

    bind_ddr(lua, session);

    try {
        auto result = lua.safe_script_file(script_path, sol::script_pass_on_error);
        if (!result.valid()) {
            sol::error err = result;
            std::cerr << std::format("ERROR: Lua: {}\n", err.what());
            return false;
        }
    } catch (const sol::error& e) {
        std::cerr << std::format("ERROR: Lua: {}\n", e.what());
        return false;
    } catch (const std::exception& e) {
        std::cerr << std::format("ERROR: exception in Lua script: {}\n", e.what());
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Usage
// ---------------------------------------------------------------------------

static void print_usage(const char* prog) {
    std::fprintf(
        stderr,
        "Usage: %s --script <path.lua> [--vcd <file.vcd>] [--max-cycles N]\n"
        "\n"
        "  --script <path>     Lua script to execute (required)\n"
        "  --vcd <path>        Write a VCD trace of the DFI signals\n"
        "  --max-cycles <N>    Abort the script after N cycles (default: unlimited)\n",
        prog
    );
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char** argv) {
    const char* script_path = nullptr;
    SimSession session;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--script") == 0 && i + 1 < argc) {
            script_path = argv[++i];
        } else if (std::strcmp(argv[i], "--vcd") == 0 && i + 1 < argc) {
            session.vcd_path = argv[++i];
        } else if (std::strcmp(argv[i], "--max-cycles") == 0 && i + 1 < argc) {
            session.max_cycles = std::strtoull(argv[++i], nullptr, 0);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << std::format("Unknown argument: {}\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (script_path == nullptr) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        session.phy = DfiTestbench::matching_phy(session.config);
        session.build();
    } catch (const std::exception& e) {
        std::cerr << std::format("ERROR: {}\n", e.what());
        return 1;
    }

    std::cout << std::format("Running {}\n", script_path);
    bool ok = run_script(script_path, session);

    try {
        session.bench->close_trace();
    } catch (const std::exception& e) {
        std::cerr << std::format("ERROR: {}\n", e.what());
        ok = false;
    }

    session.bench->print_summary(std::cout);
    std::cout << std::format(
        "Simulation {}. Total cycles: {}\n", ok ? "complete" : "aborted", session.bench->cycle()
    );
    return ok ? 0 : 1;
}
