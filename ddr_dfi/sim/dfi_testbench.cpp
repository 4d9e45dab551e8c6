#include "dfi_testbench.hpp"

#include <format>

namespace ddr_dfi {

PhyConfig DfiTestbench::matching_phy(const ControllerConfig& config) {
    PhyConfig phy;
    phy.timing = config.timing;
    phy.read_latency = config.timing.tCL;
    return phy;
}

DfiTestbench::DfiTestbench(const ControllerConfig& config)
    : DfiTestbench(config, matching_phy(config)) {}

DfiTestbench::DfiTestbench(const ControllerConfig& config, const PhyConfig& phy)
    : controller_(config), phy_(phy) {}

void DfiTestbench::tick() {
    inputs_.phy = phy_.signals();
    controller_.tick(inputs_);
    phy_.eval(controller_.outputs());
    if (trace_) {
        trace_->sample(controller_.cycle(), controller_.outputs(), inputs_.phy);
    }
}

void DfiTestbench::tick(uint64_t n) {
    for (uint64_t i = 0; i < n; i++) {
        tick();
    }
}

void DfiTestbench::reset(int cycles) {
    inputs_.cmd_valid = 0;
    inputs_.reset = 1;
    for (int i = 0; i < cycles; i++) {
        tick();
    }
    inputs_.reset = 0;
    phy_.reset();
}

bool DfiTestbench::wait_idle(uint64_t& budget) {
    while (controller_.mission().busy()) {
        if (budget == 0) {
            return false;
        }
        tick();
        budget--;
    }
    return true;
}

bool DfiTestbench::run_command(const Command& cmd, uint64_t max_cycles) {
    uint64_t budget = max_cycles;
    set_mode(Mode::MISSION);

    inputs_.cmd_valid = 0;
    if (!wait_idle(budget)) {
        return false;
    }

    // Hold the command on the bus until the sequencer leaves IDLE.
    inputs_.cmd = cmd;
    inputs_.cmd_valid = 1;
    while (!controller_.mission().busy()) {
        if (budget == 0) {
            inputs_.cmd_valid = 0;
            return false;
        }
        tick();
        budget--;
    }
    inputs_.cmd_valid = 0;

    return wait_idle(budget);
}

bool DfiTestbench::write(
    uint8_t rank,
    uint8_t bank,
    uint8_t bank_group,
    uint32_t address,
    const std::vector<uint64_t>& data,
    const std::vector<uint8_t>& mask,
    uint64_t max_cycles
) {
    Command cmd;
    cmd.type = CommandType::WRITE;
    cmd.rank = rank;
    cmd.bank = bank;
    cmd.bank_group = bank_group;
    cmd.address = address;
    cmd.write_data = data;
    cmd.write_mask = mask;
    return run_command(cmd, max_cycles);
}

std::optional<std::vector<uint64_t>> DfiTestbench::read(
    uint8_t rank, uint8_t bank, uint8_t bank_group, uint32_t address, uint64_t max_cycles
) {
    Command cmd;
    cmd.type = CommandType::READ;
    cmd.rank = rank;
    cmd.bank = bank;
    cmd.bank_group = bank_group;
    cmd.address = address;
    if (!run_command(cmd, max_cycles)) {
        return std::nullopt;
    }
    return drain();
}

bool DfiTestbench::run_training(uint64_t max_cycles) {
    if (controller_.training().result().complete) {
        controller_.restart_training();
    }
    set_mode(Mode::TRAINING);
    inputs_.cmd_valid = 0;

    uint64_t budget = max_cycles;
    bool done = false;
    while (!done) {
        if (budget == 0) {
            set_mode(Mode::MISSION);
            return false;
        }
        tick();
        budget--;
        const TrainingSequencer& training = controller_.training();
        done = training.result().complete && training.current_state() == TrainingState::IDLE;
    }

    set_mode(Mode::MISSION);
    return true;
}

void DfiTestbench::open_trace(const std::string& filename) {
    trace_ = std::make_unique<VcdWriter>(filename);
}

void DfiTestbench::close_trace() {
    if (trace_) {
        trace_->close();
        trace_.reset();
    }
}

void DfiTestbench::print_summary(std::ostream& os) const {
    const MissionSequencer& mission = controller_.mission();
    const TrainingResult& result = controller_.training().result();
    const ReadCaptureQueue& queue = controller_.read_queue();

    os << std::format("DIAG: cycles={}\n", controller_.cycle());
    os << std::format(
        "DIAG: controller ACT={} RD={} WR={} PRE={} stalled={}\n",
        mission.activate_count(),
        mission.read_count(),
        mission.write_count(),
        mission.precharge_count(),
        mission.stalled() ? 1 : 0
    );
    os << std::format(
        "DIAG: phy ACT={} RD={} WR={} PRE={} wl_strobes={} rl_strobes={} init_start={}\n",
        phy_.activate_count(),
        phy_.read_count(),
        phy_.write_count(),
        phy_.precharge_count(),
        phy_.write_level_strobes(),
        phy_.read_level_strobes(),
        phy_.init_start_count()
    );
    os << std::format(
        "DIAG: training complete={} write_level={} read_level={} eye_center={}\n",
        result.complete ? 1 : 0,
        result.write_level_done ? 1 : 0,
        result.read_level_done ? 1 : 0,
        result.eye_center_detected ? 1 : 0
    );
    os << std::format(
        "DIAG: read queue size={} overflow={}\n", queue.size(), queue.overflow_count()
    );
    os << std::format("DIAG: phy violations={}\n", phy_.violations().size());
    for (const auto& v : phy_.violations()) {
        os << std::format("DIAG:   {}\n", v);
    }
}

} // namespace ddr_dfi
