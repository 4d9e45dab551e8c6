// VCD waveform writer for DFI signal frames.
//
// Records one DfiOutputs + PhyInputs sample per controller tick and writes
// a Value Change Dump readable by GTKWave and similar viewers:
//   $timescale 1ns, one time step per tick, scope "dfi".
//
// Only signals whose value changed since the previous sample are emitted
// after the initial $dumpvars block.

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "dfi_signals.hpp"

namespace ddr_dfi {

class VcdWriter {
public:
    /// Open `filename` and write the VCD header.
    ///
    /// @throws std::runtime_error if the file cannot be created.
    explicit VcdWriter(const std::string& filename);
    ~VcdWriter();

    VcdWriter(const VcdWriter&) = delete;
    VcdWriter& operator=(const VcdWriter&) = delete;

    /// Append the frame seen at `cycle`.
    ///
    /// @param cycle  Controller tick the sample belongs to (must increase).
    /// @param dfi    Controller output frame.
    /// @param phy    PHY signals sampled by the controller on that tick.
    /// @throws std::runtime_error on a write error.
    void sample(uint64_t cycle, const DfiOutputs& dfi, const PhyInputs& phy);

    /// Flush and close the file. Safe to call more than once.
    ///
    /// @throws std::runtime_error if the final flush fails.
    void close();

    const std::string& filename() const {
        return filename_;
    }

    uint64_t sample_count() const {
        return samples_;
    }

private:
    struct Signal {
        const char* name;
        int width;
        std::string id;
        uint64_t last = 0;
    };

    void write_header();
    void write_value(const Signal& sig, uint64_t value);
    void check_io(int rc);

    std::string filename_;
    std::FILE* fp_ = nullptr;
    std::vector<Signal> signals_;
    uint64_t samples_ = 0;
};

} // namespace ddr_dfi
