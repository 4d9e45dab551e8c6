// VCD waveform writer implementation.
//
// VCD layout:
//   $timescale 1ns $end
//   $scope module dfi $end
//   $var wire <width> <id> <name> $end     (one per signal)
//   $upscope $end
//   $enddefinitions $end
//   #<cycle>                               (one per sample)
//   <value><id> | b<binary> <id>           (changed signals only)
//
// Identifier codes are the shortest strings over the printable range
// '!'..'~', assigned in declaration order.

#include "vcd_writer.hpp"

#include <format>
#include <stdexcept>

namespace ddr_dfi {

namespace {

constexpr char ID_FIRST = '!';
constexpr int ID_RADIX = '~' - '!' + 1;

std::string make_id(size_t index) {
    std::string id;
    do {
        id.push_back(static_cast<char>(ID_FIRST + index % ID_RADIX));
        index /= ID_RADIX;
    } while (index > 0);
    return id;
}

} // namespace

VcdWriter::VcdWriter(const std::string& filename) : filename_(filename) {
    fp_ = std::fopen(filename_.c_str(), "w");
    if (!fp_) {
        throw std::runtime_error(std::format("cannot open VCD file '{}'", filename_));
    }

    // Declaration order must match the value order in sample().
    signals_ = {
        {"address", 32, {}},     {"bank", 8, {}},         {"bank_group", 8, {}},
        {"cs_n", 8, {}},         {"act_n", 1, {}},        {"ras_n", 1, {}},
        {"cas_n", 1, {}},        {"we_n", 1, {}},         {"cke", 1, {}},
        {"odt", 1, {}},          {"reset_n", 1, {}},      {"wrdata", 64, {}},
        {"wrdata_en", 1, {}},    {"wrdata_cs_n", 8, {}},  {"wrdata_mask", 8, {}},
        {"rddata_en", 1, {}},    {"rddata_cs_n", 8, {}},  {"init_start", 1, {}},
        {"rddata", 64, {}},      {"rddata_valid", 1, {}}, {"init_complete", 1, {}},
    };
    for (size_t i = 0; i < signals_.size(); i++) {
        signals_[i].id = make_id(i);
    }

    write_header();
}

VcdWriter::~VcdWriter() {
    if (fp_) {
        std::fclose(fp_);
    }
}

void VcdWriter::check_io(int rc) {
    if (rc < 0) {
        throw std::runtime_error(std::format("write error on VCD file '{}'", filename_));
    }
}

void VcdWriter::write_header() {
    check_io(std::fprintf(fp_, "$date\n  ddr_dfi simulation\n$end\n"));
    check_io(std::fprintf(fp_, "$version\n  ddr_dfi VcdWriter\n$end\n"));
    check_io(std::fprintf(fp_, "$timescale 1ns $end\n"));
    check_io(std::fprintf(fp_, "$scope module dfi $end\n"));
    for (const auto& sig : signals_) {
        check_io(std::fprintf(fp_, "$var wire %d %s %s $end\n", sig.width, sig.id.c_str(), sig.name));
    }
    check_io(std::fprintf(fp_, "$upscope $end\n$enddefinitions $end\n"));
}

void VcdWriter::write_value(const Signal& sig, uint64_t value) {
    if (sig.width == 1) {
        check_io(std::fprintf(fp_, "%c%s\n", (value & 1) ? '1' : '0', sig.id.c_str()));
        return;
    }
    std::string bits = std::format("{:b}", value);
    check_io(std::fprintf(fp_, "b%s %s\n", bits.c_str(), sig.id.c_str()));
}

void VcdWriter::sample(uint64_t cycle, const DfiOutputs& dfi, const PhyInputs& phy) {
    if (!fp_) {
        throw std::runtime_error(std::format("VCD file '{}' already closed", filename_));
    }

    const uint64_t values[] = {
        dfi.address,   dfi.bank,        dfi.bank_group,  dfi.cs_n,        dfi.act_n,
        dfi.ras_n,     dfi.cas_n,       dfi.we_n,        dfi.cke,         dfi.odt,
        dfi.reset_n,   dfi.wrdata,      dfi.wrdata_en,   dfi.wrdata_cs_n, dfi.wrdata_mask,
        dfi.rddata_en, dfi.rddata_cs_n, dfi.init_start,  phy.rddata,      phy.rddata_valid,
        phy.init_complete,
    };

    check_io(std::fprintf(fp_, "#%llu\n", static_cast<unsigned long long>(cycle)));
    bool first = (samples_ == 0);
    if (first) {
        check_io(std::fprintf(fp_, "$dumpvars\n"));
    }
    for (size_t i = 0; i < signals_.size(); i++) {
        Signal& sig = signals_[i];
        if (first || values[i] != sig.last) {
            write_value(sig, values[i]);
            sig.last = values[i];
        }
    }
    if (first) {
        check_io(std::fprintf(fp_, "$end\n"));
    }
    samples_++;
}

void VcdWriter::close() {
    if (!fp_) {
        return;
    }
    int rc = std::fclose(fp_);
    fp_ = nullptr;
    if (rc != 0) {
        throw std::runtime_error(std::format("error closing VCD file '{}'", filename_));
    }
}

} // namespace ddr_dfi
