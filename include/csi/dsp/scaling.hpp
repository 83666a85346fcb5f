#pragma once
#include <cstdint>
#include <vector>
#include "csi/record_buffer.hpp"
#include "csi/rx/intel.hpp"

namespace csi::dsp {

// Intel 5300 post-processing: absolute scaling of the 8-bit CSI and
// removal of the transmit spatial mapping.

inline constexpr uint16_t RATE_HT40_FLAG = 0x800;

// Combined RSSI of the active chains, in dBm.
double total_rss(uint8_t rssi_a, uint8_t rssi_b, uint8_t rssi_c, uint8_t agc);
std::vector<double> get_total_rss(const rx::IntelRecords& r);

// Returns the scaled CSI, leaving r.csi untouched.
Column<cdouble> get_scaled_csi(const rx::IntelRecords& r);
void get_scaled_csi_inplace(rx::IntelRecords& r);

// H <- H * inv(SM) for every subcarrier of `csi`, which must have the
// layout of r.csi. Records with one transmit antenna are left as is.
Column<cdouble> apply_sm(const rx::IntelRecords& r, const Column<cdouble>& csi);
void apply_sm_inplace(const rx::IntelRecords& r, Column<cdouble>& csi);

Column<cdouble> get_scaled_csi_sm(const rx::IntelRecords& r);
void get_scaled_csi_sm_inplace(rx::IntelRecords& r);

// Spatial mapping matrix (ntx x ntx, row-major) for ntx 2 or 3.
std::vector<cdouble> spatial_mapping(unsigned ntx, bool ht40);

} // namespace csi::dsp
