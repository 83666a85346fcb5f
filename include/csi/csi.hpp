#pragma once
#include "csi/dsp/scaling.hpp"
#include "csi/rx/atheros.hpp"
#include "csi/rx/intel.hpp"
#include "csi/rx/nexmon.hpp"
#include "csi/rx/session.hpp"
#include "csi/rx/variants.hpp"
#include "csi/status.hpp"

namespace csi {

using Intel = rx::Session<rx::IntelFormat>;
using Atheros = rx::Session<rx::AtherosFormat>;
using Nexmon = rx::Session<rx::NexmonFormat>;
using AtherosPull10 = rx::AtherosPull10;
using NexmonPull46 = rx::NexmonPull46;

} // namespace csi
