#pragma once

#include "core/config.hpp"
#include "core/yolo_dnn.hpp"
#include "infra/udp_command_channel.hpp"

// Config -> component parameters, shared by the executables under apps/

namespace dac {

UdpCommandChannel::Params MakeChannelParams(const VehicleConfig& cfg);
YoloDnn::Params MakeDetectorParams(const DetectionConfig& cfg);

} // namespace dac
