#include "detect/camera_state.hpp"

namespace camsnitch::detect {

const char* ToString(const CameraState state) {
  switch (state) {
  case CameraState::kOn:
    return "on";
  case CameraState::kOff:
    return "off";
  }
  return "off";
}

std::string_view ToPayload(const CameraState state) {
  switch (state) {
  case CameraState::kOn:
    return "ON";
  case CameraState::kOff:
    return "OFF";
  }
  return "OFF";
}

} // namespace camsnitch::detect
