#pragma once

// Helpers over the WebGPU C API (wgpu-native v27 / Dawn, WGPUStringView era).

#include <webgpu/webgpu.h>
#include <string>

#ifdef __EMSCRIPTEN__
#include <emscripten.h>
#define WGPU_DEVICE_TICK(device) emscripten_sleep(1)
#else
#define WGPU_DEVICE_TICK(device) wgpuDeviceTick(device)
#endif

#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})
#define WGPU_STR_NULL (WGPUStringView{.data = nullptr, .length = 0})

// Shader code: WGPUStringView over a std::string
#define WGPU_SHADER_CODE(desc, src)                                            \
  (desc).code = {.data = (src).c_str(), .length = (src).size()}

namespace yquad {

inline std::string wgpuLabel(WGPUStringView sv) {
    if (!sv.data) return "(unnamed)";
    if (sv.length == WGPU_STRLEN) return std::string(sv.data);
    return std::string(sv.data, sv.length);
}

} // namespace yquad
