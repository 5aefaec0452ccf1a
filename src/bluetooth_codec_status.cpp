/*
 * Copyright (C) 2017 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "bluetooth_codec_status.h"

namespace a2dp_bridge {

// A concrete configuration sets at most one bit per feeding parameter.
static bool HasAtMostOneBit(int32_t mask) {
  uint32_t bits = static_cast<uint32_t>(mask);
  return (bits & (bits - 1)) == 0;
}

static bool MaskAllows(int32_t value, int32_t capability) {
  return value == 0 || (value & capability) != 0;
}

static std::string ConfigsToString(
    const std::vector<BluetoothCodecConfig>& configs) {
  std::string result = "[";
  for (size_t i = 0; i < configs.size(); i++) {
    if (i != 0) result += ", ";
    result += configs[i].ToString();
  }
  result += "]";
  return result;
}

bool BluetoothCodecStatus::IsCodecConfigSelectable(
    const BluetoothCodecConfig& codecConfig) const {
  if (!HasAtMostOneBit(codecConfig.GetSampleRate()) ||
      !HasAtMostOneBit(codecConfig.GetBitsPerSample()) ||
      !HasAtMostOneBit(codecConfig.GetChannelMode())) {
    return false;
  }

  for (const auto& selectable : mCodecsSelectableCapabilities) {
    if (codecConfig.GetCodecType() != selectable.GetCodecType()) continue;
    if (!MaskAllows(codecConfig.GetSampleRate(), selectable.GetSampleRate()))
      continue;
    if (!MaskAllows(codecConfig.GetBitsPerSample(),
                    selectable.GetBitsPerSample()))
      continue;
    if (!MaskAllows(codecConfig.GetChannelMode(), selectable.GetChannelMode()))
      continue;
    return true;
  }
  return false;
}

std::string BluetoothCodecStatus::ToString() const {
  return "{mCodecConfig:" + mCodecConfig.ToString() +
         ",mCodecsLocalCapabilities:" +
         ConfigsToString(mCodecsLocalCapabilities) +
         ",mCodecsSelectableCapabilities:" +
         ConfigsToString(mCodecsSelectableCapabilities) + "}";
}

}  // namespace a2dp_bridge
