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

#ifndef A2DP_BRIDGE_BLUETOOTH_CODEC_STATUS_H
#define A2DP_BRIDGE_BLUETOOTH_CODEC_STATUS_H

#include <string>
#include <vector>

#include "bluetooth_codec_config.h"

namespace a2dp_bridge {

/** The codec in use plus what the local stack supports and what the peer
 * currently allows selecting.
 */
class BluetoothCodecStatus {
 public:
  BluetoothCodecStatus(
      const BluetoothCodecConfig& codecConfig,
      const std::vector<BluetoothCodecConfig>& codecsLocalCapabilities,
      const std::vector<BluetoothCodecConfig>& codecsSelectableCapabilities)
      : mCodecConfig(codecConfig),
        mCodecsLocalCapabilities(codecsLocalCapabilities),
        mCodecsSelectableCapabilities(codecsSelectableCapabilities) {}

  const BluetoothCodecConfig& GetCodecConfig() const { return mCodecConfig; }
  const std::vector<BluetoothCodecConfig>& GetCodecsLocalCapabilities() const {
    return mCodecsLocalCapabilities;
  }
  const std::vector<BluetoothCodecConfig>& GetCodecsSelectableCapabilities()
      const {
    return mCodecsSelectableCapabilities;
  }

  // True if |codecConfig| matches one of the selectable capabilities by codec
  // type and every feeding parameter it sets is allowed by that capability.
  bool IsCodecConfigSelectable(const BluetoothCodecConfig& codecConfig) const;

  std::string ToString() const;

  bool operator==(const BluetoothCodecStatus& rhs) const {
    return mCodecConfig == rhs.mCodecConfig &&
           mCodecsLocalCapabilities == rhs.mCodecsLocalCapabilities &&
           mCodecsSelectableCapabilities == rhs.mCodecsSelectableCapabilities;
  }
  bool operator!=(const BluetoothCodecStatus& rhs) const {
    return !(*this == rhs);
  }

 private:
  BluetoothCodecConfig mCodecConfig;
  std::vector<BluetoothCodecConfig> mCodecsLocalCapabilities;
  std::vector<BluetoothCodecConfig> mCodecsSelectableCapabilities;
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_BLUETOOTH_CODEC_STATUS_H
