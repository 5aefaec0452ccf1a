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

#ifndef A2DP_BRIDGE_A2DP_BRIDGE_CONFIG_H
#define A2DP_BRIDGE_A2DP_BRIDGE_CONFIG_H

#include <string>

namespace a2dp_bridge {

static constexpr char kMaxConnectedAudioDevicesProperty[] =
    "persist.bluetooth.maxconnectedaudiodevices";
static constexpr char kA2dpOffloadSupportedProperty[] =
    "ro.bluetooth.a2dp_offload.supported";
static constexpr char kA2dpOffloadDisabledProperty[] =
    "persist.bluetooth.a2dp_offload.disabled";

/** Settings the A2DP native stack is initialised with. */
class A2dpBridgeConfig {
 public:
  static constexpr int kDefaultMaxConnectedAudioDevices = 1;
  static constexpr int kMaxConnectedAudioDevicesLimit = 5;

  // |maxConnectedAudioDevices| is clamped to [1, kMaxConnectedAudioDevicesLimit].
  A2dpBridgeConfig(int maxConnectedAudioDevices, bool offloadSupported,
                   bool offloadDisabled);

  static A2dpBridgeConfig FromSystemProperties();

  int GetMaxConnectedAudioDevices() const { return mMaxConnectedAudioDevices; }
  bool IsOffloadSupported() const { return mOffloadSupported; }
  bool IsOffloadDisabled() const { return mOffloadDisabled; }
  bool IsOffloadEnabled() const { return mOffloadSupported && !mOffloadDisabled; }

  std::string ToString() const;

 private:
  int mMaxConnectedAudioDevices;
  bool mOffloadSupported;
  bool mOffloadDisabled;
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_A2DP_BRIDGE_CONFIG_H
