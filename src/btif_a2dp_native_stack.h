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

#ifndef A2DP_BRIDGE_BTIF_A2DP_NATIVE_STACK_H
#define A2DP_BRIDGE_BTIF_A2DP_NATIVE_STACK_H

#include <hardware/bluetooth.h>
#include <hardware/bt_av.h>

#include <base/macros.h>

#include "a2dp_native_stack.h"

namespace a2dp_bridge {

// Conversions between the HAL codec config and BluetoothCodecConfig.
BluetoothCodecConfig FromBtavCodecConfig(
    const btav_a2dp_codec_config_t& codec_config);
btav_a2dp_codec_config_t ToBtavCodecConfig(
    const BluetoothCodecConfig& codecConfig);

/** A2dpNativeStack backed by the A2DP source profile of the Bluetooth HAL.
 *
 * The HAL has a single callback table, so only one instance can be
 * initialized at a time. Destroying an instance releases the profile only
 * if that instance initialized it. The stock profile interface has no LHDC extension;
 * those calls answer BT_STATUS_UNSUPPORTED.
 */
class BtifA2dpNativeStack : public A2dpNativeStack {
 public:
  explicit BtifA2dpNativeStack(const bt_interface_t* btInterface);
  ~BtifA2dpNativeStack() override;

  void Init(A2dpNativeCallbacks* callbacks, int maxConnectedAudioDevices,
            const std::vector<BluetoothCodecConfig>& codecConfigPriorities,
            const std::vector<BluetoothCodecConfig>& codecConfigOffload)
      override;
  void Cleanup() override;

  bool Connect(const BtAddress& address) override;
  bool Disconnect(const BtAddress& address) override;
  bool SetSilenceDevice(const BtAddress& address, bool silence) override;
  bool SetActiveDevice(const BtAddress& address) override;
  bool SetCodecConfigPreference(
      const BtAddress& address,
      const std::vector<BluetoothCodecConfig>& codecConfigArray) override;

  int GetLhdcCodecExtendApiVer(const BtAddress& address,
                               std::vector<uint8_t>& exApiVer) override;
  int SetLhdcCodecExtendApiConfig(const BtAddress& address,
                                  std::vector<uint8_t>& codecConfig) override;
  int GetLhdcCodecExtendApiConfig(const BtAddress& address,
                                  std::vector<uint8_t>& codecConfig) override;
  int GetLhdcCodecExtendApiA2dpCodecConfig(
      const BtAddress& address, std::vector<uint8_t>& codecConfig) override;
  void SetLhdcCodecExtendApiData(const BtAddress& address,
                                 std::vector<uint8_t>& codecData) override;

 private:
  // Caller holds interface_mutex and callbacks_mutex exclusively.
  void ReleaseProfile();

  const bt_interface_t* mBtInterface;

  DISALLOW_COPY_AND_ASSIGN(BtifA2dpNativeStack);
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_BTIF_A2DP_NATIVE_STACK_H
