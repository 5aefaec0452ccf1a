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

#ifndef A2DP_BRIDGE_A2DP_NATIVE_STACK_H
#define A2DP_BRIDGE_A2DP_NATIVE_STACK_H

#include <stdint.h>

#include <vector>

#include "bluetooth_codec_config.h"
#include "bt_address.h"

namespace a2dp_bridge {

/** Callbacks from the native A2DP source stack. They may arrive on any
 * thread, typically the stack's own callback thread.
 */
class A2dpNativeCallbacks {
 public:
  virtual ~A2dpNativeCallbacks() = default;

  virtual void OnConnectionStateChanged(const BtAddress& address,
                                        int state) = 0;
  virtual void OnAudioStateChanged(const BtAddress& address, int state) = 0;
  virtual void OnCodecConfigChanged(
      const BtAddress& address, const BluetoothCodecConfig& newCodecConfig,
      const std::vector<BluetoothCodecConfig>& codecsLocalCapabilities,
      const std::vector<BluetoothCodecConfig>& codecsSelectableCapabilities) = 0;
  // Asked by the stack when it picks a codec for |address|.
  virtual bool IsMandatoryCodecPreferred(const BtAddress& address) = 0;
};

/** Entry points of the native A2DP source stack.
 *
 * Boolean results report success. Integer results are native status codes,
 * zero on success, and are handed back to callers untranslated.
 */
class A2dpNativeStack {
 public:
  virtual ~A2dpNativeStack() = default;

  virtual void Init(A2dpNativeCallbacks* callbacks,
                    int maxConnectedAudioDevices,
                    const std::vector<BluetoothCodecConfig>& codecConfigPriorities,
                    const std::vector<BluetoothCodecConfig>& codecConfigOffload) = 0;
  virtual void Cleanup() = 0;

  virtual bool Connect(const BtAddress& address) = 0;
  virtual bool Disconnect(const BtAddress& address) = 0;
  virtual bool SetSilenceDevice(const BtAddress& address, bool silence) = 0;
  virtual bool SetActiveDevice(const BtAddress& address) = 0;
  virtual bool SetCodecConfigPreference(
      const BtAddress& address,
      const std::vector<BluetoothCodecConfig>& codecConfigArray) = 0;

  // Savitech LHDC extension. Getters fill the caller's buffer in place.
  virtual int GetLhdcCodecExtendApiVer(const BtAddress& address,
                                       std::vector<uint8_t>& exApiVer) = 0;
  virtual int SetLhdcCodecExtendApiConfig(const BtAddress& address,
                                          std::vector<uint8_t>& codecConfig) = 0;
  virtual int GetLhdcCodecExtendApiConfig(const BtAddress& address,
                                          std::vector<uint8_t>& codecConfig) = 0;
  virtual int GetLhdcCodecExtendApiA2dpCodecConfig(
      const BtAddress& address, std::vector<uint8_t>& codecConfig) = 0;
  virtual void SetLhdcCodecExtendApiData(const BtAddress& address,
                                         std::vector<uint8_t>& codecData) = 0;
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_A2DP_NATIVE_STACK_H
