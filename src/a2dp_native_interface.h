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

#ifndef A2DP_BRIDGE_A2DP_NATIVE_INTERFACE_H
#define A2DP_BRIDGE_A2DP_NATIVE_INTERFACE_H

#include <stdint.h>

#include <memory>
#include <shared_mutex>
#include <vector>

#include <base/macros.h>

#include "a2dp_bridge_config.h"
#include "a2dp_native_stack.h"
#include "a2dp_service_interface.h"
#include "bluetooth_codec_config.h"
#include "bluetooth_device.h"

namespace a2dp_bridge {

/** Native interface used by the A2DP service to talk to the native stack.
 *
 * Outbound calls resolve the device to its address and forward to the
 * native stack, returning its result untouched. Callbacks from the stack are
 * turned into A2dpStackEvents and handed to the registered service, which
 * decides which state machine the event belongs to.
 */
class A2dpNativeInterface : public A2dpNativeCallbacks {
 public:
  // |adapter| may be null; devices are then built straight from addresses.
  A2dpNativeInterface(A2dpNativeStack* nativeStack, BluetoothAdapter* adapter);
  ~A2dpNativeInterface() override = default;

  // Process-wide instance, created on first use with the default native stack
  // and the default adapter. Never destroyed.
  static A2dpNativeInterface* GetInstance();
  // Must be called at startup, before the first GetInstance().
  static void SetDefaultNativeStack(A2dpNativeStack* nativeStack);

  /**
   * Initializes the native interface.
   *
   * @param maxConnectedAudioDevices maximum number of A2DP sink devices that
   * can be connected simultaneously
   * @param codecConfigPriorities codec configuration priorities to configure
   * @param codecConfigOffload codecs the offload path can encode
   */
  void Init(int maxConnectedAudioDevices,
            const std::vector<BluetoothCodecConfig>& codecConfigPriorities,
            const std::vector<BluetoothCodecConfig>& codecConfigOffload);
  // As above, taking the device limit from |config|. |codecConfigOffload| is
  // only passed on when offload is enabled.
  void Init(const A2dpBridgeConfig& config,
            const std::vector<BluetoothCodecConfig>& codecConfigPriorities,
            const std::vector<BluetoothCodecConfig>& codecConfigOffload);
  void Cleanup();

  // A null |device| addresses 00:00:00:00:00:00.
  bool ConnectA2dp(const BluetoothDevice* device);
  bool DisconnectA2dp(const BluetoothDevice* device);
  bool SetSilenceDevice(const BluetoothDevice* device, bool silence);
  bool SetActiveDevice(const BluetoothDevice* device);
  bool SetCodecConfigPreference(
      const BluetoothDevice* device,
      const std::vector<BluetoothCodecConfig>& codecConfigArray);

  // Savitech LHDC extension API.
  int GetLhdcCodecExtendApiVer(const BluetoothDevice* device,
                               std::vector<uint8_t>& exApiVer);
  int GetLhdcCodecExtendApiConfigAr(const BluetoothDevice* device,
                                    std::vector<uint8_t>& codecConfig);
  int SetLhdcCodecExtendApiConfigAr(const BluetoothDevice* device,
                                    std::vector<uint8_t>& codecConfig);
  int GetLhdcCodecExtendApiConfigMeta(const BluetoothDevice* device,
                                      std::vector<uint8_t>& codecConfig);
  int GetLhdcCodecExtendApiConfigA2dpCodecSpecific(
      const BluetoothDevice* device, std::vector<uint8_t>& codecConfig);
  int SetLhdcCodecExtendApiConfigMeta(const BluetoothDevice* device,
                                      std::vector<uint8_t>& codecConfig);
  void SetLhdcCodecExtendApiDataGyro2D(const BluetoothDevice* device,
                                       std::vector<uint8_t>& codecData);

  // Events arriving while no service is registered are dropped.
  void RegisterService(std::shared_ptr<A2dpServiceInterface> service);
  void UnregisterService();

  // A2dpNativeCallbacks
  void OnConnectionStateChanged(const BtAddress& address, int state) override;
  void OnAudioStateChanged(const BtAddress& address, int state) override;
  void OnCodecConfigChanged(
      const BtAddress& address, const BluetoothCodecConfig& newCodecConfig,
      const std::vector<BluetoothCodecConfig>& codecsLocalCapabilities,
      const std::vector<BluetoothCodecConfig>& codecsSelectableCapabilities)
      override;
  bool IsMandatoryCodecPreferred(const BtAddress& address) override;

 private:
  BluetoothDevice GetDevice(const BtAddress& address);
  static BtAddress GetByteAddress(const BluetoothDevice* device);
  std::shared_ptr<A2dpServiceInterface> GetService();
  void SendMessageToService(const A2dpStackEvent& event);

  A2dpNativeStack* mNativeStack;
  BluetoothAdapter* mAdapter;

  std::shared_timed_mutex mServiceMutex;
  std::shared_ptr<A2dpServiceInterface> mService;

  DISALLOW_COPY_AND_ASSIGN(A2dpNativeInterface);
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_A2DP_NATIVE_INTERFACE_H
