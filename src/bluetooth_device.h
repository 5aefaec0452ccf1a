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

#ifndef A2DP_BRIDGE_BLUETOOTH_DEVICE_H
#define A2DP_BRIDGE_BLUETOOTH_DEVICE_H

#include <string>

#include "bt_address.h"

namespace a2dp_bridge {

/** Handle for a remote device, identified by its textual address. */
class BluetoothDevice {
 public:
  explicit BluetoothDevice(const std::string& address) : mAddress(address) {}
  explicit BluetoothDevice(const BtAddress& address)
      : mAddress(address.ToString()) {}

  const std::string& GetAddress() const { return mAddress; }

  bool operator==(const BluetoothDevice& rhs) const {
    return mAddress == rhs.mAddress;
  }
  bool operator!=(const BluetoothDevice& rhs) const { return !(*this == rhs); }

 private:
  std::string mAddress;
};

/** Resolves raw addresses to device handles.
 *
 * A process may install one default adapter at startup; components that are
 * not handed an adapter explicitly fall back to it.
 */
class BluetoothAdapter {
 public:
  virtual ~BluetoothAdapter() = default;

  virtual BluetoothDevice GetRemoteDevice(const BtAddress& address) = 0;

  // Returns nullptr until SetDefaultAdapter() has been called.
  static BluetoothAdapter* GetDefaultAdapter();
  static void SetDefaultAdapter(BluetoothAdapter* adapter);
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_BLUETOOTH_DEVICE_H
