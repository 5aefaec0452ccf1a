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

#ifndef A2DP_BRIDGE_A2DP_SERVICE_INTERFACE_H
#define A2DP_BRIDGE_A2DP_SERVICE_INTERFACE_H

#include "a2dp_stack_event.h"
#include "bluetooth_device.h"

namespace a2dp_bridge {

/** The A2DP service as seen from the native bridge. The service owns the
 * per-device state machines and routes each stack event to the right one.
 */
class A2dpServiceInterface {
 public:
  static constexpr int OPTIONAL_CODECS_PREF_UNKNOWN = -1;
  static constexpr int OPTIONAL_CODECS_PREF_DISABLED = 0;
  static constexpr int OPTIONAL_CODECS_PREF_ENABLED = 1;

  virtual ~A2dpServiceInterface() = default;

  virtual void MessageFromNative(const A2dpStackEvent& event) = 0;

  // One of the OPTIONAL_CODECS_PREF_* values.
  virtual int GetOptionalCodecsEnabled(const BluetoothDevice& device) = 0;
};

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_A2DP_SERVICE_INTERFACE_H
