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

#ifndef A2DP_BRIDGE_BT_ADDRESS_H
#define A2DP_BRIDGE_BT_ADDRESS_H

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <string>

namespace a2dp_bridge {

/** A Bluetooth device address as the native stack sees it: six raw octets,
 * most significant first. The all-zero address stands for "no device".
 */
class BtAddress {
 public:
  static constexpr size_t kLength = 6;
  static const BtAddress kEmpty;

  BtAddress() : mAddress{} {}
  explicit BtAddress(const std::array<uint8_t, kLength>& address)
      : mAddress(address) {}
  // Copies kLength octets from |address|.
  explicit BtAddress(const uint8_t* address);

  // Parses "XX:XX:XX:XX:XX:XX" (hex digits of either case). Returns false and
  // leaves |to| untouched when |from| is malformed.
  static bool FromString(const std::string& from, BtAddress& to);
  static bool IsValidAddress(const std::string& address);

  // Upper case, colon separated.
  std::string ToString() const;

  bool IsEmpty() const { return *this == kEmpty; }

  const uint8_t* data() const { return mAddress.data(); }
  const std::array<uint8_t, kLength>& octets() const { return mAddress; }

  bool operator==(const BtAddress& rhs) const {
    return mAddress == rhs.mAddress;
  }
  bool operator!=(const BtAddress& rhs) const { return !(*this == rhs); }
  bool operator<(const BtAddress& rhs) const {
    return mAddress < rhs.mAddress;
  }

 private:
  std::array<uint8_t, kLength> mAddress;
};

// Returns the octets of a textual address. Malformed text yields the empty
// address.
BtAddress GetBytesFromAddress(const std::string& address);

}  // namespace a2dp_bridge

#endif  // A2DP_BRIDGE_BT_ADDRESS_H
