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

#define LOG_TAG "A2dpBtAddress"

#include "bt_address.h"
#include "utils/Log.h"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace a2dp_bridge {

const BtAddress BtAddress::kEmpty;

BtAddress::BtAddress(const uint8_t* address) {
  memcpy(mAddress.data(), address, kLength);
}

bool BtAddress::IsValidAddress(const std::string& address) {
  // "XX:" per octet, without the final separator.
  if (address.size() != kLength * 3 - 1) return false;

  for (size_t i = 0; i < address.size(); i++) {
    char c = address[i];
    if (i % 3 == 2) {
      if (c != ':') return false;
    } else if (!isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

bool BtAddress::FromString(const std::string& from, BtAddress& to) {
  if (!IsValidAddress(from)) return false;

  std::array<uint8_t, kLength> octets;
  for (size_t i = 0; i < kLength; i++) {
    octets[i] =
        static_cast<uint8_t>(strtoul(from.substr(i * 3, 2).c_str(), nullptr, 16));
  }
  to.mAddress = octets;
  return true;
}

std::string BtAddress::ToString() const {
  char buf[kLength * 3];
  snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X", mAddress[0],
           mAddress[1], mAddress[2], mAddress[3], mAddress[4], mAddress[5]);
  return std::string(buf);
}

BtAddress GetBytesFromAddress(const std::string& address) {
  BtAddress bd_addr;
  if (!BtAddress::FromString(address, bd_addr)) {
    ALOGE("%s: malformed address '%s'", __func__, address.c_str());
    return BtAddress::kEmpty;
  }
  return bd_addr;
}

}  // namespace a2dp_bridge
