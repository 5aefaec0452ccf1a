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

#include "a2dp_stack_event.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace a2dp_bridge {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

const BluetoothDevice kTestDevice("00:01:02:03:04:05");

TEST(A2dpStackEventTest, ConnectionStateEvent) {
  A2dpStackEvent event = A2dpStackEvent::ConnectionStateChanged(
      kTestDevice, A2dpStackEvent::CONNECTION_STATE_DISCONNECTING);

  EXPECT_EQ(A2dpStackEvent::EVENT_TYPE_CONNECTION_STATE_CHANGED,
            event.GetType());
  EXPECT_EQ(kTestDevice, event.GetDevice());
  EXPECT_EQ(A2dpStackEvent::CONNECTION_STATE_DISCONNECTING,
            event.GetValueInt());
  EXPECT_FALSE(event.GetCodecStatus().has_value());
  EXPECT_EQ(
      "A2dpStackEvent {type:EVENT_TYPE_CONNECTION_STATE_CHANGED, "
      "device:00:01:02:03:04:05, value1:DISCONNECTING}",
      event.ToString());
}

TEST(A2dpStackEventTest, AudioStateEvent) {
  A2dpStackEvent event = A2dpStackEvent::AudioStateChanged(
      kTestDevice, A2dpStackEvent::AUDIO_STATE_REMOTE_SUSPEND);

  EXPECT_EQ(A2dpStackEvent::EVENT_TYPE_AUDIO_STATE_CHANGED, event.GetType());
  EXPECT_EQ(A2dpStackEvent::AUDIO_STATE_REMOTE_SUSPEND, event.GetValueInt());
  EXPECT_EQ(
      "A2dpStackEvent {type:EVENT_TYPE_AUDIO_STATE_CHANGED, "
      "device:00:01:02:03:04:05, value1:REMOTE_SUSPEND}",
      event.ToString());
}

TEST(A2dpStackEventTest, UnknownStatesArePrintedRaw) {
  EXPECT_THAT(A2dpStackEvent::ConnectionStateChanged(kTestDevice, 9).ToString(),
              HasSubstr("value1:UNKNOWN(9)"));
  EXPECT_THAT(A2dpStackEvent::AudioStateChanged(kTestDevice, -2).ToString(),
              HasSubstr("value1:UNKNOWN(-2)"));
  EXPECT_EQ("EVENT_TYPE_UNKNOWN:12", A2dpStackEvent::EventTypeToString(12));
}

TEST(A2dpStackEventTest, CodecConfigEventCarriesStatus) {
  BluetoothCodecConfig sbc(BluetoothCodecConfig::SOURCE_CODEC_TYPE_SBC);
  BluetoothCodecStatus status(sbc, {sbc}, {sbc});

  A2dpStackEvent event =
      A2dpStackEvent::CodecConfigChanged(kTestDevice, status);

  EXPECT_EQ(A2dpStackEvent::EVENT_TYPE_CODEC_CONFIG_CHANGED, event.GetType());
  EXPECT_EQ(0, event.GetValueInt());
  ASSERT_TRUE(event.GetCodecStatus().has_value());
  EXPECT_EQ(status, *event.GetCodecStatus());
  EXPECT_THAT(event.ToString(), HasSubstr("codecStatus:{mCodecConfig:"));
  EXPECT_THAT(event.ToString(), Not(HasSubstr("value2")));
}

TEST(A2dpStackEventTest, CopiesAreIndependent) {
  A2dpStackEvent first = A2dpStackEvent::ConnectionStateChanged(
      kTestDevice, A2dpStackEvent::CONNECTION_STATE_CONNECTED);
  A2dpStackEvent second = first;
  second = A2dpStackEvent::AudioStateChanged(
      BluetoothDevice("AA:AA:AA:AA:AA:AA"), A2dpStackEvent::AUDIO_STATE_STOPPED);

  EXPECT_EQ(A2dpStackEvent::EVENT_TYPE_CONNECTION_STATE_CHANGED,
            first.GetType());
  EXPECT_EQ(kTestDevice, first.GetDevice());
  EXPECT_EQ(A2dpStackEvent::CONNECTION_STATE_CONNECTED, first.GetValueInt());
}

}  // namespace
}  // namespace a2dp_bridge
