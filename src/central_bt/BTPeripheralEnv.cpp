/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>
#include <cstdint>

#include <jau/debug.hpp>

#include "GattNumbers.hpp"
#include "BTPeripheralEnv.hpp"

using namespace central_bt;
using namespace jau::fractions_i64_literals;

BTPeripheralEnv::BTPeripheralEnv() noexcept
: DEBUG_GLOBAL( jau::environment::get("central_bt").debug ),
  exploding( jau::environment::getExplodingProperties("central_bt.peripheral") ),
  CLEANUP_GRACE( jau::environment::getFractionProperty("central_bt.peripheral.cleanup.grace", 200_ms, 10_ms /* min */, 5_s /* max */) ),
  CONNECT_TIMEOUT( jau::environment::getFractionProperty("central_bt.peripheral.connect.timeout", 30_s, 1_s /* min */, 365_d /* max */) ),
  GATT_OP_TIMEOUT( jau::environment::getFractionProperty("central_bt.gatt.op.timeout", 10_s, 0_s /* min */, 365_d /* max */) ),
  WATCHDOG_PERIOD( jau::environment::getFractionProperty("central_bt.peripheral.watchdog.period", 50_ms, 10_ms /* min */, 1_s /* max */) ),
  DEFAULT_MTU( jau::environment::getInt32Property("central_bt.gatt.mtu.default", number(GattMtu::MAX_ATT_MTU),
                                                  number(GattMtu::MIN_ATT_MTU) /* min */, number(GattMtu::MAX_ATT_MTU) /* max */) ),
  SIM_RING_CAPACITY( jau::environment::getInt32Property("central_bt.sim.ringsize", 128, 64 /* min */, 1024 /* max */) ),
  DEBUG_DATA( jau::environment::getBooleanProperty("central_bt.debug.gatt.data", false) )
{
}
