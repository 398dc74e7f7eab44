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

#include <iostream>
#include <cinttypes>
#include <cstring>
#include <vector>
#include <thread>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include "ScriptedRadioAdapter.hpp"

#include <central_bt/BTPeripheral.hpp>

using namespace central_bt;

static jau::POctets createValue(const std::vector<uint8_t>& bytes) {
    jau::POctets v(static_cast<jau::nsize_t>(bytes.size()), jau::lb_endian_t::little);
    for(size_t i=0; i<bytes.size(); ++i) {
        v.put_uint8_nc(static_cast<jau::nsize_t>(i), bytes[i]);
    }
    return v;
}

TEST_CASE( "GATT Validation Test 01", "[gatt][validation]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = BTPeripheral::create(adapter, TEST_ADDRESS, createTestConfig());
    ReplyRecorder r;

    // not connected, rejected synchronously without radio I/O
    p->discoverServices(r.callback());
    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r.callback());
    p->write(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER, createValue({1}), true, r.callback());
    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, true, r.callback());
    p->requestMtu(185, r.callback());
    REQUIRE( 5 == r.count() );
    for(size_t i=0; i<5; ++i) {
        REQUIRE( GattError::NOT_CONNECTED == r.get(i).error );
    }
    REQUIRE( 0 == adapter->commandCount() );

    // connected, unknown characteristic
    ReplyRecorder r2;
    p->connect(r2.callback());
    adapter->cb()->onConnectionStateChange(0, BTRadioLinkState::CONNECTED);
    REQUIRE( r2.last().isSuccess() );
    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r2.callback());
    REQUIRE( 2 == r2.count() );
    REQUIRE( GattError::CHAR_NOT_FOUND == r2.last().error );
    REQUIRE( 0 == adapter->countCommands("read") );

    // invalid mtu
    p->requestMtu(22, r2.callback());
    REQUIRE( GattError::INVALID_PARAM == r2.last().error );
    p->requestMtu(518, r2.callback());
    REQUIRE( GattError::INVALID_PARAM == r2.last().error );
    REQUIRE( 0 == adapter->countCommands("mtu") );
}

TEST_CASE( "GATT Discovery Test 02", "[gatt][discovery]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    REQUIRE( 3 == p->listServices().size() );
    REQUIRE( nullptr != p->findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL) );

    // failed discovery clears the catalog
    ReplyRecorder r;
    p->discoverServices(r.callback());
    adapter->cb()->onServicesDiscovered(number(GattStatusCode::GATT_FAILURE), jau::darray<BTGattServiceRef>());
    REQUIRE( 1 == r.count() );
    REQUIRE( GattError::SERVICE_DISCOVERY_FAILED == r.last().error );
    REQUIRE( 0x101 == r.last().status );
    REQUIRE( 0 == p->listServices().size() );

    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r.callback());
    REQUIRE( GattError::CHAR_NOT_FOUND == r.last().error );

    // unsolicited discovery result still updates the catalog
    adapter->cb()->onServicesDiscovered(0, createTestServices());
    REQUIRE( 3 == p->listServices().size() );
    REQUIRE( 2 == r.count() );
}

TEST_CASE( "GATT Read Test 03", "[gatt][read]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    const GattCharKey key(SVC_BATTERY, CHR_BATTERY_LEVEL);
    ReplyRecorder r1, r2;

    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r1.callback());
    REQUIRE( "read" == adapter->lastCommand().name );
    REQUIRE( key == adapter->lastCommand().key );
    REQUIRE( 1 == p->getPendingCount() );

    // same characteristic supersedes
    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r2.callback());
    REQUIRE( 1 == r1.count() );
    REQUIRE( GattError::OVERWRITTEN == r1.last().error );
    REQUIRE( 1 == p->getPendingCount() );

    // other characteristic in parallel
    ReplyRecorder r3;
    p->read(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER, r3.callback());
    REQUIRE( 2 == p->getPendingCount() );

    adapter->cb()->onCharacteristicRead(key, createValue({ 0x5a }), 0);
    REQUIRE( 1 == r2.count() );
    REQUIRE( r2.last().isSuccess() );
    REQUIRE( 1 == r2.last().value.size() );
    REQUIRE( 0x5a == r2.last().value.get_uint8_nc(0) );
    REQUIRE( 1 == r1.count() );
    REQUIRE( 0 == r3.count() );

    // late duplicate completion has no owner
    adapter->cb()->onCharacteristicRead(key, createValue({ 0x5b }), 0);
    REQUIRE( 1 == r2.count() );

    adapter->cb()->onCharacteristicRead(GattCharKey(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER), createValue({ 0 }), number(GattStatusCode::NO_READ_PERM));
    REQUIRE( 1 == r3.count() );
    REQUIRE( GattError::OPERATION_FAILED == r3.last().error );
    REQUIRE( 0x02 == r3.last().status );
    REQUIRE( 0 == p->getPendingCount() );
}

TEST_CASE( "GATT Write Test 04", "[gatt][write]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    const GattCharKey key(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER);
    ReplyRecorder r;

    p->write(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER, createValue({ 1, 2 }), true, r.callback());
    {
        ScriptedRadioAdapter::Command c = adapter->lastCommand();
        REQUIRE( "write" == c.name );
        REQUIRE( GattWriteType::WITH_RESPONSE == c.writeType );
        REQUIRE( 2 == c.value.size() );
        REQUIRE( 2 == c.value.get_uint8_nc(1) );
    }
    adapter->cb()->onCharacteristicWrite(key, number(GattStatusCode::INSUFFICIENT_AUTHENTICATION));
    REQUIRE( 1 == r.count() );
    REQUIRE( GattError::OPERATION_FAILED == r.last().error );
    REQUIRE( 5 == r.last().status );
    // link stays up
    REQUIRE( p->isConnected() );

    p->write(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER, createValue({ 3 }), false, r.callback());
    REQUIRE( GattWriteType::NO_RESPONSE == adapter->lastCommand().writeType );
    adapter->cb()->onCharacteristicWrite(key, 0);
    REQUIRE( 2 == r.count() );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( GattOpKind::WRITE == r.last().kind );

    // command could not be started
    adapter->failCommands = true;
    p->write(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER, createValue({ 4 }), true, r.callback());
    REQUIRE( 3 == r.count() );
    REQUIRE( GattError::START_FAILED == r.last().error );
    REQUIRE( 0 == p->getPendingCount() );
}

TEST_CASE( "GATT Subscribe Test 05", "[gatt][subscribe]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    const GattCharKey level(SVC_BATTERY, CHR_BATTERY_LEVEL);
    const GattCharKey temp(SVC_HEALTH_THERMOMETER, CHR_TEMPERATURE_MEASUREMENT);
    const jau::uuid128_t cccd = GattClientCharConfig::TYPE_UUID128;
    ReplyRecorder r;

    // notify
    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, true, r.callback());
    REQUIRE( p->findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL)->getNotificationEnabled() );
    {
        ScriptedRadioAdapter::Command c = adapter->lastCommand();
        REQUIRE( "descriptor" == c.name );
        REQUIRE( level == c.key );
        REQUIRE( cccd == c.descriptor );
        REQUIRE( GattClientCharConfig::NOTIFICATION == c.argument );
        REQUIRE( 1 == adapter->countCommands("notification") );
    }
    adapter->cb()->onDescriptorWrite(level, cccd, 0);
    REQUIRE( 1 == r.count() );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( GattOpKind::DESC_WRITE == r.last().kind );

    // indicate only
    p->subscribe(SVC_HEALTH_THERMOMETER, CHR_TEMPERATURE_MEASUREMENT, true, r.callback());
    REQUIRE( GattClientCharConfig::INDICATION == adapter->lastCommand().argument );

    // descriptor writes share one slot
    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, false, r.callback());
    REQUIRE( 2 == r.count() );
    REQUIRE( GattError::OVERWRITTEN == r.last().error );
    REQUIRE( GattClientCharConfig::DISABLE == adapter->lastCommand().argument );
    REQUIRE( !p->findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL)->getNotificationEnabled() );
    // the overwritten request restored its local flag
    REQUIRE( !p->findGattChar(SVC_HEALTH_THERMOMETER, CHR_TEMPERATURE_MEASUREMENT)->getNotificationEnabled() );

    // completion for another characteristic than the pending one
    adapter->cb()->onDescriptorWrite(temp, cccd, 0);
    REQUIRE( 3 == r.count() );
    REQUIRE( GattError::UNEXPECTED_DESCRIPTOR == r.last().error );
    REQUIRE( p->findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL)->getNotificationEnabled() );

    // completion failure
    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, true, r.callback());
    adapter->cb()->onDescriptorWrite(level, cccd, number(GattStatusCode::INSUFFICIENT_ENCRYPTION));
    REQUIRE( 4 == r.count() );
    REQUIRE( GattError::OPERATION_FAILED == r.last().error );
    REQUIRE( 0x0f == r.last().status );
    REQUIRE( p->findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL)->getNotificationEnabled() );

    // command not started
    adapter->failCommands = true;
    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, false, r.callback());
    REQUIRE( 5 == r.count() );
    REQUIRE( GattError::START_FAILED == r.last().error );
    REQUIRE( p->findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL)->getNotificationEnabled() );
    adapter->failCommands = false;

    // characteristic without CCCD
    p->subscribe(SVC_DEVICE_INFORMATION, CHR_MANUFACTURER_NAME, true, r.callback());
    REQUIRE( 6 == r.count() );
    REQUIRE( GattError::NO_CLIENT_CONFIG == r.last().error );
    REQUIRE( 0 == p->getPendingCount() );
}

TEST_CASE( "GATT MTU Test 06", "[gatt][mtu]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    ReplyRecorder r;
    REQUIRE( 23 == p->getMtu() );

    p->requestMtu(185, r.callback());
    REQUIRE( 185 == adapter->lastCommand().argument );
    adapter->cb()->onMtuChanged(185, 0);
    REQUIRE( 1 == r.count() );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( 185 == r.last().mtu );
    REQUIRE( 185 == p->getMtu() );

    // failure leaves the cached mtu unchanged and never resolves success
    p->requestMtu(517, r.callback());
    adapter->cb()->onMtuChanged(517, number(GattStatusCode::GATT_ERROR));
    REQUIRE( 2 == r.count() );
    REQUIRE( GattError::OPERATION_FAILED == r.last().error );
    REQUIRE( 185 == p->getMtu() );

    // peer initiated
    adapter->cb()->onMtuChanged(247, 0);
    REQUIRE( 2 == r.count() );
    REQUIRE( 247 == p->getMtu() );

    // only a successful MTU completion updates the cached mtu
    p->disconnect(r.callback());
    REQUIRE( 247 == p->getMtu() );
    p->connect(r.callback());
    adapter->cb()->onConnectionStateChange(0, BTRadioLinkState::CONNECTED);
    REQUIRE( r.last().isSuccess() );
    REQUIRE( 247 == p->getMtu() );
    adapter->cb()->onMtuChanged(100, 0);
    REQUIRE( 100 == p->getMtu() );
}

TEST_CASE( "GATT Operation Timeout Test 07", "[gatt][timeout]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig(0, 0, 100));
    ReplyRecorder r;

    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r.callback());
    REQUIRE( r.waitFor(1) );
    REQUIRE( GattError::TIMEOUT == r.last().error );
    REQUIRE( 0 == p->getPendingCount() );
    REQUIRE( p->isConnected() );

    // late completion has no owner
    adapter->cb()->onCharacteristicRead(GattCharKey(SVC_BATTERY, CHR_BATTERY_LEVEL), createValue({ 1 }), 0);
    REQUIRE( 1 == r.count() );
}

TEST_CASE( "GATT Subscribe Overwrite Test 08", "[gatt][subscribe]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    const GattCharKey level(SVC_BATTERY, CHR_BATTERY_LEVEL);
    const jau::uuid128_t cccd = GattClientCharConfig::TYPE_UUID128;
    BTGattCharRef c = p->findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL);
    ReplyRecorder rEnable, rDisable;

    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, true, rEnable.callback());
    REQUIRE( c->getNotificationEnabled() );
    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, false, rDisable.callback());
    REQUIRE( 1 == rEnable.count() );
    REQUIRE( GattError::OVERWRITTEN == rEnable.last().error );
    REQUIRE( 0 == rDisable.count() );
    REQUIRE( !c->getNotificationEnabled() );
    REQUIRE( 2 == adapter->countCommands("descriptor") );
    REQUIRE( 1 == p->getPendingCount() );

    adapter->cb()->onDescriptorWrite(level, cccd, 0);
    REQUIRE( 1 == rDisable.count() );
    REQUIRE( rDisable.last().isSuccess() );
    REQUIRE( 1 == rEnable.count() );
    REQUIRE( !c->getNotificationEnabled() );
    REQUIRE( 0 == p->getPendingCount() );
}

TEST_CASE( "GATT Concurrent Requests Test 09", "[gatt][concurrency]" ) {
    ScriptedRadioAdapterRef adapter = std::make_shared<ScriptedRadioAdapter>();
    BTPeripheralRef p = createConnected(adapter, createTestConfig());
    const GattCharKey level(SVC_BATTERY, CHR_BATTERY_LEVEL);
    BTRadioCallbackRef cb = adapter->cb();
    const size_t count = 200;
    jau::sc_atomic_bool done(false);
    ReplyRecorder r, rDisc;

    std::thread issuer([&p, &r, &done, count]() {
        for(size_t i=0; i<count; ++i) {
            p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r.callback());
        }
        done = true;
    });
    std::thread completer([&p, &cb, &level, &done]() {
        const jau::POctets value = createValue({ 42 });
        while( !done ) {
            if( 0 < p->getPendingCount() ) {
                cb->onCharacteristicRead(level, value, 0);
            }
        }
    });
    issuer.join();
    completer.join();

    p->disconnect(rDisc.callback());
    // each request resolved exactly once: completed, overwritten or torn down
    REQUIRE( count == r.count() );
    REQUIRE( 0 == p->getPendingCount() );
    for(size_t i=0; i<count; ++i) {
        const GattReply reply = r.get(i);
        REQUIRE( ( reply.isSuccess() || GattError::OVERWRITTEN == reply.error || GattError::DISCONNECTED == reply.error ) );
    }
}
