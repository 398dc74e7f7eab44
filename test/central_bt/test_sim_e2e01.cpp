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

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include "ScriptedRadioAdapter.hpp"

#include <central_bt/BTPeripheral.hpp>
#include <central_bt/SimRadioAdapter.hpp>

using namespace central_bt;

static jau::POctets createValue(const uint8_t v) {
    jau::POctets p(1, jau::lb_endian_t::little);
    p.put_uint8_nc(0, v);
    return p;
}

/** Battery level with notify and CCCD, writable model number. */
static SimGattDatabaseRef createSimDatabase() {
    SimGattDatabase::service_list_t services;
    {
        jau::darray<SimGattDescRef> descs;
        descs.push_back( SimGattDesc::createClientCharConfig() );
        jau::darray<SimGattCharRef> chars;
        chars.push_back( std::make_shared<SimGattChar>(CHR_BATTERY_LEVEL,
                            BTGattChar::PropertyBitVal::Read | BTGattChar::PropertyBitVal::Notify,
                            std::move(descs), createValue(100)) );
        services.push_back( std::make_shared<SimGattService>(true, SVC_BATTERY, std::move(chars)) );
    }
    {
        jau::darray<SimGattCharRef> chars;
        chars.push_back( std::make_shared<SimGattChar>(CHR_MODEL_NUMBER,
                            BTGattChar::PropertyBitVal::Read | BTGattChar::PropertyBitVal::WriteWithAck,
                            jau::darray<SimGattDescRef>(), createValue(1)) );
        chars.push_back( std::make_shared<SimGattChar>(CHR_MANUFACTURER_NAME,
                            BTGattChar::PropertyBitVal::Read,
                            jau::darray<SimGattDescRef>(), createValue(2)) );
        services.push_back( std::make_shared<SimGattService>(true, SVC_DEVICE_INFORMATION, std::move(chars)) );
    }
    return std::make_shared<SimGattDatabase>(std::move(services));
}

static BTPeripheral::Config createSimConfig() {
    BTPeripheral::Config config = createTestConfig(0, 2000, 2000);
    return config;
}

TEST_CASE( "Simulated Session Test 01", "[sim][session]" ) {
    SimGattDatabaseRef db = createSimDatabase();
    INFO_STR( db->toFullString() );
    SimRadioAdapterRef adapter = SimRadioAdapter::create(TEST_ADDRESS, db);
    REQUIRE( adapter->isRunning() );

    BTPeripheralRef p = BTPeripheral::create(adapter, TEST_ADDRESS, createSimConfig());
    std::shared_ptr<StatusRecorder> status = std::make_shared<StatusRecorder>();
    std::shared_ptr<NotificationRecorder> notes = std::make_shared<NotificationRecorder>();
    p->setStatusListener(status);
    p->setNotificationListener(notes);

    ReplyRecorder r;
    p->connect(r.callback());
    REQUIRE( r.waitFor(1) );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( p->isConnected() );
    REQUIRE( adapter->isLinkUp() );
    REQUIRE( 1 == status->getConnectedCount() );

    p->discoverServices(r.callback());
    REQUIRE( r.waitFor(2) );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( 2 == p->listServices().size() );
    REQUIRE( nullptr != p->findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL) );

    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r.callback());
    REQUIRE( r.waitFor(3) );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( 1 == r.last().value.size() );
    REQUIRE( 100 == r.last().value.get_uint8_nc(0) );

    p->write(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER, createValue(7), true, r.callback());
    REQUIRE( r.waitFor(4) );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( 7 == adapter->getValue(GattCharKey(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER)).get_uint8_nc(0) );

    // no write permission
    p->write(SVC_DEVICE_INFORMATION, CHR_MANUFACTURER_NAME, createValue(9), true, r.callback());
    REQUIRE( r.waitFor(5) );
    REQUIRE( GattError::OPERATION_FAILED == r.last().error );
    REQUIRE( number(GattStatusCode::NO_WRITE_PERM) == r.last().status );

    // notification before subscription is not sent by the peer
    const GattCharKey level(SVC_BATTERY, CHR_BATTERY_LEVEL);
    REQUIRE( false == adapter->notify(level, createValue(99)) );

    p->subscribe(SVC_BATTERY, CHR_BATTERY_LEVEL, true, r.callback());
    REQUIRE( r.waitFor(6) );
    REQUIRE( r.last().isSuccess() );

    REQUIRE( true == adapter->notify(level, createValue(98)) );
    REQUIRE( notes->waitFor(1) );
    REQUIRE( 0 == notes->last().data.find("Yg") );

    p->requestMtu(247, r.callback());
    REQUIRE( r.waitFor(7) );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( 247 == p->getMtu() );

    p->disconnect(r.callback());
    REQUIRE( r.waitFor(8) );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( !p->isConnected() );
    REQUIRE( 1 == status->getDisconnectedCount() );
    REQUIRE( !adapter->isLinkUp() );

    p->close();
    adapter->close();
    REQUIRE( !adapter->isRunning() );
}

TEST_CASE( "Simulated Link Loss Test 02", "[sim][linkloss]" ) {
    SimRadioAdapterRef adapter = SimRadioAdapter::create(TEST_ADDRESS, createSimDatabase());
    BTPeripheralRef p = BTPeripheral::create(adapter, TEST_ADDRESS, createSimConfig());
    std::shared_ptr<StatusRecorder> status = std::make_shared<StatusRecorder>();
    p->setStatusListener(status);

    ReplyRecorder r;
    p->connect(r.callback());
    REQUIRE( r.waitFor(1) );
    p->discoverServices(r.callback());
    REQUIRE( r.waitFor(2) );
    REQUIRE( r.last().isSuccess() );

    // held read, failed by the link loss
    adapter->setHoldResponses(true);
    ReplyRecorder rr;
    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, rr.callback());
    REQUIRE( adapter->linkLoss(number(BTConnStatusCode::CONNECTION_TIMEOUT)) );
    REQUIRE( rr.waitFor(1) );
    REQUIRE( GattError::DISCONNECTED == rr.last().error );
    REQUIRE( ConnStatusCategory::LINK_LOSS == rr.last().category );
    REQUIRE( waitForState(p, ConnectionState::DISCONNECTED, 2000) );
    REQUIRE( 0 == p->listServices().size() );

    // held completion of the dropped link is never delivered
    adapter->releaseHeld();
    jau::sleep_for( 50_ms );
    REQUIRE( 1 == rr.count() );

    // reconnect
    adapter->setHoldResponses(false);
    p->connect(r.callback());
    REQUIRE( r.waitFor(3) );
    REQUIRE( r.last().isSuccess() );
    REQUIRE( 2 == adapter->getConnectCount() );
    REQUIRE( 2 == status->getConnectedCount() );
}

TEST_CASE( "Simulated Fault Injection Test 03", "[sim][fault]" ) {
    SimRadioAdapterRef adapter = SimRadioAdapter::create(TEST_ADDRESS, createSimDatabase());
    BTPeripheralRef p = BTPeripheral::create(adapter, TEST_ADDRESS, createSimConfig());
    ReplyRecorder r;

    // connection refused
    adapter->setConnectStatus(number(BTConnStatusCode::CONNECTION_EST_FAILED_OR_SYNC_TIMEOUT));
    p->connect(r.callback());
    REQUIRE( r.waitFor(1) );
    REQUIRE( GattError::CONNECTION_FAILED == r.last().error );
    REQUIRE( 0x3e == r.last().status );
    REQUIRE( ConnStatusCategory::TIMEOUT == r.last().category );
    REQUIRE( waitForState(p, ConnectionState::DISCONNECTED, 2000) );

    adapter->setConnectStatus(0);
    p->connect(r.callback());
    REQUIRE( r.waitFor(2) );
    REQUIRE( r.last().isSuccess() );
    p->discoverServices(r.callback());
    REQUIRE( r.waitFor(3) );

    // held response overwritten by a newer read of the same characteristic
    adapter->setHoldResponses(true);
    ReplyRecorder r1, r2;
    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r1.callback());
    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r2.callback());
    REQUIRE( 1 == r1.count() );
    REQUIRE( GattError::OVERWRITTEN == r1.last().error );
    REQUIRE( 2 == adapter->releaseHeld() );
    REQUIRE( r2.waitFor(1) );
    REQUIRE( r2.last().isSuccess() );
    jau::sleep_for( 50_ms );
    REQUIRE( 1 == r1.count() );
    REQUIRE( 1 == r2.count() );
    adapter->setHoldResponses(false);

    // one-shot completion status
    adapter->setNextStatus(GattOpKind::READ, number(GattStatusCode::INSUFFICIENT_AUTHENTICATION));
    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r.callback());
    REQUIRE( r.waitFor(4) );
    REQUIRE( GattError::OPERATION_FAILED == r.last().error );
    REQUIRE( 5 == r.last().status );
    p->read(SVC_BATTERY, CHR_BATTERY_LEVEL, r.callback());
    REQUIRE( r.waitFor(5) );
    REQUIRE( r.last().isSuccess() );

    // start failure
    adapter->setStartFailure(GattOpKind::MTU, true);
    p->requestMtu(100, r.callback());
    REQUIRE( 6 == r.count() );
    REQUIRE( GattError::START_FAILED == r.last().error );

    // closing the session drops the link
    p->close();
    REQUIRE( !adapter->isLinkUp() );
}
