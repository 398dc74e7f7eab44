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

#include <central_bt/GattOpRegistry.hpp>

using namespace central_bt;

static GattPendingRequestRef createRequest(const GattOpKey& key, ReplyRecorder& r) {
    return std::make_shared<GattPendingRequest>(key, nullptr, 0, r.callback());
}

TEST_CASE( "GattOpRegistry Overwrite Test 01", "[registry]" ) {
    GattOpRegistry registry;
    const GattCharKey k1(SVC_BATTERY, CHR_BATTERY_LEVEL);
    const GattCharKey k2(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER);
    ReplyRecorder r1, r2, r3;

    registry.put( createRequest(GattOpKey(GattOpKind::READ, k1), r1) );
    registry.put( createRequest(GattOpKey(GattOpKind::READ, k2), r2) );
    REQUIRE( 2 == registry.size() );
    REQUIRE( 0 == r1.count() );

    // same key supersedes, the prior request fails with OVERWRITTEN
    registry.put( createRequest(GattOpKey(GattOpKind::READ, k1), r3) );
    REQUIRE( 2 == registry.size() );
    REQUIRE( 1 == r1.count() );
    REQUIRE( GattError::OVERWRITTEN == r1.last().error );
    REQUIRE( GattOpKind::READ == r1.last().kind );
    REQUIRE( std::string::npos != r1.last().message.find("overwritten") );
    REQUIRE( 0 == r2.count() );
    REQUIRE( 0 == r3.count() );

    GattPendingRequestRef req = registry.take( GattOpKey(GattOpKind::READ, k1) );
    REQUIRE( nullptr != req );
    REQUIRE( req->resolve( GattReply::success(GattOpKind::READ) ) );
    REQUIRE( 1 == r3.count() );
    REQUIRE( r3.last().isSuccess() );

    // exactly once
    REQUIRE( !req->resolve( GattReply::failure(GattOpKind::READ, GattError::TIMEOUT, "late") ) );
    REQUIRE( 1 == r3.count() );

    REQUIRE( nullptr == registry.take( GattOpKey(GattOpKind::READ, k1) ) );
    REQUIRE( 1 == registry.size() );
}

TEST_CASE( "GattOpRegistry Global Slot Test 02", "[registry]" ) {
    GattOpRegistry registry;
    const GattCharKey k1(SVC_BATTERY, CHR_BATTERY_LEVEL);
    const GattCharKey k2(SVC_HEALTH_THERMOMETER, CHR_TEMPERATURE_MEASUREMENT);
    ReplyRecorder r1, r2;

    // descriptor writes of different characteristics share one slot
    registry.put( createRequest(GattOpKey(GattOpKind::DESC_WRITE, k1), r1) );
    registry.put( createRequest(GattOpKey(GattOpKind::DESC_WRITE, k2), r2) );
    REQUIRE( 1 == registry.size() );
    REQUIRE( 1 == r1.count() );
    REQUIRE( GattError::OVERWRITTEN == r1.last().error );

    GattPendingRequestRef req = registry.get( GattOpKey(GattOpKind::DESC_WRITE) );
    REQUIRE( nullptr != req );
    REQUIRE( req->key.target == k2 );
}

TEST_CASE( "GattOpRegistry RemoveIfSame Test 03", "[registry]" ) {
    GattOpRegistry registry;
    ReplyRecorder r1, r2;
    GattPendingRequestRef a = createRequest(GattOpKey(GattOpKind::MTU), r1);
    GattPendingRequestRef b = createRequest(GattOpKey(GattOpKind::MTU), r2);
    registry.put(a);
    registry.put(b);
    REQUIRE( !registry.removeIfSame(a) );
    REQUIRE( registry.contains( GattOpKey(GattOpKind::MTU) ) );
    REQUIRE( registry.removeIfSame(b) );
    REQUIRE( 0 == registry.size() );
    REQUIRE( 0 == r2.count() );
}

TEST_CASE( "GattOpRegistry TakeAll and Expired Test 04", "[registry][timeout]" ) {
    GattOpRegistry registry;
    const GattCharKey k1(SVC_BATTERY, CHR_BATTERY_LEVEL);
    ReplyRecorder r;
    registry.put( createRequest(GattOpKey(GattOpKind::CONNECT), r) );
    registry.put( createRequest(GattOpKey(GattOpKind::READ, k1), r) );
    registry.put( createRequest(GattOpKey(GattOpKind::WRITE, k1), r) );
    REQUIRE( 3 == registry.size() );

    const uint64_t now = jau::getCurrentMilliseconds();
    {
        // nothing expired yet
        GattOpRegistry::request_list_t expired = registry.takeExpired(now, 1000, 1000);
        REQUIRE( 0 == expired.size() );
    }
    {
        // zero disables the timeout of its kind
        GattOpRegistry::request_list_t expired = registry.takeExpired(now+5000, 0, 1000);
        REQUIRE( 2 == expired.size() );
        REQUIRE( 1 == registry.size() );
        REQUIRE( registry.contains( GattOpKey(GattOpKind::CONNECT) ) );
    }
    {
        GattOpRegistry::request_list_t all = registry.takeAll();
        REQUIRE( 1 == all.size() );
        REQUIRE( GattOpKind::CONNECT == all[0]->getKind() );
        REQUIRE( 0 == registry.size() );
    }
    // taking never resolves
    REQUIRE( 0 == r.count() );
}
