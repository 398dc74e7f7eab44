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
#include <unordered_set>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <central_bt/BTStatusCodes.hpp>
#include <central_bt/BTTypes0.hpp>
#include <central_bt/GattReply.hpp>

using namespace central_bt;

TEST_CASE( "ConnStatusCategory Test 01", "[status][category]" ) {
    REQUIRE( ConnStatusCategory::NORMAL == to_ConnStatusCategory(0x00) );
    REQUIRE( ConnStatusCategory::NORMAL == to_ConnStatusCategory(BTConnStatusCode::CONNECTION_TERMINATED_BY_LOCAL_HOST) );
    REQUIRE( ConnStatusCategory::OUT_OF_RANGE == to_ConnStatusCategory(0x04) );
    REQUIRE( ConnStatusCategory::LINK_LOSS == to_ConnStatusCategory(0x08) );
    REQUIRE( ConnStatusCategory::TERMINATED_BY_PEER == to_ConnStatusCategory(0x13) );
    REQUIRE( ConnStatusCategory::TERMINATED_BY_PEER == to_ConnStatusCategory(0x14) );
    REQUIRE( ConnStatusCategory::TERMINATED_BY_PEER == to_ConnStatusCategory(0x15) );
    REQUIRE( ConnStatusCategory::TIMEOUT == to_ConnStatusCategory(0x22) );
    REQUIRE( ConnStatusCategory::TIMEOUT == to_ConnStatusCategory(0x3e) );
    REQUIRE( ConnStatusCategory::TIMEOUT == to_ConnStatusCategory(BTConnStatusCode::GATT_CONNECTION_TIMEOUT) );
    REQUIRE( ConnStatusCategory::RESOURCE_EXHAUSTED == to_ConnStatusCategory(0x07) );
    REQUIRE( ConnStatusCategory::RESOURCE_EXHAUSTED == to_ConnStatusCategory(0x09) );
    REQUIRE( ConnStatusCategory::RESOURCE_EXHAUSTED == to_ConnStatusCategory(0x0d) );
    REQUIRE( ConnStatusCategory::RESOURCE_EXHAUSTED == to_ConnStatusCategory(0x101) );
    REQUIRE( ConnStatusCategory::DEVICE_UNAVAILABLE == to_ConnStatusCategory(0x85) );
    REQUIRE( ConnStatusCategory::UNKNOWN == to_ConnStatusCategory(0x3d) );
    REQUIRE( ConnStatusCategory::UNKNOWN == to_ConnStatusCategory(0x1234) );

    REQUIRE( "Link loss, supervision timeout" == getDescription(ConnStatusCategory::LINK_LOSS) );
    REQUIRE( "Unknown connection status" == getDescription(ConnStatusCategory::UNKNOWN) );
}

TEST_CASE( "Status Names Test 02", "[status][datatype]" ) {
    REQUIRE( "CONNECTION_TIMEOUT" == to_string(BTConnStatusCode::CONNECTION_TIMEOUT) );
    REQUIRE( "GATT_CONNECTION_TIMEOUT" == to_string(to_BTConnStatusCode(0x93)) );
    REQUIRE( "INSUFFICIENT_AUTHENTICATION" == to_string(GattStatusCode::INSUFFICIENT_AUTHENTICATION) );
    REQUIRE( "OVERWRITTEN" == to_string(GattError::OVERWRITTEN) );
    REQUIRE( "CLEANING_UP" == to_string(ConnectionState::CLEANING_UP) );
    REQUIRE( "DESC_WRITE" == to_string(GattOpKind::DESC_WRITE) );
    REQUIRE( "TERMINATED_BY_PEER" == to_string(ConnStatusCategory::TERMINATED_BY_PEER) );
}

TEST_CASE( "GattReply Test 03", "[reply][datatype]" ) {
    {
        const GattReply r = GattReply::success(GattOpKind::READ);
        REQUIRE( r.isSuccess() );
        REQUIRE( GattError::NONE == r.error );
        REQUIRE( 0 == r.value.size() );
    }
    {
        const GattReply r = GattReply::connFailure(GattOpKind::CONNECT, GattError::CONNECTION_FAILED, 0x08, "Connection failed");
        REQUIRE( !r.isSuccess() );
        REQUIRE( 0x08 == r.status );
        REQUIRE( ConnStatusCategory::LINK_LOSS == r.category );
        REQUIRE( std::string::npos != r.message.find("Link loss") );
    }
    {
        const GattReply r = GattReply::opFailure(GattOpKind::WRITE, GattError::OPERATION_FAILED, 0x05, "Write failed");
        REQUIRE( GattError::OPERATION_FAILED == r.error );
        REQUIRE( 0x05 == r.status );
        REQUIRE( std::string::npos != r.message.find("INSUFFICIENT_AUTHENTICATION") );
    }
}

TEST_CASE( "GattOpKey Test 04", "[registry][datatype]" ) {
    const GattCharKey k1(jau::uuid16_t(0x180F), jau::uuid16_t(0x2A19));
    const GattCharKey k2(jau::uuid16_t(0x180A), jau::uuid16_t(0x2A19));
    REQUIRE( k1 != k2 );
    REQUIRE( k1 == GattCharKey(jau::uuid16_t(0x180F).toUUID128(), jau::uuid16_t(0x2A19).toUUID128()) );

    // reads and writes are tracked per characteristic
    REQUIRE( GattOpKey(GattOpKind::READ, k1) != GattOpKey(GattOpKind::READ, k2) );
    REQUIRE( GattOpKey(GattOpKind::READ, k1) == GattOpKey(GattOpKind::READ, k1) );
    REQUIRE( GattOpKey(GattOpKind::READ, k1) != GattOpKey(GattOpKind::WRITE, k1) );

    // descriptor writes, discovery and mtu share one session slot
    REQUIRE( GattOpKey(GattOpKind::DESC_WRITE, k1) == GattOpKey(GattOpKind::DESC_WRITE, k2) );
    REQUIRE( GattOpKey(GattOpKind::DESC_WRITE, k1) == GattOpKey(GattOpKind::DESC_WRITE) );
    REQUIRE( GattOpKey(GattOpKind::MTU) != GattOpKey(GattOpKind::DISCOVER_SERVICES) );

    std::unordered_set<GattOpKey> set;
    set.insert( GattOpKey(GattOpKind::READ, k1) );
    set.insert( GattOpKey(GattOpKind::READ, k2) );
    set.insert( GattOpKey(GattOpKind::DESC_WRITE, k1) );
    set.insert( GattOpKey(GattOpKind::DESC_WRITE, k2) );
    REQUIRE( 3 == set.size() );
}

TEST_CASE( "BDAddressAndType Test 05", "[datatype][address]" ) {
    const BDAddressAndType a1(jau::EUI48("C0:26:DA:01:DA:B1"), BDAddressType::BDADDR_LE_PUBLIC);
    const BDAddressAndType a2(jau::EUI48("C0:26:DA:01:DA:B1"), BDAddressType::BDADDR_LE_RANDOM);
    const BDAddressAndType a0;
    REQUIRE( a1.isDefined() );
    REQUIRE( !a0.isDefined() );
    REQUIRE( a1 != a2 );
    REQUIRE( a1 == BDAddressAndType(jau::EUI48("C0:26:DA:01:DA:B1"), BDAddressType::BDADDR_LE_PUBLIC) );
    REQUIRE( a0 != a1 );
    REQUIRE( std::string::npos != a2.toString().find("BDADDR_LE_RANDOM") );
}
