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

#include <central_bt/GattServiceCatalog.hpp>

using namespace central_bt;

TEST_CASE( "GattServiceCatalog Test 01", "[catalog]" ) {
    GattServiceCatalog catalog;
    REQUIRE( catalog.isEmpty() );
    REQUIRE( 0 == catalog.getCharCount() );
    REQUIRE( nullptr == catalog.findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL) );

    catalog.replace( createTestServices() );
    INFO_STR( catalog.toString() );
    REQUIRE( !catalog.isEmpty() );
    REQUIRE( 3 == catalog.getServices().size() );
    REQUIRE( 4 == catalog.getCharCount() );

    BTGattCharRef level = catalog.findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL);
    REQUIRE( nullptr != level );
    REQUIRE( level->hasProperties(BTGattChar::PropertyBitVal::Notify) );
    REQUIRE( !level->hasProperties(BTGattChar::PropertyBitVal::Indicate) );
    REQUIRE( nullptr != level->getClientCharConfig() );

    // lookup by uuid128 form
    REQUIRE( level == catalog.findGattChar( GattCharKey(SVC_BATTERY.toUUID128(), CHR_BATTERY_LEVEL.toUUID128()) ) );

    // characteristic type is unique within its service only
    REQUIRE( nullptr == catalog.findGattChar(SVC_DEVICE_INFORMATION, CHR_BATTERY_LEVEL) );

    BTGattCharRef temp = catalog.findGattChar(SVC_HEALTH_THERMOMETER, CHR_TEMPERATURE_MEASUREMENT);
    REQUIRE( nullptr != temp );
    REQUIRE( nullptr != temp->getClientCharConfig() );
    REQUIRE( temp->getClientCharConfig()->isClientCharConfig() );
    REQUIRE( nullptr != temp->findGattDesc(DESC_USER_DESCRIPTION) );

    BTGattCharRef manufacturer = catalog.findGattChar(SVC_DEVICE_INFORMATION, CHR_MANUFACTURER_NAME);
    REQUIRE( nullptr != manufacturer );
    REQUIRE( nullptr == manufacturer->getClientCharConfig() );

    catalog.clear();
    REQUIRE( catalog.isEmpty() );
    REQUIRE( nullptr == catalog.findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL) );
}

TEST_CASE( "GattServiceCatalog Replace Test 02", "[catalog]" ) {
    GattServiceCatalog catalog;
    catalog.replace( createTestServices() );
    GattServiceCatalog::service_list_t before = catalog.getServices();
    BTGattCharRef level0 = catalog.findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL);

    // wholesale replacement, no merge with the prior topology
    jau::darray<BTGattServiceRef> services;
    {
        jau::darray<BTGattCharRef> chars;
        chars.push_back( std::make_shared<BTGattChar>(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER,
                            BTGattChar::PropertyBitVal::Read, jau::darray<BTGattDescRef>()) );
        // duplicate keeps the first
        chars.push_back( std::make_shared<BTGattChar>(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER,
                            BTGattChar::PropertyBitVal::WriteNoAck, jau::darray<BTGattDescRef>()) );
        services.push_back( std::make_shared<BTGattService>(true, SVC_DEVICE_INFORMATION, std::move(chars)) );
    }
    catalog.replace( services );
    REQUIRE( 1 == catalog.getServices().size() );
    REQUIRE( 1 == catalog.getCharCount() );
    REQUIRE( nullptr == catalog.findGattChar(SVC_BATTERY, CHR_BATTERY_LEVEL) );
    BTGattCharRef model = catalog.findGattChar(SVC_DEVICE_INFORMATION, CHR_MODEL_NUMBER);
    REQUIRE( nullptr != model );
    REQUIRE( model->hasProperties(BTGattChar::PropertyBitVal::Read) );

    // previously returned snapshots stay intact
    REQUIRE( 3 == before.size() );
    REQUIRE( nullptr != level0 );
}

TEST_CASE( "BTGattChar Notification Flag Test 03", "[catalog][notification]" ) {
    jau::darray<BTGattServiceRef> services = createTestServices();
    BTGattCharRef level = services[0]->findGattChar(CHR_BATTERY_LEVEL);
    REQUIRE( nullptr != level );
    REQUIRE( !level->getNotificationEnabled() );
    level->setNotificationEnabled(true);
    REQUIRE( level->getNotificationEnabled() );
    REQUIRE( level->getKey() == GattCharKey(SVC_BATTERY, CHR_BATTERY_LEVEL) );
    REQUIRE( "[Read, Notify]" == to_string(level->properties) );
}

TEST_CASE( "BTGattChar Null Descriptor Test 04", "[catalog][descriptor]" ) {
    jau::darray<BTGattDescRef> descs;
    descs.push_back( nullptr );
    descs.push_back( std::make_shared<BTGattDesc>( jau::uuid16_t(GattClientCharConfig::TYPE) ) );
    BTGattChar c(SVC_BATTERY, CHR_BATTERY_LEVEL, BTGattChar::PropertyBitVal::Notify, std::move(descs));

    REQUIRE( nullptr != c.getClientCharConfig() );
    REQUIRE( nullptr == c.findGattDesc(DESC_USER_DESCRIPTION) );
    const std::string s = c.toString();
    INFO_STR( s );
    REQUIRE( std::string::npos != s.find("null") );
}
