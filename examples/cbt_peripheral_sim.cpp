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
#include <memory>
#include <cstdint>
#include <cinttypes>
#include <mutex>
#include <condition_variable>

#include <jau/debug.hpp>
#include <jau/environment.hpp>
#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/ordered_atomic.hpp>

#include <central_bt/BTPeripheral.hpp>
#include <central_bt/SimRadioAdapter.hpp>

extern "C" {
    #include <unistd.h>
}

using namespace central_bt;
using namespace jau;
using namespace jau::fractions_i64_literals;

/** \file
 * This _cbt_peripheral_sim_ C++ GATT client example drives one BTPeripheral session
 * against the SimRadioAdapter, a virtual battery and device information peripheral.
 *
 * The session connects, discovers the services, reads the battery level,
 * writes the model number, subscribes to battery level notifications
 * and receives a number of simulated value changes before disconnecting.
 *
 * ### cbt_peripheral_sim Invocation Examples:
 *
 * * Default run
 *   ~~~
 *   ./cbt_peripheral_sim
 *   ~~~
 *
 * * Five notifications, one simulated link loss and reconnect, debug logging
 *   ~~~
 *   ./cbt_peripheral_sim -count 5 -linkloss -cbt_debug true
 *   ~~~
 */

static const BDAddressAndType SIM_PEER(EUI48("C0:26:DA:01:DA:B1"), BDAddressType::BDADDR_LE_PUBLIC);

static const jau::uuid16_t BATTERY_SERVICE(0x180F);
static const jau::uuid16_t BATTERY_LEVEL(0x2A19);
static const jau::uuid16_t DEVICE_INFORMATION(0x180A);
static const jau::uuid16_t MODEL_NUMBER(0x2A24);

static int NOTIFICATION_COUNT = 3;
static bool LINK_LOSS = false;
static uint16_t MTU = 185;

/**
 * Blocking wait for one asynchronous GattReply.
 */
class ReplyLatch {
    private:
        std::mutex mtx;
        std::condition_variable cv;
        bool done = false;
        GattReply reply = GattReply::success(GattOpKind::CONNECT);

    public:
        GattReplyCallback callback() {
            return [this](const GattReply& r) {
                std::unique_lock<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                reply = r;
                done = true;
                cv.notify_all();
            };
        }

        GattReply await(const std::string& msg) {
            std::unique_lock<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
            while( !done ) {
                cv.wait(lock);
            }
            done = false;
            fprintf_td(stderr, "****** %s: %s\n", msg.c_str(), reply.toString().c_str());
            return reply;
        }
};

class MyStatusListener : public PeripheralStatusListener {
    void deviceConnected(const BDAddressAndType& address, const uint64_t timestamp) override {
        fprintf_td(stderr, "****** CONNECTED: %s, ts %" PRIu64 "\n", address.toString().c_str(), timestamp);
    }

    void deviceDisconnected(const BDAddressAndType& address, const uint16_t reason, const ConnStatusCategory category,
                            const uint64_t timestamp) override {
        fprintf_td(stderr, "****** DISCONNECTED: %s, reason %s, %s, ts %" PRIu64 "\n", address.toString().c_str(),
                to_string(to_BTConnStatusCode(reason)).c_str(), to_string(category).c_str(), timestamp);
    }

    std::string toString() const noexcept override { return "MyStatusListener"; }
};

class MyNotificationListener : public GattNotificationListener {
    public:
        jau::relaxed_atomic_int received;

        MyNotificationListener() noexcept : received(0) {}

        void notificationReceived(const GattNotification& n) override {
            received++;
            fprintf_td(stderr, "****** NOTIFICATION #%d: %s\n", received.load(), n.toString().c_str());
        }

        std::string toString() const noexcept override { return "MyNotificationListener"; }
};

static SimGattDatabaseRef createDatabase() {
    SimGattDatabase::service_list_t services;
    {
        jau::POctets level(1, jau::lb_endian_t::little);
        level.put_uint8_nc(0, 100);
        jau::darray<SimGattDescRef> descs;
        descs.push_back( SimGattDesc::createClientCharConfig() );
        jau::darray<SimGattCharRef> chars;
        chars.push_back( std::make_shared<SimGattChar>(BATTERY_LEVEL,
                            BTGattChar::PropertyBitVal::Read | BTGattChar::PropertyBitVal::Notify,
                            std::move(descs), std::move(level)) );
        services.push_back( std::make_shared<SimGattService>(true, BATTERY_SERVICE, std::move(chars)) );
    }
    {
        const std::string model("SIM-0001");
        jau::POctets value(static_cast<jau::nsize_t>(model.size()), jau::lb_endian_t::little);
        value.put_bytes_nc(0, reinterpret_cast<const uint8_t*>(model.c_str()), static_cast<jau::nsize_t>(model.size()));
        jau::darray<SimGattCharRef> chars;
        chars.push_back( std::make_shared<SimGattChar>(MODEL_NUMBER,
                            BTGattChar::PropertyBitVal::Read | BTGattChar::PropertyBitVal::WriteWithAck,
                            jau::darray<SimGattDescRef>(), std::move(value)) );
        services.push_back( std::make_shared<SimGattService>(true, DEVICE_INFORMATION, std::move(chars)) );
    }
    return std::make_shared<SimGattDatabase>(std::move(services));
}

static bool connectAndDiscover(const BTPeripheralRef& p, ReplyLatch& latch) {
    p->connect(latch.callback());
    if( !latch.await("connect").isSuccess() ) {
        return false;
    }
    p->discoverServices(latch.callback());
    if( !latch.await("discoverServices").isSuccess() ) {
        return false;
    }
    for(const BTGattServiceRef& s : p->listServices()) {
        fprintf_td(stderr, "  %s\n", s->toString().c_str());
        for(const BTGattCharRef& c : s->characteristicList) {
            fprintf_td(stderr, "    %s\n", c->toString().c_str());
        }
    }
    return true;
}

static bool test() {
    SimGattDatabaseRef db = createDatabase();
    fprintf_td(stderr, "%s", db->toFullString().c_str());

    SimRadioAdapterRef adapter = SimRadioAdapter::create(SIM_PEER, db);
    BTPeripheralRef p = BTPeripheral::create(adapter, SIM_PEER);
    std::shared_ptr<MyStatusListener> statusListener = std::make_shared<MyStatusListener>();
    std::shared_ptr<MyNotificationListener> notificationListener = std::make_shared<MyNotificationListener>();
    p->setStatusListener(statusListener);
    p->setNotificationListener(notificationListener);
    fprintf_td(stderr, "****** Session: %s\n", p->toString().c_str());

    ReplyLatch latch;
    if( !connectAndDiscover(p, latch) ) {
        return false;
    }

    p->read(BATTERY_SERVICE, BATTERY_LEVEL, latch.callback());
    {
        GattReply r = latch.await("read battery level");
        if( r.isSuccess() && 1 <= r.value.size() ) {
            fprintf_td(stderr, "****** Battery level %u%%\n", (unsigned int)r.value.get_uint8_nc(0));
        }
    }

    {
        const std::string model("SIM-0002");
        const jau::TROOctets value(reinterpret_cast<const uint8_t*>(model.c_str()), static_cast<jau::nsize_t>(model.size()),
                                   jau::lb_endian_t::little);
        p->write(DEVICE_INFORMATION, MODEL_NUMBER, value, true, latch.callback());
        latch.await("write model number");
    }

    p->requestMtu(MTU, latch.callback());
    latch.await("requestMtu");
    fprintf_td(stderr, "****** MTU %u\n", (unsigned int)p->getMtu());

    p->subscribe(BATTERY_SERVICE, BATTERY_LEVEL, true, latch.callback());
    if( !latch.await("subscribe battery level").isSuccess() ) {
        return false;
    }

    const GattCharKey levelKey(BATTERY_SERVICE, BATTERY_LEVEL);
    for(int i=0; i<NOTIFICATION_COUNT; ++i) {
        jau::POctets level(1, jau::lb_endian_t::little);
        level.put_uint8_nc(0, static_cast<uint8_t>( 100 - i ));
        adapter->notify(levelKey, level);
        jau::sleep_for( 100_ms );
    }

    if( LINK_LOSS ) {
        adapter->linkLoss(number(BTConnStatusCode::CONNECTION_TIMEOUT));
        jau::sleep_for( 500_ms );
        fprintf_td(stderr, "****** Link lost: %s\n", p->toString().c_str());
        if( !connectAndDiscover(p, latch) ) {
            return false;
        }
    }

    p->disconnect(latch.callback());
    latch.await("disconnect");

    const bool success = notificationListener->received >= NOTIFICATION_COUNT;
    fprintf_td(stderr, "****** Notifications received %d/%d\n", notificationListener->received.load(), NOTIFICATION_COUNT);
    p->close();
    adapter->close();
    return success;
}

int main(int argc, char *argv[])
{
    for(int i=1; i<argc; i++) {
        fprintf(stderr, "arg[%d/%d]: '%s'\n", i, argc, argv[i]);

        if( !strcmp("-cbt_debug", argv[i]) && argc > (i+1) ) {
            setenv("central_bt.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-cbt_verbose", argv[i]) && argc > (i+1) ) {
            setenv("central_bt.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-cbt_peripheral", argv[i]) && argc > (i+1) ) {
            setenv("central_bt.peripheral", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-count", argv[i]) && argc > (i+1) ) {
            NOTIFICATION_COUNT = atoi(argv[++i]);
        } else if( !strcmp("-mtu", argv[i]) && argc > (i+1) ) {
            MTU = static_cast<uint16_t>( atoi(argv[++i]) );
        } else if( !strcmp("-linkloss", argv[i]) ) {
            LINK_LOSS = true;
        }
    }
    fprintf_td(stderr, "pid %d\n", getpid());

    fprintf_td(stderr, "Run with '[-count <number>] [-mtu <23..517>] [-linkloss] "
                    "[-cbt_verbose true|false] "
                    "[-cbt_debug true|false] "
                    "[-cbt_peripheral cleanup.grace=200,connect.timeout=30000,...] "
                    "\n");

    fprintf_td(stderr, "NOTIFICATION_COUNT %d\n", NOTIFICATION_COUNT);
    fprintf_td(stderr, "MTU %u\n", (unsigned int)MTU);
    fprintf_td(stderr, "LINK_LOSS %d\n", LINK_LOSS);

    fprintf_td(stderr, "****** TEST start\n");
    const bool success = test();
    fprintf_td(stderr, "****** TEST end, success %d\n", success);
    return success ? 0 : 1;
}
