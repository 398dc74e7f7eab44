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

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "CBTConst.hpp"
#include "GattNumbers.hpp"
#include "BTPeripheral.hpp"

using namespace central_bt;
using namespace jau::fractions_i64_literals;

/**
 * Per attempt BTRadioCallback, forwarding completions of the current attempt only.
 */
class BTPeripheral::LinkCallback : public BTRadioCallback {
    private:
        /** Session weak back-reference */
        std::weak_ptr<BTPeripheral> wbr_peripheral;
        const uint32_t attempt;

        std::shared_ptr<BTPeripheral> getCurrent(const char* func) const noexcept {
            std::shared_ptr<BTPeripheral> p = wbr_peripheral.lock();
            if( nullptr == p ) {
                DBG_PRINT("BTPeripheral::LinkCallback::%s: Session released, attempt %u", func, (unsigned int)attempt);
                return nullptr;
            }
            if( !p->connection.isCurrent(attempt) ) {
                DBG_PRINT("BTPeripheral::LinkCallback::%s: Ignored stale attempt %u, current %u: %s", func,
                        (unsigned int)attempt, (unsigned int)p->connection.getAttempt(), p->addressAndType.toString().c_str());
                return nullptr;
            }
            return p;
        }

    public:
        LinkCallback(const std::weak_ptr<BTPeripheral>& peripheral, const uint32_t attempt_) noexcept
        : wbr_peripheral(peripheral), attempt(attempt_) {}

        void onConnectionStateChange(const uint16_t status, const BTRadioLinkState newState) noexcept override {
            std::shared_ptr<BTPeripheral> p = getCurrent("onConnectionStateChange");
            if( nullptr != p ) {
                p->linkStateChanged(attempt, status, newState);
            }
        }

        void onServicesDiscovered(const uint16_t status, const jau::darray<BTGattServiceRef>& services) noexcept override {
            std::shared_ptr<BTPeripheral> p = getCurrent("onServicesDiscovered");
            if( nullptr != p ) {
                p->servicesDiscovered(attempt, status, services);
            }
        }

        void onCharacteristicRead(const GattCharKey& key, const jau::TROOctets& value, const uint16_t status) noexcept override {
            std::shared_ptr<BTPeripheral> p = getCurrent("onCharacteristicRead");
            if( nullptr != p ) {
                p->characteristicRead(key, value, status);
            }
        }

        void onCharacteristicWrite(const GattCharKey& key, const uint16_t status) noexcept override {
            std::shared_ptr<BTPeripheral> p = getCurrent("onCharacteristicWrite");
            if( nullptr != p ) {
                p->characteristicWrite(key, status);
            }
        }

        void onDescriptorWrite(const GattCharKey& key, const jau::uuid_t& descriptor, const uint16_t status) noexcept override {
            std::shared_ptr<BTPeripheral> p = getCurrent("onDescriptorWrite");
            if( nullptr != p ) {
                p->descriptorWrite(key, descriptor, status);
            }
        }

        void onMtuChanged(const uint16_t mtu, const uint16_t status) noexcept override {
            std::shared_ptr<BTPeripheral> p = getCurrent("onMtuChanged");
            if( nullptr != p ) {
                p->mtuChanged(attempt, mtu, status);
            }
        }

        void onCharacteristicChanged(const GattCharKey& key, const jau::TROOctets& value) noexcept override {
            std::shared_ptr<BTPeripheral> p = getCurrent("onCharacteristicChanged");
            if( nullptr != p ) {
                p->characteristicChanged(key, value);
            }
        }
};

BTPeripheral::Config::Config() noexcept
: cleanup_grace( BTPeripheralEnv::get().CLEANUP_GRACE ),
  connect_timeout( BTPeripheralEnv::get().CONNECT_TIMEOUT ),
  op_timeout( BTPeripheralEnv::get().GATT_OP_TIMEOUT ),
  watchdog_period( BTPeripheralEnv::get().WATCHDOG_PERIOD ),
  default_mtu( static_cast<uint16_t>( BTPeripheralEnv::get().DEFAULT_MTU ) ),
  debug_data( BTPeripheralEnv::get().DEBUG_DATA )
{ }

std::string BTPeripheral::Config::toString() const noexcept {
    return "Config[grace "+cleanup_grace.to_string(true)+", connect "+connect_timeout.to_string(true)+
           ", op "+op_timeout.to_string(true)+", watchdog "+watchdog_period.to_string(true)+
           ", mtu "+std::to_string(default_mtu)+", debug_data "+std::to_string(debug_data)+"]";
}

BTPeripheral::BTPeripheral(const BTPeripheral::ctor_cookie& cc, const BTRadioAdapterRef& adapter_,
                           const BDAddressAndType& addressAndType_, const Config& config_)
: adapter(adapter_), addressAndType(addressAndType_), config(config_),
  connection(adapter_, addressAndType_, config_.cleanup_grace),
  catalog(), registry(),
  dispatcher(config_.debug_data),
  emitter(addressAndType_),
  mtu(config_.default_mtu), closed(false),
  watchdog("BTPeripheral::watchdog_"+addressAndType_.address.toString(), THREAD_SHUTDOWN_TIMEOUT)
{
    (void)cc;
    const bool r = watchdog.start(config.watchdog_period, jau::bind_member(this, &BTPeripheral::watchdogTimeout));
    DBG_PRINT("BTPeripheral::ctor: %s, %s, watchdog started %d", addressAndType.toString().c_str(), config.toString().c_str(), r);
}

std::shared_ptr<BTPeripheral> BTPeripheral::create(const BTRadioAdapterRef& adapter, const BDAddressAndType& addressAndType,
                                                   const Config& config)
{
    if( nullptr == adapter ) {
        throw jau::IllegalArgumentException("BTRadioAdapter is nullptr", E_FILE_LINE);
    }
    if( !addressAndType.isDefined() ) {
        throw jau::IllegalArgumentException("Undefined address type: "+addressAndType.toString(), E_FILE_LINE);
    }
    return std::make_shared<BTPeripheral>(BTPeripheral::ctor_cookie(0), adapter, addressAndType, config);
}

BTPeripheral::~BTPeripheral() noexcept {
    DBG_PRINT("BTPeripheral::dtor: %s", addressAndType.toString().c_str());
    close();
}

void BTPeripheral::close() noexcept {
    bool expClosed = false; // C++11, exp as value since C++20
    if( !closed.compare_exchange_strong(expClosed, true) ) {
        DBG_PRINT("BTPeripheral::close: Already closed: %s", addressAndType.toString().c_str());
        return;
    }
    DBG_PRINT("BTPeripheral::close: Start: %s", toString().c_str());

    // mute all listener first
    dispatcher.setListener(nullptr);
    emitter.setListener(nullptr);

    bool started;
    const ConnectionState prior = connection.beginTeardown(0, started);
    if( started ) {
        teardown(prior, number(BTConnStatusCode::CONNECTION_TERMINATED_BY_LOCAL_HOST), true /* requestDisconnect */,
                 GattError::DISCONNECTED, false /* emit */);
    }
    watchdog.stop();

    // requests registered concurrently to the teardown
    GattOpRegistry::request_list_t remaining = registry.takeAll();
    for(GattPendingRequestRef& req : remaining) {
        req->resolve( GattReply::failure(req->getKind(), GattError::DISCONNECTED, "Session closed") );
    }
    DBG_PRINT("BTPeripheral::close: End: %s", toString().c_str());
}

jau::fraction_i64 BTPeripheral::watchdogTimeout(jau::simple_timer& timer) noexcept {
    if( timer.shall_stop() ) {
        return 0_s;
    }
    const uint64_t now = jau::getCurrentMilliseconds();
    connection.checkCleanup(now);

    GattOpRegistry::request_list_t expired = registry.takeExpired(now,
            static_cast<uint64_t>( config.connect_timeout.to_ms() ), static_cast<uint64_t>( config.op_timeout.to_ms() ));
    if( 0 == expired.size() ) {
        return config.watchdog_period;
    }
    for(GattPendingRequestRef& req : expired) {
        if( GattOpKind::CONNECT == req->getKind() ) {
            // a timed out attempt is a failed attempt, release its handle
            bool started = false;
            ConnectionState prior = ConnectionState::DISCONNECTED;
            if( ConnectionState::CONNECTING == connection.getState() ) {
                prior = connection.beginTeardown(0, started);
            }
            if( started ) {
                teardown(prior, number(BTConnStatusCode::GATT_CONNECTION_TIMEOUT), true /* requestDisconnect */,
                         GattError::TIMEOUT, true /* emit */);
            }
            WARN_PRINT("BTPeripheral::watchdog: Connection attempt timed out: %s", addressAndType.toString().c_str());
            req->resolve( GattReply::connFailure(GattOpKind::CONNECT, GattError::TIMEOUT,
                          number(BTConnStatusCode::GATT_CONNECTION_TIMEOUT), "Connection attempt timed out") );
        } else {
            WARN_PRINT("BTPeripheral::watchdog: Timeout: %s: %s", req->toString().c_str(), addressAndType.toString().c_str());
            req->resolve( GattReply::failure(req->getKind(), GattError::TIMEOUT, req->key.toString()+" timed out") );
        }
    }
    return config.watchdog_period;
}

void BTPeripheral::reject(const GattReplyCallback& cb, const GattOpKind kind, const GattError error, const std::string& msg) noexcept {
    DBG_PRINT("BTPeripheral::reject: %s: %s: %s: %s", to_string(kind).c_str(), to_string(error).c_str(), msg.c_str(),
            addressAndType.toString().c_str());
    try {
        cb( GattReply::failure(kind, error, msg) );
    } catch (std::exception &e) {
        ERR_PRINT("BTPeripheral::reject: %s: Caught exception %s", to_string(kind).c_str(), e.what());
    }
}

bool BTPeripheral::validate(const GattOpKind kind, const GattReplyCallback& cb) noexcept {
    if( closed ) {
        reject(cb, kind, GattError::DISCONNECTED, "Session closed");
        return false;
    }
    if( !connection.isConnected() ) {
        reject(cb, kind, GattError::NOT_CONNECTED, "Not connected, state "+to_string(connection.getState()));
        return false;
    }
    return true;
}

BTGattCharRef BTPeripheral::validate(const GattOpKind kind, const GattCharKey& key, const GattReplyCallback& cb) noexcept {
    if( !validate(kind, cb) ) {
        return nullptr;
    }
    BTGattCharRef c = catalog.findGattChar(key);
    if( nullptr == c ) {
        reject(cb, kind, GattError::CHAR_NOT_FOUND, "Characteristic "+key.toString()+" not found");
        return nullptr;
    }
    return c;
}

void BTPeripheral::submit(const GattPendingRequestRef& req, const BTConnection::command_t& cmd) noexcept {
    registry.put(req);
    const GattError err = connection.issue(cmd);
    if( GattError::NONE == err ) {
        return;
    }
    registry.removeIfSame(req);
    const std::string msg = GattError::NOT_CONNECTED == err ? "Not connected" : "Command could not be started";
    WARN_PRINT("BTPeripheral::submit: %s: %s: %s", req->key.toString().c_str(), msg.c_str(), addressAndType.toString().c_str());
    req->resolve( GattReply::failure(req->getKind(), err, req->key.toString()+": "+msg) );
}

void BTPeripheral::connect(GattReplyCallback cb) noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_connect); // RAII-style acquire and relinquish via destructor
    if( closed ) {
        reject(cb, GattOpKind::CONNECT, GattError::DISCONNECTED, "Session closed");
        return;
    }
    // registered before the attempt, its completion may arrive before connectGatt() returns
    GattPendingRequestRef req = std::make_shared<GattPendingRequest>(GattOpKey(GattOpKind::CONNECT), nullptr, 0, std::move(cb));
    const ConnectionState state = connection.getState();
    if( ConnectionState::DISCONNECTED != state && ConnectionState::CLEANING_UP != state ) {
        // never overwrite the pending request of the live attempt
        req->resolve( GattReply::failure(GattOpKind::CONNECT, GattError::ALREADY_CONNECTED,
                      "Already connected, state "+to_string(state)) );
        return;
    }
    registry.put(req);

    const std::weak_ptr<BTPeripheral> wbr = weak_from_this();
    uint32_t attempt = 0;
    std::string msg;
    const GattError err = connection.connect([&wbr](const uint32_t a) -> BTRadioCallbackRef {
                                                 return std::make_shared<LinkCallback>(wbr, a);
                                             }, attempt, msg);
    if( GattError::NONE != err ) {
        registry.removeIfSame(req);
        req->resolve( GattReply::failure(GattOpKind::CONNECT, err, msg) );
        return;
    }
    DBG_PRINT("BTPeripheral::connect: Attempt %u started: %s", (unsigned int)attempt, addressAndType.toString().c_str());
}

void BTPeripheral::disconnect(GattReplyCallback cb) noexcept {
    bool started = false;
    ConnectionState prior = ConnectionState::DISCONNECTED;
    if( !closed ) {
        prior = connection.beginTeardown(0, started);
    }
    if( started ) {
        teardown(prior, number(BTConnStatusCode::CONNECTION_TERMINATED_BY_LOCAL_HOST), true /* requestDisconnect */,
                 GattError::DISCONNECTED, true /* emit */);
    } else {
        DBG_PRINT("BTPeripheral::disconnect: No-op in state %s: %s", to_string(prior).c_str(), addressAndType.toString().c_str());
    }
    try {
        cb( GattReply::success(GattOpKind::DISCONNECT) );
    } catch (std::exception &e) {
        ERR_PRINT("BTPeripheral::disconnect: Caught exception %s", e.what());
    }
}

void BTPeripheral::teardown(const ConnectionState prior, const uint16_t reason, const bool requestDisconnect,
                            const GattError connectError, const bool emit) noexcept
{
    const bool wasConnected = ConnectionState::CONNECTED == prior;
    DBG_PRINT("BTPeripheral::teardown: Start: prior %s, reason %s: %s", to_string(prior).c_str(),
            to_string(to_BTConnStatusCode(reason)).c_str(), addressAndType.toString().c_str());

    // no stale completion shall reference the closing handle
    GattOpRegistry::request_list_t pending = registry.takeAll();

    connection.completeTeardown(wasConnected, requestDisconnect);
    catalog.clear();

    for(GattPendingRequestRef& req : pending) {
        if( GattOpKind::CONNECT == req->getKind() ) {
            if( GattError::CONNECTION_FAILED == connectError || GattError::TIMEOUT == connectError ) {
                req->resolve( GattReply::connFailure(GattOpKind::CONNECT, connectError, reason, "Connection failed") );
            } else {
                req->resolve( GattReply::failure(GattOpKind::CONNECT, connectError, "Connection attempt cancelled") );
            }
        } else {
            req->resolve( GattReply::connFailure(req->getKind(), GattError::DISCONNECTED, reason, req->key.toString()+" torn down by disconnect") );
        }
    }
    if( emit && wasConnected ) {
        emitter.emitDisconnected(reason, jau::getCurrentMilliseconds());
    }
    DBG_PRINT("BTPeripheral::teardown: End: %s", connection.toString().c_str());
}

void BTPeripheral::linkStateChanged(const uint32_t attempt, const uint16_t status, const BTRadioLinkState newState) noexcept {
    DBG_PRINT("BTPeripheral::linkStateChanged: attempt %u, status %s, %s: %s", (unsigned int)attempt,
            to_string(to_BTConnStatusCode(status)).c_str(), to_string(newState).c_str(), addressAndType.toString().c_str());

    if( 0 == status && BTRadioLinkState::CONNECTED == newState ) {
        // a fresh link starts without services
        if( !connection.connected(attempt, [this]() { catalog.clear(); }) ) {
            return;
        }
        GattPendingRequestRef req = registry.take(GattOpKey(GattOpKind::CONNECT));
        if( nullptr != req ) {
            req->resolve( GattReply::success(GattOpKind::CONNECT) );
        } else {
            WARN_PRINT("BTPeripheral::linkStateChanged: Connected without pending request: %s", addressAndType.toString().c_str());
        }
        emitter.emitConnected(jau::getCurrentMilliseconds());
        return;
    }
    if( 0 == status && BTRadioLinkState::DISCONNECTED != newState ) {
        DBG_PRINT("BTPeripheral::linkStateChanged: Ignored transient %s", to_string(newState).c_str());
        return;
    }
    // connection failure or link loss, any cause
    bool started;
    const ConnectionState prior = connection.beginTeardown(attempt, started);
    if( !started ) {
        return;
    }
    if( ConnectionState::CONNECTED == prior ) {
        IRQ_PRINT("BTPeripheral: Link lost: %s, %s", getDescription(to_ConnStatusCategory(status)).c_str(), addressAndType.toString().c_str());
    } else {
        WARN_PRINT("BTPeripheral: Connection failed: %s, status %s, %s", getDescription(to_ConnStatusCategory(status)).c_str(),
                to_string(to_BTConnStatusCode(status)).c_str(), addressAndType.toString().c_str());
    }
    // the stack disconnected already, close only
    teardown(prior, 0 == status ? number(BTConnStatusCode::REMOTE_USER_TERMINATED_CONNECTION) : status,
             false /* requestDisconnect */, GattError::CONNECTION_FAILED, true /* emit */);
}

void BTPeripheral::discoverServices(GattReplyCallback cb) noexcept {
    if( !validate(GattOpKind::DISCOVER_SERVICES, cb) ) {
        return;
    }
    GattPendingRequestRef req = std::make_shared<GattPendingRequest>(GattOpKey(GattOpKind::DISCOVER_SERVICES), nullptr, 0, std::move(cb));
    submit(req, [](BTRadioHandle& h) -> bool { return h.discoverServices(); });
}

void BTPeripheral::servicesDiscovered(const uint32_t attempt, const uint16_t status, const jau::darray<BTGattServiceRef>& services) noexcept {
    // a teardown racing this completion must not see the catalog repopulated
    const bool applied = connection.runIfCurrent(attempt, [this, status, &services]() {
        if( 0 == status ) {
            catalog.replace(services);
        } else {
            catalog.clear();
        }
    });
    if( !applied ) {
        return;
    }
    GattPendingRequestRef req = registry.take(GattOpKey(GattOpKind::DISCOVER_SERVICES));
    if( nullptr == req ) {
        ERR_PRINT("BTPeripheral::servicesDiscovered: No pending request, status %s: %s",
                to_string(static_cast<GattStatusCode>(status)).c_str(), addressAndType.toString().c_str());
        return;
    }
    if( 0 == status ) {
        req->resolve( GattReply::success(GattOpKind::DISCOVER_SERVICES) );
    } else {
        req->resolve( GattReply::opFailure(GattOpKind::DISCOVER_SERVICES, GattError::SERVICE_DISCOVERY_FAILED, status, "Service discovery failed") );
    }
}

void BTPeripheral::read(const jau::uuid_t& service, const jau::uuid_t& characteristic, GattReplyCallback cb) noexcept {
    const GattCharKey key(service, characteristic);
    BTGattCharRef c = validate(GattOpKind::READ, key, cb);
    if( nullptr == c ) {
        return;
    }
    GattPendingRequestRef req = std::make_shared<GattPendingRequest>(GattOpKey(GattOpKind::READ, key), c, 0, std::move(cb));
    submit(req, [&key](BTRadioHandle& h) -> bool { return h.readCharacteristic(key); });
}

void BTPeripheral::characteristicRead(const GattCharKey& key, const jau::TROOctets& value, const uint16_t status) noexcept {
    GattPendingRequestRef req = registry.take(GattOpKey(GattOpKind::READ, key));
    if( nullptr == req ) {
        ERR_PRINT("BTPeripheral::characteristicRead: No pending request for %s: %s", key.toString().c_str(), addressAndType.toString().c_str());
        return;
    }
    if( 0 != status ) {
        req->resolve( GattReply::opFailure(GattOpKind::READ, GattError::OPERATION_FAILED, status, "Read "+key.toString()+" failed") );
        return;
    }
    COND_PRINT(config.debug_data, "BTPeripheral::characteristicRead: %s: %s", key.toString().c_str(), value.toString().c_str());
    GattReply reply = GattReply::success(GattOpKind::READ);
    reply.value = jau::POctets(value);
    req->resolve( reply );
}

void BTPeripheral::write(const jau::uuid_t& service, const jau::uuid_t& characteristic, const jau::TROOctets& data,
                         const bool withResponse, GattReplyCallback cb) noexcept
{
    const GattCharKey key(service, characteristic);
    BTGattCharRef c = validate(GattOpKind::WRITE, key, cb);
    if( nullptr == c ) {
        return;
    }
    const GattWriteType writeType = withResponse ? GattWriteType::WITH_RESPONSE : GattWriteType::NO_RESPONSE;
    COND_PRINT(config.debug_data, "BTPeripheral::write: %s, %s: %s", key.toString().c_str(), to_string(writeType).c_str(), data.toString().c_str());
    GattPendingRequestRef req = std::make_shared<GattPendingRequest>(GattOpKey(GattOpKind::WRITE, key), c, 0, std::move(cb));
    submit(req, [&key, &data, writeType](BTRadioHandle& h) -> bool { return h.writeCharacteristic(key, data, writeType); });
}

void BTPeripheral::characteristicWrite(const GattCharKey& key, const uint16_t status) noexcept {
    GattPendingRequestRef req = registry.take(GattOpKey(GattOpKind::WRITE, key));
    if( nullptr == req ) {
        ERR_PRINT("BTPeripheral::characteristicWrite: No pending request for %s: %s", key.toString().c_str(), addressAndType.toString().c_str());
        return;
    }
    if( 0 != status ) {
        req->resolve( GattReply::opFailure(GattOpKind::WRITE, GattError::OPERATION_FAILED, status, "Write "+key.toString()+" failed") );
    } else {
        req->resolve( GattReply::success(GattOpKind::WRITE) );
    }
}

void BTPeripheral::subscribe(const jau::uuid_t& service, const jau::uuid_t& characteristic, const bool enabled, GattReplyCallback cb) noexcept {
    const GattCharKey key(service, characteristic);
    BTGattCharRef c = validate(GattOpKind::DESC_WRITE, key, cb);
    if( nullptr == c ) {
        return;
    }
    BTGattDescRef cccd = c->getClientCharConfig();
    if( nullptr == cccd ) {
        reject(cb, GattOpKind::DESC_WRITE, GattError::NO_CLIENT_CONFIG, "Characteristic "+key.toString()+" has no client characteristic configuration");
        return;
    }
    const bool hasNotify = c->hasProperties(BTGattChar::PropertyBitVal::Notify);
    const bool hasIndicate = c->hasProperties(BTGattChar::PropertyBitVal::Indicate);
    if( enabled && !hasNotify && !hasIndicate ) {
        reject(cb, GattOpKind::DESC_WRITE, GattError::NO_CLIENT_CONFIG, "Characteristic "+key.toString()+" supports neither notification nor indication");
        return;
    }
    uint16_t ccc_value = GattClientCharConfig::DISABLE;
    if( enabled ) {
        ccc_value = hasNotify ? GattClientCharConfig::NOTIFICATION : GattClientCharConfig::INDICATION;
    }
    const std::lock_guard<std::recursive_mutex> lock(mtx_subscribe); // RAII-style acquire and relinquish via destructor

    // the local flag is restored unless the client characteristic configuration write succeeds
    std::shared_ptr<bool> prior = std::make_shared<bool>( c->getNotificationEnabled() );
    GattPendingRequestRef req = std::make_shared<GattPendingRequest>(GattOpKey(GattOpKind::DESC_WRITE, key), c, ccc_value,
            [this, c, prior, cb](const GattReply& reply) {
                if( !reply.isSuccess() ) {
                    const std::lock_guard<std::recursive_mutex> lock2(mtx_subscribe); // RAII-style acquire and relinquish via destructor
                    c->setNotificationEnabled(*prior);
                }
                cb(reply);
            });
    // an overwritten prior request restores its own flag first
    registry.put(req);
    *prior = c->getNotificationEnabled();
    c->setNotificationEnabled(enabled);

    const jau::uuid128_t cccd_type = cccd->type;
    const GattError err = connection.issue([&key, &cccd_type, enabled, ccc_value](BTRadioHandle& h) -> bool {
        if( !h.setCharacteristicNotification(key, enabled) ) {
            return false;
        }
        const uint8_t raw[] = { static_cast<uint8_t>( ccc_value & 0xff ), static_cast<uint8_t>( ( ccc_value >> 8 ) & 0xff ) };
        const jau::TROOctets value(raw, sizeof(raw), jau::lb_endian_t::little);
        return h.writeDescriptor(key, cccd_type, value);
    });
    if( GattError::NONE != err ) {
        registry.removeIfSame(req);
        const std::string msg = GattError::NOT_CONNECTED == err ? "Not connected" : "Command could not be started";
        WARN_PRINT("BTPeripheral::subscribe: %s: %s: %s", key.toString().c_str(), msg.c_str(), addressAndType.toString().c_str());
        req->resolve( GattReply::failure(GattOpKind::DESC_WRITE, err, key.toString()+": "+msg) );
    }
}

void BTPeripheral::descriptorWrite(const GattCharKey& key, const jau::uuid_t& descriptor, const uint16_t status) noexcept {
    GattPendingRequestRef req = registry.take(GattOpKey(GattOpKind::DESC_WRITE));
    if( nullptr == req ) {
        ERR_PRINT("BTPeripheral::descriptorWrite: No pending request for %s: %s", key.toString().c_str(), addressAndType.toString().c_str());
        return;
    }
    BTGattDescRef cccd = req->characteristic->getClientCharConfig();
    if( req->characteristic->getKey() != key || nullptr == cccd || cccd->type != descriptor.toUUID128() ) {
        req->resolve( GattReply::failure(GattOpKind::DESC_WRITE, GattError::UNEXPECTED_DESCRIPTOR,
                      "Unexpected descriptor "+descriptor.toUUID128().toString()+" of "+key.toString()+
                      ", expected client characteristic configuration of "+req->characteristic->getKey().toString()) );
        return;
    }
    if( 0 != status ) {
        req->resolve( GattReply::opFailure(GattOpKind::DESC_WRITE, GattError::OPERATION_FAILED, status,
                      "Client characteristic configuration write "+key.toString()+" failed") );
    } else {
        req->resolve( GattReply::success(GattOpKind::DESC_WRITE) );
    }
}

void BTPeripheral::requestMtu(const uint16_t value, GattReplyCallback cb) noexcept {
    if( !validate(GattOpKind::MTU, cb) ) {
        return;
    }
    if( number(GattMtu::MIN_ATT_MTU) > value || number(GattMtu::MAX_ATT_MTU) < value ) {
        reject(cb, GattOpKind::MTU, GattError::INVALID_PARAM, "MTU "+std::to_string(value)+" not within ["+
               std::to_string(number(GattMtu::MIN_ATT_MTU))+".."+std::to_string(number(GattMtu::MAX_ATT_MTU))+"]");
        return;
    }
    GattPendingRequestRef req = std::make_shared<GattPendingRequest>(GattOpKey(GattOpKind::MTU), nullptr, value, std::move(cb));
    submit(req, [value](BTRadioHandle& h) -> bool { return h.requestMtu(value); });
}

void BTPeripheral::mtuChanged(const uint32_t attempt, const uint16_t mtu_, const uint16_t status) noexcept {
    if( 0 == status && !connection.runIfCurrent(attempt, [this, mtu_]() { mtu = mtu_; }) ) {
        return;
    }
    GattPendingRequestRef req = registry.take(GattOpKey(GattOpKind::MTU));
    if( nullptr == req ) {
        if( 0 == status ) {
            DBG_PRINT("BTPeripheral::mtuChanged: Peer initiated MTU %u: %s", (unsigned int)mtu_, addressAndType.toString().c_str());
        } else {
            ERR_PRINT("BTPeripheral::mtuChanged: No pending request, status %s: %s",
                    to_string(static_cast<GattStatusCode>(status)).c_str(), addressAndType.toString().c_str());
        }
        return;
    }
    if( 0 != status ) {
        req->resolve( GattReply::opFailure(GattOpKind::MTU, GattError::OPERATION_FAILED, status,
                      "MTU request "+std::to_string(req->argument)+" failed") );
        return;
    }
    GattReply reply = GattReply::success(GattOpKind::MTU);
    reply.mtu = mtu_;
    req->resolve( reply );
}

void BTPeripheral::characteristicChanged(const GattCharKey& key, const jau::TROOctets& value) noexcept {
    BTGattCharRef c = catalog.findGattChar(key);
    if( nullptr == c ) {
        DBG_PRINT("BTPeripheral::characteristicChanged: Unknown characteristic %s: %s", key.toString().c_str(), addressAndType.toString().c_str());
        return;
    }
    dispatcher.dispatch(*c, value);
}

bool BTPeripheral::isBonded() const noexcept {
    return adapter->isBonded(addressAndType);
}

std::string BTPeripheral::toString() const noexcept {
    return "BTPeripheral["+addressAndType.toString()+", "+to_string(connection.getState())+", mtu "+std::to_string(mtu.load())+
           ", "+catalog.toString()+", pending "+std::to_string(registry.size())+(closed?", closed":"")+"]";
}
