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
#include <algorithm>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "CBTConst.hpp"
#include "GattNumbers.hpp"
#include "BTPeripheralEnv.hpp"
#include "SimRadioAdapter.hpp"

using namespace central_bt;
using namespace jau::fractions_i64_literals;

std::shared_ptr<SimGattDesc> SimGattDesc::createClientCharConfig() noexcept {
    jau::POctets p( 2, jau::lb_endian_t::little );
    p.put_uint16_nc(0, GattClientCharConfig::DISABLE);
    return std::make_shared<SimGattDesc>( jau::uuid16_t(GattClientCharConfig::TYPE), std::move(p) );
}

bool SimGattDesc::isClientCharConfig() const noexcept {
    return GattClientCharConfig::TYPE_UUID128 == type;
}

std::string SimGattDesc::toString() const noexcept {
    return "SimDesc[type "+type.toString()+", value "+value.toString()+"]";
}

SimGattDescRef SimGattChar::findGattDesc(const jau::uuid_t& type) noexcept {
    const jau::uuid128_t t = type.toUUID128();
    for(SimGattDescRef& d : descriptors) {
        if( t == d->type ) {
            return d;
        }
    }
    return nullptr;
}

std::string SimGattChar::toString() const noexcept {
    return "SimChar[type "+value_type.toString()+", props "+to_string(properties)+
           ", descr "+std::to_string(descriptors.size())+", value "+value.toString()+"]";
}

SimGattCharRef SimGattService::findGattChar(const jau::uuid_t& char_uuid) noexcept {
    const jau::uuid128_t t = char_uuid.toUUID128();
    for(SimGattCharRef& c : characteristics) {
        if( t == c->value_type ) {
            return c;
        }
    }
    return nullptr;
}

std::string SimGattService::toString() const noexcept {
    return "SimService[type "+type.toString()+", primary "+std::to_string(primary)+
           ", chars "+std::to_string(characteristics.size())+"]";
}

SimGattServiceRef SimGattDatabase::findGattService(const jau::uuid_t& type) noexcept {
    const jau::uuid128_t t = type.toUUID128();
    for(SimGattServiceRef& s : services) {
        if( t == s->type ) {
            return s;
        }
    }
    return nullptr;
}

SimGattCharRef SimGattDatabase::findGattChar(const GattCharKey& key) noexcept {
    SimGattServiceRef s = findGattService(key.service);
    if( nullptr == s ) {
        return nullptr;
    }
    return s->findGattChar(key.characteristic);
}

jau::darray<BTGattServiceRef> SimGattDatabase::toGattServices() const noexcept {
    jau::darray<BTGattServiceRef> res;
    for(const SimGattServiceRef& s : services) {
        jau::darray<BTGattCharRef> chars;
        for(const SimGattCharRef& c : s->characteristics) {
            jau::darray<BTGattDescRef> descs;
            for(const SimGattDescRef& d : c->descriptors) {
                descs.push_back( std::make_shared<BTGattDesc>(d->type) );
            }
            chars.push_back( std::make_shared<BTGattChar>(s->type, c->value_type, c->properties, std::move(descs)) );
        }
        res.push_back( std::make_shared<BTGattService>(s->primary, s->type, std::move(chars)) );
    }
    return res;
}

std::string SimGattDatabase::toFullString() const noexcept {
    std::string res = "SimGattDatabase[services "+std::to_string(services.size())+"]\n";
    for(const SimGattServiceRef& s : services) {
        res.append("  ").append(s->toString()).append("\n");
        for(const SimGattCharRef& c : s->characteristics) {
            res.append("    ").append(c->toString()).append("\n");
            for(const SimGattDescRef& d : c->descriptors) {
                res.append("      ").append(d->toString()).append("\n");
            }
        }
    }
    return res;
}

/**
 * BTRadioHandle of one SimRadioAdapter::Link, keeping its adapter alive.
 */
class SimRadioAdapter::Handle : public BTRadioHandle {
    private:
        const std::shared_ptr<SimRadioAdapter> adapter;
        const LinkRef link;

    public:
        Handle(const std::shared_ptr<SimRadioAdapter>& adapter_, const LinkRef& link_) noexcept
        : adapter(adapter_), link(link_) {}

        ~Handle() noexcept override {
            adapter->close(link);
        }

        bool disconnect() noexcept override { return adapter->disconnect(link); }

        void close() override { adapter->close(link); }

        bool discoverServices() noexcept override { return adapter->discoverServices(link); }

        bool readCharacteristic(const GattCharKey& key) noexcept override { return adapter->readCharacteristic(link, key); }

        bool writeCharacteristic(const GattCharKey& key, const jau::TROOctets& value, const GattWriteType writeType) noexcept override {
            return adapter->writeCharacteristic(link, key, value, writeType);
        }

        bool setCharacteristicNotification(const GattCharKey& key, const bool enable) noexcept override {
            return adapter->setCharacteristicNotification(link, key, enable);
        }

        bool writeDescriptor(const GattCharKey& key, const jau::uuid_t& descriptor, const jau::TROOctets& value) noexcept override {
            return adapter->writeDescriptor(link, key, descriptor, value);
        }

        bool requestMtu(const uint16_t mtu) noexcept override { return adapter->requestMtu(link, mtu); }
};

#define SIM_EVENT_TYPE_CASE(V) case EventType::V: return #V;

std::string SimRadioAdapter::Event::getTypeName(const EventType v) noexcept {
    switch( v ) {
        SIM_EVENT_TYPE_ENUM(SIM_EVENT_TYPE_CASE)
        default: ; // fall through intended
    }
    return "Unknown EventType";
}

SimRadioAdapter::Event::Event(const EventType type_, const LinkRef& link_, const uint16_t status_) noexcept
: type(type_), link(link_), status(status_), linkState(BTRadioLinkState::DISCONNECTED),
  key(), descriptor(), value(jau::lb_endian_t::little), mtu(0), services()
{ }

void SimRadioAdapter::Event::deliver() const noexcept {
    BTRadioCallback& cb = *link->callback;
    switch( type ) {
        case EventType::CONN_STATE:
            cb.onConnectionStateChange(status, linkState);
            break;
        case EventType::SERVICES:
            cb.onServicesDiscovered(status, services);
            break;
        case EventType::CHAR_READ:
            cb.onCharacteristicRead(key, value, status);
            break;
        case EventType::CHAR_WRITE:
            cb.onCharacteristicWrite(key, status);
            break;
        case EventType::DESC_WRITE:
            cb.onDescriptorWrite(key, descriptor, status);
            break;
        case EventType::MTU:
            cb.onMtuChanged(mtu, status);
            break;
        case EventType::CHAR_CHANGED:
            cb.onCharacteristicChanged(key, value);
            break;
    }
}

std::string SimRadioAdapter::Event::toString() const noexcept {
    return "SimEvent["+getTypeName(type)+", link "+std::to_string(link->id)+", status "+jau::to_hexstring(status)+
           ", "+to_string(linkState)+", "+key.toString()+", value "+std::to_string(value.size())+" bytes, mtu "+std::to_string(mtu)+"]";
}

SimRadioAdapter::SimRadioAdapter(const BDAddressAndType& peer_, const SimGattDatabaseRef& db_) noexcept
: peer(peer_), db(nullptr != db_ ? db_ : std::make_shared<SimGattDatabase>()), link(nullptr), link_count(0),
  bonded(false), connect_status(number(BTConnStatusCode::SUCCESS)), hold_responses(false), held(),
  deliveredCount(0),
  sim_service("SimRadioAdapter::events_"+peer_.address.toString(), THREAD_SHUTDOWN_TIMEOUT,
              jau::bind_member(this, &SimRadioAdapter::simWork),
              jau::service_runner::Callback() /* init */,
              jau::bind_member(this, &SimRadioAdapter::simEndLocked)),
  eventRing(static_cast<jau::nsize_t>( BTPeripheralEnv::get().SIM_RING_CAPACITY ))
{
    for(size_t i=0; i<=number(GattOpKind::DISCONNECT); ++i) {
        next_status[i] = 0;
        next_status_set[i] = false;
        start_failure[i] = false;
    }
    sim_service.start();
    DBG_PRINT("SimRadioAdapter::ctor: %s", toString().c_str());
}

SimRadioAdapter::~SimRadioAdapter() noexcept {
    DBG_PRINT("SimRadioAdapter::dtor: %s", peer.toString().c_str());
    close();
}

void SimRadioAdapter::close() noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
        if( nullptr != link ) {
            link->closed = true;
            link = nullptr;
        }
        held.clear();
    }
    const bool r = sim_service.stop();
    DBG_PRINT("SimRadioAdapter::close: %s, event thread stopped %d", peer.toString().c_str(), r);
}

void SimRadioAdapter::simWork(jau::service_runner& sr) noexcept {
    std::unique_ptr<Event> ev;
    if( !eventRing.getBlocking(ev, SIM_EVENT_POLL_TIMEOUT) || nullptr == ev ) {
        // timeout, poll shutdown state
        return;
    }
    if( sr.shall_stop() ) {
        return;
    }
    if( ev->link->closed ) {
        DBG_PRINT("SimRadioAdapter::events: Drop %s, link closed", ev->toString().c_str());
        return;
    }
    DBG_PRINT("SimRadioAdapter::events: Deliver %s", ev->toString().c_str());
    ev->deliver();
    deliveredCount++;
}

void SimRadioAdapter::simEndLocked(jau::service_runner& sr) noexcept {
    (void)sr;
    WORDY_PRINT("SimRadioAdapter::events: Ended. Ring has %u entries flushed", eventRing.size());
    eventRing.clear();
}

bool SimRadioAdapter::enqueue(std::unique_ptr<Event> && ev, const bool response) noexcept {
    // caller holds mtx_sim
    if( response && hold_responses ) {
        DBG_PRINT("SimRadioAdapter::enqueue: Hold %s", ev->toString().c_str());
        held.push_back( std::move(ev) );
        return true;
    }
    if( eventRing.isFull() ) {
        const jau::nsize_t dropCount = eventRing.capacity()/4;
        eventRing.drop(dropCount);
        WARN_PRINT("SimRadioAdapter::enqueue: Drop (%u oldest elements of %u capacity, ring full)", dropCount, eventRing.capacity());
    }
    if( !eventRing.putBlocking( std::move( ev ), 0_s ) ) {
        ERR_PRINT("SimRadioAdapter::enqueue: eventRing put failed: %s", eventRing.toString().c_str());
        return false;
    }
    return true;
}

uint16_t SimRadioAdapter::takeStatus(const GattOpKind kind, const uint16_t defStatus) noexcept {
    const uint8_t i = number(kind);
    if( !next_status_set[i] ) {
        return defStatus;
    }
    next_status_set[i] = false;
    return next_status[i];
}

bool SimRadioAdapter::canStart(const Link& l, const GattOpKind kind) const noexcept {
    if( link.get() != &l || l.closed ) {
        DBG_PRINT("SimRadioAdapter::%s: Link %u not live", to_string(kind).c_str(), (unsigned int)l.id);
        return false;
    }
    if( start_failure[number(kind)] ) {
        DBG_PRINT("SimRadioAdapter::%s: Start failure injected", to_string(kind).c_str());
        return false;
    }
    return true;
}

std::unique_ptr<BTRadioHandle> SimRadioAdapter::connectGatt(const BDAddressAndType& address, const bool autoConnect,
                                                            const BTRadioCallbackRef& callback) noexcept
{
    std::shared_ptr<SimRadioAdapter> self = weak_from_this().lock();
    if( nullptr == self ) {
        ERR_PRINT("SimRadioAdapter::connectGatt: Not created as shared instance: %s", peer.toString().c_str());
        return nullptr;
    }
    if( nullptr == callback ) {
        ERR_PRINT("SimRadioAdapter::connectGatt: Callback is nullptr: %s", address.toString().c_str());
        return nullptr;
    }
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( !sim_service.is_running() ) {
        ERR_PRINT("SimRadioAdapter::connectGatt: Closed: %s", peer.toString().c_str());
        return nullptr;
    }
    if( start_failure[number(GattOpKind::CONNECT)] ) {
        DBG_PRINT("SimRadioAdapter::connectGatt: Start failure injected: %s", address.toString().c_str());
        return nullptr;
    }
    if( nullptr != link ) {
        WARN_PRINT("SimRadioAdapter::connectGatt: Link %u busy, connection pool exhausted: %s", (unsigned int)link->id, address.toString().c_str());
        return nullptr;
    }
    LinkRef l = std::make_shared<Link>(++link_count, callback);
    uint16_t status = connect_status;
    if( address != peer ) {
        status = number(BTConnStatusCode::CONNECTION_EST_FAILED_OR_SYNC_TIMEOUT);
    }
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::CONN_STATE, l, status);
    if( 0 == status ) {
        link = l;
        ev->linkState = BTRadioLinkState::CONNECTED;
    } else {
        ev->linkState = BTRadioLinkState::DISCONNECTED;
    }
    DBG_PRINT("SimRadioAdapter::connectGatt: Link %u, autoConnect %d, status %s: %s", (unsigned int)l->id, autoConnect,
            to_string(to_BTConnStatusCode(status)).c_str(), address.toString().c_str());
    enqueue(std::move(ev), false);
    return std::make_unique<Handle>(self, l);
}

bool SimRadioAdapter::disconnect(const LinkRef& l) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( link != l || l->closed ) {
        DBG_PRINT("SimRadioAdapter::disconnect: Link %u not live", (unsigned int)l->id);
        return false;
    }
    link = nullptr;
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::CONN_STATE, l, number(BTConnStatusCode::SUCCESS));
    ev->linkState = BTRadioLinkState::DISCONNECTED;
    return enqueue(std::move(ev), false);
}

void SimRadioAdapter::close(const LinkRef& l) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    l->closed = true;
    if( link == l ) {
        link = nullptr;
    }
}

bool SimRadioAdapter::discoverServices(const LinkRef& l) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( !canStart(*l, GattOpKind::DISCOVER_SERVICES) ) {
        return false;
    }
    const uint16_t status = takeStatus(GattOpKind::DISCOVER_SERVICES, number(GattStatusCode::SUCCESS));
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::SERVICES, l, status);
    if( 0 == status ) {
        ev->services = db->toGattServices();
    }
    return enqueue(std::move(ev), true);
}

bool SimRadioAdapter::readCharacteristic(const LinkRef& l, const GattCharKey& key) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( !canStart(*l, GattOpKind::READ) ) {
        return false;
    }
    SimGattCharRef c = db->findGattChar(key);
    GattStatusCode def = GattStatusCode::SUCCESS;
    if( nullptr == c ) {
        def = GattStatusCode::ATTRIBUTE_NOT_FOUND;
    } else if( !c->hasProperties(BTGattChar::PropertyBitVal::Read) ) {
        def = GattStatusCode::NO_READ_PERM;
    }
    const uint16_t status = takeStatus(GattOpKind::READ, number(def));
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::CHAR_READ, l, status);
    ev->key = key;
    if( 0 == status && nullptr != c ) {
        ev->value = c->value;
    }
    return enqueue(std::move(ev), true);
}

bool SimRadioAdapter::writeCharacteristic(const LinkRef& l, const GattCharKey& key, const jau::TROOctets& value, const GattWriteType writeType) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( !canStart(*l, GattOpKind::WRITE) ) {
        return false;
    }
    SimGattCharRef c = db->findGattChar(key);
    GattStatusCode def = GattStatusCode::SUCCESS;
    if( nullptr == c ) {
        def = GattStatusCode::ATTRIBUTE_NOT_FOUND;
    } else if( !c->hasProperties(BTGattChar::PropertyBitVal::WriteWithAck) &&
               !c->hasProperties(BTGattChar::PropertyBitVal::WriteNoAck) )
    {
        def = GattStatusCode::NO_WRITE_PERM;
    }
    const uint16_t status = takeStatus(GattOpKind::WRITE, number(def));
    if( 0 == status && nullptr != c ) {
        c->value = jau::POctets(value);
    }
    DBG_PRINT("SimRadioAdapter::write: %s, %s, status %s", key.toString().c_str(), to_string(writeType).c_str(),
            to_string(static_cast<GattStatusCode>(status)).c_str());
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::CHAR_WRITE, l, status);
    ev->key = key;
    return enqueue(std::move(ev), true);
}

bool SimRadioAdapter::setCharacteristicNotification(const LinkRef& l, const GattCharKey& key, const bool enable) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( !canStart(*l, GattOpKind::DESC_WRITE) ) {
        return false;
    }
    SimGattCharRef c = db->findGattChar(key);
    DBG_PRINT("SimRadioAdapter::setCharacteristicNotification: %s, enable %d, found %d", key.toString().c_str(), enable, nullptr != c);
    return nullptr != c;
}

bool SimRadioAdapter::writeDescriptor(const LinkRef& l, const GattCharKey& key, const jau::uuid_t& descriptor, const jau::TROOctets& value) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( !canStart(*l, GattOpKind::DESC_WRITE) ) {
        return false;
    }
    SimGattCharRef c = db->findGattChar(key);
    SimGattDescRef d = nullptr != c ? c->findGattDesc(descriptor) : nullptr;
    const uint16_t status = takeStatus(GattOpKind::DESC_WRITE,
                                       number( nullptr != d ? GattStatusCode::SUCCESS : GattStatusCode::ATTRIBUTE_NOT_FOUND ));
    if( 0 == status && nullptr != d ) {
        d->value = jau::POctets(value);
    }
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::DESC_WRITE, l, status);
    ev->key = key;
    ev->descriptor = descriptor.toUUID128();
    return enqueue(std::move(ev), true);
}

bool SimRadioAdapter::requestMtu(const LinkRef& l, const uint16_t mtu) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( !canStart(*l, GattOpKind::MTU) ) {
        return false;
    }
    const uint16_t status = takeStatus(GattOpKind::MTU, number(GattStatusCode::SUCCESS));
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::MTU, l, status);
    ev->mtu = std::min<uint16_t>(mtu, number(GattMtu::MAX_ATT_MTU));
    return enqueue(std::move(ev), true);
}

bool SimRadioAdapter::isBonded(const BDAddressAndType& address) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    return bonded && address == peer;
}

void SimRadioAdapter::setBonded(const bool v) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    bonded = v;
}

void SimRadioAdapter::setConnectStatus(const uint16_t status) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    connect_status = status;
}

void SimRadioAdapter::setNextStatus(const GattOpKind kind, const uint16_t status) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    next_status[number(kind)] = status;
    next_status_set[number(kind)] = true;
}

void SimRadioAdapter::setStartFailure(const GattOpKind kind, const bool v) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    start_failure[number(kind)] = v;
}

void SimRadioAdapter::setHoldResponses(const bool v) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    hold_responses = v;
}

size_t SimRadioAdapter::releaseHeld() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    jau::darray<std::unique_ptr<Event>> list = std::move(held);
    held.clear();
    const bool hold = hold_responses;
    hold_responses = false;
    size_t count = 0;
    for(std::unique_ptr<Event>& ev : list) {
        if( enqueue(std::move(ev), true) ) {
            ++count;
        }
    }
    hold_responses = hold;
    return count;
}

bool SimRadioAdapter::linkLoss(const uint16_t reason) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    if( nullptr == link ) {
        return false;
    }
    LinkRef l = link;
    link = nullptr;
    IRQ_PRINT("SimRadioAdapter::linkLoss: Link %u, reason %s: %s", (unsigned int)l->id,
            to_string(to_BTConnStatusCode(reason)).c_str(), peer.toString().c_str());
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::CONN_STATE, l, reason);
    ev->linkState = BTRadioLinkState::DISCONNECTED;
    return enqueue(std::move(ev), false);
}

bool SimRadioAdapter::notify(const GattCharKey& key, const jau::TROOctets& value) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    SimGattCharRef c = db->findGattChar(key);
    if( nullptr == c ) {
        WARN_PRINT("SimRadioAdapter::notify: Unknown characteristic %s", key.toString().c_str());
        return false;
    }
    c->value = jau::POctets(value);
    if( nullptr == link ) {
        return false;
    }
    SimGattDescRef cccd = c->getClientCharConfig();
    if( nullptr == cccd || 2 > cccd->value.size() || GattClientCharConfig::DISABLE == cccd->value.get_uint16_nc(0) ) {
        DBG_PRINT("SimRadioAdapter::notify: %s not enabled", key.toString().c_str());
        return false;
    }
    std::unique_ptr<Event> ev = std::make_unique<Event>(EventType::CHAR_CHANGED, link, number(GattStatusCode::SUCCESS));
    ev->key = key;
    ev->value = jau::POctets(value);
    return enqueue(std::move(ev), false);
}

jau::POctets SimRadioAdapter::getValue(const GattCharKey& key) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    SimGattCharRef c = db->findGattChar(key);
    if( nullptr == c ) {
        return jau::POctets(jau::lb_endian_t::little);
    }
    return c->value;
}

bool SimRadioAdapter::isLinkUp() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    return nullptr != link;
}

uint32_t SimRadioAdapter::getConnectCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_sim); // RAII-style acquire and relinquish via destructor
    return link_count;
}

std::string SimRadioAdapter::toString() const noexcept {
    return "SimRadioAdapter["+peer.toString()+", running "+std::to_string(sim_service.is_running())+
           ", ring "+std::to_string(eventRing.size())+"/"+std::to_string(eventRing.capacity())+
           ", delivered "+std::to_string(deliveredCount.load())+"]";
}
