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

#ifndef GATT_REPLY_HPP_
#define GATT_REPLY_HPP_

#include <cstdint>
#include <string>
#include <memory>

#include <jau/basic_types.hpp>
#include <jau/functional.hpp>
#include <jau/octets.hpp>
#include <jau/ordered_atomic.hpp>

#include "BTTypes0.hpp"
#include "BTGattChar.hpp"

namespace central_bt {

    /** \addtogroup CentralBTUserAPI
     *
     *  @{
     */

    /**
     * Terminal result of one asynchronous BTPeripheral operation.
     * <p>
     * Either success, i.e. ::GattError::NONE, with its optional payload
     * or one typed ::GattError with the raw stack status code,
     * its ::ConnStatusCategory where applicable and a human readable message.
     * </p>
     */
    class GattReply {
        public:
            GattOpKind kind;
            GattError error;
            /** Raw radio stack status code, zero on success. */
            uint16_t status;
            ConnStatusCategory category;
            std::string message;
            /** Read value on ::GattOpKind::READ success, otherwise zero sized. */
            jau::POctets value;
            /** Negotiated MTU on ::GattOpKind::MTU success, otherwise zero. */
            uint16_t mtu;

            GattReply(const GattOpKind kind_, const GattError error_, const uint16_t status_,
                      const ConnStatusCategory category_, const std::string& message_) noexcept
            : kind(kind_), error(error_), status(status_), category(category_), message(message_),
              value(jau::lb_endian_t::little /* intentional zero sized */), mtu(0) {}

            static GattReply success(const GattOpKind kind_) noexcept {
                return GattReply(kind_, GattError::NONE, 0, ConnStatusCategory::NORMAL, "");
            }

            static GattReply failure(const GattOpKind kind_, const GattError error_, const std::string& message_) noexcept {
                return GattReply(kind_, error_, 0, ConnStatusCategory::UNKNOWN, message_);
            }

            /**
             * Failure of an issued GATT operation, see ::GattError::OPERATION_FAILED.
             */
            static GattReply opFailure(const GattOpKind kind_, const GattError error_, const uint16_t status_, const std::string& message_) noexcept;

            /**
             * Failure of a connection attempt or link, category mapped from the given status.
             */
            static GattReply connFailure(const GattOpKind kind_, const GattError error_, const uint16_t status_, const std::string& message_) noexcept;

            bool isSuccess() const noexcept { return GattError::NONE == error; }

            std::string toString() const noexcept;
    };

    /**
     * Receives the single terminal GattReply of one request.
     */
    typedef jau::function<void(const GattReply&)> GattReplyCallback;

    /**
     * Identity of one registry slot, i.e. the operation kind plus
     * its GattCharKey for per characteristic kinds, see isPerCharacteristic().
     */
    class GattOpKey {
        public:
            GattOpKind kind;
            GattCharKey target;
            bool global;

            /** Session global slot for the given kind. */
            explicit GattOpKey(const GattOpKind kind_) noexcept
            : kind(kind_), target(), global(true) {}

            /** Per characteristic slot for per characteristic kinds, otherwise the session global slot. */
            GattOpKey(const GattOpKind kind_, const GattCharKey& target_) noexcept
            : kind(kind_), target(target_), global( !isPerCharacteristic(kind_) ) {}

            std::string toString() const noexcept;
    };
    inline bool operator==(const GattOpKey& lhs, const GattOpKey& rhs) noexcept {
        if( lhs.kind != rhs.kind || lhs.global != rhs.global ) {
            return false;
        }
        return lhs.global || lhs.target == rhs.target;
    }
    inline bool operator!=(const GattOpKey& lhs, const GattOpKey& rhs) noexcept
    { return !(lhs == rhs); }

    /**
     * A caller's in-flight request token for one asynchronous operation,
     * resolving its GattReplyCallback at most once.
     */
    class GattPendingRequest {
        private:
            jau::sc_atomic_bool resolved;
            GattReplyCallback callback;

        public:
            const GattOpKey key;
            /** Target characteristic, nullptr for session global operations. */
            const BTGattCharRef characteristic;
            /** Operation argument, i.e. the requested MTU or the CCCD value written. */
            const uint16_t argument;
            /** Monotonic issue timestamp in milliseconds. */
            const uint64_t issued_ms;

            GattPendingRequest(const GattOpKey& key_, const BTGattCharRef& characteristic_, const uint16_t argument_,
                               GattReplyCallback callback_) noexcept;

            GattOpKind getKind() const noexcept { return key.kind; }

            bool isResolved() const noexcept { return resolved; }

            /**
             * Delivers the given reply to the caller's callback, if not yet resolved.
             * <p>
             * Exceptions thrown by the callback are caught and logged.
             * </p>
             * @return true if this call resolved the request, false if it was already resolved.
             */
            bool resolve(const GattReply& reply) noexcept;

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<GattPendingRequest> GattPendingRequestRef;

    /**@}*/

} // namespace central_bt

// injecting specialization of std::hash to namespace std of our types above
namespace std
{
    template<> struct hash<central_bt::GattOpKey> {
        std::size_t operator()(central_bt::GattOpKey const& a) const noexcept {
            std::size_t h = 31 + central_bt::number(a.kind);
            if( !a.global ) {
                // 31 * x == (x << 5) - x
                h = ((h << 5) - h) + std::hash<central_bt::GattCharKey>()(a.target);
            }
            return h;
        }
    };
}

#endif /* GATT_REPLY_HPP_ */
