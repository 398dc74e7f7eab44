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

#ifndef CBT_CONST_HPP_
#define CBT_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>
#include <jau/fraction_type.hpp>

namespace central_bt {

    /**
     * Maximum time to wait for a thread shutdown.
     *
     * Used for the BTPeripheral watchdog and the SimRadioAdapter event thread.
     */
    inline const jau::fraction_i64 THREAD_SHUTDOWN_TIMEOUT = jau::fraction_i64(8, 1); // 8s

    /**
     * Maximum time to wait for the next SimRadioAdapter event before polling its shutdown state.
     */
    inline const jau::fraction_i64 SIM_EVENT_POLL_TIMEOUT = jau::fraction_i64(500, 1000); // 500ms

} // namespace central_bt

#endif /* CBT_CONST_HPP_ */
