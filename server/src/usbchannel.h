/*
 * Byte transport over a USB bulk endpoint, for LED bridges that forward
 * bulk data to an SPI bus.
 *
 * Copyright (c) 2013 Micah Elizabeth Scott
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of
 * the Software, and to permit persons to whom the Software is furnished to do so,
 * subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
 * FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR
 * COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER
 * IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once

#include <stdint.h>
#include <libusb.h>
#include "led_driver.h"

class UsbChannel : public shimmer::led::ByteWriter {
public:
    UsbChannel(uint16_t vendor, uint16_t product, uint8_t endpoint, bool verbose);
    virtual ~UsbChannel();

    UsbChannel(const UsbChannel&) = delete;
    UsbChannel& operator=(const UsbChannel&) = delete;

    // Opens the first matching device and claims its interface. Returns a
    // libusb error code, or zero on success.
    int open();
    bool isOpen() const { return mHandle != 0; }

    // Sends |len| bytes as bulk transfers, splitting anything larger than
    // one transfer. Returns false on any USB error.
    bool write(const uint8_t *data, size_t len) override;

private:
    static constexpr size_t kMaxTransferSize = 64 * 1024;

    libusb_context *mContext;
    libusb_device_handle *mHandle;
    uint16_t mVendor;
    uint16_t mProduct;
    uint8_t mEndpoint;
    bool mVerbose;
    bool mClaimed;
};
