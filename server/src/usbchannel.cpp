/*
 * Byte transport over a USB bulk endpoint.
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

#include "usbchannel.h"
#include "config.h"
#include <iostream>


UsbChannel::UsbChannel(uint16_t vendor, uint16_t product, uint8_t endpoint, bool verbose)
    : mContext(0), mHandle(0),
      mVendor(vendor), mProduct(product), mEndpoint(endpoint),
      mVerbose(verbose), mClaimed(false)
{}

UsbChannel::~UsbChannel()
{
    if (mHandle) {
        if (mClaimed) {
            libusb_release_interface(mHandle, 0);
        }
        libusb_close(mHandle);
    }
    if (mContext) {
        libusb_exit(mContext);
    }
}

int UsbChannel::open()
{
    int r = libusb_init(&mContext);
    if (r < 0) {
        mContext = 0;
        return r;
    }

    mHandle = libusb_open_device_with_vid_pid(mContext, mVendor, mProduct);
    if (!mHandle) {
        return LIBUSB_ERROR_NO_DEVICE;
    }

    r = libusb_claim_interface(mHandle, 0);
    if (r < 0) {
        return r;
    }
    mClaimed = true;

    if (mVerbose) {
        std::clog << "USB device " << std::hex << mVendor << ":" << mProduct << std::dec
                  << " attached, endpoint " << unsigned(mEndpoint) << "\n";
    }
    return 0;
}

bool UsbChannel::write(const uint8_t *data, size_t len)
{
    if (!mHandle) {
        return false;
    }

    while (len) {
        int chunk = int(len < kMaxTransferSize ? len : kMaxTransferSize);
        int transferred = 0;

        // libusb takes a non-const buffer for both directions; OUT transfers
        // only read from it.
        int r = libusb_bulk_transfer(mHandle, mEndpoint | LIBUSB_ENDPOINT_OUT,
            const_cast<uint8_t*>(data), chunk, &transferred, SHIMMER_CONFIG_USB_TIMEOUT_MS);

        if (r < 0) {
            if (mVerbose) {
                std::clog << "Error submitting USB transfer: " << libusb_strerror(libusb_error(r)) << "\n";
            }
            return false;
        }
        if (transferred != chunk) {
            if (mVerbose) {
                std::clog << "Short USB transfer: " << transferred << " of " << chunk << " bytes\n";
            }
            return false;
        }

        data += chunk;
        len -= chunk;
    }
    return true;
}
